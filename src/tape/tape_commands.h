/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2025-2026 Bareos GmbH & Co. KG

   This program is Free Software; you can redistribute it and/or
   modify it under the terms of version three of the GNU Affero General Public
   License as published by the Free Software Foundation and included
   in the file LICENSE.

   This program is distributed in the hope that it will be useful, but
   WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
   Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program; if not, write to the Free Software
   Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
   02110-1301, USA.
*/
/**
 * @file
 * Command descriptors for sequential access devices and parsers for
 * their responses.
 *
 * Builders only encode, they are safe to call once per attempt from a
 * DescriptorBuilder.
 */

#ifndef TAPECTL_TAPE_TAPE_COMMANDS_H_
#define TAPECTL_TAPE_TAPE_COMMANDS_H_

#include "lib/scsi_lli.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace tapectl {

static constexpr uint32_t kRequestSenseLength = 252;
static constexpr uint32_t kReadPositionLength = 32;
static constexpr uint32_t kShortPositionLength = 20;
static constexpr uint32_t kModeSenseLength = 252;
static constexpr uint32_t kVpdLength = 252;
static constexpr uint32_t kDefaultBlockSize = 512;
static constexpr uint32_t kAttributeAllocation = 4096;

enum class SpaceCode : uint8_t
{
  kBlocks = 0x00,
  kFilemarks = 0x01,
  kSequentialFilemarks = 0x02,
  kEndOfData = 0x03
};

CommandDescriptor BuildTestUnitReady();
CommandDescriptor BuildRewind(std::chrono::seconds timeout);
CommandDescriptor BuildRequestSense();
CommandDescriptor BuildFormatMedium(uint8_t format,
                                    std::chrono::seconds timeout);
CommandDescriptor BuildWriteFilemarks(uint32_t count);

/* count is a signed 24 bit value, negative spaces backwards */
CommandDescriptor BuildSpace(SpaceCode code, int32_t count);

CommandDescriptor BuildInquiry();
CommandDescriptor BuildInquiryVpd(uint8_t page);
CommandDescriptor BuildErase(bool long_erase, std::chrono::seconds timeout);
CommandDescriptor BuildLoadUnload(bool load, std::chrono::seconds timeout);

/* Short form READ POSITION */
CommandDescriptor BuildReadPosition();

/* Cumulative values of a log page */
CommandDescriptor BuildLogSense(uint8_t page,
                                uint8_t subpage,
                                uint16_t allocation);
CommandDescriptor BuildModeSense10(uint8_t page, uint8_t subpage);

CommandDescriptor BuildRead16(uint64_t lba,
                              uint32_t blocks,
                              uint32_t block_size = kDefaultBlockSize);

/* The block count is rounded up to whole blocks of block_size */
CommandDescriptor BuildWrite16(uint64_t lba,
                               const std::vector<uint8_t>& data,
                               uint32_t block_size = kDefaultBlockSize);

/* Service action ATTRIBUTE VALUES starting at first_attribute */
CommandDescriptor BuildReadAttribute(uint8_t partition,
                                     uint16_t first_attribute,
                                     std::chrono::seconds timeout,
                                     uint32_t allocation
                                     = kAttributeAllocation);
CommandDescriptor BuildWriteAttribute(uint8_t partition,
                                      const std::vector<uint8_t>& list,
                                      std::chrono::seconds timeout);

struct PositionData {
  bool bop{false};  /**< beginning of partition */
  bool eop{false};  /**< early warning or end of partition */
  bool block_position_unknown{false};
  uint8_t partition{0};
  uint32_t first_block{0}; /**< next block to transfer */
  uint32_t last_block{0};  /**< next block to write to the medium */
  uint32_t blocks_in_buffer{0};
  uint32_t bytes_in_buffer{0};
};

std::optional<PositionData> ParseReadPosition(const std::vector<uint8_t>& data);

}  // namespace tapectl

#endif  // TAPECTL_TAPE_TAPE_COMMANDS_H_
