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
 * Tape drive operations over the SCSI pass-through path.
 */

#ifndef TAPECTL_TAPE_TAPE_DRIVE_H_
#define TAPECTL_TAPE_TAPE_DRIVE_H_

#include "tape/command_dispatch.h"
#include "tape/drive_info.h"
#include "tape/mam_codec.h"
#include "tape/tape_commands.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tapectl {

struct TapeTimeouts {
  std::chrono::seconds command{300};
  std::chrono::seconds load{60};
  std::chrono::seconds format{3600};
  std::chrono::seconds erase{10800};
  std::chrono::seconds attribute{60};
};

/*
 * One drive opened through a ScsiTransport. Every command goes through
 * the dispatcher, the outcome of the last one is kept in last_result()
 * and a message for failures in errmsg().
 *
 * Not safe for concurrent use, one owner per drive.
 */
class TapeDrive {
 public:
  TapeDrive(CommandDispatcher& dispatcher,
            std::shared_ptr<DeviceHandle> handle,
            RetryPolicy policy = RetryPolicy(),
            TapeTimeouts timeouts = TapeTimeouts());

  bool TestUnitReady();
  bool Rewind();
  bool Load();
  bool Unload();
  bool Erase(bool long_erase);
  bool FormatMedium(uint8_t format = 0);
  bool WriteFilemarks(uint32_t count = 1);
  bool Space(SpaceCode code, int32_t count);

  std::optional<InquiryData> Inquiry();
  std::optional<std::string> UnitSerialNumber();
  std::optional<PositionData> ReadPosition();
  std::optional<SenseData> RequestSense();

  /*
   * Active TapeAlert flags, bit n-1 for alert n. Critical alerts are
   * reported as M_ALERT messages.
   */
  std::optional<uint64_t> TapeAlerts();

  std::optional<std::vector<uint8_t>> LogSense(uint8_t page, uint8_t subpage = 0);
  std::optional<std::vector<uint8_t>> ModeSense(uint8_t page = 0x3f,
                                                uint8_t subpage = 0);

  /* Decoded value of one attribute of the loaded cartridge */
  std::optional<MamAttributeRecord> ReadAttribute(uint8_t partition,
                                                  uint16_t attribute_id);
  std::optional<std::vector<RawAttribute>> ReadAttributes(
      uint8_t partition,
      uint16_t first_attribute = 0);
  bool WriteAttribute(uint8_t partition, const RawAttribute& attribute);

  std::optional<std::vector<uint8_t>> ReadBlocks(
      uint64_t lba,
      uint32_t blocks,
      uint32_t block_size = kDefaultBlockSize);
  bool WriteBlocks(uint64_t lba,
                   const std::vector<uint8_t>& data,
                   uint32_t block_size = kDefaultBlockSize);

  const CommandResult& last_result() const { return last_result_; }
  const std::string& errmsg() const { return errmsg_; }
  const std::string& identity() const { return handle_->identity(); }
  DeviceHandle* handle() const { return handle_.get(); }

 private:
  bool Run(const DescriptorBuilder& builder);

  CommandDispatcher& dispatcher_;
  std::shared_ptr<DeviceHandle> handle_;
  RetryPolicy policy_;
  TapeTimeouts timeouts_;
  CommandResult last_result_;
  std::string errmsg_;
};

}  // namespace tapectl

#endif  // TAPECTL_TAPE_TAPE_DRIVE_H_
