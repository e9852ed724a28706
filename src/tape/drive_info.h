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
 * Drive identification: INQUIRY data, unit serial VPD page and LTO
 * generation.
 */

#ifndef TAPECTL_TAPE_DRIVE_INFO_H_
#define TAPECTL_TAPE_DRIVE_INFO_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tapectl {

/* Peripheral device type of a sequential access device */
static constexpr uint8_t kPeripheralTypeTape = 0x01;

/* Standard INQUIRY data as far as it is requested */
static constexpr uint32_t kInquiryLength = 36;

/* Unit serial number VPD page */
static constexpr uint8_t kVpdUnitSerialNumber = 0x80;

struct InquiryData {
  uint8_t peripheral_type{0x1f};
  std::string vendor;   /**< bytes 8-15, trimmed */
  std::string product;  /**< bytes 16-31, trimmed */
  std::string revision; /**< bytes 32-35, trimmed */

  bool IsTape() const { return peripheral_type == kPeripheralTypeTape; }
};

std::optional<InquiryData> ParseInquiry(const std::vector<uint8_t>& data);
std::optional<std::string> ParseUnitSerialVpd(const std::vector<uint8_t>& data);

/* Printable ASCII of a fixed size field without trailing blanks */
std::string TrimField(const uint8_t* field, std::size_t len);

/*
 * LTO generation from a product id like "ULT3580-HH9" or "LTO-8".
 * Returns 0 if the product does not name a generation.
 */
int LtoGeneration(const std::string& product);

/* Native capacity in bytes, 0 for unknown generations */
uint64_t LtoNativeCapacity(int generation);

}  // namespace tapectl

#endif  // TAPECTL_TAPE_DRIVE_INFO_H_
