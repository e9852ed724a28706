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
 * SCSI sense data parsing
 */

#ifndef TAPECTL_LIB_SCSI_SENSE_H_
#define TAPECTL_LIB_SCSI_SENSE_H_ 1

#include <cstdint>
#include <string>
#include <vector>

/*
 * Sense keys
 */
enum
{
  SENSE_KEY_NO_SENSE = 0x00,
  SENSE_KEY_RECOVERED_ERROR = 0x01,
  SENSE_KEY_NOT_READY = 0x02,
  SENSE_KEY_MEDIUM_ERROR = 0x03,
  SENSE_KEY_HARDWARE_ERROR = 0x04,
  SENSE_KEY_ILLEGAL_REQUEST = 0x05,
  SENSE_KEY_UNIT_ATTENTION = 0x06,
  SENSE_KEY_DATA_PROTECT = 0x07,
  SENSE_KEY_BLANK_CHECK = 0x08,
  SENSE_KEY_VENDOR_SPECIFIC = 0x09,
  SENSE_KEY_COPY_ABORTED = 0x0a,
  SENSE_KEY_ABORTED_COMMAND = 0x0b,
  SENSE_KEY_VOLUME_OVERFLOW = 0x0d,
  SENSE_KEY_MISCOMPARE = 0x0e
};

/* ASC for "medium not present" */
#define SENSE_ASC_MEDIUM_NOT_PRESENT 0x3a

#define SCSI_SENSE_BUFFER_SIZE 64

/*
 * Parsed fixed (0x70/0x71) or descriptor (0x72/0x73) format sense data
 */
struct SenseData {
  bool valid{false};
  uint8_t response_code{0};
  uint8_t sense_key{0};
  uint8_t asc{0};
  uint8_t ascq{0};
  bool filemark{false};
  bool eom{false};
  bool ili{false};
  bool information_valid{false};
  uint64_t information{0};
  std::vector<uint8_t> raw;

  bool deferred() const
  {
    return response_code == 0x71 || response_code == 0x73;
  }
};

SenseData ParseSenseData(const uint8_t* buf, std::size_t len);
inline SenseData ParseSenseData(const std::vector<uint8_t>& buf)
{
  return ParseSenseData(buf.data(), buf.size());
}

const char* SenseKeyToString(uint8_t sense_key);
const char* ScsiStatusToString(uint8_t status);

/* "KEY (asc/ascq) text" for messages */
std::string DescribeSense(const SenseData& sense);

#endif  // TAPECTL_LIB_SCSI_SENSE_H_
