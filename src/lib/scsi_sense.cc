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
/*
 * SCSI sense data parsing, fixed and descriptor format.
 */

#include "include/tapectl.h"
#include "lib/scsi_cdb.h"
#include "lib/scsi_sense.h"

#include <fmt/format.h>

#include <algorithm>

static constexpr int debuglevel{300};

struct asc_mapping {
  uint8_t asc;
  uint8_t ascq;
  const char* text;
};

/* the conditions a tape drive reports most often */
static const asc_mapping asc_mappings[] = {
    {0x00, 0x00, "No additional sense information"},
    {0x00, 0x01, "Filemark detected"},
    {0x00, 0x02, "End-of-partition/medium detected"},
    {0x00, 0x04, "Beginning-of-partition/medium detected"},
    {0x00, 0x05, "End-of-data detected"},
    {0x04, 0x00, "Logical unit not ready, cause not reportable"},
    {0x04, 0x01, "Logical unit is in process of becoming ready"},
    {0x04, 0x02, "Logical unit not ready, initializing command required"},
    {0x04, 0x03, "Logical unit not ready, manual intervention required"},
    {0x04, 0x04, "Logical unit not ready, format in progress"},
    {0x04, 0x07, "Logical unit not ready, operation in progress"},
    {0x04, 0x12, "Logical unit not ready, offline"},
    {0x0c, 0x00, "Write error"},
    {0x11, 0x00, "Unrecovered read error"},
    {0x14, 0x00, "Recorded entity not found"},
    {0x14, 0x03, "End-of-data not found"},
    {0x20, 0x00, "Invalid command operation code"},
    {0x24, 0x00, "Invalid field in CDB"},
    {0x25, 0x00, "Logical unit not supported"},
    {0x26, 0x00, "Invalid field in parameter list"},
    {0x27, 0x00, "Write protected"},
    {0x28, 0x00, "Not ready to ready change, medium may have changed"},
    {0x29, 0x00, "Power on, reset, or bus device reset occurred"},
    {0x2a, 0x01, "Mode parameters changed"},
    {0x30, 0x00, "Incompatible medium installed"},
    {0x30, 0x03, "Cleaning cartridge installed"},
    {0x31, 0x00, "Medium format corrupted"},
    {0x3a, 0x00, "Medium not present"},
    {0x3b, 0x00, "Sequential positioning error"},
    {0x3b, 0x08, "Reposition error"},
    {0x44, 0x00, "Internal target failure"},
    {0x50, 0x00, "Write append error"},
    {0x53, 0x00, "Media load or eject failed"},
    {0x53, 0x02, "Medium removal prevented"},
    {0x5d, 0x00, "Failure prediction threshold exceeded"},
};

SenseData ParseSenseData(const uint8_t* buf, std::size_t len)
{
  SenseData sense;

  if (!buf || len < 2) { return sense; }

  sense.raw.assign(buf, buf + len);
  sense.response_code = buf[0] & 0x7f;

  switch (sense.response_code) {
    case 0x70:
    case 0x71:
      if (len < 3) { return sense; }
      sense.valid = true;
      sense.sense_key = buf[2] & 0x0f;
      sense.filemark = (buf[2] & 0x80) != 0;
      sense.eom = (buf[2] & 0x40) != 0;
      sense.ili = (buf[2] & 0x20) != 0;
      if (len >= 7) {
        sense.information_valid = (buf[0] & 0x80) != 0;
        sense.information = Get4ByteValue(buf + 3);
      }
      if (len >= 14) {
        sense.asc = buf[12];
        sense.ascq = buf[13];
      }
      break;
    case 0x72:
    case 0x73: {
      if (len < 4) { return sense; }
      sense.valid = true;
      sense.sense_key = buf[1] & 0x0f;
      sense.asc = buf[2];
      sense.ascq = buf[3];

      /* walk the descriptors for information and stream commands bits */
      std::size_t end = len;
      if (len >= 8) { end = std::min<std::size_t>(len, 8 + buf[7]); }
      std::size_t pos = 8;
      while (pos + 2 <= end) {
        uint8_t type = buf[pos];
        std::size_t dlen = buf[pos + 1];
        if (pos + 2 + dlen > end) { break; }
        if (type == 0x00 && dlen >= 10) {
          sense.information_valid = (buf[pos + 2] & 0x80) != 0;
          sense.information = Get8ByteValue(buf + pos + 4);
        } else if (type == 0x04 && dlen >= 2) {
          sense.filemark = (buf[pos + 3] & 0x80) != 0;
          sense.eom = (buf[pos + 3] & 0x40) != 0;
          sense.ili = (buf[pos + 3] & 0x20) != 0;
        }
        pos += 2 + dlen;
      }
      break;
    }
    default:
      Dmsg1(debuglevel, "Unknown sense response code 0x%02x\n",
            sense.response_code);
      break;
  }

  return sense;
}

const char* SenseKeyToString(uint8_t sense_key)
{
  switch (sense_key) {
    case SENSE_KEY_NO_SENSE:
      return "NO SENSE";
    case SENSE_KEY_RECOVERED_ERROR:
      return "RECOVERED ERROR";
    case SENSE_KEY_NOT_READY:
      return "NOT READY";
    case SENSE_KEY_MEDIUM_ERROR:
      return "MEDIUM ERROR";
    case SENSE_KEY_HARDWARE_ERROR:
      return "HARDWARE ERROR";
    case SENSE_KEY_ILLEGAL_REQUEST:
      return "ILLEGAL REQUEST";
    case SENSE_KEY_UNIT_ATTENTION:
      return "UNIT ATTENTION";
    case SENSE_KEY_DATA_PROTECT:
      return "DATA PROTECT";
    case SENSE_KEY_BLANK_CHECK:
      return "BLANK CHECK";
    case SENSE_KEY_VENDOR_SPECIFIC:
      return "VENDOR SPECIFIC";
    case SENSE_KEY_COPY_ABORTED:
      return "COPY ABORTED";
    case SENSE_KEY_ABORTED_COMMAND:
      return "ABORTED COMMAND";
    case SENSE_KEY_VOLUME_OVERFLOW:
      return "VOLUME OVERFLOW";
    case SENSE_KEY_MISCOMPARE:
      return "MISCOMPARE";
    default:
      return "RESERVED";
  }
}

const char* ScsiStatusToString(uint8_t status)
{
  switch (status) {
    case SCSI_STATUS_GOOD:
      return "GOOD";
    case SCSI_STATUS_CHECK_CONDITION:
      return "CHECK CONDITION";
    case SCSI_STATUS_CONDITION_MET:
      return "CONDITION MET";
    case SCSI_STATUS_BUSY:
      return "BUSY";
    case SCSI_STATUS_RESERVATION_CONFLICT:
      return "RESERVATION CONFLICT";
    case SCSI_STATUS_TASK_SET_FULL:
      return "TASK SET FULL";
    case SCSI_STATUS_ACA_ACTIVE:
      return "ACA ACTIVE";
    case SCSI_STATUS_TASK_ABORTED:
      return "TASK ABORTED";
    default:
      return "UNKNOWN STATUS";
  }
}

std::string DescribeSense(const SenseData& sense)
{
  if (!sense.valid) { return "no sense data"; }

  const char* text = nullptr;
  for (const auto& m : asc_mappings) {
    if (m.asc == sense.asc && m.ascq == sense.ascq) {
      text = m.text;
      break;
    }
  }

  return fmt::format("{} (asc=0x{:02x} ascq=0x{:02x}){}{}",
                     SenseKeyToString(sense.sense_key), sense.asc, sense.ascq,
                     text ? ": " : "", text ? text : "");
}
