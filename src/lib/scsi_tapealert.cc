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
 * Decoding of the SCSI TapeAlert log page.
 */

#include "include/tapectl.h"
#include "lib/scsi_cdb.h"
#include "lib/scsi_tapealert.h"

static constexpr int debuglevel{300};

struct tapealert_mapping {
  uint32_t flag;
  bool critical;
  const char* alert_msg;
};

static const tapealert_mapping tapealert_mappings[] = {
    {0x01, false, "Having problems reading (slowing down)"},
    {0x02, false, "Having problems writing (losing capacity)"},
    {0x03, true, "Uncorrectable read/write error"},
    {0x04, true, "Media performance degraded, data is at risk"},
    {0x05, true, "Read failure"},
    {0x06, true, "Write failure"},
    {0x07, false, "Media has reached the end of its useful life"},
    {0x08, false, "Cartridge not data grade"},
    {0x09, false, "Cartridge write protected"},
    {0x0A, false, "Initiator is preventing media removal"},
    {0x0B, false, "Cleaning media found instead of data media"},
    {0x0C, false, "Cartridge contains data in an unsupported format"},
    {0x0D, false, "Recoverable mechanical cartridge failure"},
    {0x0E, true, "Unrecoverable mechanical cartridge failure"},
    {0x0F, false, "Failure of cartridge memory chip"},
    {0x10, true, "Forced eject of media"},
    {0x11, false, "Read only media loaded"},
    {0x12, false, "Tape directory corrupted on load"},
    {0x13, false, "Media nearing end of life"},
    {0x14, true, "Tape drive needs cleaning now"},
    {0x15, false, "Tape drive needs to be cleaned soon"},
    {0x16, false, "Cleaning cartridge used up"},
    {0x17, false, "Invalid cleaning cartridge used"},
    {0x18, false, "Retension requested"},
    {0x19, false, "Dual port interface failed"},
    {0x1A, false, "Cooling fan in drive has failed"},
    {0x1B, false, "Power supply failure in drive"},
    {0x1C, false, "Power consumption outside specified range"},
    {0x1D, false, "Preventive maintenance needed on drive"},
    {0x1E, true, "Hardware A: drive has a problem not read/write related"},
    {0x1F, true, "Hardware B: drive has a problem not read/write related"},
    {0x20, false, "Problem with the interface between drive and initiator"},
    {0x21, true, "The current operation has failed, eject and reload media"},
    {0x22, false, "Attempt to download new firmware failed"},
    {0x23, false, "Drive humidity outside operational range"},
    {0x24, false, "Drive temperature outside operational range"},
    {0x25, false, "Drive voltage outside operational range"},
    {0x26, false, "Failure of drive predicted soon"},
    {0x27, false, "Diagnostics required"},
    // 0x28 to 0x31 are obsolete or reserved
    {0x32, false, "Media statistics lost"},
    {0x33, false, "Tape directory invalid at unload"},
    {0x34, false, "Tape system area write failure"},
    {0x35, false, "Tape system area read failure"},
    {0x36, false, "Start of data not found"},
    {0x37, true, "Media could not be loaded/threaded"},
    {0x38, true, "Unrecoverable unload failed"},
    {0x39, false, "Automation interface failure"},
    {0x3A, false, "Firmware failure"},
    // 0x3B to 0x40 are reserved
    {0, false, nullptr}};

bool ParseTapeAlertPage(const uint8_t* buf, std::size_t len, uint64_t& flags)
{
  flags = 0;

  if (!buf || len < 4 || (buf[0] & 0x3f) != SCSI_TAPE_ALERT_FLAGS) {
    return false;
  }

  std::size_t page_end = 4 + Get2ByteValue(buf + 2);
  if (page_end > len) { page_end = len; }

  std::size_t pos = 4;
  while (pos + 4 <= page_end) {
    uint32_t parameter_code = Get2ByteValue(buf + pos);
    std::size_t parameter_length = buf[pos + 3];

    if (pos + 4 + parameter_length > page_end) { break; }
    if (parameter_code >= 1 && parameter_code <= MAX_TAPE_ALERTS
        && parameter_length >= 1 && (buf[pos + 4] & 0x01)) {
      Dmsg1(debuglevel, "TapeAlert flag 0x%02x set\n", parameter_code);
      flags |= (uint64_t{1} << (parameter_code - 1));
    }
    pos += 4 + parameter_length;
  }

  return true;
}

std::vector<uint32_t> TapeAlertFlagsToList(uint64_t flags)
{
  std::vector<uint32_t> list;
  for (uint32_t i = 0; i < MAX_TAPE_ALERTS; i++) {
    if (flags & (uint64_t{1} << i)) { list.push_back(i + 1); }
  }
  return list;
}

const char* TapeAlertFlagToString(uint32_t flag)
{
  for (int i = 0; tapealert_mappings[i].alert_msg; i++) {
    if (tapealert_mappings[i].flag == flag) {
      return tapealert_mappings[i].alert_msg;
    }
  }
  return "Unknown TapeAlert flag";
}

bool IsCriticalTapeAlert(uint32_t flag)
{
  for (int i = 0; tapealert_mappings[i].alert_msg; i++) {
    if (tapealert_mappings[i].flag == flag) {
      return tapealert_mappings[i].critical;
    }
  }
  return false;
}
