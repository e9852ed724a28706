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
 * Tape devices from the st driver's sysfs class.
 */

#include "include/tapectl.h"
#include "tape/device_enumerator.h"
#include "lib/berrno.h"

#include <dirent.h>
#include <sys/stat.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <regex>

namespace tapectl {

static constexpr int debuglevel{200};

static const char* const kScsiTapeClass = "/sys/class/scsi_tape";

static std::string ReadSysfsAttribute(const std::string& path)
{
  std::ifstream in(path);
  std::string value;

  if (!in || !std::getline(in, value)) { return std::string(); }

  std::size_t end = value.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) { return std::string(); }
  std::size_t begin = value.find_first_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

/* The unit serial number VPD page as exported by the SCSI midlayer */
static std::string ReadVpdSerial(const std::string& device_dir)
{
  std::ifstream in(device_dir + "/vpd_pg80", std::ios::binary);
  std::string page((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());

  if (page.size() < 4) { return std::string(); }

  std::size_t length
      = std::min<std::size_t>(static_cast<uint8_t>(page[3]), page.size() - 4);
  std::string serial = page.substr(4, length);
  std::size_t end = serial.find_last_not_of(" \0", std::string::npos, 2);
  if (end == std::string::npos) { return std::string(); }
  std::size_t begin = serial.find_first_not_of(' ');
  return serial.substr(begin, end - begin + 1);
}

std::optional<PresenceSnapshot> EnumeratePlatformTapeDevices()
{
  static const std::regex no_rewind_device("nst[0-9]+");
  PresenceSnapshot snapshot;

  DIR* dir = opendir(kScsiTapeClass);
  if (!dir) {
    BErrNo be;
    if (be.code() == ENOENT) {
      // st driver not loaded, no tape devices
      Dmsg1(debuglevel, "%s does not exist\n", kScsiTapeClass);
      return snapshot;
    }
    Dmsg2(debuglevel, "cannot open %s: %s\n", kScsiTapeClass, be.bstrerror());
    return std::nullopt;
  }

  struct dirent* entry;
  while ((entry = readdir(dir)) != nullptr) {
    std::string name(entry->d_name);
    if (!std::regex_match(name, no_rewind_device)) { continue; }

    TapeDeviceInfo info;
    info.identity = "/dev/" + name;

    struct stat st;
    if (stat(info.identity.c_str(), &st) != 0 || !S_ISCHR(st.st_mode)) {
      Dmsg1(debuglevel, "%s has no character device\n", info.identity.c_str());
      continue;
    }

    std::string device_dir = std::string(kScsiTapeClass) + "/" + name + "/device";
    info.vendor = ReadSysfsAttribute(device_dir + "/vendor");
    info.model = ReadSysfsAttribute(device_dir + "/model");
    info.serial = ReadVpdSerial(device_dir);
    snapshot.push_back(std::move(info));
  }
  closedir(dir);

  NormalizeSnapshot(snapshot);
  return snapshot;
}

}  // namespace tapectl
