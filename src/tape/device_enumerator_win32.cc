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
 * Tape devices by probing the \\.\TapeN device names.
 */

#include "include/tapectl.h"
#include "tape/device_enumerator.h"

#include <string>

namespace tapectl {

static constexpr int debuglevel{200};
static constexpr int kMaximumTapeIndex = 16;

std::optional<PresenceSnapshot> EnumeratePlatformTapeDevices()
{
  PresenceSnapshot snapshot;

  for (int index = 0; index < kMaximumTapeIndex; index++) {
    std::wstring path = L"\\\\.\\Tape" + std::to_wstring(index);
    HANDLE h = CreateFileW(path.c_str(), GENERIC_READ,
                           FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                           OPEN_EXISTING, 0, nullptr);
    bool present = false;

    if (h != INVALID_HANDLE_VALUE) {
      CloseHandle(h);
      present = true;
    } else {
      DWORD error = GetLastError();
      // in use by another process or not accessible, but it exists
      present = error == ERROR_SHARING_VIOLATION
                || error == ERROR_ACCESS_DENIED;
    }

    if (present) {
      TapeDeviceInfo info;
      info.identity = "\\\\.\\Tape" + std::to_string(index);
      Dmsg1(debuglevel, "found %s\n", info.identity.c_str());
      snapshot.push_back(std::move(info));
    }
  }

  NormalizeSnapshot(snapshot);
  return snapshot;
}

}  // namespace tapectl
