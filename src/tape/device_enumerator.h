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
 * Enumeration of the tape devices visible to the host.
 */

#ifndef TAPECTL_TAPE_DEVICE_ENUMERATOR_H_
#define TAPECTL_TAPE_DEVICE_ENUMERATOR_H_

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tapectl {

struct TapeDeviceInfo {
  std::string identity; /**< path used to open the device */
  std::string vendor;
  std::string model;
  std::string serial;
};

/* Ordered by identity, no duplicates */
using PresenceSnapshot = std::vector<TapeDeviceInfo>;

/* std::nullopt when the devices could not be enumerated */
using DeviceEnumerator = std::function<std::optional<PresenceSnapshot>()>;

std::optional<PresenceSnapshot> EnumeratePlatformTapeDevices();

/* Sort by identity and drop duplicate identities */
void NormalizeSnapshot(PresenceSnapshot& snapshot);

}  // namespace tapectl

#endif  // TAPECTL_TAPE_DEVICE_ENUMERATOR_H_
