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

#ifndef TAPECTL_LIB_SCSI_TAPEALERT_H_
#define TAPECTL_LIB_SCSI_TAPEALERT_H_ 1

#include <cstddef>
#include <cstdint>
#include <vector>

#define MAX_TAPE_ALERTS 64

enum
{
  SCSI_TAPE_ALERT_FLAGS = 0x2e
};

/* Size of the LOG SENSE buffer requested for the TapeAlert page */
#define TAPEALERT_PAGE_BUFFER_SIZE 2048

/*
 * Parse a LOG SENSE TapeAlert page. Alert n (1..64) sets bit n-1 in flags.
 * Returns false if buf is not a TapeAlert page.
 */
bool ParseTapeAlertPage(const uint8_t* buf, std::size_t len, uint64_t& flags);

std::vector<uint32_t> TapeAlertFlagsToList(uint64_t flags);
const char* TapeAlertFlagToString(uint32_t flag);

/* Alerts that need an operator right away */
bool IsCriticalTapeAlert(uint32_t flag);

#endif  // TAPECTL_LIB_SCSI_TAPEALERT_H_
