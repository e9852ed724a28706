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
 * Serial number, barcode and manufacturer of the loaded cartridge.
 */

#ifndef TAPECTL_TAPE_CARTRIDGE_IDENTITY_H_
#define TAPECTL_TAPE_CARTRIDGE_IDENTITY_H_

#include "tape/mam_codec.h"

#include <optional>
#include <string>
#include <vector>

namespace tapectl {

class TapeDrive;
class ItdtTool;

struct CartridgeIdentity {
  std::string serial;
  std::string barcode;
  std::string manufacturer;
  /* decoded attributes the identity was taken from */
  std::vector<MamAttributeRecord> records;
  std::vector<std::string> errors;

  bool empty() const
  {
    return serial.empty() && barcode.empty() && manufacturer.empty();
  }
};

/* Text of a decoded barcode or manufacturer, empty below 2 characters */
std::string TextFromRecord(const MamAttributeRecord& record);

/*
 * Build the identity from the decoded serial, barcode and manufacturer
 * records, each of them may be missing.
 */
CartridgeIdentity IdentityFromRecords(
    const std::optional<MamAttributeRecord>& serial,
    const std::optional<MamAttributeRecord>& barcode,
    const std::optional<MamAttributeRecord>& manufacturer);

/* Via READ ATTRIBUTE, MAM attributes 0x0401, 0x0806 and 0x0400 */
CartridgeIdentity ReadCartridgeIdentity(TapeDrive& drive,
                                        uint8_t partition = 0);

/* Via itdt readattr, tool attributes 0x0002, 0x0009 and 0x0001 */
CartridgeIdentity ReadCartridgeIdentity(ItdtTool& itdt, uint8_t partition = 0);

}  // namespace tapectl

#endif  // TAPECTL_TAPE_CARTRIDGE_IDENTITY_H_
