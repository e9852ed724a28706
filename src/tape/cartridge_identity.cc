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

#include "include/tapectl.h"
#include "tape/cartridge_identity.h"
#include "tape/itdt_tool.h"
#include "tape/tape_drive.h"

#include <fmt/format.h>

namespace tapectl {

static constexpr int debuglevel{100};

std::string TextFromRecord(const MamAttributeRecord& record)
{
  if (!record.parsed || record.value.size() < 2) { return std::string(); }
  return record.value;
}

CartridgeIdentity IdentityFromRecords(
    const std::optional<MamAttributeRecord>& serial,
    const std::optional<MamAttributeRecord>& barcode,
    const std::optional<MamAttributeRecord>& manufacturer)
{
  CartridgeIdentity identity;

  if (serial) {
    identity.serial = SerialFromRecord(*serial);
    identity.records.push_back(*serial);
  }
  if (barcode) {
    identity.barcode = TextFromRecord(*barcode);
    identity.records.push_back(*barcode);
  }
  if (manufacturer) {
    identity.manufacturer = TextFromRecord(*manufacturer);
    identity.records.push_back(*manufacturer);
  }

  for (const MamAttributeRecord& record : identity.records) {
    if (!record.parsed) {
      Dmsg2(debuglevel, "attribute 0x%04x unparsed, raw %s\n",
            record.attribute_id, record.raw_hex.c_str());
    }
  }
  return identity;
}

CartridgeIdentity ReadCartridgeIdentity(TapeDrive& drive, uint8_t partition)
{
  std::vector<std::string> errors;
  auto read = [&](uint16_t id) {
    std::optional<MamAttributeRecord> record
        = drive.ReadAttribute(partition, id);
    if (!record) { errors.push_back(drive.errmsg()); }
    return record;
  };

  auto serial = read(MAM_ATTR_MEDIUM_SERIAL_NUMBER);
  auto barcode = read(MAM_ATTR_BARCODE);
  auto manufacturer = read(MAM_ATTR_MEDIUM_MANUFACTURER);

  CartridgeIdentity identity = IdentityFromRecords(serial, barcode, manufacturer);
  identity.errors = std::move(errors);
  return identity;
}

CartridgeIdentity ReadCartridgeIdentity(ItdtTool& itdt, uint8_t partition)
{
  std::vector<std::string> errors;
  auto read = [&](uint16_t id) {
    std::optional<MamAttributeRecord> record;
    ProgramResult result = itdt.ReadAttribute(partition, id, record);
    if (!result.success()) {
      errors.push_back(fmt::format("readattr {}: {}", FormatAttributeId(id),
                                   DescribeProgramResult(result)));
    } else if (!record) {
      errors.push_back(
          fmt::format("readattr {}: no data", FormatAttributeId(id)));
    }
    return record;
  };

  auto serial = read(IDENTITY_ATTR_SERIAL);
  auto barcode = read(IDENTITY_ATTR_BARCODE);
  auto manufacturer = read(IDENTITY_ATTR_MANUFACTURER);

  CartridgeIdentity identity = IdentityFromRecords(serial, barcode, manufacturer);
  identity.errors = std::move(errors);
  return identity;
}

}  // namespace tapectl
