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
 * SCSI command descriptor block definitions and big-endian field helpers
 */

#ifndef TAPECTL_LIB_SCSI_CDB_H_
#define TAPECTL_LIB_SCSI_CDB_H_ 1

#include <cstddef>
#include <cstdint>

/*
 * SCSI CDB opcodes used for sequential access devices
 */
enum
{
  SCSI_TEST_UNIT_READY_OPCODE = 0x00,
  SCSI_REWIND_OPCODE = 0x01,
  SCSI_REQUEST_SENSE_OPCODE = 0x03,
  SCSI_FORMAT_MEDIUM_OPCODE = 0x04,
  SCSI_WRITE_FILEMARKS_OPCODE = 0x10,
  SCSI_SPACE_OPCODE = 0x11,
  SCSI_INQUIRY_OPCODE = 0x12,
  SCSI_ERASE_OPCODE = 0x19,
  SCSI_LOAD_UNLOAD_OPCODE = 0x1b,
  SCSI_READ_POSITION_OPCODE = 0x34,
  SCSI_LOG_SENSE_OPCODE = 0x4d,
  SCSI_MODE_SENSE10_OPCODE = 0x5a,
  SCSI_READ16_OPCODE = 0x88,
  SCSI_WRITE16_OPCODE = 0x8a,
  SCSI_READ_ATTRIBUTE_OPCODE = 0x8c,
  SCSI_WRITE_ATTRIBUTE_OPCODE = 0x8d
};

/*
 * SCSI status byte values
 */
enum
{
  SCSI_STATUS_GOOD = 0x00,
  SCSI_STATUS_CHECK_CONDITION = 0x02,
  SCSI_STATUS_CONDITION_MET = 0x04,
  SCSI_STATUS_BUSY = 0x08,
  SCSI_STATUS_RESERVATION_CONFLICT = 0x18,
  SCSI_STATUS_TASK_SET_FULL = 0x28,
  SCSI_STATUS_ACA_ACTIVE = 0x30,
  SCSI_STATUS_TASK_ABORTED = 0x40
};

/*
 * Multi byte CDB and page fields are big-endian on the wire, whatever
 * the host byte order is.
 */
inline void Set2ByteValue(uint8_t* field, uint32_t value)
{
  field[0] = static_cast<uint8_t>((value >> 8) & 0xff);
  field[1] = static_cast<uint8_t>(value & 0xff);
}

inline void Set3ByteValue(uint8_t* field, uint32_t value)
{
  field[0] = static_cast<uint8_t>((value >> 16) & 0xff);
  field[1] = static_cast<uint8_t>((value >> 8) & 0xff);
  field[2] = static_cast<uint8_t>(value & 0xff);
}

inline void Set4ByteValue(uint8_t* field, uint32_t value)
{
  for (int i = 0; i < 4; i++) {
    field[i] = static_cast<uint8_t>((value >> (8 * (3 - i))) & 0xff);
  }
}

inline void Set8ByteValue(uint8_t* field, uint64_t value)
{
  for (int i = 0; i < 8; i++) {
    field[i] = static_cast<uint8_t>((value >> (8 * (7 - i))) & 0xff);
  }
}

inline uint32_t Get2ByteValue(const uint8_t* field)
{
  return (static_cast<uint32_t>(field[0]) << 8) | field[1];
}

inline uint32_t Get3ByteValue(const uint8_t* field)
{
  return (static_cast<uint32_t>(field[0]) << 16)
         | (static_cast<uint32_t>(field[1]) << 8) | field[2];
}

inline uint32_t Get4ByteValue(const uint8_t* field)
{
  uint32_t value = 0;
  for (int i = 0; i < 4; i++) { value = (value << 8) | field[i]; }
  return value;
}

inline uint64_t Get8ByteValue(const uint8_t* field)
{
  uint64_t value = 0;
  for (int i = 0; i < 8; i++) { value = (value << 8) | field[i]; }
  return value;
}

#endif  // TAPECTL_LIB_SCSI_CDB_H_
