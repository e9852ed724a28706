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
 * CDB encoding for tape commands
 */

#include "include/tapectl.h"
#include "tape/tape_commands.h"
#include "lib/scsi_cdb.h"

namespace tapectl {

static CommandDescriptor MakeDescriptor(const char* name,
                                        std::size_t cdb_length,
                                        uint8_t opcode)
{
  CommandDescriptor cmd;

  cmd.name = name;
  cmd.cdb.assign(cdb_length, 0);
  cmd.cdb[0] = opcode;
  return cmd;
}

CommandDescriptor BuildTestUnitReady()
{
  CommandDescriptor cmd
      = MakeDescriptor("TEST UNIT READY", 6, SCSI_TEST_UNIT_READY_OPCODE);
  cmd.timeout = std::chrono::seconds(30);
  return cmd;
}

CommandDescriptor BuildRewind(std::chrono::seconds timeout)
{
  CommandDescriptor cmd = MakeDescriptor("REWIND", 6, SCSI_REWIND_OPCODE);
  cmd.timeout = timeout;
  return cmd;
}

CommandDescriptor BuildRequestSense()
{
  CommandDescriptor cmd
      = MakeDescriptor("REQUEST SENSE", 6, SCSI_REQUEST_SENSE_OPCODE);
  cmd.cdb[4] = static_cast<uint8_t>(kRequestSenseLength);
  cmd.direction = DataDirection::kIn;
  cmd.transfer_length = kRequestSenseLength;
  cmd.timeout = std::chrono::seconds(30);
  return cmd;
}

CommandDescriptor BuildFormatMedium(uint8_t format,
                                    std::chrono::seconds timeout)
{
  CommandDescriptor cmd
      = MakeDescriptor("FORMAT MEDIUM", 6, SCSI_FORMAT_MEDIUM_OPCODE);
  cmd.cdb[2] = format & 0x0f;
  cmd.timeout = timeout;
  return cmd;
}

CommandDescriptor BuildWriteFilemarks(uint32_t count)
{
  CommandDescriptor cmd
      = MakeDescriptor("WRITE FILEMARKS", 6, SCSI_WRITE_FILEMARKS_OPCODE);
  Set3ByteValue(&cmd.cdb[2], count & 0xffffff);
  return cmd;
}

CommandDescriptor BuildSpace(SpaceCode code, int32_t count)
{
  CommandDescriptor cmd = MakeDescriptor("SPACE", 6, SCSI_SPACE_OPCODE);
  cmd.cdb[1] = static_cast<uint8_t>(code) & 0x07;
  Set3ByteValue(&cmd.cdb[2], static_cast<uint32_t>(count) & 0xffffff);
  return cmd;
}

CommandDescriptor BuildInquiry()
{
  CommandDescriptor cmd = MakeDescriptor("INQUIRY", 6, SCSI_INQUIRY_OPCODE);
  Set2ByteValue(&cmd.cdb[3], 36);
  cmd.direction = DataDirection::kIn;
  cmd.transfer_length = 36;
  cmd.timeout = std::chrono::seconds(30);
  return cmd;
}

CommandDescriptor BuildInquiryVpd(uint8_t page)
{
  CommandDescriptor cmd = MakeDescriptor("INQUIRY VPD", 6, SCSI_INQUIRY_OPCODE);
  cmd.cdb[1] = 0x01; /* EVPD */
  cmd.cdb[2] = page;
  Set2ByteValue(&cmd.cdb[3], kVpdLength);
  cmd.direction = DataDirection::kIn;
  cmd.transfer_length = kVpdLength;
  cmd.timeout = std::chrono::seconds(30);
  return cmd;
}

CommandDescriptor BuildErase(bool long_erase, std::chrono::seconds timeout)
{
  CommandDescriptor cmd = MakeDescriptor("ERASE", 6, SCSI_ERASE_OPCODE);
  cmd.cdb[1] = long_erase ? 0x01 : 0x00;
  cmd.timeout = timeout;
  return cmd;
}

CommandDescriptor BuildLoadUnload(bool load, std::chrono::seconds timeout)
{
  CommandDescriptor cmd = MakeDescriptor(load ? "LOAD" : "UNLOAD", 6,
                                         SCSI_LOAD_UNLOAD_OPCODE);
  cmd.cdb[4] = load ? 0x01 : 0x00;
  cmd.timeout = timeout;
  return cmd;
}

CommandDescriptor BuildReadPosition()
{
  CommandDescriptor cmd
      = MakeDescriptor("READ POSITION", 10, SCSI_READ_POSITION_OPCODE);
  Set2ByteValue(&cmd.cdb[7], kReadPositionLength);
  cmd.direction = DataDirection::kIn;
  cmd.transfer_length = kReadPositionLength;
  cmd.timeout = std::chrono::seconds(30);
  return cmd;
}

CommandDescriptor BuildLogSense(uint8_t page, uint8_t subpage,
                                uint16_t allocation)
{
  CommandDescriptor cmd = MakeDescriptor("LOG SENSE", 10, SCSI_LOG_SENSE_OPCODE);
  cmd.cdb[2] = 0x40 | (page & 0x3f); /* PC 01b, cumulative values */
  cmd.cdb[3] = subpage;
  Set2ByteValue(&cmd.cdb[7], allocation);
  cmd.direction = DataDirection::kIn;
  cmd.transfer_length = allocation;
  cmd.timeout = std::chrono::seconds(60);
  return cmd;
}

CommandDescriptor BuildModeSense10(uint8_t page, uint8_t subpage)
{
  CommandDescriptor cmd
      = MakeDescriptor("MODE SENSE(10)", 10, SCSI_MODE_SENSE10_OPCODE);
  cmd.cdb[2] = page & 0x3f;
  cmd.cdb[3] = subpage;
  Set2ByteValue(&cmd.cdb[7], kModeSenseLength);
  cmd.direction = DataDirection::kIn;
  cmd.transfer_length = kModeSenseLength;
  cmd.timeout = std::chrono::seconds(60);
  return cmd;
}

CommandDescriptor BuildRead16(uint64_t lba, uint32_t blocks, uint32_t block_size)
{
  CommandDescriptor cmd = MakeDescriptor("READ(16)", 16, SCSI_READ16_OPCODE);
  Set8ByteValue(&cmd.cdb[2], lba);
  Set4ByteValue(&cmd.cdb[10], blocks);
  cmd.direction = DataDirection::kIn;
  cmd.transfer_length = blocks * block_size;
  cmd.lba = lba;
  return cmd;
}

CommandDescriptor BuildWrite16(uint64_t lba,
                               const std::vector<uint8_t>& data,
                               uint32_t block_size)
{
  CommandDescriptor cmd = MakeDescriptor("WRITE(16)", 16, SCSI_WRITE16_OPCODE);
  uint32_t blocks
      = static_cast<uint32_t>((data.size() + block_size - 1) / block_size);

  Set8ByteValue(&cmd.cdb[2], lba);
  Set4ByteValue(&cmd.cdb[10], blocks);
  cmd.direction = DataDirection::kOut;
  cmd.payload = data;
  cmd.payload.resize(static_cast<std::size_t>(blocks) * block_size, 0);
  cmd.lba = lba;
  return cmd;
}

CommandDescriptor BuildReadAttribute(uint8_t partition,
                                     uint16_t first_attribute,
                                     std::chrono::seconds timeout,
                                     uint32_t allocation)
{
  CommandDescriptor cmd
      = MakeDescriptor("READ ATTRIBUTE", 16, SCSI_READ_ATTRIBUTE_OPCODE);
  cmd.cdb[1] = 0x00; /* ATTRIBUTE VALUES */
  cmd.cdb[7] = partition;
  Set2ByteValue(&cmd.cdb[8], first_attribute);
  Set4ByteValue(&cmd.cdb[10], allocation);
  cmd.direction = DataDirection::kIn;
  cmd.transfer_length = allocation;
  cmd.timeout = timeout;
  cmd.partition = partition;
  return cmd;
}

CommandDescriptor BuildWriteAttribute(uint8_t partition,
                                      const std::vector<uint8_t>& list,
                                      std::chrono::seconds timeout)
{
  CommandDescriptor cmd
      = MakeDescriptor("WRITE ATTRIBUTE", 16, SCSI_WRITE_ATTRIBUTE_OPCODE);
  cmd.cdb[1] = 0x01; /* write through cache */
  cmd.cdb[7] = partition;
  Set4ByteValue(&cmd.cdb[10], static_cast<uint32_t>(list.size()));
  cmd.direction = DataDirection::kOut;
  cmd.payload = list;
  cmd.timeout = timeout;
  cmd.partition = partition;
  return cmd;
}

std::optional<PositionData> ParseReadPosition(const std::vector<uint8_t>& data)
{
  if (data.size() < kShortPositionLength) { return std::nullopt; }

  PositionData position;
  position.bop = (data[0] & 0x80) != 0;
  position.eop = (data[0] & 0x40) != 0;
  position.block_position_unknown = (data[0] & 0x04) != 0;
  position.partition = data[1];
  position.first_block = Get4ByteValue(&data[4]);
  position.last_block = Get4ByteValue(&data[8]);
  position.blocks_in_buffer = Get3ByteValue(&data[13]);
  position.bytes_in_buffer = Get4ByteValue(&data[16]);

  return position;
}

}  // namespace tapectl
