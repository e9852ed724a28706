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
#include "tape/tape_drive.h"
#include "lib/scsi_tapealert.h"

#include <fmt/format.h>

namespace tapectl {

static constexpr int debuglevel{100};

TapeDrive::TapeDrive(CommandDispatcher& dispatcher,
                     std::shared_ptr<DeviceHandle> handle,
                     RetryPolicy policy,
                     TapeTimeouts timeouts)
    : dispatcher_(dispatcher)
    , handle_(std::move(handle))
    , policy_(policy)
    , timeouts_(timeouts)
{
}

bool TapeDrive::Run(const DescriptorBuilder& builder)
{
  last_result_ = dispatcher_.Execute(handle_.get(), builder, policy_);
  if (last_result_.ok()) {
    errmsg_.clear();
    return true;
  }

  errmsg_ = fmt::format("{} on {} failed after {} attempt(s): {}",
                        last_result_.command, handle_->identity(),
                        last_result_.attempts, last_result_.Describe());
  Dmsg1(debuglevel, "%s\n", errmsg_.c_str());
  return false;
}

bool TapeDrive::TestUnitReady()
{
  return Run([] { return BuildTestUnitReady(); });
}

bool TapeDrive::Rewind()
{
  auto timeout = timeouts_.command;
  return Run([timeout] { return BuildRewind(timeout); });
}

bool TapeDrive::Load()
{
  auto timeout = timeouts_.load;
  return Run([timeout] { return BuildLoadUnload(true, timeout); });
}

bool TapeDrive::Unload()
{
  auto timeout = timeouts_.load;
  return Run([timeout] { return BuildLoadUnload(false, timeout); });
}

bool TapeDrive::Erase(bool long_erase)
{
  auto timeout = timeouts_.erase;
  return Run([long_erase, timeout] { return BuildErase(long_erase, timeout); });
}

bool TapeDrive::FormatMedium(uint8_t format)
{
  auto timeout = timeouts_.format;
  return Run([format, timeout] { return BuildFormatMedium(format, timeout); });
}

bool TapeDrive::WriteFilemarks(uint32_t count)
{
  return Run([count] { return BuildWriteFilemarks(count); });
}

bool TapeDrive::Space(SpaceCode code, int32_t count)
{
  return Run([code, count] { return BuildSpace(code, count); });
}

std::optional<InquiryData> TapeDrive::Inquiry()
{
  if (!Run([] { return BuildInquiry(); })) { return std::nullopt; }

  std::optional<InquiryData> inquiry = ParseInquiry(last_result_.data);
  if (!inquiry) {
    errmsg_ = fmt::format("short INQUIRY data from {} ({} bytes)",
                          handle_->identity(), last_result_.data.size());
  }
  return inquiry;
}

std::optional<std::string> TapeDrive::UnitSerialNumber()
{
  if (!Run([] { return BuildInquiryVpd(kVpdUnitSerialNumber); })) {
    return std::nullopt;
  }

  std::optional<std::string> serial = ParseUnitSerialVpd(last_result_.data);
  if (!serial) {
    errmsg_ = fmt::format("no unit serial number page from {}",
                          handle_->identity());
  }
  return serial;
}

std::optional<PositionData> TapeDrive::ReadPosition()
{
  if (!Run([] { return BuildReadPosition(); })) { return std::nullopt; }

  std::optional<PositionData> position = ParseReadPosition(last_result_.data);
  if (!position) {
    errmsg_ = fmt::format("short READ POSITION data from {} ({} bytes)",
                          handle_->identity(), last_result_.data.size());
  }
  return position;
}

std::optional<SenseData> TapeDrive::RequestSense()
{
  if (!Run([] { return BuildRequestSense(); })) { return std::nullopt; }

  SenseData sense = ParseSenseData(last_result_.data);
  if (!sense.valid) {
    errmsg_ = fmt::format("invalid sense data from {}", handle_->identity());
    return std::nullopt;
  }
  return sense;
}

std::optional<uint64_t> TapeDrive::TapeAlerts()
{
  if (!Run([] {
        return BuildLogSense(SCSI_TAPE_ALERT_FLAGS, 0,
                             TAPEALERT_PAGE_BUFFER_SIZE);
      })) {
    return std::nullopt;
  }

  uint64_t flags = 0;
  if (!ParseTapeAlertPage(last_result_.data.data(), last_result_.data.size(),
                          flags)) {
    errmsg_ = fmt::format("invalid TapeAlert page from {}",
                          handle_->identity());
    return std::nullopt;
  }

  for (uint32_t flag : TapeAlertFlagsToList(flags)) {
    if (IsCriticalTapeAlert(flag)) {
      Emsg3(M_ALERT, 0, "%s: critical tape alert %u: %s\n",
            handle_->identity().c_str(), flag, TapeAlertFlagToString(flag));
    } else {
      Dmsg3(debuglevel, "%s: tape alert %u: %s\n", handle_->identity().c_str(),
            flag, TapeAlertFlagToString(flag));
    }
  }
  return flags;
}

std::optional<std::vector<uint8_t>> TapeDrive::LogSense(uint8_t page,
                                                        uint8_t subpage)
{
  if (!Run([page, subpage] {
        return BuildLogSense(page, subpage, TAPEALERT_PAGE_BUFFER_SIZE);
      })) {
    return std::nullopt;
  }
  return last_result_.data;
}

std::optional<std::vector<uint8_t>> TapeDrive::ModeSense(uint8_t page,
                                                         uint8_t subpage)
{
  if (!Run([page, subpage] { return BuildModeSense10(page, subpage); })) {
    return std::nullopt;
  }
  return last_result_.data;
}

std::optional<std::vector<RawAttribute>> TapeDrive::ReadAttributes(
    uint8_t partition,
    uint16_t first_attribute)
{
  auto timeout = timeouts_.attribute;
  if (!Run([partition, first_attribute, timeout] {
        return BuildReadAttribute(partition, first_attribute, timeout);
      })) {
    return std::nullopt;
  }

  auto attributes = ParseAttributeList(last_result_.data);
  if (!attributes) {
    errmsg_ = fmt::format("malformed attribute list from {}",
                          handle_->identity());
  }
  return attributes;
}

std::optional<MamAttributeRecord> TapeDrive::ReadAttribute(
    uint8_t partition,
    uint16_t attribute_id)
{
  auto attributes = ReadAttributes(partition, attribute_id);
  if (!attributes) { return std::nullopt; }

  for (const RawAttribute& attribute : *attributes) {
    if (attribute.id == attribute_id) {
      return Decode(attribute.value, attribute_id, partition);
    }
  }

  errmsg_ = fmt::format("attribute 0x{:04x} not returned by {}", attribute_id,
                        handle_->identity());
  return std::nullopt;
}

bool TapeDrive::WriteAttribute(uint8_t partition, const RawAttribute& attribute)
{
  auto timeout = timeouts_.attribute;
  std::vector<uint8_t> list = BuildAttributeList(attribute);
  return Run([partition, &list, timeout] {
    return BuildWriteAttribute(partition, list, timeout);
  });
}

std::optional<std::vector<uint8_t>> TapeDrive::ReadBlocks(uint64_t lba,
                                                          uint32_t blocks,
                                                          uint32_t block_size)
{
  if (!Run([lba, blocks, block_size] {
        return BuildRead16(lba, blocks, block_size);
      })) {
    return std::nullopt;
  }
  return last_result_.data;
}

bool TapeDrive::WriteBlocks(uint64_t lba,
                            const std::vector<uint8_t>& data,
                            uint32_t block_size)
{
  return Run([lba, &data, block_size] {
    return BuildWrite16(lba, data, block_size);
  });
}

}  // namespace tapectl
