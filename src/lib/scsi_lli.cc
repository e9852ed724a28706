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
 * Low level SCSI interface, the platform independent part.
 */

#include "include/tapectl.h"
#include "lib/berrno.h"
#include "lib/scsi_cdb.h"
#include "lib/scsi_lli.h"

#include <fmt/format.h>

#include <algorithm>

static constexpr int debuglevel{200};

/* Linux driver_status bits, the low nibble is the driver byte */
#define SCSI_DRIVER_MASK 0x0f
#define SCSI_DRIVER_SENSE 0x08

bool CommandResult::ok() const
{
  if (transport_error != TransportError::kNone) { return false; }
  if (scsi_status == SCSI_STATUS_GOOD
      || scsi_status == SCSI_STATUS_CONDITION_MET) {
    return true;
  }
  return scsi_status == SCSI_STATUS_CHECK_CONDITION && sense.valid
         && sense.sense_key == SENSE_KEY_RECOVERED_ERROR;
}

const char* TransportErrorToString(TransportError error)
{
  switch (error) {
    case TransportError::kNone:
      return "none";
    case TransportError::kDeviceUnavailable:
      return "device unavailable";
    case TransportError::kTransportFault:
      return "transport fault";
  }
  return "unknown";
}

std::string CommandResult::Describe() const
{
  switch (transport_error) {
    case TransportError::kDeviceUnavailable:
      return fmt::format("{}: device unavailable", command);
    case TransportError::kTransportFault:
      return fmt::format("{}: transport fault (os_error={} host=0x{:02x} "
                         "driver=0x{:02x})",
                         command, os_error, host_status, driver_status);
    default:
      break;
  }
  if (scsi_status == SCSI_STATUS_CHECK_CONDITION) {
    return fmt::format("{}: {} {}", command, ScsiStatusToString(scsi_status),
                       DescribeSense(sense));
  }
  return fmt::format("{}: {}", command, ScsiStatusToString(scsi_status));
}

DeviceHandle::DeviceHandle(std::string identity)
    : identity_(std::move(identity))
{
  Touch();
}

void DeviceHandle::Touch()
{
  last_seen_ms_ = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
}

std::chrono::system_clock::time_point DeviceHandle::LastSeen() const
{
  return std::chrono::system_clock::time_point(
      std::chrono::milliseconds(last_seen_ms_.load()));
}

ScsiTransport::~ScsiTransport()
{
  auto handles = handles_.lock();
  if (!handles->empty()) {
    Dmsg1(debuglevel, "%zu device handles left open at transport shutdown\n",
          handles->size());
  }
}

std::shared_ptr<DeviceHandle> ScsiTransport::Open(const std::string& identity)
{
  NativeDevice device = INVALID_NATIVE_DEVICE;
  int os_error = 0;

  if (!OpenNative(identity, device, os_error)) {
    BErrNo be(os_error);
    Dmsg3(debuglevel, "%s: cannot open %s: %s\n", name(), identity.c_str(),
          be.bstrerror());
    return nullptr;
  }

  auto handle = std::make_shared<DeviceHandle>(identity);
  handle->native_.lock()->device = device;
  handles_.lock()->push_back(handle);

  Dmsg2(debuglevel, "%s: opened %s\n", name(), identity.c_str());
  return handle;
}

void ScsiTransport::Release(DeviceHandle& handle)
{
  auto native = handle.native_.lock();
  if (native->device != INVALID_NATIVE_DEVICE) {
    CloseNative(native->device);
    native->device = INVALID_NATIVE_DEVICE;
  }
}

void ScsiTransport::Close(const std::shared_ptr<DeviceHandle>& handle)
{
  if (!handle) { return; }

  handle->closed_ = true;
  Release(*handle);

  auto handles = handles_.lock();
  handles->erase(std::remove(handles->begin(), handles->end(), handle),
                 handles->end());
  Dmsg2(debuglevel, "%s: closed %s\n", name(), handle->identity().c_str());
}

void ScsiTransport::CloseAll()
{
  std::vector<std::shared_ptr<DeviceHandle>> open_handles;
  open_handles.swap(handles_.lock().get());

  for (auto& handle : open_handles) {
    handle->closed_ = true;
    Release(*handle);
  }
}

int ScsiTransport::InvalidateDevice(const std::string& identity)
{
  std::vector<std::shared_ptr<DeviceHandle>> matching;
  {
    auto handles = handles_.lock();
    auto it = std::stable_partition(
        handles->begin(), handles->end(),
        [&identity](const auto& h) { return h->identity() != identity; });
    matching.assign(it, handles->end());
    handles->erase(it, handles->end());
  }

  /* flag first, a command in flight keeps the native device until done */
  for (auto& handle : matching) {
    handle->invalidated_ = true;
    Release(*handle);
  }

  if (!matching.empty()) {
    Dmsg3(debuglevel, "%s: invalidated %zu handle(s) for %s\n", name(),
          matching.size(), identity.c_str());
  }
  return static_cast<int>(matching.size());
}

CommandResult ScsiTransport::Submit(DeviceHandle* handle,
                                    const CommandDescriptor& cmd)
{
  CommandResult result;
  result.command = cmd.name;
  result.attempts = 1;

  if (!handle || !handle->IsUsable()) {
    result.transport_error = TransportError::kDeviceUnavailable;
    return result;
  }

  NativeCompletion completion;
  std::vector<uint8_t> data;
  {
    auto native = handle->native_.lock();
    if (!handle->IsUsable() || native->device == INVALID_NATIVE_DEVICE) {
      result.transport_error = TransportError::kDeviceUnavailable;
      return result;
    }

    if (cmd.direction == DataDirection::kIn) {
      data.assign(cmd.transfer_length, 0);
    }

    Dmsg4(debuglevel, "%s: %s opcode=0x%02x on %s\n", name(), cmd.name.c_str(),
          cmd.opcode(), handle->identity().c_str());
    Issue(native->device, cmd, data, completion);
  }

  result.os_error = completion.os_error;
  result.scsi_status = completion.scsi_status;
  result.host_status = completion.host_status;
  result.driver_status = completion.driver_status;

  if (!completion.issued) {
    result.transport_error = TransportError::kTransportFault;
    Dmsg2(debuglevel, "%s: %s\n", name(), result.Describe().c_str());
    return result;
  }
  handle->Touch();

  if (completion.host_status != 0
      || ((completion.driver_status & SCSI_DRIVER_MASK) != 0
          && (completion.driver_status & SCSI_DRIVER_MASK)
                 != SCSI_DRIVER_SENSE)) {
    result.transport_error = TransportError::kTransportFault;
    Dmsg2(debuglevel, "%s: %s\n", name(), result.Describe().c_str());
    return result;
  }

  if (result.scsi_status == SCSI_STATUS_CHECK_CONDITION
      || !completion.sense.empty()) {
    result.sense = ParseSenseData(completion.sense);
  }

  if (cmd.direction == DataDirection::kIn) {
    result.bytes_transferred
        = std::min<uint32_t>(completion.bytes_transferred, data.size());
    data.resize(result.bytes_transferred);
    result.data = std::move(data);
  } else {
    result.bytes_transferred = completion.bytes_transferred;
  }

  if (!result.ok()) {
    Dmsg2(debuglevel, "%s: %s\n", name(), result.Describe().c_str());
  }
  return result;
}
