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
#include "lib/scsi_cdb.h"
#include "tape/command_dispatch.h"

#include <algorithm>
#include <thread>

namespace tapectl {

static constexpr int debuglevel{100};

/* Linux host adapter states worth another try */
enum
{
  SCSI_DID_BUS_BUSY = 0x02,
  SCSI_DID_TIME_OUT = 0x03,
  SCSI_DID_SOFT_ERROR = 0x0b,
  SCSI_DID_IMM_RETRY = 0x0c,
  SCSI_DID_REQUEUE = 0x0d
};

const char* FaultClassToString(FaultClass fault)
{
  switch (fault) {
    case FaultClass::kNone:
      return "none";
    case FaultClass::kTransient:
      return "transient";
    case FaultClass::kPermanent:
      return "permanent";
    case FaultClass::kUnknown:
      return "unknown";
    case FaultClass::kDeviceUnavailable:
      return "device unavailable";
  }
  return "unknown";
}

static FaultClass ClassifyTransportFault(const CommandResult& result)
{
  switch (result.host_status) {
    case SCSI_DID_BUS_BUSY:
    case SCSI_DID_TIME_OUT:
    case SCSI_DID_SOFT_ERROR:
    case SCSI_DID_IMM_RETRY:
    case SCSI_DID_REQUEUE:
      return FaultClass::kTransient;
    default:
      break;
  }

  switch (result.os_error) {
    case EBUSY:
    case EAGAIN:
    case EINTR:
      return FaultClass::kTransient;
    default:
      return FaultClass::kUnknown;
  }
}

static FaultClass ClassifySense(const SenseData& sense)
{
  if (!sense.valid) { return FaultClass::kUnknown; }

  switch (sense.sense_key) {
    case SENSE_KEY_UNIT_ATTENTION:
    case SENSE_KEY_ABORTED_COMMAND:
      return FaultClass::kTransient;
    case SENSE_KEY_NOT_READY:
      if (sense.asc == SENSE_ASC_MEDIUM_NOT_PRESENT) {
        return FaultClass::kPermanent;
      }
      return FaultClass::kTransient;
    case SENSE_KEY_ILLEGAL_REQUEST:
    case SENSE_KEY_DATA_PROTECT:
    case SENSE_KEY_MEDIUM_ERROR:
    case SENSE_KEY_HARDWARE_ERROR:
    case SENSE_KEY_BLANK_CHECK:
    case SENSE_KEY_VOLUME_OVERFLOW:
      return FaultClass::kPermanent;
    default:
      return FaultClass::kUnknown;
  }
}

FaultClass ClassifyResult(const CommandResult& result)
{
  switch (result.transport_error) {
    case TransportError::kDeviceUnavailable:
      return FaultClass::kDeviceUnavailable;
    case TransportError::kTransportFault:
      return ClassifyTransportFault(result);
    default:
      break;
  }

  if (result.ok()) { return FaultClass::kNone; }

  switch (result.scsi_status) {
    case SCSI_STATUS_BUSY:
    case SCSI_STATUS_TASK_SET_FULL:
      return FaultClass::kTransient;
    case SCSI_STATUS_RESERVATION_CONFLICT:
      return FaultClass::kPermanent;
    case SCSI_STATUS_CHECK_CONDITION:
      return ClassifySense(result.sense);
    default:
      return FaultClass::kUnknown;
  }
}

std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt)
{
  if (attempt < 1 || policy.base_delay.count() <= 0) {
    return std::chrono::milliseconds(0);
  }

  auto delay = policy.base_delay;
  for (int i = 1; i < attempt && delay < policy.max_delay; i++) { delay *= 2; }
  return std::min(delay, policy.max_delay);
}

static void DefaultSleeper(std::chrono::milliseconds delay)
{
  std::this_thread::sleep_for(delay);
}

CommandDispatcher::CommandDispatcher(ScsiTransport& transport)
    : CommandDispatcher(transport, DefaultSleeper)
{
}

CommandDispatcher::CommandDispatcher(ScsiTransport& transport, Sleeper sleeper)
    : transport_(transport), sleeper_(std::move(sleeper))
{
}

CommandResult CommandDispatcher::Execute(DeviceHandle* handle,
                                         const DescriptorBuilder& builder,
                                         const RetryPolicy& policy)
{
  const int max_attempts = std::max(1, policy.max_attempts);
  RetryState state;
  CommandResult result;

  while (true) {
    state.attempt++;

    const CommandDescriptor descriptor = builder();
    result = transport_.Submit(handle, descriptor);
    state.last_fault = ClassifyResult(result);

    if (state.last_fault != FaultClass::kTransient) { break; }
    if (state.attempt >= max_attempts) {
      Dmsg2(debuglevel, "%s: giving up after %d attempts\n",
            descriptor.name.c_str(), state.attempt);
      break;
    }

    auto delay = BackoffDelay(policy, state.attempt);
    state.total_backoff += delay;
    Dmsg4(debuglevel, "%s: transient fault (%s), attempt %d, retry in %lld ms\n",
          descriptor.name.c_str(), result.Describe().c_str(), state.attempt,
          static_cast<long long>(delay.count()));
    sleeper_(delay);
  }

  result.attempts = state.attempt;
  last_state_ = state;

  if (state.last_fault != FaultClass::kNone) {
    Dmsg3(debuglevel, "%s failed (%s) after %d attempt(s)\n",
          result.Describe().c_str(), FaultClassToString(state.last_fault),
          state.attempt);
  }
  return result;
}

}  // namespace tapectl
