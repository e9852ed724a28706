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
 * Execution of SCSI commands with fault classification and bounded
 * exponential backoff.
 */

#ifndef TAPECTL_TAPE_COMMAND_DISPATCH_H_
#define TAPECTL_TAPE_COMMAND_DISPATCH_H_

#include "lib/scsi_lli.h"

#include <chrono>
#include <functional>

namespace tapectl {

enum class FaultClass
{
  kNone,              /**< command succeeded */
  kTransient,         /**< retried after backoff */
  kPermanent,         /**< never retried */
  kUnknown,           /**< treated as permanent */
  kDeviceUnavailable  /**< never retried, the caller must reopen */
};

const char* FaultClassToString(FaultClass fault);
FaultClass ClassifyResult(const CommandResult& result);

struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{8000};
};

/* min(base * 2^(attempt-1), cap), the wait after attempt */
std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt);

/* Lives for one Execute call */
struct RetryState {
  int attempt{0};
  std::chrono::milliseconds total_backoff{0};
  FaultClass last_fault{FaultClass::kNone};
};

using DescriptorBuilder = std::function<CommandDescriptor()>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

class CommandDispatcher {
 public:
  explicit CommandDispatcher(ScsiTransport& transport);
  CommandDispatcher(ScsiTransport& transport, Sleeper sleeper);

  /*
   * Build a fresh descriptor per attempt and submit it. Transient faults
   * are retried up to policy.max_attempts, everything else returns at
   * once. The handle guard is only held while a command is in flight.
   */
  CommandResult Execute(DeviceHandle* handle,
                        const DescriptorBuilder& builder,
                        const RetryPolicy& policy);

  /* The state of the last Execute call */
  const RetryState& LastRetryState() const { return last_state_; }

  ScsiTransport& transport() { return transport_; }

 private:
  ScsiTransport& transport_;
  Sleeper sleeper_;
  RetryState last_state_;
};

}  // namespace tapectl

#endif  // TAPECTL_TAPE_COMMAND_DISPATCH_H_
