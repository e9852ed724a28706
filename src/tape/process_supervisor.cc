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
#include "tape/process_supervisor.h"

#include <fmt/format.h>

namespace tapectl {

static constexpr int debuglevel{100};

ToolOutcome ClassifyProgramResult(const ProgramResult& result)
{
  if (result.timed_out) { return ToolOutcome::kTimeout; }
  if (result.success()) { return ToolOutcome::kSuccess; }
  return ToolOutcome::kFailure;
}

const char* ToolOutcomeToString(ToolOutcome outcome)
{
  switch (outcome) {
    case ToolOutcome::kSuccess:
      return "success";
    case ToolOutcome::kFailure:
      return "failure";
    case ToolOutcome::kTimeout:
      return "timeout";
  }
  return "unknown";
}

static std::string FirstLine(const std::string& text)
{
  std::size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) { return std::string(); }
  std::size_t end = text.find_first_of("\r\n", begin);
  return text.substr(begin, end == std::string::npos ? end : end - begin);
}

std::string DescribeProgramResult(const ProgramResult& result)
{
  switch (ClassifyProgramResult(result)) {
    case ToolOutcome::kSuccess:
      return "success";
    case ToolOutcome::kTimeout:
      return fmt::format("timed out after {} ms", result.elapsed.count());
    case ToolOutcome::kFailure:
      break;
  }

  std::string line = FirstLine(result.std_err);
  if (line.empty()) { line = FirstLine(result.std_out); }
  if (line.empty()) { return fmt::format("exit code {}", *result.exit_code); }
  return fmt::format("exit code {}: {}", *result.exit_code, line);
}

ProcessSupervisor::ProcessSupervisor(std::chrono::milliseconds kill_grace)
    : kill_grace_(kill_grace)
{
}

std::shared_ptr<std::timed_mutex> ProcessSupervisor::DeviceLock(
    const std::string& device)
{
  auto locks = device_locks_.lock();
  auto& lock = (*locks)[device];
  if (!lock) { lock = std::make_shared<std::timed_mutex>(); }
  return lock;
}

static ProgramResult DeviceBusyResult(const ToolInvocation& invocation,
                                      std::chrono::milliseconds waited)
{
  ProgramResult busy;
  busy.program = invocation.program;
  busy.arguments = invocation.arguments;
  busy.working_directory = invocation.working_directory;
  busy.start_time = std::chrono::system_clock::now();
  busy.exit_code = -1;
  busy.std_err = fmt::format("device {} busy", invocation.device);
  busy.elapsed = waited;
  Emsg2(M_ERROR, 0, "%s not started: device %s busy\n",
        invocation.program.c_str(), invocation.device.c_str());
  return busy;
}

ProgramResult ProcessSupervisor::Run(const ToolInvocation& invocation)
{
  using std::chrono::milliseconds;
  using std::chrono::steady_clock;

  const auto start = steady_clock::now();
  const auto deadline = start + invocation.timeout;
  milliseconds timeout = std::chrono::duration_cast<milliseconds>(
      invocation.timeout);
  auto waited = [start]() {
    return std::chrono::duration_cast<milliseconds>(steady_clock::now()
                                                    - start);
  };

  std::shared_ptr<std::timed_mutex> device_lock;
  std::unique_lock<std::timed_mutex> device_guard;

  if (!invocation.device.empty()) {
    device_lock = DeviceLock(invocation.device);
    device_guard = std::unique_lock<std::timed_mutex>(*device_lock,
                                                      std::defer_lock);
    // time spent waiting for the device counts against the timeout
    if (!device_guard.try_lock_until(deadline)) {
      return DeviceBusyResult(invocation, waited());
    }
    timeout = std::chrono::duration_cast<milliseconds>(deadline
                                                       - steady_clock::now());
    if (timeout <= milliseconds::zero()) {
      return DeviceBusyResult(invocation, waited());
    }
  }

  Dmsg2(debuglevel, "running %s in \"%s\"\n",
        FormatCommandLine(invocation.program, invocation.arguments).c_str(),
        invocation.working_directory.c_str());

  ProgramResult result = RunProgram(
      invocation.program, invocation.arguments, invocation.working_directory,
      timeout, kill_grace_);

  switch (ClassifyProgramResult(result)) {
    case ToolOutcome::kSuccess:
      Dmsg2(debuglevel, "%s finished in %lld ms\n", invocation.program.c_str(),
            static_cast<long long>(result.elapsed.count()));
      break;
    case ToolOutcome::kTimeout:
      Emsg2(M_ERROR, 0, "%s killed after timeout of %lld s\n",
            invocation.program.c_str(),
            static_cast<long long>(invocation.timeout.count()));
      break;
    case ToolOutcome::kFailure:
      Dmsg2(debuglevel, "%s failed: %s\n", invocation.program.c_str(),
            DescribeProgramResult(result).c_str());
      break;
  }

  return result;
}

std::future<ProgramResult> ProcessSupervisor::RunAsync(ToolInvocation invocation)
{
  return std::async(std::launch::async,
                    [this, invocation = std::move(invocation)]() {
                      return Run(invocation);
                    });
}

}  // namespace tapectl
