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
 * Supervised execution of vendor tools.
 */

#ifndef TAPECTL_TAPE_PROCESS_SUPERVISOR_H_
#define TAPECTL_TAPE_PROCESS_SUPERVISOR_H_

#include "lib/run_program.h"
#include "lib/thread_util.h"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tapectl {

struct ToolInvocation {
  std::string program;
  std::vector<std::string> arguments;
  std::string working_directory;
  std::chrono::seconds timeout{60};
  /* runs on the same device are serialized, empty for none */
  std::string device;
};

enum class ToolOutcome
{
  kSuccess,
  kFailure, /**< non-zero exit, see std_err */
  kTimeout  /**< killed at the deadline */
};

ToolOutcome ClassifyProgramResult(const ProgramResult& result);
const char* ToolOutcomeToString(ToolOutcome outcome);

/* "exit code 2: <first line of stderr>" and the like */
std::string DescribeProgramResult(const ProgramResult& result);

class ToolRunner {
 public:
  virtual ~ToolRunner() = default;
  virtual ProgramResult Run(const ToolInvocation& invocation) = 0;
};

/*
 * Runs each invocation with RunProgram. Invocations naming the same
 * device never overlap. Waiting for the device uses up the invocation's
 * timeout, so Run returns within timeout + 2 * kill_grace in any case; a
 * run that does not get the device before its timeout fails with exit
 * code -1 and "device busy" on stderr.
 */
class ProcessSupervisor : public ToolRunner {
 public:
  explicit ProcessSupervisor(std::chrono::milliseconds kill_grace
                             = std::chrono::seconds(5));

  ProgramResult Run(const ToolInvocation& invocation) override;

  /* The supervisor must outlive the returned future */
  std::future<ProgramResult> RunAsync(ToolInvocation invocation);

  std::chrono::milliseconds kill_grace() const { return kill_grace_; }

 private:
  std::shared_ptr<std::timed_mutex> DeviceLock(const std::string& device);

  std::chrono::milliseconds kill_grace_;
  synchronized<std::map<std::string, std::shared_ptr<std::timed_mutex>>>
      device_locks_;
};

}  // namespace tapectl

#endif  // TAPECTL_TAPE_PROCESS_SUPERVISOR_H_
