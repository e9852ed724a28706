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
 * Run an external program with captured output and a hard deadline
 */

#ifndef TAPECTL_LIB_RUN_PROGRAM_H_
#define TAPECTL_LIB_RUN_PROGRAM_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/*
 * Execution record of one program run. Exactly one of exit_code and
 * timed_out is set. A program killed by a signal reports 128 + signal,
 * a program that could not be started reports 127 (not executable),
 * 126 (working directory unusable) or -1 (no process was created).
 */
struct ProgramResult {
  std::string program;
  std::vector<std::string> arguments;
  std::string working_directory;
  std::chrono::system_clock::time_point start_time{};
  std::chrono::steady_clock::time_point deadline{};
  ProcessId pid{0};

  std::string std_out;
  std::string std_err;
  std::optional<int> exit_code;
  bool timed_out{false};
  std::chrono::milliseconds elapsed{0};

  bool success() const { return !timed_out && exit_code && *exit_code == 0; }
};

/*
 * Start program with arguments in working_directory (empty means the
 * current one), stdin from the null device, stdout and stderr captured.
 *
 * After timeout the program and its process group are terminated, after
 * a further kill_grace killed. The call returns within
 * timeout + 2 * kill_grace under all circumstances.
 */
ProgramResult RunProgram(const std::string& program,
                         const std::vector<std::string>& arguments,
                         const std::string& working_directory,
                         std::chrono::milliseconds timeout,
                         std::chrono::milliseconds kill_grace
                         = std::chrono::seconds(5));

/* Quote the command line for logging */
std::string FormatCommandLine(const std::string& program,
                              const std::vector<std::string>& arguments);

#endif  // TAPECTL_LIB_RUN_PROGRAM_H_
