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

#ifndef TAPECTL_TESTS_MOCK_TOOL_RUNNER_H_
#define TAPECTL_TESTS_MOCK_TOOL_RUNNER_H_

#include "gmock/gmock.h"
#include "tape/process_supervisor.h"

class MockToolRunner : public tapectl::ToolRunner {
 public:
  MOCK_METHOD1(Run, ProgramResult(const tapectl::ToolInvocation& invocation));
};

inline ProgramResult ExitedWith(int exit_code,
                                const std::string& std_out = std::string(),
                                const std::string& std_err = std::string())
{
  ProgramResult result;
  result.exit_code = exit_code;
  result.std_out = std_out;
  result.std_err = std_err;
  return result;
}

inline ProgramResult TimedOut()
{
  ProgramResult result;
  result.timed_out = true;
  return result;
}

using Args = std::vector<std::string>;

MATCHER_P(HasArguments, arguments, "") { return arg.arguments == arguments; }

MATCHER_P(RunsProgram, program, "") { return arg.program == program; }

#endif  // TAPECTL_TESTS_MOCK_TOOL_RUNNER_H_
