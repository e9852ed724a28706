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

#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "include/tapectl.h"
#include "tape/ltfs_tools.h"
#include "tests/mock_tool_runner.h"

#include <filesystem>

using namespace tapectl;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::Return;

static LtfsOptions TestOptions()
{
  LtfsOptions options;
  options.tool_directory = "/opt/ltfs";
  options.drive_address = "0.0.24.0";
  options.drive_letter = "o:";
  options.assign_timeout = std::chrono::seconds(90);
  return options;
}

static std::string Tool(LtfsCommand command)
{
  return (std::filesystem::path("/opt/ltfs") / LtfsExecutableName(command))
      .string();
}

TEST(ltfs_tools, drive_letter_is_normalized)
{
  EXPECT_EQ(NormalizeDriveLetter("o:"), "O");
  EXPECT_EQ(NormalizeDriveLetter("O"), "O");
  EXPECT_EQ(NormalizeDriveLetter("e::"), "E");
  EXPECT_EQ(NormalizeDriveLetter(""), "");
}

TEST(ltfs_tools, volume_serial_validation)
{
  EXPECT_TRUE(IsValidVolumeSerial("TP1101"));
  EXPECT_TRUE(IsValidVolumeSerial("000042"));
  EXPECT_FALSE(IsValidVolumeSerial("tp1101"));
  EXPECT_FALSE(IsValidVolumeSerial("TP110"));
  EXPECT_FALSE(IsValidVolumeSerial("TP11011"));
  EXPECT_FALSE(IsValidVolumeSerial("TP-101"));
}

TEST(ltfs_tools, load_runs_in_tool_directory)
{
  MockToolRunner runner;
  LtfsTools tools(runner, TestOptions());

  EXPECT_CALL(runner,
              Run(AllOf(RunsProgram(Tool(LtfsCommand::kLoad)),
                        HasArguments(Args{"0.0.24.0"}),
                        Field(&ToolInvocation::working_directory, "/opt/ltfs"),
                        Field(&ToolInvocation::device, "0.0.24.0"))))
      .WillOnce(Return(ExitedWith(0)));

  EXPECT_TRUE(tools.Load().success());
}

TEST(ltfs_tools, assign_and_unassign)
{
  MockToolRunner runner;
  LtfsTools tools(runner, TestOptions());

  EXPECT_CALL(runner,
              Run(AllOf(RunsProgram(Tool(LtfsCommand::kAssign)),
                        HasArguments(Args{"0.0.24.0", "O:"}),
                        Field(&ToolInvocation::timeout,
                              std::chrono::seconds(90)))))
      .WillOnce(Return(ExitedWith(0)));
  EXPECT_CALL(runner, Run(AllOf(RunsProgram(Tool(LtfsCommand::kUnassign)),
                                HasArguments(Args{"0.0.24.0"}))))
      .WillOnce(Return(ExitedWith(0)));

  EXPECT_TRUE(tools.Assign().success());
  EXPECT_TRUE(tools.Unassign().success());
}

TEST(ltfs_tools, format_arguments)
{
  MockToolRunner runner;
  LtfsTools tools(runner, TestOptions());

  EXPECT_CALL(runner,
              Run(AllOf(RunsProgram(Tool(LtfsCommand::kFormat)),
                        HasArguments(Args{"O", "/S:TP1101", "/N:BACKUP", "/E"}),
                        Field(&ToolInvocation::timeout,
                              std::chrono::seconds(3600)))))
      .WillOnce(Return(ExitedWith(0)));
  EXPECT_CALL(runner, Run(HasArguments(Args{"O", "/N:BACKUP"})))
      .WillOnce(Return(ExitedWith(0)));

  EXPECT_TRUE(tools.Format("BACKUP", "TP1101", true).success());
  // an invalid serial is left out
  EXPECT_TRUE(tools.Format("BACKUP", "bad serial").success());
}

TEST(ltfs_tools, mkltfs_arguments)
{
  MockToolRunner runner;
  LtfsTools tools(runner, TestOptions());

  EXPECT_CALL(runner, Run(AllOf(RunsProgram(Tool(LtfsCommand::kMkltfs)),
                                HasArguments(Args{"-d", "/dev/sg3", "--force",
                                                  "--volume-name", "VOL01"}))))
      .WillOnce(Return(ExitedWith(0)));
  EXPECT_CALL(runner,
              Run(HasArguments(Args{"-d", "/dev/sg3", "--force"})))
      .WillOnce(Return(ExitedWith(0)));

  EXPECT_TRUE(tools.Mkltfs("/dev/sg3", "VOL01").success());
  EXPECT_TRUE(tools.Mkltfs("/dev/sg3", "").success());
}

TEST(ltfs_tools, parse_drives_output)
{
  const char* output
      = "Assigned   Address    Serial       Status\n"
        "--------   --------   ----------   ------\n"
        "O:         0.0.24.0   10WT012345   LTFS_MEDIA\n"
        "\n"
        "-          0.0.25.0   10WT054321   NO_MEDIA\n";

  std::vector<LtfsDrive> drives = ParseDrivesOutput(output);

  ASSERT_EQ(drives.size(), 2u);
  EXPECT_EQ(drives[0].assigned, "O:");
  EXPECT_EQ(drives[0].address, "0.0.24.0");
  EXPECT_EQ(drives[0].serial, "10WT012345");
  EXPECT_EQ(drives[0].status, "LTFS_MEDIA");
  EXPECT_EQ(drives[1].status, "NO_MEDIA");
}

TEST(ltfs_tools, failed_drives_query_lists_nothing)
{
  MockToolRunner runner;
  LtfsTools tools(runner, TestOptions());

  EXPECT_CALL(runner, Run(HasArguments(Args{})))
      .WillOnce(Return(ExitedWith(1, "Assigned Address Serial Status\n--\n"
                                     "O: 0.0.24.0 X Y\n")));

  std::vector<LtfsDrive> drives{LtfsDrive()};
  EXPECT_FALSE(tools.Drives(drives).success());
  EXPECT_TRUE(drives.empty());
}

TEST(ltfs_tools, missing_tools_are_reported)
{
  LtfsOptions options;
  options.tool_directory = "/nonexistent/ltfs";
  MockToolRunner runner;
  LtfsTools tools(runner, options);

  std::vector<ToolAvailability> availability = tools.CheckAvailability();

  ASSERT_EQ(availability.size(), 10u);
  EXPECT_EQ(availability.front().name, "LtfsCmdLoad");
  EXPECT_EQ(availability.back().name, "mkltfs");
  for (const ToolAvailability& tool : availability) {
    EXPECT_FALSE(tool.available) << tool.path;
  }
}
