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
#include "tape/cartridge_identity.h"
#include "tape/itdt_tool.h"
#include "tests/mock_tool_runner.h"

#include <filesystem>
#include <fstream>

using namespace tapectl;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::Return;

namespace fs = std::filesystem;

static ItdtOptions TestOptions()
{
  ItdtOptions options;
  options.program = "/opt/ibm/itdt";
  options.device = "/dev/nst0";
  return options;
}

/* Path given to readattr with -d or writeattr with -s */
static std::string FileArgument(const ToolInvocation& invocation,
                                const std::string& flag)
{
  for (const std::string& arg : invocation.arguments) {
    if (arg.compare(0, flag.size(), flag) == 0) {
      return arg.substr(flag.size());
    }
  }
  return std::string();
}

/* Behaves like readattr, writing data into the -d file */
static auto WritesAttributeFile(std::vector<uint8_t> data, int exit_code = 0)
{
  return [data, exit_code](const ToolInvocation& invocation) {
    std::ofstream out(FileArgument(invocation, "-d"), std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
    return ExitedWith(exit_code);
  };
}

TEST(itdt_tool, device_commands)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());

  EXPECT_CALL(runner,
              Run(AllOf(RunsProgram("/opt/ibm/itdt"),
                        HasArguments(Args{"-f", "/dev/nst0", "tur"}),
                        Field(&ToolInvocation::device, "/dev/nst0"))))
      .WillOnce(Return(ExitedWith(0)));
  EXPECT_CALL(runner, Run(HasArguments(Args{"-f", "/dev/nst0", "load", "-amu"})))
      .WillOnce(Return(ExitedWith(0)));
  EXPECT_CALL(runner, Run(HasArguments(Args{"-f", "/dev/nst0", "weof", "3"})))
      .WillOnce(Return(ExitedWith(0)));
  EXPECT_CALL(runner, Run(HasArguments(Args{"-f", "/dev/nst0", "weof"})))
      .WillOnce(Return(ExitedWith(0)));
  EXPECT_CALL(runner, Run(HasArguments(Args{"-f", "/dev/nst0", "qrypos"})))
      .WillOnce(Return(ExitedWith(0)));

  EXPECT_TRUE(itdt.TestUnitReady().success());
  EXPECT_TRUE(itdt.Load(true).success());
  EXPECT_TRUE(itdt.WriteFilemarks(3).success());
  EXPECT_TRUE(itdt.WriteFilemarks().success());
  EXPECT_TRUE(itdt.QueryPosition().success());
}

TEST(itdt_tool, erase_uses_erase_timeout)
{
  MockToolRunner runner;
  ItdtOptions options = TestOptions();
  options.erase_timeout = std::chrono::seconds(500);
  ItdtTool itdt(runner, options);

  EXPECT_CALL(runner,
              Run(AllOf(HasArguments(Args{"-f", "/dev/nst0", "erase", "-short"}),
                        Field(&ToolInvocation::timeout,
                              std::chrono::seconds(500)))))
      .WillOnce(Return(ExitedWith(0)));

  EXPECT_TRUE(itdt.Erase(true).success());
}

TEST(itdt_tool, force_generic_dd_comes_first)
{
  MockToolRunner runner;
  ItdtOptions options = TestOptions();
  options.force_generic_dd = true;
  ItdtTool itdt(runner, options);

  EXPECT_CALL(runner, Run(HasArguments(Args{"-force-generic-dd", "-f",
                                            "/dev/nst0", "rewind"})))
      .WillOnce(Return(ExitedWith(0)));
  EXPECT_CALL(runner, Run(HasArguments(Args{"-force-generic-dd", "-version"})))
      .WillOnce(Return(ExitedWith(0)));

  EXPECT_TRUE(itdt.Rewind().success());
  EXPECT_TRUE(itdt.IsAvailable());
}

TEST(itdt_tool, missing_itdt_is_not_available)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());

  EXPECT_CALL(runner, Run(HasArguments(Args{"-version"})))
      .WillOnce(Return(ExitedWith(127)));

  EXPECT_FALSE(itdt.IsAvailable());
}

static const char* kTapeUsageOutput = R"(
Thread Count            12
Data Sets Read          4711
Data Sets Written       815
Read Retries            3
Write Retries           2
Unrecovered Read Err.   1
Unrecovered Write Err.  0
Suspended Reads         2
Suspended Writes        0
Fatal Suspended Reads   1
Fatal Suspended Writes  0
Result: pass
Code: ok
)";

TEST(itdt_tool, parse_tape_usage)
{
  TapeUsage usage = ParseTapeUsage(kTapeUsageOutput);

  EXPECT_EQ(usage.thread_count, 12);
  EXPECT_EQ(usage.data_sets_read, 4711);
  EXPECT_EQ(usage.data_sets_written, 815);
  EXPECT_EQ(usage.read_retries, 3);
  EXPECT_EQ(usage.write_retries, 2);
  EXPECT_EQ(usage.unrecovered_read_errors, 1);
  EXPECT_EQ(usage.suspended_reads, 2);
  EXPECT_EQ(usage.fatal_suspended_reads, 1);
  EXPECT_EQ(usage.fatal_suspended_writes, 0);
  EXPECT_EQ(usage.result, "PASS");
  EXPECT_EQ(usage.code, "OK");
  // 100 - 10 - 5 - 4 - 5
  EXPECT_EQ(usage.health_score, 76);
  ASSERT_TRUE(usage.formatted);
  EXPECT_TRUE(*usage.formatted);
}

TEST(itdt_tool, health_score_is_clamped)
{
  TapeUsage usage;
  usage.fatal_suspended_writes = 20;
  EXPECT_EQ(TapeUsageHealthScore(usage), 0);

  usage = TapeUsage();
  usage.read_retries = 1000;
  EXPECT_EQ(TapeUsageHealthScore(usage), 90);
}

TEST(itdt_tool, tape_usage_of_unformatted_tape)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());

  EXPECT_CALL(runner, Run(HasArguments(Args{"-f", "/dev/nst0", "tapeusage"})))
      .WillOnce(Return(ExitedWith(1, "", "Medium not formatted")));

  TapeUsage usage;
  EXPECT_FALSE(itdt.QueryTapeUsage(usage).success());
  ASSERT_TRUE(usage.formatted);
  EXPECT_FALSE(*usage.formatted);
  EXPECT_EQ(usage.result, "UNKNOWN");
}

TEST(itdt_tool, tape_usage_timeout_leaves_formatted_unknown)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());

  EXPECT_CALL(runner, Run(_)).WillOnce(Return(TimedOut()));

  TapeUsage usage;
  EXPECT_FALSE(itdt.QueryTapeUsage(usage).success());
  EXPECT_FALSE(usage.formatted);
}

TEST(itdt_tool, parse_scan_output)
{
  const char* output
      = "Scanning...\n"
        "#0 /dev/IBMtape0: - [ULT3580-HH9]-[R1J1] S/N:10WT012345 H0-B0-T2-L0\n"
        "#1 \\\\.\\Tape1: - [ULTRIUM-TD5] S/N:HU1234ABCD\n"
        "\\\\.\\Changer0\n"
        "Exit with code: 0\n";

  std::vector<ScannedDevice> devices = ParseScanOutput(output);

  ASSERT_EQ(devices.size(), 3u);
  EXPECT_EQ(devices[0].path, "/dev/IBMtape0");
  EXPECT_EQ(devices[0].model, "ULT3580-HH9");
  EXPECT_EQ(devices[0].generation, "R1J1");
  EXPECT_EQ(devices[0].serial, "10WT012345");
  EXPECT_TRUE(devices[0].is_ibm_lto);
  EXPECT_EQ(devices[0].vendor, "IBM");

  EXPECT_EQ(devices[1].path, "\\\\.\\Tape1");
  EXPECT_EQ(devices[1].generation, "");
  EXPECT_FALSE(devices[1].is_ibm_lto);

  EXPECT_EQ(devices[2].path, "\\\\.\\Changer0");
  EXPECT_TRUE(devices[2].serial.empty());
}

TEST(itdt_tool, ltfs_readiness)
{
  EXPECT_EQ(ParseLtfsReadiness(ExitedWith(0, "Drive is ready for LTFS\n")),
            LtfsReadiness::kReady);
  EXPECT_EQ(ParseLtfsReadiness(ExitedWith(0, "Medium not formatted\n")),
            LtfsReadiness::kNotReady);
  EXPECT_EQ(ParseLtfsReadiness(ExitedWith(0, "done\n")),
            LtfsReadiness::kUndetermined);
  EXPECT_EQ(ParseLtfsReadiness(ExitedWith(2, "", "LTFS not supported\n")),
            LtfsReadiness::kNotReady);
  EXPECT_EQ(ParseLtfsReadiness(TimedOut()), LtfsReadiness::kUndetermined);
}

TEST(itdt_tool, check_ltfs_readiness_arguments)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());

  EXPECT_CALL(runner,
              Run(AllOf(HasArguments(Args{"-f", "/dev/nst0",
                                          "checkltfsreadiness",
                                          "-forcedataoverwrite"}),
                        Field(&ToolInvocation::timeout,
                              std::chrono::seconds(7200)))))
      .WillOnce(Return(ExitedWith(0, "LTFS ready\n")));

  LtfsReadiness readiness = LtfsReadiness::kUndetermined;
  EXPECT_TRUE(itdt.CheckLtfsReadiness(true, readiness).success());
  EXPECT_EQ(readiness, LtfsReadiness::kReady);
}

TEST(itdt_tool, read_attribute_decodes_output_file)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());
  std::string file;

  EXPECT_CALL(runner, Run(_))
      .WillOnce(Invoke([&file](const ToolInvocation& invocation) {
        EXPECT_EQ(invocation.arguments[2], "readattr");
        EXPECT_EQ(invocation.arguments[3], "-p1");
        EXPECT_EQ(invocation.arguments[4], "-a0x0002");
        file = FileArgument(invocation, "-d");
        return WritesAttributeFile(
            {0x00, 0x00, 0x54, 0x50, 0x31, 0x31, 0x30, 0x31, 0x00, 0x00})(
            invocation);
      }));

  std::optional<MamAttributeRecord> record;
  EXPECT_TRUE(itdt.ReadAttribute(1, IDENTITY_ATTR_SERIAL, record).success());

  ASSERT_TRUE(record);
  EXPECT_EQ(record->value, "TP1101");
  EXPECT_EQ(record->partition, 1);
  ASSERT_FALSE(file.empty());
  EXPECT_FALSE(fs::exists(file));
}

TEST(itdt_tool, failed_read_attribute_has_no_record)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());

  EXPECT_CALL(runner, Run(_))
      .WillOnce(Invoke(WritesAttributeFile({'J', 'U', 'N', 'K'}, 4)));

  std::optional<MamAttributeRecord> record;
  EXPECT_FALSE(itdt.ReadAttribute(0, IDENTITY_ATTR_BARCODE, record).success());
  EXPECT_FALSE(record);
}

TEST(itdt_tool, write_attribute_passes_value_file)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());
  std::string written;

  EXPECT_CALL(runner, Run(_))
      .WillOnce(Invoke([&written](const ToolInvocation& invocation) {
        EXPECT_EQ(invocation.arguments[2], "writeattr");
        EXPECT_EQ(invocation.arguments[4], "-a0x0803");
        std::ifstream in(FileArgument(invocation, "-s"), std::ios::binary);
        std::getline(in, written);
        return ExitedWith(0);
      }));

  EXPECT_TRUE(itdt.WriteAttribute(0, MAM_ATTR_USER_MEDIUM_TEXT_LABEL, "BK1")
                  .success());
  EXPECT_EQ(written, "BK1");
}

TEST(itdt_tool, attribute_files_go_to_the_attribute_directory)
{
  fs::path dir = fs::temp_directory_path() / "tapectl-itdt-attribute-dir";
  fs::remove_all(dir);
  ASSERT_TRUE(fs::create_directory(dir));

  MockToolRunner runner;
  ItdtOptions options = TestOptions();
  options.attribute_directory = dir.string();
  ItdtTool itdt(runner, options);

  EXPECT_CALL(runner, Run(_))
      .WillOnce(Invoke([&dir](const ToolInvocation& invocation) {
        EXPECT_EQ(fs::path(FileArgument(invocation, "-s")).parent_path(), dir);
        return ExitedWith(0);
      }));

  EXPECT_TRUE(itdt.WriteAttribute(0, MAM_ATTR_USER_MEDIUM_TEXT_LABEL, "BK1")
                  .success());
  EXPECT_TRUE(fs::is_empty(dir));
  fs::remove_all(dir);
}

TEST(itdt_tool, unwritable_value_file_runs_nothing)
{
  fs::path dir = fs::temp_directory_path() / "tapectl-itdt-missing" / "sub";
  fs::remove_all(dir.parent_path());

  MockToolRunner runner;
  ItdtOptions options = TestOptions();
  options.attribute_directory = dir.string();
  ItdtTool itdt(runner, options);

  EXPECT_CALL(runner, Run(_)).Times(0);

  ProgramResult result
      = itdt.WriteAttribute(0, MAM_ATTR_USER_MEDIUM_TEXT_LABEL, "BK1");
  EXPECT_FALSE(result.success());
  ASSERT_TRUE(result.exit_code);
  EXPECT_EQ(*result.exit_code, -1);
  EXPECT_THAT(result.std_err, HasSubstr("cannot write"));
  EXPECT_FALSE(fs::exists(dir.parent_path()));
}

TEST(cartridge_identity, read_with_itdt)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());

  EXPECT_CALL(runner, Run(_))
      .WillOnce(Invoke(WritesAttributeFile(
          {0x00, 0x00, 0x54, 0x50, 0x31, 0x31, 0x30, 0x31, 0x00, 0x00})))
      .WillOnce(Invoke(WritesAttributeFile({'A', '0', '0', '0', '0', '1', 'L',
                                            '9'})))
      .WillOnce(Invoke(WritesAttributeFile({'I', 'B', 'M', ' ', ' '})));

  CartridgeIdentity identity = ReadCartridgeIdentity(itdt);

  EXPECT_EQ(identity.serial, "TP1101");
  EXPECT_EQ(identity.barcode, "A00001L9");
  EXPECT_EQ(identity.manufacturer, "IBM");
  EXPECT_TRUE(identity.errors.empty());
  EXPECT_FALSE(identity.empty());
}

TEST(cartridge_identity, known_empty_serial_and_missing_barcode)
{
  MockToolRunner runner;
  ItdtTool itdt(runner, TestOptions());

  EXPECT_CALL(runner, Run(_))
      .WillOnce(Invoke(WritesAttributeFile({0x00, 0x00, 0x00, 0x00})))
      .WillOnce(Return(ExitedWith(1, "", "attribute not available")))
      .WillOnce(Invoke(WritesAttributeFile({'H', 'P', 'E'})));

  CartridgeIdentity identity = ReadCartridgeIdentity(itdt);

  EXPECT_EQ(identity.serial, "");
  EXPECT_EQ(identity.barcode, "");
  EXPECT_EQ(identity.manufacturer, "HPE");
  EXPECT_FALSE(identity.errors.empty());
}
