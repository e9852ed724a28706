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
#include "include/tapectl.h"
#include "lib/ini.h"
#include "tape/tape_config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace tapectl;

// clang-format off
static struct ini_items test_items[] = {
  {"name",    INI_CFG_TYPE_NAME,   "A name",   0, "default", ITEMS_DEFAULT},
  {"text",    INI_CFG_TYPE_STR,    "",         0, nullptr,   ITEMS_DEFAULT},
  {"count",   INI_CFG_TYPE_PINT32, "Count",    0, "7",       ITEMS_DEFAULT},
  {"offset",  INI_CFG_TYPE_INT32,  "",         0, "0",       ITEMS_DEFAULT},
  {"enabled", INI_CFG_TYPE_BOOL,   "",         0, "no",      ITEMS_DEFAULT},
  {nullptr, 0, nullptr, 0, nullptr, ITEMS_DEFAULT}
};
// clang-format on

class IniTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    ASSERT_TRUE(ini.RegisterItems(test_items, sizeof(struct ini_items)));
  }

  const item_value& Value(const char* name)
  {
    return ini.items[ini.GetItem(name)].val;
  }

  ConfigFile ini;
};

TEST_F(IniTest, defaults_apply_before_parsing)
{
  EXPECT_EQ(Value("name").strval, "default");
  EXPECT_EQ(Value("count").int32val, 7);
  EXPECT_FALSE(Value("enabled").boolval);
  EXPECT_EQ(ini.GetItem("missing"), -1);
}

TEST_F(IniTest, parse_values)
{
  const char* content
      = "# comment\n"
        "\n"
        "NAME = drive1   # keys are case insensitive\n"
        "text = \"with spaces # and hash\"\n"
        "count = 42\n"
        "offset = -5\n"
        "enabled = Yes\n";

  ASSERT_TRUE(ini.ParseString(content)) << ini.error();
  EXPECT_EQ(Value("name").strval, "drive1");
  EXPECT_EQ(Value("text").strval, "with spaces # and hash");
  EXPECT_EQ(Value("count").int32val, 42);
  EXPECT_EQ(Value("offset").int32val, -5);
  EXPECT_TRUE(Value("enabled").boolval);
  EXPECT_TRUE(ini.items[ini.GetItem("count")].found);
}

TEST_F(IniTest, unknown_keyword_is_an_error)
{
  EXPECT_FALSE(ini.ParseString("name = a\nbogus = 1\n", "test.conf"));
  EXPECT_EQ(ini.error(), "test.conf:2: Keyword bogus not found");
}

TEST_F(IniTest, malformed_values_are_errors)
{
  EXPECT_FALSE(ini.ParseString("count = -1\n"));
  EXPECT_FALSE(ini.ParseString("count = 99999999999\n"));
  EXPECT_FALSE(ini.ParseString("offset = 12abc\n"));
  EXPECT_FALSE(ini.ParseString("enabled = maybe\n"));
  EXPECT_FALSE(ini.ParseString("name = \"quoted\"\n"));
  EXPECT_FALSE(ini.ParseString("name = two words\n"));
  EXPECT_FALSE(ini.ParseString("text = \"unterminated\n"));
  EXPECT_FALSE(ini.ParseString("text = \"a\" trailing\n"));
  EXPECT_FALSE(ini.ParseString("no equals sign\n"));
  EXPECT_NE(ini.error().find("expected '='"), std::string::npos);
}

TEST_F(IniTest, quoted_strings_round_trip)
{
  ini.items[ini.GetItem("text")].val.strval = "\\\\.\\Tape0 \"x\"";

  std::string dump;
  ini.DumpResults(dump);

  ConfigFile reparsed;
  ASSERT_TRUE(reparsed.RegisterItems(test_items, sizeof(struct ini_items)));
  ASSERT_TRUE(reparsed.ParseString(dump)) << reparsed.error();
  EXPECT_EQ(reparsed.items[reparsed.GetItem("text")].val.strval,
            "\\\\.\\Tape0 \"x\"");
}

TEST_F(IniTest, dump_shows_comments_and_values)
{
  std::string dump;
  EXPECT_EQ(ini.DumpResults(dump), static_cast<int>(dump.size()));
  EXPECT_NE(dump.find("# A name\nname = default\n"), std::string::npos);
  EXPECT_NE(dump.find("count = 7\n"), std::string::npos);
  EXPECT_NE(dump.find("enabled = no\n"), std::string::npos);
  EXPECT_NE(dump.find("text = \"\"\n"), std::string::npos);
}

TEST_F(IniTest, missing_file)
{
  EXPECT_FALSE(ini.parse("/nonexistent/tapectl.conf"));
  EXPECT_NE(ini.error().find("/nonexistent/tapectl.conf"), std::string::npos);
}

TEST(ini, store_codes)
{
  EXPECT_STREQ(ini_get_store_code(INI_CFG_TYPE_PINT32), "@PINT32@");
  EXPECT_EQ(IniGetStoreType("@BOOL@"), INI_CFG_TYPE_BOOL);
  EXPECT_EQ(IniGetStoreType("@NOPE@"), 0);
}

TEST(tape_config, defaults)
{
  TapeConfig config = DefaultTapeConfig();

  EXPECT_EQ(config.itdt_path, "itdt");
  EXPECT_FALSE(config.itdt_force_generic_dd);
  EXPECT_EQ(config.drive_address, "0.0.24.0");
  EXPECT_EQ(config.drive_letter, "O");
  EXPECT_EQ(config.label_format, "BK%Y%m%d_%H%M");
  EXPECT_EQ(config.label_mapping_file, "");
  EXPECT_EQ(config.attribute_directory, "");
  EXPECT_EQ(config.scsi_timeout, std::chrono::seconds(300));
  EXPECT_EQ(config.retry.max_attempts, 3);
  EXPECT_EQ(config.retry.base_delay, std::chrono::milliseconds(1000));
  EXPECT_EQ(config.retry.max_delay, std::chrono::milliseconds(8000));
  EXPECT_EQ(config.erase_timeout, std::chrono::seconds(10800));
}

TEST(tape_config, parse_overrides)
{
  TapeConfig config;
  std::string error;

  ASSERT_TRUE(ParseTapeConfigString("device = \"\\\\\\\\.\\\\Tape1\"\n"
                                    "itdt_force_generic_dd = yes\n"
                                    "drive_letter = E\n"
                                    "retry_max_attempts = 5\n"
                                    "format_timeout = 600\n"
                                    "attribute_directory = /var/tmp\n",
                                    config, error))
      << error;

  EXPECT_EQ(config.device, "\\\\.\\Tape1");
  EXPECT_TRUE(config.itdt_force_generic_dd);
  EXPECT_EQ(config.retry.max_attempts, 5);

  ItdtOptions itdt = config.Itdt();
  EXPECT_EQ(itdt.device, "\\\\.\\Tape1");
  EXPECT_TRUE(itdt.force_generic_dd);
  EXPECT_EQ(itdt.attribute_directory, "/var/tmp");

  LtfsOptions ltfs = config.Ltfs();
  EXPECT_EQ(ltfs.drive_letter, "E");
  EXPECT_EQ(ltfs.format_timeout, std::chrono::seconds(600));

  EXPECT_EQ(config.Timeouts().format, std::chrono::seconds(600));
}

TEST(tape_config, parse_error_is_reported)
{
  TapeConfig config;
  std::string error;

  EXPECT_FALSE(ParseTapeConfigString("scsi_timeout = soon\n", config, error));
  EXPECT_NE(error.find("scsi_timeout"), std::string::npos);
}

TEST(tape_config, load_and_dump_file)
{
  std::filesystem::path file
      = std::filesystem::temp_directory_path() / "tapectl-config-test.conf";
  {
    std::ofstream out(file);
    out << "device = /dev/nst3\n"
        << "monitor_interval = 15\n";
  }

  TapeConfig config;
  std::string error;
  ASSERT_TRUE(LoadTapeConfig(file.string(), config, error)) << error;
  EXPECT_EQ(config.device, "/dev/nst3");
  EXPECT_EQ(config.monitor_interval, std::chrono::seconds(15));

  std::string dump = DumpTapeConfig(file.string());
  EXPECT_NE(dump.find("device = \"/dev/nst3\"\n"), std::string::npos);
  EXPECT_NE(dump.find("monitor_interval = 15\n"), std::string::npos);

  // the dump is itself a valid configuration
  TapeConfig reparsed;
  ASSERT_TRUE(ParseTapeConfigString(dump, reparsed, error)) << error;
  EXPECT_EQ(reparsed.device, "/dev/nst3");
  EXPECT_EQ(reparsed.label_format, config.label_format);

  std::filesystem::remove(file);
}

TEST(tape_config, empty_filename_gives_defaults)
{
  TapeConfig config;
  std::string error;

  ASSERT_TRUE(LoadTapeConfig("", config, error));
  EXPECT_EQ(config.monitor_interval, std::chrono::seconds(60));
  EXPECT_EQ(config.kill_grace, std::chrono::seconds(5));
}
