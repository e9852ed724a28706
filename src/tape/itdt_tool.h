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
 * IBM Tape Diagnostic Tool (ITDT) command wrapper and output parsers.
 */

#ifndef TAPECTL_TAPE_ITDT_TOOL_H_
#define TAPECTL_TAPE_ITDT_TOOL_H_

#include "tape/mam_codec.h"
#include "tape/process_supervisor.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tapectl {

struct ItdtOptions {
  std::string program{"itdt"};
  std::string device;
  std::chrono::seconds timeout{60};
  std::chrono::seconds erase_timeout{10800};
  std::chrono::seconds check_timeout{7200};
  std::chrono::seconds attribute_timeout{60};
  bool force_generic_dd{false};
  /* readattr/writeattr files, the system temporary directory if empty */
  std::string attribute_directory;
};

/* Counters of "itdt tapeusage" */
struct TapeUsage {
  int thread_count{0};
  int data_sets_read{0};
  int data_sets_written{0};
  int read_retries{0};
  int write_retries{0};
  int unrecovered_read_errors{0};
  int unrecovered_write_errors{0};
  int suspended_reads{0};
  int suspended_writes{0};
  int fatal_suspended_reads{0};
  int fatal_suspended_writes{0};
  int health_score{100};
  std::string result{"UNKNOWN"};
  std::string code{"UNKNOWN"};
  /* std::nullopt if the output does not tell */
  std::optional<bool> formatted;
};

/*
 * 100 - 10 per fatal suspension - 5 per unrecovered error - 2 per
 * suspension - retries (at most 10), clamped to 0..100
 */
int TapeUsageHealthScore(const TapeUsage& usage);

/* Usage of a successful run */
TapeUsage ParseTapeUsage(const std::string& output);

struct ScannedDevice {
  std::string path;
  std::string vendor;
  std::string model;
  std::string generation;
  std::string serial;
  bool is_ibm_lto{false};
};

/* Device lines of "itdt scan" */
std::vector<ScannedDevice> ParseScanOutput(const std::string& output);

enum class LtfsReadiness
{
  kReady,
  kNotReady,
  kUndetermined
};

const char* LtfsReadinessToString(LtfsReadiness readiness);
LtfsReadiness ParseLtfsReadiness(const ProgramResult& result);

/*
 * Every method runs one itdt command through the ToolRunner and returns
 * its record, parsed results go to the out parameters.
 */
class ItdtTool {
 public:
  ItdtTool(ToolRunner& runner, ItdtOptions options);

  ProgramResult Version();
  bool IsAvailable();

  ProgramResult TestUnitReady();
  ProgramResult Rewind();
  ProgramResult Load(bool amu = false);
  ProgramResult Unload();
  ProgramResult Erase(bool short_erase);
  ProgramResult QueryPosition();
  ProgramResult WriteFilemarks(int count = 1);
  ProgramResult CheckLtfsReadiness(bool force_data_overwrite,
                                   LtfsReadiness& readiness);
  ProgramResult QueryTapeUsage(TapeUsage& usage);
  ProgramResult Scan(std::vector<ScannedDevice>& devices);

  /*
   * readattr into a temporary file that is decoded and removed. The
   * record is only set when the command succeeded and wrote data.
   */
  ProgramResult ReadAttribute(uint8_t partition,
                              uint16_t attribute_id,
                              std::optional<MamAttributeRecord>& record);
  ProgramResult WriteAttribute(uint8_t partition,
                               uint16_t attribute_id,
                               const std::string& value);

  const ItdtOptions& options() const { return options_; }

 private:
  ProgramResult RunDeviceCommand(std::vector<std::string> arguments,
                                 std::chrono::seconds timeout);
  ProgramResult RunGlobalCommand(std::vector<std::string> arguments,
                                 std::chrono::seconds timeout);

  ToolRunner& runner_;
  ItdtOptions options_;
};

/* "0x0002" */
std::string FormatAttributeId(uint16_t attribute_id);

}  // namespace tapectl

#endif  // TAPECTL_TAPE_ITDT_TOOL_H_
