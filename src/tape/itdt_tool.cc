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
#include "tape/itdt_tool.h"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>
#include <utility>

namespace tapectl {

static constexpr int debuglevel{100};

namespace fs = std::filesystem;

std::string FormatAttributeId(uint16_t attribute_id)
{
  return fmt::format("0x{:04X}", attribute_id);
}

static std::string ToLower(std::string text)
{
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

static std::string ToUpper(std::string text)
{
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

static bool Contains(const std::string& text, const char* what)
{
  return text.find(what) != std::string::npos;
}

int TapeUsageHealthScore(const TapeUsage& usage)
{
  int score = 100;

  score -= 10 * (usage.fatal_suspended_reads + usage.fatal_suspended_writes);
  score -= 5 * (usage.unrecovered_read_errors + usage.unrecovered_write_errors);
  score -= 2 * (usage.suspended_reads + usage.suspended_writes);
  score -= std::min(usage.read_retries + usage.write_retries, 10);

  return std::max(0, std::min(100, score));
}

TapeUsage ParseTapeUsage(const std::string& output)
{
  using Counter = int TapeUsage::*;
  static const std::pair<std::regex, Counter> counters[] = {
      {std::regex(R"(Fatal Suspend(?:ed)? Reads\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::fatal_suspended_reads},
      {std::regex(R"(Fatal Suspend(?:ed)? Writes\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::fatal_suspended_writes},
      {std::regex(R"(Thread Count\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::thread_count},
      {std::regex(R"(Data Sets Read\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::data_sets_read},
      {std::regex(R"(Data Sets Written\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::data_sets_written},
      {std::regex(R"(Read Retries\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::read_retries},
      {std::regex(R"(Write Retries\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::write_retries},
      {std::regex(R"(Unrecovered Read Err\.\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::unrecovered_read_errors},
      {std::regex(R"(Unrecovered Write Err\.\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::unrecovered_write_errors},
      {std::regex(R"(Suspended Reads\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::suspended_reads},
      {std::regex(R"(Suspended Writes\s+(\d{1,9}))", std::regex::icase),
       &TapeUsage::suspended_writes},
  };
  static const std::regex result_re(R"(Result:\s*(\w+))", std::regex::icase);
  static const std::regex code_re(R"(Code:\s*(\w+))", std::regex::icase);

  TapeUsage usage;
  std::istringstream in(output);
  std::string line;

  while (std::getline(in, line)) {
    std::smatch match;

    for (const auto& counter : counters) {
      if (std::regex_search(line, match, counter.first)) {
        usage.*counter.second = std::stoi(match[1].str());
        break;
      }
    }
    if (std::regex_search(line, match, result_re)) {
      usage.result = ToUpper(match[1].str());
    }
    if (std::regex_search(line, match, code_re)) {
      usage.code = ToUpper(match[1].str());
    }
  }

  usage.health_score = TapeUsageHealthScore(usage);
  usage.formatted = true;
  return usage;
}

std::vector<ScannedDevice> ParseScanOutput(const std::string& output)
{
  static const std::regex device_line(
      R"(#\d+\s+([^\s]+):\s+-\s+\[([^\]]+)\](?:-\[([^\]]+)\])?\s+S/N:([^\s]+))",
      std::regex::icase);
  static const std::regex device_path(R"((\\\\\.\\[A-Za-z0-9_-]+):?)");

  std::vector<ScannedDevice> devices;
  std::istringstream in(output);
  std::string line;

  while (std::getline(in, line)) {
    std::smatch match;

    if (std::regex_search(line, match, device_line)) {
      ScannedDevice device;
      device.path = match[1].str();
      device.model = match[2].str();
      device.generation = match[3].matched ? match[3].str() : std::string();
      device.serial = match[4].str();
      device.is_ibm_lto = Contains(ToUpper(device.model), "ULT3580");
      device.vendor = device.is_ibm_lto ? "IBM" : "Unknown";
      devices.push_back(std::move(device));
    } else if (std::regex_search(line, match, device_path)) {
      ScannedDevice device;
      device.path = match[1].str();
      devices.push_back(std::move(device));
    }
  }
  return devices;
}

const char* LtfsReadinessToString(LtfsReadiness readiness)
{
  switch (readiness) {
    case LtfsReadiness::kReady:
      return "ready";
    case LtfsReadiness::kNotReady:
      return "not ready";
    case LtfsReadiness::kUndetermined:
      return "undetermined";
  }
  return "unknown";
}

LtfsReadiness ParseLtfsReadiness(const ProgramResult& result)
{
  if (result.success()) {
    std::string out = ToLower(result.std_out);
    bool negative = Contains(out, "not ready") || Contains(out, "not formatted")
                    || Contains(out, "not supported");
    if (!negative
        && (Contains(out, "ready") || Contains(out, "formatted")
            || Contains(out, "ltfs support"))) {
      return LtfsReadiness::kReady;
    }
    if (negative) { return LtfsReadiness::kNotReady; }
    return LtfsReadiness::kUndetermined;
  }

  std::string err = ToLower(result.std_err);
  if (Contains(err, "not formatted") || Contains(err, "not ready")
      || Contains(err, "not supported")) {
    return LtfsReadiness::kNotReady;
  }
  return LtfsReadiness::kUndetermined;
}

static fs::path TemporaryAttributeFile(const std::string& directory)
{
  static std::atomic<unsigned> counter{0};
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::error_code ec;
  fs::path dir = directory;
  if (dir.empty()) { dir = fs::temp_directory_path(ec); }
  if (ec) { dir = fs::current_path(); }
  return dir
         / fmt::format("tapectl-attr-{}-{}.bin", static_cast<long long>(now),
                       counter++);
}

ItdtTool::ItdtTool(ToolRunner& runner, ItdtOptions options)
    : runner_(runner), options_(std::move(options))
{
}

ProgramResult ItdtTool::RunGlobalCommand(std::vector<std::string> arguments,
                                         std::chrono::seconds timeout)
{
  ToolInvocation invocation;

  invocation.program = options_.program;
  if (options_.force_generic_dd) {
    invocation.arguments.push_back("-force-generic-dd");
  }
  invocation.arguments.insert(invocation.arguments.end(), arguments.begin(),
                              arguments.end());
  invocation.timeout = timeout;
  return runner_.Run(invocation);
}

ProgramResult ItdtTool::RunDeviceCommand(std::vector<std::string> arguments,
                                         std::chrono::seconds timeout)
{
  ToolInvocation invocation;

  invocation.program = options_.program;
  if (options_.force_generic_dd) {
    invocation.arguments.push_back("-force-generic-dd");
  }
  invocation.arguments.push_back("-f");
  invocation.arguments.push_back(options_.device);
  invocation.arguments.insert(invocation.arguments.end(), arguments.begin(),
                              arguments.end());
  invocation.timeout = timeout;
  invocation.device = options_.device;
  return runner_.Run(invocation);
}

ProgramResult ItdtTool::Version()
{
  return RunGlobalCommand({"-version"}, options_.timeout);
}

bool ItdtTool::IsAvailable() { return Version().success(); }

ProgramResult ItdtTool::TestUnitReady()
{
  return RunDeviceCommand({"tur"}, options_.timeout);
}

ProgramResult ItdtTool::Rewind()
{
  return RunDeviceCommand({"rewind"}, options_.timeout);
}

ProgramResult ItdtTool::Load(bool amu)
{
  std::vector<std::string> arguments{"load"};
  if (amu) { arguments.push_back("-amu"); }
  return RunDeviceCommand(std::move(arguments), options_.timeout);
}

ProgramResult ItdtTool::Unload()
{
  return RunDeviceCommand({"unload"}, options_.timeout);
}

ProgramResult ItdtTool::Erase(bool short_erase)
{
  std::vector<std::string> arguments{"erase"};
  if (short_erase) { arguments.push_back("-short"); }
  return RunDeviceCommand(std::move(arguments), options_.erase_timeout);
}

ProgramResult ItdtTool::QueryPosition()
{
  return RunDeviceCommand({"qrypos"}, options_.timeout);
}

ProgramResult ItdtTool::WriteFilemarks(int count)
{
  std::vector<std::string> arguments{"weof"};
  if (count != 1) { arguments.push_back(std::to_string(count)); }
  return RunDeviceCommand(std::move(arguments), options_.timeout);
}

ProgramResult ItdtTool::CheckLtfsReadiness(bool force_data_overwrite,
                                           LtfsReadiness& readiness)
{
  std::vector<std::string> arguments{"checkltfsreadiness"};
  if (force_data_overwrite) { arguments.push_back("-forcedataoverwrite"); }

  ProgramResult result
      = RunDeviceCommand(std::move(arguments), options_.check_timeout);
  readiness = ParseLtfsReadiness(result);
  Dmsg2(debuglevel, "LTFS readiness of %s: %s\n", options_.device.c_str(),
        LtfsReadinessToString(readiness));
  return result;
}

ProgramResult ItdtTool::QueryTapeUsage(TapeUsage& usage)
{
  ProgramResult result = RunDeviceCommand({"tapeusage"}, options_.timeout);

  if (result.success()) {
    usage = ParseTapeUsage(result.std_out);
    return result;
  }

  usage = TapeUsage();
  std::string text = ToLower(result.std_err + result.std_out);
  if (Contains(text, "not formatted") || Contains(text, "not ready")
      || Contains(text, "mount")) {
    usage.formatted = false;
  }
  return result;
}

ProgramResult ItdtTool::Scan(std::vector<ScannedDevice>& devices)
{
  ProgramResult result = RunGlobalCommand({"scan"}, options_.timeout);

  devices.clear();
  if (result.success()) { devices = ParseScanOutput(result.std_out); }
  return result;
}

ProgramResult ItdtTool::ReadAttribute(uint8_t partition,
                                      uint16_t attribute_id,
                                      std::optional<MamAttributeRecord>& record)
{
  fs::path file = TemporaryAttributeFile(options_.attribute_directory);

  record.reset();
  ProgramResult result = RunDeviceCommand(
      {"readattr", fmt::format("-p{}", static_cast<int>(partition)),
       "-a" + FormatAttributeId(attribute_id), "-d" + file.string()},
      options_.attribute_timeout);

  std::error_code ec;
  if (fs::exists(file, ec)) {
    std::ifstream in(file, std::ios::binary);
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    in.close();
    fs::remove(file, ec);

    if (result.success() && !data.empty()) {
      record = Decode(data, attribute_id, partition);
    } else if (result.success()) {
      Dmsg1(debuglevel, "readattr wrote no data for %s\n",
            FormatAttributeId(attribute_id).c_str());
    }
  } else if (result.success()) {
    Dmsg1(debuglevel, "readattr did not create %s\n", file.string().c_str());
  }

  return result;
}

ProgramResult ItdtTool::WriteAttribute(uint8_t partition,
                                       uint16_t attribute_id,
                                       const std::string& value)
{
  fs::path file = TemporaryAttributeFile(options_.attribute_directory);
  {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
    if (!out) {
      out.close();
      std::error_code ec;
      fs::remove(file, ec);

      ProgramResult result;
      result.program = options_.program;
      result.exit_code = -1;
      result.std_err = fmt::format("cannot write {}", file.string());
      return result;
    }
  }

  ProgramResult result = RunDeviceCommand(
      {"writeattr", fmt::format("-p{}", static_cast<int>(partition)),
       "-a" + FormatAttributeId(attribute_id), "-s" + file.string()},
      options_.attribute_timeout);

  std::error_code ec;
  fs::remove(file, ec);
  return result;
}

}  // namespace tapectl
