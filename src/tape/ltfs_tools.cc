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
#include "tape/ltfs_tools.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace tapectl {

static constexpr int debuglevel{100};

static constexpr LtfsCommand kAllCommands[]
    = {LtfsCommand::kLoad,     LtfsCommand::kEject,    LtfsCommand::kAssign,
       LtfsCommand::kUnassign, LtfsCommand::kFormat,   LtfsCommand::kUnformat,
       LtfsCommand::kCheck,    LtfsCommand::kRollback, LtfsCommand::kDrives,
       LtfsCommand::kMkltfs};

static const char* LtfsCommandBaseName(LtfsCommand command)
{
  switch (command) {
    case LtfsCommand::kLoad:
      return "LtfsCmdLoad";
    case LtfsCommand::kEject:
      return "LtfsCmdEject";
    case LtfsCommand::kAssign:
      return "LtfsCmdAssign";
    case LtfsCommand::kUnassign:
      return "LtfsCmdUnassign";
    case LtfsCommand::kFormat:
      return "LtfsCmdFormat";
    case LtfsCommand::kUnformat:
      return "LtfsCmdUnformat";
    case LtfsCommand::kCheck:
      return "LtfsCmdCheck";
    case LtfsCommand::kRollback:
      return "LtfsCmdRollback";
    case LtfsCommand::kDrives:
      return "LtfsCmdDrives";
    case LtfsCommand::kMkltfs:
      return "mkltfs";
  }
  return "unknown";
}

std::string LtfsExecutableName(LtfsCommand command)
{
  std::string name(LtfsCommandBaseName(command));
#ifdef HAVE_WIN32
  name += ".exe";
#endif
  return name;
}

std::vector<LtfsDrive> ParseDrivesOutput(const std::string& output)
{
  std::vector<LtfsDrive> drives;
  std::istringstream in(output);
  std::string line;
  int line_number = 0;

  while (std::getline(in, line)) {
    // header and separator line
    if (++line_number <= 2) { continue; }

    std::istringstream fields(line);
    LtfsDrive drive;
    if (fields >> drive.assigned >> drive.address >> drive.serial
        >> drive.status) {
      drives.push_back(std::move(drive));
    }
  }
  return drives;
}

bool IsValidVolumeSerial(const std::string& serial)
{
  return serial.size() == 6
         && std::all_of(serial.begin(), serial.end(), [](unsigned char c) {
              return std::isdigit(c) || std::isupper(c);
            });
}

std::string NormalizeDriveLetter(const std::string& letter)
{
  std::string normalized(letter);

  while (!normalized.empty() && normalized.back() == ':') {
    normalized.pop_back();
  }
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return normalized;
}

LtfsTools::LtfsTools(ToolRunner& runner, LtfsOptions options)
    : runner_(runner), options_(std::move(options))
{
  options_.drive_letter = NormalizeDriveLetter(options_.drive_letter);
}

std::string LtfsTools::ToolPath(LtfsCommand command) const
{
  if (options_.tool_directory.empty()) { return LtfsExecutableName(command); }
  return (std::filesystem::path(options_.tool_directory)
          / LtfsExecutableName(command))
      .string();
}

std::vector<ToolAvailability> LtfsTools::CheckAvailability() const
{
  std::vector<ToolAvailability> tools;

  for (LtfsCommand command : kAllCommands) {
    ToolAvailability tool;
    std::error_code ec;
    tool.name = LtfsCommandBaseName(command);
    tool.path = ToolPath(command);
    tool.available = std::filesystem::is_regular_file(tool.path, ec);
    tools.push_back(std::move(tool));
  }
  return tools;
}

ProgramResult LtfsTools::Run(LtfsCommand command,
                             std::vector<std::string> arguments,
                             std::chrono::seconds timeout)
{
  ToolInvocation invocation;

  invocation.program = ToolPath(command);
  invocation.arguments = std::move(arguments);
  invocation.working_directory = options_.tool_directory;
  invocation.timeout = timeout;
  invocation.device = options_.drive_address;

  Dmsg1(debuglevel, "%s\n", LtfsCommandBaseName(command));
  return runner_.Run(invocation);
}

ProgramResult LtfsTools::Load()
{
  return Run(LtfsCommand::kLoad, {options_.drive_address}, options_.timeout);
}

ProgramResult LtfsTools::Eject()
{
  return Run(LtfsCommand::kEject, {options_.drive_address}, options_.timeout);
}

ProgramResult LtfsTools::Assign()
{
  return Run(LtfsCommand::kAssign,
             {options_.drive_address, options_.drive_letter + ":"},
             options_.assign_timeout);
}

ProgramResult LtfsTools::Unassign()
{
  return Run(LtfsCommand::kUnassign, {options_.drive_address},
             options_.assign_timeout);
}

ProgramResult LtfsTools::Format(const std::string& label,
                                const std::string& serial,
                                bool eject_after)
{
  std::vector<std::string> arguments{options_.drive_letter};

  if (IsValidVolumeSerial(serial)) {
    arguments.push_back("/S:" + serial);
  } else if (!serial.empty()) {
    Dmsg1(debuglevel, "volume serial \"%s\" ignored\n", serial.c_str());
  }
  if (!label.empty()) { arguments.push_back("/N:" + label); }
  if (eject_after) { arguments.push_back("/E"); }

  return Run(LtfsCommand::kFormat, std::move(arguments),
             options_.format_timeout);
}

ProgramResult LtfsTools::Unformat()
{
  return Run(LtfsCommand::kUnformat, {options_.drive_address},
             options_.format_timeout);
}

ProgramResult LtfsTools::Check()
{
  return Run(LtfsCommand::kCheck, {options_.drive_address},
             options_.check_timeout);
}

ProgramResult LtfsTools::Rollback()
{
  return Run(LtfsCommand::kRollback, {options_.drive_address},
             options_.check_timeout);
}

ProgramResult LtfsTools::Drives(std::vector<LtfsDrive>& drives)
{
  ProgramResult result = Run(LtfsCommand::kDrives, {}, options_.timeout);

  drives.clear();
  if (result.success()) { drives = ParseDrivesOutput(result.std_out); }
  return result;
}

ProgramResult LtfsTools::Mkltfs(const std::string& device,
                                const std::string& label)
{
  std::vector<std::string> arguments{"-d", device, "--force"};

  if (!label.empty()) {
    arguments.push_back("--volume-name");
    arguments.push_back(label);
  }
  return Run(LtfsCommand::kMkltfs, std::move(arguments),
             options_.format_timeout);
}

}  // namespace tapectl
