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
 * IBM LTFS command line tools (LtfsCmd* and mkltfs).
 *
 * The tools load their libraries relative to their own directory, so
 * they always run with the tool directory as working directory.
 */

#ifndef TAPECTL_TAPE_LTFS_TOOLS_H_
#define TAPECTL_TAPE_LTFS_TOOLS_H_

#include "tape/process_supervisor.h"

#include <chrono>
#include <string>
#include <vector>

namespace tapectl {

enum class LtfsCommand
{
  kLoad,
  kEject,
  kAssign,
  kUnassign,
  kFormat,
  kUnformat,
  kCheck,
  kRollback,
  kDrives,
  kMkltfs
};

/* "LtfsCmdLoad", with ".exe" on Windows */
std::string LtfsExecutableName(LtfsCommand command);

struct LtfsOptions {
  std::string tool_directory;
  std::string drive_address{"0.0.24.0"};
  std::string drive_letter{"O"};
  std::chrono::seconds timeout{60}; /**< load, eject and drives */
  std::chrono::seconds assign_timeout{60};
  std::chrono::seconds format_timeout{3600};
  std::chrono::seconds check_timeout{7200};
};

/* One row of LtfsCmdDrives: Assigned Address Serial Status */
struct LtfsDrive {
  std::string assigned;
  std::string address;
  std::string serial;
  std::string status;
};

std::vector<LtfsDrive> ParseDrivesOutput(const std::string& output);

/* Volume serials given to LtfsCmdFormat are 6 upper case alphanumerics */
bool IsValidVolumeSerial(const std::string& serial);

/* "O:" and "o" become "O" */
std::string NormalizeDriveLetter(const std::string& letter);

struct ToolAvailability {
  std::string name;
  std::string path;
  bool available{false};
};

class LtfsTools {
 public:
  LtfsTools(ToolRunner& runner, LtfsOptions options);

  ProgramResult Load();
  ProgramResult Eject();
  ProgramResult Assign();
  ProgramResult Unassign();

  /* Format the volume assigned to the drive letter */
  ProgramResult Format(const std::string& label,
                       const std::string& serial = std::string(),
                       bool eject_after = false);
  ProgramResult Unformat();
  ProgramResult Check();
  ProgramResult Rollback();
  ProgramResult Drives(std::vector<LtfsDrive>& drives);
  ProgramResult Mkltfs(const std::string& device, const std::string& label);

  std::string ToolPath(LtfsCommand command) const;
  std::vector<ToolAvailability> CheckAvailability() const;

  const LtfsOptions& options() const { return options_; }

 private:
  ProgramResult Run(LtfsCommand command,
                    std::vector<std::string> arguments,
                    std::chrono::seconds timeout);

  ToolRunner& runner_;
  LtfsOptions options_;
};

}  // namespace tapectl

#endif  // TAPECTL_TAPE_LTFS_TOOLS_H_
