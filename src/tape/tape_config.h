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
 * tapectl configuration file
 */

#ifndef TAPECTL_TAPE_TAPE_CONFIG_H_
#define TAPECTL_TAPE_TAPE_CONFIG_H_

#include "tape/command_dispatch.h"
#include "tape/itdt_tool.h"
#include "tape/ltfs_tools.h"
#include "tape/tape_drive.h"

#include <chrono>
#include <string>

class ConfigFile;

namespace tapectl {

struct TapeConfig {
  std::string device;
  std::string itdt_path;
  bool itdt_force_generic_dd{false};
  std::string ltfs_tool_directory;
  std::string drive_address;
  std::string drive_letter;
  std::string label_format;
  std::string label_mapping_file;
  std::string attribute_directory;
  std::string trace_file;

  std::chrono::seconds scsi_timeout{300};
  RetryPolicy retry;
  std::chrono::seconds monitor_interval{60};
  std::chrono::seconds kill_grace{5};
  std::chrono::seconds load_timeout{60};
  std::chrono::seconds assign_timeout{60};
  std::chrono::seconds format_timeout{3600};
  std::chrono::seconds check_timeout{7200};
  std::chrono::seconds erase_timeout{10800};
  std::chrono::seconds attribute_timeout{60};

  ItdtOptions Itdt() const;
  LtfsOptions Ltfs() const;
  TapeTimeouts Timeouts() const;
};

/* Register the tapectl items with their defaults */
bool RegisterTapeConfigItems(ConfigFile& ini);

/* Copy the parsed items into config */
void ApplyTapeConfigItems(const ConfigFile& ini, TapeConfig& config);

/* The built in defaults */
TapeConfig DefaultTapeConfig();

/*
 * Parse filename, or only apply the defaults if filename is empty.
 * Returns false with error set on unknown keys, malformed values or an
 * unreadable file.
 */
bool LoadTapeConfig(const std::string& filename,
                    TapeConfig& config,
                    std::string& error);
bool ParseTapeConfigString(const std::string& content,
                           TapeConfig& config,
                           std::string& error);

/* The effective configuration in configuration file syntax */
std::string DumpTapeConfig(const std::string& filename);

}  // namespace tapectl

#endif  // TAPECTL_TAPE_TAPE_CONFIG_H_
