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
#include "tape/tape_config.h"
#include "lib/ini.h"

namespace tapectl {

#ifdef HAVE_WIN32
#  define DEFAULT_TAPE_DEVICE "\\\\.\\Tape0"
#  define DEFAULT_LTFS_TOOL_DIRECTORY "C:\\Program Files\\IBM\\LTFS"
#else
#  define DEFAULT_TAPE_DEVICE "/dev/nst0"
#  define DEFAULT_LTFS_TOOL_DIRECTORY "/opt/IBM/ltfs/bin"
#endif

// clang-format off
static struct ini_items tape_config_items[] = {
  // name                    type                 comment                                          req default
  {"device",                 INI_CFG_TYPE_STR,    "Tape device used for SCSI and ITDT commands",   0, DEFAULT_TAPE_DEVICE, ITEMS_DEFAULT},
  {"itdt_path",              INI_CFG_TYPE_STR,    "ITDT executable",                               0, "itdt", ITEMS_DEFAULT},
  {"itdt_force_generic_dd",  INI_CFG_TYPE_BOOL,   "Run ITDT with -force-generic-dd",               0, "no", ITEMS_DEFAULT},
  {"ltfs_tool_directory",    INI_CFG_TYPE_STR,    "Directory of the LtfsCmd tools and mkltfs",     0, DEFAULT_LTFS_TOOL_DIRECTORY, ITEMS_DEFAULT},
  {"drive_address",          INI_CFG_TYPE_NAME,   "LTFS drive address",                            0, "0.0.24.0", ITEMS_DEFAULT},
  {"drive_letter",           INI_CFG_TYPE_NAME,   "Drive letter the LTFS volume is assigned to",   0, "O", ITEMS_DEFAULT},
  {"label_format",           INI_CFG_TYPE_STR,    "strftime format of generated volume labels",    0, "BK%Y%m%d_%H%M", ITEMS_DEFAULT},
  {"label_mapping_file",     INI_CFG_TYPE_STR,    "File formatted labels are recorded in",         0, "", ITEMS_DEFAULT},
  {"scsi_timeout",           INI_CFG_TYPE_PINT32, "SCSI command timeout in seconds",               0, "300", ITEMS_DEFAULT},
  {"retry_max_attempts",     INI_CFG_TYPE_PINT32, "Attempts for transient SCSI faults",            0, "3", ITEMS_DEFAULT},
  {"retry_base_delay",       INI_CFG_TYPE_PINT32, "First retry delay in milliseconds",             0, "1000", ITEMS_DEFAULT},
  {"retry_max_delay",        INI_CFG_TYPE_PINT32, "Longest retry delay in milliseconds",           0, "8000", ITEMS_DEFAULT},
  {"monitor_interval",       INI_CFG_TYPE_PINT32, "Device poll interval in seconds",               0, "60", ITEMS_DEFAULT},
  {"kill_grace",             INI_CFG_TYPE_PINT32, "Seconds between terminate and kill of a tool",  0, "5", ITEMS_DEFAULT},
  {"load_timeout",           INI_CFG_TYPE_PINT32, "Load and eject timeout in seconds",             0, "60", ITEMS_DEFAULT},
  {"assign_timeout",         INI_CFG_TYPE_PINT32, "Assign and unassign timeout in seconds",        0, "60", ITEMS_DEFAULT},
  {"format_timeout",         INI_CFG_TYPE_PINT32, "Format timeout in seconds",                     0, "3600", ITEMS_DEFAULT},
  {"check_timeout",          INI_CFG_TYPE_PINT32, "Check and rollback timeout in seconds",         0, "7200", ITEMS_DEFAULT},
  {"erase_timeout",          INI_CFG_TYPE_PINT32, "Erase timeout in seconds",                      0, "10800", ITEMS_DEFAULT},
  {"attribute_timeout",      INI_CFG_TYPE_PINT32, "Attribute read and write timeout in seconds",   0, "60", ITEMS_DEFAULT},
  {"attribute_directory",    INI_CFG_TYPE_STR,    "Directory of ITDT attribute files, temp if empty", 0, "", ITEMS_DEFAULT},
  {"trace_file",             INI_CFG_TYPE_STR,    "Debug output file, stdout if empty",            0, "", ITEMS_DEFAULT},
  {nullptr, 0, nullptr, 0, nullptr, ITEMS_DEFAULT}
};
// clang-format on

static const std::string& StringItem(const ConfigFile& ini, const char* name)
{
  return ini.items[ini.GetItem(name)].val.strval;
}

static int32_t IntItem(const ConfigFile& ini, const char* name)
{
  return ini.items[ini.GetItem(name)].val.int32val;
}

static bool BoolItem(const ConfigFile& ini, const char* name)
{
  return ini.items[ini.GetItem(name)].val.boolval;
}

static std::chrono::seconds Seconds(const ConfigFile& ini, const char* name)
{
  return std::chrono::seconds(IntItem(ini, name));
}

bool RegisterTapeConfigItems(ConfigFile& ini)
{
  return ini.RegisterItems(tape_config_items, sizeof(struct ini_items));
}

void ApplyTapeConfigItems(const ConfigFile& ini, TapeConfig& config)
{
  config.device = StringItem(ini, "device");
  config.itdt_path = StringItem(ini, "itdt_path");
  config.itdt_force_generic_dd = BoolItem(ini, "itdt_force_generic_dd");
  config.ltfs_tool_directory = StringItem(ini, "ltfs_tool_directory");
  config.drive_address = StringItem(ini, "drive_address");
  config.drive_letter = StringItem(ini, "drive_letter");
  config.label_format = StringItem(ini, "label_format");
  config.label_mapping_file = StringItem(ini, "label_mapping_file");
  config.attribute_directory = StringItem(ini, "attribute_directory");
  config.trace_file = StringItem(ini, "trace_file");

  config.scsi_timeout = Seconds(ini, "scsi_timeout");
  config.retry.max_attempts = IntItem(ini, "retry_max_attempts");
  config.retry.base_delay
      = std::chrono::milliseconds(IntItem(ini, "retry_base_delay"));
  config.retry.max_delay
      = std::chrono::milliseconds(IntItem(ini, "retry_max_delay"));
  config.monitor_interval = Seconds(ini, "monitor_interval");
  config.kill_grace = Seconds(ini, "kill_grace");
  config.load_timeout = Seconds(ini, "load_timeout");
  config.assign_timeout = Seconds(ini, "assign_timeout");
  config.format_timeout = Seconds(ini, "format_timeout");
  config.check_timeout = Seconds(ini, "check_timeout");
  config.erase_timeout = Seconds(ini, "erase_timeout");
  config.attribute_timeout = Seconds(ini, "attribute_timeout");
}

TapeConfig DefaultTapeConfig()
{
  ConfigFile ini;
  TapeConfig config;

  RegisterTapeConfigItems(ini);
  ApplyTapeConfigItems(ini, config);
  return config;
}

bool LoadTapeConfig(const std::string& filename,
                    TapeConfig& config,
                    std::string& error)
{
  ConfigFile ini;

  if (!RegisterTapeConfigItems(ini)) {
    error = "cannot register configuration items";
    return false;
  }
  if (!filename.empty() && !ini.parse(filename.c_str())) {
    error = ini.error();
    return false;
  }

  ApplyTapeConfigItems(ini, config);
  return true;
}

bool ParseTapeConfigString(const std::string& content,
                           TapeConfig& config,
                           std::string& error)
{
  ConfigFile ini;

  if (!RegisterTapeConfigItems(ini)) {
    error = "cannot register configuration items";
    return false;
  }
  if (!ini.ParseString(content)) {
    error = ini.error();
    return false;
  }

  ApplyTapeConfigItems(ini, config);
  return true;
}

std::string DumpTapeConfig(const std::string& filename)
{
  ConfigFile ini;
  std::string buf;

  RegisterTapeConfigItems(ini);
  if (!filename.empty() && !ini.parse(filename.c_str())) {
    return std::string();
  }
  ini.DumpResults(buf);
  return buf;
}

ItdtOptions TapeConfig::Itdt() const
{
  ItdtOptions options;

  options.program = itdt_path;
  options.device = device;
  options.timeout = load_timeout;
  options.erase_timeout = erase_timeout;
  options.check_timeout = check_timeout;
  options.attribute_timeout = attribute_timeout;
  options.force_generic_dd = itdt_force_generic_dd;
  options.attribute_directory = attribute_directory;
  return options;
}

LtfsOptions TapeConfig::Ltfs() const
{
  LtfsOptions options;

  options.tool_directory = ltfs_tool_directory;
  options.drive_address = drive_address;
  options.drive_letter = drive_letter;
  options.timeout = load_timeout;
  options.assign_timeout = assign_timeout;
  options.format_timeout = format_timeout;
  options.check_timeout = check_timeout;
  return options;
}

TapeTimeouts TapeConfig::Timeouts() const
{
  TapeTimeouts timeouts;

  timeouts.command = scsi_timeout;
  timeouts.load = load_timeout;
  timeouts.format = format_timeout;
  timeouts.erase = erase_timeout;
  timeouts.attribute = attribute_timeout;
  return timeouts;
}

}  // namespace tapectl
