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
#include "lib/cli.h"

#include <fmt/format.h>

#include <cctype>

static bool IsANumber(const std::string& s)
{
  if (s.empty() || s.size() > 9) { return false; }
  for (char c : s) {
    if (!isdigit(static_cast<unsigned char>(c))) { return false; }
  }
  return true;
}

void InitCLIApp(CLI::App& app, std::string description, int copyright_year)
{
  if (copyright_year) {
    description += fmt::format(
        "\nCopyright (C) {} Bareos GmbH & Co. KG\nVersion: {}", copyright_year,
        TAPECTL_VERSION);
  }

  app.description(description);
  app.set_help_flag("-h,--help,-?", "Print this help message and exit.");
  app.set_version_flag("--version", TAPECTL_VERSION);
  app.get_formatter()->column_width(32);
  app.get_formatter()->label("REQUIRED", "(required)");
#ifdef HAVE_WIN32
  app.allow_windows_style_options();
#endif
  app.failure_message(CLI::FailureMessage::help);
}

void AddDebugOptions(CLI::App& app)
{
  app.add_option(
         "-d,--debug-level",
         [](std::vector<std::string> vals) {
           if (IsANumber(vals.front())) {
             debug_level = std::stoi(vals.front());
             return true;
           }
           return false;
         },
         "Set debug level to <level>.")
      ->take_last()
      ->type_name("<level>");

  app.add_flag("--dt,--debug-timestamps", dbg_timestamp,
               "Print timestamps in debug output.");
}

void AddVerboseOption(CLI::App& app)
{
  app.add_flag("-v,--verbose", verbose, "Verbose user messages.");
}
