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
/*
 * Handle simple configuration file such as "ini" files.
 * key1 = val               # comment
 * key2 = val
 */

#include "include/tapectl.h"
#include "lib/berrno.h"
#include "lib/ini.h"

#include <fmt/format.h>

#include <cctype>
#include <climits>
#include <fstream>
#include <sstream>

static constexpr int debuglevel{100};

static const struct ini_store {
  const char* key;
  const char* comment;
  int type;
} funcs[] = {{"@INT32@", "Integer", INI_CFG_TYPE_INT32},
             {"@PINT32@", "Integer", INI_CFG_TYPE_PINT32},
             {"@NAME@", "Name", INI_CFG_TYPE_NAME},
             {"@STR@", "String", INI_CFG_TYPE_STR},
             {"@BOOL@", "on/off", INI_CFG_TYPE_BOOL},
             {nullptr, nullptr, 0}};

const char* ini_get_store_code(int type)
{
  for (int i = 0; funcs[i].key; i++) {
    if (funcs[i].type == type) { return funcs[i].key; }
  }
  return nullptr;
}

int IniGetStoreType(const char* key)
{
  for (int i = 0; funcs[i].key; i++) {
    if (strcmp(funcs[i].key, key) == 0) { return funcs[i].type; }
  }
  return 0;
}

static bool EqualsIgnoreCase(const char* a, const char* b)
{
  for (; *a && *b; a++, b++) {
    if (tolower(static_cast<unsigned char>(*a))
        != tolower(static_cast<unsigned char>(*b))) {
      return false;
    }
  }
  return *a == *b;
}

static std::string Trim(const std::string& s)
{
  std::size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) { return std::string(); }
  std::size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

static bool ParseInt(const std::string& value, bool positive, int32_t& out)
{
  if (value.empty()) { return false; }

  std::size_t i = 0;
  bool negative = false;
  if (!positive && (value[0] == '-' || value[0] == '+')) {
    negative = value[0] == '-';
    i = 1;
  }
  if (i >= value.size()) { return false; }

  int64_t result = 0;
  for (; i < value.size(); i++) {
    if (!isdigit(static_cast<unsigned char>(value[i]))) { return false; }
    result = result * 10 + (value[i] - '0');
    if (result > INT32_MAX) { return false; }
  }
  out = static_cast<int32_t>(negative ? -result : result);
  return true;
}

void ConfigFile::ScanError(const char* source, int line, const std::string& msg)
{
  error_ = fmt::format("{}:{}: {}", source, line, msg);
  Dmsg1(debuglevel, "%s\n", error_.c_str());
}

bool ConfigFile::StoreValue(ini_items& item,
                            const std::string& value,
                            bool quoted)
{
  switch (item.type) {
    case INI_CFG_TYPE_STR:
      item.val.strval = value;
      return true;
    case INI_CFG_TYPE_NAME:
      if (quoted || value.empty() || value.size() >= MAX_NAME_LENGTH) {
        return false;
      }
      for (char c : value) {
        if (isspace(static_cast<unsigned char>(c))) { return false; }
      }
      item.val.strval = value;
      return true;
    case INI_CFG_TYPE_INT32:
      return ParseInt(value, false, item.val.int32val);
    case INI_CFG_TYPE_PINT32:
      return ParseInt(value, true, item.val.int32val);
    case INI_CFG_TYPE_BOOL:
      if (EqualsIgnoreCase(value.c_str(), "yes")
          || EqualsIgnoreCase(value.c_str(), "true")) {
        item.val.boolval = true;
      } else if (EqualsIgnoreCase(value.c_str(), "no")
                 || EqualsIgnoreCase(value.c_str(), "false")) {
        item.val.boolval = false;
      } else {
        return false;
      }
      return true;
    default:
      return false;
  }
}

bool ConfigFile::RegisterItems(const ini_items* aitems, int size)
{
  if (sizeof_ini_items != size) { return false; }

  items.clear();
  for (int i = 0; aitems[i].name; i++) { items.push_back(aitems[i]); }
  ClearItems();
  return true;
}

void ConfigFile::ClearItems()
{
  for (auto& item : items) {
    item.found = false;
    item.val = item_value{};
    if (item.default_value) {
      if (!StoreValue(item, item.default_value, false)) {
        Dmsg2(debuglevel, "Invalid default value %s for %s\n",
              item.default_value, item.name);
      }
    }
  }
}

int ConfigFile::GetItem(const char* name) const
{
  for (std::size_t i = 0; i < items.size(); i++) {
    if (EqualsIgnoreCase(items[i].name, name)) { return static_cast<int>(i); }
  }
  return -1;
}

bool ConfigFile::parse(const char* fname)
{
  std::ifstream in(fname, std::ios::in | std::ios::binary);
  if (!in) {
    BErrNo be;
    error_ = fmt::format("Cannot open config file {}: {}", fname,
                         be.bstrerror());
    Emsg1(M_ERROR, 0, "%s\n", error_.c_str());
    return false;
  }

  std::stringstream content;
  content << in.rdbuf();
  return ParseString(content.str(), fname);
}

bool ConfigFile::ParseString(const std::string& content, const char* source)
{
  std::istringstream in(content);
  std::string raw;
  int lineno = 0;

  error_.clear();
  if (items.empty()) {
    error_ = "no configuration items registered";
    return false;
  }

  while (std::getline(in, raw)) {
    lineno++;

    std::string line = Trim(raw);
    if (line.empty() || line[0] == '#' || line[0] == ';') { continue; }

    std::size_t eq = line.find('=');
    if (eq == std::string::npos) {
      ScanError(source, lineno, fmt::format("expected '=' in \"{}\"", line));
      return false;
    }

    std::string key = Trim(line.substr(0, eq));
    std::string rest = Trim(line.substr(eq + 1));

    int i = GetItem(key.c_str());
    if (i < 0) {
      ScanError(source, lineno, fmt::format("Keyword {} not found", key));
      return false;
    }

    std::string value;
    bool quoted = false;
    if (!rest.empty() && rest[0] == '"') {
      quoted = true;
      std::size_t pos = 1;
      bool closed = false;
      while (pos < rest.size()) {
        char c = rest[pos];
        if (c == '\\' && pos + 1 < rest.size()
            && (rest[pos + 1] == '"' || rest[pos + 1] == '\\')) {
          value += rest[pos + 1];
          pos += 2;
          continue;
        }
        if (c == '"') {
          closed = true;
          pos++;
          break;
        }
        value += c;
        pos++;
      }
      std::string trailing = Trim(rest.substr(pos));
      if (!closed || (!trailing.empty() && trailing[0] != '#')) {
        ScanError(source, lineno,
                  fmt::format("malformed quoted string for {}", key));
        return false;
      }
    } else {
      std::size_t hash = rest.find('#');
      value = Trim(hash == std::string::npos ? rest : rest.substr(0, hash));
    }

    ini_items& item = items[i];
    Dmsg2(debuglevel, "calling handler for %s value=%s\n", item.name,
          value.c_str());
    if (!StoreValue(item, value, quoted)) {
      ScanError(source, lineno,
                fmt::format("invalid {} value \"{}\" for {}",
                            ini_get_store_code(item.type), value, key));
      return false;
    }
    item.found = true;
  }

  for (const auto& item : items) {
    if (item.required && !item.found) {
      ScanError(source, lineno,
                fmt::format("{} required but not found", item.name));
      return false;
    }
  }

  return true;
}

static std::string QuoteString(const std::string& value)
{
  std::string quoted("\"");
  for (char c : value) {
    if (c == '"' || c == '\\') { quoted += '\\'; }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

int ConfigFile::DumpResults(std::string& buf) const
{
  buf.clear();
  for (const auto& item : items) {
    if (item.comment && *item.comment) {
      buf += fmt::format("# {}\n", item.comment);
    }
    switch (item.type) {
      case INI_CFG_TYPE_INT32:
      case INI_CFG_TYPE_PINT32:
        buf += fmt::format("{} = {}\n", item.name, item.val.int32val);
        break;
      case INI_CFG_TYPE_BOOL:
        buf += fmt::format("{} = {}\n", item.name,
                           item.val.boolval ? "yes" : "no");
        break;
      case INI_CFG_TYPE_NAME:
        buf += fmt::format("{} = {}\n", item.name, item.val.strval);
        break;
      default:
        buf += fmt::format("{} = {}\n", item.name, QuoteString(item.val.strval));
        break;
    }
  }
  return static_cast<int>(buf.size());
}
