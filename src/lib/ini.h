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
 * Handle simple configuration files such as "ini" files.
 */

#ifndef TAPECTL_LIB_INI_H_
#define TAPECTL_LIB_INI_H_

#include <cstdint>
#include <string>
#include <vector>

/*
 * Standard global types with handlers defined in ini.cc
 */
enum
{
  INI_CFG_TYPE_INT32 = 1,  /* 32 bits Integer */
  INI_CFG_TYPE_PINT32 = 2, /* Positive 32 bits Integer (unsigned) */
  INI_CFG_TYPE_NAME = 5,   /* Name */
  INI_CFG_TYPE_STR = 6,    /* String */
  INI_CFG_TYPE_BOOL = 7    /* Boolean */
};

#define MAX_NAME_LENGTH 128

/*
 * Used to store result
 */
struct item_value {
  std::string strval; /* STR and NAME */
  int32_t int32val{0};
  bool boolval{false};
};

/*
 * The program describes its configuration with a static table
 * terminated by an entry with a null name.
 */
struct ini_items {
  const char* name;    /* keyword name */
  int type;            /* type accepted */
  const char* comment; /* comment associated, shown by DumpResults */

  int required;              /* optional required or not */
  const char* default_value; /* optional default value */

  bool found;     /* if val is set from the file */
  item_value val; /* val contains the value */
};

#define ITEMS_DEFAULT false, {}

/*
 * Handle simple configuration file such as "ini" files.
 * key1 = val               # comment
 * key2 = "quoted value"
 *
 * Keys are case insensitive, unknown keys and malformed values are errors.
 */
class ConfigFile {
 public:
  ConfigFile() = default;

  /*
   * Register config file structure, size must match the items struct.
   * Registered items start out with their default value.
   */
  bool RegisterItems(const ini_items* aitems, int size);

  /*
   * Reset every item to its default value
   */
  void ClearItems();

  /*
   * Get item position in items list, -1 if not found
   */
  int GetItem(const char* name) const;

  /*
   * Parse a ini file with a item list previously registered
   */
  bool parse(const char* filename);
  bool ParseString(const std::string& content, const char* source = "<string>");

  /*
   * Dump the item table content to a buffer, returns the buffer length
   */
  int DumpResults(std::string& buf) const;

  const std::string& error() const { return error_; }

  std::vector<ini_items> items; /* Structure of the config file */

 private:
  std::string error_;
  int sizeof_ini_items{sizeof(struct ini_items)};

  bool StoreValue(ini_items& item, const std::string& value, bool quoted);
  void ScanError(const char* source, int line, const std::string& msg);
};

/*
 * Get handler code from storage type.
 */
const char* ini_get_store_code(int type);

/*
 * Get storage type from handler name.
 */
int IniGetStoreType(const char* key);

#endif  // TAPECTL_LIB_INI_H_
