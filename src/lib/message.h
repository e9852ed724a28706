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
 * Debug, error and user message output
 */

#ifndef TAPECTL_LIB_MESSAGE_H_
#define TAPECTL_LIB_MESSAGE_H_

#include <functional>
#include <string>

#if defined(__GNUC__)
#  define TAPECTL_PRINTF_FORMAT(fmt_idx, arg_idx) \
    __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#  define TAPECTL_PRINTF_FORMAT(fmt_idx, arg_idx)
#endif

extern int debug_level;
extern bool dbg_timestamp; /* print timestamp in debug output */
extern int verbose;
extern char my_name[];

void MyNameIs(int argc, char* argv[], const char* name);

void d_msg(const char* file, int line, int level, const char* fmt, ...)
    TAPECTL_PRINTF_FORMAT(4, 5);
void e_msg(const char* file,
           int line,
           int type,
           int level,
           const char* fmt,
           ...) TAPECTL_PRINTF_FORMAT(5, 6);

/* Send debug output to a trace file instead of stdout, empty path resets */
bool SetTraceFile(const std::string& path);
void SetTimestamp(int timestamp_flag);
bool GetTimestamp();

/*
 * Receives every message emitted with Emsg. The type is one of the
 * M_* values from message_severity.h, msg is the formatted text.
 */
using MessageCallback = std::function<void(int type, const std::string& msg)>;
void RegisterMessageCallback(MessageCallback callback);

const char* get_basename(const char* pathname);
const char* MessageTypeToString(int type);

#endif  // TAPECTL_LIB_MESSAGE_H_
