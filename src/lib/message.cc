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

#include "include/tapectl.h"
#include "lib/message.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <mutex>

int debug_level = 0;
bool dbg_timestamp = false; /* print timestamp in debug output */
int verbose = 0;
char my_name[128] = {0};

static std::mutex trace_mutex;
static FILE* trace_fd = nullptr;
static std::string trace_filename;

static std::mutex callback_mutex;
static MessageCallback message_callback;

/*
 * Remember the name of the running program, the argv[0] basename
 * is used if no explicit name is given.
 */
void MyNameIs(int argc, char* argv[], const char* name)
{
  const char* source = name;
  if ((!source || !*source) && argc > 0 && argv && argv[0]) {
    source = get_basename(argv[0]);
  }
  if (!source) { source = TAPECTL_PROG_NAME; }
  snprintf(my_name, sizeof(my_name), "%s", source);
}

const char* get_basename(const char* pathname)
{
  const char* basename = pathname;
  if (!basename) { return ""; }

  for (const char* p = pathname; *p; p++) {
    if (*p == '/' || *p == '\\') { basename = p + 1; }
  }
  return basename;
}

const char* MessageTypeToString(int type)
{
  switch (type) {
    case M_ABORT:
      return "Abort";
    case M_DEBUG:
      return "Debug";
    case M_FATAL:
      return "Fatal error";
    case M_ERROR:
      return "Error";
    case M_WARNING:
      return "Warning";
    case M_INFO:
      return "Info";
    case M_ALERT:
      return "Alert";
    default:
      return "Unknown";
  }
}

static std::string FormatMessage(const char* fmt, va_list ap)
{
  va_list copy;
  va_copy(copy, ap);
  int len = vsnprintf(nullptr, 0, fmt, copy);
  va_end(copy);

  if (len <= 0) { return std::string(); }

  std::vector<char> buf(len + 1);
  vsnprintf(buf.data(), buf.size(), fmt, ap);
  return std::string(buf.data(), len);
}

static void TraceOut(const std::string& text)
{
  std::lock_guard<std::mutex> l(trace_mutex);
  FILE* out = trace_fd ? trace_fd : stdout;
  fputs(text.c_str(), out);
  fflush(out);
}

static std::string Timestamp()
{
  auto now = std::chrono::system_clock::now();
  auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(
                   now.time_since_epoch())
                   .count()
               % 1000000;
  return fmt::format("{:%d-%b-%Y %H:%M:%S}.{:06d} ",
                     fmt::localtime(std::chrono::system_clock::to_time_t(now)),
                     usecs);
}

/*
 * Debug output, prefixed with "name (level): file:line ".
 * A negative level suppresses the prefix.
 */
void d_msg(const char* file, int line, int level, const char* fmt, ...)
{
  bool details = true;

  if (level < 0) {
    details = false;
    level = -level;
  }

  if (level > debug_level) { return; }

  std::string out;
  if (dbg_timestamp) { out += Timestamp(); }
  if (details) {
    out += fmt::format("{} ({}): {}:{} ", my_name, level, get_basename(file),
                       line);
  }

  va_list ap;
  va_start(ap, fmt);
  out += FormatMessage(fmt, ap);
  va_end(ap);

  TraceOut(out);
}

/*
 * Typed message. Goes to stderr, to the debug output and to the
 * registered callback. M_ABORT terminates the program.
 */
void e_msg(const char* file,
           int line,
           int type,
           int level,
           const char* fmt,
           ...)
{
  va_list ap;
  va_start(ap, fmt);
  std::string more = FormatMessage(fmt, ap);
  va_end(ap);

  std::string typestr = MessageTypeToString(type);
  d_msg(file, line, 10, "%s: %s", typestr.c_str(), more.c_str());

  if (type != M_DEBUG && (type != M_INFO || verbose)) {
    std::string out = fmt::format("{}: {}: {}", my_name, typestr, more);
    if (type == M_ABORT || type == M_FATAL || type == M_ERROR) {
      out = fmt::format("{}: {}:{} {}: {}", my_name, get_basename(file), line,
                        typestr, more);
    }
    fputs(out.c_str(), stderr);
    fflush(stderr);
  }

  MessageCallback callback;
  {
    std::lock_guard<std::mutex> l(callback_mutex);
    callback = message_callback;
  }
  if (callback) { callback(type, more); }

  if (type == M_ABORT) { abort(); }
}

bool SetTraceFile(const std::string& path)
{
  std::lock_guard<std::mutex> l(trace_mutex);

  if (trace_fd) {
    fclose(trace_fd);
    trace_fd = nullptr;
  }
  trace_filename = path;
  if (path.empty()) { return true; }

  trace_fd = fopen(path.c_str(), "a+b");
  if (!trace_fd) {
    trace_filename.clear();
    return false;
  }
  return true;
}

/*
 * Set timestamp flag on/off. If argument is negative, there is no change
 */
void SetTimestamp(int timestamp_flag)
{
  if (timestamp_flag < 0) {
    return;
  } else if (timestamp_flag > 0) {
    dbg_timestamp = true;
  } else {
    dbg_timestamp = false;
  }
}

bool GetTimestamp() { return dbg_timestamp; }

void RegisterMessageCallback(MessageCallback callback)
{
  std::lock_guard<std::mutex> l(callback_mutex);
  message_callback = std::move(callback);
}
