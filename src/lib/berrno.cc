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
 * errno handler
 *
 * BErrNo is a simplistic errno handler that works for
 * Unix, Win32 and reaped child processes.
 */

#include "include/tapectl.h"
#include "lib/berrno.h"

#include <fmt/format.h>

#ifndef HAVE_WIN32
#  include <csignal>
#endif

const char* BErrNo::bstrerror()
{
  buf_.clear();
#ifdef HAVE_WIN32
  if (berrno_ & b_errno_win32 || berrno_ == 0) {
    FormatWin32Message();
    return buf_.c_str();
  }

  int windows_error_code = GetLastError();
  buf_ = fmt::format("{} (errno={} | win_error=0x{:08X})", strerror(berrno_),
                     berrno_, static_cast<unsigned>(windows_error_code));
#else
  if (berrno_ & b_errno_exit) {
    int status = code();
    if (status) {
      buf_ = fmt::format("Child exited with code {}", status);
    } else {
      buf_ = "Child exited normally.";
    }
    return buf_.c_str();
  }
  if (berrno_ & b_errno_signal) {
    int sig = code();
    const char* name = strsignal(sig);
    buf_ = fmt::format("Child died from signal {}: {}", sig,
                       name ? name : "Unknown signal");
    return buf_.c_str();
  }

  /* Normal errno */
  char tmp[1024];
  tmp[0] = 0;
#  if defined(__GLIBC__) && defined(_GNU_SOURCE)
  buf_ = strerror_r(berrno_, tmp, sizeof(tmp));
#  else
  if (strerror_r(berrno_, tmp, sizeof(tmp)) != 0) {
    buf_ = fmt::format("Invalid errno. No error message possible for {}",
                       berrno_);
  } else {
    buf_ = tmp;
  }
#  endif
#endif

  return buf_.c_str();
}

void BErrNo::FormatWin32Message()
{
#ifdef HAVE_WIN32
  char* msg = nullptr;
  DWORD windows_error_code = GetLastError();

  if (auto len = FormatMessageA(
          FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM
              | FORMAT_MESSAGE_IGNORE_INSERTS,
          nullptr, windows_error_code, 0, reinterpret_cast<LPSTR>(&msg), 0,
          nullptr);
      len > 0 && msg) {
    while (len > 0 && (msg[len - 1] == '\n' || msg[len - 1] == '\r')) {
      msg[--len] = 0;
    }
    buf_ = fmt::format("{} (win_error=0x{:08X})", msg,
                       static_cast<unsigned>(windows_error_code));
  } else {
    buf_ = fmt::format("Unknown error (win_error=0x{:08X})",
                       static_cast<unsigned>(windows_error_code));
  }
  if (msg) { LocalFree(msg); }
#endif
}
