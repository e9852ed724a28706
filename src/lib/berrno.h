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
 * BErrNo header file
 */

#ifndef TAPECTL_LIB_BERRNO_H_
#define TAPECTL_LIB_BERRNO_H_

#include <cerrno>
#include <string>

/**
 * Extra bits set to interpret errno value differently from errno
 */
#ifdef HAVE_WIN32
#  define b_errno_win32 (1 << 29) /* user reserved bit */
#else
#  define b_errno_win32 0 /* On Unix/Linux system */
#endif
#define b_errno_exit (1 << 28)   /* child exited, exit code returned */
#define b_errno_signal (1 << 27) /* child died, signal code returned */

/**
 * A more generalized way of handling errno that works with Unix and Windows
 * and with the status of reaped child processes.
 *
 * It picks up errno on construction and formats it on request. If bit 29
 * is set the value is a Win32 error and GetLastError() is consulted.
 */
class BErrNo {
  std::string buf_;
  int berrno_;
  void FormatWin32Message();

 public:
  BErrNo() : berrno_(errno) { errno = berrno_; }
  explicit BErrNo(int errnum) : berrno_(errnum) {}
  const char* bstrerror();
  const char* bstrerror(int errnum)
  {
    berrno_ = errnum;
    return bstrerror();
  }
  void SetErrno(int errnum) { berrno_ = errnum; }
  int code() const { return berrno_ & ~(b_errno_exit | b_errno_signal); }
  int code(int stat) const { return stat & ~(b_errno_exit | b_errno_signal); }
};

#endif  // TAPECTL_LIB_BERRNO_H_
