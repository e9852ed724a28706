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
 * main header file to include in all tapectl sources
 */

#ifndef TAPECTL_INCLUDE_TAPECTL_H_
#define TAPECTL_INCLUDE_TAPECTL_H_

#if defined(_WIN32) && !defined(HAVE_WIN32)
#  define HAVE_WIN32 1
#endif

#if defined(HAVE_WIN32)
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/types.h>
#endif

#include <cerrno>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "include/messages.h"
#include "lib/message.h"

#define TAPECTL_VERSION "1.0.0"
#define TAPECTL_PROG_NAME "tapectl"

#if defined(HAVE_WIN32)
typedef DWORD ProcessId;
#else
typedef pid_t ProcessId;
#endif

#endif  // TAPECTL_INCLUDE_TAPECTL_H_
