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
 * Kill a child process (and its process group) when a deadline passes,
 * built on top of the timer thread.
 */

#ifndef TAPECTL_LIB_CHILD_TIMER_H_
#define TAPECTL_LIB_CHILD_TIMER_H_

#include "lib/timer_thread.h"

#include <atomic>
#include <chrono>

#ifdef HAVE_WIN32
using ChildProcess = HANDLE;
#else
using ChildProcess = pid_t;
#endif

struct ChildTimer {
  TimerThread::Timer* timer{nullptr};
  ChildProcess child{};
  std::chrono::milliseconds kill_grace{};
  std::atomic<bool> killed{false};  /**< deadline passed, termination sent */
  std::atomic<bool> hard_killed{false};
};

/*
 * Start a timer on the child, terminate it after wait. On POSIX the
 * process group gets SIGTERM first and SIGKILL after kill_grace.
 *
 * Returns nullptr if the timer could not be started.
 */
ChildTimer* StartChildTimer(ChildProcess child,
                            std::chrono::milliseconds wait,
                            std::chrono::milliseconds kill_grace);

/* Stop and free the timer. Must be called before the child is reaped. */
void StopChildTimer(ChildTimer* wid);

/* Terminate right away, a no-op if the child is gone already */
void TerminateChild(ChildProcess child, bool force);

#endif  // TAPECTL_LIB_CHILD_TIMER_H_
