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
 * One background thread running registered timers
 */

#ifndef TAPECTL_LIB_TIMER_THREAD_H_
#define TAPECTL_LIB_TIMER_THREAD_H_

#include <chrono>

namespace TimerThread {

struct Timer {
  bool single_shot = true;
  bool is_active = false;
  std::chrono::milliseconds interval{};
  void (*user_callback)(Timer* t) = nullptr;
  void* user_data = nullptr;

  std::chrono::steady_clock::time_point scheduled_run_timepoint;
};

bool Start();
void Stop();

/* Timers are owned by the timer thread, single shot timers are deleted
 * after they fired, all others by UnregisterTimer */
Timer* NewTimer();

bool RegisterTimer(Timer* t);
bool UnregisterTimer(Timer* t);
}  // namespace TimerThread

#endif  // TAPECTL_LIB_TIMER_THREAD_H_
