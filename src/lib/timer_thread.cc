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
#include "lib/timer_thread.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace TimerThread {

static constexpr int debuglevel{800};

static constexpr std::chrono::seconds idle_timeout_interval{60};

static std::mutex timer_sleep_mutex;
static std::condition_variable timer_sleep_condition;
static bool wakeup_event_occured = false;

static void TimerThreadMain();

enum class TimerThreadState
{
  IS_NOT_INITIALZED,
  IS_STARTING,
  IS_RUNNING,
  IS_SHUTTING_DOWN,
  IS_SHUT_DOWN
};

static std::atomic<TimerThreadState> timer_thread_state(
    TimerThreadState::IS_NOT_INITIALZED);
static std::atomic<bool> quit_timer_thread(false);

static std::unique_ptr<std::thread> timer_thread;
static std::mutex timer_thread_control_mutex;

static std::mutex controlled_items_list_mutex;
static std::vector<Timer*> controlled_items_list;

bool Start()
{
  std::lock_guard<std::mutex> control(timer_thread_control_mutex);

  if (timer_thread_state != TimerThreadState::IS_NOT_INITIALZED
      && timer_thread_state != TimerThreadState::IS_SHUT_DOWN) {
    return false;
  }

  Dmsg0(debuglevel, "Starting timer thread\n");

  quit_timer_thread = false;
  timer_thread_state = TimerThreadState::IS_STARTING;
  try {
    timer_thread = std::make_unique<std::thread>(TimerThreadMain);
  } catch (const std::system_error& e) {
    Emsg1(M_ERROR, 0, "Could not start timer thread: %s\n", e.what());
    timer_thread_state = TimerThreadState::IS_NOT_INITIALZED;
    return false;
  }

  int timeout = 0;
  while (timer_thread_state.load() != TimerThreadState::IS_RUNNING
         && ++timeout < 2000) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  return true;
}

static void WakeTimer()
{
  std::lock_guard<std::mutex> l(timer_sleep_mutex);
  wakeup_event_occured = true;
  timer_sleep_condition.notify_one();
}

void Stop()
{
  std::lock_guard<std::mutex> control(timer_thread_control_mutex);

  if (timer_thread_state != TimerThreadState::IS_RUNNING) { return; }

  timer_thread_state = TimerThreadState::IS_SHUTTING_DOWN;
  quit_timer_thread = true;
  WakeTimer();

  timer_thread->join();
  timer_thread.reset();
}

Timer* NewTimer()
{
  Timer* t = new Timer;

  {
    std::lock_guard<std::mutex> l(controlled_items_list_mutex);
    controlled_items_list.push_back(t);
  }

  if (timer_thread_state != TimerThreadState::IS_RUNNING) { Start(); }

  return t;
}

bool RegisterTimer(Timer* t)
{
  std::chrono::milliseconds interval;
  bool single_shot;

  {
    std::lock_guard<std::mutex> l(controlled_items_list_mutex);

    if (!t->user_callback) { return false; }
    if (std::find(controlled_items_list.begin(), controlled_items_list.end(), t)
        == controlled_items_list.end()) {
      return false;
    }

    t->scheduled_run_timepoint = std::chrono::steady_clock::now() + t->interval;
    t->is_active = true;

    interval = t->interval;
    single_shot = t->single_shot;
  }

  Dmsg2(debuglevel, "Registered timer interval %lld ms%s\n",
        static_cast<long long>(interval.count()),
        single_shot ? " one shot" : "");

  WakeTimer();

  return true;
}

/*
 * Remove a timer. Blocks while its callback is running, so after this
 * returns the callback will not run again.
 */
bool UnregisterTimer(Timer* t)
{
  std::lock_guard<std::mutex> l(controlled_items_list_mutex);

  auto pos
      = std::find(controlled_items_list.begin(), controlled_items_list.end(), t);

  if (pos != controlled_items_list.end()) {
    delete (*pos);
    controlled_items_list.erase(pos);
    Dmsg1(debuglevel, "Unregistered timer %p\n", static_cast<void*>(t));
    return true;
  } else {
    Dmsg1(debuglevel, "Failed to unregister timer %p\n", static_cast<void*>(t));
    return false;
  }
}

static void Cleanup()
{
  std::lock_guard<std::mutex> l(controlled_items_list_mutex);

  for (auto p : controlled_items_list) { delete p; }
  controlled_items_list.clear();
}

static void SleepUntil(std::chrono::steady_clock::time_point next_timer_run)
{
  std::unique_lock<std::mutex> l(timer_sleep_mutex);
  timer_sleep_condition.wait_until(l, next_timer_run,
                                   []() { return wakeup_event_occured; });
  wakeup_event_occured = false;
}

static bool RunOneItem(Timer* p,
                       std::chrono::steady_clock::time_point& next_timer_run)
{
  auto last_timer_run_timepoint = std::chrono::steady_clock::now();

  if (p->is_active && last_timer_run_timepoint >= p->scheduled_run_timepoint) {
    Dmsg1(3400, "Timer callback p=%p\n", static_cast<void*>(p));
    p->user_callback(p);
    if (p->single_shot) {
      delete p;
      return true;
    }
    p->scheduled_run_timepoint = last_timer_run_timepoint + p->interval;
  }
  if (p->is_active) {
    next_timer_run = std::min(p->scheduled_run_timepoint, next_timer_run);
  }
  return false;
}

static void RunAllItemsAndRemoveOneShotItems(
    std::chrono::steady_clock::time_point& next_timer_run)
{
  std::unique_lock<std::mutex> l(controlled_items_list_mutex);

  auto new_end_of_vector = std::remove_if(  // one_shot items will be removed
      controlled_items_list.begin(), controlled_items_list.end(),
      [&next_timer_run](Timer* p) { return RunOneItem(p, next_timer_run); });

  controlled_items_list.erase(new_end_of_vector, controlled_items_list.end());
}

static void TimerThreadMain()
{
  Dmsg0(debuglevel, "Timer thread started\n");
  timer_thread_state = TimerThreadState::IS_RUNNING;

  while (!quit_timer_thread) {
    std::chrono::steady_clock::time_point next_timer_run
        = std::chrono::steady_clock::now() + idle_timeout_interval;

    RunAllItemsAndRemoveOneShotItems(next_timer_run);

    SleepUntil(next_timer_run);
  }

  Cleanup();
  timer_thread_state = TimerThreadState::IS_SHUT_DOWN;
  Dmsg0(debuglevel, "Timer thread stopped\n");
}

class TimerThreadGuard {
 public:
  TimerThreadGuard() = default;
  ~TimerThreadGuard()
  {
    if (timer_thread_state == TimerThreadState::IS_RUNNING) { Stop(); }
  }
};

static TimerThreadGuard timer_thread_guard;

}  // namespace TimerThread
