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
 * Process timer routines, built on top of the timer thread.
 */

#include "include/tapectl.h"
#include "lib/child_timer.h"

#ifndef HAVE_WIN32
#  include <csignal>
#endif

static constexpr int debuglevel{900};

static void CallbackChildTimer(TimerThread::Timer* self);

ChildTimer* StartChildTimer(ChildProcess child,
                            std::chrono::milliseconds wait,
                            std::chrono::milliseconds kill_grace)
{
  ChildTimer* wid = new ChildTimer;
  wid->child = child;
  wid->kill_grace = kill_grace;

  wid->timer = TimerThread::NewTimer();
  if (!wid->timer) {
    delete wid;
    return nullptr;
  }

  wid->timer->user_data = wid;
  wid->timer->user_callback = CallbackChildTimer;
  wid->timer->single_shot = false;
  wid->timer->interval = wait;

  if (!TimerThread::RegisterTimer(wid->timer)) {
    TimerThread::UnregisterTimer(wid->timer);
    delete wid;
    return nullptr;
  }

  Dmsg2(debuglevel, "Start child timer %p for %lld ms.\n",
        static_cast<void*>(wid), static_cast<long long>(wait.count()));
  return wid;
}

void StopChildTimer(ChildTimer* wid)
{
  if (!wid) {
    Dmsg0(debuglevel, "StopChildTimer called with NULL timer\n");
    return;
  }
  Dmsg2(debuglevel, "Stop child timer %p killed=%d\n", static_cast<void*>(wid),
        wid->killed.load());

  /* waits for a running callback, afterwards the callback is gone */
  TimerThread::UnregisterTimer(wid->timer);
  delete wid;
}

void TerminateChild(ChildProcess child, bool force)
{
#ifdef HAVE_WIN32
  if (!TerminateProcess(child, 1)) {
    Dmsg1(debuglevel, "TerminateProcess failed: %lu\n",
          static_cast<unsigned long>(GetLastError()));
  }
  (void)force;
#else
  int sig = force ? SIGKILL : SIGTERM;

  /* the child runs in its own process group */
  if (kill(-child, sig) != 0 && kill(child, sig) != 0) {
    Dmsg2(debuglevel, "kill pid %d failed: errno=%d\n", static_cast<int>(child),
          errno);
  }
#endif
}

static void CallbackChildTimer(TimerThread::Timer* self)
{
  ChildTimer* wid = static_cast<ChildTimer*>(self->user_data);

  if (!wid->killed) {
    /* First kill attempt, terminate softly and escalate after the grace */
    wid->killed = true;
    Dmsg1(debuglevel, "child timer %p term child\n", static_cast<void*>(wid));
    TerminateChild(wid->child, false);
    self->interval = wid->kill_grace;
  } else if (!wid->hard_killed) {
    /* Second call, terminate with prejudice */
    wid->hard_killed = true;
    Dmsg1(debuglevel, "child timer %p kill child\n", static_cast<void*>(wid));
    TerminateChild(wid->child, true);

    /* stays registered until StopChildTimer, but never fires again */
    self->is_active = false;
  }
}
