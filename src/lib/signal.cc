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
 * Termination signal handling
 */

#include "include/tapectl.h"
#include "lib/signal.h"

#include <algorithm>
#include <csignal>
#include <thread>

static constexpr int debuglevel{200};
static constexpr std::chrono::milliseconds poll_interval{100};

static volatile std::sig_atomic_t termination_signal = 0;

extern "C" void TerminationSignalHandler(int sig) { termination_signal = sig; }

void InitTerminationSignals()
{
#ifdef HAVE_WIN32
  std::signal(SIGINT, TerminationSignalHandler);
  std::signal(SIGTERM, TerminationSignalHandler);
#else
  struct sigaction sighandle;

  sighandle.sa_flags = 0;
  sighandle.sa_handler = TerminationSignalHandler;
  sigfillset(&sighandle.sa_mask);

  sigaction(SIGINT, &sighandle, nullptr);
  sigaction(SIGTERM, &sighandle, nullptr);
#endif
  Dmsg0(debuglevel, "termination signal handlers installed\n");
}

bool TerminationRequested() { return termination_signal != 0; }

int TerminationSignal() { return termination_signal; }

bool WaitForTermination(std::chrono::milliseconds timeout)
{
  using std::chrono::steady_clock;
  const bool forever = timeout < std::chrono::milliseconds::zero();
  const auto deadline = steady_clock::now() + (forever ? poll_interval : timeout);

  // a handler must not touch a condition variable, so poll the flag
  while (!TerminationRequested()) {
    auto now = steady_clock::now();
    if (!forever && now >= deadline) { break; }
    auto step = forever ? poll_interval
                        : std::min<steady_clock::duration>(poll_interval,
                                                           deadline - now);
    std::this_thread::sleep_for(step);
  }

  if (TerminationRequested()) {
    Dmsg1(debuglevel, "termination signal %d received\n",
          static_cast<int>(termination_signal));
  }
  return TerminationRequested();
}

void ClearTerminationRequest() { termination_signal = 0; }
