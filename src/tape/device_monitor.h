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
 * Background poll loop that reports tape devices coming and going.
 */

#ifndef TAPECTL_TAPE_DEVICE_MONITOR_H_
#define TAPECTL_TAPE_DEVICE_MONITOR_H_

#include "tape/device_enumerator.h"
#include "lib/thread_list.h"
#include "lib/thread_util.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class ScsiTransport;

namespace tapectl {

enum class PresenceChange
{
  kAttached,
  kDetached
};

const char* PresenceChangeToString(PresenceChange change);

struct DeviceEvent {
  PresenceChange change{PresenceChange::kAttached};
  TapeDeviceInfo device;
};

using DeviceListener = std::function<void(const DeviceEvent&)>;

/*
 * Events turning previous into current: Detached for identities only in
 * previous, then Attached for identities only in current, each in
 * identity order. Both snapshots must be normalized.
 */
std::vector<DeviceEvent> DiffSnapshots(const PresenceSnapshot& previous,
                                       const PresenceSnapshot& current);

/* Listener that invalidates the transport's handles of detached devices */
DeviceListener MakeHandleInvalidator(ScsiTransport& transport);

struct ListenerDispatch;

/*
 * Idle until Start(), then one enumeration per interval on a background
 * thread. The first enumeration only sets the baseline. A failed
 * enumeration is logged and counts as "no change".
 *
 * Every listener has a queue of its own, drained in order by one worker
 * thread at a time, so a listener sees all events in detection order
 * and a slow listener never delays the next tick. Events are never
 * dropped while the monitor is open.
 * After Stop() returned neither an enumeration nor a listener
 * invocation starts. Stop() waits at most listener_wait for listener
 * invocations that are already running.
 */
class DevicePresenceMonitor {
 public:
  DevicePresenceMonitor(DeviceEnumerator enumerator,
                        std::chrono::milliseconds interval,
                        std::size_t maximum_listener_threads = 16);
  ~DevicePresenceMonitor();

  int AddListener(DeviceListener listener);
  void RemoveListener(int id);

  /* false if already polling */
  bool Start();
  void Stop(std::chrono::milliseconds listener_wait
            = std::chrono::milliseconds(5000));
  bool IsPolling() const;

  /* One tick on the calling thread, used by Start() and tests */
  void PollOnce();

  /* Wait for dispatched listener invocations */
  bool WaitForListeners(std::chrono::milliseconds timeout);

  PresenceSnapshot CurrentSnapshot() const;
  int FailedTicks() const;

  DevicePresenceMonitor(const DevicePresenceMonitor&) = delete;
  DevicePresenceMonitor& operator=(const DevicePresenceMonitor&) = delete;

 private:
  struct Snapshots {
    bool have_baseline{false};
    PresenceSnapshot current;
    int failed_ticks{0};
  };

  struct LoopState {
    bool polling{false};
    bool stop_requested{false};
  };

  void PollLoop();
  void Dispatch(const std::vector<DeviceEvent>& events);

  DeviceEnumerator enumerator_;
  std::chrono::milliseconds interval_;

  synchronized<Snapshots> snapshots_;

  mutable std::mutex loop_mutex_;
  std::condition_variable loop_cv_;
  LoopState loop_state_;
  std::thread loop_thread_;

  ThreadList listener_threads_;
  std::shared_ptr<ListenerDispatch> dispatch_;
};

}  // namespace tapectl

#endif  // TAPECTL_TAPE_DEVICE_MONITOR_H_
