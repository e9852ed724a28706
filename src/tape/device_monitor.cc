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
#include "tape/device_monitor.h"
#include "lib/scsi_lli.h"

#include <deque>
#include <exception>
#include <system_error>

namespace tapectl {

static constexpr int debuglevel{100};

/* Events not yet delivered to one listener, drained by at most one worker */
struct ListenerQueue {
  ListenerQueue(int t_id, DeviceListener t_listener)
      : id(t_id), listener(std::move(t_listener))
  {
  }

  const int id;
  const DeviceListener listener;
  std::deque<DeviceEvent> pending;
  bool worker_running{false};
  bool removed{false};
};

struct ListenerDispatch {
  std::mutex mutex;
  std::condition_variable cv;
  bool closed{false};
  int in_flight{0};
  int next_id{1};
  std::map<int, std::shared_ptr<ListenerQueue>> queues;
};

/* Counts one running listener invocation */
class InvocationGuard {
 public:
  explicit InvocationGuard(ListenerDispatch& dispatch) : dispatch_(dispatch) {}
  ~InvocationGuard()
  {
    std::lock_guard<std::mutex> lg(dispatch_.mutex);
    dispatch_.in_flight--;
    dispatch_.cv.notify_all();
  }

 private:
  ListenerDispatch& dispatch_;
};

const char* PresenceChangeToString(PresenceChange change)
{
  switch (change) {
    case PresenceChange::kAttached:
      return "attached";
    case PresenceChange::kDetached:
      return "detached";
  }
  return "unknown";
}

std::vector<DeviceEvent> DiffSnapshots(const PresenceSnapshot& previous,
                                       const PresenceSnapshot& current)
{
  std::vector<DeviceEvent> detached, attached;
  auto p = previous.begin();
  auto c = current.begin();

  while (p != previous.end() || c != current.end()) {
    if (c == current.end()
        || (p != previous.end() && p->identity < c->identity)) {
      detached.push_back(DeviceEvent{PresenceChange::kDetached, *p++});
    } else if (p == previous.end() || c->identity < p->identity) {
      attached.push_back(DeviceEvent{PresenceChange::kAttached, *c++});
    } else {
      ++p;
      ++c;
    }
  }

  detached.insert(detached.end(), attached.begin(), attached.end());
  return detached;
}

DeviceListener MakeHandleInvalidator(ScsiTransport& transport)
{
  return [&transport](const DeviceEvent& event) {
    if (event.change != PresenceChange::kDetached) { return; }
    int count = transport.InvalidateDevice(event.device.identity);
    Dmsg2(debuglevel, "invalidated %d handle(s) of %s\n", count,
          event.device.identity.c_str());
  };
}

DevicePresenceMonitor::DevicePresenceMonitor(
    DeviceEnumerator enumerator,
    std::chrono::milliseconds interval,
    std::size_t maximum_listener_threads)
    : enumerator_(std::move(enumerator))
    , interval_(interval)
    , dispatch_(std::make_shared<ListenerDispatch>())
{
  listener_threads_.Init(maximum_listener_threads);
}

DevicePresenceMonitor::~DevicePresenceMonitor() { Stop(); }

int DevicePresenceMonitor::AddListener(DeviceListener listener)
{
  std::lock_guard<std::mutex> lg(dispatch_->mutex);
  int id = dispatch_->next_id++;
  dispatch_->queues.emplace(
      id, std::make_shared<ListenerQueue>(id, std::move(listener)));
  return id;
}

void DevicePresenceMonitor::RemoveListener(int id)
{
  std::lock_guard<std::mutex> lg(dispatch_->mutex);
  auto it = dispatch_->queues.find(id);
  if (it == dispatch_->queues.end()) { return; }
  it->second->removed = true;
  it->second->pending.clear();
  dispatch_->queues.erase(it);
}

bool DevicePresenceMonitor::Start()
{
  std::lock_guard<std::mutex> lg(loop_mutex_);

  if (loop_state_.polling) { return false; }

  snapshots_.lock()->have_baseline = false;
  {
    std::lock_guard<std::mutex> dispatch_lock(dispatch_->mutex);
    dispatch_->closed = false;
    for (auto& entry : dispatch_->queues) { entry.second->pending.clear(); }
  }

  loop_state_.stop_requested = false;
  try {
    loop_thread_ = std::thread(&DevicePresenceMonitor::PollLoop, this);
  } catch (const std::system_error& e) {
    Emsg1(M_ERROR, 0, "cannot start device monitor: %s\n", e.what());
    return false;
  }
  loop_state_.polling = true;

  Dmsg1(debuglevel, "device monitor started, interval %lld ms\n",
        static_cast<long long>(interval_.count()));
  return true;
}

void DevicePresenceMonitor::Stop(std::chrono::milliseconds listener_wait)
{
  {
    std::lock_guard<std::mutex> lg(loop_mutex_);
    loop_state_.stop_requested = true;
  }
  loop_cv_.notify_all();

  if (loop_thread_.joinable()) { loop_thread_.join(); }

  bool was_polling;
  {
    std::lock_guard<std::mutex> lg(loop_mutex_);
    was_polling = loop_state_.polling;
    loop_state_.polling = false;
  }

  std::unique_lock<std::mutex> ul(dispatch_->mutex);
  dispatch_->closed = true;
  if (!dispatch_->cv.wait_for(ul, listener_wait,
                              [this] { return dispatch_->in_flight == 0; })) {
    Emsg1(M_WARNING, 0, "%d device listener(s) still running after stop\n",
          dispatch_->in_flight);
  }

  if (was_polling) { Dmsg0(debuglevel, "device monitor stopped\n"); }
}

bool DevicePresenceMonitor::IsPolling() const
{
  std::lock_guard<std::mutex> lg(loop_mutex_);
  return loop_state_.polling;
}

void DevicePresenceMonitor::PollLoop()
{
  while (true) {
    PollOnce();

    std::unique_lock<std::mutex> ul(loop_mutex_);
    if (loop_cv_.wait_for(ul, interval_,
                          [this] { return loop_state_.stop_requested; })) {
      break;
    }
  }
}

void DevicePresenceMonitor::PollOnce()
{
  std::optional<PresenceSnapshot> current = enumerator_();

  if (!current) {
    int failed = ++snapshots_.lock()->failed_ticks;
    Emsg1(M_WARNING, 0,
          "tape device enumeration failed (%d), assuming no change\n", failed);
    Dispatch({});
    return;
  }
  NormalizeSnapshot(*current);

  std::vector<DeviceEvent> events;
  {
    auto snapshots = snapshots_.lock();
    if (snapshots->have_baseline) {
      events = DiffSnapshots(snapshots->current, *current);
    } else {
      snapshots->have_baseline = true;
      Dmsg1(debuglevel, "device baseline with %zu device(s)\n",
            current->size());
    }
    snapshots->current = std::move(*current);
  }

  for (const DeviceEvent& event : events) {
    Dmsg2(debuglevel, "%s %s\n", event.device.identity.c_str(),
          PresenceChangeToString(event.change));
  }
  Dispatch(events);
}

static void DrainListenerQueue(std::shared_ptr<ListenerDispatch> dispatch,
                               std::shared_ptr<ListenerQueue> queue)
{
  while (true) {
    DeviceEvent event;
    {
      std::lock_guard<std::mutex> lg(dispatch->mutex);
      if (dispatch->closed || queue->removed || queue->pending.empty()) {
        queue->worker_running = false;
        return;
      }
      event = std::move(queue->pending.front());
      queue->pending.pop_front();
      dispatch->in_flight++;
    }

    InvocationGuard guard(*dispatch);
    try {
      queue->listener(event);
    } catch (const std::exception& e) {
      Emsg3(M_ERROR, 0, "device listener %d failed on %s: %s\n", queue->id,
            event.device.identity.c_str(), e.what());
    }
  }
}

/*
 * Appends the events to every listener queue and starts a worker for
 * each queue holding events without one. A queue whose worker cannot be
 * started keeps its events for the next tick.
 */
void DevicePresenceMonitor::Dispatch(const std::vector<DeviceEvent>& events)
{
  std::vector<std::shared_ptr<ListenerQueue>> idle;
  {
    std::lock_guard<std::mutex> lg(dispatch_->mutex);
    if (dispatch_->closed) { return; }
    for (auto& entry : dispatch_->queues) {
      ListenerQueue& queue = *entry.second;
      queue.pending.insert(queue.pending.end(), events.begin(), events.end());
      if (!queue.pending.empty() && !queue.worker_running) {
        queue.worker_running = true;
        idle.push_back(entry.second);
      }
    }
  }

  for (auto& queue : idle) {
    std::shared_ptr<ListenerDispatch> dispatch = dispatch_;
    if (listener_threads_.CreateAndAddNewThread(
            [dispatch, queue]() { DrainListenerQueue(dispatch, queue); })) {
      continue;
    }

    std::lock_guard<std::mutex> lg(dispatch_->mutex);
    queue->worker_running = false;
    Emsg2(M_WARNING, 0,
          "device listener %d busy, %zu event(s) deferred to the next tick\n",
          queue->id, queue->pending.size());
  }
}

bool DevicePresenceMonitor::WaitForListeners(std::chrono::milliseconds timeout)
{
  return listener_threads_.WaitUntilThreadListIsEmpty(timeout);
}

PresenceSnapshot DevicePresenceMonitor::CurrentSnapshot() const
{
  return snapshots_.lock()->current;
}

int DevicePresenceMonitor::FailedTicks() const
{
  return snapshots_.lock()->failed_ticks;
}

}  // namespace tapectl
