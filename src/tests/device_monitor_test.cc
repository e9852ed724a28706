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

#include "gtest/gtest.h"
#include "include/tapectl.h"
#include "tape/device_monitor.h"
#include "tests/scripted_transport.h"

#include <atomic>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace tapectl;
using namespace std::chrono_literals;

static TapeDeviceInfo Device(const std::string& identity)
{
  return TapeDeviceInfo{identity, "IBM", "ULT3580-HH9", ""};
}

/* Hands out the queued snapshots, the last one repeats */
class ScriptedEnumerator {
 public:
  void Push(std::optional<PresenceSnapshot> snapshot)
  {
    std::lock_guard<std::mutex> l(mutex_);
    script_.push_back(std::move(snapshot));
  }

  DeviceEnumerator Enumerator()
  {
    return [this]() -> std::optional<PresenceSnapshot> {
      std::lock_guard<std::mutex> l(mutex_);
      calls_++;
      if (script_.empty()) { return PresenceSnapshot(); }
      std::optional<PresenceSnapshot> snapshot = script_.front();
      if (script_.size() > 1) { script_.pop_front(); }
      return snapshot;
    };
  }

  int Calls()
  {
    std::lock_guard<std::mutex> l(mutex_);
    return calls_;
  }

 private:
  std::mutex mutex_;
  std::deque<std::optional<PresenceSnapshot>> script_;
  int calls_{0};
};

class EventRecorder {
 public:
  DeviceListener Listener()
  {
    return [this](const DeviceEvent& event) {
      std::lock_guard<std::mutex> l(mutex_);
      events_.push_back(event);
    };
  }

  std::vector<DeviceEvent> Events()
  {
    std::lock_guard<std::mutex> l(mutex_);
    return events_;
  }

 private:
  std::mutex mutex_;
  std::vector<DeviceEvent> events_;
};

TEST(device_monitor, diff_reports_detached_then_attached)
{
  PresenceSnapshot previous{Device("A"), Device("B")};
  PresenceSnapshot current{Device("B"), Device("C")};

  std::vector<DeviceEvent> events = DiffSnapshots(previous, current);

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].change, PresenceChange::kDetached);
  EXPECT_EQ(events[0].device.identity, "A");
  EXPECT_EQ(events[1].change, PresenceChange::kAttached);
  EXPECT_EQ(events[1].device.identity, "C");
}

TEST(device_monitor, diff_of_equal_snapshots_is_empty)
{
  PresenceSnapshot snapshot{Device("A"), Device("B")};

  EXPECT_TRUE(DiffSnapshots(snapshot, snapshot).empty());
  EXPECT_TRUE(DiffSnapshots({}, {}).empty());
  EXPECT_EQ(DiffSnapshots({}, snapshot).size(), 2u);
  EXPECT_EQ(DiffSnapshots(snapshot, {}).size(), 2u);
}

TEST(device_monitor, normalize_sorts_and_removes_duplicates)
{
  PresenceSnapshot snapshot{Device("C"), Device("A"), Device("C")};

  NormalizeSnapshot(snapshot);

  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0].identity, "A");
  EXPECT_EQ(snapshot[1].identity, "C");
}

TEST(device_monitor, first_tick_is_the_baseline)
{
  ScriptedEnumerator enumerator;
  EventRecorder recorder;
  enumerator.Push(PresenceSnapshot{Device("A"), Device("B")});
  enumerator.Push(PresenceSnapshot{Device("C"), Device("B")});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h);
  monitor.AddListener(recorder.Listener());

  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));
  EXPECT_TRUE(recorder.Events().empty());
  EXPECT_EQ(monitor.CurrentSnapshot().size(), 2u);

  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));
  std::vector<DeviceEvent> events = recorder.Events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].change, PresenceChange::kDetached);
  EXPECT_EQ(events[0].device.identity, "A");
  EXPECT_EQ(events[1].change, PresenceChange::kAttached);
  EXPECT_EQ(events[1].device.identity, "C");
}

TEST(device_monitor, failed_enumeration_assumes_no_change)
{
  ScriptedEnumerator enumerator;
  EventRecorder recorder;
  enumerator.Push(PresenceSnapshot{Device("A")});
  enumerator.Push(std::nullopt);
  enumerator.Push(PresenceSnapshot{Device("A")});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h);
  monitor.AddListener(recorder.Listener());

  monitor.PollOnce();
  monitor.PollOnce();
  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));

  EXPECT_EQ(monitor.FailedTicks(), 1);
  EXPECT_TRUE(recorder.Events().empty());
  ASSERT_EQ(monitor.CurrentSnapshot().size(), 1u);
}

TEST(device_monitor, every_listener_gets_every_event)
{
  ScriptedEnumerator enumerator;
  EventRecorder first, second;
  enumerator.Push(PresenceSnapshot{});
  enumerator.Push(PresenceSnapshot{Device("A"), Device("B")});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h);
  monitor.AddListener(first.Listener());
  monitor.AddListener(second.Listener());

  monitor.PollOnce();
  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));

  EXPECT_EQ(first.Events().size(), 2u);
  EXPECT_EQ(second.Events().size(), 2u);
}

TEST(device_monitor, removed_listener_gets_nothing)
{
  ScriptedEnumerator enumerator;
  EventRecorder recorder;
  enumerator.Push(PresenceSnapshot{});
  enumerator.Push(PresenceSnapshot{Device("A")});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h);
  int id = monitor.AddListener(recorder.Listener());
  monitor.RemoveListener(id);

  monitor.PollOnce();
  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));

  EXPECT_TRUE(recorder.Events().empty());
}

TEST(device_monitor, throwing_listener_does_not_stop_others)
{
  ScriptedEnumerator enumerator;
  EventRecorder recorder;
  enumerator.Push(PresenceSnapshot{});
  enumerator.Push(PresenceSnapshot{Device("A")});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h);
  monitor.AddListener(
      [](const DeviceEvent&) { throw std::runtime_error("listener bug"); });
  monitor.AddListener(recorder.Listener());

  monitor.PollOnce();
  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));

  EXPECT_EQ(recorder.Events().size(), 1u);
}

TEST(device_monitor, slow_listener_does_not_delay_polling)
{
  ScriptedEnumerator enumerator;
  std::atomic<bool> release{false};
  enumerator.Push(PresenceSnapshot{});
  enumerator.Push(PresenceSnapshot{Device("A")});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 10ms);
  monitor.AddListener([&release](const DeviceEvent&) {
    while (!release) { std::this_thread::sleep_for(5ms); }
  });

  ASSERT_TRUE(monitor.Start());
  EXPECT_FALSE(monitor.Start());
  EXPECT_TRUE(monitor.IsPolling());

  auto deadline = std::chrono::steady_clock::now() + 5s;
  while (enumerator.Calls() < 10 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_GE(enumerator.Calls(), 10);

  release = true;
  monitor.Stop();
  EXPECT_FALSE(monitor.IsPolling());
}

TEST(device_monitor, stop_closes_dispatch)
{
  ScriptedEnumerator enumerator;
  EventRecorder recorder;
  enumerator.Push(PresenceSnapshot{});
  enumerator.Push(PresenceSnapshot{Device("A")});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h);
  monitor.AddListener(recorder.Listener());

  ASSERT_TRUE(monitor.Start());
  monitor.Stop();
  EXPECT_FALSE(monitor.IsPolling());

  // events detected after stop are not delivered
  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));
  EXPECT_TRUE(recorder.Events().empty());
}

TEST(device_monitor, detach_invalidates_open_handles)
{
  ScriptedTransport transport;
  ScriptedEnumerator enumerator;
  enumerator.Push(PresenceSnapshot{Device("/dev/nst0")});
  enumerator.Push(PresenceSnapshot{});

  auto handle = transport.Open("/dev/nst0");
  ASSERT_NE(handle, nullptr);

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h);
  monitor.AddListener(MakeHandleInvalidator(transport));

  monitor.PollOnce();
  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));

  EXPECT_TRUE(handle->IsInvalidated());
  EXPECT_EQ(transport.Submit(handle.get(), CommandDescriptor()).transport_error,
            TransportError::kDeviceUnavailable);
}

TEST(device_monitor, slow_listener_sees_events_in_detection_order)
{
  ScriptedEnumerator enumerator;
  EventRecorder recorder;
  enumerator.Push(PresenceSnapshot{Device("A")});
  enumerator.Push(PresenceSnapshot{});
  enumerator.Push(PresenceSnapshot{Device("A")});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h);
  DeviceListener record = recorder.Listener();
  monitor.AddListener([record](const DeviceEvent& event) {
    if (event.change == PresenceChange::kDetached) {
      std::this_thread::sleep_for(200ms);
    }
    record(event);
  });

  monitor.PollOnce();
  monitor.PollOnce();
  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));

  std::vector<DeviceEvent> events = recorder.Events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].change, PresenceChange::kDetached);
  EXPECT_EQ(events[1].change, PresenceChange::kAttached);
}

TEST(device_monitor, events_wait_for_a_free_worker)
{
  ScriptedEnumerator enumerator;
  EventRecorder recorder;
  std::atomic<bool> release{false};
  enumerator.Push(PresenceSnapshot{Device("/dev/nst0")});
  enumerator.Push(PresenceSnapshot{});

  DevicePresenceMonitor monitor(enumerator.Enumerator(), 1h, 1);
  monitor.AddListener([&release](const DeviceEvent&) {
    while (!release) { std::this_thread::sleep_for(5ms); }
  });
  monitor.AddListener(recorder.Listener());

  monitor.PollOnce();
  monitor.PollOnce();
  EXPECT_TRUE(recorder.Events().empty());

  release = true;
  ASSERT_TRUE(monitor.WaitForListeners(5s));

  // the next tick finds no change but delivers what was kept back
  monitor.PollOnce();
  ASSERT_TRUE(monitor.WaitForListeners(5s));
  std::vector<DeviceEvent> events = recorder.Events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].change, PresenceChange::kDetached);
  EXPECT_EQ(events[0].device.identity, "/dev/nst0");
}
