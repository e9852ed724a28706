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
#include "lib/thread_list.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <random>
#include <thread>

class WaitCondition {
 public:
  enum class Status : int
  {
    kNotWaiting,
    kWaiting,
    kTimedOut,
    kSuccess
  };

 private:
  std::mutex mutex_;
  std::condition_variable cond_variable_;
  bool notified = false;
  std::atomic<Status> status_{Status::kNotWaiting};

 public:
  void WaitFor(std::chrono::milliseconds ms)
  {
    std::unique_lock<std::mutex> ul(mutex_);
    status_ = Status::kWaiting;
    bool success = cond_variable_.wait_for(ul, ms, [=]() { return notified; });
    status_ = success ? Status::kSuccess : Status::kTimedOut;
  }
  void NotifyOne()
  {
    std::lock_guard<std::mutex> l(mutex_);
    notified = true;
    cond_variable_.notify_one();
  }
  Status GetStatus() { return status_; }
};

static constexpr int maximum_allowed_thread_count = 10;
static constexpr int try_to_start_thread_count = 11;

TEST(thread_list, thread_list_startup_and_shutdown)
{
  std::atomic<int> thread_counter{0};
  std::vector<std::unique_ptr<WaitCondition>> wait_conditions;
  auto t(std::make_unique<ThreadList>());

  t->Init(maximum_allowed_thread_count);

  int started = 0;
  for (int i = 0; i < try_to_start_thread_count; i++) {
    auto wc(std::make_unique<WaitCondition>());
    WaitCondition* cond = wc.get();
    if (t->CreateAndAddNewThread([cond, &thread_counter]() {
          cond->WaitFor(std::chrono::milliseconds(10000));
          thread_counter++;
        })) {
      started++;
      wait_conditions.push_back(std::move(wc));
    }
  }
  EXPECT_EQ(started, maximum_allowed_thread_count);
  EXPECT_EQ(t->Size(), static_cast<std::size_t>(maximum_allowed_thread_count));

  for (const auto& c : wait_conditions) { c->NotifyOne(); }

  EXPECT_TRUE(t->WaitUntilThreadListIsEmpty(std::chrono::seconds(10)));
  EXPECT_EQ(t->Size(), 0u);
  for (const auto& c : wait_conditions) {
    EXPECT_EQ(c->GetStatus(), WaitCondition::Status::kSuccess);
  }
  EXPECT_EQ(thread_counter, maximum_allowed_thread_count);
}

TEST(thread_list, thread_random_shutdown)
{
  std::atomic<int> thread_counter{0};
  auto t(std::make_unique<ThreadList>());

  t->Init(maximum_allowed_thread_count);

  for (int i = 0; i < maximum_allowed_thread_count; i++) {
    t->CreateAndAddNewThread([&thread_counter]() {
      std::mt19937_64 eng{std::random_device{}()};
      std::uniform_int_distribution<> dist{0, 10};
      std::this_thread::sleep_for(std::chrono::milliseconds{dist(eng)});
      ++thread_counter;
    });
  }

  EXPECT_TRUE(t->WaitUntilThreadListIsEmpty(std::chrono::seconds(10)));
  EXPECT_EQ(t->Size(), 0u);
  EXPECT_EQ(thread_counter, maximum_allowed_thread_count);
}

TEST(thread_list, wait_times_out_while_threads_run)
{
  auto release = std::make_shared<WaitCondition>();
  auto t(std::make_unique<ThreadList>());

  t->Init(1);
  ASSERT_TRUE(t->CreateAndAddNewThread(
      [release]() { release->WaitFor(std::chrono::milliseconds(10000)); }));

  EXPECT_FALSE(t->WaitUntilThreadListIsEmpty(std::chrono::milliseconds(50)));
  EXPECT_EQ(t->Size(), 1u);

  release->NotifyOne();
  EXPECT_TRUE(t->WaitUntilThreadListIsEmpty(std::chrono::seconds(10)));
}
