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
#include "lib/thread_list.h"

#include <condition_variable>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

static constexpr int debuglevel{800};

struct ThreadListItem {
  std::thread::id id{};
};

struct ThreadListContainer {
  std::set<ThreadListItem*> thread_list_;
  std::mutex thread_list_mutex_;
  std::condition_variable wait_shutdown_condition;
};

struct ThreadListPrivate {
  std::size_t maximum_thread_count_{32};

  std::shared_ptr<ThreadListContainer> l{
      std::make_shared<ThreadListContainer>()};
};

ThreadList::ThreadList() : impl_(std::make_unique<ThreadListPrivate>()) {}
ThreadList::~ThreadList() = default;

void ThreadList::Init(std::size_t maximum_thread_count)
{
  impl_->maximum_thread_count_ = maximum_thread_count;
}

class ThreadGuard {
 public:
  ThreadGuard(std::shared_ptr<ThreadListContainer> l,
              std::unique_ptr<ThreadListItem>&& item)
      : l_(std::move(l)), item_(std::move(item))
  {
  }
  ~ThreadGuard()
  {
    std::lock_guard<std::mutex> lg(l_->thread_list_mutex_);
    l_->thread_list_.erase(item_.get());
    l_->wait_shutdown_condition.notify_all();
  }

 private:
  std::shared_ptr<ThreadListContainer> l_;
  std::unique_ptr<ThreadListItem> item_;  // finally destroys the item
};

static void WorkerThread(std::shared_ptr<ThreadListContainer> l,
                         std::unique_ptr<ThreadListItem> item,
                         ThreadList::ThreadHandler handler)
{
  item->id = std::this_thread::get_id();
  ThreadGuard guard(std::move(l), std::move(item));

  handler();

  Dmsg0(debuglevel, "Finished WorkerThread.\n");
}

/*
 * The item is inserted before the thread starts, so Size() and
 * WaitUntilThreadListIsEmpty() see the worker right away.
 */
bool ThreadList::CreateAndAddNewThread(ThreadHandler handler)
{
  std::lock_guard<std::mutex> lg(impl_->l->thread_list_mutex_);

  if (impl_->l->thread_list_.size() >= impl_->maximum_thread_count_) {
    Dmsg1(debuglevel, "Number of maximum threads exceeded: %zu\n",
          impl_->maximum_thread_count_);
    return false;
  }

  auto item = std::make_unique<ThreadListItem>();
  ThreadListItem* raw_item = item.get();
  impl_->l->thread_list_.insert(raw_item);

  try {
    std::thread(WorkerThread, impl_->l, std::move(item), std::move(handler))
        .detach();
  } catch (const std::system_error& e) {
    impl_->l->thread_list_.erase(raw_item);
    Dmsg1(debuglevel, "Could not start and detach thread: %s\n", e.what());
    return false;
  }

  return true;
}

bool ThreadList::WaitUntilThreadListIsEmpty(std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> ul(impl_->l->thread_list_mutex_);
  return impl_->l->wait_shutdown_condition.wait_for(
      ul, timeout, [this]() { return impl_->l->thread_list_.empty(); });
}

std::size_t ThreadList::Size() const
{
  std::lock_guard<std::mutex> l(impl_->l->thread_list_mutex_);
  return impl_->l->thread_list_.size();
}
