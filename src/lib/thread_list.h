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

#ifndef TAPECTL_LIB_THREAD_LIST_H_
#define TAPECTL_LIB_THREAD_LIST_H_ 1

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

struct ThreadListPrivate;

/*
 * Detached worker threads that are tracked until they finish. The list
 * may be destroyed while workers are still running.
 */
class ThreadList {
 public:
  using ThreadHandler = std::function<void()>;

  ThreadList();
  ~ThreadList();

  void Init(std::size_t maximum_thread_count);

  bool CreateAndAddNewThread(ThreadHandler handler);
  bool WaitUntilThreadListIsEmpty(std::chrono::milliseconds timeout);
  std::size_t Size() const;

  ThreadList(const ThreadList& other) = delete;
  ThreadList(ThreadList&& other) = delete;
  ThreadList& operator=(const ThreadList& rhs) = delete;
  ThreadList& operator=(ThreadList&& rhs) = delete;

 private:
  std::unique_ptr<ThreadListPrivate> impl_;
};

#endif  // TAPECTL_LIB_THREAD_LIST_H_
