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

#ifndef TAPECTL_LIB_THREAD_UTIL_H_
#define TAPECTL_LIB_THREAD_UTIL_H_

#include <mutex>
#include <utility>

/*
 * Access to data guarded by a mutex. The lock is held for the lifetime
 * of the locked object.
 */
template <typename T, typename Mutex, template <typename> typename Lock>
class locked {
 public:
  locked(Mutex& t_mut, T* t_data) : lock{t_mut}, data(t_data) {}
  locked(Lock<Mutex> t_lock, T* t_data) : lock{std::move(t_lock)}, data(t_data)
  {
  }

  locked(const locked&) = delete;
  locked& operator=(const locked&) = delete;
  locked(locked&& that) : lock(std::move(that.lock)), data(that.data)
  {
    that.data = nullptr;
  }

  locked& operator=(locked&& that)
  {
    std::swap(lock, that.lock);
    std::swap(data, that.data);
    return *this;
  }

  T& get() { return *data; }
  T& operator*() { return *data; }
  T* operator->() { return data; }

  const T& get() const { return *data; }
  const T& operator*() const { return *data; }
  const T* operator->() const { return data; }

 private:
  Lock<Mutex> lock;
  T* data;
};

template <typename T, typename Mutex = std::mutex> class synchronized {
 public:
  using unique_locked = locked<T, Mutex, std::unique_lock>;
  using const_unique_locked = locked<const T, Mutex, std::unique_lock>;

  template <typename... Args>
  synchronized(Args... args) : data{std::forward<Args>(args)...}
  {
  }

  ~synchronized()
  {
    /* nobody may hold the lock here, taking it once gives the destroying
     * thread a synchronized view of data */
    std::unique_lock _{mut};
  }

  [[nodiscard]] unique_locked lock() { return {mut, &data}; }
  [[nodiscard]] const_unique_locked lock() const { return {mut, &data}; }

 private:
  mutable Mutex mut{};
  T data;
};

#endif  // TAPECTL_LIB_THREAD_UTIL_H_
