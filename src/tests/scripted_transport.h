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
 * In memory ScsiTransport answering commands from a script
 */

#ifndef TAPECTL_TESTS_SCRIPTED_TRANSPORT_H_
#define TAPECTL_TESTS_SCRIPTED_TRANSPORT_H_

#include "include/tapectl.h"
#include "lib/scsi_cdb.h"
#include "lib/scsi_lli.h"

#include <algorithm>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct ScriptedReply {
  bool issued{true};
  int os_error{0};
  uint8_t scsi_status{SCSI_STATUS_GOOD};
  uint16_t host_status{0};
  std::vector<uint8_t> sense;
  std::vector<uint8_t> data;
};

/* 18 byte fixed format sense */
inline std::vector<uint8_t> FixedSense(uint8_t key, uint8_t asc, uint8_t ascq)
{
  std::vector<uint8_t> sense(18, 0);
  sense[0] = 0x70;
  sense[2] = key;
  sense[7] = 10;
  sense[12] = asc;
  sense[13] = ascq;
  return sense;
}

inline ScriptedReply CheckCondition(uint8_t key, uint8_t asc, uint8_t ascq)
{
  ScriptedReply reply;
  reply.scsi_status = SCSI_STATUS_CHECK_CONDITION;
  reply.sense = FixedSense(key, asc, ascq);
  return reply;
}

inline ScriptedReply DataReply(std::vector<uint8_t> data)
{
  ScriptedReply reply;
  reply.data = std::move(data);
  return reply;
}

/*
 * Replies are consumed in order, once the script is exhausted every
 * command completes with GOOD status and no data.
 */
class ScriptedTransport : public ScsiTransport {
 public:
  ~ScriptedTransport() override { CloseAll(); }

  const char* name() const override { return "scripted"; }

  void Push(ScriptedReply reply)
  {
    std::lock_guard<std::mutex> l(mutex_);
    replies_.push_back(std::move(reply));
  }

  void SetMissing(const std::string& identity)
  {
    std::lock_guard<std::mutex> l(mutex_);
    missing_.insert(identity);
  }

  std::vector<CommandDescriptor> Issued()
  {
    std::lock_guard<std::mutex> l(mutex_);
    return issued_;
  }

  int OpenDevices()
  {
    std::lock_guard<std::mutex> l(mutex_);
    return open_devices_;
  }

 protected:
  bool OpenNative(const std::string& identity,
                  NativeDevice& device,
                  int& os_error) override
  {
    std::lock_guard<std::mutex> l(mutex_);
    if (missing_.count(identity)) {
      os_error = ENOENT;
      return false;
    }
#ifdef HAVE_WIN32
    device = reinterpret_cast<HANDLE>(static_cast<intptr_t>(next_device_++));
#else
    device = next_device_++;
#endif
    open_devices_++;
    return true;
  }

  void CloseNative(NativeDevice) override
  {
    std::lock_guard<std::mutex> l(mutex_);
    open_devices_--;
  }

  void Issue(NativeDevice,
             const CommandDescriptor& cmd,
             std::vector<uint8_t>& data,
             NativeCompletion& completion) override
  {
    std::lock_guard<std::mutex> l(mutex_);
    issued_.push_back(cmd);

    ScriptedReply reply;
    if (!replies_.empty()) {
      reply = std::move(replies_.front());
      replies_.pop_front();
    }

    completion.issued = reply.issued;
    completion.os_error = reply.os_error;
    completion.scsi_status = reply.scsi_status;
    completion.host_status = reply.host_status;
    completion.sense = reply.sense;

    std::size_t n = std::min(reply.data.size(), data.size());
    std::copy(reply.data.begin(), reply.data.begin() + n, data.begin());
    completion.bytes_transferred = static_cast<uint32_t>(
        cmd.direction == DataDirection::kOut ? cmd.payload.size() : n);
  }

 private:
  std::mutex mutex_;
  std::deque<ScriptedReply> replies_;
  std::set<std::string> missing_;
  std::vector<CommandDescriptor> issued_;
  int next_device_{100};
  int open_devices_{0};
};

#endif  // TAPECTL_TESTS_SCRIPTED_TRANSPORT_H_
