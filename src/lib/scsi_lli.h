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
 * SCSI Low Level Interface: one command protocol over the host's
 * pass-through mechanism (SG_IO on Linux, SPTI on Windows).
 */

#ifndef TAPECTL_LIB_SCSI_LLI_H_
#define TAPECTL_LIB_SCSI_LLI_H_ 1

#include "lib/scsi_sense.h"
#include "lib/thread_util.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#ifdef HAVE_WIN32
using NativeDevice = HANDLE;
#  define INVALID_NATIVE_DEVICE INVALID_HANDLE_VALUE
#else
using NativeDevice = int;
#  define INVALID_NATIVE_DEVICE (-1)
#endif

enum class DataDirection
{
  kNone,
  kIn, /* device to host */
  kOut /* host to device */
};

/*
 * One logical SCSI command. Built fresh for every attempt and not
 * changed after it was handed to the transport.
 */
struct CommandDescriptor {
  std::string name;
  std::vector<uint8_t> cdb;
  DataDirection direction{DataDirection::kNone};
  std::vector<uint8_t> payload;  /**< data sent for kOut */
  uint32_t transfer_length{0};   /**< bytes expected for kIn */
  std::chrono::seconds timeout{300};

  /* addressing, for logging */
  uint8_t partition{0};
  uint64_t lba{0};

  uint8_t opcode() const { return cdb.empty() ? 0 : cdb[0]; }
};

enum class TransportError
{
  kNone,
  kDeviceUnavailable, /**< handle closed or invalidated */
  kTransportFault     /**< host API or host adapter failure */
};

struct CommandResult {
  std::string command;
  TransportError transport_error{TransportError::kNone};
  int os_error{0};
  uint8_t scsi_status{0};
  uint16_t host_status{0};
  uint16_t driver_status{0};
  SenseData sense;
  uint32_t bytes_transferred{0};
  std::vector<uint8_t> data;
  int attempts{0};

  /* GOOD, or CHECK CONDITION that only reports a recovered error */
  bool ok() const;
  std::string Describe() const;
};

const char* TransportErrorToString(TransportError error);

/*
 * Reference to one open tape device. Created by ScsiTransport::Open and
 * never usable again after Close or invalidation, the caller must open
 * the device again.
 */
class DeviceHandle {
 public:
  explicit DeviceHandle(std::string identity);

  const std::string& identity() const { return identity_; }
  bool IsUsable() const { return !closed_ && !invalidated_; }
  bool IsInvalidated() const { return invalidated_; }
  std::chrono::system_clock::time_point LastSeen() const;

 private:
  friend class ScsiTransport;

  struct NativeState {
    NativeDevice device{INVALID_NATIVE_DEVICE};
  };

  void Touch();

  std::string identity_;
  std::atomic<bool> closed_{false};
  std::atomic<bool> invalidated_{false};
  std::atomic<int64_t> last_seen_ms_{0};
  synchronized<NativeState> native_; /**< held for exactly one command */
};

/*
 * The platform variants only open and close the native device and issue
 * one command. Handle checks, serialization and status decoding are
 * done here for both.
 */
class ScsiTransport {
 public:
  virtual ~ScsiTransport();

  std::shared_ptr<DeviceHandle> Open(const std::string& identity);
  void Close(const std::shared_ptr<DeviceHandle>& handle);
  CommandResult Submit(DeviceHandle* handle, const CommandDescriptor& cmd);

  /* Invalidate all handles open on identity, returns their number */
  int InvalidateDevice(const std::string& identity);

  virtual const char* name() const = 0;

 protected:
  struct NativeCompletion {
    bool issued{false}; /**< false if the ioctl itself failed */
    int os_error{0};
    uint8_t scsi_status{0};
    uint16_t host_status{0};
    uint16_t driver_status{0};
    std::vector<uint8_t> sense;
    uint32_t bytes_transferred{0};
  };

  virtual bool OpenNative(const std::string& identity,
                          NativeDevice& device,
                          int& os_error)
      = 0;
  virtual void CloseNative(NativeDevice device) = 0;
  virtual void Issue(NativeDevice device,
                     const CommandDescriptor& cmd,
                     std::vector<uint8_t>& data,
                     NativeCompletion& completion)
      = 0;

  /* close every handle, platform destructors call this */
  void CloseAll();

 private:
  void Release(DeviceHandle& handle);

  synchronized<std::vector<std::shared_ptr<DeviceHandle>>> handles_;
};

std::unique_ptr<ScsiTransport> CreatePlatformTransport();

#endif  // TAPECTL_LIB_SCSI_LLI_H_
