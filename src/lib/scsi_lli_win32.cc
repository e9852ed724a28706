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
 * Low level SCSI interface for Windows, using SCSI pass through direct
 * (SPTI) on \\.\TapeN.
 */

#include "include/tapectl.h"
#include "lib/berrno.h"
#include "lib/scsi_lli.h"

#include <ntddscsi.h>

#include <cstddef>
#include <memory>

static constexpr int debuglevel{200};

namespace {

struct ScsiPassThroughWithSense {
  SCSI_PASS_THROUGH_DIRECT sptd;
  ULONG filler; /* align the sense buffer */
  UCHAR sense[SCSI_SENSE_BUFFER_SIZE];
};

std::wstring WidePath(const std::string& identity)
{
  std::string path = identity;
  if (path.rfind("\\\\.\\", 0) != 0) { path = "\\\\.\\" + path; }

  int len = MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, nullptr, 0);
  std::wstring wide(len > 0 ? len - 1 : 0, L'\0');
  if (len > 1) {
    MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, wide.data(), len);
  }
  return wide;
}

}  // namespace

class Win32SptiTransport : public ScsiTransport {
 public:
  ~Win32SptiTransport() override { CloseAll(); }

  const char* name() const override { return "SPTI"; }

 protected:
  bool OpenNative(const std::string& identity,
                  NativeDevice& device,
                  int& os_error) override
  {
    HANDLE h = CreateFileW(WidePath(identity).c_str(),
                           GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                           OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE) {
      os_error = b_errno_win32;
      Dmsg2(debuglevel, "CreateFile %s failed: %lu\n", identity.c_str(),
            static_cast<unsigned long>(GetLastError()));
      return false;
    }
    device = h;
    return true;
  }

  void CloseNative(NativeDevice device) override { CloseHandle(device); }

  void Issue(NativeDevice device,
             const CommandDescriptor& cmd,
             std::vector<uint8_t>& data,
             NativeCompletion& completion) override
  {
    ScsiPassThroughWithSense spt{};
    std::vector<uint8_t> out_payload;

    spt.sptd.Length = sizeof(SCSI_PASS_THROUGH_DIRECT);
    spt.sptd.CdbLength = static_cast<UCHAR>(
        cmd.cdb.size() > sizeof(spt.sptd.Cdb) ? sizeof(spt.sptd.Cdb)
                                              : cmd.cdb.size());
    memcpy(spt.sptd.Cdb, cmd.cdb.data(), spt.sptd.CdbLength);
    spt.sptd.SenseInfoLength = sizeof(spt.sense);
    spt.sptd.SenseInfoOffset = offsetof(ScsiPassThroughWithSense, sense);

    /* the port driver wants seconds */
    spt.sptd.TimeOutValue = static_cast<ULONG>(cmd.timeout.count());

    switch (cmd.direction) {
      case DataDirection::kIn:
        spt.sptd.DataIn = SCSI_IOCTL_DATA_IN;
        spt.sptd.DataBuffer = data.data();
        spt.sptd.DataTransferLength = static_cast<ULONG>(data.size());
        break;
      case DataDirection::kOut:
        out_payload = cmd.payload;
        spt.sptd.DataIn = SCSI_IOCTL_DATA_OUT;
        spt.sptd.DataBuffer = out_payload.data();
        spt.sptd.DataTransferLength = static_cast<ULONG>(out_payload.size());
        break;
      default:
        spt.sptd.DataIn = SCSI_IOCTL_DATA_UNSPECIFIED;
        break;
    }

    DWORD returned = 0;
    if (!DeviceIoControl(device, IOCTL_SCSI_PASS_THROUGH_DIRECT, &spt,
                         sizeof(spt), &spt, sizeof(spt), &returned, nullptr)) {
      DWORD error = GetLastError();
      completion.issued = false;
      completion.os_error
          = (error == ERROR_BUSY) ? EBUSY : static_cast<int>(b_errno_win32);
      Dmsg1(debuglevel, "DeviceIoControl failed: %lu\n",
            static_cast<unsigned long>(error));
      return;
    }

    completion.issued = true;
    completion.scsi_status = spt.sptd.ScsiStatus;
    completion.bytes_transferred = spt.sptd.DataTransferLength;
    if (spt.sptd.ScsiStatus != 0 && spt.sptd.SenseInfoLength > 0) {
      completion.sense.assign(spt.sense,
                              spt.sense + spt.sptd.SenseInfoLength);
    }
  }
};

std::unique_ptr<ScsiTransport> CreatePlatformTransport()
{
  return std::make_unique<Win32SptiTransport>();
}
