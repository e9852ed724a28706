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
 * Low level SCSI interface for Linux, using the SG_IO ioctl on the
 * st/nst or sg device node.
 */

#include "include/tapectl.h"
#include "lib/scsi_lli.h"

#include <fcntl.h>
#include <scsi/sg.h>
#include <sys/ioctl.h>

#include <climits>
#include <memory>

static constexpr int debuglevel{200};

class LinuxSgTransport : public ScsiTransport {
 public:
  ~LinuxSgTransport() override { CloseAll(); }

  const char* name() const override { return "SG_IO"; }

 protected:
  bool OpenNative(const std::string& identity,
                  NativeDevice& device,
                  int& os_error) override
  {
    /* O_NONBLOCK, an empty drive must open too */
    int fd = open(identity.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
      os_error = errno;
      return false;
    }

    int version = 0;
    if (ioctl(fd, SG_GET_VERSION_NUM, &version) == 0) {
      Dmsg2(debuglevel, "%s: sg driver version %d\n", identity.c_str(),
            version);
    }

    device = fd;
    return true;
  }

  void CloseNative(NativeDevice device) override { close(device); }

  void Issue(NativeDevice device,
             const CommandDescriptor& cmd,
             std::vector<uint8_t>& data,
             NativeCompletion& completion) override
  {
    unsigned char sense[SCSI_SENSE_BUFFER_SIZE] = {};
    std::vector<uint8_t> cdb(cmd.cdb);
    sg_io_hdr_t io_hdr{};

    io_hdr.interface_id = 'S';
    io_hdr.cmdp = cdb.data();
    io_hdr.cmd_len = static_cast<unsigned char>(cdb.size());
    io_hdr.sbp = sense;
    io_hdr.mx_sb_len = sizeof(sense);

    /* the kernel wants milliseconds */
    auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          cmd.timeout)
                          .count();
    io_hdr.timeout = timeout_ms > UINT_MAX ? UINT_MAX
                                           : static_cast<unsigned>(timeout_ms);

    std::vector<uint8_t> out_payload;
    switch (cmd.direction) {
      case DataDirection::kIn:
        io_hdr.dxfer_direction = SG_DXFER_FROM_DEV;
        io_hdr.dxferp = data.data();
        io_hdr.dxfer_len = static_cast<unsigned>(data.size());
        break;
      case DataDirection::kOut:
        out_payload = cmd.payload;
        io_hdr.dxfer_direction = SG_DXFER_TO_DEV;
        io_hdr.dxferp = out_payload.data();
        io_hdr.dxfer_len = static_cast<unsigned>(out_payload.size());
        break;
      default:
        io_hdr.dxfer_direction = SG_DXFER_NONE;
        break;
    }

    if (ioctl(device, SG_IO, &io_hdr) < 0) {
      completion.issued = false;
      completion.os_error = errno;
      return;
    }

    completion.issued = true;
    completion.scsi_status = io_hdr.status;
    completion.host_status = io_hdr.host_status;
    completion.driver_status = io_hdr.driver_status;
    if (io_hdr.sb_len_wr > 0) {
      completion.sense.assign(sense, sense + io_hdr.sb_len_wr);
    }

    int resid = io_hdr.resid < 0 ? 0 : io_hdr.resid;
    completion.bytes_transferred
        = io_hdr.dxfer_len > static_cast<unsigned>(resid)
              ? io_hdr.dxfer_len - static_cast<unsigned>(resid)
              : 0;
  }
};

std::unique_ptr<ScsiTransport> CreatePlatformTransport()
{
  return std::make_unique<LinuxSgTransport>();
}
