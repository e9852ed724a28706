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
#include "lib/scsi_lli.h"
#include "tape/tape_commands.h"
#include "tests/scripted_transport.h"

#include <memory>
#include <thread>

using namespace tapectl;

/*
 * Handle lifecycle rules every transport has to follow. A platform
 * transport opened on the null device cannot execute SCSI commands but
 * must still honour open, close and invalidation.
 */
struct ScriptedTransportTraits {
  static std::unique_ptr<ScsiTransport> Create()
  {
    auto transport = std::make_unique<ScriptedTransport>();
    transport->SetMissing(Missing());
    return transport;
  }
  static std::string Identity() { return "/dev/nst0"; }
  static std::string Missing() { return "/dev/nst9"; }
};

#if !defined(HAVE_WIN32)
struct PlatformTransportTraits {
  static std::unique_ptr<ScsiTransport> Create()
  {
    return CreatePlatformTransport();
  }
  static std::string Identity() { return "/dev/null"; }
  static std::string Missing() { return "/nonexistent/tapectl/nst0"; }
};
#endif

template <typename Traits>
class TransportConformance : public ::testing::Test {
 protected:
  void SetUp() override { transport = Traits::Create(); }
  void TearDown() override { transport.reset(); }

  std::unique_ptr<ScsiTransport> transport;
};

#if !defined(HAVE_WIN32)
using TransportTypes
    = ::testing::Types<ScriptedTransportTraits, PlatformTransportTraits>;
#else
using TransportTypes = ::testing::Types<ScriptedTransportTraits>;
#endif
TYPED_TEST_SUITE(TransportConformance, TransportTypes);

TYPED_TEST(TransportConformance, open_missing_device_fails)
{
  EXPECT_EQ(this->transport->Open(TypeParam::Missing()), nullptr);
}

TYPED_TEST(TransportConformance, open_handle_is_usable)
{
  auto handle = this->transport->Open(TypeParam::Identity());
  ASSERT_NE(handle, nullptr);
  EXPECT_TRUE(handle->IsUsable());
  EXPECT_FALSE(handle->IsInvalidated());
  EXPECT_EQ(handle->identity(), TypeParam::Identity());

  CommandResult result
      = this->transport->Submit(handle.get(), BuildTestUnitReady());
  EXPECT_NE(result.transport_error, TransportError::kDeviceUnavailable);
  EXPECT_EQ(result.command, "TEST UNIT READY");

  this->transport->Close(handle);
}

TYPED_TEST(TransportConformance, closed_handle_is_unavailable)
{
  auto handle = this->transport->Open(TypeParam::Identity());
  ASSERT_NE(handle, nullptr);
  this->transport->Close(handle);

  EXPECT_FALSE(handle->IsUsable());
  CommandResult result
      = this->transport->Submit(handle.get(), BuildTestUnitReady());
  EXPECT_EQ(result.transport_error, TransportError::kDeviceUnavailable);
  EXPECT_FALSE(result.ok());

  // closing twice is harmless
  this->transport->Close(handle);
}

TYPED_TEST(TransportConformance, invalidated_handle_is_unavailable)
{
  auto first = this->transport->Open(TypeParam::Identity());
  auto second = this->transport->Open(TypeParam::Identity());
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);

  EXPECT_EQ(this->transport->InvalidateDevice(TypeParam::Identity()), 2);
  EXPECT_TRUE(first->IsInvalidated());
  EXPECT_TRUE(second->IsInvalidated());

  EXPECT_EQ(this->transport->Submit(first.get(), BuildTestUnitReady())
                .transport_error,
            TransportError::kDeviceUnavailable);
  EXPECT_EQ(this->transport->Submit(second.get(), BuildInquiry())
                .transport_error,
            TransportError::kDeviceUnavailable);

  // a fresh open after invalidation works again
  auto third = this->transport->Open(TypeParam::Identity());
  ASSERT_NE(third, nullptr);
  EXPECT_TRUE(third->IsUsable());
  this->transport->Close(third);
}

TYPED_TEST(TransportConformance, invalidation_only_hits_matching_identity)
{
  auto handle = this->transport->Open(TypeParam::Identity());
  ASSERT_NE(handle, nullptr);

  EXPECT_EQ(this->transport->InvalidateDevice(TypeParam::Missing()), 0);
  EXPECT_TRUE(handle->IsUsable());
  this->transport->Close(handle);
}

TYPED_TEST(TransportConformance, null_handle_is_unavailable)
{
  EXPECT_EQ(
      this->transport->Submit(nullptr, BuildTestUnitReady()).transport_error,
      TransportError::kDeviceUnavailable);
}

TEST(scripted_transport, data_and_status_are_reported)
{
  ScriptedTransport transport;
  auto handle = transport.Open("/dev/nst0");
  ASSERT_NE(handle, nullptr);

  transport.Push(DataReply(std::vector<uint8_t>(40, 0x20)));
  CommandResult result = transport.Submit(handle.get(), BuildInquiry());
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.bytes_transferred, 36u);
  EXPECT_EQ(result.data.size(), 36u);

  transport.Push(CheckCondition(SENSE_KEY_NOT_READY, 0x3a, 0));
  result = transport.Submit(handle.get(), BuildTestUnitReady());
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.scsi_status, SCSI_STATUS_CHECK_CONDITION);
  EXPECT_TRUE(result.sense.valid);
  EXPECT_EQ(result.sense.asc, SENSE_ASC_MEDIUM_NOT_PRESENT);

  transport.Push(CheckCondition(SENSE_KEY_RECOVERED_ERROR, 0, 0));
  EXPECT_TRUE(transport.Submit(handle.get(), BuildTestUnitReady()).ok());

  ScriptedReply fault;
  fault.issued = false;
  fault.os_error = EIO;
  transport.Push(fault);
  result = transport.Submit(handle.get(), BuildTestUnitReady());
  EXPECT_EQ(result.transport_error, TransportError::kTransportFault);
  EXPECT_EQ(result.os_error, EIO);

  transport.Close(handle);
  EXPECT_EQ(transport.OpenDevices(), 0);
}

TEST(scripted_transport, destruction_closes_open_handles)
{
  std::shared_ptr<DeviceHandle> handle;
  {
    ScriptedTransport transport;
    handle = transport.Open("/dev/nst0");
    ASSERT_NE(handle, nullptr);
  }
  EXPECT_FALSE(handle->IsUsable());
}

TEST(scripted_transport, invalidation_during_use_from_other_thread)
{
  ScriptedTransport transport;
  auto handle = transport.Open("/dev/nst0");
  ASSERT_NE(handle, nullptr);

  std::thread invalidator(
      [&transport] { transport.InvalidateDevice("/dev/nst0"); });
  invalidator.join();

  EXPECT_EQ(transport.Submit(handle.get(), BuildTestUnitReady())
                .transport_error,
            TransportError::kDeviceUnavailable);
  EXPECT_EQ(transport.OpenDevices(), 0);
}
