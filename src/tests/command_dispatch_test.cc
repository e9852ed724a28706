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
#include "tape/command_dispatch.h"
#include "tape/tape_commands.h"
#include "tests/scripted_transport.h"

#include <vector>

using namespace tapectl;
using std::chrono::milliseconds;

class CommandDispatchTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    handle = transport.Open("/dev/nst0");
    ASSERT_NE(handle, nullptr);
  }

  CommandResult Execute(const RetryPolicy& policy)
  {
    return dispatcher.Execute(
        handle.get(), [] { return BuildTestUnitReady(); }, policy);
  }

  ScriptedTransport transport;
  std::vector<milliseconds> delays;
  CommandDispatcher dispatcher{
      transport, [this](milliseconds delay) { delays.push_back(delay); }};
  std::shared_ptr<DeviceHandle> handle;
};

TEST_F(CommandDispatchTest, success_needs_one_attempt)
{
  CommandResult result = Execute(RetryPolicy());

  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.attempts, 1);
  EXPECT_TRUE(delays.empty());
  EXPECT_EQ(dispatcher.LastRetryState().last_fault, FaultClass::kNone);
}

TEST_F(CommandDispatchTest, transient_fault_retries_up_to_the_ceiling)
{
  RetryPolicy policy;
  policy.max_attempts = 5;
  policy.base_delay = milliseconds(100);
  policy.max_delay = milliseconds(300);

  for (int i = 0; i < 10; i++) {
    transport.Push(CheckCondition(SENSE_KEY_UNIT_ATTENTION, 0x28, 0));
  }

  CommandResult result = Execute(policy);

  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.attempts, 5);
  EXPECT_EQ(transport.Issued().size(), 5u);
  ASSERT_EQ(delays.size(), 4u);
  for (std::size_t i = 1; i < delays.size(); i++) {
    EXPECT_GE(delays[i], delays[i - 1]);
  }
  EXPECT_EQ(delays.front(), milliseconds(100));
  EXPECT_EQ(delays.back(), milliseconds(300));
  EXPECT_EQ(dispatcher.LastRetryState().total_backoff, milliseconds(900));
  EXPECT_EQ(dispatcher.LastRetryState().last_fault, FaultClass::kTransient);
}

TEST_F(CommandDispatchTest, transient_fault_that_clears_succeeds)
{
  transport.Push(CheckCondition(SENSE_KEY_NOT_READY, 0x04, 0x01));
  ScriptedReply busy;
  busy.scsi_status = SCSI_STATUS_BUSY;
  transport.Push(busy);

  CommandResult result = Execute(RetryPolicy());

  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.attempts, 3);
  EXPECT_EQ(delays.size(), 2u);
}

TEST_F(CommandDispatchTest, permanent_fault_is_not_retried)
{
  transport.Push(CheckCondition(SENSE_KEY_ILLEGAL_REQUEST, 0x24, 0));

  CommandResult result = Execute(RetryPolicy());

  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.attempts, 1);
  EXPECT_TRUE(delays.empty());
  EXPECT_EQ(dispatcher.LastRetryState().last_fault, FaultClass::kPermanent);
}

TEST_F(CommandDispatchTest, medium_not_present_is_permanent)
{
  transport.Push(CheckCondition(SENSE_KEY_NOT_READY,
                                SENSE_ASC_MEDIUM_NOT_PRESENT, 0));

  EXPECT_EQ(Execute(RetryPolicy()).attempts, 1);
  EXPECT_EQ(dispatcher.LastRetryState().last_fault, FaultClass::kPermanent);
}

TEST_F(CommandDispatchTest, unknown_fault_is_not_retried)
{
  ScriptedReply odd;
  odd.scsi_status = SCSI_STATUS_ACA_ACTIVE;
  transport.Push(odd);

  EXPECT_EQ(Execute(RetryPolicy()).attempts, 1);
  EXPECT_EQ(dispatcher.LastRetryState().last_fault, FaultClass::kUnknown);
}

TEST_F(CommandDispatchTest, invalidated_device_is_not_retried)
{
  transport.InvalidateDevice("/dev/nst0");

  CommandResult result = Execute(RetryPolicy());

  EXPECT_EQ(result.transport_error, TransportError::kDeviceUnavailable);
  EXPECT_EQ(result.attempts, 1);
  EXPECT_TRUE(transport.Issued().empty());
  EXPECT_EQ(dispatcher.LastRetryState().last_fault,
            FaultClass::kDeviceUnavailable);
}

TEST_F(CommandDispatchTest, busy_host_adapter_is_transient)
{
  ScriptedReply fault;
  fault.issued = false;
  fault.os_error = EBUSY;
  transport.Push(fault);

  EXPECT_TRUE(Execute(RetryPolicy()).ok());
  EXPECT_EQ(dispatcher.LastRetryState().attempt, 2);
}

TEST_F(CommandDispatchTest, each_attempt_gets_a_fresh_descriptor)
{
  int built = 0;
  transport.Push(CheckCondition(SENSE_KEY_UNIT_ATTENTION, 0x29, 0));

  dispatcher.Execute(
      handle.get(),
      [&built] {
        built++;
        return BuildTestUnitReady();
      },
      RetryPolicy());

  EXPECT_EQ(built, 2);
}

TEST(retry_policy, backoff_doubles_and_is_capped)
{
  RetryPolicy policy;

  EXPECT_EQ(BackoffDelay(policy, 1), milliseconds(1000));
  EXPECT_EQ(BackoffDelay(policy, 2), milliseconds(2000));
  EXPECT_EQ(BackoffDelay(policy, 3), milliseconds(4000));
  EXPECT_EQ(BackoffDelay(policy, 4), milliseconds(8000));
  EXPECT_EQ(BackoffDelay(policy, 10), milliseconds(8000));
  EXPECT_EQ(BackoffDelay(policy, 0), milliseconds(0));
}

TEST(retry_policy, classification)
{
  CommandResult result;
  EXPECT_EQ(ClassifyResult(result), FaultClass::kNone);

  result.scsi_status = SCSI_STATUS_RESERVATION_CONFLICT;
  EXPECT_EQ(ClassifyResult(result), FaultClass::kPermanent);

  result.scsi_status = SCSI_STATUS_TASK_SET_FULL;
  EXPECT_EQ(ClassifyResult(result), FaultClass::kTransient);

  result.transport_error = TransportError::kTransportFault;
  result.os_error = EIO;
  EXPECT_EQ(ClassifyResult(result), FaultClass::kUnknown);
}
