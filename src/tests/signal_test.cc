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
#include "lib/signal.h"

#include <csignal>
#include <thread>

using namespace std::chrono_literals;

TEST(signal, wait_returns_false_without_signal)
{
  InitTerminationSignals();
  ClearTerminationRequest();

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(WaitForTermination(150ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
  EXPECT_EQ(TerminationSignal(), 0);
}

TEST(signal, terminate_ends_an_unbounded_wait)
{
  InitTerminationSignals();
  ClearTerminationRequest();

  std::thread sender([] {
    std::this_thread::sleep_for(200ms);
    std::raise(SIGTERM);
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(WaitForTermination(std::chrono::milliseconds(-1)));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  sender.join();

  EXPECT_TRUE(TerminationRequested());
  EXPECT_EQ(TerminationSignal(), SIGTERM);
  ClearTerminationRequest();
}

TEST(signal, interrupt_is_recorded)
{
  InitTerminationSignals();
  ClearTerminationRequest();

  std::raise(SIGINT);

  EXPECT_TRUE(WaitForTermination(0ms));
  EXPECT_EQ(TerminationSignal(), SIGINT);
  ClearTerminationRequest();
  EXPECT_FALSE(TerminationRequested());
}
