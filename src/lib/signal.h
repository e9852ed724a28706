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
 * Orderly shutdown on SIGINT and SIGTERM
 */

#ifndef TAPECTL_LIB_SIGNAL_H_
#define TAPECTL_LIB_SIGNAL_H_

#include <chrono>

/*
 * Install handlers for SIGINT and SIGTERM. The handler only records the
 * signal, the program picks it up with TerminationRequested() or
 * WaitForTermination() and shuts down on its own.
 */
void InitTerminationSignals();

bool TerminationRequested();

/* The recorded signal, 0 if none arrived */
int TerminationSignal();

/*
 * Wait until a termination signal arrived or timeout passed. A negative
 * timeout waits for the signal only. Returns TerminationRequested().
 */
bool WaitForTermination(std::chrono::milliseconds timeout);

void ClearTerminationRequest();

#endif  // TAPECTL_LIB_SIGNAL_H_
