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

#ifndef TAPECTL_LIB_MESSAGE_SEVERITY_H_
#define TAPECTL_LIB_MESSAGE_SEVERITY_H_

#undef M_DEBUG
#undef M_ABORT
#undef M_FATAL
#undef M_ERROR
#undef M_WARNING
#undef M_INFO
#undef M_ALERT

/**
 * M_ABORT    unrecoverable internal error, the program terminates
 * M_DEBUG    debug messages
 * M_FATAL    an operation failed and cannot be continued
 * M_ERROR    an operation failed
 * M_WARNING  an auxiliary step failed, the operation itself is fine
 * M_INFO     informational message
 * M_ALERT    critical drive or media condition (TapeAlert, lost device)
 *
 * M_FATAL and M_ALERT are what the notification channel gets to see.
 */
enum
{
  M_ABORT = 1,
  M_DEBUG,
  M_FATAL,
  M_ERROR,
  M_WARNING,
  M_INFO,
  M_ALERT
};

#endif  // TAPECTL_LIB_MESSAGE_SEVERITY_H_
