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
 * Run an external program on Windows. The pipes are polled with
 * PeekNamedPipe, so a child that keeps them open never blocks us.
 */

#include "include/tapectl.h"
#include "lib/berrno.h"
#include "lib/child_timer.h"
#include "lib/run_program.h"

#include <fmt/format.h>

#include <algorithm>
#include <thread>

static constexpr int debuglevel{150};

static std::wstring FromUtf8(const std::string& utf8)
{
  if (utf8.empty()) { return std::wstring(); }
  int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(),
                                static_cast<int>(utf8.size()), nullptr, 0);
  std::wstring wide(len, L'\0');
  MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                      wide.data(), len);
  return wide;
}

/* Quoting as understood by CommandLineToArgvW and the MS C runtime */
static std::string QuoteArgument(const std::string& arg)
{
  if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
    return arg;
  }

  std::string quoted = "\"";
  std::size_t backslashes = 0;
  for (char c : arg) {
    if (c == '\\') {
      backslashes++;
      continue;
    }
    if (c == '"') {
      quoted.append(backslashes * 2 + 1, '\\');
    } else {
      quoted.append(backslashes, '\\');
    }
    backslashes = 0;
    quoted += c;
  }
  quoted.append(backslashes * 2, '\\');
  quoted += '"';
  return quoted;
}

static void CloseIfValid(HANDLE& h)
{
  if (h != INVALID_HANDLE_VALUE && h != nullptr) {
    CloseHandle(h);
    h = INVALID_HANDLE_VALUE;
  }
}

/* Read what is available without blocking, false once the pipe is closed */
static bool DrainPipe(HANDLE pipe, std::string& sink)
{
  char buf[4096];

  while (true) {
    DWORD available = 0;
    if (!PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr)) {
      return false;
    }
    if (available == 0) { return true; }

    DWORD len = 0;
    DWORD want = available < sizeof(buf) ? available : sizeof(buf);
    if (!ReadFile(pipe, buf, want, &len, nullptr) || len == 0) {
      return false;
    }
    sink.append(buf, len);
  }
}

ProgramResult RunProgram(const std::string& program,
                         const std::vector<std::string>& arguments,
                         const std::string& working_directory,
                         std::chrono::milliseconds timeout,
                         std::chrono::milliseconds kill_grace)
{
  using namespace std::chrono;

  ProgramResult result;
  result.program = program;
  result.arguments = arguments;
  result.working_directory = working_directory;
  result.start_time = system_clock::now();

  const auto start = steady_clock::now();
  result.deadline = start + timeout;
  const auto hard_deadline = result.deadline + 2 * kill_grace;

  std::string cmdline = QuoteArgument(program);
  for (const auto& arg : arguments) { cmdline += " " + QuoteArgument(arg); }

  Dmsg2(debuglevel, "Run program: %s (wd=%s)\n", cmdline.c_str(),
        working_directory.c_str());

  SECURITY_ATTRIBUTES sa_attr{};
  sa_attr.nLength = sizeof(SECURITY_ATTRIBUTES);
  sa_attr.bInheritHandle = TRUE;
  sa_attr.lpSecurityDescriptor = nullptr;

  HANDLE out_rd = INVALID_HANDLE_VALUE, out_wr = INVALID_HANDLE_VALUE;
  HANDLE err_rd = INVALID_HANDLE_VALUE, err_wr = INVALID_HANDLE_VALUE;
  HANDLE null_in = INVALID_HANDLE_VALUE;

  if (!CreatePipe(&out_rd, &out_wr, &sa_attr, 0)
      || !CreatePipe(&err_rd, &err_wr, &sa_attr, 0)) {
    BErrNo be(b_errno_win32);
    result.exit_code = -1;
    result.std_err = fmt::format("Cannot create pipe: {}\n", be.bstrerror());
    CloseIfValid(out_rd);
    CloseIfValid(out_wr);
    CloseIfValid(err_rd);
    CloseIfValid(err_wr);
    return result;
  }

  /* our ends are not inherited */
  SetHandleInformation(out_rd, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(err_rd, HANDLE_FLAG_INHERIT, 0);

  null_in = CreateFileW(L"NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                        &sa_attr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL,
                        nullptr);

  STARTUPINFOW si{};
  si.cb = sizeof(si);
  si.dwFlags = STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
  si.wShowWindow = SW_HIDE;
  si.hStdInput = null_in;
  si.hStdOutput = out_wr;
  si.hStdError = err_wr;

  PROCESS_INFORMATION pi{};
  std::wstring wcmdline = FromUtf8(cmdline);
  std::wstring wdir = FromUtf8(working_directory);

  BOOL created = CreateProcessW(
      nullptr, wcmdline.data(), nullptr, nullptr, TRUE,
      CREATE_NO_WINDOW | CREATE_NEW_PROCESS_GROUP, nullptr,
      working_directory.empty() ? nullptr : wdir.c_str(), &si, &pi);

  CloseIfValid(out_wr);
  CloseIfValid(err_wr);
  CloseIfValid(null_in);

  if (!created) {
    BErrNo be(b_errno_win32);
    DWORD error = GetLastError();
    result.exit_code = (error == ERROR_DIRECTORY) ? 126 : 127;
    result.std_err = fmt::format("Cannot execute {}: {}\n", program,
                                 be.bstrerror());
    CloseIfValid(out_rd);
    CloseIfValid(err_rd);
    return result;
  }
  CloseHandle(pi.hThread);
  result.pid = pi.dwProcessId;

  ChildTimer* timer = StartChildTimer(pi.hProcess, timeout, kill_grace);
  if (!timer) {
    TerminateChild(pi.hProcess, true);
    WaitForSingleObject(pi.hProcess, 1000);
    CloseHandle(pi.hProcess);
    CloseIfValid(out_rd);
    CloseIfValid(err_rd);
    result.exit_code = -1;
    result.std_err = "Cannot start child timer\n";
    return result;
  }

  bool out_open = true, err_open = true, exited = false;
  steady_clock::time_point drain_deadline = hard_deadline;

  while (out_open || err_open) {
    auto now = steady_clock::now();
    if (now >= hard_deadline || now >= drain_deadline) { break; }

    if (out_open) { out_open = DrainPipe(out_rd, result.std_out); }
    if (err_open) { err_open = DrainPipe(err_rd, result.std_err); }

    if (!exited && WaitForSingleObject(pi.hProcess, 0) == WAIT_OBJECT_0) {
      exited = true;
      drain_deadline = std::min(hard_deadline,
                                steady_clock::now() + milliseconds(500));
    }
    std::this_thread::sleep_for(milliseconds(10));
  }
  CloseIfValid(out_rd);
  CloseIfValid(err_rd);

  if (!exited) {
    auto now = steady_clock::now();
    DWORD wait_ms = now < hard_deadline
                        ? static_cast<DWORD>(
                            duration_cast<milliseconds>(hard_deadline - now)
                                .count())
                        : 0;
    exited = WaitForSingleObject(pi.hProcess, wait_ms) == WAIT_OBJECT_0;
  }

  bool killed = timer->killed;
  StopChildTimer(timer);

  DWORD exit_code = 0;
  if (!exited) {
    TerminateChild(pi.hProcess, true);
    killed = true;
  } else if (!GetExitCodeProcess(pi.hProcess, &exit_code)) {
    exit_code = static_cast<DWORD>(-1);
  }
  CloseHandle(pi.hProcess);

  result.elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

  if (killed) {
    result.timed_out = true;
    Dmsg2(debuglevel, "Program %s killed after %lld ms (timeout)\n",
          program.c_str(), static_cast<long long>(result.elapsed.count()));
  } else {
    result.exit_code = static_cast<int>(exit_code);
  }

  return result;
}
