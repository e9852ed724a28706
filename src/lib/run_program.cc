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
 * Run an external program. The program is killed if the deadline
 * passes, the timer thread does the killing while this thread
 * collects the output.
 */

#include "include/tapectl.h"
#include "lib/berrno.h"
#include "lib/child_timer.h"
#include "lib/run_program.h"

#include <fmt/format.h>

#include <algorithm>
#include <system_error>
#include <thread>

#ifndef HAVE_WIN32
#  include <fcntl.h>
#  include <poll.h>
#  include <sys/wait.h>
#endif

static constexpr int debuglevel{150};

std::string FormatCommandLine(const std::string& program,
                              const std::vector<std::string>& arguments)
{
  auto quote = [](const std::string& s) {
    if (!s.empty() && s.find_first_of(" \t\"'") == std::string::npos) {
      return s;
    }
    std::string quoted = "\"";
    for (char c : s) {
      if (c == '"' || c == '\\') { quoted += '\\'; }
      quoted += c;
    }
    return quoted + "\"";
  };

  std::string cmdline = quote(program);
  for (const auto& arg : arguments) { cmdline += " " + quote(arg); }
  return cmdline;
}

#ifndef HAVE_WIN32

/* Only async-signal-safe calls, used between fork and exec */
static void ChildError(const char* what, const char* detail)
{
  const char* msg = strerror(errno);
  const char* parts[] = {what, " ", detail, ": ", msg ? msg : "", "\n"};
  for (const char* part : parts) {
    ssize_t ignored = write(STDERR_FILENO, part, strlen(part));
    (void)ignored;
  }
}

static void SetCloseOnExec(int fd)
{
  int flags = fcntl(fd, F_GETFD);
  if (flags >= 0) { fcntl(fd, F_SETFD, flags | FD_CLOEXEC); }
}

static void ClosePipe(int fds[2])
{
  for (int i = 0; i < 2; i++) {
    if (fds[i] >= 0) {
      close(fds[i]);
      fds[i] = -1;
    }
  }
}

static bool ChildHasExited(pid_t pid)
{
  siginfo_t info{};
  while (true) {
    if (waitid(P_PID, static_cast<id_t>(pid), &info,
               WEXITED | WNOHANG | WNOWAIT)
        == 0) {
      return info.si_pid == pid;
    }
    if (errno != EINTR) { return errno == ECHILD; }
  }
}

static void ReapInBackground(pid_t pid)
{
  try {
    std::thread([pid]() {
      int status;
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }).detach();
  } catch (const std::system_error& e) {
    Emsg2(M_WARNING, 0, "Could not start reaper for pid %d: %s\n",
          static_cast<int>(pid), e.what());
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

  std::vector<std::string> argv_storage;
  argv_storage.push_back(program);
  argv_storage.insert(argv_storage.end(), arguments.begin(), arguments.end());
  std::vector<char*> argv;
  for (auto& arg : argv_storage) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);

  Dmsg2(debuglevel, "Run program: %s (wd=%s)\n",
        FormatCommandLine(program, arguments).c_str(),
        working_directory.c_str());

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
    BErrNo be;
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    result.exit_code = -1;
    result.std_err = fmt::format("Cannot create pipe: {}\n", be.bstrerror());
    return result;
  }
  for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
    SetCloseOnExec(fd);
  }

  pid_t pid = fork();
  if (pid < 0) {
    BErrNo be;
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    result.exit_code = -1;
    result.std_err = fmt::format("Cannot fork: {}\n", be.bstrerror());
    return result;
  }

  if (pid == 0) { /* child */
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      if (devnull != STDIN_FILENO) { close(devnull); }
    } else {
      close(STDIN_FILENO);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
      ChildError("Cannot change to directory", working_directory.c_str());
      _exit(126);
    }

    execvp(argv[0], argv.data());
    ChildError("Cannot execute", argv[0]);
    _exit(127);
  }

  /* parent */
  setpgid(pid, pid); /* may race with the child doing the same */
  close(out_pipe[1]);
  out_pipe[1] = -1;
  close(err_pipe[1]);
  err_pipe[1] = -1;
  result.pid = pid;

  ChildTimer* timer = StartChildTimer(pid, timeout, kill_grace);
  if (!timer) {
    TerminateChild(pid, true);
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    result.exit_code = -1;
    result.std_err = "Cannot start child timer\n";
    return result;
  }

  struct pollfd fds[2];
  fds[0] = {out_pipe[0], POLLIN, 0};
  fds[1] = {err_pipe[0], POLLIN, 0};
  std::string* sinks[2] = {&result.std_out, &result.std_err};
  int open_fds = 2;
  bool exited = false;
  steady_clock::time_point drain_deadline = hard_deadline;
  char buf[4096];

  while (open_fds > 0) {
    auto now = steady_clock::now();
    if (now >= hard_deadline || now >= drain_deadline) { break; }

    auto remaining = duration_cast<milliseconds>(
        std::min(hard_deadline, drain_deadline) - now);
    int wait_ms = static_cast<int>(
        std::clamp<milliseconds::rep>(remaining.count(), 1, 200));

    int n = poll(fds, 2, wait_ms);
    if (n < 0 && errno != EINTR) {
      BErrNo be;
      Dmsg1(debuglevel, "poll failed: %s\n", be.bstrerror());
      break;
    }

    for (int i = 0; n > 0 && i < 2; i++) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
        continue;
      }
      ssize_t len = read(fds[i].fd, buf, sizeof(buf));
      if (len > 0) {
        sinks[i]->append(buf, static_cast<std::size_t>(len));
      } else if (len == 0 || (errno != EINTR && errno != EAGAIN)) {
        close(fds[i].fd);
        fds[i].fd = -1;
        open_fds--;
      }
    }

    /* a grandchild may keep the pipes open after the program is gone */
    if (!exited && ChildHasExited(pid)) {
      exited = true;
      drain_deadline = std::min(hard_deadline,
                                steady_clock::now() + milliseconds(500));
    }
  }
  for (auto& fd : fds) {
    if (fd.fd >= 0) { close(fd.fd); }
  }

  while (!exited && steady_clock::now() < hard_deadline) {
    if (ChildHasExited(pid)) {
      exited = true;
      break;
    }
    std::this_thread::sleep_for(milliseconds(10));
  }

  /* the timer must be gone before the pid can be recycled */
  bool killed = timer->killed;
  StopChildTimer(timer);

  int status = 0;
  if (exited) {
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
  } else {
    Dmsg1(debuglevel, "pid %d did not exit in time\n", static_cast<int>(pid));
    TerminateChild(pid, true);
    ReapInBackground(pid);
    killed = true;
  }

  result.elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

  /* trust the killed flag, the program may exit just as the timer fires */
  if (killed) {
    result.timed_out = true;
    Dmsg2(debuglevel, "Program %s killed after %lld ms (timeout)\n",
          program.c_str(), static_cast<long long>(result.elapsed.count()));
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }

  Dmsg2(debuglevel, "Run program returning %d timed_out=%d\n",
        result.exit_code.value_or(-1), result.timed_out);
  return result;
}

#endif  // !HAVE_WIN32
