#ifndef _WIN32

#include "h5gate/process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

namespace h5gate {

namespace {

void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  if (limit == 0) {
    dst.append(src, static_cast<std::size_t>(n));
    return;
  }
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Drains a non-blocking fd. Returns false once EOF or a hard error is seen.
bool drain(int fd, std::string &dst, std::size_t limit, bool &truncated) {
  char buf[65536];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append_limited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

// Restores the previous SIGPIPE disposition on scope exit. A child that exits
// without reading its stdin must surface as EPIPE, not kill the harness.
class SigpipeGuard {
public:
  SigpipeGuard() {
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &previous_);
  }
  ~SigpipeGuard() { sigaction(SIGPIPE, &previous_, nullptr); }
  SigpipeGuard(const SigpipeGuard &) = delete;
  SigpipeGuard &operator=(const SigpipeGuard &) = delete;

private:
  struct sigaction previous_ {};
};

} // namespace

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;
  const auto started = std::chrono::steady_clock::now();
  SigpipeGuard sigpipe_guard;

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    for (int *p : {in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return result;
  }

  // Build argv before fork so the child does not allocate.
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);
  const bool path_lookup = spec.command.find('/') == std::string::npos;

  pid_t pid = fork();
  if (pid < 0) {
    result.error_message = std::string("spawn_failed: fork: ") + std::strerror(errno);
    for (int *p : {in_pipe, out_pipe, err_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(in_pipe[0]);
    close(in_pipe[1]);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    if (!spec.cwd.empty()) {
      if (chdir(spec.cwd.c_str()) != 0)
        _exit(127);
    }
    if (path_lookup)
      execvp(spec.command.c_str(), argv.data());
    else
      execv(spec.command.c_str(), argv.data());
    _exit(127);
  }

  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  int in_fd = in_pipe[1];
  int out_fd = out_pipe[0];
  int err_fd = err_pipe[0];
  fcntl(in_fd, F_SETFL, O_NONBLOCK);
  fcntl(out_fd, F_SETFL, O_NONBLOCK);
  fcntl(err_fd, F_SETFL, O_NONBLOCK);

  std::size_t written = 0;
  if (spec.stdin_text.empty())
    close_fd(in_fd);

  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  int status = 0;
  bool reaped = false;

  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      if (!reaped)
        waitpid(pid, &status, 0);
      reaped = true;
      result.timed_out = true;
      break;
    }

    if (out_fd < 0 && err_fd < 0) {
      // Output closed; wait for exit without spinning past the deadline.
      pid_t w = waitpid(pid, &status, WNOHANG);
      if (w == pid) {
        reaped = true;
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      continue;
    }

    pollfd fds[3];
    nfds_t nfds = 0;
    int in_slot = -1, out_slot = -1, err_slot = -1;
    if (in_fd >= 0) {
      in_slot = static_cast<int>(nfds);
      fds[nfds++] = pollfd{in_fd, POLLOUT, 0};
    }
    if (out_fd >= 0) {
      out_slot = static_cast<int>(nfds);
      fds[nfds++] = pollfd{out_fd, POLLIN, 0};
    }
    if (err_fd >= 0) {
      err_slot = static_cast<int>(nfds);
      fds[nfds++] = pollfd{err_fd, POLLIN, 0};
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    const int wait_ms = static_cast<int>(std::min<long long>(remaining, 50));
    const int ready = poll(fds, nfds, wait_ms);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      result.error_message = std::string("poll: ") + std::strerror(errno);
      kill(-pid, SIGKILL);
      waitpid(pid, &status, 0);
      reaped = true;
      break;
    }

    if (in_slot >= 0 && (fds[in_slot].revents & (POLLOUT | POLLERR | POLLHUP))) {
      while (written < spec.stdin_text.size()) {
        const ssize_t n = write(in_fd, spec.stdin_text.data() + written,
                                spec.stdin_text.size() - written);
        if (n > 0) {
          written += static_cast<std::size_t>(n);
          continue;
        }
        if (n < 0 && errno == EINTR)
          continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
          break;
        // EPIPE: the child stopped reading; its exit status decides the rest.
        written = spec.stdin_text.size();
      }
      if (written >= spec.stdin_text.size())
        close_fd(in_fd);
    }
    if (out_slot >= 0 && (fds[out_slot].revents & (POLLIN | POLLHUP | POLLERR))) {
      if (!drain(out_fd, result.stdout_text, spec.max_output_bytes,
                 result.stdout_truncated))
        close_fd(out_fd);
    }
    if (err_slot >= 0 && (fds[err_slot].revents & (POLLIN | POLLHUP | POLLERR))) {
      if (!drain(err_fd, result.stderr_text, spec.max_output_bytes,
                 result.stderr_truncated))
        close_fd(err_fd);
    }
  }

  close_fd(in_fd);
  close_fd(out_fd);
  close_fd(err_fd);

  result.duration_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now() - started)
          .count());

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace h5gate

#endif
