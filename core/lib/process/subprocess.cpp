// hammer/process/subprocess.cpp - fork/exec with stdin/stdout pipes
//
#include "hammer/process/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <string_view>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace hammer
{
namespace
{

using Clock = std::chrono::steady_clock;

[[noreturn]] void throw_errno(const std::string & what)
{
  throw std::system_error(errno, std::generic_category(), what);
}

/// Owns one pipe end.
class Fd
{
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  Fd(const Fd &) = delete;
  Fd & operator=(const Fd &) = delete;
  Fd(Fd && other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  Fd & operator=(Fd && other) noexcept
  {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }
  ~Fd() { reset(); }

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

  void reset() noexcept
  {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

struct Pipe
{
  Fd read;
  Fd write;
};

// O_CLOEXEC so that children spawned concurrently by other threads never
// inherit our ends (a leaked stdin write end would keep a check waiting for EOF)
Pipe make_pipe()
{
  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw_errno("pipe");
  }
  return Pipe{Fd(fds[0]), Fd(fds[1])};
}

/**
 * Blocks SIGPIPE for the calling thread while writing to a child that may
 * have stopped reading; a pending SIGPIPE is consumed on destruction.
 */
class SigpipeGuard
{
public:
  SigpipeGuard()
  {
    sigemptyset(&set_);
    sigaddset(&set_, SIGPIPE);
    ::pthread_sigmask(SIG_BLOCK, &set_, &old_);
  }

  ~SigpipeGuard()
  {
    const timespec zero{0, 0};
    while (::sigtimedwait(&set_, nullptr, &zero) > 0) {
    }
    ::pthread_sigmask(SIG_SETMASK, &old_, nullptr);
  }

  SigpipeGuard(const SigpipeGuard &) = delete;
  SigpipeGuard & operator=(const SigpipeGuard &) = delete;

private:
  sigset_t set_{};
  sigset_t old_{};
};

int remaining_ms(std::optional<Clock::time_point> deadline)
{
  if (!deadline) {
    return -1;
  }
  const auto left =
    std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

void fill_status(ProcessResult & result, int status)
{
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
}

void kill_and_reap(pid_t pid)
{
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

const char * signal_name(int sig) noexcept
{
  switch (sig) {
    case SIGHUP:
      return "SIGHUP";
    case SIGINT:
      return "SIGINT";
    case SIGQUIT:
      return "SIGQUIT";
    case SIGILL:
      return "SIGILL";
    case SIGABRT:
      return "SIGABRT";
    case SIGBUS:
      return "SIGBUS";
    case SIGFPE:
      return "SIGFPE";
    case SIGKILL:
      return "SIGKILL";
    case SIGSEGV:
      return "SIGSEGV";
    case SIGPIPE:
      return "SIGPIPE";
    case SIGALRM:
      return "SIGALRM";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "unknown signal";
  }
}

}  // namespace

std::string ProcessResult::describe_failure() const
{
  if (timed_out) {
    return "timed out";
  }
  if (term_signal != 0) {
    return "was killed by signal " + std::to_string(term_signal) + " (" +
           signal_name(term_signal) + ")";
  }
  return "exited with status " + std::to_string(exit_code);
}

ProcessResult run_process(const ProcessOptions & options)
{
  if (options.argv.empty()) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument), "empty argv");
  }

  Pipe in_pipe = make_pipe();    // parent writes to child's stdin
  Pipe out_pipe = make_pipe();   // parent reads from child's stdout
  Pipe exec_pipe = make_pipe();  // child reports exec failure

  // Everything the child touches is prepared before fork
  std::vector<char *> argv;
  argv.reserve(options.argv.size() + 1);
  for (const auto & arg : options.argv) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  sigset_t empty_mask;
  sigemptyset(&empty_mask);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw_errno("fork");
  }

  if (pid == 0) {
    // child
    ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
    ::dup2(in_pipe.read.get(), STDIN_FILENO);
    ::dup2(out_pipe.write.get(), STDOUT_FILENO);

    ::execv(argv[0], argv.data());

    const int err = errno;
    (void)!::write(exec_pipe.write.get(), &err, sizeof(err));
    _exit(127);
  }

  // parent
  in_pipe.read.reset();
  out_pipe.write.reset();
  exec_pipe.write.reset();

  {
    int child_errno = 0;
    ssize_t n = 0;
    do {
      n = ::read(exec_pipe.read.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
      int status = 0;
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      throw std::system_error(child_errno, std::generic_category(), "exec " + options.argv[0]);
    }
  }

  if (::fcntl(in_pipe.write.get(), F_SETFL, O_NONBLOCK) != 0) {
    const int err = errno;
    kill_and_reap(pid);
    throw std::system_error(err, std::generic_category(), "fcntl");
  }

  std::optional<Clock::time_point> deadline;
  if (options.timeout.count() > 0) {
    deadline = Clock::now() + options.timeout;
  }

  ProcessResult result;
  SigpipeGuard sigpipe_guard;

  std::string_view pending(options.input);
  if (pending.empty()) {
    in_pipe.write.reset();
  }

  char buffer[8192];
  while (out_pipe.read.valid()) {
    struct pollfd fds[2];
    nfds_t nfds = 0;
    fds[nfds++] = {out_pipe.read.get(), POLLIN, 0};
    if (in_pipe.write.valid()) {
      fds[nfds++] = {in_pipe.write.get(), POLLOUT, 0};
    }

    const int pr = ::poll(fds, nfds, remaining_ms(deadline));
    if (pr < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      kill_and_reap(pid);
      throw std::system_error(err, std::generic_category(), "poll");
    }
    if (pr == 0) {
      kill_and_reap(pid);
      result.timed_out = true;
      return result;
    }

    if (nfds > 1 && fds[1].revents != 0) {
      if ((fds[1].revents & (POLLERR | POLLHUP)) != 0) {
        // child closed its stdin; the rest of the payload is dropped
        in_pipe.write.reset();
      } else {
        const ssize_t w = ::write(in_pipe.write.get(), pending.data(), pending.size());
        if (w < 0) {
          if (errno == EPIPE) {
            in_pipe.write.reset();
          } else if (errno != EINTR && errno != EAGAIN) {
            const int err = errno;
            kill_and_reap(pid);
            throw std::system_error(err, std::generic_category(), "write");
          }
        } else {
          pending.remove_prefix(static_cast<size_t>(w));
          if (pending.empty()) {
            in_pipe.write.reset();
          }
        }
      }
    }

    if (fds[0].revents != 0) {
      const ssize_t r = ::read(out_pipe.read.get(), buffer, sizeof(buffer));
      if (r < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        const int err = errno;
        kill_and_reap(pid);
        throw std::system_error(err, std::generic_category(), "read");
      }
      if (r == 0) {
        out_pipe.read.reset();
      } else {
        result.output.append(buffer, static_cast<size_t>(r));
      }
    }
  }
  in_pipe.write.reset();

  // stdout is closed; the child may still be running
  int status = 0;
  for (;;) {
    const pid_t r = ::waitpid(pid, &status, deadline ? WNOHANG : 0);
    if (r == pid) {
      break;
    }
    if (r < 0) {
      if (errno == EINTR) continue;
      throw_errno("waitpid");
    }
    if (remaining_ms(deadline) == 0) {
      kill_and_reap(pid);
      result.timed_out = true;
      return result;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  fill_status(result, status);
  return result;
}

std::optional<fs::path> find_executable(
  const std::string & name, const std::vector<fs::path> & search_dirs)
{
  const auto is_executable = [](const fs::path & p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
  };

  if (name.empty()) {
    return std::nullopt;
  }

  if (name.find('/') != std::string::npos) {
    if (is_executable(name)) {
      return fs::absolute(name);
    }
    return std::nullopt;
  }

  for (const auto & dir : search_dirs) {
    const fs::path candidate = dir / name;
    if (is_executable(candidate)) {
      return candidate;
    }
  }

  const char * path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return std::nullopt;
  }

  std::string_view path_list(path_env);
  while (!path_list.empty()) {
    const auto sep = path_list.find(':');
    const std::string_view dir = path_list.substr(0, sep);
    // an empty PATH entry means the current directory
    const fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(std::string(dir))) / name;
    if (is_executable(candidate)) {
      return candidate;
    }
    if (sep == std::string_view::npos) {
      break;
    }
    path_list.remove_prefix(sep + 1);
  }

  return std::nullopt;
}

}  // namespace hammer
