#include "util/Subprocess.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace std::chrono;

namespace rtspmon::util {

namespace {

void close_fd(int& fd) {
  if (fd >= 0) { ::close(fd); fd = -1; }
}

bool is_executable(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return false;
  return ::access(path.c_str(), X_OK) == 0;
}

int decode_wait_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

pid_t wait_blocking(pid_t pid, int& status) {
  pid_t w;
  do { w = ::waitpid(pid, &status, 0); } while (w < 0 && errno == EINTR);
  return w;
}

// Exited (zombie) but not reaped yet. WNOWAIT leaves it for waitpid.
bool leader_exited(pid_t pid) {
  siginfo_t info{};
  if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) < 0)
    return errno == ECHILD;
  return info.si_pid == pid;
}

void append_capped(std::string& dst, const char* buf, std::size_t n, std::size_t cap) {
  if (dst.size() >= cap) return;
  dst.append(buf, std::min(n, cap - dst.size()));
}

} // anonymous namespace

auto process_status_name(ProcessResult::Status s) -> const char* {
  switch (s) {
    case ProcessResult::Status::Completed: return "completed";
    case ProcessResult::Status::TimedOut:  return "timed out";
    case ProcessResult::Status::Cancelled: return "cancelled";
    case ProcessResult::Status::Errored:   break;
  }
  return "errored";
}

auto find_executable(const std::string& name) -> std::string {
  if (name.empty()) return {};
  if (name.find('/') != std::string::npos) return is_executable(name) ? name : std::string();
  const char* path = std::getenv("PATH");
  std::string p = (path && *path) ? path : "/usr/local/bin:/usr/bin:/bin";
  size_t start = 0;
  while (start <= p.size()) {
    size_t end = p.find(':', start);
    std::string dir = p.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (dir.empty()) dir = ".";
    std::string cand = dir + "/" + name;
    if (is_executable(cand)) return cand;
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return {};
}

auto run_process(const std::vector<std::string>& argv, const ProcessOptions& opts,
                 std::stop_token st) -> ProcessResult {
  ProcessResult r;
  const auto t0 = steady_clock::now();
  auto finish = [&]() -> ProcessResult {
    r.elapsed = steady_clock::now() - t0;
    return std::move(r);
  };

  if (argv.empty()) {
    r.error = "empty command line";
    return finish();
  }
  const std::string exe = find_executable(argv[0]);
  if (exe.empty()) {
    r.error = argv[0] + ": executable not found";
    return finish();
  }

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0 ||
      ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
    r.error = std::string("pipe2: ") + std::strerror(errno);
    for (int* p : {out_pipe, err_pipe, exec_pipe}) { close_fd(p[0]); close_fd(p[1]); }
    return finish();
  }
  int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

  // Built before fork: the child must not allocate.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    r.error = std::string("fork: ") + std::strerror(errno);
    for (int* p : {out_pipe, err_pipe, exec_pipe}) { close_fd(p[0]); close_fd(p[1]); }
    close_fd(devnull);
    return finish();
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execv(exe.c_str(), cargv.data());
    int e = errno;
    ssize_t wr = ::write(exec_pipe[1], &e, sizeof(e));
    (void)wr;
    ::_exit(127);
  }

  // Set from both sides so the group exists before either one proceeds.
  ::setpgid(pid, pid);
  r.pid = pid;
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);
  close_fd(devnull);

  // EOF here means exec succeeded (CLOEXEC closed the write end).
  int exec_errno = 0;
  ssize_t n;
  do { n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno)); } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    (void)wait_blocking(pid, status);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    r.error = exe + ": " + std::strerror(exec_errno);
    return finish();
  }

  const auto deadline = t0 + opts.timeout;
  std::optional<steady_clock::time_point> cancel_at;
  std::optional<ProcessResult::Status> abort_status;
  int status = 0;
  bool reaped = false;
  int fds[2] = {out_pipe[0], err_pipe[0]};
  char buf[64 * 1024];

  // One poll/read round over the open pipes. False on a poll failure.
  auto pump = [&](int wait_ms) -> bool {
    pollfd pfds[2];
    int which[2];
    nfds_t count = 0;
    for (int i = 0; i < 2; ++i) {
      if (fds[i] < 0) continue;
      pfds[count] = pollfd{fds[i], POLLIN, 0};
      which[count] = i;
      ++count;
    }
    int pr = ::poll(pfds, count, wait_ms);
    if (pr < 0) {
      if (errno == EINTR) return true;
      r.error = std::string("poll: ") + std::strerror(errno);
      return false;
    }
    for (nfds_t k = 0; k < count; ++k) {
      if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      int i = which[k];
      ssize_t got = ::read(fds[i], buf, sizeof(buf));
      if (got < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        close_fd(fds[i]);
        continue;
      }
      if (got == 0) { close_fd(fds[i]); continue; }
      auto len = static_cast<std::size_t>(got);
      if (i == 0) {
        r.stdout_bytes += len;
        if (!opts.count_stdout_only) append_capped(r.out, buf, len, opts.max_capture);
      } else {
        append_capped(r.err, buf, len, opts.max_capture);
      }
    }
    return true;
  };

  while (true) {
    auto now = steady_clock::now();
    if (!cancel_at && st.stop_requested()) cancel_at = now + opts.cancel_grace;
    if (cancel_at && now >= *cancel_at) { abort_status = ProcessResult::Status::Cancelled; break; }
    if (now >= deadline) { abort_status = ProcessResult::Status::TimedOut; break; }

    if (fds[0] < 0 && fds[1] < 0) {
      pid_t w = ::waitpid(pid, &status, WNOHANG);
      if (w == pid) { reaped = true; break; }
      if (w < 0 && errno != EINTR) {
        // ECHILD: SIGCHLD is ignored and the kernel already reaped it
        r.error = std::string("waitpid: ") + std::strerror(errno);
        abort_status = ProcessResult::Status::Errored;
        reaped = true;
        break;
      }
      std::this_thread::sleep_for(5ms);
      continue;
    }

    auto limit = cancel_at ? std::min(deadline, *cancel_at) : deadline;
    long long wait_ms = duration_cast<milliseconds>(limit - now).count();
    // Bounded slices so stop requests are noticed promptly.
    wait_ms = std::clamp<long long>(wait_ms, 1, 50);
    if (!pump(static_cast<int>(wait_ms))) {
      abort_status = ProcessResult::Status::Errored;
      break;
    }
  }

  if (!reaped) {
    if (abort_status != ProcessResult::Status::Errored)
      std::fprintf(stderr, "rtspmon: subprocess: warning: stopping %s (pid %d, %s)\n",
                   argv[0].c_str(), static_cast<int>(pid), process_status_name(*abort_status));
    // SIGTERM first so tools like ffmpeg can shut down cleanly. Output keeps
    // being drained meanwhile: a child blocked on a full pipe cannot exit.
    ::kill(-pid, SIGTERM);
    const auto kill_at = steady_clock::now() + opts.term_grace;
    bool exited = false;
    while (!(exited = leader_exited(pid)) && steady_clock::now() < kill_at) {
      if (fds[0] < 0 && fds[1] < 0) std::this_thread::sleep_for(5ms);
      else if (!pump(5)) std::this_thread::sleep_for(5ms);
    }
    if (!exited)
      std::fprintf(stderr, "rtspmon: subprocess: warning: %s (pid %d) ignored SIGTERM, killing\n",
                   argv[0].c_str(), static_cast<int>(pid));
    // The unreaped leader keeps the group id reserved, so this cannot hit
    // an unrelated group; it also takes out members that outlived the leader.
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    (void)wait_blocking(pid, status);
  }
  close_fd(fds[0]);
  close_fd(fds[1]);

  if (abort_status) {
    r.status = *abort_status;
    return finish();
  }
  r.status = ProcessResult::Status::Completed;
  r.exit_code = decode_wait_status(status);
  return finish();
}

} // namespace rtspmon::util
