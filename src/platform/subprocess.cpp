#include "ba/platform/subprocess.h"

#include "ba/error.h"
#include "ba/errors.h"

#include <cerrno>
#include <csignal>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ba::platform {
namespace {

// Written by the child over a close-on-exec pipe when it fails before exec
// completes. A successful exec closes the pipe with nothing written.
struct ChildFailure {
  int stage{0};
  int error{0};
};

constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

[[noreturn]] void ThrowSpawnError(const std::string& program, const std::string& step, int native) {
  throw ba::Error(ba::ErrorDomain::Dependency, ba::errors::dependency::kSpawnFailed,
                  std::string(ba::errors::msg::kSpawnFailed) + " (" + step + "): " + program,
                  native, ba::Retryability::kTransient);
}

class PipeFd {
 public:
  PipeFd() = default;
  explicit PipeFd(int fd) : fd_(fd) {}
  ~PipeFd() { Close(); }
  PipeFd(const PipeFd&) = delete;
  PipeFd& operator=(const PipeFd&) = delete;

  int get() const noexcept { return fd_; }
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{-1};
};

void ReportChildFailure(int fd, int stage, int error) {
  const ChildFailure failure{stage, error};
  const ssize_t written = ::write(fd, &failure, sizeof(failure));
  (void)written;  // the parent treats a short report as a clean exec
}

// Only async-signal-safe calls are allowed between fork() and exec().
[[noreturn]] void RunChild(char* const* argv, const char* working_dir, int report_fd) {
  // Stop requests belong to the parent, which lets the running tool finish
  // the current book. Ignored dispositions survive exec.
  struct sigaction ignore {};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  ::sigaction(SIGINT, &ignore, nullptr);
  ::sigaction(SIGTERM, &ignore, nullptr);

  if (::chdir(working_dir) != 0) {
    ReportChildFailure(report_fd, kStageChdir, errno);
    _exit(kExecFailedStatus);
  }
  ::execvp(argv[0], argv);
  ReportChildFailure(report_fd, kStageExec, errno);
  _exit(kExecFailedStatus);
}

// Returns true when the child sent a complete failure report.
bool ReadChildFailure(int fd, ChildFailure& failure) {
  auto* out = reinterpret_cast<char*>(&failure);
  size_t total = 0;
  while (total < sizeof(failure)) {
    const ssize_t got = ::read(fd, out + total, sizeof(failure) - total);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      break;
    }
    total += static_cast<size_t>(got);
  }
  return total == sizeof(failure);
}

} // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const std::filesystem::path& working_dir) {
  if (argv.empty()) {
    ThrowSpawnError("<empty>", "argv", EINVAL);
  }

  // Build the C argv before forking so the child does not allocate.
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);
  const std::string dir = working_dir.string();

  int fds[2] = {-1, -1};
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    ThrowSpawnError(argv.front(), "pipe", errno);
  }
  PipeFd report_read(fds[0]);
  PipeFd report_write(fds[1]);

  pid_t pid = ::fork();
  if (pid < 0) {
    ThrowSpawnError(argv.front(), "fork", errno);
  }
  if (pid == 0) {
    RunChild(c_argv.data(), dir.c_str(), report_write.get());
  }
  report_write.Close();

  ChildFailure failure;
  const bool setup_failed = ReadChildFailure(report_read.get(), failure);
  report_read.Close();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      ThrowSpawnError(argv.front(), "waitpid", errno);
    }
  }

  ProcessResult result;
  if (setup_failed) {
    if (failure.stage == kStageChdir) {
      ThrowSpawnError(argv.front(), "chdir " + dir, failure.error);
    }
    if (failure.error != ENOENT) {
      ThrowSpawnError(argv.front(), "exec", failure.error);
    }
    result.program_missing = true;
  }
  if (WIFEXITED(status)) {
    result.exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signaled = true;
    result.term_signal = WTERMSIG(status);
  }
  return result;
}

} // namespace ba::platform
