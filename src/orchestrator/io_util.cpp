#include "ba/orchestrator/io_util.h"

#include "ba/common.h"
#include "ba/errors.h"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace ba::orchestrator {
namespace {

constexpr const char* kAppendErrorMessage = "Record append failed";
constexpr const char* kMoveErrorMessage = "Artifact move failed";
constexpr int kMaxBackupSuffix = 10000;

class ErrorContext { // TSK109_Error_Code_Handling accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

ba::Retryability ClassifyNativeError(int native) {
  switch (native) {
#if defined(EINTR)
    case EINTR:
#endif
#if defined(EAGAIN)
    case EAGAIN:
#endif
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
      return ba::Retryability::kRetryable;
#if defined(EBUSY)
    case EBUSY:
      return ba::Retryability::kTransient;
#endif
#if defined(ETIMEDOUT)
    case ETIMEDOUT:
      return ba::Retryability::kTransient;
#endif
    default:
      break;
  }
  return ba::Retryability::kFatal;
}

std::vector<std::string> MergeContext(const std::vector<std::string>& existing,
                                      const ErrorContext& ctx) {
  auto merged = existing;
  auto stack = ctx.Stack();
  merged.insert(merged.end(), stack.begin(), stack.end());
  return merged;
}

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, int code, std::string message,
                               std::optional<int> native = std::nullopt,
                               ba::Retryability retry = ba::Retryability::kFatal) {
  throw Error{ErrorDomain::IO, code, ctx.Format(std::move(message)), native, retry, ctx.Stack()};
}

Error AugmentError(const Error& err, const ErrorContext& ctx) {
  return Error{err.domain,
               err.code,
               ctx.Format(err.what()),
               err.native_code,
               err.retryability,
               MergeContext(err.context, ctx)};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx,
                                     int code) { // TSK109_Error_Code_Handling preserve errno
  throw Error{ErrorDomain::IO,
              code,
              ctx.Format(sys_err.what()),
              sys_err.code().value(),
              ClassifyNativeError(sys_err.code().value()),
              ctx.Stack()};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, int code, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const Error& err) {
    if (err.context.empty()) {
      throw AugmentError(err, ctx);
    }
    throw;
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx, code);
  }
}

int NativeOpenAppend(const std::filesystem::path& path) {
  return ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
}

bool IsTransientFsyncError(int err) {
  return err == EINTR || err == EAGAIN || err == EBUSY;
}

void SyncFileWithRetry(int fd, ErrorContext& ctx, int code) { // TSK101_File_IO_Persistence_and_Atomicity durability retry loop
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (::fsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
      ThrowIoError(ctx, code, std::string(kAppendErrorMessage) + ": fsync failed", saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

// O_APPEND positions every write() at end of file, so a record written by one
// call never interleaves with another writer's record.
void WriteRecord(int fd, std::string_view record, ErrorContext& ctx, int code) {
  size_t written = 0;
  while (written < record.size()) {
    auto chunk = ::write(fd, record.data() + written, record.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, code, std::string(kAppendErrorMessage) + ": write failed", saved_errno,
                   ClassifyNativeError(saved_errno));
    }
    if (chunk == 0) {
      ThrowIoError(ctx, code, std::string(kAppendErrorMessage) + ": short write");
    }
    written += static_cast<size_t>(chunk);
  }
}

std::filesystem::path NextBackupName(const std::filesystem::path& existing, ErrorContext& ctx) {
  for (int suffix = 1; suffix < kMaxBackupSuffix; ++suffix) {
    std::filesystem::path candidate = existing;
    candidate += ".~" + std::to_string(suffix) + "~";
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(candidate, ec))) {
      return candidate;
    }
  }
  ThrowIoError(ctx, ba::errors::io::kArtifactMoveFailed,
               std::string(kMoveErrorMessage) + ": no free backup name");
}

void RenameOrCopy(const std::filesystem::path& from, const std::filesystem::path& to,
                  ErrorContext& ctx) {
  if (::rename(from.c_str(), to.c_str()) == 0) {
    return;
  }
  const int saved_errno = errno;
  if (saved_errno != EXDEV) {
    ThrowIoError(ctx, ba::errors::io::kArtifactMoveFailed,
                 std::string(kMoveErrorMessage) + ": rename failed", saved_errno,
                 ClassifyNativeError(saved_errno));
  }
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing);
  std::filesystem::remove(from);
}

}  // namespace

void AppendRecord(const std::filesystem::path& target, std::string_view record, int error_code) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "append target=" + ba::PathToUtf8String(target));

  int fd = WithContext(ctx, "opening for append", error_code, [&]() {
    int handle = NativeOpenAppend(target);
    if (handle < 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, error_code, std::string(kAppendErrorMessage) + ": open failed",
                   saved_errno, ClassifyNativeError(saved_errno));
    }
    return handle;
  });

  try {
    WithContext(ctx, "writing record", error_code, [&] { WriteRecord(fd, record, ctx, error_code); });
    WithContext(ctx, "syncing record", error_code, [&] { SyncFileWithRetry(fd, ctx, error_code); });
  } catch (...) {
    ::close(fd);
    throw;
  }

  if (::close(fd) != 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, error_code, std::string(kAppendErrorMessage) + ": close failed",
                 saved_errno, ClassifyNativeError(saved_errno));
  }
}

void EnsureFileExists(const std::filesystem::path& target, int error_code) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "ensure file=" + ba::PathToUtf8String(target));

  std::error_code ec;
  const auto status = std::filesystem::status(target, ec);
  if (std::filesystem::is_regular_file(status)) {
    return;
  }
  if (std::filesystem::exists(status)) {
    ThrowIoError(ctx, error_code, "Path exists but is not a regular file");
  }
  const auto parent = target.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ThrowIoError(ctx, error_code, "Failed to create parent directory: " + ec.message(),
                   ec.value(), ClassifyNativeError(ec.value()));
    }
  }
  int fd = NativeOpenAppend(target);
  if (fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, error_code, "Failed to create file", saved_errno,
                 ClassifyNativeError(saved_errno));
  }
  ::close(fd);
}

std::filesystem::path BackupExisting(const std::filesystem::path& target) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "backup target=" + ba::PathToUtf8String(target));
  return WithContext(ctx, "backing up existing file", ba::errors::io::kArtifactMoveFailed, [&] {
    const auto backup = NextBackupName(target, ctx);
    RenameOrCopy(target, backup, ctx);
    return backup;
  });
}

std::filesystem::path MoveWithNumberedBackup(const std::filesystem::path& source,
                                             const std::filesystem::path& dest_dir) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "move source=" + ba::PathToUtf8String(source) +
                                   " dest=" + ba::PathToUtf8String(dest_dir));
  const auto target = dest_dir / source.filename();
  const int code = ba::errors::io::kArtifactMoveFailed;

  WithContext(ctx, "backing up existing artifact", code, [&] {
    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(target, ec))) {
      const auto backup = NextBackupName(target, ctx);
      RenameOrCopy(target, backup, ctx);
    }
  });
  WithContext(ctx, "placing artifact", code, [&] { RenameOrCopy(source, target, ctx); });
  return target;
}

}  // namespace ba::orchestrator
