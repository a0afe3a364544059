#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ba::platform {

  // Exit status of a child that failed before its program started.
  inline constexpr int kExecFailedStatus = 127;

  struct ProcessResult {
    int exit_status{-1};
    bool signaled{false};
    int term_signal{0};
    bool program_missing{false};  // exec found no such program

    [[nodiscard]] bool Succeeded() const noexcept {
      return !program_missing && !signaled && exit_status == 0;
    }
    [[nodiscard]] bool ProgramMissing() const noexcept { return program_missing; }
  };

  // Runs argv[0] (resolved through PATH) with `working_dir` as the child's
  // current directory and waits for it. The calling process never changes its
  // own working directory. The child ignores SIGINT and SIGTERM so a stop
  // request never cuts a tool short. Throws ba::Error (Dependency) when the
  // child cannot be created, cannot enter `working_dir`, or cannot exec an
  // existing program.
  ProcessResult RunProcess(const std::vector<std::string>& argv,
                           const std::filesystem::path& working_dir);

} // namespace ba::platform
