#pragma once

#include <filesystem>
#include <string>

namespace ba::core {

  struct ChecksumVerdict {
    bool match{false};
    std::string expected;
    std::string actual;
  };

  enum class ContainerStatus { kSkipped, kPassed, kFailed };

  struct ContainerCheck {
    ContainerStatus status{ContainerStatus::kSkipped};
    std::string detail;
  };

  const char* ContainerStatusToString(ContainerStatus status);

  // Content checks applied to a single book. Read failures throw ba::Error (IO).
  class Verifier {
  public:
    virtual ~Verifier() = default;

    // Hex MD5 of the book's current bytes.
    virtual std::string Checksum(const std::filesystem::path& path);

    ChecksumVerdict VerifyChecksum(const std::filesystem::path& path, const std::string& expected);

    // ZIP-based containers (EPUB, CBZ, DOCX...) are recognised by signature,
    // whatever their extension. Anything else is skipped.
    virtual ContainerCheck VerifyContainerStructure(const std::filesystem::path& path);
  };

} // namespace ba::core
