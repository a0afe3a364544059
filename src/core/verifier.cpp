#include "ba/core/verifier.h"

#include "ba/core/zip_archive.h"
#include "ba/crypto/md5.h"

namespace ba::core {

const char* ContainerStatusToString(ContainerStatus status) {
  switch (status) {
  case ContainerStatus::kSkipped:
    return "skipped";
  case ContainerStatus::kPassed:
    return "passed";
  case ContainerStatus::kFailed:
    return "failed";
  }
  return "skipped";
}

std::string Verifier::Checksum(const std::filesystem::path& path) {
  return ba::crypto::MD5_FileHex(path);
}

ChecksumVerdict Verifier::VerifyChecksum(const std::filesystem::path& path,
                                         const std::string& expected) {
  ChecksumVerdict verdict;
  verdict.expected = expected;
  verdict.actual = Checksum(path);
  verdict.match = verdict.actual == verdict.expected;
  return verdict;
}

ContainerCheck Verifier::VerifyContainerStructure(const std::filesystem::path& path) {
  ContainerCheck check;
  if (!LooksLikeZip(path)) {
    return check;
  }
  const auto report = TestZipArchive(path);
  if (report.ok) {
    check.status = ContainerStatus::kPassed;
    check.detail = std::to_string(report.entries_tested) + " members tested";
    if (report.entries_skipped > 0) {
      check.detail += ", " + std::to_string(report.entries_skipped) + " skipped";
    }
  } else {
    check.status = ContainerStatus::kFailed;
    check.detail = report.error;
  }
  return check;
}

} // namespace ba::core
