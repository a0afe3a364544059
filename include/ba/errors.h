#pragma once

#include <string_view>

namespace ba::errors::msg {
// TSK111_Code_Duplication_and_Maintainability centralized message catalog
inline constexpr std::string_view kLedgerUnreadable{"Unable to read checksum ledger"};
inline constexpr std::string_view kLedgerWriteFailed{"Failed to append checksum ledger entry"};
inline constexpr std::string_view kCatalogUnreadable{"Unable to read catalog log"};
inline constexpr std::string_view kCatalogWriteFailed{"Failed to append catalog record"};
inline constexpr std::string_view kMalformedChecksum{"Checksum must be 32 lowercase hex digits"};
inline constexpr std::string_view kInvalidBookKey{"Book key must be <collection>/<name>"};
inline constexpr std::string_view kBookUnreadable{"Unable to read book"};
inline constexpr std::string_view kBookDirUnreadable{"Unable to enumerate book directory"};
inline constexpr std::string_view kBookDirMissing{"Book directory does not exist"};
inline constexpr std::string_view kRepairDirUnavailable{"Unable to prepare repair directory"};
inline constexpr std::string_view kParityGenerationFailed{"Recovery data generation failed"};
inline constexpr std::string_view kParityNoArtifacts{"Recovery tool produced no artifacts"};
inline constexpr std::string_view kParityPlacementFailed{"Failed to move recovery artifacts into place"};
inline constexpr std::string_view kParityLinkFailed{"Failed to link book into repair directory"};
inline constexpr std::string_view kParitySelfVerifyFailed{"Recovery data failed self-verification"};
inline constexpr std::string_view kToolMissing{"External tool not found on PATH"};
inline constexpr std::string_view kSpawnFailed{"Failed to start external tool"};
inline constexpr std::string_view kDigestFailed{"Checksum computation failed"};
inline constexpr std::string_view kInvalidRedundancy{"REDUNDANCY must be an integer between 1 and 100"};
inline constexpr std::string_view kMissingHome{"HOME is not set and BOOK_DIR was not provided"};
inline constexpr std::string_view kInvalidPolicy{"FAILURE_POLICY must be 'accumulate' or 'fail-fast'"};
inline constexpr std::string_view kInvalidBoolean{"Expected a boolean value (0/1/true/false/yes/no)"};
inline constexpr std::string_view kInvalidSize{"ARMOR_LOG_MAX_SIZE must be a positive byte count"};
}  // namespace ba::errors::msg
