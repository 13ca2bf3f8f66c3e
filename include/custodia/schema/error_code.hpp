#pragma once

#include <custodia/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace custodia::schema {

enum class error_code_t : uint32_t {
  ok = 0,
  // input validation
  invalid_input = 1,
  invalid_fingerprint = 2,
  invalid_case_id = 3,
  // not found
  evidence_not_found = 10,
  index_out_of_bounds = 11,
  // conflicts
  duplicate_fingerprint = 20,
  duplicate_attestation = 21,
  // policy
  invalid_custody_order = 30,
  parallel_access_violation = 31,
  access_duration_exceeded = 32,
  not_registered_verifier = 33,
  // underlying log
  commit_failed = 40,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code_t>{"Ok", error_code_t::ok},
    std::pair<std::string_view, error_code_t>{"InvalidInput",
                                              error_code_t::invalid_input},
    std::pair<std::string_view, error_code_t>{
        "InvalidFingerprint", error_code_t::invalid_fingerprint},
    std::pair<std::string_view, error_code_t>{"InvalidCaseId",
                                              error_code_t::invalid_case_id},
    std::pair<std::string_view, error_code_t>{
        "EvidenceNotFound", error_code_t::evidence_not_found},
    std::pair<std::string_view, error_code_t>{
        "IndexOutOfBounds", error_code_t::index_out_of_bounds},
    std::pair<std::string_view, error_code_t>{
        "DuplicateFingerprint", error_code_t::duplicate_fingerprint},
    std::pair<std::string_view, error_code_t>{
        "DuplicateAttestation", error_code_t::duplicate_attestation},
    std::pair<std::string_view, error_code_t>{
        "InvalidCustodyOrder", error_code_t::invalid_custody_order},
    std::pair<std::string_view, error_code_t>{
        "ParallelAccessViolation", error_code_t::parallel_access_violation},
    std::pair<std::string_view, error_code_t>{
        "AccessDurationExceeded", error_code_t::access_duration_exceeded},
    std::pair<std::string_view, error_code_t>{
        "NotRegisteredVerifier", error_code_t::not_registered_verifier},
    std::pair<std::string_view, error_code_t>{"CommitFailed",
                                              error_code_t::commit_failed}};

template <>
inline std::optional<error_code_t> try_from_string<error_code_t>(
    const std::string_view value) {
  return from_string(value, kErrorCodeMappings);
}

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("Unknown");
}

/// Business-rule rejections that are recorded as VIOLATION custody events.
inline constexpr bool is_policy_violation(const error_code_t value) {
  switch (value) {
    case error_code_t::invalid_custody_order:
    case error_code_t::parallel_access_violation:
    case error_code_t::access_duration_exceeded:
    case error_code_t::not_registered_verifier:
      return true;
    default:
      return false;
  }
}

}  // namespace custodia::schema
