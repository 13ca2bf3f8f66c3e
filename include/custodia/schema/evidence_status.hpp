#pragma once

#include <custodia/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: evidence status.
// Integrity lifecycle: UNSET is never stored; REGISTERED on creation,
// VERIFIED / FLAGGED by verification outcomes.
namespace custodia::schema {

enum class evidence_status_t : uint8_t {
  unset = 0,
  registered = 1,
  flagged = 2,
  verified = 3,
};

inline constexpr auto kEvidenceStatusMappings = std::array{
    std::pair<std::string_view, evidence_status_t>{"UNSET",
                                                   evidence_status_t::unset},
    std::pair<std::string_view, evidence_status_t>{
        "REGISTERED", evidence_status_t::registered},
    std::pair<std::string_view, evidence_status_t>{"FLAGGED",
                                                   evidence_status_t::flagged},
    std::pair<std::string_view, evidence_status_t>{
        "VERIFIED", evidence_status_t::verified}};

template <>
inline std::optional<evidence_status_t> try_from_string<evidence_status_t>(
    const std::string_view value) {
  return from_string(value, kEvidenceStatusMappings);
}

inline constexpr std::string_view to_string(const evidence_status_t value) {
  return to_string(value, kEvidenceStatusMappings).value_or("UNKNOWN");
}

}  // namespace custodia::schema
