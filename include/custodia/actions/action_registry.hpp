#pragma once

#include <custodia/schema/primitives.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace custodia::actions {

inline constexpr std::string_view kCollected{"COLLECTED"};
inline constexpr std::string_view kAccessed{"ACCESSED"};
inline constexpr std::string_view kTransferred{"TRANSFERRED"};
inline constexpr std::string_view kVerified{"VERIFIED"};
inline constexpr std::string_view kAnalyzed{"ANALYZED"};
inline constexpr std::string_view kViolation{"VIOLATION"};
inline constexpr std::string_view kUnknown{"UNKNOWN"};

/// Reverse-resolvable vocabulary. Custom action names are accepted on the
/// ledger but never resolve back to text.
inline constexpr auto kCanonicalActions = std::array{
    kCollected, kAccessed, kTransferred, kVerified, kAnalyzed, kViolation};

/// digest_string(name); case sensitive.
custodia::schema::hash32_t action_fingerprint(std::string_view name);

/// Canonical name for `fingerprint`, or UNKNOWN.
std::string action_name(const custodia::schema::hash32_t& fingerprint);

/// Like action_name, additionally resolving names from `vocabulary`.
std::string action_name(const custodia::schema::hash32_t& fingerprint,
                        const std::vector<std::string>& vocabulary);

}  // namespace custodia::actions
