#pragma once

#include <custodia/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger event type.
// Outbound notification taxonomy consumed by indexing and UI layers.
namespace custodia::schema {

enum class ledger_event_type_t : uint16_t {
  evidence_registered = 1,
  custody_event_logged = 2,
  verification_passed = 3,
  tamper_detected = 4,
  verification_attested = 5,
  policy_violation = 6,
};

inline constexpr auto kLedgerEventTypeMappings = std::array{
    std::pair<std::string_view, ledger_event_type_t>{
        "EvidenceRegistered", ledger_event_type_t::evidence_registered},
    std::pair<std::string_view, ledger_event_type_t>{
        "CustodyEventLogged", ledger_event_type_t::custody_event_logged},
    std::pair<std::string_view, ledger_event_type_t>{
        "VerificationPassed", ledger_event_type_t::verification_passed},
    std::pair<std::string_view, ledger_event_type_t>{
        "TamperDetected", ledger_event_type_t::tamper_detected},
    std::pair<std::string_view, ledger_event_type_t>{
        "VerificationAttested", ledger_event_type_t::verification_attested},
    std::pair<std::string_view, ledger_event_type_t>{
        "PolicyViolation", ledger_event_type_t::policy_violation}};

template <>
inline std::optional<ledger_event_type_t>
try_from_string<ledger_event_type_t>(const std::string_view value) {
  return from_string(value, kLedgerEventTypeMappings);
}

inline constexpr std::string_view to_string(const ledger_event_type_t value) {
  return to_string(value, kLedgerEventTypeMappings).value_or("Unknown");
}

}  // namespace custodia::schema
