#pragma once

#include <custodia/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: tamper source.
// Which subsystem raised a tamper event.
namespace custodia::schema {

enum class tamper_source_t : uint8_t {
  unknown = 0,
  verification = 1,
  risk_scoring = 2,
};

inline constexpr auto kTamperSourceMappings = std::array{
    std::pair<std::string_view, tamper_source_t>{"UNKNOWN",
                                                 tamper_source_t::unknown},
    std::pair<std::string_view, tamper_source_t>{
        "VERIFICATION", tamper_source_t::verification},
    std::pair<std::string_view, tamper_source_t>{
        "RISK_SCORING", tamper_source_t::risk_scoring}};

template <>
inline std::optional<tamper_source_t> try_from_string<tamper_source_t>(
    const std::string_view value) {
  return from_string(value, kTamperSourceMappings);
}

inline constexpr std::string_view to_string(const tamper_source_t value) {
  return to_string(value, kTamperSourceMappings).value_or("UNKNOWN");
}

}  // namespace custodia::schema
