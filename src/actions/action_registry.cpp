#include <custodia/actions/action_registry.hpp>
#include <custodia/fingerprint/fingerprint.hpp>

#include <algorithm>

namespace custodia::actions {

namespace {

struct canonical_entry final {
  std::string_view name;
  custodia::schema::hash32_t fingerprint;
};

const std::array<canonical_entry, kCanonicalActions.size()>&
canonical_entries() {
  static const auto entries = [] {
    auto out = std::array<canonical_entry, kCanonicalActions.size()>{};
    for (std::size_t i = 0; i < kCanonicalActions.size(); ++i) {
      out[i] = canonical_entry{.name = kCanonicalActions[i],
                               .fingerprint =
                                   action_fingerprint(kCanonicalActions[i])};
    }
    return out;
  }();
  return entries;
}

}  // namespace

custodia::schema::hash32_t action_fingerprint(std::string_view name) {
  return custodia::fingerprint::digest_string(name);
}

std::string action_name(const custodia::schema::hash32_t& fingerprint) {
  const auto& entries = canonical_entries();
  auto it = std::find_if(std::begin(entries), std::end(entries),
                         [&](const auto& entry) {
                           return entry.fingerprint == fingerprint;
                         });
  if (it == std::end(entries)) {
    return std::string{kUnknown};
  }
  return std::string{it->name};
}

std::string action_name(const custodia::schema::hash32_t& fingerprint,
                        const std::vector<std::string>& vocabulary) {
  auto name = action_name(fingerprint);
  if (name != kUnknown) {
    return name;
  }
  for (const auto& candidate : vocabulary) {
    if (action_fingerprint(candidate) == fingerprint) {
      return candidate;
    }
  }
  return name;
}

}  // namespace custodia::actions
