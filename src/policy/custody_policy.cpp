#include <custodia/actions/action_registry.hpp>
#include <custodia/policy/custody_policy.hpp>

namespace custodia::policy {

custody_policy default_custody_policy() {
  return custody_policy{
      .required_order = {std::string{custodia::actions::kCollected}, "SEALED",
                         std::string{custodia::actions::kAnalyzed},
                         std::string{custodia::actions::kVerified}},
      .allowed_skips = {},
      .max_access_duration_hours = 48.0,
      .no_parallel_access = true};
}

}  // namespace custodia::policy
