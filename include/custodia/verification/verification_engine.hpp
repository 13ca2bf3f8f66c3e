#pragma once

#include <custodia/ledger/ledger_store.hpp>
#include <custodia/schema/operation_result.hpp>
#include <custodia/schema/primitives.hpp>
#include <custodia/schema/verification_outcome.hpp>

#include <variant>

namespace custodia::verification {

/// Raw evidence bytes, or a fingerprint computed elsewhere.
using verification_input_t =
    std::variant<custodia::schema::bytes_t, custodia::schema::hash32_t>;

/// Fingerprints raw input when needed and records the comparison through the
/// ledger store.
class verification_engine final {
 public:
  explicit verification_engine(custodia::ledger::ledger_store& store);

  custodia::schema::operation_result<custodia::schema::verification_outcome_t>
  verify(custodia::schema::evidence_id_t id,
         const verification_input_t& input,
         const custodia::schema::identity_t& verifier);

 private:
  custodia::ledger::ledger_store& store_;
};

}  // namespace custodia::verification
