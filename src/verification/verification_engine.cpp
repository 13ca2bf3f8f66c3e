#include <custodia/fingerprint/fingerprint.hpp>
#include <custodia/verification/verification_engine.hpp>

namespace custodia::verification {

verification_engine::verification_engine(custodia::ledger::ledger_store& store)
    : store_{store} {}

custodia::schema::operation_result<custodia::schema::verification_outcome_t>
verification_engine::verify(const custodia::schema::evidence_id_t id,
                            const verification_input_t& input,
                            const custodia::schema::identity_t& verifier) {
  auto submitted = std::visit(
      overloaded{[](const custodia::schema::bytes_t& bytes) {
                   return custodia::fingerprint::digest(
                       custodia::schema::make_bytes_view(bytes));
                 },
                 [](const custodia::schema::hash32_t& fingerprint) {
                   return fingerprint;
                 }},
      input);
  return store_.record_verification(id, submitted, verifier);
}

}  // namespace custodia::verification
