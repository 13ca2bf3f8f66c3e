#pragma once

#include <custodia/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: ledger keys.
// Canonical key prefixes and key builders for evidence state, custody logs,
// attestations, the notification log, and the tamper ledger.
namespace custodia::schema::key {

inline constexpr std::string_view kEvidenceSeqKeyPrefix{
    "SYS|STATE|EVIDENCE_SEQ|"};
inline constexpr std::string_view kEvidenceKeyPrefix{"SYS|STATE|EVIDENCE|"};
inline constexpr std::string_view kFingerprintKeyPrefix{
    "SYS|STATE|FINGERPRINT|"};
inline constexpr std::string_view kCustodyKeyPrefix{"SYS|STATE|CUSTODY|"};
inline constexpr std::string_view kAttestationKeyPrefix{"SYS|STATE|ATTEST|"};
inline constexpr std::string_view kAttestationCountKeyPrefix{
    "SYS|STATE|ATTEST_COUNT|"};
inline constexpr std::string_view kAttesterKeyPrefix{"SYS|STATE|ATTESTER|"};
inline constexpr std::string_view kVerifierKeyPrefix{"SYS|STATE|VERIFIER|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};
inline constexpr std::string_view kTamperSeqKeyPrefix{"SYS|STATE|TAMPER_SEQ|"};
inline constexpr std::string_view kTamperPrefix{"SYS|TAMPER|"};

template <typename Encoder, typename T>
custodia::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
custodia::schema::bytes_t make_prefix_key(Encoder& encoder,
                                          std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
custodia::schema::bytes_t make_evidence_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEvidenceSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
custodia::schema::bytes_t make_evidence_key(
    Encoder& encoder,
    const custodia::schema::evidence_id_t id) {
  return make_prefixed_key(encoder, kEvidenceKeyPrefix, id);
}

template <typename Encoder>
custodia::schema::bytes_t make_fingerprint_key(
    Encoder& encoder,
    const custodia::schema::hash32_t& fingerprint) {
  return make_prefixed_key(encoder, kFingerprintKeyPrefix, fingerprint);
}

template <typename Encoder>
custodia::schema::bytes_t make_custody_event_key(
    Encoder& encoder,
    const custodia::schema::evidence_id_t id,
    const uint64_t index) {
  return make_prefixed_key(encoder, kCustodyKeyPrefix, std::tuple{id, index});
}

template <typename Encoder>
custodia::schema::bytes_t make_attestation_key(
    Encoder& encoder,
    const custodia::schema::evidence_id_t id,
    const uint64_t index) {
  return make_prefixed_key(encoder, kAttestationKeyPrefix,
                           std::tuple{id, index});
}

template <typename Encoder>
custodia::schema::bytes_t make_attester_key(
    Encoder& encoder,
    const custodia::schema::evidence_id_t id,
    const custodia::schema::identity_t& verifier) {
  return make_prefixed_key(encoder, kAttesterKeyPrefix,
                           std::tuple{id, verifier});
}

template <typename Encoder>
custodia::schema::bytes_t make_attestation_count_key(
    Encoder& encoder,
    const custodia::schema::evidence_id_t id) {
  return make_prefixed_key(encoder, kAttestationCountKeyPrefix, id);
}

template <typename Encoder>
custodia::schema::bytes_t make_verifier_key(
    Encoder& encoder,
    const custodia::schema::identity_t& verifier) {
  return make_prefixed_key(encoder, kVerifierKeyPrefix, verifier);
}

template <typename Encoder>
custodia::schema::bytes_t make_event_key(Encoder& encoder,
                                         const uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

template <typename Encoder>
custodia::schema::bytes_t make_tamper_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kTamperSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
custodia::schema::bytes_t make_tamper_key(Encoder& encoder, const uint64_t id) {
  return make_prefixed_key(encoder, kTamperPrefix, id);
}

}  // namespace custodia::schema::key
