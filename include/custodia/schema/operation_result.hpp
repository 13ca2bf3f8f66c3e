#pragma once

#include <custodia/schema/error_code.hpp>

#include <optional>
#include <string>
#include <utility>

namespace custodia::schema {

/// Outcome of a ledger operation.
///
/// `code == ok` means the operation committed and `value` is set. Any other
/// code is a rejection of the current operation only; `detail` carries the
/// human-readable reason. Policy rejections recorded on the ledger may also
/// carry a value describing the record that was written instead.
template <typename T>
struct operation_result final {
  error_code_t code{error_code_t::ok};
  std::string detail;
  std::optional<T> value;

  bool ok() const { return code == error_code_t::ok; }
};

template <typename T>
operation_result<T> make_ok(T value) {
  return operation_result<T>{
      .code = error_code_t::ok, .detail = {}, .value = std::move(value)};
}

template <typename T>
operation_result<T> make_error(const error_code_t code, std::string detail) {
  return operation_result<T>{
      .code = code, .detail = std::move(detail), .value = std::nullopt};
}

/// Re-types a failed result, keeping code and detail.
template <typename T, typename U>
operation_result<T> forward_error(const operation_result<U>& failed) {
  return operation_result<T>{
      .code = failed.code, .detail = failed.detail, .value = std::nullopt};
}

}  // namespace custodia::schema
