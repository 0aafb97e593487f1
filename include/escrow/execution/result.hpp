#pragma once

#include <escrow/schema/transaction_error_code.hpp>
#include <escrow/schema/transaction_result.hpp>
#include <string>
#include <string_view>

namespace escrow::execution {

inline constexpr auto kCheckTxCodespace = std::string_view{"escrow.checktx"};
inline constexpr auto kFinalizeCodespace = std::string_view{"escrow.finalize"};
inline constexpr auto kJobsCodespace = std::string_view{"escrow.jobs"};
inline constexpr auto kAccessCodespace = std::string_view{"escrow.access"};

inline escrow::schema::transaction_result_t make_failure(
    const escrow::schema::transaction_error_code code,
    const std::string_view codespace,
    std::string info = {}) {
  auto result = escrow::schema::transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{escrow::schema::to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

inline escrow::schema::transaction_result_t make_success(std::string info) {
  auto result = escrow::schema::transaction_result_t{};
  result.info = std::move(info);
  return result;
}

}  // namespace escrow::execution
