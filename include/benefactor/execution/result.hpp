#pragma once

#include <benefactor/schema/transaction_error_code.hpp>
#include <boost/outcome/std_result.hpp>
#include <boost/outcome/success_failure.hpp>
#include <system_error>

namespace benefactor::execution {

namespace outcome = boost::outcome_v2;

/// Component operation outcome; the error is a transaction_error_code.
template <typename T>
using result_t = outcome::std_result<T>;

inline auto fail(const benefactor::schema::transaction_error_code code) {
  return outcome::failure(benefactor::schema::make_error_code(code));
}

}  // namespace benefactor::execution
