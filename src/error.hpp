#ifndef INFALLIBLE_ERROR_HPP
#define INFALLIBLE_ERROR_HPP

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>
#include <utility>

namespace infallible {

// Distinct error kinds are distinct instantiations, so callers can catch one
// kind without catching every std::runtime_error.
template <typename>
class named_runtime_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

template <typename Error = std::runtime_error, typename... Args>
Error
make_error(std::string_view fmt, Args&&... args) {
  return Error{fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...)};
}

// Thrown when a big_uint would be built from a negative number.
using negative_value_error = named_runtime_error<class negative_value_error_tag>;

} // namespace infallible

#endif
