#include "conversion_defect.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>

namespace infallible {

void
report_conversion_defect(std::string_view operation, std::string_view type) {
  fmt::print(stderr,
             "{} failed for {}, this should not happen and is most likely a "
             "programming error\n",
             operation, type);
  std::fflush(stderr);
  std::abort();
}

} // namespace infallible
