#ifndef INFALLIBLE_CONVERSION_DEFECT_HPP
#define INFALLIBLE_CONVERSION_DEFECT_HPP

#include <string_view>

namespace infallible {

// Called when a conversion that can't fail has failed anyway. Prints a
// diagnostic naming the operation and the source type to stderr and aborts.
[[noreturn]] void
report_conversion_defect(std::string_view operation, std::string_view type);

} // namespace infallible

#endif
