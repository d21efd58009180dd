#pragma once

#include <string>

namespace edi {
namespace utils {

// Removes leading and trailing ASCII whitespace.
std::string trim(const std::string& text);

} // namespace utils
} // namespace edi
