#include <edi/utils/text_utils.h>
#include <algorithm>
#include <cctype>

namespace edi {
namespace utils {

std::string trim(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

} // namespace utils
} // namespace edi
