#pragma once

#include <iosfwd>
#include <string>

namespace edi {
namespace app {

// Asks for the API key until one of kApiKeyLength characters is entered.
// Echo is switched off while typing when `in` is the terminal on stdin.
// Throws std::runtime_error if input ends first.
std::string promptApiKey(std::istream& in, std::ostream& out);

// Prints the numbered model menu and returns the chosen model.
// Anything that is not a listed number selects the default model.
std::string promptModel(std::istream& in, std::ostream& out);

} // namespace app
} // namespace edi
