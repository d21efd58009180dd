#pragma once

#include <edi/core/types.h>
#include <string>

namespace edi {
namespace core {

/// Returns a copy of `prior` with one user turn holding `text` appended.
/// `prior` itself is left untouched.
Transcript withUserTurn(const Transcript& prior, std::string text);

} // namespace core
} // namespace edi
