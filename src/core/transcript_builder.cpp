#include <edi/core/transcript_builder.h>
#include <utility>

namespace edi {
namespace core {

Transcript withUserTurn(const Transcript& prior, std::string text) {
    Transcript next = prior;
    next.push_back(Turn{Role::User, std::move(text)});
    return next;
}

} // namespace core
} // namespace edi
