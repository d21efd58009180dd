#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace edi {
namespace core {

enum class Role {
    User,
    Assistant,
};

std::string roleToString(Role role);

// Throws std::invalid_argument for anything other than "user" or "assistant".
Role roleFromString(const std::string& value);

// One message of a conversation. Turns are values and are never edited once
// they are part of a transcript.
struct Turn {
    Role role = Role::User;
    std::string content;

    bool operator==(const Turn& other) const = default;
};

// Conversation order is insertion order.
using Transcript = std::vector<Turn>;

void to_json(nlohmann::json& j, const Turn& turn);
void from_json(const nlohmann::json& j, Turn& turn);

} // namespace core
} // namespace edi
