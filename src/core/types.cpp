#include <edi/core/types.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace edi {
namespace core {

std::string roleToString(Role role) {
    switch (role) {
    case Role::User:
        return "user";
    case Role::Assistant:
        return "assistant";
    }
    throw std::invalid_argument("Unknown role value");
}

Role roleFromString(const std::string& value) {
    if (value == "user") {
        return Role::User;
    }
    if (value == "assistant") {
        return Role::Assistant;
    }
    throw std::invalid_argument("Unknown role: '" + value + "'");
}

void to_json(nlohmann::json& j, const Turn& turn) {
    j = nlohmann::json{{"role", roleToString(turn.role)}, {"content", turn.content}};
}

// Raises nlohmann::json::exception for a missing key or a non-string value
// and std::invalid_argument for an unknown role.
void from_json(const nlohmann::json& j, Turn& turn) {
    turn.role = roleFromString(j.at("role").get<std::string>());
    turn.content = j.at("content").get<std::string>();
}

} // namespace core
} // namespace edi
