#include <edi/core/session_store.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace edi {
namespace core {

SessionStore::SessionStore(std::filesystem::path path) : m_path(std::move(path)) {}

void SessionStore::save(const Transcript& transcript) const {
    std::error_code ec;
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create session directory " + m_path.parent_path().string() + ": " + ec.message());
        }
    }

    // Write next to the record and rename over it so a crash mid-write never
    // leaves a truncated session behind.
    std::filesystem::path tmp_path = m_path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to open session file for writing: " + tmp_path.string());
        }
        out << nlohmann::json(transcript).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        out.flush();
        if (!out) {
            throw std::runtime_error("Failed to write session file: " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, m_path, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("Failed to replace session file " + m_path.string() + ": " + reason);
    }
}

Transcript SessionStore::load() const {
    std::ifstream in(m_path, std::ios::binary);
    if (!in) {
        return {};
    }
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_array()) {
            return {};
        }
        return j.get<Transcript>();
    } catch (const nlohmann::json::exception&) {
        return {};
    } catch (const std::invalid_argument&) {
        // Unknown role in the record.
        return {};
    }
}

} // namespace core
} // namespace edi
