#pragma once

#include <edi/core/types.h>
#include <filesystem>

namespace edi {
namespace core {

/*
 * Persists the transcript of the most recent conversation as a JSON array of
 * {"role", "content"} objects. The record is always rewritten as a whole.
 */
class SessionStore {
public:
    /// Constructs a store backed by the file at `path`. Nothing is touched on disk yet.
    explicit SessionStore(std::filesystem::path path);

    /// Replaces the record with `transcript`. Throws std::runtime_error if the file cannot be written.
    void save(const Transcript& transcript) const;

    /// Returns the saved transcript, or an empty one when the record is missing or unreadable.
    Transcript load() const;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace core
} // namespace edi
