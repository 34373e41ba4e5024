#ifndef CHATRELAY_MIRROR_STORE_HPP
#define CHATRELAY_MIRROR_STORE_HPP

/**
 * @file MirrorStore.hpp
 * @brief Flat JSON file holding the full message history.
 *
 * The artifact is a single pretty-printed JSON array of
 * { date, username, message } records, rewritten wholesale on every append.
 * A missing or unparsable artifact reads as an empty history and is replaced
 * by the next successful append.
 */

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <chatrelay/protocol.hpp>

namespace chatrelay
{
    class MirrorStore
    {
    public:
        explicit MirrorStore(std::filesystem::path path);

        MirrorStore(const MirrorStore &) = delete;
        MirrorStore &operator=(const MirrorStore &) = delete;

        /// Create the artifact as an empty array if it does not exist yet.
        bool ensure_initialized();

        /// Read-modify-write of the whole array. Appends are mutually exclusive.
        bool append(const Message &msg);

        /// Full history, oldest-first. Empty if missing or corrupt.
        [[nodiscard]] std::vector<Message> load() const;

        /// Full history as a serialized JSON array ("[]" if missing or corrupt).
        [[nodiscard]] std::string history_json() const;

        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

    private:
        nlohmann::ordered_json read_array_locked() const;
        bool write_array_locked(const nlohmann::ordered_json &records);

        std::filesystem::path path_;
        mutable std::mutex mutex_;
    };

} // namespace chatrelay

#endif // CHATRELAY_MIRROR_STORE_HPP
