#ifndef CHATRELAY_PROTOCOL_HPP
#define CHATRELAY_PROTOCOL_HPP

/**
 * @file protocol.hpp
 * @brief Chat message record and its JSON wire / mirror encoding.
 *
 * Wire format (one WebSocket text frame per message):
 *
 * {
 *   "date":     "2025-12-07T10:15:30.123Z", // assigned by the server
 *   "username": "alice",                    // required, non-empty
 *   "message":  "hi"                        // required, non-empty
 * }
 *
 * The same three fields form a mirror record. The storage id assigned by the
 * primary store never leaves the process.
 */

#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatrelay
{
    /// Current time as ISO-8601 UTC with milliseconds: YYYY-MM-DDTHH:MM:SS.mmmZ
    inline std::string utc_timestamp_now()
    {
        using clock = std::chrono::system_clock;
        const auto now = clock::now();
        const auto tt = clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                now.time_since_epoch())
                                .count() %
                            1000;

        std::tm tm{};
#if defined(_WIN32)
        gmtime_s(&tm, &tt);
#else
        gmtime_r(&tt, &tm);
#endif
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900,
                      tm.tm_mon + 1,
                      tm.tm_mday,
                      tm.tm_hour,
                      tm.tm_min,
                      tm.tm_sec,
                      static_cast<int>(millis));
        return buf;
    }

    struct Message
    {
        std::string date;                     ///< ISO-8601 UTC, set at ingest
        std::string username;                 ///< required
        std::string body;                     ///< required ("message" on the wire)
        std::optional<std::string> storageId; ///< set by the primary store only

        bool is_valid() const noexcept
        {
            return !username.empty() && !body.empty();
        }

        /// Mirror / wire record: { date, username, message }, never the id.
        nlohmann::ordered_json to_record() const
        {
            nlohmann::ordered_json j = nlohmann::ordered_json::object();
            j["date"] = date;
            j["username"] = username;
            j["message"] = body;
            return j;
        }

        /// Rebuild a message from a mirror record. Records missing a required
        /// field (or holding non-string values) yield nullopt.
        static std::optional<Message> from_record(const nlohmann::ordered_json &j)
        {
            if (!j.is_object())
                return std::nullopt;

            auto username = j.find("username");
            auto body = j.find("message");
            if (username == j.end() || body == j.end() ||
                !username->is_string() || !body->is_string())
                return std::nullopt;

            Message m;
            m.username = username->get<std::string>();
            m.body = body->get<std::string>();

            auto date = j.find("date");
            if (date != j.end() && date->is_string())
                m.date = date->get<std::string>();

            if (!m.is_valid())
                return std::nullopt;

            return m;
        }

        /**
         * @brief Decode one inbound frame.
         *
         * Returns nullopt when the frame is not a JSON object or when
         * `username` / `message` are missing, not strings, or empty. When
         * `error` is given it receives a short reason for the rejection.
         */
        static std::optional<Message> parse(std::string_view s, std::string *error = nullptr)
        {
            auto fail = [error](const char *why) -> std::optional<Message>
            {
                if (error)
                    *error = why;
                return std::nullopt;
            };

            nlohmann::ordered_json j;
            try
            {
                j = nlohmann::ordered_json::parse(s);
            }
            catch (const nlohmann::json::parse_error &)
            {
                return fail("invalid JSON");
            }

            if (!j.is_object())
                return fail("frame is not a JSON object");

            auto msg = from_record(j);
            if (!msg)
                return fail("missing or empty username/message");

            return msg;
        }

        /// Serialize for the wire (compact, no storage id).
        static std::string serialize(const Message &m)
        {
            return m.to_record().dump();
        }
    };

} // namespace chatrelay

#endif // CHATRELAY_PROTOCOL_HPP
