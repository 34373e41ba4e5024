#ifndef CHATRELAY_CONNECTION_HPP
#define CHATRELAY_CONNECTION_HPP

#include <cstdint>
#include <string_view>

namespace chatrelay
{
    using ConnectionId = std::uint64_t;

    /**
     * @brief A live duplex channel to one client, as seen by the broadcast path.
     *
     * Session is the network implementation; tests provide their own.
     */
    class Connection
    {
    public:
        virtual ~Connection() = default;

        /// Process-unique identity, stable for the connection's lifetime.
        virtual ConnectionId id() const noexcept = 0;

        /// Queue a text frame. Returns false if the connection can no longer
        /// deliver (closing, or too many frames still waiting to be written).
        virtual bool send_text(std::string_view text) = 0;

        /// True once the connection has started an orderly close.
        virtual bool is_closing() const noexcept = 0;

        /// Start closing the connection. Safe to call more than once.
        virtual void close() = 0;
    };

} // namespace chatrelay

#endif // CHATRELAY_CONNECTION_HPP
