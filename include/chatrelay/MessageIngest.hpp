#ifndef CHATRELAY_MESSAGE_INGEST_HPP
#define CHATRELAY_MESSAGE_INGEST_HPP

#include <functional>
#include <string>
#include <string_view>

#include <chatrelay/BroadcastCoordinator.hpp>
#include <chatrelay/Connection.hpp>
#include <chatrelay/Metrics.hpp>

namespace chatrelay
{
    /**
     * @brief Turns inbound frames into messages for the coordinator.
     *
     * Called from each connection's read loop, one frame at a time. A frame
     * that does not decode is logged and skipped; the connection stays open.
     * Decoded messages get the server's arrival time as `date`, replacing
     * whatever the client sent.
     */
    class MessageIngest
    {
    public:
        using Clock = std::function<std::string()>;

        explicit MessageIngest(BroadcastCoordinator &coordinator,
                               RelayMetrics *metrics = nullptr,
                               Clock clock = &utc_timestamp_now);

        MessageIngest(const MessageIngest &) = delete;
        MessageIngest &operator=(const MessageIngest &) = delete;

        /// Returns true if the frame was decoded and handed to the coordinator.
        bool on_frame(ConnectionId origin, std::string_view frame);

    private:
        BroadcastCoordinator &coordinator_;
        RelayMetrics *metrics_;
        Clock clock_;
    };

} // namespace chatrelay

#endif // CHATRELAY_MESSAGE_INGEST_HPP
