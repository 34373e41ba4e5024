#include <chatrelay/MessageIngest.hpp>

#include <utility>

#include <vix/utils/Logger.hpp>

namespace chatrelay
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    MessageIngest::MessageIngest(BroadcastCoordinator &coordinator,
                                 RelayMetrics *metrics,
                                 Clock clock)
        : coordinator_(coordinator),
          metrics_(metrics),
          clock_(std::move(clock))
    {
    }

    bool MessageIngest::on_frame(ConnectionId origin, std::string_view frame)
    {
        if (metrics_)
            metrics_->messages_in_total++;

        std::string why;
        auto msg = Message::parse(frame, &why);
        if (!msg)
        {
            logger.log(Logger::Level::WARN,
                       "[Relay][Ingest] Skipping malformed frame from connection {} ({} bytes): {}",
                       origin, frame.size(), why);
            if (metrics_)
                metrics_->messages_rejected_total++;
            return false;
        }

        msg->date = clock_();
        msg->storageId.reset();

        coordinator_.handle(std::move(*msg));
        return true;
    }

} // namespace chatrelay
