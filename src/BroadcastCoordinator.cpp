#include <chatrelay/BroadcastCoordinator.hpp>

#include <utility>

#include <vix/utils/Logger.hpp>

namespace chatrelay
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    BroadcastCoordinator::BroadcastCoordinator(ConnectionRegistry &registry,
                                               std::shared_ptr<IPrimaryStore> primary,
                                               MirrorStore &mirror,
                                               RelayMetrics *metrics)
        : registry_(registry),
          primary_(std::move(primary)),
          mirror_(mirror),
          metrics_(metrics)
    {
    }

    BroadcastCoordinator::Result BroadcastCoordinator::handle(Message msg)
    {
        Result result;

        // 1) Validate
        if (!msg.is_valid())
        {
            logger.log(Logger::Level::WARN,
                       "[Relay][Coordinator] Dropping message with empty username or body");
            if (metrics_)
                metrics_->messages_rejected_total++;
            return result;
        }
        result.accepted = true;
        msg.storageId.reset();

        // 2) PersistPrimary
        if (primary_)
        {
            try
            {
                Message stored = primary_->insert(msg);
                result.storageId = stored.storageId;
            }
            catch (const StoreUnavailable &e)
            {
                logger.log(Logger::Level::WARN,
                           "[Relay][Coordinator] Primary store unavailable, continuing without id: {}",
                           e.what());
                if (metrics_)
                    metrics_->primary_failures_total++;
            }
        }

        std::lock_guard<std::mutex> sequence(sequenceMutex_);

        // 3) Mirror (record never carries the storage id)
        result.mirrored = mirror_.append(msg);
        if (!result.mirrored)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][Coordinator] Mirror append failed for message from {}",
                       msg.username);
            if (metrics_)
                metrics_->mirror_failures_total++;
        }

        // 4) Fan-out
        result.delivered = fan_out(Message::serialize(msg), result);

        logger.log(Logger::Level::DEBUG,
                   "[Relay][Coordinator] Message from {} delivered to {} connection(s), {} evicted",
                   msg.username, result.delivered, result.evicted);

        return result;
    }

    std::size_t BroadcastCoordinator::fan_out(const std::string &frame, Result &result)
    {
        std::size_t delivered = 0;

        for (auto &conn : registry_.snapshot())
        {
            bool ok = false;
            try
            {
                ok = conn->send_text(frame);
            }
            catch (const std::exception &e)
            {
                logger.log(Logger::Level::WARN,
                           "[Relay][Coordinator] Send to connection {} threw: {}",
                           conn->id(), e.what());
            }

            if (ok)
            {
                ++delivered;
                if (metrics_)
                    metrics_->messages_out_total++;
                continue;
            }

            if (conn->is_closing())
            {
                // Already leaving on its own; its close notification does the rest.
                logger.log(Logger::Level::DEBUG,
                           "[Relay][Coordinator] Skipping connection {}, it is closing",
                           conn->id());
                registry_.remove(conn->id());
                continue;
            }

            logger.log(Logger::Level::WARN,
                       "[Relay][Coordinator] Failed to send to connection {}, evicting",
                       conn->id());

            if (registry_.remove(conn->id()))
            {
                ++result.evicted;
                if (metrics_)
                    metrics_->evictions_total++;
            }
            conn->close();
        }

        return delivered;
    }

} // namespace chatrelay
