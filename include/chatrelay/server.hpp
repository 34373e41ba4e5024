#ifndef CHATRELAY_SERVER_HPP
#define CHATRELAY_SERVER_HPP

#include <memory>
#include <string>

#include <boost/system/error_code.hpp>

#include <vix/utils/Logger.hpp>

#include <chatrelay/config.hpp>
#include <chatrelay/ConnectionRegistry.hpp>
#include <chatrelay/MessageIngest.hpp>
#include <chatrelay/Metrics.hpp>
#include <chatrelay/router.hpp>
#include <chatrelay/session.hpp>
#include <chatrelay/websocket.hpp>

namespace chatrelay
{
    /**
     * @brief WebSocket front of the relay.
     *
     * Wires session events to the core: a completed handshake adds the
     * session to the registry, a closed session is removed, and every inbound
     * frame goes to MessageIngest on the session's own read loop.
     */
    class Server
    {
    public:
        Server(const Config &cfg,
               ConnectionRegistry &registry,
               MessageIngest &ingest,
               RelayMetrics *metrics = nullptr)
            : cfg_(cfg),
              registry_(registry),
              ingest_(ingest),
              metrics_(metrics),
              router_(std::make_shared<Router>()),
              engine_(cfg_, router_)
        {
            router_->on_open(
                [this](Session &s)
                {
                    registry_.add(s.shared_from_this());
                    if (metrics_)
                    {
                        metrics_->connections_total++;
                        metrics_->connections_active++;
                    }
                });

            router_->on_close(
                [this](Session &s)
                {
                    if (registry_.remove(s.id()))
                    {
                        vix::utils::Logger::getInstance().log(vix::utils::Logger::Level::DEBUG,
                                                              "[Relay][Server] Connection {} left", s.id());
                    }
                    if (metrics_)
                        metrics_->connections_active--;
                });

            router_->on_error(
                [](Session &s, const boost::system::error_code &ec)
                {
                    vix::utils::Logger::getInstance().log(vix::utils::Logger::Level::WARN,
                                                          "[Relay][Server] Connection {} failed before opening: {}",
                                                          s.id(), ec.message());
                });

            router_->on_message(
                [this](Session &s, std::string payload)
                {
                    ingest_.on_frame(s.id(), payload);
                });
        }

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        void start()
        {
            vix::utils::Logger::getInstance().log(vix::utils::Logger::Level::INFO,
                                                  "[Relay] start() called on port {}", port());
            engine_.run();
        }

        void stop()
        {
            engine_.stop_async();
            engine_.join_threads();
        }

        /// Bound port (the real one when configured with port 0).
        unsigned short port() const
        {
            return engine_.bound_port();
        }

    private:
        Config cfg_;
        ConnectionRegistry &registry_;
        MessageIngest &ingest_;
        RelayMetrics *metrics_;
        std::shared_ptr<Router> router_;
        LowLevelServer engine_;
    };

} // namespace chatrelay

#endif // CHATRELAY_SERVER_HPP
