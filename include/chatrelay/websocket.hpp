#ifndef CHATRELAY_ENGINE_HPP
#define CHATRELAY_ENGINE_HPP

/**
 * @file websocket.hpp
 * @brief Low-level WebSocket server engine.
 *
 * This component:
 *  - owns the io_context and its I/O threads
 *  - accepts TCP connections, each on its own strand
 *  - creates chatrelay::Session instances for each client
 */

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

#include <chatrelay/config.hpp>
#include <chatrelay/router.hpp>

namespace chatrelay
{
    namespace net = boost::asio;
    namespace beast = boost::beast;
    using tcp = net::ip::tcp;

    class LowLevelServer
    {
    public:
        /// Binds and listens immediately; throws if the port cannot be used.
        LowLevelServer(const Config &cfg, std::shared_ptr<Router> router);

        ~LowLevelServer();

        LowLevelServer(const LowLevelServer &) = delete;
        LowLevelServer &operator=(const LowLevelServer &) = delete;

        /// Start accepting connections and running io_context_ in background threads.
        void run();

        /// Cooperative async stop: close acceptor and stop io_context_.
        void stop_async();

        /// Join all I/O threads.
        void join_threads();

        bool is_stop_requested() const { return stopRequested_.load(); }

        /// Port actually bound (differs from the configured one when that is 0).
        unsigned short bound_port() const;

    private:
        void init_acceptor(const std::string &address, unsigned short port);
        void start_accept();
        void start_io_threads();
        void handle_client(tcp::socket socket);

        std::size_t compute_io_thread_count() const;

    private:
        Config cfg_;
        std::shared_ptr<Router> router_;

        std::shared_ptr<net::io_context> ioContext_;
        std::unique_ptr<tcp::acceptor> acceptor_;
        std::vector<std::thread> ioThreads_;

        std::atomic<bool> stopRequested_{false};
    };

} // namespace chatrelay

#endif // CHATRELAY_ENGINE_HPP
