#ifndef CHATRELAY_SESSION_HPP
#define CHATRELAY_SESSION_HPP

/**
 * @file session.hpp
 * @brief Per-connection WebSocket session.
 *
 * Responsibilities:
 *  - Perform the WebSocket handshake.
 *  - Configure WS options (timeouts, max message size, deflate...).
 *  - Run the read loop, one frame at a time, dispatching to the Router.
 *  - Queue outbound text frames from any thread, one write in flight.
 *  - Report close to the Router exactly once, whichever path closes first.
 */

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <chatrelay/Connection.hpp>
#include <chatrelay/config.hpp>
#include <chatrelay/router.hpp>

namespace chatrelay
{
    namespace beast = boost::beast;
    namespace ws = boost::beast::websocket;
    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    class Session : public Connection, public std::enable_shared_from_this<Session>
    {
    public:
        /// `socket` should carry a strand executor; all handlers run on it.
        Session(tcp::socket socket,
                const Config &cfg,
                std::shared_ptr<Router> router);

        ~Session() override = default;

        /// Start handshake then message loop.
        void run();

        ConnectionId id() const noexcept override { return id_; }

        /// Queue a text frame (thread-safe). False once closing or when the
        /// peer has `maxPendingWrites` frames still unsent.
        bool send_text(std::string_view text) override;

        bool is_closing() const noexcept override { return closing_.load(); }

        /// Send a normal close frame (thread-safe).
        void close() override;

    private:
        void do_accept();
        void on_accept(const boost::system::error_code &ec);

        void do_read();
        void on_read(const boost::system::error_code &ec, std::size_t bytes);

        void arm_idle_timer();
        void cancel_idle_timer();
        void on_idle_timeout(const boost::system::error_code &ec);

        void do_enqueue_message(std::string payload);
        void do_write_next();
        void on_write_complete(const boost::system::error_code &ec, std::size_t bytes);
        void drop_queue();

        void do_close(ws::close_reason reason);
        void notify_closed();

    private:
        const ConnectionId id_;

        // The stream owns the socket (NextLayer = tcp::socket)
        ws::stream<tcp::socket> ws_;

        Config cfg_;
        std::shared_ptr<Router> router_;

        beast::flat_buffer buffer_;
        net::steady_timer idleTimer_;

        std::atomic<bool> closing_{false};
        std::atomic<bool> closeNotified_{false};
        std::atomic<std::size_t> pendingWrites_{0};

        // Strand-only: front() is the frame being written.
        std::deque<std::string> writeQueue_;
        bool writeInProgress_ = false;
    };

} // namespace chatrelay

#endif // CHATRELAY_SESSION_HPP
