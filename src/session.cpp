#include <chatrelay/session.hpp>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace chatrelay
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace
    {
        std::atomic<ConnectionId> nextSessionId{1};
    }

    Session::Session(tcp::socket socket,
                     const Config &cfg,
                     std::shared_ptr<Router> router)
        : id_(nextSessionId.fetch_add(1)),
          ws_(std::move(socket)),
          cfg_(cfg),
          router_(std::move(router)),
          buffer_(),
          idleTimer_(ws_.get_executor()),
          writeQueue_(),
          writeInProgress_(false)
    {
        {
            boost::system::error_code ec;
            ws_.next_layer().set_option(tcp::no_delay(true), ec);
        }

        ws_.read_message_max(cfg_.maxMessageSize);

        auto timeouts = ws::stream_base::timeout::suggested(beast::role_type::server);
        if (cfg_.pingInterval.count() > 0)
        {
            // Beast pings after half the idle period and drops peers that stay silent.
            timeouts.idle_timeout = cfg_.pingInterval * 2;
            timeouts.keep_alive_pings = true;
        }
        ws_.set_option(timeouts);

        if (cfg_.enablePerMessageDeflate)
        {
            ws::permessage_deflate pmd;
            pmd.server_enable = true;
            ws_.set_option(pmd);
        }

        if (cfg_.autoPingPong)
        {
            // Pings and pongs count as activity for the idle timer.
            ws_.control_callback(
                [this](ws::frame_type kind, beast::string_view)
                {
                    if (kind != ws::frame_type::close && !closing_)
                        arm_idle_timer();
                });
        }
    }

    void Session::run()
    {
        logger.log(Logger::Level::DEBUG, "[Relay][Session] {} starting handshake", id_);

        // Start on the session's strand.
        net::dispatch(ws_.get_executor(),
                      [self = shared_from_this()]()
                      {
                          self->do_accept();
                      });
    }

    void Session::do_accept()
    {
        auto self = shared_from_this();

        ws_.async_accept(
            [this, self](const boost::system::error_code &ec)
            {
                on_accept(ec);
            });
    }

    void Session::on_accept(const boost::system::error_code &ec)
    {
        if (ec)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][Session] {} accept failed: {}", id_, ec.message());
            closing_ = true;
            if (router_)
                router_->handle_error(*this, ec);
            return;
        }

        logger.log(Logger::Level::INFO, "[Relay][Session] {} handshake OK", id_);

        if (router_)
            router_->handle_open(*this);

        arm_idle_timer();
        do_read();
    }

    void Session::do_read()
    {
        auto self = shared_from_this();

        ws_.async_read(
            buffer_,
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_read(ec, bytes);
            });
    }

    void Session::on_read(const boost::system::error_code &ec, std::size_t bytes)
    {
        cancel_idle_timer();

        if (ec)
        {
            if (ec == ws::error::closed)
            {
                logger.log(Logger::Level::INFO,
                           "[Relay][Session] {} closed by client", id_);
            }
            else if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[Relay][Session] {} read error: {}", id_, ec.message());
            }

            closing_ = true;
            drop_queue();
            notify_closed();
            return;
        }

        logger.log(Logger::Level::DEBUG,
                   "[Relay][Session] {} received {} bytes", id_, bytes);

        auto data = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        // The next read starts only after this frame has been fully handled.
        if (router_)
        {
            router_->handle_message(*this, std::move(data));
        }

        if (!closing_)
        {
            arm_idle_timer();
            do_read();
        }
    }

    void Session::arm_idle_timer()
    {
        if (cfg_.idleTimeout.count() <= 0)
            return;

        idleTimer_.expires_after(cfg_.idleTimeout);

        auto self = shared_from_this();

        idleTimer_.async_wait(
            [this, self](const boost::system::error_code &ec)
            {
                on_idle_timeout(ec);
            });
    }

    void Session::cancel_idle_timer()
    {
        idleTimer_.cancel();
    }

    void Session::on_idle_timeout(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted)
            return;

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Relay][Session] {} idle timer error: {}", id_, ec.message());
            return;
        }

        logger.log(Logger::Level::WARN,
                   "[Relay][Session] {} idle timeout reached, closing connection", id_);

        do_close(ws::close_reason(ws::close_code::normal));
    }

    bool Session::send_text(std::string_view text)
    {
        if (closing_)
            return false;

        if (pendingWrites_.fetch_add(1) >= cfg_.maxPendingWrites)
        {
            pendingWrites_.fetch_sub(1);
            logger.log(Logger::Level::WARN,
                       "[Relay][Session] {} has {} frames unsent, refusing more",
                       id_, cfg_.maxPendingWrites);
            return false;
        }

        auto self = shared_from_this();
        std::string payload{text};

        net::post(
            ws_.get_executor(),
            [self, payload = std::move(payload)]() mutable
            {
                self->do_enqueue_message(std::move(payload));
            });
        return true;
    }

    void Session::do_enqueue_message(std::string payload)
    {
        if (closing_)
        {
            pendingWrites_.fetch_sub(1);
            return;
        }

        writeQueue_.push_back(std::move(payload));

        if (!writeInProgress_)
        {
            do_write_next();
        }
    }

    void Session::do_write_next()
    {
        if (closing_)
        {
            drop_queue();
            return;
        }

        if (writeQueue_.empty())
        {
            writeInProgress_ = false;
            return;
        }

        writeInProgress_ = true;

        auto self = shared_from_this();

        // front() stays queued until the write completes; it owns the buffer.
        ws_.text(true);
        ws_.async_write(
            net::buffer(writeQueue_.front()),
            [this, self](const boost::system::error_code &ec, std::size_t bytes)
            {
                on_write_complete(ec, bytes);
            });
    }

    void Session::on_write_complete(const boost::system::error_code &ec,
                                    std::size_t bytes)
    {
        if (!writeQueue_.empty())
        {
            writeQueue_.pop_front();
            pendingWrites_.fetch_sub(1);
        }
        writeInProgress_ = false;

        if (ec)
        {
            if (ec != net::error::operation_aborted)
            {
                logger.log(Logger::Level::WARN,
                           "[Relay][Session] {} write error: {}", id_, ec.message());
            }
            closing_ = true;
            drop_queue();

            // Abort the pending read so the read loop ends and reports the close.
            boost::system::error_code ignore;
            ws_.next_layer().close(ignore);
            return;
        }

        logger.log(Logger::Level::DEBUG,
                   "[Relay][Session] {} sent {} bytes", id_, bytes);

        do_write_next();
    }

    void Session::drop_queue()
    {
        // The in-flight frame (if any) is accounted for by on_write_complete.
        std::size_t queued = writeQueue_.size();
        if (writeInProgress_ && queued > 0)
        {
            std::string inFlight = std::move(writeQueue_.front());
            writeQueue_.clear();
            writeQueue_.push_back(std::move(inFlight));
            --queued;
        }
        else
        {
            writeQueue_.clear();
            writeInProgress_ = false;
        }

        pendingWrites_.fetch_sub(queued);
    }

    void Session::close()
    {
        if (closing_)
            return;

        net::post(
            ws_.get_executor(),
            [self = shared_from_this()]()
            {
                self->do_close(ws::close_reason(ws::close_code::normal));
            });
    }

    void Session::do_close(ws::close_reason reason)
    {
        if (closing_.exchange(true))
            return;

        cancel_idle_timer();
        drop_queue();

        auto self = shared_from_this();

        ws_.async_close(
            reason,
            [this, self](const boost::system::error_code &ec)
            {
                if (ec && ec != net::error::operation_aborted)
                {
                    logger.log(Logger::Level::WARN,
                               "[Relay][Session] {} close error: {}", id_, ec.message());
                }

                notify_closed();
            });
    }

    void Session::notify_closed()
    {
        if (closeNotified_.exchange(true))
            return;

        if (router_)
            router_->handle_close(*this);
    }

} // namespace chatrelay
