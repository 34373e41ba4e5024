#include <chatrelay/websocket.hpp>
#include <chatrelay/session.hpp>

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include <boost/asio/strand.hpp>

#include <vix/utils/Logger.hpp>

#if defined(__linux__)
#include <pthread.h>
#include <sched.h>
#endif

namespace chatrelay
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace
    {
        void set_affinity(std::size_t thread_index)
        {
#ifdef __linux__
            unsigned int hc = std::thread::hardware_concurrency();
            if (hc == 0u)
                hc = 1u;

            const unsigned int cpu =
                static_cast<unsigned int>(thread_index % static_cast<std::size_t>(hc));

            cpu_set_t cpuset;
            CPU_ZERO(&cpuset);
            CPU_SET(cpu, &cpuset);

            (void)pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
#else
            (void)thread_index;
#endif
        }
    }

    LowLevelServer::LowLevelServer(const Config &cfg, std::shared_ptr<Router> router)
        : cfg_(cfg),
          router_(std::move(router)),
          ioContext_(std::make_shared<net::io_context>()),
          acceptor_(nullptr),
          ioThreads_(),
          stopRequested_(false)
    {
        const int port = cfg_.port;
        if (port != 0 && (port < 1024 || port > 65535))
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][Server] Port {} out of range (0 or 1024-65535)", port);
            throw std::invalid_argument("Invalid WebSocket port");
        }

        init_acceptor(cfg_.bindAddress, static_cast<unsigned short>(port));

        logger.log(Logger::Level::INFO,
                   "[Relay][Server] Config -> maxMessageSize={} idleTimeout={}s pingInterval={}s maxPendingWrites={}",
                   cfg_.maxMessageSize,
                   cfg_.idleTimeout.count(),
                   cfg_.pingInterval.count(),
                   cfg_.maxPendingWrites);
    }

    LowLevelServer::~LowLevelServer()
    {
        stop_async();
        join_threads();
    }

    void LowLevelServer::init_acceptor(const std::string &address, unsigned short port)
    {
        acceptor_ = std::make_unique<tcp::acceptor>(*ioContext_);
        boost::system::error_code ec;

        auto ip = net::ip::make_address(address, ec);
        if (ec)
            throw std::system_error(ec, "bind address");

        tcp::endpoint endpoint(ip, port);
        acceptor_->open(endpoint.protocol(), ec);
        if (ec)
            throw std::system_error(ec, "open acceptor");

        acceptor_->set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::system_error(ec, "reuse_address");

        acceptor_->bind(endpoint, ec);
        if (ec)
            throw std::system_error(ec, "bind acceptor");

        acceptor_->listen(net::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::system_error(ec, "listen acceptor");

        logger.log(Logger::Level::INFO,
                   "[Relay][Server] Listening on {}:{}", address, bound_port());
    }

    unsigned short LowLevelServer::bound_port() const
    {
        boost::system::error_code ec;
        auto ep = acceptor_->local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void LowLevelServer::run()
    {
        start_accept();
        start_io_threads();
    }

    void LowLevelServer::start_accept()
    {
        acceptor_->async_accept(
            net::make_strand(*ioContext_),
            [this](boost::system::error_code ec, tcp::socket socket)
            {
                if (ec)
                {
                    if (!stopRequested_ && ec != net::error::operation_aborted)
                    {
                        logger.log(Logger::Level::WARN,
                                   "[Relay][Server] Accept error: {}", ec.message());
                    }
                }
                else if (!stopRequested_)
                {
                    handle_client(std::move(socket));
                }

                if (!stopRequested_)
                {
                    start_accept();
                }
            });
    }

    void LowLevelServer::handle_client(tcp::socket socket)
    {
        auto session = std::make_shared<Session>(
            std::move(socket), // move into ws::stream
            cfg_,
            router_);

        session->run();
    }

    std::size_t LowLevelServer::compute_io_thread_count() const
    {
        if (cfg_.ioThreads > 0)
            return cfg_.ioThreads;

        const unsigned int hc = std::thread::hardware_concurrency();
        const unsigned int v = (hc != 0u) ? (hc / 2u) : 1u;
        return static_cast<std::size_t>(std::max(1u, v));
    }

    void LowLevelServer::start_io_threads()
    {
        const std::size_t n = compute_io_thread_count();
        ioThreads_.reserve(n);

        for (std::size_t i = 0; i < n; ++i)
        {
            ioThreads_.emplace_back([this, i]()
                                    {
        try
        {
            set_affinity(i);
            ioContext_->run();
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][Server] IO thread {} error: {}", i, e.what());
        }

        logger.log(Logger::Level::INFO,
                   "[Relay][Server] IO thread {} finished", i); });
        }
    }

    void LowLevelServer::stop_async()
    {
        stopRequested_.store(true);

        if (acceptor_ && acceptor_->is_open())
        {
            boost::system::error_code ec;
            acceptor_->close(ec);
        }

        ioContext_->stop();
    }

    void LowLevelServer::join_threads()
    {
        for (auto &t : ioThreads_)
        {
            if (t.joinable())
                t.join();
        }
    }

} // namespace chatrelay
