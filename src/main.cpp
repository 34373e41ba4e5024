#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <vix/config/Config.hpp>
#include <vix/utils/Logger.hpp>

#include <chatrelay/BroadcastCoordinator.hpp>
#include <chatrelay/ConnectionRegistry.hpp>
#include <chatrelay/MessageIngest.hpp>
#include <chatrelay/Metrics.hpp>
#include <chatrelay/MirrorStore.hpp>
#include <chatrelay/SqliteMessageStore.hpp>
#include <chatrelay/config.hpp>
#include <chatrelay/server.hpp>

int main(int argc, char **argv)
{
    using Logger = vix::utils::Logger;
    auto &logger = Logger::getInstance();

    try
    {
        // ------------------------------------------------------------
        // 1) Load configuration
        // ------------------------------------------------------------
        const std::string configPath = (argc > 1) ? argv[1] : "config/config.json";
        vix::config::Config coreConfig{configPath};
        const auto cfg = chatrelay::Config::from_core(coreConfig);

        // ------------------------------------------------------------
        // 2) Stores
        // ------------------------------------------------------------
        chatrelay::RelayMetrics metrics;

        chatrelay::MirrorStore mirror{cfg.mirrorPath};
        if (!mirror.ensure_initialized())
        {
            logger.log(Logger::Level::WARN,
                       "[main] Could not create {}, history starts on first append", cfg.mirrorPath);
        }

        auto primary = std::make_shared<chatrelay::SqliteMessageStore>(cfg.primaryPath, cfg.primaryTimeout);
        try
        {
            logger.log(Logger::Level::INFO,
                       "[main] Primary store holds {} message(s)", primary->count());
        }
        catch (const chatrelay::StoreUnavailable &e)
        {
            logger.log(Logger::Level::WARN,
                       "[main] Primary store not reachable yet: {}", e.what());
        }

        // ------------------------------------------------------------
        // 3) Core pipeline, one registry for the whole process
        // ------------------------------------------------------------
        chatrelay::ConnectionRegistry registry;
        chatrelay::BroadcastCoordinator coordinator{registry, primary, mirror, &metrics};
        chatrelay::MessageIngest ingest{coordinator, &metrics};

        chatrelay::Server server{cfg, registry, ingest, &metrics};

        if (cfg.metricsEnabled)
        {
            std::thread([&metrics, &mirror, cfg]()
                        { chatrelay::run_http_exporter(metrics, mirror, cfg.metricsAddress,
                                                       static_cast<std::uint16_t>(cfg.metricsPort)); })
                .detach();
        }

        // ------------------------------------------------------------
        // 4) Run until SIGINT / SIGTERM
        // ------------------------------------------------------------
        boost::asio::io_context signalsContext{1};
        boost::asio::signal_set signals{signalsContext, SIGINT, SIGTERM};
        signals.async_wait(
            [&logger](const boost::system::error_code &ec, int signo)
            {
                if (!ec)
                {
                    logger.log(Logger::Level::INFO,
                               "[main] Signal {} received, shutting down", signo);
                }
            });

        server.start();
        signalsContext.run();
        server.stop();

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
