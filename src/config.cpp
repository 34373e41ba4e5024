#include <chatrelay/config.hpp>

#include <algorithm>

namespace chatrelay
{
    Config Config::from_core(const vix::config::Config &core)
    {
        Config cfg;

        if (core.has("websocket.port"))
        {
            cfg.port = core.getInt("websocket.port", cfg.port);
        }

        if (core.has("websocket.bind_address"))
        {
            cfg.bindAddress = core.getString("websocket.bind_address", cfg.bindAddress);
        }

        if (core.has("websocket.max_message_size"))
        {
            auto v = core.getInt("websocket.max_message_size", static_cast<int>(cfg.maxMessageSize));
            cfg.maxMessageSize = static_cast<std::size_t>(std::max(1024, v)); // min 1 KiB
        }

        if (core.has("websocket.idle_timeout"))
        {
            auto v = core.getInt("websocket.idle_timeout", static_cast<int>(cfg.idleTimeout.count()));
            if (v <= 0)
                cfg.idleTimeout = std::chrono::seconds{0};
            else
                cfg.idleTimeout = std::chrono::seconds(std::max(5, v)); // min 5s
        }

        if (core.has("websocket.enable_deflate"))
        {
            cfg.enablePerMessageDeflate = core.getBool("websocket.enable_deflate", cfg.enablePerMessageDeflate);
        }

        if (core.has("websocket.ping_interval"))
        {
            auto v = core.getInt("websocket.ping_interval", static_cast<int>(cfg.pingInterval.count()));
            if (v <= 0)
                cfg.pingInterval = std::chrono::seconds{0};
            else
                cfg.pingInterval = std::chrono::seconds(v);
        }

        if (core.has("websocket.auto_ping_pong"))
        {
            cfg.autoPingPong = core.getBool("websocket.auto_ping_pong", cfg.autoPingPong);
        }

        if (core.has("websocket.max_pending_writes"))
        {
            auto v = core.getInt("websocket.max_pending_writes", static_cast<int>(cfg.maxPendingWrites));
            cfg.maxPendingWrites = static_cast<std::size_t>(std::max(1, v));
        }

        if (core.has("websocket.io_threads"))
        {
            auto v = core.getInt("websocket.io_threads", 0);
            cfg.ioThreads = static_cast<std::size_t>(std::max(0, v));
        }

        if (core.has("storage.mirror_path"))
        {
            cfg.mirrorPath = core.getString("storage.mirror_path", cfg.mirrorPath);
        }

        if (core.has("storage.primary_path"))
        {
            cfg.primaryPath = core.getString("storage.primary_path", cfg.primaryPath);
        }

        if (core.has("storage.primary_timeout_ms"))
        {
            auto v = core.getInt("storage.primary_timeout_ms", static_cast<int>(cfg.primaryTimeout.count()));
            cfg.primaryTimeout = std::chrono::milliseconds(std::max(1, v));
        }

        if (core.has("metrics.enabled"))
        {
            cfg.metricsEnabled = core.getBool("metrics.enabled", cfg.metricsEnabled);
        }

        if (core.has("metrics.address"))
        {
            cfg.metricsAddress = core.getString("metrics.address", cfg.metricsAddress);
        }

        if (core.has("metrics.port"))
        {
            cfg.metricsPort = core.getInt("metrics.port", cfg.metricsPort);
        }

        return cfg;
    }

} // namespace chatrelay
