#ifndef CHATRELAY_CONFIG_HPP
#define CHATRELAY_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Relay configuration.
 *
 * @details
 * Wraps the core `vix::config::Config` into a strongly-typed structure used
 * by the server, sessions and stores. Keeps all knobs in one place instead of
 * scattering literals across the codebase.
 */

#include <cstddef>
#include <chrono>
#include <string>

#include <vix/config/Config.hpp>

namespace chatrelay
{
    /**
     * @struct Config
     * @brief Tunables controlling the relay.
     */
    struct Config
    {
        /// TCP port for WebSocket clients (0 = pick an ephemeral port).
        int port = 9090;

        /// Address the acceptor binds to.
        std::string bindAddress = "0.0.0.0";

        /// Maximum accepted payload size in bytes (larger frames close the connection).
        std::size_t maxMessageSize = 64 * 1024; // 64 KiB

        /// Idle timeout after which an inactive connection is closed (0 = disabled).
        std::chrono::seconds idleTimeout{0};

        /// Enable permessage-deflate compression if client supports it.
        bool enablePerMessageDeflate = true;

        /// Treat ping/pong frames from the peer as activity for `idleTimeout`.
        bool autoPingPong = true;

        /// Interval between server-initiated pings (0 = disabled).
        std::chrono::seconds pingInterval{30};

        /// Frames a session may hold unsent before it is treated as stuck.
        std::size_t maxPendingWrites = 256;

        /// I/O threads driving the io_context (0 = derive from hardware).
        std::size_t ioThreads = 0;

        /// JSON mirror of the message history.
        std::string mirrorPath = "storage/data.json";

        /// SQLite database backing the primary store.
        std::string primaryPath = "storage/messages.db";

        /// Upper bound on how long one primary store call may wait.
        std::chrono::milliseconds primaryTimeout{2000};

        /// HTTP exporter for /metrics and /get_messages.
        bool metricsEnabled = true;
        std::string metricsAddress = "0.0.0.0";
        int metricsPort = 9100;

        /**
         * @brief Build a Config from the core Vix config.
         *
         * Expected keys (optional):
         *  - websocket.port               (int)
         *  - websocket.bind_address       (string)
         *  - websocket.max_message_size   (int, bytes)
         *  - websocket.idle_timeout       (int, seconds, 0 = disabled)
         *  - websocket.enable_deflate     (bool)
         *  - websocket.auto_ping_pong     (bool)
         *  - websocket.ping_interval      (int, seconds)
         *  - websocket.max_pending_writes (int)
         *  - websocket.io_threads         (int)
         *  - storage.mirror_path          (string)
         *  - storage.primary_path         (string)
         *  - storage.primary_timeout_ms   (int, milliseconds)
         *  - metrics.enabled              (bool)
         *  - metrics.address              (string)
         *  - metrics.port                 (int)
         */
        static Config from_core(const vix::config::Config &core);
    };

} // namespace chatrelay

#endif // CHATRELAY_CONFIG_HPP
