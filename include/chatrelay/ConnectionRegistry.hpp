#ifndef CHATRELAY_CONNECTION_REGISTRY_HPP
#define CHATRELAY_CONNECTION_REGISTRY_HPP

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <chatrelay/Connection.hpp>

namespace chatrelay
{
    /**
     * @brief Set of currently open client connections.
     *
     * Constructed once per process and shared by reference between the server
     * (open/close) and the broadcast coordinator (fan-out, eviction). Members
     * are held weakly: the transport owns the connection, the registry only
     * tracks membership.
     */
    class ConnectionRegistry
    {
    public:
        ConnectionRegistry() = default;

        ConnectionRegistry(const ConnectionRegistry &) = delete;
        ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

        /// Insert a connection. Returns false if it was already a member.
        bool add(const std::shared_ptr<Connection> &conn);

        /// Remove a connection. Returns false if it was not a member.
        bool remove(ConnectionId id);

        /// Copy of the live members, safe to iterate while others add/remove.
        [[nodiscard]] std::vector<std::shared_ptr<Connection>> snapshot() const;

        [[nodiscard]] bool contains(ConnectionId id) const;
        [[nodiscard]] std::size_t size() const;

    private:
        void cleanup_expired_locked();

        mutable std::mutex mutex_;
        std::unordered_map<ConnectionId, std::weak_ptr<Connection>> members_;
    };

} // namespace chatrelay

#endif // CHATRELAY_CONNECTION_REGISTRY_HPP
