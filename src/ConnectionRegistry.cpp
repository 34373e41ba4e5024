#include <chatrelay/ConnectionRegistry.hpp>

namespace chatrelay
{
    bool ConnectionRegistry::add(const std::shared_ptr<Connection> &conn)
    {
        if (!conn)
            return false;

        std::lock_guard<std::mutex> lock(mutex_);
        cleanup_expired_locked();

        auto [it, inserted] = members_.try_emplace(conn->id(), conn);
        (void)it;
        return inserted;
    }

    bool ConnectionRegistry::remove(ConnectionId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return members_.erase(id) > 0;
    }

    std::vector<std::shared_ptr<Connection>> ConnectionRegistry::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::shared_ptr<Connection>> out;
        out.reserve(members_.size());

        for (const auto &[id, weak] : members_)
        {
            (void)id;
            if (auto sp = weak.lock())
            {
                out.push_back(std::move(sp));
            }
        }
        return out;
    }

    bool ConnectionRegistry::contains(ConnectionId id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = members_.find(id);
        return it != members_.end() && !it->second.expired();
    }

    std::size_t ConnectionRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::size_t n = 0;
        for (const auto &[id, weak] : members_)
        {
            (void)id;
            if (!weak.expired())
                ++n;
        }
        return n;
    }

    void ConnectionRegistry::cleanup_expired_locked()
    {
        for (auto it = members_.begin(); it != members_.end();)
        {
            if (it->second.expired())
            {
                it = members_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

} // namespace chatrelay
