#ifndef CHATRELAY_SQLITE_MESSAGE_STORE_HPP
#define CHATRELAY_SQLITE_MESSAGE_STORE_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <chatrelay/MessageStore.hpp>
#include <chatrelay/protocol.hpp>

struct sqlite3;

namespace chatrelay
{
    /**
     * @brief SQLite-backed primary store (WAL journal).
     *
     * The database is opened on first use and reopened after a connection-level
     * failure, so an unreachable path surfaces as StoreUnavailable per call
     * instead of failing at startup. Every statement waits at most `timeout`
     * for a locked database.
     */
    class SqliteMessageStore : public IPrimaryStore
    {
    public:
        explicit SqliteMessageStore(std::string db_path,
                                    std::chrono::milliseconds timeout = std::chrono::milliseconds{2000});
        ~SqliteMessageStore() override;

        SqliteMessageStore(const SqliteMessageStore &) = delete;
        SqliteMessageStore &operator=(const SqliteMessageStore &) = delete;
        SqliteMessageStore(SqliteMessageStore &&) = delete;
        SqliteMessageStore &operator=(SqliteMessageStore &&) = delete;

        Message insert(const Message &msg) override;

        [[nodiscard]] std::vector<Message> latest(std::size_t limit) override;

        [[nodiscard]] std::size_t count() override;

    private:
        sqlite3 *db_{nullptr};
        std::string dbPath_;
        std::chrono::milliseconds timeout_;
        std::mutex mutex_;
        std::int64_t lastIdMicros_{0};

        void open_locked();
        void close_locked() noexcept;
        void init_schema_locked();
        [[noreturn]] void fail_locked(int rc, const char *stage);
        std::string generate_id_locked();
    };

} // namespace chatrelay

#endif // CHATRELAY_SQLITE_MESSAGE_STORE_HPP
