#include <chatrelay/SqliteMessageStore.hpp>

#include <iomanip>
#include <sstream>
#include <utility>

#include <sqlite3.h>

#include <vix/utils/Logger.hpp>

namespace chatrelay
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    // ───────────────────────── Helpers internes ─────────────────────────

    namespace
    {
        /// Finalizes a prepared statement on scope exit.
        struct StatementGuard
        {
            sqlite3_stmt *stmt{nullptr};

            StatementGuard() = default;
            StatementGuard(const StatementGuard &) = delete;
            StatementGuard &operator=(const StatementGuard &) = delete;

            ~StatementGuard()
            {
                if (stmt)
                    sqlite3_finalize(stmt);
            }
        };

        std::string column_text(sqlite3_stmt *stmt, int col)
        {
            const unsigned char *txt = sqlite3_column_text(stmt, col);
            return txt ? std::string(reinterpret_cast<const char *>(txt)) : std::string{};
        }

        /// Busy/locked means the database is reachable but contended.
        bool is_contention(int rc) noexcept
        {
            const int primary = rc & 0xff;
            return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
        }
    } // namespace

    // ───────────────────────── Ctor / Dtor ─────────────────────────

    SqliteMessageStore::SqliteMessageStore(std::string db_path,
                                           std::chrono::milliseconds timeout)
        : dbPath_(std::move(db_path)),
          timeout_(timeout)
    {
    }

    SqliteMessageStore::~SqliteMessageStore()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        close_locked();
    }

    void SqliteMessageStore::open_locked()
    {
        if (db_)
            return;

        sqlite3 *db = nullptr;
        int rc = sqlite3_open_v2(dbPath_.c_str(), &db,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteMessageStore] Failed to open DB '" + dbPath_ + "': ";
            msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            if (db)
                sqlite3_close_v2(db);
            throw StoreUnavailable(msg);
        }

        db_ = db;
        sqlite3_busy_timeout(db_, static_cast<int>(timeout_.count()));

        // Activer WAL
        {
            char *errmsg = nullptr;
            rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errmsg);
            if (rc != SQLITE_OK)
            {
                std::string msg = "[SqliteMessageStore] Failed to set WAL: ";
                if (errmsg)
                {
                    msg += errmsg;
                    sqlite3_free(errmsg);
                }
                close_locked();
                throw StoreUnavailable(msg);
            }
        }

        init_schema_locked();

        logger.log(Logger::Level::INFO,
                   "[Relay][SqliteMessageStore] Opened {} (busy timeout {} ms)",
                   dbPath_, timeout_.count());
    }

    void SqliteMessageStore::close_locked() noexcept
    {
        if (db_)
        {
            sqlite3_close_v2(db_);
            db_ = nullptr;
        }
    }

    void SqliteMessageStore::init_schema_locked()
    {
        const char *sql =
            "CREATE TABLE IF NOT EXISTS messages ("
            "  id       TEXT PRIMARY KEY,"
            "  date     TEXT NOT NULL,"
            "  username TEXT NOT NULL,"
            "  message  TEXT NOT NULL"
            ");";

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[SqliteMessageStore] Failed to create table: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }
            close_locked();
            throw StoreUnavailable(msg);
        }
    }

    void SqliteMessageStore::fail_locked(int rc, const char *stage)
    {
        std::string msg = "[SqliteMessageStore] ";
        msg += stage;
        msg += " error: ";
        msg += db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);

        // Anything other than contention may mean the file went away; reopen next time.
        if (!is_contention(rc))
            close_locked();

        throw StoreUnavailable(msg);
    }

    // ───────────────────────── ID helper ─────────────────────────

    std::string SqliteMessageStore::generate_id_locked()
    {
        // Microseconds since epoch, zero-padded for lexicographic order, bumped
        // so that two inserts within the same microsecond stay distinct.
        using clock = std::chrono::system_clock;
        auto now = clock::now().time_since_epoch();
        std::int64_t micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();

        if (micros <= lastIdMicros_)
            micros = lastIdMicros_ + 1;
        lastIdMicros_ = micros;

        std::ostringstream oss;
        oss << std::setw(20) << std::setfill('0') << micros;
        return oss.str();
    }

    // ───────────────────────── insert() ─────────────────────────

    Message SqliteMessageStore::insert(const Message &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_locked();

        Message m = msg;
        m.storageId = generate_id_locked();

        const char *sql =
            "INSERT INTO messages (id, date, username, message) "
            "VALUES (?1, ?2, ?3, ?4);";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
            fail_locked(rc, "prepare insert");

        sqlite3_bind_text(guard.stmt, 1, m.storageId->c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 2, m.date.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 3, m.username.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(guard.stmt, 4, m.body.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_DONE)
            fail_locked(rc, "step insert");

        return m;
    }

    // ───────────────────────── latest() ─────────────────────────

    std::vector<Message> SqliteMessageStore::latest(std::size_t limit)
    {
        std::vector<Message> out;
        if (limit == 0)
            return out;

        std::lock_guard<std::mutex> lock(mutex_);
        open_locked();

        const char *sql =
            "SELECT id, date, username, message "
            "FROM messages "
            "ORDER BY id DESC "
            "LIMIT ?1;";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
            fail_locked(rc, "prepare latest");

        sqlite3_bind_int64(guard.stmt, 1, static_cast<sqlite3_int64>(limit));

        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            Message m;
            m.storageId = column_text(guard.stmt, 0);
            m.date = column_text(guard.stmt, 1);
            m.username = column_text(guard.stmt, 2);
            m.body = column_text(guard.stmt, 3);
            out.push_back(std::move(m));
        }

        if (rc != SQLITE_DONE)
            fail_locked(rc, "step latest");

        return out; // newest-first
    }

    // ───────────────────────── count() ─────────────────────────

    std::size_t SqliteMessageStore::count()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_locked();

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM messages;", -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
            fail_locked(rc, "prepare count");

        rc = sqlite3_step(guard.stmt);
        if (rc != SQLITE_ROW)
            fail_locked(rc, "step count");

        return static_cast<std::size_t>(sqlite3_column_int64(guard.stmt, 0));
    }

} // namespace chatrelay
