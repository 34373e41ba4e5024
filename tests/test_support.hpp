#ifndef CHATRELAY_TEST_SUPPORT_HPP
#define CHATRELAY_TEST_SUPPORT_HPP

#include <atomic>
#include <functional>
#include <filesystem>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <chatrelay/Connection.hpp>
#include <chatrelay/MessageStore.hpp>

namespace chatrelay::testing
{
    /// Scratch directory removed at scope exit.
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() /
                    ("chatrelay_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }
        std::filesystem::path file(const std::string &name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    /// In-memory connection recording every frame it is asked to send.
    class FakeConnection : public Connection
    {
    public:
        enum class Mode
        {
            Healthy,
            Refuse, // send_text returns false
            Throw   // send_text throws
        };

        explicit FakeConnection(ConnectionId id, Mode mode = Mode::Healthy)
            : id_(id), mode_(mode)
        {
        }

        ConnectionId id() const noexcept override { return id_; }

        bool send_text(std::string_view text) override
        {
            if (mode_ == Mode::Throw)
                throw std::runtime_error("broken pipe");
            if (mode_ == Mode::Refuse || closed_)
                return false;

            {
                std::lock_guard<std::mutex> lock(mutex_);
                frames_.emplace_back(text);
            }
            if (afterSend_)
                afterSend_(text);
            return true;
        }

        bool is_closing() const noexcept override { return closed_; }

        void close() override { closed_ = true; }

        /// Runs on the sending thread after each accepted frame. Set before use.
        void after_send(std::function<void(std::string_view)> fn) { afterSend_ = std::move(fn); }

        void set_mode(Mode mode) { mode_ = mode; }
        bool closed() const { return closed_; }

        std::vector<std::string> frames() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return frames_;
        }

    private:
        ConnectionId id_;
        std::atomic<Mode> mode_;
        std::atomic<bool> closed_{false};
        mutable std::mutex mutex_;
        std::vector<std::string> frames_;
        std::function<void(std::string_view)> afterSend_;
    };

    /// Primary store double that counts calls and can be switched off.
    class FakePrimaryStore : public IPrimaryStore
    {
    public:
        Message insert(const Message &msg) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++insertCalls_;
            if (unavailable_)
                throw StoreUnavailable("connection refused");

            Message m = msg;
            m.storageId = "id-" + std::to_string(stored_.size() + 1);
            stored_.push_back(m);
            return m;
        }

        std::vector<Message> latest(std::size_t limit) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<Message> out;
            for (auto it = stored_.rbegin(); it != stored_.rend() && out.size() < limit; ++it)
                out.push_back(*it);
            return out;
        }

        std::size_t count() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return stored_.size();
        }

        void set_unavailable(bool v) { unavailable_ = v; }
        std::size_t insert_calls() const { return insertCalls_; }

    private:
        std::mutex mutex_;
        std::vector<Message> stored_;
        std::atomic<bool> unavailable_{false};
        std::atomic<std::size_t> insertCalls_{0};
    };

} // namespace chatrelay::testing

#endif // CHATRELAY_TEST_SUPPORT_HPP
