#include <chatrelay/MirrorStore.hpp>

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <vix/utils/Logger.hpp>

namespace chatrelay
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace fs = std::filesystem;

    MirrorStore::MirrorStore(fs::path path)
        : path_(std::move(path)),
          mutex_()
    {
    }

    bool MirrorStore::ensure_initialized()
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::error_code ec;
        if (fs::exists(path_, ec))
            return true;

        logger.log(Logger::Level::INFO,
                   "[Relay][MirrorStore] Creating empty history at {}", path_.string());
        return write_array_locked(nlohmann::ordered_json::array());
    }

    bool MirrorStore::append(const Message &msg)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        nlohmann::ordered_json records = read_array_locked();
        records.push_back(msg.to_record());

        return write_array_locked(records);
    }

    std::vector<Message> MirrorStore::load() const
    {
        nlohmann::ordered_json records;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            records = read_array_locked();
        }

        std::vector<Message> out;
        out.reserve(records.size());

        for (const auto &rec : records)
        {
            if (auto m = Message::from_record(rec))
            {
                out.push_back(std::move(*m));
            }
        }
        return out;
    }

    std::string MirrorStore::history_json() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return read_array_locked().dump();
    }

    nlohmann::ordered_json MirrorStore::read_array_locked() const
    {
        std::ifstream in(path_);
        if (!in)
            return nlohmann::ordered_json::array();

        std::ostringstream buf;
        buf << in.rdbuf();

        try
        {
            auto j = nlohmann::ordered_json::parse(buf.str());
            if (j.is_array())
                return j;

            logger.log(Logger::Level::WARN,
                       "[Relay][MirrorStore] {} does not hold an array, starting a fresh history",
                       path_.string());
        }
        catch (const nlohmann::json::parse_error &e)
        {
            logger.log(Logger::Level::WARN,
                       "[Relay][MirrorStore] {} is corrupt ({}), starting a fresh history",
                       path_.string(), e.what());
        }

        return nlohmann::ordered_json::array();
    }

    bool MirrorStore::write_array_locked(const nlohmann::ordered_json &records)
    {
        std::error_code ec;

        if (path_.has_parent_path())
        {
            fs::create_directories(path_.parent_path(), ec);
            if (ec)
            {
                logger.log(Logger::Level::ERROR,
                           "[Relay][MirrorStore] Cannot create {}: {}",
                           path_.parent_path().string(), ec.message());
                return false;
            }
        }

        // Write beside the artifact, then rename over it.
        fs::path tmp = path_;
        tmp += ".tmp";

        {
            std::ofstream out(tmp, std::ios::out | std::ios::trunc);
            if (!out)
            {
                logger.log(Logger::Level::ERROR,
                           "[Relay][MirrorStore] Cannot open {} for writing", tmp.string());
                return false;
            }

            out << records.dump(4) << '\n';
            out.flush();
            if (!out)
            {
                logger.log(Logger::Level::ERROR,
                           "[Relay][MirrorStore] Write to {} failed", tmp.string());
                fs::remove(tmp, ec);
                return false;
            }
        }

        fs::rename(tmp, path_, ec);
        if (ec)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][MirrorStore] Cannot replace {}: {}",
                       path_.string(), ec.message());
            std::error_code ignore;
            fs::remove(tmp, ignore);
            return false;
        }

        return true;
    }

} // namespace chatrelay
