#include <chatrelay/router.hpp>
#include <chatrelay/session.hpp>

#include <exception>
#include <utility>

#include <vix/utils/Logger.hpp>

namespace chatrelay
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace
    {
        template <typename Handler, typename... Args>
        void guarded(const char *event, const Handler &handler, Session &session, Args &&...args)
        {
            if (!handler)
                return;

            try
            {
                handler(session, std::forward<Args>(args)...);
            }
            catch (const std::exception &e)
            {
                logger.log(Logger::Level::ERROR,
                           "[Relay][Router] {} hook failed for connection {}: {}",
                           event, session.id(), e.what());
            }
        }
    } // namespace

    void Router::handle_open(Session &session) const
    {
        guarded("open", openHandler_, session);
    }

    void Router::handle_close(Session &session) const
    {
        guarded("close", closeHandler_, session);
    }

    void Router::handle_error(Session &session, const boost::system::error_code &ec) const
    {
        guarded("error", errorHandler_, session, ec);
    }

    void Router::handle_message(Session &session, std::string payload) const
    {
        guarded("message", messageHandler_, session, std::move(payload));
    }

} // namespace chatrelay
