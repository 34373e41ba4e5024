#include <chatrelay/SubmissionGateway.hpp>
#include <chatrelay/protocol.hpp>

#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <vix/utils/Logger.hpp>

namespace chatrelay
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace websocket = beast::websocket;
    using tcp = net::ip::tcp;

    SubmissionGateway::SubmissionGateway(std::string host, std::string port, std::string target)
        : host_(std::move(host)),
          port_(std::move(port)),
          target_(std::move(target))
    {
    }

    bool SubmissionGateway::submit(const std::string &username, const std::string &message) const
    {
        Message msg;
        msg.date = utc_timestamp_now();
        msg.username = username;
        msg.body = message;

        try
        {
            net::io_context ioc;
            tcp::resolver resolver{ioc};
            websocket::stream<tcp::socket> ws{ioc};

            auto results = resolver.resolve(host_, port_);
            auto ep = net::connect(ws.next_layer(), results);

            ws.handshake(host_ + ":" + std::to_string(ep.port()), target_);

            ws.text(true);
            ws.write(net::buffer(Message::serialize(msg)));

            ws.close(websocket::close_code::normal);
        }
        catch (const boost::system::system_error &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][Gateway] Error sending message to {}:{}: {}",
                       host_, port_, e.what());
            return false;
        }
        catch (const nlohmann::json::type_error &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Relay][Gateway] Cannot encode message from {}: {}",
                       username, e.what());
            return false;
        }

        logger.log(Logger::Level::DEBUG,
                   "[Relay][Gateway] Submitted message from {}", username);
        return true;
    }

} // namespace chatrelay
