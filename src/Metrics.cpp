#include <chatrelay/Metrics.hpp>
#include <chatrelay/MirrorStore.hpp>

#include <sstream>
#include <string_view>
#include <utility>
#include <system_error>

#include <vix/utils/Logger.hpp>

#include <boost/beast/http.hpp>
#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace chatrelay
{
    using tcp = boost::asio::ip::tcp;
    namespace bb = boost::beast;
    namespace http = bb::http;
    namespace net = boost::asio;

    namespace
    {
        void set_common_headers(http::response<http::string_body> &res, unsigned version)
        {
            res.version(version);
            res.set(http::field::server, "chatrelay-exporter");
            res.set(http::field::cache_control, "no-store");
            res.set(http::field::connection, "close");
        }

        void counter(std::ostringstream &os, const char *name, const char *help,
                     const char *type, std::uint64_t value)
        {
            os << "# HELP " << name << ' ' << help << "\n"
               << "# TYPE " << name << ' ' << type << "\n"
               << name << ' ' << value << "\n\n";
        }
    } // namespace

    std::string RelayMetrics::render_prometheus() const
    {
        std::ostringstream os;

        counter(os, "chatrelay_connections_total",
                "Total WebSocket connections accepted", "counter", connections_total.load());
        counter(os, "chatrelay_connections_active",
                "Current live WebSocket connections", "gauge", connections_active.load());
        counter(os, "chatrelay_messages_in_total",
                "Total frames received from clients", "counter", messages_in_total.load());
        counter(os, "chatrelay_messages_rejected_total",
                "Total frames dropped as malformed or incomplete", "counter", messages_rejected_total.load());
        counter(os, "chatrelay_messages_out_total",
                "Total frames queued to clients by fan-out", "counter", messages_out_total.load());
        counter(os, "chatrelay_primary_failures_total",
                "Total failed primary store inserts", "counter", primary_failures_total.load());
        counter(os, "chatrelay_mirror_failures_total",
                "Total failed mirror appends", "counter", mirror_failures_total.load());
        counter(os, "chatrelay_evictions_total",
                "Total connections evicted after a failed send", "counter", evictions_total.load());

        return os.str();
    }

    ExporterReply route_exporter_request(bool is_get,
                                         std::string_view target,
                                         const RelayMetrics &metrics,
                                         const MirrorStore &mirror)
    {
        const std::string_view path = target.substr(0, target.find('?'));

        ExporterReply reply;
        if (is_get && path == "/metrics")
        {
            reply.status = 200;
            reply.contentType = "text/plain; version=0.0.4; charset=utf-8";
            reply.body = metrics.render_prometheus();
        }
        else if (is_get && path == "/get_messages")
        {
            reply.status = 200;
            reply.contentType = "application/json";
            reply.body = mirror.history_json();
        }
        else
        {
            reply.status = 404;
            reply.contentType = "text/plain; charset=utf-8";
            reply.body = "Not Found\n";
        }
        return reply;
    }

    void run_http_exporter(RelayMetrics &metrics,
                           const MirrorStore &mirror,
                           const std::string &address,
                           std::uint16_t port)
    {
        auto &log = vix::utils::Logger::getInstance();

        try
        {
            net::io_context ioc{1};

            tcp::endpoint ep{net::ip::make_address(address), port};
            tcp::acceptor acceptor{ioc};
            boost::system::error_code ec;

            acceptor.open(ep.protocol(), ec);
            if (ec)
                throw std::system_error(ec, "open");

            acceptor.set_option(net::socket_base::reuse_address(true), ec);
            if (ec)
                throw std::system_error(ec, "reuse_address");

            acceptor.bind(ep, ec);
            if (ec)
            {
                if (ec == boost::system::errc::address_in_use)
                {
                    throw std::system_error(
                        ec,
                        "bind: address already in use. Another process is listening on this port.");
                }
                throw std::system_error(ec, "bind");
            }

            acceptor.listen(net::socket_base::max_listen_connections, ec);
            if (ec)
                throw std::system_error(ec, "listen");

            log.log(vix::utils::Logger::Level::INFO,
                    "[Relay][Exporter] listening {}:{}  (GET /metrics, GET /get_messages)",
                    address, port);

            for (;;)
            {
                tcp::socket socket{ioc};
                acceptor.accept(socket, ec);
                if (ec)
                {
                    log.log(vix::utils::Logger::Level::DEBUG,
                            "[Relay][Exporter] accept error ({})",
                            ec.message());
                    continue;
                }

                bb::flat_buffer buffer;
                http::request<http::string_body> req;
                http::read(socket, buffer, req, ec);

                if (ec)
                {
                    log.log(vix::utils::Logger::Level::DEBUG,
                            "[Relay][Exporter] read error ({})",
                            ec.message());
                    boost::system::error_code ignore;
                    socket.shutdown(tcp::socket::shutdown_both, ignore);
                    socket.close(ignore);
                    continue;
                }

                http::response<http::string_body> res;
                set_common_headers(res, req.version());

                const auto target = req.target();
                ExporterReply reply = route_exporter_request(req.method() == http::verb::get,
                                                             std::string_view(target.data(), target.size()),
                                                             metrics, mirror);
                res.result(static_cast<http::status>(reply.status));
                res.set(http::field::content_type, reply.contentType);
                res.body() = std::move(reply.body);
                res.prepare_payload();

                http::write(socket, res, ec);
                if (ec)
                {
                    log.log(vix::utils::Logger::Level::DEBUG,
                            "[Relay][Exporter] write error ({})",
                            ec.message());
                }

                boost::system::error_code ignore;
                socket.shutdown(tcp::socket::shutdown_send, ignore);
                socket.close(ignore);
            }
        }
        catch (const std::exception &e)
        {
            log.log(vix::utils::Logger::Level::ERROR,
                    "[Relay][Exporter] server error ({})",
                    e.what());
        }
    }

} // namespace chatrelay
