#ifndef CHATRELAY_SUBMISSION_GATEWAY_HPP
#define CHATRELAY_SUBMISSION_GATEWAY_HPP

#include <string>

namespace chatrelay
{
    /**
     * @brief One-shot client used by form front ends to inject a message.
     *
     * Each submit() behaves like a transient WebSocket client: it connects,
     * sends exactly one frame { date, username, message } stamped with the
     * current time, and disconnects. Failures are logged and reported as false.
     *
     * Usage:
     *
     *   chatrelay::SubmissionGateway gateway{"websocket_server", "5000"};
     *   gateway.submit("alice", "hi");
     */
    class SubmissionGateway
    {
    public:
        SubmissionGateway(std::string host, std::string port, std::string target = "/");

        bool submit(const std::string &username, const std::string &message) const;

    private:
        std::string host_;
        std::string port_;
        std::string target_;
    };

} // namespace chatrelay

#endif // CHATRELAY_SUBMISSION_GATEWAY_HPP
