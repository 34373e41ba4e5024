//
// examples/submit_message.cpp
//
// Inject one chat message into a running relay, the way a web form handler
// would: connect, send a single frame, disconnect.
//
// Usage:
//   submit_message <host> <port> <username> <message>
//
// Example:
//   submit_message localhost 5000 alice "hello from the form"
//

#include <iostream>

#include <chatrelay/SubmissionGateway.hpp>

int main(int argc, char **argv)
{
    if (argc != 5)
    {
        std::cerr << "usage: " << argv[0] << " <host> <port> <username> <message>\n";
        return 2;
    }

    chatrelay::SubmissionGateway gateway{argv[1], argv[2]};

    if (!gateway.submit(argv[3], argv[4]))
    {
        std::cerr << "Error sending message to WebSocket server\n";
        return 1;
    }

    std::cout << "Message sent successfully!\n";
    return 0;
}
