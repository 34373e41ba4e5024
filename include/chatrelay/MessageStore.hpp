#ifndef CHATRELAY_MESSAGE_STORE_HPP
#define CHATRELAY_MESSAGE_STORE_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include <chatrelay/protocol.hpp>

namespace chatrelay
{
    /// The primary store could not be reached, or a read/write failed or timed out.
    class StoreUnavailable : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Authoritative message store.
     *
     * Expected semantics:
     *  - insert(msg)   : durably stores the message and returns a copy carrying
     *                    the generated storageId. Throws StoreUnavailable.
     *  - latest(limit) : most recent messages, newest-first.
     *  - count()       : number of stored messages.
     *
     * Implementations must be safe for concurrent callers.
     */
    class IPrimaryStore
    {
    public:
        virtual ~IPrimaryStore() = default;

        virtual Message insert(const Message &msg) = 0;

        virtual std::vector<Message> latest(std::size_t limit) = 0;

        virtual std::size_t count() = 0;
    };

} // namespace chatrelay

#endif // CHATRELAY_MESSAGE_STORE_HPP
