#ifndef CHATRELAY_BROADCAST_COORDINATOR_HPP
#define CHATRELAY_BROADCAST_COORDINATOR_HPP

/**
 * @file BroadcastCoordinator.hpp
 * @brief Per-message pipeline: validate, persist, mirror, fan out.
 *
 * Steps run strictly in order for one message:
 *   1. Validate       - empty username/message is dropped, nothing else runs.
 *   2. PersistPrimary - insert into the primary store; failure is logged and
 *                       the message continues without a storage id.
 *   3. Mirror         - append to the JSON mirror; failure is logged.
 *   4. Fan-out        - send to every member of a registry snapshot; a member
 *                       whose send fails is evicted and closed, the others
 *                       still receive the message.
 *
 * The primary and mirror writes are independent and not transactional: a
 * message may end up in one store and not the other.
 *
 * Steps 3 and 4 run under one lock, so the mirror order is the order every
 * recipient's queue sees, whichever I/O threads call handle().
 */

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <chatrelay/ConnectionRegistry.hpp>
#include <chatrelay/MessageStore.hpp>
#include <chatrelay/MirrorStore.hpp>
#include <chatrelay/Metrics.hpp>
#include <chatrelay/protocol.hpp>

namespace chatrelay
{
    class BroadcastCoordinator
    {
    public:
        struct Result
        {
            bool accepted = false;                ///< passed validation
            std::optional<std::string> storageId; ///< set if the primary insert succeeded
            bool mirrored = false;                ///< mirror append succeeded
            std::size_t delivered = 0;            ///< members the frame was queued to
            std::size_t evicted = 0;              ///< members removed after a failed send
        };

        /// `primary` and `metrics` may be null (no primary store / no metrics).
        BroadcastCoordinator(ConnectionRegistry &registry,
                             std::shared_ptr<IPrimaryStore> primary,
                             MirrorStore &mirror,
                             RelayMetrics *metrics = nullptr);

        BroadcastCoordinator(const BroadcastCoordinator &) = delete;
        BroadcastCoordinator &operator=(const BroadcastCoordinator &) = delete;

        /// Run the pipeline for one message. Never throws on store or delivery failures.
        Result handle(Message msg);

    private:
        std::size_t fan_out(const std::string &frame, Result &result);

        ConnectionRegistry &registry_;
        std::shared_ptr<IPrimaryStore> primary_;
        MirrorStore &mirror_;
        RelayMetrics *metrics_;

        std::mutex sequenceMutex_; // mirror + fan-out
    };

} // namespace chatrelay

#endif // CHATRELAY_BROADCAST_COORDINATOR_HPP
