#ifndef CHATRELAY_METRICS_HPP
#define CHATRELAY_METRICS_HPP

/**
 * @file Metrics.hpp
 * @brief Prometheus-style counters for the relay, plus a small HTTP exporter.
 *
 * Typical usage
 * -------------
 * @code{.cpp}
 * chatrelay::RelayMetrics metrics;
 * chatrelay::MirrorStore mirror{"storage/data.json"};
 *
 * std::thread([&]{
 *     chatrelay::run_http_exporter(metrics, mirror, "0.0.0.0", 9100);
 * }).detach();
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace chatrelay
{
    class MirrorStore;

    /**
     * @struct RelayMetrics
     * @brief Aggregated counters for connections and the broadcast pipeline.
     *
     * All fields are 64-bit atomics and can be incremented from any thread.
     */
    struct RelayMetrics
    {
        std::atomic<std::uint64_t> connections_total{0};
        std::atomic<std::uint64_t> connections_active{0};
        std::atomic<std::uint64_t> messages_in_total{0};
        std::atomic<std::uint64_t> messages_rejected_total{0};
        std::atomic<std::uint64_t> messages_out_total{0};
        std::atomic<std::uint64_t> primary_failures_total{0};
        std::atomic<std::uint64_t> mirror_failures_total{0};
        std::atomic<std::uint64_t> evictions_total{0};

        /// Render all counters in Prometheus text exposition format (v0.0.4).
        [[nodiscard]] std::string render_prometheus() const;
    };

    struct ExporterReply
    {
        unsigned status = 404;
        std::string contentType;
        std::string body;
    };

    /// Answer one exporter request. Only the path is matched; a query string is ignored.
    [[nodiscard]] ExporterReply route_exporter_request(bool is_get,
                                                       std::string_view target,
                                                       const RelayMetrics &metrics,
                                                       const MirrorStore &mirror);

    /**
     * @brief Run a blocking HTTP loop exposing relay state.
     *
     *  - GET /metrics      → `metrics.render_prometheus()`
     *  - GET /get_messages → the mirror history as a JSON array
     *
     * Any other request returns 404. Intended to run on a dedicated thread.
     */
    void run_http_exporter(RelayMetrics &metrics,
                           const MirrorStore &mirror,
                           const std::string &address = "0.0.0.0",
                           std::uint16_t port = 9100);

} // namespace chatrelay

#endif // CHATRELAY_METRICS_HPP
