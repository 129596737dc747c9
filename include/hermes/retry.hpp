#pragma once

#include "config.hpp"
#include "forwarding_client.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace hermes
{
    /** Longest pause between two attempts, whatever the policy computes. */
    inline constexpr std::chrono::milliseconds kMaxBackoff{std::chrono::seconds(60)};

    /** Rule policy when present, otherwise the global settings. */
    RetryPolicy resolve_retry_policy(const std::optional<RetryPolicy> &rule, const AppSettings &settings);

    /**
     * Pause before retry number `retry` (0 for the pause after the first
     * failed attempt): delay_ms * backoff_multiplier^retry, capped.
     */
    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, std::uint32_t retry);

    /** Only transport failures are retried; any HTTP response is final. */
    bool is_retryable(const HermesError &error);

    /**
     * Send through `forwarder`, retrying transport failures up to
     * policy.attempts total attempts. The handler sees the last result.
     */
    void send_with_retry(std::shared_ptr<Forwarder> forwarder, boost::asio::any_io_executor executor,
                         OutboundRequest request, RetryPolicy policy, ForwardHandler handler);

} // namespace hermes
