#include "hermes/retry.hpp"
#include "hermes/logging.hpp"
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <cmath>

namespace net = boost::asio;

namespace hermes
{
    namespace
    {
        class RetryOperation : public std::enable_shared_from_this<RetryOperation>
        {
        public:
            RetryOperation(std::shared_ptr<Forwarder> forwarder, net::any_io_executor executor,
                           OutboundRequest request, RetryPolicy policy, ForwardHandler handler)
                : forwarder_(std::move(forwarder)),
                  timer_(executor),
                  request_(std::move(request)),
                  policy_(policy),
                  handler_(std::move(handler)),
                  log_(logging::category("forward"))
            {
            }

            void start()
            {
                ++attempt_;
                forwarder_->send(request_, [self = shared_from_this()](Result<UpstreamResponse> result)
                                 { self->on_result(std::move(result)); });
            }

        private:
            void on_result(Result<UpstreamResponse> result)
            {
                const std::uint32_t max_attempts = std::max<std::uint32_t>(policy_.attempts, 1);
                if (result || !is_retryable(result.error()) || attempt_ >= max_attempts)
                {
                    if (!result && attempt_ > 1)
                        log_->warn("Giving up on {} after {} attempts", request_.url, attempt_);
                    handler_(std::move(result));
                    return;
                }

                auto delay = backoff_delay(policy_, attempt_ - 1);
                log_->warn("Attempt {}/{} to {} failed ({}), retrying in {}ms", attempt_, max_attempts, request_.url,
                           result.error().what(), delay.count());

                timer_.expires_after(delay);
                timer_.async_wait(
                    [self = shared_from_this(), last = std::move(result)](boost::system::error_code ec) mutable
                    {
                        if (ec)
                        {
                            self->handler_(std::move(last));
                            return;
                        }
                        self->start();
                    });
            }

            std::shared_ptr<Forwarder> forwarder_;
            net::steady_timer timer_;
            OutboundRequest request_;
            RetryPolicy policy_;
            ForwardHandler handler_;
            std::shared_ptr<spdlog::logger> log_;
            std::uint32_t attempt_{0};
        };
    } // namespace

    RetryPolicy resolve_retry_policy(const std::optional<RetryPolicy> &rule, const AppSettings &settings)
    {
        if (rule)
            return *rule;
        return RetryPolicy{settings.retry_attempts, settings.retry_delay_ms, settings.retry_backoff_multiplier};
    }

    std::chrono::milliseconds backoff_delay(const RetryPolicy &policy, std::uint32_t retry)
    {
        const double factor = std::pow(std::max(policy.backoff_multiplier, 1.0), static_cast<double>(retry));
        const double ms = static_cast<double>(policy.delay_ms) * factor;
        const double cap = static_cast<double>(kMaxBackoff.count());
        if (!std::isfinite(ms) || ms >= cap)
            return kMaxBackoff;
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
    }

    bool is_retryable(const HermesError &error)
    {
        return error.code == ErrorCode::NetworkError;
    }

    void send_with_retry(std::shared_ptr<Forwarder> forwarder, net::any_io_executor executor,
                         OutboundRequest request, RetryPolicy policy, ForwardHandler handler)
    {
        std::make_shared<RetryOperation>(std::move(forwarder), std::move(executor), std::move(request), policy,
                                         std::move(handler))
            ->start();
    }

} // namespace hermes
