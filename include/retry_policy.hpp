// include/retry_policy.hpp
#pragma once

#include <chrono>
#include <functional>
#include <iostream> // For retry logging
#include <string>

#include "errors.hpp"

namespace ChannelStore
{
    namespace Transfer
    {

        // How a single chunk (or manifest) request is retried.
        // Rate-limit waits and transport failures have separate budgets.
        struct RetryPolicy
        {
            // Total attempts allowed when the backend keeps failing.
            int max_attempts = 5;
            // Rate-limit responses tolerated before giving up.
            int max_rate_limit_retries = 8;
            std::chrono::milliseconds base_delay{500};
            std::chrono::milliseconds max_delay{30000};

            // Used for every wait. Empty means std::this_thread::sleep_for.
            std::function<void(std::chrono::milliseconds)> sleep;

            // Delay after the n-th consecutive transport failure (n >= 1):
            // base_delay * 2^(n-1), capped at max_delay.
            std::chrono::milliseconds backoffFor(int failures) const;

            void pause(std::chrono::milliseconds delay) const;
        };

        using StopCheck = std::function<bool()>;

        // Runs op() until it succeeds or a budget runs out.
        //  - RateLimited: waits the signalled delay, counts against max_rate_limit_retries.
        //  - TransportError: exponential backoff, counts against max_attempts.
        //  - anything else propagates untouched.
        // Exhaustion throws TransferFailed with failure_kind.
        // stop_requested, when set, is checked before every attempt.
        template <class F>
        auto runWithRetry(const RetryPolicy &policy,
                          ErrorKind failure_kind,
                          const std::string &what,
                          const StopCheck &stop_requested,
                          F &&op) -> decltype(op());

        // --- Template implementation ---
        template <class F>
        auto runWithRetry(const RetryPolicy &policy,
                          ErrorKind failure_kind,
                          const std::string &what,
                          const StopCheck &stop_requested,
                          F &&op) -> decltype(op())
        {
            int transport_failures = 0;
            int rate_limited = 0;
            for (;;)
            {
                if (stop_requested && stop_requested())
                {
                    throw Cancelled("Cancelled before " + what);
                }
                try
                {
                    return op();
                }
                catch (const RateLimited &e)
                {
                    ++rate_limited;
                    if (rate_limited > policy.max_rate_limit_retries)
                    {
                        throw TransferFailed(failure_kind,
                                             "Still rate limited after " + std::to_string(rate_limited) +
                                                 " attempts while " + what + ": " + e.what(),
                                             transport_failures + rate_limited);
                    }
                    std::cerr << "Rate limited while " << what << ", retrying in "
                              << e.retryAfter().count() << " ms" << std::endl;
                    policy.pause(e.retryAfter());
                }
                catch (const TransportError &e)
                {
                    ++transport_failures;
                    if (transport_failures >= policy.max_attempts)
                    {
                        throw TransferFailed(failure_kind,
                                             "Gave up after " + std::to_string(transport_failures) +
                                                 " failed attempts while " + what + ": " + e.what(),
                                             transport_failures + rate_limited);
                    }
                    auto delay = policy.backoffFor(transport_failures);
                    std::cerr << "Transport error while " << what << " (" << e.what()
                              << "), attempt " << transport_failures << "/" << policy.max_attempts
                              << ", retrying in " << delay.count() << " ms" << std::endl;
                    policy.pause(delay);
                }
            }
        }

    } // namespace Transfer
} // namespace ChannelStore
