/**
 * @file rate_limiter.cpp
 * @brief Implementation of RateLimiter.
 */

#include "sources/rate_limiter.hpp"

#include <thread>
#include <utility>

namespace fundscope
{
    namespace sources
    {

        RateLimiter::RateLimiter(std::chrono::milliseconds interval, Clock clock, Sleeper sleeper)
            : interval_(interval), clock_(std::move(clock)), sleeper_(std::move(sleeper))
        {
            if (!clock_)
            {
                clock_ = []
                { return std::chrono::steady_clock::now(); };
            }
            if (!sleeper_)
            {
                sleeper_ = [](std::chrono::milliseconds d)
                { std::this_thread::sleep_for(d); };
            }
        }

        void RateLimiter::acquire(const std::string &provider)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto now = clock_();
            auto it = last_call_.find(provider);
            if (it != last_call_.end())
            {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second);
                if (elapsed < interval_)
                {
                    sleeper_(interval_ - elapsed);
                    now = clock_();
                }
            }
            last_call_[provider] = now;
        }

    } // namespace sources
} // namespace fundscope
