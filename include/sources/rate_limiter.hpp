/**
 * @file rate_limiter.hpp
 * @brief Fixed minimum interval between calls to the same provider.
 */

#ifndef FUNDSCOPE_SOURCES_RATE_LIMITER_HPP
#define FUNDSCOPE_SOURCES_RATE_LIMITER_HPP

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace fundscope
{
    namespace sources
    {

        /**
         * @class RateLimiter
         * @brief Sleeps so that consecutive calls to one provider are at least
         *        a fixed interval apart.
         *
         * Clock and sleep are injectable so tests run instantly.
         */
        class RateLimiter
        {
        public:
            using Clock = std::function<std::chrono::steady_clock::time_point()>;
            using Sleeper = std::function<void(std::chrono::milliseconds)>;

            /**
             * @param interval Minimum spacing between calls to one provider.
             * @param clock Time source (default steady_clock::now).
             * @param sleeper Sleep function (default std::this_thread::sleep_for).
             */
            explicit RateLimiter(std::chrono::milliseconds interval = std::chrono::milliseconds(1000),
                                 Clock clock = nullptr,
                                 Sleeper sleeper = nullptr);

            /**
             * @brief Block until a call to @p provider is allowed, then record it.
             */
            void acquire(const std::string &provider);

            std::chrono::milliseconds interval() const { return interval_; }

        private:
            std::chrono::milliseconds interval_;
            Clock clock_;
            Sleeper sleeper_;
            std::mutex mutex_;
            std::map<std::string, std::chrono::steady_clock::time_point> last_call_;
        };

    } // namespace sources
} // namespace fundscope

#endif // FUNDSCOPE_SOURCES_RATE_LIMITER_HPP
