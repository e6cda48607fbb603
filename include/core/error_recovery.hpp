#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;
    using RetryPredicate = std::function<bool(const std::exception &)>;

    static SleepFunction realSleep()
    {
        return [](std::chrono::milliseconds delay)
        { std::this_thread::sleep_for(delay); };
    }

    /**
     * @brief Run func up to max_attempts times with linear backoff
     *
     * After failed attempt n (1-based) the loop sleeps n * backoff. Exceptions for
     * which is_retryable returns false are rethrown immediately, as is the
     * exception of the final attempt.
     */
    template <typename Func>
    static auto retryWithLinearBackoff(Func func, int max_attempts, std::chrono::milliseconds backoff,
                                       const std::string &operation_name, const SleepFunction &sleep,
                                       const RetryPredicate &is_retryable = nullptr)
        -> decltype(func())
    {
        if (max_attempts < 1)
            max_attempts = 1;

        for (int attempt = 1; attempt <= max_attempts; ++attempt)
        {
            try
            {
                return func();
            }
            catch (const std::exception &e)
            {
                if (is_retryable && !is_retryable(e))
                {
                    Logger::warn("Operation '" + operation_name + "' failed with a non-retryable error: " + e.what());
                    throw;
                }
                if (attempt == max_attempts)
                {
                    Logger::error("Operation '" + operation_name + "' failed after " + std::to_string(max_attempts) +
                                  " attempts: " + e.what());
                    throw;
                }

                auto delay = backoff * attempt;
                Logger::warn("Operation '" + operation_name + "' failed, retrying in " +
                             std::to_string(delay.count()) + "ms (attempt " + std::to_string(attempt) + "/" +
                             std::to_string(max_attempts) + "): " + e.what());
                if (sleep)
                    sleep(delay);
            }
        }
        throw std::runtime_error("All retry attempts failed for operation: " + operation_name);
    }
};
