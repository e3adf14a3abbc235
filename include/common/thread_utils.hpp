#pragma once

#include <thread>
#include <chrono>
#include <algorithm>

// Timing helpers shared by the retry loops
class ThreadUtils {
public:
    static void sleepFor(std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    }

    // initial * 2^attempt, capped at maximum
    static std::chrono::milliseconds backoffDelay(int attempt,
                                                  std::chrono::milliseconds initial,
                                                  std::chrono::milliseconds maximum) {
        auto delay = initial;
        for (int i = 0; i < attempt && delay < maximum; ++i) {
            delay *= 2;
        }
        return std::min(delay, maximum);
    }
};
