#pragma once

#include <logger.h>

#include <chrono>
#include <string>

namespace kdg {

/**
 * @brief Logs "<content> cost(ms): <elapsed>" when released or destroyed
 */
class Timer {
public:
    Timer(std::string content, spdlog::level::level_enum level = spdlog::level::info)
        : content_(std::move(content))
        , level_(level)
        , start_(std::chrono::steady_clock::now())
        , released_(false) {
    }
    ~Timer() {
        if (!released_)
            release();
    }

    [[nodiscard]] long long elapsed() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_).count();
    }

    void release() {
        released_ = true;
        logger()->log(level_, "{} cost(ms): {}", content_, elapsed());
    }

private:
    std::string                                        content_;
    spdlog::level::level_enum                          level_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
    bool                                               released_;
};

} // namespace kdg
