/*
 * sampler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Per-message record sampling

**************************************************/

#ifndef FACET_LOGGING_SAMPLER_HPP
#define FACET_LOGGING_SAMPLER_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

#include "../core/types.hpp"

namespace facet::logging {

/**
 * @brief Caps repeated records
 *
 * Records are bucketed by severity and a hash of the message. Within each
 * tick the first @c initial records of a bucket pass, after that every
 * @c thereafter-th one (none when thereafter is 0). Lock-free; severities
 * outside debug..fatal are never sampled.
 */
class Sampler {
public:
    Sampler(int initial, int thereafter,
            std::chrono::nanoseconds tick = std::chrono::seconds(1));

    /**
     * @brief Count a record and decide whether it is written
     */
    [[nodiscard]] auto check(Severity severity, std::string_view message,
                             std::chrono::system_clock::time_point now)
        -> bool;

private:
    static constexpr std::size_t LEVEL_COUNT =
        toInt(MAX_SEVERITY) - toInt(MIN_SEVERITY) + 1;
    static constexpr std::size_t BUCKET_COUNT = 4096;

    struct Counter {
        std::atomic<std::int64_t> resetAt{0};
        std::atomic<std::uint64_t> count{0};

        auto incCheckReset(std::int64_t now, std::int64_t tick)
            -> std::uint64_t;
    };

    using CounterTable = std::array<Counter, LEVEL_COUNT * BUCKET_COUNT>;

    std::uint64_t initial_;
    std::uint64_t thereafter_;
    std::int64_t tick_;
    std::unique_ptr<CounterTable> counters_;
};

}  // namespace facet::logging

#endif  // FACET_LOGGING_SAMPLER_HPP
