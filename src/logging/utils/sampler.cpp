/*
 * sampler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sampler.hpp"

#include <algorithm>

namespace facet::logging {

namespace {

auto fnv32a(std::string_view text) -> std::uint32_t {
    constexpr std::uint32_t OFFSET = 2166136261U;
    constexpr std::uint32_t PRIME = 16777619U;

    std::uint32_t hash = OFFSET;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= PRIME;
    }
    return hash;
}

}  // namespace

auto Sampler::Counter::incCheckReset(std::int64_t now, std::int64_t tick)
    -> std::uint64_t {
    auto resetAfter = resetAt.load();
    if (resetAfter > now) {
        return count.fetch_add(1) + 1;
    }

    count.store(1);
    if (!resetAt.compare_exchange_strong(resetAfter, now + tick)) {
        // Another thread started the new tick first
        return count.fetch_add(1) + 1;
    }
    return 1;
}

Sampler::Sampler(int initial, int thereafter, std::chrono::nanoseconds tick)
    : initial_(static_cast<std::uint64_t>(std::max(initial, 0))),
      thereafter_(static_cast<std::uint64_t>(std::max(thereafter, 0))),
      tick_(tick.count()),
      counters_(std::make_unique<CounterTable>()) {}

auto Sampler::check(Severity severity, std::string_view message,
                    std::chrono::system_clock::time_point now) -> bool {
    if (severity < MIN_SEVERITY || severity > MAX_SEVERITY) {
        return true;
    }

    auto level =
        static_cast<std::size_t>(toInt(severity) - toInt(MIN_SEVERITY));
    auto bucket = fnv32a(message) % BUCKET_COUNT;
    auto& counter = (*counters_)[level * BUCKET_COUNT + bucket];

    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                     now.time_since_epoch())
                     .count();
    auto n = counter.incCheckReset(nanos, tick_);

    if (n > initial_ &&
        (thereafter_ == 0 || (n - initial_) % thereafter_ != 0)) {
        return false;
    }
    return true;
}

}  // namespace facet::logging
