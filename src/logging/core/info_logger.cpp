/*
 * info_logger.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "info_logger.hpp"

namespace facet::logging {

auto disabledInfoLogger() noexcept -> std::shared_ptr<const InfoLogger> {
    static const NoopInfoLogger instance{};
    // Aliasing constructor: no control block, no ownership
    return std::shared_ptr<const InfoLogger>(std::shared_ptr<void>(),
                                             &instance);
}

}  // namespace facet::logging
