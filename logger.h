#pragma once

#include <apiExport.h>

#include <spdlog/spdlog.h>

#include <memory>

namespace kdg {

/**
 * @brief library logger named "kdgraph", created on first use with a colour console sink
 */
KDG_PUBLIC std::shared_ptr<spdlog::logger> logger();

KDG_PUBLIC void setLogLevel(spdlog::level::level_enum level);

} // namespace kdg
