#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace ermes::infra {

/// spdlog colour console logger named "ermes".
/// Format: [ts] [level] [trace_id] [component] event: msg
/// `level` is an spdlog level name ("debug", "info", "warn", ...); unknown
/// names fall back to info.
std::shared_ptr<core::ILogger> create_console_logger(const std::string &level = "info");

} // namespace ermes::infra
