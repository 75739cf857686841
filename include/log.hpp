#pragma once

#include <optional>
#include <spdlog/spdlog.h>
#include <string_view>

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view s);

// Installs a colored stderr logger named "schemasniff" as the default
// logger. Output stays on stdout, diagnostics go to stderr.
void init_logging(spdlog::level::level_enum level);
