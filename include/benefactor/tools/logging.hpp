#pragma once

#include <benefactor/config/options.hpp>

namespace benefactor::tools {

/// Install the asynchronous "benefactor" default logger writing to stderr and
/// to `options.log_file`. Throws spdlog::spdlog_ex when the log file cannot be
/// opened; the previous default logger stays in place.
void install_logger(const benefactor::config::cli_options& options);

}  // namespace benefactor::tools
