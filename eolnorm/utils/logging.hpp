#ifndef EOLNORM_UTILS_LOGGING_HPP
#define EOLNORM_UTILS_LOGGING_HPP

#pragma once

namespace eolnorm::utils {

inline constexpr const char *kLoggerName = "eolnorm";

// Routes spdlog's default logger to stderr so stdout only carries results.
// Level is debug when verbose, warn otherwise. Safe to call more than once.
void init_logging(bool verbose);

} // namespace eolnorm::utils

#endif // EOLNORM_UTILS_LOGGING_HPP
