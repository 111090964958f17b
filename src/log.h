#pragma once

#include <string>

namespace sniprun {
namespace log {

// Each call writes one whole line "[tag] message"; lines from concurrent
// threads never interleave.
void info(const std::string& tag, const std::string& message);
void warn(const std::string& tag, const std::string& message);
void error(const std::string& tag, const std::string& message);

// Infrastructure faults that need an operator. Goes to stderr with [ALERT].
void alert(const std::string& tag, const std::string& message);

// Silence info lines (tests, --quiet)
void set_quiet(bool quiet);

} // namespace log
} // namespace sniprun
