#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace sniprun {

// Closed set of languages the service knows how to run. A language only
// becomes usable once the runtime registry holds a profile for it.
enum class Language {
    PYTHON,
    JAVASCRIPT,
    SHELL,
    RUBY,
    LUA
};

// Accepts the canonical id and common aliases ("python3", "js", "bash")
std::optional<Language> parse_language(const std::string& name);
std::string language_to_string(Language language);

enum class Outcome {
    COMPLETED,
    TIMED_OUT,
    RESOURCE_EXCEEDED,
    RUNTIME_ERROR,
    INTERNAL_ERROR,
    CANCELLED
};

std::string outcome_to_string(Outcome outcome);

// One snippet submission. Immutable once the gateway has built it.
struct ExecutionRequest {
    std::string id;
    Language language = Language::PYTHON;
    std::string source_code;
    std::optional<std::string> stdin_data;
    std::string client_session_id;
    std::chrono::steady_clock::time_point submitted_at;
};

using RequestPtr = std::shared_ptr<const ExecutionRequest>;

struct ExecutionResult {
    std::string request_id;
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = 0;
    bool truncated = false;
    Outcome outcome = Outcome::INTERNAL_ERROR;
    std::chrono::milliseconds duration{0};

    double cpu_seconds = 0;
    size_t memory_peak_bytes = 0;
    std::string message;   // Learner-facing note ("time limit exceeded")
};

// Ordered messages emitted while a request is alive
enum class EventType {
    STATUS,
    STDOUT,
    STDERR,
    RESULT
};

std::string event_type_to_string(EventType type);

} // namespace sniprun
