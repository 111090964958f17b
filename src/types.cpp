#include "types.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace sniprun {

namespace {

const std::map<std::string, Language> language_aliases = {
    {"python", Language::PYTHON},
    {"python3", Language::PYTHON},
    {"py", Language::PYTHON},
    {"javascript", Language::JAVASCRIPT},
    {"js", Language::JAVASCRIPT},
    {"node", Language::JAVASCRIPT},
    {"shell", Language::SHELL},
    {"sh", Language::SHELL},
    {"bash", Language::SHELL},
    {"ruby", Language::RUBY},
    {"rb", Language::RUBY},
    {"lua", Language::LUA},
};

} // namespace

std::optional<Language> parse_language(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto it = language_aliases.find(lowered);
    if (it == language_aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string language_to_string(Language language) {
    switch (language) {
        case Language::PYTHON: return "python";
        case Language::JAVASCRIPT: return "javascript";
        case Language::SHELL: return "shell";
        case Language::RUBY: return "ruby";
        case Language::LUA: return "lua";
    }
    return "unknown";
}

std::string outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::COMPLETED: return "Completed";
        case Outcome::TIMED_OUT: return "TimedOut";
        case Outcome::RESOURCE_EXCEEDED: return "ResourceExceeded";
        case Outcome::RUNTIME_ERROR: return "RuntimeError";
        case Outcome::INTERNAL_ERROR: return "InternalError";
        case Outcome::CANCELLED: return "Cancelled";
    }
    return "InternalError";
}

std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::STATUS: return "status";
        case EventType::STDOUT: return "stdout";
        case EventType::STDERR: return "stderr";
        case EventType::RESULT: return "result";
    }
    return "status";
}

} // namespace sniprun
