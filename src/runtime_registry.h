#pragma once

#include "types.h"

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace Json {
class Value;
}

namespace sniprun {

// Everything needed to run one language: what to exec and how tightly to
// box it in. Loaded once at startup, read-only while serving.
struct RuntimeProfile {
    Language language_id = Language::PYTHON;
    std::string image_reference;               // e.g. "python:3.12-slim"
    std::vector<std::string> command;          // argv, "{file}" is replaced
    std::string source_file = "main.py";       // Name of the snippet file

    double cpu_limit = 1.0;                    // Cores
    size_t memory_limit_bytes = 0;
    std::chrono::milliseconds wall_clock_limit{0};
    int max_processes = 0;
    int max_open_files = 0;
    size_t max_file_size_bytes = 0;
    bool limit_address_space = true;           // RLIMIT_AS when no cgroup (off for V8)

    std::vector<std::string> denied_syscalls;  // Seccomp deny list
    bool allow_network = false;                // Airgapped by default
    size_t warm_pool = 1;                      // Ready workers to keep

    // Build argv with the snippet path substituted
    std::vector<std::string> build_argv(const std::string& file_path) const;
};

// Static catalog of supported languages
class RuntimeRegistry {
public:
    RuntimeRegistry() = default;

    // Catalog of the built-in profiles (python, javascript, shell)
    static RuntimeRegistry with_builtins();

    // Load from a JSON file; throws ConfigError on any invalid entry
    static RuntimeRegistry from_file(const std::string& path);
    static RuntimeRegistry from_json(const Json::Value& root);

    // Register (or replace) a profile
    void register_profile(const RuntimeProfile& profile);

    // nullptr when the language is not registered
    const RuntimeProfile* find(Language language) const;
    const RuntimeProfile* find(const std::string& language) const;

    bool has(Language language) const;
    std::vector<Language> languages() const;
    size_t size() const { return profiles_.size(); }

private:
    std::map<Language, RuntimeProfile> profiles_;
};

// Syscalls no snippet ever needs
std::vector<std::string> default_denied_syscalls();

// Built-in runtime profiles
namespace BuiltInRuntimes {
    RuntimeProfile python();
    RuntimeProfile javascript();
    RuntimeProfile shell();
}

} // namespace sniprun
