#include "runtime_registry.h"
#include "constants.h"
#include "errors.h"
#include "log.h"

#include <json/json.h>

#include <fstream>

namespace sniprun {

std::vector<std::string> RuntimeProfile::build_argv(const std::string& file_path) const {
    std::vector<std::string> argv;
    argv.reserve(command.size());
    for (const auto& arg : command) {
        std::string expanded = arg;
        size_t pos = expanded.find("{file}");
        if (pos != std::string::npos) {
            expanded.replace(pos, 6, file_path);
        }
        argv.push_back(expanded);
    }
    return argv;
}

RuntimeRegistry RuntimeRegistry::with_builtins() {
    RuntimeRegistry registry;
    registry.register_profile(BuiltInRuntimes::python());
    registry.register_profile(BuiltInRuntimes::javascript());
    registry.register_profile(BuiltInRuntimes::shell());
    return registry;
}

namespace {

RuntimeProfile base_profile(Language language) {
    switch (language) {
        case Language::PYTHON: return BuiltInRuntimes::python();
        case Language::JAVASCRIPT: return BuiltInRuntimes::javascript();
        case Language::SHELL: return BuiltInRuntimes::shell();
        default: break;
    }
    // Languages without a built-in start from conservative limits
    RuntimeProfile profile = BuiltInRuntimes::shell();
    profile.language_id = language;
    profile.command.clear();
    profile.image_reference.clear();
    return profile;
}

std::vector<std::string> string_list(const Json::Value& value, const std::string& field) {
    if (!value.isArray()) {
        throw ConfigError("'" + field + "' must be an array of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        if (!item.isString()) {
            throw ConfigError("'" + field + "' must be an array of strings");
        }
        items.push_back(item.asString());
    }
    return items;
}

RuntimeProfile parse_profile(const Json::Value& entry) {
    if (!entry.isObject() || !entry["language"].isString()) {
        throw ConfigError("runtime entry needs a string 'language'");
    }

    std::string name = entry["language"].asString();
    auto language = parse_language(name);
    if (!language) {
        throw ConfigError("unsupported language: " + name);
    }

    RuntimeProfile profile = base_profile(*language);

    if (entry.isMember("image")) profile.image_reference = entry["image"].asString();
    if (entry.isMember("command")) profile.command = string_list(entry["command"], "command");
    if (entry.isMember("file")) profile.source_file = entry["file"].asString();
    if (entry.isMember("cpu_limit")) profile.cpu_limit = entry["cpu_limit"].asDouble();
    if (entry.isMember("memory_limit_mb")) {
        profile.memory_limit_bytes = static_cast<size_t>(entry["memory_limit_mb"].asUInt64()) * 1024 * 1024;
    }
    if (entry.isMember("wall_clock_ms")) {
        profile.wall_clock_limit = std::chrono::milliseconds(entry["wall_clock_ms"].asInt64());
    }
    if (entry.isMember("max_processes")) profile.max_processes = entry["max_processes"].asInt();
    if (entry.isMember("max_open_files")) profile.max_open_files = entry["max_open_files"].asInt();
    if (entry.isMember("max_file_size_mb")) {
        profile.max_file_size_bytes = static_cast<size_t>(entry["max_file_size_mb"].asUInt64()) * 1024 * 1024;
    }
    if (entry.isMember("limit_address_space")) {
        profile.limit_address_space = entry["limit_address_space"].asBool();
    }
    if (entry.isMember("denied_syscalls")) {
        profile.denied_syscalls = string_list(entry["denied_syscalls"], "denied_syscalls");
    }
    if (entry.isMember("allow_network")) profile.allow_network = entry["allow_network"].asBool();
    if (entry.isMember("warm_pool")) profile.warm_pool = entry["warm_pool"].asUInt();

    if (profile.command.empty()) {
        throw ConfigError("runtime '" + name + "' has no command");
    }
    if (profile.source_file.empty() || profile.source_file.find('/') != std::string::npos) {
        throw ConfigError("runtime '" + name + "' needs a plain file name");
    }
    if (profile.cpu_limit <= 0 || profile.memory_limit_bytes == 0 ||
        profile.wall_clock_limit.count() <= 0) {
        throw ConfigError("runtime '" + name + "' needs positive cpu, memory and time limits");
    }

    return profile;
}

} // namespace

RuntimeRegistry RuntimeRegistry::from_json(const Json::Value& root) {
    if (!root.isObject() || !root["runtimes"].isArray()) {
        throw ConfigError("expected an object with a 'runtimes' array");
    }

    RuntimeRegistry registry;
    for (const auto& entry : root["runtimes"]) {
        RuntimeProfile profile = parse_profile(entry);
        if (registry.has(profile.language_id)) {
            throw ConfigError("duplicate runtime: " + language_to_string(profile.language_id));
        }
        registry.register_profile(profile);
    }

    if (registry.size() == 0) {
        throw ConfigError("no runtimes configured");
    }
    return registry;
}

RuntimeRegistry RuntimeRegistry::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open runtime file: " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        throw ConfigError("invalid JSON in " + path + ": " + errors);
    }

    RuntimeRegistry registry = from_json(root);
    log::info("Registry", "Loaded " + std::to_string(registry.size()) + " runtimes from " + path);
    return registry;
}

void RuntimeRegistry::register_profile(const RuntimeProfile& profile) {
    profiles_[profile.language_id] = profile;
}

const RuntimeProfile* RuntimeRegistry::find(Language language) const {
    auto it = profiles_.find(language);
    return it == profiles_.end() ? nullptr : &it->second;
}

const RuntimeProfile* RuntimeRegistry::find(const std::string& language) const {
    auto parsed = parse_language(language);
    if (!parsed) {
        return nullptr;
    }
    return find(*parsed);
}

bool RuntimeRegistry::has(Language language) const {
    return profiles_.count(language) > 0;
}

std::vector<Language> RuntimeRegistry::languages() const {
    std::vector<Language> result;
    for (const auto& [language, _] : profiles_) {
        result.push_back(language);
    }
    return result;
}

std::vector<std::string> default_denied_syscalls() {
    return {
        "ptrace", "process_vm_readv", "process_vm_writev",
        "mount", "umount2", "pivot_root", "chroot",
        "unshare", "setns",
        "reboot", "kexec_load", "init_module", "finit_module", "delete_module",
        "swapon", "swapoff",
        "keyctl", "add_key", "request_key",
        "bpf", "perf_event_open", "userfaultfd",
        "acct", "quotactl", "settimeofday", "clock_settime"
    };
}

// Built-in runtime profiles

namespace BuiltInRuntimes {

RuntimeProfile python() {
    RuntimeProfile profile;
    profile.language_id = Language::PYTHON;
    profile.image_reference = "python:3.12-slim";
    profile.command = {"python3", "-I", "-B", "{file}"};
    profile.source_file = "main.py";
    profile.cpu_limit = DEFAULT_CPU_LIMIT;
    profile.memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    profile.wall_clock_limit = std::chrono::milliseconds(DEFAULT_WALL_CLOCK_MS);
    profile.max_processes = MAX_PROCESSES_PER_SNIPPET;
    profile.max_open_files = MAX_OPEN_FILES;
    profile.max_file_size_bytes = DEFAULT_MAX_FILE_SIZE_BYTES;
    profile.denied_syscalls = default_denied_syscalls();
    profile.warm_pool = 2;  // The lessons are mostly Python
    return profile;
}

RuntimeProfile javascript() {
    RuntimeProfile profile;
    profile.language_id = Language::JAVASCRIPT;
    profile.image_reference = "node:20-slim";
    profile.command = {"node", "--max-old-space-size=96", "{file}"};
    profile.source_file = "main.js";
    profile.cpu_limit = DEFAULT_CPU_LIMIT;
    profile.memory_limit_bytes = 2 * DEFAULT_MEMORY_LIMIT_BYTES;
    profile.wall_clock_limit = std::chrono::milliseconds(DEFAULT_WALL_CLOCK_MS);
    profile.max_processes = MAX_PROCESSES_PER_SNIPPET;
    profile.max_open_files = MAX_OPEN_FILES;
    profile.max_file_size_bytes = DEFAULT_MAX_FILE_SIZE_BYTES;
    profile.limit_address_space = false;  // V8 reserves far more than it uses
    profile.denied_syscalls = default_denied_syscalls();
    profile.warm_pool = DEFAULT_WARM_POOL;
    return profile;
}

RuntimeProfile shell() {
    RuntimeProfile profile;
    profile.language_id = Language::SHELL;
    profile.image_reference = "busybox:stable";
    profile.command = {"/bin/sh", "{file}"};
    profile.source_file = "main.sh";
    profile.cpu_limit = DEFAULT_CPU_LIMIT;
    profile.memory_limit_bytes = DEFAULT_MEMORY_LIMIT_BYTES / 2;
    profile.wall_clock_limit = std::chrono::milliseconds(DEFAULT_WALL_CLOCK_MS);
    profile.max_processes = MAX_PROCESSES_PER_SNIPPET;
    profile.max_open_files = MAX_OPEN_FILES;
    profile.max_file_size_bytes = DEFAULT_MAX_FILE_SIZE_BYTES;
    profile.denied_syscalls = default_denied_syscalls();
    profile.warm_pool = DEFAULT_WARM_POOL;
    return profile;
}

} // namespace BuiltInRuntimes

} // namespace sniprun
