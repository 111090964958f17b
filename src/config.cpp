#include "config.h"
#include "errors.h"

#include <json/json.h>

#include <fstream>
#include <vector>

namespace sniprun {

namespace {

const Json::Value& section(const Json::Value& root, const char* name) {
    static const Json::Value empty(Json::objectValue);
    if (!root.isMember(name)) return empty;
    if (!root[name].isObject()) {
        throw ConfigError(std::string("'") + name + "' must be an object");
    }
    return root[name];
}

template <typename T, typename Get>
void read_field(const Json::Value& object, const char* key, T& target, Get get) {
    if (!object.isMember(key)) return;
    try {
        target = get(object[key]);
    } catch (const Json::Exception&) {
        throw ConfigError(std::string("field '") + key + "' has the wrong type");
    }
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < 0) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(flag + " expects a non-negative integer, got '" + value + "'");
    }
}

} // namespace

ServiceConfig::ServiceConfig() {
    pool.isolation.cgroup_root = DEFAULT_CGROUP_ROOT;
}

ServiceConfig ServiceConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open " + path);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, in, &root, &errors)) {
        throw ConfigError(path + ": " + errors);
    }
    if (!root.isObject()) {
        throw ConfigError(path + ": expected a JSON object");
    }

    ServiceConfig config;
    config.merge_json(root);
    return config;
}

void ServiceConfig::merge_json(const Json::Value& root) {
    auto as_int = [](const Json::Value& v) { return v.asInt(); };
    auto as_size = [](const Json::Value& v) { return static_cast<size_t>(v.asUInt64()); };
    auto as_double = [](const Json::Value& v) { return v.asDouble(); };
    auto as_bool = [](const Json::Value& v) { return v.asBool(); };
    auto as_string = [](const Json::Value& v) { return v.asString(); };
    auto as_ms = [](const Json::Value& v) { return std::chrono::milliseconds(v.asInt64()); };
    auto as_seconds = [](const Json::Value& v) { return std::chrono::seconds(v.asInt64()); };

    read_field(root, "port", port, as_int);
    read_field(root, "max_connections", max_connections, as_size);
    read_field(root, "runtimes", runtimes_path, as_string);
    read_field(root, "quiet", quiet, as_bool);
    read_field(root, "sweep_interval_seconds", sweep_interval_seconds, as_int);

    const Json::Value& workers = section(root, "workers");
    read_field(workers, "max", pool.max_workers, as_size);
    read_field(workers, "require_namespaces", pool.require_namespaces, as_bool);
    read_field(workers, "namespaces", pool.isolation.use_namespaces, as_bool);
    read_field(workers, "work_root", pool.isolation.work_root, as_string);
    read_field(workers, "cgroup_root", pool.isolation.cgroup_root, as_string);
    read_field(workers, "output_limit_bytes", pool.isolation.output_limit_bytes, as_size);
    read_field(workers, "tmpfs_size_bytes", pool.isolation.tmpfs_size_bytes, as_size);

    const Json::Value& queue = section(root, "queue");
    read_field(queue, "max_depth", scheduler.max_queue_depth, as_size);
    read_field(queue, "max_wait_ms", scheduler.max_queue_wait, as_ms);

    const Json::Value& limits = section(root, "quota");
    read_field(limits, "burst", quota.bucket_capacity, as_double);
    read_field(limits, "refill_per_second", quota.refill_per_second, as_double);
    read_field(limits, "max_concurrent", quota.max_concurrent, as_int);
    read_field(limits, "abuse_threshold", quota.abuse_threshold, as_int);
    read_field(limits, "abuse_window_seconds", quota.abuse_window, as_seconds);
    read_field(limits, "ban_seconds", quota.ban_duration, as_seconds);

    const Json::Value& requests = section(root, "requests");
    read_field(requests, "max_source_bytes", gateway.max_source_bytes, as_size);
    read_field(requests, "max_stdin_bytes", gateway.max_stdin_bytes, as_size);
    read_field(requests, "max_end_to_end_ms", gateway.max_end_to_end, as_ms);
    read_field(requests, "delivery_wait_ms", aggregator.delivery_wait, as_ms);

    if (pool.max_workers == 0 || scheduler.max_queue_depth == 0) {
        throw ConfigError("workers.max and queue.max_depth must be positive");
    }
    if (quota.bucket_capacity < 1 || quota.max_concurrent < 1) {
        throw ConfigError("quota.burst and quota.max_concurrent must be at least 1");
    }
}

ServiceConfig ServiceConfig::from_args(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    ServiceConfig config;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw ConfigError("--config needs a path");
            config = from_file(args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        bool has_value = i + 1 < args.size();

        if (flag == "--config") {
            ++i;
        } else if (flag == "--port" && has_value) {
            config.port = parse_int(flag, args[++i]);
        } else if (flag == "--workers" && has_value) {
            config.pool.max_workers = parse_int(flag, args[++i]);
        } else if (flag == "--queue-depth" && has_value) {
            config.scheduler.max_queue_depth = parse_int(flag, args[++i]);
        } else if (flag == "--runtimes" && has_value) {
            config.runtimes_path = args[++i];
        } else if (flag == "--work-root" && has_value) {
            config.pool.isolation.work_root = args[++i];
        } else if (flag == "--cgroup-root" && has_value) {
            config.pool.isolation.cgroup_root = args[++i];
        } else if (flag == "--no-namespaces") {
            config.pool.isolation.use_namespaces = false;
        } else if (flag == "--require-namespaces") {
            config.pool.require_namespaces = true;
        } else if (flag == "--quiet") {
            config.quiet = true;
        } else {
            throw ConfigError("unknown or incomplete option: " + flag);
        }
    }

    if (config.pool.max_workers == 0 || config.scheduler.max_queue_depth == 0) {
        throw ConfigError("--workers and --queue-depth must be positive");
    }
    return config;
}

std::string ServiceConfig::usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --config PATH          JSON service configuration\n"
           "  --runtimes PATH        JSON runtime catalog (default: built-in runtimes)\n"
           "  --port N               Listen port (default " + std::to_string(DEFAULT_PORT) + ")\n"
           "  --workers N            Concurrent sandboxes\n"
           "  --queue-depth N        Pending requests before ServiceBusy\n"
           "  --work-root PATH       Parent directory for sandbox directories\n"
           "  --cgroup-root PATH     Delegated cgroup v2 directory ('' for rlimits only)\n"
           "  --no-namespaces        Run without Linux namespaces\n"
           "  --require-namespaces   Refuse to start if namespaces are unavailable\n"
           "  --quiet                Only log warnings and errors\n";
}

} // namespace sniprun
