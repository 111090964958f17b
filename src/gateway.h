#pragma once

#include "constants.h"
#include "quota_manager.h"
#include "result_aggregator.h"
#include "runtime_registry.h"
#include "scheduler.h"
#include "types.h"

#include <chrono>
#include <optional>
#include <string>

namespace sniprun {

struct SubmitHandle {
    std::string request_id;
    size_t queue_position = 0;
};

// Front door for snippet submissions. Validates, applies the session quota
// and queues; it never runs anything itself. Every refusal is thrown as a
// RejectedError.
class Gateway {
public:
    struct Config {
        size_t max_source_bytes;
        size_t max_stdin_bytes;
        std::chrono::milliseconds max_end_to_end;

        Config() :
            max_source_bytes(DEFAULT_MAX_SOURCE_BYTES),
            max_stdin_bytes(DEFAULT_MAX_STDIN_BYTES),
            max_end_to_end(DEFAULT_MAX_END_TO_END_MS) {}
    };

    Gateway(const RuntimeRegistry& registry, QuotaManager& quota, Scheduler& scheduler,
            ResultAggregator& aggregator, const Config& config = Config());

    SubmitHandle submit(const std::string& language, const std::string& source_code,
                        const std::optional<std::string>& stdin_data,
                        const std::string& client_session_id);

    bool cancel(const std::string& request_id);

    PollResult poll(const std::string& request_id, uint64_t cursor) const;
    PollResult wait(const std::string& request_id, uint64_t cursor,
                    std::chrono::milliseconds timeout) const;
    std::optional<size_t> queue_position(const std::string& request_id) const;
    bool acknowledge(const std::string& request_id);

    // Submit and wait for the result, bounded by max_end_to_end. A request
    // still unfinished at the deadline is cancelled and reported TimedOut.
    ExecutionResult run_sync(const std::string& language, const std::string& source_code,
                             const std::optional<std::string>& stdin_data,
                             const std::string& client_session_id);

    const Config& config() const { return config_; }

    // 128 random bits, hex encoded
    static std::string generate_request_id();

private:
    Language validate(const std::string& language, const std::string& source_code,
                      const std::optional<std::string>& stdin_data) const;

    const RuntimeRegistry& registry_;
    QuotaManager& quota_;
    Scheduler& scheduler_;
    ResultAggregator& aggregator_;
    Config config_;
};

} // namespace sniprun
