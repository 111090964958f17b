#include "gateway.h"
#include "errors.h"
#include "log.h"

#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>

namespace sniprun {

Gateway::Gateway(const RuntimeRegistry& registry, QuotaManager& quota, Scheduler& scheduler,
                 ResultAggregator& aggregator, const Config& config)
    : registry_(registry), quota_(quota), scheduler_(scheduler), aggregator_(aggregator),
      config_(config) {
    scheduler_.set_completion_handler(
        [this](const ExecutionRequest& request, const ExecutionResult& result, bool executed) {
            // Time spent waiting in our queue is not held against the session
            quota_.release(request.client_session_id, executed ? result.outcome : Outcome::CANCELLED);
        });
}

std::string Gateway::generate_request_id() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw SandboxError("RAND_bytes failed");
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned char byte : bytes) {
        hex << std::setw(2) << static_cast<int>(byte);
    }
    return hex.str();
}

Language Gateway::validate(const std::string& language, const std::string& source_code,
                           const std::optional<std::string>& stdin_data) const {
    std::string name = language;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    auto parsed = parse_language(name);
    if (!parsed || !registry_.has(*parsed)) {
        throw RejectedError(ErrorCode::INVALID_LANGUAGE, "unsupported language: " + language);
    }

    if (source_code.size() > config_.max_source_bytes) {
        throw RejectedError(ErrorCode::PAYLOAD_TOO_LARGE,
                            "source exceeds " + std::to_string(config_.max_source_bytes) + " bytes");
    }
    if (stdin_data && stdin_data->size() > config_.max_stdin_bytes) {
        throw RejectedError(ErrorCode::PAYLOAD_TOO_LARGE,
                            "stdin exceeds " + std::to_string(config_.max_stdin_bytes) + " bytes");
    }
    return *parsed;
}

SubmitHandle Gateway::submit(const std::string& language, const std::string& source_code,
                             const std::optional<std::string>& stdin_data,
                             const std::string& client_session_id) {
    Language parsed = validate(language, source_code, stdin_data);

    AdmissionDecision decision = quota_.admit(client_session_id);
    if (decision.admission == Admission::REJECTED) {
        throw RejectedError(ErrorCode::REJECTED, decision.reason, decision.retry_after);
    }
    if (decision.admission == Admission::THROTTLED) {
        throw RejectedError(ErrorCode::THROTTLED, decision.reason, decision.retry_after);
    }

    auto request = std::make_shared<ExecutionRequest>();
    try {
        request->id = generate_request_id();
    } catch (...) {
        quota_.cancel_admission(client_session_id);
        throw;
    }
    request->language = parsed;
    request->source_code = source_code;
    request->stdin_data = stdin_data;
    request->client_session_id = client_session_id;
    request->submitted_at = std::chrono::steady_clock::now();

    aggregator_.open(request->id);
    aggregator_.publish(request->id, EventType::STATUS, "queued");

    SubmitHandle handle;
    handle.request_id = request->id;
    try {
        handle.queue_position = scheduler_.enqueue(request);
    } catch (const RejectedError&) {
        aggregator_.close(request->id);
        quota_.cancel_admission(client_session_id);
        throw;
    }

    log::info("Gateway", "Accepted " + handle.request_id + " (" + language_to_string(parsed) +
              ", " + std::to_string(source_code.size()) + " bytes, position " +
              std::to_string(handle.queue_position) + ")");
    return handle;
}

bool Gateway::cancel(const std::string& request_id) {
    bool cancelled = scheduler_.cancel(request_id);
    if (cancelled) {
        log::info("Gateway", "Cancel requested for " + request_id);
    }
    return cancelled;
}

PollResult Gateway::poll(const std::string& request_id, uint64_t cursor) const {
    return aggregator_.poll(request_id, cursor);
}

PollResult Gateway::wait(const std::string& request_id, uint64_t cursor,
                        std::chrono::milliseconds timeout) const {
    return aggregator_.wait(request_id, cursor, timeout);
}

std::optional<size_t> Gateway::queue_position(const std::string& request_id) const {
    return scheduler_.queue_position(request_id);
}

bool Gateway::acknowledge(const std::string& request_id) {
    return aggregator_.acknowledge(request_id);
}

ExecutionResult Gateway::run_sync(const std::string& language, const std::string& source_code,
                                  const std::optional<std::string>& stdin_data,
                                  const std::string& client_session_id) {
    SubmitHandle handle = submit(language, source_code, stdin_data, client_session_id);

    auto result = aggregator_.await_result(handle.request_id, config_.max_end_to_end);
    if (result) {
        aggregator_.acknowledge(handle.request_id);
        return *result;
    }

    // Out of time: stop it, keep whatever output it produced
    scheduler_.cancel(handle.request_id);
    result = aggregator_.await_result(handle.request_id, std::chrono::milliseconds(2 * KILL_GRACE_MS));
    aggregator_.acknowledge(handle.request_id);

    ExecutionResult timed_out = result ? *result : ExecutionResult();
    if (!result || timed_out.outcome == Outcome::CANCELLED) {
        timed_out.request_id = handle.request_id;
        timed_out.outcome = Outcome::TIMED_OUT;
        timed_out.exit_code = -1;
        timed_out.message = "end-to-end deadline exceeded";
        timed_out.duration = config_.max_end_to_end;
    }
    return timed_out;
}

} // namespace sniprun
