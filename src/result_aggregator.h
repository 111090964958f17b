#pragma once

#include "constants.h"
#include "types.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sniprun {

enum class RequestState {
    QUEUED,
    RUNNING,
    DONE
};

std::string request_state_to_string(RequestState state);

// One entry of a request's event log. The terminal RESULT event carries no
// data; the result itself is returned next to the events.
struct OutputEvent {
    uint64_t seq = 0;
    EventType type = EventType::STATUS;
    std::string data;
};

struct PollResult {
    bool found = false;
    RequestState state = RequestState::QUEUED;
    std::vector<OutputEvent> events;
    uint64_t next_cursor = 0;
    bool done = false;
    std::optional<ExecutionResult> result;
};

// Collects the ordered output of every live request and hands it to
// pollers and stream subscribers. A channel lives from submission until
// its result is acknowledged or left unread for `delivery_wait`.
class ResultAggregator {
public:
    struct Config {
        std::chrono::milliseconds delivery_wait;

        Config() : delivery_wait(DEFAULT_DELIVERY_WAIT_MS) {}
    };

    explicit ResultAggregator(const Config& config = Config());

    void open(const std::string& request_id);

    // Append an event. Ignored once the channel is done or gone.
    bool publish(const std::string& request_id, EventType type, const std::string& data);
    void set_state(const std::string& request_id, RequestState state);

    // Store the result and append the terminal event. First call wins.
    bool complete(const std::string& request_id, const ExecutionResult& result);

    // Events with seq >= cursor
    PollResult poll(const std::string& request_id, uint64_t cursor) const;

    // Like poll(), but blocks up to `timeout` until there is something new
    PollResult wait(const std::string& request_id, uint64_t cursor,
                    std::chrono::milliseconds timeout) const;

    // Block until the request is done or `timeout` passes
    std::optional<ExecutionResult> await_result(const std::string& request_id,
                                                std::chrono::milliseconds timeout) const;

    // Caller has the result; drop the channel. False unless it was done.
    bool acknowledge(const std::string& request_id);

    // Drop a channel whatever its state (submission never got queued)
    void close(const std::string& request_id);

    // Drop finished channels nobody collected within delivery_wait
    size_t sweep();

    bool contains(const std::string& request_id) const;
    size_t size() const;

private:
    struct Channel {
        mutable std::mutex mutex;
        mutable std::condition_variable cv;
        std::vector<OutputEvent> events;
        RequestState state = RequestState::QUEUED;
        std::optional<ExecutionResult> result;
        std::chrono::steady_clock::time_point completed_at;
    };
    using ChannelPtr = std::shared_ptr<Channel>;

    ChannelPtr find(const std::string& request_id) const;
    static PollResult snapshot(const Channel& channel, uint64_t cursor);

    Config config_;
    mutable std::shared_mutex channels_mutex_;
    std::map<std::string, ChannelPtr> channels_;
};

} // namespace sniprun
