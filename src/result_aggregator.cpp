#include "result_aggregator.h"
#include "log.h"

#include <algorithm>

namespace sniprun {

std::string request_state_to_string(RequestState state) {
    switch (state) {
        case RequestState::QUEUED: return "queued";
        case RequestState::RUNNING: return "running";
        case RequestState::DONE: return "done";
    }
    return "unknown";
}

ResultAggregator::ResultAggregator(const Config& config) : config_(config) {}

ResultAggregator::ChannelPtr ResultAggregator::find(const std::string& request_id) const {
    std::shared_lock<std::shared_mutex> lock(channels_mutex_);
    auto it = channels_.find(request_id);
    return it == channels_.end() ? nullptr : it->second;
}

void ResultAggregator::open(const std::string& request_id) {
    std::unique_lock<std::shared_mutex> lock(channels_mutex_);
    channels_.emplace(request_id, std::make_shared<Channel>());
}

bool ResultAggregator::publish(const std::string& request_id, EventType type, const std::string& data) {
    ChannelPtr channel = find(request_id);
    if (!channel) return false;

    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->state == RequestState::DONE) return false;
        channel->events.push_back({channel->events.size(), type, data});
    }
    channel->cv.notify_all();
    return true;
}

void ResultAggregator::set_state(const std::string& request_id, RequestState state) {
    ChannelPtr channel = find(request_id);
    if (!channel) return;

    std::lock_guard<std::mutex> lock(channel->mutex);
    if (channel->state != RequestState::DONE) {
        channel->state = state;
    }
}

bool ResultAggregator::complete(const std::string& request_id, const ExecutionResult& result) {
    ChannelPtr channel = find(request_id);
    if (!channel) return false;

    {
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->state == RequestState::DONE) return false;
        channel->result = result;
        channel->events.push_back({channel->events.size(), EventType::RESULT, ""});
        channel->state = RequestState::DONE;
        channel->completed_at = std::chrono::steady_clock::now();
    }
    channel->cv.notify_all();
    return true;
}

PollResult ResultAggregator::snapshot(const Channel& channel, uint64_t cursor) {
    PollResult poll;
    poll.found = true;
    poll.state = channel.state;
    poll.done = channel.state == RequestState::DONE;
    poll.result = channel.result;

    if (cursor < channel.events.size()) {
        poll.events.assign(channel.events.begin() + cursor, channel.events.end());
    }
    poll.next_cursor = std::max<uint64_t>(cursor, channel.events.size());
    return poll;
}

PollResult ResultAggregator::poll(const std::string& request_id, uint64_t cursor) const {
    ChannelPtr channel = find(request_id);
    if (!channel) return PollResult{};

    std::lock_guard<std::mutex> lock(channel->mutex);
    return snapshot(*channel, cursor);
}

PollResult ResultAggregator::wait(const std::string& request_id, uint64_t cursor,
                                  std::chrono::milliseconds timeout) const {
    ChannelPtr channel = find(request_id);
    if (!channel) return PollResult{};

    std::unique_lock<std::mutex> lock(channel->mutex);
    channel->cv.wait_for(lock, timeout, [&] {
        return channel->events.size() > cursor || channel->state == RequestState::DONE;
    });
    return snapshot(*channel, cursor);
}

std::optional<ExecutionResult> ResultAggregator::await_result(const std::string& request_id,
                                                              std::chrono::milliseconds timeout) const {
    ChannelPtr channel = find(request_id);
    if (!channel) return std::nullopt;

    std::unique_lock<std::mutex> lock(channel->mutex);
    channel->cv.wait_for(lock, timeout, [&] { return channel->state == RequestState::DONE; });
    return channel->result;
}

bool ResultAggregator::acknowledge(const std::string& request_id) {
    std::unique_lock<std::shared_mutex> lock(channels_mutex_);
    auto it = channels_.find(request_id);
    if (it == channels_.end()) return false;

    {
        std::lock_guard<std::mutex> channel_lock(it->second->mutex);
        if (it->second->state != RequestState::DONE) return false;
    }
    channels_.erase(it);
    return true;
}

void ResultAggregator::close(const std::string& request_id) {
    ChannelPtr channel;
    {
        std::unique_lock<std::shared_mutex> lock(channels_mutex_);
        auto it = channels_.find(request_id);
        if (it == channels_.end()) return;
        channel = it->second;
        channels_.erase(it);
    }
    // Wake anyone still waiting on it
    channel->cv.notify_all();
}

size_t ResultAggregator::sweep() {
    auto cutoff = std::chrono::steady_clock::now() - config_.delivery_wait;
    size_t removed = 0;

    std::unique_lock<std::shared_mutex> lock(channels_mutex_);
    for (auto it = channels_.begin(); it != channels_.end();) {
        bool expired;
        {
            std::lock_guard<std::mutex> channel_lock(it->second->mutex);
            expired = it->second->state == RequestState::DONE && it->second->completed_at <= cutoff;
        }
        if (expired) {
            it = channels_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        log::info("Aggregator", "Dropped " + std::to_string(removed) + " uncollected results");
    }
    return removed;
}

bool ResultAggregator::contains(const std::string& request_id) const {
    return find(request_id) != nullptr;
}

size_t ResultAggregator::size() const {
    std::shared_lock<std::shared_mutex> lock(channels_mutex_);
    return channels_.size();
}

} // namespace sniprun
