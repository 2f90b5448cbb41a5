/**
 * @file refresh_scheduler.cpp
 * @brief RefreshScheduler implementation.
 */

#include "scheduler/refresh_scheduler.hpp"

#include <chrono>
#include <condition_variable>
#include <vector>

namespace hvac_exporter {

RefreshScheduler::RefreshScheduler(RefreshSettings settings,
                                   HostTable& hosts,
                                   StateCache& cache,
                                   QueryClientFactory client_factory,
                                   Logger& logger,
                                   ExporterStats& stats)
    : settings_(settings)
    , hosts_(hosts)
    , cache_(cache)
    , client_factory_(std::move(client_factory))
    , logger_(logger)
    , stats_(stats) {}

RefreshScheduler::~RefreshScheduler() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void RefreshScheduler::start() {
    for (const auto& key : hosts_.keys()) {
        add_host(key);
    }
}

void RefreshScheduler::stop() {
    std::unordered_map<HostKey, std::jthread> tasks;
    {
        std::lock_guard lock(tasks_mutex_);
        stopped_ = true;
        tasks.swap(tasks_);
    }

    for (auto& [key, task] : tasks) {
        task.request_stop();
    }
    sleep_cv_.notify_all();
    // jthreads join as `tasks` goes out of scope
}

bool RefreshScheduler::add_host(const HostKey& key) {
    auto host = hosts_.get(key);
    if (!host) return false;

    std::lock_guard lock(tasks_mutex_);
    if (stopped_ || tasks_.count(key) > 0) return false;

    tasks_.emplace(key, std::jthread([this, key](std::stop_token stop) {
        refresh_loop(key, stop);
    }));

    logger_.info("Watching unit " + key + " at " + host->endpoint.to_string()
                 + " (" + std::string(to_string(host->origin)) + ")");
    return true;
}

size_t RefreshScheduler::scheduled_count() const {
    std::lock_guard lock(tasks_mutex_);
    return tasks_.size();
}

uint64_t RefreshScheduler::ticks_skipped() const noexcept {
    return ticks_skipped_.load();
}

// ─────────────────────────────────────────────
// Refresh Task
// ─────────────────────────────────────────────

void RefreshScheduler::refresh_loop(const HostKey& key, std::stop_token stop) {
    auto client = client_factory_();
    if (!client) {
        logger_.error("No query client available for " + key);
        return;
    }

    auto next = std::chrono::steady_clock::now();

    while (!stop.stop_requested()) {
        tick(key, *client, stop);

        next += settings_.interval;
        auto now = std::chrono::steady_clock::now();
        if (now > next) {
            auto missed = (now - next) / settings_.interval + 1;
            next += missed * settings_.interval;
            ticks_skipped_ += static_cast<uint64_t>(missed);
            logger_.debug("Refresh of " + key + " overran, skipped "
                          + std::to_string(missed) + " tick(s)");
        }

        sleep_until(next, stop);
    }
}

void RefreshScheduler::tick(const HostKey& key, IQueryClient& client, std::stop_token stop) {
    auto host = hosts_.get(key);
    if (!host) return;

    ++stats_.query_requests;
    auto reply = client.query(host->endpoint, settings_.timeout, stop);

    // Shutdown interrupted the wait; that says nothing about the unit
    if (stop.stop_requested()) return;

    auto now = std::chrono::system_clock::now();

    if (reply) {
        ++stats_.query_successes;

        std::optional<UnitId> unit_id;
        if (auto mac = reply->fields.find("mac"); mac != reply->fields.end() && !mac->second.empty()) {
            unit_id = mac->second;
        }

        auto snapshot = snapshot_from_reply(*reply, now);
        auto name = snapshot.text("name");

        cache_.store(key, std::move(snapshot));
        auto previous = hosts_.mark_responding(key, now);

        if (!hosts_.bind_identity(key, unit_id, name)) {
            logger_.log(previous == Liveness::Unreachable ? LogLevel::Warn : LogLevel::Debug,
                        "Unit " + key + " reports id " + unit_id.value_or("?")
                        + " already registered to another host");
        }

        if (previous == Liveness::Unreachable) {
            logger_.info("Unit " + key + " is responding");
        }
        return;
    }

    const auto& error = reply.error();
    switch (error.kind) {
        case ProtocolError::Kind::TimedOut:    ++stats_.query_timeouts; break;
        case ProtocolError::Kind::Malformed:   ++stats_.query_malformed; break;
        case ProtocolError::Kind::SocketError: ++stats_.query_socket_errors; break;
    }

    auto previous = hosts_.mark_unreachable(key, now);
    if (previous == Liveness::Responding) {
        logger_.warn("Unit " + key + " unreachable (" + std::string(to_string(error.kind))
                     + "): " + error.message + "; serving cached values");
    } else {
        logger_.debug("Refresh of " + key + " failed (" + std::string(to_string(error.kind))
                      + "): " + error.message);
    }
}

void RefreshScheduler::sleep_until(SteadyTime deadline, std::stop_token stop) {
    std::unique_lock lock(sleep_mutex_);
    sleep_cv_.wait_until(lock, stop, deadline, [] { return false; });
}

}  // namespace hvac_exporter
