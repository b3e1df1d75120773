#pragma once

#include "RNETypes.h"
#include "common/ILoggerBackend.h"
#include "guards/GuardTypes.h"
#include "runtime/NavigationResult.h"
#include <algorithm>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RNE {
namespace Test {

/**
 * @brief Logger backend that records every message for assertions
 */
class CapturingLoggerBackend : public ILoggerBackend {
public:
    void log(LogLevel level, const std::string &message, const std::source_location &) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace_back(level, message);
    }

    void setLevel(LogLevel) override {}

    void flush() override {}

    bool contains(LogLevel level, const std::string &fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(entries_.begin(), entries_.end(), [&](const auto &entry) {
            return entry.first == level && entry.second.find(fragment) != std::string::npos;
        });
    }

    bool contains(const std::string &fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(entries_.begin(), entries_.end(),
                           [&](const auto &entry) { return entry.second.find(fragment) != std::string::npos; });
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<LogLevel, std::string>> entries_;
};

/**
 * @brief Holds asynchronous guard answers until the test releases them
 *
 * Stands in for an event loop: a guard created with deferredGuard() parks its
 * continuation here instead of answering.
 */
class ManualScheduler {
public:
    GuardFn deferredGuard(const std::string &label, GuardResult answer = GuardResult::allow()) {
        return [this, label, answer](const State &, const std::optional<State> &, GuardCallback done) {
            pending_.push_back({label, [done, answer]() { done(answer); }});
        };
    }

    std::size_t pendingCount() const {
        return pending_.size();
    }

    bool hasPending(const std::string &label) const {
        return std::any_of(pending_.begin(), pending_.end(),
                           [&](const Task &task) { return task.label == label; });
    }

    /**
     * @brief Run the oldest parked continuation
     */
    bool runNext() {
        if (pending_.empty()) {
            return false;
        }
        Task task = std::move(pending_.front());
        pending_.pop_front();
        task.run();
        return true;
    }

    void runAll() {
        while (runNext()) {
        }
    }

private:
    struct Task {
        std::string label;
        std::function<void()> run;
    };

    std::deque<Task> pending_;
};

/**
 * @brief Guard that appends its label to @p calls and answers @p allowed
 */
inline GuardFn recordingGuard(std::vector<std::string> &calls, const std::string &label, bool allowed = true) {
    return [&calls, label, allowed](const State &, const std::optional<State> &, GuardCallback done) {
        calls.push_back(label);
        done(allowed ? GuardResult::allow() : GuardResult::reject());
    };
}

inline GuardHandler guardHandler(GuardFn fn) {
    return GuardFactory([fn = std::move(fn)](GuardRegistry &) { return fn; });
}

/**
 * @brief Collects every result delivered to its callback
 */
class ResultCollector {
public:
    NavigationCallback callback() {
        return [this](const NavigationResult &result) { results_.push_back(result); };
    }

    std::size_t count() const {
        return results_.size();
    }

    const NavigationResult &last() const {
        return results_.back();
    }

    std::optional<ErrorCode> lastErrorCode() const {
        if (results_.empty() || !results_.back().error) {
            return std::nullopt;
        }
        return results_.back().error->getCode();
    }

private:
    std::vector<NavigationResult> results_;
};

/**
 * @brief Minimal state without segment metadata
 */
inline State makeState(const std::string &name, const Params &params = {}, const std::string &path = "") {
    State state;
    state.name = name;
    state.params = params;
    state.path = path.empty() ? "/" + name : path;
    return state;
}

}  // namespace Test
}  // namespace RNE
