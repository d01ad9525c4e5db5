#include "holdem/action_timer.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <exception>
#include <vector>

namespace holdem_table {

ActionTimer::ActionTimer() {
    worker_ = std::thread([this] { run(); });
}

ActionTimer::~ActionTimer() {
    {
        std::lock_guard<std::mutex> lock(m_);
        stopping_ = true;
        entries_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void ActionTimer::schedule(const std::string& key, std::chrono::milliseconds delay, Callback callback) {
    {
        std::lock_guard<std::mutex> lock(m_);
        entries_[key] = Entry{std::chrono::steady_clock::now() + delay, std::move(callback)};
    }
    cv_.notify_all();
}

bool ActionTimer::cancel(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_);
    return entries_.erase(key) > 0;
}

bool ActionTimer::is_scheduled(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_);
    return entries_.count(key) > 0;
}

void ActionTimer::run() {
    std::unique_lock<std::mutex> lock(m_);
    while (!stopping_) {
        if (entries_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !entries_.empty(); });
            continue;
        }

        auto next = entries_.begin()->second.deadline;
        for (const auto& [key, entry] : entries_) next = std::min(next, entry.deadline);
        // Réveil anticipé si une clé est (re)planifiée ou annulée
        if (cv_.wait_until(lock, next) != std::cv_status::timeout && std::chrono::steady_clock::now() < next) {
            continue;
        }

        const auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<std::string, Callback>> due;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second.deadline <= now) {
                due.emplace_back(it->first, std::move(it->second.callback));
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }

        lock.unlock();
        for (auto& [key, callback] : due) {
            try {
                callback();
            } catch (const std::exception& e) {
                spdlog::error("Action timer callback for {} failed: {}", key, e.what());
            }
        }
        lock.lock();
    }
}

} // namespace holdem_table
