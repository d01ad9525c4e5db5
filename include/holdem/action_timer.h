#ifndef HOLDEM_ACTION_TIMER_H
#define HOLDEM_ACTION_TIMER_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace holdem_table {

/**
 * Échéances annulables, une par clé (id de table), servies par un seul thread.
 * Re-planifier une clé remplace l'échéance précédente. Les rappels s'exécutent
 * sur le thread du minuteur, hors verrou.
 */
class ActionTimer {
public:
    using Callback = std::function<void()>;

    ActionTimer();
    ~ActionTimer();

    ActionTimer(const ActionTimer&) = delete;
    ActionTimer& operator=(const ActionTimer&) = delete;

    void schedule(const std::string& key, std::chrono::milliseconds delay, Callback callback);
    bool cancel(const std::string& key);
    bool is_scheduled(const std::string& key) const;

private:
    struct Entry {
        std::chrono::steady_clock::time_point deadline;
        Callback callback;
    };

    void run();

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::map<std::string, Entry> entries_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace holdem_table

#endif // HOLDEM_ACTION_TIMER_H
