#pragma once

#include <atomic>
#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/constant/probe.h>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace devmon::core {

/**
 * @brief Runs named repeating background tasks.
 *
 * @details Every task owns a thread running its own io_context. The task invokes its
 * action immediately, then waits on a steady_timer for the interval; cancelling the timer
 * is the cancellation signal, so a stopped task exits at its next wait without invoking
 * the action again. An action that throws is logged and the loop carries on.
 *
 * Joins are bounded by the join timeout: a task whose action is still running past it is
 * detached and left to finish on its own.
 */
class SchedulerService {
public:
    using Action = std::function<void()>;

    explicit SchedulerService(std::chrono::milliseconds join_timeout = schedule::kTaskJoinTimeout);
    ~SchedulerService();
    SchedulerService(const SchedulerService&) = delete;
    SchedulerService& operator=(const SchedulerService&) = delete;

    // Both are no-ops when already in the requested state
    void Start();
    void Stop();

    // Rejected with a warning if the name is taken or the scheduler is stopped
    bool ScheduleRepeating(const std::string& task_name,
                           Action action,
                           std::chrono::milliseconds interval);
    bool Unschedule(const std::string& task_name);

    bool IsRunning() const;
    bool IsScheduled(const std::string& task_name) const;
    std::size_t TaskCount() const;

private:
    struct Task;

    std::chrono::milliseconds join_timeout_;
    mutable std::mutex mutex_;
    bool running_{false};
    // Replaced on every Start() so tasks abandoned by an earlier Stop() keep seeing it set
    std::shared_ptr<std::atomic<bool>> stop_requested_;
    std::unordered_map<std::string, std::shared_ptr<Task>> tasks_;

    void cancelAndJoin(const std::shared_ptr<Task>& task);

    static boost::asio::awaitable<void> runTask(std::shared_ptr<Task> task);
};

} // namespace devmon::core
