#include <utility> // boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/service/scheduler_service.h>
#include <future>
#include <spdlog/spdlog.h>
#include <thread>
#include <vector>

namespace net = boost::asio;

namespace devmon::core {

struct SchedulerService::Task {
    Task(std::string name,
         Action action,
         std::chrono::milliseconds interval,
         std::shared_ptr<std::atomic<bool>> stop_requested)
        : name(std::move(name))
        , action(std::move(action))
        , interval(interval)
        , stop_requested(std::move(stop_requested))
        , timer(ioc)
        , finished_future(finished.get_future()) {}

    bool shouldExit() const { return cancelled || *stop_requested; }

    std::string name;
    Action action;
    std::chrono::milliseconds interval;
    std::shared_ptr<std::atomic<bool>> stop_requested;
    std::atomic<bool> cancelled{false};

    net::io_context ioc;
    net::steady_timer timer;
    std::thread thread;
    std::promise<void> finished;
    std::future<void> finished_future;
};

SchedulerService::SchedulerService(std::chrono::milliseconds join_timeout)
    : join_timeout_(join_timeout)
    , stop_requested_(std::make_shared<std::atomic<bool>>(true)) {}

SchedulerService::~SchedulerService() {
    Stop();
}

void SchedulerService::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        spdlog::warn("Scheduler already running");
        return;
    }
    running_ = true;
    stop_requested_ = std::make_shared<std::atomic<bool>>(false);
    spdlog::info("Scheduler started");
}

void SchedulerService::Stop() {
    std::unordered_map<std::string, std::shared_ptr<Task>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            spdlog::debug("Scheduler already stopped");
            return;
        }
        running_ = false;
        stop_requested_->store(true);
        tasks.swap(tasks_);
    }

    for (auto& [name, task] : tasks) {
        cancelAndJoin(task);
    }
    spdlog::info("Scheduler stopped");
}

bool SchedulerService::ScheduleRepeating(const std::string& task_name,
                                         Action action,
                                         std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        spdlog::warn("Scheduler is not running, task not scheduled: {}", task_name);
        return false;
    }
    if (tasks_.contains(task_name)) {
        spdlog::warn("Task already scheduled: {}", task_name);
        return false;
    }

    auto task = std::make_shared<Task>(task_name, std::move(action), interval, stop_requested_);
    net::co_spawn(task->ioc, runTask(task), [name = task_name](std::exception_ptr e) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::error("Scheduled task {} terminated: {}", name, ex.what());
            }
        }
    });
    task->thread = std::thread([task]() {
        try {
            task->ioc.run();
        } catch (const std::exception& e) {
            spdlog::error("Scheduled task {} aborted: {}", task->name, e.what());
        }
        task->finished.set_value();
    });
    tasks_.emplace(task_name, std::move(task));
    spdlog::info("Scheduled task: {} (interval: {}ms)", task_name, interval.count());
    return true;
}

bool SchedulerService::Unschedule(const std::string& task_name) {
    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_name);
        if (it == tasks_.end()) {
            spdlog::warn("Task not found to unschedule: {}", task_name);
            return false;
        }
        task = std::move(it->second);
        tasks_.erase(it);
    }
    cancelAndJoin(task);
    spdlog::info("Unscheduled task: {}", task_name);
    return true;
}

bool SchedulerService::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool SchedulerService::IsScheduled(const std::string& task_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.contains(task_name);
}

std::size_t SchedulerService::TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void SchedulerService::cancelAndJoin(const std::shared_ptr<Task>& task) {
    task->cancelled = true;
    // The timer lives on the task's own thread; cancel it there
    net::post(task->ioc, [weak = std::weak_ptr<Task>(task)]() {
        if (auto alive = weak.lock(); alive) {
            alive->timer.cancel();
        }
    });

    if (!task->thread.joinable()) {
        return;
    }
    if (task->thread.get_id() == std::this_thread::get_id()) {
        spdlog::warn("Task {} cancelled from its own action, not joining", task->name);
        task->thread.detach();
        return;
    }
    if (task->finished_future.wait_for(join_timeout_) == std::future_status::ready) {
        task->thread.join();
    } else {
        spdlog::warn("Task {} did not stop within {}ms, abandoning it",
                     task->name,
                     join_timeout_.count());
        task->thread.detach();
    }
}

net::awaitable<void> SchedulerService::runTask(std::shared_ptr<Task> task) {
    spdlog::debug("Scheduled task {} started (interval={}ms)", task->name, task->interval.count());
    while (!task->shouldExit()) {
        try {
            task->action();
        } catch (const std::exception& e) {
            spdlog::error("Error in scheduled task {}: {}", task->name, e.what());
        } catch (...) {
            spdlog::error("Unknown error in scheduled task {}", task->name);
        }
        if (task->shouldExit()) {
            break;
        }

        boost::system::error_code ec;
        task->timer.expires_after(task->interval);
        co_await task->timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec == net::error::operation_aborted) {
            break;
        }
    }
    spdlog::debug("Scheduled task {} exiting", task->name);
}

} // namespace devmon::core
