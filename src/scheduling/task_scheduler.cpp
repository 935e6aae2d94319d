#include "scheduling/task_scheduler.hpp"
#include "utils.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

TaskScheduler::TaskScheduler(std::size_t maxQueueSize, double replanWeight, Clock clock)
    : maxQueueSize_(maxQueueSize),
      replanWeight_(replanWeight),
      clock_(std::move(clock))
{
    if (maxQueueSize_ == 0)
        throw std::invalid_argument("TaskScheduler: max queue size must be positive");

    if (!clock_) {
        auto origin = std::chrono::steady_clock::now();
        clock_ = [origin]() { return utils::secondsSince(origin); };
    }
    startTime_ = clock_();
}

TaskScheduler::TaskScheduler(const SchedulerConfig& config, Clock clock)
    : TaskScheduler(config.maxQueueSize, config.replanWeight, std::move(clock))
{
}

/* ───────────────────────────── Admission ────────────────────────── */
bool TaskScheduler::addTask(const Task& task, int priority)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.size() >= maxQueueSize_)
        return false;

    if (records_.count(task.id) || finished_.count(task.id)) {
        std::cerr << "[TaskScheduler] Task#" << task.id << " already known, rejected" << std::endl;
        return false;
    }

    TaskRecord record;
    record.task = task;
    record.task.priority = priority;
    record.task.arrivalTime = now();
    record.task.completed = false;
    record.sortPriority = static_cast<double>(priority);
    record.sequence = nextSequence_++;

    queue_.insert(keyOf(record));
    records_.emplace(task.id, std::move(record));
    return true;
}

std::size_t TaskScheduler::addTasks(const std::vector<Task>& tasks,
                                    const std::vector<int>& priorities)
{
    std::size_t added = 0;
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        int priority = i < priorities.size() ? priorities[i] : DEFAULT_TASK_PRIORITY;
        if (addTask(tasks[i], priority))
            ++added;
    }
    return added;
}

/* ───────────────────────────── Dispatch ─────────────────────────── */
std::optional<Task> TaskScheduler::nextTask()
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        current_.reset();
        return std::nullopt;
    }

    const QueueKey key = *queue_.begin();
    queue_.erase(queue_.begin());

    TaskRecord& record = records_.at(key.id);
    record.dispatched = true;
    record.dispatchTime = now();
    current_ = key.id;
    return record.task;
}

std::optional<Task> TaskScheduler::currentTask() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_)
        return std::nullopt;
    return records_.at(*current_).task;
}

/* ───────────────────────────── Lifecycle ────────────────────────── */
bool TaskScheduler::markCompleted(TaskId id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(id);
    if (it == records_.end())
        return false;

    const TaskRecord& record = it->second;
    const double t = now();
    const double start = record.dispatched ? record.dispatchTime : record.task.arrivalTime;
    totalServiceTime_ += t - start;
    totalWaitTime_    += t - record.task.arrivalTime;
    ++completedCount_;

    retire(it, TaskState::Completed);
    return true;
}

bool TaskScheduler::cancelTask(TaskId id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(id);
    if (it == records_.end())
        return false;

    ++canceledCount_;
    retire(it, TaskState::Canceled);
    return true;
}

bool TaskScheduler::reprioritizeTask(TaskId id, int newPriority)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = records_.find(id);
    if (it == records_.end())
        return false;

    TaskRecord& record = it->second;

    // A dispatched task re-enters the queue and needs a free slot
    if (record.dispatched && queue_.size() >= maxQueueSize_) {
        std::cerr << "[TaskScheduler] Queue full, Task#" << id
                  << " not reprioritized" << std::endl;
        return false;
    }

    if (!record.dispatched)
        queue_.erase(keyOf(record));
    else if (current_ && *current_ == id)
        current_.reset();

    record.dispatched = false;
    record.task.priority = newPriority;
    record.task.arrivalTime = now();
    record.sortPriority = static_cast<double>(newPriority);
    record.sequence = nextSequence_++;

    queue_.insert(keyOf(record));
    return true;
}

void TaskScheduler::replan(const Point2D& robotPosition)
{
    std::lock_guard<std::mutex> lock(mutex_);

    // NaN keys would break the queue ordering
    if (!std::isfinite(robotPosition.x) || !std::isfinite(robotPosition.y)) {
        std::cerr << "[TaskScheduler] Ignoring replan from non-finite position ("
                  << robotPosition.x << ", " << robotPosition.y << ")" << std::endl;
        return;
    }

    std::set<QueueKey> rebuilt;
    for (const auto& key : queue_) {
        TaskRecord& record = records_.at(key.id);
        const double dx = record.task.position.x - robotPosition.x;
        const double dy = record.task.position.y - robotPosition.y;
        const double distance = std::sqrt(dx * dx + dy * dy);

        record.sortPriority = distance * record.task.priority * replanWeight_;
        rebuilt.insert(keyOf(record));
    }
    queue_.swap(rebuilt);
}

/* Drops the record of a finished task, keeping only its final state */
void TaskScheduler::retire(RecordMap::iterator it, TaskState finalState)
{
    const TaskId id = it->first;
    if (!it->second.dispatched)
        queue_.erase(keyOf(it->second));
    if (current_ && *current_ == id)
        current_.reset();

    records_.erase(it);
    finished_.emplace(id, finalState);
}

/* ───────────────────────────── Inspection ───────────────────────── */
SchedulerStatistics TaskScheduler::statistics() const
{
    std::lock_guard<std::mutex> lock(mutex_);

    SchedulerStatistics stats;
    stats.completedCount = completedCount_;
    stats.pendingCount   = queue_.size();
    stats.canceledCount  = canceledCount_;
    stats.activeCount    = records_.size();

    if (completedCount_ > 0) {
        stats.avgCompletionTime = totalServiceTime_ / completedCount_;
        stats.avgWaitTime       = totalWaitTime_ / completedCount_;
    }

    const double elapsed = now() - startTime_;
    stats.throughput = elapsed > 0.0 ? completedCount_ / elapsed : 0.0;
    return stats;
}

std::optional<TaskState> TaskScheduler::state(TaskId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(id))
        return TaskState::Queued;
    auto it = finished_.find(id);
    if (it == finished_.end())
        return std::nullopt;
    return it->second;
}

std::optional<Task> TaskScheduler::find(TaskId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end())
        return std::nullopt;
    return it->second.task;
}

bool TaskScheduler::isActive(TaskId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(id) > 0;
}

std::size_t TaskScheduler::pendingCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskScheduler::printStats() const
{
    SchedulerStatistics s = statistics();

    std::cout << "\n========== SCHEDULER STATUS ==========\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Completed tasks:     " << s.completedCount << "\n";
    std::cout << "Pending tasks:       " << s.pendingCount << " / " << maxQueueSize_ << "\n";
    std::cout << "Active tasks:        " << s.activeCount << "\n";
    std::cout << "Canceled tasks:      " << s.canceledCount << "\n";
    std::cout << "Avg completion time: " << s.avgCompletionTime << " s\n";
    std::cout << "Avg wait time:       " << s.avgWaitTime << " s\n";
    std::cout << "Throughput:          " << s.throughput << " tasks/s\n";
    std::cout << "======================================\n" << std::endl;
}
