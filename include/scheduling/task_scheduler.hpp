#ifndef TASK_SCHEDULER_HPP
#define TASK_SCHEDULER_HPP

#include "scheduling/task.hpp"
#include "core/config.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

enum class TaskState : uint8_t
{
    Queued = 0,       // admitted; waiting or dispatched but not finished
    Completed = 1,    // terminal
    Canceled = 2      // terminal
};

struct SchedulerStatistics
{
    std::size_t completedCount{0};
    std::size_t pendingCount{0};     // waiting in the dispatch queue
    std::size_t canceledCount{0};
    std::size_t activeCount{0};      // pending + dispatched, not yet finished
    double avgCompletionTime{0.0};   // mean dispatch -> completion, seconds
    double avgWaitTime{0.0};         // mean arrival -> completion, seconds
    double throughput{0.0};          // completed tasks per second since start
};

/*** Priority dispatcher for robot tasks.
 *
 *   Ordering key is (priority, arrival time, admission sequence): lower
 *   priority first, FIFO among equals. Records are owned in a map keyed by
 *   the stable task id; the dispatch queue is an ordered index over them,
 *   so cancel / reprioritize never scan the queue. A finished task drops
 *   its record; only its id and final state are kept.
 *
 *   Every failure is reported by return value and leaves state untouched.
 *   All public calls are serialised on one internal mutex.
 */
class TaskScheduler {
public:
    /// Returns the current time in seconds. Only differences are used.
    using Clock = std::function<double()>;

    explicit TaskScheduler(std::size_t maxQueueSize = DEFAULT_MAX_QUEUE_SIZE,
                           double replanWeight = DEFAULT_REPLAN_WEIGHT,
                           Clock clock = Clock());
    explicit TaskScheduler(const SchedulerConfig& config, Clock clock = Clock());

    /* ───── Admission ─────────────────────────────────────────────── */
    /** False if the queue is full or the id was seen before. */
    bool addTask(const Task& task, int priority = DEFAULT_TASK_PRIORITY);

    /** Missing priorities default to DEFAULT_TASK_PRIORITY. Returns the
        number admitted; capacity may run out partway through.           */
    std::size_t addTasks(const std::vector<Task>& tasks,
                         const std::vector<int>& priorities = {});

    /* ───── Dispatch ──────────────────────────────────────────────── */
    /** Pops the most urgent task; empty (and current cleared) if none. */
    std::optional<Task> nextTask();
    std::optional<Task> currentTask() const;

    /* ───── Lifecycle ─────────────────────────────────────────────── */
    bool markCompleted(TaskId id);
    bool markCompleted(const Task& task) { return markCompleted(task.id); }

    bool cancelTask(TaskId id);
    bool cancelTask(const Task& task) { return cancelTask(task.id); }

    /** Cancel + readmit: the task gets a fresh arrival stamp, so its
        wait-time accounting restarts.                                  */
    bool reprioritizeTask(TaskId id, int newPriority);
    bool reprioritizeTask(const Task& task, int newPriority)
    { return reprioritizeTask(task.id, newPriority); }

    /** Re-keys every waiting task by
        distance(task, robot) * priority * replanWeight and rebuilds the
        queue. O(n log n); call periodically, not every tick. A
        non-finite position leaves the queue as it is.                  */
    void replan(const Point2D& robotPosition);

    /* ───── Inspection ────────────────────────────────────────────── */
    SchedulerStatistics statistics() const;
    std::optional<TaskState> state(TaskId id) const;
    std::optional<Task> find(TaskId id) const;   ///< active tasks only
    bool isActive(TaskId id) const;
    std::size_t pendingCount() const;
    std::size_t maxQueueSize() const { return maxQueueSize_; }
    double replanWeight() const { return replanWeight_; }
    void printStats() const;

private:
    struct QueueKey {
        double        priority;
        double        arrival;
        std::uint64_t sequence;
        TaskId        id;

        bool operator<(const QueueKey& o) const {
            if (priority != o.priority) return priority < o.priority;
            if (arrival != o.arrival)   return arrival < o.arrival;
            if (sequence != o.sequence) return sequence < o.sequence;
            return id < o.id;
        }
    };

    struct TaskRecord {
        Task          task;
        double        sortPriority{0.0};   // priority, or the replan key
        std::uint64_t sequence{0};
        bool          dispatched{false};
        double        dispatchTime{0.0};
    };
    using RecordMap = std::unordered_map<TaskId, TaskRecord>;

    QueueKey keyOf(const TaskRecord& r) const {
        return {r.sortPriority, r.task.arrivalTime, r.sequence, r.task.id};
    }
    double now() const { return clock_(); }
    void retire(RecordMap::iterator it, TaskState finalState);

    mutable std::mutex mutex_;

    std::size_t maxQueueSize_;
    double      replanWeight_;
    Clock       clock_;
    double      startTime_;

    RecordMap                             records_;    // active tasks only
    std::unordered_map<TaskId, TaskState> finished_;   // terminal ids, for duplicate checks
    std::set<QueueKey>    queue_;
    std::optional<TaskId> current_;
    std::uint64_t         nextSequence_{0};

    std::size_t completedCount_{0};
    std::size_t canceledCount_{0};
    double      totalServiceTime_{0.0};
    double      totalWaitTime_{0.0};
};

#endif // TASK_SCHEDULER_HPP
