#include "scheduling/task_scheduler.hpp"
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

static int g_failures = 0;

static void check(bool ok, const std::string& what)
{
    std::cout << (ok ? "  [PASS] " : "  [FAIL] ") << what << std::endl;
    if (!ok) ++g_failures;
}

static bool near(double a, double b, double eps = 1e-9)
{
    return std::abs(a - b) <= eps;
}

static Task makeTask(TaskId id, double x = 0.0, double y = 0.0)
{
    Task t;
    t.id = id;
    t.type = TaskType::Pick;
    t.position = {x, y};
    t.item = static_cast<int>(id);
    return t;
}

static bool nextIs(TaskScheduler& s, TaskId id)
{
    std::optional<Task> t = s.nextTask();
    return t && t->id == id;
}

void testPriorityOrdering()
{
    std::cout << "=== Priority ordering ===" << std::endl;
    double t = 0.0;
    TaskScheduler s(10, 0.1, [&t]() { return t; });

    s.addTask(makeTask(1), 2);
    t = 1.0;
    s.addTask(makeTask(2), 1);
    t = 2.0;
    s.addTask(makeTask(3), 1);

    check(nextIs(s, 2), "priority 1 admitted first goes first");
    check(nextIs(s, 3), "then the other priority 1 task");
    check(nextIs(s, 1), "priority 2 last");

    check(!s.nextTask().has_value(), "empty queue -> nothing to dispatch");
    check(!s.currentTask().has_value(), "empty dispatch clears the current task");
}

void testFifoOnTies()
{
    std::cout << "\n=== FIFO among equal keys ===" << std::endl;
    double t = 5.0;
    TaskScheduler s(10, 0.1, [&t]() { return t; });

    for (TaskId id = 1; id <= 4; ++id)
        s.addTask(makeTask(id), 1);

    bool fifo = true;
    for (TaskId id = 1; id <= 4; ++id)
        fifo = fifo && nextIs(s, id);
    check(fifo, "same priority and timestamp -> admission order");
}

void testCapacity()
{
    std::cout << "\n=== Capacity ===" << std::endl;
    double t = 0.0;
    TaskScheduler s(3, 0.1, [&t]() { return t; });

    std::vector<Task> batch = { makeTask(1), makeTask(2), makeTask(3), makeTask(4), makeTask(5) };
    check(s.addTasks(batch, {3, 2}) == 3, "batch admission stops at capacity");
    check(s.pendingCount() == 3, "three tasks waiting");
    check(!s.addTask(makeTask(6)), "full queue rejects a new task");
    check(!s.state(6).has_value(), "rejected task leaves no record");

    check(s.find(3) && s.find(3)->priority == DEFAULT_TASK_PRIORITY,
          "missing batch priority falls back to the default");
    check(nextIs(s, 3), "default priority 1 beats the explicit 2 and 3");

    check(!s.addTask(makeTask(1)), "known id rejected even with free capacity");
    check(s.addTask(makeTask(6)), "free slot admits a new task");
    check(nextIs(s, 6), "new task dispatched");
    check(!s.addTask(makeTask(3)), "dispatched id cannot be readmitted");
}

void testLifecycle()
{
    std::cout << "\n=== Complete / cancel ===" << std::endl;
    double t = 0.0;
    TaskScheduler s(10, 0.1, [&t]() { return t; });

    s.addTask(makeTask(1), 1);
    s.addTask(makeTask(2), 2);
    s.addTask(makeTask(3), 3);

    check(!s.markCompleted(99), "unknown task cannot be completed");
    check(s.statistics().completedCount == 0 && s.pendingCount() == 3,
          "failed completion changes nothing");

    t = 2.0;
    std::optional<Task> task = s.nextTask();
    check(task && s.currentTask() && s.currentTask()->id == task->id, "dispatch sets the current task");
    check(s.isActive(task->id) && s.pendingCount() == 2, "dispatched task is active, not pending");

    t = 5.0;
    check(s.markCompleted(*task), "dispatched task completed");
    check(!s.currentTask().has_value(), "completing the current task clears it");
    check(s.state(1) == TaskState::Completed, "state reports completion");
    check(!s.find(1).has_value() && !s.isActive(1), "finished task record released");
    check(!s.markCompleted(1), "second completion fails");
    check(!s.cancelTask(1), "completed task cannot be canceled");

    check(s.cancelTask(3), "queued task canceled");
    check(s.pendingCount() == 1 && s.state(3) == TaskState::Canceled, "canceled task left the queue");
    check(nextIs(s, 2), "remaining task still dispatches");
    check(s.cancelTask(2), "dispatched task canceled");
    check(!s.currentTask().has_value() && !s.isActive(2), "canceling the current task clears it");
    check(!s.reprioritizeTask(2, 1), "terminal task cannot be reprioritized");

    SchedulerStatistics stats = s.statistics();
    check(stats.completedCount == 1 && stats.canceledCount == 2 &&
          stats.pendingCount == 0 && stats.activeCount == 0, "counters add up");
    check(near(stats.avgCompletionTime, 3.0) && near(stats.avgWaitTime, 5.0),
          "service 2s -> 5s, wait 0s -> 5s");
}

void testCompletionWithoutDispatch()
{
    std::cout << "\n=== Completion straight from the queue ===" << std::endl;
    double t = 1.0;
    TaskScheduler s(10, 0.1, [&t]() { return t; });

    s.addTask(makeTask(7), 1);
    t = 4.0;
    check(s.markCompleted(7), "queued task completed directly");
    check(s.pendingCount() == 0, "and removed from the queue");
    check(near(s.statistics().avgCompletionTime, 3.0), "completion time counted from arrival");
}

void testReprioritize()
{
    std::cout << "\n=== Reprioritize ===" << std::endl;
    double t = 0.0;
    TaskScheduler s(10, 0.1, [&t]() { return t; });

    s.addTask(makeTask(1), 1);
    t = 1.0;
    s.addTask(makeTask(2), 1);
    t = 3.0;

    check(s.reprioritizeTask(1, 1), "same priority accepted");
    check(s.find(1) && near(s.find(1)->arrivalTime, 3.0), "arrival stamp refreshed");
    check(nextIs(s, 2), "refreshed stamp moves the task behind its peer");

    check(s.reprioritizeTask(2, 5), "dispatched task reprioritized");
    check(!s.currentTask().has_value() && s.pendingCount() == 2, "it went back into the queue");
    check(nextIs(s, 1) && nextIs(s, 2), "new priority honoured");

    check(!s.reprioritizeTask(42, 1), "unknown task cannot be reprioritized");
}

void testReprioritizeFullQueue()
{
    std::cout << "\n=== Reprioritize with a full queue ===" << std::endl;
    double t = 0.0;
    TaskScheduler s(2, 0.1, [&t]() { return t; });

    s.addTask(makeTask(1), 1);
    s.addTask(makeTask(2), 1);
    s.nextTask();
    s.addTask(makeTask(3), 1);

    check(!s.reprioritizeTask(1, 1), "dispatched task has no slot to return to");
    check(s.currentTask() && s.currentTask()->id == 1, "current task unchanged");
    check(s.reprioritizeTask(2, 3), "queued task can still be re-keyed in place");
    check(nextIs(s, 3), "and lost its place to the urgent task");
}

void testReplan()
{
    std::cout << "\n=== Replan ===" << std::endl;
    double t = 0.0;
    TaskScheduler s(10, 0.5, [&t]() { return t; });

    s.addTask(makeTask(1, 0.0, 0.0), 1);
    s.addTask(makeTask(2, 10.0, 0.0), 1);
    s.addTask(makeTask(3, 10.0, 5.0), 1);
    s.addTask(makeTask(4, 1.0, 0.0), 3);

    s.replan({10.0, 0.0});
    check(nextIs(s, 2), "task under the robot comes first");
    check(nextIs(s, 3), "then the nearest (5 m)");
    check(nextIs(s, 1), "10 m at priority 1 beats 9 m at priority 3");
    check(nextIs(s, 4), "last the far low-priority task");
    check(s.find(4)->priority == 3, "replan keeps the user priority");

    s.replan({0.0, 0.0});
    check(s.pendingCount() == 0, "replan on an empty queue is a no-op");
}

void testReplanIgnoresNonFinitePosition()
{
    std::cout << "\n=== Replan from a non-finite position ===" << std::endl;
    double t = 0.0;
    TaskScheduler s(10, 0.5, [&t]() { return t; });

    for (TaskId id = 1; id <= 4; ++id)
        s.addTask(makeTask(id, id * 2.0, 0.0), static_cast<int>(5 - id));

    s.replan({std::nan(""), 0.0});
    s.replan({0.0, std::numeric_limits<double>::infinity()});
    check(s.pendingCount() == 4, "every task still queued");

    bool order = nextIs(s, 4) && nextIs(s, 3) && nextIs(s, 2) && nextIs(s, 1);
    check(order, "priority order untouched, every task dispatchable");
}

void testFinishedTasksReleased()
{
    std::cout << "\n=== Finished task bookkeeping ===" << std::endl;
    double t = 0.0;
    TaskScheduler s(5, 0.1, [&t]() { return t; });

    const TaskId total = 1000;
    for (TaskId id = 1; id <= total; ++id) {
        s.addTask(makeTask(id), 1);
        std::optional<Task> task = s.nextTask();
        t += 0.5;
        if (id % 2) s.markCompleted(*task);
        else        s.cancelTask(*task);
    }

    SchedulerStatistics stats = s.statistics();
    check(stats.completedCount == total / 2 && stats.canceledCount == total / 2,
          "every task finished");
    check(stats.activeCount == 0 && !s.find(1).has_value() && !s.find(total).has_value(),
          "no task records kept after finishing");
    check(s.state(1) == TaskState::Completed && s.state(total) == TaskState::Canceled,
          "final states still reported");
    check(!s.addTask(makeTask(7)) && !s.addTask(makeTask(total)),
          "finished ids still rejected");
    check(s.addTask(makeTask(total + 1)), "new ids admitted");
}

void testThroughput()
{
    std::cout << "\n=== Throughput ===" << std::endl;
    double t = 100.0;
    TaskScheduler s(10, 0.1, [&t]() { return t; });

    check(near(s.statistics().throughput, 0.0), "no elapsed time -> zero throughput");

    for (TaskId id = 1; id <= 4; ++id)
        s.addTask(makeTask(id), 1);

    for (int i = 0; i < 4; ++i) {
        std::optional<Task> task = s.nextTask();
        t += 1.0;
        s.markCompleted(*task);
        t += 1.0;
    }

    SchedulerStatistics stats = s.statistics();
    check(stats.completedCount == 4, "four tasks completed");
    check(near(stats.throughput, 0.5), "4 tasks in 8 s -> 0.5 tasks/s");
    check(near(stats.avgCompletionTime, 1.0), "each task took 1 s after dispatch");
    check(near(stats.avgWaitTime, (1.0 + 3.0 + 5.0 + 7.0) / 4.0), "waits measured from arrival");
}

void testConstruction()
{
    std::cout << "\n=== Construction ===" << std::endl;
    bool threw = false;
    try { TaskScheduler bad(0); } catch (const std::invalid_argument&) { threw = true; }
    check(threw, "zero capacity rejected");

    SchedulerConfig config;
    config.maxQueueSize = 7;
    config.replanWeight = 0.25;
    TaskScheduler fromConfig(config);
    check(fromConfig.maxQueueSize() == 7 && near(fromConfig.replanWeight(), 0.25),
          "config values applied");

    TaskScheduler realTime;
    check(realTime.addTask(makeTask(1)) && realTime.nextTask().has_value(),
          "default steady clock works");
}

int main()
{
    std::cout << "TaskScheduler Test Program" << std::endl;
    std::cout << "==========================\n" << std::endl;

    testPriorityOrdering();
    testFifoOnTies();
    testCapacity();
    testLifecycle();
    testCompletionWithoutDispatch();
    testReprioritize();
    testReprioritizeFullQueue();
    testReplan();
    testReplanIgnoresNonFinitePosition();
    testFinishedTasksReleased();
    testThroughput();
    testConstruction();

    if (g_failures > 0) {
        std::cout << "\n" << g_failures << " check(s) failed" << std::endl;
        return EXIT_FAILURE;
    }
    std::cout << "\nTest completed successfully!" << std::endl;
    return EXIT_SUCCESS;
}
