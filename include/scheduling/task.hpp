#ifndef TASK_HPP
#define TASK_HPP

#include "mapping/grid_map.hpp"   // Point2D
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

using TaskId = std::uint64_t;

enum class TaskType : uint8_t
{
    Pick = 0,
    Place = 1,
    Charge = 2
};

/*** A unit of work for the robot: go to `position` and do `type`.
 *   `item` is set for Pick, `location` for Place; Charge carries neither. */
struct Task
{
    TaskId   id{0};
    TaskType type{TaskType::Pick};
    Point2D  position{0.0, 0.0};

    std::optional<int>     item;       // item id to pick
    std::optional<Point2D> location;   // drop-off point

    int    priority{1};                // lower = more urgent
    double arrivalTime{0.0};           // stamped by the scheduler on admission
    bool   completed{false};
};

const char* toString(TaskType type);
std::ostream& operator<<(std::ostream& os, const Task& task);

#endif // TASK_HPP
