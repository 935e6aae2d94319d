#include "scheduling/task.hpp"
#include <iomanip>

const char* toString(TaskType type)
{
    switch (type) {
        case TaskType::Pick:   return "pick";
        case TaskType::Place:  return "place";
        case TaskType::Charge: return "charge";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Task& task)
{
    std::ios::fmtflags flags(os.flags());
    os << "Task#" << task.id << " " << toString(task.type)
       << " at (" << std::fixed << std::setprecision(2)
       << task.position.x << ", " << task.position.y << ")"
       << " prio=" << task.priority;
    if (task.item)
        os << " item=" << *task.item;
    if (task.location)
        os << " location=(" << task.location->x << ", " << task.location->y << ")";
    os.flags(flags);
    return os;
}
