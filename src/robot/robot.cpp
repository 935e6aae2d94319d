#include "robot/robot.hpp"
#include <algorithm>
#include <iostream>

Robot::Robot(const RobotConfig& config, const Point2D& start)
    : config_(config),
      position_(start.x, start.y),
      velocity_(Eigen::Vector2d::Zero()),
      distanceTraveled_(0.0)
{
}

bool Robot::step(const Point2D& target, double dt)
{
    const Eigen::Vector2d goal(target.x, target.y);
    const Eigen::Vector2d delta = goal - position_;
    const double distance = delta.norm();

    if (distance <= ARRIVAL_TOLERANCE || dt <= 0.0) {
        velocity_.setZero();
        return distance <= ARRIVAL_TOLERANCE;
    }

    // Slow down on the last step so the target is hit exactly
    const double travel = std::min(config_.maxSpeed * dt, distance);
    const Eigen::Vector2d move = delta / distance * travel;

    velocity_ = move / dt;
    position_ += move;
    distanceTraveled_ += travel;

    if (travel >= distance) {
        position_ = goal;
        return true;
    }
    return false;
}

bool Robot::followPath(const std::vector<Point2D>& path, double dt,
                       std::size_t& steps, std::size_t maxSteps)
{
    steps = 0;
    for (const auto& waypoint : path) {
        bool reached = step(waypoint, dt);
        ++steps;
        while (!reached) {
            if (steps >= maxSteps)
                return false;
            reached = step(waypoint, dt);
            ++steps;
        }
    }
    velocity_.setZero();
    return true;
}

/* ───────────────────────── Task execution ───────────────────────── */
bool Robot::executeTask(const Task& task, Warehouse& warehouse)
{
    switch (task.type) {
        case TaskType::Pick:   return pick(task, warehouse);
        case TaskType::Place:  return place(task, warehouse);
        case TaskType::Charge: return true;
    }
    return false;
}

bool Robot::pick(const Task& task, const Warehouse& warehouse)
{
    if (load_) {
        std::cerr << "[Robot] Task#" << task.id << ": gripper already holds item "
                  << load_->id << std::endl;
        return false;
    }
    if (!task.item) {
        std::cerr << "[Robot] Task#" << task.id << ": pick without an item" << std::endl;
        return false;
    }

    const Item* item = warehouse.findItem(*task.item);
    if (!item) {
        std::cerr << "[Robot] Task#" << task.id << ": unknown item " << *task.item << std::endl;
        return false;
    }
    if (item->weight > config_.gripperCapacity) {
        std::cerr << "[Robot] Task#" << task.id << ": item " << item->id << " weighs "
                  << item->weight << " kg, capacity " << config_.gripperCapacity
                  << " kg" << std::endl;
        return false;
    }

    load_ = *item;
    return true;
}

bool Robot::place(const Task& task, Warehouse& warehouse)
{
    if (!load_) {
        std::cerr << "[Robot] Task#" << task.id << ": nothing to place" << std::endl;
        return false;
    }

    const Point2D target = task.location ? *task.location : position();
    if (!warehouse.relocateItem(load_->id, target)) {
        std::cerr << "[Robot] Task#" << task.id << ": item " << load_->id
                  << " no longer in the warehouse" << std::endl;
        return false;
    }

    load_.reset();
    return true;
}
