#ifndef ROBOT_HPP
#define ROBOT_HPP

#include "core/config.hpp"
#include "environment/warehouse.hpp"
#include "mapping/grid_map.hpp"
#include "scheduling/task.hpp"
#include <cstddef>
#include <optional>
#include <vector>
#include <Eigen/Dense>

/*** Kinematic point-mass: moves straight toward a target at up to
 *   maxSpeed, no acceleration limit, no collision checking.           */
class Robot {
public:
    Robot(const RobotConfig& config, const Point2D& start);

    /** One integration step of dt seconds; true once the target is reached. */
    bool step(const Point2D& target, double dt);

    /** Visits every waypoint in order. `steps` receives the number of
        integration steps used; false if maxSteps ran out first.        */
    bool followPath(const std::vector<Point2D>& path, double dt,
                    std::size_t& steps, std::size_t maxSteps = 100000);

    /** Carries out `task` at the current position.
        Pick:   fails if already loaded, the item is unknown or heavier
                than gripperCapacity.
        Place:  fails if empty-handed; the load is moved to the task's
                location (or the robot's position if none).
        Charge: always succeeds.                                        */
    bool executeTask(const Task& task, Warehouse& warehouse);

    const std::optional<Item>& load() const { return load_; }

    Point2D position() const { return {position_.x(), position_.y()}; }
    double  speed() const { return velocity_.norm(); }
    double  distanceTraveled() const { return distanceTraveled_; }

private:
    static constexpr double ARRIVAL_TOLERANCE = 1e-6;   // m

    RobotConfig     config_;
    Eigen::Vector2d position_;
    Eigen::Vector2d velocity_;
    double          distanceTraveled_;

    std::optional<Item> load_;   // item in the gripper

    bool pick(const Task& task, const Warehouse& warehouse);
    bool place(const Task& task, Warehouse& warehouse);
};

#endif // ROBOT_HPP
