#ifndef WAREHOUSE_HPP
#define WAREHOUSE_HPP

#include "core/config.hpp"
#include "mapping/grid_map.hpp"
#include "scheduling/task.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct Obstacle {
    int     id;
    Point2D centre;
    double  width;    // x extent, m
    double  length;   // y extent, m

    BoundingBox bounds() const;
    bool contains(const Point2D& p) const;
};

struct Item {
    int         id;
    std::string type;
    Point2D     position;
    double      weight;   // kg
};

/*** Synthetic warehouse: rack layout, items, charging stations and loose
 *   obstacles. Racks form the static GridMap; obstacles are only known to
 *   the planner through perceiveObstacles(). All randomness comes from the
 *   seed passed at construction, so two warehouses with the same config
 *   and seed are identical.                                              */
class Warehouse {
public:
    Warehouse(const WarehouseConfig& config, std::uint32_t seed);

    const GridMap& gridMap() const { return map_; }
    Point2D startPosition() const;

    const std::vector<Point2D>&  racks() const { return racks_; }
    const std::vector<Item>&     items() const { return items_; }
    const std::vector<Point2D>&  chargingStations() const { return chargingStations_; }
    const std::vector<Obstacle>& obstacles() const { return obstacles_; }

    /** Pick 45 %, Place 45 %, Charge 10 %. Empty if the chosen kind has
        nothing to target (no items / racks / stations). `position` is
        a free cell of the static map beside the rack; the drop-off
        point on the rack goes in `location`.                                  */
    std::optional<Task> generateTask();
    std::vector<Task>   generateTasks(int count);

    /** Noisy boxes of the obstacles whose centre lies within `range`. */
    std::vector<BoundingBox> perceiveObstacles(const Point2D& position,
                                               double range,
                                               double noiseStd);

    bool isPositionOccupied(const Point2D& p) const;

    /** Free-space point to serve `target` from: the target itself if its
        cell is free, else the centre of the nearest free cell.          */
    Point2D approachPoint(const Point2D& target) const;

    const Item* findItem(int id) const;          ///< nullptr if unknown
    bool        relocateItem(int id, const Point2D& position);

private:
    static constexpr int APPROACH_SEARCH_RADIUS = 50;   // cells (5 m)

    static cv::Mat buildLayout(const WarehouseConfig& config,
                               std::vector<Point2D>& rackCentres);

    void generateObstacles();
    void generateItems();
    void generateChargingStations();

    double uniform(double lo, double hi);

    WarehouseConfig config_;
    std::mt19937    rng_;

    std::vector<Point2D>  racks_;
    GridMap               map_;
    std::vector<Obstacle> obstacles_;
    std::vector<Item>     items_;
    std::vector<Point2D>  chargingStations_;

    TaskId nextTaskId_{1};
};

#endif // WAREHOUSE_HPP
