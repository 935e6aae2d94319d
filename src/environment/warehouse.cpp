#include "environment/warehouse.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

/* ─────────────────────────── Obstacle ───────────────────────────── */
BoundingBox Obstacle::bounds() const
{
    return { {centre.x - width / 2.0, centre.y - length / 2.0},
             {centre.x + width / 2.0, centre.y + length / 2.0} };
}

bool Obstacle::contains(const Point2D& p) const
{
    BoundingBox b = bounds();
    return p.x >= b.min.x && p.x <= b.max.x &&
           p.y >= b.min.y && p.y <= b.max.y;
}

/* ─────────────────────────── Warehouse ──────────────────────────── */
Warehouse::Warehouse(const WarehouseConfig& config, std::uint32_t seed)
    : config_(config),
      rng_(seed),
      map_(buildLayout(config, racks_), GRID_RESOLUTION)
{
    generateObstacles();
    generateItems();
    generateChargingStations();

    std::cout << "[Warehouse] " << config_.width << "x" << config_.length << "m, "
              << map_.width() << "x" << map_.height() << " cells, "
              << racks_.size() << " racks, " << items_.size() << " items, "
              << obstacles_.size() << " obstacles, "
              << chargingStations_.size() << " charging stations" << std::endl;
}

Point2D Warehouse::startPosition() const
{
    return {config_.robotStartX, config_.robotStartY};
}

/* Two rows of rack columns at 1/3 and 2/3 of the length, centred in x */
cv::Mat Warehouse::buildLayout(const WarehouseConfig& config,
                               std::vector<Point2D>& rackCentres)
{
    const double cellsPerMetre = 1.0 / GRID_RESOLUTION;
    const int rows = static_cast<int>(config.length * cellsPerMetre);
    const int cols = static_cast<int>(config.width * cellsPerMetre);

    cv::Mat layout = cv::Mat::zeros(std::max(rows, 1), std::max(cols, 1), CV_8UC1);
    const cv::Rect bounds(0, 0, layout.cols, layout.rows);

    const int racksPerRow = config.numRacks / 2;
    const double pitch = config.rackWidth + config.aisleWidth;
    const int rackW = static_cast<int>(config.rackWidth * cellsPerMetre);
    const int rackH = static_cast<int>(config.rackLength * cellsPerMetre);

    const int rowStarts[2] = {
        static_cast<int>(config.length / 3.0 * cellsPerMetre),
        static_cast<int>(2.0 * config.length / 3.0 * cellsPerMetre)
    };

    rackCentres.clear();
    for (int i = 0; i < racksPerRow; ++i) {
        const int xStart = static_cast<int>(
            (config.width / 2.0 - racksPerRow * pitch / 2.0 + i * pitch) * cellsPerMetre);

        for (int yStart : rowStarts) {
            cv::Rect rack = cv::Rect(xStart, yStart, rackW, rackH) & bounds;
            if (rack.area() == 0)
                continue;
            layout(rack).setTo(CELL_OCCUPIED);
            rackCentres.push_back({ (rack.x + rack.width / 2.0) * GRID_RESOLUTION,
                                    (rack.y + rack.height / 2.0) * GRID_RESOLUTION });
        }
    }
    return layout;
}

void Warehouse::generateObstacles()
{
    const double cellArea = GRID_RESOLUTION * GRID_RESOLUTION;
    const double freeArea = config_.width * config_.length - map_.occupiedCount() * cellArea;
    const int count = static_cast<int>(freeArea * config_.obstacleDensity);

    for (int i = 0; i < count; ++i) {
        for (int attempt = 0; attempt < 10; ++attempt) {
            Point2D p{uniform(0.0, config_.width), uniform(0.0, config_.length)};
            if (isPositionOccupied(p))
                continue;

            obstacles_.push_back({i, p, uniform(0.3, 1.0), uniform(0.3, 1.0)});
            break;
        }
    }
}

void Warehouse::generateItems()
{
    if (racks_.empty())
        return;

    std::uniform_int_distribution<std::size_t> pickRack(0, racks_.size() - 1);
    std::uniform_int_distribution<int> pickType(1, std::max(config_.itemTypes, 1));

    for (int i = 0; i < config_.numItems; ++i) {
        const Point2D& rack = racks_[pickRack(rng_)];
        Point2D pos{rack.x + uniform(-0.4, 0.4), rack.y + uniform(-2.0, 2.0)};
        items_.push_back({i, "type_" + std::to_string(pickType(rng_)), pos, uniform(0.1, 4.0)});
    }
}

/* Round-robin over the four walls, 1 m in from the edge */
void Warehouse::generateChargingStations()
{
    const double w = config_.width, l = config_.length;
    for (int i = 0; i < config_.chargingStations; ++i) {
        switch (i % 4) {
            case 0:  chargingStations_.push_back({uniform(1.0, w - 1.0), 1.0});     break;
            case 1:  chargingStations_.push_back({w - 1.0, uniform(1.0, l - 1.0)}); break;
            case 2:  chargingStations_.push_back({uniform(1.0, w - 1.0), l - 1.0}); break;
            default: chargingStations_.push_back({1.0, uniform(1.0, l - 1.0)});     break;
        }
    }
}

/* ─────────────────────────── Tasks ──────────────────────────────── */
std::optional<Task> Warehouse::generateTask()
{
    std::discrete_distribution<int> kind({45.0, 45.0, 10.0});

    Task task;
    switch (kind(rng_)) {
        case 0: {
            if (items_.empty()) return std::nullopt;
            std::uniform_int_distribution<std::size_t> pick(0, items_.size() - 1);
            const Item& item = items_[pick(rng_)];
            task.type = TaskType::Pick;
            task.position = approachPoint(item.position);
            task.item = item.id;
            break;
        }
        case 1: {
            if (racks_.empty()) return std::nullopt;
            std::uniform_int_distribution<std::size_t> pick(0, racks_.size() - 1);
            const Point2D& rack = racks_[pick(rng_)];
            task.type = TaskType::Place;
            task.location = Point2D{rack.x + uniform(-0.4, 0.4), rack.y + uniform(-2.0, 2.0)};
            task.position = approachPoint(*task.location);
            break;
        }
        default: {
            if (chargingStations_.empty()) return std::nullopt;
            std::uniform_int_distribution<std::size_t> pick(0, chargingStations_.size() - 1);
            task.type = TaskType::Charge;
            task.position = approachPoint(chargingStations_[pick(rng_)]);
            break;
        }
    }

    task.id = nextTaskId_++;
    return task;
}

std::vector<Task> Warehouse::generateTasks(int count)
{
    std::vector<Task> tasks;
    for (int i = 0; i < count; ++i) {
        std::optional<Task> t = generateTask();
        if (t)
            tasks.push_back(std::move(*t));
    }
    return tasks;
}

/* ─────────────────────────── Perception ─────────────────────────── */
std::vector<BoundingBox> Warehouse::perceiveObstacles(const Point2D& position,
                                                      double range,
                                                      double noiseStd)
{
    std::vector<BoundingBox> detections;
    std::normal_distribution<double> noise(0.0, noiseStd > 0.0 ? noiseStd : 1.0);

    for (const auto& obstacle : obstacles_) {
        const double dx = obstacle.centre.x - position.x;
        const double dy = obstacle.centre.y - position.y;
        if (std::sqrt(dx * dx + dy * dy) > range)
            continue;

        BoundingBox box = obstacle.bounds();
        if (noiseStd > 0.0) {
            box.min.x += noise(rng_);
            box.min.y += noise(rng_);
            box.max.x += noise(rng_);
            box.max.y += noise(rng_);
            if (box.min.x > box.max.x) std::swap(box.min.x, box.max.x);
            if (box.min.y > box.max.y) std::swap(box.min.y, box.max.y);
        }
        detections.push_back(box);
    }
    return detections;
}

/* Racks are solid in the static map; the robot works from the aisle */
Point2D Warehouse::approachPoint(const Point2D& target) const
{
    const Cell cell = map_.worldToCell(target);
    std::optional<Cell> free = map_.nearestFreeCell(cell, APPROACH_SEARCH_RADIUS);
    if (!free) {
        std::cerr << "[Warehouse] No free cell near (" << target.x << ", "
                  << target.y << "), keeping the target" << std::endl;
        return target;
    }
    return *free == cell ? target : map_.cellToWorld(*free);
}

const Item* Warehouse::findItem(int id) const
{
    auto it = std::find_if(items_.begin(), items_.end(),
                           [id](const Item& item) { return item.id == id; });
    return it == items_.end() ? nullptr : &*it;
}

bool Warehouse::relocateItem(int id, const Point2D& position)
{
    auto it = std::find_if(items_.begin(), items_.end(),
                           [id](const Item& item) { return item.id == id; });
    if (it == items_.end())
        return false;
    it->position = position;
    return true;
}

bool Warehouse::isPositionOccupied(const Point2D& p) const
{
    if (p.x < 0.0 || p.y < 0.0 || p.x >= config_.width || p.y >= config_.length)
        return true;
    if (map_.isOccupied(map_.worldToCell(p)))
        return true;

    for (const auto& obstacle : obstacles_)
        if (obstacle.contains(p))
            return true;
    return false;
}

double Warehouse::uniform(double lo, double hi)
{
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng_);
}
