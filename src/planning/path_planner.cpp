#include "planning/path_planner.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <queue>
#include <utility>

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();
constexpr double DIAGONAL_COST = 1.41421356237309504880;   // sqrt(2)

struct Step {
    int dx, dy;
    double cost;
};

// 8-connected neighbourhood, straight moves first
const Step STEPS[8] = {
    { 0,  1, 1.0}, { 1,  0, 1.0}, { 0, -1, 1.0}, {-1,  0, 1.0},
    { 1,  1, DIAGONAL_COST}, { 1, -1, DIAGONAL_COST},
    {-1,  1, DIAGONAL_COST}, {-1, -1, DIAGONAL_COST}
};

} // namespace

PathPlanner::PathPlanner(GridMap map, std::size_t maxExpansions)
    : map_(std::move(map)),
      maxExpansions_(maxExpansions)
{
}

std::vector<Point2D> PathPlanner::plan(const Point2D& start,
                                       const Point2D& goal,
                                       const std::vector<BoundingBox>& detections)
{
    const Cell startCell = map_.worldToCell(start);
    const Cell goalCell  = map_.worldToCell(goal);

    // Dynamic obstacles only ever touch this copy
    cv::Mat working = map_.withObstacles(detections);

    std::vector<Cell> cells = findGridPath(working, startCell, goalCell);
    if (cells.empty())
        return {};

    std::vector<Point2D> waypoints;
    waypoints.reserve(cells.size());
    for (const auto& c : cells)
        waypoints.push_back(map_.cellToWorld(c));

    return simplifyPath(waypoints, working);
}

std::vector<Point2D> PathPlanner::planOrDirect(const Point2D& start,
                                               const Point2D& goal,
                                               const std::vector<BoundingBox>& detections)
{
    std::vector<Point2D> path = plan(start, goal, detections);
    if (path.empty()) {
        std::cerr << "[PathPlanner] No path, using direct line ("
                  << start.x << ", " << start.y << ") -> ("
                  << goal.x << ", " << goal.y << ")" << std::endl;
        return {start, goal};
    }
    return path;
}

std::vector<Cell> PathPlanner::findGridPath(const cv::Mat& grid,
                                            const Cell& start,
                                            const Cell& goal)
{
    stats_ = PlanStats{};

    if (!GridMap::isFree(grid, start) || !GridMap::isFree(grid, goal)) {
        std::cerr << "[PathPlanner] Start or goal cell is occupied" << std::endl;
        return {};
    }

    const int cols = grid.cols;
    const int rows = grid.rows;
    resetBuffers(rows * cols);

    auto to1D = [cols](int x, int y) { return y * cols + x; };
    const int goalIndex = to1D(goal.x, goal.y);

    std::priority_queue<Node, std::vector<Node>, CompareF> open;
    std::size_t order = 0;

    const int startIndex = to1D(start.x, start.y);
    gScore_[startIndex] = 0.0;
    open.push({heuristic(start, goal), 0.0, order++, startIndex});

    while (!open.empty())
    {
        Node current = open.top();
        open.pop();

        // Skip closed cells and outdated frontier entries
        if (closed_[current.index] || current.g > gScore_[current.index])
            continue;

        if (maxExpansions_ > 0 && stats_.expansions >= maxExpansions_) {
            stats_.expansionLimitHit = true;
            std::cerr << "[PathPlanner] Expansion limit (" << maxExpansions_
                      << ") reached" << std::endl;
            return {};
        }

        closed_[current.index] = 1;
        ++stats_.expansions;

        if (current.index == goalIndex) {
            std::vector<Cell> path = reconstruct(goalIndex, cols);
            stats_.found = true;
            stats_.pathCost = gScore_[goalIndex];
            stats_.gridPathLength = path.size();
            return path;
        }

        const Cell cur{current.index % cols, current.index / cols};
        for (const auto& step : STEPS) {
            const Cell next{cur.x + step.dx, cur.y + step.dy};
            if (next.x < 0 || next.x >= cols || next.y < 0 || next.y >= rows)
                continue;
            if (grid.at<uchar>(next.y, next.x) != CELL_FREE)
                continue;

            const int nextIndex = to1D(next.x, next.y);
            if (closed_[nextIndex])
                continue;

            double tentative = gScore_[current.index] + step.cost;
            if (tentative < gScore_[nextIndex]) {
                gScore_[nextIndex] = tentative;
                parent_[nextIndex] = current.index;
                open.push({tentative + heuristic(next, goal), tentative, order++, nextIndex});
            }
        }
    }

    std::cerr << "[PathPlanner] Frontier exhausted after " << stats_.expansions
              << " expansions, goal unreachable" << std::endl;
    return {};
}

std::vector<Point2D> PathPlanner::simplifyPath(const std::vector<Point2D>& path,
                                               const cv::Mat& grid) const
{
    if (path.size() <= 2)
        return path;

    std::vector<Point2D> simplified;
    simplified.push_back(path.front());

    const std::size_t last = path.size() - 1;
    std::size_t current = 0;

    while (current < last)
    {
        const Cell from = map_.worldToCell(path[current]);

        // Furthest visible point; the neighbour is the fallback
        std::size_t next = current + 1;
        for (std::size_t i = last; i > current + 1; --i) {
            if (GridMap::isLineClear(grid, from, map_.worldToCell(path[i]))) {
                next = i;
                break;
            }
        }

        simplified.push_back(path[next]);
        current = next;
    }

    return simplified;
}

void PathPlanner::resetBuffers(int cells)
{
    gScore_.assign(cells, INF);
    parent_.assign(cells, -1);
    closed_.assign(cells, 0);
}

std::vector<Cell> PathPlanner::reconstruct(int goalIndex, int cols) const
{
    std::vector<Cell> path;
    for (int idx = goalIndex; idx >= 0; idx = parent_[idx])
        path.push_back({idx % cols, idx / cols});
    std::reverse(path.begin(), path.end());
    return path;
}

double PathPlanner::heuristic(const Cell& a, const Cell& b)
{
    // Euclidean distance
    double dx = static_cast<double>(a.x - b.x);
    double dy = static_cast<double>(a.y - b.y);
    return std::sqrt(dx * dx + dy * dy);
}
