#ifndef PATH_PLANNER_HPP
#define PATH_PLANNER_HPP

#include "mapping/grid_map.hpp"
#include "core/config.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

/*** Counters describing the most recent search. */
struct PlanStats {
    std::size_t expansions{0};   // cells popped and closed
    double      pathCost{0.0};   // g-cost of the returned grid path (1 / sqrt(2) steps)
    std::size_t gridPathLength{0};
    bool        found{false};
    bool        expansionLimitHit{false};
};

/*** A* planner on an 8-connected occupancy grid.
 *   • the static map is never modified; detections go onto a per-call copy
 *   • "no path" is an empty vector, never an exception
 *   • the grid path is thinned with a Bresenham line-of-sight pass        */
class PathPlanner {
public:
    explicit PathPlanner(GridMap map,
                         std::size_t maxExpansions = PLANNER_MAX_EXPANSIONS);

    /** World-coordinate waypoints from start to goal (cell centres), or
        an empty vector if start/goal is occupied, the goal is unreachable
        or the expansion limit was hit.                                   */
    std::vector<Point2D> plan(const Point2D& start,
                              const Point2D& goal,
                              const std::vector<BoundingBox>& detections = {});

    /** plan(), falling back to the straight segment [start, goal] when no
        path exists. The fallback may cross obstacles.                    */
    std::vector<Point2D> planOrDirect(const Point2D& start,
                                      const Point2D& goal,
                                      const std::vector<BoundingBox>& detections = {});

    /** Raw A* between two cells of `grid` (a working copy of the map). */
    std::vector<Cell> findGridPath(const cv::Mat& grid,
                                   const Cell& start,
                                   const Cell& goal);

    /** Greedy line-of-sight thinning against `grid`. */
    std::vector<Point2D> simplifyPath(const std::vector<Point2D>& path,
                                      const cv::Mat& grid) const;

    const PlanStats& lastStats() const { return stats_; }
    const GridMap&   map() const { return map_; }

    void        setMaxExpansions(std::size_t n) { maxExpansions_ = n; }
    std::size_t maxExpansions() const { return maxExpansions_; }

private:
    /// Frontier entry; `order` is the push counter used to break f ties.
    struct Node {
        double        f;
        double        g;
        std::size_t   order;
        int           index;
    };

    struct CompareF {
        bool operator()(const Node& a, const Node& b) const {
            if (a.f != b.f) return a.f > b.f;
            return a.order > b.order;
        }
    };

    GridMap     map_;
    std::size_t maxExpansions_;
    PlanStats   stats_;

    // Buffers reused between searches
    std::vector<double>  gScore_;
    std::vector<int>     parent_;
    std::vector<uint8_t> closed_;

    void resetBuffers(int cells);
    std::vector<Cell> reconstruct(int goalIndex, int cols) const;

    static double heuristic(const Cell& a, const Cell& b);
};

#endif // PATH_PLANNER_HPP
