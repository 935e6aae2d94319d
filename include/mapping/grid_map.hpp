#pragma once
/********************************************************************
 * GridMap – immutable binary occupancy grid used for planning.
 *  - 0 = free, 1 = occupied, one byte per cell (CV_8UC1, [row=y][col=x])
 *  - world <-> cell transforms (floor + clamp, cell centres)
 *  - per-call working copies with obstacle boxes rasterised in
 *  - Bresenham line tracing / line-of-sight tests on any working grid
 *  - image export for quick visualisation
 *******************************************************************/
#include <optional>
#include <vector>
#include <opencv2/core.hpp>

constexpr unsigned char CELL_FREE     = 0;
constexpr unsigned char CELL_OCCUPIED = 1;

struct Cell {
    int x;
    int y;

    bool operator==(const Cell& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

struct Point2D {
    double x;   // metres
    double y;   // metres
};

/*** Axis-aligned obstacle footprint in world coordinates (perception output). */
struct BoundingBox {
    Point2D min;
    Point2D max;
};

class GridMap
{
public:
    /** Copies `occupancy` (CV_8UC1, any non-zero treated as occupied).
        Throws std::invalid_argument on an empty/wrong-type matrix or a
        non-positive resolution.                                         */
    GridMap(const cv::Mat& occupancy, double resolution_m);

    /** All-free width × height grid. */
    GridMap(int width_cells, int height_cells, double resolution_m);

    /* ───── Geometry ──────────────────────────────────────────────── */
    inline int    width()      const { return grid_.cols; }
    inline int    height()     const { return grid_.rows; }
    inline double resolution() const { return resolution_; }

    bool inBounds(const Cell& c) const;
    bool isOccupied(const Cell& c) const;   ///< out of bounds counts as occupied
    int  occupiedCount() const;

    /** Closest free cell to `c` by ring (Chebyshev) distance, Euclidean
        among cells of the same ring; `c` itself if free. Empty if none
        lies within maxRadius.                                          */
    std::optional<Cell> nearestFreeCell(const Cell& c, int maxRadius) const;

    /** floor(world / resolution), clamped into the grid. */
    Cell    worldToCell(const Point2D& p) const;
    /** Centre of the cell: (c + 0.5) * resolution. */
    Point2D cellToWorld(const Cell& c) const;

    /* ───── Working grids ─────────────────────────────────────────── */
    /** Deep copy of the stored grid; the stored grid never changes. */
    cv::Mat workingCopy() const;

    /** Working copy with every box rasterised as occupied. Boxes partly
        or entirely outside the map are clamped to the border.           */
    cv::Mat withObstacles(const std::vector<BoundingBox>& boxes) const;

    /** Marks one box on `grid` (a working copy of this map's size). */
    void rasterize(cv::Mat& grid, const BoundingBox& box) const;

    /* ───── Static helpers on working grids ───────────────────────── */
    static bool isFree(const cv::Mat& grid, const Cell& c);

    /** Bresenham cells from a to b, both endpoints included. */
    static void traceLine(const Cell& a, const Cell& b, std::vector<Cell>& cells);

    /** True if every traced cell between a and b is free on `grid`. */
    static bool isLineClear(const cv::Mat& grid, const Cell& a, const Cell& b);

    /* ───── Visualisation ─────────────────────────────────────────── */
    /** BGR image: white = free, black = occupied, `scale` pixels per cell. */
    cv::Mat toImage(int scale = 4) const;

private:
    cv::Mat grid_;          // CV_8UC1, CELL_FREE / CELL_OCCUPIED
    double  resolution_;
};
