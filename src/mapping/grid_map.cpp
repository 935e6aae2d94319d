#include "mapping/grid_map.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

/* ───────────────────────── Constructors ─────────────────────────── */
GridMap::GridMap(const cv::Mat& occupancy, double resolution_m)
    : resolution_(resolution_m)
{
    if (occupancy.empty())
        throw std::invalid_argument("GridMap: empty occupancy matrix");
    if (occupancy.type() != CV_8UC1)
        throw std::invalid_argument("GridMap: occupancy must be CV_8UC1");
    if (!(resolution_m > 0.0))
        throw std::invalid_argument("GridMap: resolution must be positive");

    // normalise to strictly 0 / 1 and take ownership of a private buffer
    cv::threshold(occupancy, grid_, 0, CELL_OCCUPIED, cv::THRESH_BINARY);
}

GridMap::GridMap(int width_cells, int height_cells, double resolution_m)
    : resolution_(resolution_m)
{
    if (width_cells <= 0 || height_cells <= 0)
        throw std::invalid_argument("GridMap: dimensions must be positive");
    if (!(resolution_m > 0.0))
        throw std::invalid_argument("GridMap: resolution must be positive");

    grid_ = cv::Mat::zeros(height_cells, width_cells, CV_8UC1);
}

/* ───────────────────────── Cell queries ─────────────────────────── */
bool GridMap::inBounds(const Cell& c) const
{
    return c.x >= 0 && c.x < grid_.cols && c.y >= 0 && c.y < grid_.rows;
}

bool GridMap::isOccupied(const Cell& c) const
{
    return !isFree(grid_, c);
}

int GridMap::occupiedCount() const
{
    return cv::countNonZero(grid_);
}

std::optional<Cell> GridMap::nearestFreeCell(const Cell& c, int maxRadius) const
{
    if (!isOccupied(c))
        return c;

    for (int r = 1; r <= maxRadius; ++r) {
        std::optional<Cell> best;
        int bestDist = 0;
        for (int dy = -r; dy <= r; ++dy)
            for (int dx = -r; dx <= r; ++dx) {
                if (std::max(std::abs(dx), std::abs(dy)) != r)
                    continue;                               // ring only
                const Cell n{c.x + dx, c.y + dy};
                if (isOccupied(n))
                    continue;
                const int d = dx * dx + dy * dy;
                if (!best || d < bestDist) {
                    best = n;
                    bestDist = d;
                }
            }
        if (best)
            return best;
    }
    return std::nullopt;
}

Cell GridMap::worldToCell(const Point2D& p) const
{
    int cx = static_cast<int>(std::floor(p.x / resolution_));
    int cy = static_cast<int>(std::floor(p.y / resolution_));
    return { std::clamp(cx, 0, grid_.cols - 1),
             std::clamp(cy, 0, grid_.rows - 1) };
}

Point2D GridMap::cellToWorld(const Cell& c) const
{
    return { (c.x + 0.5) * resolution_, (c.y + 0.5) * resolution_ };
}

/* ───────────────────────── Working grids ────────────────────────── */
cv::Mat GridMap::workingCopy() const
{
    return grid_.clone();
}

cv::Mat GridMap::withObstacles(const std::vector<BoundingBox>& boxes) const
{
    cv::Mat working = grid_.clone();
    for (const auto& box : boxes)
        rasterize(working, box);
    return working;
}

void GridMap::rasterize(cv::Mat& grid, const BoundingBox& box) const
{
    // worldToCell already clamps, so boxes hanging off the map are trimmed
    Cell a = worldToCell(box.min);
    Cell b = worldToCell(box.max);

    int x0 = std::min(a.x, b.x), x1 = std::max(a.x, b.x);
    int y0 = std::min(a.y, b.y), y1 = std::max(a.y, b.y);

    grid(cv::Range(y0, y1 + 1), cv::Range(x0, x1 + 1)).setTo(CELL_OCCUPIED);
}

/* ─────────────────────── Static helpers ─────────────────────────── */
bool GridMap::isFree(const cv::Mat& grid, const Cell& c)
{
    if (c.x < 0 || c.x >= grid.cols || c.y < 0 || c.y >= grid.rows)
        return false;
    return grid.at<uchar>(c.y, c.x) == CELL_FREE;
}

/* Bresenham line trace -------------------------------------------- */
void GridMap::traceLine(const Cell& a, const Cell& b, std::vector<Cell>& cells)
{
    cells.clear();

    int x0 = a.x, y0 = a.y;
    int x1 = b.x, y1 = b.y;

    int dx = std::abs(x1 - x0), dy = std::abs(y1 - y0);
    int sx = (x0 < x1) ? 1 : -1;
    int sy = (y0 < y1) ? 1 : -1;
    int err = dx - dy;

    for (;;) {
        cells.push_back({x0, y0});
        if (x0 == x1 && y0 == y1) break;

        int e2 = 2*err;
        if (e2 > -dy) { err -= dy; x0 += sx; }
        if (e2 <  dx) { err += dx; y0 += sy; }
    }
}

bool GridMap::isLineClear(const cv::Mat& grid, const Cell& a, const Cell& b)
{
    std::vector<Cell> cells;
    traceLine(a, b, cells);
    return std::all_of(cells.begin(), cells.end(),
                       [&grid](const Cell& c) { return isFree(grid, c); });
}

/* ────────────────────────── Image export ────────────────────────── */
cv::Mat GridMap::toImage(int scale) const
{
    cv::Mat img(grid_.rows, grid_.cols, CV_8UC3);

    for (int y = 0; y < grid_.rows; ++y)
        for (int x = 0; x < grid_.cols; ++x)
        {
            cv::Vec3b col;                              // BGR
            if (grid_.at<uchar>(y, x) == CELL_OCCUPIED)
                col = {  0,  0,  0};                    // occupied
            else
                col = {255,255,255};                    // free
            img.at<cv::Vec3b>(y, x) = col;
        }

    if (scale > 1)
        cv::resize(img, img, cv::Size(), scale, scale, cv::INTER_NEAREST);
    return img;
}
