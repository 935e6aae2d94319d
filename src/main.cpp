// main.cpp
#include "core/config.hpp"
#include "environment/warehouse.hpp"
#include "planning/path_planner.hpp"
#include "scheduling/task_scheduler.hpp"
#include "robot/robot.hpp"
#include "utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <boost/filesystem.hpp>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>

namespace fs = boost::filesystem;

constexpr int SNAPSHOT_SCALE = 4;   // pixels per grid cell

struct CommandLine {
    std::string                  configPath{"config/default_sim.yaml"};
    std::optional<double>        duration;
    std::optional<std::uint32_t> seed;
    std::optional<std::string>   outputDir;
};

void printUsage(const char* argv0)
{
    std::cout << "Usage: " << argv0
              << " [--config <yaml>] [--duration <s>] [--seed <n>] [--output <dir>]" << std::endl;
}

bool parseArgs(int argc, char** argv, CommandLine& cli)
{
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
            return false;
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }
        std::string value = argv[++i];
        try {
            if (arg == "--config")        cli.configPath = value;
            else if (arg == "--duration") cli.duration = std::stod(value);
            else if (arg == "--seed")     cli.seed = static_cast<std::uint32_t>(std::stoul(value));
            else if (arg == "--output")   cli.outputDir = value;
            else {
                std::cerr << "Unknown option " << arg << std::endl;
                return false;
            }
        }
        catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << ": " << value << std::endl;
            return false;
        }
    }
    return true;
}

/* ---------- Snapshot of map, obstacles, stations, last path and robot ------------- */
cv::Point toPixel(const Point2D& p, double resolution)
{
    return { static_cast<int>(p.x / resolution * SNAPSHOT_SCALE),
             static_cast<int>(p.y / resolution * SNAPSHOT_SCALE) };
}

cv::Mat renderScene(const Warehouse& warehouse,
                    const std::vector<Point2D>& path,
                    const Point2D& robot)
{
    const GridMap& map = warehouse.gridMap();
    const double res = map.resolution();
    cv::Mat img = map.toImage(SNAPSHOT_SCALE);

    for (const auto& obstacle : warehouse.obstacles()) {
        BoundingBox b = obstacle.bounds();
        cv::rectangle(img, toPixel(b.min, res), toPixel(b.max, res),
                      cv::Scalar(128, 128, 128), cv::FILLED);
    }

    for (const auto& station : warehouse.chargingStations())
        cv::circle(img, toPixel(station, res), 6, cv::Scalar(255, 0, 0), cv::FILLED);

    if (path.size() >= 2) {
        std::vector<cv::Point> pts;
        for (const auto& p : path)
            pts.push_back(toPixel(p, res));
        cv::polylines(img, pts, false, cv::Scalar(0, 0, 255), 2);
        for (const auto& pt : pts)
            cv::circle(img, pt, 3, cv::Scalar(0, 0, 255), cv::FILLED);
    }

    cv::circle(img, toPixel(robot, res), 8, cv::Scalar(0, 200, 0), cv::FILLED);

    cv::flip(img, img, 0);   // (0,0) top-left → bottom-left
    return img;
}

void saveSnapshot(const std::string& dir, const cv::Mat& img)
{
    fs::create_directories(dir);
    std::string file = (fs::path(dir) / ("warebot_map_" + utils::fileTimestamp() + ".png")).string();
    if (cv::imwrite(file, img))
        std::cout << "[Sim] Saved map: " << file << std::endl;
    else
        std::cerr << "[Sim] Could not write " << file << std::endl;
}

/* ---------- Main Function ------------------------------------------------ */
int main(int argc, char** argv)
{
    CommandLine cli;
    if (!parseArgs(argc, argv, cli)) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        SimConfig config;
        if (!config.load(cli.configPath))
            return 1;
        if (cli.duration)  config.duration = *cli.duration;
        if (cli.seed)      config.seed = *cli.seed;
        if (cli.outputDir) config.outputDir = *cli.outputDir;

        std::cout << "[Sim] " << utils::timestamp() << " starting: duration "
                  << config.duration << "s, seed " << config.seed << std::endl;

        Warehouse   warehouse(config.warehouse, config.seed);
        PathPlanner planner(warehouse.gridMap(), config.planner.maxExpansions);
        Robot       robot(config.robot, warehouse.startPosition());

        // The scheduler runs on simulated time
        double simTime = 0.0;
        TaskScheduler scheduler(config.scheduler, [&simTime]() { return simTime; });

        std::mt19937 priorityRng(config.seed + 1);
        std::uniform_int_distribution<int> pickPriority(1, 3);

        auto admit = [&](int count) {
            std::vector<Task> tasks = warehouse.generateTasks(count);
            std::vector<int> priorities;
            for (std::size_t i = 0; i < tasks.size(); ++i)
                priorities.push_back(pickPriority(priorityRng));
            std::size_t added = scheduler.addTasks(tasks, priorities);
            if (added < tasks.size())
                std::cerr << "[Sim] Queue full, dropped " << tasks.size() - added
                          << " generated task(s)" << std::endl;
        };

        admit(SIM_INITIAL_TASKS);

        const double rate = config.warehouse.taskGenerationRate;
        const int    replanInterval = config.scheduler.replanInterval;
        double       taskCredit = 0.0;
        int          dispatched = 0;
        int          fallbacks = 0;
        int          stalled = 0;
        int          failed = 0;
        std::vector<Point2D> lastPath;

        auto advance = [&](double dt) {
            simTime += dt;
            taskCredit += rate * dt;
            int newTasks = static_cast<int>(std::floor(taskCredit));
            if (newTasks > 0) {
                taskCredit -= newTasks;
                admit(newTasks);
            }
        };

        while (simTime < config.duration)
        {
            std::optional<Task> task = scheduler.nextTask();
            if (!task) {
                advance(1.0);   // idle until new work shows up
                continue;
            }
            ++dispatched;

            std::cout << "[Sim] t=" << std::fixed << std::setprecision(1) << simTime
                      << "s executing " << *task << std::endl;

            std::vector<BoundingBox> detections =
                warehouse.perceiveObstacles(robot.position(), config.robot.sensorRange,
                                            config.perceptionNoise);

            std::vector<Point2D> path =
                planner.planOrDirect(robot.position(), task->position, detections);
            if (!planner.lastStats().found)
                ++fallbacks;

            std::size_t steps = 0;
            bool arrived = robot.followPath(path, config.stepTime, steps);
            advance(steps * config.stepTime);
            lastPath = path;

            bool done = false;
            if (!arrived) {
                ++stalled;
                std::cerr << "[Sim] Task#" << task->id << " not reached, canceling" << std::endl;
            } else if (!robot.executeTask(*task, warehouse)) {
                ++failed;
                std::cerr << "[Sim] Task#" << task->id << " " << toString(task->type)
                          << " failed, canceling" << std::endl;
            } else {
                done = true;
            }

            bool recorded = done ? scheduler.markCompleted(*task) : scheduler.cancelTask(*task);
            if (!recorded)
                std::cerr << "[Sim] Task#" << task->id << " was no longer active" << std::endl;

            if (replanInterval > 0 && dispatched % replanInterval == 0)
                scheduler.replan(robot.position());
        }

        scheduler.printStats();
        std::cout << std::fixed << std::setprecision(2)
                  << "[Sim] Dispatched " << dispatched << " task(s), "
                  << fallbacks << " direct-line fallback(s), "
                  << stalled << " stalled, " << failed << " failed, distance traveled "
                  << robot.distanceTraveled() << " m" << std::endl;

        saveSnapshot(config.outputDir, renderScene(warehouse, lastPath, robot.position()));
    }
    catch (const std::exception& e) {
        std::cerr << "[Sim] Fatal: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
