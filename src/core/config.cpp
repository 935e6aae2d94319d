#include "core/config.hpp"

#include <opencv2/core.hpp>
#include <boost/filesystem.hpp>
#include <iostream>

namespace fs = boost::filesystem;

namespace {

template <typename T>
void readIfPresent(const cv::FileNode& section, const char* key, T& value)
{
    cv::FileNode node = section[key];
    if (!node.empty())
        node >> value;
}

// cv::FileStorage has no size_t / uint32 overloads
void readIfPresent(const cv::FileNode& section, const char* key, std::size_t& value)
{
    cv::FileNode node = section[key];
    if (!node.empty()) {
        int v = 0;
        node >> v;
        if (v >= 0) value = static_cast<std::size_t>(v);
    }
}

void readIfPresent(const cv::FileNode& section, const char* key, std::uint32_t& value)
{
    cv::FileNode node = section[key];
    if (!node.empty()) {
        int v = 0;
        node >> v;
        value = static_cast<std::uint32_t>(v);
    }
}

} // namespace

bool SimConfig::load(const std::string& path)
{
    boost::system::error_code ec;
    const bool present = fs::exists(path, ec);
    if (ec) {
        std::cerr << "[Config] Can't access " << path << ": " << ec.message() << std::endl;
        return false;
    }
    if (!present) {
        std::cerr << "[Config] Warning: " << path
                  << " not found. Using defaults." << std::endl;
        if (!save(path))
            std::cerr << "[Config] Defaults not written to " << path << std::endl;
        return true;
    }

    try {
        cv::FileStorage file(path, cv::FileStorage::READ);
        if (!file.isOpened()) {
            std::cerr << "[Config] Can't open " << path << std::endl;
            return false;
        }

        cv::FileNode r = file["robot"];
        if (!r.empty()) {
            readIfPresent(r, "max_speed",    robot.maxSpeed);
            readIfPresent(r, "sensor_range", robot.sensorRange);
            readIfPresent(r, "gripper_capacity", robot.gripperCapacity);
        }

        cv::FileNode w = file["warehouse"];
        if (!w.empty()) {
            readIfPresent(w, "width",                warehouse.width);
            readIfPresent(w, "length",               warehouse.length);
            readIfPresent(w, "num_racks",            warehouse.numRacks);
            readIfPresent(w, "rack_length",          warehouse.rackLength);
            readIfPresent(w, "rack_width",           warehouse.rackWidth);
            readIfPresent(w, "aisle_width",          warehouse.aisleWidth);
            readIfPresent(w, "num_items",            warehouse.numItems);
            readIfPresent(w, "item_types",           warehouse.itemTypes);
            readIfPresent(w, "obstacle_density",     warehouse.obstacleDensity);
            readIfPresent(w, "charging_stations",    warehouse.chargingStations);
            readIfPresent(w, "robot_start_x",        warehouse.robotStartX);
            readIfPresent(w, "robot_start_y",        warehouse.robotStartY);
            readIfPresent(w, "task_generation_rate", warehouse.taskGenerationRate);
        }

        cv::FileNode p = file["planner"];
        if (!p.empty())
            readIfPresent(p, "max_expansions", planner.maxExpansions);

        cv::FileNode s = file["scheduler"];
        if (!s.empty()) {
            readIfPresent(s, "max_queue_size",  scheduler.maxQueueSize);
            readIfPresent(s, "replan_weight",   scheduler.replanWeight);
            readIfPresent(s, "replan_interval", scheduler.replanInterval);
        }

        cv::FileNode sim = file["simulation"];
        if (!sim.empty()) {
            readIfPresent(sim, "duration",         duration);
            readIfPresent(sim, "step_time",        stepTime);
            readIfPresent(sim, "seed",             seed);
            readIfPresent(sim, "perception_noise", perceptionNoise);
            readIfPresent(sim, "output_dir",       outputDir);
        }
    }
    catch (const cv::Exception& e) {
        std::cerr << "[Config] Failed to parse " << path << ": " << e.what() << std::endl;
        return false;
    }

    std::cout << "[Config] Loaded " << path << std::endl;
    return true;
}

bool SimConfig::save(const std::string& path) const
{
    try {
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty())
            fs::create_directories(parent);

        cv::FileStorage file(path, cv::FileStorage::WRITE);
        if (!file.isOpened()) {
            std::cerr << "[Config] Can't write " << path << std::endl;
            return false;
        }

        file << "robot" << "{"
             << "max_speed"    << robot.maxSpeed
             << "sensor_range" << robot.sensorRange
             << "gripper_capacity" << robot.gripperCapacity
             << "}";

        file << "warehouse" << "{"
             << "width"                << warehouse.width
             << "length"               << warehouse.length
             << "num_racks"            << warehouse.numRacks
             << "rack_length"          << warehouse.rackLength
             << "rack_width"           << warehouse.rackWidth
             << "aisle_width"          << warehouse.aisleWidth
             << "num_items"            << warehouse.numItems
             << "item_types"           << warehouse.itemTypes
             << "obstacle_density"     << warehouse.obstacleDensity
             << "charging_stations"    << warehouse.chargingStations
             << "robot_start_x"        << warehouse.robotStartX
             << "robot_start_y"        << warehouse.robotStartY
             << "task_generation_rate" << warehouse.taskGenerationRate
             << "}";

        file << "planner" << "{"
             << "max_expansions" << static_cast<int>(planner.maxExpansions)
             << "}";

        file << "scheduler" << "{"
             << "max_queue_size"  << static_cast<int>(scheduler.maxQueueSize)
             << "replan_weight"   << scheduler.replanWeight
             << "replan_interval" << scheduler.replanInterval
             << "}";

        file << "simulation" << "{"
             << "duration"         << duration
             << "step_time"        << stepTime
             << "seed"             << static_cast<int>(seed)
             << "perception_noise" << perceptionNoise
             << "output_dir"       << outputDir
             << "}";
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "[Config] Failed to save " << path << ": " << e.what() << std::endl;
        return false;
    }
}
