#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

// Simulation timing
constexpr double SIM_STEP_TIME = 0.1;        // Robot integration step in seconds
constexpr double SIM_DEFAULT_DURATION = 300.0;
constexpr int    SIM_INITIAL_TASKS = 10;

// Grid / planner
constexpr double GRID_RESOLUTION = 0.1;      // Warehouse layout resolution, metres per cell
constexpr std::size_t PLANNER_MAX_EXPANSIONS = 0; // 0 = unbounded search

// Scheduler
constexpr std::size_t DEFAULT_MAX_QUEUE_SIZE = 100;
constexpr double DEFAULT_REPLAN_WEIGHT = 0.1;
constexpr int    DEFAULT_TASK_PRIORITY = 1;
constexpr int    DEFAULT_REPLAN_INTERVAL = 5; // Replan every N dispatched tasks

// Perception stub
constexpr double PERCEPTION_NOISE_STD = 0.05; // metres, applied to box bounds

struct RobotConfig
{
    double maxSpeed{1.5};          // m/s
    double sensorRange{5.0};       // m, perception radius
    double gripperCapacity{5.0};   // kg, heaviest item the gripper lifts
};

struct WarehouseConfig
{
    double width{20.0};            // m (x)
    double length{30.0};           // m (y)
    int    numRacks{10};
    double rackLength{5.0};
    double rackWidth{1.0};
    double aisleWidth{2.0};
    int    numItems{100};
    int    itemTypes{10};
    double obstacleDensity{0.05};  // obstacles per square metre of free space
    int    chargingStations{2};
    double robotStartX{1.0};
    double robotStartY{1.0};
    double taskGenerationRate{0.1}; // tasks per simulated second
};

struct PlannerConfig
{
    std::size_t maxExpansions{PLANNER_MAX_EXPANSIONS};
};

struct SchedulerConfig
{
    std::size_t maxQueueSize{DEFAULT_MAX_QUEUE_SIZE};
    double replanWeight{DEFAULT_REPLAN_WEIGHT};
    int    replanInterval{DEFAULT_REPLAN_INTERVAL};
};

// Everything the simulation runner needs, persisted as one YAML file.
struct SimConfig
{
    RobotConfig     robot;
    WarehouseConfig warehouse;
    PlannerConfig   planner;
    SchedulerConfig scheduler;

    double        duration{SIM_DEFAULT_DURATION};
    double        stepTime{SIM_STEP_TIME};
    std::uint32_t seed{42};
    double        perceptionNoise{PERCEPTION_NOISE_STD};
    std::string   outputDir{"outputs"};

    /** Reads `path` on top of the current values. A missing file is
        created with the current values; missing keys keep their value.
        Returns false if the path cannot be accessed or an existing
        file could not be parsed.                                    */
    bool load(const std::string& path);
    bool save(const std::string& path) const;
};

#endif // CONFIG_HPP
