#pragma once

#include "builder_common.hpp"
#include "map_builder.hpp"

#include <memory>
#include <string>
#include <vector>

// Concrete level generators. Construct one per level; see MapBuilder for the
// shared contract.

class SimpleRoomsBuilder : public MapBuilder {
public:
    static constexpr int MAX_ROOMS = 30;
    static constexpr int MIN_SIZE = 6;
    static constexpr int MAX_SIZE = 9;

    SimpleRoomsBuilder(int width, int height, int depth);
    std::string name() const override { return "Simple Rooms"; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;
};

class BspDungeonBuilder : public MapBuilder {
public:
    static constexpr int PLACEMENT_ATTEMPTS = 240;

    BspDungeonBuilder(int width, int height, int depth);
    std::string name() const override { return "BSP Dungeon"; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;

private:
    void addSubrects(const Rect& r);
    Rect randomSubRect(const Rect& r, RNG& rng) const;
    bool isPossible(const Rect& r) const;

    std::vector<Rect> rects;
};

class BspInteriorBuilder : public MapBuilder {
public:
    static constexpr int MIN_ROOM_SIZE = 8;

    BspInteriorBuilder(int width, int height, int depth);
    std::string name() const override { return "BSP Interior"; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;

private:
    void addSubrects(const Rect& r, RNG& rng);

    std::vector<Rect> rects;
};

class CellularAutomataBuilder : public MapBuilder {
public:
    static constexpr int FLOOR_ROLL_THRESHOLD = 55; // d100 above this starts as Floor
    static constexpr int SMOOTHING_PASSES = 15;

    CellularAutomataBuilder(int width, int height, int depth);
    std::string name() const override { return "Cellular Automata"; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;
};

enum class DrunkSpawnMode : uint8_t {
    StartingPoint = 0,
    Random,
};

struct DrunkardSettings {
    std::string label;
    DrunkSpawnMode spawnMode = DrunkSpawnMode::StartingPoint;
    int lifetime = 400;
    float floorPercent = 0.5f;
    int brushSize = 1;
    Symmetry symmetry = Symmetry::None;

    static DrunkardSettings openArea();
    static DrunkardSettings openHalls();
    static DrunkardSettings windingPassages();
    static DrunkardSettings fatPassages();
    static DrunkardSettings fearfulSymmetry();
};

class DrunkardWalkBuilder : public MapBuilder {
public:
    DrunkardWalkBuilder(int width, int height, int depth, DrunkardSettings settings);
    std::string name() const override { return "Drunkard Walk (" + settings.label + ")"; }

    const DrunkardSettings& drunkardSettings() const { return settings; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;

private:
    DrunkardSettings settings;
};

class MazeBuilder : public MapBuilder {
public:
    MazeBuilder(int width, int height, int depth);
    std::string name() const override { return "Maze"; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;
};

enum class DlaAlgorithm : uint8_t {
    WalkInwards = 0,
    WalkOutwards,
    CentralAttractor,
};

struct DlaSettings {
    std::string label;
    DlaAlgorithm algorithm = DlaAlgorithm::WalkInwards;
    int brushSize = 1;
    Symmetry symmetry = Symmetry::None;
    float floorPercent = 0.25f;

    static DlaSettings walkInwards();
    static DlaSettings walkOutwards();
    static DlaSettings centralAttractor();
    static DlaSettings insectoid();
};

class DlaBuilder : public MapBuilder {
public:
    DlaBuilder(int width, int height, int depth, DlaSettings settings);
    std::string name() const override { return "Diffusion-Limited Aggregation (" + settings.label + ")"; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;

private:
    DlaSettings settings;
};

enum class DistanceMetric : uint8_t {
    Pythagoras = 0, // squared Euclidean
    Manhattan,
    Chebyshev,
};

const char* distanceMetricName(DistanceMetric m);

class VoronoiBuilder : public MapBuilder {
public:
    static constexpr int SEED_COUNT = 64;

    VoronoiBuilder(int width, int height, int depth, DistanceMetric metric);
    std::string name() const override { return std::string("Voronoi (") + distanceMetricName(metric) + ")"; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;

private:
    DistanceMetric metric;
};

// Re-derives a level from another builder's finished map: the source map is
// cut into chunk patterns and the wave-function-collapse solver reassembles
// them into a new layout.
class WfcBuilder : public MapBuilder {
public:
    WfcBuilder(int width, int height, int depth, std::unique_ptr<MapBuilder> source,
               int chunkSize = 8, int maxSolverRuns = 64);

    std::string name() const override;

    const MapBuilder& sourceBuilder() const { return *source; }
    int solverRuns() const { return runs; }

protected:
    bool buildImpl(RNG& rng, std::string* err) override;

private:
    std::unique_ptr<MapBuilder> source;
    int chunkSize = 8;
    int maxSolverRuns = 64;
    int runs = 0;
};
