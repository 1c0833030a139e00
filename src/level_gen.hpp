#pragma once

#include "map_builder.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Every registered level generator. Append-only: names are used in settings
// files and on the command line.
enum class BuilderKind : uint8_t {
    SimpleRooms = 0,
    BspDungeon,
    BspInterior,
    CellularAutomata,
    DrunkardOpenArea,
    DrunkardOpenHalls,
    DrunkardWindingPassages,
    DrunkardFatPassages,
    DrunkardFearfulSymmetry,
    Maze,
    DlaWalkInwards,
    DlaWalkOutwards,
    DlaCentralAttractor,
    DlaInsectoid,
    VoronoiPythagoras,
    VoronoiManhattan,
    VoronoiChebyshev,
};

const std::vector<BuilderKind>& allBuilderKinds();

// Stable lowercase id ("simple_rooms", "drunkard_open_halls", ...).
const char* builderKindName(BuilderKind k);
bool parseBuilderKind(const std::string& s, BuilderKind& out);

std::unique_ptr<MapBuilder> makeBuilder(BuilderKind k, int width, int height, int depth);
// Wraps `source` (unbuilt) so its finished map becomes the WFC sample.
std::unique_ptr<MapBuilder> makeWfcBuilder(std::unique_ptr<MapBuilder> source, int width, int height, int depth,
                                           int chunkSize, int maxSolverRuns);

enum class WfcMode : uint8_t {
    Random = 0, // one-in-N chance per level
    Always,
    Never,
};

const char* wfcModeName(WfcMode m);
bool parseWfcMode(const std::string& s, WfcMode& out);

struct LevelGenOptions {
    int width = 80;
    int height = 43;

    // Kinds to choose from; empty means all of them.
    std::vector<BuilderKind> kinds;
    // If set, always use this kind.
    bool forceKind = false;
    BuilderKind forcedKind = BuilderKind::SimpleRooms;

    WfcMode wfcMode = WfcMode::Random;
    int wfcOneIn = 3;
    int wfcChunkSize = 8;
    int wfcMaxAttempts = 64;

    // Whole-build retries on a fatal attempt (no rooms, no exit, ...).
    int maxBuildAttempts = 8;

    SnapshotFn onSnapshot;
};

struct GeneratedLevel {
    Grid map;
    Vec2i start{ -1, -1 };
    Vec2i exit{ -1, -1 };

    BuilderKind kind = BuilderKind::SimpleRooms;
    std::string builderName;
    bool wfcDerived = false;
    int attempts = 0;

    // One line per rejected attempt.
    std::vector<std::string> warnings;
};

// Picks a generator, optionally re-derives it through WFC, builds it and
// spawns entities through `spawn`. Returns false (with `err`) only when every
// attempt failed.
bool generateLevel(RNG& rng, int depth, const LevelGenOptions& opts, const SpawnFn& spawn,
                   GeneratedLevel& out, std::string* err = nullptr);
