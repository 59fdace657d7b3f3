/**
 * @file map_tool.cpp
 * @brief Command-line map generation, inspection and save/load
 *
 * Usage:
 *   terratile_map [--seed N] [--dim N] [--config FILE]
 *                 [--save FILE] [--save-mode seed|full] [--load FILE]
 *                 [--log-level debug|info|warning|error]
 *                 [--timing] [--print] [--dump] [--verify]
 */

#include "terratile/core/errors.hpp"
#include "terratile/core/log.hpp"
#include "terratile/worldgen/map_io.hpp"
#include "terratile/worldgen/terrain.hpp"
#include "terratile/worldgen/terrain_dump.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace terratile;
using namespace terratile::worldgen;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --seed N             Generation seed (default 0)\n"
              << "  --dim N              Map dimension in cells (default 128)\n"
              << "  --config FILE        Generation config file\n"
              << "  --save FILE          Save the map\n"
              << "  --save-mode MODE     seed (default) or full\n"
              << "  --load FILE          Load a map instead of generating\n"
              << "  --log-level LEVEL    debug, info, warning or error\n"
              << "  --timing             Print generation stage timings\n"
              << "  --print              Print an ASCII overview\n"
              << "  --dump               Print every grid\n"
              << "  --verify             Generate twice and compare\n";
}

/// Parse an unsigned integer argument, or nullopt if malformed or out of range
std::optional<uint64_t> parseNumber(const std::string& text) {
    if (text.empty() || text[0] == '-') {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

void printSummary(const Terrain& terrain) {
    std::cout << "Map " << terrain.dimension() << "x" << terrain.dimension()
              << ", seed " << terrain.seed() << "\n";
    for (LayerKind kind : DRAW_ORDER) {
        const TerrainLayer& layer = terrain.layer(kind);
        std::cout << "  " << std::left << std::setw(6) << layerKindName(kind) << std::right;
        switch (kind) {
            case LayerKind::Sea:
                std::cout << layer.count(SeaCategory::Water) << " water cells";
                break;
            case LayerKind::River:
                std::cout << layer.count(RiverCategory::Water) << " river cells";
                if (!layer.rivers().empty()) std::cout << " in " << layer.rivers().size() << " rivers";
                break;
            case LayerKind::Biome:
                std::cout << layer.count(BiomeCategory::Forest) << " forest, "
                          << layer.count(BiomeCategory::Desert) << " desert, "
                          << layer.count(BiomeCategory::Mountain) << " mountain";
                break;
            case LayerKind::Road:
                std::cout << layer.count(RoadCategory::Road) << " road cells";
                if (!layer.roads().empty()) std::cout << " in " << layer.roads().size() << " roads";
                break;
            case LayerKind::City:
                std::cout << layer.sites().size() << " cities";
                break;
        }
        std::cout << "\n";
    }
    for (const auto& warning : terrain.warnings()) {
        std::cout << "  warning: " << warning << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    uint64_t seed = 0;
    int64_t dimension = 128;
    std::string configPath;
    std::string savePath;
    std::string loadPath;
    MapSaveMode saveMode = MapSaveMode::Seed;
    bool timing = false;
    bool print = false;
    bool dump = false;
    bool verify = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--timing") {
            timing = true;
        } else if (arg == "--print") {
            print = true;
        } else if (arg == "--dump") {
            dump = true;
        } else if (arg == "--verify") {
            verify = true;
        } else if (!hasValue) {
            std::cerr << "Unknown option or missing value: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        } else if (arg == "--seed") {
            auto value = parseNumber(argv[++i]);
            if (!value) {
                std::cerr << "Invalid seed: " << argv[i] << "\n";
                return 1;
            }
            seed = *value;
        } else if (arg == "--dim") {
            // Signed parse so non-positive values reach InvalidDimension
            char* end = nullptr;
            errno = 0;
            long long value = std::strtoll(argv[++i], &end, 10);
            if (*end != '\0' || errno == ERANGE) {
                std::cerr << "Invalid dimension: " << argv[i] << "\n";
                return 1;
            }
            dimension = value;
        } else if (arg == "--config") {
            configPath = argv[++i];
        } else if (arg == "--save") {
            savePath = argv[++i];
        } else if (arg == "--save-mode") {
            auto mode = parseMapSaveMode(argv[++i]);
            if (!mode) {
                std::cerr << "Invalid save mode: " << argv[i] << " (expected seed or full)\n";
                return 1;
            }
            saveMode = *mode;
        } else if (arg == "--load") {
            loadPath = argv[++i];
        } else if (arg == "--log-level") {
            auto level = parseLogLevel(argv[++i]);
            if (!level) {
                std::cerr << "Invalid log level: " << argv[i] << "\n";
                return 1;
            }
            Log::setLevel(*level);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        GenerationConfig config;
        if (!configPath.empty()) {
            config = GenerationConfig::loadFile(configPath);
        }

        Terrain terrain = loadPath.empty() ? Terrain::generate(seed, dimension, config)
                                           : loadMap(loadPath);

        printSummary(terrain);

        if (timing) {
            double total = 0.0;
            for (const auto& stage : terrain.timings()) {
                std::cout << "  " << std::left << std::setw(10) << stage.stage << std::right
                          << std::fixed << std::setprecision(3) << stage.milliseconds << " ms\n";
                total += stage.milliseconds;
            }
            std::cout << "  " << std::left << std::setw(10) << "total" << std::right
                      << std::fixed << std::setprecision(3) << total << " ms\n";
        }

        if (verify) {
            Terrain::verifyDeterminism(terrain.seed(), terrain.dimension(), terrain.config());
            std::cout << "Determinism verified for seed " << terrain.seed() << "\n";
        }

        if (print) {
            std::cout << renderOverview(terrain);
        }
        if (dump) {
            std::cout << dumpTerrain(terrain);
        }

        if (!savePath.empty()) {
            saveMap(terrain, savePath, saveMode);
        }
    } catch (const InvalidDimension& e) {
        Log::error("terratile_map", e.what());
        return 2;
    } catch (const NonDeterminismDetected& e) {
        Log::error("terratile_map", e.what());
        return 3;
    } catch (const std::exception& e) {
        Log::error("terratile_map", e.what());
        return 1;
    }

    return 0;
}
