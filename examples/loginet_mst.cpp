#include <loginet/loginet.h>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_PIPELINE = 2;

void printUsage(const char* program) {
    std::cerr << "LogiNet " << loginet::versionString() << "\n"
              << "Usage: " << program << " <features.geojson> <output.json> [options]\n"
              << "  --mode auto|aero|sea|rail   Facility category (default: auto)\n"
              << "  --bbox w,s,e,n              Query region (default: whole world)\n"
              << "  --roads FILE                Road network JSON for route refinement\n"
              << "  --config FILE               Pipeline options JSON\n"
              << "  --threads N                 Routing workers (0 = calling thread)\n"
              << "  --drop-invalid              Skip records with bad geometry\n"
              << "  --log-dir DIR               Also write logs to DIR/loginet.log\n";
}

struct CommandLine {
    std::string featuresPath;
    std::string outputPath;
    std::string modeName = "auto";
    std::string bbox = "-180,-90,180,90";
    std::string roadsPath;
    std::string configPath;
    std::string logDir;
    int threads = -1;
    bool dropInvalid = false;
};

/// @throws std::invalid_argument on malformed arguments
CommandLine parseArguments(int argc, char* argv[]) {
    CommandLine cmd;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto nextValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--mode") {
            cmd.modeName = nextValue();
        } else if (arg == "--bbox") {
            cmd.bbox = nextValue();
        } else if (arg == "--roads") {
            cmd.roadsPath = nextValue();
        } else if (arg == "--config") {
            cmd.configPath = nextValue();
        } else if (arg == "--log-dir") {
            cmd.logDir = nextValue();
        } else if (arg == "--threads") {
            std::string value = nextValue();
            size_t consumed = 0;
            cmd.threads = std::stoi(value, &consumed);
            if (consumed != value.size() || cmd.threads < 0) {
                throw std::invalid_argument("--threads expects a non-negative integer");
            }
        } else if (arg == "--drop-invalid") {
            cmd.dropInvalid = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw std::invalid_argument("Unknown option " + arg);
        } else if (positional == 0) {
            cmd.featuresPath = arg;
            ++positional;
        } else if (positional == 1) {
            cmd.outputPath = arg;
            ++positional;
        } else {
            throw std::invalid_argument("Unexpected argument " + arg);
        }
    }
    if (positional != 2) {
        throw std::invalid_argument("Expected <features.geojson> and <output.json>");
    }
    return cmd;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace loginet;

    CommandLine cmd;
    CategoryMode mode = CategoryMode::Auto;
    BoundingBox region;
    PipelineOptions options = PipelineOptions::balanced();
    try {
        cmd = parseArguments(argc, argv);
        mode = parseCategoryMode(cmd.modeName);
        region = BoundingBox::parse(cmd.bbox);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    if (cmd.logDir.empty()) {
        Logger::initialize();
    } else {
        Logger::initialize(cmd.logDir, true);
    }

    try {
        if (!cmd.configPath.empty()) {
            options = PipelineOptions::loadFromFile(cmd.configPath);
        }
    } catch (const std::runtime_error& e) {
        LOG_ERROR("{}", e.what());
        return EXIT_USAGE;
    }
    if (cmd.threads >= 0) {
        options.workerThreads = static_cast<size_t>(cmd.threads);
    }
    if (cmd.dropInvalid) {
        options.geometryPolicy = InvalidGeometryPolicy::DropAndReport;
    }

    std::shared_ptr<IRoutableNetworkProvider> roads;
    if (!cmd.roadsPath.empty()) {
        roads = std::make_shared<RoadNetworkFileProvider>(cmd.roadsPath);
    }

    try {
        GeoJsonFeatureSource source(cmd.featuresPath);
        NetworkPipeline pipeline(options);
        NetworkResult result = pipeline.run(source, region, mode, roads);

        if (!NetworkSerializer::saveToFile(result, cmd.outputPath)) {
            LOG_ERROR("Cannot write {}", cmd.outputPath);
            Logger::flush();
            return EXIT_PIPELINE;
        }

        const PipelineStats& stats = pipeline.lastStats();
        LOG_INFO("Wrote {} ({}; {} nodes, {} edges, {:.1f} m) in {:.1f} ms",
                 cmd.outputPath, toString(result.status()), result.nodesCount(),
                 result.edgesCount(), result.totalDistance(), stats.totalMs());
    } catch (const InvalidGeometryError& e) {
        LOG_ERROR("Invalid geometry: {}", e.what());
        Logger::flush();
        return EXIT_PIPELINE;
    } catch (const std::exception& e) {
        LOG_ERROR("Pipeline failed: {}", e.what());
        Logger::flush();
        return EXIT_PIPELINE;
    }

    Logger::flush();
    return 0;
}
