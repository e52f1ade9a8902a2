// =============================================================================
// knowmap CLI - Density flattening for 2D knowledge-map layouts
// =============================================================================
//
// Usage:
//   knowmap [global options] <command> [options]
//
// Commands:
//   flatten     Flatten original coordinates into the active coordinate files
//   stats       Density statistics for a coordinate file
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   knowmap flatten --primary articles.orig.txt --out-primary articles.txt \
//                   --secondary questions.orig.txt --out-secondary questions.txt --mu 0.75
//   knowmap flatten --primary articles.orig.txt --out-primary articles.txt --mu 0
//   knowmap stats articles.txt
//
// Original coordinate files are only ever read. Re-running with another mu
// starts from the originals again.
//
// =============================================================================

#include <chrono>
#include <climits>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <Eigen/Core>

#include "knowmap/cli/commands.hpp"
#include "knowmap/config.hpp"
#include "knowmap/density.hpp"
#include "knowmap/error.hpp"
#include "knowmap/flatten.hpp"
#include "knowmap/io/point_io.hpp"
#include "knowmap/logging.hpp"

// =============================================================================
// Version Info
// =============================================================================

#define KNOWMAP_VERSION_MAJOR 1
#define KNOWMAP_VERSION_MINOR 0
#define KNOWMAP_VERSION_PATCH 0
#define KNOWMAP_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"flatten", "Flatten original coordinates into active coordinate files", knowmap::cli::cmd_flatten},
    {"stats",   "Show density statistics for a coordinate file", knowmap::cli::cmd_stats},
    {"version", "Show version information", knowmap::cli::cmd_version},
    {"help",    "Show this help message", knowmap::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace {

// Option value helpers; a bad value is reported under the parameter it sets
double parse_double(const char* value, const char* field) {
    size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != std::strlen(value)) {
        throw knowmap::InvalidParameterError(field, "a number", std::string("got '") + value + "'");
    }
    return v;
}

long long parse_integer(const char* value, const char* field) {
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != std::strlen(value)) {
        throw knowmap::InvalidParameterError(field, "an integer", std::string("got '") + value + "'");
    }
    return v;
}

int parse_int(const char* value, const char* field) {
    const long long v = parse_integer(value, field);
    if (v < INT_MIN || v > INT_MAX) {
        throw knowmap::InvalidParameterError(field, "an integer in int range", std::string("got '") + value + "'");
    }
    return static_cast<int>(v);
}

size_t parse_count(const char* value, const char* field) {
    const long long v = parse_integer(value, field);
    if (v < 0) {
        throw knowmap::InvalidParameterError(field, "a non-negative integer", std::string("got '") + value + "'");
    }
    return static_cast<size_t>(v);
}

// Config and environment values go through the same parsers as the options
std::string config_raw(const knowmap::Config& config, const char* key) {
    return config.has(key) ? config.get<std::string>(key) : std::string();
}

double config_double(const knowmap::Config& config, const char* key, const char* field, double fallback) {
    const std::string raw = config_raw(config, key);
    return raw.empty() ? fallback : parse_double(raw.c_str(), field);
}

int config_int(const knowmap::Config& config, const char* key, const char* field, int fallback) {
    const std::string raw = config_raw(config, key);
    return raw.empty() ? fallback : parse_int(raw.c_str(), field);
}

size_t config_count(const knowmap::Config& config, const char* key, const char* field, size_t fallback) {
    const std::string raw = config_raw(config, key);
    return raw.empty() ? fallback : parse_count(raw.c_str(), field);
}

int report_error(const knowmap::KnowmapException& e) {
    std::cerr << e.what() << "\n";
    return e.code() == knowmap::ErrorCode::INVALID_PARAMETER ? 2 : 1;
}

} // namespace

// =============================================================================
// Help Command
// =============================================================================

namespace knowmap::cli {

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "knowmap - Density flattening for 2D knowledge maps\n";
    std::cout << "Version " << KNOWMAP_VERSION_STRING << "\n\n";
    std::cout << "Usage: knowmap [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>      key = value configuration file\n";
    std::cout << "  -v, --verbose            Debug logging\n";
    std::cout << "  -q, --quiet              Errors only\n";
    std::cout << "\nflatten Options:\n";
    std::cout << "  --primary <file>         Original primary coordinates (required)\n";
    std::cout << "  --out-primary <file>     Active primary coordinates (required)\n";
    std::cout << "  --secondary <file>       Original secondary coordinates\n";
    std::cout << "  --out-secondary <file>   Active secondary coordinates (required with --secondary)\n";
    std::cout << "  --mu <0..1>              Flattening strength, 0 restores the originals (default 0.75)\n";
    std::cout << "  --clusters <n>           k-means clusters (default 100)\n";
    std::cout << "  --knn <k>                Neighbours for secondary interpolation (default 8)\n";
    std::cout << "  --margin <m>             Target inset from the square edges (default 0.02)\n";
    std::cout << "  --seed <s>               Random seed (default 42)\n";
    std::cout << "  --method <name>          patched | subsample (default patched)\n";
    std::cout << "  --subsample <n>          Representatives for subsample (default 5000)\n";
    std::cout << "  --max-cluster-size <n>   Grow clusters while any exceeds n, 0 = off (default 2000)\n";
    std::cout << "  --threads <n>            Assignment workers, 0 = all cores (default 1)\n";
    std::cout << "  --greedy                 Approximate assignment instead of Hungarian\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  KNOWMAP_MU, KNOWMAP_CLUSTERS, KNOWMAP_KNN, KNOWMAP_MARGIN, KNOWMAP_SEED,\n";
    std::cout << "  KNOWMAP_MAX_CLUSTER_SIZE, KNOWMAP_SUBSAMPLE, KNOWMAP_MAX_THREADS, KNOWMAP_LOG_LEVEL\n";
    std::cout << "\nExamples:\n";
    std::cout << "  knowmap flatten --primary a.orig.txt --out-primary a.txt --mu 0.75\n";
    std::cout << "  knowmap stats a.txt\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "knowmap " << KNOWMAP_VERSION_STRING << "\n";
    std::cout << "Eigen: " << EIGEN_WORLD_VERSION << "." << EIGEN_MAJOR_VERSION << "." << EIGEN_MINOR_VERSION << "\n";
    std::cout << "k-NN: " << knn_backend_name(KnnConfig{}.backend) << " (" << knn_backend_name(KnnBackend::HNSW)
              << " available)\n";
    std::cout << "Hardware threads: " << std::thread::hardware_concurrency() << "\n";
    return 0;
}

// =============================================================================
// Stats Command
// =============================================================================

int cmd_stats(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: knowmap stats <coords file> [--grid <n>]\n";
        return 1;
    }

    try {
        std::string path;
        int grid = constants::DEFAULT_GRID_SIZE;
        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--grid" && i + 1 < argc) {
                grid = parse_int(argv[++i], "grid_size");
            } else if (arg[0] != '-') {
                path = arg;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            }
        }
        KNOWMAP_CHECK_PARAM(grid > 0, "grid_size", "grid_size > 0");

        const PointSet points = io::read_points(path);
        const DensityStats s = compute_density_stats(points, grid);

        std::cout << std::fixed << std::setprecision(3);
        std::cout << "=== Density: " << path << " ===\n";
        std::cout << "Points:            " << s.total_points << "\n";
        std::cout << "Grid:              " << s.grid_size << "x" << s.grid_size << "\n";
        std::cout << "Empty cells:       " << s.empty_cells << "/" << s.total_cells
                  << " (" << 100.0 * s.empty_fraction << "%)\n";
        std::cout << "Max density:       " << s.max_density << "\n";
        std::cout << "Median (nonzero):  " << s.median_density_nonzero << "\n";
        std::cout << "Mean (nonzero):    " << s.mean_density_nonzero << "\n";
        std::cout << "Std (nonzero):     " << s.std_density_nonzero << "\n";
        std::cout << "Top 10% cells:     " << s.top_decile_points << " points ("
                  << 100.0 * s.top_decile_fraction << "%)\n";
        std::cout << "X range:           [" << s.x_min << ", " << s.x_max << "]\n";
        std::cout << "Y range:           [" << s.y_min << ", " << s.y_max << "]\n";
    } catch (const KnowmapException& e) {
        return report_error(e);
    }
    return 0;
}

// =============================================================================
// Flatten Command
// =============================================================================

int cmd_flatten(int argc, char* argv[]) {
    const Config& config = Config::getInstance();

    std::string primary_path, secondary_path, out_primary_path, out_secondary_path;
    FlattenParameters params;

    try {
        params.mu = config_double(config, "flatten.mu", "mu", params.mu);
        params.cluster_count = config_int(config, "flatten.clusters", "cluster_count", params.cluster_count);
        params.neighbor_k = config_int(config, "flatten.knn", "neighbor_k", params.neighbor_k);
        params.margin = config_double(config, "flatten.margin", "margin", params.margin);
        params.seed = static_cast<uint64_t>(config_count(config, "flatten.seed", "seed", params.seed));
        params.max_cluster_size = config_count(config, "flatten.max_cluster_size", "max_cluster_size",
                                               params.max_cluster_size);
        params.subsample_size = config_count(config, "flatten.subsample", "subsample_size", params.subsample_size);
        params.num_threads = config_count(config, "perf.max_threads", "num_threads", 1);

        for (int i = 0; i < argc; ++i) {
            std::string arg = argv[i];
            const bool has_value = i + 1 < argc;

            if (arg == "--primary" && has_value) {
                primary_path = argv[++i];
            } else if (arg == "--secondary" && has_value) {
                secondary_path = argv[++i];
            } else if (arg == "--out-primary" && has_value) {
                out_primary_path = argv[++i];
            } else if (arg == "--out-secondary" && has_value) {
                out_secondary_path = argv[++i];
            } else if (arg == "--mu" && has_value) {
                params.mu = parse_double(argv[++i], "mu");
            } else if (arg == "--clusters" && has_value) {
                params.cluster_count = parse_int(argv[++i], "cluster_count");
            } else if (arg == "--knn" && has_value) {
                params.neighbor_k = parse_int(argv[++i], "neighbor_k");
            } else if (arg == "--margin" && has_value) {
                params.margin = parse_double(argv[++i], "margin");
            } else if (arg == "--seed" && has_value) {
                params.seed = static_cast<uint64_t>(parse_count(argv[++i], "seed"));
            } else if (arg == "--method" && has_value) {
                std::string method = argv[++i];
                if (method == "patched") {
                    params.method = FlattenMethod::PATCHED;
                } else if (method == "subsample") {
                    params.method = FlattenMethod::SUBSAMPLE;
                } else {
                    throw InvalidParameterError("method", "one of patched, subsample", "got '" + method + "'");
                }
            } else if (arg == "--subsample" && has_value) {
                params.subsample_size = parse_count(argv[++i], "subsample_size");
            } else if (arg == "--max-cluster-size" && has_value) {
                params.max_cluster_size = parse_count(argv[++i], "max_cluster_size");
            } else if (arg == "--threads" && has_value) {
                params.num_threads = parse_count(argv[++i], "num_threads");
            } else if (arg == "--greedy") {
                params.assignment = AssignmentSolver::GREEDY;
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n";
                std::cerr << "Run 'knowmap help' for usage.\n";
                return 1;
            }
        }

        if (primary_path.empty() || out_primary_path.empty()) {
            std::cerr << "flatten requires --primary and --out-primary\n";
            return 1;
        }
        if (!secondary_path.empty() && out_secondary_path.empty()) {
            std::cerr << "--secondary requires --out-secondary\n";
            return 1;
        }

        const PointSet primary = io::read_points(primary_path);
        const PointSet secondary = secondary_path.empty() ? PointSet{} : io::read_points(secondary_path);

        validate_parameters(params, primary, secondary);

        if (params.mu == 0.0) {
            LOG_INFO("mu = 0, restoring original coordinates");
            std::vector<io::PointFile> outputs = {{out_primary_path, &primary}};
            if (!secondary_path.empty()) outputs.push_back({out_secondary_path, &secondary});
            io::write_point_files_atomic(outputs);
            std::cout << "Restored " << primary.size() << " primary and " << secondary.size()
                      << " secondary points\n";
            return 0;
        }

        Flattener flattener(params);
        if (!g_options.quiet) {
            flattener.set_progress_callback([](const std::string& stage, size_t current, size_t total) {
                LOG_DEBUG("[", stage, "] ", current, "/", total);
            });
        }

        const auto start = std::chrono::steady_clock::now();
        const FlattenResult result = flattener.flatten(primary, secondary);
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        // Both outputs are complete before either active file is replaced
        std::vector<io::PointFile> outputs = {{out_primary_path, &result.flat_primary}};
        if (!secondary_path.empty()) outputs.push_back({out_secondary_path, &result.flat_secondary});
        io::write_point_files_atomic(outputs);

        const FlattenMetadata& meta = result.metadata;
        if (!g_options.quiet) {
            std::cout << format_density_comparison(meta.density_before, meta.density_after);

            const double overlap = neighborhood_preservation(primary, result.flat_primary, 10, 5000, params.seed);
            std::cout << std::fixed << std::setprecision(3);
            std::cout << "\nNeighbourhood overlap (k=10): " << overlap << "\n";
            switch (classify_coherence(overlap)) {
                case CoherenceVerdict::LOW:
                    std::cout << "  Low semantic coherence: mu may be too high\n";
                    break;
                case CoherenceVerdict::HIGH:
                    std::cout << "  High semantic coherence: density may not be sufficiently flattened\n";
                    break;
                case CoherenceVerdict::BALANCED:
                    std::cout << "  Balanced coherence and coverage\n";
                    break;
            }

            std::cout << "\n=== Complete ===\n";
            std::cout << "Method: " << flatten_method_name(meta.method) << ", mu=" << meta.mu << "\n";
            if (meta.method == FlattenMethod::PATCHED) {
                std::cout << "Clusters: " << meta.clusters_used << " (sizes " << meta.smallest_cluster
                          << ".." << meta.largest_cluster << ")\n";
            } else {
                std::cout << "Representatives: " << meta.representatives << "\n";
            }
            std::cout << "Mean displacement: primary " << meta.mean_applied_primary
                      << ", secondary " << meta.mean_applied_secondary << "\n";
            std::cout << "Time: " << secs << " s\n";
        }
    } catch (const KnowmapException& e) {
        return report_error(e);
    }
    return 0;
}

// =============================================================================
// Entry Point
// =============================================================================

namespace {

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-global argument is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

} // namespace

int run(int argc, char* argv[]) {
    g_options = GlobalOptions{};
    parse_global_options(argc, argv);

    if (!init_config(g_options.config_file)) {
        return 1;
    }
    if (g_options.verbose) {
        set_log_level(LogLevel::DEBUG);
    } else if (g_options.quiet) {
        set_log_level(LogLevel::ERROR);
    }

    if (argc < 1) {
        cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            return cmd->handler(argc, argv);
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'knowmap help' for usage.\n";
    return 1;
}

}  // namespace knowmap::cli
