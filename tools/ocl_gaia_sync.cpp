#include "ocl_gaiasync/config.h"
#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/openclust_catalogue.h"
#include "ocl_gaiasync/query_builder.h"
#include "ocl_gaiasync/schema_descriptor.h"
#include "ocl_gaiasync/session_manager.h"
#include "ocl_gaiasync/sqlite_region_store.h"
#include "ocl_gaiasync/sync_orchestrator.h"
#include "ocl_gaiasync/tap_client.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <signal.h>

using namespace ocl::gaiasync;

// Global orchestrator pointer for signal handling
SyncOrchestrator* g_orchestrator = nullptr;

void signalHandler(int /*signum*/) {
    if (g_orchestrator) {
        g_orchestrator->cancel();
    }
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\n"
              << "Download Gaia DR2 sources around open clusters into a local database.\n\n"
              << "Options:\n"
              << "  --config FILE          JSON configuration file\n"
              << "  --catalogue FILE       OpenClust clusters.dat file\n"
              << "  --cluster NAME ...     Clusters to synchronize (ALL for every cluster)\n"
              << "  --extra-size X         Region size multiplier (default 1.5)\n"
              << "  --partition-size N     Rows per query, 0 for unbounded (default 500000)\n"
              << "  --db PATH              SQLite database path\n"
              << "  --workers N            Clusters synchronized concurrently\n"
              << "  -v, -vv                Verbose / debug output\n"
              << "  -h, --help             Show this help\n\n"
              << "Credentials are read from the configuration file or from\n"
              << "GAIA_USERNAME and GAIA_PASSWORD.\n";
}

void printSummary(const BatchSummary& summary) {
    std::cout << "\n" << std::left << std::setw(20) << "Cluster"
              << std::setw(11) << "Status"
              << std::right << std::setw(12) << "Downloaded"
              << std::setw(12) << "Inserted"
              << std::setw(12) << "Duplicates" << "\n";
    std::cout << std::string(67, '-') << "\n";

    for (const auto& r : summary.regions) {
        std::cout << std::left << std::setw(20) << r.region
                  << std::setw(11) << downloadStateToString(r.state)
                  << std::right << std::setw(12) << r.downloaded
                  << std::setw(12) << r.inserted
                  << std::setw(12) << r.duplicates << "\n";
        if (r.state == DownloadState::FAILED) {
            std::cout << "    " << r.error << "\n";
        }
    }

    std::cout << std::string(67, '-') << "\n";
    std::cout << summary.completed() << " completed, " << summary.failed() << " failed, "
              << summary.cancelled() << " cancelled, " << summary.inserted()
              << " records inserted" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string catalogue_path;
    std::string db_path;
    std::set<std::string> clusters;
    std::optional<std::string> extra_size;
    std::optional<std::string> partition_size;
    std::optional<std::string> workers;
    int verbosity = 0;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto nextValue = [&](const std::string& option) -> std::string {
                if (i + 1 >= argc) {
                    throw SyncException(ErrorCode::INVALID_PARAMS, option + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config") {
                config_path = nextValue(arg);
            } else if (arg == "--catalogue") {
                catalogue_path = nextValue(arg);
            } else if (arg == "--cluster") {
                clusters.insert(nextValue(arg));
                while (i + 1 < argc && argv[i + 1][0] != '-') {
                    clusters.insert(argv[++i]);
                }
            } else if (arg == "--extra-size") {
                extra_size = nextValue(arg);
            } else if (arg == "--partition-size") {
                partition_size = nextValue(arg);
            } else if (arg == "--db") {
                db_path = nextValue(arg);
            } else if (arg == "--workers") {
                workers = nextValue(arg);
            } else if (arg == "-v") {
                verbosity = std::max(verbosity, 1);
            } else if (arg == "-vv") {
                verbosity = 2;
            } else {
                throw SyncException(ErrorCode::INVALID_PARAMS, "Unknown option: " + arg);
            }
        }
    } catch (const SyncException& e) {
        std::cerr << e.what() << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    Logger logger(LogLevel::INFO);

    try {
        // Defaults < file < environment < command line
        SyncConfig config = config_path.empty() ? SyncConfig() : SyncConfig::fromFile(config_path);
        config.applyEnvironment();

        std::map<std::string, std::string> overrides;
        if (!catalogue_path.empty()) overrides["catalogue_path"] = catalogue_path;
        if (!db_path.empty()) overrides["db_path"] = db_path;
        if (extra_size) overrides["extra_size"] = *extra_size;
        if (partition_size) overrides["partition_size"] = *partition_size;
        if (workers) overrides["workers"] = *workers;
        config.apply(overrides);

        logger.setLevel(config.log_level);
        if (verbosity == 1) logger.setLevel(LogLevel::INFO);
        if (verbosity >= 2) logger.setLevel(LogLevel::DEBUG);
        if (!config.log_file.empty()) {
            logger.setLogFile(config.log_file);
        }

        // Regions
        auto catalogue = OpenClustCatalogue::load(config.catalogue_path, logger);
        std::vector<Region> regions;
        if (clusters.empty() || clusters.count("ALL") > 0) {
            for (const auto& entry : catalogue) {
                regions.push_back(entry.second);
            }
        } else {
            for (const auto& name : clusters) {
                auto it = catalogue.find(name);
                if (it == catalogue.end()) {
                    logger.warn("Cluster " + name + " is not in the catalogue");
                    continue;
                }
                regions.push_back(it->second);
            }
        }

        if (regions.empty()) {
            logger.error("No clusters to synchronize");
            return 1;
        }

        // Components
        const SchemaDescriptor& dr2 = SchemaDescriptor::gaiaDR2();
        SchemaDescriptor schema(dr2.storeTable(), config.main_table, dr2.columns(), dr2.idColumn());

        SqliteRegionStore store(config.db_path, schema, logger, config.chunk_size);
        TapClient client(schema, config.tapOptions(), logger);
        SessionManager session(client, config.credentials(), logger);
        SpatialQueryBuilder builder(schema, logger);

        SyncOrchestrator orchestrator(builder, store, session, logger, config.syncOptions());
        g_orchestrator = &orchestrator;

        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        BatchSummary summary = orchestrator.run(std::move(regions));

        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        g_orchestrator = nullptr;

        printSummary(summary);

        if (orchestrator.isCancelled()) {
            return 130;
        }
        return summary.allSucceeded() ? 0 : 2;

    } catch (const SyncException& e) {
        logger.error(errorCodeToString(e.code()) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.error(std::string("Exception: ") + e.what());
        return 1;
    }
}
