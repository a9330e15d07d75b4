#pragma once

#include "logger.h"
#include "sync_orchestrator.h"
#include "tap_client.h"
#include "types.h"
#include <map>
#include <optional>
#include <string>

namespace ocl {
namespace gaiasync {

/**
 * SyncConfig - Settings of a synchronization run
 *
 * Values come from defaults, then a flat JSON file, then environment
 * variables (GAIA_USERNAME, GAIA_PASSWORD, OCL_DB_PATH, OCL_PARTITION_SIZE,
 * OCL_EXTRA_SIZE, OCL_WORKERS, OCL_LOG_LEVEL). Command line options are
 * applied last by the tool itself.
 *
 * Example file:
 * @code
 *   {
 *     "username": "jdoe",
 *     "password": "secret",
 *     "db_path": "/data/ocl.db",
 *     "partition_size": 500000,
 *     "extra_size": 1.5,
 *     "workers": 3
 *   }
 * @endcode
 *
 * A partition_size of 0 (or null) disables paging.
 */
struct SyncConfig {
    std::string username;
    std::string password;
    std::string db_path = "ocl_gaia.db";
    std::string tap_url = "https://gea.esac.esa.int/tap-server";
    std::string main_table = "gaiadr2.gaia_source";
    std::optional<size_t> partition_size = 500000;
    double extra_size = 1.5;
    int timeout_seconds = 60;
    int poll_interval_ms = 1000;
    int job_timeout_seconds = 3600;
    int queries_per_minute = 0;  ///< 0 = unlimited
    unsigned workers = 1;
    unsigned region_retries = 0;
    size_t chunk_size = 50000;
    bool remove_jobs = true;
    size_t inline_exclusion_warn = 10000;
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    std::string catalogue_path = "clusters.dat";

    /**
     * Load a JSON configuration file on top of the defaults
     * @throws SyncException (INVALID_PARAMS) if the file cannot be read or a
     *         value is invalid, (PARSE_ERROR) for malformed JSON
     */
    static SyncConfig fromFile(const std::string& path);

    /**
     * Same as fromFile() with the JSON text already in memory
     */
    static SyncConfig fromJson(const std::string& json);

    /**
     * Apply key/value settings (configuration file keys)
     * @throws SyncException (INVALID_PARAMS) for unknown keys or bad values
     */
    void apply(const std::map<std::string, std::string>& values);

    /**
     * Apply overrides from the process environment
     */
    void applyEnvironment();

    /**
     * Apply overrides from an explicit variable map (same names as the
     * process environment)
     */
    void applyEnvironment(const std::map<std::string, std::string>& environment);

    std::optional<Credentials> credentials() const;

    TapClientOptions tapOptions() const;
    SyncOptions syncOptions() const;
};

} // namespace gaiasync
} // namespace ocl
