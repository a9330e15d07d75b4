#include "ocl_gaiasync/config.h"
#include "ocl_gaiasync/simple_json.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace ocl {
namespace gaiasync {

namespace {

SyncException invalidValue(const std::string& key, const std::string& value) {
    return SyncException(ErrorCode::INVALID_PARAMS,
                         "Invalid value for '" + key + "': '" + value + "'");
}

unsigned long long parseUnsigned(const std::string& key, const std::string& value) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throw invalidValue(key, value);
    }
    try {
        size_t consumed = 0;
        unsigned long long v = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw invalidValue(key, value);
        }
        return v;
    } catch (const std::logic_error&) {
        throw invalidValue(key, value);
    }
}

unsigned parseUnsignedInt(const std::string& key, const std::string& value) {
    unsigned long long v = parseUnsigned(key, value);
    if (v > std::numeric_limits<unsigned>::max()) {
        throw invalidValue(key, value);
    }
    return static_cast<unsigned>(v);
}

int parsePositiveInt(const std::string& key, const std::string& value) {
    unsigned long long v = parseUnsigned(key, value);
    if (v == 0 || v > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
        throw invalidValue(key, value);
    }
    return static_cast<int>(v);
}

double parseDouble(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        double v = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw invalidValue(key, value);
        }
        return v;
    } catch (const std::logic_error&) {
        throw invalidValue(key, value);
    }
}

bool parseBool(const std::string& key, const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    throw invalidValue(key, value);
}

std::optional<size_t> parsePartitionSize(const std::string& key, const std::string& value) {
    if (value == "null") {
        return std::nullopt;
    }
    unsigned long long v = parseUnsigned(key, value);
    if (v == 0) {
        return std::nullopt;
    }
    return static_cast<size_t>(v);
}

} // namespace

SyncConfig SyncConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

SyncConfig SyncConfig::fromJson(const std::string& json) {
    SyncConfig config;
    config.apply(SimpleJSON::parse(json));
    return config;
}

void SyncConfig::apply(const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        if (key == "partition_size") {
            partition_size = parsePartitionSize(key, value);
            continue;
        }
        if (value == "null") {
            continue;
        }

        if (key == "username") {
            username = value;
        } else if (key == "password") {
            password = value;
        } else if (key == "db_path") {
            db_path = value;
        } else if (key == "tap_url") {
            tap_url = value;
        } else if (key == "main_table") {
            main_table = value;
        } else if (key == "extra_size") {
            extra_size = parseDouble(key, value);
        } else if (key == "timeout_seconds") {
            timeout_seconds = parsePositiveInt(key, value);
        } else if (key == "poll_interval_ms") {
            poll_interval_ms = parsePositiveInt(key, value);
        } else if (key == "job_timeout_seconds") {
            job_timeout_seconds = parsePositiveInt(key, value);
        } else if (key == "queries_per_minute") {
            queries_per_minute = value == "0" ? 0 : parsePositiveInt(key, value);
        } else if (key == "workers") {
            workers = parseUnsignedInt(key, value);
            if (workers == 0) {
                throw invalidValue(key, value);
            }
        } else if (key == "region_retries") {
            region_retries = parseUnsignedInt(key, value);
        } else if (key == "chunk_size") {
            chunk_size = static_cast<size_t>(parseUnsigned(key, value));
            if (chunk_size == 0) {
                throw invalidValue(key, value);
            }
        } else if (key == "remove_jobs") {
            remove_jobs = parseBool(key, value);
        } else if (key == "inline_exclusion_warn") {
            inline_exclusion_warn = static_cast<size_t>(parseUnsigned(key, value));
        } else if (key == "log_level") {
            log_level = stringToLogLevel(value);
        } else if (key == "log_file") {
            log_file = value;
        } else if (key == "catalogue_path") {
            catalogue_path = value;
        } else {
            throw SyncException(ErrorCode::INVALID_PARAMS, "Unknown configuration key: " + key);
        }
    }
}

void SyncConfig::applyEnvironment() {
    static const char* const kVariables[] = {
        "GAIA_USERNAME", "GAIA_PASSWORD", "OCL_DB_PATH", "OCL_PARTITION_SIZE",
        "OCL_EXTRA_SIZE", "OCL_WORKERS", "OCL_LOG_LEVEL"
    };

    std::map<std::string, std::string> environment;
    for (const char* name : kVariables) {
        if (const char* value = std::getenv(name)) {
            environment[name] = value;
        }
    }
    applyEnvironment(environment);
}

void SyncConfig::applyEnvironment(const std::map<std::string, std::string>& environment) {
    static const std::map<std::string, std::string> kKeys = {
        {"GAIA_USERNAME", "username"},
        {"GAIA_PASSWORD", "password"},
        {"OCL_DB_PATH", "db_path"},
        {"OCL_PARTITION_SIZE", "partition_size"},
        {"OCL_EXTRA_SIZE", "extra_size"},
        {"OCL_WORKERS", "workers"},
        {"OCL_LOG_LEVEL", "log_level"}
    };

    std::map<std::string, std::string> values;
    for (const auto& [variable, key] : kKeys) {
        auto it = environment.find(variable);
        if (it != environment.end() && !it->second.empty()) {
            values[key] = it->second;
        }
    }
    apply(values);
}

std::optional<Credentials> SyncConfig::credentials() const {
    if (username.empty()) {
        return std::nullopt;
    }
    return Credentials{username, password};
}

TapClientOptions SyncConfig::tapOptions() const {
    TapClientOptions options;
    options.base_url = tap_url;
    options.timeout_seconds = timeout_seconds;
    options.poll_interval_ms = poll_interval_ms;
    options.job_timeout_seconds = job_timeout_seconds;
    options.queries_per_minute = queries_per_minute;
    return options;
}

SyncOptions SyncConfig::syncOptions() const {
    SyncOptions options;
    options.download.extra_size = extra_size;
    options.download.partition_size = partition_size;
    options.download.remove_jobs = remove_jobs;
    options.workers = workers;
    options.region_retries = region_retries;
    options.inline_warn_threshold = inline_exclusion_warn;
    return options;
}

} // namespace gaiasync
} // namespace ocl
