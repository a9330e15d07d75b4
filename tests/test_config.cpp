#include "ocl_gaiasync/config.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using namespace ocl::gaiasync;

namespace {

void expectInvalid(const std::map<std::string, std::string>& values) {
    SyncConfig config;
    try {
        config.apply(values);
        FAIL() << "Expected SyncException for " << values.begin()->first;
    } catch (const SyncException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PARAMS);
    }
}

} // namespace

TEST(SyncConfigTest, Defaults) {
    SyncConfig config;

    EXPECT_EQ(config.db_path, "ocl_gaia.db");
    EXPECT_EQ(config.main_table, "gaiadr2.gaia_source");
    EXPECT_EQ(config.partition_size, std::optional<size_t>(500000));
    EXPECT_DOUBLE_EQ(config.extra_size, 1.5);
    EXPECT_EQ(config.workers, 1u);
    EXPECT_FALSE(config.credentials().has_value());
}

TEST(SyncConfigTest, FromJson) {
    SyncConfig config = SyncConfig::fromJson(R"({
        "username": "jdoe",
        "password": "secret",
        "db_path": "/data/clusters.db",
        "partition_size": 1000,
        "extra_size": 2.0,
        "workers": 4,
        "region_retries": 2,
        "remove_jobs": false,
        "log_level": "debug",
        "log_file": null
    })");

    EXPECT_EQ(config.db_path, "/data/clusters.db");
    EXPECT_EQ(config.partition_size, std::optional<size_t>(1000));
    EXPECT_DOUBLE_EQ(config.extra_size, 2.0);
    EXPECT_EQ(config.workers, 4u);
    EXPECT_EQ(config.region_retries, 2u);
    EXPECT_FALSE(config.remove_jobs);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_TRUE(config.log_file.empty());

    auto credentials = config.credentials();
    ASSERT_TRUE(credentials.has_value());
    EXPECT_EQ(credentials->username, "jdoe");
    EXPECT_EQ(credentials->password, "secret");
}

TEST(SyncConfigTest, UnboundedPartition) {
    SyncConfig from_null = SyncConfig::fromJson(R"({"partition_size": null})");
    EXPECT_FALSE(from_null.partition_size.has_value());

    SyncConfig from_zero = SyncConfig::fromJson(R"({"partition_size": 0})");
    EXPECT_FALSE(from_zero.partition_size.has_value());
    EXPECT_FALSE(from_zero.syncOptions().download.partition_size.has_value());
}

TEST(SyncConfigTest, InvalidValues) {
    expectInvalid({{"workers", "0"}});
    expectInvalid({{"workers", "-2"}});
    expectInvalid({{"chunk_size", "0"}});
    expectInvalid({{"partition_size", "many"}});
    expectInvalid({{"extra_size", "1.5x"}});
    expectInvalid({{"timeout_seconds", "0"}});
    expectInvalid({{"remove_jobs", "maybe"}});
    expectInvalid({{"log_level", "chatty"}});
    expectInvalid({{"no_such_key", "1"}});
}

TEST(SyncConfigTest, MalformedJson) {
    EXPECT_THROW(SyncConfig::fromJson("{\"workers\": "), SyncException);
}

TEST(SyncConfigTest, EnvironmentOverridesFile) {
    SyncConfig config = SyncConfig::fromJson(R"({"db_path": "file.db", "workers": 2})");

    config.applyEnvironment({{"GAIA_USERNAME", "jdoe"},
                             {"GAIA_PASSWORD", "secret"},
                             {"OCL_DB_PATH", "env.db"},
                             {"OCL_PARTITION_SIZE", "250"},
                             {"OCL_WORKERS", ""},
                             {"UNRELATED", "ignored"}});

    EXPECT_EQ(config.db_path, "env.db");
    EXPECT_EQ(config.partition_size, std::optional<size_t>(250));
    EXPECT_EQ(config.workers, 2u);  // empty value ignored
    ASSERT_TRUE(config.credentials().has_value());
    EXPECT_EQ(config.credentials()->username, "jdoe");
}

TEST(SyncConfigTest, DerivedOptions) {
    SyncConfig config;
    config.tap_url = "http://localhost:8080/tap";
    config.timeout_seconds = 30;
    config.poll_interval_ms = 200;
    config.partition_size = 1000;
    config.extra_size = 2.5;
    config.workers = 3;
    config.region_retries = 1;
    config.inline_exclusion_warn = 50;

    TapClientOptions tap = config.tapOptions();
    EXPECT_EQ(tap.base_url, "http://localhost:8080/tap");
    EXPECT_EQ(tap.timeout_seconds, 30);
    EXPECT_EQ(tap.poll_interval_ms, 200);

    SyncOptions sync = config.syncOptions();
    EXPECT_EQ(sync.download.partition_size, std::optional<size_t>(1000));
    EXPECT_DOUBLE_EQ(sync.download.extra_size, 2.5);
    EXPECT_TRUE(sync.download.remove_jobs);
    EXPECT_EQ(sync.workers, 3u);
    EXPECT_EQ(sync.region_retries, 1u);
    EXPECT_EQ(sync.inline_warn_threshold, 50u);
}

TEST(SyncConfigTest, FromFile) {
    const std::string path = ::testing::TempDir() + "ocl_gaiasync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"catalogue_path": "/data/clusters.dat", "chunk_size": 1000})";
    }

    SyncConfig config = SyncConfig::fromFile(path);
    EXPECT_EQ(config.catalogue_path, "/data/clusters.dat");
    EXPECT_EQ(config.chunk_size, 1000u);
    std::remove(path.c_str());

    EXPECT_THROW(SyncConfig::fromFile("/nonexistent/ocl_gaia.json"), SyncException);
}

TEST(SyncConfigTest, JobLimits) {
    SyncConfig defaults;
    EXPECT_EQ(defaults.tapOptions().job_timeout_seconds, 3600);
    EXPECT_EQ(defaults.tapOptions().queries_per_minute, 0);

    SyncConfig config = SyncConfig::fromJson(R"({"job_timeout_seconds": 120, "queries_per_minute": 30})");
    TapClientOptions tap = config.tapOptions();
    EXPECT_EQ(tap.job_timeout_seconds, 120);
    EXPECT_EQ(tap.queries_per_minute, 30);

    SyncConfig unlimited = SyncConfig::fromJson(R"({"queries_per_minute": 0})");
    EXPECT_EQ(unlimited.tapOptions().queries_per_minute, 0);

    expectInvalid({{"job_timeout_seconds", "0"}});
    expectInvalid({{"queries_per_minute", "-1"}});
    expectInvalid({{"queries_per_minute", "fast"}});
}
