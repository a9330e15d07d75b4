#pragma once

#include "remote_catalog_service.h"
#include "schema_descriptor.h"
#include <memory>
#include <string>
#include <vector>

namespace ocl {
namespace gaiasync {

class Logger;

/**
 * Connection settings for the Gaia Archive TAP server
 */
struct TapClientOptions {
    std::string base_url = "https://gea.esac.esa.int/tap-server";
    int timeout_seconds = 60;        ///< Per HTTP request
    int poll_interval_ms = 1000;     ///< Async job phase polling
    int job_timeout_seconds = 3600;  ///< Give up waiting for a job after this
    int queries_per_minute = 0;      ///< Job submissions per minute, 0 = unlimited
};

/**
 * TapClient - Gaia Archive client over HTTP (libcurl)
 *
 * Queries run as asynchronous TAP jobs (POST /tap/async, poll the job phase,
 * then fetch /results/result as CSV). The session is the JSESSIONID cookie
 * returned by POST /login. User tables are
 * uploaded as VOTable through POST /Upload and live in the
 * "user_<username>" schema until deleted.
 *
 * Jobs that end in ERROR or ABORTED are removed by the client itself when the
 * session is authenticated; successful jobs are left for the caller to remove
 * with removeJob().
 *
 * Every request runs on its own curl easy handle. The session cookie
 * returned by POST /login lives in a curl share handle used by all of them,
 * so one instance can be shared by several worker threads without holding a
 * lock for the duration of a job.
 *
 * GET requests follow redirects (result downloads are often redirected);
 * POST requests do not, and a 3xx answer is an error except for the job
 * submission, whose Location header names the job.
 *
 * Example usage:
 * @code
 *   Logger logger(LogLevel::INFO);
 *   TapClient client(SchemaDescriptor::gaiaDR2(), TapClientOptions(), logger);
 *   client.login({"jdoe", "secret"});
 *   auto result = client.executeQuery("SELECT TOP 10 ... FROM gaiadr2.gaia_source A ...");
 *   client.removeJob(result.job_id);
 *   client.logout();
 * @endcode
 */
class TapClient : public RemoteCatalogService {
public:
    TapClient(const SchemaDescriptor& schema, TapClientOptions options, Logger& logger);
    ~TapClient() override;

    // No copy, allow move
    TapClient(const TapClient&) = delete;
    TapClient& operator=(const TapClient&) = delete;
    TapClient(TapClient&&) noexcept;
    TapClient& operator=(TapClient&&) noexcept;

    void login(const Credentials& credentials) override;
    void logout() override;
    bool isAuthenticated() const override;

    std::string uploadTable(const std::string& table_name,
                            const std::vector<SourceId>& ids) override;
    void deleteTable(const std::string& table_name) override;

    QueryResult executeQuery(const std::string& adql) override;
    void removeJob(const std::string& job_id) override;

    /**
     * Get the TAP service base URL being used
     */
    std::string getBaseUrl() const;

    /**
     * Serialize identifiers as a single column VOTable (used for uploads)
     */
    static std::string buildVOTable(const std::string& table_name,
                                    const std::string& column,
                                    const std::vector<SourceId>& ids);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace gaiasync
} // namespace ocl
