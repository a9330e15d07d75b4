#pragma once

#include "types.h"
#include <string>
#include <vector>

namespace ocl {
namespace gaiasync {

/**
 * Result of one remote query
 */
struct QueryResult {
    RecordBatch batch;
    std::string job_id;          ///< Remote job identifier, empty for synchronous queries
};

/**
 * RemoteCatalogService - Remote paginated query service
 *
 * Abstracts the catalog archive: session handling, ADQL execution and
 * session-scoped user tables. TapClient talks to the Gaia Archive; tests use
 * an in-memory implementation.
 *
 * Implementations report failures with SyncException:
 * NETWORK_ERROR / TIMEOUT for transport problems, REMOTE_SERVICE_ERROR when
 * the service rejects a request, PARSE_ERROR for unreadable responses and
 * SESSION_ERROR for rejected credentials.
 */
class RemoteCatalogService {
public:
    virtual ~RemoteCatalogService() = default;

    /**
     * Open an authenticated session
     * @throws SyncException (SESSION_ERROR, NETWORK_ERROR)
     */
    virtual void login(const Credentials& credentials) = 0;

    /**
     * Close the authenticated session
     */
    virtual void logout() = 0;

    virtual bool isAuthenticated() const = 0;

    /**
     * Upload a single column (source_id) table into the user space.
     * Requires an authenticated session.
     *
     * @param table_name Unqualified table name
     * @param ids Identifiers to store
     * @return Qualified name to reference the table from ADQL
     */
    virtual std::string uploadTable(const std::string& table_name,
                                    const std::vector<SourceId>& ids) = 0;

    /**
     * Remove a previously uploaded table
     * @param table_name Unqualified table name
     */
    virtual void deleteTable(const std::string& table_name) = 0;

    /**
     * Run an ADQL query and return its rows
     */
    virtual QueryResult executeQuery(const std::string& adql) = 0;

    /**
     * Remove a finished job from the user's job list
     */
    virtual void removeJob(const std::string& job_id) = 0;
};

} // namespace gaiasync
} // namespace ocl
