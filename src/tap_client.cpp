#include "ocl_gaiasync/tap_client.h"
#include "ocl_gaiasync/logger.h"
#include "ocl_gaiasync/tap_result_parser.h"
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>
#include <curl/curl.h>

namespace ocl {
namespace gaiasync {

// =============================================================================
// Rate Limiter - Spaces job submissions evenly
// =============================================================================

class RateLimiter {
public:
    explicit RateLimiter(int queries_per_minute)
        : queries_per_minute_(queries_per_minute),
          next_slot_(std::chrono::steady_clock::now()) {}

    void waitIfNeeded() {
        if (queries_per_minute_ <= 0) return;  // No limit

        const auto interval = std::chrono::milliseconds(60000 / queries_per_minute_);

        // Reserve a slot, then sleep without holding the lock
        std::chrono::steady_clock::time_point slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            slot = std::max(std::chrono::steady_clock::now(), next_slot_);
            next_slot_ = slot + interval;
        }
        std::this_thread::sleep_until(slot);
    }

private:
    int queries_per_minute_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point next_slot_;
};

// =============================================================================
// CURL Helper Functions
// =============================================================================

namespace {

using FormFields = std::vector<std::pair<std::string, std::string>>;
using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using MimeHandle = std::unique_ptr<curl_mime, decltype(&curl_mime_free)>;

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string location;
};

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensureCurlInitialized() {
    static CurlGlobal global;
}

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string jobIdFromUrl(const std::string& job_url) {
    std::string url = job_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    size_t slash = url.find_last_of('/');
    return slash == std::string::npos ? url : url.substr(slash + 1);
}

} // anonymous namespace

// =============================================================================
// TapClient::Impl - Private implementation
// =============================================================================

class TapClient::Impl {
public:
    const SchemaDescriptor& schema_;
    TapClientOptions options_;
    Logger& logger_;
    RateLimiter rate_limiter_;

    // Session cookie jar and DNS cache shared by every request handle
    CURLSH* share_;
    std::mutex share_locks_[CURL_LOCK_DATA_LAST];

    mutable std::mutex state_mutex_;
    bool authenticated_;
    std::string username_;

    Impl(const SchemaDescriptor& schema, TapClientOptions options, Logger& logger)
        : schema_(schema),
          options_(std::move(options)),
          logger_(logger),
          rate_limiter_(options_.queries_per_minute),
          share_(nullptr),
          authenticated_(false) {

        ensureCurlInitialized();

        while (!options_.base_url.empty() && options_.base_url.back() == '/') {
            options_.base_url.pop_back();
        }

        share_ = curl_share_init();
        if (!share_) {
            throw SyncException(ErrorCode::NETWORK_ERROR, "Failed to initialize CURL share handle");
        }
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, lockShared);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, unlockShared);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    }

    ~Impl() {
        if (share_) {
            curl_share_cleanup(share_);
        }
    }

    static void lockShared(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<Impl*>(userptr)->share_locks_[data].lock();
    }

    static void unlockShared(CURL*, curl_lock_data data, void* userptr) {
        static_cast<Impl*>(userptr)->share_locks_[data].unlock();
    }

    CurlHandle newHandle(const std::string& url) {
        CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            throw SyncException(ErrorCode::NETWORK_ERROR, "Failed to initialize CURL");
        }
        curl_easy_setopt(curl.get(), CURLOPT_SHARE, share_);
        curl_easy_setopt(curl.get(), CURLOPT_COOKIEFILE, "");
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
        return curl;
    }

    static std::string encodeForm(CURL* curl, const FormFields& fields) {
        std::ostringstream encoded;
        for (size_t i = 0; i < fields.size(); ++i) {
            if (i > 0) encoded << '&';
            char* key = curl_easy_escape(curl, fields[i].first.c_str(),
                                         static_cast<int>(fields[i].first.size()));
            char* value = curl_easy_escape(curl, fields[i].second.c_str(),
                                           static_cast<int>(fields[i].second.size()));
            if (!key || !value) {
                curl_free(key);
                curl_free(value);
                throw SyncException(ErrorCode::NETWORK_ERROR, "Failed to URL-encode request");
            }
            encoded << key << '=' << value;
            curl_free(key);
            curl_free(value);
        }
        return encoded.str();
    }

    static HttpResponse perform(CURL* curl, const std::string& url) {
        HttpResponse response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) {
            ErrorCode code = res == CURLE_OPERATION_TIMEDOUT ? ErrorCode::TIMEOUT
                                                             : ErrorCode::NETWORK_ERROR;
            throw SyncException(code, std::string("CURL error for ") + url + ": " +
                                      curl_easy_strerror(res));
        }

        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

        char* location = nullptr;
        curl_easy_getinfo(curl, CURLINFO_REDIRECT_URL, &location);
        if (location) {
            response.location = location;
        }

        return response;
    }

    HttpResponse get(const std::string& url) {
        CurlHandle curl = newHandle(url);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
        return perform(curl.get(), url);
    }

    HttpResponse post(const std::string& url, const FormFields& fields) {
        CurlHandle curl = newHandle(url);
        std::string data = encodeForm(curl.get(), fields);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, data.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(data.size()));
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
        return perform(curl.get(), url);
    }

    HttpResponse postFile(const std::string& url, const FormFields& fields,
                          const std::string& file_name, const std::string& content_type,
                          const std::string& content) {
        CurlHandle curl = newHandle(url);
        MimeHandle mime(curl_mime_init(curl.get()), &curl_mime_free);
        if (!mime) {
            throw SyncException(ErrorCode::NETWORK_ERROR, "Failed to build multipart request");
        }

        for (const auto& field : fields) {
            curl_mimepart* part = curl_mime_addpart(mime.get());
            curl_mime_name(part, field.first.c_str());
            curl_mime_data(part, field.second.c_str(), field.second.size());
        }

        curl_mimepart* file = curl_mime_addpart(mime.get());
        curl_mime_name(file, "FILE");
        curl_mime_filename(file, file_name.c_str());
        curl_mime_type(file, content_type.c_str());
        curl_mime_data(file, content.c_str(), content.size());

        curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
        return perform(curl.get(), url);
    }

    void clearCookies() {
        CurlHandle curl = newHandle(options_.base_url);
        curl_easy_setopt(curl.get(), CURLOPT_COOKIELIST, "ALL");
    }

    bool isAuthenticated() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return authenticated_;
    }

    /**
     * Map an HTTP status to success or a SyncException
     *
     * A 3xx is accepted only when the caller reads the Location header;
     * anywhere else it means the response body is not the expected content.
     */
    static void checkStatus(const HttpResponse& response, const std::string& what,
                            bool accept_redirect = false) {
        if (response.status >= 200 && response.status < 300) {
            return;
        }
        if (accept_redirect && response.status >= 300 && response.status < 400) {
            return;
        }

        std::string message = what + " failed (HTTP " + std::to_string(response.status) + ")";
        if (response.status >= 300 && response.status < 400) {
            message += ": unexpected redirect";
            if (!response.location.empty()) {
                message += " to " + response.location;
            }
        } else {
            std::string detail = trim(response.body);
            if (!detail.empty()) {
                message += ": " + detail.substr(0, 512);
            }
        }

        if (response.status == 401 || response.status == 403) {
            throw SyncException(ErrorCode::SESSION_ERROR, message);
        }
        if (response.status >= 500) {
            throw SyncException(ErrorCode::NETWORK_ERROR, message);
        }
        throw SyncException(ErrorCode::REMOTE_SERVICE_ERROR, message);
    }

    void waitForJob(const std::string& job_url, const std::string& job_id) {
        auto start = std::chrono::steady_clock::now();
        const auto limit = std::chrono::seconds(options_.job_timeout_seconds);

        while (true) {
            auto response = get(job_url + "/phase");
            checkStatus(response, "Reading phase of job " + job_id);
            std::string phase = trim(response.body);

            if (phase == "COMPLETED") {
                return;
            }

            if (phase == "ERROR") {
                auto error = get(job_url + "/error");
                std::string cause = error.status == 200 ? trim(error.body) : "unknown cause";
                throw SyncException(ErrorCode::REMOTE_SERVICE_ERROR,
                                    "Job " + job_id + " failed: " + cause);
            }

            if (phase == "ABORTED") {
                throw SyncException(ErrorCode::REMOTE_SERVICE_ERROR,
                                    "Job " + job_id + " was aborted by the server");
            }

            auto elapsed = std::chrono::steady_clock::now() - start;
            if (elapsed >= limit) {
                throw SyncException(ErrorCode::TIMEOUT,
                                    "Job " + job_id + " did not finish after " +
                                    std::to_string(options_.job_timeout_seconds) +
                                    " s (phase " + phase + ")");
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(options_.poll_interval_ms));
        }
    }

    void removeJob(const std::string& job_id) {
        auto response = post(options_.base_url + "/tap/deletejobs", {{"JOB_IDS", job_id}});
        checkStatus(response, "Removing job " + job_id);
        logger_.debug("Job " + job_id + " successfully removed");
    }
};

// =============================================================================
// TapClient Public Interface
// =============================================================================

TapClient::TapClient(const SchemaDescriptor& schema, TapClientOptions options, Logger& logger)
    : pImpl_(std::make_unique<Impl>(schema, std::move(options), logger)) {}

TapClient::~TapClient() = default;

TapClient::TapClient(TapClient&&) noexcept = default;
TapClient& TapClient::operator=(TapClient&&) noexcept = default;

void TapClient::login(const Credentials& credentials) {
    auto response = pImpl_->post(pImpl_->options_.base_url + "/login",
                                 {{"username", credentials.username},
                                  {"password", credentials.password}});
    if (response.status != 200) {
        throw SyncException(ErrorCode::SESSION_ERROR,
                            "Login rejected for user '" + credentials.username +
                            "' (HTTP " + std::to_string(response.status) + ")");
    }

    std::lock_guard<std::mutex> lock(pImpl_->state_mutex_);
    pImpl_->authenticated_ = true;
    pImpl_->username_ = credentials.username;
}

void TapClient::logout() {
    {
        std::lock_guard<std::mutex> lock(pImpl_->state_mutex_);
        if (!pImpl_->authenticated_) {
            return;
        }
        pImpl_->authenticated_ = false;
    }

    HttpResponse response;
    try {
        response = pImpl_->post(pImpl_->options_.base_url + "/logout", {});
    } catch (const SyncException&) {
        pImpl_->clearCookies();
        throw;
    }
    pImpl_->clearCookies();
    Impl::checkStatus(response, "Logout");
}

bool TapClient::isAuthenticated() const {
    return pImpl_->isAuthenticated();
}

std::string TapClient::uploadTable(const std::string& table_name,
                                   const std::vector<SourceId>& ids) {
    std::string username;
    {
        std::lock_guard<std::mutex> lock(pImpl_->state_mutex_);
        if (!pImpl_->authenticated_) {
            throw SyncException(ErrorCode::SESSION_ERROR,
                                "Uploading table " + table_name + " requires a login");
        }
        username = pImpl_->username_;
    }
    if (!SchemaDescriptor::isSafeIdentifier(table_name) ||
        table_name.find('.') != std::string::npos) {
        throw SyncException(ErrorCode::INVALID_PARAMS, "Invalid table name: " + table_name);
    }

    std::string votable = buildVOTable(table_name, pImpl_->schema_.idColumn(), ids);

    auto response = pImpl_->postFile(pImpl_->options_.base_url + "/Upload",
                                     {{"TABLE_NAME", table_name},
                                      {"TABLE_DESC", "temporary exclusion table"},
                                      {"FORMAT", "votable"}},
                                     table_name + ".xml", "application/x-votable+xml", votable);
    Impl::checkStatus(response, "Uploading table " + table_name);

    pImpl_->logger_.debug("Uploaded table " + table_name + " with " +
                          std::to_string(ids.size()) + " rows");

    return "user_" + username + "." + table_name;
}

void TapClient::deleteTable(const std::string& table_name) {
    auto response = pImpl_->post(pImpl_->options_.base_url + "/Upload",
                                 {{"TABLE_NAME", table_name},
                                  {"DELETE", "TRUE"},
                                  {"FORCE_REMOVAL", "TRUE"}});
    Impl::checkStatus(response, "Deleting table " + table_name);
}

QueryResult TapClient::executeQuery(const std::string& adql) {
    pImpl_->rate_limiter_.waitIfNeeded();

    auto response = pImpl_->post(pImpl_->options_.base_url + "/tap/async",
                                 {{"REQUEST", "doQuery"},
                                  {"LANG", "ADQL"},
                                  {"FORMAT", "csv"},
                                  {"PHASE", "RUN"},
                                  {"QUERY", adql}});
    Impl::checkStatus(response, "Submitting query", true);

    if (response.location.empty()) {
        throw SyncException(ErrorCode::REMOTE_SERVICE_ERROR,
                            "TAP server did not return a job location");
    }

    const std::string job_url = response.location;
    const std::string job_id = jobIdFromUrl(job_url);
    pImpl_->logger_.debug("Launched job " + job_id);

    try {
        pImpl_->waitForJob(job_url, job_id);

        auto result = pImpl_->get(job_url + "/results/result");
        Impl::checkStatus(result, "Fetching results of job " + job_id);

        QueryResult query_result;
        query_result.batch = TapResultParser::parseCSV(result.body, pImpl_->schema_);
        query_result.job_id = job_id;
        return query_result;

    } catch (const SyncException&) {
        if (pImpl_->isAuthenticated()) {
            try {
                pImpl_->removeJob(job_id);
            } catch (const SyncException& cleanup) {
                pImpl_->logger_.error("Error removing job " + job_id +
                                      " from the server. Cause: " + cleanup.what());
            }
        }
        throw;
    }
}

void TapClient::removeJob(const std::string& job_id) {
    if (job_id.empty()) {
        return;
    }
    pImpl_->removeJob(job_id);
}

std::string TapClient::getBaseUrl() const {
    return pImpl_->options_.base_url;
}

std::string TapClient::buildVOTable(const std::string& table_name,
                                    const std::string& column,
                                    const std::vector<SourceId>& ids) {
    std::ostringstream xml;
    xml << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<VOTABLE version=\"1.3\" xmlns=\"http://www.ivoa.net/xml/VOTable/v1.3\">\n"
        << "<RESOURCE type=\"results\">\n"
        << "<TABLE name=\"" << table_name << "\">\n"
        << "<FIELD name=\"" << column << "\" datatype=\"long\"/>\n"
        << "<DATA>\n<TABLEDATA>\n";
    for (SourceId id : ids) {
        xml << "<TR><TD>" << id << "</TD></TR>\n";
    }
    xml << "</TABLEDATA>\n</DATA>\n</TABLE>\n</RESOURCE>\n</VOTABLE>\n";
    return xml.str();
}

} // namespace gaiasync
} // namespace ocl
