#include "sloup/storage/swift_client.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <map>
#include <memory>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fcntl.h>
#include <json/json.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "sloup/storage/manifest_json.hpp"

namespace sloup::storage {

using namespace sloup::core;

namespace {

constexpr const char* kUserAgent = "sloup/0.1";
constexpr long kConnectTimeoutSec = 30;
constexpr long kLowSpeedLimit = 1;     // bytes/s
constexpr long kLowSpeedTimeSec = 120; // stalled transfers give up after this

enum class Method { Get, Head, Put, Post };

const char* method_name(Method m) {
    switch (m) {
        case Method::Get: return "GET";
        case Method::Head: return "HEAD";
        case Method::Put: return "PUT";
        case Method::Post: return "POST";
    }
    return "?";
}

// Request body: either a string in memory or an open descriptor.
struct RequestBody {
    const std::string* data{nullptr};
    int fd{-1};
    u64 offset{0};
};

struct HttpRequest {
    Method method{Method::Get};
    std::string url;
    std::vector<std::string> headers;
    RequestBody* body{nullptr};
    u64 body_size{0};
};

struct HttpResponse {
    long code{0};
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;
};

class FdGuard {
public:
    explicit FdGuard(int fd) noexcept : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) ::close(fd_);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

private:
    int fd_;
};

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

size_t read_body(char* buf, size_t size, size_t nitems, void* userdata) {
    auto* body = static_cast<RequestBody*>(userdata);
    const size_t want = size * nitems;
    if (body->data != nullptr) {
        const u64 left = body->data->size() - body->offset;
        const size_t n = static_cast<size_t>(std::min<u64>(want, left));
        std::memcpy(buf, body->data->data() + body->offset, n);
        body->offset += n;
        return n;
    }
    if (body->fd < 0) {
        return 0;
    }
    for (;;) {
        const ssize_t n = ::read(body->fd, buf, want);
        if (n >= 0) {
            body->offset += static_cast<u64>(n);
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) continue;
        return CURL_READFUNC_ABORT;
    }
}

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t collect_header(char* buf, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    const size_t len = size * nitems;
    const std::string line(buf, len);
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        (*headers)[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return len;
}

template <typename T>
void set_opt(CURL* curl, CURLoption opt, T value, CURLcode* rc) {
    if (*rc == CURLE_OK) {
        *rc = curl_easy_setopt(curl, opt, value);
    }
}

[[nodiscard]] Status transport_error(CURLcode rc) noexcept {
    return make_status(StatusDomain::Swift, StatusCode::Network, static_cast<u32>(rc));
}

Status perform(const HttpRequest& req, HttpResponse* resp) noexcept {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return make_status(StatusDomain::Swift, StatusCode::Unavailable);
    }

    curl_slist* list = nullptr;
    for (const auto& h : req.headers) {
        curl_slist* next = curl_slist_append(list, h.c_str());
        if (next == nullptr) {
            curl_slist_free_all(list);
            return make_status(StatusDomain::Swift, StatusCode::Unknown);
        }
        list = next;
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(list, &curl_slist_free_all);

    CURLcode rc = CURLE_OK;
    CURL* h = curl.get();
    set_opt(h, CURLOPT_URL, req.url.c_str(), &rc);
    set_opt(h, CURLOPT_NOSIGNAL, 1L, &rc);
    set_opt(h, CURLOPT_USERAGENT, kUserAgent, &rc);
    set_opt(h, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSec, &rc);
    set_opt(h, CURLOPT_LOW_SPEED_LIMIT, kLowSpeedLimit, &rc);
    set_opt(h, CURLOPT_LOW_SPEED_TIME, kLowSpeedTimeSec, &rc);
    set_opt(h, CURLOPT_HTTPHEADER, headers.get(), &rc);
    set_opt(h, CURLOPT_HEADERFUNCTION, &collect_header, &rc);
    set_opt(h, CURLOPT_HEADERDATA, &resp->headers, &rc);
    set_opt(h, CURLOPT_WRITEFUNCTION, &collect_body, &rc);
    set_opt(h, CURLOPT_WRITEDATA, &resp->body, &rc);

    switch (req.method) {
        case Method::Get:
            set_opt(h, CURLOPT_HTTPGET, 1L, &rc);
            break;
        case Method::Head:
            set_opt(h, CURLOPT_NOBODY, 1L, &rc);
            break;
        case Method::Put:
            set_opt(h, CURLOPT_UPLOAD, 1L, &rc);
            set_opt(h, CURLOPT_READFUNCTION, &read_body, &rc);
            set_opt(h, CURLOPT_READDATA, req.body, &rc);
            set_opt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(req.body_size), &rc);
            break;
        case Method::Post:
            set_opt(h, CURLOPT_POST, 1L, &rc);
            set_opt(h, CURLOPT_READFUNCTION, &read_body, &rc);
            set_opt(h, CURLOPT_READDATA, req.body, &rc);
            set_opt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_size), &rc);
            break;
    }
    if (rc != CURLE_OK) {
        spdlog::error("curl setup for {} {} failed: {}", method_name(req.method), req.url, curl_easy_strerror(rc));
        return transport_error(rc);
    }

    rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        spdlog::warn("{} {} failed: {}", method_name(req.method), req.url, curl_easy_strerror(rc));
        return transport_error(rc);
    }

    rc = curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &resp->code);
    if (rc != CURLE_OK) {
        return transport_error(rc);
    }
    spdlog::debug("{} {} -> {}", method_name(req.method), req.url, resp->code);
    return ok_status();
}

std::string header_or_empty(const HttpResponse& resp, const char* name) {
    const auto it = resp.headers.find(name);
    return it == resp.headers.end() ? std::string() : it->second;
}

std::string strip_quotes(std::string s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace

// ========================================================================
// Helpers
// ========================================================================

Status swift_global_init() noexcept {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        return transport_error(rc);
    }
    return ok_status();
}

void swift_global_cleanup() noexcept {
    curl_global_cleanup();
}

Status http_status_to_status(long http_code) noexcept {
    const u32 aux = http_code > 0 ? static_cast<u32>(http_code) : 0;
    if (http_code >= 200 && http_code < 300) {
        return ok_status();
    }
    if (http_code == 401 || http_code == 403) {
        return make_status(StatusDomain::Swift, StatusCode::PermissionDenied, aux);
    }
    if (http_code == 404) {
        return make_status(StatusDomain::Swift, StatusCode::NotFound, aux);
    }
    if (http_code == 422) {
        return make_status(StatusDomain::Swift, StatusCode::Corrupt, aux);
    }
    if (http_code == 408 || http_code == 429 || (http_code >= 500 && http_code < 600)) {
        return make_status(StatusDomain::Swift, StatusCode::Unavailable, aux);
    }
    return make_status(StatusDomain::Swift, StatusCode::Invalid, aux);
}

std::string escape_path_component(const std::string& s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out += ch;
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string escape_object_path(const std::string& path) {
    std::string out;
    size_t start = 0;
    for (;;) {
        const size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            out += escape_path_component(path.substr(start));
            return out;
        }
        out += escape_path_component(path.substr(start, slash - start));
        out += '/';
        start = slash + 1;
    }
}

std::string swift_object_url(const std::string& storage_url, const std::string& container,
                             const std::string& object_path) {
    std::string url = storage_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += '/';
    url += escape_path_component(container);
    if (!object_path.empty()) {
        url += '/';
        url += escape_object_path(object_path);
    }
    return url;
}

Status authenticate_v1(const std::string& auth_url, const std::string& user, const std::string& key,
                       SwiftCredentials* out) noexcept {
    if (out == nullptr || auth_url.empty()) {
        return make_status(StatusDomain::Swift, StatusCode::Invalid);
    }

    HttpRequest req;
    req.method = Method::Get;
    req.url = auth_url;
    req.headers = {"X-Auth-User: " + user, "X-Auth-Key: " + key};

    HttpResponse resp;
    Status s = perform(req, &resp);
    if (!is_ok(s)) return s;
    s = http_status_to_status(resp.code);
    if (!is_ok(s)) {
        spdlog::error("authentication at {} rejected with HTTP {}", auth_url, resp.code);
        return s;
    }

    SwiftCredentials creds;
    creds.storage_url = header_or_empty(resp, "x-storage-url");
    creds.auth_token = header_or_empty(resp, "x-auth-token");
    if (creds.storage_url.empty() || creds.auth_token.empty()) {
        spdlog::error("authentication at {} returned no storage URL or token", auth_url);
        return make_status(StatusDomain::Swift, StatusCode::Corrupt, static_cast<u32>(resp.code));
    }
    *out = std::move(creds);
    return ok_status();
}

std::string keystone_v2_request_body(const std::string& tenant, const std::string& user,
                                     const std::string& password) {
    Json::Value root(Json::objectValue);
    Json::Value& auth = root["auth"];
    auth["tenantName"] = tenant;
    auth["passwordCredentials"]["username"] = user;
    auth["passwordCredentials"]["password"] = password;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

Status parse_keystone_v2_response(const std::string& body, SwiftCredentials* out) noexcept {
    if (out == nullptr) {
        return make_status(StatusDomain::Swift, StatusCode::Invalid);
    }

    Json::CharReaderBuilder builder;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors) || !root.isObject()) {
        spdlog::error("keystone response is not JSON: {}", errors);
        return make_status(StatusDomain::Swift, StatusCode::Corrupt);
    }

    const Json::Value& access = root["access"];
    if (!access.isObject() || !access["token"].isObject() || !access["token"]["id"].isString()) {
        return make_status(StatusDomain::Swift, StatusCode::Corrupt);
    }

    const Json::Value& catalog = access["serviceCatalog"];
    if (!catalog.isArray()) {
        return make_status(StatusDomain::Swift, StatusCode::Corrupt);
    }
    for (const Json::Value& service : catalog) {
        if (!service.isObject() || !service["type"].isString() || service["type"].asString() != "object-store") {
            continue;
        }
        const Json::Value& endpoints = service["endpoints"];
        if (!endpoints.isArray()) {
            continue;
        }
        for (const Json::Value& ep : endpoints) {
            if (ep.isObject() && ep["publicURL"].isString() && !ep["publicURL"].asString().empty()) {
                SwiftCredentials creds;
                creds.storage_url = ep["publicURL"].asString();
                creds.auth_token = access["token"]["id"].asString();
                *out = std::move(creds);
                return ok_status();
            }
        }
    }
    return make_status(StatusDomain::Swift, StatusCode::NotFound);
}

Status authenticate_v2(const std::string& auth_url, const std::string& tenant, const std::string& user,
                       const std::string& password, SwiftCredentials* out) noexcept {
    if (out == nullptr || auth_url.empty()) {
        return make_status(StatusDomain::Swift, StatusCode::Invalid);
    }

    std::string url = auth_url;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/tokens";

    const std::string json = keystone_v2_request_body(tenant, user, password);
    RequestBody body;
    body.data = &json;

    HttpRequest req;
    req.method = Method::Post;
    req.url = url;
    req.headers = {"Content-Type: application/json", "Accept: application/json"};
    req.body = &body;
    req.body_size = json.size();

    HttpResponse resp;
    Status s = perform(req, &resp);
    if (!is_ok(s)) return s;
    s = http_status_to_status(resp.code);
    if (!is_ok(s)) {
        spdlog::error("keystone authentication at {} rejected with HTTP {}", url, resp.code);
        return s;
    }

    s = parse_keystone_v2_response(resp.body, out);
    if (s.code == StatusCode::NotFound) {
        spdlog::error("keystone at {} lists no object-store endpoint", url);
    }
    return s;
}

// ========================================================================
// Client
// ========================================================================

SwiftClient::SwiftClient(SwiftCredentials creds) : creds_(std::move(creds)) {}

Status SwiftClient::head_account() noexcept {
    HttpRequest req;
    req.method = Method::Head;
    req.url = creds_.storage_url;
    req.headers = {"X-Auth-Token: " + creds_.auth_token};

    HttpResponse resp;
    const Status s = perform(req, &resp);
    if (!is_ok(s)) return s;
    return http_status_to_status(resp.code);
}

Status SwiftClient::head_container(const std::string& name, bool* exists) noexcept {
    if (exists == nullptr || name.empty()) {
        return make_status(StatusDomain::Swift, StatusCode::Invalid);
    }

    HttpRequest req;
    req.method = Method::Head;
    req.url = swift_object_url(creds_.storage_url, name);
    req.headers = {"X-Auth-Token: " + creds_.auth_token};

    HttpResponse resp;
    Status s = perform(req, &resp);
    if (!is_ok(s)) return s;
    if (resp.code == 404) {
        *exists = false;
        return ok_status();
    }
    s = http_status_to_status(resp.code);
    if (!is_ok(s)) return s;
    *exists = true;
    return ok_status();
}

Status SwiftClient::create_container(const std::string& name) noexcept {
    if (name.empty()) {
        return make_status(StatusDomain::Swift, StatusCode::Invalid);
    }

    const std::string empty;
    RequestBody body;
    body.data = &empty;

    HttpRequest req;
    req.method = Method::Put;
    req.url = swift_object_url(creds_.storage_url, name);
    req.headers = {"X-Auth-Token: " + creds_.auth_token};
    req.body = &body;
    req.body_size = 0;

    HttpResponse resp;
    Status s = perform(req, &resp);
    if (!is_ok(s)) return s;
    s = http_status_to_status(resp.code);
    if (!is_ok(s)) {
        spdlog::error("creating container {} failed with HTTP {}", name, resp.code);
    }
    return s;
}

Status SwiftClient::put_object(const PutObjectRequest& req, PutObjectResult* result) noexcept {
    if (result == nullptr || req.container.empty() || req.object_path.empty()) {
        return make_status(StatusDomain::Swift, StatusCode::Invalid);
    }

    const int fd = ::open(req.local_path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return make_status(StatusDomain::Fs, err == ENOENT ? StatusCode::NotFound : StatusCode::Io,
                           static_cast<u32>(err));
    }
    FdGuard guard(fd);

    RequestBody body;
    body.fd = fd;

    HttpRequest http;
    http.method = Method::Put;
    http.url = swift_object_url(creds_.storage_url, req.container, req.object_path);
    http.headers = {"X-Auth-Token: " + creds_.auth_token, "Content-Type: application/octet-stream"};
    if (!req.md5_hex.empty()) {
        http.headers.push_back("ETag: " + req.md5_hex);
    }
    http.body = &body;
    http.body_size = req.size_bytes;

    HttpResponse resp;
    Status s = perform(http, &resp);
    if (!is_ok(s)) return s;
    s = http_status_to_status(resp.code);
    if (!is_ok(s)) return s;

    result->size_bytes = req.size_bytes;
    result->etag = strip_quotes(header_or_empty(resp, "etag"));
    return ok_status();
}

Status SwiftClient::put_manifest(const std::string& container, const std::string& object_name,
                                 const Manifest& entries) noexcept {
    if (container.empty() || object_name.empty()) {
        return make_status(StatusDomain::Swift, StatusCode::Invalid);
    }

    const std::string json = manifest_to_json(entries);
    RequestBody body;
    body.data = &json;

    HttpRequest req;
    req.method = Method::Put;
    req.url = swift_object_url(creds_.storage_url, container, object_name) + "?multipart-manifest=put";
    req.headers = {"X-Auth-Token: " + creds_.auth_token, "Content-Type: application/json"};
    req.body = &body;
    req.body_size = json.size();

    HttpResponse resp;
    Status s = perform(req, &resp);
    if (!is_ok(s)) return s;
    s = http_status_to_status(resp.code);
    if (!is_ok(s)) {
        spdlog::error("manifest {}/{} rejected with HTTP {}: {}", container, object_name, resp.code, resp.body);
    }
    return s;
}

} // namespace sloup::storage
