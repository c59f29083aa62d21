#include "s3_client.hpp"
#include "../common/config.hpp"
#include "../common/hash_utils.hpp"
#include "../common/log.hpp"
#include "../common/path_utils.hpp"
#include "s3_response.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <mutex>
#include <vector>
#include <curl/curl.h>

namespace {

const std::string META_PREFIX = "x-amz-meta-";

std::string envOrDefault(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? std::string(value) : fallback;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

ErrorCode classifyStatus(long status) {
    if (status == 404) return ErrorCode::NotFound;
    if (status == 429 || status == 500 || status == 502 || status == 503 || status == 504) {
        return ErrorCode::Transient;
    }
    return ErrorCode::Remote;
}

template<typename T>
Result<T> statusError(const std::string& what, long status, const std::string& body) {
    std::string detail = xmlElement(body, "Code");
    std::string message = what + ": HTTP " + std::to_string(status);
    if (!detail.empty()) message += " (" + detail + ")";
    return Result<T>::Error(message, classifyStatus(status));
}

bool isSuccess(long status) {
    return status >= 200 && status < 300;
}

// shared by the curl callbacks of one request
struct TransferState {
    long status = 0;
    std::map<std::string, std::string>* headers = nullptr;
    std::string* body = nullptr;
    ByteSink* sink = nullptr;
    ByteSource* source = nullptr;
    bool callbackFailed = false;
    Result<void> callbackError = Result<void>::Ok();
};

size_t onHeader(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t length = size * nitems;
    std::string line(buffer, length);

    if (line.rfind("HTTP/", 0) == 0) {
        // a new status line (e.g. after "100 Continue") starts a fresh header block
        state->headers->clear();
        size_t space = line.find(' ');
        if (space != std::string::npos) state->status = std::strtol(line.c_str() + space + 1, nullptr, 10);
        return length;
    }
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        (*state->headers)[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return length;
}

size_t onWrite(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    size_t length = size * nmemb;
    if (state->sink != nullptr && isSuccess(state->status)) {
        Result<void> written = state->sink->write(data, length);
        if (!written.success) {
            state->callbackFailed = true;
            state->callbackError = written;
            return 0;   // makes curl abort with CURLE_WRITE_ERROR
        }
        return length;
    }
    state->body->append(data, length);
    return length;
}

size_t onRead(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<TransferState*>(userdata);
    Result<size_t> got = state->source->read(buffer, size * nitems);
    if (!got.success) {
        state->callbackFailed = true;
        state->callbackError = Result<void>::From(got);
        return CURL_READFUNC_ABORT;
    }
    return got.data;
}

std::once_flag g_curlInit;

}

Result<S3Config> S3Config::fromEnvironment() {
    S3Config config;
    config.endpoint = envOrDefault("S3MIRROR_ENDPOINT", "");
    config.accessKey = envOrDefault("S3MIRROR_ACCESS_KEY", "");
    config.secretKey = envOrDefault("S3MIRROR_SECRET_KEY", "");
    config.region = envOrDefault("S3MIRROR_REGION", "us-east-1");
    config.usePathStyle = envOrDefault("S3MIRROR_USE_PATH_STYLE", "false") == "true";

    if (config.accessKey.empty() || config.secretKey.empty()) {
        return Result<S3Config>::Error(
            "missing required environment variables (S3MIRROR_ACCESS_KEY, S3MIRROR_SECRET_KEY)", ErrorCode::Config);
    }
    return Result<S3Config>::Ok(config);
}

S3Client::S3Client(S3Config config, std::string bucket)
    : config_(std::move(config)), bucket_(std::move(bucket)),
      signer_(config_.accessKey, config_.secretKey, config_.region) {
    std::call_once(g_curlInit, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    std::string endpoint = config_.endpoint;
    if (endpoint.empty()) {
        scheme_ = "https";
        endpointHost_ = "s3." + config_.region + ".amazonaws.com";
    } else {
        size_t sep = endpoint.find("://");
        scheme_ = sep == std::string::npos ? "https" : endpoint.substr(0, sep);
        endpointHost_ = sep == std::string::npos ? endpoint : endpoint.substr(sep + 3);
        while (!endpointHost_.empty() && endpointHost_.back() == '/') endpointHost_.pop_back();
    }
}

std::string S3Client::host() const {
    return config_.usePathStyle ? endpointHost_ : bucket_ + "." + endpointHost_;
}

std::string S3Client::canonicalPath(const std::string& key) const {
    std::string encodedKey = PathUtils::uriEncode(key, false);
    if (config_.usePathStyle) return "/" + bucket_ + "/" + encodedKey;
    return "/" + encodedKey;
}

Result<S3Client::HttpResponse> S3Client::perform(HttpRequest& request) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return Result<HttpResponse>::Error("failed to create curl handle", ErrorCode::Io);
    }

    std::string amzDate = RequestSigner::amzDate(std::time(nullptr));
    request.headers["host"] = host();
    request.headers["x-amz-date"] = amzDate;
    request.headers["x-amz-content-sha256"] = request.payloadHash;

    SigningInput signing{request.method, canonicalPath(request.key), request.query, request.headers,
                         request.payloadHash};
    std::string authorization = signer_.authorization(signing, amzDate);

    std::string url = scheme_ + "://" + host() + canonicalPath(request.key);
    std::string query = RequestSigner::canonicalQuery(request.query);
    if (!query.empty()) url += "?" + query;

    struct curl_slist* rawHeaders = nullptr;
    for (const auto& header : request.headers) {
        if (header.first == "host") continue;   // curl derives it from the URL
        rawHeaders = curl_slist_append(rawHeaders, (header.first + ": " + header.second).c_str());
    }
    rawHeaders = curl_slist_append(rawHeaders, ("Authorization: " + authorization).c_str());
    rawHeaders = curl_slist_append(rawHeaders, "Expect:");
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList(rawHeaders, &curl_slist_free_all);

    HttpResponse response;
    TransferState state;
    state.headers = &response.headers;
    state.body = &response.body;
    state.sink = request.sink;
    state.source = request.body;

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &state);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, onWrite);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, 30L);
    if (config_.timeoutSeconds > 0) {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT, config_.timeoutSeconds);
    }

    if (request.method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else if (request.method == "PUT") {
        curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(handle, CURLOPT_READFUNCTION, onRead);
        curl_easy_setopt(handle, CURLOPT_READDATA, &state);
        curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(request.bodySize));
    } else if (request.method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        const std::string empty;
        const std::string& text = request.text != nullptr ? *request.text : empty;
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(text.size()));
        curl_easy_setopt(handle, CURLOPT_COPYPOSTFIELDS, text.c_str());
    } else if (request.method == "DELETE") {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "DELETE");
    }

    CURLcode rc = curl_easy_perform(handle);
    if (state.callbackFailed) {
        return Result<HttpResponse>::From(state.callbackError);
    }
    if (rc != CURLE_OK) {
        return Result<HttpResponse>::Error(std::string("network error: ") + curl_easy_strerror(rc),
                                           ErrorCode::Transient);
    }
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    return Result<HttpResponse>::Ok(response);
}

Result<ListPage> S3Client::listPage(const std::string& prefix, const std::string& continuationToken) {
    HttpRequest request;
    request.query["list-type"] = "2";
    request.query["encoding-type"] = "url";
    if (!prefix.empty()) request.query["prefix"] = prefix;
    if (!continuationToken.empty()) request.query["continuation-token"] = continuationToken;

    Result<HttpResponse> response = perform(request);
    if (!response.success) return Result<ListPage>::From(response, "list objects");
    if (!isSuccess(response.data.status)) {
        return statusError<ListPage>("list objects", response.data.status, response.data.body);
    }

    return parseListObjects(response.data.body);
}

Result<ObjectHead> S3Client::head(const std::string& key) {
    HttpRequest request;
    request.method = "HEAD";
    request.key = key;

    Result<HttpResponse> response = perform(request);
    if (!response.success) return Result<ObjectHead>::From(response, "head " + key);

    ObjectHead head;
    if (response.data.status == 404) {
        return Result<ObjectHead>::Ok(head);
    }
    if (!isSuccess(response.data.status)) {
        return statusError<ObjectHead>("head " + key, response.data.status, response.data.body);
    }

    head.exists = true;
    for (const auto& header : response.data.headers) {
        if (header.first == "etag") head.etag = stripQuotes(header.second);
        else if (header.first == "content-length") head.size = std::strtoull(header.second.c_str(), nullptr, 10);
        else if (header.first == "last-modified") head.modTime = parseHttpDate(header.second);
        else if (header.first.rfind(META_PREFIX, 0) == 0) {
            head.metadata[header.first.substr(META_PREFIX.size())] = header.second;
        }
    }
    return Result<ObjectHead>::Ok(head);
}

Result<void> S3Client::get(const std::string& key, ByteSink& sink) {
    HttpRequest request;
    request.key = key;
    request.sink = &sink;

    Result<HttpResponse> response = perform(request);
    if (!response.success) return Result<void>::From(response, "get " + key);
    if (!isSuccess(response.data.status)) {
        return statusError<void>("get " + key, response.data.status, response.data.body);
    }
    return Result<void>::Ok();
}

Result<void> S3Client::put(const std::string& key, ByteSource& body, uint64_t size, const ObjectMetadata& metadata) {
    if (size > Config::MULTIPART_THRESHOLD) {
        return putMultipart(key, body, size, metadata);
    }
    return putSingle(key, body, size, metadata);
}

Result<void> S3Client::putSingle(const std::string& key, ByteSource& body, uint64_t size, const ObjectMetadata& metadata) {
    HttpRequest request;
    request.method = "PUT";
    request.key = key;
    request.body = &body;
    request.bodySize = size;
    request.payloadHash = "UNSIGNED-PAYLOAD";
    for (const auto& entry : metadata) {
        request.headers[META_PREFIX + lower(entry.first)] = entry.second;
    }

    Result<HttpResponse> response = perform(request);
    if (!response.success) return Result<void>::From(response, "put " + key);
    if (!isSuccess(response.data.status)) {
        return statusError<void>("put " + key, response.data.status, response.data.body);
    }
    return Result<void>::Ok();
}

Result<void> S3Client::putMultipart(const std::string& key, ByteSource& body, uint64_t size,
                                    const ObjectMetadata& metadata) {
    HttpRequest create;
    create.method = "POST";
    create.key = key;
    create.query["uploads"] = "";
    for (const auto& entry : metadata) {
        create.headers[META_PREFIX + lower(entry.first)] = entry.second;
    }

    Result<HttpResponse> created = perform(create);
    if (!created.success) return Result<void>::From(created, "create multipart upload " + key);
    if (!isSuccess(created.data.status)) {
        return statusError<void>("create multipart upload " + key, created.data.status, created.data.body);
    }
    std::string uploadId = xmlElement(created.data.body, "UploadId");
    if (uploadId.empty()) {
        return Result<void>::Error("create multipart upload " + key + ": no upload id", ErrorCode::Remote);
    }

    // parts are staged invisibly; only a successful complete publishes the object
    std::vector<std::string> etags;
    uint64_t sent = 0;
    std::string part(Config::MULTIPART_PART_SIZE, '\0');
    while (sent < size) {
        Result<size_t> got = readFull(body, &part[0], part.size());
        if (!got.success) {
            abortMultipart(key, uploadId);
            return Result<void>::From(got, "read body for " + key);
        }
        if (got.data == 0) break;

        std::string chunk = part.substr(0, got.data);
        BufferSource partBody(chunk);
        HttpRequest upload;
        upload.method = "PUT";
        upload.key = key;
        upload.query["partNumber"] = std::to_string(etags.size() + 1);
        upload.query["uploadId"] = uploadId;
        upload.body = &partBody;
        upload.bodySize = chunk.size();
        upload.payloadHash = HashUtils::sha256Hex(chunk);

        Result<HttpResponse> uploaded = perform(upload);
        if (!uploaded.success || !isSuccess(uploaded.data.status)) {
            abortMultipart(key, uploadId);
            if (!uploaded.success) return Result<void>::From(uploaded, "upload part of " + key);
            return statusError<void>("upload part of " + key, uploaded.data.status, uploaded.data.body);
        }
        etags.push_back(uploaded.data.headers["etag"]);
        sent += got.data;
    }

    if (sent != size) {
        abortMultipart(key, uploadId);
        return Result<void>::Error("body of " + key + " ended after " + std::to_string(sent) +
                                   " of " + std::to_string(size) + " bytes", ErrorCode::Io);
    }

    std::string manifest = "<CompleteMultipartUpload>";
    for (size_t i = 0; i < etags.size(); ++i) {
        manifest += "<Part><PartNumber>" + std::to_string(i + 1) + "</PartNumber><ETag>" + etags[i] + "</ETag></Part>";
    }
    manifest += "</CompleteMultipartUpload>";

    HttpRequest complete;
    complete.method = "POST";
    complete.key = key;
    complete.query["uploadId"] = uploadId;
    complete.text = &manifest;
    complete.payloadHash = HashUtils::sha256Hex(manifest);

    Result<HttpResponse> completed = perform(complete);
    if (!completed.success) {
        abortMultipart(key, uploadId);
        return Result<void>::From(completed, "complete multipart upload " + key);
    }
    // S3 may answer 200 and still report the failure in the body
    if (!isSuccess(completed.data.status) || completed.data.body.find("<Error>") != std::string::npos) {
        abortMultipart(key, uploadId);
        long status = isSuccess(completed.data.status) ? 500 : completed.data.status;
        return statusError<void>("complete multipart upload " + key, status, completed.data.body);
    }
    return Result<void>::Ok();
}

void S3Client::abortMultipart(const std::string& key, const std::string& uploadId) {
    HttpRequest abort;
    abort.method = "DELETE";
    abort.key = key;
    abort.query["uploadId"] = uploadId;
    Result<HttpResponse> aborted = perform(abort);
    if (!aborted.success || !isSuccess(aborted.data.status)) {
        Log::warn("S3", "failed to abort multipart upload of " + key + " (" + uploadId + ")");
    }
}

Result<void> S3Client::remove(const std::string& key) {
    HttpRequest request;
    request.method = "DELETE";
    request.key = key;

    Result<HttpResponse> response = perform(request);
    if (!response.success) return Result<void>::From(response, "delete " + key);
    // already gone counts as deleted
    if (!isSuccess(response.data.status) && response.data.status != 404) {
        return statusError<void>("delete " + key, response.data.status, response.data.body);
    }
    return Result<void>::Ok();
}
