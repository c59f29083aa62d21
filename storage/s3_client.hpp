#pragma once
#include "object_store.hpp"
#include "request_signer.hpp"
#include <map>
#include <string>

struct S3Config {
    std::string endpoint;               // "http://host:9000" for S3-compatible stores; empty for AWS
    std::string region = "us-east-1";
    std::string accessKey;
    std::string secretKey;
    bool usePathStyle = false;
    long timeoutSeconds = 0;            // per request, 0 for none

    // S3MIRROR_ENDPOINT, S3MIRROR_ACCESS_KEY, S3MIRROR_SECRET_KEY,
    // S3MIRROR_REGION, S3MIRROR_USE_PATH_STYLE
    static Result<S3Config> fromEnvironment();
};

// S3 REST client for one bucket over libcurl. Each call uses its own curl
// handle, so one instance serves every worker thread.
class S3Client : public ObjectStore {
public:
    S3Client(S3Config config, std::string bucket);

    Result<ListPage> listPage(const std::string& prefix, const std::string& continuationToken) override;
    Result<ObjectHead> head(const std::string& key) override;
    Result<void> get(const std::string& key, ByteSink& sink) override;
    Result<void> put(const std::string& key, ByteSource& body, uint64_t size,
                     const ObjectMetadata& metadata) override;
    Result<void> remove(const std::string& key) override;

    const std::string& bucket() const { return bucket_; }

private:
    struct HttpRequest {
        std::string method = "GET";
        std::string key;
        std::map<std::string, std::string> query;
        std::map<std::string, std::string> headers;
        std::string payloadHash = RequestSigner::EMPTY_PAYLOAD_HASH;
        ByteSource* body = nullptr;        // PUT body
        uint64_t bodySize = 0;
        const std::string* text = nullptr; // POST body
        ByteSink* sink = nullptr;          // GET body, written only for 2xx responses
    };

    struct HttpResponse {
        long status = 0;
        std::map<std::string, std::string> headers;   // lower-case names
        std::string body;
    };

    Result<HttpResponse> perform(HttpRequest& request);

    Result<void> putSingle(const std::string& key, ByteSource& body, uint64_t size, const ObjectMetadata& metadata);
    Result<void> putMultipart(const std::string& key, ByteSource& body, uint64_t size, const ObjectMetadata& metadata);
    void abortMultipart(const std::string& key, const std::string& uploadId);

    std::string host() const;
    std::string canonicalPath(const std::string& key) const;

    S3Config config_;
    std::string bucket_;
    std::string scheme_;
    std::string endpointHost_;
    RequestSigner signer_;
};
