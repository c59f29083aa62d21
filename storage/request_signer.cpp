#include "request_signer.hpp"
#include "../common/hash_utils.hpp"
#include "../common/path_utils.hpp"
#include <algorithm>
#include <utility>
#include <vector>

const char* RequestSigner::EMPTY_PAYLOAD_HASH =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

namespace {
std::string trimValue(const std::string& value) {
    size_t start = value.find_first_not_of(' ');
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(' ');
    return value.substr(start, end - start + 1);
}
}

RequestSigner::RequestSigner(std::string accessKey, std::string secretKey, std::string region, std::string service)
    : accessKey_(std::move(accessKey)), secretKey_(std::move(secretKey)),
      region_(std::move(region)), service_(std::move(service)) {}

std::string RequestSigner::amzDate(std::time_t when) {
    std::tm utc{};
    gmtime_r(&when, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
    return buffer;
}

std::string RequestSigner::canonicalQuery(const std::map<std::string, std::string>& query) {
    std::vector<std::pair<std::string, std::string>> encoded;
    for (const auto& entry : query) {
        encoded.emplace_back(PathUtils::uriEncode(entry.first, true), PathUtils::uriEncode(entry.second, true));
    }
    std::sort(encoded.begin(), encoded.end());

    std::string out;
    for (const auto& entry : encoded) {
        if (!out.empty()) out += '&';
        out += entry.first + "=" + entry.second;
    }
    return out;
}

std::string RequestSigner::signedHeaders(const SigningInput& input) const {
    std::string out;
    for (const auto& header : input.headers) {
        if (!out.empty()) out += ';';
        out += header.first;
    }
    return out;
}

std::string RequestSigner::canonicalRequest(const SigningInput& input) const {
    std::string headers;
    for (const auto& header : input.headers) {
        headers += header.first + ":" + trimValue(header.second) + "\n";
    }
    return input.method + "\n" +
           input.canonicalUri + "\n" +
           canonicalQuery(input.query) + "\n" +
           headers + "\n" +
           signedHeaders(input) + "\n" +
           input.payloadHash;
}

std::string RequestSigner::scope(const std::string& amzDate) const {
    return amzDate.substr(0, 8) + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::string RequestSigner::stringToSign(const std::string& canonicalRequest, const std::string& amzDate) const {
    return "AWS4-HMAC-SHA256\n" + amzDate + "\n" + scope(amzDate) + "\n" + HashUtils::sha256Hex(canonicalRequest);
}

std::string RequestSigner::authorization(const SigningInput& input, const std::string& amzDate) const {
    std::string dateKey = HashUtils::hmacSha256("AWS4" + secretKey_, amzDate.substr(0, 8));
    std::string regionKey = HashUtils::hmacSha256(dateKey, region_);
    std::string serviceKey = HashUtils::hmacSha256(regionKey, service_);
    std::string signingKey = HashUtils::hmacSha256(serviceKey, "aws4_request");

    std::string toSign = stringToSign(canonicalRequest(input), amzDate);
    std::string mac = HashUtils::hmacSha256(signingKey, toSign);
    std::string signature = HashUtils::toHex(reinterpret_cast<const unsigned char*>(mac.data()), mac.size());

    return "AWS4-HMAC-SHA256 Credential=" + accessKey_ + "/" + scope(amzDate) +
           ", SignedHeaders=" + signedHeaders(input) +
           ", Signature=" + signature;
}
