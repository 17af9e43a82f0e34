#include "runcatalog/HttpBlockSource.hpp"

#include <memory>
#include <nlohmann/json.hpp>

#include "httplib.h"
#include "runcatalog/Compression.hpp"
#include "runcatalog/Errors.hpp"

using json = nlohmann::json;

namespace runcatalog {

namespace {

httplib::Headers requestHeaders(const HttpEndpoint& endpoint) {
    httplib::Headers headers;
    if (!endpoint.identity.empty()) {
        headers.emplace("X-Identity", endpoint.identity);
    }
    return headers;
}

std::unique_ptr<httplib::Client> openClient(const HttpEndpoint& endpoint) {
    auto client = std::make_unique<httplib::Client>(endpoint.host, endpoint.port);
    client->set_connection_timeout(endpoint.timeoutSeconds, 0);
    client->set_read_timeout(endpoint.timeoutSeconds, 0);
    return client;
}

// Message from the {"status":"error","error":{...}} envelope, or the raw body.
std::string errorMessage(const httplib::Response& res) {
    try {
        auto j = json::parse(res.body);
        if (j.contains("error") && j["error"].contains("message")) {
            return j["error"]["message"].get<std::string>();
        }
    } catch (const json::exception&) {
    }
    return res.body;
}

} // namespace

HttpBlockSource::HttpBlockSource(HttpEndpoint endpoint, std::string path)
    : endpoint_(std::move(endpoint)), path_(std::move(path)) {
    if (path_.empty()) {
        throw ConfigurationError("HttpBlockSource needs a dataset path");
    }
}

std::string HttpBlockSource::key() const {
    return "http://" + endpoint_.host + ":" + std::to_string(endpoint_.port) + "/" + path_;
}

std::vector<std::uint8_t> HttpBlockSource::fetchBlock(const BlockIndex& block, DType dtype, const Shape& blockShape) const {
    std::string target = "/v1/array/block/" + path_ + "?block=";
    for (std::size_t i = 0; i < block.size(); ++i) {
        if (i) target += ",";
        target += std::to_string(block[i]);
    }
    if (endpoint_.compress && zstdAvailable()) {
        target += "&encoding=zstd";
    }

    auto client = openClient(endpoint_);
    auto res = client->Get(target, requestHeaders(endpoint_));
    if (!res) {
        throw BlockFetchFailure("GET " + target + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw BlockFetchFailure("GET " + target + " returned " + std::to_string(res->status) + ": " + errorMessage(*res));
    }

    const auto encoding = parseBlockEncoding(res->get_header_value("X-Block-Encoding"));
    std::string payload;
    if (!maybeDecompress(res->body, encoding, payload)) {
        throw BlockFetchFailure("GET " + target + ": cannot decode " + blockEncodingName(encoding) + " payload");
    }

    const std::size_t expected = elementCount(blockShape) * itemSize(dtype);
    if (payload.size() != expected) {
        throw BlockFetchFailure("GET " + target + " returned " + std::to_string(payload.size()) +
                                " bytes, expected " + std::to_string(expected));
    }
    return std::vector<std::uint8_t>(payload.begin(), payload.end());
}

ArrayStructure HttpBlockSource::fetchStructure(const HttpEndpoint& endpoint, const std::string& path) {
    const std::string target = "/v1/metadata/" + path;
    auto client = openClient(endpoint);
    auto res = client->Get(target, requestHeaders(endpoint));
    if (!res) {
        throw BlockFetchFailure("GET " + target + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status == 404) {
        throw NotFound(path);
    }
    if (res->status != 200) {
        throw BlockFetchFailure("GET " + target + " returned " + std::to_string(res->status) + ": " + errorMessage(*res));
    }

    json body;
    try {
        body = json::parse(res->body);
    } catch (const json::exception& e) {
        throw MalformedDocument("structure of " + path + ": " + e.what());
    }
    if (!body.contains("data") || !body["data"].contains("structure")) {
        throw MalformedDocument("structure of " + path + ": response has no data.structure");
    }
    return ArrayStructure::fromJson(body["data"]["structure"]);
}

RemoteBlockArray openRemoteArray(const HttpEndpoint& endpoint, const std::string& path, std::size_t maxParallel) {
    auto structure = HttpBlockSource::fetchStructure(endpoint, path);
    auto source = std::make_shared<const HttpBlockSource>(endpoint, path);
    return RemoteBlockArray(std::move(structure), std::move(source), maxParallel);
}

} // namespace runcatalog
