#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "runcatalog/BlockArray.hpp"

namespace runcatalog {

// Where a catalog server lives and how to talk to it.
struct HttpEndpoint {
    std::string host = "127.0.0.1";
    int port = 8080;
    std::string identity;   // sent as X-Identity when not empty
    bool compress = false;  // ask for zstd block payloads
    int timeoutSeconds = 10;
};

// Reads blocks of one field array from the block-fetch endpoint. Every fetch
// opens its own client, so concurrent fetches share nothing.
class HttpBlockSource final : public BlockSource {
public:
    // `path` is "<run uid>/<stream>/<field>".
    HttpBlockSource(HttpEndpoint endpoint, std::string path);

    std::string key() const override;

    std::vector<std::uint8_t> fetchBlock(const BlockIndex& block, DType dtype, const Shape& blockShape) const override;

    // Structure metadata of `path`, without fetching any block. Throws
    // NotFound for an unknown path and BlockFetchFailure for transport errors.
    static ArrayStructure fetchStructure(const HttpEndpoint& endpoint, const std::string& path);

private:
    HttpEndpoint endpoint_;
    std::string path_;
};

// Remote array for `path` backed by an HttpBlockSource.
RemoteBlockArray openRemoteArray(const HttpEndpoint& endpoint,
                                 const std::string& path,
                                 std::size_t maxParallel = RemoteBlockArray::kDefaultParallelism);

} // namespace runcatalog
