#include "CatalogHttpServer.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <thread>

#include "runcatalog/Compression.hpp"
#include "runcatalog/Errors.hpp"

using json = nlohmann::json;
using runcatalog::Catalog;
using runcatalog::Identity;

namespace {

int statusFor(const std::exception& e) {
    if (dynamic_cast<const runcatalog::NotFound*>(&e)) return 404;
    if (dynamic_cast<const runcatalog::AlreadyAuthenticated*>(&e)) return 403;
    if (dynamic_cast<const runcatalog::BlockFetchFailure*>(&e)) return 502;
    if (dynamic_cast<const runcatalog::IndexOutOfRange*>(&e) ||
        dynamic_cast<const runcatalog::UnsupportedQueryKind*>(&e) ||
        dynamic_cast<const runcatalog::UnsupportedDType*>(&e) ||
        dynamic_cast<const runcatalog::ConfigurationError*>(&e)) {
        return 400;
    }
    return 500;
}

json runSummary(const runcatalog::Run& run) {
    return json{
        {"uid", run.uid()},
        {"start", run.start()},
        {"stop", run.stop() ? *run.stop() : json()},
        {"streams", run.iterate().drain()}
    };
}

} // namespace

CatalogHttpServer::CatalogHttpServer(Catalog catalog, ServerOptions options)
    : catalog_(std::move(catalog)), options_(std::move(options)), startTime_(std::chrono::steady_clock::now()) {
    setupRoutes();
}

void CatalogHttpServer::run() {
    std::cout << "Catalog HTTP server listening on "
              << options_.host << ":" << options_.port << std::endl;
    if (!server_.listen(options_.host.c_str(), options_.port)) {
        throw std::runtime_error("cannot listen on " + options_.host + ":" + std::to_string(options_.port));
    }
}

int CatalogHttpServer::bindToAnyPort() {
    options_.port = server_.bind_to_any_port(options_.host.c_str());
    if (options_.port < 0) {
        throw std::runtime_error("cannot bind " + options_.host);
    }
    return options_.port;
}

bool CatalogHttpServer::listenAfterBind() {
    return server_.listen_after_bind();
}

void CatalogHttpServer::waitUntilReady() const {
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void CatalogHttpServer::stop() {
    server_.stop();
}

Catalog CatalogHttpServer::viewFor(const httplib::Request& req) const {
    const auto name = req.get_header_value("X-Identity");
    if (name.empty()) {
        return catalog_;
    }
    if (name == options_.adminIdentity) {
        return catalog_.rebindIdentity(Identity::admin());
    }
    return catalog_.rebindIdentity(Identity::user(name));
}

void CatalogHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    // CORS helper to add to ALL responses
    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, X-Identity");
    };

    auto fail = [err, addCors](httplib::Response& res, const std::exception& e) {
        res.status = statusFor(e);
        if (res.status >= 500) {
            std::cerr << "CatalogHttpServer: " << e.what() << "\n";
        }
        res.set_content(err(res.status, e.what()).dump(), "application/json");
        addCors(res);
    };

    auto parseBounded = [](const std::string& val, long long def, long long min, long long max) -> long long {
        if (val.empty()) return def;
        long long v = 0;
        try {
            v = std::stoll(val);
        } catch (const std::exception&) {
            throw runcatalog::ConfigurationError("'" + val + "' is not an integer");
        }
        return std::min(std::max(v, min), max);
    };

    // Handle preflight OPTIONS requests for ANY route
    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_).count();
        json data = {
            {"uptime_seconds", uptime},
            {"database", catalog_.database()->name()},
            {"zstd", runcatalog::zstdAvailable()}
        };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });

    // --- LIST RUNS ---
    server_.Get("/v1/runs", [this, ok, fail, parseBounded, addCors](const httplib::Request& req, httplib::Response& res) {
        try {
            auto view = viewFor(req);
            auto q = req.get_param_value("q");
            if (!q.empty()) {
                view = view.search(runcatalog::FullText{q});
            }
            auto offset = parseBounded(req.get_param_value("offset"), 0, 0, 1'000'000'000);
            auto limit = parseBounded(req.get_param_value("limit"), 100, 1, static_cast<long long>(options_.maxPageSize));

            json runs = json::array();
            for (const auto& item : view.items(runcatalog::Interval::range(offset, offset + limit))) {
                runs.push_back(runSummary(item.second));
            }
            json data = {
                {"offset", offset},
                {"limit", limit},
                {"total", view.length()},
                {"runs", runs}
            };
            res.set_content(ok(data).dump(), "application/json");
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- GET RUN ---
    server_.Get(R"(/v1/runs/([^/]+))", [this, ok, fail, addCors](const httplib::Request& req, httplib::Response& res) {
        try {
            auto run = viewFor(req).lookup(req.matches[1]);
            res.set_content(ok(runSummary(run)).dump(), "application/json");
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- GET STREAM ---
    server_.Get(R"(/v1/runs/([^/]+)/([^/]+))", [this, ok, fail, addCors](const httplib::Request& req, httplib::Response& res) {
        try {
            auto stream = viewFor(req).lookup(req.matches[1]).lookup(req.matches[2]);
            json data = stream->metadata();
            data["fields"] = stream->iterate().drain();
            res.set_content(ok(data).dump(), "application/json");
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- ARRAY STRUCTURE ---
    server_.Get(R"(/v1/metadata/([^/]+)/([^/]+)/([^/]+))", [this, ok, fail, addCors](const httplib::Request& req, httplib::Response& res) {
        try {
            auto stream = viewFor(req).lookup(req.matches[1]).lookup(req.matches[2]);
            auto array = stream->lookup(req.matches[3]);
            json data = {
                {"structure", array->structure().toJson()},
                {"block_count", array->blockCount()}
            };
            res.set_content(ok(data).dump(), "application/json");
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- ARRAY BLOCK ---
    server_.Get(R"(/v1/array/block/([^/]+)/([^/]+)/([^/]+))", [this, fail, addCors](const httplib::Request& req, httplib::Response& res) {
        try {
            runcatalog::BlockIndex block;
            std::stringstream ss(req.get_param_value("block"));
            std::string item;
            while (std::getline(ss, item, ',')) {
                try {
                    block.push_back(static_cast<std::size_t>(std::stoull(item)));
                } catch (const std::exception&) {
                    throw runcatalog::ConfigurationError("invalid block index '" + item + "'");
                }
            }
            auto requested = runcatalog::parseBlockEncoding(req.get_param_value("encoding"));

            auto stream = viewFor(req).lookup(req.matches[1]).lookup(req.matches[2]);
            auto array = stream->lookup(req.matches[3]);
            if (block.empty() && array->structure().ndim() > 0) {
                throw runcatalog::ConfigurationError("missing query parameter 'block'");
            }
            auto data = array->fetchBlock(block);

            std::string payload(data.data.begin(), data.data.end());
            bool compress = requested == runcatalog::BlockEncoding::Zstd && options_.compressBlocks;
            auto encoding = runcatalog::maybeCompress(payload, compress);
            res.set_header("X-Block-Encoding", runcatalog::blockEncodingName(encoding));
            res.set_content(payload, "application/octet-stream");
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });
}
