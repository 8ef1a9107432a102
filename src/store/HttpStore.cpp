#include "store/HttpStore.hpp"
#include "store/Error.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <memory>
#include <sstream>

using namespace mfsync::store;
using namespace mfsync::util;
using namespace mfsync::log;

HttpStore::HttpStore(config::ApiConfig api, Transport transport)
    : api_(std::move(api)),
      baseUrl_(fmt::format("http://{}:{}/api/v0/", api_.host, api_.port)),
      transport_(std::move(transport)) {
    ensureCurlGlobalInit();
}

// #########################################################################
// ############################ LISTING ####################################
// #########################################################################

std::vector<model::Entry> HttpStore::list(const fs::path& path) const {
    const auto body = call("files/ls", path, {{"long", "true"}});
    try {
        return model::entriesFromListing(body);
    } catch (const std::exception& e) {
        throw Error("files/ls", path.generic_string(), fmt::format("malformed listing: {}", e.what()));
    }
}

model::Stat HttpStore::stat(const fs::path& path) const {
    const auto body = call("files/stat", path, {});
    try {
        return body.get<model::Stat>();
    } catch (const std::exception& e) {
        throw Error("files/stat", path.generic_string(), fmt::format("malformed stat: {}", e.what()));
    }
}

// #########################################################################
// ############################ MUTATION ###################################
// #########################################################################

void HttpStore::mkdir(const fs::path& path) {
    Params params{{"parents", "true"}};
    addFlushParam(params);
    (void)call("files/mkdir", path, std::move(params));
}

void HttpStore::remove(const fs::path& path, const bool recursive) {
    Params params;
    if (recursive) {
        params.emplace_back("recursive", "true");
        params.emplace_back("force", "true");
    }
    addFlushParam(params);
    (void)call("files/rm", path, std::move(params));
}

std::string HttpStore::add(const fs::path& localFile, const AddOptions& opts) {
    const auto absPath = fs::absolute(localFile);
    {
        std::ifstream in(absPath, std::ios::binary);
        if (!in) throw std::runtime_error("Failed to open file for upload: " + absPath.string());
    }

    Params params{{"pin", opts.pin ? "true" : "false"}, {"quieter", "true"}};
    if (opts.nocopy) params.emplace_back("nocopy", "true");

    Upload upload{absPath, {}};
    // the filestore keys its references on the absolute path
    if (opts.nocopy) upload.partHeaders.push_back("Abspath: " + absPath.string());

    const HttpResponse resp = send({buildUrl("add", params), std::move(upload)});

    if (!resp.ok()) (void)parseResponse("add", absPath.string(), resp);

    // One JSON object per line; the last one describes the root of what was added.
    std::istringstream lines(resp.body);
    std::string line, last;
    while (std::getline(lines, line))
        if (!line.empty()) last = line;

    const auto j = nlohmann::json::parse(last, nullptr, false);
    if (j.is_discarded() || !j.contains("Hash"))
        throw Error("add", absPath.string(), "unexpected response: " + resp.body);

    return j.at("Hash").get<std::string>();
}

void HttpStore::copyHashTo(const fs::path& path, const std::string& hash) {
    try {
        remove(path, true);
    } catch (const Error& e) {
        if (!e.isNotFound()) throw;
    }

    Params params{{"arg", "/ipfs/" + hash}};
    params.emplace_back("arg", path.generic_string());
    addFlushParam(params);

    const HttpResponse resp = send({buildUrl("files/cp", params), std::nullopt});

    (void)parseResponse("files/cp", path.generic_string(), resp);
}

// #########################################################################
// ############################# COMMIT ####################################
// #########################################################################

void HttpStore::flush(const fs::path& path) {
    (void)call("files/flush", path, {});
}

// #########################################################################
// ############################ HELPERS ####################################
// #########################################################################

std::string HttpStore::buildUrl(const std::string& command, const Params& params) const {
    std::ostringstream url;
    url << baseUrl_ << command;

    char sep = '?';
    for (const auto& [k, v] : params) {
        url << sep << k << '=' << escape(v);
        sep = '&';
    }
    return url.str();
}

nlohmann::json HttpStore::call(const std::string& command, const fs::path& path, Params params) const {
    params.insert(params.begin(), std::make_pair(std::string("arg"), path.generic_string()));
    const HttpResponse resp = send({buildUrl(command, params), std::nullopt});

    return parseResponse(command, path.generic_string(), resp);
}

HttpResponse HttpStore::send(const Request& req) const {
    return transport_ ? transport_(req) : performCurlRequest(req);
}

HttpResponse HttpStore::performCurlRequest(const Request& req) const {
    std::unique_ptr<Mime> mime;
    SList partHeaders;
    if (req.upload)
        for (const auto& h : req.upload->partHeaders) partHeaders.add(h);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());

        if (req.upload) {
            const auto& file = req.upload->file;
            mime = std::make_unique<Mime>(h);
            curl_mimepart* part = mime->addPart();
            curl_mime_name(part, "file");
            if (curl_mime_filedata(part, file.c_str()) != CURLE_OK)
                throw std::runtime_error("Failed to attach file for upload: " + file.string());
            curl_mime_type(part, "application/octet-stream");
            if (partHeaders.get()) {
                curl_mime_filename(part, file.c_str());
                curl_mime_headers(part, partHeaders.get(), 0);
            }
            curl_easy_setopt(h, CURLOPT_MIMEPOST, mime->get());
        } else {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, 0L);
        }

        if (api_.timeout_seconds > 0)
            curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(api_.timeout_seconds));
    });
}

void HttpStore::addFlushParam(Params& params) const {
    if (!autoflush_) params.emplace_back("flush", "false");
}

nlohmann::json HttpStore::parseResponse(const std::string& op, const std::string& path, const HttpResponse& resp) {
    if (resp.curl != CURLE_OK) {
        Registry::store()->trace("[HttpStore] {} {} failed: CURL={} {}", op, path, static_cast<int>(resp.curl), resp.error);
        throw Error(op, path, resp.error);
    }

    auto body = resp.body.empty() ? nlohmann::json(nullptr) : nlohmann::json::parse(resp.body, nullptr, false);

    if (!resp.ok()) {
        Registry::store()->trace("[HttpStore] {} {} failed: HTTP={} {}", op, path, resp.http, resp.body);
        if (!body.is_discarded() && body.is_object() && body.contains("Message"))
            throw Error(op, path, body.at("Message").get<std::string>(), resp.http, body.value("Code", -1));
        throw Error(op, path, resp.body.empty() ? fmt::format("HTTP {}", resp.http) : resp.body, resp.http);
    }

    if (body.is_discarded()) throw Error(op, path, "unparseable response: " + resp.body, resp.http);
    return body;
}
