#pragma once

#include "store/Store.hpp"
#include "config/Config.hpp"

#include "util/curlWrappers.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mfsync::store {

// Store backed by the daemon's HTTP RPC API (POST /api/v0/<command>?arg=...).
class HttpStore final : public Store {
public:
    // A file sent as the single multipart part of an add.
    struct Upload {
        fs::path file;
        std::vector<std::string> partHeaders;
    };

    struct Request {
        std::string url;
        std::optional<Upload> upload;
    };

    // Performs one POST. Defaults to libcurl.
    using Transport = std::function<util::HttpResponse(const Request&)>;

    explicit HttpStore(config::ApiConfig api, Transport transport = {});
    ~HttpStore() override = default;

    // #########################################################################
    // ############################ LISTING ####################################
    // #########################################################################

    [[nodiscard]] std::vector<model::Entry> list(const fs::path& path) const override;
    [[nodiscard]] model::Stat stat(const fs::path& path) const override;

    // #########################################################################
    // ############################ MUTATION ###################################
    // #########################################################################

    void mkdir(const fs::path& path) override;
    void remove(const fs::path& path, bool recursive) override;
    [[nodiscard]] std::string add(const fs::path& localFile, const AddOptions& opts) override;
    void copyHashTo(const fs::path& path, const std::string& hash) override;

    // #########################################################################
    // ############################# COMMIT ####################################
    // #########################################################################

    void flush(const fs::path& path) override;
    void setAutoflush(bool enabled) override { autoflush_ = enabled; }

    [[nodiscard]] bool autoflush() const { return autoflush_; }
    [[nodiscard]] const std::string& baseUrl() const { return baseUrl_; }

    using Params = std::vector<std::pair<std::string, std::string>>;

    [[nodiscard]] std::string buildUrl(const std::string& command, const Params& params) const;

    // Turns a daemon response into JSON, or throws store::Error carrying the daemon's message.
    [[nodiscard]] static nlohmann::json parseResponse(const std::string& op, const std::string& path,
                                                      const util::HttpResponse& resp);

private:
    config::ApiConfig api_;
    std::string baseUrl_;
    Transport transport_;
    bool autoflush_ = true; // daemon default

    [[nodiscard]] nlohmann::json call(const std::string& command, const fs::path& path, Params params) const;
    [[nodiscard]] util::HttpResponse send(const Request& req) const;
    [[nodiscard]] util::HttpResponse performCurlRequest(const Request& req) const;

    void addFlushParam(Params& params) const;
};

}
