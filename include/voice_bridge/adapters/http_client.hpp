#pragma once

#include <filesystem>
#include <functional>
#include <httplib.h>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_bridge {

class HttpError : public std::runtime_error {
public:
    HttpError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

class HttpPermissionError : public HttpError {
public:
    HttpPermissionError(const std::string& message, int status) : HttpError(message, status) {}
};

struct HttpRequestOptions {
    double connect_timeout = 10.0;
    double read_timeout = 60.0;
    double write_timeout = 60.0;
};

class HttpClient {
public:
    using ChunkHandler = std::function<bool(const char* data, size_t size)>;

    HttpClient(std::string base_url,
               std::optional<std::string> bearer_token,
               HttpRequestOptions options);

    nlohmann::json post_json(const std::string& path, const nlohmann::json& body) const;
    nlohmann::json post_multipart(const std::string& path,
                                  const httplib::MultipartFormDataItems& items) const;
    // Streams the response body into on_chunk. Returns false when on_chunk
    // aborted the transfer.
    bool post_stream(const std::string& path,
                     const nlohmann::json& body,
                     const ChunkHandler& on_chunk) const;

    void download(const std::filesystem::path& destination) const;

    const std::string& base_url() const { return base_url_; }

private:
    std::string build_path(const std::string& path) const;
    httplib::Headers headers(const std::string& accept) const;
    void apply_timeouts(httplib::Client& client) const;
    void check_status(int status, const std::string& body) const;

    std::string base_url_;
    std::string origin_;
    std::string base_path_;
    std::optional<std::string> bearer_token_;
    HttpRequestOptions options_;
};

}
