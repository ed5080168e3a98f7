#include "voice_bridge/adapters/http_client.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "voice_bridge/utils/http.hpp"

namespace voice_bridge {

namespace {

constexpr size_t kErrorSnippetLimit = 256;

std::pair<time_t, time_t> split_seconds(double seconds) {
    const auto whole = static_cast<time_t>(std::floor(seconds));
    const auto micros = static_cast<time_t>((seconds - static_cast<double>(whole)) * 1e6);
    return {whole, micros};
}

}

HttpClient::HttpClient(std::string base_url,
                       std::optional<std::string> bearer_token,
                       HttpRequestOptions options)
    : base_url_(std::move(base_url)),
      bearer_token_(std::move(bearer_token)),
      options_(options) {
    utils::Url url;
    try {
        url = utils::parse_url(base_url_);
    } catch (const std::invalid_argument& ex) {
        throw HttpError(ex.what());
    }
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        throw HttpError("HTTPS requires CPPHTTPLIB_OPENSSL_SUPPORT");
    }
#endif
    origin_ = url.origin();
    base_path_ = url.path;
}

nlohmann::json HttpClient::post_json(const std::string& path, const nlohmann::json& body) const {
    httplib::Client client(origin_);
    apply_timeouts(client);
    auto response = client.Post(build_path(path), headers("application/json"), body.dump(),
                                "application/json");
    if (!response) {
        throw HttpError("request to " + path + " failed: " + httplib::to_string(response.error()));
    }
    check_status(response->status, response->body);
    return nlohmann::json::parse(response->body);
}

nlohmann::json HttpClient::post_multipart(const std::string& path,
                                          const httplib::MultipartFormDataItems& items) const {
    httplib::Client client(origin_);
    apply_timeouts(client);
    auto response = client.Post(build_path(path), headers("application/json"), items);
    if (!response) {
        throw HttpError("request to " + path + " failed: " + httplib::to_string(response.error()));
    }
    check_status(response->status, response->body);
    return nlohmann::json::parse(response->body);
}

bool HttpClient::post_stream(const std::string& path,
                             const nlohmann::json& body,
                             const ChunkHandler& on_chunk) const {
    httplib::Client client(origin_);
    apply_timeouts(client);

    int status = 0;
    bool aborted = false;
    std::string error_body;

    httplib::Request request;
    request.method = "POST";
    request.path = build_path(path);
    request.headers = headers("*/*");
    request.headers.emplace("Content-Type", "application/json");
    request.body = body.dump();
    request.response_handler = [&status](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    request.content_receiver = [&](const char* data, size_t size, uint64_t, uint64_t) {
        if (status < 200 || status >= 300) {
            if (error_body.size() < kErrorSnippetLimit) {
                error_body.append(data, size);
            }
            return true;
        }
        if (!on_chunk(data, size)) {
            aborted = true;
            return false;
        }
        return true;
    };

    httplib::Response response;
    httplib::Error error = httplib::Error::Success;
    const bool ok = client.send(request, response, error);
    if (aborted) {
        return false;
    }
    if (!ok) {
        throw HttpError("request to " + path + " failed: " + httplib::to_string(error));
    }
    check_status(status != 0 ? status : response.status, error_body);
    return true;
}

void HttpClient::download(const std::filesystem::path& destination) const {
    httplib::Client client(origin_);
    apply_timeouts(client);
    client.set_follow_location(true);

    std::error_code ec;
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
    }
    auto partial = destination;
    partial += ".part";
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw HttpError("cannot write " + partial.string());
    }

    int status = 0;
    std::string error_body;
    auto result = client.Get(
        build_path(""), headers("*/*"),
        [&status](const httplib::Response& response) {
            status = response.status;
            return true;
        },
        [&](const char* data, size_t size) {
            if (status < 200 || status >= 300) {
                if (error_body.size() < kErrorSnippetLimit) {
                    error_body.append(data, size);
                }
                return true;
            }
            out.write(data, static_cast<std::streamsize>(size));
            return static_cast<bool>(out);
        });
    out.close();
    if (!result) {
        std::filesystem::remove(partial, ec);
        throw HttpError("download of " + base_url_ + " failed: " +
                        httplib::to_string(result.error()));
    }
    try {
        check_status(status != 0 ? status : result->status, error_body);
    } catch (const HttpError&) {
        std::filesystem::remove(partial, ec);
        throw;
    }
    if (!out) {
        std::filesystem::remove(partial, ec);
        throw HttpError("cannot write " + partial.string());
    }
    std::filesystem::rename(partial, destination);
}

std::string HttpClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

httplib::Headers HttpClient::headers(const std::string& accept) const {
    httplib::Headers result{{"Accept", accept}};
    if (bearer_token_) {
        result.emplace("Authorization", "Bearer " + *bearer_token_);
    }
    return result;
}

void HttpClient::apply_timeouts(httplib::Client& client) const {
    const auto connect = split_seconds(options_.connect_timeout);
    const auto read = split_seconds(options_.read_timeout);
    const auto write = split_seconds(options_.write_timeout);
    client.set_connection_timeout(connect.first, connect.second);
    client.set_read_timeout(read.first, read.second);
    client.set_write_timeout(write.first, write.second);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    client.enable_server_certificate_verification(true);
#endif
}

void HttpClient::check_status(int status, const std::string& body) const {
    if (status >= 200 && status < 300) {
        return;
    }
    const auto snippet = body.substr(0, kErrorSnippetLimit);
    if (status == 401 || status == 403) {
        throw HttpPermissionError(snippet, status);
    }
    throw HttpError("HTTP " + std::to_string(status) + ": " + snippet, status);
}

}
