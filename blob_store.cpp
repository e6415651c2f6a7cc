#include "blob_store.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "url.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>

namespace page_pilot {

namespace fs = std::filesystem;
namespace http = boost::beast::http;

std::string screenshot_object_key(const std::string& task_id, const std::string& file_name) {
    return "automation_screenshots/" + task_id + "/" + file_name;
}

// --------------------------- HttpBlobStore -----------------------------------
HttpBlobStore::HttpBlobStore(HttpBlobStoreOptions options) : options_(std::move(options)) {
    if (options_.endpoint.empty()) {
        throw ConfigError("blob_store.endpoint is required for the http blob store");
    }
    if (options_.public_base_url.empty()) {
        options_.public_base_url = join_url(options_.endpoint, options_.bucket);
    }
}

std::string HttpBlobStore::upload(const std::string& bytes, const std::string& key) {
    const std::string target = join_url(join_url(options_.endpoint, options_.bucket), key);

    std::map<std::string, std::string> headers = {{"Content-Type", options_.content_type}};
    if (!options_.auth_env.empty()) {
        const char* auth = std::getenv(options_.auth_env.c_str());
        if (auth && *auth) {
            headers["Authorization"] = auth;
        } else {
            std::cerr << "[Upload] " << options_.auth_env << " is not set; uploading without Authorization" << std::endl;
        }
    }

    HttpResponse res;
    try {
        res = http_request(http::verb::put, target, bytes, headers, options_.timeout);
    } catch (const std::runtime_error& e) {
        throw UploadError("upload of " + key + " failed: " + e.what());
    }
    if (!res.ok()) {
        throw UploadError("upload of " + key + " rejected with HTTP " + std::to_string(res.status));
    }

    const std::string url = join_url(options_.public_base_url, key);
    std::cout << "[Upload] Stored " << bytes.size() << " bytes at " << url << std::endl;
    return url;
}

// --------------------------- FileBlobStore -----------------------------------
std::string FileBlobStore::upload(const std::string& bytes, const std::string& key) {
    fs::path path = fs::path(root_dir_) / key;
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw UploadError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw UploadError("cannot open " + path.string() + " for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        throw UploadError("short write to " + path.string());
    }

    const std::string url = "file://" + fs::absolute(path).string();
    std::cout << "[Upload] Wrote " << bytes.size() << " bytes to " << url << std::endl;
    return url;
}

} // namespace page_pilot
