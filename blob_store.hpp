#pragma once

#include <chrono>
#include <string>

namespace page_pilot {

// automation_screenshots/<task_id>/<file_name>
std::string screenshot_object_key(const std::string& task_id, const std::string& file_name);

// Upload contract: store bytes under a key, get back a URL.
class BlobStore {
public:
    virtual ~BlobStore() = default;
    // Throws UploadError when the write is rejected.
    virtual std::string upload(const std::string& bytes, const std::string& key) = 0;
};

struct HttpBlobStoreOptions {
    std::string endpoint;          // e.g. https://storage.example.com
    std::string bucket;
    std::string public_base_url;   // prefix of returned URLs; defaults to endpoint/bucket
    std::string auth_env;          // env var holding the Authorization header value
    std::string content_type = "image/png";
    std::chrono::milliseconds timeout = std::chrono::seconds(60);
};

// PUT <endpoint>/<bucket>/<key>.
class HttpBlobStore : public BlobStore {
public:
    explicit HttpBlobStore(HttpBlobStoreOptions options);
    std::string upload(const std::string& bytes, const std::string& key) override;

private:
    HttpBlobStoreOptions options_;
};

// Writes under a local directory; returns file:// URLs.
class FileBlobStore : public BlobStore {
public:
    explicit FileBlobStore(std::string root_dir) : root_dir_(std::move(root_dir)) {}
    std::string upload(const std::string& bytes, const std::string& key) override;

private:
    std::string root_dir_;
};

} // namespace page_pilot
