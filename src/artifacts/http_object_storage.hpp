#pragma once

#include <chrono>
#include <string>

#include "artifacts/object_storage.hpp"
#include "utils/http.hpp"

namespace kiln::artifacts {

struct HttpObjectStorageOptions {
    std::string endpoint;       // e.g. http://minio:9000
    std::string bucket;
    std::string public_base;    // base of issued URLs; endpoint when empty
    std::chrono::seconds url_ttl{3600};
    std::string token;          // bearer token for uploads
    std::string signing_key;    // HMAC key for URL signatures
    kiln::utils::HttpClientOptions http;
};

// PUTs objects to an S3-compatible HTTP endpoint and hands out signed,
// expiring URLs:
//   {public_base}/{bucket}/{key}?expires=<epoch>&signature=<hmac>
// where signature = hex HMAC-SHA256(signing_key, "{bucket}/{key}\n{expires}").
class HttpObjectStorage : public ObjectStorage {
public:
    explicit HttpObjectStorage(HttpObjectStorageOptions options);

    StoredObject Put(const std::string& bytes, const std::string& key, const std::string& mime_type) override;

    std::string SignedUrl(const std::string& key, std::chrono::system_clock::time_point expires_at) const;

private:
    HttpObjectStorageOptions options_;
    kiln::utils::ParsedUrl url_;
};

}  // namespace kiln::artifacts
