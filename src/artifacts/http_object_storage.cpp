#include "artifacts/http_object_storage.hpp"

#include "runtime/sandbox_error.hpp"
#include "utils/hash.hpp"
#include "utils/logging.hpp"

namespace kiln::artifacts {

HttpObjectStorage::HttpObjectStorage(HttpObjectStorageOptions options)
    : options_(std::move(options)), url_(kiln::utils::ParseUrl(options_.endpoint)) {
    if (options_.public_base.empty()) {
        options_.public_base = options_.endpoint;
    }
    while (!options_.public_base.empty() && options_.public_base.back() == '/') {
        options_.public_base.pop_back();
    }
}

std::string HttpObjectStorage::SignedUrl(const std::string& key,
                                         std::chrono::system_clock::time_point expires_at) const {
    const auto expires = std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(expires_at.time_since_epoch()).count());
    const auto object = options_.bucket + "/" + key;
    auto url = options_.public_base + "/" + kiln::utils::UrlEncode(object) + "?expires=" + expires;
    if (!options_.signing_key.empty()) {
        url += "&signature=" + kiln::utils::HmacSha256Hex(options_.signing_key, object + "\n" + expires);
    }
    return url;
}

StoredObject HttpObjectStorage::Put(const std::string& bytes, const std::string& key, const std::string& mime_type) {
    auto client = kiln::utils::MakeHttpClient(url_, options_.http);
    httplib::Headers headers;
    if (!options_.token.empty()) {
        headers.emplace("Authorization", "Bearer " + options_.token);
    }
    const auto path = url_.base_path + "/" + kiln::utils::UrlEncode(options_.bucket + "/" + key);
    auto result = client->Put(path.c_str(), headers, bytes, mime_type.c_str());
    if (!result || result->status >= 400) {
        const auto failure = kiln::utils::DescribeFailure(result);
        kiln::utils::LogWarn("storage", "upload failed", {{"key", key}, {"error", failure}});
        throw kiln::runtime::SandboxError(kiln::runtime::ErrorCode::kStorageUploadFailure,
                                          "upload of " + key + " failed: " + failure);
    }

    StoredObject stored{};
    // Whole seconds, so the URL and expires_at agree.
    stored.expires_at = std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::now() + options_.url_ttl);
    stored.url = SignedUrl(key, stored.expires_at);
    kiln::utils::LogDebug("storage", "object stored", {{"key", key}, {"bytes", std::to_string(bytes.size())}});
    return stored;
}

}  // namespace kiln::artifacts
