#pragma once

#include <chrono>
#include <string>

namespace kiln::artifacts {

struct StoredObject {
    std::string url;
    std::chrono::system_clock::time_point expires_at;
};

class ObjectStorage {
public:
    virtual ~ObjectStorage() = default;

    // Stores bytes under key and returns a time-limited URL. Throws on
    // failure.
    virtual StoredObject Put(const std::string& bytes, const std::string& key, const std::string& mime_type) = 0;
};

}  // namespace kiln::artifacts
