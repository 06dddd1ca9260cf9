#pragma once

#include <string>

namespace kiln::artifacts {

enum class ArtifactClass {
    kImage,
    kDocument,
    kUnknown
};

struct Classification {
    ArtifactClass artifact_class = ArtifactClass::kUnknown;
    std::string mime_type = "application/octet-stream";
};

// By file extension, case-insensitive.
Classification ClassifyByName(const std::string& file_name);

}  // namespace kiln::artifacts
