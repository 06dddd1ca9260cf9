#include "artifacts/mime_types.hpp"

#include <unordered_map>

#include "utils/common.hpp"

namespace kiln::artifacts {
namespace {

const std::unordered_map<std::string, Classification>& Table() {
    static const std::unordered_map<std::string, Classification> kTable = {
        {"png", {ArtifactClass::kImage, "image/png"}},
        {"jpg", {ArtifactClass::kImage, "image/jpeg"}},
        {"jpeg", {ArtifactClass::kImage, "image/jpeg"}},
        {"gif", {ArtifactClass::kImage, "image/gif"}},
        {"bmp", {ArtifactClass::kImage, "image/bmp"}},
        {"webp", {ArtifactClass::kImage, "image/webp"}},
        {"svg", {ArtifactClass::kImage, "image/svg+xml"}},
        {"pdf", {ArtifactClass::kDocument, "application/pdf"}},
        {"csv", {ArtifactClass::kDocument, "text/csv"}},
        {"tsv", {ArtifactClass::kDocument, "text/tab-separated-values"}},
        {"json", {ArtifactClass::kDocument, "application/json"}},
        {"txt", {ArtifactClass::kDocument, "text/plain"}},
        {"log", {ArtifactClass::kDocument, "text/plain"}},
        {"md", {ArtifactClass::kDocument, "text/markdown"}},
        {"html", {ArtifactClass::kDocument, "text/html"}},
        {"htm", {ArtifactClass::kDocument, "text/html"}},
        {"xml", {ArtifactClass::kDocument, "application/xml"}},
        {"yaml", {ArtifactClass::kDocument, "application/yaml"}},
        {"yml", {ArtifactClass::kDocument, "application/yaml"}},
        {"xlsx", {ArtifactClass::kDocument, "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"}},
        {"xls", {ArtifactClass::kDocument, "application/vnd.ms-excel"}},
        {"docx", {ArtifactClass::kDocument, "application/vnd.openxmlformats-officedocument.wordprocessingml.document"}},
        {"pptx", {ArtifactClass::kDocument, "application/vnd.openxmlformats-officedocument.presentationml.presentation"}},
        {"parquet", {ArtifactClass::kDocument, "application/vnd.apache.parquet"}},
        {"zip", {ArtifactClass::kDocument, "application/zip"}},
        {"npy", {ArtifactClass::kDocument, "application/octet-stream"}},
        {"pkl", {ArtifactClass::kDocument, "application/octet-stream"}},
    };
    return kTable;
}

}  // namespace

Classification ClassifyByName(const std::string& file_name) {
    const auto dot = file_name.rfind('.');
    if (dot == std::string::npos || dot + 1 == file_name.size()) {
        return {};
    }
    const auto extension = kiln::utils::ToLower(file_name.substr(dot + 1));
    const auto it = Table().find(extension);
    return it == Table().end() ? Classification{} : it->second;
}

}  // namespace kiln::artifacts
