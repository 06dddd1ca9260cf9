#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <string>

#include "artifacts/artifact_processor.hpp"
#include "artifacts/mime_types.hpp"
#include "fakes/fake_storage.hpp"
#include "runtime/sandbox_error.hpp"

using namespace kiln::artifacts;
using kiln::fakes::FakeStorage;
using kiln::runtime::ExecutionResult;
using kiln::runtime::FileReference;
using kiln::runtime::FileSnapshot;

class ArtifactProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "kiln_artifact_test";
        std::filesystem::create_directories(testDir);
        storage = std::make_shared<FakeStorage>();
        options.staging_dir = testDir;
        options.max_artifact_bytes = 64;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    void AddFile(const std::string& relative_path, const std::string& content) {
        files[relative_path] = content;
        after[relative_path] = {content.size(), ++mtime};
    }

    Downloader MakeDownloader() {
        return [this](const std::string& remote_path, const std::filesystem::path& local_path) {
            const auto it = files.find(remote_path);
            if (it == files.end()) {
                throw kiln::runtime::SandboxError(kiln::runtime::ErrorCode::kNotFound, remote_path + " not found");
            }
            std::ofstream(local_path, std::ios::binary) << it->second;
        };
    }

    ExecutionResult Run(ArtifactProcessor& processor, const std::vector<std::string>& candidates) {
        ExecutionResult result{};
        processor.Process("s1", "/home/user", candidates, after, MakeDownloader(), ledger, result);
        return result;
    }

    std::filesystem::path testDir;
    std::shared_ptr<FakeStorage> storage;
    ArtifactOptions options;
    ArtifactLedger ledger;
    std::map<std::string, std::string> files;
    FileSnapshot after;
    std::int64_t mtime = 0;
};

TEST(MimeTypesTest, ClassifiesByExtension) {
    EXPECT_EQ(ClassifyByName("plot.PNG").artifact_class, ArtifactClass::kImage);
    EXPECT_EQ(ClassifyByName("plot.PNG").mime_type, "image/png");
    EXPECT_EQ(ClassifyByName("chart.svg").mime_type, "image/svg+xml");
    EXPECT_EQ(ClassifyByName("report.pdf").artifact_class, ArtifactClass::kDocument);
    EXPECT_EQ(ClassifyByName("data.csv").mime_type, "text/csv");
    EXPECT_EQ(ClassifyByName("blob.xyz").artifact_class, ArtifactClass::kUnknown);
    EXPECT_EQ(ClassifyByName("Makefile").mime_type, "application/octet-stream");
}

TEST_F(ArtifactProcessorTest, ChangedFilesFindsNewAndModified) {
    FileSnapshot before{{"a.txt", {1, 1}}, {"b.txt", {1, 1}}, {"gone.txt", {1, 1}}};
    FileSnapshot now{{"a.txt", {1, 1}}, {"b.txt", {2, 5}}, {"c.png", {3, 6}}};
    const auto changed = ArtifactProcessor::ChangedFiles(before, now);
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], "b.txt");
    EXPECT_EQ(changed[1], "c.png");
}

TEST_F(ArtifactProcessorTest, ImageIsInlinedWithExactBytes) {
    ArtifactProcessor processor(options, storage);
    const std::string bytes("\x89PNG\r\n\x1a\n\0\0binary", 18);
    AddFile("out/plot.png", bytes);
    const auto result = Run(processor, {"out/plot.png"});
    ASSERT_EQ(result.artifacts.size(), 1u);
    const auto& ref = result.artifacts[0];
    EXPECT_EQ(ref.kind, FileReference::Kind::kInline);
    EXPECT_EQ(ref.name, "plot.png");
    EXPECT_EQ(ref.path, "/home/user/out/plot.png");
    EXPECT_EQ(*ref.inline_data, bytes);
    EXPECT_EQ(ref.size_bytes, bytes.size());
    EXPECT_EQ(ref.artifact_id.rfind("art_", 0), 0u);
    EXPECT_TRUE(ref.IsValid());
    EXPECT_EQ(storage->puts.load(), 0);
}

TEST_F(ArtifactProcessorTest, UnknownExtensionUploadsAsOctetStream) {
    ArtifactProcessor processor(options, storage);
    AddFile("model.bin", "weights");
    const auto result = Run(processor, {"model.bin"});
    ASSERT_EQ(result.artifacts.size(), 1u);
    EXPECT_EQ(result.artifacts[0].kind, FileReference::Kind::kExternal);
    EXPECT_EQ(result.artifacts[0].mime_type, "application/octet-stream");
    EXPECT_TRUE(result.artifacts[0].IsValid());
}

TEST_F(ArtifactProcessorTest, OversizedFileIsRejectedWithWarning) {
    ArtifactProcessor processor(options, storage);
    AddFile("huge.csv", std::string(65, 'x'));
    AddFile("small.csv", "a,b");
    const auto result = Run(processor, {"huge.csv", "small.csv"});
    ASSERT_EQ(result.artifacts.size(), 1u);
    EXPECT_EQ(result.artifacts[0].name, "small.csv");
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].rfind("huge.csv:", 0), 0u);
}

TEST_F(ArtifactProcessorTest, ExpiredLedgerEntryIsUploadedAgain) {
    storage->ttl = std::chrono::seconds(0);
    ArtifactProcessor processor(options, storage);
    AddFile("report.pdf", "%PDF");
    Run(processor, {"report.pdf"});
    Run(processor, {"report.pdf"});
    EXPECT_EQ(storage->puts.load(), 2);
}

TEST_F(ArtifactProcessorTest, MissingStorageOmitsDocumentsButKeepsImages) {
    ArtifactProcessor processor(options, nullptr);
    AddFile("plot.png", "png");
    AddFile("report.pdf", "%PDF");
    const auto result = Run(processor, {"plot.png", "report.pdf"});
    ASSERT_EQ(result.artifacts.size(), 1u);
    EXPECT_EQ(result.artifacts[0].name, "plot.png");
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("no object storage"), std::string::npos);
}

TEST_F(ArtifactProcessorTest, DownloadFailureBecomesWarning) {
    ArtifactProcessor processor(options, storage);
    after["vanished.csv"] = {3, 1};
    const auto result = Run(processor, {"vanished.csv"});
    EXPECT_TRUE(result.artifacts.empty());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("could not retrieve"), std::string::npos);
}

TEST_F(ArtifactProcessorTest, StagingDirectoryIsCleanedUp) {
    ArtifactProcessor processor(options, storage);
    AddFile("plot.png", "png");
    AddFile("data.csv", "a");
    Run(processor, {"plot.png", "data.csv"});
    EXPECT_TRUE(std::filesystem::is_empty(testDir));
}
