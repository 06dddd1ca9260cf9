#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <future>
#include <mutex>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "fakes/session_harness.hpp"
#include "runtime/sandbox_error.hpp"
#include "utils/hash.hpp"

using namespace kiln::session;
using kiln::fakes::FakeBackend;
using kiln::fakes::SessionHarness;
using kiln::runtime::BackendRunResult;
using kiln::runtime::ErrorCode;
using kiln::runtime::Language;
using kiln::runtime::OutputSink;
using kiln::runtime::SandboxError;

namespace {

template <typename Fn>
ErrorCode CodeOf(Fn fn) {
    try {
        fn();
    } catch (const SandboxError& ex) {
        return ex.Code();
    }
    ADD_FAILURE() << "expected a SandboxError";
    return ErrorCode::kBackendFailure;
}

const std::string kPngBytes = std::string("\x89PNG\r\n\x1a\n", 8) + std::string("\0\x01\x02\x03", 4);

class RecordingAuditSink : public kiln::integrations::AuditSink {
public:
    void Notify(const kiln::integrations::AuditEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    }

    std::mutex mutex;
    std::vector<kiln::integrations::AuditEvent> events;
};

}  // namespace

class SessionManagerTest : public ::testing::Test {
protected:
    SessionHarness harness;
};

TEST_F(SessionManagerTest, ConcurrentCreateBootsOnce) {
    harness.configure = [](FakeBackend& backend) { backend.start_delay = std::chrono::milliseconds(100); };
    std::vector<std::future<std::shared_ptr<Session>>> callers;
    for (int i = 0; i < 8; ++i) {
        callers.push_back(std::async(std::launch::async, [this] {
            return harness.manager->GetOrCreateSession("s1", harness.config);
        }));
    }
    std::set<Session*> seen;
    for (auto& caller : callers) {
        seen.insert(caller.get().get());
    }
    EXPECT_EQ(seen.size(), 1u);
    ASSERT_EQ(harness.BackendCount(), 1u);
    EXPECT_EQ(harness.Backend(0)->starts.load(), 1);
    EXPECT_EQ(harness.manager->SessionCount(), 1u);
    EXPECT_EQ(harness.manager->GetSession("s1")->State(), SessionState::kWarm);
}

TEST_F(SessionManagerTest, ConcurrentCreateSharesProvisionFailure) {
    harness.configure = [](FakeBackend& backend) {
        backend.start_delay = std::chrono::milliseconds(100);
        backend.fail_start = true;
    };
    std::vector<std::future<ErrorCode>> callers;
    for (int i = 0; i < 6; ++i) {
        callers.push_back(std::async(std::launch::async, [this] {
            return CodeOf([this] { harness.manager->GetOrCreateSession("s1", harness.config); });
        }));
    }
    for (auto& caller : callers) {
        EXPECT_EQ(caller.get(), ErrorCode::kProvisionFailure);
    }
    EXPECT_EQ(harness.BackendCount(), 1u);
    EXPECT_EQ(harness.manager->SessionCount(), 0u);
}

TEST_F(SessionManagerTest, ExecuteReturnsOutputAndTouchesSession) {
    harness.configure = [](FakeBackend& backend) {
        backend.on_run = [](const std::string&, Language, OutputSink& sink, FakeBackend&) {
            sink.AppendStdout("4\n");
            return BackendRunResult{};
        };
    };
    auto session = harness.manager->GetOrCreateSession("s1", harness.config);
    const auto before = session->LastUsedAt();
    const auto result = harness.manager->Execute("s1", "print(2 + 2)", Language::kPython);
    EXPECT_EQ(result.stdout_text, "4\n");
    EXPECT_EQ(result.exit_code, 0);
    // The clock is frozen; the touch still moves forward.
    EXPECT_GT(session->LastUsedAt(), before);
    EXPECT_EQ(session->State(), SessionState::kWarm);
}

TEST_F(SessionManagerTest, UnknownSessionIsNotFound) {
    EXPECT_EQ(CodeOf([this] { harness.manager->Execute("ghost", "x", Language::kPython); }),
              ErrorCode::kSessionNotFound);
    EXPECT_EQ(CodeOf([this] { harness.manager->CloseSession("ghost"); }), ErrorCode::kSessionNotFound);
}

TEST_F(SessionManagerTest, TimeoutTerminatesAndRemovesSession) {
    harness.configure = [](FakeBackend& backend) {
        backend.on_run = [](const std::string& code, Language, OutputSink&, FakeBackend& self) {
            if (code == "while True: pass") {
                self.WaitForAbort();
            }
            return BackendRunResult{};
        };
    };
    auto session = harness.manager->GetOrCreateSession("s1", harness.config);
    EXPECT_THROW(harness.manager->Execute("s1", "while True: pass", Language::kPython),
                 kiln::runtime::ExecutionTimeoutError);
    EXPECT_EQ(session->State(), SessionState::kTerminated);
    EXPECT_EQ(harness.manager->GetSession("s1"), nullptr);
    EXPECT_EQ(harness.Backend(0)->terminates.load(), 1);

    auto fresh = harness.manager->GetOrCreateSession("s1", harness.config);
    EXPECT_NE(fresh.get(), session.get());
    EXPECT_EQ(harness.BackendCount(), 2u);
}

TEST_F(SessionManagerTest, SecondExecuteOnSameSessionIsBusy) {
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    harness.configure = [&](FakeBackend& backend) {
        backend.on_run = [&entered, release_future](const std::string&, Language, OutputSink&, FakeBackend&) {
            entered.set_value();
            release_future.wait();
            return BackendRunResult{};
        };
    };
    harness.config.max_execution_time = std::chrono::seconds(5);
    harness.manager->GetOrCreateSession("s1", harness.config);
    auto first = std::async(std::launch::async, [this] {
        return harness.manager->Execute("s1", "slow", Language::kPython);
    });
    entered.get_future().wait();
    EXPECT_EQ(CodeOf([this] { harness.manager->Execute("s1", "fast", Language::kPython); }), ErrorCode::kBusy);
    EXPECT_EQ(CodeOf([this] { harness.manager->InstallPackage("s1", "numpy"); }), ErrorCode::kBusy);
    EXPECT_EQ(CodeOf([this] { harness.manager->ListFiles("s1"); }), ErrorCode::kBusy);
    EXPECT_EQ(harness.manager->GetSession("s1")->State(), SessionState::kExecuting);
    release.set_value();
    EXPECT_NO_THROW(first.get());
}

TEST_F(SessionManagerTest, DifferentSessionsRunInParallel) {
    std::atomic<int> inside{0};
    std::promise<void> both_inside;
    harness.configure = [&](FakeBackend& backend) {
        backend.on_run = [&inside, &both_inside](const std::string&, Language, OutputSink&, FakeBackend&) {
            if (++inside == 2) {
                both_inside.set_value();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            return BackendRunResult{};
        };
    };
    harness.manager->GetOrCreateSession("a", harness.config);
    harness.manager->GetOrCreateSession("b", harness.config);
    auto a = std::async(std::launch::async, [this] { return harness.manager->Execute("a", "x", Language::kPython); });
    auto b = std::async(std::launch::async, [this] { return harness.manager->Execute("b", "x", Language::kPython); });
    EXPECT_EQ(both_inside.get_future().wait_for(std::chrono::seconds(2)), std::future_status::ready);
    a.get();
    b.get();
}

TEST_F(SessionManagerTest, ImagesInlineDocumentsUpload) {
    harness.configure = [](FakeBackend& backend) {
        backend.on_run = [](const std::string&, Language, OutputSink&, FakeBackend& self) {
            self.WriteFile("plot.png", kPngBytes);
            self.WriteFile("report.pdf", "%PDF-1.4 report");
            return BackendRunResult{};
        };
    };
    harness.manager->GetOrCreateSession("s1", harness.config);
    const auto result = harness.manager->Execute("s1", "make_outputs()", Language::kPython);
    ASSERT_EQ(result.artifacts.size(), 2u);
    EXPECT_TRUE(result.warnings.empty());

    const auto& image = result.artifacts[0];
    EXPECT_EQ(image.name, "plot.png");
    EXPECT_EQ(image.kind, kiln::runtime::FileReference::Kind::kInline);
    EXPECT_EQ(image.mime_type, "image/png");
    ASSERT_TRUE(image.inline_data.has_value());
    EXPECT_EQ(*image.inline_data, kPngBytes);
    EXPECT_FALSE(image.url.has_value());
    EXPECT_TRUE(image.IsValid());

    const auto& report = result.artifacts[1];
    EXPECT_EQ(report.name, "report.pdf");
    EXPECT_EQ(report.kind, kiln::runtime::FileReference::Kind::kExternal);
    EXPECT_EQ(report.mime_type, "application/pdf");
    ASSERT_TRUE(report.url.has_value());
    EXPECT_FALSE(report.url->empty());
    ASSERT_TRUE(report.expires_at.has_value());
    EXPECT_GT(*report.expires_at, std::chrono::system_clock::now());
    EXPECT_EQ(report.fingerprint, kiln::utils::Sha256Hex("%PDF-1.4 report"));
    EXPECT_EQ(harness.storage->puts.load(), 1);
}

TEST_F(SessionManagerTest, IdenticalUploadsAreDeduplicatedPerSession) {
    harness.configure = [](FakeBackend& backend) {
        backend.on_run = [](const std::string&, Language, OutputSink&, FakeBackend& self) {
            self.WriteFile("data.csv", "a,b\n1,2\n");
            return BackendRunResult{};
        };
    };
    harness.manager->GetOrCreateSession("s1", harness.config);
    const auto first = harness.manager->Execute("s1", "write()", Language::kPython);
    const auto second = harness.manager->Execute("s1", "write()", Language::kPython);
    ASSERT_EQ(first.artifacts.size(), 1u);
    ASSERT_EQ(second.artifacts.size(), 1u);
    EXPECT_EQ(harness.storage->puts.load(), 1);
    EXPECT_EQ(*first.artifacts[0].url, *second.artifacts[0].url);
}

TEST_F(SessionManagerTest, StorageFailureIsAWarningNotAnError) {
    harness.storage->fail = true;
    harness.configure = [](FakeBackend& backend) {
        backend.on_run = [](const std::string&, Language, OutputSink& sink, FakeBackend& self) {
            sink.AppendStdout("done\n");
            self.WriteFile("report.pdf", "%PDF");
            return BackendRunResult{};
        };
    };
    harness.manager->GetOrCreateSession("s1", harness.config);
    const auto result = harness.manager->Execute("s1", "x", Language::kPython);
    EXPECT_EQ(result.stdout_text, "done\n");
    EXPECT_TRUE(result.artifacts.empty());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("StorageUploadFailure"), std::string::npos);
}

TEST_F(SessionManagerTest, CloseSessionTerminatesAndRemoves) {
    auto session = harness.manager->GetOrCreateSession("s1", harness.config);
    harness.manager->CloseSession("s1");
    EXPECT_EQ(session->State(), SessionState::kTerminated);
    EXPECT_EQ(harness.manager->SessionCount(), 0u);
    EXPECT_EQ(harness.Backend(0)->terminates.load(), 1);
    EXPECT_EQ(CodeOf([this] { harness.manager->CloseSession("s1"); }), ErrorCode::kSessionNotFound);
}

TEST_F(SessionManagerTest, UncleanCloseReportsTerminationFailure) {
    harness.configure = [](FakeBackend& backend) {
        backend.fail_terminate = true;
        backend.fail_force_kill = true;
    };
    harness.manager->GetOrCreateSession("s1", harness.config);
    EXPECT_EQ(CodeOf([this] { harness.manager->CloseSession("s1"); }), ErrorCode::kTerminationFailure);
    EXPECT_EQ(harness.manager->GetSession("s1"), nullptr);
}

TEST_F(SessionManagerTest, UploadWithTraversalIsRejected) {
    const auto local = harness.staging_dir / "input.txt";
    std::ofstream(local) << "payload";
    harness.manager->GetOrCreateSession("s1", harness.config);
    EXPECT_EQ(CodeOf([&] { harness.manager->Upload("s1", local, "../../etc/passwd"); }), ErrorCode::kPathViolation);
    EXPECT_TRUE(harness.Backend(0)->Snapshot().empty());

    harness.manager->Upload("s1", local, "input.txt");
    const auto entries = harness.manager->ListFiles("s1", ".");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], "input.txt");
}

TEST_F(SessionManagerTest, ShutdownTerminatesEverythingAndRefusesNewSessions) {
    harness.manager->GetOrCreateSession("a", harness.config);
    harness.manager->GetOrCreateSession("b", harness.config);
    harness.manager->Shutdown();
    EXPECT_EQ(harness.manager->SessionCount(), 0u);
    EXPECT_EQ(harness.Backend(0)->terminates.load(), 1);
    EXPECT_EQ(harness.Backend(1)->terminates.load(), 1);
    EXPECT_EQ(CodeOf([this] { harness.manager->GetOrCreateSession("c", harness.config); }),
              ErrorCode::kProvisionFailure);
}

TEST_F(SessionManagerTest, ShutdownLeavesLongOperationToFinishItself) {
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    harness.configure = [&](FakeBackend& backend) {
        backend.on_run = [&entered, release_future](const std::string&, Language, OutputSink&, FakeBackend&) {
            entered.set_value();
            release_future.wait();
            return BackendRunResult{};
        };
    };
    harness.config.max_execution_time = std::chrono::seconds(5);
    auto session = harness.manager->GetOrCreateSession("s1", harness.config);
    auto running = std::async(std::launch::async, [this] {
        return harness.manager->Execute("s1", "slow", Language::kPython);
    });
    entered.get_future().wait();
    harness.manager->Shutdown();
    EXPECT_EQ(session->State(), SessionState::kTerminating);
    EXPECT_EQ(harness.Backend(0)->terminates.load(), 0);

    release.set_value();
    EXPECT_NO_THROW(running.get());
    EXPECT_EQ(session->State(), SessionState::kTerminated);
    EXPECT_EQ(harness.Backend(0)->terminates.load(), 1);
}

TEST(SessionManagerAuditTest, EveryExecutionIsAudited) {
    auto sink = std::make_shared<RecordingAuditSink>();
    auto audit = std::make_shared<kiln::integrations::AuditDispatcher>(sink);
    audit->Start();
    {
        SessionHarness harness(audit);
        harness.manager->GetOrCreateSession("s1", harness.config);
        harness.manager->Execute("s1", "print(1)", Language::kPython);
    }
    audit->Stop();
    std::lock_guard<std::mutex> lock(sink->mutex);
    ASSERT_EQ(sink->events.size(), 1u);
    EXPECT_EQ(sink->events[0].session_id, "s1");
    EXPECT_EQ(sink->events[0].language, "python");
    EXPECT_EQ(sink->events[0].code_hash, kiln::utils::Sha256Hex("print(1)"));
}
