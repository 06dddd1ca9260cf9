#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "artifacts/artifact_processor.hpp"
#include "backends/adapter_factory.hpp"
#include "config/config_loader.hpp"
#include "integrations/audit.hpp"
#include "integrations/secrets.hpp"
#include "runtime/sandbox_error.hpp"
#include "session/session_manager.hpp"
#include "tools/call_workers.hpp"
#include "tools/sandbox_tools.hpp"
#include "tools/tool_registry.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    // No SA_RESTART: a blocked read on stdin returns so the loop can exit.
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

// Everything one kiln process needs, wired from the loaded configuration.
struct Service {
    kiln::config::Config config;
    kiln::runtime::RuntimeConfig session_config;
    std::shared_ptr<kiln::integrations::AuditDispatcher> audit;
    std::shared_ptr<kiln::session::SessionManager> manager;
    kiln::tools::ToolRegistry tools;

    ~Service() {
        if (manager) {
            manager->Shutdown();
        }
        if (audit) {
            audit->Stop();
        }
    }
};

std::unique_ptr<Service> BuildService(bool start_reaper) {
    auto service = std::make_unique<Service>();
    service->config = kiln::config::LoadConfig();
    kiln::utils::LogConfig log_config{};
    log_config.min_level = kiln::utils::ParseLogLevel(service->config.logging.level);
    kiln::utils::ConfigureLogging(log_config);

    service->session_config = kiln::config::MakeRuntimeConfig(service->config);

    const kiln::integrations::EnvSecretsProvider secrets{};
    auto factory = std::make_shared<kiln::backends::AdapterFactory>(service->config, secrets);
    auto storage = kiln::backends::CreateObjectStorage(service->config, secrets);

    kiln::artifacts::ArtifactOptions artifact_options{};
    artifact_options.max_artifact_bytes = service->config.artifacts.max_artifact_bytes;
    artifact_options.staging_dir = service->config.artifacts.staging_dir;
    kiln::artifacts::ArtifactProcessor processor(artifact_options, std::move(storage));

    if (service->config.audit.enabled) {
        service->audit = std::make_shared<kiln::integrations::AuditDispatcher>(
            std::make_shared<kiln::integrations::LogAuditSink>());
        service->audit->Start();
    }

    kiln::session::SessionManagerOptions options{};
    options.reaper_interval = std::chrono::seconds(service->config.reaper.interval_s);
    options.shutdown_grace = std::chrono::seconds(service->config.reaper.shutdown_grace_s);
    service->manager = std::make_shared<kiln::session::SessionManager>(
        std::move(factory), std::move(processor), service->audit, options);
    if (start_reaper) {
        service->manager->StartReaper();
    }

    kiln::tools::RegisterSandboxTools(service->tools, {service->manager, service->session_config});
    return service;
}

kiln::tools::ToolParams ToParams(const nlohmann::json& json) {
    kiln::tools::ToolParams params;
    if (!json.is_object()) {
        return params;
    }
    for (const auto& item : json.items()) {
        if (item.value().is_string()) {
            params[item.key()] = item.value().get<std::string>();
        } else {
            params[item.key()] = item.value().dump();
        }
    }
    return params;
}

int RunServe() {
    auto service = BuildService(true);
    InstallSignalHandlers();

    std::mutex output_mutex;
    kiln::tools::CallWorkers workers;
    kiln::utils::LogInfo("session", "serving tool calls on stdin",
                         {{"backend", kiln::runtime::ToString(service->session_config.backend_kind)}});

    std::string line;
    while (g_signal == 0 && std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        auto request = nlohmann::json::parse(line, nullptr, false);
        if (request.is_discarded() || !request.is_object() || !request.contains("tool")) {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << nlohmann::json{{"output", "Error: expected {\"tool\":...,\"params\":{...}}"}}.dump()
                      << std::endl;
            continue;
        }
        // Calls on different sessions run concurrently; each reply carries
        // the request id, if one was given.
        workers.Spawn([&service, &output_mutex, request]() {
            const auto name = request.value("tool", "");
            const auto output = service->tools.Execute(
                name, ToParams(request.contains("params") ? request["params"] : nlohmann::json::object()));
            nlohmann::json reply{{"tool", name}, {"output", output}};
            if (request.contains("id")) {
                reply["id"] = request["id"];
            }
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << reply.dump() << std::endl;
        });
    }

    if (g_signal != 0) {
        kiln::utils::LogInfo("session", "signal received; shutting down", {{"signal", std::to_string(g_signal)}});
        const auto grace = std::chrono::seconds(service->config.reaper.shutdown_grace_s + 5);
        std::thread([grace] {
            std::this_thread::sleep_for(grace);
            std::_Exit(130);
        }).detach();
        service->manager->Shutdown();
    }
    workers.JoinAll();
    return 0;
}

std::string ReadCodeArgument(const std::string& value) {
    if (value != "-") {
        return value;
    }
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

// One-shot commands run on a throwaway session that is closed afterwards.
int RunOneShot(const std::string& tool, const kiln::tools::ToolParams& params) {
    auto service = BuildService(false);
    InstallSignalHandlers();
    const auto output = service->tools.Execute(tool, params);
    std::cout << output << std::endl;
    const auto session_id = params.at("session_id");
    if (service->manager->GetSession(session_id)) {
        try {
            service->manager->CloseSession(session_id);
        } catch (const kiln::runtime::SandboxError& ex) {
            kiln::utils::LogWarn("session", "close failed", {{"session", session_id}, {"error", ex.what()}});
        }
    }
    return output.rfind("Error:", 0) == 0 ? 1 : 0;
}

int ListTools() {
    auto service = BuildService(false);
    nlohmann::json json = nlohmann::json::array();
    for (const auto& def : service->tools.GetDefinitions()) {
        json.push_back({
            {"name", def.name},
            {"description", def.description},
            {"parameters", nlohmann::json::parse(def.parameters_json)}
        });
    }
    std::cout << json.dump(2) << std::endl;
    return 0;
}

int ShowConfig() {
    const auto config = kiln::config::LoadConfig();
    std::cout << kiln::config::DescribeConfig(config) << std::endl;
    return 0;
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  kiln serve\n"
              << "  kiln exec <session> <python|bash|r> <code|->\n"
              << "  kiln install <session> <package>\n"
              << "  kiln ls <session> [path]\n"
              << "  kiln tools\n"
              << "  kiln config" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    try {
        if (command == "serve") {
            return RunServe();
        }
        if (command == "exec" && argc >= 5) {
            return RunOneShot("execute_code",
                              {{"session_id", argv[2]}, {"language", argv[3]}, {"code", ReadCodeArgument(argv[4])}});
        }
        if (command == "install" && argc >= 4) {
            return RunOneShot("install_package", {{"session_id", argv[2]}, {"package_name", argv[3]}});
        }
        if (command == "ls" && argc >= 3) {
            return RunOneShot("list_files", {{"session_id", argv[2]}, {"path", argc >= 4 ? argv[3] : "."}});
        }
        if (command == "tools") {
            return ListTools();
        }
        if (command == "config") {
            return ShowConfig();
        }
    } catch (const std::exception& ex) {
        std::cerr << "kiln: " << ex.what() << std::endl;
        return 1;
    }
    PrintUsage();
    return 1;
}
