#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <google/protobuf/text_format.h>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"

#include "syncpoint/common/logger.h"
#include "syncpoint/endpoint/config.h"
#include "syncpoint/endpoint/endpoint.h"

namespace {
std::atomic<bool> running{true};

void SignalHandler(int /*signal*/) {
    running.store(false);
}

std::string ExpandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return path;
    }
    if (path.size() == 1) {
        return std::string(home);
    }
    if (path[1] == '/') {
        return std::string(home) + path.substr(1);
    }
    return path;  // ~user forms are left alone
}

void PrintNode(const syncpoint::Node& node) {
    std::string text;
    if (!google::protobuf::TextFormat::PrintToString(node, &text)) {
        std::cerr << "Failed to format node " << node.path() << std::endl;
        return;
    }
    std::cout << text << "---" << std::endl;
}

int Fail(const absl::Status& status) {
    std::cerr << "Error: " << status << std::endl;
    return 1;
}

int RunWalk(syncpoint::Endpoint& endpoint, const std::vector<std::string>& args) {
    int failures = 0;
    endpoint.Walk(
        [&failures](const std::string& path, const absl::StatusOr<syncpoint::Node>& node) {
            if (!node.ok()) {
                ++failures;
                std::cerr << path << ": " << node.status() << std::endl;
                return;
            }
            PrintNode(*node);
        },
        args);
    return failures == 0 ? 0 : 1;
}

int RunCat(syncpoint::Endpoint& endpoint, const std::string& path) {
    auto reader = endpoint.GetReaderOn(path);
    if (!reader.ok()) {
        return Fail(reader.status());
    }
    std::cout << (*reader)->rdbuf();
    std::cout.flush();
    return 0;
}

int RunPut(syncpoint::Endpoint& endpoint, const std::string& path, const std::string& local) {
    std::ifstream in(local, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "Error: cannot open " << local << std::endl;
        return 1;
    }

    auto writer = endpoint.GetWriterOn(path);
    if (!writer.ok()) {
        return Fail(writer.status());
    }
    **writer << in.rdbuf();
    (*writer)->flush();
    if (!**writer) {
        std::cerr << "Error: failed to write " << path << std::endl;
        return 1;
    }
    return 0;
}

int RunWatch(syncpoint::Endpoint& endpoint, const std::string& sub_path, int64_t duration_s) {
    auto session = endpoint.Watch(sub_path);
    if (!session.ok()) {
        return Fail(session.status());
    }

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration_s);
    auto& events = (*session)->Events();
    auto& errors = (*session)->Errors();

    std::cout << "Watching " << sub_path << ", press Ctrl+C to stop" << std::endl;
    while (running.load()) {
        if (duration_s > 0 && std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        if (auto event = events.ReceiveFor(std::chrono::milliseconds(200))) {
            std::cout << syncpoint::DescribeEvent(*event) << std::endl;
        }
        while (auto error = errors.TryReceive()) {
            std::cerr << "Watch error: " << *error << std::endl;
        }
        if (events.IsDrained()) {
            break;
        }
    }

    // Buffered changes are still delivered after cancelling
    (*session)->Cancel();
    while (auto event = events.Receive()) {
        std::cout << syncpoint::DescribeEvent(*event) << std::endl;
    }
    while (auto error = errors.Receive()) {
        std::cerr << "Watch error: " << *error << std::endl;
    }
    return 0;
}
}  // namespace

ABSL_FLAG(std::string, config, "~/.config/syncpoint/config.json", "Path to the configuration file");
ABSL_FLAG(std::string, root, "", "Endpoint root directory, overrides root_path from the config");
ABSL_FLAG(int64_t, duration_s, 0, "Stop 'watch' after this many seconds (0: until Ctrl+C)");

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(
        "syncpoint: a directory tree exposed as a synchronization endpoint.\n\n"
        "Usage:\n"
        "  syncpoint [--config path] [--root dir] <command> [args...]\n\n"
        "Commands:\n"
        "  walk [paths...]         Print every node below the given paths (default: all)\n"
        "  stat <path>             Print one node\n"
        "  mkdir <path>            Create a directory node\n"
        "  rm <path>               Delete a node recursively\n"
        "  mv <old> <new>          Move a node\n"
        "  cat <path>              Print the content of a file node\n"
        "  put <path> <local>      Write a local file into a file node\n"
        "  watch [sub-path]        Print changes until Ctrl+C or --duration_s\n\n"
        "Examples:\n"
        "  syncpoint --root ~/Documents walk\n"
        "  syncpoint --root ~/Documents mv /drafts /archive/drafts\n"
        "  syncpoint --root ~/Documents --duration_s 60 watch /projects"
    );
    std::vector<char*> args = absl::ParseCommandLine(argc, argv);

    if (args.size() < 2) {
        std::cerr << "Error: missing command, see --help" << std::endl;
        return 1;
    }
    const std::string command = args[1];
    const std::vector<std::string> command_args(args.begin() + 2, args.end());

    const std::string config_path = ExpandPath(absl::GetFlag(FLAGS_config));
    syncpoint::EndpointConfig config;
    auto load_status = config.Load(config_path);
    if (absl::IsNotFound(load_status)) {
        LOG_DEBUG("Config not found at " + config_path + ", using defaults");
    } else if (!load_status.ok()) {
        return Fail(load_status);
    }

    const std::string root_flag = absl::GetFlag(FLAGS_root);
    if (!root_flag.empty()) {
        config.SetRootPath(ExpandPath(root_flag));
    }

    if (auto level = syncpoint::ParseLogLevel(config.GetLogLevel())) {
        syncpoint::Logger::Instance().SetLevel(*level);
    } else {
        LOG_WARNING("Unknown log level '" + config.GetLogLevel() + "', keeping info");
    }
    if (!config.GetLogPath().empty() &&
        !syncpoint::Logger::Instance().SetOutputFile(ExpandPath(config.GetLogPath().string()))) {
        LOG_WARNING("Cannot open log file " + config.GetLogPath().string());
    }

    std::shared_ptr<syncpoint::Endpoint> endpoint;
    try {
        endpoint = syncpoint::Endpoint::Open(config.GetRootPath(), config.ToEndpointOptions());
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto require_args = [&command, &command_args](size_t count, const char* usage) {
        if (command_args.size() < count) {
            std::cerr << "Error: " << command << " requires arguments\n";
            std::cerr << "Usage: " << usage << "\n";
            return false;
        }
        return true;
    };

    if (command == "walk") {
        return RunWalk(*endpoint, command_args);

    } else if (command == "stat") {
        if (!require_args(1, "stat <path>")) {
            return 1;
        }
        auto node = endpoint->LoadNode(command_args[0]);
        if (!node.ok()) {
            return Fail(node.status());
        }
        PrintNode(*node);
        return 0;

    } else if (command == "mkdir") {
        if (!require_args(1, "mkdir <path>")) {
            return 1;
        }
        syncpoint::Node node;
        node.set_path(command_args[0]);
        node.set_type(syncpoint::COLLECTION);
        auto status = endpoint->CreateNode(node);
        return status.ok() ? 0 : Fail(status);

    } else if (command == "rm") {
        if (!require_args(1, "rm <path>")) {
            return 1;
        }
        auto status = endpoint->DeleteNode(command_args[0]);
        return status.ok() ? 0 : Fail(status);

    } else if (command == "mv") {
        if (!require_args(2, "mv <old> <new>")) {
            return 1;
        }
        auto status = endpoint->MoveNode(command_args[0], command_args[1]);
        return status.ok() ? 0 : Fail(status);

    } else if (command == "cat") {
        if (!require_args(1, "cat <path>")) {
            return 1;
        }
        return RunCat(*endpoint, command_args[0]);

    } else if (command == "put") {
        if (!require_args(2, "put <path> <local-file>")) {
            return 1;
        }
        return RunPut(*endpoint, command_args[0], command_args[1]);

    } else if (command == "watch") {
        const std::string sub_path = command_args.empty() ? "/" : command_args[0];
        return RunWatch(*endpoint, sub_path, absl::GetFlag(FLAGS_duration_s));
    }

    std::cerr << "Error: unknown command: " << command << std::endl;
    return 1;
}
