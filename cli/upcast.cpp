/*
 * upcast - Upload queue command line tool
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "upcast/config.hpp"
#include "upcast/credentials.hpp"
#include "upcast/job.hpp"
#include "upcast/jsonfile.hpp"
#include "upcast/logger.hpp"
#include "upcast/orchestrator.hpp"
#include "upcast/platforms.hpp"
#include "upcast/queue.hpp"
#include "upcast/store.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace upcast;

constexpr const char* VERSION = "0.1.0";

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitFailures = 2;

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_interrupted = 0;

void signalHandler(int signal) {
    (void)signal;
    g_interrupted = 1;
}

struct CliContext {
    std::filesystem::path configPath;
    nlohmann::json config = nlohmann::json::object();
    Settings settings;
    CredentialStore credentials;
    bool color = false;
};

void printUsage(const char* progName) {
    std::cout << "upcast Multi-platform Video Upload Queue v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [--workspace <dir>] [--config <file>] <command> [args]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Commands:\n";
    std::cout << "  add <file>...                 Queue video files\n";
    std::cout << "  list                          Show the queue\n";
    std::cout << "  show <id>                     Show one job with its platform tasks\n";
    std::cout << "  edit <id> [fields]            Edit metadata of a pending job\n";
    std::cout << "      --title <text>  --description <text>  --tags a,b,c\n";
    std::cout << "      --platforms youtube,instagram  --privacy public|private\n";
    std::cout << "  remove <id>                   Remove a job that is not uploading\n";
    std::cout << "  upload <id> | --all           Upload one job or every pending job\n";
    std::cout << "  retry <id> <platform>         Re-run a failed platform upload\n";
    std::cout << "  credentials show              List stored credentials\n";
    std::cout << "  credentials set <platform> key=value...\n\n";
    std::cout << "Options:\n";
    std::cout << "  --workspace <dir>  Job storage directory (default: " << kDefaultWorkspace << ")\n";
    std::cout << "  --config <file>    Configuration file (default: " << kDefaultConfigFile << ")\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "  -v, --version      Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  UPCAST_LOG_LEVEL              Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  UPCAST_WORKSPACE              Job storage directory\n";
    std::cout << "  UPCAST_MAX_CONCURRENCY        Parallel platform uploads (default: 4)\n";
    std::cout << "  UPCAST_UPLOAD_TIMEOUT_MS      Per-upload time limit\n";
    std::cout << "  UPCAST_ADMISSION_INTERVAL_MS  Delay between jobs in upload --all\n";
    std::cout << "  UPCAST_CHUNK_SIZE             Upload chunk size in bytes\n";
    std::cout << "  UPCAST_CHUNK_DELAY_MS         Delay between chunks\n\n";
    std::cout << "Exit status: 0 ok, 1 error, 2 upload finished with failures\n";
}

std::string paint(const CliContext& ctx, const char* code, const std::string& text) {
    if (!ctx.color) {
        return text;
    }
    return std::string("\033[") + code + "m" + text + "\033[0m";
}

const char* statusColor(TaskStatus status) {
    switch (status) {
        case TaskStatus::Succeeded: return "32";
        case TaskStatus::Failed: return "31";
        case TaskStatus::Uploading: return "36";
        default: return "33";
    }
}

const char* statusColor(JobStatus status) {
    switch (status) {
        case JobStatus::Completed: return "32";
        case JobStatus::Failed: return "31";
        case JobStatus::Uploading: return "36";
        default: return "90";
    }
}

std::optional<JobId> parseId(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return static_cast<JobId>(std::stoull(text));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string formatTime(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return out.str();
}

std::string percent(double fraction) {
    return std::to_string(static_cast<int>(fraction * 100.0 + 0.5)) + "%";
}

int reportError(const std::string& what, ErrorCode error, const std::string& message) {
    std::cerr << "Error: " << what << " (" << toString(error) << ")";
    if (!message.empty()) {
        std::cerr << ": " << message;
    }
    std::cerr << "\n";
    return kExitError;
}

bool saveConfig(CliContext& ctx) {
    ctx.credentials.storeTo(ctx.config);
    if (!saveJson(ctx.configPath, ctx.config)) {
        std::cerr << "Error: Cannot write " << ctx.configPath.string() << "\n";
        return false;
    }
    return true;
}

int cmdCredentials(CliContext& ctx, const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "show") {
        auto platforms = ctx.credentials.platforms();
        if (platforms.empty()) {
            std::cout << "No credentials stored in " << ctx.configPath.string() << "\n";
            return kExitOk;
        }
        for (const auto& platform : platforms) {
            auto creds = ctx.credentials.get(platform);
            std::cout << paint(ctx, "1", platform)
                      << (creds.authenticated ? paint(ctx, "32", "  authenticated") : paint(ctx, "90", "  not authenticated"))
                      << "\n";
            for (const auto& [key, value] : creds.fields) {
                std::cout << "    " << std::left << std::setw(16) << key
                          << (trim(value).empty() ? "(empty)" : "********") << "\n";
            }
        }
        return kExitOk;
    }

    if (args[0] != "set" || args.size() < 3) {
        std::cerr << "Usage: upcast credentials set <platform> key=value...\n";
        return kExitError;
    }

    const PlatformId& platform = args[1];
    for (std::size_t i = 2; i < args.size(); ++i) {
        auto eq = args[i].find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Error: Expected key=value, got '" << args[i] << "'\n";
            return kExitError;
        }
        ctx.credentials.set(platform, trim(args[i].substr(0, eq)), args[i].substr(eq + 1));
    }

    if (!saveConfig(ctx)) {
        return kExitError;
    }
    std::cout << "Saved " << platform << " credentials to " << ctx.configPath.string() << "\n";
    return kExitOk;
}

int cmdAdd(QueueManager& queue, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: upcast add <file>...\n";
        return kExitError;
    }

    int exitCode = kExitOk;
    for (const auto& file : args) {
        auto result = queue.add(file);
        if (result) {
            // Just the job ID, clean for piping
            std::cout << result.id << std::endl;
        } else {
            exitCode = reportError("Cannot add " + file, result.error, result.message);
        }
    }
    return exitCode;
}

int cmdList(const CliContext& ctx, const QueueManager& queue) {
    auto jobs = queue.list();
    if (jobs.empty()) {
        std::cout << "Queue is empty\n";
        return kExitOk;
    }

    std::cout << paint(ctx, "90", "  ID  STATUS      PLATFORMS            TITLE") << "\n";
    for (const auto& job : jobs) {
        std::ostringstream status;
        status << std::left << std::setw(10) << toString(job.status());
        std::ostringstream platforms;
        platforms << std::left << std::setw(20) << (job.platforms.empty() ? "-" : joinList(job.platforms));

        std::cout << std::right << std::setw(4) << job.id << "  "
                  << paint(ctx, statusColor(job.status()), status.str()) << "  "
                  << platforms.str() << " " << job.title << "\n";
    }
    return kExitOk;
}

void printJob(const CliContext& ctx, const Job& job) {
    std::cout << paint(ctx, "1", "Job " + std::to_string(job.id)) << "  "
              << paint(ctx, statusColor(job.status()), toString(job.status())) << "\n";
    std::cout << "    File         " << job.path.string() << "\n";
    std::cout << "    Title        " << job.title << "\n";
    if (!job.description.empty()) {
        std::cout << "    Description  " << job.description << "\n";
    }
    std::cout << "    Tags         " << (job.tags.empty() ? "-" : joinList(job.tags, ", ")) << "\n";
    std::cout << "    Platforms    " << (job.platforms.empty() ? "-" : joinList(job.platforms, ", ")) << "\n";
    std::cout << "    Privacy      " << toString(job.privacy) << "\n";
    std::cout << "    Added        " << formatTime(job.created) << "\n";

    if (!job.tasks.empty()) {
        std::cout << "\n";
        for (const auto& task : job.tasks) {
            std::ostringstream status;
            status << std::left << std::setw(10) << toString(task.status);
            std::cout << "    " << std::left << std::setw(12) << task.platform
                      << paint(ctx, statusColor(task.status), status.str()) << " "
                      << std::right << std::setw(4) << percent(task.progress);
            if (task.detail) {
                std::cout << "  " << *task.detail;
            }
            std::cout << "\n";
        }
    }
}

int cmdShow(const CliContext& ctx, const QueueManager& queue, const std::vector<std::string>& args) {
    auto id = args.size() == 1 ? parseId(args[0]) : std::nullopt;
    if (!id) {
        std::cerr << "Usage: upcast show <id>\n";
        return kExitError;
    }
    auto job = queue.get(*id);
    if (!job) {
        return reportError("Job " + args[0], ErrorCode::NotFound, "");
    }
    printJob(ctx, *job);
    return kExitOk;
}

int cmdEdit(QueueManager& queue, const std::vector<std::string>& args) {
    auto id = args.empty() ? std::nullopt : parseId(args[0]);
    if (!id) {
        std::cerr << "Usage: upcast edit <id> [--title T] [--description D] [--tags a,b] "
                     "[--platforms p,q] [--privacy public|private]\n";
        return kExitError;
    }

    JobUpdate update;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (i + 1 >= args.size()) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return kExitError;
        }
        const std::string& value = args[++i];
        if (arg == "--title") {
            update.title = value;
        } else if (arg == "--description") {
            update.description = value;
        } else if (arg == "--tags") {
            auto tags = parseTagList(value);
            update.tags = std::vector<std::string>(tags.begin(), tags.end());
        } else if (arg == "--platforms") {
            update.platforms = parseTagList(value);
        } else if (arg == "--privacy") {
            auto privacy = parsePrivacy(value);
            if (!privacy) {
                std::cerr << "Error: Privacy must be public or private\n";
                return kExitError;
            }
            update.privacy = *privacy;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return kExitError;
        }
    }

    if (auto result = queue.update(*id, update); !result) {
        return reportError("Cannot edit job " + args[0], result.error, result.message);
    }
    return kExitOk;
}

int cmdRemove(QueueManager& queue, const std::vector<std::string>& args) {
    auto id = args.size() == 1 ? parseId(args[0]) : std::nullopt;
    if (!id) {
        std::cerr << "Usage: upcast remove <id>\n";
        return kExitError;
    }
    if (auto result = queue.remove(*id); !result) {
        return reportError("Cannot remove job " + args[0], result.error, result.message);
    }
    return kExitOk;
}

// Prints progress lines until the handle settles; SIGINT cancels it.
int follow(const CliContext& ctx, UploadHandle handle) {
    std::mutex outputMutex;
    std::map<std::pair<JobId, PlatformId>, int> lastStep;

    handle.subscribe([&](const TaskProgress& update) {
        std::lock_guard<std::mutex> lock(outputMutex);
        int step = static_cast<int>(update.progress * 4.0);
        auto key = std::make_pair(update.job, update.platform);
        if (update.status == TaskStatus::Uploading) {
            auto it = lastStep.find(key);
            if (it != lastStep.end() && it->second >= step) {
                return;
            }
            lastStep[key] = step;
        }

        std::ostringstream status;
        status << std::left << std::setw(10) << toString(update.status);
        std::cout << "  job " << std::left << std::setw(4) << update.job << " "
                  << std::setw(10) << update.platform << " "
                  << paint(ctx, statusColor(update.status), status.str()) << " "
                  << std::right << std::setw(4) << percent(update.progress);
        if (update.detail) {
            std::cout << "  " << *update.detail;
        }
        std::cout << std::endl;
    });

    bool cancelRequested = false;
    while (!handle.waitFor(std::chrono::milliseconds(100))) {
        if (g_interrupted && !cancelRequested) {
            cancelRequested = true;
            std::lock_guard<std::mutex> lock(outputMutex);
            std::cout << paint(ctx, "33", "  Cancelling...") << std::endl;
            handle.cancel();
        }
    }

    auto tasks = handle.snapshot();
    std::size_t failed = handle.failedCount();
    {
        std::lock_guard<std::mutex> lock(outputMutex);
        if (tasks.empty()) {
            std::cout << "Nothing to upload\n";
        } else if (failed == 0) {
            std::cout << paint(ctx, "32", "  " + std::to_string(tasks.size()) + " upload(s) succeeded") << "\n";
        } else {
            std::cout << paint(ctx, "31", "  " + std::to_string(failed) + " of " +
                                          std::to_string(tasks.size()) + " upload(s) failed") << "\n";
        }
    }
    return failed == 0 ? kExitOk : kExitFailures;
}

int cmdUpload(const CliContext& ctx, Orchestrator& orchestrator, const std::vector<std::string>& args) {
    DispatchResult dispatched;
    if (args.size() == 1 && args[0] == "--all") {
        dispatched = orchestrator.uploadAll();
    } else if (auto id = args.size() == 1 ? parseId(args[0]) : std::nullopt) {
        dispatched = orchestrator.uploadOne(*id);
    } else {
        std::cerr << "Usage: upcast upload <id> | --all\n";
        return kExitError;
    }

    if (!dispatched) {
        return reportError("Cannot start upload", dispatched.error, dispatched.message);
    }

    return follow(ctx, dispatched.handle);
}

int cmdRetry(const CliContext& ctx, Orchestrator& orchestrator, const std::vector<std::string>& args) {
    auto id = args.size() == 2 ? parseId(args[0]) : std::nullopt;
    if (!id) {
        std::cerr << "Usage: upcast retry <id> <platform>\n";
        return kExitError;
    }

    auto dispatched = orchestrator.retry(*id, args[1]);
    if (!dispatched) {
        return reportError("Cannot retry " + args[1] + " upload of job " + args[0],
                           dispatched.error, dispatched.message);
    }

    return follow(ctx, dispatched.handle);
}

int main(int argc, char* argv[]) {
    // Default to WARN so stdout stays clean; UPCAST_LOG_LEVEL overrides
    if (!std::getenv("UPCAST_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);
    setThreadName("Main");

    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return kExitOk;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return kExitOk;
        }
    }

    CliContext ctx;
    ctx.configPath = kDefaultConfigFile;
    std::optional<std::filesystem::path> workspaceFlag;

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--workspace" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a path\n";
                return kExitError;
            }
            if (arg == "--workspace") {
                workspaceFlag = argv[++i];
            } else {
                ctx.configPath = argv[++i];
            }
        } else {
            break;
        }
    }

    if (i >= argc) {
        printUsage(argv[0]);
        return kExitError;
    }

    std::string command = argv[i];
    std::vector<std::string> args(argv + i + 1, argv + argc);

    auto config = loadJson(ctx.configPath);
    if (!config) {
        std::cerr << "Error: Cannot read configuration " << ctx.configPath.string() << "\n";
        return kExitError;
    }
    ctx.config = std::move(*config);
    ctx.settings = settingsFrom(ctx.config);
    applyEnvironment(ctx.settings);
    if (workspaceFlag) {
        ctx.settings.workspace = *workspaceFlag;
    }
    if (!ctx.settings.logFile.empty() && !Logger::setLogFile(ctx.settings.logFile)) {
        std::cerr << "Warning: Cannot open log file " << ctx.settings.logFile.string() << "\n";
    }
    ctx.credentials.loadFrom(ctx.config);
    ctx.color = isatty(STDOUT_FILENO) != 0;

    if (command == "credentials") {
        return cmdCredentials(ctx, args);
    }

    try {
        JobStore store(ctx.settings.workspace, true);
        if (!store.isReady()) {
            std::cerr << "Error: Cannot use workspace " << ctx.settings.workspace.string() << "\n";
            return kExitError;
        }

        auto registry = makeDefaultRegistry(ctx.credentials, transferOptionsFrom(ctx.settings));
        QueueManager queue(registry, &store);
        queue.load();

        if (command == "add") return cmdAdd(queue, args);
        if (command == "list") return cmdList(ctx, queue);
        if (command == "show") return cmdShow(ctx, queue, args);
        if (command == "edit") return cmdEdit(queue, args);
        if (command == "remove") return cmdRemove(queue, args);

        if (command == "upload" || command == "retry") {
            std::signal(SIGINT, signalHandler);
            std::signal(SIGTERM, signalHandler);

            Orchestrator orchestrator(queue, registry, ctx.settings);
            if (!orchestrator.start()) {
                std::cerr << "Error: Failed to start upload workers\n";
                return kExitError;
            }
            return command == "upload" ? cmdUpload(ctx, orchestrator, args)
                                       : cmdRetry(ctx, orchestrator, args);
        }

        std::cerr << "Error: Unknown command '" << command << "'\n\n";
        printUsage(argv[0]);
        return kExitError;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << "\n";
        return kExitError;
    }
}
