/*
 * Labshot - sandboxed lab program runs, rendered and composed into reports
 */

#include "labshot/artifact_store.h"
#include "labshot/composer.h"
#include "labshot/config.h"
#include "labshot/errors.h"
#include "labshot/json_codec.h"
#include "labshot/orchestrator.h"
#include "labshot/process_runtime.h"
#include "labshot/renderer.h"
#include "labshot/sqlite_store.h"
#include "labshot/text_generator.h"
#include "file_utils.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace labshot;
namespace fs = std::filesystem;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " --batch tasks.json [options]\n"
              << "       " << argv0 << " --status BATCH_ID [--compose] [--order a,b]\n"
              << "       " << argv0 << " --cancel BATCH_ID\n\n"
              << "Options:\n"
              << "  --config FILE      JSON config, flags below override it\n"
              << "  --db FILE          SQLite database (default labshot.db)\n"
              << "  --artifacts DIR    Artifact directory (default artifacts)\n"
              << "  --workers N        Concurrent pipelines (default " << DEFAULT_WORKERS << ")\n"
              << "  --timeout S        Wall-clock limit per run (default "
              << DEFAULT_TIMEOUT_SECONDS << ")\n"
              << "  --document FILE    Document the composer anchors into\n"
              << "  --order a,b,...    Task order for the composed document\n"
              << "  --compose          Compose once the batch is finished\n"
              << std::endl;
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

int parse_positive(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used == value.size() && parsed > 0) {
            return parsed;
        }
    } catch (const std::exception&) {
        // Reported below
    }
    throw ConfigError(flag + " expects a positive integer, got '" + value + "'");
}

} // namespace

int main(int argc, char* argv[]) {
    std::string batch_file;
    std::string config_file;
    std::string document_file;
    std::string status_id;
    std::string cancel_id;
    std::string order;
    std::string db_path;
    std::string artifact_dir;
    std::string workers;
    std::string timeout;
    bool compose = false;

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--batch" && i + 1 < argc) {
            batch_file = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            db_path = argv[++i];
        } else if (arg == "--artifacts" && i + 1 < argc) {
            artifact_dir = argv[++i];
        } else if (arg == "--workers" && i + 1 < argc) {
            workers = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout = argv[++i];
        } else if (arg == "--document" && i + 1 < argc) {
            document_file = argv[++i];
        } else if (arg == "--order" && i + 1 < argc) {
            order = argv[++i];
        } else if (arg == "--status" && i + 1 < argc) {
            status_id = argv[++i];
        } else if (arg == "--cancel" && i + 1 < argc) {
            cancel_id = argv[++i];
        } else if (arg == "--compose") {
            compose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    if (batch_file.empty() && status_id.empty() && cancel_id.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    Config config;
    try {
        if (!config_file.empty()) {
            config = Config::load_file(config_file);
        }
        if (!db_path.empty()) config.database_path = db_path;
        if (!artifact_dir.empty()) config.artifact_dir = artifact_dir;
        if (!workers.empty()) config.workers = parse_positive("--workers", workers);
        if (!timeout.empty()) config.timeout_seconds = parse_positive("--timeout", timeout);
        config.check();
    } catch (const ConfigError& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return 2;
    }

    try {
        SqliteTaskStore store(config.database_path);
        ArtifactStore artifacts(config.artifact_dir);

        if (!cancel_id.empty() || !status_id.empty()) {
            // No workers needed to read or cancel; pending tasks fail at once
            std::string batch_id = cancel_id.empty() ? status_id : cancel_id;
            if (!cancel_id.empty()) {
                auto skipped = cancel_pending(store, batch_id);
                if (skipped) {
                    std::cout << "[Main] Cancelled " << batch_id << ", " << *skipped
                              << " pending tasks skipped" << std::endl;
                }
            }

            auto report = load_status_report(store, batch_id);
            if (!report) {
                std::cerr << "[Main] Unknown batch " << batch_id << std::endl;
                return 1;
            }
            std::cout << to_json_string(to_json(*report)) << std::endl;

            if (compose) {
                ReportComposer composer(store, artifacts);
                auto composed = composer.compose(batch_id, split_list(order));
                std::cout << to_json_string(to_json(composed)) << std::endl;
            }
            return report->aggregate == BatchStatus::COMPLETED ? 0 : 1;
        }

        BatchSubmission submission = parse_batch(FileUtils::read_file(batch_file));
        if (!document_file.empty()) {
            submission.document = FileUtils::read_file(document_file);
        }

        std::error_code ec;
        fs::create_directories(config.work_dir, ec);
        if (ec) {
            std::cerr << "[Main] Cannot create work directory " << config.work_dir << ": "
                      << ec.message() << std::endl;
            return 1;
        }

        ProcessRuntimeOptions runtime_options;
        runtime_options.work_root = config.work_dir;
        runtime_options.cgroup_root = config.cgroup_root;
        runtime_options.require_seccomp = config.require_seccomp;
        runtime_options.require_isolation = config.require_isolation;
        SandboxExecutor executor(std::make_unique<ProcessRuntime>(runtime_options),
                                 config.workers);

        auto panes = std::make_shared<const PaneRenderer>(config.font_path, config.font_size);
        PngArtifactRenderer renderer(panes, artifacts);
        TextService text(std::make_shared<TemplateTextGenerator>(), config.text_policy());

        JobOrchestrator orchestrator(store, executor, renderer, text,
                                     OrchestratorOptions::from_config(config));
        orchestrator.start();

        std::string batch_id = orchestrator.submit_batch(submission);
        std::cout << "[Main] Submitted batch " << batch_id << std::endl;

        while (!orchestrator.wait_for_batch(batch_id, std::chrono::seconds(5))) {
            std::cout << "[Main] Waiting for " << batch_id << " (" << orchestrator.queued()
                      << " queued, " << executor.live_environments() << " running)" << std::endl;
        }

        auto report = orchestrator.get_batch_status(batch_id);
        orchestrator.stop();
        if (!report) {
            std::cerr << "[Main] Batch " << batch_id << " disappeared" << std::endl;
            return 1;
        }
        std::cout << to_json_string(to_json(*report)) << std::endl;

        if (compose) {
            ReportComposer composer(store, artifacts);
            auto composed = composer.compose(batch_id, split_list(order));
            std::cout << to_json_string(to_json(composed)) << std::endl;
        }
        return report->aggregate == BatchStatus::COMPLETED ? 0 : 1;
    } catch (const InvalidBatchError& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        return 1;
    }
}
