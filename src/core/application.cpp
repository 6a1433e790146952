/*
 * mdguard C++17 - Application Implementation
 */
#include <mdguard/core/application.hpp>
#include <mdguard/core/errors.hpp>
#include <mdguard/core/logger.hpp>
#include <mdguard/core/utils.hpp>

#include <iostream>
#include <iterator>
#include <cstring>
#include <unistd.h>

namespace mdguard {

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - Markdown chunk planner and span guard\n\n"
              << "Usage: " << prog << " [options] [INPUT]\n\n"
              << "Reads Markdown from INPUT (or stdin) and prints the chunk plan as JSON.\n\n"
              << "Options:\n"
              << "  -h, --help       Show this help message\n"
              << "  -v, --version    Show version\n"
              << "  --config FILE    Read settings from FILE (default: config.json if present)\n"
              << "  --dry-run        Run the full pipeline with an identity transform and\n"
              << "                   fail unless the output equals the input\n\n"
              << "Example:\n"
              << "  " << prog << " --config config.json README.md\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

} // anonymous namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : config_file_("config.json")
    , config_file_explicit_(false)
    , dry_run_(false)
    , exit_code_(0)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                LOG_ERROR("--config needs a file argument");
                exit_code_ = 2;
                return false;
            }
            config_file_ = std::string(argv[++i]);
            config_file_explicit_ = true;
            continue;
        }
        if (strcmp(argv[i], "--dry-run") == 0) {
            dry_run_ = true;
            continue;
        }
        if (argv[i][0] == '-' && strcmp(argv[i], "-") != 0) {
            LOG_ERROR("Unknown option: %s", argv[i]);
            print_usage(argv[0]);
            exit_code_ = 2;
            return false;
        }
        if (!input_path_.empty()) {
            LOG_ERROR("Only one input file is supported (got %s and %s)", input_path_.c_str(), argv[i]);
            exit_code_ = 2;
            return false;
        }
        input_path_ = argv[i];
    }
    return true;
}

bool Application::load_config() {
    // The default file is optional; an explicit one must load
    if (!config_file_explicit_ && access(config_file_.c_str(), F_OK) != 0) {
        LOG_DEBUG("[App] No %s, using defaults", config_file_.c_str());
    } else if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
        return false;
    } else {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }

    try {
        setup_logging();
        settings_ = PipelineConfig::from_config(config_);
    } catch (const ConfigError& e) {
        LOG_ERROR("[App] Invalid configuration: %s", e.what());
        return false;
    }
    LOG_DEBUG("[App] max_chunk_chars=%lld concurrency=%lld max_placeholders=%lld placeholder_attempts=%lld",
              settings_.max_chunk_chars, settings_.concurrency, settings_.max_placeholders,
              settings_.placeholder_attempts);
    return true;
}

void Application::setup_logging() {
    std::string log_level = config_.get_string("log_level", "info");
    Logger::instance().set_level(log_level_from_string(log_level, LogLevel::INFO));
}

bool Application::read_input() {
    if (input_path_.empty() || input_path_ == "-") {
        document_.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        LOG_DEBUG("[App] Read %zu bytes from stdin", document_.size());
        return true;
    }
    if (!read_file(input_path_, document_)) {
        LOG_ERROR("Cannot read input file: %s", input_path_.c_str());
        return false;
    }
    LOG_DEBUG("[App] Read %zu bytes from %s", document_.size(), input_path_.c_str());
    return true;
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    LOG_DEBUG("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!load_config() || !read_input()) {
        exit_code_ = 1;
        return false;
    }
    return true;
}

int Application::run() {
    exit_code_ = dry_run_ ? run_dry_run() : run_plan();
    return exit_code_;
}

void Application::shutdown() {
    LOG_DEBUG("[App] Shutting down (exit code %d)", exit_code_);
    std::cout.flush();
}

// ============================================================================
// Modes
// ============================================================================

Json Application::build_plan_report(const std::string& document) const {
    std::vector<ChunkPlanEntry> chunks = plan_chunks(document, settings_.max_chunk_chars);
    Json records = chunk_plan_to_json(chunks);

    for (size_t i = 0; i < chunks.size(); ++i) {
        bool skipped = false;
        ProtectedText protected_text = protect_with_fallback(
            chunks[i].source_text, static_cast<size_t>(settings_.max_placeholders), &skipped);
        records[i]["protected_text"] = protected_text.text;
        records[i]["restoration_map"] = restoration_map_to_json(protected_text.map);
        records[i]["inline_code_skipped"] = skipped;
    }
    return records;
}

int Application::run_plan() {
    try {
        Json report = build_plan_report(document_);
        std::cout << report.dump(2) << std::endl;
        LOG_INFO("[App] Planned %zu chunks from %zu bytes", report.size(), document_.size());
        return 0;
    } catch (const Error& e) {
        LOG_ERROR("[App] Planning failed: %s", e.what());
        return 1;
    }
}

int Application::run_dry_run() {
    IdentityTransformer transformer;
    TransformPipeline pipeline(settings_, transformer);

    PipelineResult result = pipeline.run(document_);
    if (!result.success) {
        LOG_ERROR("[App] Dry run failed at %s: %s",
                  result.failed_chunk_id.empty() ? "planning" : result.failed_chunk_id.c_str(),
                  result.error.c_str());
        return 1;
    }

    std::string output = result.text();
    bool identical = (output == document_);

    Json summary = Json::object();
    summary["chunks"] = result.outcomes.size();
    summary["bytes"] = document_.size();
    summary["qa_warnings"] = result.warning_count();
    summary["identical"] = identical;
    std::cout << summary.dump(2) << std::endl;

    if (!identical) {
        LOG_ERROR("[App] Dry run output differs from input (%zu vs %zu bytes)",
                  output.size(), document_.size());
        return 1;
    }
    LOG_INFO("[App] Dry run reproduced %zu bytes across %zu chunks", document_.size(), result.outcomes.size());
    return 0;
}

} // namespace mdguard
