/*
 * mdguard C++17 - Application
 *
 * Command-line front end: reads a Markdown document, prints its chunk plan
 * with protected text, or checks that a dry run reproduces it.
 */
#ifndef mdguard_CORE_APPLICATION_HPP
#define mdguard_CORE_APPLICATION_HPP

#include <mdguard/core/config.hpp>
#include <mdguard/core/json.hpp>
#include <mdguard/core/transform_pipeline.hpp>
#include <string>

namespace mdguard {

struct AppInfo {
    static constexpr const char* NAME = "mdguard";
    static constexpr const char* VERSION = "0.3.0";
};

class Application {
public:
    static Application& instance();

    // Parse arguments, load config and input. Returns false when there is
    // nothing to run (--help, --version) or on a fatal error; see exit_code().
    bool init(int argc, char* argv[]);

    // Returns the process exit status
    int run();

    void shutdown();

    int exit_code() const { return exit_code_; }

    // Chunk plan records, each with its protected text and restoration map
    Json build_plan_report(const std::string& document) const;

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool read_input();

    int run_plan();
    int run_dry_run();

    Config config_;
    PipelineConfig settings_;
    std::string config_file_;
    bool config_file_explicit_;
    std::string input_path_;
    std::string document_;
    bool dry_run_;
    int exit_code_;
};

} // namespace mdguard

#endif // mdguard_CORE_APPLICATION_HPP
