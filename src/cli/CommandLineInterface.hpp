/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the survey annotator
 */

#pragma once

#include "survey_annotator.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../export/DrawingSink.hpp"
#include <optional>
#include <string>
#include <vector>

namespace survey {

/**
 * @brief Everything one invocation needs besides the point data
 */
struct RunSettings {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> template_path;
    std::optional<std::string> config_path;
    std::optional<std::string> report_path;
    std::optional<std::string> log_file;
    bool dry_run = false;
    int log_level = 3;

    AnnotationConfig annotation;
    std::vector<LayerAttributes> layers;        ///< Layer catalog of the template
};

/**
 * @brief Command line interface for parsing arguments and configuring a run
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if a run should follow; false after help, version,
     *         --create-config or an error (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    const RunSettings& get_settings() const { return settings_; }

    /**
     * @brief Process exit code when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

private:
    RunSettings settings_;
    int exit_code_ = 0;

    // Main parsing method
    bool parse_all_options(const SimpleCommandLineParser& parser);
    void parse_logging_options(const SimpleCommandLineParser& parser);

    // Configuration file methods
    bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);
};

} // namespace survey
