/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "../core/InputValidator.hpp"
#include "../core/Logger.hpp"
#include "../core/TextUtils.hpp"
#include "version.h"
#include <iostream>
#include <cstdint>
#include <cstdlib>

namespace survey {

namespace {

/**
 * @brief Default level of a "3,TinBuilder=5" style string, if it names one
 */
std::optional<int> default_log_level(const std::string& log_config) {
    std::string first_part = log_config.substr(0, log_config.find(','));
    if (first_part.find('=') != std::string::npos) {
        return std::nullopt;
    }
    auto value = parse_number(first_part);
    if (!value) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

} // namespace

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("survey-annotate",
        "Builds a DXF plan from a survey point table: point labels, code-driven\n"
        "blocks, breaklines, vegetation areas, towers and, on request, a\n"
        "triangulated surface with refinement and contours.");

    parser.begin_section("INPUT/OUTPUT OPTIONS");
    parser.add_option("input", "i", "Point table with Point, X, Y, Z, Code, Comment columns");
    parser.add_option("output", "o", "Output DXF drawing");
    parser.add_option("template", "t", "Template DXF providing blocks, layers and styles");
    parser.add_option("config", "c", "Load configuration from JSON file");
    parser.add_option("create-config", "", "Write the default configuration file and exit");
    parser.add_option("report", "r", "Write the run summary as JSON");
    parser.add_flag("dry-run", "", "Run the pipeline without writing a drawing");

    parser.begin_section("PROCESSING OPTIONS");
    parser.add_option("scale", "s", "Drawing scale factor, 1.0 = 1:1000 (default: 1.0)");
    parser.add_flag("tin", "", "Build the triangulated surface");
    parser.add_flag("refine", "", "Refine the surface with centroid points (implies --tin)");
    parser.add_option("contour-interval", "", "Contour interval: 0.5, 1, 2 or 5 (default: 1)");
    parser.add_option("tin-scale", "", "Nominal scale for the refinement table (default: scale x 1000)");
    parser.add_option("seed", "", "Random seed for vegetation scatter (default: 0)");

    parser.begin_section("LOGGING OPTIONS");
    parser.add_option("log-level", "", "1=ERROR, 2=WARNING, 3=INFO (default), 4=DETAILED, 5=DEBUG, 6=TRACE\n"
                                       "                                  Facility-specific levels: \"3,TinBuilder=5\"");
    parser.add_option("log-file", "", "Log to specified file (append if exists)");
    parser.add_flag("silent", "q", "Only report errors");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        // --help also ends up here
        exit_code_ = 1;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                exit_code_ = 0;
            }
        }
        return false;
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        exit_code_ = 1;
        return false;
    }

    // Handle version flag
    if (parser.get_flag("version")) {
        std::cout << "Survey Annotator v" << SURVEY_VERSION_STRING << std::endl;
        std::cout << "Survey point tables to annotated DXF drawings" << std::endl;
        std::cout << "Built with CGAL, Eigen, GDAL" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        exit_code_ = 0;
        return false;
    }

    parse_logging_options(parser);

    // Handle create-config flag
    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        exit_code_ = 0;
        return false;
    }

    // Load configuration file if specified; CLI options override it
    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            exit_code_ = 1;
            return false;
        }
        settings_.config_path = config_file.value();
    }

    if (!parse_all_options(parser)) {
        exit_code_ = 1;
        return false;
    }

    InputValidator validator;
    ValidationResult validation = validator.validate(settings_.annotation);
    if (validation.has_errors()) {
        std::cerr << validation.format_error_message();
        exit_code_ = 1;
        return false;
    }

    return true;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Input/output
    if (auto value = parser.get("input")) settings_.input_path = value.value();
    if (auto value = parser.get("output")) settings_.output_path = value.value();
    if (auto value = parser.get("template")) settings_.template_path = value.value();
    if (auto value = parser.get("report")) settings_.report_path = value.value();
    settings_.dry_run = parser.get_flag("dry-run");

    if (settings_.input_path.empty()) {
        std::cerr << "Missing required option --input" << std::endl;
        return false;
    }
    if (settings_.output_path.empty() && !settings_.dry_run) {
        std::cerr << "Missing required option --output (or use --dry-run)" << std::endl;
        return false;
    }

    auto& config = settings_.annotation;

    // Numeric options accept a decimal comma as the point table does
    if (auto value = parser.get("scale")) {
        auto number = parse_number(value.value());
        if (!number) {
            std::cerr << "Invalid --scale value: " << value.value() << std::endl;
            return false;
        }
        config.scale_factor = *number;
    }
    if (auto value = parser.get("contour-interval")) {
        auto number = parse_number(value.value());
        if (!number) {
            std::cerr << "Invalid --contour-interval value: " << value.value() << std::endl;
            return false;
        }
        config.tin.contour_interval = *number;
    }
    if (auto value = parser.get("tin-scale")) {
        auto number = parser.get_as<int>("tin-scale");
        if (!number) {
            std::cerr << "Invalid --tin-scale value: " << value.value() << std::endl;
            return false;
        }
        config.tin.scale = *number;
    }
    if (auto value = parser.get("seed")) {
        auto number = parser.get_as<std::uint32_t>("seed");
        if (!number) {
            std::cerr << "Invalid --seed value: " << value.value() << std::endl;
            return false;
        }
        config.random_seed = *number;
    }

    // Flags only switch stages on; the configuration file may have done so already
    if (parser.get_flag("tin")) config.tin.enabled = true;
    if (parser.get_flag("refine")) {
        config.tin.enabled = true;
        config.tin.refine = true;
    }

    return true;
}

void CommandLineInterface::parse_logging_options(const SimpleCommandLineParser& parser) {
    // Logging options with priority: CLI > ENV > defaults
    // 1. Check environment variable first
    const char* env_log_level = std::getenv("SURVEY_LOG_LEVEL");
    if (env_log_level) {
        std::string env_config(env_log_level);
        if (Logger::parseLogConfig(env_config)) {
            settings_.log_level = default_log_level(env_config).value_or(3);
        } else {
            std::cerr << "Warning: Ignoring invalid SURVEY_LOG_LEVEL '" << env_config << "'" << std::endl;
        }
    }

    // 2. CLI arguments override environment
    if (auto value = parser.get("log-level")) {
        std::string log_config = value.value();
        if (Logger::parseLogConfig(log_config)) {
            if (auto level = default_log_level(log_config)) {
                settings_.log_level = *level;
            }
        } else {
            std::cerr << "Warning: Ignoring invalid --log-level '" << log_config << "'" << std::endl;
        }
    }

    // 3. Flags override everything
    if (parser.get_flag("silent")) {
        settings_.log_level = 1;
        Logger::setDefaultLevel(LogLevel::ERROR);
    }
    if (parser.get_flag("verbose")) {
        settings_.log_level = 6;
        Logger::setDefaultLevel(LogLevel::TRACE);
    }

    // 4. Log file configuration
    const char* env_log_file = std::getenv("SURVEY_LOG_FILE");
    if (env_log_file) {
        settings_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        settings_.log_file = value.value();  // CLI overrides environment
    }
    if (settings_.log_file) {
        Logger::setGlobalLogFile(settings_.log_file);
    }
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    ConfigurationManager manager;
    return manager.save_to_file(filename);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    ConfigurationManager manager;
    if (!manager.load_from_file(filename)) {
        std::cerr << "Error: " << manager.last_error() << std::endl;
        return false;
    }

    settings_.annotation = manager.get_config();
    settings_.layers = manager.get_layers();
    return true;
}

void CommandLineInterface::print_config() const {
    if (settings_.log_level < 4) return;  // Only print at DETAILED level or higher

    const auto& config = settings_.annotation;
    std::cout << "\n=== Configuration ===\n";
    std::cout << "Input: " << settings_.input_path << "\n";
    std::cout << "Output: " << (settings_.dry_run ? "(dry run)" : settings_.output_path) << "\n";
    std::cout << "Template: " << settings_.template_path.value_or("(none)") << "\n";
    std::cout << "Scale factor: " << config.effective_scale_factor() << "\n";
    std::cout << "Blocks: " << (config.show_blocks ? "yes" : "no")
              << ", polylines: " << (config.show_polylines ? "yes" : "no")
              << ", towers: " << (config.show_towers ? "yes" : "no") << "\n";
    std::cout << "Surface: " << (config.tin.enabled ? "yes" : "no");
    if (config.tin.enabled) {
        std::cout << " (refine: " << (config.tin.refine ? "yes" : "no")
                  << ", scale 1:" << config.effective_tin_scale()
                  << ", contour interval " << config.tin.contour_interval << ")";
    }
    std::cout << "\nLayer catalog: " << settings_.layers.size() << " layers\n";
    std::cout << "===================\n\n";
}

} // namespace survey
