/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the survey-annotate tool
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <type_traits>
#include <cctype>

namespace survey {

/**
 * @brief Simple command-line argument parser
 *
 * Options take "--name value", "--name=value" or "-n value". A separate
 * value may not start with '-' unless it is a number, so "--scale -1"
 * reaches validation instead of being read as an option. Flags take no
 * value. Help output is grouped by the section each option was
 * registered under.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        std::string section;
        bool has_value = true;
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    /**
     * @brief Start a help section; options added afterwards are listed under it
     */
    void begin_section(const std::string& title) {
        current_section_ = title;
        section_order_.push_back(title);
    }

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description) {
        register_option(Option{long_name, short_name, description, current_section_, true});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option{long_name, short_name, description, current_section_, false});
    }

    /**
     * @brief Parse arguments
     * @return false on an unknown option, a missing value or a help request
     */
    bool parse(int argc, char* argv[]) {
        parsed_values_.clear();
        positional_args_.clear();

        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            std::string option_name;
            std::optional<std::string> inline_value;
            std::string spelled;

            if (arg.starts_with("--")) {
                option_name = arg.substr(2);
                size_t eq_pos = option_name.find('=');
                if (eq_pos != std::string::npos) {
                    inline_value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                }
                spelled = "--" + option_name;
                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: " << spelled << std::endl;
                    return false;
                }
            } else if (arg.starts_with("-") && arg.size() > 1 && !looks_numeric(arg)) {
                std::string short_name = arg.substr(1);
                spelled = arg;
                auto it = short_to_long_.find(short_name);
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: " << spelled << std::endl;
                    return false;
                }
                option_name = it->second;
            } else {
                positional_args_.push_back(arg);
                continue;
            }

            const Option& option = options_.at(option_name);
            if (!option.has_value) {
                if (inline_value) {
                    std::cerr << "Flag " << spelled << " does not take a value" << std::endl;
                    return false;
                }
                parsed_values_[option_name] = "true";
                continue;
            }

            if (inline_value) {
                parsed_values_[option_name] = *inline_value;
                continue;
            }
            if (i + 1 >= args.size() || (args[i + 1].starts_with("-") && !looks_numeric(args[i + 1]))) {
                std::cerr << "Option " << spelled << " requires a value" << std::endl;
                return false;
            }
            parsed_values_[option_name] = args[++i];
        }

        return true;
    }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    /**
     * @brief Value converted with operator>>; the whole value must be consumed
     *
     * Unsigned targets reject a leading '-' instead of wrapping around.
     */
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value() || value->empty()) {
            return std::nullopt;
        }
        if constexpr (std::is_unsigned_v<T>) {
            if (value->front() == '-') {
                return std::nullopt;
            }
        }

        std::istringstream iss(value.value());
        T result;
        if (!(iss >> result)) {
            return std::nullopt;
        }
        iss >> std::ws;
        if (!iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << "SURVEY ANNOTATE - Survey point tables to annotated DXF drawings\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --input POINTS.csv --output PLAN.dxf [OPTIONS]\n\n";

        if (!description_.empty()) {
            std::cout << description_ << "\n\n";
        }

        for (const auto& section : section_order_) {
            std::cout << section << ":\n";
            for (const auto& name : registration_order_) {
                const Option& option = options_.at(name);
                if (option.section == section) {
                    print_option(option);
                }
            }
            std::cout << "\n";
        }

        std::cout << "HELP:\n";
        std::cout << "    -h, --help                    Show this help\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --input points.csv --output plan.dxf --template base.dxf\n";
        std::cout << "    " << program_name_ << " --input points.csv --output plan.dxf --tin --refine --scale 0.5\n";
        std::cout << "    " << program_name_ << " --input points.csv --dry-run --report summary.json\n";
        std::cout << "    " << program_name_ << " --create-config survey.json\n\n";
    }

private:
    void register_option(const Option& option) {
        if (options_.find(option.long_name) == options_.end()) {
            registration_order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    static bool looks_numeric(const std::string& arg) {
        return arg.size() > 1 && arg[0] == '-' &&
               (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }

    static void print_option(const Option& option) {
        std::string names = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        names += "--" + option.long_name;
        if (option.has_value) {
            names += " VALUE";
        }

        // Continuation lines of multi-line descriptions are indented by the caller
        std::cout << "    " << std::left << std::setw(30) << names << option.description << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::string current_section_ = "OPTIONS";
    std::vector<std::string> section_order_;
    std::vector<std::string> registration_order_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
};

} // namespace survey
