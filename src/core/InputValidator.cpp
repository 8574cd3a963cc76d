/**
 * @file InputValidator.cpp
 * @brief Implementation of configuration validation
 */

#include "InputValidator.hpp"
#include "TextUtils.hpp"
#include <sstream>
#include <cmath>

namespace survey {

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid configuration detected:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Conflict " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    oss << "\nProgram terminated due to invalid configuration.\n";
    return oss.str();
}

bool InputValidator::is_supported_contour_interval(double interval) {
    static const double supported[] = {0.5, 1.0, 2.0, 5.0};
    for (double value : supported) {
        if (std::abs(interval - value) < 1e-9) {
            return true;
        }
    }
    return false;
}

ValidationResult InputValidator::validate(const AnnotationConfig& config) const {
    ValidationResult result;
    result.is_valid = true;

    const std::optional<ParameterConflict> checks[] = {
        check_scale_factor(config),
        check_surface_settings(config),
        check_refinement_table(config),
        check_tower_settings(config),
        check_support_settings(config),
        check_vegetation_settings(config)
    };

    for (const auto& conflict : checks) {
        if (conflict) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> InputValidator::check_scale_factor(
    const AnnotationConfig& config) const {

    if (config.scale_factor > 0.0 && std::isfinite(config.scale_factor)) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Scale factor must be a positive number";
    conflict.involved_params = {"--scale " + format_fixed(config.scale_factor, 3)};
    conflict.suggestions = {
        "Use --scale 1.0 for a 1:1000 drawing",
        "Use --scale 0.5 for a 1:500 drawing"
    };
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_surface_settings(
    const AnnotationConfig& config) const {

    const auto& tin = config.tin;
    ParameterConflict conflict;

    if (!is_supported_contour_interval(tin.contour_interval)) {
        conflict.involved_params.push_back("--contour-interval " + format_fixed(tin.contour_interval, 2));
        conflict.suggestions.push_back("Use one of --contour-interval 0.5, 1, 2 or 5");
    }
    if (!(tin.max_edge_length > 0.0)) {
        conflict.involved_params.push_back("tin.max_edge_length " + format_fixed(tin.max_edge_length, 2));
        conflict.suggestions.push_back("Set tin.max_edge_length to a positive length (default 100)");
    }
    if (tin.dedup_tolerance < 0.0) {
        conflict.involved_params.push_back("tin.dedup_tolerance " + format_fixed(tin.dedup_tolerance, 3));
        conflict.suggestions.push_back("Set tin.dedup_tolerance to 0 or more (default 0.01)");
    }
    if (tin.scale && *tin.scale <= 0) {
        conflict.involved_params.push_back("--tin-scale " + std::to_string(*tin.scale));
        conflict.suggestions.push_back("Use a nominal scale such as --tin-scale 1000");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    conflict.description = "Surface settings are out of range";
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_refinement_table(
    const AnnotationConfig& config) const {

    const auto& table = config.tin.refine_distance_by_scale;
    if (!config.tin.refine) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    if (table.empty()) {
        conflict.description = "Refinement is enabled but the distance table is empty";
        conflict.involved_params = {"--refine", "tin.refine_distance_by_scale (empty)"};
        conflict.suggestions = {
            "Add entries such as {\"1000\": 20.0} to tin.refine_distance_by_scale",
            "Run without --refine"
        };
        return conflict;
    }

    for (const auto& [scale, distance] : table) {
        if (scale <= 0 || !(distance > 0.0)) {
            conflict.involved_params.push_back("tin.refine_distance_by_scale[" + std::to_string(scale) + "] = " +
                                               format_fixed(distance, 2));
        }
    }
    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }

    conflict.description = "Refinement distances must be positive for positive scales";
    conflict.suggestions = {"Remove or correct the listed entries"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_tower_settings(
    const AnnotationConfig& config) const {

    const auto& tower = config.tower;
    ParameterConflict conflict;

    if (tower.group_size < 2) {
        conflict.involved_params.push_back("tower.group_size " + std::to_string(tower.group_size));
        conflict.suggestions.push_back("Use tower.group_size 4 (corners of the footprint)");
    }
    if (tower.min_points > tower.group_size || tower.min_points < 1) {
        conflict.involved_params.push_back("tower.min_points " + std::to_string(tower.min_points) +
                                           " (group_size " + std::to_string(tower.group_size) + ")");
        conflict.suggestions.push_back("Use tower.min_points between 1 and tower.group_size (default 3)");
    }
    if (!(tower.max_span > 0.0)) {
        conflict.involved_params.push_back("tower.max_span " + format_fixed(tower.max_span, 2));
        conflict.suggestions.push_back("Set tower.max_span to a positive distance (default 25)");
    }
    if (!(tower.min_scale > 0.0)) {
        conflict.involved_params.push_back("tower.min_scale " + format_fixed(tower.min_scale, 3));
        conflict.suggestions.push_back("Set tower.min_scale to a small positive value (default 0.01)");
    }
    if (tower.right_angle_tolerance < 0.0) {
        conflict.involved_params.push_back("tower.right_angle_tolerance " +
                                           format_fixed(tower.right_angle_tolerance, 3));
        conflict.suggestions.push_back("Set tower.right_angle_tolerance to 0 or more (default 0.05)");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    conflict.description = "Tower reconstruction settings are inconsistent";
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_support_settings(
    const AnnotationConfig& config) const {

    if (config.line_support.distance_threshold >= 0.0) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Bracing search distance cannot be negative";
    conflict.involved_params = {"line_support.distance_threshold " +
                                format_fixed(config.line_support.distance_threshold, 2)};
    conflict.suggestions = {"Use line_support.distance_threshold 5.0"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_vegetation_settings(
    const AnnotationConfig& config) const {

    const auto& vegetation = config.vegetation;
    ParameterConflict conflict;

    if (!(vegetation.min_distance > 0.0)) {
        conflict.involved_params.push_back("vegetation.min_distance " + format_fixed(vegetation.min_distance, 2));
        conflict.suggestions.push_back("Set vegetation.min_distance to a positive distance (default 10)");
    }
    if (vegetation.max_attempts <= 0) {
        conflict.involved_params.push_back("vegetation.max_attempts " + std::to_string(vegetation.max_attempts));
        conflict.suggestions.push_back("Set vegetation.max_attempts to a positive count (default 2000)");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    conflict.description = "Vegetation scatter settings are out of range";
    return conflict;
}

} // namespace survey
