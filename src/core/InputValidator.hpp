/**
 * @file InputValidator.hpp
 * @brief Validation of annotation configuration values
 *
 * Checks configuration values that would make a stage meaningless and
 * provides clear error messages with suggested solutions.
 */

#pragma once

#include "survey_annotator.hpp"
#include <string>
#include <vector>
#include <optional>

namespace survey {

/**
 * @brief Represents an invalid parameter or parameter combination
 */
struct ParameterConflict {
    std::string description;           // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of configuration validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Validates an AnnotationConfig before a run
 */
class InputValidator {
public:
    InputValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const AnnotationConfig& config) const;

    /**
     * @brief Contour intervals accepted by the surface stage
     */
    static bool is_supported_contour_interval(double interval);

private:
    std::optional<ParameterConflict> check_scale_factor(const AnnotationConfig& config) const;

    /**
     * @brief Contour interval, edge length and refinement table
     */
    std::optional<ParameterConflict> check_surface_settings(const AnnotationConfig& config) const;

    std::optional<ParameterConflict> check_refinement_table(const AnnotationConfig& config) const;

    /**
     * @brief Group size, minimum points, span and scale floor must agree
     */
    std::optional<ParameterConflict> check_tower_settings(const AnnotationConfig& config) const;

    std::optional<ParameterConflict> check_support_settings(const AnnotationConfig& config) const;

    std::optional<ParameterConflict> check_vegetation_settings(const AnnotationConfig& config) const;
};

} // namespace survey
