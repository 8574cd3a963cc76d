/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file management for the survey annotator
 */

#pragma once

#include "survey_annotator.hpp"
#include "../export/DrawingSink.hpp"
#include "../core/Logger.hpp"
#include <string>
#include <vector>

namespace survey {

/**
 * @brief Configuration file manager for loading and saving settings
 *
 * Every key of the file is optional; missing keys keep their defaults.
 * Besides the AnnotationConfig the file carries the layer catalog of the
 * drawing template ("layers": [{"name", "color", "linetype"}]).
 */
class ConfigurationManager {
public:
    ConfigurationManager();

    /**
     * @brief Load configuration from file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise (see last_error())
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Load configuration from JSON text
     */
    bool load_from_string(const std::string& text);

    /**
     * @brief Save configuration to file
     * @param filename Path to configuration file
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Serialize the current configuration as indented JSON
     */
    std::string to_string() const;

    const AnnotationConfig& get_config() const { return config_; }
    AnnotationConfig& config() { return config_; }
    void set_config(const AnnotationConfig& config) { config_ = config; }

    const std::vector<LayerAttributes>& get_layers() const { return layers_; }
    void set_layers(const std::vector<LayerAttributes>& layers) { layers_ = layers; }

    const std::string& last_error() const { return last_error_; }

private:
    AnnotationConfig config_;
    std::vector<LayerAttributes> layers_;
    std::string last_error_;
    Logger logger_;
};

} // namespace survey
