/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the survey annotator
 */

#include "ConfigurationManager.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace survey {

namespace {

template <typename T>
void read_value(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

void read_optional_int(const json& j, const char* key, std::optional<int>& target) {
    if (!j.contains(key)) {
        return;
    }
    if (j[key].is_null()) {
        target.reset();
    } else {
        target = j[key].get<int>();
    }
}

ScaleResolver parse_scale(const json& j) {
    if (j.is_number()) {
        return ConstantScale{j.get<double>()};
    }
    if (!j.is_array()) {
        throw std::invalid_argument("scale must be a number or a list of {min_height, scale} breakpoints");
    }

    HeightPiecewiseScale piecewise;
    for (const auto& item : j) {
        ScaleBreakpoint breakpoint;
        if (item.is_object()) {
            breakpoint.min_height = item.at("min_height").get<double>();
            breakpoint.scale = item.at("scale").get<double>();
        } else if (item.is_array() && item.size() == 2) {
            breakpoint.min_height = item[0].get<double>();
            breakpoint.scale = item[1].get<double>();
        } else {
            throw std::invalid_argument("scale breakpoint must be {min_height, scale} or [height, scale]");
        }
        piecewise.breakpoints.push_back(breakpoint);
    }
    return piecewise;
}

void read_scale(const json& j, const char* key, ScaleResolver& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = parse_scale(j[key]);
    }
}

json scale_to_json(const ScaleResolver& resolver) {
    if (const auto* constant = std::get_if<ConstantScale>(&resolver)) {
        return constant->value;
    }
    json breakpoints = json::array();
    for (const auto& breakpoint : std::get<HeightPiecewiseScale>(resolver).breakpoints) {
        breakpoints.push_back({{"min_height", breakpoint.min_height}, {"scale", breakpoint.scale}});
    }
    return breakpoints;
}

// ============================================================================
// Sections
// ============================================================================

void read_tin(const json& j, TinSettings& tin) {
    read_value(j, "enabled", tin.enabled);
    read_value(j, "refine", tin.refine);
    read_value(j, "contours", tin.contours);
    read_optional_int(j, "scale", tin.scale);
    read_value(j, "codes", tin.codes);
    read_value(j, "max_edge_length", tin.max_edge_length);
    read_value(j, "dedup_tolerance", tin.dedup_tolerance);
    read_value(j, "contour_interval", tin.contour_interval);

    // JSON object keys are strings: {"1000": 20.0}
    if (j.contains("refine_distance_by_scale")) {
        tin.refine_distance_by_scale.clear();
        for (const auto& [key, value] : j["refine_distance_by_scale"].items()) {
            tin.refine_distance_by_scale[std::stoi(key)] = value.get<double>();
        }
    }

    read_value(j, "point_layer", tin.point_layer);
    read_value(j, "surface_layer", tin.surface_layer);
    read_value(j, "refined_surface_layer", tin.refined_surface_layer);
    read_value(j, "refined_point_layer", tin.refined_point_layer);
    read_value(j, "contour_layer", tin.contour_layer);
    read_value(j, "surface_color", tin.surface_color);
    read_value(j, "refined_color", tin.refined_color);
    read_value(j, "contour_color", tin.contour_color);
}

json tin_to_json(const TinSettings& tin) {
    json refine_table = json::object();
    for (const auto& [scale, distance] : tin.refine_distance_by_scale) {
        refine_table[std::to_string(scale)] = distance;
    }

    return {
        {"enabled", tin.enabled},
        {"refine", tin.refine},
        {"contours", tin.contours},
        {"scale", tin.scale ? json(*tin.scale) : json(nullptr)},
        {"codes", tin.codes},
        {"max_edge_length", tin.max_edge_length},
        {"dedup_tolerance", tin.dedup_tolerance},
        {"contour_interval", tin.contour_interval},
        {"refine_distance_by_scale", refine_table},
        {"point_layer", tin.point_layer},
        {"surface_layer", tin.surface_layer},
        {"refined_surface_layer", tin.refined_surface_layer},
        {"refined_point_layer", tin.refined_point_layer},
        {"contour_layer", tin.contour_layer},
        {"surface_color", tin.surface_color},
        {"refined_color", tin.refined_color},
        {"contour_color", tin.contour_color}
    };
}

void read_labels(const json& j, LabelConfig& labels) {
    read_value(j, "show_points", labels.show_points);
    read_value(j, "show_codes", labels.show_codes);
    read_value(j, "show_elevations", labels.show_elevations);
    read_value(j, "show_comments", labels.show_comments);
    read_value(j, "text_height", labels.text_height);
    read_value(j, "numbers_color", labels.numbers_color);
    read_value(j, "codes_color", labels.codes_color);
    read_value(j, "elevations_color", labels.elevations_color);
    read_value(j, "comments_color", labels.comments_color);
    read_value(j, "numbered_codes", labels.numbered_codes);
    read_value(j, "numbered_offset", labels.numbered_offset);
    read_value(j, "line_label_height", labels.line_label_height);
    read_value(j, "line_label_offset", labels.line_label_offset);
}

json labels_to_json(const LabelConfig& labels) {
    return {
        {"show_points", labels.show_points},
        {"show_codes", labels.show_codes},
        {"show_elevations", labels.show_elevations},
        {"show_comments", labels.show_comments},
        {"text_height", labels.text_height},
        {"numbers_color", labels.numbers_color},
        {"codes_color", labels.codes_color},
        {"elevations_color", labels.elevations_color},
        {"comments_color", labels.comments_color},
        {"numbered_codes", labels.numbered_codes},
        {"numbered_offset", labels.numbered_offset},
        {"line_label_height", labels.line_label_height},
        {"line_label_offset", labels.line_label_offset}
    };
}

std::vector<BlockMappingEntry> read_block_mapping(const json& j) {
    std::vector<BlockMappingEntry> entries;
    for (const auto& item : j) {
        BlockMappingEntry entry;
        read_value(item, "name", entry.name);
        read_value(item, "block", entry.block);
        read_value(item, "codes", entry.codes);
        read_scale(item, "scale", entry.scale);
        entries.push_back(std::move(entry));
    }
    return entries;
}

json block_mapping_to_json(const std::vector<BlockMappingEntry>& entries) {
    json result = json::array();
    for (const auto& entry : entries) {
        result.push_back({
            {"name", entry.name},
            {"block", entry.block},
            {"codes", entry.codes},
            {"scale", scale_to_json(entry.scale)}
        });
    }
    return result;
}

void read_line_support(const json& j, LineSupportConfig& support) {
    read_value(j, "codes", support.codes);
    read_value(j, "bracing_codes", support.bracing_codes);
    read_value(j, "blocks", support.blocks);
    read_scale(j, "scale", support.scale);
    read_value(j, "distance_threshold", support.distance_threshold);
}

json line_support_to_json(const LineSupportConfig& support) {
    return {
        {"codes", support.codes},
        {"bracing_codes", support.bracing_codes},
        {"blocks", support.blocks},
        {"scale", scale_to_json(support.scale)},
        {"distance_threshold", support.distance_threshold}
    };
}

void read_tower(const json& j, TowerConfig& tower) {
    read_value(j, "codes", tower.codes);
    read_value(j, "prefixes", tower.prefixes);
    read_value(j, "group_size", tower.group_size);
    read_value(j, "min_points", tower.min_points);
    read_value(j, "right_angle_tolerance", tower.right_angle_tolerance);
    read_value(j, "max_span", tower.max_span);
    read_value(j, "block_name", tower.block_name);
    read_value(j, "layer", tower.layer);
    read_optional_int(j, "color", tower.color);
    read_value(j, "base_width", tower.base_width);
    read_value(j, "base_height", tower.base_height);
    read_value(j, "zscale", tower.zscale);
    read_value(j, "min_scale", tower.min_scale);
}

json tower_to_json(const TowerConfig& tower) {
    return {
        {"codes", tower.codes},
        {"prefixes", tower.prefixes},
        {"group_size", tower.group_size},
        {"min_points", tower.min_points},
        {"right_angle_tolerance", tower.right_angle_tolerance},
        {"max_span", tower.max_span},
        {"block_name", tower.block_name},
        {"layer", tower.layer},
        {"color", tower.color ? json(*tower.color) : json(nullptr)},
        {"base_width", tower.base_width},
        {"base_height", tower.base_height},
        {"zscale", tower.zscale},
        {"min_scale", tower.min_scale}
    };
}

void read_vegetation(const json& j, VegetationConfig& vegetation) {
    read_value(j, "prefixes", vegetation.prefixes);
    read_value(j, "forest_markers", vegetation.forest_markers);
    read_value(j, "shrub_markers", vegetation.shrub_markers);
    read_value(j, "default_layer", vegetation.default_layer);
    read_value(j, "forest_block", vegetation.forest_block);
    read_value(j, "min_distance", vegetation.min_distance);
    read_value(j, "max_attempts", vegetation.max_attempts);
    read_value(j, "close_tolerance", vegetation.close_tolerance);
    read_value(j, "shrub_pattern", vegetation.shrub_pattern);
    read_value(j, "shrub_pattern_scale", vegetation.shrub_pattern_scale);
}

json vegetation_to_json(const VegetationConfig& vegetation) {
    return {
        {"prefixes", vegetation.prefixes},
        {"forest_markers", vegetation.forest_markers},
        {"shrub_markers", vegetation.shrub_markers},
        {"default_layer", vegetation.default_layer},
        {"forest_block", vegetation.forest_block},
        {"min_distance", vegetation.min_distance},
        {"max_attempts", vegetation.max_attempts},
        {"close_tolerance", vegetation.close_tolerance},
        {"shrub_pattern", vegetation.shrub_pattern},
        {"shrub_pattern_scale", vegetation.shrub_pattern_scale}
    };
}

std::vector<LayerAttributes> read_layers(const json& j) {
    std::vector<LayerAttributes> layers;
    for (const auto& item : j) {
        LayerAttributes layer;
        layer.name = item.at("name").get<std::string>();
        read_value(item, "color", layer.color);
        read_value(item, "linetype", layer.linetype);
        layers.push_back(std::move(layer));
    }
    return layers;
}

} // namespace

// ============================================================================
// ConfigurationManager
// ============================================================================

ConfigurationManager::ConfigurationManager()
    : logger_("ConfigurationManager") {
}

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        last_error_ = "Could not open config file: " + filename;
        logger_.error(last_error_);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!load_from_string(buffer.str())) {
        last_error_ = filename + ": " + last_error_;
        return false;
    }

    logger_.info("Loaded configuration from " + filename);
    return true;
}

bool ConfigurationManager::load_from_string(const std::string& text) {
    last_error_.clear();

    // Work on copies so a failed load leaves the previous values intact
    AnnotationConfig config = config_;
    std::vector<LayerAttributes> layers = layers_;

    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            last_error_ = "Configuration root must be a JSON object";
            logger_.error(last_error_);
            return false;
        }

        read_value(root, "scale_factor", config.scale_factor);
        read_value(root, "random_seed", config.random_seed);
        read_value(root, "layer_separation", config.layer_separation);
        read_value(root, "show_blocks", config.show_blocks);
        read_value(root, "show_polylines", config.show_polylines);
        read_value(root, "show_towers", config.show_towers);
        read_value(root, "polyline_prefixes", config.polyline_prefixes);
        read_value(root, "polyline_layers", config.polyline_layers);
        read_value(root, "default_polyline_layer", config.default_polyline_layer);
        read_value(root, "default_block_layer", config.default_block_layer);

        if (root.contains("tin")) read_tin(root["tin"], config.tin);
        if (root.contains("labels")) read_labels(root["labels"], config.labels);
        if (root.contains("block_mapping")) config.block_mapping = read_block_mapping(root["block_mapping"]);
        if (root.contains("line_support")) read_line_support(root["line_support"], config.line_support);
        if (root.contains("tower")) read_tower(root["tower"], config.tower);
        if (root.contains("vegetation")) read_vegetation(root["vegetation"], config.vegetation);
        if (root.contains("layers")) layers = read_layers(root["layers"]);

    } catch (const json::exception& e) {
        last_error_ = std::string("Error parsing JSON configuration: ") + e.what();
        logger_.error(last_error_);
        return false;
    } catch (const std::exception& e) {
        last_error_ = std::string("Error loading configuration: ") + e.what();
        logger_.error(last_error_);
        return false;
    }

    config_ = std::move(config);
    layers_ = std::move(layers);
    return true;
}

std::string ConfigurationManager::to_string() const {
    json layers = json::array();
    for (const auto& layer : layers_) {
        layers.push_back({{"name", layer.name}, {"color", layer.color}, {"linetype", layer.linetype}});
    }

    json root = {
        {"scale_factor", config_.scale_factor},
        {"random_seed", config_.random_seed},
        {"layer_separation", config_.layer_separation},
        {"show_blocks", config_.show_blocks},
        {"show_polylines", config_.show_polylines},
        {"show_towers", config_.show_towers},
        {"polyline_prefixes", config_.polyline_prefixes},
        {"polyline_layers", config_.polyline_layers},
        {"default_polyline_layer", config_.default_polyline_layer},
        {"default_block_layer", config_.default_block_layer},
        {"tin", tin_to_json(config_.tin)},
        {"labels", labels_to_json(config_.labels)},
        {"block_mapping", block_mapping_to_json(config_.block_mapping)},
        {"line_support", line_support_to_json(config_.line_support)},
        {"tower", tower_to_json(config_.tower)},
        {"vegetation", vegetation_to_json(config_.vegetation)},
        {"layers", layers}
    };
    return root.dump(2);
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        logger_.error("Could not write config file: " + filename);
        return false;
    }

    file << to_string() << std::endl;
    return file.good();
}

} // namespace survey
