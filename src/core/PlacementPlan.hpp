/**
 * @file PlacementPlan.hpp
 * @brief Output of the block placement strategies
 *
 * Strategies only decide what to place; the pipeline writes the plan to the
 * drawing sink and counts refusals.
 */

#pragma once

#include "survey_annotator.hpp"
#include "../export/DrawingSink.hpp"
#include <string>
#include <vector>

namespace survey {

struct PlacementPlan {
    std::vector<BlockPlacement> blocks;
    std::vector<TextAnnotation> labels;
    std::vector<std::string> geometry_defects;   ///< Features skipped for bad geometry
    std::vector<std::string> template_defects;   ///< Features skipped for missing blocks
};

/**
 * @brief Drawing attributes for a block taken from its template definition
 *
 * Falls back to the configured block layer with color 7; when layer
 * separation is off the layer is "0".
 */
inline EntityAttributes resolve_block_attributes(const DrawingSink& sink, const std::string& block_name,
                                                 const AnnotationConfig& config) {
    EntityAttributes attributes(config.default_block_layer, 7);
    if (auto properties = sink.block_properties(block_name)) {
        attributes = *properties;
    }
    if (!config.layer_separation) {
        attributes.layer = "0";
    }
    return attributes;
}

} // namespace survey
