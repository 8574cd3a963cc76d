/**
 * @file StaticBlockPlacer.cpp
 * @brief Implementation of the static code-to-block lookup
 */

#include "StaticBlockPlacer.hpp"
#include "TextUtils.hpp"
#include <algorithm>

namespace survey {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

StaticBlockPlacer::StaticBlockPlacer(const AnnotationConfig& config)
    : config_(config),
      support_codes_(normalize_codes(config.line_support.codes)),
      numbered_codes_(normalize_codes(config.labels.numbered_codes)),
      logger_("StaticBlockPlacer") {
    entry_codes_.reserve(config_.block_mapping.size());
    for (const auto& entry : config_.block_mapping) {
        entry_codes_.push_back(normalize_codes(entry.codes));
    }
}

const BlockMappingEntry* StaticBlockPlacer::find_entry(const std::string& normalized_code) const {
    for (size_t i = 0; i < config_.block_mapping.size(); ++i) {
        if (!contains(entry_codes_[i], normalized_code)) {
            continue;
        }
        if (config_.block_mapping[i].block.empty()) {
            continue;
        }
        return &config_.block_mapping[i];
    }
    return nullptr;
}

PlacementPlan StaticBlockPlacer::place(const std::vector<SurveyPoint>& points, const DrawingSink& sink) const {
    PlacementPlan plan;
    const double scale_factor = config_.effective_scale_factor();

    for (const auto& point : points) {
        std::string code = normalize_code(point.code);
        if (code.empty() || contains(support_codes_, code)) {
            continue;
        }

        const BlockMappingEntry* entry = find_entry(code);
        if (!entry) {
            continue;
        }

        double scale = resolve_scale(entry->scale, point.z) * scale_factor;

        BlockPlacement placement;
        placement.block_name = entry->block;
        placement.position = point.position();
        placement.scale = {scale, scale, scale};
        placement.rotation_deg = 0.0;
        placement.attributes = resolve_block_attributes(sink, entry->block, config_);

        logger_.trace("Point " + point.id + " (" + code + ") -> block " + entry->block +
                      " scale " + format_fixed(scale, 3));

        std::string comment = trim(point.comment);
        if (contains(numbered_codes_, code) && !comment.empty()) {
            TextAnnotation label;
            label.text = "№" + comment;
            label.position = Point3D(point.x + config_.labels.numbered_offset * scale_factor, point.y, point.z);
            label.height = config_.labels.text_height;
            label.attributes = placement.attributes;
            plan.labels.push_back(std::move(label));
        }

        plan.blocks.push_back(std::move(placement));
    }

    logger_.detailed("Static lookup matched " + std::to_string(plan.blocks.size()) + " points");
    return plan;
}

} // namespace survey
