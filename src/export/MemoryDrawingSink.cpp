/**
 * @file MemoryDrawingSink.cpp
 * @brief Implementation of the in-memory drawing sink
 */

#include "MemoryDrawingSink.hpp"

namespace survey {

MemoryDrawingSink::MemoryDrawingSink()
    : logger_("MemoryDrawingSink") {
}

void MemoryDrawingSink::define_block(const std::string& name, double width, double height,
                                     const std::optional<EntityAttributes>& first_entity) {
    block_catalog_[name] = BlockDefinition{BlockExtent{width, height}, first_entity};
}

void MemoryDrawingSink::define_layer(const LayerAttributes& layer) {
    layer_catalog_[layer.name] = layer;
}

// ============================================================================
// Writes
// ============================================================================

void MemoryDrawingSink::add_point(const Point3D& position, const EntityAttributes& attributes) {
    points_.push_back(PointRecord{position, attributes});
}

void MemoryDrawingSink::add_face(const Point3D& v1, const Point3D& v2, const Point3D& v3,
                                 const EntityAttributes& attributes) {
    faces_.push_back(FaceRecord{{v1, v2, v3}, attributes});
}

void MemoryDrawingSink::add_polyline(const std::vector<Point3D>& points, bool closed, bool three_d,
                                     const EntityAttributes& attributes) {
    if (points.size() < 2) {
        logger_.debug("Ignoring polyline with " + std::to_string(points.size()) + " points");
        return;
    }
    polylines_.push_back(PolylineRecord{points, closed, three_d, attributes});
}

void MemoryDrawingSink::add_text(const TextAnnotation& text) {
    texts_.push_back(text);
}

PlacementResult MemoryDrawingSink::add_block_reference(const BlockPlacement& placement) {
    if (!has_block(placement.block_name)) {
        return PlacementResult::failure(PlacementError::MissingBlock,
                                        "Block " + placement.block_name + " is not defined");
    }
    blocks_.push_back(placement);
    return PlacementResult::ok();
}

PlacementResult MemoryDrawingSink::add_area_fill(const std::vector<Point3D>& boundary, const FillStyle& style,
                                                 const EntityAttributes& attributes) {
    if (boundary.size() < 3) {
        return PlacementResult::failure(PlacementError::InvalidGeometry,
                                        "Fill boundary needs at least 3 points");
    }
    fills_.push_back(FillRecord{boundary, fill_patterns_supported_ ? style : FillStyle::solid_fill(), attributes});
    return PlacementResult::ok();
}

// ============================================================================
// Catalog Queries
// ============================================================================

bool MemoryDrawingSink::has_block(const std::string& name) const {
    return block_catalog_.count(name) > 0;
}

std::optional<BlockExtent> MemoryDrawingSink::get_block_bounding_box(const std::string& name) const {
    auto it = block_catalog_.find(name);
    if (it == block_catalog_.end()) {
        return std::nullopt;
    }
    return it->second.extent;
}

std::optional<EntityAttributes> MemoryDrawingSink::block_properties(const std::string& name) const {
    auto it = block_catalog_.find(name);
    if (it == block_catalog_.end()) {
        return std::nullopt;
    }
    return it->second.first_entity;
}

std::optional<LayerAttributes> MemoryDrawingSink::layer_exists(const std::string& name) const {
    auto it = layer_catalog_.find(name);
    if (it == layer_catalog_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MemoryDrawingSink::count_on_layer(const std::string& layer) const {
    size_t count = 0;
    for (const auto& p : points_) count += p.attributes.layer == layer;
    for (const auto& f : faces_) count += f.attributes.layer == layer;
    for (const auto& l : polylines_) count += l.attributes.layer == layer;
    for (const auto& t : texts_) count += t.attributes.layer == layer;
    for (const auto& b : blocks_) count += b.attributes.layer == layer;
    for (const auto& f : fills_) count += f.attributes.layer == layer;
    return count;
}

} // namespace survey
