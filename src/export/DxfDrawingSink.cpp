/**
 * @file DxfDrawingSink.cpp
 * @brief Implementation of DXF output via GDAL/OGR
 */

#include "DxfDrawingSink.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_geometry.h>
#include <ogr_feature.h>
#include <cpl_conv.h>
#include <cpl_string.h>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <limits>

namespace survey {

namespace {

struct Rgb {
    int r, g, b;
};

Rgb hsv_to_rgb(double hue_deg, double saturation, double value) {
    double c = value * saturation;
    double x = c * (1.0 - std::abs(std::fmod(hue_deg / 60.0, 2.0) - 1.0));
    double m = value - c;
    double r = 0.0, g = 0.0, b = 0.0;
    if (hue_deg < 60.0)       { r = c; g = x; }
    else if (hue_deg < 120.0) { r = x; g = c; }
    else if (hue_deg < 180.0) { g = c; b = x; }
    else if (hue_deg < 240.0) { g = x; b = c; }
    else if (hue_deg < 300.0) { r = x; b = c; }
    else                      { r = c; b = x; }
    return Rgb{static_cast<int>(std::lround((r + m) * 255.0)),
               static_cast<int>(std::lround((g + m) * 255.0)),
               static_cast<int>(std::lround((b + m) * 255.0))};
}

// Index 0 is unused (ByBlock); 1-255 follow the AutoCAD color index
const std::array<Rgb, 256>& aci_palette() {
    static const std::array<Rgb, 256> palette = [] {
        std::array<Rgb, 256> table{};
        const Rgb base[10] = {{0, 0, 0},       {255, 0, 0},   {255, 255, 0}, {0, 255, 0},
                              {0, 255, 255},   {0, 0, 255},   {255, 0, 255}, {255, 255, 255},
                              {128, 128, 128}, {192, 192, 192}};
        for (int i = 0; i < 10; ++i) {
            table[i] = base[i];
        }

        const double brightness[5] = {1.0, 0.65, 0.5, 0.3, 0.15};
        for (int aci = 10; aci < 250; ++aci) {
            double hue = (aci / 10 - 1) * 15.0;
            int shade = aci % 10;
            double saturation = (shade % 2 == 0) ? 1.0 : 0.5;
            table[aci] = hsv_to_rgb(hue, saturation, brightness[shade / 2]);
        }

        const int greys[6] = {51, 80, 105, 130, 190, 255};
        for (int i = 0; i < 6; ++i) {
            table[250 + i] = Rgb{greys[i], greys[i], greys[i]};
        }
        return table;
    }();
    return palette;
}

std::string escape_label_text(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::string format_number(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.6g", value);
    return buffer;
}

} // namespace

// ============================================================================
// Color Helpers
// ============================================================================

std::string DxfDrawingSink::aci_to_hex(int aci) {
    if (aci < 1 || aci > 255) {
        return "";
    }
    const Rgb& rgb = aci_palette()[aci];
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", rgb.r, rgb.g, rgb.b);
    return buffer;
}

int DxfDrawingSink::hex_to_aci(const std::string& hex) {
    unsigned int r = 0, g = 0, b = 0;
    if (hex.size() < 7 || hex[0] != '#' || std::sscanf(hex.c_str() + 1, "%02x%02x%02x", &r, &g, &b) != 3) {
        return 256;
    }

    int best = 7;
    long best_distance = std::numeric_limits<long>::max();
    const auto& palette = aci_palette();
    for (int aci = 1; aci <= 255; ++aci) {
        long dr = static_cast<long>(r) - palette[aci].r;
        long dg = static_cast<long>(g) - palette[aci].g;
        long db = static_cast<long>(b) - palette[aci].b;
        long distance = dr * dr + dg * dg + db * db;
        if (distance < best_distance) {
            best_distance = distance;
            best = aci;
        }
    }
    return best;
}

std::vector<Point3D> DxfDrawingSink::remove_duplicate_vertices(const std::vector<Point3D>& points,
                                                               double tolerance) {
    std::vector<Point3D> unique;
    unique.reserve(points.size());
    for (const auto& point : points) {
        if (!unique.empty() &&
            std::abs(point.x() - unique.back().x()) <= tolerance &&
            std::abs(point.y() - unique.back().y()) <= tolerance) {
            continue;
        }
        unique.push_back(point);
    }
    return unique;
}

// ============================================================================
// Lifecycle
// ============================================================================

DxfDrawingSink::DxfDrawingSink(const Options& options)
    : options_(options), logger_("DxfDrawingSink") {
    GDALAllRegister();
    for (const auto& layer : options_.layers) {
        layer_catalog_[layer.name] = layer;
    }
}

DxfDrawingSink::~DxfDrawingSink() {
    if (dataset_) {
        close();
    }
}

bool DxfDrawingSink::open(const std::string& output_path) {
    if (dataset_) {
        logger_.error("DXF output is already open");
        return false;
    }

    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("DXF");
    if (!driver) {
        logger_.error("DXF driver not available");
        return false;
    }

    char** creation_options = nullptr;
    if (options_.template_path) {
        if (!load_template_blocks(*options_.template_path)) {
            return false;
        }
        creation_options = CSLSetNameValue(creation_options, "HEADER", options_.template_path->c_str());
    }

    dataset_ = driver->Create(output_path.c_str(), 0, 0, 0, GDT_Unknown, creation_options);
    CSLDestroy(creation_options);
    if (!dataset_) {
        logger_.error("Failed to create DXF file: " + output_path);
        return false;
    }

    layer_ = dataset_->CreateLayer("entities", nullptr, wkbUnknown, nullptr);
    if (!layer_) {
        logger_.error("Failed to create DXF entities layer");
        GDALClose(dataset_);
        dataset_ = nullptr;
        return false;
    }

    logger_.info("Writing DXF: " + output_path + " (" + std::to_string(block_catalog_.size()) +
                 " template blocks)");
    return true;
}

bool DxfDrawingSink::close() {
    if (!dataset_) {
        return false;
    }
    GDALClose(dataset_);
    dataset_ = nullptr;
    layer_ = nullptr;

    if (write_failures_ > 0) {
        logger_.warning(std::to_string(write_failures_) + " entities could not be written");
    }
    return true;
}

bool DxfDrawingSink::load_template_blocks(const std::string& template_path) {
    // Keep block definitions as separate features instead of exploding inserts
    CPLSetConfigOption("DXF_INLINE_BLOCKS", "FALSE");
    GDALDataset* source = static_cast<GDALDataset*>(
        GDALOpenEx(template_path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr));
    CPLSetConfigOption("DXF_INLINE_BLOCKS", nullptr);

    if (!source) {
        logger_.error("Cannot open DXF template: " + template_path);
        return false;
    }

    OGRLayer* blocks = source->GetLayerByName("blocks");
    if (!blocks) {
        logger_.warning("Template " + template_path + " defines no blocks");
        GDALClose(source);
        return true;
    }

    int name_field = blocks->GetLayerDefn()->GetFieldIndex("BlockName");
    int layer_field = blocks->GetLayerDefn()->GetFieldIndex("Layer");
    if (name_field < 0) {
        logger_.warning("Template blocks layer has no BlockName field");
        GDALClose(source);
        return true;
    }

    blocks->ResetReading();
    OGRFeature* feature = nullptr;
    while ((feature = blocks->GetNextFeature()) != nullptr) {
        std::string name = feature->GetFieldAsString(name_field);
        if (!name.empty()) {
            BlockInfo& info = block_catalog_[name];

            if (!info.first_entity) {
                EntityAttributes first;
                first.layer = layer_field >= 0 ? feature->GetFieldAsString(layer_field) : "0";
                first.color = 256;
                if (const char* style = feature->GetStyleString()) {
                    std::string style_text(style);
                    auto pos = style_text.find("c:#");
                    if (pos != std::string::npos) {
                        first.color = hex_to_aci(style_text.substr(pos + 2, 7));
                    }
                }
                info.first_entity = first;
            }

            if (const OGRGeometry* geometry = feature->GetGeometryRef()) {
                OGREnvelope envelope;
                geometry->getEnvelope(&envelope);
                if (!info.has_extent) {
                    info.min_x = envelope.MinX;
                    info.min_y = envelope.MinY;
                    info.max_x = envelope.MaxX;
                    info.max_y = envelope.MaxY;
                    info.has_extent = true;
                } else {
                    info.min_x = std::min(info.min_x, envelope.MinX);
                    info.min_y = std::min(info.min_y, envelope.MinY);
                    info.max_x = std::max(info.max_x, envelope.MaxX);
                    info.max_y = std::max(info.max_y, envelope.MaxY);
                }
            }
        }
        OGRFeature::DestroyFeature(feature);
    }

    GDALClose(source);
    logger_.detailed("Loaded " + std::to_string(block_catalog_.size()) + " blocks from " + template_path);
    return true;
}

// ============================================================================
// Feature Helpers
// ============================================================================

OGRFeature* DxfDrawingSink::create_feature(const EntityAttributes& attributes) const {
    OGRFeature* feature = OGRFeature::CreateFeature(layer_->GetLayerDefn());
    int layer_field = feature->GetFieldIndex("Layer");
    if (layer_field >= 0) {
        feature->SetField(layer_field, attributes.layer.c_str());
    }
    return feature;
}

bool DxfDrawingSink::commit_feature(OGRFeature* feature, OGRGeometry* geometry, const std::string& style,
                                    const std::string& description) {
    feature->SetGeometry(geometry);
    if (!style.empty()) {
        feature->SetStyleString(style.c_str());
    }

    bool ok = layer_->CreateFeature(feature) == OGRERR_NONE;
    if (!ok) {
        write_failures_++;
        logger_.warning("Failed to write " + description);
    }

    OGRFeature::DestroyFeature(feature);
    OGRGeometryFactory::destroyGeometry(geometry);
    return ok;
}

std::string DxfDrawingSink::pen_style(int aci) const {
    std::string color = aci_to_hex(aci);
    return color.empty() ? std::string() : "PEN(c:" + color + ")";
}

// ============================================================================
// Writes
// ============================================================================

void DxfDrawingSink::add_point(const Point3D& position, const EntityAttributes& attributes) {
    if (!layer_) {
        write_failures_++;
        return;
    }
    OGRFeature* feature = create_feature(attributes);
    commit_feature(feature, new OGRPoint(position.x(), position.y(), position.z()),
                   pen_style(attributes.color), "point");
}

void DxfDrawingSink::add_face(const Point3D& v1, const Point3D& v2, const Point3D& v3,
                              const EntityAttributes& attributes) {
    if (!layer_) {
        write_failures_++;
        return;
    }

    auto* ring = new OGRLinearRing();
    for (const Point3D* vertex : {&v1, &v2, &v3}) {
        ring->addPoint(vertex->x(), vertex->y(), vertex->z());
    }
    ring->closeRings();
    auto* polygon = new OGRPolygon();
    polygon->addRingDirectly(ring);

    OGRFeature* feature = create_feature(attributes);
    commit_feature(feature, polygon, pen_style(attributes.color), "face");
}

void DxfDrawingSink::add_polyline(const std::vector<Point3D>& points, bool closed, bool three_d,
                                  const EntityAttributes& attributes) {
    if (!layer_) {
        write_failures_++;
        return;
    }

    std::vector<Point3D> vertices = remove_duplicate_vertices(points, options_.vertex_tolerance);
    if (closed && vertices.size() > 2 &&
        distance_2d(vertices.front(), vertices.back()) <= options_.vertex_tolerance) {
        vertices.pop_back();
    }
    if (vertices.size() < 2) {
        logger_.debug("Skipping polyline with fewer than 2 distinct vertices");
        return;
    }

    OGRGeometry* geometry = nullptr;
    if (closed && vertices.size() >= 3) {
        auto* ring = new OGRLinearRing();
        for (const auto& v : vertices) {
            if (three_d) ring->addPoint(v.x(), v.y(), v.z());
            else ring->addPoint(v.x(), v.y());
        }
        ring->closeRings();
        auto* polygon = new OGRPolygon();
        polygon->addRingDirectly(ring);
        geometry = polygon;
    } else {
        auto* line = new OGRLineString();
        for (const auto& v : vertices) {
            if (three_d) line->addPoint(v.x(), v.y(), v.z());
            else line->addPoint(v.x(), v.y());
        }
        geometry = line;
    }

    OGRFeature* feature = create_feature(attributes);
    commit_feature(feature, geometry, pen_style(attributes.color), "polyline");
}

void DxfDrawingSink::add_text(const TextAnnotation& text) {
    if (!layer_) {
        write_failures_++;
        return;
    }

    std::string style = "LABEL(f:\"" + options_.text_font + "\",t:\"" + escape_label_text(text.text) +
                        "\",s:" + format_number(text.height) + "g";
    if (text.rotation_deg != 0.0) {
        style += ",a:" + format_number(text.rotation_deg);
    }
    std::string color = aci_to_hex(text.attributes.color);
    if (!color.empty()) {
        style += ",c:" + color;
    }
    style += ")";

    OGRFeature* feature = create_feature(text.attributes);
    int text_field = feature->GetFieldIndex("Text");
    if (text_field >= 0) {
        feature->SetField(text_field, text.text.c_str());
    }
    commit_feature(feature, new OGRPoint(text.position.x(), text.position.y(), text.position.z()),
                   style, "text '" + text.text + "'");
}

PlacementResult DxfDrawingSink::add_block_reference(const BlockPlacement& placement) {
    if (!has_block(placement.block_name)) {
        return PlacementResult::failure(PlacementError::MissingBlock,
                                        "Block " + placement.block_name + " is not present in the template");
    }
    if (!layer_) {
        return PlacementResult::failure(PlacementError::WriteFailed, "DXF output is not open");
    }
    for (double s : placement.scale) {
        if (!std::isfinite(s)) {
            return PlacementResult::failure(PlacementError::InvalidGeometry,
                                            "Non-finite scale for block " + placement.block_name);
        }
    }

    OGRFeature* feature = create_feature(placement.attributes);
    feature->SetField("BlockName", placement.block_name.c_str());
    feature->SetField("BlockAngle", placement.rotation_deg);
    feature->SetField("BlockScale", 3, placement.scale.data());

    const Point3D& p = placement.position;
    if (!commit_feature(feature, new OGRPoint(p.x(), p.y(), p.z()), pen_style(placement.attributes.color),
                        "block " + placement.block_name)) {
        return PlacementResult::failure(PlacementError::WriteFailed,
                                        "OGR rejected block " + placement.block_name);
    }
    return PlacementResult::ok();
}

PlacementResult DxfDrawingSink::add_area_fill(const std::vector<Point3D>& boundary, const FillStyle& style,
                                              const EntityAttributes& attributes) {
    if (!layer_) {
        return PlacementResult::failure(PlacementError::WriteFailed, "DXF output is not open");
    }

    std::vector<Point3D> vertices = remove_duplicate_vertices(boundary, options_.vertex_tolerance);
    if (vertices.size() < 3) {
        return PlacementResult::failure(PlacementError::InvalidGeometry,
                                        "Fill boundary needs at least 3 distinct points");
    }

    auto* ring = new OGRLinearRing();
    for (const auto& v : vertices) {
        ring->addPoint(v.x(), v.y());
    }
    ring->closeRings();
    auto* polygon = new OGRPolygon();
    polygon->addRingDirectly(ring);

    // The OGR DXF writer emits BRUSH polygons as solid HATCH entities only
    if (!style.solid) {
        logger_.debug("Pattern " + style.pattern + " written as solid fill");
    }

    std::string color = aci_to_hex(attributes.color);
    std::string brush = color.empty() ? "BRUSH(fc:#ffffff)" : "BRUSH(fc:" + color + ")";

    OGRFeature* feature = create_feature(attributes);
    if (!commit_feature(feature, polygon, brush, "area fill")) {
        return PlacementResult::failure(PlacementError::WriteFailed, "OGR rejected area fill");
    }
    return PlacementResult::ok();
}

// ============================================================================
// Catalog Queries
// ============================================================================

bool DxfDrawingSink::has_block(const std::string& name) const {
    return block_catalog_.count(name) > 0;
}

std::optional<BlockExtent> DxfDrawingSink::get_block_bounding_box(const std::string& name) const {
    auto it = block_catalog_.find(name);
    if (it == block_catalog_.end() || !it->second.has_extent) {
        return std::nullopt;
    }
    return BlockExtent{it->second.max_x - it->second.min_x, it->second.max_y - it->second.min_y};
}

std::optional<EntityAttributes> DxfDrawingSink::block_properties(const std::string& name) const {
    auto it = block_catalog_.find(name);
    if (it == block_catalog_.end()) {
        return std::nullopt;
    }
    return it->second.first_entity;
}

std::optional<LayerAttributes> DxfDrawingSink::layer_exists(const std::string& name) const {
    auto it = layer_catalog_.find(name);
    if (it == layer_catalog_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace survey
