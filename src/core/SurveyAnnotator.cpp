/**
 * @file SurveyAnnotator.cpp
 * @brief Pipeline orchestration for survey annotation
 */

#include "survey_annotator.hpp"
#include "Logger.hpp"
#include "TextUtils.hpp"
#include "PointAnnotator.hpp"
#include "BreaklineExtractor.hpp"
#include "StaticBlockPlacer.hpp"
#include "LineSupportPlacer.hpp"
#include "TowerPlacer.hpp"
#include "VegetationPlacer.hpp"
#include "TinBuilder.hpp"
#include "MeshRefiner.hpp"
#include "ContourExtractor.hpp"
#include "../export/DrawingSink.hpp"
#include <chrono>
#include <stdexcept>

namespace survey {

// ============================================================================
// SurveyAnnotator::Impl - Private implementation
// ============================================================================

class SurveyAnnotator::Impl {
public:
    explicit Impl(const AnnotationConfig& config)
        : config_(config), logger_("SurveyAnnotator") {
    }

    GenerationSummary generate(const std::vector<SurveyPoint>& points, DrawingSink& sink) {
        auto start_time = std::chrono::high_resolution_clock::now();
        GenerationSummary summary;
        summary.input_points = points.size();

        if (config_.scale_factor < config_.effective_scale_factor()) {
            logger_.warning("Scale factor " + format_fixed(config_.scale_factor, 3) + " raised to " +
                            format_fixed(config_.effective_scale_factor(), 3));
        }
        logger_.info("Annotating " + std::to_string(points.size()) + " survey points (scale factor " +
                     format_fixed(config_.effective_scale_factor(), 3) + ")");

        run_stage("point labels", summary, [&] {
            PointAnnotator annotator(config_);
            summary.labels += annotator.annotate(points, sink).labels;
        });

        if (config_.show_blocks) {
            run_stage("point blocks", summary, [&] {
                StaticBlockPlacer static_placer(config_);
                summary.static_blocks += apply_plan(static_placer.place(points, sink), sink, summary);

                LineSupportPlacer support_placer(config_);
                summary.support_blocks += apply_plan(support_placer.place(points, sink), sink, summary);
            });
        }

        std::vector<Breakline> breaklines;
        run_stage("breaklines", summary, [&] {
            BreaklineExtractor extractor(config_.polyline_prefixes);
            breaklines = extractor.extract(points);
            summary.breaklines = breaklines.size();
            if (config_.show_polylines) {
                emit_breaklines(breaklines, sink, summary);
            }
        });

        if (config_.show_polylines) {
            run_stage("vegetation", summary, [&] {
                emit_vegetation(points, sink, summary);
            });
        }

        if (config_.tin.enabled) {
            run_stage("surface", summary, [&] {
                build_surface(points, breaklines, sink, summary);
            });
        }

        if (config_.show_towers) {
            run_stage("towers", summary, [&] {
                TowerPlacer placer(config_);
                summary.tower_blocks += apply_plan(placer.place(points, sink), sink, summary);
            });
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        summary.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        logger_.info("Annotation finished in " + std::to_string(summary.total_time.count()) + " ms: " +
                     std::to_string(summary.static_blocks + summary.support_blocks + summary.tower_blocks +
                                    summary.vegetation_blocks) +
                     " blocks, " + std::to_string(summary.total_skipped()) + " skipped features");
        return summary;
    }

    const AnnotationConfig& get_config() const { return config_; }

private:
    AnnotationConfig config_;
    Logger logger_;

    /**
     * @brief Run one stage; an exception skips the rest of that stage only
     */
    template <typename Stage>
    void run_stage(const std::string& name, GenerationSummary& summary, Stage&& stage) {
        try {
            stage();
        } catch (const std::exception& e) {
            logger_.error("Stage '" + name + "' failed: " + e.what());
            summary.record_skip(SkipCategory::GEOMETRY, "Stage '" + name + "' failed: " + e.what());
        }
    }

    /**
     * @brief Write a placement plan; returns the number of blocks accepted
     */
    size_t apply_plan(const PlacementPlan& plan, DrawingSink& sink, GenerationSummary& summary) {
        size_t placed = 0;
        for (const auto& block : plan.blocks) {
            PlacementResult result = sink.add_block_reference(block);
            if (result) {
                placed++;
                continue;
            }
            SkipCategory category = result.error == PlacementError::MissingBlock ? SkipCategory::TEMPLATE
                                                                                  : SkipCategory::GEOMETRY;
            logger_.warning(result.message);
            summary.record_skip(category, result.message);
        }

        for (const auto& label : plan.labels) {
            sink.add_text(label);
            summary.labels++;
        }
        for (const auto& message : plan.geometry_defects) {
            summary.record_skip(SkipCategory::GEOMETRY, message);
        }
        for (const auto& message : plan.template_defects) {
            summary.record_skip(SkipCategory::TEMPLATE, message);
        }
        return placed;
    }

    // Unknown layers are still written; they take the default color
    static EntityAttributes layer_attributes(const DrawingSink& sink, const std::string& layer) {
        auto definition = sink.layer_exists(layer);
        return EntityAttributes(layer, definition ? definition->color : 7);
    }

    // ========================================================================
    // Linear features
    // ========================================================================

    void emit_breaklines(const std::vector<Breakline>& breaklines, DrawingSink& sink, GenerationSummary& summary) {
        const double scale_factor = config_.effective_scale_factor();

        for (const auto& line : breaklines) {
            auto mapped = config_.polyline_layers.find(line.prefix);
            std::string layer = mapped != config_.polyline_layers.end() ? mapped->second
                                                                        : config_.default_polyline_layer;
            EntityAttributes attributes = layer_attributes(sink, layer);

            sink.add_polyline(line.points, false, false, attributes);
            for (const auto& label : BreaklineExtractor::segment_labels(line, scale_factor, config_.labels,
                                                                        attributes)) {
                sink.add_text(label);
                summary.labels++;
            }
        }
    }

    void emit_vegetation(const std::vector<SurveyPoint>& points, DrawingSink& sink, GenerationSummary& summary) {
        VegetationPlacer placer(config_);
        VegetationPlan plan = placer.place(points, sink);

        for (const auto& area : plan.areas) {
            sink.add_polyline(area.boundary, true, false, area.attributes);
            summary.vegetation_areas++;

            if (area.fill) {
                PlacementResult result = sink.add_area_fill(area.boundary, *area.fill, area.attributes);
                if (!result) {
                    logger_.warning("Fill for " + area.code + " failed: " + result.message);
                    summary.record_skip(result.error == PlacementError::MissingBlock ? SkipCategory::TEMPLATE
                                                                                     : SkipCategory::GEOMETRY,
                                        "Fill for " + area.code + " failed: " + result.message);
                } else if (!area.fill->solid && !sink.supports_fill_patterns()) {
                    std::string message = "Pattern " + area.fill->pattern + " for " + area.code +
                                          " written as solid fill";
                    logger_.warning(message);
                    summary.pattern_fills_as_solid++;
                    summary.record_warning(message);
                }
            }
        }

        summary.vegetation_blocks += apply_plan(plan.scatter, sink, summary);
    }

    // ========================================================================
    // Surface, refinement, contours
    // ========================================================================

    void build_surface(const std::vector<SurveyPoint>& points, const std::vector<Breakline>& breaklines,
                       DrawingSink& sink, GenerationSummary& summary) {
        const auto& tin = config_.tin;
        const EntityAttributes base_point_attributes(tin.point_layer, tin.surface_color);
        const EntityAttributes surface_attributes(tin.surface_layer, tin.surface_color);

        TinBuildConfig build_config;
        build_config.max_edge_length = tin.max_edge_length;
        build_config.dedup_tolerance = tin.dedup_tolerance;

        std::vector<Point3D> selected = TinBuilder::select_points(points, tin.codes);
        summary.base_points = selected.size();
        for (const auto& position : selected) {
            sink.add_point(position, base_point_attributes);
        }
        for (const auto& line : breaklines) {
            sink.add_polyline(line.points, false, true, surface_attributes);
        }

        TinBuilder builder(build_config);
        TerrainMesh base_mesh = builder.build(selected, breaklines);
        const auto& stats = builder.get_stats();
        if (stats.degenerate_triangles > 0) {
            summary.record_skip(SkipCategory::GEOMETRY,
                                std::to_string(stats.degenerate_triangles) + " degenerate triangles skipped",
                                stats.degenerate_triangles);
        }
        if (base_mesh.empty()) {
            summary.record_skip(SkipCategory::GEOMETRY, "Surface could not be triangulated from " +
                                                        std::to_string(selected.size()) + " points");
            return;
        }

        emit_faces(base_mesh, surface_attributes, sink);
        summary.base_triangles = base_mesh.num_triangles();

        const TerrainMesh* contour_mesh = &base_mesh;
        RefinementResult refinement;
        if (tin.refine) {
            MeshRefiner refiner(tin.refine_distance_by_scale, build_config);
            refinement = refiner.refine(base_mesh, selected, breaklines, config_.effective_tin_scale());

            if (refinement.refined) {
                const EntityAttributes refined_points(tin.refined_point_layer, tin.refined_color);
                const EntityAttributes refined_faces(tin.refined_surface_layer, tin.refined_color);
                for (const auto& position : refinement.added_points) {
                    sink.add_point(position, refined_points);
                }
                emit_faces(refinement.mesh, refined_faces, sink);

                summary.refined_points = refinement.added_points.size();
                summary.refined_triangles = refinement.mesh.num_triangles();
                if (!refinement.mesh.empty()) {
                    contour_mesh = &refinement.mesh;
                }
            }
        }

        if (tin.contours) {
            ContourExtractionConfig contour_config;
            contour_config.interval = tin.contour_interval;
            ContourExtractor extractor(contour_config);

            const EntityAttributes contour_attributes(tin.contour_layer, tin.contour_color);
            for (const auto& level : extractor.extract(*contour_mesh)) {
                for (const auto& polyline : level.polylines) {
                    sink.add_polyline(polyline.points, polyline.closed, true, contour_attributes);
                    summary.contour_polylines++;
                }
                summary.contour_levels++;
            }
            if (extractor.get_stats().ladder_too_long) {
                summary.record_skip(SkipCategory::GEOMETRY, "Contours skipped: elevation range too large");
            }
        }

        logger_.info("Surface: points=" + std::to_string(summary.base_points) +
                     " triangles=" + std::to_string(summary.base_triangles) +
                     " refined_points=" + std::to_string(summary.refined_points) +
                     " refined_triangles=" + std::to_string(summary.refined_triangles) +
                     " contours=" + std::to_string(summary.contour_polylines));
    }

    void emit_faces(const TerrainMesh& mesh, const EntityAttributes& attributes, DrawingSink& sink) {
        for (const auto& triangle : mesh.triangles()) {
            sink.add_face(mesh.get_vertex(triangle.vertices[0]),
                          mesh.get_vertex(triangle.vertices[1]),
                          mesh.get_vertex(triangle.vertices[2]),
                          attributes);
        }
    }
};

// ============================================================================
// SurveyAnnotator public interface
// ============================================================================

SurveyAnnotator::SurveyAnnotator(const AnnotationConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

SurveyAnnotator::~SurveyAnnotator() = default;

GenerationSummary SurveyAnnotator::generate(const std::vector<SurveyPoint>& points, DrawingSink& sink) {
    return impl_->generate(points, sink);
}

const AnnotationConfig& SurveyAnnotator::get_config() const {
    return impl_->get_config();
}

} // namespace survey
