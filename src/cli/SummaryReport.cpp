/**
 * @file SummaryReport.cpp
 * @brief JSON and console run summaries
 */

#include "SummaryReport.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace survey {

std::string format_summary_report(const GenerationSummary& summary,
                                  const PointTableStats& input_stats,
                                  const RunSettings& settings) {
    json report = {
        {"input", {
            {"path", settings.input_path},
            {"rows", input_stats.rows},
            {"points", summary.input_points}
        }},
        {"output", {
            {"path", settings.dry_run ? json(nullptr) : json(settings.output_path)},
            {"template", settings.template_path ? json(*settings.template_path) : json(nullptr)},
            {"dry_run", settings.dry_run}
        }},
        {"surface", {
            {"base_points", summary.base_points},
            {"base_triangles", summary.base_triangles},
            {"refined_points", summary.refined_points},
            {"refined_triangles", summary.refined_triangles},
            {"contour_levels", summary.contour_levels},
            {"contour_polylines", summary.contour_polylines}
        }},
        {"annotation", {
            {"breaklines", summary.breaklines},
            {"static_blocks", summary.static_blocks},
            {"support_blocks", summary.support_blocks},
            {"tower_blocks", summary.tower_blocks},
            {"vegetation_areas", summary.vegetation_areas},
            {"vegetation_blocks", summary.vegetation_blocks},
            {"pattern_fills_as_solid", summary.pattern_fills_as_solid},
            {"labels", summary.labels}
        }},
        {"skipped", {
            {"input", summary.skipped_input},
            {"geometry", summary.skipped_geometry},
            {"template", summary.skipped_template},
            {"total", summary.total_skipped()}
        }},
        {"warnings", summary.warnings},
        {"total_time_ms", summary.total_time.count()}
    };
    return report.dump(2);
}

bool write_summary_report(const std::string& path,
                          const GenerationSummary& summary,
                          const PointTableStats& input_stats,
                          const RunSettings& settings) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << format_summary_report(summary, input_stats, settings) << std::endl;
    return file.good();
}

void print_summary(const GenerationSummary& summary) {
    std::cout << "\n=== Annotation Summary ===\n";
    std::cout << "Input points: " << summary.input_points << "\n";
    std::cout << "Breaklines: " << summary.breaklines << "\n";
    std::cout << "Blocks: " << summary.static_blocks << " static, "
              << summary.support_blocks << " supports, "
              << summary.tower_blocks << " towers, "
              << summary.vegetation_blocks << " vegetation\n";
    std::cout << "Vegetation areas: " << summary.vegetation_areas << "\n";
    if (summary.pattern_fills_as_solid > 0) {
        std::cout << "Pattern fills written solid: " << summary.pattern_fills_as_solid << "\n";
    }
    std::cout << "Labels: " << summary.labels << "\n";
    if (summary.base_points > 0) {
        std::cout << "Surface: " << summary.base_triangles << " triangles from "
                  << summary.base_points << " points\n";
        if (summary.refined_points > 0) {
            std::cout << "Refinement: +" << summary.refined_points << " points, "
                      << summary.refined_triangles << " triangles\n";
        }
        std::cout << "Contours: " << summary.contour_polylines << " polylines on "
                  << summary.contour_levels << " levels\n";
    }
    std::cout << "Skipped: " << summary.skipped_input << " input, "
              << summary.skipped_geometry << " geometry, "
              << summary.skipped_template << " template\n";
    std::cout << "Total time: " << summary.total_time.count() << "ms\n";
    std::cout << "==========================\n";
}

} // namespace survey
