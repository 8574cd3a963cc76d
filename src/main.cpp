/**
 * @file main.cpp
 * @brief Main entry point for the survey annotator
 *
 * Reads a survey point table, runs the annotation pipeline and writes the
 * result into a DXF drawing built from a template.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "survey_annotator.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/SummaryReport.hpp"
#include "core/PointTableReader.hpp"
#include "export/DxfDrawingSink.hpp"
#include "export/MemoryDrawingSink.hpp"
#include <iostream>
#include <memory>

using namespace survey;

/**
 * @brief Run the pipeline against the drawing sink selected by the settings
 * @return false if the output drawing cannot be opened or closed
 */
bool run_pipeline(const RunSettings& settings, const std::vector<SurveyPoint>& points,
                  GenerationSummary& summary) {
    SurveyAnnotator annotator(settings.annotation);

    if (settings.dry_run) {
        MemoryDrawingSink sink;
        for (const auto& layer : settings.layers) {
            sink.define_layer(layer);
        }
        summary = annotator.generate(points, sink);
        return true;
    }

    DxfDrawingSink::Options options;
    options.template_path = settings.template_path;
    options.layers = settings.layers;

    DxfDrawingSink sink(options);
    if (!sink.open(settings.output_path)) {
        std::cerr << "Error: Cannot create output drawing " << settings.output_path << "\n";
        return false;
    }

    summary = annotator.generate(points, sink);

    if (!sink.close()) {
        std::cerr << "Error: Failed to finish output drawing " << settings.output_path << "\n";
        return false;
    }
    if (sink.write_failures() > 0) {
        summary.record_skip(SkipCategory::GEOMETRY,
                            std::to_string(sink.write_failures()) + " entities rejected by the DXF writer",
                            sink.write_failures());
    }
    return true;
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;
        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_code();  // Help, version, create-config or error
        }

        const RunSettings& settings = cli.get_settings();
        cli.print_config();

        PointTableReader reader;
        std::vector<SurveyPoint> points;
        if (!reader.load(settings.input_path, points)) {
            std::cerr << "Error: Failed to read point table " << settings.input_path << "\n";
            return 1;
        }

        GenerationSummary summary;
        if (!run_pipeline(settings, points, summary)) {
            return 1;
        }

        // Rows the reader dropped count as input defects of this run
        for (const auto& message : reader.get_stats().skipped_messages) {
            summary.record_skip(SkipCategory::INPUT, message);
        }

        if (settings.report_path) {
            if (!write_summary_report(*settings.report_path, summary, reader.get_stats(), settings)) {
                std::cerr << "Error: Failed to write report " << *settings.report_path << "\n";
                return 1;
            }
        }

        if (settings.log_level >= 3) {
            print_summary(summary);
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
