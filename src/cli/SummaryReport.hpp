/**
 * @file SummaryReport.hpp
 * @brief JSON report of one annotation run
 */

#pragma once

#include "survey_annotator.hpp"
#include "CommandLineInterface.hpp"
#include "../core/PointTableReader.hpp"
#include <string>

namespace survey {

/**
 * @brief Render the run summary as indented JSON
 *
 * Holds the input file, output file, per-stage counts, skip counters by
 * category, the retained warning messages and the run time.
 */
std::string format_summary_report(const GenerationSummary& summary,
                                  const PointTableStats& input_stats,
                                  const RunSettings& settings);

/**
 * @brief Write format_summary_report() to a file
 * @return false if the file cannot be written
 */
bool write_summary_report(const std::string& path,
                          const GenerationSummary& summary,
                          const PointTableStats& input_stats,
                          const RunSettings& settings);

/**
 * @brief Print the human-readable run summary to stdout
 */
void print_summary(const GenerationSummary& summary);

} // namespace survey
