/**
 * @file StaticBlockPlacer.hpp
 * @brief Code-to-block lookup for point symbols
 */

#pragma once

#include "PlacementPlan.hpp"
#include "Logger.hpp"
#include <string>
#include <vector>

namespace survey {

/**
 * @brief Places one block per point whose code appears in the block mapping
 *
 * Mapping entries are tried in configuration order and the first entry
 * listing the code wins. Line-support codes are left to LineSupportPlacer.
 */
class StaticBlockPlacer {
public:
    explicit StaticBlockPlacer(const AnnotationConfig& config);

    PlacementPlan place(const std::vector<SurveyPoint>& points, const DrawingSink& sink) const;

    /**
     * @brief First mapping entry for a normalized code, or nullptr
     *
     * Entries without a block name never match.
     */
    const BlockMappingEntry* find_entry(const std::string& normalized_code) const;

private:
    const AnnotationConfig& config_;
    std::vector<std::vector<std::string>> entry_codes_;   ///< Normalized codes per mapping entry
    std::vector<std::string> support_codes_;
    std::vector<std::string> numbered_codes_;
    Logger logger_;
};

} // namespace survey
