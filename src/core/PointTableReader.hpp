/**
 * @file PointTableReader.hpp
 * @brief Survey point table loading through the GDAL/OGR CSV driver
 */

#pragma once

#include "survey_annotator.hpp"
#include "Logger.hpp"
#include <string>
#include <vector>

namespace survey {

/**
 * @brief Positions of the recognised columns (-1 = absent)
 */
struct PointColumnMap {
    int point = -1;
    int x = -1;
    int y = -1;
    int z = -1;
    int code = -1;
    int comment = -1;

    bool has_coordinates() const { return x >= 0 && y >= 0 && z >= 0; }
};

struct PointTableStats {
    size_t rows = 0;
    size_t points = 0;
    size_t skipped_rows = 0;
    std::vector<std::string> skipped_messages;
};

/**
 * @brief Reads Point, X, Y, Z, Code, Comment tables
 *
 * Column names are matched case-insensitively ("Coments" and "Comments"
 * are accepted for the comment column). Values are trimmed and a decimal
 * comma is accepted. Rows whose X, Y or Z is not a number are skipped and
 * counted.
 */
class PointTableReader {
public:
    PointTableReader();

    /**
     * @brief Load a delimited table (comma, semicolon or tab)
     * @return false if the file cannot be opened or lacks X/Y/Z columns
     */
    bool load(const std::string& path, std::vector<SurveyPoint>& points);

    static PointColumnMap map_columns(const std::vector<std::string>& names);

    /**
     * @brief Build a point from one row of field values
     * @return nullopt when a coordinate is missing or not numeric
     */
    static std::optional<SurveyPoint> parse_row(const std::vector<std::string>& values,
                                                const PointColumnMap& columns, size_t row_index);

    const PointTableStats& get_stats() const { return stats_; }

private:
    Logger logger_;
    PointTableStats stats_;
};

} // namespace survey
