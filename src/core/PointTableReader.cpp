/**
 * @file PointTableReader.cpp
 * @brief Implementation of the CSV point table reader
 */

#include "PointTableReader.hpp"
#include "TextUtils.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>

namespace survey {

namespace {

std::string field_value(const std::vector<std::string>& values, int column) {
    if (column < 0 || static_cast<size_t>(column) >= values.size()) {
        return "";
    }
    return trim(values[static_cast<size_t>(column)]);
}

bool has_csv_extension(const std::string& path) {
    return path.size() >= 4 && to_lower(path.substr(path.size() - 4)) == ".csv";
}

} // namespace

PointTableReader::PointTableReader()
    : logger_("PointTableReader") {
    GDALAllRegister();
}

PointColumnMap PointTableReader::map_columns(const std::vector<std::string>& names) {
    PointColumnMap columns;
    for (size_t i = 0; i < names.size(); ++i) {
        std::string name = normalize_code(names[i]);
        int index = static_cast<int>(i);

        if (name == "point" && columns.point < 0) columns.point = index;
        else if (name == "x" && columns.x < 0) columns.x = index;
        else if (name == "y" && columns.y < 0) columns.y = index;
        else if (name == "z" && columns.z < 0) columns.z = index;
        else if (name == "code" && columns.code < 0) columns.code = index;
        else if ((name == "comment" || name == "coments" || name == "comments") && columns.comment < 0) {
            columns.comment = index;
        }
    }
    return columns;
}

std::optional<SurveyPoint> PointTableReader::parse_row(const std::vector<std::string>& values,
                                                       const PointColumnMap& columns, size_t row_index) {
    auto x = parse_number(field_value(values, columns.x));
    auto y = parse_number(field_value(values, columns.y));
    auto z = parse_number(field_value(values, columns.z));
    if (!x || !y || !z) {
        return std::nullopt;
    }

    SurveyPoint point;
    point.id = field_value(values, columns.point);
    point.x = *x;
    point.y = *y;
    point.z = *z;
    point.code = field_value(values, columns.code);
    point.comment = field_value(values, columns.comment);
    point.row_index = row_index;
    return point;
}

bool PointTableReader::load(const std::string& path, std::vector<SurveyPoint>& points) {
    stats_ = PointTableStats{};
    points.clear();

    // Non-.csv names need the explicit driver prefix
    std::string source = has_csv_extension(path) ? path : "CSV:" + path;
    const char* allowed_drivers[] = {"CSV", nullptr};
    const char* open_options[] = {"AUTODETECT_TYPE=NO", "EMPTY_STRING_AS_NULL=NO", nullptr};

    GDALDataset* dataset = static_cast<GDALDataset*>(
        GDALOpenEx(source.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, allowed_drivers, open_options, nullptr));
    if (!dataset) {
        logger_.error("Cannot open point table: " + path);
        return false;
    }

    OGRLayer* layer = dataset->GetLayer(0);
    if (!layer) {
        logger_.error("Point table has no rows: " + path);
        GDALClose(dataset);
        return false;
    }

    OGRFeatureDefn* definition = layer->GetLayerDefn();
    std::vector<std::string> names;
    for (int i = 0; i < definition->GetFieldCount(); ++i) {
        names.push_back(definition->GetFieldDefn(i)->GetNameRef());
    }

    PointColumnMap columns = map_columns(names);
    if (!columns.has_coordinates()) {
        logger_.error("Point table " + path + " must have X, Y and Z columns");
        GDALClose(dataset);
        return false;
    }

    layer->ResetReading();
    OGRFeature* feature = nullptr;
    std::vector<std::string> values(names.size());
    while ((feature = layer->GetNextFeature()) != nullptr) {
        for (size_t i = 0; i < names.size(); ++i) {
            values[i] = feature->GetFieldAsString(static_cast<int>(i));
        }
        OGRFeature::DestroyFeature(feature);

        size_t row_index = stats_.rows++;
        auto point = parse_row(values, columns, row_index);
        if (!point) {
            stats_.skipped_rows++;
            std::string message = "Row " + std::to_string(row_index + 1) + " skipped: non-numeric coordinates";
            stats_.skipped_messages.push_back(message);
            logger_.warning(message);
            continue;
        }
        points.push_back(std::move(*point));
    }

    GDALClose(dataset);
    stats_.points = points.size();

    logger_.info("Loaded " + std::to_string(stats_.points) + " points from " + path +
                 (stats_.skipped_rows > 0 ? " (" + std::to_string(stats_.skipped_rows) + " rows skipped)" : ""));
    return true;
}

} // namespace survey
