/**
 * @file PlanarGridIndex.hpp
 * @brief Hash-grid lookup of points within a small XY tolerance
 *
 * Cells are tolerance-sized, so every point within the tolerance of a query
 * lies in the query cell or one of its eight neighbours.
 */

#pragma once

#include <unordered_map>
#include <vector>
#include <algorithm>
#include <cstdint>
#include <cmath>
#include <utility>

namespace survey {

class PlanarGridIndex {
public:
    explicit PlanarGridIndex(double tolerance)
        : tolerance_(tolerance > 0.0 ? tolerance : 1e-9) {}

    void insert(double x, double y, size_t id) {
        cells_[cell_key(x, y)].push_back(Entry{x, y, id});
    }

    /**
     * @brief Ids of all entries within tolerance of (x, y), ascending
     */
    std::vector<size_t> query(double x, double y) const {
        std::vector<size_t> result;
        auto [cx, cy] = cell_key(x, y);
        double tolerance_sq = tolerance_ * tolerance_;

        for (std::int64_t dx = -1; dx <= 1; ++dx) {
            for (std::int64_t dy = -1; dy <= 1; ++dy) {
                auto it = cells_.find({cx + dx, cy + dy});
                if (it == cells_.end()) {
                    continue;
                }
                for (const auto& entry : it->second) {
                    double ex = entry.x - x;
                    double ey = entry.y - y;
                    if (ex * ex + ey * ey <= tolerance_sq) {
                        result.push_back(entry.id);
                    }
                }
            }
        }

        std::sort(result.begin(), result.end());
        result.erase(std::unique(result.begin(), result.end()), result.end());
        return result;
    }

    double tolerance() const { return tolerance_; }

private:
    using CellKey = std::pair<std::int64_t, std::int64_t>;

    struct CellKeyHash {
        std::size_t operator()(const CellKey& key) const {
            auto h1 = std::hash<std::int64_t>{}(key.first);
            auto h2 = std::hash<std::int64_t>{}(key.second);
            return h1 ^ (h2 << 1);
        }
    };

    struct Entry {
        double x, y;
        size_t id;
    };

    CellKey cell_key(double x, double y) const {
        return {static_cast<std::int64_t>(std::floor(x / tolerance_)),
                static_cast<std::int64_t>(std::floor(y / tolerance_))};
    }

    double tolerance_;
    std::unordered_map<CellKey, std::vector<Entry>, CellKeyHash> cells_;
};

} // namespace survey
