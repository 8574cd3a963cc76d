/**
 * @file ScaleResolver.cpp
 * @brief Evaluation of constant and height-dependent block scales
 */

#include "survey_annotator.hpp"
#include <algorithm>

namespace survey {

namespace {

struct ScaleVisitor {
    double height;

    double operator()(const ConstantScale& constant) const {
        return constant.value;
    }

    double operator()(const HeightPiecewiseScale& piecewise) const {
        if (piecewise.breakpoints.empty()) {
            return 1.0;
        }

        std::vector<ScaleBreakpoint> sorted = piecewise.breakpoints;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const ScaleBreakpoint& a, const ScaleBreakpoint& b) {
                             return a.min_height < b.min_height;
                         });

        double scale = sorted.front().scale;
        for (const auto& breakpoint : sorted) {
            if (breakpoint.min_height <= height) {
                scale = breakpoint.scale;
            } else {
                break;
            }
        }
        return scale;
    }
};

} // namespace

double resolve_scale(const ScaleResolver& resolver, double height) {
    return std::visit(ScaleVisitor{height}, resolver);
}

} // namespace survey
