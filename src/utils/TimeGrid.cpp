#include "utils/TimeGrid.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>

namespace crn {
namespace TimeGrid {

std::vector<double> linspace(double start, double end, int num_points) {
    if (num_points < 2) {
        THROW_INVALID_PARAM("TimeGrid::linspace", "At least two points are required. Got: " + std::to_string(num_points));
    }
    if (!(end > start)) {
        THROW_INVALID_PARAM("TimeGrid::linspace", "End time must be greater than start time.");
    }
    std::vector<double> grid(static_cast<size_t>(num_points));
    const double step = (end - start) / (num_points - 1);
    for (int i = 0; i < num_points; ++i) {
        grid[static_cast<size_t>(i)] = start + i * step;
    }
    grid.back() = end;
    return grid;
}

void validate(const std::string& caller,
              const std::vector<double>& time_points,
              double start_time,
              double end_time) {
    if (time_points.empty()) {
        return;
    }
    for (double t : time_points) {
        if (!std::isfinite(t)) {
            THROW_INVALID_PARAM(caller, "Output time points must be finite.");
        }
    }
    if (time_points.front() < start_time || time_points.back() > end_time) {
        THROW_INVALID_PARAM(caller,
                            "Output time points must be within [" +
                            std::to_string(start_time) + ", " +
                            std::to_string(end_time) + "]. Received: [" +
                            std::to_string(time_points.front()) + ", " +
                            std::to_string(time_points.back()) + "].");
    }
    for (size_t i = 1; i < time_points.size(); ++i) {
        if (time_points[i] <= time_points[i - 1]) {
            THROW_INVALID_PARAM(caller,
                                "Output time points must be strictly increasing. Found " +
                                std::to_string(time_points[i]) + " after " +
                                std::to_string(time_points[i - 1]) + ".");
        }
    }
}

} // namespace TimeGrid
} // namespace crn
