#ifndef TIME_GRID_HPP
#define TIME_GRID_HPP

#include <string>
#include <vector>

namespace crn {

/**
 * @namespace TimeGrid
 * @brief Helpers for building and checking output time grids.
 */
namespace TimeGrid {

    /**
     * @brief Evenly spaced grid over [start, end] with both ends included.
     *
     * @param start First time point.
     * @param end Last time point.
     * @param num_points Number of points; must be at least 2.
     * @return std::vector<double> The grid. The last element equals `end` exactly.
     *
     * @throws InvalidParameterException If `num_points < 2` or `end <= start`.
     */
    std::vector<double> linspace(double start, double end, int num_points);

    /**
     * @brief Checks an output grid against a simulation horizon.
     *
     * An empty grid is accepted here; callers decide whether they need one.
     *
     * @param caller Function name used in the exception.
     * @param time_points Grid to check.
     * @param start_time Horizon start.
     * @param end_time Horizon end.
     *
     * @throws InvalidParameterException If the grid is not strictly increasing,
     *         contains non-finite values, or leaves [start_time, end_time].
     */
    void validate(const std::string& caller,
                  const std::vector<double>& time_points,
                  double start_time,
                  double end_time);

} // namespace TimeGrid
} // namespace crn

#endif // TIME_GRID_HPP
