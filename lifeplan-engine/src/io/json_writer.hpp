#ifndef LIFEPLAN_IO_JSON_WRITER_HPP
#define LIFEPLAN_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../comparison.hpp"
#include "../trajectory.hpp"

namespace lifeplan {
namespace io {

// Write Trajectory to JSON format
// Amounts are written in dollars, keys follow the field names of the structs
void write_trajectory_json(std::ostream& os, const Trajectory& trajectory,
                           bool pretty_print = true);

// Write Trajectory to JSON file
void write_trajectory_json(const std::string& filepath, const Trajectory& trajectory,
                           bool pretty_print = true);

// Write Comparison to JSON format
// Both trajectories are embedded in full
void write_comparison_json(std::ostream& os, const Comparison& comparison,
                           bool pretty_print = true);

// Write Comparison to JSON file
void write_comparison_json(const std::string& filepath, const Comparison& comparison,
                           bool pretty_print = true);

} // namespace io
} // namespace lifeplan

#endif // LIFEPLAN_IO_JSON_WRITER_HPP
