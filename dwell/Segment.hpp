#pragma once
#include <ostream>
#include <string>

namespace dwell {

/** The demand policy of an Agent.  The set is closed: every function that dispatches on a Segment
 * does so with an exhaustive switch, and a value outside the three enumerators is rejected with an
 * invalid_segment_error.
 */
enum class Segment {
    /// Wants new construction with the highest quality score.
    FANCY,
    /// Looks for value: a low price per unit of area.
    OPTIMIZER,
    /// Looks at properties priced at or below the market average.
    AVERAGE
};

/// The number of Segment enumerators; segments are drawn uniformly from `[0, segment_count)`.
constexpr int segment_count = 3;

/** Returns the textual tag of a segment ("FANCY", "OPTIMIZER" or "AVERAGE").
 *
 * \throws dwell::invalid_segment_error if `s` is not one of the enumerators
 */
std::string to_string(Segment s);

/** Parses a segment tag.  Matching is exact and case-sensitive.
 *
 * \throws dwell::invalid_segment_error for any other tag
 */
Segment parse_segment(const std::string &tag);

/// Writes the segment tag to the stream.
std::ostream& operator<<(std::ostream &os, Segment s);

}
