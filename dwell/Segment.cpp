#include <dwell/Segment.hpp>
#include <dwell/error.hpp>

namespace dwell {

std::string to_string(Segment s) {
    switch (s) {
        case Segment::FANCY:     return "FANCY";
        case Segment::OPTIMIZER: return "OPTIMIZER";
        case Segment::AVERAGE:   return "AVERAGE";
    }
    throw invalid_segment_error("Invalid segment value " + std::to_string(static_cast<int>(s)));
}

Segment parse_segment(const std::string &tag) {
    if (tag == "FANCY") return Segment::FANCY;
    if (tag == "OPTIMIZER") return Segment::OPTIMIZER;
    if (tag == "AVERAGE") return Segment::AVERAGE;
    throw invalid_segment_error("Invalid segment: " + tag + ". Choose from 'FANCY', 'OPTIMIZER', or 'AVERAGE'.");
}

std::ostream& operator<<(std::ostream &os, Segment s) {
    return os << to_string(s);
}

}
