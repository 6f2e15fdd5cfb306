#include <dwell/Property.hpp>
#include <dwell/error.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace dwell {

Property::Property(id_t id, double price, double area, int bedrooms, year_t year_built,
        boost::optional<QualityScore> quality, bool available)
    : id_{id}, price_{price}, area_{area}, bedrooms_{bedrooms}, year_built_{year_built},
    quality_{quality}, available_{available}
{
    if (not (price > 0))
        throw std::invalid_argument("Property " + std::to_string(id) + " must have a positive price");
    if (area < 0)
        throw std::invalid_argument("Property " + std::to_string(id) + " cannot have a negative area");
}

double Property::pricePerArea() const {
    if (area_ == 0)
        throw division_by_zero_error("Area cannot be zero when calculating the price per area of property " + std::to_string(id_));
    return std::round(price_ / area_ * 100.0) / 100.0;
}

bool Property::isNewConstruction(year_t reference_year) const {
    return reference_year - year_built_ < 5;
}

QualityScore Property::assignQualityScore(year_t reference_year) {
    if (quality_) return *quality_;

    const year_t age = reference_year - year_built_;
    int score;
    if      (age <  5) score = 5;
    else if (age < 15) score = 4;
    else if (age < 30) score = 3;
    else if (age < 50) score = 2;
    else               score = 1;

    if (area_ > 2000) score++;
    if (bedrooms_ > 3) score++;

    quality_ = static_cast<QualityScore>(std::min(score, 5));
    return *quality_;
}

Property::operator std::string() const {
    std::ostringstream s;
    s << "Property[" << id_ << ", $" << price_ << "]";
    return s.str();
}

std::ostream& operator<<(std::ostream &os, QualityScore q) {
    return os << static_cast<int>(q);
}

std::ostream& operator<<(std::ostream &os, const Property &p) {
    return os << std::string(p);
}

}
