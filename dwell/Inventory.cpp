#include <dwell/Inventory.hpp>
#include <dwell/error.hpp>
#include <stdexcept>
#include <utility>

namespace dwell {

Inventory::Inventory(std::vector<Property> properties) : properties_{std::move(properties)} {
    index_.reserve(properties_.size());
    for (size_t i = 0; i < properties_.size(); i++) {
        if (not index_.emplace(properties_[i].id(), i).second)
            throw std::invalid_argument("Duplicate property id " + std::to_string(properties_[i].id()) + " in inventory");
    }
}

size_t Inventory::countAvailable() const {
    size_t n = 0;
    for (const auto &p : properties_) if (p.available()) n++;
    return n;
}

Property& Inventory::findById(id_t id) {
    auto found = index_.find(id);
    if (found == index_.end())
        throw not_found_error("Property with id " + std::to_string(id) + " not found");
    return properties_[found->second];
}

const Property& Inventory::findById(id_t id) const {
    return const_cast<Inventory&>(*this).findById(id);
}

double Inventory::averagePrice(boost::optional<int> bedrooms) const {
    double total = 0;
    size_t n = 0;
    for (const auto &p : properties_) {
        if (not p.available()) continue;
        if (bedrooms and p.bedrooms() != *bedrooms) continue;
        total += p.price();
        n++;
    }
    return n == 0 ? 0.0 : total / n;
}

double Inventory::listedAveragePrice() const {
    if (properties_.empty()) return 0.0;
    double total = 0;
    for (const auto &p : properties_) total += p.price();
    return total / properties_.size();
}

namespace {
// Segment-specific part of matchingRequirements(); the price cap is applied by the caller
bool meets_segment(const Property &p, double max_price, Segment segment) {
    switch (segment) {
        case Segment::FANCY:
            return p.qualityScore() and *p.qualityScore() >= QualityScore::GOOD;
        case Segment::OPTIMIZER:
            return p.area() > 0 and p.pricePerArea() < max_price / p.area();
        case Segment::AVERAGE:
            return p.price() <= max_price;
    }
    throw invalid_segment_error("Invalid segment value " + std::to_string(static_cast<int>(segment)));
}
}

std::vector<const Property*> Inventory::matchingRequirements(double max_price, Segment segment) const {
    // Validate up front so that an invalid segment fails even when nothing is available
    to_string(segment);

    std::vector<const Property*> matching;
    for (const auto &p : properties_) {
        if (p.available() and p.price() <= max_price and meets_segment(p, max_price, segment))
            matching.push_back(&p);
    }
    return matching;
}

std::vector<const Property*> Inventory::matchingRequirements(double max_price, const std::string &segment) const {
    return matchingRequirements(max_price, parse_segment(segment));
}

}
