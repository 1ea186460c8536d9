///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "catalog.hpp"
#include <stdexcept>
#include <utility>


///////////////////////////
///       CATALOG       ///
///////////////////////////
int Catalog::addOffering(Offering offering) {
    offering.validate();
    int id = nextId_++;
    entries_.push_back({id, std::move(offering)});
    return id;
}

void Catalog::updateOffering(int id, Offering offering) {
    offering.validate();
    entries_[requirePosition(id)].offering = std::move(offering);
}

void Catalog::removeOffering(int id) {
    entries_.erase(entries_.begin() + requirePosition(id));
}

std::vector<Offering> Catalog::listOfferings() const {
    std::vector<Offering> out;
    out.reserve(entries_.size());
    for (const Entry& e : entries_) out.push_back(e.offering);
    return out;
}

const Offering& Catalog::find(int id) const {
    return entries_[requirePosition(id)].offering;
}

std::vector<int> Catalog::ids() const {
    std::vector<int> out;
    out.reserve(entries_.size());
    for (const Entry& e : entries_) out.push_back(e.id);
    return out;
}

void Catalog::setExcluded(int id, bool excluded) {
    entries_[requirePosition(id)].offering.excluded = excluded;
}

int Catalog::setMandatory(const std::string& name, bool mandatory) {
    int touched = 0;
    for (Entry& e : entries_) {
        if (e.offering.name != name) continue;
        e.offering.mandatory = mandatory;
        ++touched;
    }
    return touched;
}

int Catalog::position(int id) const {
    for (int i = 0; i < (int)entries_.size(); ++i) {
        if (entries_[i].id == id) return i;
    }
    return -1;
}

int Catalog::requirePosition(int id) const {
    int pos = position(id);
    if (pos < 0) {
        throw std::out_of_range("No offering with id " + std::to_string(id));
    }
    return pos;
}
