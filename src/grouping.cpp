///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "grouping.hpp"
#include <algorithm>
#include <unordered_map>


///////////////////////////
///       ERRORS        ///
///////////////////////////
MandatoryUnsatisfiable::MandatoryUnsatisfiable(const std::string& courseName)
        : std::runtime_error("Mandatory course '" + courseName + "' has no available offering"),
          courseName_(courseName) {}


///////////////////////////
///      GROUPING       ///
///////////////////////////
std::vector<OfferingGroup> buildOfferingGroups(const std::vector<Offering>& catalog) {
    std::vector<OfferingGroup> groups;
    if (catalog.empty()) return groups;

    // Mandatory names in order of first appearance, excluded records included.
    std::vector<std::string> mandatoryNames;
    for (const Offering& o : catalog) {
        if (!o.mandatory) continue;
        if (std::find(mandatoryNames.begin(), mandatoryNames.end(), o.name) == mandatoryNames.end()) {
            mandatoryNames.push_back(o.name);
        }
    }

    // Group available offerings by name, keeping first-appearance order.
    std::unordered_map<std::string, int> groupByName;
    for (int i = 0; i < (int)catalog.size(); ++i) {
        const Offering& o = catalog[i];
        if (o.excluded) continue;
        auto it = groupByName.find(o.name);
        if (it == groupByName.end()) {
            it = groupByName.emplace(o.name, (int)groups.size()).first;
            OfferingGroup g;
            g.name = o.name;
            groups.push_back(g);
        }
        groups[it->second].offeringIndices.push_back(i);
    }

    // Fail fast on the first mandatory name without an available offering.
    for (const std::string& name : mandatoryNames) {
        auto it = groupByName.find(name);
        if (it == groupByName.end()) {
            throw MandatoryUnsatisfiable(name);
        }
        groups[it->second].mandatory = true;
    }

    // Mandatory offerings first, then priority descending; stable keeps catalog order.
    for (OfferingGroup& g : groups) {
        std::stable_sort(g.offeringIndices.begin(), g.offeringIndices.end(),
                         [&catalog](int a, int b) {
                             const Offering& oa = catalog[a];
                             const Offering& ob = catalog[b];
                             if (oa.mandatory != ob.mandatory) return oa.mandatory;
                             return oa.priority > ob.priority;
                         });
    }
    return groups;
}
