#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <vector>


///////////////////////////
///       CATALOG       ///
///////////////////////////
/**
 * @brief Editable pool of candidate offerings.
 *
 * Every record gets a stable integer id when added; ids are never reused.
 * listOfferings() returns an immutable snapshot in insertion order, which
 * is what the solvers consume.
 */
class Catalog {
public:
    /**
     * @brief Append an offering and return its id.
     */
    int addOffering(Offering offering);

    /**
     * @brief Replace the offering stored under id, keeping its position.
     *
     * @throws std::out_of_range if id is unknown.
     */
    void updateOffering(int id, Offering offering);

    /**
     * @brief Delete the offering stored under id.
     *
     * @throws std::out_of_range if id is unknown.
     */
    void removeOffering(int id);

    /**
     * @brief Snapshot of all offerings in insertion order.
     */
    std::vector<Offering> listOfferings() const;

    /**
     * @brief Access a single offering.
     *
     * @throws std::out_of_range if id is unknown.
     */
    const Offering& find(int id) const;

    /// Ids in insertion order (parallel to listOfferings()).
    std::vector<int> ids() const;

    /// Toggle the excluded flag of one offering.
    void setExcluded(int id, bool excluded);

    /**
     * @brief Mark every offering of a course name as (not) mandatory.
     *
     * @return number of offerings touched.
     */
    int setMandatory(const std::string& name, bool mandatory);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    struct Entry {
        int id;
        Offering offering;
    };

    std::vector<Entry> entries_;
    int nextId_ = 0;

    /// Position of id in entries_, or -1 if not found.
    int position(int id) const;

    /// Position of id in entries_; throws std::out_of_range if not found.
    int requirePosition(int id) const;
};
