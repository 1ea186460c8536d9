///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include "ranking.hpp"
#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

///////////////////////////
///       HELPERS       ///
///////////////////////////

/**
 * @brief Lightweight view of one meeting of a selected offering.
 *
 * Holds resolved pointers to simplify sorting and rendering.
 */
struct MeetingView {
    Day day; ///< Day of the meeting.
    int period; ///< Period within the day.
    const Offering* offering; ///< Selected offering (non-owning).
    const TimeSlot* slot; ///< Meeting of that offering (non-owning).
};

/**
 * @brief Print the header row for a per-day schedule table.
 *
 * Uses fixed-width columns to align period, course, section, category,
 * teacher and room.
 */
static void printDayTableHeader(std::ostream& out) {
    out << "    "
        << std::left << std::setw(6)  << "Period"
        << " | " << std::left << std::setw(20) << "Course"
        << " | " << std::left << std::setw(8)  << "Section"
        << " | " << std::left << std::setw(8)  << "Category"
        << " | " << std::left << std::setw(12) << "Teacher"
        << " | " << std::left << std::setw(8)  << "Room"
        << "\n";

    out << "    "
        << std::string(6, '-')
        << "-+-" << std::string(20, '-')
        << "-+-" << std::string(8, '-')
        << "-+-" << std::string(8, '-')
        << "-+-" << std::string(12, '-')
        << "-+-" << std::string(8, '-')
        << "\n";
}

std::string describeConflict(const std::vector<Offering>& catalog, const SlotConflict& conflict) {
    std::ostringstream ss;
    ss << dayName(conflict.day) << " period " << conflict.period << ": ";
    for (size_t i = 0; i < conflict.offeringIndices.size(); ++i) {
        const Offering& o = catalog[conflict.offeringIndices[i]];
        if (i > 0) ss << ", ";
        ss << o.name;
        if (!o.teacher.empty()) ss << " (" << o.teacher << ")";
    }
    return ss.str();
}

/**
 * @brief Print one candidate as a small table per day, ordered by period.
 */
void printCandidate(std::ostream& out, const std::vector<Offering>& catalog,
                    const ScheduleCandidate& candidate, int rank) {
    out << "----------------------------------------\n";
    out << "#" << rank << " (ordinal " << candidate.ordinal << ")"
        << " conflicts=" << candidate.conflictCount
        << " priority=" << candidate.totalPriority
        << " credits=" << candidate.totalCredits
        << " (required " << candidate.requiredCredits
        << ", elective " << candidate.electiveCredits << ")\n";

    std::vector<MeetingView> meetings;
    for (int idx : candidate.selection) {
        const Offering& o = catalog[idx];
        for (const TimeSlot& ts : o.timeSlots) {
            meetings.push_back(MeetingView{ts.day, ts.period, &o, &ts});
        }
    }

    // Stable keeps tuple order inside a colliding slot.
    std::stable_sort(meetings.begin(), meetings.end(),
                     [](const MeetingView& a, const MeetingView& b) {
                         if (a.day != b.day) return a.day < b.day;
                         return a.period < b.period;
                     });

    if (meetings.empty()) {
        out << "  (no meetings)\n";
    }

    bool first = true;
    Day currentDay = Day::MON;
    for (const MeetingView& m : meetings) {
        if (first || m.day != currentDay) {
            first = false;
            currentDay = m.day;
            out << "\n  " << dayName(m.day) << ":\n";
            printDayTableHeader(out);
        }

        std::string teacher = m.offering->teacher.empty() ? "-" : m.offering->teacher;
        std::string room = m.slot->room.empty() ? "-" : m.slot->room;

        out << "    "
            << std::left << std::setw(6)  << m.period
            << " | " << std::left << std::setw(20) << m.offering->name
            << " | " << std::left << std::setw(8)  << m.offering->sectionId
            << " | " << std::left << std::setw(8)  << categoryName(m.offering->category)
            << " | " << std::left << std::setw(12) << teacher
            << " | " << std::left << std::setw(8)  << room
            << "\n";
    }

    if (!candidate.conflicts.empty()) {
        out << "\n  Conflicts:\n";
        for (const SlotConflict& c : candidate.conflicts) {
            out << "    " << describeConflict(catalog, c) << "\n";
        }
    }
    out << "\n";
}

void printScheduleResult(std::ostream& out, const std::vector<Offering>& catalog,
                         const ScheduleResult& result, int top) {
    out << "State: " << stateName(result.state) << "\n";
    out << "Policy: " << policyName(result.policy) << "\n";

    if (result.state == EngineState::FAILED) {
        out << "No schedule generated: " << result.failureReason << "\n";
        return;
    }
    if (result.state == EngineState::CANCELLED) {
        out << "Run cancelled, no candidates kept.\n";
        return;
    }

    out << "Product size: " << result.productSize << "\n";
    out << "Generated: " << result.generated
        << " (clean " << result.clean.size()
        << ", conflicting " << result.conflicting.size() << ")\n";
    if (result.truncated) {
        out << "Warning: candidate cap reached, enumeration was truncated.\n";
    }

    int shownClean = std::min<int>(top, (int)result.clean.size());
    out << "\nConflict-free candidates (showing " << shownClean << "):\n";
    for (int i = 0; i < shownClean; ++i) {
        printCandidate(out, catalog, result.clean[i], i + 1);
    }

    int shownConflicting = std::min<int>(top, (int)result.conflicting.size());
    out << "\nConflicting candidates (showing " << shownConflicting << "):\n";
    for (int i = 0; i < shownConflicting; ++i) {
        printCandidate(out, catalog, result.conflicting[i], i + 1);
    }
}
