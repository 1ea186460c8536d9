#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>
#include <vector>


///////////////////////////
///      CONSTANTS      ///
///////////////////////////
// Week grid: 7 days, periods are 1-based and usually 1..10.
static constexpr int DAYS = 7;
static constexpr int PERIODS_PER_DAY = 10;

// User preference weight range (5 = highest).
static constexpr int MIN_PRIORITY = 1;
static constexpr int MAX_PRIORITY = 5;
static constexpr int DEFAULT_PRIORITY = 3;

// Upper bound on the credits of one offering; keeps per-candidate sums in int range.
static constexpr int MAX_CREDITS = 100;


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief Day of the week a time slot falls on.
 */
enum class Day { MON, TUE, WED, THU, FRI, SAT, SUN };

/**
 * @brief Whether a course counts towards required or elective credits.
 */
enum class Category { REQUIRED, ELECTIVE };

/**
 * @brief One weekly meeting of an offering.
 *
 * Slot identity is (day, period); the room is descriptive only and never
 * takes part in conflict detection.
 */
struct TimeSlot {
    Day day; ///< Day of the week.
    int period; ///< 1-based period within the day.
    std::string room; ///< Room label (may be empty).

    bool sameSlot(const TimeSlot& other) const {
        return day == other.day && period == other.period;
    }
};

/**
 * @brief One concrete timetable entry for a named course.
 *
 * Offerings sharing a name are alternatives (different section, teacher or
 * time). The constructor validates every field and normalizes the time
 * slots (deduplicated by (day, period), sorted), so an Offering that exists
 * is always well-formed.
 */
struct Offering {
    /**
     * @brief Build and validate an offering.
     *
     * @throws std::invalid_argument if the name is empty, credits are
     *         outside [0, MAX_CREDITS], priority is outside [1,5] or a
     *         period is < 1.
     */
    Offering(std::string name,
             Category category,
             std::string sectionId,
             int credits,
             int priority,
             std::vector<TimeSlot> timeSlots,
             bool mandatory = false,
             bool excluded = false,
             std::string teacher = "",
             std::string notes = "");

    std::string name; ///< Course identity; equal names are alternatives.
    Category category; ///< Required or elective.
    std::string sectionId; ///< Distinguishes offerings of the same name.
    int credits; ///< Credit count in [0, MAX_CREDITS].
    int priority; ///< Preference weight in [1,5].
    std::vector<TimeSlot> timeSlots; ///< Sorted, duplicate-free meetings.
    bool mandatory; ///< Course name must appear in every candidate.
    bool excluded; ///< Offering is ignored entirely.
    std::string teacher; ///< Free-form, not used by the engine.
    std::string notes; ///< Free-form, not used by the engine.

    /**
     * @brief Re-run the field checks performed by the constructor.
     *
     * Useful after members were edited directly.
     */
    void validate() const;
};

/**
 * @brief All available offerings sharing one course name.
 *
 * Offerings are referenced by their index in the catalog vector, in the
 * order the enumerator will try them.
 */
struct OfferingGroup {
    std::string name; ///< Shared course name.
    std::vector<int> offeringIndices; ///< Catalog indices, enumeration order.
    bool mandatory = false; ///< True if any offering of the name is mandatory.
};


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Short English day name ("Mon".."Sun").
std::string dayName(Day day);

/**
 * @brief Parse a day label.
 *
 * Accepts short and full English names (any case) and the single Chinese
 * weekday characters used by imported course tables (一..六, 日).
 *
 * @throws std::invalid_argument for anything else.
 */
Day parseDay(const std::string& text);

/// "Required" or "Elective".
std::string categoryName(Category category);

/// 0-based index of a day (MON = 0).
inline int dayIndex(Day day) { return static_cast<int>(day); }
