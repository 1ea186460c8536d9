///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static const std::array<std::string, DAYS> kShortDayNames = {
        "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"
};

static const std::array<std::string, DAYS> kFullDayNames = {
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
};

// UTF-8 weekday characters as they appear in the school's course tables.
static const std::array<std::string, DAYS> kChineseDayNames = {
        "\xe4\xb8\x80", "\xe4\xba\x8c", "\xe4\xb8\x89", "\xe5\x9b\x9b",
        "\xe4\xba\x94", "\xe5\x85\xad", "\xe6\x97\xa5"
};

static std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string dayName(Day day) {
    return kShortDayNames[dayIndex(day)];
}

Day parseDay(const std::string& text) {
    std::string t = trim(text);
    std::string lower = toLower(t);
    for (int d = 0; d < DAYS; ++d) {
        if (lower == toLower(kShortDayNames[d]) || lower == kFullDayNames[d] || t == kChineseDayNames[d]) {
            return static_cast<Day>(d);
        }
    }
    throw std::invalid_argument("Unknown day '" + text + "'");
}

std::string categoryName(Category category) {
    switch (category) {
        case Category::REQUIRED: return "Required";
        case Category::ELECTIVE: return "Elective";
    }
    return "Unknown";
}


///////////////////////////
///      OFFERING       ///
///////////////////////////
/**
 * @brief Construct an offering, normalize its time slots and validate it.
 *
 * Duplicate (day, period) entries collapse to the first one seen, so the
 * room of the first occurrence wins.
 */
Offering::Offering(std::string name,
                   Category category,
                   std::string sectionId,
                   int credits,
                   int priority,
                   std::vector<TimeSlot> timeSlots,
                   bool mandatory,
                   bool excluded,
                   std::string teacher,
                   std::string notes)
        : name(std::move(name)),
          category(category),
          sectionId(std::move(sectionId)),
          credits(credits),
          priority(priority),
          mandatory(mandatory),
          excluded(excluded),
          teacher(std::move(teacher)),
          notes(std::move(notes)) {
    // Keep first occurrence of every (day, period), then order the week.
    for (TimeSlot& ts : timeSlots) {
        bool seen = std::any_of(this->timeSlots.begin(), this->timeSlots.end(),
                                [&ts](const TimeSlot& kept) { return kept.sameSlot(ts); });
        if (!seen) this->timeSlots.push_back(std::move(ts));
    }
    std::stable_sort(this->timeSlots.begin(), this->timeSlots.end(),
                     [](const TimeSlot& a, const TimeSlot& b) {
                         if (a.day != b.day) return a.day < b.day;
                         return a.period < b.period;
                     });
    validate();
}

void Offering::validate() const {
    if (name.empty()) {
        throw std::invalid_argument("Offering name must not be empty");
    }
    if (credits < 0 || credits > MAX_CREDITS) {
        std::ostringstream ss;
        ss << "Offering '" << name << "': credits must be in [0," << MAX_CREDITS << "] (got " << credits << ")";
        throw std::invalid_argument(ss.str());
    }
    if (priority < MIN_PRIORITY || priority > MAX_PRIORITY) {
        std::ostringstream ss;
        ss << "Offering '" << name << "': priority must be in [" << MIN_PRIORITY << ","
           << MAX_PRIORITY << "] (got " << priority << ")";
        throw std::invalid_argument(ss.str());
    }
    for (const TimeSlot& ts : timeSlots) {
        if (dayIndex(ts.day) < 0 || dayIndex(ts.day) >= DAYS) {
            throw std::invalid_argument("Offering '" + name + "': invalid day");
        }
        if (ts.period < 1) {
            std::ostringstream ss;
            ss << "Offering '" << name << "': period must be >= 1 (got " << ts.period << ")";
            throw std::invalid_argument(ss.str());
        }
    }
}
