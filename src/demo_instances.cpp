///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

///////////////////////////
///       HELPERS       ///
///////////////////////////
static TimeSlot slot(Day day, int period, const std::string& room = "") {
    return TimeSlot{day, period, room};
}

///////////////////////////
///     DEMO: SMALL     ///
///////////////////////////
// Two alternatives for two required courses plus one elective: 4 candidates,
// exactly one of which (Calculus 01 + Physics 01) collides on Mon period 1.
static Catalog makeDemoSmall() {
    Catalog catalog;

    catalog.addOffering(Offering("Calculus", Category::REQUIRED, "01", 4, 5,
                                 {slot(Day::MON, 1, "A101"), slot(Day::MON, 2, "A101"), slot(Day::WED, 3, "A101")},
                                 /*mandatory=*/true, /*excluded=*/false, "Prof. Li"));
    catalog.addOffering(Offering("Calculus", Category::REQUIRED, "02", 4, 3,
                                 {slot(Day::TUE, 1, "A102"), slot(Day::TUE, 2, "A102"), slot(Day::THU, 3, "A102")},
                                 /*mandatory=*/true, /*excluded=*/false, "Prof. Wang"));

    catalog.addOffering(Offering("Physics", Category::REQUIRED, "01", 3, 4,
                                 {slot(Day::MON, 1, "B201"), slot(Day::THU, 5, "B201")},
                                 false, false, "Prof. Zhao"));
    catalog.addOffering(Offering("Physics", Category::REQUIRED, "02", 3, 4,
                                 {slot(Day::WED, 1, "B202"), slot(Day::FRI, 2, "B202")},
                                 false, false, "Prof. Chen"));

    catalog.addOffering(Offering("Film Studies", Category::ELECTIVE, "01", 2, 2,
                                 {slot(Day::FRI, 7, "C301"), slot(Day::FRI, 8, "C301")},
                                 false, false, "Dr. Sun"));

    return catalog;
}

///////////////////////////
///     DEMO: MEDIUM    ///
///////////////////////////
static Catalog makeDemoMedium() {
    Catalog catalog = makeDemoSmall();

    catalog.addOffering(Offering("Linear Algebra", Category::REQUIRED, "01", 3, 4,
                                 {slot(Day::TUE, 3, "A201"), slot(Day::FRI, 1, "A201")},
                                 false, false, "Prof. Liu"));
    catalog.addOffering(Offering("Linear Algebra", Category::REQUIRED, "02", 3, 3,
                                 {slot(Day::WED, 3, "A202"), slot(Day::FRI, 3, "A202")},
                                 false, false, "Prof. Yang"));
    catalog.addOffering(Offering("Linear Algebra", Category::REQUIRED, "03", 3, 2,
                                 {slot(Day::THU, 1, "A203"), slot(Day::THU, 2, "A203")},
                                 false, false, "Prof. Huang"));

    catalog.addOffering(Offering("Programming", Category::REQUIRED, "01", 4, 5,
                                 {slot(Day::MON, 3, "Lab1"), slot(Day::MON, 4, "Lab1"), slot(Day::WED, 5, "Lab1")},
                                 /*mandatory=*/true, false, "Dr. Zhou"));
    catalog.addOffering(Offering("Programming", Category::REQUIRED, "02", 4, 4,
                                 {slot(Day::TUE, 5, "Lab2"), slot(Day::TUE, 6, "Lab2"), slot(Day::FRI, 2, "Lab2")},
                                 false, false, "Dr. Wu"));

    catalog.addOffering(Offering("English", Category::REQUIRED, "01", 2, 3,
                                 {slot(Day::MON, 5, "D101")},
                                 false, false, "Ms. Xu"));
    catalog.addOffering(Offering("English", Category::REQUIRED, "02", 2, 3,
                                 {slot(Day::THU, 5, "D102")},
                                 false, false, "Mr. Ma"));

    catalog.addOffering(Offering("Photography", Category::ELECTIVE, "01", 1, 1,
                                 {slot(Day::SAT, 2, "Studio")},
                                 false, false, "Mr. He"));
    catalog.addOffering(Offering("Photography", Category::ELECTIVE, "02", 1, 2,
                                 {slot(Day::WED, 5, "Studio")},
                                 false, false, "Mr. He"));
    // Withdrawn section: visible in the catalog, never enumerated.
    catalog.addOffering(Offering("Photography", Category::ELECTIVE, "03", 1, 5,
                                 {slot(Day::SUN, 2, "Studio")},
                                 false, /*excluded=*/true, "Mr. He"));

    return catalog;
}

///////////////////////////
///  DEMO: GENERATED    ///
///////////////////////////
// Deterministic pseudo-timetable: numCourses names with sectionsPerCourse
// alternatives each, meeting twice a week on weekdays.
static Catalog makeDemoGenerated(int numCourses, int sectionsPerCourse) {
    Catalog catalog;

    for (int c = 0; c < numCourses; ++c) {
        std::string name = "Course " + std::to_string(c + 1);
        Category category = (c % 3 == 2) ? Category::ELECTIVE : Category::REQUIRED;
        int credits = 2 + c % 3;

        for (int k = 0; k < sectionsPerCourse; ++k) {
            int day = (c + 2 * k) % 5;
            int period = 1 + (3 * c + 5 * k) % PERIODS_PER_DAY;
            int secondDay = (day + 2) % 5;
            std::string room = "R" + std::to_string(100 + (c * sectionsPerCourse + k) % 40);

            std::vector<TimeSlot> slots = {
                    slot(static_cast<Day>(day), period, room),
                    slot(static_cast<Day>(secondDay), period, room)
            };

            std::string section = (k < 9 ? "0" : "") + std::to_string(k + 1);
            catalog.addOffering(Offering(name, category, section, credits, 1 + (c + k) % MAX_PRIORITY,
                                         slots,
                                         /*mandatory=*/c == 0,
                                         /*excluded=*/false,
                                         "Teacher " + std::to_string(1 + (c + k) % 12)));
        }
    }

    return catalog;
}

///////////////////////////
///    DEMO FACTORY     ///
///////////////////////////
Catalog makeDemoCatalog(DemoSize size) {
    switch (size) {
        case DemoSize::S: return makeDemoSmall();
        case DemoSize::M: return makeDemoMedium();
        case DemoSize::L: return makeDemoGenerated(10, 3);
        case DemoSize::XL: return makeDemoGenerated(16, 4);
    }
    return makeDemoSmall();
}

DemoSize parseDemoSize(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    if (upper == "S") return DemoSize::S;
    if (upper == "M") return DemoSize::M;
    if (upper == "L") return DemoSize::L;
    if (upper == "XL") return DemoSize::XL;
    throw std::invalid_argument("Unknown demo size '" + text + "' (expected S, M, L or XL)");
}

std::string demoSizeName(DemoSize size) {
    switch (size) {
        case DemoSize::S: return "S";
        case DemoSize::M: return "M";
        case DemoSize::L: return "L";
        case DemoSize::XL: return "XL";
    }
    return "?";
}
