#include <iostream>
#include <string>

#include <tempora.hpp>

using namespace tempora;

// Helper function to print a DateTime and its epoch timestamps
void printDateTime(const DateTime& dt, const std::string& label) {
    std::cout << label << ":\n";
    std::cout << "  ISO-8601: " << dt.to_iso8601(true) << "\n";
    std::cout << "  Offset: " << dt.time_offset().to_string();
    if (auto zone = dt.time_zone()) {
        std::cout << " (" << zone->name() << (dt.is_daylight() ? ", DST" : "") << ")";
    }
    std::cout << "\n";

    for (const auto& epoch :
         {TimeEpoch::unix_time(), TimeEpoch::utc(), TimeEpoch::gps(), TimeEpoch::tai()}) {
        auto ts = dt.timestamp(epoch);
        std::cout << "  " << epoch.name() << ": ";
        if (ts) {
            std::cout << ts->in_seconds_precise() << " s\n";
        } else {
            std::cout << ts.error().what() << "\n";
        }
    }
    std::cout << std::endl;
}

int main() {
    std::cout << "Tempora DateTime Examples\n";
    std::cout << "=========================\n\n";

    // Example 1: Creating DateTimes
    std::cout << "1. Creating DateTimes\n";
    std::cout << "---------------------\n";

    auto new_year = DateTime::create(2017, 1, 1, 0, 0, 0);
    if (!new_year) {
        std::cerr << "Error: " << new_year.error().what() << "\n";
        return 1;
    }
    printDateTime(*new_year, "2017-01-01 UTC");

    auto warsaw = DateTime::create(2020, 6, 1, 12, 30, 0, 250'000, "Europe/Warsaw");
    if (!warsaw) {
        std::cerr << "Error: " << warsaw.error().what() << "\n";
        return 1;
    }
    printDateTime(*warsaw, "Summer afternoon in Warsaw");

    auto parsed = DateTime::from_string("1980-01-06T00:00:00Z");
    if (!parsed) {
        std::cerr << "Error: " << parsed.error().what() << "\n";
        return 1;
    }
    printDateTime(*parsed, "GPS epoch (parsed)");

    auto invalid = DateTime::create(2021, 2, 29, 0, 0, 0);
    std::cout << "2021-02-29: " << (invalid ? "accepted" : invalid.error().what()) << "\n\n";

    // Example 2: Calendar arithmetic
    std::cout << "2. Calendar Arithmetic\n";
    std::cout << "----------------------\n";

    auto jan31 = *DateTime::create(2020, 1, 31, 10, 0, 0);
    std::cout << "Base:          " << jan31.to_iso8601() << "\n";
    std::cout << "+1 month:      " << jan31.add_month().to_iso8601() << "\n";
    std::cout << "+1 year:       " << jan31.add_year().to_iso8601() << "\n";
    std::cout << "-3 weeks:      " << jan31.sub_weeks(3).to_iso8601() << "\n";
    std::cout << "+90 minutes:   " << jan31.add_minutes(90).to_iso8601() << "\n";
    std::cout << "End of day:    " << jan31.end_of_day().to_iso8601(true) << "\n\n";

    // Example 3: Daylight-saving transitions
    std::cout << "3. Daylight-Saving Transitions\n";
    std::cout << "------------------------------\n";

    auto before = *DateTime::create(2020, 3, 29, 1, 30, 0, 0, "Europe/Warsaw");
    std::cout << "Before the gap:   " << before.to_iso8601() << "\n";
    std::cout << "One hour later:   " << before.add_hour().to_iso8601() << "\n";
    auto in_gap = *DateTime::create(2020, 3, 29, 2, 30, 0, 0, "Europe/Warsaw");
    std::cout << "02:30 requested:  " << in_gap.to_iso8601() << "\n";
    std::cout << "Same instant UTC: " << in_gap.to_time_zone(TimeZone::utc()).to_iso8601()
              << "\n\n";

    // Example 4: Leap seconds
    std::cout << "4. Leap Seconds\n";
    std::cout << "---------------\n";

    auto table = LeapSeconds::load();
    if (!table) {
        std::cerr << "Error: " << table.error().what() << "\n";
        return 1;
    }
    std::cout << "Records: " << table->size() << " (" << table->count() << " insertions)\n";
    std::cout << "TAI-UTC: " << table->offset_tai().in_seconds() << " s\n";
    if (auto expires = table->expires()) {
        std::cout << "Expires: " << expires->to_iso8601() << "\n";
    }

    auto start = *DateTime::create(1990, 1, 1, 0, 0, 0);
    auto end = *DateTime::create(2000, 1, 1, 0, 0, 0);
    std::cout << "Inserted in the 1990s:\n";
    for (const auto& record : table->between(start, end)) {
        std::cout << "  " << record.date().to_iso8601() << "\n";
    }

    auto atomic = new_year->to_atomic_time(*table);
    auto gps = new_year->to_gps_time(*table);
    std::cout << "Atomic time at 2017-01-01: " << atomic.to_iso8601() << "\n";
    std::cout << "GPS time at 2017-01-01:    " << gps.to_iso8601() << "\n\n";

    // Example 5: Iterating an interval
    std::cout << "5. Iterating an Interval\n";
    std::cout << "------------------------\n";

    auto from = *DateTime::create(2020, 1, 1, 0, 0, 0);
    auto to = from.add_seconds(10);
    auto steps = TimePeriod(from, to).iterate(TimeUnit::seconds(3));
    if (!steps) {
        std::cerr << "Error: " << steps.error().what() << "\n";
        return 1;
    }
    for (const auto& dt : *steps) {
        std::cout << "  " << dt.to_iso8601() << "\n";
    }

    auto back = TimePeriod(from, to).iterate_backward(TimeUnit::seconds(3));
    if (back) {
        std::cout << "Backward: " << back->front().to_iso8601() << " .. "
                  << back->back().to_iso8601() << " (" << back->size() << " steps)\n";
    }

    return 0;
}
