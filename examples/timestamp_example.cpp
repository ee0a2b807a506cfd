#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

#include <unixts.hpp>

using namespace unixts;
using namespace unixts::literals;

// Helper function to print timestamp details
void printTimestamp(const Timestamp& ts, const std::string& label) {
    std::cout << label << ":\n";
    std::cout << "  Seconds: " << ts.seconds() << "\n";
    std::cout << "  Nanoseconds: " << ts.subsec_nanos() << "\n";

    // Convert to human-readable time
    if (auto ct = to_utc_civil(ts)) {
        std::cout << "  UTC time: " << ct->year << "-" << std::setfill('0') << std::setw(2)
                  << ct->month << "-" << std::setw(2) << ct->day << " " << std::setw(2)
                  << ct->hour << ":" << std::setw(2) << ct->minute << ":" << std::setw(2)
                  << ct->second << "." << std::setw(6) << ts.subsec(6) << " UTC\n";
        std::cout << std::setfill(' ');
    } else {
        std::cout << "  UTC time: out of calendar range\n";
    }
    std::cout << std::endl;
}

int main() {
    std::cout << "UNIXTS Timestamp Examples\n";
    std::cout << "=========================\n\n";

    // Example 1: Creating timestamps
    std::cout << "1. Creating Timestamps\n";
    std::cout << "----------------------\n";

    // From current time
    auto ts_now = Timestamp::now();
    printTimestamp(ts_now, "Current time");

    // From seconds only
    auto ts_seconds = Timestamp::from_seconds(1335020400);
    printTimestamp(ts_seconds, "From seconds (1335020400)");

    // From components (seconds + nanoseconds)
    auto ts_components = Timestamp(1335020400,
                                   123'456'789 // 123.456789 milliseconds
    );
    printTimestamp(ts_components, "From components");

    // From std::chrono
    auto ts_chrono = Timestamp::from_chrono(std::chrono::system_clock::now());
    printTimestamp(ts_chrono, "From std::chrono::system_clock");

    // Example 2: Literals
    std::cout << "2. Literals\n";
    std::cout << "-----------\n";

    // Checked by the compiler; a typo here fails the build
    constexpr auto compiled = "1335020400.50"_ts;
    printTimestamp(compiled, "\"1335020400.50\"_ts");

    // A negative fraction is stored as a forward offset from the floor second
    constexpr auto negative = "-10000.25"_ts;
    std::cout << "\"-10000.25\"_ts is seconds=" << negative.seconds()
              << ", subsec(2)=" << negative.subsec(2) << "\n\n";

    // Runtime parsing reports where the input went wrong
    for (const char* text : {"1335020400.5", "1.2.3", "12a4", ""}) {
        auto parsed = parse_timestamp(text);
        if (parsed) {
            std::cout << "  parse(\"" << text << "\") = " << std::fixed << std::setprecision(1)
                      << *parsed << std::defaultfloat << "\n";
        } else {
            std::cout << "  parse(\"" << text << "\") failed: " << parsed.error().message()
                      << " (offset " << parsed.error().offset << ")\n";
        }
    }
    std::cout << "\n";

    // Example 3: Precision
    std::cout << "3. Precision\n";
    std::cout << "------------\n";

    auto precise = Timestamp(1335020400, 123'456'789);
    std::cout << "  Milliseconds since epoch: " << static_cast<int64_t>(precise.at_precision(3))
              << "\n";
    std::cout << "  Microseconds since epoch: " << static_cast<int64_t>(precise.at_precision(6))
              << "\n";
    std::cout << "  Sub-second milliseconds: " << precise.subsec(3) << "\n";
    std::cout << "  As seconds (2 places): " << to_string(precise, 2) << "\n\n";

    // Example 4: Arithmetic
    std::cout << "4. Arithmetic\n";
    std::cout << "-------------\n";

    auto tomorrow = ts_seconds + 86400;
    std::cout << "  One day later: " << tomorrow << "\n";

    auto later = ts_seconds + Duration::from_milliseconds(1500);
    std::cout << "  Plus 1.5s: " << to_string(later, 3) << "\n";

    auto earlier = ts_seconds - std::chrono::milliseconds(750);
    std::cout << "  Minus 750ms: " << to_string(earlier, 3) << "\n";

    std::cout << "  Second of day: " << (ts_seconds % 86400) << "\n";

    if (auto since_epoch = later.to_duration()) {
        std::cout << "  Span since epoch: " << *since_epoch << "\n";
    }
    std::cout << "\n";

    // Example 5: Saturation
    std::cout << "5. Saturation\n";
    std::cout << "-------------\n";

    auto overflowed = Timestamp::max() + 1;
    std::cout << "  max() + 1 saturated: " << (saturated(overflowed) ? "yes" : "no") << "\n";
    std::cout << "  now saturated: " << (saturated(ts_now) ? "yes" : "no") << "\n\n";

    // Example 6: Civil time at fixed UTC offsets
    std::cout << "6. Civil Time\n";
    std::cout << "-------------\n";

    for (const char* zone : {"UTC", "-04:00", "+10:00"}) {
        auto offset = parse_utc_offset(zone);
        if (!offset) {
            std::cout << "  " << zone << ": " << civil_error_string(offset.error()) << "\n";
            continue;
        }
        if (auto ct = to_civil(ts_seconds, *offset)) {
            std::cout << "  " << std::setw(6) << zone << ": " << ct->year << "-"
                      << std::setfill('0') << std::setw(2) << ct->month << "-" << std::setw(2)
                      << ct->day << " " << std::setw(2) << ct->hour << ":" << std::setw(2)
                      << ct->minute << std::setfill(' ') << "\n";
        }
    }

    CivilTime leap{.year = 2013, .month = 2, .day = 29};
    auto invalid = from_civil(leap);
    if (!invalid) {
        std::cout << "  2013-02-29: " << civil_error_string(invalid.error()) << "\n";
    }
    std::cout << "\n";

    // Example 7: Real-time timestamp updates
    std::cout << "7. Real-time Updates (showing time progression)\n";
    std::cout << "------------------------------------------------\n";

    for (int i = 0; i < 3; ++i) {
        auto ts = Timestamp::now();
        std::cout << "Update " << (i + 1) << ": " << ts.seconds() << "s + " << ts.subsec(3)
                  << "ms\n";
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nExample completed successfully!\n";

    return 0;
}
