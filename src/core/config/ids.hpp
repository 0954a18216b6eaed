#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace webaudit::core::config {

    // Generates a simple 8-character hex ID prefixed with "run-"
    inline std::string generate_run_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "run-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Random (version 4) UUID in canonical 8-4-4-4-12 text form.
    inline std::string generate_audit_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << std::hex;
        for (int i = 0; i < 32; ++i) {
            if (i == 8 || i == 12 || i == 16 || i == 20) {
                ss << '-';
            }
            int nibble = dis(gen);
            if (i == 12) {
                nibble = 4;
            } else if (i == 16) {
                nibble = (nibble & 0x3) | 0x8;
            }
            ss << nibble;
        }
        return ss.str();
    }

    inline std::string utc_timestamp_now() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

} // namespace webaudit::core::config
