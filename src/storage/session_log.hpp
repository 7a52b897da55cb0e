#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace calmroom {

struct SessionRecord {
    std::string date;  // "YYYY-MM-DD HH:MM", local time
    std::string type;
    int duration = 0;  // minutes
    std::optional<int> stress_before;
    std::optional<int> stress_after;
};

// Append-only history stored as a JSON array, newest last
class SessionLog {
public:
    static constexpr std::size_t kMaxEntries = 200;

    explicit SessionLog(const std::string& path = "");

    // A missing or malformed file leaves the log empty and returns false
    bool load();

    // Throws std::runtime_error when the file cannot be written
    void save() const;

    // Appends, keeps the newest kMaxEntries and saves
    const SessionRecord& log_session(
        const std::string& type, int duration_min,
        std::optional<int> stress_before = std::nullopt,
        std::optional<int> stress_after = std::nullopt,
        std::chrono::system_clock::time_point now =
            std::chrono::system_clock::now());

    const std::vector<SessionRecord>& records() const { return sessions; }
    const std::string& path() const { return sessions_path; }

private:
    std::string sessions_path;
    std::vector<SessionRecord> sessions;
};

std::string format_session_date(std::chrono::system_clock::time_point time);

} // namespace calmroom
