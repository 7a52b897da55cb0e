#include "session_log.hpp"
#include "../common/paths.hpp"
#include "rapidjson/document.h"
#include "rapidjson/filereadstream.h"
#include "rapidjson/filewritestream.h"
#include "rapidjson/prettywriter.h"
#include <cstdio>
#include <cstddef>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <stdexcept>

namespace calmroom {

namespace {

// Ratings were written as numbers, numeric strings or "" over time
std::optional<int> read_rating(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return std::nullopt;
    }
    const rapidjson::Value& value = it->value;
    if (value.IsInt()) {
        return value.GetInt();
    }
    if (value.IsString() && value.GetStringLength() > 0) {
        char* end = nullptr;
        long parsed = std::strtol(value.GetString(), &end, 10);
        if (end != nullptr && *end == '\0') {
            return static_cast<int>(parsed);
        }
    }
    return std::nullopt;
}

std::string read_string(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it != obj.MemberEnd() && it->value.IsString()) {
        return it->value.GetString();
    }
    return "";
}

int read_int(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it != obj.MemberEnd() && it->value.IsNumber()) {
        return static_cast<int>(it->value.GetDouble());
    }
    return 0;
}

void write_rating(rapidjson::Value& obj, const char* key,
                  const std::optional<int>& rating,
                  rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value value;
    if (rating) {
        value.SetInt(*rating);
    }
    obj.AddMember(rapidjson::StringRef(key), value, allocator);
}

} // namespace

SessionLog::SessionLog(const std::string& path)
    : sessions_path(path.empty() ? paths::get_sessions_path() : path) {}

bool SessionLog::load() {
    sessions.clear();

    FILE* inFile = fopen(sessions_path.c_str(), "rb");
    if (!inFile) {
        return false;
    }

    char readBuffer[65536];
    rapidjson::FileReadStream is(inFile, readBuffer, sizeof(readBuffer));
    rapidjson::Document doc;
    doc.ParseStream(is);
    fclose(inFile);

    if (doc.HasParseError() || !doc.IsArray()) {
        return false;
    }

    for (const auto& entry : doc.GetArray()) {
        if (!entry.IsObject()) {
            continue;
        }
        SessionRecord record;
        record.date = read_string(entry, "date");
        record.type = read_string(entry, "type");
        record.duration = read_int(entry, "duration");
        record.stress_before = read_rating(entry, "stress_before");
        record.stress_after = read_rating(entry, "stress_after");
        sessions.push_back(std::move(record));
    }

    if (sessions.size() > kMaxEntries) {
        sessions.erase(sessions.begin(),
                       sessions.end() - static_cast<std::ptrdiff_t>(kMaxEntries));
    }
    return true;
}

void SessionLog::save() const {
    rapidjson::Document data;
    data.SetArray();
    rapidjson::Document::AllocatorType& allocator = data.GetAllocator();

    for (const auto& session : sessions) {
        rapidjson::Value sessionObj(rapidjson::kObjectType);
        sessionObj.AddMember("date", rapidjson::StringRef(session.date.c_str()), allocator);
        sessionObj.AddMember("type", rapidjson::StringRef(session.type.c_str()), allocator);
        sessionObj.AddMember("duration", session.duration, allocator);
        write_rating(sessionObj, "stress_before", session.stress_before, allocator);
        write_rating(sessionObj, "stress_after", session.stress_after, allocator);
        data.PushBack(sessionObj, allocator);
    }

    paths::ensure_directory_exists(
        std::filesystem::path(sessions_path).parent_path().string());
    FILE* outFile = fopen(sessions_path.c_str(), "wb");
    if (!outFile) {
        throw std::runtime_error("Cannot write sessions file: " + sessions_path);
    }

    char writeBuffer[65536];
    rapidjson::FileWriteStream os(outFile, writeBuffer, sizeof(writeBuffer));
    rapidjson::PrettyWriter<rapidjson::FileWriteStream> writer(os);
    writer.SetIndent(' ', 2);
    data.Accept(writer);
    os.Flush();

    if (fclose(outFile) != 0) {
        throw std::runtime_error("Failed writing sessions file: " + sessions_path);
    }
}

const SessionRecord& SessionLog::log_session(
    const std::string& type, int duration_min, std::optional<int> stress_before,
    std::optional<int> stress_after, std::chrono::system_clock::time_point now) {
    sessions.push_back(
        {format_session_date(now), type, duration_min, stress_before, stress_after});
    if (sessions.size() > kMaxEntries) {
        sessions.erase(sessions.begin(),
                       sessions.end() - static_cast<std::ptrdiff_t>(kMaxEntries));
    }
    save();
    return sessions.back();
}

std::string format_session_date(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    return fmt::format("{:%Y-%m-%d %H:%M}", fmt::localtime(t));
}

} // namespace calmroom
