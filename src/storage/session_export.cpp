#include "session_export.hpp"
#include "../common/paths.hpp"
#include "rapidjson/document.h"
#include "rapidjson/filewritestream.h"
#include "rapidjson/prettywriter.h"
#include <cstdio>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <stdexcept>

namespace calmroom {

namespace {

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string escaped = "\"";
    for (char c : value) {
        if (c == '"') {
            escaped += "\"\"";
        } else {
            escaped += c;
        }
    }
    escaped += "\"";
    return escaped;
}

std::string rating_field(const std::optional<int>& rating) {
    return rating ? std::to_string(*rating) : "";
}

FILE* open_for_writing(const std::string& path) {
    FILE* file = fopen(path.c_str(), "wb");
    if (!file) {
        throw std::runtime_error("Cannot open export file: " + path);
    }
    return file;
}

void close_written(FILE* file, const std::string& path) {
    bool failed = ferror(file) != 0;
    if (fclose(file) != 0 || failed) {
        throw std::runtime_error("Failed writing export file: " + path);
    }
}

} // namespace

void export_sessions_csv(const std::vector<SessionRecord>& sessions,
                         const std::string& path) {
    FILE* file = open_for_writing(path);
    try {
        fmt::print(file, "date,type,duration,stress_before,stress_after\n");
        for (const auto& session : sessions) {
            fmt::print(file, "{},{},{},{},{}\n", csv_field(session.date),
                       csv_field(session.type), session.duration,
                       rating_field(session.stress_before),
                       rating_field(session.stress_after));
        }
    } catch (...) {
        fclose(file);
        throw;
    }
    close_written(file, path);
}

void export_sessions_json(const std::vector<SessionRecord>& sessions,
                          const std::string& path) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    rapidjson::Value results(rapidjson::kArrayType);
    for (const auto& session : sessions) {
        rapidjson::Value session_obj(rapidjson::kObjectType);
        session_obj.AddMember("date", rapidjson::Value(session.date.c_str(), allocator), allocator);
        session_obj.AddMember("type", rapidjson::Value(session.type.c_str(), allocator), allocator);
        session_obj.AddMember("duration", session.duration, allocator);
        rapidjson::Value before;
        if (session.stress_before) {
            before.SetInt(*session.stress_before);
        }
        session_obj.AddMember("stress_before", before, allocator);
        rapidjson::Value after;
        if (session.stress_after) {
            after.SetInt(*session.stress_after);
        }
        session_obj.AddMember("stress_after", after, allocator);
        results.PushBack(session_obj, allocator);
    }

    doc.AddMember("sessions", results, allocator);
    doc.AddMember("count", static_cast<int>(sessions.size()), allocator);

    FILE* file = open_for_writing(path);
    char buffer[65536];
    rapidjson::FileWriteStream os(file, buffer, sizeof(buffer));
    rapidjson::PrettyWriter<rapidjson::FileWriteStream> writer(os);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);
    os.Flush();
    close_written(file, path);
}

std::string export_file_path(const std::string& dir, ExportFormat format,
                             std::chrono::system_clock::time_point now) {
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    return fmt::format("{}/sessions-{:%Y%m%d-%H%M%S}.{}", dir, fmt::localtime(t),
                       format == ExportFormat::Csv ? "csv" : "json");
}

std::string export_sessions(const std::vector<SessionRecord>& sessions,
                            ExportFormat format, const std::string& dir) {
    paths::ensure_directory_exists(dir);
    std::string path = export_file_path(dir, format);
    if (format == ExportFormat::Csv) {
        export_sessions_csv(sessions, path);
    } else {
        export_sessions_json(sessions, path);
    }
    return path;
}

} // namespace calmroom
