#pragma once

#include "session_log.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace calmroom {

enum class ExportFormat { Csv, Json };

// Both throw std::runtime_error when the file cannot be written
void export_sessions_csv(const std::vector<SessionRecord>& sessions,
                         const std::string& path);
void export_sessions_json(const std::vector<SessionRecord>& sessions,
                          const std::string& path);

// <dir>/sessions-YYYYMMDD-HHMMSS.<csv|json>
std::string export_file_path(const std::string& dir, ExportFormat format,
                             std::chrono::system_clock::time_point now =
                                 std::chrono::system_clock::now());

// Writes into dir (created when missing) and returns the file path
std::string export_sessions(const std::vector<SessionRecord>& sessions,
                            ExportFormat format, const std::string& dir);

} // namespace calmroom
