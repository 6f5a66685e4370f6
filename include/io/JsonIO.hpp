#pragma once
#include <string>

#include "nlohmann/json.hpp"
#include "timesheet/Models.hpp"

// Throws std::runtime_error naming the offending element on malformed input.
timesheet::Timesheet timesheetFromJson(const nlohmann::json& j);
nlohmann::json timesheetToJson(const timesheet::Timesheet& ts);

// A missing file yields an empty timesheet and a warning on stderr.
timesheet::Timesheet loadTimesheet(const std::string& path);

// Writes the whole timesheet, creating parent directories.
void saveTimesheet(const std::string& path, const timesheet::Timesheet& ts);
