#pragma once
#include <string>

// JSON_TIMESHEET if set and non-empty, otherwise $HOME/timesheet.json
std::string resolveTimesheetPath();
