#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "timesheet/Models.hpp"

namespace timesheet {

using Clock = std::function<Timestamp()>;

// Prepends an open entry for project. Throws ValidationError, ConflictError, ParseError.
Timesheet clock_in(Timesheet ts,
                   const std::string& project,
                   const std::vector<std::string>& description = {},
                   const std::optional<std::string>& start = std::nullopt,
                   const Clock& clock = Timestamp::now);

// Closes the most recent entry for project.
// Throws ValidationError, ConflictError, NotFoundError, ParseError.
Timesheet clock_out(Timesheet ts,
                    const std::string& project,
                    const std::vector<std::string>& description = {},
                    const std::optional<std::string>& start = std::nullopt,
                    const std::optional<std::string>& end = std::nullopt,
                    const Clock& clock = Timestamp::now);

// Entries matching every given filter, in reverse input order.
// With no filters the input is returned as is.
Timesheet filter_timesheet(const Timesheet& ts,
                           const std::optional<std::string>& project = std::nullopt,
                           const std::optional<std::string>& start = std::nullopt,
                           const std::optional<std::string>& end = std::nullopt);

// Without a project drops the head entry, otherwise the first entry for project.
Timesheet remove_last(Timesheet ts, const std::optional<std::string>& project = std::nullopt);

// Entries shown by the status report, ascending by start time. Throws NotFoundError, ParseError.
std::vector<Entry> status(const Timesheet& ts,
                          const std::optional<std::string>& project = std::nullopt,
                          const std::optional<std::string>& start = std::nullopt,
                          const std::optional<std::string>& end = std::nullopt);

std::string render_status(const std::vector<Entry>& rows);

} // namespace timesheet
