#pragma once
#include <stdexcept>
#include <string>

namespace timesheet {

class TimesheetError : public std::runtime_error {
public:
    explicit TimesheetError(const std::string& msg) : std::runtime_error(msg) {}
};

// missing/empty required field, bad time ordering, missing description
class ValidationError : public TimesheetError {
public:
    explicit ValidationError(const std::string& msg) : TimesheetError(msg) {}
};

// double clock-in, double clock-out
class ConflictError : public TimesheetError {
public:
    explicit ConflictError(const std::string& msg) : TimesheetError(msg) {}
};

// no matching clock-in, no status data
class NotFoundError : public TimesheetError {
public:
    explicit NotFoundError(const std::string& msg) : TimesheetError(msg) {}
};

// malformed timestamp
class ParseError : public TimesheetError {
public:
    explicit ParseError(const std::string& msg) : TimesheetError(msg) {}
};

} // namespace timesheet
