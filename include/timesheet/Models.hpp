#pragma once
#include <optional>
#include <string>
#include <vector>

#include "timesheet/Timestamp.hpp"

namespace timesheet {

struct Entry {
    std::string project;
    Timestamp in;
    std::optional<Timestamp> out;            // absent while clocked in
    std::optional<std::string> description;  // required once out is set
};

// newest first
using Timesheet = std::vector<Entry>;

} // namespace timesheet
