#include "commands/status.hpp"

#include "io/JsonIO.hpp"
#include "timesheet/Engine.hpp"

void cmd_status(const cli::Options& opt, const std::string& timesheet_path, std::ostream& out) {
    const auto ts = loadTimesheet(timesheet_path);
    const auto rows = timesheet::status(ts, opt.project, opt.start_time, opt.end_time);
    out << timesheet::render_status(rows);
}
