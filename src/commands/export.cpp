#include "commands/export.hpp"

#include "io/JsonIO.hpp"
#include "timesheet/Engine.hpp"

#include <stdexcept>

void cmd_export(const cli::Options& opt, const std::string& timesheet_path) {
    if (!opt.export_path || opt.export_path->empty()) {
        throw std::runtime_error("no export file was given");
    }

    const auto ts = loadTimesheet(timesheet_path);
    const auto data = timesheet::filter_timesheet(ts, opt.project, opt.start_time, opt.end_time);
    saveTimesheet(*opt.export_path, data);
}
