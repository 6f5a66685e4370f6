#include "commands/clock.hpp"

#include "io/JsonIO.hpp"
#include "timesheet/Engine.hpp"

#include <utility>

void cmd_clock_in(const cli::Options& opt, const std::string& timesheet_path) {
    auto ts = loadTimesheet(timesheet_path);
    ts = timesheet::clock_in(std::move(ts), opt.project.value_or(""), opt.description, opt.start_time);
    saveTimesheet(timesheet_path, ts);
}

void cmd_clock_out(const cli::Options& opt, const std::string& timesheet_path) {
    auto ts = loadTimesheet(timesheet_path);
    ts = timesheet::clock_out(std::move(ts), opt.project.value_or(""), opt.description,
                              opt.start_time, opt.end_time);
    saveTimesheet(timesheet_path, ts);
}

void cmd_delete_clock_in(const cli::Options& opt, const std::string& timesheet_path) {
    auto ts = loadTimesheet(timesheet_path);
    ts = timesheet::remove_last(std::move(ts), opt.project);
    saveTimesheet(timesheet_path, ts);
}
