#include "cli/Options.hpp"
#include "commands/clock.hpp"
#include "commands/export.hpp"
#include "commands/status.hpp"
#include "io/Config.hpp"

#include <exception>
#include <iostream>
#include <string>

static int print_usage_error(const std::string& reason) {
    std::cerr << "error: " << reason << "\n\n" << cli::usage();
    return 2;
}

static void dispatch(const cli::Options& opt, const std::string& path) {
    switch (opt.command) {
        case cli::Command::ClockIn:       cmd_clock_in(opt, path); break;
        case cli::Command::ClockOut:      cmd_clock_out(opt, path); break;
        case cli::Command::Export:        cmd_export(opt, path); break;
        case cli::Command::DeleteClockIn: cmd_delete_clock_in(opt, path); break;
        case cli::Command::Status:        cmd_status(opt, path, std::cout); break;
    }
}

int main(int argc, char** argv) {
    cli::Options opt;
    try {
        opt = cli::parse_options(argc, argv);
    } catch (const cli::UsageError& e) {
        return print_usage_error(e.what());
    }

    if (opt.help) {
        std::cout << cli::usage();
        return 0;
    }

    const std::string path = resolveTimesheetPath();

    try {
        dispatch(opt, path);
    } catch (const std::exception& e) {
        std::cerr << "FAILED: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
