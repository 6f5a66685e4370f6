#pragma once
#include <string>

#include "cli/Options.hpp"

// Mutating commands: load, apply, save. Throw on failure, nothing is written then.
void cmd_clock_in(const cli::Options& opt, const std::string& timesheet_path);
void cmd_clock_out(const cli::Options& opt, const std::string& timesheet_path);
void cmd_delete_clock_in(const cli::Options& opt, const std::string& timesheet_path);
