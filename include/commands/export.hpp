#pragma once
#include <string>

#include "cli/Options.hpp"

// Writes the filtered timesheet to opt.export_path. The timesheet file is left untouched.
void cmd_export(const cli::Options& opt, const std::string& timesheet_path);
