#pragma once
#include <ostream>
#include <string>

#include "cli/Options.hpp"

void cmd_status(const cli::Options& opt, const std::string& timesheet_path, std::ostream& out);
