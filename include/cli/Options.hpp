#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace cli {

enum class Command {
    Status,
    ClockIn,
    ClockOut,
    Export,
    DeleteClockIn,
};

struct Options {
    Command command = Command::Status;
    bool help = false;

    std::optional<std::string> export_path;
    std::optional<std::string> start_time;
    std::optional<std::string> end_time;

    std::optional<std::string> project;
    std::vector<std::string> description;
};

// bad flags, missing values, more than one command
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// argv[0] is the program name. Throws UsageError.
Options parse_options(int argc, char** argv);

std::string usage();

} // namespace cli
