#include "cli/Options.hpp"

#include <sstream>

namespace cli {

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static void set_command(Options& opt, Command cmd, bool& seen, const std::string& flag) {
    if (seen && opt.command != cmd) {
        throw UsageError("argument " + flag + ": not allowed with another command");
    }
    seen = true;
    opt.command = cmd;
}

// value of "--key=value" or the next argv entry
static std::string take_value(int argc, char** argv, int& i, const std::string& arg, const std::string& key) {
    if (arg.size() > key.size() && arg[key.size()] == '=') {
        std::string value = arg.substr(key.size() + 1);
        if (value.empty()) throw UsageError("argument " + key + ": expected one argument");
        return value;
    }
    if (i + 1 >= argc) throw UsageError("argument " + key + ": expected one argument");
    return argv[++i];
}

Options parse_options(int argc, char** argv) {
    Options opt;
    bool have_command = false;
    bool only_positional = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (only_positional || a.empty() || a[0] != '-' || a == "-") {
            positional.push_back(a);
            continue;
        }

        if (a == "--") {
            only_positional = true;
            continue;
        }

        if (a == "-h" || a == "--help") {
            opt.help = true;
            continue;
        }

        if (a == "-i" || a == "--clock-in") {
            set_command(opt, Command::ClockIn, have_command, a);
            continue;
        }

        if (a == "-o" || a == "--clock-out") {
            set_command(opt, Command::ClockOut, have_command, a);
            continue;
        }

        if (a == "-d" || a == "--delete-clock-in") {
            set_command(opt, Command::DeleteClockIn, have_command, a);
            continue;
        }

        if (a == "-e" || a == "--export" || starts_with(a, "--export=")) {
            const std::string key = (a == "-e") ? "-e" : "--export";
            set_command(opt, Command::Export, have_command, key);
            opt.export_path = take_value(argc, argv, i, a, key);
            continue;
        }

        if (a == "--start-time" || starts_with(a, "--start-time=")) {
            opt.start_time = take_value(argc, argv, i, a, "--start-time");
            continue;
        }

        if (a == "--end-time" || starts_with(a, "--end-time=")) {
            opt.end_time = take_value(argc, argv, i, a, "--end-time");
            continue;
        }

        throw UsageError("unrecognized argument: " + a);
    }

    if (!positional.empty()) {
        opt.project = positional.front();
        opt.description.assign(positional.begin() + 1, positional.end());
    }

    return opt;
}

std::string usage() {
    std::ostringstream oss;
    oss << "usage: logh [-h] [-i | -o | -e <file> | -d] [--start-time <iso8601>] [--end-time <iso8601>]\n"
        << "            [project] [description ...]\n"
        << "\n"
        << "log working hours\n"
        << "\n"
        << "positional arguments:\n"
        << "  project                      project being worked on\n"
        << "  description                  description of tasks completed\n"
        << "\n"
        << "options:\n"
        << "  -h, --help                   show this help message and exit\n"
        << "  -i, --clock-in               mark current time as clock start\n"
        << "  -o, --clock-out              mark current time as clock end\n"
        << "  -e, --export <file>          export timesheet data to file\n"
        << "  -d, --delete-clock-in        delete the most recent clock-in / hours\n"
        << "  --start-time <iso8601>       specify a specific starting time\n"
        << "  --end-time <iso8601>         specify a specific ending time\n"
        << "\n"
        << "with no command the most recent hours per project are shown.\n"
        << "the timesheet lives at $JSON_TIMESHEET, default $HOME/timesheet.json\n";
    return oss.str();
}

} // namespace cli
