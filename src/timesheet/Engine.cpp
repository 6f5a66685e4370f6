#include "timesheet/Engine.hpp"
#include "timesheet/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace timesheet {

static std::string join_words(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i) out += ' ';
        out += words[i];
    }
    return out;
}

static std::string trim_ascii(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

static std::optional<Timestamp> parse_opt(const std::optional<std::string>& s) {
    if (!s) return std::nullopt;
    return Timestamp::parse(*s);
}

static void require_project(const std::string& project) {
    if (project.empty()) throw ValidationError("no project name was given");
}

static bool by_start(const Entry& a, const Entry& b) {
    return a.in < b.in;
}

Timesheet clock_in(Timesheet ts,
                   const std::string& project,
                   const std::vector<std::string>& description,
                   const std::optional<std::string>& start,
                   const Clock& clock) {
    require_project(project);

    // only the most recent entry for a project can still be open
    for (const auto& e : ts) {
        if (e.project != project) continue;
        if (!e.out) {
            throw ConflictError("already clocked in for project '" + project + "' at '" + e.in.display() + "'");
        }
        break;
    }

    Entry e;
    e.project = project;
    e.in = start ? Timestamp::parse(*start) : clock();

    const std::string desc = trim_ascii(join_words(description));
    if (!desc.empty()) e.description = desc;

    ts.insert(ts.begin(), std::move(e));
    return ts;
}

Timesheet clock_out(Timesheet ts,
                    const std::string& project,
                    const std::vector<std::string>& description,
                    const std::optional<std::string>& start,
                    const std::optional<std::string>& end,
                    const Clock& clock) {
    require_project(project);

    const std::string desc = trim_ascii(join_words(description));

    for (auto& e : ts) {
        if (e.project != project) continue;

        if (e.out) throw ConflictError("no clock-in specified for project '" + project + "'");

        const Timestamp st = start ? Timestamp::parse(*start) : e.in;
        const Timestamp et = end ? Timestamp::parse(*end) : clock();
        if (et <= st) throw ValidationError("end time must be later than start time");

        const bool has_stored = e.description && !trim_ascii(*e.description).empty();
        if (desc.empty() && !has_stored) {
            throw ValidationError("please specify a description of work completed");
        }

        e.in = st;
        e.out = et;
        if (!desc.empty()) e.description = desc;
        return ts;
    }

    throw NotFoundError("did not find a clock-in time for project '" + project + "'");
}

Timesheet filter_timesheet(const Timesheet& ts,
                           const std::optional<std::string>& project,
                           const std::optional<std::string>& start,
                           const std::optional<std::string>& end) {
    if (!project && !start && !end) return ts;

    const auto start_time = parse_opt(start);
    const auto end_time = parse_opt(end);

    Timesheet filtered;
    for (const auto& e : ts) {
        if (project && e.project != *project) continue;
        if (start_time && e.in < *start_time) continue;
        if (end_time && (!e.out || *e.out > *end_time)) continue;
        filtered.push_back(e);
    }
    std::reverse(filtered.begin(), filtered.end());
    return filtered;
}

Timesheet remove_last(Timesheet ts, const std::optional<std::string>& project) {
    if (!project) {
        if (ts.size() <= 1) return {};
        ts.erase(ts.begin());
        return ts;
    }

    auto it = std::find_if(ts.begin(), ts.end(), [&](const Entry& e) { return e.project == *project; });
    if (it != ts.end()) ts.erase(it);
    return ts;
}

std::vector<Entry> status(const Timesheet& ts,
                          const std::optional<std::string>& project,
                          const std::optional<std::string>& start,
                          const std::optional<std::string>& end) {
    const auto start_time = parse_opt(start);
    const auto end_time = parse_opt(end);

    std::vector<Entry> rows;

    if (project) {
        for (const auto& e : ts) {
            if (e.project == *project) rows.push_back(e);
        }
        if (rows.empty()) throw NotFoundError("no data for project '" + *project + "' found");
    } else {
        std::unordered_set<std::string> seen;
        for (const auto& e : ts) {
            if (seen.count(e.project)) continue;
            if (start_time && e.in < *start_time) continue;
            if (end_time && e.out && *e.out > *end_time) continue;
            seen.insert(e.project);
            rows.push_back(e);
        }
        if (rows.empty()) throw NotFoundError("no timesheet data found");
    }

    std::stable_sort(rows.begin(), rows.end(), by_start);
    return rows;
}

// pads to width in UTF-8 code points
static std::string pad_right(const std::string& s, size_t width) {
    size_t cps = 0;
    for (char c : s) {
        if (((unsigned char)c & 0xC0) != 0x80) ++cps;
    }
    if (cps >= width) return s;
    return s + std::string(width - cps, ' ');
}

std::string render_status(const std::vector<Entry>& rows) {
    std::ostringstream oss;
    for (const auto& r : rows) {
        oss << pad_right(r.project, 20) << ": " << r.in.display() << " ";
        if (r.out) oss << "- " << r.out->display();
        else oss << "<- clocked in";
        oss << "\n";

        if (r.description && !trim_ascii(*r.description).empty()) {
            oss << "└──" << *r.description << "\n";
        }
    }
    return oss.str();
}

} // namespace timesheet
