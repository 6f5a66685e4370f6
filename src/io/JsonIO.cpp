#include "io/JsonIO.hpp"
#include "timesheet/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using timesheet::Entry;
using timesheet::Timesheet;
using timesheet::Timestamp;

namespace fs = std::filesystem;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static std::string require_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

// missing key and null both read as absent
static std::optional<std::string> optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string or null");
    }
    return j.at(key).get<std::string>();
}

static Timestamp parse_field(const std::string& value, const std::string& where) {
    try {
        return Timestamp::parse(value);
    } catch (const timesheet::ParseError& e) {
        throw timesheet::ParseError(where + ": " + e.what());
    }
}

static Entry parseEntry(const json& j, const std::string& where) {
    require_object(j, where);

    Entry e;
    e.project = require_string(j, "project", where);
    if (e.project.empty()) {
        throw std::runtime_error(where + ".project must not be empty");
    }
    e.in = parse_field(require_string(j, "in", where), where + ".in");

    if (auto out = optional_string(j, "out", where)) {
        e.out = parse_field(*out, where + ".out");
    }
    e.description = optional_string(j, "description", where);
    return e;
}

Timesheet timesheetFromJson(const json& j) {
    require_array(j, "root");

    Timesheet ts;
    ts.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        std::ostringstream oss;
        oss << "root[" << i << "]";
        ts.push_back(parseEntry(j.at(i), oss.str()));
    }
    return ts;
}

json timesheetToJson(const Timesheet& ts) {
    json arr = json::array();
    for (const auto& e : ts) {
        json ej;
        ej["project"] = e.project;
        ej["in"] = e.in.iso();
        ej["out"] = e.out ? json(e.out->iso()) : json(nullptr);
        ej["description"] = e.description ? json(*e.description) : json(nullptr);
        arr.push_back(ej);
    }
    return arr;
}

Timesheet loadTimesheet(const std::string& path) {
    if (!fs::exists(path)) {
        std::cerr << "warning: '" << path << "' not found, will create new file on data write\n";
        return {};
    }

    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open timesheet file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return timesheetFromJson(j);
}

// written to a sibling temp file and renamed over path, so a failed write leaves the old file
void saveTimesheet(const std::string& path, const Timesheet& ts) {
    const fs::path p(path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());

    const fs::path tmp(path + ".tmp");
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out) throw std::runtime_error("failed to open output file: " + tmp.string());

        out << timesheetToJson(ts).dump(2) << "\n";
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw std::runtime_error("failed to write output file: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, p, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("failed to replace " + path + ": " + ec.message());
    }
}
