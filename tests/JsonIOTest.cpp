#include <gtest/gtest.h>

#include "io/JsonIO.hpp"
#include "timesheet/Engine.hpp"
#include "timesheet/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using timesheet::Timestamp;

namespace
{
class JsonIOTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("logh_") + info->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write_file(const std::string& name, const std::string& body)
    {
        const fs::path p = dir_ / name;
        std::ofstream out(p);
        out << body;
        return p.string();
    }

    fs::path dir_;
};
} // namespace

TEST_F(JsonIOTest, MissingFileLoadsEmpty)
{
    EXPECT_TRUE(loadTimesheet((dir_ / "absent.json").string()).empty());
}

TEST_F(JsonIOTest, LoadsEntriesInFileOrder)
{
    const std::string path = write_file("ts.json", R"([
        {"project": "proj-a", "in": "2024-01-02T09:00:00", "out": null, "description": null},
        {"project": "proj-b", "in": "2024-01-01T09:00:00.250000", "out": "2024-01-01T17:00:00", "description": "done"}
    ])");

    const auto ts = loadTimesheet(path);

    ASSERT_EQ(ts.size(), 2u);
    EXPECT_EQ(ts[0].project, "proj-a");
    EXPECT_FALSE(ts[0].out.has_value());
    EXPECT_FALSE(ts[0].description.has_value());
    EXPECT_EQ(ts[1].project, "proj-b");
    EXPECT_EQ(ts[1].in.microsecond, 250000);
    EXPECT_EQ(*ts[1].out, Timestamp::parse("2024-01-01T17:00:00"));
    EXPECT_EQ(*ts[1].description, "done");
}

TEST_F(JsonIOTest, MissingNullableKeysReadAsAbsent)
{
    const auto ts = timesheetFromJson(json::parse(R"([{"project": "p", "in": "2024-01-01"}])"));

    ASSERT_EQ(ts.size(), 1u);
    EXPECT_FALSE(ts[0].out.has_value());
    EXPECT_FALSE(ts[0].description.has_value());
}

TEST_F(JsonIOTest, SaveWritesNullsAndCreatesDirectories)
{
    timesheet::Timesheet ts = timesheet::clock_in({}, "proj-a", {}, std::string("2024-01-01T09:00:00"));
    const std::string path = (dir_ / "nested" / "ts.json").string();

    saveTimesheet(path, ts);

    std::ifstream in(path);
    ASSERT_TRUE(in.good());
    json j;
    in >> j;

    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["project"], "proj-a");
    EXPECT_EQ(j[0]["in"], "2024-01-01T09:00:00");
    EXPECT_TRUE(j[0]["out"].is_null());
    EXPECT_TRUE(j[0]["description"].is_null());
}

TEST_F(JsonIOTest, SaveThenLoadKeepsEntries)
{
    timesheet::Timesheet ts = timesheet::clock_in({}, "proj-a", {"design"}, std::string("2024-01-01T09:00:00.5"));
    ts = timesheet::clock_out(ts, "proj-a", {}, std::nullopt, std::string("2024-01-01T10:00:00"));
    ts = timesheet::clock_in(ts, "proj-b", {}, std::string("2024-01-01T11:00:00"));

    const std::string path = (dir_ / "ts.json").string();
    saveTimesheet(path, ts);
    const auto loaded = loadTimesheet(path);

    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].project, "proj-b");
    EXPECT_FALSE(loaded[0].out.has_value());
    EXPECT_EQ(loaded[1].in, ts[1].in);
    EXPECT_EQ(*loaded[1].out, *ts[1].out);
    EXPECT_EQ(*loaded[1].description, "design");
}

TEST_F(JsonIOTest, RejectsMalformedJson)
{
    const std::string path = write_file("bad.json", "[{\"project\": ");
    EXPECT_THROW(loadTimesheet(path), std::runtime_error);
}

TEST_F(JsonIOTest, RejectsWrongShapes)
{
    EXPECT_THROW(timesheetFromJson(json::parse(R"({"project": "p"})")), std::runtime_error);
    EXPECT_THROW(timesheetFromJson(json::parse(R"([42])")), std::runtime_error);
    EXPECT_THROW(timesheetFromJson(json::parse(R"([{"in": "2024-01-01"}])")), std::runtime_error);
    EXPECT_THROW(timesheetFromJson(json::parse(R"([{"project": "", "in": "2024-01-01"}])")), std::runtime_error);
    EXPECT_THROW(timesheetFromJson(json::parse(R"([{"project": "p", "in": 5}])")), std::runtime_error);
    EXPECT_THROW(timesheetFromJson(json::parse(R"([{"project": "p", "in": "2024-01-01", "out": 1}])")),
                 std::runtime_error);
}

TEST_F(JsonIOTest, BadTimestampNamesTheElement)
{
    const json j = json::parse(R"([
        {"project": "p", "in": "2024-01-01"},
        {"project": "p", "in": "2024-01-01", "out": "later"}
    ])");

    try {
        timesheetFromJson(j);
        FAIL() << "expected ParseError";
    } catch (const timesheet::ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("root[1].out"), std::string::npos);
    }
}

TEST_F(JsonIOTest, SaveLeavesNoTempFileBehind)
{
    const std::string path = (dir_ / "ts.json").string();
    saveTimesheet(path, timesheet::clock_in({}, "proj-a", {}, std::string("2024-01-01T09:00")));
    saveTimesheet(path, {});

    EXPECT_TRUE(loadTimesheet(path).empty());
    EXPECT_FALSE(fs::exists(path + ".tmp"));
}

TEST_F(JsonIOTest, FailedReplaceKeepsExistingTarget)
{
    // a non-empty directory cannot be replaced by a file
    const fs::path target = dir_ / "occupied";
    fs::create_directories(target);
    write_file("occupied/keep.txt", "data");

    EXPECT_THROW(saveTimesheet(target.string(), {}), std::runtime_error);
    EXPECT_TRUE(fs::is_directory(target));
    EXPECT_TRUE(fs::exists(target / "keep.txt"));
    EXPECT_FALSE(fs::exists(target.string() + ".tmp"));
}
