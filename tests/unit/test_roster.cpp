#include <gtest/gtest.h>
#include "roster/student_roster.hpp"
#include "io/csv.hpp"
#include <sstream>

using namespace affinity;

// ==========================================
// Identifier / interest parsing
// ==========================================

TEST(RosterParsingTest, NormalizeIdentifier) {
    EXPECT_EQ(normalize_identifier("  Ada.Lovelace@School.EDU \n"), "ada.lovelace@school.edu");
    EXPECT_EQ(normalize_identifier(""), "");
    EXPECT_EQ(normalize_identifier("   "), "");
}

TEST(RosterParsingTest, SplitInterestList) {
    auto items = split_interest_list("robotics; film ;; painting ;");
    ASSERT_EQ(items.size(), 3);
    EXPECT_EQ(items[0], "robotics");
    EXPECT_EQ(items[1], "film");
    EXPECT_EQ(items[2], "painting");
}

TEST(RosterParsingTest, RecordFromJsonArray) {
    nlohmann::json j = {
        {"firstName", "Ada"},
        {"lastName", "Lovelace"},
        {"interests", {"robotics", " film ", "robotics", ""}},
        {"availability", {{"Monday", {"10am-11am"}}}}
    };

    auto record = StudentRecord::from_json(j);
    EXPECT_EQ(record.first_name, "Ada");
    EXPECT_EQ(record.last_name, "Lovelace");
    ASSERT_EQ(record.interests.size(), 2);
    EXPECT_EQ(record.interests[0], "robotics");
    EXPECT_EQ(record.interests[1], "film");
}

TEST(RosterParsingTest, RecordFromJsonDelimitedString) {
    nlohmann::json j = {
        {"firstName", "Alan"},
        {"lastName", "Turing"},
        {"interests", "cooking; AI & machine learning;cooking"}
    };

    auto record = StudentRecord::from_json(j);
    ASSERT_EQ(record.interests.size(), 2);
    EXPECT_EQ(record.interests[0], "cooking");
    EXPECT_EQ(record.interests[1], "AI & machine learning");
}

TEST(RosterParsingTest, RecordsKeyedByNormalizedEmail) {
    nlohmann::json j = {
        {" Ada@School.edu", {{"firstName", "Ada"}, {"lastName", "L"}, {"interests", {"film"}}}},
        {"", {{"firstName", "Blank"}}}
    };

    auto records = parse_student_records(j);
    ASSERT_EQ(records.size(), 1);
    ASSERT_EQ(records.count("ada@school.edu"), 1);
    EXPECT_EQ(records.at("ada@school.edu").identifier, "ada@school.edu");
}

TEST(RosterParsingTest, NullFieldsDoNotDropOtherRecords) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "ada@x.edu": {"firstName": "Ada", "lastName": "L", "interests": ["film", "robotics"]},
        "bo@x.edu": {"firstName": "Bo", "lastName": null, "interests": ["film", null, 7, "painting"]},
        "cy@x.edu": {"firstName": null, "lastName": "C", "interests": null},
        "dee@x.edu": null
    })");

    auto records = parse_student_records(j);
    ASSERT_EQ(records.size(), 4);

    EXPECT_EQ(records.at("ada@x.edu").interests, (std::vector<std::string>{"film", "robotics"}));

    const auto& bo = records.at("bo@x.edu");
    EXPECT_EQ(bo.first_name, "Bo");
    EXPECT_EQ(bo.last_name, "");
    EXPECT_EQ(bo.interests, (std::vector<std::string>{"film", "painting"}));

    const auto& cy = records.at("cy@x.edu");
    EXPECT_EQ(cy.first_name, "");
    EXPECT_EQ(cy.last_name, "C");
    EXPECT_TRUE(cy.interests.empty());

    EXPECT_EQ(records.at("dee@x.edu").identifier, "dee@x.edu");
    EXPECT_TRUE(records.at("dee@x.edu").interests.empty());
}

TEST(RosterParsingTest, RecordsMustBeAnObject) {
    EXPECT_THROW(parse_student_records(nlohmann::json::array()), std::runtime_error);
}

TEST(RosterParsingTest, MissingRecordFileThrows) {
    EXPECT_THROW(load_student_records("/nonexistent/student_data.json"), std::runtime_error);
}

// ==========================================
// Target subset CSV
// ==========================================

TEST(TargetSubsetTest, ParsesAndNormalizes) {
    std::istringstream csv(
        "\xEF\xBB\xBF" "Name,Email,Track\n"
        "Ada,  ADA@school.edu ,Engineering\n"
        "Frida,frida@school.edu,\"Arts, Media\"\n"
        "Blank,,Arts\n"
        "\n"
        "Ada again,ada@school.edu,Arts\n"
        "Alan,alan@school.edu,Engineering\n");

    auto targets = parse_target_subset(csv);
    ASSERT_EQ(targets.size(), 3);
    EXPECT_EQ(targets[0].identifier, "ada@school.edu");
    EXPECT_EQ(targets[0].group, "Engineering");
    EXPECT_EQ(targets[1].identifier, "frida@school.edu");
    EXPECT_EQ(targets[1].group, "Arts, Media");
    EXPECT_EQ(targets[2].identifier, "alan@school.edu");
}

TEST(TargetSubsetTest, CustomColumns) {
    std::istringstream csv("login,cohort\nx@y.z,A\n");
    auto targets = parse_target_subset(csv, "login", "cohort");
    ASSERT_EQ(targets.size(), 1);
    EXPECT_EQ(targets[0].group, "A");
}

TEST(TargetSubsetTest, MissingColumnThrows) {
    std::istringstream no_track("Email\nada@school.edu\n");
    EXPECT_THROW(parse_target_subset(no_track), std::runtime_error);

    std::istringstream empty("");
    EXPECT_THROW(parse_target_subset(empty), std::runtime_error);
}

// ==========================================
// CSV helpers
// ==========================================

TEST(CsvTest, QuotedFieldSpanningLines) {
    std::istringstream in("a,\"multi\nline\",\"say \"\"hi\"\"\"\n");
    std::vector<std::string> row;
    ASSERT_TRUE(read_csv_row(in, row));
    ASSERT_EQ(row.size(), 3);
    EXPECT_EQ(row[1], "multi\nline");
    EXPECT_EQ(row[2], "say \"hi\"");
    EXPECT_FALSE(read_csv_row(in, row));
}

TEST(CsvTest, Escape) {
    EXPECT_EQ(csv_escape("plain"), "plain");
    EXPECT_EQ(csv_escape("a, b"), "\"a, b\"");
    EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

// ==========================================
// Interest pool
// ==========================================

class InterestPoolTest : public ::testing::Test {
protected:
    StudentRecords records;
    std::vector<TargetEntry> targets;

    void SetUp() override {
        records["ada@school.edu"] = {"ada@school.edu", "Ada", "L", {"robotics", "AI & machine learning", "film"}};
        records["alan@school.edu"] = {"alan@school.edu", "Alan", "T", {"cooking", "robotics"}};
        records["outsider@school.edu"] = {"outsider@school.edu", "Out", "Sider", {"sailing"}};

        targets = {
            {"ada@school.edu", "Engineering"},
            {"alan@school.edu", "Engineering"},
            {"missing@school.edu", "Arts"}
        };
    }
};

TEST_F(InterestPoolTest, UnionMinusExclusionSorted) {
    auto pool = InterestPool::build(records, targets, {"AI & machine learning"});

    std::vector<std::string> expected = {"cooking", "film", "robotics"};
    EXPECT_EQ(pool.tags(), expected);
    EXPECT_FALSE(pool.contains("AI & machine learning"));
    EXPECT_FALSE(pool.contains("sailing"));  // not a target
}

TEST_F(InterestPoolTest, RestrictKeepsStudentOrder) {
    auto pool = InterestPool::build(records, targets, {"AI & machine learning"});
    auto restricted = pool.restrict({"robotics", "sailing", "cooking", "robotics"});

    ASSERT_EQ(restricted.size(), 2);
    EXPECT_EQ(restricted[0], "robotics");
    EXPECT_EQ(restricted[1], "cooking");
}

TEST_F(InterestPoolTest, EmptyWithoutTargets) {
    auto pool = InterestPool::build(records, {}, {});
    EXPECT_TRUE(pool.empty());
    EXPECT_EQ(pool.size(), 0);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
