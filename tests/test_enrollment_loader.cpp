///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>
#include "enrollment_loader.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;


///////////////////////////
///      FIXTURES       ///
///////////////////////////
class EnrollmentLoaderTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() /
              (std::string("timetable_loader_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void writeFile(const std::string& name, const std::string& content) const {
        std::ofstream out(dir / name);
        out << content;
    }
};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_F(EnrollmentLoaderTest, ReadsPreambleAndStudentRows) {
    writeFile("or.csv",
              "Operations Research,,\n"
              "Faculty Name,Prof. Sharma\n"
              "Group Mail ID,or-batch@example.edu\n"
              "SN,Student ID,Student Name\n"
              "1, h001-24 ,Aakriti Sen\n"
              "2,H002-24,\"Rao, Vikram\"\n"
              "3,nan,Ghost Row\n"
              "4,,Nobody\n");

    EnrollmentData data = loadEnrollmentDirectory(dir);

    ASSERT_EQ(data.records.size(), 2u);
    EXPECT_EQ(data.records[0].studentId, "H001-24");
    EXPECT_EQ(data.records[0].studentName, "Aakriti Sen");
    EXPECT_EQ(data.records[0].subject, "Operations Research");
    EXPECT_EQ(data.records[1].studentId, "H002-24");
    EXPECT_EQ(data.records[1].studentName, "Rao, Vikram");
    EXPECT_EQ(data.courseFaculty.at("Operations Research"), "Prof. Sharma");
    EXPECT_TRUE(data.skippedFiles.empty());
}

TEST_F(EnrollmentLoaderTest, SubjectFallsBackToFileStem) {
    writeFile("finance.csv",
              "Student ID,Student Name\n"
              "H001-24,Aakriti Sen\n");

    EnrollmentData data = loadEnrollmentDirectory(dir);

    ASSERT_EQ(data.records.size(), 1u);
    EXPECT_EQ(data.records[0].subject, "finance");
    EXPECT_EQ(data.courseFaculty.at("finance"), "Unknown");
}

TEST_F(EnrollmentLoaderTest, SerialNumberLinesDoNotNameTheSubject) {
    writeFile("ethics.csv",
              "Business Ethics\n"
              "Serial No.,,\n"
              "Student ID,Student Name\n"
              "H003-24,Meera Nair\n");

    EnrollmentData data = loadEnrollmentDirectory(dir);

    ASSERT_EQ(data.records.size(), 1u);
    EXPECT_EQ(data.records[0].subject, "Business Ethics");
}

TEST_F(EnrollmentLoaderTest, FileWithoutHeaderStillDefinesAnEmptyCourse) {
    writeFile("notes.csv", "just some text\nmore text\n");
    writeFile("readme.txt", "Student ID,Student Name\nH009-24,Not Loaded\n");

    EnrollmentData data = loadEnrollmentDirectory(dir);

    EXPECT_TRUE(data.records.empty());
    ASSERT_EQ(data.courseFaculty.size(), 1u);
    EXPECT_EQ(data.courseFaculty.count("notes"), 1u);

    CourseRoster roster = buildRoster(data);
    ASSERT_EQ(roster.size(), 1u);
    EXPECT_EQ(roster[0].name, "notes");
    EXPECT_TRUE(roster[0].students.empty());
}

TEST_F(EnrollmentLoaderTest, BuildRosterGroupsStudentsBySubject) {
    writeFile("a.csv",
              "Marketing\n"
              "Faculty Name,Prof. Iyer\n"
              "Student ID,Student Name\n"
              "H002-24,Vikram Rao\n"
              "H001-24,Aakriti Sen\n"
              "h002-24,Vikram Rao\n");
    writeFile("b.csv",
              "Accounting\n"
              "Student ID,Student Name\n"
              "H001-24,Aakriti Sen\n");

    CourseRoster roster = buildRoster(loadEnrollmentDirectory(dir));

    ASSERT_EQ(roster.size(), 2u);
    EXPECT_EQ(roster[0].name, "Accounting");
    EXPECT_EQ(roster[0].faculty, "Unknown");
    EXPECT_EQ(roster[0].students, std::vector<std::string>{"H001-24"});
    EXPECT_EQ(roster[1].name, "Marketing");
    EXPECT_EQ(roster[1].faculty, "Prof. Iyer");
    std::vector<std::string> expected = {"H001-24", "H002-24"};
    EXPECT_EQ(roster[1].students, expected);
}

TEST_F(EnrollmentLoaderTest, MissingDirectoryThrows) {
    EXPECT_THROW(loadEnrollmentDirectory(dir / "absent"), std::runtime_error);
}

TEST_F(EnrollmentLoaderTest, UnreadableFileIsRecordedAsSkipped) {
    EnrollmentData data;
    EXPECT_FALSE(loadEnrollmentFile(dir / "missing.csv", data));
    ASSERT_EQ(data.skippedFiles.size(), 1u);
    EXPECT_TRUE(data.courseFaculty.empty());
}

TEST(SplitCsvLine, HandlesQuotesAndWhitespace) {
    std::vector<std::string> fields = splitCsvLine(" 1 ,\"Rao, Vikram\",\"say \"\"hi\"\"\",\r");

    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "1");
    EXPECT_EQ(fields[1], "Rao, Vikram");
    EXPECT_EQ(fields[2], "say \"hi\"");
    EXPECT_EQ(fields[3], "");
}
