///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "enrollment_loader.hpp"
#include <algorithm>
#include <fstream>
#include <map>
#include <set>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// The header row must appear within this many leading lines.
static constexpr int kHeaderScanLines = 10;

static bool contains(const std::string& line, const char* marker) {
    return line.find(marker) != std::string::npos;
}

/**
 * @brief Index of a named column in the header fields, or -1.
 */
static int columnIndex(const std::vector<std::string>& header, const std::string& name) {
    for (int i = 0; i < (int)header.size(); ++i) {
        if (header[i] == name) return i;
    }
    return -1;
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (ch == '"') {
            // "" inside a quoted field is a literal quote.
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (ch == ',' && !quoted) {
            fields.push_back(trimWhitespace(current));
            current.clear();
        } else if (ch != '\r' && ch != '\n') {
            current += ch;
        }
    }
    fields.push_back(trimWhitespace(current));
    return fields;
}


///////////////////////////
///      INGESTION      ///
///////////////////////////
/**
 * @brief Read the preamble, locate the header and collect student rows.
 */
bool loadEnrollmentFile(const std::filesystem::path& path, EnrollmentData& data) {
    std::ifstream in(path);
    if (!in) {
        data.skippedFiles.push_back(path.string() + ": cannot open file");
        return false;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }

    std::string faculty = "Unknown";
    std::string subject = "Unknown";
    int headerIdx = -1;

    // Faculty and header row live in the first few lines.
    int scan = std::min((int)lines.size(), kHeaderScanLines);
    for (int i = 0; i < scan; ++i) {
        if (contains(lines[i], "Faculty Name")) {
            std::vector<std::string> parts = splitCsvLine(lines[i]);
            if (parts.size() > 1 && !parts[1].empty()) {
                faculty = parts[1];
            }
        }
        if (contains(lines[i], "Student ID") && contains(lines[i], "Student Name")) {
            headerIdx = i;
            break;
        }
    }

    // The last preamble line that is not metadata names the subject.
    for (int i = 0; i < std::max(0, headerIdx); ++i) {
        if (contains(lines[i], "Faculty Name") || contains(lines[i], "Group Mail ID")) continue;
        std::string candidate = splitCsvLine(lines[i]).front();
        if (!candidate.empty() && candidate != "SN" && candidate != "Serial No.") {
            subject = candidate;
        }
    }

    if (subject == "Unknown") {
        subject = path.filename().string();
        subject = subject.substr(0, subject.find('.'));
    }
    data.courseFaculty[subject] = faculty;

    if (headerIdx < 0) return true;

    std::vector<std::string> header = splitCsvLine(lines[headerIdx]);
    int idCol = columnIndex(header, "Student ID");
    int nameCol = columnIndex(header, "Student Name");
    if (idCol < 0 || nameCol < 0) return true;

    for (size_t i = headerIdx + 1; i < lines.size(); ++i) {
        if (trimWhitespace(lines[i]).empty()) continue;

        std::vector<std::string> fields = splitCsvLine(lines[i]);
        std::string rawId = idCol < (int)fields.size() ? fields[idCol] : "";
        std::string studentId = normalizeStudentId(rawId);
        if (studentId.empty() || studentId == "NAN") continue;

        std::string studentName = nameCol < (int)fields.size() ? fields[nameCol] : "";
        data.records.push_back({studentId, studentName, subject});
    }

    return true;
}

EnrollmentData loadEnrollmentDirectory(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw std::runtime_error("enrollment directory not found: " + dir.string());
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".csv") continue;
        files.push_back(entry.path());
    }
    if (ec) {
        throw std::runtime_error("cannot list " + dir.string() + ": " + ec.message());
    }

    // Directory order is unspecified; sort for reproducible rosters.
    std::sort(files.begin(), files.end());

    EnrollmentData data;
    for (const auto& file : files) {
        loadEnrollmentFile(file, data);
    }
    return data;
}

/**
 * @brief Collapse enrollment rows into one course per known subject.
 *
 * Subjects without any student row still become (empty) courses.
 */
CourseRoster buildRoster(const EnrollmentData& data) {
    std::map<std::string, std::set<std::string>> studentsBySubject;
    for (const StudentRecord& r : data.records) {
        studentsBySubject[r.subject].insert(r.studentId);
    }

    CourseRoster roster;
    for (const auto& kv : data.courseFaculty) {
        Course course;
        course.name = kv.first;
        course.faculty = kv.second;
        auto it = studentsBySubject.find(kv.first);
        if (it != studentsBySubject.end()) {
            course.students.assign(it->second.begin(), it->second.end());
        }
        roster.push_back(course);
    }
    return roster;
}
