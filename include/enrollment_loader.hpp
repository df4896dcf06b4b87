#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <filesystem>
#include <string>
#include <vector>


///////////////////////////
///      INGESTION      ///
///////////////////////////
/**
 * @brief Load every *.csv file of a directory, in path order.
 *
 * Each file describes one subject (see loadEnrollmentFile()). Files that
 * cannot be opened are listed in EnrollmentData::skippedFiles.
 *
 * @throws std::runtime_error if dir is not a readable directory.
 */
EnrollmentData loadEnrollmentDirectory(const std::filesystem::path& dir);

/**
 * @brief Parse one subject file and append its rows to data.
 *
 * Layout: a few preamble lines (subject title, "Faculty Name,<name>",
 * "Group Mail ID,..."), then a header row containing "Student ID" and
 * "Student Name", then one row per student. The header must appear within
 * the first 10 lines. The subject falls back to the file stem when no
 * preamble line names it; its faculty defaults to "Unknown".
 *
 * @return false if the file could not be opened (recorded in skippedFiles).
 */
bool loadEnrollmentFile(const std::filesystem::path& path, EnrollmentData& data);

/**
 * @brief Group enrollment records into a roster.
 *
 * One course per subject of data.courseFaculty, sorted by name, with its
 * unique student ids sorted.
 */
CourseRoster buildRoster(const EnrollmentData& data);

/**
 * @brief Split one CSV line into trimmed fields; double quotes group commas.
 */
std::vector<std::string> splitCsvLine(const std::string& line);
