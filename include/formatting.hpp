#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "query.hpp"
#include "validation.hpp"
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Print the run banner: solver name, roster size, time and outcome.
 */
void printRunSummary(const std::string& title, const CourseRoster& roster,
                     const GenerationResult& result, double elapsedMs);

/**
 * @brief Print every placed course as a table, ordered by day and slot.
 */
void printMasterSchedule(const CourseRoster& roster, const GenerationResult& result);

/**
 * @brief Print the outcome of validateAssignment().
 */
void printValidationReport(const ValidationReport& report, const LoadRules& rules);

/**
 * @brief Print a student's weekly grid: slots as rows, days as columns.
 */
void printStudentGrid(const StudentGrid& grid);

/**
 * @brief Print subject, faculty, day, time and room of each entry.
 */
void printCourseDetails(const std::vector<ScheduleEntry>& entries);

/**
 * @brief Print grid and course details for every student of the roster.
 */
void printAllStudentSchedules(const CourseRoster& roster, const GenerationResult& result);
