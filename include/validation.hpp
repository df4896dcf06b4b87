#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include <string>
#include <vector>


///////////////////////////
///     VALIDATION      ///
///////////////////////////
/**
 * @brief A student attending more than one course in the same (day, slot).
 */
struct ClashViolation {
    std::string studentId;
    int day;
    int slot;
    std::vector<std::string> courses; ///< Colliding course names, roster order.
};

/**
 * @brief A student with more classes on one day than the daily cap.
 */
struct CapViolation {
    std::string studentId;
    int day;
    int classes;
};

/**
 * @brief Independent audit of an assignment against the hard rules.
 */
struct ValidationReport {
    std::vector<ClashViolation> clashes;
    std::vector<CapViolation> capViolations;
    std::vector<std::string> unplacedCourses;
    int placedCount = 0;
    int penalty = 0; ///< Load penalty of the placed courses.

    /// Clash-free, within the daily cap and complete.
    bool ok() const {
        return clashes.empty() && capViolations.empty() && unplacedCourses.empty();
    }
};

/**
 * @brief Audit placements against the roster.
 *
 * Rebuilds per-student occupancy from scratch, so it does not trust the
 * solver that produced the placements. Placements with a negative course
 * index or an out-of-grid (day, slot) count as unplaced.
 *
 * @param roster     Roster the placements were generated for.
 * @param placements One entry per course, indexed by course index.
 * @param rules      Daily cap and soft-rule weights.
 */
ValidationReport validateAssignment(const CourseRoster& roster,
                                    const std::vector<Placement>& placements,
                                    const LoadRules& rules);
