#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "constraints.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief How equal-penalty candidates are ordered.
 */
enum class TieBreak {
    SHUFFLE_ORDER, ///< First candidate in the shuffled scan order wins.
    LEXICOGRAPHIC  ///< Smallest (day, slot) wins.
};

/**
 * @brief Configuration shared by every timetable solver.
 */
struct GeneratorConfig {
    int maxAttempts = 50; ///< Restart budget.
    int roomCount = 8; ///< Size of the room label pool (CR-1..CR-n).
    LoadRules rules; ///< Daily cap and soft-rule weights.
    TieBreak tieBreak = TieBreak::SHUFFLE_ORDER;
    std::uint32_t seed = 42; ///< Base seed for the injected random engine(s).

    /// Wall-clock budget checked between attempts; zero disables it.
    std::chrono::milliseconds timeLimit{0};
};

/**
 * @brief Outcome of a generation run.
 *
 * Holds one placement per roster course (indexed by course index, with
 * courseIndex == -1 for courses that could not be placed) together with
 * an explicit completeness flag.
 */
struct GenerationResult {
    /// Placements indexed by course index.
    std::vector<Placement> placements;

    /// True iff every course of the roster was placed.
    bool fullyPlaced = true;

    /// Names of the courses missing from the assignment.
    std::vector<std::string> unplacedCourses;

    /// Number of attempts actually run.
    int attemptsUsed = 0;

    /// Load penalty of the assignment; lower values are preferred.
    int penalty = 0;

    /**
     * @brief Count of placements that carry a course.
     */
    int placedCount() const {
        int n = 0;
        for (const Placement& p : placements) {
            if (p.courseIndex >= 0) ++n;
        }
        return n;
    }
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for timetable generators.
 *
 * Implementations may be sequential, multithreaded or GPU-audited, but all
 * expose the same generate() contract.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Generate a timetable for the given roster.
     *
     * Never fails on a well-formed roster: when no complete clash-free
     * assignment is found within the budget, a best-effort result with
     * fullyPlaced == false is returned.
     */
    virtual GenerationResult generate(const CourseRoster& roster) = 0;
};
