#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <array>
#include <vector>


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief Placement of a single course in the timetable grid.
 *
 * Associates a course index with a specific (day, slot) and a room label
 * from the room pool.
 */
struct Placement {
    int courseIndex; ///< Index of the course in the roster (or -1 if unplaced).
    int day; ///< Day index in the timetable (0..DAYS-1).
    int slot; ///< Time slot index within the day (0..SLOTS_PER_DAY-1).
    int roomIndex; ///< Index into the room pool (0..roomCount-1).
};

/**
 * @brief Tunables of the hard daily cap and the load-spreading soft rule.
 *
 * For every enrolled student, a candidate day with fewer than
 * lightDayThreshold classes earns -lightDayReward; any other day costs
 * +stackingPenalty.
 */
struct LoadRules {
    int dailyCap = 4; ///< Max classes per student per day.
    int lightDayThreshold = 2; ///< Days below this count are "lightly loaded".
    int lightDayReward = 5; ///< Reward for using a lightly loaded day.
    int stackingPenalty = 2; ///< Penalty for stacking onto a busier day.
};

/**
 * @brief Per-student occupancy during one greedy attempt.
 *
 * For every student keeps, per day, the ordered list of slots already
 * taken. Enforces the two hard rules when placing a course:
 *  - no clash: none of the course's students may already sit in the slot,
 *  - daily cap: none of them may already have dailyCap classes that day.
 * A fresh state is built at the start of each attempt.
 */
class StudentScheduleState {
public:
    /**
     * @brief Construct an empty schedule state for a roster index.
     *
     * The index must outlive the state.
     */
    StudentScheduleState(const RosterIndex& index, const LoadRules& rules);

    /**
     * @brief Evaluate a candidate (day, slot) for a course.
     *
     * Scans every enrolled student once. Returns false as soon as a hard
     * rule is violated; otherwise stores the soft-rule penalty of the
     * candidate in penaltyOut and returns true.
     *
     * @param courseIndex Course being placed.
     * @param day         Day index of the candidate.
     * @param slot        Slot index of the candidate.
     * @param penaltyOut  Receives the summed load penalty on success.
     */
    bool evaluate(int courseIndex, int day, int slot, int& penaltyOut) const;

    /**
     * @brief Check both hard rules for a candidate without scoring it.
     */
    bool canPlace(int courseIndex, int day, int slot) const;

    /**
     * @brief Commit a course to (day, slot) for all its students.
     *
     * Does not re-check constraints; call evaluate() or canPlace() first.
     */
    void place(int courseIndex, int day, int slot);

    /**
     * @brief Number of classes a student already has on a day.
     */
    int classesOn(int student, int day) const;

    /**
     * @brief Slots a student occupies on a day, in placement order.
     */
    const std::vector<int>& occupiedSlots(int student, int day) const;

private:
    /// Index this state belongs to.
    const RosterIndex& index_;

    /// Daily cap and soft-rule weights.
    LoadRules rules_;

    using DaySlots = std::array<std::vector<int>, DAYS>;

    /// occupied_[student][day] = slots taken that day.
    std::vector<DaySlots> occupied_;

    /**
     * @brief Check whether a student is free at (day, slot).
     */
    bool checkSlotFree(int student, int day, int slot) const;

    /**
     * @brief Check whether a student is still below the daily cap.
     */
    bool checkDailyCap(int student, int day) const;

    /**
     * @brief Soft-rule contribution of one student for a candidate day.
     */
    int studentPenalty(int student, int day) const;
};

/**
 * @brief Order-independent load penalty of an assignment.
 *
 * Equals the sum of the per-placement soft-rule penalties a greedy attempt
 * accumulates: a student with n classes on a day contributes
 * -reward * min(n, threshold) + stacking * max(0, n - threshold).
 * Unplaced entries (courseIndex < 0) are ignored.
 */
int computeLoadPenalty(const RosterIndex& index,
                       const std::vector<Placement>& placements,
                       const LoadRules& rules);
