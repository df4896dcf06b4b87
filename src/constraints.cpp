///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief Initialize an empty schedule for every student of the index.
 */
StudentScheduleState::StudentScheduleState(const RosterIndex& index, const LoadRules& rules)
        : index_(index), rules_(rules) {
    occupied_.resize(index.numStudents());
}

/**
 * @brief Evaluate hard rules and soft penalty for a candidate in one pass.
 *
 * Mirrors the per-student loop of the greedy search: clash check, daily cap
 * check, then the load-spreading contribution of that student.
 */
bool StudentScheduleState::evaluate(int courseIndex, int day, int slot, int& penaltyOut) const {
    if (day < 0 || day >= DAYS || slot < 0 || slot >= SLOTS_PER_DAY)
        return false;

    int penalty = 0;
    for (int s : index_.courseStudents[courseIndex]) {
        // Hard rule 1: student already sits in this slot.
        if (!checkSlotFree(s, day, slot))
            return false;

        // Hard rule 2: student already reached the daily cap.
        if (!checkDailyCap(s, day))
            return false;

        penalty += studentPenalty(s, day);
    }

    penaltyOut = penalty;
    return true;
}

bool StudentScheduleState::canPlace(int courseIndex, int day, int slot) const {
    int ignored = 0;
    return evaluate(courseIndex, day, slot, ignored);
}

/**
 * @brief Record (day, slot) as occupied for every student of the course.
 */
void StudentScheduleState::place(int courseIndex, int day, int slot) {
    for (int s : index_.courseStudents[courseIndex]) {
        occupied_[s][day].push_back(slot);
    }
}

int StudentScheduleState::classesOn(int student, int day) const {
    return (int)occupied_[student][day].size();
}

const std::vector<int>& StudentScheduleState::occupiedSlots(int student, int day) const {
    return occupied_[student][day];
}

bool StudentScheduleState::checkSlotFree(int student, int day, int slot) const {
    const std::vector<int>& taken = occupied_[student][day];
    return std::find(taken.begin(), taken.end(), slot) == taken.end();
}

bool StudentScheduleState::checkDailyCap(int student, int day) const {
    return classesOn(student, day) < rules_.dailyCap;
}

/**
 * @brief Reward lightly loaded days, mildly penalize stacking.
 */
int StudentScheduleState::studentPenalty(int student, int day) const {
    if (classesOn(student, day) < rules_.lightDayThreshold) {
        return -rules_.lightDayReward;
    }
    return rules_.stackingPenalty;
}


///////////////////////////
///       SCORING       ///
///////////////////////////
/**
 * @brief Recompute the load penalty of a (partial) assignment from scratch.
 *
 * Counts classes per (student, day) and applies the closed form of the
 * soft rule, so the result does not depend on placement order.
 */
int computeLoadPenalty(const RosterIndex& index,
                       const std::vector<Placement>& placements,
                       const LoadRules& rules) {
    // perDay[student][day] = number of classes that day.
    std::vector<std::array<int, DAYS>> perDay(index.numStudents());
    for (auto& counts : perDay) counts.fill(0);

    for (const Placement& p : placements) {
        if (p.courseIndex < 0) continue;
        if (p.day < 0 || p.day >= DAYS) continue;
        for (int s : index.courseStudents[p.courseIndex]) {
            perDay[s][p.day]++;
        }
    }

    int penalty = 0;
    for (const auto& counts : perDay) {
        for (int n : counts) {
            int light = std::min(n, rules.lightDayThreshold);
            int stacked = std::max(0, n - rules.lightDayThreshold);
            penalty += -rules.lightDayReward * light + rules.stackingPenalty * stacked;
        }
    }
    return penalty;
}
