#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <cstdint>
#include <string>


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Size presets for synthetic rosters.
 */
enum class DemoSize { S, M, L, XL };

/**
 * @brief Build a synthetic roster organised in programme tracks.
 *
 * Students only take courses of their own track, so clashes stay within a
 * track and every preset fits in the 5 × 4 grid. The same size and seed
 * always give the same roster.
 */
CourseRoster makeDemoRoster(DemoSize size, std::uint32_t seed = 7);

/**
 * @brief Parse "S", "M", "L" or "XL" (case-insensitive).
 *
 * @throws std::invalid_argument for any other text.
 */
DemoSize parseDemoSize(const std::string& text);

/**
 * @brief Two courses sharing one student: MathA {S1, S2}, MathB {S1, S3}.
 */
CourseRoster makeSharedStudentRoster();

/**
 * @brief numCourses singleton courses all taken by student S1.
 */
CourseRoster makeSingleStudentRoster(int numCourses);
