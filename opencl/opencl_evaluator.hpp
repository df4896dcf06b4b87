#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <vector>
#include "model.hpp"
#include "constraints.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief Device-side audit of one candidate assignment.
 */
struct AssignmentAudit {
    int clashes = 0; ///< Seats double-booked (a student's second course in a taken slot).
    int capViolations = 0; ///< (student, day) pairs above the daily cap.
    int unplaced = 0; ///< Courses without a placement.
    int penalty = 0; ///< Load penalty of the placed courses.

    /// Complete, clash-free and within the daily cap.
    bool clean() const { return clashes == 0 && capViolations == 0 && unplaced == 0; }
};

/**
 * @brief OpenCL helper context for batched assignment auditing.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * used to audit many candidate assignments in parallel, one work-item per
 * candidate.
 */
class AssignmentOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Prefers a GPU and falls back to a CPU device. Also builds the program
     * containing the audit kernel.
     *
     * @throws std::runtime_error if OpenCL setup fails.
     */
    AssignmentOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     */
    ~AssignmentOpenCLContext();

    AssignmentOpenCLContext(const AssignmentOpenCLContext&) = delete;
    AssignmentOpenCLContext& operator=(const AssignmentOpenCLContext&) = delete;

    /**
     * @brief Audit a batch of candidate assignments on the device.
     *
     * Each element of batchPlacements holds one placement per course of the
     * index (courseIndex < 0 for unplaced courses). On return audits[i]
     * describes candidate i with the same semantics as validateAssignment()
     * and computeLoadPenalty().
     *
     * @throws std::runtime_error on any OpenCL failure.
     */
    void evaluateBatch(
            const RosterIndex& index,
            const LoadRules& rules,
            const std::vector<std::vector<Placement>>& batchPlacements,
            std::vector<AssignmentAudit>& audits
    );

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;

    cl_program buildProgram(const char* src);
};
