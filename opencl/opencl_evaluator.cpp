///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
#include "constraints.hpp"
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

///////////////////////////
///   ERROR  CHECKING   ///
///////////////////////////
static inline void checkError(cl_int err, const char* operation) {
    if (err != CL_SUCCESS) {
        std::stringstream ss;
        ss << "OpenCL error during " << operation << ": " << err;
        throw std::runtime_error(ss.str());
    }
}

/**
 * @brief Owning handle for a device buffer, released on scope exit.
 */
struct DeviceBuffer {
    cl_mem mem = nullptr;

    DeviceBuffer(cl_context context, cl_mem_flags flags, size_t bytes, const char* what) {
        cl_int err = CL_SUCCESS;
        mem = clCreateBuffer(context, flags, bytes, nullptr, &err);
        checkError(err, what);
    }
    ~DeviceBuffer() {
        if (mem) clReleaseMemObject(mem);
    }
    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;
};

///////////////////////////
///   OPENCL KERNELS    ///
///////////////////////////
static const char* AUDIT_KERNEL_SRC = R"(
__kernel void audit_assignments(
    __global const int* days,                  // size: numCandidates * numCourses
    __global const int* slots,                 // size: numCandidates * numCourses
    const int numCandidates,
    const int numCourses,
    const int numStudents,
    const int daysPerWeek,
    const int slotsPerDay,
    const int dailyCap,
    const int lightThreshold,
    const int lightReward,
    const int stackingPenalty,
    __global const int* studentCourseOffsets,  // size: numStudents+1
    __global const int* studentCourses,        // flat course indices
    __global int* clashOut,
    __global int* capOut,
    __global int* unplacedOut,
    __global int* penaltyOut
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    const int MAX_DAYS  = 7;
    const int MAX_SLOTS = 16;

    if (daysPerWeek > MAX_DAYS || slotsPerDay > MAX_SLOTS) {
        // Calendar too big for the per-day bitmasks; flag as unusable.
        clashOut[cid] = -1;
        capOut[cid] = -1;
        unplacedOut[cid] = numCourses;
        penaltyOut[cid] = 1000000000;
        return;
    }

    int base = cid * numCourses;

    // UNPLACED COURSES
    int unplaced = 0;
    for (int c = 0; c < numCourses; ++c) {
        int d = days[base + c];
        int s = slots[base + c];
        if (d < 0 || d >= daysPerWeek || s < 0 || s >= slotsPerDay) {
            unplaced++;
        }
    }

    int clashes = 0;
    int capViolations = 0;
    int penalty = 0;

    // PER-STUDENT OCCUPANCY
    for (int st = 0; st < numStudents; ++st) {
        int mask[MAX_DAYS];
        int count[MAX_DAYS];
        for (int d = 0; d < daysPerWeek; ++d) {
            mask[d] = 0;
            count[d] = 0;
        }

        int start = studentCourseOffsets[st];
        int end   = studentCourseOffsets[st + 1];
        for (int i = start; i < end; ++i) {
            int c = studentCourses[i];
            int d = days [base + c];
            int s = slots[base + c];
            if (d < 0 || d >= daysPerWeek || s < 0 || s >= slotsPerDay) continue;

            // Slot already taken by another of this student's courses.
            if (mask[d] & (1 << s)) {
                clashes++;
            }
            mask[d] |= (1 << s);
            count[d]++;
        }

        // DAILY CAP + LOAD PENALTY
        for (int d = 0; d < daysPerWeek; ++d) {
            int n = count[d];
            if (n > dailyCap) {
                capViolations++;
            }
            int light   = n < lightThreshold ? n : lightThreshold;
            int stacked = n > lightThreshold ? n - lightThreshold : 0;
            penalty += -lightReward * light + stackingPenalty * stacked;
        }
    }

    clashOut[cid] = clashes;
    capOut[cid] = capViolations;
    unplacedOut[cid] = unplaced;
    penaltyOut[cid] = penalty;
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
AssignmentOpenCLContext::AssignmentOpenCLContext() {
    cl_int err = CL_SUCCESS;

    cl_uint numPlatforms = 0;
    err = clGetPlatformIDs(0, nullptr, &numPlatforms);
    checkError(err, "getting platform count");
    if (numPlatforms == 0)
        throw std::runtime_error("No OpenCL platforms found.");

    std::vector<cl_platform_id> platforms(numPlatforms);
    err = clGetPlatformIDs(numPlatforms, platforms.data(), nullptr);
    checkError(err, "getting platform IDs");
    platform = platforms[0];

    err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_GPU, 1, &device, nullptr);
    if (err != CL_SUCCESS) {
        std::cout << "No GPU found, trying CPU...\n";
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    std::cout << "Using OpenCL device: " << name << "\n";

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

    queue = clCreateCommandQueue(context, device, 0, &err);
    if (err != CL_SUCCESS) {
        clReleaseContext(context);
        checkError(err, "creating command queue");
    }

    try {
        program = buildProgram(AUDIT_KERNEL_SRC);
    } catch (...) {
        clReleaseCommandQueue(queue);
        clReleaseContext(context);
        throw;
    }
}

AssignmentOpenCLContext::~AssignmentOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program AssignmentOpenCLContext::buildProgram(const char* src) {
    cl_int err = CL_SUCCESS;
    size_t len = std::strlen(src);
    const char* srcs[1] = { src };
    size_t lens[1] = { len };

    cl_program prog = clCreateProgramWithSource(context, 1, srcs, lens, &err);
    checkError(err, "creating program from source");

    err = clBuildProgram(prog, 1, &device, nullptr, nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t logSize = 0;
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &logSize);
        std::vector<char> log(logSize + 1, '\0');
        clGetProgramBuildInfo(prog, device, CL_PROGRAM_BUILD_LOG, logSize, log.data(), nullptr);
        std::cerr << "OpenCL build log:\n" << log.data() << "\n";
        clReleaseProgram(prog);
        throw std::runtime_error("Failed to build OpenCL program");
    }

    return prog;
}

///////////////////////////
///   EVALUATE BATCH    ///
///////////////////////////
void AssignmentOpenCLContext::evaluateBatch(
        const RosterIndex& index,
        const LoadRules& rules,
        const std::vector<std::vector<Placement>>& batchPlacements,
        std::vector<AssignmentAudit>& audits
) {
    cl_int err = CL_SUCCESS;

    int numCandidates = (int)batchPlacements.size();
    audits.assign(numCandidates, AssignmentAudit{});
    if (numCandidates == 0) return;

    int numCourses = index.numCourses();
    int numStudents = index.numStudents();
    int daysPerWeek = DAYS;
    int slotsPerDay = SLOTS_PER_DAY;

    // Nothing to audit on the device: no seats can clash and no load exists.
    if (numCourses == 0 || numStudents == 0) {
        for (int c = 0; c < numCandidates; ++c) {
            for (const Placement& p : batchPlacements[c]) {
                if (p.courseIndex < 0) audits[c].unplaced++;
            }
        }
        return;
    }

    // Flatten placements; unplaced courses get day = slot = -1.
    std::vector<int> days((size_t)numCandidates * numCourses, -1);
    std::vector<int> slots((size_t)numCandidates * numCourses, -1);

    for (int c = 0; c < numCandidates; ++c) {
        const auto& placements = batchPlacements[c];
        for (int k = 0; k < numCourses && k < (int)placements.size(); ++k) {
            const Placement& p = placements[k];
            if (p.courseIndex < 0) continue;
            size_t idx = (size_t)c * numCourses + k;
            days [idx] = p.day;
            slots[idx] = p.slot;
        }
    }

    // Flatten index: student -> courses (CSR layout)
    std::vector<int> studentCourseOffsets(numStudents + 1);
    std::vector<int> studentCourses;
    int offset = 0;
    for (int s = 0; s < numStudents; ++s) {
        studentCourseOffsets[s] = offset;
        for (int course : index.studentCourses[s]) {
            studentCourses.push_back(course);
            ++offset;
        }
    }
    studentCourseOffsets[numStudents] = offset;

    size_t bufPlacementsSize = days.size() * sizeof(int);
    size_t bufOffsetsSize = studentCourseOffsets.size() * sizeof(int);
    size_t bufCoursesSize = studentCourses.size() * sizeof(int);
    size_t bufOutSize = (size_t)numCandidates * sizeof(int);

    DeviceBuffer d_days(context, CL_MEM_READ_ONLY, bufPlacementsSize, "creating d_days");
    DeviceBuffer d_slots(context, CL_MEM_READ_ONLY, bufPlacementsSize, "creating d_slots");
    DeviceBuffer d_offsets(context, CL_MEM_READ_ONLY, bufOffsetsSize, "creating d_studentCourseOffsets");
    DeviceBuffer d_courses(context, CL_MEM_READ_ONLY, bufCoursesSize, "creating d_studentCourses");
    DeviceBuffer d_clash(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating d_clash");
    DeviceBuffer d_cap(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating d_cap");
    DeviceBuffer d_unplaced(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating d_unplaced");
    DeviceBuffer d_penalty(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating d_penalty");

    // Upload data
    err = clEnqueueWriteBuffer(queue, d_days.mem, CL_TRUE, 0, bufPlacementsSize, days.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_days");
    err = clEnqueueWriteBuffer(queue, d_slots.mem, CL_TRUE, 0, bufPlacementsSize, slots.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_slots");
    err = clEnqueueWriteBuffer(queue, d_offsets.mem, CL_TRUE, 0, bufOffsetsSize, studentCourseOffsets.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_studentCourseOffsets");
    err = clEnqueueWriteBuffer(queue, d_courses.mem, CL_TRUE, 0, bufCoursesSize, studentCourses.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_studentCourses");

    // Kernel + args
    cl_kernel kernel = clCreateKernel(program, "audit_assignments", &err);
    checkError(err, "creating kernel");

    try {
        int arg = 0;
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_days.mem); checkError(err, "arg days");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_slots.mem); checkError(err, "arg slots");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numCourses); checkError(err, "arg numCourses");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numStudents); checkError(err, "arg numStudents");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &daysPerWeek); checkError(err, "arg daysPerWeek");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &slotsPerDay); checkError(err, "arg slotsPerDay");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &rules.dailyCap); checkError(err, "arg dailyCap");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &rules.lightDayThreshold); checkError(err, "arg lightThreshold");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &rules.lightDayReward); checkError(err, "arg lightReward");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &rules.stackingPenalty); checkError(err, "arg stackingPenalty");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_offsets.mem); checkError(err, "arg studentCourseOffsets");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_courses.mem); checkError(err, "arg studentCourses");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_clash.mem); checkError(err, "arg clashOut");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_cap.mem); checkError(err, "arg capOut");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_unplaced.mem); checkError(err, "arg unplacedOut");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_penalty.mem); checkError(err, "arg penaltyOut");

        size_t global = (size_t)numCandidates;
        err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
        checkError(err, "enqueuing audit_assignments");
        err = clFinish(queue);
        checkError(err, "finishing queue");
    } catch (...) {
        clReleaseKernel(kernel);
        throw;
    }
    clReleaseKernel(kernel);

    std::vector<int> clashes(numCandidates), caps(numCandidates), unplaced(numCandidates), penalties(numCandidates);

    err = clEnqueueReadBuffer(queue, d_clash.mem, CL_TRUE, 0, bufOutSize, clashes.data(), 0, nullptr, nullptr);
    checkError(err, "reading clashes");
    err = clEnqueueReadBuffer(queue, d_cap.mem, CL_TRUE, 0, bufOutSize, caps.data(), 0, nullptr, nullptr);
    checkError(err, "reading capViolations");
    err = clEnqueueReadBuffer(queue, d_unplaced.mem, CL_TRUE, 0, bufOutSize, unplaced.data(), 0, nullptr, nullptr);
    checkError(err, "reading unplaced");
    err = clEnqueueReadBuffer(queue, d_penalty.mem, CL_TRUE, 0, bufOutSize, penalties.data(), 0, nullptr, nullptr);
    checkError(err, "reading penalties");

    for (int c = 0; c < numCandidates; ++c) {
        audits[c].clashes = clashes[c];
        audits[c].capViolations = caps[c];
        audits[c].unplaced = unplaced[c];
        audits[c].penalty = penalties[c];
    }
}
