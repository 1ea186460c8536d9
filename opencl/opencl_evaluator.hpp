#pragma once
#define CL_TARGET_OPENCL_VERSION 120

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <CL/cl.h>
#include <string>
#include <vector>
#include "model.hpp"


///////////////////////////
///      EVALUATOR      ///
///////////////////////////
/**
 * @brief OpenCL helper context for batched candidate evaluation.
 *
 * Owns the OpenCL platform/device/context/queue and a compiled program
 * used to compute the metrics of many selections in parallel on the GPU
 * (or on a CPU device when no GPU is present).
 */
class ScheduleOpenCLContext {
public:
    /**
     * @brief Initialize OpenCL platform, device, context and command queue.
     *
     * Also builds the program containing the evaluation kernel.
     *
     * @throws std::runtime_error if no platform/device is available or any
     *         OpenCL call fails.
     */
    ScheduleOpenCLContext();

    /**
     * @brief Release all OpenCL resources owned by this context.
     *
     * Destroys program, queue and context in the correct order.
     */
    ~ScheduleOpenCLContext();

    ScheduleOpenCLContext(const ScheduleOpenCLContext&) = delete;
    ScheduleOpenCLContext& operator=(const ScheduleOpenCLContext&) = delete;

    /**
     * @brief Evaluate a batch of selections on the device.
     *
     * Each element of batchSelections holds one catalog index per offering
     * group (all the same length). On return, for candidate i:
     *  - conflictCounts[i]  = distinct (day, period) slots with 2+ offerings,
     *  - totalPriorities[i] = sum of priorities,
     *  - totalCredits[i]    = sum of credits,
     *  - requiredCredits[i] = sum of credits of REQUIRED offerings.
     *
     * @throws std::runtime_error on any OpenCL failure.
     */
    void evaluateBatch(
            const std::vector<Offering>& catalog,
            const std::vector<std::vector<int>>& batchSelections,
            std::vector<int>& conflictCounts,
            std::vector<int>& totalPriorities,
            std::vector<int>& totalCredits,
            std::vector<int>& requiredCredits
    );

    /// Name reported by the selected device.
    const std::string& deviceName() const { return deviceName_; }

private:
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    cl_context context = nullptr;
    cl_program program = nullptr;
    cl_command_queue queue = nullptr;
    std::string deviceName_;

    cl_program buildProgram(const char* src);
};
