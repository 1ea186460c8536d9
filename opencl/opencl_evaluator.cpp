///////////////////////////
///   IMPORTS SECTION   ///
///////////////////////////
#include "opencl_evaluator.hpp"
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
        // Zero-sized buffers are invalid in OpenCL; allocate one element instead.
        mem = clCreateBuffer(context, flags, bytes > 0 ? bytes : sizeof(cl_int), nullptr, &err);
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
static const char* SCHEDULE_KERNEL_SRC = R"(
__kernel void eval_schedules(
    __global const int* selections,     // numCandidates * numGroups catalog indices
    const int numCandidates,
    const int numGroups,
    __global const int* slotOffsets,    // size: numOfferings+1 (CSR into slotDays/slotPeriods)
    __global const int* slotDays,       // flat day indices
    __global const int* slotPeriods,    // flat periods
    __global const int* credits,        // size: numOfferings
    __global const int* priorities,     // size: numOfferings
    __global const int* required,       // size: numOfferings, 1 = REQUIRED
    __global int* conflictOut,
    __global int* priorityOut,
    __global int* creditsOut,
    __global int* requiredOut
) {
    int cid = get_global_id(0);
    if (cid >= numCandidates) return;

    int base = cid * numGroups;

    int totalPriority = 0;
    int totalCredits = 0;
    int requiredCredits = 0;
    for (int g = 0; g < numGroups; ++g) {
        int o = selections[base + g];
        totalPriority += priorities[o];
        totalCredits += credits[o];
        if (required[o]) requiredCredits += credits[o];
    }

    // A slot counts once: at its first occupant, if any later offering shares it.
    // Slots are duplicate-free within one offering, so only other groups matter.
    int conflicts = 0;
    for (int g = 0; g < numGroups; ++g) {
        int o = selections[base + g];
        for (int k = slotOffsets[o]; k < slotOffsets[o + 1]; ++k) {
            int d = slotDays[k];
            int p = slotPeriods[k];

            int seenBefore = 0;
            for (int h = 0; h < g && !seenBefore; ++h) {
                int q = selections[base + h];
                for (int m = slotOffsets[q]; m < slotOffsets[q + 1]; ++m) {
                    if (slotDays[m] == d && slotPeriods[m] == p) { seenBefore = 1; break; }
                }
            }
            if (seenBefore) continue;

            int seenAfter = 0;
            for (int h = g + 1; h < numGroups && !seenAfter; ++h) {
                int q = selections[base + h];
                for (int m = slotOffsets[q]; m < slotOffsets[q + 1]; ++m) {
                    if (slotDays[m] == d && slotPeriods[m] == p) { seenAfter = 1; break; }
                }
            }
            if (seenAfter) conflicts += 1;
        }
    }

    conflictOut[cid] = conflicts;
    priorityOut[cid] = totalPriority;
    creditsOut[cid] = totalCredits;
    requiredOut[cid] = requiredCredits;
}
)";

///////////////////////////
///  CONTEXT CTOR/DTOR  ///
///////////////////////////
ScheduleOpenCLContext::ScheduleOpenCLContext() {
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
        std::cerr << "No GPU found, trying CPU...\n";
        err = clGetDeviceIDs(platform, CL_DEVICE_TYPE_CPU, 1, &device, nullptr);
        checkError(err, "getting device ID");
    }

    char name[256] = {0};
    err = clGetDeviceInfo(device, CL_DEVICE_NAME, sizeof(name), name, nullptr);
    checkError(err, "getting device name");
    deviceName_ = name;

    context = clCreateContext(nullptr, 1, &device, nullptr, nullptr, &err);
    checkError(err, "creating context");

#if CL_TARGET_OPENCL_VERSION >= 200
    cl_queue_properties props[] = { CL_QUEUE_PROPERTIES, 0, 0 };
    queue = clCreateCommandQueueWithProperties(context, device, props, &err);
#else
    queue = clCreateCommandQueue(context, device, 0, &err);
#endif
    if (err != CL_SUCCESS) {
        clReleaseContext(context);
        checkError(err, "creating command queue");
    }

    try {
        program = buildProgram(SCHEDULE_KERNEL_SRC);
    } catch (const std::exception&) {
        clReleaseCommandQueue(queue);
        clReleaseContext(context);
        throw;
    }
}

ScheduleOpenCLContext::~ScheduleOpenCLContext() {
    if (queue)   clReleaseCommandQueue(queue);
    if (program) clReleaseProgram(program);
    if (context) clReleaseContext(context);
}

///////////////////////////
///   BUILD PROGRAM     ///
///////////////////////////
cl_program ScheduleOpenCLContext::buildProgram(const char* src) {
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
void ScheduleOpenCLContext::evaluateBatch(
        const std::vector<Offering>& catalog,
        const std::vector<std::vector<int>>& batchSelections,
        std::vector<int>& conflictCounts,
        std::vector<int>& totalPriorities,
        std::vector<int>& totalCredits,
        std::vector<int>& requiredCredits
) {
    cl_int err = CL_SUCCESS;

    int numCandidates = (int)batchSelections.size();
    conflictCounts.assign(numCandidates, 0);
    totalPriorities.assign(numCandidates, 0);
    totalCredits.assign(numCandidates, 0);
    requiredCredits.assign(numCandidates, 0);
    if (numCandidates == 0) return;

    int numGroups = (int)batchSelections.front().size();
    int numOfferings = (int)catalog.size();

    // Flatten selections
    std::vector<int> selections((size_t)numCandidates * numGroups);
    for (int c = 0; c < numCandidates; ++c) {
        const auto& sel = batchSelections[c];
        if ((int)sel.size() != numGroups) {
            throw std::invalid_argument("All selections of a batch must have the same length");
        }
        for (int g = 0; g < numGroups; ++g) {
            selections[(size_t)c * numGroups + g] = sel[g];
        }
    }

    // Flatten catalog: offering -> time slots (CSR layout)
    std::vector<int> slotOffsets(numOfferings + 1);
    std::vector<int> slotDays;
    std::vector<int> slotPeriods;
    std::vector<int> credits(numOfferings);
    std::vector<int> priorities(numOfferings);
    std::vector<int> required(numOfferings);

    int offset = 0;
    for (int o = 0; o < numOfferings; ++o) {
        slotOffsets[o] = offset;
        const Offering& off = catalog[o];
        for (const TimeSlot& ts : off.timeSlots) {
            slotDays.push_back(dayIndex(ts.day));
            slotPeriods.push_back(ts.period);
            ++offset;
        }
        credits[o] = off.credits;
        priorities[o] = off.priority;
        required[o] = off.category == Category::REQUIRED ? 1 : 0;
    }
    slotOffsets[numOfferings] = offset;

    size_t bufSelectionsSize = selections.size() * sizeof(int);
    size_t bufOffsetsSize = slotOffsets.size() * sizeof(int);
    size_t bufSlotsSize = slotDays.size() * sizeof(int);
    size_t bufOfferingSize = (size_t)numOfferings * sizeof(int);
    size_t bufOutSize = (size_t)numCandidates * sizeof(int);

    DeviceBuffer d_selections(context, CL_MEM_READ_ONLY, bufSelectionsSize, "creating d_selections");
    DeviceBuffer d_slotOffsets(context, CL_MEM_READ_ONLY, bufOffsetsSize, "creating d_slotOffsets");
    DeviceBuffer d_slotDays(context, CL_MEM_READ_ONLY, bufSlotsSize, "creating d_slotDays");
    DeviceBuffer d_slotPeriods(context, CL_MEM_READ_ONLY, bufSlotsSize, "creating d_slotPeriods");
    DeviceBuffer d_credits(context, CL_MEM_READ_ONLY, bufOfferingSize, "creating d_credits");
    DeviceBuffer d_priorities(context, CL_MEM_READ_ONLY, bufOfferingSize, "creating d_priorities");
    DeviceBuffer d_required(context, CL_MEM_READ_ONLY, bufOfferingSize, "creating d_required");
    DeviceBuffer d_conflicts(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating d_conflicts");
    DeviceBuffer d_priority(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating d_priority");
    DeviceBuffer d_creditsOut(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating d_creditsOut");
    DeviceBuffer d_requiredOut(context, CL_MEM_WRITE_ONLY, bufOutSize, "creating d_requiredOut");

    // Upload data
    err = clEnqueueWriteBuffer(queue, d_selections.mem, CL_TRUE, 0, bufSelectionsSize, selections.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_selections");
    err = clEnqueueWriteBuffer(queue, d_slotOffsets.mem, CL_TRUE, 0, bufOffsetsSize, slotOffsets.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_slotOffsets");
    if (bufSlotsSize > 0) {
        err = clEnqueueWriteBuffer(queue, d_slotDays.mem, CL_TRUE, 0, bufSlotsSize, slotDays.data(), 0, nullptr, nullptr);
        checkError(err, "writing d_slotDays");
        err = clEnqueueWriteBuffer(queue, d_slotPeriods.mem, CL_TRUE, 0, bufSlotsSize, slotPeriods.data(), 0, nullptr, nullptr);
        checkError(err, "writing d_slotPeriods");
    }
    err = clEnqueueWriteBuffer(queue, d_credits.mem, CL_TRUE, 0, bufOfferingSize, credits.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_credits");
    err = clEnqueueWriteBuffer(queue, d_priorities.mem, CL_TRUE, 0, bufOfferingSize, priorities.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_priorities");
    err = clEnqueueWriteBuffer(queue, d_required.mem, CL_TRUE, 0, bufOfferingSize, required.data(), 0, nullptr, nullptr);
    checkError(err, "writing d_required");

    // Kernel + args
    cl_kernel kernel = clCreateKernel(program, "eval_schedules", &err);
    checkError(err, "creating kernel");

    try {
        int arg = 0;
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_selections.mem); checkError(err, "arg selections");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numCandidates); checkError(err, "arg numCandidates");
        err = clSetKernelArg(kernel, arg++, sizeof(int), &numGroups); checkError(err, "arg numGroups");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_slotOffsets.mem); checkError(err, "arg slotOffsets");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_slotDays.mem); checkError(err, "arg slotDays");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_slotPeriods.mem); checkError(err, "arg slotPeriods");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_credits.mem); checkError(err, "arg credits");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_priorities.mem); checkError(err, "arg priorities");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_required.mem); checkError(err, "arg required");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_conflicts.mem); checkError(err, "arg conflictOut");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_priority.mem); checkError(err, "arg priorityOut");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_creditsOut.mem); checkError(err, "arg creditsOut");
        err = clSetKernelArg(kernel, arg++, sizeof(cl_mem), &d_requiredOut.mem); checkError(err, "arg requiredOut");

        size_t global = (size_t)numCandidates;
        err = clEnqueueNDRangeKernel(queue, kernel, 1, nullptr, &global, nullptr, 0, nullptr, nullptr);
        checkError(err, "enqueuing eval_schedules");
        err = clFinish(queue);
        checkError(err, "finishing queue");

        err = clEnqueueReadBuffer(queue, d_conflicts.mem, CL_TRUE, 0, bufOutSize, conflictCounts.data(), 0, nullptr, nullptr);
        checkError(err, "reading conflictCounts");
        err = clEnqueueReadBuffer(queue, d_priority.mem, CL_TRUE, 0, bufOutSize, totalPriorities.data(), 0, nullptr, nullptr);
        checkError(err, "reading totalPriorities");
        err = clEnqueueReadBuffer(queue, d_creditsOut.mem, CL_TRUE, 0, bufOutSize, totalCredits.data(), 0, nullptr, nullptr);
        checkError(err, "reading totalCredits");
        err = clEnqueueReadBuffer(queue, d_requiredOut.mem, CL_TRUE, 0, bufOutSize, requiredCredits.data(), 0, nullptr, nullptr);
        checkError(err, "reading requiredCredits");
    } catch (const std::exception&) {
        clReleaseKernel(kernel);
        throw;
    }

    clReleaseKernel(kernel);
}
