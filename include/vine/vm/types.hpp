#pragma once

#include <string>

#include "vine/vm/config.hpp"

namespace vine {

static constexpr size_t STACK_MAX = 1024;
static constexpr size_t OBJECTS_PER_CLASS = 1024;
static constexpr size_t MAX_OBJECT_SLOTS = 255;
static constexpr size_t MAX_HEAP_OBJECTS = size_t(1) << 24;
static constexpr size_t MAX_STACK_CAPACITY = size_t(1) << 24;
static constexpr uint64 DEFAULT_STEP_BUDGET = 10000000;

enum class MachineState : uint8
{
    RUNNING,
    HALTED,
    FAULTED
};

enum class Fault : uint8
{
    NONE,
    UNREACHABLE,
    ILLEGAL_INSTRUCTION,
    UNEXPECTED_END_OF_CODE,
    STACK_OVERFLOW,
    STACK_UNDERFLOW,
    DIVISION_BY_ZERO,
    TYPE_MISMATCH,
    OUT_OF_BOUNDS,
    INVALID_REFERENCE,
    OUT_OF_MEMORY,
    INVALID_SIZE_CLASS,
    INVALID_JUMP,
    STEP_BUDGET_EXHAUSTED,
    CANCELLED
};

struct ExecutionResult
{
    MachineState state = MachineState::RUNNING;
    Fault fault = Fault::NONE;
    size_t offset = 0; // offset of the faulting (or last) instruction
    uint64 steps = 0;
    std::string message;

    bool ok() const { return state == MachineState::HALTED; }
};

const char *faultToString(Fault fault);
const char *machineStateToString(MachineState state);

} // namespace vine
