#pragma once

#include <atomic>
#include <vector>

#include "vine/core/context.hpp"
#include "vine/vm/decoder.hpp"
#include "vine/vm/heap.hpp"
#include "vine/vm/stack.hpp"
#include "vine/vm/types.hpp"
#include "vine/vm/value.hpp"

namespace vine {

struct MachineConfig
{
    size_t stackCapacity = STACK_MAX;
    uint64 stepBudget = DEFAULT_STEP_BUDGET; // 0 = unlimited
    bool trace = false;
};

/**
 * @brief Single-threaded bytecode interpreter over a shared Heap.
 *
 * The machine copies its code and inputs at construction and borrows the heap,
 * which must outlive it. Faults are terminal and captured in the result; they
 * never escape execute() as exceptions.
 */
class Machine
{
public:
    Machine(const std::vector<uint8> &code, size_t entry,
            const std::vector<Value> &aInputs, const std::vector<Value> &bInputs,
            Heap &heap, const MachineConfig &config = MachineConfig());

    Machine(const Machine &) = delete;
    Machine &operator=(const Machine &) = delete;

    // Logging target for print and tracing. Defaults to a silent context.
    void setContext(const Context &ctx) { ctx_ = &ctx; }

    MachineState step();
    ExecutionResult execute();

    // Safe from any thread; the next step faults CANCELLED.
    void requestStop() { stopRequested_.store(true, std::memory_order_relaxed); }

    const Stack &stack() const { return stack_; }
    const Value &registerR() const { return registerR_; }
    size_t pc() const { return pc_; }
    MachineState state() const { return result_.state; }
    const ExecutionResult &result() const { return result_; }

    // Stack contents plus R, for Heap::collect.
    std::vector<Value> roots() const;

private:
    void runtimeError(Fault fault, const char *format, ...);
    void halt();

    void dispatch(const Instruction &ins, size_t &next);

    bool push(const Value &value);
    bool pop(Value &out);
    bool popRaw(uint64 &out);
    bool popReference(Handle &out);
    bool jumpTo(uint64 target, size_t &next);

    void binaryInteger(Opcode op);
    void binaryFloat(Opcode op);

    void createObject(uint64 sizeClass);
    void readProperty(uint64 slot);
    void writeProperty(uint64 slot);
    void objectSize();
    void retainObject();
    void releaseObject();
    void heapError(const HeapError &e, Handle handle);

    std::vector<uint8> code_;
    std::vector<Value> aInputs_;
    std::vector<Value> bInputs_;
    Heap &heap_;
    MachineConfig config_;
    const Context *ctx_;

    Stack stack_;
    Value registerR_;
    size_t pc_;
    size_t current_; // offset of the instruction being executed
    ExecutionResult result_;
    std::atomic<bool> stopRequested_;
};

} // namespace vine
