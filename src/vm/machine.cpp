/**
 * @file machine.cpp
 * @brief Fetch/decode/dispatch loop of the Vine interpreter
 *
 * Each step decodes exactly one instruction at `pc_`, runs it, then either
 * advances to the next offset, jumps, halts or faults. A fault records the
 * offset of the instruction that raised it and stops the machine for good.
 *
 * Object instructions take the object's lock through an ObjectGuard scoped to
 * the helper that needs it, so the lock is gone before the step returns.
 */
#include "vine/vm/machine.hpp"

#include "vine/vm/debug.hpp"

#include <cmath> // std::fmod
#include <cstdarg>
#include <cstdio>
#include <limits>

namespace vine
{

namespace
{

const Context &silentContext()
{
  static const Context ctx(false);
  return ctx;
}

} // namespace

Machine::Machine(const std::vector<uint8> &code, size_t entry,
                 const std::vector<Value> &aInputs, const std::vector<Value> &bInputs,
                 Heap &heap, const MachineConfig &config)
    : code_(code), aInputs_(aInputs), bInputs_(bInputs), heap_(heap), config_(config),
      ctx_(&silentContext()), stack_(config.stackCapacity), registerR_(Value::makeRaw(0)),
      pc_(entry), current_(entry), stopRequested_(false)
{
  result_.offset = entry;

  // entry == size is an empty program and halts on the first step
  if (entry > code_.size())
  {
    runtimeError(Fault::INVALID_JUMP, "entry offset %zu past end of code (%zu bytes)", entry, code_.size());
  }
}

void Machine::runtimeError(Fault fault, const char *format, ...)
{
  char buffer[256];
  va_list args;
  va_start(args, format);
  vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);

  result_.state = MachineState::FAULTED;
  result_.fault = fault;
  result_.offset = current_;
  result_.message = buffer;

  if (config_.trace)
  {
    ctx_->warn("fault at ", current_, ": ", faultToString(fault), " (", buffer, ")");
  }
}

void Machine::halt()
{
  result_.state = MachineState::HALTED;
  result_.offset = current_;
}

std::vector<Value> Machine::roots() const
{
  std::vector<Value> out(stack_.begin(), stack_.end());
  out.push_back(registerR_);
  return out;
}

// ============= STACK HELPERS =============

bool Machine::push(const Value &value)
{
  if (VINE_UNLIKELY(!stack_.push(value)))
  {
    runtimeError(Fault::STACK_OVERFLOW, "Stack overflow (capacity %zu)", stack_.capacity());
    return false;
  }
  return true;
}

bool Machine::pop(Value &out)
{
  if (VINE_UNLIKELY(!stack_.pop(out)))
  {
    runtimeError(Fault::STACK_UNDERFLOW, "Stack underflow");
    return false;
  }
  return true;
}

bool Machine::popRaw(uint64 &out)
{
  Value value;
  if (!pop(value))
    return false;

  if (!value.isRaw())
  {
    runtimeError(Fault::TYPE_MISMATCH, "expected a raw value, got %s", valueToString(value).c_str());
    return false;
  }
  out = value.asRaw();
  return true;
}

bool Machine::popReference(Handle &out)
{
  Value value;
  if (!pop(value))
    return false;

  if (!value.isReference())
  {
    runtimeError(Fault::TYPE_MISMATCH, "expected a reference, got %s", valueToString(value).c_str());
    return false;
  }
  out = value.asHandle();
  return true;
}

bool Machine::jumpTo(uint64 target, size_t &next)
{
  if (target > code_.size())
  {
    runtimeError(Fault::INVALID_JUMP, "jump target %llu past end of code (%zu bytes)",
                 (unsigned long long)target, code_.size());
    return false;
  }
  next = (size_t)target;
  return true;
}

// ============= ARITHMETIC =============

void Machine::binaryInteger(Opcode op)
{
  if (stack_.size() < 2)
  {
    runtimeError(Fault::STACK_UNDERFLOW, "Stack underflow: '%s' needs two operands", opcodeName(op));
    return;
  }

  uint64 b, a;
  if (!popRaw(b) || !popRaw(a))
    return;

  uint64 out = 0;
  switch (op)
  {
  case OP_ADD:
    out = a + b;
    break;
  case OP_SUBTRACT:
    out = a - b;
    break;
  case OP_MULTIPLY:
    out = a * b;
    break;
  case OP_DIVIDE:
  case OP_REMAINDER:
    if (b == 0)
    {
      runtimeError(Fault::DIVISION_BY_ZERO, "Division by zero");
      return;
    }
    out = op == OP_DIVIDE ? a / b : a % b;
    break;
  case OP_DIVIDE_SIGNED:
  case OP_REMAINDER_SIGNED:
  {
    if (b == 0)
    {
      runtimeError(Fault::DIVISION_BY_ZERO, "Division by zero");
      return;
    }
    int64 sa = static_cast<int64>(a);
    int64 sb = static_cast<int64>(b);
    // INT64_MIN / -1 overflows in hardware; wrap instead
    if (sa == std::numeric_limits<int64>::min() && sb == -1)
    {
      out = op == OP_DIVIDE_SIGNED ? a : 0;
      break;
    }
    out = static_cast<uint64>(op == OP_DIVIDE_SIGNED ? sa / sb : sa % sb);
    break;
  }
  default:
    runtimeError(Fault::ILLEGAL_INSTRUCTION, "'%s' is not an integer operator", opcodeName(op));
    return;
  }

  push(Value::makeRaw(out));
}

void Machine::binaryFloat(Opcode op)
{
  if (stack_.size() < 2)
  {
    runtimeError(Fault::STACK_UNDERFLOW, "Stack underflow: '%s' needs two operands", opcodeName(op));
    return;
  }

  uint64 rb, ra;
  if (!popRaw(rb) || !popRaw(ra))
    return;

  double a = Value::makeRaw(ra).asDouble();
  double b = Value::makeRaw(rb).asDouble();
  double out = 0.0;

  switch (op)
  {
  case OP_ADD_F64:
    out = a + b;
    break;
  case OP_SUBTRACT_F64:
    out = a - b;
    break;
  case OP_MULTIPLY_F64:
    out = a * b;
    break;
  case OP_DIVIDE_F64:
  case OP_REMAINDER_F64:
    if (b == 0.0)
    {
      runtimeError(Fault::DIVISION_BY_ZERO, "Division by zero");
      return;
    }
    out = op == OP_DIVIDE_F64 ? a / b : std::fmod(a, b);
    break;
  default:
    runtimeError(Fault::ILLEGAL_INSTRUCTION, "'%s' is not a float operator", opcodeName(op));
    return;
  }

  push(Value::fromDouble(out));
}

// ============= OBJECTS =============

void Machine::heapError(const HeapError &e, Handle handle)
{
  switch (e.code())
  {
  case HeapErrorCode::INVALID_HANDLE:
    runtimeError(Fault::INVALID_REFERENCE, "invalid reference #%u:%u", handle.index, handle.generation);
    break;
  case HeapErrorCode::OUT_OF_BOUNDS:
    runtimeError(Fault::OUT_OF_BOUNDS, "%s", e.what());
    break;
  case HeapErrorCode::OUT_OF_MEMORY:
    runtimeError(Fault::OUT_OF_MEMORY, "%s", e.what());
    break;
  case HeapErrorCode::INVALID_SIZE_CLASS:
    runtimeError(Fault::INVALID_SIZE_CLASS, "%s", e.what());
    break;
  default:
    runtimeError(Fault::INVALID_REFERENCE, "heap error: %s", e.what());
    break;
  }
}

void Machine::createObject(uint64 sizeClass)
{
  if (stack_.full())
  {
    runtimeError(Fault::STACK_OVERFLOW, "Stack overflow (capacity %zu)", stack_.capacity());
    return;
  }

  Handle handle{};
  HeapErrorCode code = heap_.tryAllocate((size_t)sizeClass, handle);
  switch (code)
  {
  case HeapErrorCode::OK:
    push(Value::makeReference(handle));
    return;
  case HeapErrorCode::INVALID_SIZE_CLASS:
    runtimeError(Fault::INVALID_SIZE_CLASS, "size class %llu out of range (%zu classes)",
                 (unsigned long long)sizeClass, heap_.sizeClassCount());
    return;
  case HeapErrorCode::OUT_OF_MEMORY:
    runtimeError(Fault::OUT_OF_MEMORY, "size class %llu exhausted", (unsigned long long)sizeClass);
    return;
  default:
    runtimeError(Fault::OUT_OF_MEMORY, "allocation failed: %s", heapErrorToString(code));
    return;
  }
}

void Machine::readProperty(uint64 slot)
{
  Handle handle{};
  if (!popReference(handle))
    return;

  Value value;
  try
  {
    ObjectGuard guard = heap_.lock(handle);
    if (slot >= guard.size())
    {
      runtimeError(Fault::OUT_OF_BOUNDS, "slot %llu out of bounds (size=%zu)", (unsigned long long)slot, guard.size());
      return;
    }
    value = guard[(size_t)slot];
  }
  catch (const HeapError &e)
  {
    heapError(e, handle);
    return;
  }

  push(value);
}

void Machine::writeProperty(uint64 slot)
{
  Value value;
  Handle handle{};
  if (!pop(value) || !popReference(handle))
    return;

  try
  {
    ObjectGuard guard = heap_.lock(handle);
    if (slot >= guard.size())
    {
      runtimeError(Fault::OUT_OF_BOUNDS, "slot %llu out of bounds (size=%zu)", (unsigned long long)slot, guard.size());
      return;
    }
    guard[(size_t)slot] = value;
  }
  catch (const HeapError &e)
  {
    heapError(e, handle);
  }
}

void Machine::objectSize()
{
  Handle handle{};
  if (!popReference(handle))
    return;

  size_t size = 0;
  try
  {
    ObjectGuard guard = heap_.lock(handle);
    size = guard.size();
  }
  catch (const HeapError &e)
  {
    heapError(e, handle);
    return;
  }

  push(Value::fromUnsigned(size));
}

void Machine::retainObject()
{
  Handle handle{};
  if (!popReference(handle))
    return;

  try
  {
    heap_.retain(handle);
  }
  catch (const HeapError &e)
  {
    heapError(e, handle);
  }
}

void Machine::releaseObject()
{
  Handle handle{};
  if (!popReference(handle))
    return;

  try
  {
    heap_.release(handle);
  }
  catch (const HeapError &e)
  {
    heapError(e, handle);
  }
}

// ============= DISPATCH =============

void Machine::dispatch(const Instruction &ins, size_t &next)
{
  switch (ins.op)
  {
    // ========== CONTROL ==========
  case OP_UNREACHABLE:
    runtimeError(Fault::UNREACHABLE, "Reached unreachable code");
    return;
  case OP_NO_OPERATION:
    return;
  case OP_HALT:
    halt();
    return;
  case OP_JUMP:
    jumpTo(ins.operand, next);
    return;
  case OP_JUMP_IF_ZERO:
  case OP_JUMP_IF_NOT_ZERO:
  {
    uint64 cond;
    if (!popRaw(cond))
      return;
    bool taken = ins.op == OP_JUMP_IF_ZERO ? cond == 0 : cond != 0;
    if (taken)
      jumpTo(ins.operand, next);
    return;
  }

    // ========== STACK ==========
  case OP_PUSH_A:
  case OP_PUSH_B:
  {
    const std::vector<Value> &inputs = ins.op == OP_PUSH_A ? aInputs_ : bInputs_;
    if (ins.operand >= inputs.size())
    {
      runtimeError(Fault::OUT_OF_BOUNDS, "%s input %llu out of bounds (%zu inputs)",
                   ins.op == OP_PUSH_A ? "A" : "B", (unsigned long long)ins.operand, inputs.size());
      return;
    }
    push(inputs[(size_t)ins.operand]);
    return;
  }
  case OP_PUSH_R:
    push(registerR_);
    return;
  case OP_POP:
  {
    Value dropped;
    pop(dropped);
    return;
  }
  case OP_POP_INTO_R:
  {
    Value value;
    if (pop(value))
      registerR_ = value;
    return;
  }
  case OP_DUP:
  {
    Value top;
    if (!stack_.peek(0, top))
    {
      runtimeError(Fault::STACK_UNDERFLOW, "Stack underflow");
      return;
    }
    push(top);
    return;
  }
  case OP_SWAP:
    if (!stack_.swapTop())
      runtimeError(Fault::STACK_UNDERFLOW, "Stack underflow: 'swap' needs two operands");
    return;
  case OP_PUSH_IMMEDIATE:
    push(Value::makeRaw(ins.operand));
    return;
  case OP_CLEAR:
    stack_.clear();
    return;

    // ========== ARITHMETIC ==========
  case OP_ADD:
  case OP_SUBTRACT:
  case OP_MULTIPLY:
  case OP_DIVIDE:
  case OP_REMAINDER:
  case OP_DIVIDE_SIGNED:
  case OP_REMAINDER_SIGNED:
    binaryInteger(ins.op);
    return;

  case OP_ADD_F64:
  case OP_SUBTRACT_F64:
  case OP_MULTIPLY_F64:
  case OP_DIVIDE_F64:
  case OP_REMAINDER_F64:
    binaryFloat(ins.op);
    return;

    // ========== OBJECTS ==========
  case OP_CREATE_OBJECT:
    createObject(ins.operand);
    return;
  case OP_READ_PROPERTY:
    readProperty(ins.operand);
    return;
  case OP_WRITE_PROPERTY:
    writeProperty(ins.operand);
    return;
  case OP_OBJECT_SIZE:
    objectSize();
    return;
  case OP_RETAIN:
    retainObject();
    return;
  case OP_RELEASE:
    releaseObject();
    return;

    // ========== I/O ==========
  case OP_PRINT:
  {
    Value top;
    if (!stack_.peek(0, top))
    {
      runtimeError(Fault::STACK_UNDERFLOW, "Stack underflow: nothing to print");
      return;
    }
    ctx_->log(valueToString(top));
    return;
  }
  }

  runtimeError(Fault::ILLEGAL_INSTRUCTION, "Unknown opcode 0x%02x", (unsigned)ins.op);
}

MachineState Machine::step()
{
  if (result_.state != MachineState::RUNNING)
    return result_.state;

  current_ = pc_;

  if (stopRequested_.load(std::memory_order_relaxed))
  {
    runtimeError(Fault::CANCELLED, "Execution cancelled");
    return result_.state;
  }

  if (pc_ == code_.size())
  {
    halt();
    return result_.state;
  }

  if (config_.stepBudget != 0 && result_.steps >= config_.stepBudget)
  {
    runtimeError(Fault::STEP_BUDGET_EXHAUSTED, "Step budget of %llu exhausted",
                 (unsigned long long)config_.stepBudget);
    return result_.state;
  }

  Instruction ins;
  switch (decodeInstruction(code_, pc_, ins))
  {
  case DecodeStatus::OK:
    break;
  case DecodeStatus::ILLEGAL_OPCODE:
    runtimeError(Fault::ILLEGAL_INSTRUCTION, "Illegal opcode 0x%02x", (unsigned)code_[pc_]);
    return result_.state;
  case DecodeStatus::TRUNCATED:
    runtimeError(Fault::UNEXPECTED_END_OF_CODE, "'%s' is missing operand bytes", opcodeName(code_[pc_]));
    return result_.state;
  case DecodeStatus::END_OF_CODE:
    halt();
    return result_.state;
  }

  if (config_.trace)
  {
    ctx_->log(Debug::formatInstruction(code_, pc_), "    depth=", stack_.size());
  }

  result_.steps++;
  size_t next = pc_ + ins.length;
  dispatch(ins, next);

  if (result_.state == MachineState::RUNNING)
    pc_ = next;

  return result_.state;
}

ExecutionResult Machine::execute()
{
  while (step() == MachineState::RUNNING)
  {
  }
  return result_;
}

} // namespace vine
