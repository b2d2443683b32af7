#include "vine/vm/value.hpp"
#include "vine/vm/types.hpp"

#include <ostream>

namespace vine
{

Value::Value() : type(ValueType::RAW)
{
  as.raw = 0;
}

Value Value::makeRaw(uint64 bits)
{
  Value v;
  v.type = ValueType::RAW;
  v.as.raw = bits;
  return v;
}

Value Value::makeReference(Handle handle)
{
  Value v;
  v.type = ValueType::REFERENCE;
  v.as.handle = handle;
  return v;
}

Value Value::fromFloat(float value)
{
  uint32 bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  return makeRaw(static_cast<uint64>(bits));
}

Value Value::fromDouble(double value)
{
  uint64 bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  return makeRaw(bits);
}

const char *valueTypeToString(ValueType type)
{
  switch (type)
  {
  case ValueType::RAW:
    return "raw";
  case ValueType::REFERENCE:
    return "reference";
  }
  return "unknown";
}

std::string valueToString(const Value &value)
{
  if (value.isRaw())
  {
    return "Raw(" + std::to_string(value.asRaw()) + ")";
  }

  const Handle h = value.asHandle();
  return "Ref(#" + std::to_string(h.index) + ":" + std::to_string(h.generation) + ")";
}

std::ostream &operator<<(std::ostream &out, const Value &value)
{
  return out << valueToString(value);
}

const char *faultToString(Fault fault)
{
  switch (fault)
  {
  case Fault::NONE:
    return "none";
  case Fault::UNREACHABLE:
    return "unreachable";
  case Fault::ILLEGAL_INSTRUCTION:
    return "illegal instruction";
  case Fault::UNEXPECTED_END_OF_CODE:
    return "unexpected end of code";
  case Fault::STACK_OVERFLOW:
    return "stack overflow";
  case Fault::STACK_UNDERFLOW:
    return "stack underflow";
  case Fault::DIVISION_BY_ZERO:
    return "division by zero";
  case Fault::TYPE_MISMATCH:
    return "type mismatch";
  case Fault::OUT_OF_BOUNDS:
    return "out of bounds";
  case Fault::INVALID_REFERENCE:
    return "invalid reference";
  case Fault::OUT_OF_MEMORY:
    return "out of memory";
  case Fault::INVALID_SIZE_CLASS:
    return "invalid size class";
  case Fault::INVALID_JUMP:
    return "invalid jump";
  case Fault::STEP_BUDGET_EXHAUSTED:
    return "step budget exhausted";
  case Fault::CANCELLED:
    return "cancelled";
  }
  return "unknown";
}

const char *machineStateToString(MachineState state)
{
  switch (state)
  {
  case MachineState::RUNNING:
    return "running";
  case MachineState::HALTED:
    return "halted";
  case MachineState::FAULTED:
    return "faulted";
  }
  return "unknown";
}

} // namespace vine
