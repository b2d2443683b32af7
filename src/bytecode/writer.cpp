#include "vine/bytecode/writer.hpp"

#include <cstring>
#include <limits>

namespace vine
{

void BytecodeWriter::writeU8(uint8 value)
{
  code_.push_back(value);
}

void BytecodeWriter::writeU32(uint32 value)
{
  code_.push_back((uint8)(value & 0xFFu));
  code_.push_back((uint8)((value >> 8u) & 0xFFu));
  code_.push_back((uint8)((value >> 16u) & 0xFFu));
  code_.push_back((uint8)((value >> 24u) & 0xFFu));
}

void BytecodeWriter::writeU64(uint64 value)
{
  for (unsigned i = 0; i < 8; i++)
  {
    code_.push_back((uint8)((value >> (8u * i)) & 0xFFu));
  }
}

void BytecodeWriter::emit(Opcode op)
{
  writeU8(op);
}

void BytecodeWriter::emitByte(Opcode op, uint8 operand)
{
  writeU8(op);
  writeU8(operand);
}

void BytecodeWriter::emitImmediate(uint64 value)
{
  writeU8(OP_PUSH_IMMEDIATE);
  writeU64(value);
}

void BytecodeWriter::emitSigned(int64 value)
{
  emitImmediate((uint64)value);
}

void BytecodeWriter::emitDouble(double value)
{
  uint64 bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));
  emitImmediate(bits);
}

size_t BytecodeWriter::emitJump(Opcode op, uint32 target)
{
  writeU8(op);
  size_t operandOffset = code_.size();
  writeU32(target);
  return operandOffset;
}

void BytecodeWriter::patchJump(size_t operandOffset, uint32 target)
{
  code_[operandOffset] = (uint8)(target & 0xFFu);
  code_[operandOffset + 1] = (uint8)((target >> 8u) & 0xFFu);
  code_[operandOffset + 2] = (uint8)((target >> 16u) & 0xFFu);
  code_[operandOffset + 3] = (uint8)((target >> 24u) & 0xFFu);
}

bool BytecodeWriter::emitInstruction(Opcode op, uint64 operand, std::string &error)
{
  const OpcodeInfo *info = opcodeInfo(op);
  if (!info)
  {
    error = "unknown opcode";
    return false;
  }

  switch (info->operandBytes)
  {
  case 0:
    emit(op);
    return true;
  case 1:
    if (operand > std::numeric_limits<uint8>::max())
    {
      error = std::string("operand of '") + info->name + "' must fit in one byte";
      return false;
    }
    emitByte(op, (uint8)operand);
    return true;
  case 4:
    if (operand > std::numeric_limits<uint32>::max())
    {
      error = std::string("operand of '") + info->name + "' must fit in 32 bits";
      return false;
    }
    emitJump(op, (uint32)operand);
    return true;
  case 8:
    writeU8(op);
    writeU64(operand);
    return true;
  }

  error = std::string("unsupported operand width for '") + info->name + "'";
  return false;
}

} // namespace vine
