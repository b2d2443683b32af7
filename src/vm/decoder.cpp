#include "vine/vm/decoder.hpp"

namespace vine
{

DecodeStatus decodeInstruction(const uint8 *code, size_t size, size_t offset, Instruction &out)
{
  if (offset >= size)
  {
    return DecodeStatus::END_OF_CODE;
  }

  const OpcodeInfo *info = opcodeInfo(code[offset]);
  if (!info)
  {
    return DecodeStatus::ILLEGAL_OPCODE;
  }

  const size_t width = info->operandBytes;
  if (size - offset - 1 < width)
  {
    return DecodeStatus::TRUNCATED;
  }

  uint64 operand = 0;
  for (size_t i = 0; i < width; i++)
  {
    operand |= (uint64)code[offset + 1 + i] << (8u * i);
  }

  out.op = info->op;
  out.operand = operand;
  out.length = 1 + width;
  return DecodeStatus::OK;
}

DecodeStatus decodeInstruction(const std::vector<uint8> &code, size_t offset, Instruction &out)
{
  return decodeInstruction(code.data(), code.size(), offset, out);
}

const char *decodeStatusToString(DecodeStatus status)
{
  switch (status)
  {
  case DecodeStatus::OK:
    return "ok";
  case DecodeStatus::END_OF_CODE:
    return "end of code";
  case DecodeStatus::ILLEGAL_OPCODE:
    return "illegal opcode";
  case DecodeStatus::TRUNCATED:
    return "truncated";
  }
  return "unknown";
}

} // namespace vine
