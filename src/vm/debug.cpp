#include "vine/vm/debug.hpp"
#include "vine/vm/decoder.hpp"

#include <cstdio>

namespace vine
{

void Debug::disassembleCode(const Context &ctx, const std::vector<uint8> &code, size_t entry, const char *name)
{
  ctx.log("== ", name, " ==");
  for (size_t offset = 0; offset < code.size();)
  {
    std::string line;
    size_t next = disassembleInstruction(code, offset, line);
    ctx.log(offset == entry ? "> " : "  ", line);
    offset = next;
  }
}

std::string Debug::disassemble(const std::vector<uint8> &code, size_t entry)
{
  std::string out;
  for (size_t offset = 0; offset < code.size();)
  {
    std::string line;
    size_t next = disassembleInstruction(code, offset, line);
    out += offset == entry ? "> " : "  ";
    out += line;
    out += '\n';
    offset = next;
  }
  return out;
}

std::string Debug::formatInstruction(const std::vector<uint8> &code, size_t offset)
{
  std::string line;
  disassembleInstruction(code, offset, line);
  return line;
}

size_t Debug::disassembleInstruction(const std::vector<uint8> &code, size_t offset, std::string &out)
{
  char buffer[64];

  Instruction ins;
  switch (decodeInstruction(code, offset, ins))
  {
  case DecodeStatus::OK:
    break;
  case DecodeStatus::END_OF_CODE:
    snprintf(buffer, sizeof(buffer), "%04zu <<end of code>>", offset);
    out = buffer;
    return offset + 1;
  case DecodeStatus::ILLEGAL_OPCODE:
    snprintf(buffer, sizeof(buffer), "%04zu <<illegal 0x%02x>>", offset, (unsigned)code[offset]);
    out = buffer;
    return offset + 1;
  case DecodeStatus::TRUNCATED:
    snprintf(buffer, sizeof(buffer), "%04zu %-16s <truncated>", offset, opcodeName(code[offset]));
    out = buffer;
    return code.size();
  }

  const char *name = opcodeName(ins.op);

  switch (ins.op)
  {
  case OP_JUMP:
  case OP_JUMP_IF_ZERO:
  case OP_JUMP_IF_NOT_ZERO:
    out = jumpInstruction(name, offset, ins.operand);
    break;

  case OP_PUSH_A:
  case OP_PUSH_B:
  case OP_CREATE_OBJECT:
  case OP_READ_PROPERTY:
  case OP_WRITE_PROPERTY:
    out = byteInstruction(name, offset, ins.operand);
    break;

  case OP_PUSH_IMMEDIATE:
    out = immediateInstruction(name, offset, ins.operand);
    break;

  default:
    out = simpleInstruction(name, offset);
    break;
  }

  return offset + ins.length;
}

std::string Debug::simpleInstruction(const char *name, size_t offset)
{
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%04zu %s", offset, name);
  return buffer;
}

std::string Debug::byteInstruction(const char *name, size_t offset, uint64 operand)
{
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%04zu %-16s %4llu", offset, name, (unsigned long long)operand);
  return buffer;
}

std::string Debug::jumpInstruction(const char *name, size_t offset, uint64 target)
{
  char buffer[64];
  snprintf(buffer, sizeof(buffer), "%04zu %-16s %4zu -> %llu", offset, name, offset, (unsigned long long)target);
  return buffer;
}

std::string Debug::immediateInstruction(const char *name, size_t offset, uint64 operand)
{
  char buffer[96];
  snprintf(buffer, sizeof(buffer), "%04zu %-16s %llu (0x%llx)", offset, name,
           (unsigned long long)operand, (unsigned long long)operand);
  return buffer;
}

} // namespace vine
