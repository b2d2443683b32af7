#include "vine/vm/opcode.hpp"

#include <array>
#include <unordered_map>

namespace vine
{

namespace
{

const OpcodeInfo kOpcodes[] = {
    // ========== CONTROL ==========
    {OP_UNREACHABLE, "unreachable", "!!!", 0},
    {OP_NO_OPERATION, "noop", "_", 0},
    {OP_HALT, "halt", "ret", 0},
    {OP_JUMP, "jump", "jmp", 4},
    {OP_JUMP_IF_ZERO, "jump_if_zero", "jz", 4},
    {OP_JUMP_IF_NOT_ZERO, "jump_if_not_zero", "jnz", 4},

    // ========== STACK ==========
    {OP_PUSH_A, "push_a", nullptr, 1},
    {OP_PUSH_B, "push_b", nullptr, 1},
    {OP_PUSH_R, "push_r", nullptr, 0},
    {OP_POP, "pop", nullptr, 0},
    {OP_POP_INTO_R, "pop_into_r", nullptr, 0},
    {OP_DUP, "dup", nullptr, 0},
    {OP_SWAP, "swap", nullptr, 0},
    {OP_PUSH_IMMEDIATE, "push_imm", nullptr, 8},
    {OP_CLEAR, "clear", nullptr, 0},

    // ========== ARITHMETIC ==========
    {OP_ADD, "add", "+", 0},
    {OP_SUBTRACT, "sub", "-", 0},
    {OP_MULTIPLY, "mul", "*", 0},
    {OP_DIVIDE, "div_u", "/u", 0},
    {OP_REMAINDER, "rem_u", "%u", 0},
    {OP_DIVIDE_SIGNED, "div_s", "/s", 0},
    {OP_REMAINDER_SIGNED, "rem_s", "%s", 0},
    {OP_ADD_F64, "add_f", nullptr, 0},
    {OP_SUBTRACT_F64, "sub_f", nullptr, 0},
    {OP_MULTIPLY_F64, "mul_f", nullptr, 0},
    {OP_DIVIDE_F64, "div_f", nullptr, 0},
    {OP_REMAINDER_F64, "rem_f", nullptr, 0},

    // ========== OBJECTS ==========
    {OP_CREATE_OBJECT, "alloc", nullptr, 1},
    {OP_READ_PROPERTY, "prop", ".", 1},
    {OP_WRITE_PROPERTY, "set_prop", nullptr, 1},
    {OP_OBJECT_SIZE, "size_of", nullptr, 0},
    {OP_RETAIN, "retain", nullptr, 0},
    {OP_RELEASE, "release", nullptr, 0},

    // ========== I/O ==========
    {OP_PRINT, "print", nullptr, 0},
};

// Byte -> info table, built once.
const std::array<const OpcodeInfo *, 256> &byteTable()
{
  static const std::array<const OpcodeInfo *, 256> table = []()
  {
    std::array<const OpcodeInfo *, 256> out{};
    for (const OpcodeInfo &info : kOpcodes)
    {
      out[info.op] = &info;
    }
    return out;
  }();
  return table;
}

const std::unordered_map<std::string, Opcode> &nameTable()
{
  static const std::unordered_map<std::string, Opcode> table = []()
  {
    std::unordered_map<std::string, Opcode> out;
    for (const OpcodeInfo &info : kOpcodes)
    {
      out.emplace(info.name, info.op);
      if (info.altName)
      {
        out.emplace(info.altName, info.op);
      }
    }
    return out;
  }();
  return table;
}

} // namespace

const OpcodeInfo *opcodeInfo(uint8 byte)
{
  return byteTable()[byte];
}

const char *opcodeName(uint8 byte)
{
  const OpcodeInfo *info = opcodeInfo(byte);
  return info ? info->name : "<illegal>";
}

std::optional<Opcode> opcodeFromName(const std::string &name)
{
  const auto &table = nameTable();
  auto it = table.find(name);
  if (it == table.end())
  {
    return std::nullopt;
  }
  return it->second;
}

} // namespace vine
