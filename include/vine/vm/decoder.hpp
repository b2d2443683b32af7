#pragma once

#include <vector>

#include "vine/vm/opcode.hpp"

namespace vine {

enum class DecodeStatus : uint8
{
    OK,
    END_OF_CODE,
    ILLEGAL_OPCODE,
    TRUNCATED
};

struct Instruction
{
    Opcode op = OP_NO_OPERATION;
    uint64 operand = 0; // little-endian immediate, zero when the opcode has none
    size_t length = 1;  // opcode byte + operand bytes
};

// Pure: reads the instruction starting at `offset` without touching any state.
DecodeStatus decodeInstruction(const uint8 *code, size_t size, size_t offset, Instruction &out);
DecodeStatus decodeInstruction(const std::vector<uint8> &code, size_t offset, Instruction &out);

const char *decodeStatusToString(DecodeStatus status);

} // namespace vine
