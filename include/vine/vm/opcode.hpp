#pragma once

#include <optional>
#include <string>

#include "vine/vm/config.hpp"

namespace vine {

// Wire format: numbers are stable once assigned.
enum Opcode : uint8
{
    // Control (0x00-0x0A)
    OP_UNREACHABLE = 0x00,
    OP_NO_OPERATION = 0x01,
    OP_HALT = 0x02,
    OP_JUMP = 0x08,             // u32 absolute target
    OP_JUMP_IF_ZERO = 0x09,     // u32 absolute target
    OP_JUMP_IF_NOT_ZERO = 0x0A, // u32 absolute target

    // Stack (0x10-0x18)
    OP_PUSH_A = 0x10, // u8 index into the A-inputs
    OP_PUSH_B = 0x11, // u8 index into the B-inputs
    OP_PUSH_R = 0x12,
    OP_POP = 0x13,
    OP_POP_INTO_R = 0x14,
    OP_DUP = 0x15,
    OP_SWAP = 0x16,
    OP_PUSH_IMMEDIATE = 0x17, // u64 payload
    OP_CLEAR = 0x18,

    // Integer arithmetic (0x20-0x26)
    OP_ADD = 0x20,
    OP_SUBTRACT = 0x21,
    OP_MULTIPLY = 0x22,
    OP_DIVIDE = 0x23,
    OP_REMAINDER = 0x24,
    OP_DIVIDE_SIGNED = 0x25,
    OP_REMAINDER_SIGNED = 0x26,

    // Float arithmetic, f64 bit patterns (0x28-0x2C)
    OP_ADD_F64 = 0x28,
    OP_SUBTRACT_F64 = 0x29,
    OP_MULTIPLY_F64 = 0x2A,
    OP_DIVIDE_F64 = 0x2B,
    OP_REMAINDER_F64 = 0x2C,

    // Objects (0x30-0x35)
    OP_CREATE_OBJECT = 0x30,  // u8 size class index
    OP_READ_PROPERTY = 0x31,  // u8 slot
    OP_WRITE_PROPERTY = 0x32, // u8 slot
    OP_OBJECT_SIZE = 0x33,
    OP_RETAIN = 0x34,
    OP_RELEASE = 0x35,

    // I/O (0x40)
    OP_PRINT = 0x40,
};

struct OpcodeInfo
{
    Opcode op;
    const char *name;
    const char *altName; // nullptr when there is none
    uint8 operandBytes;
};

// nullptr for bytes that are not opcodes.
const OpcodeInfo *opcodeInfo(uint8 byte);
const char *opcodeName(uint8 byte);

// Looks up mnemonics and alternative symbols ("noop", "_", "+", ...).
std::optional<Opcode> opcodeFromName(const std::string &name);

} // namespace vine
