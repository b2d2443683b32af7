#pragma once

#include <string>
#include <utility>
#include <vector>

#include "vine/vm/opcode.hpp"

namespace vine {

// Emits Vine bytecode into a growable buffer. Operands go out little-endian.
class BytecodeWriter
{
public:
    BytecodeWriter() = default;

    size_t offset() const { return code_.size(); }
    const std::vector<uint8> &code() const { return code_; }
    std::vector<uint8> release() { return std::move(code_); }

    void writeU8(uint8 value);
    void writeU32(uint32 value);
    void writeU64(uint64 value);

    void emit(Opcode op);
    void emitByte(Opcode op, uint8 operand);
    void emitImmediate(uint64 value);
    void emitSigned(int64 value);
    void emitDouble(double value);

    // Emits a jump with a placeholder target; returns the operand offset for patchJump.
    size_t emitJump(Opcode op, uint32 target = 0);
    void patchJump(size_t operandOffset, uint32 target);

    // Appends `op` with its operand, checking the width against the opcode table.
    bool emitInstruction(Opcode op, uint64 operand, std::string &error);

private:
    std::vector<uint8> code_;
};

} // namespace vine
