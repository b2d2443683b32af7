#pragma once

#include <string>
#include <vector>

#include "vine/core/context.hpp"
#include "vine/vm/config.hpp"

namespace vine {

class Debug
{
public:
    // Whole buffer, one line per instruction, prefixed by a "== name ==" header.
    static void disassembleCode(const Context &ctx, const std::vector<uint8> &code, size_t entry, const char *name);
    static std::string disassemble(const std::vector<uint8> &code, size_t entry);

    // One instruction at `offset`. Returns the offset of the next one; a
    // malformed instruction consumes the rest of the buffer.
    static size_t disassembleInstruction(const std::vector<uint8> &code, size_t offset, std::string &out);
    static std::string formatInstruction(const std::vector<uint8> &code, size_t offset);

private:
    static std::string simpleInstruction(const char *name, size_t offset);
    static std::string byteInstruction(const char *name, size_t offset, uint64 operand);
    static std::string jumpInstruction(const char *name, size_t offset, uint64 target);
    static std::string immediateInstruction(const char *name, size_t offset, uint64 operand);
};

} // namespace vine
