#include "vine/asm/assembler.hpp"
#include "vine/bytecode/writer.hpp"
#include "vine/vm/opcode.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <unordered_map>

namespace vine
{

namespace
{

struct Fixup
{
  size_t operandOffset;
  std::string label;
  size_t line;
};

bool isLabelName(const std::string &text)
{
  if (text.empty() || !(std::isalpha((unsigned char)text[0]) || text[0] == '_'))
    return false;

  for (char c : text)
  {
    if (!(std::isalnum((unsigned char)c) || c == '_' || c == '.'))
      return false;
  }
  return true;
}

bool isHex(const std::string &text)
{
  return text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
}

bool looksLikeFloat(const std::string &text)
{
  if (isHex(text))
    return false;
  return text.find_first_of(".eE") != std::string::npos;
}

// Decimal or 0x-prefixed hexadecimal, no sign.
bool parseUnsigned(const std::string &text, uint64 &out)
{
  if (text.empty() || !std::isdigit((unsigned char)text[0]))
    return false;

  const char *begin = text.c_str();
  char *end = nullptr;
  errno = 0;
  unsigned long long value = isHex(text) ? std::strtoull(begin + 2, &end, 16) : std::strtoull(begin, &end, 10);
  if (errno == ERANGE || end == begin || *end != '\0')
    return false;

  out = (uint64)value;
  return true;
}

// push_imm payload: unsigned, negative (two's complement) or f64 bits.
bool parseImmediate(const std::string &text, uint64 &out, std::string &error)
{
  const char *begin = text.c_str();
  char *end = nullptr;

  if (looksLikeFloat(text))
  {
    errno = 0;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0')
    {
      error = "invalid float literal '" + text + "'";
      return false;
    }
    std::memcpy(&out, &value, sizeof(out));
    return true;
  }

  if (!text.empty() && text[0] == '-')
  {
    errno = 0;
    long long value = std::strtoll(begin, &end, 10);
    if (errno == ERANGE || end == begin || *end != '\0')
    {
      error = "invalid signed literal '" + text + "'";
      return false;
    }
    out = (uint64)(int64)value;
    return true;
  }

  if (!parseUnsigned(text, out))
  {
    error = "invalid integer literal '" + text + "'";
    return false;
  }
  return true;
}

std::vector<std::string> splitTokens(const std::string &line)
{
  std::string code = line.substr(0, line.find_first_of(";#"));
  std::vector<std::string> out;
  std::istringstream input(code);
  std::string token;
  while (input >> token)
  {
    out.push_back(token);
  }
  return out;
}

class Assembler
{
public:
  explicit Assembler(const std::string &source) : source_(source) {}

  AssemblyResult run()
  {
    std::istringstream input(source_);
    std::string text;
    while (std::getline(input, text))
    {
      line_++;
      parseLine(splitTokens(text));
    }

    patchLabels();
    resolveEntry();

    result_.code = writer_.release();
    result_.ok = result_.errors.empty();
    return result_;
  }

private:
  void error(const std::string &message) { result_.errors.push_back({line_, message}); }

  void parseLine(const std::vector<std::string> &tokens)
  {
    size_t first = 0;

    // leading "name:" defines a label at the current offset
    if (!tokens.empty() && tokens[0].size() > 1 && tokens[0].back() == ':')
    {
      std::string name = tokens[0].substr(0, tokens[0].size() - 1);
      if (!isLabelName(name))
      {
        error("invalid label name '" + name + "'");
      }
      else if (!labels_.emplace(name, writer_.offset()).second)
      {
        error("duplicate label '" + name + "'");
      }
      first = 1;
    }

    if (first >= tokens.size())
      return;

    const std::string &head = tokens[first];
    if (head.size() > 1 && head[0] == '.')
    {
      parseDirective(tokens, first);
      return;
    }
    parseInstruction(tokens, first);
  }

  void parseDirective(const std::vector<std::string> &tokens, size_t first)
  {
    const std::string &name = tokens[first];
    if (name != ".entry")
    {
      error("unknown directive '" + name + "'");
      return;
    }
    if (tokens.size() != first + 2)
    {
      error(".entry expects exactly one label or offset");
      return;
    }
    if (hasEntry_)
    {
      error("duplicate .entry");
      return;
    }

    hasEntry_ = true;
    entryLine_ = line_;
    entryTarget_ = tokens[first + 1];
  }

  void parseInstruction(const std::vector<std::string> &tokens, size_t first)
  {
    const std::string &mnemonic = tokens[first];
    std::optional<Opcode> op = opcodeFromName(mnemonic);
    if (!op)
    {
      error("unknown instruction '" + mnemonic + "'");
      return;
    }

    const OpcodeInfo *info = opcodeInfo(*op);
    size_t operands = tokens.size() - first - 1;

    if (info->operandBytes == 0)
    {
      if (operands != 0)
      {
        error(std::string("'") + info->name + "' takes no operand");
        return;
      }
      writer_.emit(*op);
      return;
    }

    if (operands != 1)
    {
      error(std::string("'") + info->name + "' expects exactly one operand");
      return;
    }

    const std::string &operand = tokens[first + 1];
    uint64 value = 0;
    std::string message;

    if (info->operandBytes == 4 && isLabelName(operand))
    {
      size_t at = writer_.emitJump(*op);
      fixups_.push_back({at, operand, line_});
      return;
    }

    if (*op == OP_PUSH_IMMEDIATE)
    {
      if (!parseImmediate(operand, value, message))
      {
        error(message);
        return;
      }
    }
    else if (!parseUnsigned(operand, value))
    {
      error(std::string("'") + info->name + "' expects a non-negative integer, got '" + operand + "'");
      return;
    }

    if (!writer_.emitInstruction(*op, value, message))
    {
      error(message);
    }
  }

  void patchLabels()
  {
    for (const Fixup &fixup : fixups_)
    {
      auto it = labels_.find(fixup.label);
      if (it == labels_.end())
      {
        result_.errors.push_back({fixup.line, "undefined label '" + fixup.label + "'"});
        continue;
      }
      writer_.patchJump(fixup.operandOffset, (uint32)it->second);
    }
  }

  void resolveEntry()
  {
    if (!hasEntry_)
      return;

    uint64 entry = 0;
    auto it = labels_.find(entryTarget_);
    if (it != labels_.end())
    {
      entry = it->second;
    }
    else if (!parseUnsigned(entryTarget_, entry))
    {
      result_.errors.push_back({entryLine_, "undefined entry label '" + entryTarget_ + "'"});
      return;
    }

    if (entry > writer_.offset())
    {
      result_.errors.push_back({entryLine_, "entry offset " + std::to_string(entry) + " past end of code"});
      return;
    }
    result_.entry = (size_t)entry;
  }

  const std::string &source_;
  size_t line_ = 0;
  BytecodeWriter writer_;
  std::unordered_map<std::string, size_t> labels_;
  std::vector<Fixup> fixups_;
  bool hasEntry_ = false;
  size_t entryLine_ = 0;
  std::string entryTarget_;
  AssemblyResult result_;
};

} // namespace

AssemblyResult assemble(const std::string &source)
{
  Assembler assembler(source);
  return assembler.run();
}

} // namespace vine
