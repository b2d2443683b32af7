#include "vine/vm/stack.hpp"

#include <stdexcept>
#include <string>

namespace vine
{

namespace
{

size_t checkedCapacity(size_t capacity)
{
  if (capacity > MAX_STACK_CAPACITY)
  {
    throw std::length_error("stack capacity " + std::to_string(capacity) + " exceeds " +
                            std::to_string(MAX_STACK_CAPACITY));
  }
  return capacity;
}

} // namespace

Stack::Stack(size_t capacity)
    : values_(new Value[checkedCapacity(capacity)]), capacity_(capacity), top_(0)
{
}

bool Stack::push(const Value &value)
{
  if (top_ >= capacity_)
  {
    return false;
  }
  values_[top_++] = value;
  return true;
}

bool Stack::pop(Value &out)
{
  if (top_ == 0)
  {
    return false;
  }
  out = values_[--top_];
  return true;
}

// distance 0 is the top
bool Stack::peek(size_t distance, Value &out) const
{
  if (distance >= top_)
  {
    return false;
  }
  out = values_[top_ - 1 - distance];
  return true;
}

bool Stack::swapTop()
{
  if (top_ < 2)
  {
    return false;
  }
  Value tmp = values_[top_ - 1];
  values_[top_ - 1] = values_[top_ - 2];
  values_[top_ - 2] = tmp;
  return true;
}

} // namespace vine
