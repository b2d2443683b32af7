#pragma once

#include <memory>

#include "vine/vm/types.hpp"
#include "vine/vm/value.hpp"

namespace vine {

// Fixed-capacity operand stack. Never grows; push/pop report overflow and
// underflow instead of truncating. Capacities above MAX_STACK_CAPACITY throw
// std::length_error.
class Stack
{
public:
    explicit Stack(size_t capacity = STACK_MAX);

    bool push(const Value &value);
    bool pop(Value &out);
    bool peek(size_t distance, Value &out) const;
    bool swapTop();
    void clear() { top_ = 0; }

    size_t size() const { return top_; }
    size_t capacity() const { return capacity_; }
    bool empty() const { return top_ == 0; }
    bool full() const { return top_ == capacity_; }

    // Bottom-up access, 0 is the first pushed value.
    const Value &at(size_t index) const { return values_[index]; }
    const Value *begin() const { return values_.get(); }
    const Value *end() const { return values_.get() + top_; }

private:
    std::unique_ptr<Value[]> values_;
    size_t capacity_;
    size_t top_;
};

} // namespace vine
