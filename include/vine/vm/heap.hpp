#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "vine/vm/types.hpp"
#include "vine/vm/value.hpp"

namespace vine {

enum class HeapErrorCode : uint8
{
    OK,
    INVALID_CONFIGURATION,
    INVALID_SIZE_CLASS,
    OUT_OF_MEMORY,
    INVALID_HANDLE,
    OUT_OF_BOUNDS
};

const char *heapErrorToString(HeapErrorCode code);

class HeapError : public std::runtime_error
{
public:
    HeapError(HeapErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    HeapErrorCode code() const { return code_; }

private:
    HeapErrorCode code_;
};

struct HeapConfig
{
    std::vector<size_t> sizeClasses;
    size_t objectsPerClass = OBJECTS_PER_CLASS;
};

class Heap;

// One entry of the object table. Slots live in the owning size class's block.
struct ObjectEntry
{
    std::mutex mutex;
    Value *slots = nullptr;
    uint32 generation = 0;
    uint32 refCount = 0;
    uint32 sizeClass = 0;
    uint8 size = 0;
    bool live = false;
    bool marked = false;
};

// Exclusive view over an object's slots. Releases the object lock when destroyed.
class ObjectGuard
{
public:
    ObjectGuard(ObjectGuard &&other) noexcept = default;
    ObjectGuard &operator=(ObjectGuard &&other) noexcept = default;
    ObjectGuard(const ObjectGuard &) = delete;
    ObjectGuard &operator=(const ObjectGuard &) = delete;

    size_t size() const { return entry_->size; }
    Handle handle() const { return handle_; }

    const Value &get(size_t slot) const;
    void set(size_t slot, const Value &value);

    Value &operator[](size_t slot) { return entry_->slots[slot]; }
    const Value &operator[](size_t slot) const { return entry_->slots[slot]; }

private:
    friend class Heap;
    ObjectGuard(ObjectEntry *entry, Handle handle, std::unique_lock<std::mutex> lock)
        : entry_(entry), handle_(handle), lock_(std::move(lock)) {}

    ObjectEntry *entry_;
    Handle handle_;
    std::unique_lock<std::mutex> lock_;
};

class Heap
{
public:
    explicit Heap(const std::vector<size_t> &sizeClasses);
    explicit Heap(const HeapConfig &config);
    ~Heap();

    Heap(const Heap &) = delete;
    Heap &operator=(const Heap &) = delete;

    Handle allocate(size_t sizeClass);
    HeapErrorCode tryAllocate(size_t sizeClass, Handle &out);

    ObjectGuard lock(Handle handle);
    std::optional<ObjectGuard> tryLock(Handle handle);

    void retain(Handle handle);
    bool release(Handle handle);

    size_t collect(const std::vector<Value> &roots);

    bool isValid(Handle handle);
    uint32 refCount(Handle handle);

    size_t sizeClassCount() const { return classes_.size(); }
    size_t slotsOf(size_t sizeClass) const;
    size_t capacity(size_t sizeClass) const;
    size_t liveObjects() const;
    size_t liveObjects(size_t sizeClass) const;

private:
    struct SizeClass
    {
        size_t slots = 0;
        size_t first = 0; // first table index owned by this class
        std::unique_ptr<Value[]> block;
        std::vector<uint32> freeList;
        size_t live = 0;
    };

    void init(const HeapConfig &config);
    ObjectEntry *entryFor(Handle handle);
    std::unique_lock<std::mutex> lockValid(Handle handle, ObjectEntry *&entry);
    void recycle(uint32 index, size_t sizeClass);

    // Mark-and-sweep helpers; run with the heap lock and every entry lock held.
    void markRoots(const std::vector<Value> &roots, std::vector<uint32> &gray);
    void markValue(const Value &value, std::vector<uint32> &gray);
    void traceReferences(std::vector<uint32> &gray);
    size_t sweep();

    std::vector<SizeClass> classes_;
    std::unique_ptr<ObjectEntry[]> table_;
    size_t tableSize_ = 0;
    size_t objectsPerClass_ = 0;
    mutable std::mutex mutex_;
};

} // namespace vine
