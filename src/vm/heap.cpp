/**
 * @file heap.cpp
 * @brief Size-classed object heap shared by Vine machines
 *
 * Every size class owns one preallocated block of Value slots and a free list
 * of object-table indices. Objects are reference counted and freed when the
 * count drops to zero; `collect()` is an explicit mark-and-sweep for cycles
 * the counts cannot reclaim.
 *
 * Locking:
 * - the heap mutex guards free lists and live counters
 * - each object entry has its own mutex guarding slots, refcount and generation
 * - order is entry -> heap; the heap mutex is never held while blocking on an
 *   entry lock (allocation drops it first, collect() only try-locks)
 */
#include "vine/vm/heap.hpp"

#include <new>

namespace vine
{

const char *heapErrorToString(HeapErrorCode code)
{
  switch (code)
  {
  case HeapErrorCode::OK:
    return "ok";
  case HeapErrorCode::INVALID_CONFIGURATION:
    return "invalid configuration";
  case HeapErrorCode::INVALID_SIZE_CLASS:
    return "invalid size class";
  case HeapErrorCode::OUT_OF_MEMORY:
    return "out of memory";
  case HeapErrorCode::INVALID_HANDLE:
    return "invalid handle";
  case HeapErrorCode::OUT_OF_BOUNDS:
    return "out of bounds";
  }
  return "unknown";
}

// ============= GUARD =============

const Value &ObjectGuard::get(size_t slot) const
{
  if (slot >= entry_->size)
  {
    throw HeapError(HeapErrorCode::OUT_OF_BOUNDS,
                    "slot " + std::to_string(slot) + " out of bounds (size=" + std::to_string(entry_->size) + ")");
  }
  return entry_->slots[slot];
}

void ObjectGuard::set(size_t slot, const Value &value)
{
  if (slot >= entry_->size)
  {
    throw HeapError(HeapErrorCode::OUT_OF_BOUNDS,
                    "slot " + std::to_string(slot) + " out of bounds (size=" + std::to_string(entry_->size) + ")");
  }
  entry_->slots[slot] = value;
}

// ============= SETUP =============

Heap::Heap(const std::vector<size_t> &sizeClasses)
{
  HeapConfig config;
  config.sizeClasses = sizeClasses;
  init(config);
}

Heap::Heap(const HeapConfig &config)
{
  init(config);
}

Heap::~Heap()
{
}

void Heap::init(const HeapConfig &config)
{
  if (config.sizeClasses.empty())
  {
    throw HeapError(HeapErrorCode::INVALID_CONFIGURATION, "heap needs at least one size class");
  }
  if (config.objectsPerClass == 0)
  {
    throw HeapError(HeapErrorCode::INVALID_CONFIGURATION, "heap capacity per size class must be positive");
  }

  for (size_t i = 0; i < config.sizeClasses.size(); i++)
  {
    const size_t slots = config.sizeClasses[i];
    if (slots == 0 || slots > MAX_OBJECT_SLOTS)
    {
      throw HeapError(HeapErrorCode::INVALID_CONFIGURATION,
                      "size class " + std::to_string(i) + " has invalid length " + std::to_string(slots));
    }
  }

  if (config.objectsPerClass > MAX_HEAP_OBJECTS / config.sizeClasses.size())
  {
    throw HeapError(HeapErrorCode::INVALID_CONFIGURATION,
                    "heap object table too large (" + std::to_string(config.sizeClasses.size()) + " classes x " +
                        std::to_string(config.objectsPerClass) + " objects, limit " +
                        std::to_string(MAX_HEAP_OBJECTS) + ")");
  }

  objectsPerClass_ = config.objectsPerClass;
  tableSize_ = config.sizeClasses.size() * config.objectsPerClass;

  try
  {
    table_ = std::make_unique<ObjectEntry[]>(tableSize_);
    classes_.resize(config.sizeClasses.size());

    for (size_t c = 0; c < classes_.size(); c++)
    {
      SizeClass &cls = classes_[c];
      cls.slots = config.sizeClasses[c];
      cls.first = c * objectsPerClass_;
      cls.block.reset(new Value[cls.slots * objectsPerClass_]);
      cls.freeList.reserve(objectsPerClass_);

      for (size_t i = 0; i < objectsPerClass_; i++)
      {
        ObjectEntry &entry = table_[cls.first + i];
        entry.slots = cls.block.get() + i * cls.slots;
        entry.sizeClass = static_cast<uint32>(c);
        entry.size = static_cast<uint8>(cls.slots);
      }

      // lowest index is handed out first
      for (size_t i = objectsPerClass_; i > 0; i--)
      {
        cls.freeList.push_back(static_cast<uint32>(cls.first + i - 1));
      }
    }
  }
  catch (const std::bad_alloc &)
  {
    throw HeapError(HeapErrorCode::INVALID_CONFIGURATION,
                    "cannot reserve " + std::to_string(tableSize_) + " heap objects");
  }
}

// ============= ALLOCATION =============

HeapErrorCode Heap::tryAllocate(size_t sizeClass, Handle &out)
{
  std::unique_lock<std::mutex> heapLock(mutex_);

  if (sizeClass >= classes_.size())
    return HeapErrorCode::INVALID_SIZE_CLASS;

  SizeClass &cls = classes_[sizeClass];
  if (cls.freeList.empty())
    return HeapErrorCode::OUT_OF_MEMORY;

  const uint32 index = cls.freeList.back();
  cls.freeList.pop_back();
  cls.live++;
  heapLock.unlock();

  // Off the free list and not yet live: nobody else can hand it out or sweep it.
  ObjectEntry &entry = table_[index];
  std::lock_guard<std::mutex> entryLock(entry.mutex);
  for (size_t i = 0; i < entry.size; i++)
  {
    entry.slots[i] = Value();
  }
  entry.live = true;
  entry.marked = false;
  entry.refCount = 1;

  out.index = index;
  out.generation = entry.generation;
  return HeapErrorCode::OK;
}

Handle Heap::allocate(size_t sizeClass)
{
  Handle handle{0, 0};
  const HeapErrorCode code = tryAllocate(sizeClass, handle);
  if (code == HeapErrorCode::INVALID_SIZE_CLASS)
  {
    throw HeapError(code, "size class " + std::to_string(sizeClass) + " out of range (have " +
                              std::to_string(classes_.size()) + ")");
  }
  if (code == HeapErrorCode::OUT_OF_MEMORY)
  {
    throw HeapError(code, "size class " + std::to_string(sizeClass) + " exhausted (" +
                              std::to_string(objectsPerClass_) + " objects)");
  }
  return handle;
}

void Heap::recycle(uint32 index, size_t sizeClass)
{
  SizeClass &cls = classes_[sizeClass];
  cls.freeList.push_back(index);
  cls.live--;
}

// ============= LOCKING =============

ObjectEntry *Heap::entryFor(Handle handle)
{
  if (handle.index >= tableSize_)
  {
    throw HeapError(HeapErrorCode::INVALID_HANDLE, "handle index " + std::to_string(handle.index) + " out of range");
  }
  return &table_[handle.index];
}

std::unique_lock<std::mutex> Heap::lockValid(Handle handle, ObjectEntry *&entry)
{
  entry = entryFor(handle);
  std::unique_lock<std::mutex> lock(entry->mutex);
  if (!entry->live || entry->generation != handle.generation)
  {
    throw HeapError(HeapErrorCode::INVALID_HANDLE, "stale handle #" + std::to_string(handle.index) + ":" +
                                                       std::to_string(handle.generation));
  }
  return lock;
}

ObjectGuard Heap::lock(Handle handle)
{
  ObjectEntry *entry = nullptr;
  std::unique_lock<std::mutex> lock = lockValid(handle, entry);
  return ObjectGuard(entry, handle, std::move(lock));
}

std::optional<ObjectGuard> Heap::tryLock(Handle handle)
{
  ObjectEntry *entry = entryFor(handle);
  std::unique_lock<std::mutex> lock(entry->mutex, std::try_to_lock);
  if (!lock.owns_lock())
  {
    return std::nullopt;
  }
  if (!entry->live || entry->generation != handle.generation)
  {
    throw HeapError(HeapErrorCode::INVALID_HANDLE, "stale handle #" + std::to_string(handle.index) + ":" +
                                                       std::to_string(handle.generation));
  }
  return ObjectGuard(entry, handle, std::move(lock));
}

// ============= REFERENCE COUNTING =============

void Heap::retain(Handle handle)
{
  ObjectEntry *entry = nullptr;
  std::unique_lock<std::mutex> lock = lockValid(handle, entry);
  entry->refCount++;
}

bool Heap::release(Handle handle)
{
  ObjectEntry *entry = nullptr;
  size_t sizeClass = 0;
  {
    std::unique_lock<std::mutex> lock = lockValid(handle, entry);
    if (--entry->refCount > 0)
      return false;

    entry->live = false;
    entry->generation++;
    sizeClass = entry->sizeClass;
  }

  std::lock_guard<std::mutex> heapLock(mutex_);
  recycle(handle.index, sizeClass);
  return true;
}

bool Heap::isValid(Handle handle)
{
  if (handle.index >= tableSize_)
    return false;

  ObjectEntry &entry = table_[handle.index];
  std::lock_guard<std::mutex> lock(entry.mutex);
  return entry.live && entry.generation == handle.generation;
}

uint32 Heap::refCount(Handle handle)
{
  ObjectEntry *entry = nullptr;
  std::unique_lock<std::mutex> lock = lockValid(handle, entry);
  return entry->refCount;
}

// ============= MARK & SWEEP =============

size_t Heap::collect(const std::vector<Value> &roots)
{
  std::lock_guard<std::mutex> heapLock(mutex_);

  std::vector<std::unique_lock<std::mutex>> held;
  held.reserve(tableSize_);
  for (size_t i = 0; i < tableSize_; i++)
  {
    std::unique_lock<std::mutex> lock(table_[i].mutex, std::try_to_lock);
    if (!lock.owns_lock())
    {
      // somebody is inside an object; try again later
      return 0;
    }
    held.push_back(std::move(lock));
  }

  std::vector<uint32> gray;
  markRoots(roots, gray);
  traceReferences(gray);
  return sweep();
}

void Heap::markRoots(const std::vector<Value> &roots, std::vector<uint32> &gray)
{
  for (size_t i = 0; i < roots.size(); i++)
  {
    if (!roots[i].isReference())
      continue;
    markValue(roots[i], gray);
  }
}

void Heap::markValue(const Value &value, std::vector<uint32> &gray)
{
  const Handle h = value.asHandle();
  if (h.index >= tableSize_)
    return;

  ObjectEntry &entry = table_[h.index];
  if (!entry.live || entry.generation != h.generation || entry.marked)
    return;

  entry.marked = true;
  gray.push_back(h.index);
}

void Heap::traceReferences(std::vector<uint32> &gray)
{
  while (!gray.empty())
  {
    ObjectEntry &entry = table_[gray.back()];
    gray.pop_back();

    for (size_t i = 0; i < entry.size; i++)
    {
      if (!entry.slots[i].isReference())
        continue;
      markValue(entry.slots[i], gray);
    }
  }
}

size_t Heap::sweep()
{
  size_t freed = 0;
  for (size_t i = 0; i < tableSize_; i++)
  {
    ObjectEntry &entry = table_[i];
    if (entry.live && !entry.marked)
    {
      entry.live = false;
      entry.refCount = 0;
      entry.generation++;
      recycle(static_cast<uint32>(i), entry.sizeClass);
      freed++;
    }
    else
    {
      // Unmark for the next cycle
      entry.marked = false;
    }
  }
  return freed;
}

// ============= INTROSPECTION =============

size_t Heap::slotsOf(size_t sizeClass) const
{
  if (sizeClass >= classes_.size())
  {
    throw HeapError(HeapErrorCode::INVALID_SIZE_CLASS, "size class " + std::to_string(sizeClass) + " out of range");
  }
  return classes_[sizeClass].slots;
}

size_t Heap::capacity(size_t sizeClass) const
{
  if (sizeClass >= classes_.size())
  {
    throw HeapError(HeapErrorCode::INVALID_SIZE_CLASS, "size class " + std::to_string(sizeClass) + " out of range");
  }
  return objectsPerClass_;
}

size_t Heap::liveObjects() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (size_t c = 0; c < classes_.size(); c++)
  {
    count += classes_[c].live;
  }
  return count;
}

size_t Heap::liveObjects(size_t sizeClass) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (sizeClass >= classes_.size())
  {
    throw HeapError(HeapErrorCode::INVALID_SIZE_CLASS, "size class " + std::to_string(sizeClass) + " out of range");
  }
  return classes_[sizeClass].live;
}

} // namespace vine
