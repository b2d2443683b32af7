#include <atomic>
#include <optional>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "vine/vm/heap.hpp"

using vine::Handle;
using vine::Heap;
using vine::HeapConfig;
using vine::HeapError;
using vine::HeapErrorCode;
using vine::ObjectGuard;
using vine::Value;

namespace
{

    HeapErrorCode constructionError(const HeapConfig &config)
    {
        try
        {
            Heap heap(config);
        }
        catch (const HeapError &e)
        {
            return e.code();
        }
        return HeapErrorCode::OK;
    }

    HeapConfig smallConfig(std::vector<size_t> classes, size_t perClass)
    {
        HeapConfig config;
        config.sizeClasses = std::move(classes);
        config.objectsPerClass = perClass;
        return config;
    }

    struct HandleResult
    {
        HeapErrorCode code;
        Handle handle;
    };

    HandleResult tryAllocateIn(Heap &heap, size_t sizeClass)
    {
        HandleResult result{HeapErrorCode::OK, Handle{0, 0}};
        result.code = heap.tryAllocate(sizeClass, result.handle);
        return result;
    }

} // namespace

TEST(Heap, RejectsInvalidConfiguration)
{
    EXPECT_EQ(constructionError(smallConfig({}, 4)), HeapErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(constructionError(smallConfig({0}, 4)), HeapErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(constructionError(smallConfig({4, 256}, 4)), HeapErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(constructionError(smallConfig({4}, 0)), HeapErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(constructionError(smallConfig({1, 255}, 4)), HeapErrorCode::OK);
    EXPECT_EQ(constructionError(smallConfig({255}, 4000000000u)), HeapErrorCode::INVALID_CONFIGURATION);
    EXPECT_EQ(constructionError(smallConfig({1, 1}, vine::MAX_HEAP_OBJECTS / 2 + 1)),
              HeapErrorCode::INVALID_CONFIGURATION);

    EXPECT_THROW({ Heap heap(std::vector<size_t>{}); }, HeapError);
}

TEST(Heap, ObjectsExposeTheirSizeClassZeroed)
{
    const std::vector<size_t> classes = {1, 2, 4, 255};
    Heap heap(smallConfig(classes, 4));

    for (size_t c = 0; c < classes.size(); ++c)
    {
        Handle h = heap.allocate(c);
        ObjectGuard guard = heap.lock(h);
        ASSERT_EQ(guard.size(), classes[c]);
        for (size_t i = 0; i < guard.size(); ++i)
        {
            EXPECT_EQ(guard.get(i), Value::makeRaw(0));
        }
    }
}

TEST(Heap, FreedObjectsReturnToTheirOwnClassBeyond65535Classes)
{
    std::vector<size_t> classes(65537, 1);
    classes.back() = 2;
    Heap heap(smallConfig(classes, 1));

    Handle last = heap.allocate(65536);
    EXPECT_TRUE(heap.release(last));
    EXPECT_EQ(heap.liveObjects(65536), 0u);
    EXPECT_EQ(heap.liveObjects(0), 0u);

    Handle first = heap.allocate(0);
    EXPECT_EQ(heap.lock(first).size(), 1u);
    EXPECT_EQ(heap.liveObjects(0), 1u);

    HandleResult second = tryAllocateIn(heap, 0);
    EXPECT_EQ(second.code, HeapErrorCode::OUT_OF_MEMORY);

    Handle again = heap.allocate(65536);
    EXPECT_EQ(heap.lock(again).size(), 2u);
    EXPECT_EQ(heap.liveObjects(65536), 1u);
}

TEST(Heap, ReusedObjectsAreZeroedAgain)
{
    Heap heap(smallConfig({2}, 1));

    Handle first = heap.allocate(0);
    {
        ObjectGuard guard = heap.lock(first);
        guard.set(0, Value::makeRaw(11));
        guard.set(1, Value::makeRaw(22));
    }
    EXPECT_TRUE(heap.release(first));

    Handle second = heap.allocate(0);
    EXPECT_EQ(second.index, first.index);
    EXPECT_NE(second.generation, first.generation);

    ObjectGuard guard = heap.lock(second);
    EXPECT_EQ(guard.get(0), Value::makeRaw(0));
    EXPECT_EQ(guard.get(1), Value::makeRaw(0));
}

TEST(Heap, SlotsSurviveUnlockAndRelock)
{
    Heap heap(std::vector<size_t>{4});
    Handle h = heap.allocate(0);

    {
        ObjectGuard guard = heap.lock(h);
        for (uint64_t i = 0; i < 4; ++i)
        {
            guard.set(i, Value::makeRaw(i));
        }
    }

    ObjectGuard guard = heap.lock(h);
    ASSERT_EQ(guard.size(), 4u);
    for (uint64_t i = 0; i < 4; ++i)
    {
        EXPECT_EQ(guard[i].asRaw(), i);
    }
}

TEST(Heap, GuardChecksSlotBounds)
{
    Heap heap(std::vector<size_t>{4});
    ObjectGuard guard = heap.lock(heap.allocate(0));

    try
    {
        guard.get(4);
        FAIL() << "expected OUT_OF_BOUNDS";
    }
    catch (const HeapError &e)
    {
        EXPECT_EQ(e.code(), HeapErrorCode::OUT_OF_BOUNDS);
    }
    EXPECT_THROW(guard.set(10, Value::makeRaw(1)), HeapError);
}

TEST(Heap, AllocationReportsExhaustionAndBadClass)
{
    Heap heap(smallConfig({2}, 2));
    heap.allocate(0);
    heap.allocate(0);

    Handle h{};
    EXPECT_EQ(heap.tryAllocate(0, h), HeapErrorCode::OUT_OF_MEMORY);
    EXPECT_EQ(heap.tryAllocate(1, h), HeapErrorCode::INVALID_SIZE_CLASS);

    try
    {
        heap.allocate(0);
        FAIL() << "expected OUT_OF_MEMORY";
    }
    catch (const HeapError &e)
    {
        EXPECT_EQ(e.code(), HeapErrorCode::OUT_OF_MEMORY);
    }
    EXPECT_EQ(heap.liveObjects(0), 2u);
}

TEST(Heap, ReleaseFreesAtZeroAndStaleHandlesAreRejected)
{
    Heap heap(smallConfig({1}, 4));
    Handle h = heap.allocate(0);
    EXPECT_EQ(heap.refCount(h), 1u);

    heap.retain(h);
    EXPECT_EQ(heap.refCount(h), 2u);
    EXPECT_FALSE(heap.release(h));
    EXPECT_TRUE(heap.isValid(h));
    EXPECT_TRUE(heap.release(h));

    EXPECT_FALSE(heap.isValid(h));
    EXPECT_EQ(heap.liveObjects(), 0u);

    try
    {
        heap.lock(h);
        FAIL() << "expected INVALID_HANDLE";
    }
    catch (const HeapError &e)
    {
        EXPECT_EQ(e.code(), HeapErrorCode::INVALID_HANDLE);
    }
    EXPECT_THROW(heap.release(h), HeapError);
    EXPECT_THROW(heap.retain(h), HeapError);
    EXPECT_THROW(heap.lock(Handle{1000, 0}), HeapError);
}

TEST(Heap, TryLockFailsWhileAnotherHolderOwnsTheObject)
{
    Heap heap(std::vector<size_t>{1});
    Handle h = heap.allocate(0);

    {
        ObjectGuard held = heap.lock(h);
        bool acquired = true;
        std::thread other([&]()
                          { acquired = heap.tryLock(h).has_value(); });
        other.join();
        EXPECT_FALSE(acquired);
    }

    std::optional<ObjectGuard> guard = heap.tryLock(h);
    EXPECT_TRUE(guard.has_value());
}

TEST(Heap, ConcurrentIncrementsUnderLockNeverLoseUpdates)
{
    Heap heap(std::vector<size_t>{1});
    Handle h = heap.allocate(0);
    constexpr int kIterations = 20000;

    auto worker = [&]()
    {
        for (int i = 0; i < kIterations; ++i)
        {
            ObjectGuard guard = heap.lock(h);
            guard[0] = Value::makeRaw(guard[0].asRaw() + 1);
        }
    };

    std::thread a(worker);
    std::thread b(worker);
    a.join();
    b.join();

    ObjectGuard guard = heap.lock(h);
    EXPECT_EQ(guard[0].asRaw(), 2u * kIterations);
}

TEST(Heap, CollectFreesUnreachableObjectsAndKeepsChains)
{
    Heap heap(smallConfig({1, 2}, 8));
    Handle root = heap.allocate(1);
    Handle child = heap.allocate(0);
    Handle orphan = heap.allocate(0);

    {
        ObjectGuard guard = heap.lock(root);
        guard.set(0, Value::makeReference(child));
    }

    EXPECT_EQ(heap.collect({Value::makeRaw(7), Value::makeReference(root)}), 1u);
    EXPECT_TRUE(heap.isValid(root));
    EXPECT_TRUE(heap.isValid(child));
    EXPECT_FALSE(heap.isValid(orphan));

    EXPECT_EQ(heap.collect({}), 2u);
    EXPECT_EQ(heap.liveObjects(), 0u);
}

TEST(Heap, CollectFreesCycles)
{
    Heap heap(std::vector<size_t>{1});
    Handle a = heap.allocate(0);
    Handle b = heap.allocate(0);
    heap.lock(a).set(0, Value::makeReference(b));
    heap.lock(b).set(0, Value::makeReference(a));

    EXPECT_EQ(heap.collect({Value::makeReference(a)}), 0u);
    EXPECT_EQ(heap.collect({}), 2u);
}

TEST(Heap, CollectBacksOffWhileAnObjectIsLocked)
{
    Heap heap(std::vector<size_t>{1});
    Handle a = heap.allocate(0);
    heap.allocate(0);

    size_t freed = 1;
    {
        ObjectGuard guard = heap.lock(a);
        std::thread other([&]()
                          { freed = heap.collect({}); });
        other.join();
    }
    EXPECT_EQ(freed, 0u);
    EXPECT_EQ(heap.liveObjects(), 2u);
}

TEST(Heap, Introspection)
{
    Heap heap(smallConfig({3, 5}, 16));
    EXPECT_EQ(heap.sizeClassCount(), 2u);
    EXPECT_EQ(heap.slotsOf(1), 5u);
    EXPECT_EQ(heap.capacity(0), 16u);

    heap.allocate(1);
    EXPECT_EQ(heap.liveObjects(0), 0u);
    EXPECT_EQ(heap.liveObjects(1), 1u);
    EXPECT_THROW(heap.slotsOf(2), HeapError);
    EXPECT_THROW(heap.liveObjects(2), HeapError);
}
