#pragma once

#include <meridian/status.h>

#include <span>
#include <utility>

#include "boot.hpp"
#include "memory/detail/range_table.hpp"
#include "memory/range.hpp"
#include "std/mutex.h"
#include "std/spinlock.hpp"

namespace mr {
    /// @brief What a physical frame is currently being used for.
    enum class MemoryType : uint8_t {
        eFree,
        eBootloader,
        eKernel,
        eKernelPageTables,
        eKernelHeap,
        eKernelStack,
        eUser,

        eCount,
    };

    static constexpr size_t kMemoryTypeCount = std::to_underlying(MemoryType::eCount);

    struct FrameSegment {
        MemoryRange range;
        MemoryType type;
    };

    /// @brief Why a frame could not be released.
    struct FreeError {
        enum Kind : uint8_t {
            /// @brief The frame is not tracked or is already free.
            eFrameNotAllocated,

            /// @brief The frame is allocated for a different purpose than the caller claimed.
            eWrongMemoryType,
        };

        Kind kind;
        MemoryType expected;
        MemoryType found;

        static constexpr FreeError frameNotAllocated() noexcept {
            return FreeError { eFrameNotAllocated, MemoryType::eFree, MemoryType::eFree };
        }

        static constexpr FreeError wrongMemoryType(MemoryType expected, MemoryType found) noexcept {
            return FreeError { eWrongMemoryType, expected, found };
        }

        constexpr bool operator==(const FreeError&) const noexcept = default;
    };

    class [[nodiscard]] FreeResult {
        bool mOk;
        FreeError mError;

        constexpr FreeResult(bool ok, FreeError error) noexcept
            : mOk(ok)
            , mError(error)
        { }

    public:
        static constexpr FreeResult success() noexcept {
            return FreeResult { true, FreeError::frameNotAllocated() };
        }

        static constexpr FreeResult failure(FreeError error) noexcept {
            return FreeResult { false, error };
        }

        constexpr bool isOk() const noexcept { return mOk; }
        constexpr explicit operator bool() const noexcept { return mOk; }

        /// @pre !isOk()
        constexpr FreeError error() const noexcept { return mError; }

        /// @brief Map the result onto a status code.
        ///
        /// @retval OsStatusSuccess the frame was released.
        /// @retval OsStatusNotFound the frame was not allocated.
        /// @retval OsStatusInvalidType the frame has a different memory type.
        constexpr OsStatus status() const noexcept {
            if (mOk) return OsStatusSuccess;

            return mError.kind == FreeError::eFrameNotAllocated
                ? OsStatusNotFound
                : OsStatusInvalidType;
        }
    };

    struct FrameAllocatorStats {
        size_t segments;
        size_t bytes[kMemoryTypeCount];

        size_t usage(MemoryType type) const noexcept {
            return bytes[std::to_underlying(type)];
        }
    };

    /// @brief Physical memory frame allocator.
    ///
    /// Tracks every usable page of physical memory with the type it was allocated as.
    /// Frames can only be released by naming the type they were allocated as, a frame
    /// holding page tables can never be returned to the pool through a heap free.
    class FrameAllocator {
        using Table = detail::RangeTable<FrameSegment>;

        stdx::SpinLock mLock;
        Table mTable GUARDED_BY(mLock);

        void retag(Table::Iterator it, MemoryRange range, MemoryType type) REQUIRES(mLock);
        void merge(Table::Iterator it) REQUIRES(mLock);

    public:
        UTIL_NOCOPY(FrameAllocator);
        UTIL_NOMOVE(FrameAllocator);

        FrameAllocator() noexcept = default;

        /// @brief Allocate a single frame and tag it as @p type.
        ///
        /// @param type what the frame will be used for.
        /// @param frame the address of the allocated frame.
        ///
        /// @retval OsStatusInvalidInput @p type is @a MemoryType::eFree.
        /// @retval OsStatusOutOfMemory there are no free frames.
        [[nodiscard]]
        OsStatus allocate(MemoryType type, sm::PhysicalAddress *frame);

        /// @brief Release a frame that was allocated as @p expected.
        ///
        /// A failed free does not change the state of the allocator.
        FreeResult free(sm::PhysicalAddress frame, MemoryType expected);

        /// @brief Tag a range of free memory as @p type.
        ///
        /// @retval OsStatusNotAvailable some of the range is not free memory.
        /// @retval OsStatusInvalidInput @p range is not page aligned or is empty.
        [[nodiscard]]
        OsStatus reserve(MemoryRange range, MemoryType type);

        /// @brief Query the type of a frame.
        ///
        /// @retval OsStatusNotFound the frame is not tracked.
        [[nodiscard]]
        OsStatus query(sm::PhysicalAddress frame, MemoryType *type);

        bool isAllocated(sm::PhysicalAddress frame);

        FrameAllocatorStats stats();

        /// @brief Populate @p allocator from the boot memory map.
        ///
        /// @retval OsStatusInvalidInput two tracked regions overlap.
        /// @retval OsStatusAlreadyExists @p allocator is already populated.
        [[nodiscard]]
        static OsStatus create(std::span<const boot::MemoryRegion> memmap, FrameAllocator *allocator);
    };
}

template<>
struct mr::Format<mr::MemoryType> {
    static void format(mr::IOutStream& out, mr::MemoryType value);
};

template<>
struct mr::Format<mr::FreeError> {
    static void format(mr::IOutStream& out, mr::FreeError value);
};
