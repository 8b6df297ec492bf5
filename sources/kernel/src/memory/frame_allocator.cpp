#include "memory/frame_allocator.hpp"

#include "logger/categories.hpp"
#include "panic.hpp"

#include <algorithm>

using FrameAllocator = mr::FrameAllocator;
using MemoryType = mr::MemoryType;

static bool GetTrackedType(boot::MemoryRegion::Type type, MemoryType *result) {
    switch (type) {
    case boot::MemoryRegion::eUsable:
        *result = MemoryType::eFree;
        return true;
    case boot::MemoryRegion::eBootloaderReclaimable:
        *result = MemoryType::eBootloader;
        return true;
    case boot::MemoryRegion::eKernel:
        *result = MemoryType::eKernel;
        return true;

    default:
        return false;
    }
}

static mr::MemoryRange FrameRange(sm::PhysicalAddress frame) {
    return mr::MemoryRange { frame, frame + x64::kPageSize };
}

static bool IsFrameAligned(sm::PhysicalAddress frame) {
    return frame.address % x64::kPageSize == 0;
}

void FrameAllocator::merge(Table::Iterator it) {
    MemoryRange range = it->second.range;
    MemoryType type = it->second.type;

    it = mTable.erase(it);

    if (it != mTable.end() && it->second.type == type && it->second.range.front == range.back) {
        range.back = it->second.range.back;
        it = mTable.erase(it);
    }

    if (it != mTable.begin()) {
        auto prev = std::prev(it);
        if (prev->second.type == type && prev->second.range.back == range.front) {
            range.front = prev->second.range.front;
            mTable.erase(prev);
        }
    }

    mTable.insert(FrameSegment { range, type });
}

void FrameAllocator::retag(Table::Iterator it, MemoryRange range, MemoryType type) {
    FrameSegment segment = it->second;
    MR_ASSERT(segment.range.contains(range));

    mTable.erase(it);

    if (segment.range.front != range.front) {
        mTable.insert(FrameSegment { { segment.range.front, range.front }, segment.type });
    }

    if (segment.range.back != range.back) {
        mTable.insert(FrameSegment { { range.back, segment.range.back }, segment.type });
    }

    merge(mTable.insert(FrameSegment { range, type }));
}

OsStatus FrameAllocator::allocate(MemoryType type, sm::PhysicalAddress *frame) {
    if (type == MemoryType::eFree || type >= MemoryType::eCount) {
        return OsStatusInvalidInput;
    }

    stdx::LockGuard guard(mLock);

    auto it = std::find_if(mTable.begin(), mTable.end(), [](const auto& entry) {
        return entry.second.type == MemoryType::eFree;
    });

    if (it == mTable.end()) {
        MemLog.warnf("Out of physical memory allocating ", type, " frame");
        return OsStatusOutOfMemory;
    }

    sm::PhysicalAddress result = it->second.range.front;
    retag(it, FrameRange(result), type);

    *frame = result;
    return OsStatusSuccess;
}

mr::FreeResult FrameAllocator::free(sm::PhysicalAddress frame, MemoryType expected) {
    if (!IsFrameAligned(frame)) {
        return FreeResult::failure(FreeError::frameNotAllocated());
    }

    stdx::LockGuard guard(mLock);

    auto it = mTable.find(frame);
    if (it == mTable.end() || it->second.type == MemoryType::eFree) {
        return FreeResult::failure(FreeError::frameNotAllocated());
    }

    MemoryType found = it->second.type;
    if (found != expected) {
        return FreeResult::failure(FreeError::wrongMemoryType(expected, found));
    }

    retag(it, FrameRange(frame), MemoryType::eFree);
    return FreeResult::success();
}

OsStatus FrameAllocator::reserve(MemoryRange range, MemoryType type) {
    if (range.isEmpty() || !range.isValid() || !IsFrameAligned(range.front) || !IsFrameAligned(range.back)) {
        return OsStatusInvalidInput;
    }

    if (type == MemoryType::eFree || type >= MemoryType::eCount) {
        return OsStatusInvalidInput;
    }

    stdx::LockGuard guard(mLock);

    auto it = mTable.find(range.front);
    if (it == mTable.end()) {
        return OsStatusNotAvailable;
    }

    const FrameSegment& segment = it->second;
    if (segment.type != MemoryType::eFree || !segment.range.contains(range)) {
        return OsStatusNotAvailable;
    }

    retag(it, range, type);
    return OsStatusSuccess;
}

OsStatus FrameAllocator::query(sm::PhysicalAddress frame, MemoryType *type) {
    stdx::LockGuard guard(mLock);

    auto it = mTable.find(frame);
    if (it == mTable.end()) {
        return OsStatusNotFound;
    }

    *type = it->second.type;
    return OsStatusSuccess;
}

bool FrameAllocator::isAllocated(sm::PhysicalAddress frame) {
    MemoryType type = MemoryType::eFree;
    if (OsStatus status = query(frame, &type)) {
        return false;
    }

    return type != MemoryType::eFree;
}

mr::FrameAllocatorStats FrameAllocator::stats() {
    stdx::LockGuard guard(mLock);

    FrameAllocatorStats result { };
    result.segments = mTable.count();

    for (const auto& [_, segment] : mTable) {
        result.bytes[std::to_underlying(segment.type)] += segment.range.size();
    }

    return result;
}

OsStatus FrameAllocator::create(std::span<const boot::MemoryRegion> memmap, FrameAllocator *allocator) {
    stdx::LockGuard guard(allocator->mLock);

    if (!allocator->mTable.isEmpty()) {
        return OsStatusAlreadyExists;
    }

    Table table;

    for (const boot::MemoryRegion& region : memmap) {
        MemoryType type = MemoryType::eFree;
        if (!GetTrackedType(region.type, &type)) {
            continue;
        }

        MemoryRange range = region.range.alignedInward(x64::kPageSize);
        if (range.isEmpty()) {
            MemLog.dbgf("Ignoring sub-page region ", region.range);
            continue;
        }

        if (table.intersects(range)) {
            MemLog.errorf("Overlapping memory map region ", region.range);
            return OsStatusInvalidInput;
        }

        table.insert(FrameSegment { range, type });
    }

    allocator->mTable = std::move(table);

    // Merge neighbouring regions of the same type now that every region is in place.
    for (auto it = allocator->mTable.begin(); it != allocator->mTable.end();) {
        auto next = std::next(it);
        if (next != allocator->mTable.end()
            && next->second.type == it->second.type
            && next->second.range.front == it->second.range.back) {
            allocator->merge(it);
            it = allocator->mTable.begin();
            continue;
        }

        it = next;
    }

    for (const auto& [_, segment] : allocator->mTable) {
        MemLog.infof(segment.range, " ", segment.type);
    }

    return OsStatusSuccess;
}

static std::string_view MemoryTypeName(MemoryType type) {
    switch (type) {
    case MemoryType::eFree: return "Free";
    case MemoryType::eBootloader: return "Bootloader";
    case MemoryType::eKernel: return "Kernel";
    case MemoryType::eKernelPageTables: return "KernelPageTables";
    case MemoryType::eKernelHeap: return "KernelHeap";
    case MemoryType::eKernelStack: return "KernelStack";
    case MemoryType::eUser: return "User";
    case MemoryType::eCount: break;
    }

    return "Unknown";
}

void mr::Format<MemoryType>::format(IOutStream& out, MemoryType value) {
    out.format(MemoryTypeName(value));
}

void mr::Format<mr::FreeError>::format(IOutStream& out, FreeError value) {
    if (value.kind == FreeError::eFrameNotAllocated) {
        out.format("FrameNotAllocated");
    } else {
        out.format("WrongMemoryType(expected ", value.expected, ", found ", value.found, ")");
    }
}
