#pragma once

#include "common/compiler/compiler.hpp"
#include "common/util/util.hpp"

#include <array>
#include <atomic>
#include <type_traits>
#include <utility>

#include <stddef.h>
#include <stdint.h>

namespace sm {
    /// @brief A fixed size, multi-producer, single-consumer reentrant atomic ringbuffer.
    ///
    /// Storage is inline so the queue can live in static storage before any allocator exists.
    /// Each slot carries a sequence number, a slot only becomes visible to the consumer once
    /// its producer has finished writing it. Producers never wait on each other so pushing
    /// is safe from interrupt context. The consumer must be serialized externally.
    template<typename T, uint32_t N>
    class AtomicRingQueue {
        static_assert(N > 0);
        static_assert(std::is_nothrow_move_assignable_v<T>
                   && std::is_nothrow_default_constructible_v<T>);

        struct Slot {
            std::atomic<uint64_t> sequence;
            T value;
        };

        std::array<Slot, N> mStorage;
        std::atomic<uint64_t> mProducerHead{0};
        std::atomic<uint64_t> mConsumerHead{0};

        static constexpr int64_t distance(uint64_t sequence, uint64_t position) noexcept {
            return int64_t(sequence - position);
        }

    public:
        UTIL_NOCOPY(AtomicRingQueue);
        UTIL_NOMOVE(AtomicRingQueue);

        AtomicRingQueue() noexcept {
            for (uint32_t i = 0; i < N; i++) {
                mStorage[i].sequence.store(i, std::memory_order_relaxed);
            }
        }

        /// @brief Try to push a value onto the queue.
        ///
        /// If the value is pushed @p value is moved from, otherwise it is left unchanged.
        ///
        /// @return true if the value was pushed, false if the queue was full.
        bool tryPush(T& value) noexcept MR_NONBLOCKING {
            uint64_t position = mProducerHead.load(std::memory_order_relaxed);

            while (true) {
                Slot& slot = mStorage[position % N];
                int64_t diff = distance(slot.sequence.load(std::memory_order_acquire), position);

                if (diff == 0) {
                    if (mProducerHead.compare_exchange_weak(position, position + 1, std::memory_order_relaxed)) {
                        slot.value = std::move(value);
                        slot.sequence.store(position + 1, std::memory_order_release);
                        return true;
                    }
                } else if (diff < 0) {
                    return false;
                } else {
                    position = mProducerHead.load(std::memory_order_relaxed);
                }
            }
        }

        /// @brief Try to pop a value from the queue.
        ///
        /// A slot that has been claimed but not yet written reads as empty.
        ///
        /// @return true if a value was moved into @p value, false if the queue was empty.
        bool tryPop(T& value) noexcept MR_NONBLOCKING {
            uint64_t position = mConsumerHead.load(std::memory_order_relaxed);
            Slot& slot = mStorage[position % N];

            if (distance(slot.sequence.load(std::memory_order_acquire), position + 1) != 0) {
                return false;
            }

            value = std::move(slot.value);
            slot.sequence.store(position + N, std::memory_order_release);
            mConsumerHead.store(position + 1, std::memory_order_relaxed);
            return true;
        }

        /// @brief An estimate of the number of queued items, out of date as soon as it is read.
        uint32_t count() const noexcept MR_NONBLOCKING {
            uint64_t head = mProducerHead.load(std::memory_order_relaxed);
            uint64_t tail = mConsumerHead.load(std::memory_order_relaxed);
            return uint32_t(head - tail);
        }

        constexpr uint32_t capacity() const noexcept MR_NONBLOCKING {
            return N;
        }
    };
}
