#pragma once

#include <meridian/status.h>

#include <atomic>
#include <concepts>
#include <utility>

#include <emmintrin.h>

#include "common/util/util.hpp"

namespace stdx {
    /// @brief A value that is published at most once.
    ///
    /// The first caller of @a initOnce runs the initializer while every other caller
    /// spins. If the initializer fails nothing is published and the next caller gets
    /// to try again. Once published the value is immutable for the lifetime of the latch.
    template<typename T>
    class Once {
        enum class State : uint8_t {
            eEmpty,
            eBusy,
            eReady,
        };

        std::atomic<State> mState = State::eEmpty;
        T mValue{};

    public:
        UTIL_NOCOPY(Once);
        UTIL_NOMOVE(Once);

        constexpr Once() noexcept = default;

        /// @brief Publish the value if no other caller has.
        ///
        /// @param init Callable with the signature `OsStatus(T*)`.
        ///
        /// @retval OsStatusSuccess This call ran the initializer and published the value.
        /// @retval OsStatusCompleted The value was already published, the initializer was not run.
        /// @return Any other status is the initializer's failure, nothing was published.
        template<typename F> requires std::invocable<F, T*>
        [[nodiscard]]
        OsStatus initOnce(F&& init) {
            while (true) {
                State expected = State::eEmpty;
                if (mState.compare_exchange_strong(expected, State::eBusy, std::memory_order_acquire)) {
                    OsStatus status = std::forward<F>(init)(&mValue);
                    mState.store(status == OsStatusSuccess ? State::eReady : State::eEmpty, std::memory_order_release);
                    return status;
                }

                if (expected == State::eReady) {
                    return OsStatusCompleted;
                }

                while (mState.load(std::memory_order_acquire) == State::eBusy) {
                    _mm_pause();
                }
            }
        }

        bool isReady() const noexcept {
            return mState.load(std::memory_order_acquire) == State::eReady;
        }

        /// @brief Get the published value.
        ///
        /// @return The value, or nullptr if it has not been published yet.
        T *get() noexcept {
            return isReady() ? &mValue : nullptr;
        }

        const T *get() const noexcept {
            return isReady() ? &mValue : nullptr;
        }
    };
}
