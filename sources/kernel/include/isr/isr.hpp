#pragma once

#include "isr/vectors.hpp"

#include "common/util/util.hpp"

#include <atomic>
#include <cstdint>
#include <span>

namespace mr {
    namespace isr {
        // vectors for architectural exceptions

        constexpr uint8_t DE = 0x0;
        constexpr uint8_t DB = 0x1;
        constexpr uint8_t NMI = 0x2;
        constexpr uint8_t BP = 0x3;
        constexpr uint8_t UD = 0x6;
        constexpr uint8_t DF = 0x8;
        constexpr uint8_t GP = 0xD;
        constexpr uint8_t PF = 0xE;
        constexpr uint8_t MCE = 0x12;

        /// @brief The number of exceptions reserved by the CPU
        constexpr uint8_t kExceptionCount = 0x20;

        static_assert(kExceptionCount == kVectorBase);
    }

    struct [[gnu::packed]] IsrContext {
        uint64_t rax;
        uint64_t rbx;
        uint64_t rcx;
        uint64_t rdx;
        uint64_t rdi;
        uint64_t rsi;
        uint64_t r8;
        uint64_t r9;
        uint64_t r10;
        uint64_t r11;
        uint64_t r12;
        uint64_t r13;
        uint64_t r14;
        uint64_t r15;
        uint64_t rbp;

        uint64_t vector;
        uint64_t error;

        uint64_t rip;
        uint64_t cs;
        uint64_t rflags;
        uint64_t rsp;
        uint64_t ss;
    };

    static_assert(sizeof(IsrContext) == 176);

    using IsrCallback = IsrContext(*)(IsrContext*);
    using IsrEntry = std::atomic<IsrCallback>;

    /// @brief The handler for every vector that has nothing installed.
    IsrContext DefaultIsrHandler(IsrContext *context) noexcept;

    struct VectorBinding {
        InterruptVector vector;
        IsrCallback callback;
    };

    /// @brief Dispatch table shared by every core.
    ///
    /// Covers the architectural exceptions followed by the fixed vectors in
    /// @a InterruptVector. Entries are atomic so handlers can be swapped while
    /// other cores are taking interrupts.
    class IsrTable {
    public:
        static constexpr size_t kCount = kVectorLimit;

    private:
        IsrEntry mHandlers[kCount];

    public:
        UTIL_NOCOPY(IsrTable);
        UTIL_NOMOVE(IsrTable);

        IsrTable() noexcept;

        /// @brief Install a handler and return the one it replaced.
        IsrCallback install(uint8_t isr, IsrCallback callback) noexcept;

        IsrCallback install(InterruptVector vector, IsrCallback callback) noexcept {
            return install(VectorNumber(vector), callback);
        }

        bool isInstalled(uint8_t isr) const noexcept;

        IsrContext invoke(IsrContext *context) noexcept;
    };

    /// @brief Fill the dispatch table from a list of bindings.
    ///
    /// The vector table is validated against the range the interrupt controller
    /// reports before anything is installed.
    ///
    /// @retval OsStatusAlreadyExists Two bindings name the same vector.
    [[nodiscard]]
    OsStatus BuildDispatchTable(IsrTable& table, std::span<const VectorBinding> bindings, uint8_t minVector, uint8_t maxVector);

    void SetIsrTable(IsrTable *table) noexcept;
    IsrTable *GetIsrTable() noexcept;
}

/// @brief Called by the assembly interrupt stubs with the saved register state.
extern "C" mr::IsrContext MrIsrDispatchRoutine(mr::IsrContext *context) noexcept;
