#pragma once

#include <stdint.h>

#include <x86intrin.h>

namespace arch {
    struct IntrinX86_64 {
        [[gnu::always_inline, gnu::nodebug]]
        static void nop() noexcept {
            asm volatile("nop");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void pause() noexcept {
            _mm_pause();
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void halt() noexcept {
            asm volatile("hlt");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void cli() noexcept {
            asm volatile("cli");
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void sti() noexcept {
            asm volatile("sti");
        }

        [[gnu::always_inline, gnu::nodebug, nodiscard]]
        static uint64_t rdmsr(uint32_t msr) noexcept {
            uint32_t lo, hi;
            asm volatile("rdmsr" : "=a"(lo), "=d"(hi) : "c"(msr));
            return ((uint64_t)hi << 32) | lo;
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void wrmsr(uint32_t msr, uint64_t value) noexcept {
            uint32_t lo = value;
            uint32_t hi = value >> 32;
            asm volatile("wrmsr" : : "c"(msr), "a"(lo), "d"(hi));
        }

        /// @brief Read the timestamp counter and the core tag stored in IA32_TSC_AUX.
        [[gnu::always_inline, gnu::nodebug, nodiscard]]
        static uint64_t rdtscp(uint32_t *aux) noexcept {
            unsigned int tag;
            uint64_t value = __rdtscp(&tag);
            *aux = tag;
            return value;
        }

        [[gnu::always_inline, gnu::nodebug]]
        static void outbyte(uint16_t port, uint8_t data) noexcept {
            asm volatile("outb %b0, %w1" : : "a"(data), "Nd"(port));
        }

        [[gnu::always_inline, gnu::nodebug]]
        static uint8_t inbyte(uint16_t port) noexcept {
            uint8_t ret;
            asm volatile("inb %w1, %b0" : "=a"(ret) : "Nd"(port));
            return ret;
        }
    };

    using Intrin = IntrinX86_64;
}
