#pragma once

#include "fault/fault_state.hpp"

#include <source_location>
#include <string_view>

namespace mr {
    class IApic;

    /// @brief The hardware actions the fault protocol needs.
    class IFaultPlatform {
    public:
        virtual ~IFaultPlatform() = default;

        /// @brief Send the fault signal to every core except the current one.
        virtual void broadcastNmi() noexcept = 0;

        /// @brief Stop the current core, never returns.
        [[noreturn]]
        virtual void halt() = 0;
    };

    /// @brief Broadcasts through the local apic and halts with interrupts disabled.
    class ApicFaultPlatform final : public IFaultPlatform {
        IApic *mApic;

    public:
        constexpr ApicFaultPlatform(IApic *apic) noexcept
            : mApic(apic)
        { }

        void broadcastNmi() noexcept override;

        [[noreturn]]
        void halt() override;
    };

    /// @brief Stops every core once any core hits an unrecoverable fault.
    ///
    /// The faulting core marks itself panicked and sends an NMI to every other core,
    /// each of which marks itself panicked from its NMI handler and halts. No locks are
    /// taken anywhere on this path, the faulting context may already hold any of them.
    class FaultCoordinator {
        FaultStateTable *mTable;
        IFaultPlatform *mPlatform;

        [[noreturn]]
        void bootstrapFailure(CpuCoreId core, std::string_view message, std::source_location where);

    public:
        constexpr FaultCoordinator(FaultStateTable *table, IFaultPlatform *platform) noexcept
            : mTable(table)
            , mPlatform(platform)
        { }

        /// @brief Mark @p core as ready to take part in the fault protocol.
        ///
        /// Must be called after the core has installed its NMI handler. If another core
        /// has already panicked the arming core joins the fault and halts.
        FaultTransition arm(CpuCoreId core);

        /// @brief Declare an unrecoverable fault on @p core and stop the system.
        ///
        /// A core that is not armed, or a table that is not latched yet, takes the
        /// bootstrap failure path instead, which halts only the current core.
        [[noreturn]]
        void panic(CpuCoreId core, std::string_view message, std::source_location where = std::source_location::current());

        /// @brief Body of the NMI handler, stops @p core.
        [[noreturn]]
        void onFaultBroadcast(CpuCoreId core);

        const FaultStateTable& table() const noexcept { return *mTable; }
    };

    void SetFaultCoordinator(FaultCoordinator *coordinator) noexcept;
    FaultCoordinator *GetFaultCoordinator() noexcept;
}
