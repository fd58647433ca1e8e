#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "../common/Address.hpp"
#include "../common/Types.hpp"

namespace lan_warden::monitor
{
    struct ScanResult
    {
        bool ok = true;
        std::vector<common::Observation> observations;
        std::string error;

        static ScanResult Ok(std::vector<common::Observation> observations)
        {
            ScanResult result;
            result.observations = std::move(observations);
            return result;
        }

        static ScanResult Fail(std::string reason)
        {
            ScanResult result;
            result.ok = false;
            result.error = std::move(reason);
            return result;
        }
    };

    // A discovery technique. Implementations must be safe to call from a
    // worker thread and must not touch shared state.
    class ScanBackend
    {
    public:
        virtual ~ScanBackend() = default;
        virtual std::string Name() const = 0;
        virtual ScanResult Scan(const common::Ipv4Range &range) = 0;
    };

    struct AvailableBackend
    {
        std::shared_ptr<ScanBackend> handle;
    };

    struct UnavailableBackend
    {
        std::string name;
        std::string reason;
    };

    // Whether a backend can be used is decided once, when the slot is built.
    using BackendSlot = std::variant<AvailableBackend, UnavailableBackend>;

    struct SlotNameVisitor
    {
        std::string operator()(const AvailableBackend &slot) const { return slot.handle->Name(); }
        std::string operator()(const UnavailableBackend &slot) const { return slot.name; }
    };

    inline std::string SlotName(const BackendSlot &slot)
    {
        return std::visit(SlotNameVisitor{}, slot);
    }

    inline std::shared_ptr<ScanBackend> SlotHandle(const BackendSlot &slot)
    {
        if (const auto *available = std::get_if<AvailableBackend>(&slot))
            return available->handle;
        return nullptr;
    }
}
