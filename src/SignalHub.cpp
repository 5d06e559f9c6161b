#include "signals/Signals.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "signals/Logging.hpp"

namespace NSignals {

    TSignalBase& TSignalHub::Get(std::type_index Type) {
        auto It = Signals.find(Type);
        if (It != Signals.end()) {
            return *It->second;
        }

        auto FactoryIt = Factories.find(Type);
        if (FactoryIt == Factories.end()) {
            const std::string Message =
                fmt::format("signal type '{}' is not declared in this hub", Type.name());
            NLog::Logger()->error(Message);
            throw TSignalConfigurationError(Message);
        }

        std::unique_ptr<TSignalBase> Created = FactoryIt->second();
        TSignalBase& Result = *Created;
        Bind(Type, std::move(Created));
        return Result;
    }

    void TSignalHub::Clear() {
        for (const auto& Entry : Signals) {
            if (Entry.second->IsDispatching()) {
                const std::string Message =
                    fmt::format("cannot clear signal hub: {} is dispatching", Entry.second->Name());
                NLog::Logger()->error(Message);
                throw TSignalStateError(Message);
            }
        }

        NLog::Logger()->debug("clearing signal hub ({} signals)", Signals.size());
        Signals.clear();
    }

    void TSignalHub::Bind(std::type_index Type, std::unique_ptr<TSignalBase> Signal) {
        NLog::Logger()->debug("signal {} created", Signal->Name());
        Signals.emplace(Type, std::move(Signal));
    }

    TSignalHub& GlobalHub() {
        static TSignalHub Hub;
        return Hub;
    }

    void ResetGlobalHub() {
        GlobalHub().Clear();
        SetDispatchObserver(nullptr);
    }

} // namespace NSignals
