#include "signals/DispatchObserver.hpp"

#include <exception>
#include <utility>

#include "signals/Logging.hpp"
#include "signals/internal/SignalBase.hpp"

namespace NSignals {

    namespace {

        TDispatchObserver& ObserverStorage() {
            static TDispatchObserver Observer;
            return Observer;
        }

    } // namespace

    void SetDispatchObserver(TDispatchObserver Observer) {
        ObserverStorage() = std::move(Observer);
    }

    TDispatchObserver GetDispatchObserver() {
        return ObserverStorage();
    }

    namespace NInternal {

        void NotifyDispatchObserver(const TSignalBase& Signal,
                                    const std::source_location& Caller) {
            if (!ObserverStorage()) {
                return;
            }

            // Копия: наблюдатель может снять или заменить сам себя.
            const TDispatchObserver Observer = ObserverStorage();

            try {
                Observer(Signal, Caller);
            } catch (const std::exception& Ex) {
                NLog::Logger()->warn("dispatch observer failed for {}: {}",
                                     Signal.Name(), Ex.what());
            }
        }

    } // namespace NInternal
} // namespace NSignals
