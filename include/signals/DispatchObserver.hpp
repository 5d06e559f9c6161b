#pragma once

#include <functional>
#include <source_location>

namespace NSignals {

    class TSignalBase;

    /// Диагностический наблюдатель: вызывается в начале каждой диспетчеризации
    /// любого сигнала процесса, до первого слушателя.
    using TDispatchObserver =
        std::function<void(const TSignalBase& Signal, const std::source_location& Caller)>;

    /// Установить наблюдатель. Пустая функция отключает наблюдение.
    void SetDispatchObserver(TDispatchObserver Observer);

    TDispatchObserver GetDispatchObserver();

    namespace NInternal {

        /// Исключения наблюдателя логируются и не влияют на диспетчеризацию.
        void NotifyDispatchObserver(const TSignalBase& Signal,
                                    const std::source_location& Caller);

    } // namespace NInternal
} // namespace NSignals
