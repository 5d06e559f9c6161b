#pragma once

#include <cstddef>

namespace NSignals {

    /// Идентификатор слушателя сигнала.
    using TListenerId = std::size_t;

    /// Состояние диспетчеризации сигнала.
    enum class ESignalState { Idle,
                              Running,
                              Paused,
                              Consumed };

    namespace NInternal {

        /// Упорядоченный набор слушателей, который обходит ядро диспетчеризации.
        /// Реализуется конкретными вариантами сигналов.
        class TIListenerSource {
        public:
            virtual ~TIListenerSource() = default;

            /// Количество зарегистрированных слушателей.
            /// Меняется только при добавлении или удалении слушателя.
            [[nodiscard]] virtual std::size_t ListenerCount() const = 0;

        protected:
            /// Вызвать слушателя с индексом Index (Index < ListenerCount()).
            virtual void Invoke(std::size_t Index) = 0;
        };

    } // namespace NInternal
} // namespace NSignals
