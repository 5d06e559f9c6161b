#pragma once

#include <cstddef>
#include <source_location>
#include <string>
#include <string_view>
#include <typeindex>

#include "IListenerSource.hpp"

namespace NSignals {

    std::string_view ToString(ESignalState State) noexcept;

    /// Ядро диспетчеризации, общее для всех сигналов.
    ///
    /// Обходит слушателей строго по возрастанию индекса, по одному за раз.
    /// Код слушателя может вызвать Pause/Continue/Consume этого же сигнала,
    /// добавить или удалить слушателей (в том числе себя).
    /// Потокобезопасность не обеспечивается.
    class TSignalBase: public NInternal::TIListenerSource {
    public:
        ~TSignalBase() override = default;

        TSignalBase(const TSignalBase&) = delete;
        TSignalBase& operator=(const TSignalBase&) = delete;

        /// Приостановить диспетчеризацию после возврата из текущего слушателя.
        /// Действует только в состоянии Running.
        void Pause();

        /// Продолжить приостановленную диспетчеризацию со следующего слушателя.
        /// Вне состояния Paused ничего не делает.
        void Continue();

        /// Поглотить сигнал: оставшиеся слушатели не будут вызваны.
        /// Действует только в состоянии Running.
        void Consume();

        [[nodiscard]] ESignalState State() const noexcept {
            return StateV;
        }

        /// Индекс текущего (последнего обработанного) слушателя.
        /// Может быть -1, если слушатель с индексом 0 был удалён во время обхода.
        [[nodiscard]] std::ptrdiff_t CurrentIndex() const noexcept {
            return CurrentIndexV;
        }

        /// Цикл диспетчеризации этого сигнала сейчас на стеке вызовов.
        [[nodiscard]] bool IsDispatching() const noexcept {
            return LoopDepth > 0;
        }

        [[nodiscard]] std::type_index Type() const;
        [[nodiscard]] const std::string& Name() const;
        [[nodiscard]] std::string ToString() const;

    protected:
        TSignalBase() = default;

        /// Начать новую диспетчеризацию с первого слушателя.
        /// Бросает TSignalStateError, если цикл этого сигнала уже выполняется.
        void StartDispatch(const std::source_location& Caller = std::source_location());

        void ThrowIfDispatching() const;

        /// Вызываются вариантом сигнала после вставки/удаления слушателя
        /// с индексом Index. При массовом изменении - по одному разу на элемент.
        void OnListenerInsertedAt(std::size_t Index);
        void OnListenerRemovedAt(std::size_t Index);

        virtual void OnFinish();

        /// Внешний цикл завершился, и сигнал не на паузе.
        virtual void OnSettled() {
        }

    private:
        class TLoopGuard;

        void Run();

        std::ptrdiff_t CurrentIndexV = 0;
        ESignalState StateV = ESignalState::Idle;
        std::size_t LoopDepth = 0;
        mutable std::string NameV;
    };

} // namespace NSignals
