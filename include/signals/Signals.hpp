#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>

#include "signals/DispatchObserver.hpp"
#include "signals/Errors.hpp"
#include "signals/Signal.hpp"
#include "signals/internal/SignalBase.hpp"

namespace NSignals {

    template <typename T>
    concept SignalConstraint =
        std::derived_from<T, TSignalBase> && std::default_initializable<T>;

    /// Хаб сигналов: по одному экземпляру на тип, создаётся при первом обращении.
    /// Не потокобезопасен.
    class TSignalHub {
    public:
        TSignalHub() = default;
        TSignalHub(const TSignalHub&) = delete;
        TSignalHub& operator=(const TSignalHub&) = delete;

        /// Экземпляр сигнала типа TSignalType. Если его ещё нет, он создаётся.
        template <SignalConstraint TSignalType>
        TSignalType& Get() {
            const std::type_index Type(typeid(TSignalType));

            auto It = Signals.find(Type);
            if (It != Signals.end()) {
                return *static_cast<TSignalType*>(It->second.get());
            }

            Declare<TSignalType>();
            auto Concrete = std::make_unique<TSignalType>();
            TSignalType& Result = *Concrete;
            Bind(Type, std::move(Concrete));
            return Result;
        }

        /// Поиск по типу, известному только во время выполнения.
        /// Тип должен быть объявлен через Declare<T>() или уже запрошен через Get<T>(),
        /// иначе бросается TSignalConfigurationError.
        TSignalBase& Get(std::type_index Type);

        /// Разрешить создание TSignalType через Get(std::type_index).
        template <SignalConstraint TSignalType>
        void Declare() {
            Factories.try_emplace(std::type_index(typeid(TSignalType)), []() -> std::unique_ptr<TSignalBase> {
                return std::make_unique<TSignalType>();
            });
        }

        /// Экземпляр без создания: nullptr, если его ещё нет.
        template <SignalConstraint TSignalType>
        TSignalType* Find() {
            auto It = Signals.find(std::type_index(typeid(TSignalType)));
            if (It == Signals.end()) {
                return nullptr;
            }
            return static_cast<TSignalType*>(It->second.get());
        }

        template <SignalConstraint TSignalType>
        const TSignalType* Find() const {
            auto It = Signals.find(std::type_index(typeid(TSignalType)));
            if (It == Signals.end()) {
                return nullptr;
            }
            return static_cast<const TSignalType*>(It->second.get());
        }

        template <SignalConstraint TSignalType>
        bool Contains() const {
            return Signals.contains(std::type_index(typeid(TSignalType)));
        }

        /// Количество созданных сигналов.
        [[nodiscard]] std::size_t Count() const noexcept {
            return Signals.size();
        }

        /// Удалить все сигналы. Ранее полученные ссылки становятся недействительными,
        /// поэтому TScopedListener этих сигналов нужно освободить или отключить заранее.
        /// Бросает TSignalStateError, если какой-либо сигнал хаба сейчас диспетчеризуется.
        void Clear();

    private:
        using TFactory = std::function<std::unique_ptr<TSignalBase>()>;

        void Bind(std::type_index Type, std::unique_ptr<TSignalBase> Signal);

        std::unordered_map<std::type_index, std::unique_ptr<TSignalBase>> Signals;
        std::unordered_map<std::type_index, TFactory> Factories;
    };

    /// Хаб по умолчанию для всего процесса.
    TSignalHub& GlobalHub();

    /// Очистить хаб по умолчанию и снять наблюдатель диспетчеризации.
    void ResetGlobalHub();

    template <SignalConstraint TSignalType>
    TSignalType& Get() {
        return GlobalHub().Get<TSignalType>();
    }

} // namespace NSignals
