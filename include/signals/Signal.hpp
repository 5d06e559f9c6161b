#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "signals/internal/SignalBase.hpp"

/// Диспетчеризация с сохранением места вызова для наблюдателя.
#define SIGNALS_DISPATCH(Signal, ...) \
    (Signal).DispatchAt(std::source_location::current() __VA_OPT__(, ) __VA_ARGS__)

namespace NSignals {

    /// Сигнал с аргументами TArgs...
    /// Конкретные сигналы объявляются наследованием:
    ///     struct TPlayerDiedSignal: TSignal<int> {};
    template <typename... TArgs>
    class TSignal: public TSignalBase {
        static_assert((!std::is_reference_v<TArgs> && ...),
                      "signal arguments are stored by value for the whole dispatch");

    public:
        using Callback = std::function<void(const TArgs&...)>;

        /// RAII-обёртка для автоматического удаления слушателя.
        /// Хранит указатель на сигнал: её нужно уничтожить или отключить (Disconnect)
        /// до уничтожения сигнала, в том числе до TSignalHub::Clear().
        class TScopedListener {
        public:
            TScopedListener() = default;

            TScopedListener(TSignal& signal, TListenerId id)
                : Signal(&signal)
                , Id(id) {
            }

            TScopedListener(const TScopedListener&) = delete;
            TScopedListener& operator=(const TScopedListener&) = delete;

            TScopedListener(TScopedListener&& other) noexcept
                : Signal(other.Signal)
                , Id(other.Id) {
                other.Signal = nullptr;
                other.Id = 0;
            }

            TScopedListener& operator=(TScopedListener&& other) noexcept {
                if (this != &other) {
                    Disconnect();
                    Signal = other.Signal;
                    Id = other.Id;
                    other.Signal = nullptr;
                    other.Id = 0;
                }
                return *this;
            }

            ~TScopedListener() {
                Disconnect();
            }

            void Disconnect() {
                if (Signal && Id != 0) {
                    Signal->RemoveListener(Id);
                    Signal = nullptr;
                    Id = 0;
                }
            }

            [[nodiscard]] TListenerId GetId() const noexcept {
                return Id;
            }

        private:
            TSignal* Signal = nullptr;
            TListenerId Id = 0;
        };

        TSignal() = default;

        /// Добавить слушателя в конец.
        TListenerId AddListener(Callback Listener) {
            return InsertSlot(Slots.size(), std::move(Listener), false);
        }

        /// Слушатель снимается перед первым вызовом.
        TListenerId AddListenerOnce(Callback Listener) {
            return InsertSlot(Slots.size(), std::move(Listener), true);
        }

        /// Вставить слушателя в позицию Position (0..ListenerCount()).
        TListenerId InsertListener(std::size_t Position, Callback Listener) {
            if (Position > Slots.size()) {
                throw std::out_of_range("listener position is past the end of the listener list");
            }
            return InsertSlot(Position, std::move(Listener), false);
        }

        /// Добавить слушателя и вернуть владеющую им RAII-обёртку.
        [[nodiscard]] TScopedListener AddScopedListener(Callback Listener) {
            return TScopedListener(*this, AddListener(std::move(Listener)));
        }

        bool RemoveListener(TListenerId Id) {
            auto It = FindSlot(Id);
            if (It == Slots.end()) {
                return false;
            }

            const auto Index = static_cast<std::size_t>(It - Slots.cbegin());
            Slots.erase(It);
            OnListenerRemovedAt(Index);
            return true;
        }

        [[nodiscard]] bool HasListener(TListenerId Id) const {
            return FindSlot(Id) != Slots.end();
        }

        /// Удалить всех слушателей (с конца, по одному).
        void Clear() {
            while (!Slots.empty()) {
                Slots.pop_back();
                OnListenerRemovedAt(Slots.size());
            }
        }

        void Dispatch(const TArgs&... Args) {
            DispatchAt(std::source_location(), Args...);
        }

        void DispatchAt(const std::source_location& Caller, const TArgs&... Args) {
            // Аргументы текущего обхода нельзя перезаписывать.
            ThrowIfDispatching();

            Payload.emplace(Args...);
            StartDispatch(Caller);
        }

        [[nodiscard]] std::size_t ListenerCount() const override {
            return Slots.size();
        }

    protected:
        void Invoke(std::size_t Index) override {
            // Держим слот, пока идёт вызов: слушатель может удалить сам себя.
            const std::shared_ptr<TSlot> Slot = Slots[Index];

            if (Slot->IsOneShot) {
                RemoveListener(Slot->Id);
            }

            std::apply(Slot->CallbackV, *Payload);
        }

        void OnSettled() override {
            Payload.reset();
        }

    private:
        struct TSlot {
            TListenerId Id;
            Callback CallbackV;
            bool IsOneShot;

            TSlot(TListenerId id_, Callback Cb, bool OneShot)
                : Id(id_)
                , CallbackV(std::move(Cb))
                , IsOneShot(OneShot) {
            }
        };

        using TSlots = std::vector<std::shared_ptr<TSlot>>;

        TListenerId InsertSlot(std::size_t Position, Callback Listener, bool OneShot) {
            if (!Listener) {
                throw std::invalid_argument("signal listener must not be empty");
            }

            const TListenerId Id = NextId++;
            Slots.insert(Slots.begin() + static_cast<std::ptrdiff_t>(Position),
                         std::make_shared<TSlot>(Id, std::move(Listener), OneShot));
            OnListenerInsertedAt(Position);
            return Id;
        }

        typename TSlots::const_iterator FindSlot(TListenerId Id) const {
            return std::find_if(
                Slots.begin(), Slots.end(),
                [Id](const std::shared_ptr<TSlot>& slot) {
                    return slot->Id == Id;
                });
        }

        TSlots Slots;
        std::optional<std::tuple<TArgs...>> Payload;
        TListenerId NextId = 1;
    };

} // namespace NSignals
