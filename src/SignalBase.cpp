#include "signals/internal/SignalBase.hpp"

#include <cstdlib>
#include <memory>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

#include <fmt/format.h>

#include "signals/DispatchObserver.hpp"
#include "signals/Errors.hpp"
#include "signals/Logging.hpp"

namespace NSignals {

    namespace {

        std::string Demangle(const char* Mangled) {
#if defined(__GNUG__)
            int Status = 0;
            std::unique_ptr<char, decltype(&std::free)> Demangled(
                abi::__cxa_demangle(Mangled, nullptr, nullptr, &Status),
                &std::free);
            if (Status == 0 && Demangled) {
                return Demangled.get();
            }
#endif
            return Mangled;
        }

    } // namespace

    std::string_view ToString(ESignalState State) noexcept {
        switch (State) {
            case ESignalState::Idle:
                return "Idle";
            case ESignalState::Running:
                return "Running";
            case ESignalState::Paused:
                return "Paused";
            case ESignalState::Consumed:
                return "Consumed";
        }
        return "Unknown";
    }

    /// RAII-счётчик вложенных циклов: корректно уменьшается и при исключении
    /// из слушателя.
    class TSignalBase::TLoopGuard {
    public:
        explicit TLoopGuard(std::size_t& Depth)
            : DepthRef(Depth) {
            ++DepthRef;
        }

        ~TLoopGuard() {
            --DepthRef;
        }

        TLoopGuard(const TLoopGuard&) = delete;
        TLoopGuard& operator=(const TLoopGuard&) = delete;

    private:
        std::size_t& DepthRef;
    };

    void TSignalBase::Pause() {
        if (StateV != ESignalState::Running) {
            return;
        }

        StateV = ESignalState::Paused;
        NLog::Logger()->trace("{}: paused at index {}", Name(), CurrentIndexV);
    }

    void TSignalBase::Continue() {
        if (StateV != ESignalState::Paused) {
            return;
        }

        NLog::Logger()->trace("{}: continued after index {}", Name(), CurrentIndexV);

        // Слушатель, вызвавший Pause, считается обработанным.
        ++CurrentIndexV;
        StateV = ESignalState::Running;
        Run();
    }

    void TSignalBase::Consume() {
        if (StateV != ESignalState::Running) {
            return;
        }

        StateV = ESignalState::Consumed;
        NLog::Logger()->trace("{}: consumed at index {}", Name(), CurrentIndexV);
    }

    std::type_index TSignalBase::Type() const {
        return std::type_index(typeid(*this));
    }

    const std::string& TSignalBase::Name() const {
        if (NameV.empty()) {
            NameV = Demangle(typeid(*this).name());
        }
        return NameV;
    }

    std::string TSignalBase::ToString() const {
        return fmt::format("Signal {}: {} Listeners, State {}, Index {}",
                           Name(), ListenerCount(), NSignals::ToString(StateV), CurrentIndexV);
    }

    void TSignalBase::ThrowIfDispatching() const {
        if (!IsDispatching()) {
            return;
        }

        const std::string Message = fmt::format(
            "{}: dispatch requested while a dispatch of the same signal is executing "
            "(state {}, index {})",
            Name(), NSignals::ToString(StateV), CurrentIndexV);
        NLog::Logger()->error(Message);
        throw TSignalStateError(Message);
    }

    void TSignalBase::StartDispatch(const std::source_location& Caller) {
        ThrowIfDispatching();

        if (StateV == ESignalState::Paused || StateV == ESignalState::Running) {
            NLog::Logger()->warn("{}: abandoning unfinished dispatch (state {}, index {})",
                                 Name(), NSignals::ToString(StateV), CurrentIndexV);
        }

        // Наблюдатель видит сигнал занятым: повторный запуск и очистка хаба из него отклоняются
        {
            TLoopGuard Guard(LoopDepth);
            NInternal::NotifyDispatchObserver(*this, Caller);
        }

        CurrentIndexV = 0;
        StateV = ESignalState::Running;
        Run();
    }

    void TSignalBase::OnListenerInsertedAt(std::size_t Index) {
        if (StateV == ESignalState::Idle) {
            return;
        }

        // Вставленный до текущей позиции слушатель в этом обходе не вызывается.
        if (static_cast<std::ptrdiff_t>(Index) <= CurrentIndexV) {
            ++CurrentIndexV;
        }
    }

    void TSignalBase::OnListenerRemovedAt(std::size_t Index) {
        if (StateV == ESignalState::Idle) {
            return;
        }

        if (static_cast<std::ptrdiff_t>(Index) <= CurrentIndexV) {
            --CurrentIndexV;
        }
    }

    void TSignalBase::OnFinish() {
        StateV = ESignalState::Idle;
    }

    void TSignalBase::Run() {
        {
            TLoopGuard Guard(LoopDepth);

            // Итеративно: глубина стека не зависит от числа слушателей.
            while (true) {
                if (CurrentIndexV >= static_cast<std::ptrdiff_t>(ListenerCount())) {
                    OnFinish();
                    break;
                }

                Invoke(static_cast<std::size_t>(CurrentIndexV));

                if (StateV != ESignalState::Running) {
                    break;
                }
                ++CurrentIndexV;
            }
        }

        if (LoopDepth == 0 && StateV != ESignalState::Paused) {
            OnSettled();
        }
    }

} // namespace NSignals
