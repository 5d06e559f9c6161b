#pragma once

#include <stdexcept>
#include <string>

namespace NSignals {

    /// Базовое исключение библиотеки сигналов.
    class TSignalError: public std::runtime_error {
    public:
        explicit TSignalError(const std::string& Message)
            : std::runtime_error(Message) {
        }
    };

    /// Тип сигнала не может быть получен из хаба (не объявлен).
    class TSignalConfigurationError: public TSignalError {
    public:
        explicit TSignalConfigurationError(const std::string& Message)
            : TSignalError(Message) {
        }
    };

    /// Операция недопустима в текущем состоянии диспетчеризации
    /// (повторный вход в Dispatch, очистка хаба во время Dispatch).
    class TSignalStateError: public TSignalError {
    public:
        explicit TSignalStateError(const std::string& Message)
            : TSignalError(Message) {
        }
    };

} // namespace NSignals
