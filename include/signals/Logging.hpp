#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace NSignals::NLog {

    /// Имя логгера библиотеки. Уровень можно задать через окружение:
    /// SPDLOG_LEVEL=signals=debug
    inline constexpr std::string_view LoggerName = "signals";

    inline constexpr spdlog::level::level_enum DefaultLevel = spdlog::level::warn;

    /// Логгер библиотеки. Создаётся при первом обращении (цветной stdout).
    const std::shared_ptr<spdlog::logger>& Logger();

    /// Подменить логгер (например, чтобы направить сообщения в лог приложения).
    /// nullptr возвращает логгер по умолчанию.
    void SetLogger(std::shared_ptr<spdlog::logger> NewLogger);

    void SetLevel(spdlog::level::level_enum Level);

} // namespace NSignals::NLog
