#include "signals/Logging.hpp"

#include <string>
#include <utility>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace NSignals::NLog {

    namespace {

        std::shared_ptr<spdlog::logger>& Storage() {
            static std::shared_ptr<spdlog::logger> Instance;
            return Instance;
        }

        std::shared_ptr<spdlog::logger> CreateDefaultLogger() {
            const std::string Name(LoggerName);

            if (auto Existing = spdlog::get(Name)) {
                return Existing;
            }

            auto Created = spdlog::stdout_color_mt(Name);
            Created->set_level(DefaultLevel);
            Created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");

            // SPDLOG_LEVEL перекрывает уровень по умолчанию
            spdlog::cfg::load_env_levels();
            return Created;
        }

    } // namespace

    const std::shared_ptr<spdlog::logger>& Logger() {
        auto& Instance = Storage();
        if (!Instance) {
            Instance = CreateDefaultLogger();
        }
        return Instance;
    }

    void SetLogger(std::shared_ptr<spdlog::logger> NewLogger) {
        Storage() = NewLogger ? std::move(NewLogger) : CreateDefaultLogger();
    }

    void SetLevel(spdlog::level::level_enum Level) {
        Logger()->set_level(Level);
    }

} // namespace NSignals::NLog
