#include <iostream>
#include <source_location>
#include <string>

#include "signals/Signals.hpp"

using namespace NSignals;

// --- Сигналы ---

struct TPlayerLoginSignal: TSignal<std::string, int> {};

struct TPhysicsTickSignal: TSignal<float> {};

struct TKeyPressSignal: TSignal<int> {};

struct TLevelLoadedSignal: TSignal<> {};

// --- Демонстрация ---

void demoOrder(TSignalHub& Hub) {
    std::cout << "\n--- Demo 1: Registration order ---\n";

    auto& KeyPress = Hub.Get<TKeyPressSignal>();

    KeyPress.AddListener([](int) {
        std::cout << "[0] Handling Input (Immediate Action)\n";
    });
    KeyPress.AddListener([](int) {
        std::cout << "[1] Handling Input (UI Update)\n";
    });
    KeyPress.AddListener([](int) {
        std::cout << "[2] Handling Input (Logging)\n";
    });

    std::cout << "Dispatching TKeyPressSignal(Space)...\n";
    KeyPress.Dispatch(32);
}

void demoRAII(TSignalHub& Hub) {
    std::cout << "\n--- Demo 2: RAII TScopedListener ---\n";

    auto& Login = Hub.Get<TPlayerLoginSignal>();
    {
        std::cout << "Entering scope.\n";
        auto Conn = Login.AddScopedListener([](const std::string& Username, int) {
            std::cout << "Player " << Username << " logged in!\n";
        });

        Login.Dispatch("Nagibator2000", 1);
        std::cout << "Leaving scope.\n";
    }

    std::cout << "Dispatching again (Should be silent).\n";
    Login.Dispatch("NoobMaster69", 2);
}

void demoOnce(TSignalHub& Hub) {
    std::cout << "\n--- Demo 3: One-Shot Listener ---\n";

    auto& Tick = Hub.Get<TPhysicsTickSignal>();
    Tick.AddListenerOnce([](float) {
        std::cout << "This runs only ONCE (Initialization)\n";
    });

    std::cout << "Tick 1:\n";
    Tick.Dispatch(0.016f);

    std::cout << "Tick 2:\n";
    Tick.Dispatch(0.016f);
}

void demoPauseAndConsume(TSignalHub& Hub) {
    std::cout << "\n--- Demo 4: Pause / Continue / Consume ---\n";

    auto& Loaded = Hub.Get<TLevelLoadedSignal>();

    Loaded.AddListener([&Loaded]() {
        std::cout << "Fade out started, pausing until it ends\n";
        Loaded.Pause();
    });
    Loaded.AddListener([&Loaded]() {
        std::cout << "Cutscene handles the level, nobody else should\n";
        Loaded.Consume();
    });
    Loaded.AddListener([]() {
        std::cout << "Never printed\n";
    });

    Loaded.Dispatch();
    std::cout << Loaded.ToString() << "\n";

    std::cout << "Fade out finished.\n";
    Loaded.Continue();
    std::cout << Loaded.ToString() << "\n";
}

void demoObserver(TSignalHub& Hub) {
    std::cout << "\n--- Demo 5: Dispatch observer ---\n";

    SetDispatchObserver([](const TSignalBase& Signal, const std::source_location& Caller) {
        std::cout << "[observer] " << Signal.Name() << " from "
                  << Caller.function_name() << ":" << Caller.line() << "\n";
    });

    auto& Tick = Hub.Get<TPhysicsTickSignal>();
    SIGNALS_DISPATCH(Tick, 0.1f);

    SetDispatchObserver(nullptr);
    Tick.Dispatch(0.1f);
}

int main() {
    TSignalHub Hub;

    demoOrder(Hub);
    demoRAII(Hub);
    demoOnce(Hub);
    demoPauseAndConsume(Hub);
    demoObserver(Hub);

    std::cout << "\nSignals in hub: " << Hub.Count() << "\n";
    std::cout << "All demos finished successfully!\n";
    return 0;
}
