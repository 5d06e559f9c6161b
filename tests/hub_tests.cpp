#include <gtest/gtest.h>

#include <source_location>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <vector>

#include "signals/Signals.hpp"

using namespace NSignals;

namespace {

    struct TPlayerJoinedSignal: TSignal<int> {};

    struct TPlayerLeftSignal: TSignal<int> {};

    struct TRoundStartedSignal: TSignal<> {};

    struct TUndeclaredSignal: TSignal<> {};

    /// Считает созданные экземпляры.
    struct TCountedSignal: TSignal<> {
        inline static int Constructed = 0;

        TCountedSignal() {
            ++Constructed;
        }
    };

    struct TBrokenSignal: TSignal<> {
        TBrokenSignal() {
            throw std::runtime_error("cannot construct signal");
        }
    };

    /// Снимает наблюдатель после каждого теста.
    class SignalObserverTest: public ::testing::Test {
    protected:
        void TearDown() override {
            SetDispatchObserver(nullptr);
        }
    };

} // namespace

TEST(SignalHub, GetReturnsSameInstance) {
    TSignalHub Hub;

    auto& First = Hub.Get<TPlayerJoinedSignal>();
    auto& Second = Hub.Get<TPlayerJoinedSignal>();

    EXPECT_EQ(&First, &Second);
    EXPECT_EQ(Hub.Count(), 1u);
}

TEST(SignalHub, CountDistinctTypes) {
    TSignalHub Hub;
    EXPECT_EQ(Hub.Count(), 0u);

    Hub.Get<TPlayerJoinedSignal>();
    Hub.Get<TPlayerLeftSignal>();
    Hub.Get<TRoundStartedSignal>();
    Hub.Get<TPlayerLeftSignal>();

    EXPECT_EQ(Hub.Count(), 3u);
}

TEST(SignalHub, ClearDropsInstances) {
    TSignalHub Hub;
    const int Before = TCountedSignal::Constructed;

    Hub.Get<TCountedSignal>();
    Hub.Get<TCountedSignal>();
    EXPECT_EQ(TCountedSignal::Constructed, Before + 1);

    Hub.Clear();
    EXPECT_EQ(Hub.Count(), 0u);
    EXPECT_FALSE(Hub.Contains<TCountedSignal>());

    Hub.Get<TCountedSignal>();
    EXPECT_EQ(TCountedSignal::Constructed, Before + 2);
    EXPECT_EQ(Hub.Count(), 1u);
}

TEST(SignalHub, ListenersSurviveRepeatedLookups) {
    TSignalHub Hub;
    int Count = 0;

    Hub.Get<TPlayerJoinedSignal>().AddListener([&Count](int PlayerId) {
        Count += PlayerId;
    });
    Hub.Get<TPlayerJoinedSignal>().Dispatch(5);

    EXPECT_EQ(Count, 5);
}

TEST(SignalHub, HubsAreIndependent) {
    TSignalHub First;
    TSignalHub Second;

    First.Get<TPlayerJoinedSignal>().AddListener([](int) {});

    EXPECT_NE(&First.Get<TPlayerJoinedSignal>(), &Second.Get<TPlayerJoinedSignal>());
    EXPECT_EQ(Second.Get<TPlayerJoinedSignal>().ListenerCount(), 0u);
}

TEST(SignalHub, FindDoesNotCreate) {
    TSignalHub Hub;

    EXPECT_EQ(Hub.Find<TPlayerJoinedSignal>(), nullptr);
    EXPECT_FALSE(Hub.Contains<TPlayerJoinedSignal>());
    EXPECT_EQ(Hub.Count(), 0u);

    auto& Signal = Hub.Get<TPlayerJoinedSignal>();
    EXPECT_EQ(Hub.Find<TPlayerJoinedSignal>(), &Signal);
    EXPECT_TRUE(Hub.Contains<TPlayerJoinedSignal>());
}

TEST(SignalHub, FindOnConstHub) {
    TSignalHub Hub;
    const TSignalHub& View = Hub;

    EXPECT_EQ(View.Find<TPlayerJoinedSignal>(), nullptr);

    auto& Signal = Hub.Get<TPlayerJoinedSignal>();
    Signal.AddListener([](int) {});

    const TPlayerJoinedSignal* Found = View.Find<TPlayerJoinedSignal>();
    ASSERT_EQ(Found, &Signal);
    EXPECT_EQ(Found->ListenerCount(), 1u);
    EXPECT_EQ(View.Count(), 1u);
}

TEST(SignalHub, ScopedListenerDisconnectedBeforeClear) {
    TSignalHub Hub;
    int Count = 0;

    auto Scoped = Hub.Get<TPlayerJoinedSignal>().AddScopedListener([&](int) { ++Count; });
    Hub.Get<TPlayerJoinedSignal>().Dispatch(1);
    EXPECT_EQ(Count, 1);

    Scoped.Disconnect();
    EXPECT_EQ(Scoped.GetId(), 0u);
    Hub.Clear();

    EXPECT_EQ(Hub.Count(), 0u);
    EXPECT_EQ(Hub.Get<TPlayerJoinedSignal>().ListenerCount(), 0u);
}

TEST(SignalHub, RuntimeLookupOfUndeclaredTypeFails) {
    TSignalHub Hub;

    EXPECT_THROW(Hub.Get(std::type_index(typeid(TUndeclaredSignal))), TSignalConfigurationError);
    EXPECT_EQ(Hub.Count(), 0u);

    // Хаб остаётся рабочим
    Hub.Get<TRoundStartedSignal>();
    EXPECT_EQ(Hub.Count(), 1u);
}

TEST(SignalHub, RuntimeLookupOfDeclaredType) {
    TSignalHub Hub;
    Hub.Declare<TRoundStartedSignal>();
    EXPECT_EQ(Hub.Count(), 0u);

    TSignalBase& Base = Hub.Get(std::type_index(typeid(TRoundStartedSignal)));
    EXPECT_EQ(Hub.Count(), 1u);
    EXPECT_EQ(Base.Type(), std::type_index(typeid(TRoundStartedSignal)));
    EXPECT_EQ(&Base, &Hub.Get<TRoundStartedSignal>());
}

TEST(SignalHub, RuntimeLookupAfterTypedGet) {
    TSignalHub Hub;
    auto& Signal = Hub.Get<TPlayerLeftSignal>();

    EXPECT_EQ(&Hub.Get(std::type_index(typeid(TPlayerLeftSignal))), &Signal);

    // Фабрика запоминается и после очистки
    Hub.Clear();
    Hub.Get(std::type_index(typeid(TPlayerLeftSignal)));
    EXPECT_TRUE(Hub.Contains<TPlayerLeftSignal>());
}

TEST(SignalHub, ThrowingConstructorLeavesHubUnchanged) {
    TSignalHub Hub;
    Hub.Get<TPlayerJoinedSignal>();

    EXPECT_THROW(Hub.Get<TBrokenSignal>(), std::runtime_error);
    EXPECT_EQ(Hub.Count(), 1u);
    EXPECT_FALSE(Hub.Contains<TBrokenSignal>());
    EXPECT_TRUE(Hub.Contains<TPlayerJoinedSignal>());
}

TEST(SignalHub, ClearDuringDispatchIsRejected) {
    TSignalHub Hub;
    bool Thrown = false;

    auto& Signal = Hub.Get<TRoundStartedSignal>();
    Signal.AddListener([&]() {
        try {
            Hub.Clear();
        } catch (const TSignalStateError&) {
            Thrown = true;
        }
    });

    Signal.Dispatch();

    EXPECT_TRUE(Thrown);
    EXPECT_EQ(Hub.Count(), 1u);
    EXPECT_EQ(Signal.State(), ESignalState::Idle);
}

TEST(SignalHub, GlobalHub) {
    ResetGlobalHub();

    auto& Signal = Get<TPlayerJoinedSignal>();
    EXPECT_EQ(&Signal, &GlobalHub().Get<TPlayerJoinedSignal>());
    EXPECT_EQ(GlobalHub().Count(), 1u);

    SetDispatchObserver([](const TSignalBase&, const std::source_location&) {});
    ResetGlobalHub();

    EXPECT_EQ(GlobalHub().Count(), 0u);
    EXPECT_FALSE(GetDispatchObserver());
}

TEST_F(SignalObserverTest, SeesEveryDispatchBeforeListeners) {
    TSignalHub Hub;
    std::vector<std::string> Log;

    SetDispatchObserver([&](const TSignalBase& Signal, const std::source_location&) {
        EXPECT_EQ(Signal.Type(), std::type_index(typeid(TPlayerJoinedSignal)));
        Log.emplace_back("observer");
    });

    auto& Signal = Hub.Get<TPlayerJoinedSignal>();
    Signal.AddListener([&](int) {
        Log.emplace_back("listener");
    });

    Signal.Dispatch(1);
    Signal.Dispatch(2);

    EXPECT_EQ(Log, (std::vector<std::string>{"observer", "listener", "observer", "listener"}));
}

TEST_F(SignalObserverTest, ReceivesCallerContext) {
    TSignalHub Hub;
    unsigned Line = 0;
    std::string File;

    SetDispatchObserver([&](const TSignalBase&, const std::source_location& Caller) {
        Line = Caller.line();
        File = Caller.file_name();
    });

    auto& Signal = Hub.Get<TPlayerJoinedSignal>();
    const auto Here = std::source_location::current(); SIGNALS_DISPATCH(Signal, 7);

    EXPECT_EQ(Line, Here.line());
    EXPECT_EQ(File, Here.file_name());
}

TEST_F(SignalObserverTest, RemovedObserverIsNotCalled) {
    TSignalHub Hub;
    int Calls = 0;

    SetDispatchObserver([&](const TSignalBase&, const std::source_location&) {
        ++Calls;
    });

    auto& Signal = Hub.Get<TRoundStartedSignal>();
    Signal.Dispatch();
    EXPECT_EQ(Calls, 1);

    SetDispatchObserver(nullptr);
    Signal.Dispatch();
    EXPECT_EQ(Calls, 1);
}

TEST_F(SignalObserverTest, ThrowingObserverDoesNotChangeOutcome) {
    TSignalHub Hub;
    int Count = 0;

    SetDispatchObserver([](const TSignalBase&, const std::source_location&) {
        throw std::runtime_error("observer failed");
    });

    auto& Signal = Hub.Get<TPlayerJoinedSignal>();
    Signal.AddListener([&](int) { ++Count; });
    Signal.AddListener([&](int) { ++Count; });

    EXPECT_NO_THROW(Signal.Dispatch(0));
    EXPECT_EQ(Count, 2);
    EXPECT_EQ(Signal.State(), ESignalState::Idle);
}

TEST_F(SignalObserverTest, ObserverMayRemoveItself) {
    TSignalHub Hub;
    int Calls = 0;

    SetDispatchObserver([&](const TSignalBase&, const std::source_location&) {
        ++Calls;
        SetDispatchObserver(nullptr);
    });

    auto& Signal = Hub.Get<TRoundStartedSignal>();
    Signal.Dispatch();
    Signal.Dispatch();

    EXPECT_EQ(Calls, 1);
}

TEST_F(SignalObserverTest, ObserverCannotRedispatchSameSignal) {
    TSignalHub Hub;
    bool Rejected = false;
    bool Redispatched = false;
    int Seen = 0;

    auto& Signal = Hub.Get<TPlayerJoinedSignal>();
    Signal.AddListener([&](int Value) { Seen += Value; });

    SetDispatchObserver([&](const TSignalBase& Source, const std::source_location&) {
        EXPECT_TRUE(Source.IsDispatching());
        if (Redispatched) {
            return;
        }
        Redispatched = true;
        try {
            Signal.Dispatch(100);
        } catch (const TSignalStateError&) {
            Rejected = true;
        }
    });

    Signal.Dispatch(1);

    EXPECT_TRUE(Rejected);
    EXPECT_EQ(Seen, 1);
    EXPECT_EQ(Signal.State(), ESignalState::Idle);
    EXPECT_FALSE(Signal.IsDispatching());

    // Следующий обход получает свои аргументы
    Signal.Dispatch(2);
    EXPECT_EQ(Seen, 3);
}

TEST_F(SignalObserverTest, ObserverCannotClearHubOfDispatchingSignal) {
    TSignalHub Hub;
    bool Rejected = false;
    int Count = 0;

    auto& Signal = Hub.Get<TRoundStartedSignal>();
    Signal.AddListener([&]() { ++Count; });

    SetDispatchObserver([&](const TSignalBase&, const std::source_location&) {
        try {
            Hub.Clear();
        } catch (const TSignalStateError&) {
            Rejected = true;
        }
    });

    Signal.Dispatch();

    EXPECT_TRUE(Rejected);
    EXPECT_EQ(Hub.Count(), 1u);
    EXPECT_EQ(Count, 1);
    EXPECT_EQ(Signal.State(), ESignalState::Idle);
}

TEST_F(SignalObserverTest, ObserverMayDispatchOtherSignal) {
    TSignalHub Hub;
    std::vector<std::string> Log;

    auto& Joined = Hub.Get<TPlayerJoinedSignal>();
    auto& Round = Hub.Get<TRoundStartedSignal>();
    Joined.AddListener([&](int) { Log.emplace_back("joined"); });
    Round.AddListener([&]() { Log.emplace_back("round"); });

    SetDispatchObserver([&](const TSignalBase& Source, const std::source_location&) {
        if (Source.Type() == std::type_index(typeid(TPlayerJoinedSignal))) {
            Round.Dispatch();
        }
    });

    Joined.Dispatch(4);

    EXPECT_EQ(Log, (std::vector<std::string>{"round", "joined"}));
    EXPECT_EQ(Joined.State(), ESignalState::Idle);
    EXPECT_EQ(Round.State(), ESignalState::Idle);
}
