#include <gtest/gtest.h>

#include "optimlib/core/errors.hpp"
#include "optimlib/progress/channel.hpp"
#include "optimlib/progress/observers.hpp"

#include <filesystem>

using namespace optimlib::core;
using namespace optimlib::progress;

namespace {

    class CountingObserver : public IProgressObserver {
    public:
        std::string name() const override { return "counting"; }

        void onStart(const TStartEvent&) override { starts++; }
        void onStep(const TStepEvent& e) override { steps.push_back(e.iter); }
        void onBest(const TStepEvent&) override { bests++; }
        void onEnd(const TEndEvent&) override { ends++; }
        void close() override { closes++; }

        int starts = 0;
        std::vector<int> steps;
        int bests = 0;
        int ends = 0;
        int closes = 0;
    };

    class ThrowingObserver : public IProgressObserver {
    public:
        std::string name() const override { return "throwing"; }

        void onStart(const TStartEvent&) override { throw std::runtime_error("start hook broken"); }
        void onStep(const TStepEvent&) override { throw std::runtime_error("step hook broken"); }
        void onEnd(const TEndEvent&) override { throw std::runtime_error("end hook broken"); }
    };

    // Throws something that is not a std::exception
    class IntThrowingObserver : public IProgressObserver {
    public:
        std::string name() const override { return "int-throwing"; }

        void onStep(const TStepEvent&) override { throw 42; }
        void close() override { throw 7; }
    };

    TStepEvent Step(int run, int iter, bool best = false)
    {
        TStepEvent s;
        s.run_index = run;
        s.iter = iter;
        s.x = { static_cast<double>(iter) };
        s.f = 10.0 - iter;
        s.is_best = best;
        return s;
    }

    TStartEvent Start(int run)
    {
        TStartEvent e;
        e.run_index = run;
        e.x0 = { 0.0 };
        return e;
    }

    TEndEvent End(int run)
    {
        TEndEvent e;
        e.run_index = run;
        e.reason = StopReason::CONVERGED;
        return e;
    }

    // Deterministic clock for the time threshold
    struct FakeClock
    {
        double now = 0.0;

        ProgressChannel::Clock fn()
        {
            return [this]() { return now; };
        }
    };

} // namespace

TEST(ProgressChannelTest, EveryStepIsDeliveredWithoutThrottle)
{
    ProgressChannel channel;
    auto obs = std::make_shared<CountingObserver>();
    channel.subscribe(obs);

    channel.publish(Start(0));
    for (int i = 0; i < 5; i++) channel.publish(Step(0, i));
    channel.publish(End(0));

    EXPECT_EQ(obs->starts, 1);
    EXPECT_EQ(obs->steps.size(), 5u);
    EXPECT_EQ(obs->ends, 1);
    EXPECT_EQ(channel.history().size(), 5u);
    EXPECT_EQ(channel.events().size(), 7u);
}

TEST(ProgressChannelTest, UpdateEveryThinsDeliveriesButNotHistory)
{
    ProgressChannel channel;
    auto obs = std::make_shared<CountingObserver>();
    channel.subscribe(obs, TThrottle{ 0.0, 2 });

    const int n = 7;
    channel.publish(Start(0));
    for (int i = 0; i < n; i++) channel.publish(Step(0, i));
    channel.publish(End(0));

    EXPECT_LE(obs->steps.size(), static_cast<std::size_t>((n + 1) / 2));
    EXPECT_EQ(obs->steps.size(), 3u);
    EXPECT_EQ(obs->ends, 1);

    auto history = channel.history();
    ASSERT_EQ(history.size(), static_cast<std::size_t>(n));
    for (int i = 0; i < n; i++) EXPECT_EQ(history[i].iter, i);
}

TEST(ProgressChannelTest, TimeThrottleUsesTheClock)
{
    FakeClock clock;
    ProgressChannel channel(TThrottle{}, clock.fn());
    auto obs = std::make_shared<CountingObserver>();
    channel.subscribe(obs, TThrottle{ 1.0, 1 });

    channel.publish(Start(0));
    clock.now = 0.2;
    channel.publish(Step(0, 0));    // too early
    clock.now = 1.1;
    channel.publish(Step(0, 1));    // delivered
    clock.now = 1.5;
    channel.publish(Step(0, 2));    // too early again
    clock.now = 2.2;
    channel.publish(Step(0, 3));    // delivered

    EXPECT_EQ(obs->steps, (std::vector<int>{ 1, 3 }));
    EXPECT_EQ(channel.history().size(), 4u);
}

TEST(ProgressChannelTest, EitherThresholdDelivers)
{
    FakeClock clock;
    ProgressChannel channel(TThrottle{}, clock.fn());
    auto obs = std::make_shared<CountingObserver>();
    channel.subscribe(obs, TThrottle{ 100.0, 3 });

    channel.publish(Start(0));
    for (int i = 0; i < 6; i++) channel.publish(Step(0, i));
    EXPECT_EQ(obs->steps, (std::vector<int>{ 2, 5 }));

    clock.now = 200.0;
    channel.publish(Step(0, 6));
    EXPECT_EQ(obs->steps.back(), 6);
}

TEST(ProgressChannelTest, ThrottleIsPerRun)
{
    ProgressChannel channel;
    auto obs = std::make_shared<CountingObserver>();
    channel.subscribe(obs, TThrottle{ 0.0, 2 });

    channel.publish(Start(0));
    channel.publish(Start(1));
    channel.publish(Step(0, 0));
    channel.publish(Step(1, 0));
    EXPECT_TRUE(obs->steps.empty());

    channel.publish(Step(0, 1));
    channel.publish(Step(1, 1));
    EXPECT_EQ(obs->steps.size(), 2u);
}

TEST(ProgressChannelTest, BestStepsAreNotThrottled)
{
    ProgressChannel channel;
    auto obs = std::make_shared<CountingObserver>();
    channel.subscribe(obs, TThrottle{ 0.0, 10 });

    channel.publish(Start(0));
    channel.publish(Step(0, 0, true));
    channel.publish(Step(0, 1, false));
    channel.publish(Step(0, 2, true));

    EXPECT_TRUE(obs->steps.empty());
    EXPECT_EQ(obs->bests, 2);
}

TEST(ProgressChannelTest, FailingObserverDoesNotStopOthers)
{
    ProgressChannel channel;
    auto bad = std::make_shared<ThrowingObserver>();
    auto good = std::make_shared<CountingObserver>();
    channel.subscribe(bad);
    channel.subscribe(good);

    EXPECT_NO_THROW(channel.publish(Start(0)));
    EXPECT_NO_THROW(channel.publish(Step(0, 0)));
    EXPECT_NO_THROW(channel.publish(End(0)));

    EXPECT_EQ(good->starts, 1);
    EXPECT_EQ(good->steps.size(), 1u);
    EXPECT_EQ(good->ends, 1);
    EXPECT_EQ(channel.history().size(), 1u);
}

TEST(ProgressChannelTest, NonStandardThrowIsIsolated)
{
    ProgressChannel channel;
    auto bad = std::make_shared<IntThrowingObserver>();
    auto good = std::make_shared<CountingObserver>();
    channel.subscribe(bad);
    channel.subscribe(good);

    EXPECT_NO_THROW(channel.publish(Start(0)));
    EXPECT_NO_THROW(channel.publish(Step(0, 0)));
    EXPECT_NO_THROW(channel.publish(Step(0, 1)));
    EXPECT_NO_THROW(channel.close());

    EXPECT_EQ(good->steps, (std::vector<int>{ 0, 1 }));
    EXPECT_EQ(good->closes, 1);
    EXPECT_EQ(channel.history().size(), 2u);
}

TEST(ProgressChannelTest, CloseIsCalledOnce)
{
    ProgressChannel channel;
    auto obs = std::make_shared<CountingObserver>();
    channel.subscribe(obs);

    channel.close();
    channel.close();
    EXPECT_EQ(obs->closes, 1);
}

TEST(ProgressChannelTest, InvalidThrottleIsConfigurationError)
{
    EXPECT_THROW(ProgressChannel(TThrottle{ -1.0, 1 }), ConfigurationError);

    ProgressChannel channel;
    EXPECT_THROW(channel.subscribe(std::make_shared<CountingObserver>(), TThrottle{ 0.0, 0 }), ConfigurationError);
}

// -----------------------------------------------------------------------------
// Built-in observers
// -----------------------------------------------------------------------------

TEST(ConsoleObserverTest, PrintsProgressLines)
{
    std::ostringstream out;
    ProgressChannel channel;
    channel.subscribe(std::make_shared<ConsoleObserver>(out, 4));

    channel.publish(Start(0));
    channel.publish(Step(0, 0));
    channel.publish(End(0));

    const std::string text = out.str();
    EXPECT_NE(text.find("[progress]"), std::string::npos);
    EXPECT_NE(text.find("converged"), std::string::npos);
}

TEST(ConsoleObserverTest, PrecisionDoesNotLeakIntoTheStream)
{
    std::ostringstream out;
    const auto before = out.precision();

    ProgressChannel channel;
    channel.subscribe(std::make_shared<ConsoleObserver>(out, 2, true));

    channel.publish(Start(0));
    channel.publish(Step(0, 0, true));
    channel.publish(End(0));

    EXPECT_EQ(out.precision(), before);
    out << 3.14159265;
    EXPECT_NE(out.str().find("3.14159"), std::string::npos);
}

TEST(TraceObserverTest, WritesOneFilePerRunAndFinal)
{
    const auto dir = std::filesystem::temp_directory_path() / "optimlib_trace_test";
    std::filesystem::remove_all(dir);

    auto trace = std::make_shared<TraceObserver>(dir.string(), "demo");
    ProgressChannel channel;
    channel.subscribe(trace);

    for (int run = 0; run < 2; run++) {
        channel.publish(Start(run));
        for (int i = 0; i < 3; i++) channel.publish(Step(run, i));
        channel.publish(End(run));
    }
    channel.close();

    EXPECT_TRUE(std::filesystem::exists(dir / "demo_run0.csv"));
    EXPECT_TRUE(std::filesystem::exists(dir / "demo_run1.csv"));
    EXPECT_TRUE(std::filesystem::exists(dir / "demo_final.csv"));
    EXPECT_EQ(trace->written().size(), 3u);

    std::ifstream file(dir / "demo_run0.csv");
    std::string header;
    std::getline(file, header);
    EXPECT_EQ(header, "run_index,iter,f,best_f");

    std::filesystem::remove_all(dir);
}

TEST(ObserverSpecTest, ParsesDescriptorsAndResolvesThrottle)
{
    YAML::Node list = YAML::Load(R"(
        - console
        - {type: console, update_every: 5, decimals: 3}
        - {type: trace, throttle_s: 0.5, out_dir: /tmp, file_prefix: x}
    )");

    auto specs = ParseObserverSpecs(list);
    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[0].type, "console");
    EXPECT_FALSE(specs[0].update_every.has_value());
    EXPECT_EQ(*specs[1].update_every, 5);
    EXPECT_DOUBLE_EQ(*specs[2].throttle_s, 0.5);
    EXPECT_EQ(specs[2].options["file_prefix"].as<std::string>(), "x");

    ProgressChannel channel(TThrottle{ 0.0, 2 });
    SubscribeObservers(channel, specs, 6);
    EXPECT_EQ(channel.observerCount(), 3u);
}

TEST(ObserverSpecTest, UnknownTypeOrOptionIsConfigurationError)
{
    ProgressChannel channel;
    EXPECT_THROW(SubscribeObservers(channel, ParseObserverSpecs(YAML::Load("[{type: telegraph}]")), 6),
                 ConfigurationError);
    EXPECT_THROW(SubscribeObservers(channel, ParseObserverSpecs(YAML::Load("[{type: console, colour: red}]")), 6),
                 ConfigurationError);
    EXPECT_THROW(ParseObserverSpecs(YAML::Load("{type: console}")), ConfigurationError);
}
