#include <iostream>
#include <string>
#include <vector>
#include <array>
#include <chrono>
#include <thread>
#include <memory>
#include <string_view>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "InputRelay.h"

/**
 * \brief Some constants that are not configurable.
 */
struct KeyboardSettings
{
    /**
     * \brief Delay each iteration of a polling loop, short enough to not miss information, long enough to not waste CPU cycles.
     */
    static constexpr relay::Millis_t PollingLoopDelay{ 1 };

    // Browser-style key codes
    static constexpr int32_t KeyLeft{ 37 };
    static constexpr int32_t KeyUp{ 38 };
    static constexpr int32_t KeyRight{ 39 };
    static constexpr int32_t KeyDown{ 40 };
    static constexpr int32_t KeyA{ 65 };
    static constexpr int32_t KeyD{ 68 };
    static constexpr int32_t KeyS{ 83 };
    static constexpr int32_t KeyW{ 87 };
    static constexpr int32_t KeySpace{ 32 };

    // Mouse buttons
    static constexpr int32_t MouseRight{ 2 };
};

// Shared by every handler, the relay hands out the same object each call.
struct DriverContext
{
    int32_t PositionX{};
    int32_t PositionY{};
    bool IsJumping{};
    std::size_t HandledCount{};
};

using Relay_t = relay::InputRelay<DriverContext>;

struct ScriptedInput
{
    std::string_view Trigger;
    int32_t KeyCode{};
    relay::Millis_t WaitBefore{};
};

[[nodiscard]] auto GetDriverConfig() -> Relay_t::Config_t
{
    const auto moveBy = [](const int32_t dx, const int32_t dy)
    {
        return Relay_t::MakeHandler([dx, dy](DriverContext& ctx)
            {
                ctx.PositionX += dx;
                ctx.PositionY += dy;
                ++ctx.HandledCount;
            });
    };
    const auto jump = Relay_t::MakeHandler([](DriverContext& ctx) { ctx.IsJumping = true; ++ctx.HandledCount; });
    const auto land = Relay_t::MakeHandler([](DriverContext& ctx) { ctx.IsJumping = false; ++ctx.HandledCount; });
    const auto menu = Relay_t::MakeHandler([](DriverContext& ctx) { ++ctx.HandledCount; });

    return Relay_t::Config_t
    {
        .Triggers =
        {
            { "key-down", {
                { "move-left", moveBy(-1, 0) },
                { "move-right", moveBy(1, 0) },
                { "move-up", moveBy(0, -1) },
                { "move-down", moveBy(0, 1) },
                { "jump", jump } } },
            { "key-up", {
                { "jump", land } } },
            { "context-menu", {
                { "menu", menu } } }
        },
        .Aliases =
        {
            { "move-left", { KeyboardSettings::KeyLeft, KeyboardSettings::KeyA } },
            { "move-right", { KeyboardSettings::KeyRight, KeyboardSettings::KeyD } },
            { "move-up", { KeyboardSettings::KeyUp, KeyboardSettings::KeyW } },
            { "move-down", { KeyboardSettings::KeyDown, KeyboardSettings::KeyS } },
            { "jump", { KeyboardSettings::KeySpace } },
            { "menu", { KeyboardSettings::MouseRight } }
        },
        .EventContext = std::make_shared<DriverContext>()
    };
}

[[nodiscard]] auto GetScriptedInput() -> std::vector<ScriptedInput>
{
    using namespace std::chrono_literals;
    return {
        { "key-down", KeyboardSettings::KeyD, 0ms },
        { "key-down", KeyboardSettings::KeyRight, 40ms },
        { "key-down", KeyboardSettings::KeySpace, 25ms },
        { "key-up", KeyboardSettings::KeySpace, 60ms },
        { "key-down", KeyboardSettings::KeyW, 15ms },
        { "key-down", 999, 5ms }, // unbound, skipped
        { "key-down", KeyboardSettings::KeyA, 30ms },
        { "context-menu", KeyboardSettings::MouseRight, 10ms },
    };
}

void PrintContext(const std::string_view label, const DriverContext& ctx)
{
    std::cout << "[" << label << "] x:" << ctx.PositionX
        << " y:" << ctx.PositionY
        << " jumping:" << ctx.IsJumping
        << " handled:" << ctx.HandledCount << '\n';
}

int main()
{
    spdlog::set_level(spdlog::level::debug);

    relay::SteadyTimeSource timeSource;
    relay::PollingScheduler scheduler{ timeSource };
    Relay_t inputRelay{ timeSource, scheduler, GetDriverConfig() };

    auto keyDownPipe = inputRelay.MakePipe("key-down", "keyCode");
    auto keyUpPipe = inputRelay.MakePipe("key-up", "keyCode");
    auto contextMenuPipe = inputRelay.MakePipe("context-menu", "button", true);
    if (!keyDownPipe || !keyUpPipe || !contextMenuPipe)
    {
        std::cerr << "Failed to build the driver pipes!\n";
        return EXIT_FAILURE;
    }

    // Feed the scripted stream as the host event loop would.
    std::size_t suppressedDefaults{};
    for (const auto& [trigger, keyCode, waitBefore] : GetScriptedInput())
    {
        std::this_thread::sleep_for(waitBefore);
        relay::InputOccurrence occurrence
        {
            .Fields = { { "keyCode", keyCode }, { "button", keyCode } },
            .PreventDefault = [&suppressedDefaults]() { ++suppressedDefaults; }
        };
        if (trigger == "key-down")
            (*keyDownPipe)(occurrence);
        else if (trigger == "key-up")
            (*keyUpPipe)(occurrence);
        else
            (*contextMenuPipe)(occurrence);
    }
    PrintContext("live", inputRelay.GetEventContext());
    std::cout << "Recorded " << inputRelay.GetHistory()->size() << " entries, suppressed " << suppressedDefaults << " default(s).\n";
    for (const auto& [timestamp, entry] : *inputRelay.GetHistory())
        std::cout << "  " << timestamp.count() << "ms " << entry << '\n';

    // Replay into a fresh context, with the original offsets from the session start.
    const auto recorded = inputRelay.GetHistory();
    inputRelay.SetEventContext(std::make_shared<DriverContext>());
    const auto replayBegin = timeSource.Now();
    const auto handles = inputRelay.PlayHistory(*recorded);
    while (scheduler.Pending() > 0)
    {
        scheduler.RunDue();
        std::this_thread::sleep_for(KeyboardSettings::PollingLoopDelay);
    }
    const auto replayTime = timeSource.Now() - replayBegin;

    PrintContext("replay", inputRelay.GetEventContext());
    std::cout << "Replayed " << handles.size() << " entries in " << replayTime.count() << "ms, history still has "
        << inputRelay.GetHistory()->size() << " entries.\n";
    return 0;
}
