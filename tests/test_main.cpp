#include <iostream>
#include <string>
#include <vector>
#include <chrono>

#include "test_utils.h"
#include "rand_gen.h"
#include "InputRelay.h"

// Alias table for the timed run: 'AliasCount' labels, each bound to a run of codes.
auto GetTimedRunConfig(const int AliasCount, const int CodesPerAlias) -> Relay_t::Config_t
{
	Relay_t::Config_t config;
	for (int aliasIndex{}; aliasIndex < AliasCount; ++aliasIndex)
	{
		const auto label = "action-" + std::to_string(aliasIndex);
		config.Triggers["key-down"][label] = Relay_t::MakeHandler([](TestContext& ctx) { ++ctx.Counter; });
		config.Triggers["key-up"][label] = Relay_t::MakeHandler([](TestContext& ctx) { --ctx.Counter; });
		auto& codes = config.Aliases[label];
		for (int codeIndex{}; codeIndex < CodesPerAlias; ++codeIndex)
			codes.push_back(aliasIndex * CodesPerAlias + codeIndex);
	}
	return config;
}

// Random key codes, some of which fall outside the bound range and are skipped.
auto GetInputSequence(RandomGen& rander, const std::size_t count, const int highestCode) -> std::vector<relay::InputOccurrence>
{
	std::vector<relay::InputOccurrence> occurrences;
	occurrences.reserve(count);
	for (const auto code : rander.BuildRandomVector<int32_t>(count, count, 0, highestCode))
		occurrences.push_back(GetKeyCodeOccurrence(code));
	return occurrences;
}

auto RunTestLoop(Relay_t& inputRelay, FakeTimeSource& timeSource, std::vector<relay::InputOccurrence>& dataSet)
{
	using namespace std::chrono;

	auto keyDown = *inputRelay.MakePipe("key-down", "keyCode");
	auto keyUp = *inputRelay.MakePipe("key-up", "keyCode");
	inputRelay.RestartHistory();

	// Begin clock start
	const auto startTime = steady_clock::now();

	// Run test data set
	for (auto& data : dataSet)
	{
		timeSource.Advance(milliseconds{ 1 });
		keyDown(data);
		keyUp(data);
	}

	// Compute times
	const auto totalTime = steady_clock::now() - startTime;
	return "[Time Per Occurrence]\n" + GetPrintDurationsString(totalTime / dataSet.size());
}

// Timed run
int main()
{
	constexpr int AliasCount{ 64 };
	constexpr int CodesPerAlias{ 4 };
	constexpr std::size_t DataSetSize{ 2'000 };
	constexpr std::size_t RunCount{ 15 };

	FakeTimeSource timeSource;
	relay::PollingScheduler scheduler{ timeSource };
	Relay_t inputRelay{ timeSource, scheduler, GetTimedRunConfig(AliasCount, CodesPerAlias) };

	RandomGen rander;
	auto dataSet = GetInputSequence(rander, DataSetSize, AliasCount * CodesPerAlias * 2);

	std::vector<std::string> timeStrings;
	timeStrings.reserve(RunCount);
	for (std::size_t i{}; i < RunCount; ++i)
	{
		timeStrings.push_back(RunTestLoop(inputRelay, timeSource, dataSet));
		// Every hit records a key-down and a key-up, the pair cancels out on the counter.
		AssertEqual(inputRelay.GetEventContext().Counter, 0);
		AssertEqual(inputRelay.GetHistory()->size() % 2, 0u);
	}
	AssertEqual(inputRelay.GetHistories().Size(), RunCount);

	for (const auto& timeMessage : timeStrings)
	{
		std::cout << timeMessage << '\n';
	}
	return 0;
}
