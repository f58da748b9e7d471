#pragma once
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <chrono>
#include <algorithm>
#include <source_location>
#include <cstdlib>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include "fake_time.h"
#include "InputRelay.h"

const int keyLeft = 37;
const int keyUp = 38;
const int keyA = 65;
const int keyW = 87;

// Handlers append to this, so tests can see which handler ran and in what order.
struct TestContext
{
	std::vector<std::string> Calls;
	int Counter{};
};

using Relay_t = relay::InputRelay<TestContext>;

void pretty_log(const std::string_view message,
	const std::source_location location =
	std::source_location::current())
{
	std::cout << "file: "
		<< location.file_name() << '('
		<< location.line() << ':'
		<< location.column() << ") `"
		<< location.function_name() << "`: "
		<< message << '\n';
}

void AssertEqual(const auto& lhs, const auto& rhs, const std::source_location location = std::source_location::current())
{
	if (lhs != rhs)
	{
		std::stringstream msg;
		msg << "Assertion of {" << lhs << "} == {" << rhs << "} is false. Terminating.";
		pretty_log(msg.str(), location);
		std::exit(1);
	}
}

void AssertTrue(const bool condition, const std::string_view what, const std::source_location location = std::source_location::current())
{
	if (!condition)
	{
		std::stringstream msg;
		msg << "Assertion {" << what << "} is false. Terminating.";
		pretty_log(msg.str(), location);
		std::exit(1);
	}
}

auto GetPrintDurationsString(const auto dur) -> std::string
{
	using namespace std::chrono;
	std::stringstream ss;
	ss << "Nanoseconds: " << duration_cast<nanoseconds>(dur).count() << "ns" << '\n'
		<< "Microseconds: " << duration_cast<microseconds>(dur).count() << "us" << '\n'
		<< "Milliseconds: " << duration_cast<milliseconds>(dur).count() << "ms" << '\n';
	return ss.str();
}

// Logger writing warnings (and worse) as "<level> <message>" lines into 'sink'.
auto GetCapturingLogger(std::ostringstream& sink) -> std::shared_ptr<spdlog::logger>
{
	auto logger = std::make_shared<spdlog::logger>("relay-test", std::make_shared<spdlog::sinks::ostream_sink_st>(sink));
	logger->set_pattern("%l %v");
	logger->set_level(spdlog::level::warn);
	return logger;
}

auto CountLines(const std::string& text) -> std::size_t
{
	return static_cast<std::size_t>(std::ranges::count(text, '\n'));
}

// Handler that records 'name' into the context's call list.
auto GetNamedHandler(const std::string name) -> Relay_t::HandlerRef_t
{
	return Relay_t::MakeHandler([name](TestContext& ctx)
		{
			ctx.Calls.push_back(name);
			++ctx.Counter;
		});
}

// The key-down / move-left scenario, with 'fnA' registered under the label.
auto GetMoveLeftConfig(const Relay_t::HandlerRef_t& fnA) -> Relay_t::Config_t
{
	return Relay_t::Config_t
	{
		.Triggers = { { "key-down", { { "move-left", fnA } } } },
		.Aliases = { { "move-left", { keyLeft, keyA } } }
	};
}

auto GetKeyCodeOccurrence(const int keyCode) -> relay::InputOccurrence
{
	return relay::InputOccurrence{ .Fields = { { "keyCode", keyCode } } };
}
