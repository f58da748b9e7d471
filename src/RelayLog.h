/*
This is free and unencumbered software released into the public domain.

Anyone is free to copy, modify, publish, use, compile, sell, or distribute this software, either in source code form or as a compiled binary, for any purpose, commercial or non-commercial, and by any means.

In jurisdictions that recognize copyright laws, the author or authors of this software dedicate any and all copyright interest in the software to the public domain. We make this dedication for the benefit of the public at large and to the detriment of our heirs and successors. We intend this dedication to be an overt act of relinquishment in perpetuity of all present and future rights to this software under copyright law.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

For more information, please refer to https://unlicense.org
*/
#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace relay::logging
{
	inline constexpr const char* LoggerName{ "relay" };

	namespace detail
	{
		inline auto LoggerSlot() -> std::shared_ptr<spdlog::logger>&
		{
			static std::shared_ptr<spdlog::logger> logger;
			return logger;
		}
	}

	/**
	 * \brief	Shared "relay" logger, created with a colour stdout sink on first use (or picked up from the spdlog registry if the host made one).
	 */
	[[nodiscard]] inline auto Get() -> std::shared_ptr<spdlog::logger>
	{
		auto& logger = detail::LoggerSlot();
		if (!logger)
		{
			logger = spdlog::get(LoggerName);
			if (!logger)
				logger = spdlog::stdout_color_mt(LoggerName);
		}
		return logger;
	}

	// Replaces the logger handed to relays constructed afterwards.
	inline void Set(std::shared_ptr<spdlog::logger> logger)
	{
		detail::LoggerSlot() = std::move(logger);
	}
}
