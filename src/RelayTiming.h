/*
This is free and unencumbered software released into the public domain.

Anyone is free to copy, modify, publish, use, compile, sell, or distribute this software, either in source code form or as a compiled binary, for any purpose, commercial or non-commercial, and by any means.

In jurisdictions that recognize copyright laws, the author or authors of this software dedicate any and all copyright interest in the software to the public domain. We make this dedication for the benefit of the public at large and to the detriment of our heirs and successors. We intend this dedication to be an overt act of relinquishment in perpetuity of all present and future rights to this software under copyright law.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

For more information, please refer to https://unlicense.org
*/
#pragma once
#include <iostream>
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <vector>
#include <chrono>
#include <cstdint>
#include <concepts>

namespace relay
{
	namespace chron = std::chrono;
	using Millis_t = chron::milliseconds;
	using FloatMillis_t = chron::duration<double, std::milli>;
	using SteadyClock_t = chron::steady_clock;
	using Fn_t = std::function<void()>;
	using ScheduleHandle_t = uint64_t;

	template<typename T>
	using SmallVector_t = std::vector<T>;

	/**
	 * \brief	Source of monotonically non-decreasing elapsed time, in (fractional) milliseconds.
	 */
	class TimeSource
	{
	public:
		virtual ~TimeSource() = default;
		[[nodiscard]] virtual auto Now() const noexcept -> FloatMillis_t = 0;
	};

	/**
	 * \brief	Elapsed time since construction, measured on the steady clock.
	 */
	class SteadyTimeSource final : public TimeSource
	{
		SteadyClock_t::time_point m_origin{ SteadyClock_t::now() };
	public:
		[[nodiscard]] auto Now() const noexcept -> FloatMillis_t override
		{
			return chron::duration_cast<FloatMillis_t>(SteadyClock_t::now() - m_origin);
		}
	};

	/**
	* \brief	DelayTimer manages a non-blocking time delay measured against a TimeSource, it provides functions such as IsElapsed() and Reset(...)
	* \remarks	A zero or negative delay is elapsed immediately. The TimeSource must outlive the timer.
	*/
	class DelayTimer
	{
		const TimeSource* m_source;
		FloatMillis_t m_start_time;
		Millis_t m_delayTime{};
		mutable bool m_has_fired{ false };
	public:
		DelayTimer() = delete;
		DelayTimer(const TimeSource& source, const Millis_t duration) noexcept
			: m_source(&source), m_start_time(source.Now()), m_delayTime(duration) { }
		DelayTimer(const DelayTimer& other) = default;
		DelayTimer(DelayTimer&& other) = default;
		DelayTimer& operator=(const DelayTimer& other) = default;
		DelayTimer& operator=(DelayTimer&& other) = default;
		~DelayTimer() = default;
		/**
		 * \brief	Operator<< overload for ostream specialization, writes more detailed delay details for debugging.
		 */
		friend std::ostream& operator<<(std::ostream& os, const DelayTimer& obj) noexcept
		{
			os << "[DelayTimer]" << '\n'
				<< "m_start_time:" << obj.m_start_time.count() << "ms" << '\n'
				<< "m_delayTime:" << obj.m_delayTime.count() << "ms" << '\n'
				<< "m_has_fired:" << obj.m_has_fired << '\n'
				<< "[/DelayTimer]";
			return os;
		}
		/**
		 * \brief	Check for elapsed.
		 * \return	true if timer has elapsed, false otherwise
		 */
		[[nodiscard]]
		bool IsElapsed() const noexcept
		{
			if (m_source->Now() >= GetDueTime())
			{
				m_has_fired = true;
				return true;
			}
			return false;
		}
		/**
		 * \brief	Reset timer with a new delay, starting from the current time.
		 */
		void Reset(const Millis_t delay) noexcept
		{
			m_start_time = m_source->Now();
			m_has_fired = false;
			m_delayTime = { delay };
		}
		/**
		 * \brief	Reset timer to last used duration value for a new start point.
		 */
		void Reset() noexcept
		{
			m_start_time = m_source->Now();
			m_has_fired = false;
		}
		[[nodiscard]] auto GetTimerPeriod() const noexcept -> Millis_t
		{
			return m_delayTime;
		}
		[[nodiscard]] auto GetDueTime() const noexcept -> FloatMillis_t
		{
			return m_start_time + m_delayTime;
		}
		[[nodiscard]] bool HasFired() const noexcept
		{
			return m_has_fired;
		}
	};
	static_assert(std::copyable<DelayTimer>);
	static_assert(std::movable<DelayTimer>);

	/**
	 * \brief	Deferred execution facility, used by history playback.
	 */
	class Scheduler
	{
	public:
		virtual ~Scheduler() = default;
		/**
		 * \brief	Run the callback once, no sooner than 'delay' from now. A non-positive delay runs as soon as possible.
		 * \return	Handle which may be passed to Cancel(...)
		 */
		virtual auto ScheduleAfter(Millis_t delay, Fn_t callback) -> ScheduleHandle_t = 0;
		/**
		 * \return	true if the call was still pending and is now removed.
		 */
		virtual bool Cancel(ScheduleHandle_t handle) = 0;
	};

	/**
	 * \brief	Cooperative single-threaded scheduler. The host loop calls RunDue() periodically, callbacks fire on the calling thread.
	 * \remarks	Due callbacks fire in order of due time, then scheduling order. Callbacks scheduled while RunDue() is firing wait for the next call.
	 */
	class PollingScheduler final : public Scheduler
	{
		struct PendingCall
		{
			ScheduleHandle_t Handle{};
			DelayTimer Timer;
			Fn_t Callback;
		};

		const TimeSource* m_source;
		SmallVector_t<PendingCall> m_pending;
		ScheduleHandle_t m_nextHandle{ 1 };
	public:
		PollingScheduler() = delete;
		explicit PollingScheduler(const TimeSource& source) noexcept : m_source(&source) { }

		auto ScheduleAfter(const Millis_t delay, Fn_t callback) -> ScheduleHandle_t override
		{
			if (!callback)
				throw std::invalid_argument("Exception: Empty callback given to PollingScheduler!");

			const auto handle = m_nextHandle++;
			m_pending.push_back(PendingCall{ handle, DelayTimer{ *m_source, delay }, std::move(callback) });
			return handle;
		}

		bool Cancel(const ScheduleHandle_t handle) override
		{
			const auto findResult = std::ranges::find(m_pending, handle, &PendingCall::Handle);
			if (findResult == std::ranges::end(m_pending))
				return false;
			m_pending.erase(findResult);
			return true;
		}

		/**
		 * \brief	Fires every pending callback whose delay has elapsed.
		 * \return	Number of callbacks fired.
		 */
		auto RunDue() -> std::size_t
		{
			// Anything scheduled from inside a callback gets a handle at or above this boundary.
			const auto boundary = m_nextHandle;
			std::size_t firedCount{};
			while (true)
			{
				auto nextDue = std::ranges::end(m_pending);
				for (auto it = std::ranges::begin(m_pending); it != std::ranges::end(m_pending); ++it)
				{
					if (it->Handle >= boundary || !it->Timer.IsElapsed())
						continue;
					if (nextDue == std::ranges::end(m_pending) || IsEarlier(*it, *nextDue))
						nextDue = it;
				}
				if (nextDue == std::ranges::end(m_pending))
					break;

				// Removed before firing, the callback may schedule or cancel.
				auto callback = std::move(nextDue->Callback);
				m_pending.erase(nextDue);
				callback();
				++firedCount;
			}
			return firedCount;
		}

		[[nodiscard]] auto Pending() const noexcept -> std::size_t
		{
			return m_pending.size();
		}
	private:
		[[nodiscard]] static bool IsEarlier(const PendingCall& lhs, const PendingCall& rhs) noexcept
		{
			if (lhs.Timer.GetDueTime() != rhs.Timer.GetDueTime())
				return lhs.Timer.GetDueTime() < rhs.Timer.GetDueTime();
			return lhs.Handle < rhs.Handle;
		}
	};
	static_assert(std::movable<PollingScheduler>);
}
