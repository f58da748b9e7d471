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
#include <optional>
#include <variant>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <any>
#include <cmath>
#include <chrono>
#include <type_traits>
#include <concepts>

#include <spdlog/spdlog.h>

#include "RelayTiming.h"
#include "RelayLog.h"

namespace relay
{
	using Code_t = int32_t;

	/**
	 * \brief	Key within a trigger group, either a raw input code or a human readable alias label.
	 * \remarks	A label never compares equal to a code, "37" and 37 are distinct keys.
	 */
	using TriggerKey_t = std::variant<Code_t, std::string>;

	template<typename Key_t, typename Val_t>
	using SmallFlatMap_t = std::map<Key_t, Val_t, std::less<>>;

	// Alias label to the ordered raw codes it stands for.
	using AliasMap_t = SmallFlatMap_t<std::string, SmallVector_t<Code_t>>;

	// Opaque passthrough storage, never read by dispatch.
	using RecipientMap_t = SmallFlatMap_t<std::string, std::any>;

	template<typename Context_t, typename Result_t = void>
	using Handler_t = std::function<Result_t(Context_t&)>;

	// Handler identity is the identity of the shared pointer, a null pointer is the absent handler.
	template<typename Context_t, typename Result_t = void>
	using HandlerRef_t = std::shared_ptr<const Handler_t<Context_t, Result_t>>;

	template<typename Context_t, typename Result_t = void>
	using TriggerGroup_t = std::map<TriggerKey_t, HandlerRef_t<Context_t, Result_t>>;

	template<typename Context_t, typename Result_t = void>
	using TriggerMap_t = SmallFlatMap_t<std::string, TriggerGroup_t<Context_t, Result_t>>;

	// Handlers receive a mutable reference to the one context object shared by the session.
	template<typename Context_t>
	concept EventContext_c = std::is_object_v<Context_t> && std::default_initializable<Context_t>;

	[[nodiscard]] inline auto ToString(const TriggerKey_t& key) -> std::string
	{
		if (const auto* code = std::get_if<Code_t>(&key))
			return std::to_string(*code);
		return std::get<std::string>(key);
	}

	template<typename Context_t, typename Result_t = void, typename Fn>
	[[nodiscard]] auto MakeHandler(Fn&& fn) -> HandlerRef_t<Context_t, Result_t>
	{
		return std::make_shared<const Handler_t<Context_t, Result_t>>(std::forward<Fn>(fn));
	}

	/**
	 * \brief	A recorded dispatch, the trigger group name and the key that was looked up in it.
	 */
	struct HistoryEntry
	{
		std::string Trigger;
		TriggerKey_t Code;

		friend bool operator==(const HistoryEntry& lhs, const HistoryEntry& rhs) = default;
		friend std::ostream& operator<<(std::ostream& os, const HistoryEntry& obj)
		{
			os << "[" << obj.Trigger << ":" << ToString(obj.Code) << "]";
			return os;
		}
	};
	static_assert(std::copyable<HistoryEntry>);
	static_assert(std::movable<HistoryEntry>);

	/**
	 * \brief	Timestamp (rounded milliseconds on the relay's TimeSource) to entry. Entries sharing a timestamp keep their insertion order.
	 */
	using History_t = std::multimap<Millis_t, HistoryEntry>;
	using HistoryRef_t = std::shared_ptr<const History_t>;

	/**
	 * \brief	Past histories, positionally and (optionally) by name. A named history is also present positionally.
	 */
	struct HistoryArchive
	{
		SmallVector_t<HistoryRef_t> Positional{};
		SmallFlatMap_t<std::string, HistoryRef_t> Named{};

		[[nodiscard]] auto At(const std::size_t index) const -> HistoryRef_t
		{
			return index < Positional.size() ? Positional[index] : nullptr;
		}
		[[nodiscard]] auto Find(const std::string_view name) const -> HistoryRef_t
		{
			const auto findResult = Named.find(name);
			return findResult != Named.cend() ? findResult->second : nullptr;
		}
		[[nodiscard]] auto Size() const noexcept -> std::size_t
		{
			return Positional.size();
		}
	};
	static_assert(std::copyable<HistoryArchive>);

	/**
	 * \brief	A raw input occurrence as delivered by the host, before it is reduced to a key.
	 */
	struct InputOccurrence
	{
		// Labeled fields, e.g. "keyCode" -> 37, read when a pipe is made with a code field.
		SmallFlatMap_t<std::string, TriggerKey_t> Fields{};
		// The occurrence itself as a key, read when a pipe is made without a code field.
		std::optional<TriggerKey_t> Key{};
		// Host default-handling suppression, optional.
		Fn_t PreventDefault{};

		[[nodiscard]] auto GetField(const std::string_view label) const -> std::optional<TriggerKey_t>
		{
			const auto findResult = Fields.find(label);
			if (findResult == Fields.cend())
				return {};
			return findResult->second;
		}
	};

	/**
	 * \brief	Event caller argument, a handler to call as-is.
	 */
	template<typename Context_t, typename Result_t = void>
	struct DirectHandler
	{
		HandlerRef_t<Context_t, Result_t> Handler;
	};

	/**
	 * \brief	Event caller argument, a handler to be looked up as triggers[Trigger][Code] at call time.
	 */
	struct AliasReference
	{
		std::string Trigger;
		TriggerKey_t Code;
	};

	template<typename Context_t, typename Result_t = void>
	using HandlerCall_t = std::variant<DirectHandler<Context_t, Result_t>, AliasReference>;

	/**
	 * \brief	Configuration replaced wholesale by InputRelay::Reset(...). Every member is optional.
	 */
	template<typename Context_t, typename Result_t = void>
	struct RelayConfig
	{
		TriggerMap_t<Context_t, Result_t> Triggers{};
		RecipientMap_t Recipients{};
		AliasMap_t Aliases{};
		// Default constructed context when null.
		std::shared_ptr<Context_t> EventContext{};
		bool Recording{ true };
	};

#pragma region Algos_For_Relay

	/**
	 * \brief	For each alias, for each trigger group, for each code of the alias: group[code] = group[label].
	 * \remarks	A label missing from a group copies the absent (null) handler into the code, replacing whatever the code held.
	 *	Idempotent. Groups mutated afterwards are not re-resolved.
	 */
	template<typename Group_t>
	void ResolveAliases(SmallFlatMap_t<std::string, Group_t>& triggers, const AliasMap_t& aliases)
	{
		using Value_t = typename Group_t::mapped_type;

		for (const auto& [label, codes] : aliases)
		{
			const TriggerKey_t labelKey{ label };
			for (auto& [triggerName, group] : triggers)
			{
				const auto labelResult = group.find(labelKey);
				const Value_t canonical = labelResult != group.cend() ? labelResult->second : Value_t{};
				for (const auto code : codes)
					group.insert_or_assign(TriggerKey_t{ code }, canonical);
			}
		}
	}

	/**
	 * \brief	Checks the alias invariant: every code of every alias maps to the identical handler as the alias label, in every group.
	 */
	template<typename Group_t>
	[[nodiscard]] bool AreAliasesResolved(const SmallFlatMap_t<std::string, Group_t>& triggers, const AliasMap_t& aliases)
	{
		const auto handlerAt = [](const Group_t& group, const TriggerKey_t& key) -> typename Group_t::mapped_type
		{
			const auto findResult = group.find(key);
			return findResult != group.cend() ? findResult->second : typename Group_t::mapped_type{};
		};

		for (const auto& [label, codes] : aliases)
		{
			for (const auto& [triggerName, group] : triggers)
			{
				const auto canonical = handlerAt(group, TriggerKey_t{ label });
				const bool isCodeDiverged = std::ranges::any_of(codes, [&](const Code_t code)
					{
						return handlerAt(group, TriggerKey_t{ code }) != canonical;
					});
				if (isCodeDiverged)
					return false;
			}
		}
		return true;
	}

	// History timestamps are whole milliseconds, half rounds up.
	[[nodiscard]] inline auto RoundToMillis(const FloatMillis_t time) noexcept -> Millis_t
	{
		return Millis_t{ std::llround(time.count()) };
	}

#pragma endregion Algos_For_Relay

	/**
	 * \brief	Input dispatch middleman: resolves aliases into trigger groups, builds dispatching pipes over them, records every dispatch
	 *	with a timestamp and replays recorded histories through the injected Scheduler.
	 * \remarks	Not copyable, not movable. Pipes and scheduled replays refer back to the relay, it must outlive them.
	 *	The TimeSource and Scheduler are not owned and must outlive the relay. Single-threaded.
	 */
	template<EventContext_c Context_t, typename Result_t = void>
	class InputRelay
	{
	public:
		using Handler_t = relay::Handler_t<Context_t, Result_t>;
		using HandlerRef_t = relay::HandlerRef_t<Context_t, Result_t>;
		using TriggerGroup_t = relay::TriggerGroup_t<Context_t, Result_t>;
		using TriggerMap_t = relay::TriggerMap_t<Context_t, Result_t>;
		using Config_t = RelayConfig<Context_t, Result_t>;
		using DirectHandler_t = DirectHandler<Context_t, Result_t>;
		using HandlerCall_t = relay::HandlerCall_t<Context_t, Result_t>;
		// Whether the handler ran for void handlers, the handler's result otherwise.
		using CallResult_t = std::conditional_t<std::is_void_v<Result_t>, bool, std::optional<Result_t>>;

		/**
		 * \brief	Dispatch function bound to one trigger group, fed with raw input occurrences.
		 */
		class Pipe
		{
			friend class InputRelay;

			InputRelay* m_relay;
			std::string m_trigger;
			std::optional<std::string> m_codeField;
			bool m_preventDefault{};

			Pipe(InputRelay& relay, std::string trigger, std::optional<std::string> codeField, const bool preventDefault)
				: m_relay(&relay),
				m_trigger(std::move(trigger)),
				m_codeField(std::move(codeField)),
				m_preventDefault(preventDefault)
			{
			}
		public:
			auto operator()(InputOccurrence& occurrence) const -> CallResult_t
			{
				if (m_preventDefault && occurrence.PreventDefault)
					occurrence.PreventDefault();

				const auto key = m_codeField ? occurrence.GetField(*m_codeField) : occurrence.Key;
				if (!key)
					return CallResult_t{};
				return m_relay->DispatchKey(m_trigger, *key);
			}

			auto operator()(InputOccurrence&& occurrence) const -> CallResult_t
			{
				return (*this)(occurrence);
			}

			// The occurrence is the key itself. A bare key has no labeled fields to extract a code from.
			auto operator()(const TriggerKey_t& key) const -> CallResult_t
			{
				if (m_codeField)
					return CallResult_t{};
				return m_relay->DispatchKey(m_trigger, key);
			}

			[[nodiscard]] auto GetTrigger() const noexcept -> const std::string&
			{
				return m_trigger;
			}
			[[nodiscard]] auto GetCodeField() const noexcept -> const std::optional<std::string>&
			{
				return m_codeField;
			}
			[[nodiscard]] bool IsPreventingDefault() const noexcept
			{
				return m_preventDefault;
			}
		};
		static_assert(std::copyable<Pipe>);

	private:
		const TimeSource* m_timeSource;
		Scheduler* m_scheduler;
		std::shared_ptr<spdlog::logger> m_logger;

		TriggerMap_t m_triggers;
		RecipientMap_t m_recipients;
		AliasMap_t m_aliases;
		std::shared_ptr<Context_t> m_eventContext;
		bool m_recording{ true };

		std::shared_ptr<History_t> m_history;
		HistoryArchive m_archive;
		FloatMillis_t m_sessionStart{};

	public:
		InputRelay() = delete;
		InputRelay(const InputRelay& other) = delete;
		auto operator=(const InputRelay& other) -> InputRelay& = delete;
		InputRelay(InputRelay&& other) = delete;
		auto operator=(InputRelay&& other) -> InputRelay& = delete;
		~InputRelay() = default;

		/**
		 * \brief	Constructs and applies the initial configuration, as by Reset(config).
		 * \param logger	Logger for warnings and diagnostics, the shared "relay" logger when null.
		 */
		InputRelay(
			const TimeSource& timeSource,
			Scheduler& scheduler,
			Config_t config = {},
			std::shared_ptr<spdlog::logger> logger = {})
			: m_timeSource(&timeSource),
			m_scheduler(&scheduler),
			m_logger(logger ? std::move(logger) : logging::Get())
		{
			Reset(std::move(config));
		}

		[[nodiscard]] static auto MakeHandler(Handler_t fn) -> HandlerRef_t
		{
			return relay::MakeHandler<Context_t, Result_t>(std::move(fn));
		}

	public:
		/**
		 * \brief	Replaces all configuration, clears the archive, resolves aliases and starts a new, empty history.
		 */
		void Reset(Config_t config = {})
		{
			m_triggers = std::move(config.Triggers);
			m_recipients = std::move(config.Recipients);
			m_aliases = std::move(config.Aliases);
			m_eventContext = config.EventContext ? std::move(config.EventContext) : std::make_shared<Context_t>();
			m_recording = config.Recording;
			m_archive = {};

			ResolveAliases(m_triggers, m_aliases);

			m_logger->debug("Reset with {} trigger group(s), {} alias(es), recording {}.", m_triggers.size(), m_aliases.size(), m_recording);
			RestartHistory(false);
		}

		/**
		 * \brief	Starts a new, empty history and resets the session start time to now.
		 * \param keepHistory	Whether the outgoing history is appended to the archive first.
		 */
		void RestartHistory(const bool keepHistory = true)
		{
			if (keepHistory && m_history)
				m_archive.Positional.push_back(m_history);

			m_history = std::make_shared<History_t>();
			m_sessionStart = m_timeSource->Now();
			m_logger->debug("History restarted at {:.3f}ms, {} archived.", m_sessionStart.count(), m_archive.Size());
		}

		/**
		 * \brief	Appends the current history to the archive, and under 'name' too if one is given.
		 * \remarks	The archive shares the history, it keeps receiving entries until RestartHistory(...) is called.
		 */
		void SaveHistory(std::optional<std::string> name = {})
		{
			m_archive.Positional.push_back(m_history);
			if (name)
				m_archive.Named.insert_or_assign(std::move(*name), m_history);
		}

		[[nodiscard]] auto GetHistory() const noexcept -> HistoryRef_t
		{
			return m_history;
		}
		[[nodiscard]] auto GetHistory(const std::size_t index) const -> HistoryRef_t
		{
			return m_archive.At(index);
		}
		[[nodiscard]] auto GetHistory(const std::string_view name) const -> HistoryRef_t
		{
			return m_archive.Find(name);
		}
		[[nodiscard]] auto GetHistories() const noexcept -> const HistoryArchive&
		{
			return m_archive;
		}

		[[nodiscard]] bool GetRecording() const noexcept
		{
			return m_recording;
		}
		void SetRecording(const bool recording) noexcept
		{
			m_recording = recording;
		}

		[[nodiscard]] auto GetEventContext() const noexcept -> Context_t&
		{
			return *m_eventContext;
		}
		void SetEventContext(std::shared_ptr<Context_t> eventContext)
		{
			m_eventContext = eventContext ? std::move(eventContext) : std::make_shared<Context_t>();
		}

		[[nodiscard]] auto GetTriggers() const noexcept -> const TriggerMap_t&
		{
			return m_triggers;
		}
		[[nodiscard]] auto GetAliases() const noexcept -> const AliasMap_t&
		{
			return m_aliases;
		}
		[[nodiscard]] auto GetRecipients() const noexcept -> const RecipientMap_t&
		{
			return m_recipients;
		}
		[[nodiscard]] auto GetRecipients() noexcept -> RecipientMap_t&
		{
			return m_recipients;
		}
		[[nodiscard]] auto GetSessionStart() const noexcept -> FloatMillis_t
		{
			return m_sessionStart;
		}

		/**
		 * \brief	Creates a dispatch function for one trigger group.
		 * \param trigger	Name of the trigger group the pipe dispatches into.
		 * \param codeField	If provided, the key is read from this labeled field of each occurrence.
		 * \param preventDefault	Whether the occurrence's default handling is suppressed before dispatch.
		 * \returns	Empty optional (and a warning) if no trigger group has that name.
		 */
		[[nodiscard]] auto MakePipe(
			const std::string_view trigger,
			std::optional<std::string> codeField = {},
			const bool preventDefault = false) -> std::optional<Pipe>
		{
			if (!m_triggers.contains(trigger))
			{
				m_logger->warn("No trigger of label '{}' has been defined.", trigger);
				return {};
			}
			return Pipe{ *this, std::string{ trigger }, std::move(codeField), preventDefault };
		}

		/**
		 * \brief	Invokes a handler with the shared event context.
		 * \param call	Either the handler itself, or a trigger and key to look it up by.
		 * \returns	Empty result (and a warning) if the handler is blank.
		 */
		auto CallEvent(const HandlerCall_t& call) -> CallResult_t
		{
			HandlerRef_t handler;
			if (const auto* direct = std::get_if<DirectHandler_t>(&call))
			{
				handler = direct->Handler;
			}
			else if (const auto* reference = std::get_if<AliasReference>(&call))
			{
				handler = FindHandler(reference->Trigger, reference->Code);
			}

			if (!handler || !*handler)
			{
				m_logger->warn("Blank event given, ignoring it.");
				return CallResult_t{};
			}

			// Keeps the context alive should the handler replace it.
			const auto context = m_eventContext;
			if constexpr (std::is_void_v<Result_t>)
			{
				(*handler)(*context);
				return true;
			}
			else
			{
				return CallResult_t{ (*handler)(*context) };
			}
		}

		/**
		 * \brief	Schedules the replay of a history: each entry is called at its recorded offset from the session start.
		 * \remarks	Replays call the handler directly, they are never recorded. Order follows the history's timestamp order.
		 * \returns	Scheduler handles, one per entry, in history order.
		 */
		auto PlayHistory(const History_t& history) -> SmallVector_t<ScheduleHandle_t>
		{
			SmallVector_t<ScheduleHandle_t> handles;
			handles.reserve(history.size());
			for (const auto& [timestamp, entry] : history)
			{
				const auto delay = RoundToMillis(FloatMillis_t{ timestamp } - m_sessionStart);
				handles.push_back(m_scheduler->ScheduleAfter(delay, [this, call = AliasReference{ entry.Trigger, entry.Code }]()
					{
						CallEvent(call);
					}));
			}
			m_logger->debug("Scheduled replay of {} history entries.", handles.size());
			return handles;
		}

		auto PlayHistory() -> SmallVector_t<ScheduleHandle_t>
		{
			// The active history may be replaced by a handler, hold on to it.
			const auto history = m_history;
			return PlayHistory(*history);
		}

	private:
		[[nodiscard]] auto FindHandler(const std::string_view trigger, const TriggerKey_t& key) const -> HandlerRef_t
		{
			const auto groupResult = m_triggers.find(trigger);
			if (groupResult == m_triggers.cend())
				return {};
			const auto handlerResult = groupResult->second.find(key);
			if (handlerResult == groupResult->second.cend())
				return {};
			return handlerResult->second;
		}

		// Keys with no handler bound are skipped without a warning, unlike blank handlers given to CallEvent(...).
		auto DispatchKey(const std::string& trigger, const TriggerKey_t& key) -> CallResult_t
		{
			auto handler = FindHandler(trigger, key);
			if (!handler)
				return CallResult_t{};

			if (m_recording)
				RecordEntry(trigger, key);

			return CallEvent(DirectHandler_t{ std::move(handler) });
		}

		void RecordEntry(const std::string& trigger, const TriggerKey_t& key)
		{
			const auto timestamp = RoundToMillis(m_timeSource->Now());
			m_history->emplace(timestamp, HistoryEntry{ trigger, key });
			m_logger->trace("Recorded {}:{} at {}ms.", trigger, ToString(key), timestamp.count());
		}
	};
}
