#pragma once
#include <random>
#include <ranges>
#include <vector>
#include <concepts>
#include <limits>
#include <type_traits>
#include <algorithm>

/// <summary>
/// Implementation for RandomGen.
///	Random generation utility, as a class object, with min and max distribution value range.
///	Used to build random code streams and alias tables for the relay tests.
/// </summary>
struct RandomGen
{
	using CountType = size_t;
public:
	std::random_device rd;
	std::mt19937 randomElementGenerator{ rd() }; // seed mersenne engine
private:
	/// <typeparam name="T">Typename of values you want in the container.</typeparam>
	///	<typeparam name="X">Distribution template param to use, not less than sizeof an int</typeparam>
	/// <summary>Helper function used to fill a container</summary>
	///	<param name="containerType">some range capable container type</param>
	///	<param name="minLength">the minimum count of the type T in the filled range.</param>
	///	<param name="maxLength">the maximum count of the type T in the filled range.</param>
	///	<param name="minValue">minimum integer value used in the distribution.</param>
	///	<param name="maxValue">maximum integer value used in the distribution.</param>
	template <typename T, typename X>
		requires std::integral<T>&& std::integral<X>
	void DoGenerate(std::ranges::range auto& containerType,
		const CountType minLength,
		const CountType maxLength,
		const T minValue,
		const T maxValue)
	{
		std::uniform_int_distribution<X> distElementPossibility(minValue, maxValue);
		std::uniform_int_distribution<CountType> distLengthPossibility(minLength, maxLength);
		//the distribution uses the generator engine to get the value
		const auto tLength = static_cast<std::size_t>(distLengthPossibility(randomElementGenerator));
		containerType.resize(tLength);
		const auto GenLambda = [&]() { return static_cast<T>(distElementPossibility(randomElementGenerator)); };
		std::ranges::generate(containerType, GenLambda);
	}
public:
	/// <summary>Returns a vector of a random number of type <c>T</c> with randomized content using a uniform distribution.</summary>
	///	<param name="minLength">the minimum count of the type T in the returned vector.</param>
	///	<param name="maxLength">the maximum count of the type T in the returned vector.</param>
	///	<param name="minValue">the minimum value of an element.</param>
	///	<param name="maxValue">the maximum value of an element.</param>
	/// <returns> a vector of type T with randomized content. Empty vector on error. </returns>
	template<typename T>
		requires std::integral<T> && (!std::same_as<T, bool>)
	[[nodiscard]] auto BuildRandomVector(
		const CountType minLength,
		const CountType maxLength,
		const T minValue = std::numeric_limits<T>::min(),
		const T maxValue = std::numeric_limits<T>::max()) -> std::vector<T>
	{
		//arg error checking, returns empty vector as per description
		if (minLength > maxLength || (maxLength <= 0) || (minLength <= 0) || minValue > maxValue)
		{
			return std::vector<T>();
		}
		std::vector<T> currentBuiltVector;
		if constexpr (sizeof(T) <= sizeof(int) && std::unsigned_integral<T>)
		{
			DoGenerate<T, unsigned int>(currentBuiltVector, minLength, maxLength, minValue, maxValue);
		}
		else if constexpr (sizeof(T) <= sizeof(int) && std::signed_integral<T>)
		{
			DoGenerate<T, int>(currentBuiltVector, minLength, maxLength, minValue, maxValue);
		}
		else
		{
			DoGenerate<T, T>(currentBuiltVector, minLength, maxLength, minValue, maxValue);
		}
		return currentBuiltVector;
	}

	/// <summary>Returns a single value in the inclusive range [minValue, maxValue] using a uniform distribution.</summary>
	template<typename T>
		requires std::integral<T> && (!std::same_as<T, bool>)
	[[nodiscard]] auto BuildRandomSingleValue(const T minValue, const T maxValue) -> T
	{
		std::uniform_int_distribution<T> distElementPossibility(minValue, maxValue);
		return distElementPossibility(randomElementGenerator);
	}

	/// <summary>Returns 'count' values picked uniformly, with repetition, from 'pool'.</summary>
	template<typename T>
	[[nodiscard]] auto BuildRandomPicks(const std::vector<T>& pool, const CountType count) -> std::vector<T>
	{
		if (pool.empty())
			return {};
		std::uniform_int_distribution<CountType> distIndex(0, pool.size() - 1);
		std::vector<T> picks;
		picks.reserve(count);
		for (CountType i{}; i < count; ++i)
			picks.push_back(pool[distIndex(randomElementGenerator)]);
		return picks;
	}
};
