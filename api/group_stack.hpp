#pragma once
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <string>
#include <vector>

namespace junction
{
// Path prefixes of the currently open route groups
class GroupStack: boost::noncopyable
{
public:
	// Keeps the prefix open while alive
	class Guard: boost::noncopyable
	{
	public:
		Guard(GroupStack& stack, string_view prefix):
			stack{ stack }
		{
			stack.prefixes.emplace_back(prefix);
		}

		~Guard()
		{
			stack.prefixes.pop_back();
		}

	private:
		GroupStack& stack;
	};

	GroupStack() = default;

	// Open prefixes concatenated in the order they were opened
	[[nodiscard]] auto prefix() const -> std::string;
	// Prefixed and normalized route path
	[[nodiscard]] auto apply(string_view path) const -> std::string;

	auto depth() const noexcept -> std::size_t { return prefixes.size(); }
	auto empty() const noexcept -> bool { return prefixes.empty(); }

private:
	std::vector<std::string> prefixes;
};
}
