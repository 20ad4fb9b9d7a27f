#pragma once
#include "method.hpp"
#include "route.hpp"
#include <array>
#include <cstddef>
#include <list>

namespace junction
{
class RouteTable
{
public:
	using RouteList = std::list<Route>;

	RouteTable() = default;

	auto add(Route route) -> const Route&;

	// Routes of the method in registration order
	[[nodiscard]] auto operator[](Method m) const noexcept -> const RouteList&;
	// First route of the method with the same pattern, if any
	[[nodiscard]] auto find(Method m, const RoutePattern& pattern) const noexcept -> const Route*;

	[[nodiscard]] auto size() const noexcept -> std::size_t;
	[[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

private:
	std::array<RouteList, all_methods.size()> lists;
};
}
