#include "route_table.hpp"
#include <algorithm>

namespace junction
{
auto RouteTable::add(Route route) -> const Route&
{
	auto& list = lists[static_cast<std::size_t>(route.method)];
	return list.emplace_back(std::move(route));
}

auto RouteTable::operator[](Method m) const noexcept -> const RouteList&
{
	return lists[static_cast<std::size_t>(m)];
}

auto RouteTable::find(Method m, const RoutePattern& pattern) const noexcept -> const Route*
{
	auto& list = (*this)[m];
	auto found = std::find_if(list.begin(), list.end(),
		[&pattern](const Route& r) { return r.pattern == pattern; });
	return found == list.end() ? nullptr : &*found;
}

auto RouteTable::size() const noexcept -> std::size_t
{
	std::size_t n = 0;
	for (auto& list : lists)
		n += list.size();
	return n;
}
}
