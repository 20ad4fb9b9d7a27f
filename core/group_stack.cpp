#include "group_stack.hpp"
#include "route.hpp"

namespace junction
{
auto GroupStack::prefix() const -> std::string
{
	std::string p;
	for (auto& s : prefixes)
		p += s;
	return p;
}

auto GroupStack::apply(string_view path) const -> std::string
{
	return normalize_path(prefix().append(path));
}
}
