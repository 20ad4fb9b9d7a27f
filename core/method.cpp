#include "method.hpp"

namespace junction
{
namespace
{
constexpr std::array method_names = {
	"GET"sv,
	"POST"sv,
	"PUT"sv,
	"PATCH"sv,
	"DELETE"sv,
};

static_assert(method_names.size() == all_methods.size());
}

auto to_string(Method m) noexcept -> string_view
{
	return method_names[static_cast<std::size_t>(m)];
}

auto parse_method(string_view name) noexcept -> std::optional<Method>
{
	for (auto m : all_methods)
		if (to_string(m) == name)
			return m;
	return {};
}

auto operator<<(std::ostream& stream, Method m) -> std::ostream&
{
	return stream << to_string(m);
}
}
