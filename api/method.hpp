#pragma once
#include "string_view.hpp"
#include <array>
#include <optional>
#include <ostream>

namespace junction
{
enum class Method
{
	get,
	post,
	put,
	patch,
	delete_,
};

constexpr std::array all_methods = {
	Method::get,
	Method::post,
	Method::put,
	Method::patch,
	Method::delete_,
};

auto to_string(Method m) noexcept -> string_view;

// Exact upper-case token only: "GET" is a method, "get" and "HEAD" are not
auto parse_method(string_view name) noexcept -> std::optional<Method>;

auto operator<<(std::ostream& stream, Method m) -> std::ostream&;
}
