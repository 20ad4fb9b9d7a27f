#include "params.hpp"
#include <algorithm>
#include <stdexcept>

namespace junction
{
auto Params::add(std::string name, std::string value) -> void
{
	vals.emplace_back(move(name), move(value));
}

auto Params::find(string_view name) const noexcept -> const std::string*
{
	auto found = std::find_if(vals.begin(), vals.end(),
		[name](const value_type& v) { return v.first == name; });
	return found == vals.end() ? nullptr : &found->second;
}

auto Params::at(string_view name) const -> const std::string&
{
	auto value = find(name);
	if (!value)
		throw std::out_of_range{ "no route parameter: " + std::string{ name } };
	return *value;
}

auto Params::values() const -> Arguments
{
	Arguments args;
	args.reserve(vals.size());
	for (auto& [name, value] : vals)
		args.push_back(value);
	return args;
}

auto operator<<(std::ostream& stream, const Params& params) -> std::ostream&
{
	stream << "{";
	auto sep = ""sv;
	for (auto& [name, value] : params) {
		stream << sep << name << ": \"" << value << "\"";
		sep = ", "sv;
	}
	return stream << "}";
}
}
