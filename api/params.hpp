#pragma once
#include "string_view.hpp"
#include <initializer_list>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace junction
{
// Positional handler arguments
using Arguments = std::vector<std::string>;

// Values captured by route placeholders, in the order the placeholders
// appear in the route path
class Params
{
public:
	using value_type = std::pair<std::string, std::string>;
	using const_iterator = std::vector<value_type>::const_iterator;

	Params() = default;
	Params(std::initializer_list<value_type> init): vals{ init } {}

	auto add(std::string name, std::string value) -> void;

	[[nodiscard]] auto find(string_view name) const noexcept -> const std::string*;
	// throws std::out_of_range
	[[nodiscard]] auto at(string_view name) const -> const std::string&;
	[[nodiscard]] auto values() const -> Arguments;

	auto size() const noexcept -> std::size_t { return vals.size(); }
	auto empty() const noexcept -> bool { return vals.empty(); }
	auto begin() const noexcept -> const_iterator { return vals.begin(); }
	auto end() const noexcept -> const_iterator { return vals.end(); }

	friend auto operator==(const Params& lhs, const Params& rhs) noexcept -> bool
	{
		return lhs.vals == rhs.vals;
	}
	friend auto operator!=(const Params& lhs, const Params& rhs) noexcept -> bool
	{
		return !(lhs == rhs);
	}

private:
	std::vector<value_type> vals;
};

auto operator<<(std::ostream& stream, const Params& params) -> std::ostream&;
}
