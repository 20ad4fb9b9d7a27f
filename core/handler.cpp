#include "handler.hpp"
#include "visitor.hpp"
#include <sstream>

namespace junction
{
auto Handler::valid() const noexcept -> bool
{
	auto action = std::get_if<Action>(&target);
	return !action || static_cast<bool>(*action);
}

auto Handler::describe() const -> std::string
{
	return std::visit(Visitor{
		[](const Action& action) -> std::string
		{
			return action ? "<closure>" : "<invalid>";
		},
		[](const ControllerRef& ref)
		{
			std::ostringstream s;
			s << ref;
			return s.str();
		},
	}, target);
}
}
