#include "controller.hpp"
#include "error.hpp"

namespace junction
{
auto Controller::find_action(string_view name) const noexcept -> const Action*
{
	auto found = actions.find(name);
	return found == actions.end() ? nullptr : &found->second;
}

auto Controller::action_names() const -> std::vector<string_view>
{
	std::vector<string_view> names;
	names.reserve(actions.size());
	for (auto& [name, action] : actions)
		names.emplace_back(name);
	return names;
}

auto Controller::expose(std::string name, Action action) -> void
{
	if (!action)
		throw HandlerError{ "empty action: " + name };
	auto [it, inserted] = actions.emplace(name, std::move(action));
	if (!inserted)
		throw HandlerError{ "already exists action with name: " + name };
}

auto ControllerRegistry::add(std::string name, Factory factory) -> void
{
	if (name.empty())
		throw RegistryError{ "empty controller name" };
	if (!factory)
		throw RegistryError{ name + ": empty factory" };
	auto [it, inserted] = factories.emplace(name, std::move(factory));
	if (!inserted)
		throw RegistryError{ "already exists controller with name: " + name };
}

auto ControllerRegistry::create(string_view name) const -> std::unique_ptr<Controller>
{
	auto found = factories.find(name);
	return found == factories.end() ? nullptr : found->second();
}

auto ControllerRegistry::contains(string_view name) const noexcept -> bool
{
	return factories.find(name) != factories.end();
}

auto ControllerRegistry::size() const noexcept -> int
{
	return static_cast<int>(factories.size());
}
}
