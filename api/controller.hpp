#pragma once
#include "handler.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace junction
{
// Base class for handlers referenced as "Controller::action". A controller
// publishes its actions from its constructor:
//
//	Users() { expose("show", &Users::show); }
//
class Controller: boost::noncopyable
{
public:
	Controller() = default;
	virtual ~Controller() = default;

	[[nodiscard]] auto find_action(string_view name) const noexcept -> const Action*;
	[[nodiscard]] auto action_names() const -> std::vector<string_view>;

protected:
	// Member taking N strings: called with the first N captured values
	template <typename C, typename R, typename... Args>
	auto expose(std::string name, R (C::*fn)(Args...)) -> void;

	// Member taking the whole argument list
	template <typename C, typename R>
	auto expose(std::string name, R (C::*fn)(const Arguments&)) -> void;

	auto expose(std::string name, Action action) -> void;

private:
	std::map<std::string, Action, std::less<>> actions;
};

template <typename C, typename R, typename... Args>
auto Controller::expose(std::string name, R (C::*fn)(Args...)) -> void
{
	auto self = static_cast<C*>(this);
	expose(std::move(name), detail::positional<sizeof...(Args)>(
		[self, fn](const auto&... args) { return (self->*fn)(args...); }));
}

template <typename C, typename R>
auto Controller::expose(std::string name, R (C::*fn)(const Arguments&)) -> void
{
	auto self = static_cast<C*>(this);
	expose(std::move(name), make_action(
		[self, fn](const Arguments& args) { return (self->*fn)(args); }));
}

class ControllerRegistry: boost::noncopyable
{
public:
	using Factory = std::function<std::unique_ptr<Controller>()>;

	ControllerRegistry() = default;

	// throws RegistryError on empty factory or name conflict
	auto add(std::string name, Factory factory) -> void;

	template <typename T>
	auto add(std::string name) -> void
	{
		add(std::move(name), [] { return std::make_unique<T>(); });
	}

	// New instance, null when there is no such controller
	[[nodiscard]] auto create(string_view name) const -> std::unique_ptr<Controller>;
	[[nodiscard]] auto contains(string_view name) const noexcept -> bool;
	auto size() const noexcept -> int;

private:
	std::map<std::string, Factory, std::less<>> factories;
};
}
