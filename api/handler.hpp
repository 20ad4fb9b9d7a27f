#pragma once
#include "error.hpp"
#include "params.hpp"
#include "response.hpp"
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace junction
{
using Action = std::function<Response(const Arguments& args)>;

// Handler resolved at dispatch time: an action of a controller created
// through the ControllerRegistry
struct ControllerRef
{
	std::string controller;
	std::string action;
};

inline auto operator==(const ControllerRef& lhs, const ControllerRef& rhs) noexcept -> bool
{
	return lhs.controller == rhs.controller && lhs.action == rhs.action;
}

inline auto operator!=(const ControllerRef& lhs, const ControllerRef& rhs) noexcept -> bool
{
	return !(lhs == rhs);
}

inline auto operator<<(std::ostream& stream, const ControllerRef& ref) -> std::ostream&
{
	return stream << ref.controller << "::" << ref.action;
}

namespace detail
{
template <typename T>
struct CallableTraits: CallableTraits<decltype(&T::operator())> {};

template <typename R, typename... Args>
struct CallableTraits<R (*)(Args...)>
{
	static constexpr std::size_t arity = sizeof...(Args);
};

template <typename C, typename R, typename... Args>
struct CallableTraits<R (C::*)(Args...)>
{
	static constexpr std::size_t arity = sizeof...(Args);
};

template <typename C, typename R, typename... Args>
struct CallableTraits<R (C::*)(Args...) const>
{
	static constexpr std::size_t arity = sizeof...(Args);
};

template <typename T>
auto to_response(T&& result) -> Response
{
	if constexpr (std::is_same_v<std::decay_t<T>, Response>)
		return std::forward<T>(result);
	else
		return Response{ Response::Status::ok, {}, std::string{ std::forward<T>(result) } };
}

template <typename F, typename... Args>
auto call(F& f, Args&&... args) -> Response
{
	if constexpr (std::is_void_v<std::invoke_result_t<F&, Args...>>) {
		f(std::forward<Args>(args)...);
		return {};
	} else {
		return to_response(f(std::forward<Args>(args)...));
	}
}

template <typename F, std::size_t... I>
auto call_positional(F& f, [[maybe_unused]] const Arguments& args,
	std::index_sequence<I...>) -> Response
{
	return call(f, args[I]...);
}

// Adapts a callable taking N string arguments: it gets the first N
// captured values
template <std::size_t N, typename F>
auto positional(F f) -> Action
{
	return [f = std::move(f)](const Arguments& args) mutable -> Response
	{
		if (args.size() < N)
			throw HandlerError{ "action expects " + std::to_string(N)
				+ " arguments, got " + std::to_string(args.size()) };
		return call_positional(f, args, std::make_index_sequence<N>{});
	};
}
}

template <typename F>
auto make_action(F&& f) -> Action
{
	using Fn = std::decay_t<F>;

	if constexpr (std::is_invocable_v<Fn&, const Arguments&>)
		return [f = Fn(std::forward<F>(f))](const Arguments& args) mutable -> Response
		{
			return detail::call(f, args);
		};
	else
		return detail::positional<detail::CallableTraits<Fn>::arity>(Fn(std::forward<F>(f)));
}

class Handler
{
public:
	using Target = std::variant<Action, ControllerRef>;

	// Invalid handler, dispatching to it fails
	Handler() = default;
	Handler(Action action): target{ std::move(action) } {}
	Handler(ControllerRef ref): target{ std::move(ref) } {}

	template <typename F, typename = std::enable_if_t<
		!std::is_same_v<std::decay_t<F>, Handler>
		&& !std::is_same_v<std::decay_t<F>, Action>
		&& !std::is_same_v<std::decay_t<F>, ControllerRef>
		&& !std::is_same_v<std::decay_t<F>, std::nullptr_t>>>
	Handler(F&& f): target{ make_action(std::forward<F>(f)) } {}

	Handler(std::nullptr_t) noexcept {}

	auto get() const noexcept -> const Target& { return target; }
	[[nodiscard]] auto valid() const noexcept -> bool;
	// "Users::show" for controller handlers
	[[nodiscard]] auto describe() const -> std::string;

private:
	Target target;
};
}
