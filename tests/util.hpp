#pragma once
#include "handler.hpp"
#include "request.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace junction
{
namespace test
{
// Action remembering the arguments of every call
struct Recorder
{
	auto action(std::string body = {}) -> Action
	{
		return [this, body = std::move(body)](const Arguments& args)
		{
			calls.push_back(args);
			return Response{ Response::Status::ok, {}, body };
		};
	}

	std::vector<Arguments> calls;
};

inline auto request(std::string method, std::string target,
	std::optional<std::string> method_override = std::nullopt) -> Request
{
	return { std::move(method), std::move(target), std::move(method_override) };
}
}
}
