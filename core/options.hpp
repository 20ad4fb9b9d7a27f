#pragma once
#include "handler.hpp"
#include "method.hpp"
#include "route.hpp"
#include <boost/core/noncopyable.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace junction
{
namespace config
{
struct Document;
}

class Options: boost::noncopyable
{
public:
	struct Error: std::runtime_error
	{
		explicit Error(const std::string& s):
			runtime_error("options error: " + s) {}
	};

	struct LogTypes
	{
		enum class Severity {
			error,
			warning,
			info,
			debug,
			trace,
		};

		struct Console {};
		struct File { std::string path; };

		struct MessagesLog
		{
			std::variant<Console, File> dest;
			Severity level = Severity::info;
		};
	};

	struct Group;

	struct Route
	{
		// none: every supported method
		std::optional<Method> method;
		std::string path;
		ControllerRef handler;
	};

	using Entry = std::variant<Route, Group>;

	struct Group
	{
		std::string prefix;
		std::vector<Entry> entries;
	};

	Options() = default;
	explicit Options(const config::Document& doc);

	LogTypes::MessagesLog log = { LogTypes::Console{}, LogTypes::Severity::info };
	LiteralSyntax literals = LiteralSyntax::escaped;
	std::vector<Entry> routes;
	std::optional<ControllerRef> not_found;
};
}
