#include "options.hpp"
#include "config.hpp"
#include "visitor.hpp"
#include <unordered_map>

using std::string;

namespace junction
{
namespace
{
auto at_line(config::Line line, const string& s) -> Options::Error
{
	return Options::Error{ "line " + std::to_string(line) + ": " + s };
}

decltype(Options::LogTypes::MessagesLog::dest) parse_msg_dest(const string& s)
{
	if (s == "console")
		return Options::LogTypes::Console{};
	return Options::LogTypes::File{ s };
}

std::optional<Options::LogTypes::Severity> parse_severity(const string& s)
{
	using severity = Options::LogTypes::Severity;
	static const std::unordered_map<string, severity> severities = {
		{ "error",   severity::error },
		{ "warning", severity::warning },
		{ "info",    severity::info },
		{ "debug",   severity::debug },
		{ "trace",   severity::trace },
	};

	auto it = severities.find(s);
	if (it == severities.end())
		return std::nullopt;
	return it->second;
}

std::optional<LiteralSyntax> parse_literals(const string& s)
{
	if (s == "escaped")
		return LiteralSyntax::escaped;
	if (s == "verbatim")
		return LiteralSyntax::verbatim;
	return std::nullopt;
}

ControllerRef convert(const config::HandlerRef& h)
{
	return { h.controller, h.action };
}

Options::Route convert(const config::Route& r)
{
	Options::Route res{ std::nullopt, r.path, convert(r.handler) };
	if (r.method != "ANY") {
		res.method = parse_method(r.method);
		if (!res.method)
			throw at_line(r.line, "unsupported method: " + r.method);
	}
	return res;
}

// settings and hooks are top level only
std::vector<Options::Entry> convert_entries(const std::vector<config::Statement>& body)
{
	std::vector<Options::Entry> res;
	res.reserve(body.size());
	for (auto& stmt : body)
		std::visit(Visitor{
			[&](const config::Route& r) {
				res.push_back(convert(r));
			},
			[&](const config::Group& g) {
				res.push_back(Options::Group{ g.prefix, convert_entries(g.body) });
			},
			[](const config::Setting& s) {
				throw at_line(s.line, "setting inside a group: " + s.key);
			},
			[](const config::Hook& h) {
				throw at_line(h.line, "hook inside a group: " + h.name);
			},
		}, stmt);
	return res;
}
}

Options::Options(const config::Document& doc)
{
	auto apply = [this](const config::Setting& s)
	{
		if (s.key == "log.messages") {
			log.dest = parse_msg_dest(s.value);
		} else if (s.key == "log.level") {
			auto level = parse_severity(s.value);
			if (!level)
				throw at_line(s.line, "unknown severity: " + s.value);
			log.level = *level;
		} else if (s.key == "literals") {
			auto syntax = parse_literals(s.value);
			if (!syntax)
				throw at_line(s.line, "unknown literal syntax: " + s.value);
			literals = *syntax;
		} else {
			throw at_line(s.line, "unknown setting: " + s.key);
		}
	};

	for (auto& stmt : doc.statements)
		std::visit(Visitor{
			apply,
			[this](const config::Route& r) {
				routes.push_back(convert(r));
			},
			[this](const config::Group& g) {
				routes.push_back(Group{ g.prefix, convert_entries(g.body) });
			},
			[this](const config::Hook& h) {
				if (h.name != "not_found")
					throw at_line(h.line, "unknown hook: " + h.name);
				if (not_found)
					throw at_line(h.line, "not_found handler already set");
				not_found = convert(h.handler);
			},
		}, stmt);
}
}
