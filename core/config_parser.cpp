#define BOOST_SPIRIT_X3_NO_FILESYSTEM
#include "config_parser.hpp"
#include <boost/spirit/home/x3.hpp>
#include <boost/spirit/home/x3/support/ast/position_tagged.hpp>
#include <boost/spirit/home/x3/support/ast/variant.hpp>
#include <boost/spirit/home/x3/support/utility/annotate_on_success.hpp>
#include <boost/spirit/home/x3/support/utility/error_reporting.hpp>
#include <boost/fusion/adapted/struct/adapt_struct.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

/*
	document ::= stmt*
	stmt     ::= setting | route | group | hook
	setting  ::= key = value
	route    ::= method path handler
	group    ::= group path { (route | group)* }
	hook     ::= not_found handler
	handler  ::= identifier::identifier
 */

namespace
{
namespace ast
{
namespace x3 = boost::spirit::x3;
struct Group;

struct HandlerRef : x3::position_tagged
{
	std::string controller;
	std::string action;
};

struct Setting : x3::position_tagged
{
	std::string key;
	std::string value;
};

struct Route : x3::position_tagged
{
	std::string method;
	std::string path;
	HandlerRef handler;
};

struct Hook : x3::position_tagged
{
	std::string name;
	HandlerRef handler;
};

struct Statement : x3::variant<
		Setting,
		Route,
		x3::forward_ast<Group>,
		Hook
	>,
	x3::position_tagged
{
	using base_type::base_type;
	using base_type::operator=;
};

struct Group : x3::position_tagged
{
	std::string prefix;
	std::vector<Statement> body;
};
}

namespace grammar
{
using namespace boost::spirit::x3;

struct IdentifierId {};
struct KeyId {};
struct ValueId {};
struct PathId {};
struct MethodId {};
struct HandlerId : annotate_on_success {};
struct SettingId : annotate_on_success {};
struct RouteId : annotate_on_success {};
struct GroupId : annotate_on_success {};
struct HookId : annotate_on_success {};
struct EntryId {};
struct StatementId {};
struct DocumentId {};

const rule<IdentifierId, std::string> identifier = "identifier";
const rule<KeyId, std::string> key = "key";
const rule<ValueId, std::string> value = "value";
const rule<PathId, std::string> path = "path";
const rule<MethodId, std::string> method = "method";
const rule<HandlerId, ast::HandlerRef> handler = "handler";
const rule<SettingId, ast::Setting> setting = "setting";
const rule<RouteId, ast::Route> route = "route";
const rule<GroupId, ast::Group> group = "group";
const rule<HookId, ast::Hook> hook = "hook";
const rule<EntryId, ast::Statement> entry = "entry";
const rule<StatementId, ast::Statement> statement = "statement";
const rule<DocumentId, std::vector<ast::Statement>> document = "document";

struct MethodSymbols : symbols<std::string>
{
	MethodSymbols()
	{
		add
			("get", "GET")
			("post", "POST")
			("put", "PUT")
			("patch", "PATCH")
			("delete", "DELETE")
			("any", "ANY")
			;
	}
};
const MethodSymbols method_names;

const auto name_end = !(alnum | '_');
const auto group_kw = lexeme[lit("group") >> name_end];
const auto not_found_kw = lexeme[string("not_found") >> name_end];

const auto single_quoted_string = lexeme['\'' >> *~char_('\'') >> '\''];
// a lone '{' opens a group body
const auto unquoted_string = !lexeme['{' >> !graph] >> lexeme[+graph];
const auto token = single_quoted_string | unquoted_string;

const auto skipper = space | lexeme['#' >> *(char_ - eol)];

const auto identifier_def = lexeme[(alpha | char_('_')) >> *(alnum | char_('_'))];
const auto key_def = lexeme[(alpha | char_('_')) >> *(alnum | char_("._-"))];
const auto value_def = token;
const auto path_def = token;
const auto method_def = lexeme[method_names >> name_end];
const auto handler_def = lexeme[identifier >> "::" >> identifier];
const auto setting_def = key >> '=' > value;
const auto route_def = method > path > handler;
const auto group_def = group_kw > path > '{' > *entry > '}';
const auto hook_def = not_found_kw > handler;
const auto entry_def = route | group;
const auto statement_def = setting | route | group | hook;
const auto document_def = *statement;

BOOST_SPIRIT_DEFINE(identifier, key, value, path, method, handler,
	setting, route, group, hook, entry, statement, document);
}

using Iterator = junction::string_view::const_iterator;
using ErrorHandler = grammar::error_handler<Iterator>;

auto read(const std::filesystem::path& path)
{
	std::ifstream f{ path,  std::ios::in | std::ios::binary | std::ios::ate };
	if (!f.is_open())
		throw junction::config::Error{ "can't load route file: " + path.string() };

	auto size = f.tellg();
	f.seekg(0, std::ios::beg);
	std::string data(size, 0);
	if (!f.read(data.data(), size))
		throw junction::config::Error{ "can't read route file: " + path.string() };

	return data;
}
}

BOOST_FUSION_ADAPT_STRUCT(ast::HandlerRef, controller, action);
BOOST_FUSION_ADAPT_STRUCT(ast::Setting, key, value);
BOOST_FUSION_ADAPT_STRUCT(ast::Route, method, path, handler);
BOOST_FUSION_ADAPT_STRUCT(ast::Group, prefix, body);
BOOST_FUSION_ADAPT_STRUCT(ast::Hook, name, handler);

namespace junction
{
namespace config
{
namespace
{
namespace x3 = boost::spirit::x3;

class Builder : public boost::static_visitor<Statement>
{
public:
	Builder(string_view data, const ErrorHandler& eh):
		data{ data },
		eh{ eh }
	{}

	auto build(const ast::Statement& s) const -> Statement
	{
		return boost::apply_visitor(*this, s.get());
	}

	auto operator()(const ast::Setting& s) const -> Statement
	{
		return Setting{ s.key, s.value, line_of(s) };
	}

	auto operator()(const ast::Route& r) const -> Statement
	{
		return Route{ r.method, r.path, handler(r.handler), line_of(r) };
	}

	auto operator()(const x3::forward_ast<ast::Group>& g) const -> Statement
	{
		const auto& group = g.get();
		Group res{ group.prefix, {}, line_of(group) };
		res.body.reserve(group.body.size());
		for (auto& s : group.body)
			res.body.push_back(build(s));
		return res;
	}

	auto operator()(const ast::Hook& h) const -> Statement
	{
		return Hook{ h.name, handler(h.handler), line_of(h) };
	}

private:
	static auto handler(const ast::HandlerRef& h) -> HandlerRef
	{
		return { h.controller, h.action };
	}

	auto line_of(const x3::position_tagged& node) const -> Line
	{
		auto where = eh.position_of(node).begin();
		// tagged range may start with skipped text
		while (where != data.end()) {
			if (*where == '#')
				where = std::find(where, data.end(), '\n');
			else if (std::isspace(static_cast<unsigned char>(*where)))
				++where;
			else
				break;
		}
		return 1 + static_cast<Line>(std::count(data.begin(), where, '\n'));
	}

	const string_view data;
	const ErrorHandler& eh;
};
}

File::File(const std::filesystem::path& path):
	Text{ read(path), path.string() }
{
}

auto parse(const TextView& text) -> Document
{
	const auto data = text.data();
	auto begin = data.begin();
	const auto end = data.end();

	std::stringstream error_stream{ std::ios::out };
	ErrorHandler error_handler{ begin, end, error_stream, text.filename() };

	auto make_error = [&](Iterator where, const std::string& what)
	{
		error_handler(where, what);
		return SyntaxError{ static_cast<SyntaxError::Position>(where - data.begin()),
			error_stream.str() };
	};

	auto parser = grammar::with<grammar::error_handler_tag>(std::ref(error_handler))
	[
		grammar::document
	];

	std::vector<ast::Statement> statements;
	try {
		if (!phrase_parse(begin, end, parser, grammar::skipper, statements))
			throw make_error(begin, "can't parse:");
	} catch (grammar::expectation_failure<Iterator>& e) {
		throw make_error(e.where(), "Error! Expecting " + e.which() + " here:");
	}

	if (begin != end)
		throw make_error(begin, "can't parse:");

	const Builder builder{ data, error_handler };
	Document doc;
	doc.statements.reserve(statements.size());
	for (auto& s : statements)
		doc.statements.push_back(builder.build(s));
	return doc;
}

auto parse(const Text& text) -> Document
{
	return parse(text.view());
}
}
}
