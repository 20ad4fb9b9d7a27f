#include "route.hpp"
#include "error.hpp"
#include <algorithm>

namespace junction
{
namespace
{
constexpr string_view metachars = "\\^$.|?*+()[]{}"sv;

constexpr bool is_name_start(char c) noexcept
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

constexpr bool is_name_char(char c) noexcept
{
	return is_name_start(c) || (c >= '0' && c <= '9');
}

// Length of the "{name}" the string starts with, 0 if there is none
auto placeholder_length(string_view s) noexcept -> std::size_t
{
	if (s.size() < 3 || s[0] != '{' || !is_name_start(s[1]))
		return 0;

	std::size_t i = 2;
	while (i < s.size() && is_name_char(s[i]))
		++i;
	return i < s.size() && s[i] == '}' ? i + 1 : 0;
}

// Capturing groups written by hand in verbatim route text
class GroupCounter
{
public:
	auto feed(string_view text) noexcept -> void
	{
		for (std::size_t i = 0; i < text.size(); ++i) {
			const auto c = text[i];
			if (escaped) {
				escaped = false;
			} else if (c == '\\') {
				escaped = true;
			} else if (in_class) {
				in_class = c != ']';
			} else if (c == '[') {
				in_class = true;
			} else if (c == '(' && (i + 1 == text.size() || text[i + 1] != '?')) {
				++n;
			}
		}
	}

	auto count() const noexcept -> std::size_t { return n; }

private:
	std::size_t n = 0;
	bool escaped = false;
	bool in_class = false;
};

using Captures = std::vector<string_view>;

// Literal k, then placeholder k and so on up to the tail. A placeholder
// ends before the next '/' and the longest value is tried first, the way
// a greedy "([^/]+)" would. Recursion depth is the placeholder count.
auto match_parts(const std::vector<std::string>& literals, std::size_t k,
	string_view rest, Captures& caps) -> bool
{
	const string_view lit = literals[k];
	if (rest.substr(0, lit.size()) != lit)
		return false;
	rest.remove_prefix(lit.size());
	if (k + 1 == literals.size())
		return rest.empty();

	for (auto len = std::min(rest.find('/'), rest.size()); len > 0; --len) {
		caps[k] = rest.substr(0, len);
		if (match_parts(literals, k + 1, rest.substr(len), caps))
			return true;
	}
	return false;
}
}

RoutePattern::RoutePattern(const std::string& path, LiteralSyntax syntax):
	syntax{ syntax }
{
	GroupCounter counter;
	auto append_literal = [this, syntax, &counter](string_view text)
	{
		if (syntax == LiteralSyntax::verbatim) {
			counter.feed(text);
			src.append(text);
			return;
		}
		literals.emplace_back(text);
		for (auto c : text) {
			if (metachars.find(c) != string_view::npos)
				src += '\\';
			src += c;
		}
	};

	const string_view p = path;
	src = "^";
	std::size_t literal_begin = 0;
	for (std::size_t i = 0; i < p.size();) {
		const auto len = placeholder_length(p.substr(i));
		if (len == 0) {
			++i;
			continue;
		}

		append_literal(p.substr(literal_begin, i - literal_begin));

		auto name = std::string{ p.substr(i + 1, len - 2) };
		auto same_name = [&name](const Placeholder& v) { return v.name == name; };
		if (std::any_of(vars.begin(), vars.end(), same_name))
			throw RouteError{ path, "duplicate placeholder {" + name + "}" };

		const auto group = counter.count() + vars.size() + 1;
		vars.push_back({ move(name), group });
		src.append(segment);

		i += len;
		literal_begin = i;
	}
	append_literal(p.substr(literal_begin));
	src += '$';

	if (syntax == LiteralSyntax::escaped)
		return;
	try {
		re = std::regex{ src, std::regex_constants::ECMAScript | std::regex_constants::optimize };
	} catch (const std::regex_error& e) {
		throw RouteError{ path, "bad pattern " + src + ": " + e.what() };
	}
}

auto RoutePattern::match(string_view path) const -> std::optional<Params>
{
	if (syntax == LiteralSyntax::escaped) {
		Captures caps(vars.size());
		if (!match_parts(literals, 0, path, caps))
			return {};

		Params params;
		for (std::size_t i = 0; i < vars.size(); ++i)
			params.add(vars[i].name, std::string{ caps[i] });
		return params;
	}

	std::match_results<string_view::const_iterator> m;
	if (!std::regex_match(path.begin(), path.end(), m, re))
		return {};

	Params params;
	for (auto& v : vars)
		params.add(v.name, m[v.group].str());
	return params;
}

auto RoutePattern::placeholders() const -> std::vector<std::string>
{
	std::vector<std::string> names;
	names.reserve(vars.size());
	for (auto& v : vars)
		names.push_back(v.name);
	return names;
}

auto normalize_path(std::string path) -> std::string
{
	if (path.empty() || path.front() != '/')
		path.insert(path.begin(), '/');
	return path;
}
}
