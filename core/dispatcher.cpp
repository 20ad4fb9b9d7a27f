#include "dispatcher.hpp"
#include "method.hpp"
#include "route.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <locale>

namespace junction
{
namespace
{
constexpr bool is_scheme_char(char c) noexcept
{
	return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
		|| (c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.';
}

// Offset of the authority in an absolute URL, npos for other targets
auto authority_offset(string_view target) noexcept -> std::size_t
{
	if (target.substr(0, 2) == "//"sv)
		return 2;

	auto colon = target.find("://"sv);
	if (colon == string_view::npos || colon == 0)
		return string_view::npos;
	for (std::size_t i = 0; i < colon; ++i)
		if (!is_scheme_char(target[i]))
			return string_view::npos;
	return colon + 3;
}
}

auto effective_method(const Request& req) -> std::string
{
	if (req.method == "POST" && req.method_override)
		return boost::algorithm::to_upper_copy(*req.method_override, std::locale::classic());
	return req.method;
}

auto request_path(string_view target) noexcept -> string_view
{
	if (auto end = target.find_first_of("?#"sv); end != string_view::npos)
		target = target.substr(0, end);

	if (auto authority = authority_offset(target); authority != string_view::npos) {
		auto slash = target.find('/', authority);
		return slash == string_view::npos ? string_view{} : target.substr(slash);
	}
	return target;
}

auto Dispatcher::resolve(const Request& req) const -> DispatchResult
{
	return resolve(effective_method(req), request_path(req.target));
}

auto Dispatcher::resolve(string_view method, string_view path) const -> DispatchResult
{
	auto m = parse_method(method);
	if (!m)
		return NotFound{};

	for (auto& route : table[*m])
		if (auto params = route.pattern.match(path))
			return Match{ &route, std::move(*params) };

	return NotFound{};
}
}
