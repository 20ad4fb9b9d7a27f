#pragma once
#include "string_view.hpp"
#include <ostream>
#include <string>

namespace junction
{
// Outcome of a handler, rendered by the HTTP layer that embeds the router
struct Response
{
	enum class Status
	{
		continue_ = 100,
		switching_protocols = 101,

		ok = 200,
		created = 201,
		accepted = 202,
		no_content = 204,

		multiple_choices = 300,
		moved_permanently = 301,
		found = 302,
		see_other = 303,

		bad_request = 400,
		unauthorized = 401,
		payment_required = 402,
		forbidden = 403,
		not_found = 404,
		method_not_allowed = 405,

		internal_server_error = 500,
		not_implemented = 501,
		bad_gateway = 502,
		service_unavailable = 503,
		gateway_timeout = 504,
		http_version_not_supported = 505,
	};

	Status status = Status::ok;
	// empty: let the HTTP layer choose
	std::string content_type;
	std::string body;
};

// "404 Not Found"
auto status_string(Response::Status status) noexcept -> string_view;

inline auto operator<<(std::ostream& stream, Response::Status status) -> std::ostream&
{
	return stream << static_cast<int>(status);
}

inline auto operator==(const Response& lhs, const Response& rhs) noexcept -> bool
{
	return lhs.status == rhs.status
		&& lhs.content_type == rhs.content_type
		&& lhs.body == rhs.body;
}

inline auto operator!=(const Response& lhs, const Response& rhs) noexcept -> bool
{
	return !(lhs == rhs);
}
}
