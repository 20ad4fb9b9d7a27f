#pragma once
#include <optional>
#include <string>

namespace junction
{
// What the router needs to know about an incoming request
struct Request
{
	std::string method;
	// request target: "/path?query#fragment" or an absolute URL
	std::string target;
	// posted "_method" form field, when the request has one
	std::optional<std::string> method_override;
};
}
