#include "echo.hpp"

namespace junction
{
EchoController::EchoController()
{
	expose("params", &EchoController::params);
}

auto EchoController::params(const Arguments& args) -> Response
{
	Response resp{ Response::Status::ok, "text/plain", {} };
	for (auto& a : args) {
		resp.body += a;
		resp.body += '\n';
	}
	return resp;
}
}
