#pragma once
#include "controller.hpp"

namespace junction
{
// Replies with the captured values, one per line
class EchoController: public Controller
{
public:
	EchoController();

	auto params(const Arguments& args) -> Response;
};
}
