#pragma once
#include "controller.hpp"

namespace junction
{
class HelloController: public Controller
{
public:
	HelloController();

	auto index() -> Response;
};
}
