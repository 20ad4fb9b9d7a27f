#pragma once
#include <optional>
#include <string>
#include <vector>

namespace junction
{
struct Parameters
{
	std::string config_path;
	std::string method;
	std::optional<std::string> method_override;
	std::vector<std::string> targets;
	bool list = false;
	bool run = false;
};
}
