#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// Parsed route file
namespace junction
{
namespace config
{
class Error : public std::runtime_error
{
public:
	explicit Error(const std::string& msg): runtime_error{ msg } {}
};

// line numbers start from 1
using Line = std::size_t;

// key = value
struct Setting
{
	std::string key;
	std::string value;
	Line line;
};

// Controller::action
struct HandlerRef
{
	std::string controller;
	std::string action;
};

// method path handler
struct Route
{
	// "GET".."DELETE" or "ANY"
	std::string method;
	std::string path;
	HandlerRef handler;
	Line line;
};

// name handler
struct Hook
{
	std::string name;
	HandlerRef handler;
	Line line;
};

struct Group;

using Statement = std::variant<Setting, Route, Group, Hook>;

// group prefix { statement* }
struct Group
{
	std::string prefix;
	std::vector<Statement> body;
	Line line;
};

struct Document
{
	std::vector<Statement> statements;
};
}
}
