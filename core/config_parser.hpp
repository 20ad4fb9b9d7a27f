#pragma once
#include "config.hpp"
#include "string_view.hpp"
#include <filesystem>
#include <string>

namespace junction
{
namespace config
{
class SyntaxError : public Error
{
public:
	using Position = std::size_t;

	SyntaxError(Position where, const std::string& what):
		Error{ what },
		pos{ where }
	{}

	// byte offset in the text
	auto where() const noexcept -> Position { return pos; }

private:
	const Position pos;
};

class TextView
{
public:
	explicit TextView(string_view data, std::string filename = {}):
		d{ data },
		name{ std::move(filename) }
	{}

	auto data() const noexcept -> string_view { return d; }
	auto filename() const noexcept -> const std::string& { return name; }

private:
	string_view d;
	std::string name;
};

class Text
{
public:
	explicit Text(std::string data, std::string filename = {}):
		d{ std::move(data) },
		name{ std::move(filename) }
	{}

	auto view() const -> TextView { return TextView{ d, name }; }

private:
	std::string d;
	std::string name;
};

class File : public Text
{
public:
	// throws Error if the file can't be read
	explicit File(const std::filesystem::path& path);
};

// throws SyntaxError
auto parse(const TextView& text) -> Document;
auto parse(const Text& text) -> Document;
}
}
