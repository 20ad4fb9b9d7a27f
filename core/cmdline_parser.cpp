#include "cmdline_parser.hpp"
#include "parameters.hpp"
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/cmdline.hpp>

#ifndef JUNCTION_CONFIG_PATH
# define JUNCTION_CONFIG_PATH ./routes.conf
#endif

namespace junction
{
namespace
{
namespace po = boost::program_options;

auto make_desc()
{
	po::options_description desc{ "Usage: junction [options] target...\n"
		"Resolves request targets against a route file. Options are:" };
	desc.add_options()
		("config,c",
			po::value<std::string>()
				->value_name("path")
				->default_value(BOOST_STRINGIZE(JUNCTION_CONFIG_PATH)),
			"route file path")
		("method,m",
			po::value<std::string>()
				->value_name("name")
				->default_value("GET"),
			"request method")
		("override,o",
			po::value<std::string>()->value_name("name"),
			"method override field (POST requests only)")
		("run,r", "invoke the handler and print the response")
		("list,l", "print the route table")
		("help,h", "print help and exit")
		("version,v", "print version and exit");

	return desc;
}

auto make_hidden()
{
	po::options_description hidden;
	hidden.add_options()
		("target", po::value<std::vector<std::string>>());
	return hidden;
}
}

CommandLineParser::CommandLineParser():
	desc{ make_desc() },
	hidden{ make_hidden() }
{
	positional.add("target", -1);
}

auto CommandLineParser::parse(int argc, const char *const argv[]) const -> CommandLine
{
	namespace style = po::command_line_style;

	po::options_description all;
	all.add(desc).add(hidden);

	CommandLine result;
	auto options = po::command_line_parser(argc, argv)
		.options(all)
		.positional(positional)
		.style(style::default_style & ~style::allow_guessing)
		.run();
	store(options, result.vars);
	notify(result.vars);

	return result;
}

auto CommandLineParser::print_options(std::ostream &stream) const -> void
{
	stream << desc;
}

auto CommandLine::has(const std::string &parameter) const noexcept -> bool
{
	return vars.count(parameter) > 0;
}

auto CommandLine::to_parameters() const -> Parameters
{
	Parameters p;
	p.config_path = vars["config"].as<std::string>();
	p.method = vars["method"].as<std::string>();
	if (has("override"))
		p.method_override = vars["override"].as<std::string>();
	if (has("target"))
		p.targets = vars["target"].as<std::vector<std::string>>();
	p.list = has("list");
	p.run = has("run");

	return p;
}
}
