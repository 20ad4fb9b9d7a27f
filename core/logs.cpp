#include "logs.hpp"
#include "logger_imp.hpp"
#include "options.hpp"
#include "string_view.hpp"
#include "visitor.hpp"
#include <boost/log/core/core.hpp>
#include <boost/log/expressions/keyword.hpp>
#include <boost/log/expressions/formatters/if.hpp>
#include <boost/log/expressions/formatters/stream.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/phoenix/operator.hpp>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <variant>

namespace junction
{
Logger::Severity log_severity_level = Logger::Severity::info;

namespace
{
using Severity = Options::LogTypes::Severity;

constexpr string_view severity_tags[] = {
	"ERR "sv,
	"WRN "sv,
	"INF "sv,
	"DBG "sv,
	"TRC "sv,
};

// Options severities are the logger ones shifted down by one
constexpr auto to_logger(Severity s) noexcept
{
	return Logger::Severity{ static_cast<int>(s) + 1 };
}

static_assert(to_logger(Severity::error) == Logger::Severity::error);
static_assert(to_logger(Severity::warning) == Logger::Severity::warning);
static_assert(to_logger(Severity::trace) == Logger::Severity::trace);
static_assert(std::size(severity_tags) == static_cast<std::size_t>(Logger::Severity::trace));
}

static std::ostream& operator<<(std::ostream& s, Logger::Severity sev)
{
	return s << severity_tags[static_cast<int>(sev) - 1];
}

static std::ostream& operator<<(std::ostream& s, LoggerImp::Message msg)
{
	for (auto f = msg.first; f; f = f->next)
		f->print(s);
	return s;
}

namespace
{
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_message, LoggerImp::attr_name.lazy_message, LoggerImp::Message)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_severity, LoggerImp::attr_name.severity, Logger::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_group, LoggerImp::attr_name.group, std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_method, LoggerImp::attr_name.method, std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_path, LoggerImp::attr_name.path, std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(kw_handler, LoggerImp::attr_name.handler, std::string)

// "DBG GET /users/1 [/api] Users::show: message"
auto message_format()
{
	namespace expr = boost::log::expressions;

	return expr::stream
		<< kw_severity
		<< expr::if_(expr::has_attr(kw_method))
		[
			expr::stream << kw_method << " " << kw_path << " "
		]
		<< expr::if_(expr::has_attr(kw_group))
		[
			expr::stream << "[" << kw_group << "] "
		]
		<< expr::if_(expr::has_attr(kw_handler))
		[
			expr::stream << kw_handler << ": "
		]
		<< kw_message;
}

void reset_sink(const decltype(Options::LogTypes::MessagesLog::dest)& dest)
{
	namespace keywords = boost::log::keywords;

	const auto format = message_format();
	boost::log::core::get()->remove_all_sinks();
	std::visit(Visitor{
		[&format](const Options::LogTypes::Console&)
		{
			boost::log::add_console_log(std::clog, keywords::format = format);
		},
		[&format](const Options::LogTypes::File& f)
		{
			boost::log::add_file_log(
				keywords::file_name = f.path,
				keywords::open_mode = std::ios::out | std::ios::app,
				keywords::auto_flush = true,
				keywords::format = format
			);
		},
	}, dest);
}
}

void logs::preinit()
{
	log_severity_level = Logger::Severity::info;
	reset_sink(Options::LogTypes::Console{});
}

void logs::init(const Options& opt)
{
	const auto level = to_logger(opt.log.level);
	if (level > Logger::severity_barrier)
		throw std::runtime_error{ "log level " + std::to_string(static_cast<int>(level))
			+ " is above the compiled-in maximum "
			+ std::to_string(JUNCTION_LOG_LEVEL) };

	log_severity_level = level;
	reset_sink(opt.log.dest);
}
}
