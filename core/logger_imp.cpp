#include "logger_imp.hpp"
#include <boost/log/attributes/attribute_value_impl.hpp>

namespace junction
{
using boost::log::attributes::make_attribute_value;

const LoggerImp::AttrName LoggerImp::attr_name{};

bool LoggerImp::open_record(Severity s)
{
	rec = lg.open_record();
	if (!rec)
		return false;

	insert_attributes();
	attributes().insert(attr_name.severity, make_attribute_value(s));
	msg = {};
	return true;
}

void LoggerImp::append(Fragment& f) noexcept
{
	(msg.last ? msg.last->next : msg.first) = &f;
	msg.last = &f;
}

void LoggerImp::push_record()
{
	attributes().insert(attr_name.lazy_message, make_attribute_value(msg));
	lg.push_record(std::move(rec));
}

void GlobalLogger::insert_attributes()
{
	if (!group.empty())
		attributes().insert(attr_name.group, make_attribute_value(group));
}

void DispatchLogger::insert_attributes()
{
	BaseLogger::insert_attributes();

	attributes().insert(attr_name.method, make_attribute_value(method));
	attributes().insert(attr_name.path, make_attribute_value(path));
	if (!handler.empty())
		attributes().insert(attr_name.handler, make_attribute_value(handler));
}

LoggerImp::AttrName::AttrName():
	lazy_message{"LazyMessage"},
	severity{"Severity"},
	group{"RouteGroup"},
	method{"Method"},
	path{"Path"},
	handler{"Handler"}
{
}
}
