#pragma once
#include "logger.hpp"
#include "string_view.hpp"
#include <boost/core/noncopyable.hpp>
#include <boost/log/core/record.hpp>
#include <boost/log/sources/logger.hpp>
#include <string>

namespace junction
{
class LoggerImp: public Logger, boost::noncopyable
{
public:
	struct AttrName
	{
		AttrName();

		boost::log::attribute_name lazy_message;
		boost::log::attribute_name severity;
		boost::log::attribute_name group;
		boost::log::attribute_name method;
		boost::log::attribute_name path;
		boost::log::attribute_name handler;
	};

	// fragments linked in argument order
	struct Message
	{
		Fragment* first;
		Fragment* last;
	};

	LoggerImp() = default;
	LoggerImp(const LoggerImp& rhs) = delete;
	virtual ~LoggerImp() = default;

	LoggerImp& operator=(const LoggerImp&) = delete;

	// false if no sink takes the record
	bool open_record(Severity s);
	void append(Fragment& f) noexcept;
	void push_record();

	static const AttrName attr_name;

protected:
	virtual void insert_attributes() = 0;

	boost::log::attribute_value_set& attributes() noexcept
	{
		return rec.attribute_values();
	}

private:
	boost::log::sources::logger lg;
	boost::log::record rec;
	Message msg{};
};

struct BaseLogger: LoggerImp
{
	void insert_attributes() override {}
};

// Route registration logger
struct GlobalLogger: BaseLogger
{
	void insert_attributes() override;

	// prefix of the route groups being registered
	std::string group;
};

struct GroupLoggerGuard: boost::noncopyable
{
	GroupLoggerGuard(GlobalLogger& lg, std::string group):
		lg{ lg },
		saved{ std::move(lg.group) }
	{
		lg.group = std::move(group);
	}

	~GroupLoggerGuard()
	{
		lg.group = std::move(saved);
	}

private:
	GlobalLogger& lg;
	std::string saved;
};

// One per dispatched request
struct DispatchLogger: BaseLogger
{
	DispatchLogger(string_view method, string_view path):
		method{ method },
		path{ path }
	{}

	void insert_attributes() override;

	const std::string method;
	const std::string path;
	std::string handler;
};

struct HandlerLoggerGuard: boost::noncopyable
{
	HandlerLoggerGuard(DispatchLogger& lg, std::string name):
		lg{ lg }
	{
		lg.handler = std::move(name);
	}

	~HandlerLoggerGuard()
	{
		lg.handler.clear();
	}

private:
	DispatchLogger& lg;
};
}
