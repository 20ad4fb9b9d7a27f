#include "logger.hpp"
#include "logger_imp.hpp"

namespace junction
{
extern Logger::Severity log_severity_level;

namespace
{
auto impl(Logger* lg) -> LoggerImp&
{
	return *static_cast<LoggerImp*>(lg);
}
}

bool Logger::begin(Severity s)
{
	// runtime level first, a Boost.Log record is not free
	if (s > log_severity_level)
		return false;
	return impl(this).open_record(s);
}

void Logger::append(Fragment& f) noexcept
{
	impl(this).append(f);
}

void Logger::commit()
{
	impl(this).push_record();
}
}
