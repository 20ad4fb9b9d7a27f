#pragma once
#include <ostream>
#include <tuple>

#ifndef JUNCTION_LOG_LEVEL
#  define JUNCTION_LOG_LEVEL 3
#endif

static_assert(JUNCTION_LOG_LEVEL >= 1 && JUNCTION_LOG_LEVEL <= 5,
	"log level should be in [1(error), 5(trace)]");

namespace junction
{
// Message arguments are kept by reference and streamed only when a sink
// accepts the record. Messages above JUNCTION_LOG_LEVEL are compiled out.
class Logger
{
public:
	enum class Severity
	{
		error   = 1,
		warning = 2,
		info    = 3,
		debug   = 4,
		trace   = 5,
	};

	static constexpr Severity severity_barrier = Severity{ JUNCTION_LOG_LEVEL };

	template <typename... Args> void error(const Args&... args) { write<Severity::error>(args...); }
	template <typename... Args> void warning(const Args&... args) { write<Severity::warning>(args...); }
	template <typename... Args> void info(const Args&... args) { write<Severity::info>(args...); }
	template <typename... Args> void debug(const Args&... args) { write<Severity::debug>(args...); }
	template <typename... Args> void trace(const Args&... args) { write<Severity::trace>(args...); }

	template <Severity S, typename... Args> void write(const Args&... args);

	// One argument of a message
	struct Fragment
	{
		virtual ~Fragment() = default;
		virtual void print(std::ostream& stream) const = 0;

		Fragment* next{};
	};

	Logger(Logger&& rhs) = delete;

	Logger& operator=(const Logger& rhs) = delete;
	Logger& operator=(Logger&& rhs) = delete;

protected:
	Logger() = default;
	Logger(const Logger& rhs) = default;
	~Logger() = default;

private:
	template <typename T> struct Piece;

	bool begin(Severity s);
	void append(Fragment& f) noexcept;
	void commit();
};

template <typename T>
struct Logger::Piece : Fragment
{
	explicit Piece(const T& v) noexcept: v{ v } {}

	void print(std::ostream& stream) const override
	{
		stream << v;
	}

	const T& v;
};

template <Logger::Severity S, typename... Args>
void Logger::write(const Args&... args)
{
	if constexpr (S <= severity_barrier) {
		if (!begin(S))
			return;
		// the pieces are streamed by commit()
		std::tuple<Piece<Args>...> pieces{ Piece<Args>{ args }... };
		std::apply([this](auto&... p) { (append(p), ...); }, pieces);
		commit();
	}
}
}
