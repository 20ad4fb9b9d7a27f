#include "route.hpp"
#include "error.hpp"
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <initializer_list>
#include <ostream>
#include <string>

using namespace junction;
using boost::unit_test::data::make;

namespace
{
struct MatchSample
{
	string_view route;
	string_view path;
	bool matches;
};

using MatchSampleList = std::initializer_list<MatchSample>;

auto escaped(const std::string& path)
{
	return RoutePattern{ path, LiteralSyntax::escaped };
}

auto verbatim(const std::string& path)
{
	return RoutePattern{ path, LiteralSyntax::verbatim };
}

const MatchSampleList samples = {
	{ "/", "/", true },
	{ "/", "", false },
	{ "/users", "/users", true },
	{ "/users", "/users/", false },
	{ "/users", "/users/1", false },
	{ "/users", "/prefix/users", false },
	{ "/users/{id}", "/users/42", true },
	{ "/users/{id}", "/users/", false },
	{ "/users/{id}", "/users/1/2", false },
	{ "/users/{id}", "/users/42/edit", false },
	{ "/users/{id}/edit", "/users/42/edit", true },
	{ "/files/{name}.txt", "/files/readme.txt", true },
	{ "/files/{name}.txt", "/files/readmeXtxt", false },
	{ "/a+b", "/a+b", true },
	{ "/a+b", "/aab", false },
	{ "/{a}-{b}", "/x-y", true },
	{ "/{a}-{b}", "/x-", false },
	{ "/{a}{b}", "/x", false },
	{ "/{a}{b}", "/xy", true },
	{ "/files/{name}.txt", "/files/.txt", false },
};

std::ostream& operator<<(std::ostream& stream, const MatchSample& sample)
{
	return stream << sample.route << (sample.matches ? " matches " : " does not match ")
		<< sample.path;
}
}

BOOST_AUTO_TEST_SUITE(route_pattern_tests)

BOOST_DATA_TEST_CASE(test_match, make(samples))
{
	const auto pattern = escaped(std::string{ sample.route });
	BOOST_TEST(pattern.match(sample.path).has_value() == sample.matches);
}

BOOST_AUTO_TEST_CASE(source)
{
	BOOST_TEST(escaped("/users/{id}").source() == "^/users/([^/]+)$");
	BOOST_TEST(escaped("/").source() == "^/$");
	BOOST_TEST(escaped("/a.b").source() == "^/a\\.b$");
	BOOST_TEST(verbatim("/a.b").source() == "^/a.b$");
	// same input, same pattern
	BOOST_TEST((escaped("/p/{x}/{y}") == escaped("/p/{x}/{y}")));
	// names do not change the expression
	BOOST_TEST((escaped("/p/{x}") == escaped("/p/{y}")));
}

BOOST_AUTO_TEST_CASE(captures)
{
	const auto pattern = escaped("/posts/{year}/{month}/{slug}");
	BOOST_TEST(pattern.placeholders() == (std::vector<std::string>{ "year", "month", "slug" }),
		boost::test_tools::per_element());

	auto params = pattern.match("/posts/2024/05/hello-world");
	BOOST_TEST_REQUIRE(params.has_value());
	BOOST_TEST(params->values() == (Arguments{ "2024", "05", "hello-world" }),
		boost::test_tools::per_element());
	BOOST_TEST(params->at("month") == "05");
}

BOOST_AUTO_TEST_CASE(greedy_split)
{
	auto params = escaped("/{name}.{ext}").match("/archive.tar.gz");
	BOOST_TEST_REQUIRE(params.has_value());
	BOOST_TEST(params->values() == (Arguments{ "archive.tar", "gz" }),
		boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(long_segment)
{
	const auto name = std::string(100000, 'a');
	const auto pattern = escaped("/files/{name}");

	auto params = pattern.match("/files/" + name);
	BOOST_TEST_REQUIRE(params.has_value());
	BOOST_TEST(params->at("name") == name);

	BOOST_TEST(!escaped("/files/{name}/raw").match("/files/" + name).has_value());
	BOOST_TEST(!escaped("/files/{name}.txt").match("/files/" + name).has_value());
}

BOOST_AUTO_TEST_CASE(no_placeholders)
{
	auto params = escaped("/about").match("/about");
	BOOST_TEST_REQUIRE(params.has_value());
	BOOST_TEST(params->empty());
}

BOOST_AUTO_TEST_CASE(not_a_placeholder)
{
	// left as literal text
	BOOST_TEST(escaped("/a/{}").match("/a/{}").has_value());
	BOOST_TEST(escaped("/a/{1x}").match("/a/{1x}").has_value());
	BOOST_TEST(escaped("/a/{x").match("/a/{x").has_value());
	BOOST_TEST(escaped("/a/{x").placeholders().empty());
}

BOOST_AUTO_TEST_CASE(verbatim_literals)
{
	BOOST_TEST(verbatim("/a.b").match("/aXb").has_value());
	BOOST_TEST(!escaped("/a.b").match("/aXb").has_value());

	// hand-written groups are not parameters
	const auto pattern = verbatim("/(en|fr)/{page}");
	auto params = pattern.match("/fr/about");
	BOOST_TEST_REQUIRE(params.has_value());
	BOOST_TEST(params->size() == 1);
	BOOST_TEST(params->at("page") == "about");

	const auto nested = verbatim("/v(1|(2))/{id}/(?:x|y)/{tail}");
	params = nested.match("/v2/7/y/end");
	BOOST_TEST_REQUIRE(params.has_value());
	BOOST_TEST(params->values() == (Arguments{ "7", "end" }), boost::test_tools::per_element());

	const auto with_class = verbatim("/[(]{id}");
	params = with_class.match("/(5");
	BOOST_TEST_REQUIRE(params.has_value());
	BOOST_TEST(params->at("id") == "5");
}

BOOST_AUTO_TEST_CASE(errors)
{
	BOOST_CHECK_EXCEPTION(escaped("/{id}/x/{id}"), RouteError,
		[](const RouteError& e) { return e.path() == "/{id}/x/{id}"; });
	BOOST_CHECK_THROW(verbatim("/a(b"), RouteError);
	BOOST_CHECK_NO_THROW(escaped("/a(b"));
}

BOOST_AUTO_TEST_CASE(normalize)
{
	BOOST_TEST(normalize_path("") == "/");
	BOOST_TEST(normalize_path("users") == "/users");
	BOOST_TEST(normalize_path("/users") == "/users");
}

BOOST_AUTO_TEST_SUITE_END()
