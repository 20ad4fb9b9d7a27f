#include "params.hpp"
#include <boost/test/unit_test.hpp>
#include <sstream>
#include <stdexcept>

using namespace junction;

BOOST_AUTO_TEST_SUITE(params_tests)

BOOST_AUTO_TEST_CASE(order_is_kept)
{
	Params p;
	p.add("year", "2024");
	p.add("month", "05");
	p.add("day", "17");

	BOOST_TEST(p.size() == 3);
	const Arguments expected = { "2024", "05", "17" };
	BOOST_TEST(p.values() == expected, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(lookup)
{
	const Params p = { { "id", "42" }, { "slug", "hello" } };

	BOOST_TEST(p.at("id") == "42");
	BOOST_TEST(*p.find("slug") == "hello");
	BOOST_TEST(!p.find("name"));
	BOOST_CHECK_THROW(p.at("name"), std::out_of_range);
}

BOOST_AUTO_TEST_CASE(empty)
{
	const Params p;
	BOOST_TEST(p.empty());
	BOOST_TEST(p.values().empty());
	BOOST_TEST((p == Params{}));
}

BOOST_AUTO_TEST_CASE(print)
{
	std::ostringstream s;
	s << Params{ { "id", "42" }, { "slug", "a-b" } };
	BOOST_TEST(s.str() == R"({id: "42", slug: "a-b"})");
}

BOOST_AUTO_TEST_SUITE_END()
