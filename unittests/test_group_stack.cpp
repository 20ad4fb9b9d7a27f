#include "group_stack.hpp"
#include <boost/test/unit_test.hpp>
#include <stdexcept>

using namespace junction;

BOOST_AUTO_TEST_SUITE(group_stack_tests)

BOOST_AUTO_TEST_CASE(no_groups)
{
	const GroupStack s;
	BOOST_TEST(s.empty());
	BOOST_TEST(s.prefix() == "");
	BOOST_TEST(s.apply("/users") == "/users");
	BOOST_TEST(s.apply("users") == "/users");
	BOOST_TEST(s.apply("") == "/");
}

BOOST_AUTO_TEST_CASE(nesting)
{
	GroupStack s;
	{
		GroupStack::Guard a{ s, "/a" };
		BOOST_TEST(s.apply("/x") == "/a/x");
		{
			GroupStack::Guard b{ s, "/b" };
			BOOST_TEST(s.depth() == 2);
			BOOST_TEST(s.prefix() == "/a/b");
			BOOST_TEST(s.apply("/c") == "/a/b/c");
		}
		BOOST_TEST(s.prefix() == "/a");
	}
	BOOST_TEST(s.empty());
}

BOOST_AUTO_TEST_CASE(plain_concatenation)
{
	GroupStack s;
	GroupStack::Guard g{ s, "/api/" };
	BOOST_TEST(s.apply("/users") == "/api//users");
	BOOST_TEST(s.apply("users") == "/api/users");
	BOOST_TEST(s.apply("") == "/api/");
}

BOOST_AUTO_TEST_CASE(pop_on_exception)
{
	GroupStack s;
	try {
		GroupStack::Guard g{ s, "/admin" };
		throw std::runtime_error{ "body failed" };
	} catch (const std::runtime_error&) {
	}
	BOOST_TEST(s.empty());
	BOOST_TEST(s.apply("/x") == "/x");
}

BOOST_AUTO_TEST_SUITE_END()
