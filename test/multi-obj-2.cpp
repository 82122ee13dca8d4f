#define MATCHERTOY_DEDUP
#include "../matcher.hpp"

#include "./fw/doctest-setup.hpp"

using namespace Matching;

Node make_greeting()
{
	return seq(alt(lit("hello"), lit("hi")), lit(","), rep(chr(" ")), some(chr("a-z")), lit("!"));
}

CASE("tree built and matched here") {
	auto greeting = make_greeting();
	CHECK(parse_all(*greeting, "hello,   you!"));
	CHECK(!parse_all(*greeting, "hey, you!"));
}
