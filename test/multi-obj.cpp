#include "../matcher.hpp"

//---------------------------------------------------------------------------
// SMOKE TESTING FOR DUPLICATE DEFINITIONS, when including the header in more
// than one translation units (see multi-obj-2.cpp, which has MATCHERTOY_DEDUP).
//---------------------------------------------------------------------------
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "./fw/doctest-setup.hpp"

using namespace Matching;

Node make_greeting(); // in multi-obj-2.cpp

CASE("tree built in the other TU, matched here") {
	auto greeting = make_greeting();
	auto res = parse(*greeting, "hi, bob!");
	REQUIRE(res);
	CHECK(res->fragments == Fragments{"hi", ",", " ", "b", "o", "b", "!"});
}
