#ifndef _MATCHERTOY_HPP_
#define _MATCHERTOY_HPP_
/*****************************************************************************
  Tiny composable matchers for small, ad-hoc parsing tasks

    A handful of matcher nodes (literals, single-char classes, sequences,
    greedy repetitions and ordered alternatives) that can be nested into a
    tree, and then run against a Cursor. A successful match returns the
    matched fragments (flattened, in input order) plus the Cursor after the
    match; a failed one returns nothing at all, so the caller can just try
    something else from the very same Cursor. Nothing is ever mutated, so
    there's nothing to undo on backtracking.

    No memoization, no error positions, no captures. It's a toy: pathological
    grammars (nested alternatives/repetitions with overlapping prefixes) can
    go exponential, and that's accepted.

  NOTE:

  - The input text is copied once into the first Cursor, and then shared
    (read-only, refcounted) by all the Cursors derived from it.

  - The class patterns of Char are compiled with <regex>, as the inside of a
    bracket expression, so the syntax is whatever MATCHERTOY_CLASS_SYNTAX
    (default: POSIX extended) says about "[...]".

  - If you need to #include this in more than one translation units, then
    #define MATCHERTOY_DEDUP for all but the first one.

 *****************************************************************************/

//=============================================================================
//---------------------------------------------------------------------------
// Base language layer...
//---------------------------------------------------------------------------
#include <cassert>
#include <stdexcept>
#include <format>
#include <string>
	using std::string;
#include <string_view>
	using std::string_view;
#ifndef NDEBUG
#include <iostream>
#endif

//! For variadic macros, e.g. for calling std::format(...):
//!
//! The old MSVC preproc. suppresses the extra ',' when no more args, but
//! doesn't understand __VA_OPT__, so the std. c++20 way can't be unified...
#if defined(__GNUC__) \
	|| defined(_MSC_VER) && (!defined(_MSVC_TRADITIONAL) || !_MSVC_TRADITIONAL)
#  define _Sz_CONFORMANT_PREPROCESSOR 1
#elif defined(_MSC_VER) && defined(_MSVC_TRADITIONAL) && _MSVC_TRADITIONAL // Old MS prep.
#  define _Sz_OLD_MSVC_PREPROCESSOR 1
#endif

#ifndef NDEBUG
#  if defined(_Sz_CONFORMANT_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg __VA_OPT__(,) __VA_ARGS__)) << std::endl
     // Same as DBG(), but with no trailing \n (for continuation lines)
#    define DBG_(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg __VA_OPT__(,) __VA_ARGS__))
     // Continuation lines -- same as DBG(), but without the DBG prefix
#    define _DBG(msg, ...) std::cerr << std::format(msg __VA_OPT__(,) __VA_ARGS__) << std::endl
#  elif defined(_Sz_OLD_MSVC_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg, __VA_ARGS__)) << std::endl
#    define DBG_(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg, __VA_ARGS__))
#    define _DBG(msg, ...) std::cerr << std::format(msg, __VA_ARGS__) << std::endl
#  else
#    error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#  endif
#else
#  define DBG(msg, ...)
#  define DBG_(msg, ...)
#  define _DBG(msg, ...)
#endif

#ifndef DBG_DEFAULT_TRIM_LEN
#define DBG_DEFAULT_TRIM_LEN 30
#endif
// Trim length is ignored as yet, just using the default:
#define DBG_TRIM(str, ...) (string_view(str).length() > DBG_DEFAULT_TRIM_LEN - 3 ? \
	string(string_view(str).substr(0, DBG_DEFAULT_TRIM_LEN - 3)) + "..." : \
	string(str))


// Note: ERROR() below is _not_ a debug feature!
#if defined(_Sz_CONFORMANT_PREPROCESSOR)
#  define ERROR(X, msg, ...) throw X(std::format("- ERROR: {}", std::format(msg __VA_OPT__(,) __VA_ARGS__)))
#elif defined(_Sz_OLD_MSVC_PREPROCESSOR)
#  define ERROR(X, msg, ...) throw X(std::format("- ERROR: {}", std::format(msg, __VA_ARGS__)))
#else
#  error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#endif

// Tame MSVC -Wall just a little
#ifdef _MSC_VER
#  pragma warning(disable:5045) // Compiler will insert Spectre mitigation for memory load if /Qspectre switch specified
#  pragma warning(disable:4514) // unreferenced inline function has been removed
#endif
//---------------------------------------------------------------------------
//=============================================================================


//---------------------------------------------------------------------------
#include <regex>
#include <algorithm> // min
#include <memory> // shared_ptr, unique_ptr
#include <optional>
#include <utility> // move, forward
#include <iterator> // make_move_iterator
#include <vector>

#ifndef MATCHERTOY_CLASS_SYNTAX
#define MATCHERTOY_CLASS_SYNTAX std::regex::extended
#endif


//---------------------------------------------------------------------------
namespace Matching {

	using REGEX = std::regex;
	using Fragments = std::vector<string>;

	// Thrown while building a matcher tree (e.g. bad class pattern)
	struct BuildError : std::runtime_error { using std::runtime_error::runtime_error; };

	// Thrown while matching, if the tree itself turns out to be broken
	// (e.g. a repetition of something that can match nothing)
	struct GrammarError : std::runtime_error { using std::runtime_error::runtime_error; };


//---------------------------------------------------------------------------
class Cursor
//---------------------------------------------------------------------------
{
public:
	Cursor(string text, size_t offset = 0)
		: _text(std::make_shared<const string>(std::move(text))), _offset(offset) {}

	// Next n chars, or "" if there are less than n left
	string peek(size_t n) const
	{
		if (_offset > _text->length() || n > _text->length() - _offset)
			return {};
		return _text->substr(_offset, n);
	}

	// No bounds check: only call it for what has already been peeked!
	Cursor advance(size_t n) const { return Cursor(_text, _offset + n); }

	size_t        offset()    const { return _offset; }
	const string& text()      const { return *_text; }
	size_t        remaining() const { return _offset < _text->length() ? _text->length() - _offset : 0; }
	bool          at_end()    const { return !remaining(); }

	bool operator==(const Cursor& other) const {
		return _offset == other._offset
		    && (_text == other._text || *_text == *other._text);
	}

private:
	Cursor(std::shared_ptr<const string> text, size_t offset)
		: _text(std::move(text)), _offset(offset) {}

	std::shared_ptr<const string> _text;
	size_t _offset;
};


//---------------------------------------------------------------------------
// Match results...
//---------------------------------------------------------------------------
struct Match
{
	Fragments fragments;
	Cursor    next; // right after the matched input

	bool operator==(const Match&) const = default;
};

using Result = std::optional<Match>; // nullopt: no match (not an error!)


//---------------------------------------------------------------------------
// Matcher nodes...
//---------------------------------------------------------------------------
struct Matcher
{
	virtual ~Matcher() = default;

	// Must not change anything (neither `this`, nor the cursor), and must not
	// throw for a plain non-match.
	virtual Result match(const Cursor& cursor) const = 0;

	virtual string describe() const = 0;

#ifndef NDEBUG
	void DUMP() const { std::cerr << "     " << describe() << std::endl; }
#else
	void DUMP() const {}
#endif
};

using Node  = std::unique_ptr<const Matcher>;
using Nodes = std::vector<Node>;


struct Lit : Matcher
{
	const string lit;

	explicit Lit(string lit) : lit(std::move(lit)) {}

	Result match(const Cursor& cursor) const override;
	string describe() const override;
};


// Matches exactly one char from a class, given as the inside of a bracket
// expression, e.g. "0-9", "a-zA-Z_", " ", "[:digit:]".
// NOTE: with the default (POSIX) syntax, a backslash is just a backslash in
// there, so e.g. "\\d" means '\\' or 'd', NOT a digit! Use "[:digit:]",
// "[:space:]" etc. instead.
// A ']' can only be the first item (after an optional '^'); anywhere else it
// would close the bracket early, and is rejected with BuildError.
struct Char : Matcher
{
	const string pattern;
	const REGEX  re;

	explicit Char(const string& pattern); // Throws BuildError for bad patterns

	Result match(const Cursor& cursor) const override;
	string describe() const override;

private:
	static void  _check_bracket(const string& pattern);
	static REGEX _compile(const string& pattern);
};


struct Seq : Matcher
{
	const Nodes seq;

	explicit Seq(Nodes seq);

	Result match(const Cursor& cursor) const override;
	string describe() const override;
};


// Greedy, unbounded, no backtracking to fewer repetitions.
// The child must consume something on each success; if it doesn't, match()
// throws GrammarError, rather than looping forever.
struct Rep : Matcher
{
	const Node   child;
	const size_t min;

	explicit Rep(Node child, size_t min = 0);

	Result match(const Cursor& cursor) const override;
	string describe() const override;
};


// First match wins (not the longest!), so the order of the choices matters.
struct Alt : Matcher
{
	const Nodes choices;

	explicit Alt(Nodes choices);

	Result match(const Cursor& cursor) const override;
	string describe() const override;
};


//---------------------------------------------------------------------------
// Simple painkillers for grammar-building, e.g.:
//
//	auto cookies = seq(rep(chr("0-9"), 1), lit(" cookie"), alt(lit("s"), lit("")));
//
template <class... Children>
Nodes _nodes(Children&&... children)
{
	Nodes v;
	v.reserve(sizeof...(children));
	(v.push_back(std::forward<Children>(children)), ...);
	return v;
}

inline Node lit(string s)                { return std::make_unique<Lit>(std::move(s)); }
inline Node chr(const string& pattern)   { return std::make_unique<Char>(pattern); }
inline Node rep(Node child, size_t min = 0) { return std::make_unique<Rep>(std::move(child), min); }
inline Node some(Node child)             { return rep(std::move(child), 1); }

template <class... Children>
Node seq(Children&&... children) { return std::make_unique<Seq>(_nodes(std::forward<Children>(children)...)); }

template <class... Children>
Node alt(Children&&... children) { return std::make_unique<Alt>(_nodes(std::forward<Children>(children)...)); }


//---------------------------------------------------------------------------
// Convenience front-ends to match(...)
Result parse(const Matcher& syntax, const string& text);
Result parse_all(const Matcher& syntax, const string& text); // Fails if anything's left over

} // namespace


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//


#ifndef MATCHERTOY_DEDUP
//===========================================================================
namespace Matching {

static void _append(Fragments& to, Fragments&& from)
{
	to.insert(to.end(), std::make_move_iterator(from.begin()),
	                    std::make_move_iterator(from.end()));
}

static void _check_children(const Nodes& children, const char* what)
{
	for (size_t i = 0; i < children.size(); ++i) {
		if (!children[i]) ERROR(BuildError, "Missing (null) item #{} in {}!", i, what);
	}
}

static string _join(const Nodes& children, const char* sep)
{
	string s;
	for (auto& r : children) {
		if (!s.empty()) s += sep;
		s += r->describe();
	}
	return s;
}


//---------------------------------------------------------------------------
Result Lit::match(const Cursor& cursor) const
{
	auto peeked = cursor.peek(lit.length());
	if (peeked == lit) {
DBG("LITERAL \"{}\": MATCHED at {}.", lit, cursor.offset());
		return Match{{std::move(peeked)}, cursor.advance(lit.length())};
	}
#ifndef NDEBUG
{ auto src = DBG_TRIM(cursor.peek(std::min<size_t>(cursor.remaining(), DBG_DEFAULT_TRIM_LEN)));
DBG("LITERAL \"{}\": ---NOT--- MATCHED '{}'!", lit, src); }
#endif
	return std::nullopt;
}

string Lit::describe() const { return std::format("\"{}\"", lit); }


//---------------------------------------------------------------------------
Char::Char(const string& pattern) : pattern(pattern), re(_compile(pattern))
{
DBG("Char: compiled class [{}].", pattern);
}

void Char::_check_bracket(const string& pattern)
// POSIX bracket rules: a leading ']' (or "^]") is a literal, [:...:], [.x.]
// and [=x=] items are skipped as a whole, and any other ']' would close the
// bracket before the end of the pattern.
{
	size_t i = 0;
	if (i < pattern.length() && pattern[i] == '^') ++i;
	if (i < pattern.length() && pattern[i] == ']') ++i;

	while (i < pattern.length())
	{
		char c = pattern[i];
		if (c == '[' && i + 1 < pattern.length()
		    && (pattern[i+1] == ':' || pattern[i+1] == '.' || pattern[i+1] == '='))
		{
			char delim[] = {pattern[i+1], ']', 0};
			auto end = pattern.find(delim, i + 2);
			if (end == string::npos) {
				ERROR(BuildError, "Invalid char class \"[{}]\": unterminated \"[{}\" at {}", pattern, pattern[i+1], i);
			}
			i = end + 2;
		}
		else if (c == ']')
		{
			ERROR(BuildError, "Invalid char class \"[{}]\": stray ']' at {}", pattern, i);
		}
		else ++i;
	}
}

REGEX Char::_compile(const string& pattern)
{
	_check_bracket(pattern);
	try {
		return REGEX("[" + pattern + "]", MATCHERTOY_CLASS_SYNTAX);
	}
	catch(std::regex_error& x)
	{
		ERROR(BuildError, "Invalid char class \"[{}]\": {}", pattern, x.what());
	}
}

Result Char::match(const Cursor& cursor) const
{
	auto peeked = cursor.peek(1);
	if (peeked.length() == 1 && std::regex_match(peeked, re)) {
DBG("CHAR [{}]: MATCHED '{}' at {}.", pattern, peeked, cursor.offset());
		return Match{{std::move(peeked)}, cursor.advance(1)};
	}
DBG("CHAR [{}]: ---NOT--- MATCHED '{}' at {}!", pattern, peeked, cursor.offset());
	return std::nullopt;
}

string Char::describe() const { return std::format("[{}]", pattern); }


//---------------------------------------------------------------------------
Seq::Seq(Nodes seq) : seq(std::move(seq))
{
	_check_children(this->seq, "sequence");
}

Result Seq::match(const Cursor& cursor) const
{
	Fragments results;
	Cursor current = cursor;

	for (auto& r : seq)
	{
		assert(r);
		auto res = r->match(current);
		if (!res) {
DBG("SEQ: failed at {} (item {}).", current.offset(), r->describe());
			return std::nullopt; // No partial results!
		}
		_append(results, std::move(res->fragments));
		current = res->next;
	}
	return Match{std::move(results), current};
}

string Seq::describe() const { return "(" + _join(seq, " ") + ")"; }


//---------------------------------------------------------------------------
Rep::Rep(Node child, size_t min) : child(std::move(child)), min(min)
{
	if (!this->child) ERROR(BuildError, "Missing (null) item in repetition!");
}

Result Rep::match(const Cursor& cursor) const
{
	Fragments results;
	Cursor current = cursor;
	size_t count = 0;

	for (;;)
	{
		assert(child);
		auto res = child->match(current);
		if (!res) break;

		if (res->next.offset() == current.offset()) { // We're stuck forever if not progressing!
			ERROR(GrammarError, "Infinite loop in repetition of {} (at {})!", child->describe(), current.offset());
		}
		_append(results, std::move(res->fragments));
		current = res->next;
		++count;
	}

	if (count < min) {
DBG("REP: only {} of min. {} matches of {}.", count, min, child->describe());
		return std::nullopt;
	}
DBG("REP: {} matches of {}, {} -> {}.", count, child->describe(), cursor.offset(), current.offset());
	return Match{std::move(results), current};
}

string Rep::describe() const { return std::format("{}{{{},}}", child->describe(), min); }


//---------------------------------------------------------------------------
Alt::Alt(Nodes choices) : choices(std::move(choices))
{
	_check_children(this->choices, "alternation");
}

Result Alt::match(const Cursor& cursor) const
{
	for (auto& r : choices)
	{
		assert(r);
DBG("ALT: trying {} at {}...", r->describe(), cursor.offset());
		auto res = r->match(cursor);
DBG_("ALT: {} at {}:", r->describe(), cursor.offset());
_DBG("{}", res ? " taken." : " no.");
		if (res) return res;
	}
	return std::nullopt;
}

string Alt::describe() const { return "(" + (choices.empty() ? "|" : _join(choices, " | ")) + ")"; }


//---------------------------------------------------------------------------
Result parse(const Matcher& syntax, const string& text)
{
	return syntax.match(Cursor(text));
}

Result parse_all(const Matcher& syntax, const string& text)
{
	auto res = parse(syntax, text);
	if (res && !res->next.at_end()) {
DBG("parse_all: {} char(s) left unmatched.", res->next.remaining());
		return std::nullopt;
	}
	return res;
}

} // namespace Matching

#endif // MATCHERTOY_DEDUP

//!! These conflict with e.g. the Windows headers (included by DocTest)!
#undef ERROR
#endif // _MATCHERTOY_HPP_
