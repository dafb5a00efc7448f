#include <JBind/Serialization/Core/LookaheadCursor.hpp>

#include <catch2/catch_test_macros.hpp>

#include <JBind/Exceptions/ParseException.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    using JBind::Async::Generator;
    using JBind::Serialization::LookaheadCursor;

    Generator<int> Numbers(int count, int& pulled)
    {
        for (int i = 0; i < count; ++i)
        {
            ++pulled;
            co_yield i * 10;
        }
    }

    Generator<char> Chars(std::string text)
    {
        for (const char c: text)
            co_yield c;
    }

    Generator<const int*> Pointers(std::vector<const int*> values)
    {
        for (const int* value: values)
            co_yield value;
    }

    Generator<int> FailAfter(int count)
    {
        for (int i = 0; i < count; ++i)
            co_yield i;
        throw std::runtime_error("source failed");
    }
}// namespace

TEST_CASE("LookaheadCursor primes current and next on construction", "[serialization][cursor]")
{
    int             pulled = 0;
    LookaheadCursor cursor {Numbers(5, pulled)};

    CHECK(pulled == 2);
    REQUIRE(cursor.Current() != nullptr);
    REQUIRE(cursor.Peek() != nullptr);
    CHECK(*cursor.Current() == 0);
    CHECK(*cursor.Peek() == 10);
    CHECK(cursor.Position() == 0);
    CHECK_FALSE(cursor.IsEof());
}

TEST_CASE("LookaheadCursor draws exactly one element per advance", "[serialization][cursor]")
{
    int             pulled = 0;
    LookaheadCursor cursor {Numbers(4, pulled)};

    cursor.Advance();
    CHECK(pulled == 3);
    CHECK(*cursor.Current() == 10);
    CHECK(*cursor.Peek() == 20);
    CHECK(cursor.Position() == 1);

    cursor.Advance();
    cursor.Advance();
    CHECK(pulled == 4);
    CHECK(*cursor.Current() == 30);
    CHECK(cursor.Peek() == nullptr);

    cursor.Advance();
    CHECK(cursor.IsEof());
    CHECK(cursor.Current() == nullptr);
    CHECK(cursor.Peek() == nullptr);
    CHECK(cursor.Position() == 4);
}

TEST_CASE("LookaheadCursor over an empty source is exhausted", "[serialization][cursor]")
{
    LookaheadCursor cursor {Chars("")};
    CHECK(cursor.IsEof());
    CHECK(cursor.Current() == nullptr);
    CHECK(cursor.Peek() == nullptr);
    CHECK(cursor.History().empty());
}

TEST_CASE("LookaheadCursor records every element seen", "[serialization][cursor]")
{
    LookaheadCursor cursor {Chars("abc")};
    CHECK(cursor.History().size() == 1);

    cursor.Advance();
    cursor.Advance();
    const auto history = cursor.History();
    REQUIRE(history.size() == 3);
    CHECK(std::string(history.begin(), history.end()) == "abc");

    cursor.Advance();
    CHECK(cursor.IsEof());
    CHECK(cursor.History().size() == 3);
}

TEST_CASE("LookaheadCursor rejects the reserved end-of-input character", "[serialization][cursor]")
{
    using namespace JBind::Serialization;

    std::string text {"ab"};
    text.push_back('\0');

    LookaheadCursor cursor {Chars(text)};
    try
    {
        cursor.Advance();
        FAIL("expected ParseException");
    }
    catch (const JBind::Exceptions::ParseException& e)
    {
        CHECK(e.Code() == ParseErrorCode::InternalConsistency);
        CHECK(e.GetError().location.offset == 2);
    }
}

TEST_CASE("LookaheadCursor rejects null pointers during priming", "[serialization][cursor]")
{
    const int value = 1;
    REQUIRE_THROWS_AS(LookaheadCursor<const int*>(Pointers({&value, nullptr})), JBind::Exceptions::ParseException);
}

TEST_CASE("LookaheadCursor propagates source errors", "[serialization][cursor]")
{
    LookaheadCursor cursor {FailAfter(2)};
    CHECK(*cursor.Current() == 0);
    REQUIRE_THROWS_AS(cursor.Advance(), std::runtime_error);
}
