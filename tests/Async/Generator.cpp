#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include <JBind/Async/Generator.hpp>

namespace
{
    JBind::Async::Generator<int> Range(int count)
    {
        for (int i = 0; i < count; ++i)
        {
            co_yield i;
        }
    }

    JBind::Async::Generator<int> YieldThenThrow()
    {
        co_yield 1;
        throw std::runtime_error("boom");
    }

    JBind::Async::Generator<std::string> Words(int& produced)
    {
        ++produced;
        co_yield "alpha";
        ++produced;
        co_yield "beta";
    }
}// namespace

TEST_CASE("Generator yields a sequence of values", "[async][generator]")
{
    std::vector<int> values;
    for (const auto v: Range(5))
    {
        values.push_back(v);
    }

    REQUIRE(values.size() == 5);
    REQUIRE(values[0] == 0);
    REQUIRE(values[1] == 1);
    REQUIRE(values[2] == 2);
    REQUIRE(values[3] == 3);
    REQUIRE(values[4] == 4);
}

TEST_CASE("Generator propagates exceptions on resume", "[async][generator]")
{
    auto gen = YieldThenThrow();

    auto it = gen.begin();
    REQUIRE(it != std::default_sentinel);
    REQUIRE(*it == 1);

    REQUIRE_THROWS_AS(++it, std::runtime_error);
}

TEST_CASE("Generator Next pulls one value at a time", "[async][generator]")
{
    int  produced = 0;
    auto gen      = Words(produced);
    REQUIRE(produced == 0);

    auto first = gen.Next();
    REQUIRE(first.has_value());
    CHECK(*first == "alpha");
    CHECK(produced == 1);

    auto second = gen.Next();
    REQUIRE(second.has_value());
    CHECK(*second == "beta");
    CHECK(produced == 2);

    CHECK_FALSE(gen.Next().has_value());
    CHECK_FALSE(gen.Next().has_value());
}

TEST_CASE("Generator Next rethrows the body's exception", "[async][generator]")
{
    auto gen = YieldThenThrow();

    auto first = gen.Next();
    REQUIRE(first.has_value());
    REQUIRE(*first == 1);

    REQUIRE_THROWS_AS(gen.Next(), std::runtime_error);
    REQUIRE_FALSE(gen.Next().has_value());
}

TEST_CASE("Default constructed Generator is empty", "[async][generator]")
{
    JBind::Async::Generator<int> gen;
    REQUIRE_FALSE(gen.Next().has_value());
    REQUIRE(gen.begin() == std::default_sentinel);
}
