#include <JBind/Utilities/Expected.hpp>

#include <catch2/catch_test_macros.hpp>

#include <JBind/Exceptions/Exception.hpp>

#include <string>
#include <utility>

namespace
{
    struct MoveOnly
    {
        int value {0};

        explicit MoveOnly(int v) noexcept
            : value {v}
        {
        }

        MoveOnly(const MoveOnly&)            = delete;
        MoveOnly& operator=(const MoveOnly&) = delete;

        MoveOnly(MoveOnly&& other) noexcept
            : value {other.value}
        {
            other.value = -1;
        }

        MoveOnly& operator=(MoveOnly&& other) noexcept
        {
            value       = other.value;
            other.value = -1;
            return *this;
        }
    };
}// namespace

TEST_CASE("Expected<T,E> basic value construction", "[utilities][expected]")
{
    using Expected = JBind::Utilities::Expected<int, std::string>;

    Expected a {42};
    REQUIRE(a.HasValue());
    REQUIRE(static_cast<bool>(a));
    REQUIRE(a.Value() == 42);
    REQUIRE(a.ValueUnsafe() == 42);
}

TEST_CASE("Expected<T,E> basic error construction", "[utilities][expected]")
{
    using Expected = JBind::Utilities::Expected<int, std::string>;

    Expected e {JBind::Utilities::Unexpected<std::string> {"bad"}};
    REQUIRE_FALSE(e.HasValue());
    REQUIRE_FALSE(static_cast<bool>(e));
    REQUIRE(e.Error() == "bad");
    REQUIRE(e.ErrorUnsafe() == "bad");
}

TEST_CASE("Expected<T,E> checked accessors throw on misuse", "[utilities][expected]")
{
    using Expected = JBind::Utilities::Expected<int, std::string>;

    Expected value {1};
    Expected error {JBind::Utilities::Unexpected<std::string> {"bad"}};

    REQUIRE_THROWS_AS(value.Error(), JBind::Exceptions::Exception);
    REQUIRE_THROWS_AS(error.Value(), JBind::Exceptions::Exception);
}

TEST_CASE("Expected<T,E> move-only value", "[utilities][expected]")
{
    using Expected = JBind::Utilities::Expected<MoveOnly, int>;

    Expected a {MoveOnly {5}};
    REQUIRE(a.HasValue());
    REQUIRE(a.Value().value == 5);

    Expected b {std::move(a)};
    REQUIRE(b.HasValue());
    REQUIRE(b.Value().value == 5);
}

TEST_CASE("Expected<T,E> rvalue Value/Error accessors move", "[utilities][expected]")
{
    using ExpectedValue = JBind::Utilities::Expected<MoveOnly, int>;
    ExpectedValue a {MoveOnly {42}};

    MoveOnly extracted = std::move(a).Value();
    REQUIRE(extracted.value == 42);
    REQUIRE(a.HasValue());
    REQUIRE(a.ValueUnsafe().value == -1);

    using ExpectedError = JBind::Utilities::Expected<int, std::string>;
    ExpectedError b {JBind::Utilities::Unexpected<std::string> {"moved"}};
    std::string   extractedError = std::move(b).Error();
    REQUIRE(extractedError == "moved");
    REQUIRE_FALSE(b.HasValue());
}
