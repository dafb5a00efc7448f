// main.cpp
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <JBind/Binding/TypeBuilder.hpp>
#include <JBind/Serialization/JSON/JsonParser.hpp>

using namespace JBind;
using namespace JBind::Serialization;

struct Author
{
    Author(Int64 id, std::string name)
        : id(id), name(std::move(name))
    {
    }

    Int64                      id {0};
    std::string                name;
    std::optional<std::string> homepage;
};

struct Book
{
    std::string         title;
    Author              author {0, ""};
    std::vector<Author> reviewers;
    F64                 rating {0.0};
};

namespace JBind::Binding
{
    template<>
    struct TypeSchema<Author>
    {
        static constexpr std::string_view Name = "Author";

        static void Describe(TypeBuilder<Author>& builder)
        {
            builder.Constructor<Int64, std::string>({"id", "name"}).Field("homepage", &Author::homepage);
        }
    };

    template<>
    struct TypeSchema<Book>
    {
        static constexpr std::string_view Name = "Book";

        static void Describe(TypeBuilder<Book>& builder)
        {
            builder.Field("title", &Book::title)
                    .Field("author", &Book::author)
                    .Field("reviewers", &Book::reviewers)
                    .Field("rating", &Book::rating);
        }
    };
}// namespace JBind::Binding

// Prints an untyped tree on one line
void Print(const JsonValue& value)
{
    switch (value.GetType())
    {
        case JsonValue::Type::Null:
            std::cout << "null";
            break;
        case JsonValue::Type::Bool:
            std::cout << (value.AsBool() ? "true" : "false");
            break;
        case JsonValue::Type::Integer:
            std::cout << value.AsInteger();
            break;
        case JsonValue::Type::Float:
            std::cout << value.AsFloat();
            break;
        case JsonValue::Type::String:
            std::cout << '"' << value.AsString() << '"';
            break;
        case JsonValue::Type::Array:
        {
            std::cout << '[';
            bool first = true;
            for (const JsonValue& element: value.AsArray().values)
            {
                if (!first)
                    std::cout << ", ";
                Print(element);
                first = false;
            }
            std::cout << ']';
            break;
        }
        case JsonValue::Type::Object:
        {
            std::cout << '{';
            bool first = true;
            for (const JsonMember& member: value.AsObject().members)
            {
                if (!first)
                    std::cout << ", ";
                std::cout << '"' << member.name << "\": ";
                Print(member.value);
                first = false;
            }
            std::cout << '}';
            break;
        }
    }
}

void ReportError(const ParseError& error)
{
    std::cerr << "  error " << ToString(error.code) << " at " << error.location.line << ':' << error.location.column
              << " (offset " << error.location.offset << "): " << error.message << "\n";
}

int main()
{
    JsonParseOptions options;
    options.trackLocation = true;

    std::cout << "=== Untyped ===\n";
    auto tree = JsonParser::Parse(R"({"name": "JBind", "version": 1.0, "tags": ["json", "binding"], "stable": false})", options);
    if (tree.HasValue())
    {
        std::cout << "  ";
        Print(tree.ValueUnsafe());
        std::cout << "\n";
    }

    std::cout << "=== Typed ===\n";
    const char* bookJson = R"({
        "title": "Structure and Interpretation",
        "author": {"id": 1, "name": "Abelson", "homepage": "mit.edu"},
        "reviewers": [{"id": 2, "name": "Sussman"}, {"id": 3, "name": "Steele"}],
        "rating": 5
    })";
    auto book = JsonParser::ParseAs<Book>(bookJson, options);
    if (book.HasValue())
    {
        const Book& b = book.ValueUnsafe();
        std::cout << "  " << b.title << " by " << b.author.name << " (" << b.author.homepage.value_or("no homepage") << ")\n";
        for (const Author& reviewer: b.reviewers)
            std::cout << "  reviewed by #" << reviewer.id << ' ' << reviewer.name << "\n";
        std::cout << "  rating " << b.rating << "\n";
    }
    else
    {
        ReportError(book.ErrorUnsafe());
    }

    std::cout << "=== Errors ===\n";
    auto missing = JsonParser::ParseAs<Author>("{\n  \"name\": \"Anonymous\"\n}", options);
    if (!missing.HasValue())
        ReportError(missing.ErrorUnsafe());

    auto broken = JsonParser::Parse("[1, 2\n", options);
    if (!broken.HasValue())
        ReportError(broken.ErrorUnsafe());

    return 0;
}
