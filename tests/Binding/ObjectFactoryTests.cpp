#include <JBind/Binding/ObjectFactory.hpp>

#include <catch2/catch_test_macros.hpp>

#include <JBind/Exceptions/BindException.hpp>

#include <any>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    using JBind::Int64;

    struct Person
    {
        Person(Int64 id, std::string name)
            : id(id), name(std::move(name))
        {
        }

        Int64       id {0};
        std::string name;
        std::string email;
    };

    struct Settings
    {
        bool        verbose {false};
        Int64       retries {3};
        std::string mode {"fast"};
    };

    class Account
    {
    public:
        static Account Open(Int64 id) { return Account(id); }

        Int64 Id() const noexcept { return m_id; }

    private:
        explicit Account(Int64 id)
            : m_id(id)
        {
        }

        Int64 m_id {0};
    };

    struct NeedsArgument
    {
        explicit NeedsArgument(Int64 value)
            : value(value)
        {
        }

        Int64 value {0};
    };

    struct Profile
    {
        Profile(std::string handle, std::optional<std::string> bio)
            : handle(std::move(handle)), bio(std::move(bio))
        {
        }

        std::string                handle;
        std::optional<std::string> bio;
    };

    class Temperature
    {
    public:
        void SetCelsius(JBind::F64 value)
        {
            if (value < -273.15)
                throw std::invalid_argument("below absolute zero");
            m_celsius = value;
        }

        JBind::F64 Celsius() const noexcept { return m_celsius; }

    private:
        friend struct JBind::Binding::TypeSchema<Temperature>;

        JBind::F64 m_celsius {0.0};
    };

    struct Child
    {
        Int64 n {0};
    };

    struct Wrapper
    {
        explicit Wrapper(Child inner)
            : inner(inner)
        {
        }

        Child inner;
        Int64 count {0};
        Child spare;
    };
}// namespace

namespace JBind::Binding
{
    template<>
    struct TypeSchema<Person>
    {
        static constexpr std::string_view Name = "Person";

        static void Describe(TypeBuilder<Person>& builder)
        {
            builder.Constructor<Int64, std::string>({"id", "name"}).Field("email", &Person::email).Field("id", &Person::id);
        }
    };

    template<>
    struct TypeSchema<Settings>
    {
        static constexpr std::string_view Name = "Settings";

        static void Describe(TypeBuilder<Settings>& builder)
        {
            builder.Field("verbose", &Settings::verbose).Field("retries", &Settings::retries).Field("mode", &Settings::mode);
        }
    };

    template<>
    struct TypeSchema<Account>
    {
        static constexpr std::string_view Name = "Account";

        static void Describe(TypeBuilder<Account>& builder)
        {
            builder.Constructor<Int64>({"id"});
        }
    };

    template<>
    struct TypeSchema<NeedsArgument>
    {
        static constexpr std::string_view Name = "NeedsArgument";

        static void Describe(TypeBuilder<NeedsArgument>& builder)
        {
            builder.Field("value", &NeedsArgument::value);
        }
    };

    template<>
    struct TypeSchema<Profile>
    {
        static constexpr std::string_view Name = "Profile";

        static void Describe(TypeBuilder<Profile>& builder)
        {
            builder.Constructor<std::string, std::optional<std::string>>({"handle", "bio"});
        }
    };

    template<>
    struct TypeSchema<Temperature>
    {
        static constexpr std::string_view Name = "Temperature";

        static void Describe(TypeBuilder<Temperature>& builder)
        {
            builder.Field("celsius", &Temperature::m_celsius);
        }
    };

    template<>
    struct TypeSchema<Child>
    {
        static constexpr std::string_view Name = "Child";

        static void Describe(TypeBuilder<Child>& builder)
        {
            builder.Field("n", &Child::n);
        }
    };

    template<>
    struct TypeSchema<Wrapper>
    {
        static constexpr std::string_view Name = "Wrapper";

        static void Describe(TypeBuilder<Wrapper>& builder)
        {
            builder.Constructor<Child>({"inner"}).Field("count", &Wrapper::count).Field("spare", &Wrapper::spare);
        }
    };
}// namespace JBind::Binding

namespace
{
    using namespace JBind::Binding;
    using JBind::Serialization::JsonValue;

    BoundValue Json(JsonValue value)
    {
        return BoundValue::FromJson(std::move(value));
    }

    BoundValue Str(const char* text)
    {
        return Json(JsonValue::MakeString(text));
    }

    BoundValue Int(Int64 value)
    {
        return Json(JsonValue::MakeInteger(value));
    }
}// namespace

TEST_CASE("ObjectFactory binds constructor parameters then fields", "[binding][factory]")
{
    BoundMembers members;
    members.Set("email", Str("ada@example.com"));
    members.Set("name", Str("Ada"));
    members.Set("id", Int(7));
    members.Set("unknown", Int(1));

    const Person person = ObjectFactory::Create<Person>(std::move(members));
    CHECK(person.id == 7);
    CHECK(person.name == "Ada");
    CHECK(person.email == "ada@example.com");
}

TEST_CASE("ObjectFactory consumes members bound to the constructor", "[binding][factory]")
{
    // "id" is also a field; once the constructor takes it the field step must not see it again.
    BoundMembers members;
    members.Set("id", Int(1));
    members.Set("name", Str("Grace"));

    const Person person = ObjectFactory::Create<Person>(std::move(members));
    CHECK(person.id == 1);
    CHECK(person.name == "Grace");
    CHECK(person.email.empty());
}

TEST_CASE("ObjectFactory reports a missing constructor parameter", "[binding][factory]")
{
    BoundMembers members;
    members.Set("name", Str("Ada"));
    members.Set("email", Str("ada@example.com"));

    try
    {
        (void) ObjectFactory::Create(DescriptorOf<Person>(), std::move(members));
        FAIL("expected BindException");
    }
    catch (const JBind::Exceptions::BindException& e)
    {
        CHECK(e.Code() == JBind::Serialization::ParseErrorCode::MissingMember);
        CHECK(e.TypeName() == "Person");
        CHECK(e.MemberName() == "id");
        CHECK(e.SuppliedMembers() == std::vector<std::string> {"name", "email"});
        CHECK(std::string(e.what()) ==
              "The constructor of Person requires a parameter named \"id\", but none was provided. The provided members are: name, email");
    }
}

TEST_CASE("ObjectFactory default constructs types without a declared constructor", "[binding][factory]")
{
    const Settings defaults = ObjectFactory::Create<Settings>({});
    CHECK_FALSE(defaults.verbose);
    CHECK(defaults.retries == 3);
    CHECK(defaults.mode == "fast");

    BoundMembers members;
    members.Set("verbose", Json(JsonValue::MakeBool(true)));
    members.Set("mode", Str("safe"));

    const Settings custom = ObjectFactory::Create<Settings>(std::move(members));
    CHECK(custom.verbose);
    CHECK(custom.retries == 3);
    CHECK(custom.mode == "safe");
}

TEST_CASE("ObjectFactory refuses inaccessible constructors", "[binding][factory]")
{
    const TypeDescriptor& account = DescriptorOf<Account>();
    CHECK(account.HasConstructor());
    CHECK_FALSE(account.IsConstructorAccessible());
    CHECK_FALSE(account.IsConstructible());
    CHECK(Account::Open(5).Id() == 5);

    BoundMembers members;
    members.Set("id", Int(5));

    try
    {
        (void) ObjectFactory::Create(account, std::move(members));
        FAIL("expected BindException");
    }
    catch (const JBind::Exceptions::BindException& e)
    {
        CHECK(e.Code() == JBind::Serialization::ParseErrorCode::ConstructionNotAllowed);
        CHECK(e.TypeName() == "Account");
    }
}

TEST_CASE("ObjectFactory refuses types it cannot default construct", "[binding][factory]")
{
    const TypeDescriptor& type = DescriptorOf<NeedsArgument>();
    CHECK_FALSE(type.HasConstructor());
    CHECK_FALSE(type.IsConstructible());

    BoundMembers members;
    members.Set("value", Int(1));
    REQUIRE_THROWS_AS(ObjectFactory::Create(type, std::move(members)), JBind::Exceptions::BindException);
}

TEST_CASE("ObjectFactory leaves absent optional parameters empty", "[binding][factory]")
{
    BoundMembers withoutBio;
    withoutBio.Set("handle", Str("ada"));
    const Profile bare = ObjectFactory::Create<Profile>(std::move(withoutBio));
    CHECK(bare.handle == "ada");
    CHECK_FALSE(bare.bio.has_value());

    BoundMembers nullBio;
    nullBio.Set("handle", Str("ada"));
    nullBio.Set("bio", Json(JsonValue::MakeNull()));
    CHECK_FALSE(ObjectFactory::Create<Profile>(std::move(nullBio)).bio.has_value());

    BoundMembers withBio;
    withBio.Set("bio", Str("mathematician"));
    withBio.Set("handle", Str("ada"));
    const Profile full = ObjectFactory::Create<Profile>(std::move(withBio));
    REQUIRE(full.bio.has_value());
    CHECK(*full.bio == "mathematician");

    CHECK(DescriptorOf<Profile>().Parameters()[1].optional);
    CHECK_FALSE(DescriptorOf<Profile>().Parameters()[0].optional);
}

TEST_CASE("ObjectFactory assigns fields directly, bypassing setters", "[binding][factory]")
{
    BoundMembers members;
    members.Set("celsius", Json(JsonValue::MakeFloat(-500.0)));

    const Temperature temperature = ObjectFactory::Create<Temperature>(std::move(members));
    CHECK(temperature.Celsius() == -500.0);

    Temperature checked;
    CHECK_THROWS_AS(checked.SetCelsius(-500.0), std::invalid_argument);
}

TEST_CASE("TypeDescriptor assigns declared fields and rejects unknown ones", "[binding][factory]")
{
    const TypeDescriptor& settings = DescriptorOf<Settings>();
    std::any              instance = std::any(Settings {});

    settings.AssignField(instance, "retries", Int(8));
    CHECK(std::any_cast<Settings&>(instance).retries == 8);

    try
    {
        settings.AssignField(instance, "colour", Str("red"));
        FAIL("expected BindException");
    }
    catch (const JBind::Exceptions::BindException& e)
    {
        CHECK(e.Code() == JBind::Serialization::ParseErrorCode::UnknownMember);
        CHECK(e.TypeName() == "Settings");
        CHECK(e.MemberName() == "colour");
    }
}

TEST_CASE("ObjectFactory reports values of the wrong type", "[binding][factory]")
{
    BoundMembers members;
    members.Set("id", Str("seven"));
    members.Set("name", Str("Ada"));

    try
    {
        (void) ObjectFactory::Create(DescriptorOf<Person>(), std::move(members));
        FAIL("expected BindException");
    }
    catch (const JBind::Exceptions::BindException& e)
    {
        CHECK(e.Code() == JBind::Serialization::ParseErrorCode::TypeMismatch);
        CHECK(e.TypeName() == "Person");
        CHECK(e.MemberName() == "id");
    }
}

TEST_CASE("ObjectFactory resolves declared member types", "[binding][factory]")
{
    const TypeDescriptor& wrapper = DescriptorOf<Wrapper>();
    const TypeDescriptor& child   = DescriptorOf<Child>();

    CHECK(ObjectFactory::DeclaredTypeOf(wrapper, "inner") == &child);
    CHECK(ObjectFactory::DeclaredTypeOf(wrapper, "spare") == &child);
    CHECK(ObjectFactory::DeclaredTypeOf(wrapper, "count") == nullptr);
    CHECK(ObjectFactory::DeclaredTypeOf(wrapper, "missing") == nullptr);
    CHECK(ObjectFactory::DeclaredTypeOf(DescriptorOf<Person>(), "name") == nullptr);

    CHECK(wrapper.DeclaredTypeOfConstructorParameter("inner") == &child);
    CHECK(wrapper.DeclaredTypeOfField("inner") == nullptr);
    CHECK(wrapper.DeclaredTypeOfField("spare") == &child);
}

TEST_CASE("ObjectFactory binds nested bound objects", "[binding][factory]")
{
    BoundMembers inner;
    inner.Set("n", Int(4));

    BoundMembers outer;
    outer.Set("inner", BoundValue::FromObject(ObjectFactory::Create(DescriptorOf<Child>(), std::move(inner))));
    outer.Set("count", Int(2));

    const Wrapper wrapper = ObjectFactory::Create<Wrapper>(std::move(outer));
    CHECK(wrapper.inner.n == 4);
    CHECK(wrapper.count == 2);
    CHECK(wrapper.spare.n == 0);
}

TEST_CASE("BoundMembers keeps first position and last value", "[binding][factory]")
{
    BoundMembers members;
    members.Set("a", Int(1));
    members.Set("b", Int(2));
    members.Set("a", Int(3));

    REQUIRE(members.Size() == 2);
    CHECK(members.Names() == std::vector<std::string> {"a", "b"});
    REQUIRE(members.Find("a") != nullptr);
    CHECK(members.Find("a")->AsJson().AsInteger() == 3);

    auto taken = members.Take("a");
    REQUIRE(taken.has_value());
    CHECK(taken->AsJson().AsInteger() == 3);
    CHECK(members.Size() == 1);
    CHECK_FALSE(members.Take("a").has_value());
}
