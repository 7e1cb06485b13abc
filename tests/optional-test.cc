#include <late-core/optional.hh>

#include <nexus/test.hh>

#include "check-asserts.hh"

#include <memory>
#include <string>

// optional stays trivial, so checked_cell<int> stays trivial too
static_assert(std::is_constructible_v<lc::optional<int>>);
static_assert(std::is_constructible_v<lc::optional<int>, int>);
static_assert(std::is_constructible_v<lc::optional<int>, lc::nullopt_t>);
static_assert(std::is_trivially_copyable_v<lc::optional<int>>);
static_assert(std::is_trivially_destructible_v<lc::optional<int>>);
static_assert(!std::is_trivially_destructible_v<lc::optional<std::string>>);

// usable in constant expressions
static_assert(!lc::optional<int>().has_value());
static_assert(lc::optional<int>(5).has_value());
static_assert(lc::optional<int>(5).value() == 5);

// optional references are a single pointer
static_assert(sizeof(lc::optional<int&>) == sizeof(int*));
static_assert(std::is_trivially_copyable_v<lc::optional<int const&>>);
static_assert(std::is_convertible_v<lc::optional<int&>, lc::optional<int const&>>);
static_assert(!std::is_convertible_v<lc::optional<int const&>, lc::optional<int&>>);
static_assert(!std::is_constructible_v<lc::optional<int const&>, int&&>);

namespace
{
// counting type to track special member function calls
struct counting_type
{
    int value = 0;

    static inline int value_ctor_count = 0;
    static inline int copy_ctor_count = 0;
    static inline int move_ctor_count = 0;
    static inline int dtor_count = 0;

    static void reset_counters()
    {
        value_ctor_count = 0;
        copy_ctor_count = 0;
        move_ctor_count = 0;
        dtor_count = 0;
    }

    explicit counting_type(int v) : value(v) { ++value_ctor_count; }

    counting_type(counting_type const& rhs) : value(rhs.value) { ++copy_ctor_count; }
    counting_type(counting_type&& rhs) noexcept : value(rhs.value) { ++move_ctor_count; }
    counting_type& operator=(counting_type const& rhs) = default;
    counting_type& operator=(counting_type&& rhs) noexcept = default;

    ~counting_type() { ++dtor_count; }

    friend bool operator==(counting_type const&, counting_type const&) = default;
};
} // namespace

TEST("optional - trivial types")
{
    SECTION("default construction")
    {
        auto const opt = lc::optional<int>{};
        CHECK(!opt.has_value());
    }

    SECTION("nullopt construction")
    {
        auto const opt = lc::optional<int>{lc::nullopt};
        CHECK(!opt.has_value());
    }

    SECTION("value construction")
    {
        auto const opt = lc::optional<int>{42};
        CHECK(opt.has_value());
        CHECK(opt.value() == 42);
    }

    SECTION("copy keeps both engaged")
    {
        auto const opt1 = lc::optional<int>{42};
        auto const opt2 = opt1;
        CHECK(opt1.value() == 42);
        CHECK(opt2.value() == 42);
    }

    SECTION("value and nullopt assignment")
    {
        auto opt = lc::optional<int>{};
        opt = 42;
        CHECK(opt.value() == 42);
        opt = lc::nullopt;
        CHECK(!opt.has_value());
    }
}

TEST("optional - emplace")
{
    SECTION("into empty")
    {
        counting_type::reset_counters();
        {
            lc::optional<counting_type> opt;
            auto& v = opt.emplace(7);
            CHECK(opt.has_value());
            CHECK(&v == &opt.value());
            CHECK(v.value == 7);
            CHECK(counting_type::value_ctor_count == 1);
            CHECK(counting_type::dtor_count == 0);
        }
        CHECK(counting_type::dtor_count == 1);
    }

    SECTION("into engaged destroys the previous value first")
    {
        counting_type::reset_counters();
        {
            lc::optional<counting_type> opt;
            opt.emplace(1);
            opt.emplace(2);
            CHECK(opt.value().value == 2);
            CHECK(counting_type::value_ctor_count == 2);
            CHECK(counting_type::dtor_count == 1);
        }
        CHECK(counting_type::dtor_count == 2);
    }

    SECTION("forwards constructor arguments")
    {
        lc::optional<std::string> opt;
        opt.emplace(3, 'x');
        CHECK(opt.value() == "xxx");
    }
}

TEST("optional - non-trivial special members")
{
    SECTION("copy construction")
    {
        counting_type::reset_counters();
        auto const a = lc::optional<counting_type>{counting_type(1)};
        auto const b = a;
        CHECK(b.value().value == 1);
        CHECK(counting_type::copy_ctor_count == 1);
    }

    SECTION("move construction empties the source")
    {
        auto a = lc::optional<std::string>{"boot"};
        auto const b = lc::move(a);
        CHECK(b.value() == "boot");
        CHECK(!a.has_value());
    }

    SECTION("move assignment - value to empty")
    {
        auto a = lc::optional<std::string>{"ready"};
        auto b = lc::optional<std::string>{};
        b = lc::move(a);
        CHECK(b.value() == "ready");
    }

    SECTION("copy assignment - empty to value")
    {
        auto a = lc::optional<std::string>{};
        auto b = lc::optional<std::string>{"x"};
        b = a;
        CHECK(!b.has_value());
    }

    SECTION("constructor and destructor balance")
    {
        counting_type::reset_counters();
        {
            auto a = lc::optional<counting_type>{counting_type(1)};
            auto b = a;
            auto c = lc::move(b);
            a = c;
        }
        auto const ctors
            = counting_type::value_ctor_count + counting_type::copy_ctor_count + counting_type::move_ctor_count;
        CHECK(ctors == counting_type::dtor_count);
    }
}

TEST("optional - move-only types")
{
    auto opt = lc::optional<std::unique_ptr<int>>{std::make_unique<int>(3)};
    REQUIRE(opt.has_value());
    CHECK(*opt.value() == 3);

    auto taken = lc::move(opt).value();
    CHECK(*taken == 3);
    CHECK(opt.value() == nullptr);
}

TEST("optional - equality")
{
    CHECK(lc::optional<int>{} == lc::optional<int>{});
    CHECK(!(lc::optional<int>{} == lc::optional<int>{1}));
    CHECK(lc::optional<int>{1} == lc::optional<int>{1});
    CHECK(!(lc::optional<int>{1} == lc::optional<int>{2}));

    CHECK(lc::optional<int>{1} == 1);
    CHECK(!(lc::optional<int>{} == 1));
}

TEST("optional - value on empty is a contract violation")
{
    lc::optional<int> opt;
    LC_CHECK_ASSERTS(opt.value());

    opt = 1;
    LC_CHECK_NOT_ASSERTS(opt.value());
}

TEST("optional - references")
{
    SECTION("empty")
    {
        lc::optional<int&> ref;
        CHECK(!ref.has_value());

        lc::optional<int&> from_nullopt = lc::nullopt;
        CHECK(!from_nullopt.has_value());

        LC_CHECK_ASSERTS(ref.value());
    }

    SECTION("refers to the bound object")
    {
        int x = 1;
        lc::optional<int&> ref = x;
        REQUIRE(ref.has_value());
        CHECK(&ref.value() == &x);

        ref.value() = 2;
        CHECK(x == 2);
    }

    SECTION("converts to const reference")
    {
        int x = 5;
        lc::optional<int&> ref = x;
        lc::optional<int const&> cref = ref;
        CHECK(&cref.value() == &x);

        lc::optional<int&> empty;
        lc::optional<int const&> cempty = empty;
        CHECK(!cempty.has_value());
    }

    SECTION("compares the referenced value")
    {
        std::string s = "abc";
        lc::optional<std::string const&> ref = s;
        CHECK(ref == std::string("abc"));
        CHECK(!(ref == std::string("abd")));
        CHECK(!(lc::optional<std::string const&>{} == s));
    }
}
