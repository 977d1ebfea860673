#include <sum-core/assert-handler.hh>
#include <sum-core/result.hh>

#include <nexus/test.hh>

#include <memory>
#include <optional>
#include <string>
#include <variant>

// result stays trivial when T and E are trivial
static_assert(!std::is_default_constructible_v<sc::result<int, int>>);
static_assert(std::is_constructible_v<sc::result<int, int>, int>);
static_assert(std::is_constructible_v<sc::result<int, int>, sc::success_t<int>>);
static_assert(std::is_constructible_v<sc::result<int, int>, sc::failure_t<int>>);
static_assert(std::is_trivially_copyable_v<sc::result<int, int>>);
static_assert(std::is_trivially_destructible_v<sc::result<int, int>>);
static_assert(!std::is_trivially_copyable_v<sc::result<int, std::string>>);

// the default error type is sc::any_error
static_assert(std::is_same_v<sc::result<int>::error_type, sc::any_error>);

// never cannot be instantiated
static_assert(!std::is_default_constructible_v<sc::never>);

namespace
{
struct non_trivial
{
    int value = 0;
    bool* destroyed = nullptr;

    non_trivial() = default;
    explicit non_trivial(int v) : value(v) {}
    non_trivial(int v, bool* d) : value(v), destroyed(d) {}

    ~non_trivial()
    {
        if (destroyed)
            *destroyed = true;
    }

    non_trivial(non_trivial const&) = default;
    non_trivial(non_trivial&& rhs) noexcept : value(rhs.value), destroyed(rhs.destroyed) { rhs.destroyed = nullptr; }
    non_trivial& operator=(non_trivial const&) = default;
    non_trivial& operator=(non_trivial&& rhs) noexcept
    {
        value = rhs.value;
        destroyed = rhs.destroyed;
        rhs.destroyed = nullptr;
        return *this;
    }
};

// runs f with a throwing assertion handler installed, returns the violation message if there was one
template <class F>
std::optional<std::string> violation_message(F&& f)
{
    std::optional<std::string> message;

    auto handler = sc::impl::scoped_assertion_handler(
        [&](sc::impl::assertion_info const& info)
        {
            message = info.message;
            throw 0; // Must throw to prevent abort
        });

    try
    {
        f();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    return message;
}

sc::result<int, std::string> parse_digit(char c)
{
    if (c < '0' || c > '9')
        return sc::failure(std::string("not a digit"));
    return c - '0';
}
} // namespace

TEST("result - construction")
{
    SECTION("implicit success from value")
    {
        sc::result<int, std::string> const res = 5;
        CHECK(res.is_success());
        CHECK(!res.is_failure());
        CHECK(res.value() == 5);
    }

    SECTION("explicit success and failure tags")
    {
        sc::result<int, int> const ok = sc::success(1);
        sc::result<int, int> const bad = sc::failure(2);
        CHECK(ok.is_success());
        CHECK(ok.value() == 1);
        CHECK(bad.is_failure());
        CHECK(bad.error() == 2);
    }

    SECTION("failure from convertible error")
    {
        sc::result<int, std::string> const res = sc::failure("bad");
        REQUIRE(res.is_failure());
        CHECK(res.error() == "bad");
    }

    SECTION("converting construction")
    {
        sc::result<int, char const*> const narrow = sc::failure("narrow");
        sc::result<long, std::string> const wide = narrow;
        REQUIRE(wide.is_failure());
        CHECK(wide.error() == "narrow");
    }

    SECTION("destructor runs for the active payload")
    {
        bool destroyed = false;
        {
            sc::result<non_trivial, int> const res = sc::success(non_trivial(1, &destroyed));
            CHECK(!destroyed);
        }
        CHECK(destroyed);
    }

    SECTION("move keeps the variant of the source")
    {
        sc::result<std::string, std::string> a = std::string("v");
        auto const b = sc::move(a);
        CHECK(b.value() == "v");
        CHECK(a.is_success());

        sc::result<std::string, std::string> c = sc::failure(std::string("e"));
        auto const d = sc::move(c);
        CHECK(d.error() == "e");
        CHECK(c.is_failure());
    }

    SECTION("assignment across variants")
    {
        sc::result<std::string, std::string> a = std::string("value");
        sc::result<std::string, std::string> const b = sc::failure(std::string("error"));

        a = b;
        REQUIRE(a.is_failure());
        CHECK(a.error() == "error");

        a = sc::result<std::string, std::string>(std::string("again"));
        REQUIRE(a.is_success());
        CHECK(a.value() == "again");
    }

    SECTION("move-only payloads")
    {
        sc::result<std::unique_ptr<int>, std::string> res = std::make_unique<int>(3);
        auto p = sc::move(res).unwrap();
        REQUIRE(p != nullptr);
        CHECK(*p == 3);
    }
}

TEST("result - queries")
{
    auto const is_small = [](int v) { return v < 10; };

    sc::result<int, int> const ok = 5;
    sc::result<int, int> const bad = sc::failure(50);

    CHECK(ok.is_success_and(is_small));
    CHECK(!bad.is_success_and(is_small));
    CHECK(!ok.is_failure_and(is_small));
    CHECK(!bad.is_failure_and(is_small));
    CHECK(bad.is_failure_and([](int e) { return e == 50; }));
}

TEST("result - map and map_err")
{
    SECTION("map transforms success only")
    {
        int calls = 0;
        auto twice = [&](int v)
        {
            ++calls;
            return v * 2;
        };

        CHECK(parse_digit('4').map(twice).unwrap() == 8);
        CHECK(calls == 1);

        auto const failed = parse_digit('x').map(twice);
        REQUIRE(failed.is_failure());
        CHECK(failed.error() == "not a digit");
        CHECK(calls == 1);
    }

    SECTION("map_err transforms failure only")
    {
        auto const code = [](std::string const& e) { return int(e.size()); };

        auto const failed = parse_digit('x').map_err(code);
        static_assert(std::is_same_v<std::remove_cvref_t<decltype(failed)>, sc::result<int, int>>);
        CHECK(failed.error() == 11);

        CHECK(parse_digit('1').map_err(code).value() == 1);
    }

    SECTION("map does not modify the source")
    {
        auto const src = parse_digit('7');
        auto const r = src.map([](int v) { return v + 1; });
        CHECK(r.value() == 8);
        CHECK(src.value() == 7);
    }

    SECTION("map moves out of rvalues")
    {
        sc::result<std::unique_ptr<int>, std::string> res = std::make_unique<int>(6);
        auto const r = sc::move(res).map([](std::unique_ptr<int> p) { return *p; });
        CHECK(r.value() == 6);
    }
}

TEST("result - map_or and map_or_else always succeed")
{
    SECTION("map_or")
    {
        auto const a = parse_digit('3').map_or(-1, [](int v) { return v * 3; });
        auto const b = parse_digit('?').map_or(-1, [](int v) { return v * 3; });
        REQUIRE(a.is_success());
        REQUIRE(b.is_success());
        CHECK(a.value() == 9);
        CHECK(b.value() == -1);
    }

    SECTION("map_or_else receives the error")
    {
        auto const on_err = [](std::string const& e) { return int(e.size()); };
        auto const on_ok = [](int v) { return v + 100; };

        CHECK(parse_digit('2').map_or_else(on_err, on_ok).value() == 102);
        CHECK(parse_digit('z').map_or_else(on_err, on_ok).value() == 11);
    }
}

TEST("result - and_ and and_then")
{
    SECTION("and_ returns the second result on success")
    {
        sc::result<int, std::string> const a = 1;
        sc::result<std::string, std::string> const b = std::string("second");
        auto const r = a.and_(b);
        static_assert(std::is_same_v<std::remove_cvref_t<decltype(r)>, sc::result<std::string, std::string>>);
        CHECK(r.value() == "second");
    }

    SECTION("and_ keeps the first failure")
    {
        sc::result<int, std::string> const a = sc::failure(std::string("first"));
        sc::result<int, std::string> const b = sc::failure(std::string("second"));
        CHECK(a.and_(b).error() == "first");

        sc::result<int, std::string> const one = 1;
        CHECK(one.and_(b).error() == "second");
    }

    SECTION("and_ widens different error types")
    {
        sc::result<int, int> const a = sc::failure(7);
        sc::result<char, std::string> const b = 'c';
        auto const r = a.and_(b);
        static_assert(std::is_same_v<std::remove_cvref_t<decltype(r)>, sc::result<char, std::variant<int, std::string>>>);
        REQUIRE(r.is_failure());
        REQUIRE(std::holds_alternative<int>(r.error()));
        CHECK(std::get<int>(r.error()) == 7);
    }

    SECTION("and_then short-circuits on failure")
    {
        int calls = 0;
        auto next = [&](int v) -> sc::result<int, std::string>
        {
            ++calls;
            return v + 1;
        };

        CHECK(parse_digit('5').and_then(next).value() == 6);
        CHECK(calls == 1);

        CHECK(parse_digit('-').and_then(next).error() == "not a digit");
        CHECK(calls == 1);
    }

    SECTION("and_then reports the failure of f")
    {
        auto const r = parse_digit('5').and_then([](int) -> sc::result<int, std::string> { return sc::failure(std::string("rejected")); });
        CHECK(r.error() == "rejected");
    }

    SECTION("and_then widens different error types")
    {
        sc::result<int, int> const start = 4;
        auto const r = start.and_then([](int v) { return parse_digit(char('0' + v)); });
        static_assert(std::is_same_v<std::remove_cvref_t<decltype(r)>, sc::result<int, std::variant<int, std::string>>>);
        CHECK(r.value() == 4);
    }
}

TEST("result - or_, or_else, inspect and inspect_err")
{
    SECTION("or_ returns self on success")
    {
        auto const a = parse_digit('1');
        auto const b = parse_digit('2');
        CHECK(&a.or_(b) == &a);
    }

    SECTION("or_ returns other on failure")
    {
        auto const a = parse_digit('a');
        auto const b = parse_digit('2');
        CHECK(&a.or_(b) == &b);
    }

    SECTION("or_ with a temporary fallback returns by value")
    {
        auto const bad = parse_digit('x');
        static_assert(!std::is_reference_v<decltype(bad.or_(parse_digit('5')))>);

        auto const& chosen = bad.or_(sc::result<int, std::string>(sc::failure(std::string("fallback failed"))));
        REQUIRE(chosen.is_failure());
        CHECK(chosen.error() == "fallback failed");

        auto const good = parse_digit('7');
        auto const& kept = good.or_(parse_digit('5'));
        CHECK(kept.value() == 7);
    }

    SECTION("or_else recovers with a different error type")
    {
        int calls = 0;
        auto recover = [&](std::string const& e) -> sc::result<int, int>
        {
            ++calls;
            return int(e.size());
        };

        CHECK(parse_digit('3').or_else(recover).value() == 3);
        CHECK(calls == 0);

        auto const r = parse_digit('b').or_else(recover);
        static_assert(std::is_same_v<std::remove_cvref_t<decltype(r)>, sc::result<int, int>>);
        CHECK(r.value() == 11);
        CHECK(calls == 1);
    }

    SECTION("inspect returns the same object")
    {
        auto const res = parse_digit('9');
        int seen = 0;
        auto const& r = res.inspect([&](int v) { seen = v; });
        CHECK(&r == &res);
        CHECK(seen == 9);
    }

    SECTION("inspect_err returns the same object")
    {
        auto const res = parse_digit('q');
        std::string seen;
        auto const& r = res.inspect_err([&](std::string const& e) { seen = e; });
        CHECK(&r == &res);
        CHECK(seen == "not a digit");
    }

    SECTION("inspect callbacks only run on the matching variant")
    {
        int value_calls = 0;
        int error_calls = 0;
        auto const ok = parse_digit('1');
        auto const bad = parse_digit('x');

        (void)ok.inspect_err([&](std::string const&) { ++error_calls; });
        (void)bad.inspect([&](int) { ++value_calls; });
        CHECK(value_calls == 0);
        CHECK(error_calls == 0);
    }
}

namespace
{
// copying throws, moving does not; live counts constructed objects
struct copy_bomb
{
    inline static int live = 0;

    copy_bomb() { ++live; }
    copy_bomb(copy_bomb const&) { throw 1; }
    copy_bomb(copy_bomb&&) noexcept { ++live; }
    copy_bomb& operator=(copy_bomb const&) = default;
    copy_bomb& operator=(copy_bomb&&) noexcept = default;
    ~copy_bomb() { --live; }
};
} // namespace

TEST("result - copy assignment across variants is exception safe")
{
    copy_bomb::live = 0;
    {
        sc::result<std::string, copy_bomb> target = std::string("a string long enough to live on the heap");
        sc::result<std::string, copy_bomb> const source = sc::failure(copy_bomb());
        CHECK(copy_bomb::live == 1);

        bool thrown = false;
        try
        {
            target = source;
        }
        catch (int)
        {
            thrown = true;
        }

        CHECK(thrown);
        REQUIRE(target.is_success());
        CHECK(target.value() == "a string long enough to live on the heap");
        CHECK(copy_bomb::live == 1);

        // same-variant copies assign in place
        sc::result<std::string, copy_bomb> other = std::string("short");
        other = target;
        CHECK(other.value() == target.value());
    }
    CHECK(copy_bomb::live == 0);
}

TEST("result - extraction")
{
    sc::result<int, std::string> const ok = 5;
    sc::result<int, std::string> const bad = sc::failure(std::string("Oh no"));

    SECTION("unwrap and expect on success")
    {
        CHECK(ok.unwrap() == 5);
        CHECK(ok.expect("should work") == 5);
        CHECK(bad.unwrap_err() == "Oh no");
        CHECK(bad.expect_err("should fail") == "Oh no");
    }

    SECTION("unwrap on failure renders the error")
    {
        auto const msg = violation_message([&] { (void)bad.unwrap(); });
        REQUIRE(msg.has_value());
        CHECK(msg->find("\"Oh no\"") != std::string::npos);
    }

    SECTION("rendered errors escape quotes and line breaks")
    {
        sc::result<int, std::string> const quoted = sc::failure(std::string("bad \"token\"\nline2"));
        auto const msg = violation_message([&] { (void)quoted.unwrap(); });
        REQUIRE(msg.has_value());
        CHECK(*msg == "\"bad \\\"token\\\"\\nline2\"");
    }

    SECTION("a null char pointer payload is reported, not dereferenced")
    {
        sc::result<char const*, int> const null_value = static_cast<char const*>(nullptr);
        auto const msg = violation_message([&] { (void)null_value.unwrap_err(); });
        REQUIRE(msg.has_value());
        CHECK(*msg == "nullptr");
    }

    SECTION("expect on failure prefixes the message")
    {
        auto const msg = violation_message([&] { (void)bad.expect("Testing expect"); });
        REQUIRE(msg.has_value());
        CHECK(*msg == "Testing expect: \"Oh no\"");
    }

    SECTION("unwrap_err on success renders the value")
    {
        auto const msg = violation_message([&] { (void)ok.unwrap_err(); });
        REQUIRE(msg.has_value());
        CHECK(*msg == "5");
    }

    SECTION("expect_err on success prefixes the message")
    {
        auto const msg = violation_message([&] { (void)ok.expect_err("Testing expect_err"); });
        REQUIRE(msg.has_value());
        CHECK(*msg == "Testing expect_err: 5");
    }

    SECTION("unwrap_or and unwrap_or_else")
    {
        CHECK(ok.unwrap_or(0) == 5);
        CHECK(bad.unwrap_or(0) == 0);

        int calls = 0;
        auto from_error = [&](std::string const& e)
        {
            ++calls;
            return int(e.size());
        };
        CHECK(ok.unwrap_or_else(from_error) == 5);
        CHECK(calls == 0);
        CHECK(bad.unwrap_or_else(from_error) == 5);
        CHECK(calls == 1);
    }

    SECTION("into_ok and into_err")
    {
        sc::result<int, sc::never> const always = 42;
        CHECK(always.into_ok() == 42);

        sc::result<sc::never, std::string> const never_ok = sc::failure(std::string("only error"));
        CHECK(never_ok.into_err() == "only error");
    }
}

TEST("result - flatten")
{
    using inner = sc::result<int, std::string>;

    sc::result<inner, std::string> const ok_ok = sc::success(inner(5));
    sc::result<inner, std::string> const ok_bad = sc::success(inner(sc::failure(std::string("inner"))));
    sc::result<inner, std::string> const bad = sc::failure(std::string("outer"));

    CHECK(ok_ok.flatten().value() == 5);
    CHECK(ok_bad.flatten().error() == "inner");
    CHECK(bad.flatten().error() == "outer");
}

TEST("result - comparison and rendering")
{
    SECTION("equality")
    {
        CHECK(parse_digit('1') == parse_digit('1'));
        CHECK(parse_digit('1') != parse_digit('2'));
        CHECK(parse_digit('x') == parse_digit('y'));
        CHECK(parse_digit('1') != parse_digit('y'));
        CHECK(parse_digit('1') == sc::success(1));
        CHECK(parse_digit('x') == sc::failure(std::string("not a digit")));
    }

    SECTION("to_string")
    {
        CHECK(parse_digit('5').to_string() == "success(5)");
        CHECK(parse_digit('x').to_string() == "failure(\"not a digit\")");
    }
}

TEST("any_error - basics")
{
    SECTION("default is empty")
    {
        auto const e = sc::any_error();
        CHECK(e.is_empty());
        CHECK(e.message().empty());
        CHECK(e.context_count() == 0);
        CHECK(e.to_string() == "error: <empty sc::any_error>\n");
    }

    SECTION("message and site")
    {
        int const line = __LINE__ + 1;
        auto const e = sc::any_error("disk full");
        CHECK(!e.is_empty());
        CHECK(e.message() == "disk full");
        CHECK(e.site().line() == line);
        CHECK(std::string(e.site().file_name()).ends_with("result-test.cc"));
    }

    SECTION("context chain renders newest first")
    {
        auto e = sc::any_error("disk full");
        e.add_context("writing cache");
        e.add_context("saving project");
        CHECK(e.context_count() == 2);

        auto const s = e.to_string();
        CHECK(s.starts_with("error: disk full\n  at "));
        auto const newer = s.find("context: saving project");
        auto const older = s.find("context: writing cache");
        REQUIRE(newer != std::string::npos);
        REQUIRE(older != std::string::npos);
        CHECK(newer < older);
    }

    SECTION("long context chains are released on assignment and destruction")
    {
        auto e = sc::any_error("deep");
        for (auto i = 0; i < 200'000; ++i)
            e.add_context("retry");
        CHECK(e.context_count() == 200'000);

        auto copy = e;
        CHECK(copy.context_count() == 200'000);

        e = sc::any_error("replaced");
        CHECK(e.context_count() == 0);
        CHECK(e.message() == "replaced");

        copy = e;
        CHECK(copy.message() == "replaced");
        CHECK(copy.context_count() == 0);
    }

    SECTION("copies are deep")
    {
        auto a = sc::any_error("original");
        a.add_context("shared");

        auto b = a;
        b.add_context("only b");

        CHECK(a.context_count() == 1);
        CHECK(b.context_count() == 2);
        CHECK(b.message() == "original");
    }

    SECTION("context on an empty error")
    {
        auto e = sc::any_error().with_context("late context");
        CHECK(!e.is_empty());
        CHECK(e.context_count() == 1);
    }
}

TEST("any_error - result integration")
{
    auto const load = [](bool fail) -> sc::result<int>
    {
        if (fail)
            return sc::failure(sc::any_error("file not found"));
        return 1;
    };

    SECTION("with_context annotates failures")
    {
        auto const r = load(true).with_context("loading settings");
        REQUIRE(r.is_failure());
        CHECK(r.error().message() == "file not found");
        CHECK(r.error().context_count() == 1);
        CHECK(r.error().to_string().find("context: loading settings") != std::string::npos);
    }

    SECTION("with_context passes successes through")
    {
        auto const r = load(false).with_context("loading settings");
        CHECK(r.value() == 1);
    }

    SECTION("with_context_lazy only builds the message on failure")
    {
        int calls = 0;
        auto describe = [&]
        {
            ++calls;
            return std::string("lazy context");
        };

        CHECK(load(false).with_context_lazy(describe).is_success());
        CHECK(calls == 0);

        auto const r = load(true).with_context_lazy(describe);
        CHECK(calls == 1);
        CHECK(r.error().context_count() == 1);
    }

    SECTION("unwrap renders the full error")
    {
        auto const msg = violation_message([&] { (void)load(true).unwrap(); });
        REQUIRE(msg.has_value());
        CHECK(msg->find("error: file not found") != std::string::npos);
    }
}
