#include <catch2/catch_all.hpp>

#include "yamlsort/yamlsort.hpp"

#include <algorithm>
#include <limits>
#include <random>
#include <sstream>

using namespace Catch;

namespace {

    struct rng {
        std::mt19937_64 eng;

        rng() : eng(std::random_device{}()) {}

        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }

        std::string random_key(size_t max_len = 8) {
            size_t len = uniform_size(1, max_len);
            std::string s;
            s.reserve(len);
            for (size_t i = 0; i < len; i++)
                s.push_back(static_cast<char>('a' + uniform_size(0, 25)));
            return s;
        }
    };

    yamlsort::value random_tree(rng& r, int depth = 0, int max_depth = 3) {
        size_t pick = depth >= max_depth ? r.uniform_size(0, 2) : r.uniform_size(0, 4);
        switch (pick) {
            case 0: return yamlsort::value{ static_cast<std::int64_t>(r.uniform_size(0, 100000)) };
            // "s" prefix keeps random text clear of the null and boolean words
            case 1: return yamlsort::value{ std::string_view{ "s" + r.random_key() } };
            case 2: return yamlsort::value{ nullptr };
            case 3: {
                yamlsort::value v{ yamlsort::sequence{} };
                size_t n = r.uniform_size(0, 4);
                for (size_t i = 0; i < n; i++)
                    v.as_sequence().emplace_back(random_tree(r, depth + 1, max_depth));
                return v;
            }
        }
        yamlsort::value v{ yamlsort::mapping{} };
        size_t n = r.uniform_size(0, 6);
        for (size_t i = 0; i < n; i++)
            v[r.random_key()] = random_tree(r, depth + 1, max_depth);
        if (r.uniform_size(0, 1)) v["name"] = "x";
        return v;
    }

    std::string emit(const yamlsort::value& v, const yamlsort::EmitOptions& opts = {}) {
        auto r = yamlsort::serialize(v, opts);
        REQUIRE(r);
        return *r;
    }
}


TEST_CASE("Key Order Puts name First") {
    using yamlsort::key_less;

    REQUIRE(key_less("name", "a"));
    REQUIRE_FALSE(key_less("a", "name"));
    REQUIRE_FALSE(key_less("name", "name"));
    REQUIRE(key_less("a", "b"));
    REQUIRE_FALSE(key_less("b", "a"));
    // byte order: upper case sorts before lower case
    REQUIRE(key_less("Zeta", "alpha"));
    REQUIRE(key_less("Name", "name") == false);
    REQUIRE(key_less("names", "name") == false);
}

TEST_CASE("Ordered Keys of a Mapping") {
    yamlsort::value v;
    v["zeta"] = 1;
    v["alpha"] = 2;
    v["Name"] = 3;
    v["name"] = 4;
    v["name2"] = 5;

    auto keys = yamlsort::ordered_keys(v.as_mapping());
    REQUIRE(keys.size() == 5);
    CHECK(keys[0] == "name");
    CHECK(keys[1] == "Name");
    CHECK(keys[2] == "alpha");
    CHECK(keys[3] == "name2");
    CHECK(keys[4] == "zeta");

    REQUIRE(yamlsort::ordered_keys(yamlsort::mapping{}).empty());
}

TEST_CASE("Mapping With name Renders It First") {
    yamlsort::value v;
    v["b"] = "2";
    v["a"] = "1";
    v["name"] = "x";

    REQUIRE(emit(v) == "name: x\na: \"1\"\nb: \"2\"\n");
}

TEST_CASE("Mapping Without name Renders Keys in Lexical Order") {
    yamlsort::value v;
    v["port"] = 80;
    v["host"] = "localhost";
    v["ENV"] = "prod";

    REQUIRE(emit(v) == "ENV: prod\nhost: localhost\nport: 80\n");
}

TEST_CASE("Empty Mapping Renders Braces") {
    yamlsort::value v{ yamlsort::mapping{} };
    REQUIRE(emit(v) == "{}\n");

    SECTION("as a mapping value") {
        yamlsort::value outer;
        outer["labels"] = yamlsort::mapping{};
        REQUIRE(emit(outer) == "labels: {}\n");
    }

    SECTION("as a sequence element") {
        yamlsort::value outer;
        outer["items"][0] = yamlsort::mapping{};
        REQUIRE(emit(outer) == "items:\n- {}\n");
    }
}

TEST_CASE("Empty Sequence Renders Brackets") {
    yamlsort::value v{ yamlsort::sequence{} };
    REQUIRE(emit(v) == "[]\n");

    yamlsort::value outer;
    outer["args"] = yamlsort::sequence{};
    REQUIRE(emit(outer) == "args: []\n");
}

TEST_CASE("Null Mapping Value Renders Key Only") {
    yamlsort::value v;
    v["key"] = nullptr;
    v["a"] = "x";

    REQUIRE(emit(v) == "a: x\nkey:\n");
    REQUIRE(emit(yamlsort::value{}) == "\n");
}

TEST_CASE("Ambiguous Strings Are Quoted") {
    using yamlsort::needs_quotes;

    for (std::string_view s : { "true", "false", "yes", "NO", "On", "off", "TRUE", "Yes", "123abc", "0", ",abc", "" }) {
        INFO("string: '" << s << "'");
        REQUIRE(needs_quotes(s));
    }

    for (std::string_view s : { "hello", "nginx:1.25", "y", "n", "onion", "no-cache", "-1", "a,b", "v1.2" }) {
        INFO("string: '" << s << "'");
        REQUIRE_FALSE(needs_quotes(s));
    }

    REQUIRE(needs_quotes("hello", { .quote_strings = true }));
}

TEST_CASE("Format Scalar") {
    using yamlsort::format_scalar;
    using yamlsort::value;

    SECTION("strings") {
        REQUIRE(format_scalar(value{ "hello" }) == "hello");
        REQUIRE(format_scalar(value{ "" }) == R"("")");
        REQUIRE(format_scalar(value{ "off" }) == R"("off")");
        REQUIRE(format_scalar(value{ ",abc" }) == R"(",abc")");
        REQUIRE(format_scalar(value{ "hello" }, { .quote_strings = true }) == R"("hello")");
    }

    SECTION("quoted strings escape quotes and backslashes") {
        REQUIRE(format_scalar(value{ R"(1 "a" \)" }) == R"("1 \"a\" \\")");
        REQUIRE(format_scalar(value{ R"(say "hi")" }, { .quote_strings = true }) == R"("say \"hi\"")");
        // unquoted strings are written verbatim
        REQUIRE(format_scalar(value{ R"(say "hi")" }) == R"(say "hi")");
    }

    SECTION("integers") {
        REQUIRE(format_scalar(value{ 42 }) == "42");
        REQUIRE(format_scalar(value{ -7 }) == "-7");
        REQUIRE(format_scalar(value{ std::numeric_limits<std::int64_t>::min() }) == "-9223372036854775808");
    }

    SECTION("floating values use the shortest round-trip form") {
        REQUIRE(format_scalar(value{ 1.5 }) == "1.5");
        REQUIRE(format_scalar(value{ 0.1 }) == "0.1");
        REQUIRE(format_scalar(value{ 100.0 }) == "100");
        REQUIRE(format_scalar(value{ 1e21 }) == "1e+21");
        REQUIRE(format_scalar(value{ std::numeric_limits<double>::infinity() }) == ".inf");
        REQUIRE(format_scalar(value{ -std::numeric_limits<double>::infinity() }) == "-.inf");
        REQUIRE(format_scalar(value{ std::numeric_limits<double>::quiet_NaN() }) == ".nan");
    }

    SECTION("non-scalars are rejected") {
        REQUIRE_THROWS_AS(format_scalar(value{}), std::invalid_argument);
        REQUIRE_THROWS_AS(format_scalar(value{ true }), std::invalid_argument);
        REQUIRE_THROWS_AS(format_scalar(value{ yamlsort::mapping{} }), std::invalid_argument);
    }
}

TEST_CASE("Keys Are Written Verbatim") {
    yamlsort::value v;
    v["yes"] = 1;
    v["8080"] = 2;
    v["a: b"] = 3;

    // only values go through the quoting rule
    REQUIRE(emit(v) == "8080: 2\na: b: 3\nyes: 1\n");
    REQUIRE(emit(v, { .quote_strings = true }) == "8080: 2\na: b: 3\nyes: 1\n");
}

TEST_CASE("Always Quote Option Applies to Every String") {
    yamlsort::value v;
    v["a"] = "hello";
    v["n"] = 5;
    v["list"][0] = "x";

    REQUIRE(emit(v, { .quote_strings = true }) == "a: \"hello\"\nlist:\n- \"x\"\nn: 5\n");
}

TEST_CASE("Classify Value Shapes") {
    using yamlsort::classify;
    using yamlsort::shape;
    using yamlsort::value;

    REQUIRE(classify(value{}) == shape::omitted);
    REQUIRE(classify(value{ "x" }) == shape::inline_scalar);
    REQUIRE(classify(value{ 1 }) == shape::inline_scalar);
    REQUIRE(classify(value{ 1.5 }) == shape::inline_scalar);
    REQUIRE(classify(value{ yamlsort::mapping{} }) == shape::empty_mapping);
    REQUIRE(classify(value{ yamlsort::sequence{} }) == shape::empty_sequence);
    REQUIRE(classify(value{ true }) == shape::unsupported);

    value m;
    m["k"] = 1;
    REQUIRE(classify(m) == shape::block);

    value s;
    s[0] = 1;
    REQUIRE(classify(s) == shape::block);
}

TEST_CASE("Sequence of Mappings Aligns Sibling Keys") {
    yamlsort::value v;
    v["items"][0]["value"] = 1;
    v["items"][0]["name"] = "a";
    v["items"][1]["value"] = 2;
    v["items"][1]["name"] = "b";

    REQUIRE(emit(v) ==
        "items:\n"
        "- name: a\n"
        "  value: 1\n"
        "- name: b\n"
        "  value: 2\n");
}

TEST_CASE("Top-Level Sequence of Mappings") {
    yamlsort::value v;
    v[0]["b"] = 1;
    v[0]["name"] = "a";
    v[1] = "plain";

    REQUIRE(emit(v) ==
        "- name: a\n"
        "  b: 1\n"
        "- plain\n");
}

TEST_CASE("Sequence Elements Keep Their Order") {
    yamlsort::value v;
    v["l"][0] = "z";
    v["l"][1] = nullptr;
    v["l"][2] = 3;
    v["l"][3] = "a";

    REQUIRE(emit(v) == "l:\n- z\n- \n- 3\n- a\n");
}

TEST_CASE("Nested Sequences Share the Marker Line") {
    yamlsort::value v;
    v["m"][0][0] = "a";
    v["m"][0][1] = "b";
    v["m"][1] = "c";
    v["m"][2] = yamlsort::sequence{};

    REQUIRE(emit(v) ==
        "m:\n"
        "- - a\n"
        "  - b\n"
        "- c\n"
        "- []\n");
}

TEST_CASE("Deeply Nested Manifest") {
    yamlsort::value v;
    v["spec"]["replicas"] = 3;
    v["spec"]["containers"][0]["ports"][0]["protocol"] = "TCP";
    v["spec"]["containers"][0]["ports"][0]["containerPort"] = 8080;
    v["spec"]["containers"][0]["name"] = "nginx";
    v["kind"] = "Deployment";
    v["name"] = "web";

    REQUIRE(emit(v) ==
        "name: web\n"
        "kind: Deployment\n"
        "spec:\n"
        "  containers:\n"
        "  - name: nginx\n"
        "    ports:\n"
        "    - containerPort: 8080\n"
        "      protocol: TCP\n"
        "  replicas: 3\n");
}

TEST_CASE("Top-Level Scalars") {
    REQUIRE(emit(yamlsort::value{ "hello" }) == "hello\n");
    REQUIRE(emit(yamlsort::value{ "yes" }) == "\"yes\"\n");
    REQUIRE(emit(yamlsort::value{ 12 }) == "12\n");
}

TEST_CASE("Boolean Fails the Whole Document") {
    yamlsort::value v;
    v["a"] = "x";
    v["flag"] = true;
    v["z"] = "y";

    auto r = yamlsort::serialize(v);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == yamlsort::EmitError::code::unsupported_kind);
    REQUIRE(r.error().offending == yamlsort::kind::boolean);
    REQUIRE(r.error().path == "flag");
    REQUIRE_THAT(r.error().msg, Matchers::ContainsSubstring("boolean"));
    REQUIRE_THAT(r.error().msg, Matchers::ContainsSubstring("true"));

    SECTION("stream output keeps what was written before the failure") {
        std::ostringstream oss;
        auto sr = yamlsort::serialize(v, oss);
        REQUIRE_FALSE(sr);
        REQUIRE(oss.str() == "a: x\n");
    }

    SECTION("input is left untouched") {
        yamlsort::value copy = v;
        (void)yamlsort::serialize(v);
        REQUIRE(copy == v);
    }
}

TEST_CASE("Unsupported Kind Reports Its Path") {
    yamlsort::value v;
    v["spec"]["ports"][0]["port"] = 80;
    v["spec"]["ports"][0]["enabled"] = false;

    auto r = yamlsort::serialize(v);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().path == "spec.ports[0].enabled");

    yamlsort::value seq;
    seq[0] = "ok";
    seq[1] = true;
    auto r2 = yamlsort::serialize(seq);
    REQUIRE_FALSE(r2);
    REQUIRE(r2.error().path == "[1]");

    auto r3 = yamlsort::serialize(yamlsort::value{ false });
    REQUIRE_FALSE(r3);
    REQUIRE(r3.error().path.empty());
}

TEST_CASE("Serialization is Deterministic") {
    rng r;

    for (int i = 0; i < 100; i++) {
        yamlsort::value original = random_tree(r);
        yamlsort::value copy = original;

        std::string first = emit(original);
        REQUIRE(first == emit(original));
        REQUIRE(first == emit(copy));
    }
}

TEST_CASE("Output Does Not Depend on Insertion Order") {
    std::vector<std::string> keys{ "metadata", "name", "spec", "apiVersion", "kind", "status" };

    yamlsort::value reference;
    for (const auto& k : keys) reference[k] = std::string_view{ k };
    std::string expected = emit(reference);

    std::sort(keys.begin(), keys.end());
    do {
        yamlsort::value v;
        for (const auto& k : keys) v[k] = std::string_view{ k };
        REQUIRE(emit(v) == expected);
    } while (std::next_permutation(keys.begin(), keys.end()));
}

TEST_CASE("Sorted Output Reloads to the Same Tree") {
    rng r;

    for (int i = 0; i < 100; i++) {
        yamlsort::value original{ yamlsort::mapping{} };
        original["root"] = random_tree(r);

        std::string text = emit(original);
        auto reloaded = yamlsort::load(text);
        INFO(text);
        REQUIRE(reloaded);
        REQUIRE(*reloaded == original);
    }
}

// ------------------------------------------------------------
// DOM
// ------------------------------------------------------------

TEST_CASE("Mapping Operator[] Inserts Keys") {
    yamlsort::value v;
    v["x"] = 1.0;

    REQUIRE(v.is_mapping());
    REQUIRE(v["x"].as_floating() == Approx(1.0));

    v["y"];
    REQUIRE(v["y"].is_null());
    REQUIRE(v.size() == 2);
}

TEST_CASE("Sequence Operator[] Grows and Fills With Null") {
    yamlsort::value v;
    v[3] = 42;

    auto& seq = v.as_sequence();
    REQUIRE(seq.size() == 4);
    REQUIRE(seq[0].is_null());
    REQUIRE(seq[3].as_integer() == 42);

    const yamlsort::value& cv = v;
    REQUIRE(cv[10].is_null());
}

TEST_CASE("Value Kinds") {
    REQUIRE(yamlsort::value{}.type() == yamlsort::kind::null);
    REQUIRE(yamlsort::value{ true }.type() == yamlsort::kind::boolean);
    REQUIRE(yamlsort::value{ 3 }.type() == yamlsort::kind::integer);
    REQUIRE(yamlsort::value{ std::uint16_t{ 3 } }.type() == yamlsort::kind::integer);
    REQUIRE(yamlsort::value{ 3.0 }.type() == yamlsort::kind::floating);
    REQUIRE(yamlsort::value{ "s" }.type() == yamlsort::kind::string);
    REQUIRE(yamlsort::to_string(yamlsort::kind::mapping) == "mapping");
    REQUIRE(yamlsort::to_string(yamlsort::kind::boolean) == "boolean");

    REQUIRE(yamlsort::value{ "s" }.is_scalar());
    REQUIRE(yamlsort::value{ 3 }.is_scalar());
    REQUIRE(yamlsort::value{ 3.0 }.is_scalar());
    REQUIRE_FALSE(yamlsort::value{ true }.is_scalar());
    REQUIRE_FALSE(yamlsort::value{}.is_scalar());
    REQUIRE_FALSE(yamlsort::value{ yamlsort::sequence{} }.is_scalar());
}

TEST_CASE("Value Equality is Structural") {
    yamlsort::value a;
    a["x"] = 1;
    a["y"].as_sequence().emplace_back("s");

    yamlsort::value b;
    b["y"].as_sequence().emplace_back("s");
    b["x"] = 1;

    REQUIRE(a == b);

    b["x"] = 1.0;
    REQUIRE_FALSE(a == b);
}

TEST_CASE("At Throws for Missing Keys") {
    yamlsort::value v;
    v["a"] = 1;

    REQUIRE(v.at("a").as_integer() == 1);
    REQUIRE(v.find("b") == nullptr);
    REQUIRE_THROWS_AS(v.at("b"), std::out_of_range);
}

struct CountingResource : std::pmr::memory_resource {
    size_t allocs = 0;
    size_t deallocs = 0;

    void* do_allocate(size_t bytes, size_t alignment) override {
        allocs++;
        return std::pmr::get_default_resource()->allocate(bytes, alignment);
    }

    void do_deallocate(void* p, size_t bytes, size_t alignment) override {
        deallocs++;
        return std::pmr::get_default_resource()->deallocate(p, bytes, alignment);
    }

    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept override {
        return this == &other;
    }
};

TEST_CASE("Value Uses Provided memory_resource") {
    CountingResource res;
    {
        yamlsort::value v{ &res };

        v["a long key that does not fit in SSO"] = "value";
        v["seq"].as_sequence().emplace_back(123);

        REQUIRE(res.allocs > 0);
        REQUIRE(v.resource() == &res);
    }
    REQUIRE(res.allocs == res.deallocs);
}
