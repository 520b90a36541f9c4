#include <catch2/catch_all.hpp>

#include "mimic/mimic.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

    struct TempDir {
        fs::path path;

        TempDir() : path{ fs::temp_directory_path() / ("mimic-test-" + std::to_string(std::random_device{}())) } {
            fs::create_directories(path);
        }

        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }
    };

    struct ScopedCurrentPath {
        fs::path previous = fs::current_path();

        explicit ScopedCurrentPath(const fs::path& p) { fs::current_path(p); }

        ~ScopedCurrentPath() {
            std::error_code ec;
            fs::current_path(previous, ec);
        }
    };

    void spit(const fs::path& p, std::string_view text) {
        std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
        ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
    }

    std::string slurp(const fs::path& p) {
        std::ifstream ifs(p, std::ios::binary);
        std::ostringstream oss;
        oss << ifs.rdbuf();
        return oss.str();
    }

    std::string reencode(std::string_view text) {
        auto doc = Mimic::decode(text);
        REQUIRE(doc);
        return Mimic::encode(*doc);
    }

    const std::vector<std::string> consistent_documents = {
        "{\n  \"a\": 1,\n  \"b\": [\n    true,\n    null\n  ]\n}\n",
        "{\r\n\t\"name\": \"x\",\r\n\t\"list\": [\r\n\t\t1,\r\n\t\t2\r\n\t]\r\n}",
        "{\n    \"a\": {\n        \"b\": \"c\"\n    }\n}\n",
        "{\n  \"empty\": {},\n  \"none\": []\n}",
        "[\n\t{\n\t\t\"id\": 7\n\t}\n]\n",
        "{\"compact\":true}",
        "[]\n",
    };

} // namespace


TEST_CASE("Consistent Documents Round-Trip Exactly") {
    for (const auto& text : consistent_documents) {
        INFO("document: " << text);
        REQUIRE(reencode(text) == text);
    }
}

TEST_CASE("Re-Encoding is Idempotent") {
    const std::vector<std::string> documents = {
        "{ \"a\" : 1,\n\"b\":2 }\n",
        "{\n   \"a\": [1,\n      2],\n \"b\": {\"c\": 3}\n}",
        "[\r\n  1,\n\t2\r\n]",
        "{\n\t\"mixed\": 1,\n    \"indent\": 2\n}\n",
    };
    for (const auto& text : documents) {
        INFO("document: " << text);
        const std::string once = reencode(text);
        REQUIRE(reencode(once) == once);
    }
}

TEST_CASE("Decode Records Formatting for Structured Roots Only") {
    auto doc = Mimic::decode("{\r\n\t\"a\": 1\r\n}\r\n");
    REQUIRE(doc);
    REQUIRE(Mimic::is_tracked(*doc));

    auto f = Mimic::get_formatting(*doc);
    REQUIRE(f);
    REQUIRE(f->indent_unit == "\t");
    REQUIRE(f->use_crlf);
    REQUIRE(f->has_trailing_newline);
    REQUIRE_FALSE(f->source_path);

    auto scalar = Mimic::decode("\n  42\n");
    REQUIRE(scalar);
    REQUIRE_FALSE(Mimic::is_tracked(*scalar));
    REQUIRE(Mimic::encode(*scalar) == "42");

    REQUIRE_FALSE(Mimic::is_tracked(doc->at("a")));
}

TEST_CASE("Decode Propagates Parse Errors") {
    auto doc = Mimic::decode("{\n  \"a\": \n}");
    REQUIRE_FALSE(doc);
    REQUIRE(doc.error().errc == Mimic::ParseError::code::unexpected_character);
    REQUIRE(doc.error().line == 3);
}

TEST_CASE("Untracked Values Encode Like Dump") {
    Mimic::value v;
    v["name"] = "plain";
    v["list"][1] = true;

    REQUIRE_FALSE(Mimic::is_tracked(v));
    REQUIRE_FALSE(Mimic::get_formatting(v));
    REQUIRE(Mimic::encode(v) == Mimic::dump(v));
    REQUIRE(Mimic::encode(v) == R"({"name":"plain","list":[null,true]})");
}

TEST_CASE("Explicit Space Overrides Indentation Only") {
    auto doc = Mimic::decode("{\r\n\t\"a\": [\r\n\t\t1\r\n\t]\r\n}\r\n");
    REQUIRE(doc);

    REQUIRE(Mimic::encode(*doc, {}, 4) == "{\r\n    \"a\": [\r\n        1\r\n    ]\r\n}\r\n");
    REQUIRE(Mimic::encode(*doc, {}, "--") == "{\r\n--\"a\": [\r\n----1\r\n--]\r\n}\r\n");
    REQUIRE(Mimic::encode(*doc, {}, 0) == "{\"a\":[1]}\r\n");
    REQUIRE(Mimic::encode(*doc, {}, "") == "{\"a\":[1]}\r\n");
    REQUIRE(Mimic::encode(*doc, {}, -3) == "{\"a\":[1]}\r\n");
}

TEST_CASE("Space is Clamped and Truncated") {
    auto doc = Mimic::parse("[1]");
    REQUIRE(doc);

    REQUIRE(Mimic::encode(*doc, {}, 20) == "[\n" + std::string(10, ' ') + "1\n]");
    REQUIRE(Mimic::encode(*doc, {}, "abcdefghijkl") == "[\nabcdefghij1\n]");
}

TEST_CASE("Removing a Member Keeps Indentation") {
    SECTION("without trailing newline") {
        auto doc = Mimic::decode("{\n  \"a\": 1,\n  \"b\": 2\n}");
        REQUIRE(doc);
        REQUIRE(doc->as_object().erase("b") == 1);
        REQUIRE(Mimic::encode(*doc) == "{\n  \"a\": 1\n}");
    }

    SECTION("with trailing newline") {
        auto doc = Mimic::decode("{\n  \"a\": 1,\n  \"b\": 2\n}\n");
        REQUIRE(doc);
        REQUIRE(doc->as_object().erase("b") == 1);
        REQUIRE(Mimic::encode(*doc) == "{\n  \"a\": 1\n}\n");
    }
}

TEST_CASE("CRLF Without Trailing Newline is Byte-Identical") {
    const std::string text = "{\r\n  \"a\": 1,\r\n  \"b\": \"two\"\r\n}";
    REQUIRE(reencode(text) == text);
}

TEST_CASE("Tracking Survives Moves and Not Copies") {
    auto doc = Mimic::decode("[\n  1\n]\n");
    REQUIRE(doc);

    Mimic::value copy = *doc;
    REQUIRE_FALSE(Mimic::is_tracked(copy));
    REQUIRE(Mimic::encode(copy) == "[1]");

    Mimic::value moved = *std::move(doc);
    REQUIRE(Mimic::is_tracked(moved));
    REQUIRE(Mimic::encode(moved) == "[\n  1\n]\n");
}

TEST_CASE("Reviver Runs Bottom-Up") {
    std::vector<std::string> keys;
    auto reviver = [&keys](std::string_view key, Mimic::value v) -> std::optional<Mimic::value> {
        keys.emplace_back(key);
        if (key == "b" || key == "0") return std::nullopt;
        if (v.is_number()) return Mimic::value{ v.as_number() * 2 };
        return v;
    };

    auto doc = Mimic::decode("{\n  \"a\": 1,\n  \"b\": 2,\n  \"c\": [1, 2]\n}", reviver);
    REQUIRE(doc);
    REQUIRE(keys == std::vector<std::string>{ "a", "b", "0", "1", "c", "" });
    REQUIRE(Mimic::dump(*doc) == R"({"a":2,"c":[null,4]})");

    REQUIRE(Mimic::is_tracked(*doc));
    REQUIRE(Mimic::encode(*doc) == "{\n  \"a\": 2,\n  \"c\": [\n    null,\n    4\n  ]\n}");
}

TEST_CASE("Reviver Dropping the Root Yields Null") {
    auto doc = Mimic::decode("{\n  \"a\": 1\n}", [](std::string_view key, Mimic::value v) -> std::optional<Mimic::value> {
        if (key.empty()) return std::nullopt;
        return v;
    });
    REQUIRE(doc);
    REQUIRE(doc->is_null());
    REQUIRE_FALSE(Mimic::is_tracked(*doc));
}

TEST_CASE("Replacer Runs Top-Down") {
    auto doc = Mimic::decode("{\n  \"a\": 1,\n  \"secret\": \"x\",\n  \"list\": [1, 2, 3]\n}\n");
    REQUIRE(doc);

    std::vector<std::string> keys;
    auto replacer = [&keys](std::string_view key, const Mimic::value& v) -> std::optional<Mimic::value> {
        keys.emplace_back(key);
        if (key == "secret" || key == "1") return std::nullopt;
        return v;
    };

    REQUIRE(Mimic::encode(*doc, replacer) == "{\n  \"a\": 1,\n  \"list\": [\n    1,\n    null,\n    3\n  ]\n}\n");
    REQUIRE(keys == std::vector<std::string>{ "", "a", "secret", "list", "0", "1", "2" });

    // The document itself is left untouched
    REQUIRE(doc->as_object().contains("secret"));
}

TEST_CASE("Replacer Omitting the Root Yields Empty Output") {
    auto doc = Mimic::decode("{}\n");
    REQUIRE(doc);
    auto drop_all = [](std::string_view, const Mimic::value&) -> std::optional<Mimic::value> { return std::nullopt; };
    REQUIRE(Mimic::encode(*doc, drop_all).empty());
}

TEST_CASE("Read Then Write Without Path Targets the Source File") {
    TempDir dir;
    const std::string original = "{\r\n\t\"name\": \"demo\",\r\n\t\"version\": \"1.0.0\"\r\n}\r\n";
    spit(dir.path / "x.json", original);

    Mimic::ParseResult doc;
    {
        ScopedCurrentPath cwd{ dir.path };
        doc = Mimic::read_file("./x.json");
    }
    REQUIRE(doc);

    auto f = Mimic::get_formatting(*doc);
    REQUIRE(f);
    REQUIRE(f->source_path);
    REQUIRE(f->source_path->is_absolute());
    REQUIRE(fs::equivalent(*f->source_path, dir.path / "x.json"));

    (*doc)["version"] = "2.0.0";
    auto written = Mimic::write_file(*doc);
    REQUIRE(written);
    REQUIRE(slurp(dir.path / "x.json") == "{\r\n\t\"name\": \"demo\",\r\n\t\"version\": \"2.0.0\"\r\n}\r\n");
}

TEST_CASE("Explicit Write Path Does Not Replace the Source Path") {
    TempDir dir;
    const std::string original = "[\n  1,\n  2\n]\n";
    spit(dir.path / "in.json", original);

    auto doc = Mimic::read_file(dir.path / "in.json");
    REQUIRE(doc);

    auto written = Mimic::write_file(*doc, dir.path / "out.json");
    REQUIRE(written);
    REQUIRE(slurp(dir.path / "out.json") == original);
    REQUIRE(fs::equivalent(*Mimic::get_formatting(*doc)->source_path, dir.path / "in.json"));
}

TEST_CASE("Write Without Any Location Fails Before I/O") {
    Mimic::value plain;
    plain["a"] = 1.0;

    auto w = Mimic::write_file(plain);
    REQUIRE_FALSE(w);
    REQUIRE(w.error().errc == Mimic::WriteError::code::no_location);
    REQUIRE(w.error().msg == "no location available");
    REQUIRE(w.error().path.empty());

    auto decoded = Mimic::decode("{\n  \"a\": 1\n}");
    REQUIRE(decoded);
    auto w2 = Mimic::write_file(*decoded);
    REQUIRE_FALSE(w2);
    REQUIRE(w2.error().errc == Mimic::WriteError::code::no_location);
}

TEST_CASE("File Errors Are Reported") {
    TempDir dir;

    auto missing = Mimic::read_file(dir.path / "missing.json");
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().errc == Mimic::ParseError::code::io_error);
    REQUIRE(missing.error().line == 0);
    REQUIRE_FALSE(missing.error().msg.empty());

    spit(dir.path / "bad.json", "{\n  \"a\": tru\n}\n");
    auto bad = Mimic::read_file(dir.path / "bad.json");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().errc == Mimic::ParseError::code::unexpected_character);

    Mimic::value v;
    v["a"] = 1.0;
    auto w = Mimic::write_file(v, dir.path / "no-such-dir" / "out.json");
    REQUIRE_FALSE(w);
    REQUIRE(w.error().errc == Mimic::WriteError::code::io_error);
    REQUIRE(w.error().path == dir.path / "no-such-dir" / "out.json");
}

TEST_CASE("Library Diagnostics Go Through the Configured Logger") {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto test_logger = std::make_shared<spdlog::logger>("mimic-test", sink);
    test_logger->set_pattern("%l %v");
    Mimic::set_logger(test_logger);

    auto doc = Mimic::decode("[\n  1\n]");
    REQUIRE(doc);

#if defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#elif defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4996)
#endif
    REQUIRE(Mimic::is_managed(*doc));
    REQUIRE(Mimic::is_managed(*doc));
#if defined(__GNUC__)
#pragma GCC diagnostic pop
#elif defined(_MSC_VER)
#pragma warning(pop)
#endif

    const std::string out = captured.str();
    const auto first = out.find("is_managed() is deprecated");
    REQUIRE(first != std::string::npos);
    REQUIRE(out.find("is_managed() is deprecated", first + 1) == std::string::npos);

    auto missing = Mimic::read_file("/nonexistent-mimic-dir/file.json");
    REQUIRE_FALSE(missing);
    REQUIRE(captured.str().find("error Failed to open") != std::string::npos);

    Mimic::set_logger(nullptr);
    REQUIRE(Mimic::logger() != test_logger);
}

TEST_CASE("Deep Nesting is Rejected With a Depth Error") {
    std::string deep(100000, '[');
    deep += std::string(100000, ']');

    auto doc = Mimic::decode(deep);
    REQUIRE_FALSE(doc);
    REQUIRE(doc.error().errc == Mimic::ParseError::code::depth_limit_exceeded);

    std::string at_limit = std::string(512, '[') + std::string(512, ']');
    auto limited = Mimic::decode(at_limit);
    REQUIRE(limited);
    REQUIRE(Mimic::encode(*limited) == at_limit);

    std::string over_limit = "[" + at_limit + "]";
    auto over = Mimic::decode(over_limit);
    REQUIRE_FALSE(over);
    REQUIRE(over.error().errc == Mimic::ParseError::code::depth_limit_exceeded);
}

TEST_CASE("Reading a Directory is an I/O Error") {
    TempDir dir;

    auto doc = Mimic::read_file(dir.path);
    REQUIRE_FALSE(doc);
    REQUIRE(doc.error().errc == Mimic::ParseError::code::io_error);
    REQUIRE(doc.error().offset == 0);
    REQUIRE_FALSE(doc.error().msg.empty());
}

TEST_CASE("Line Breaks Inside the Space Unit Follow the Line Ending") {
    auto crlf = Mimic::decode("{\r\n\t\"a\": 1\r\n}");
    REQUIRE(crlf);
    REQUIRE(Mimic::encode(*crlf, {}, "\n-") == "{\r\n\r\n-\"a\": 1\r\n}");

    auto lf = Mimic::decode("{\n\t\"a\": 1\n}");
    REQUIRE(lf);
    REQUIRE(Mimic::encode(*lf, {}, "\n-") == "{\n\n-\"a\": 1\n}");
}

TEST_CASE("Default Logger Reuses an Application-Registered Logger") {
    Mimic::set_logger(nullptr);
    spdlog::drop("mimic");

    std::ostringstream captured;
    auto app_logger = std::make_shared<spdlog::logger>("mimic", std::make_shared<spdlog::sinks::ostream_sink_mt>(captured));
    spdlog::register_logger(app_logger);

    REQUIRE(Mimic::logger() == app_logger);

    auto missing = Mimic::read_file("/nonexistent-mimic-dir/file.json");
    REQUIRE_FALSE(missing);
    REQUIRE(captured.str().find("Failed to open") != std::string::npos);

    Mimic::set_logger(nullptr);
    spdlog::drop("mimic");
    auto fresh = Mimic::logger();
    REQUIRE(fresh != app_logger);
    REQUIRE(spdlog::get("mimic") == fresh);
}
