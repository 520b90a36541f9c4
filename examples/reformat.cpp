#include <print>
#include <string_view>

#include "mimic/mimic.hpp"

// Usage: mimic_reformat <file.json> <key> <value>
//
// Sets a top-level member of the document in <file.json> and writes it back
// with its original indentation, line endings and final newline. <value> is
// taken as JSON when it parses, otherwise as a plain string.
int main(int argc, char** argv) {
    if (argc != 4) {
        std::println(stderr, "usage: {} <file.json> <key> <value>", argv[0]);
        return 2;
    }

    const std::string_view key = argv[2];
    const std::string_view raw = argv[3];

    auto doc = Mimic::read_file(argv[1]);
    if (!doc) {
        const auto& e = doc.error();
        std::println(stderr, "{}:{}:{}: {} ({})", argv[1], e.line, e.column, e.msg, Mimic::to_string(e.errc));
        return 1;
    }
    if (!doc->is_object()) {
        std::println(stderr, "{}: top-level value is not an object", argv[1]);
        return 1;
    }

    auto parsed = Mimic::parse(raw);
    (*doc)[key] = parsed ? *std::move(parsed) : Mimic::value{ raw };

    const auto formatting = Mimic::get_formatting(*doc);
    std::println("{}: indent {}, {} line endings",
                 argv[1],
                 formatting && formatting->indent_unit ? "'" + *formatting->indent_unit + "'" : std::string{ "none" },
                 formatting && formatting->use_crlf ? "CRLF" : "LF");

    if (auto written = Mimic::write_file(*doc); !written) {
        std::println(stderr, "{}", written.error().msg);
        return 1;
    }

    std::println("{}", Mimic::encode(*doc, {}, 2));
    return 0;
}
