#pragma once


/*
    --------------------------------------------------------------
    Mimic - JSON round-tripping that keeps a document's formatting
    --------------------------------------------------------------

    This is the main public header for Mimic

    It brings together:
        - The dynamic JSON DOM type:    `Mimic::value`, `Mimic::object`
        - Error reporting types:        `Mimic::ParseError`,
                                        `Mimic::WriteError`
        - Strict codec:                 `Mimic::parse(...)`, `Mimic::dump(...)`
        - Formatting detection:         `Mimic::Formatting`,
                                        `Mimic::detect_formatting(...)`
        - Formatting-aware round trip:  `Mimic::decode(...)`,
                                        `Mimic::encode(...)`,
                                        `Mimic::read_file(...)`,
                                        `Mimic::write_file(...)`
        - Library logging:              `Mimic::set_logger(...)`

    -------------------
    High-Level Overview
    -------------------
    - DOM:
        * `Mimic::value` represents any JSON value and uses `std::pmr`
          allocators for its nested storage
        * Objects keep their members in insertion order, so a decoded
          document is written back with its keys where they were
    - Round trip:
        * `decode` infers the indentation unit, the dominant line ending and
          the presence of a final newline, and remembers them for the
          returned value
        * `encode` replays what was remembered; values that were never
          decoded encode compactly
        * `read_file` additionally remembers where the document came from,
          so `write_file(doc)` needs no destination
    - Errors:
        * Fallible operations return `std::expected`; nothing throws on a
          malformed document or a failed file operation

    -----
    Usage
    -----
        #include <mimic/mimic.hpp>

        int main() {
            auto doc = Mimic::read_file("package.json");
            if (!doc) {
                std::println("Read error: {}", doc.error().msg);
                return 1;
            }

            (*doc)["private"] = true;

            if (auto w = Mimic::write_file(*doc); !w) {
                std::println("Write error: {}", w.error().msg);
                return 1;
            }
        }

    Include this header for the full Mimic API, or the individual headers
    (`codec.hpp`, `formatting.hpp`, `roundtrip.hpp`, ...) directly.
*/

#include "mimic/config.hpp"
#include "mimic/value.hpp"
#include "mimic/error.hpp"
#include "mimic/options.hpp"
#include "mimic/codec.hpp"
#include "mimic/formatting.hpp"
#include "mimic/registry.hpp"
#include "mimic/roundtrip.hpp"
#include "mimic/log.hpp"
