#include "mimic/formatting.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>


namespace Mimic {

    namespace detail {

        // Leading run of a single indentation character, empty if the line
        // is not indented or starts with mixed spaces and tabs.
        std::string_view leading_run(std::string_view line) noexcept {
            if (line.empty() || (line.front() != ' ' && line.front() != '\t')) return {};
            const char c = line.front();
            size_t n = line.find_first_not_of(c);
            if (n == std::string_view::npos) n = line.size();
            if (n < line.size() && (line[n] == ' ' || line[n] == '\t')) return {};
            return line.substr(0, n);
        }

        // Candidate units in first-seen order with their use counts.
        class UnitTally {
        public:
            // Counts `unit` and returns its slot.
            size_t add(std::string unit) {
                auto it = std::find_if(m_Units.begin(), m_Units.end(), [&](const auto& entry) { return entry.first == unit; });
                if (it != m_Units.end()) {
                    ++it->second;
                    return static_cast<size_t>(it - m_Units.begin());
                }
                m_Units.emplace_back(std::move(unit), 1);
                return m_Units.size() - 1;
            }

            void bump(size_t slot) { ++m_Units[slot].second; }

            [[nodiscard]] std::optional<std::string> most_used() const {
                std::optional<std::string> best;
                size_t max = 0;
                for (const auto& [unit, count] : m_Units) {
                    if (count > max) {
                        max = count;
                        best = unit;
                    }
                }
                return best;
            }

        private:
            std::vector<std::pair<std::string, size_t>> m_Units;
        };

    } // namespace detail

    Formatting detect_formatting(std::string_view text) {
        Formatting result;
        detail::UnitTally tally;

        size_t lf_count = 0;
        size_t crlf_count = 0;
        std::string_view previous{};
        size_t previous_slot = 0;

        size_t pos = 0;
        while (pos < text.size()) {
            std::string_view line;
            const size_t eol = text.find('\n', pos);
            if (eol != std::string_view::npos) {
                if (eol > pos && text[eol - 1] == '\r') {
                    crlf_count++;
                    line = text.substr(pos, eol - 1 - pos);
                } else {
                    lf_count++;
                    line = text.substr(pos, eol - pos);
                }
                if (eol + 1 == text.size()) result.has_trailing_newline = true;
                pos = eol + 1;
            } else {
                line = text.substr(pos);
                pos = text.size();
            }

            if (line.empty()) continue;

            const std::string_view run = detail::leading_run(line);
            if (run.empty()) {
                previous = {};
                continue;
            }

            if (run == previous) {
                tally.bump(previous_slot);
            } else if (!previous.empty() && run.front() == previous.front()) {
                const size_t delta = run.size() > previous.size() ? run.size() - previous.size() : previous.size() - run.size();
                previous_slot = tally.add(std::string(delta, run.front()));
            } else {
                previous_slot = tally.add(std::string{ run });
            }
            previous = run;
        }

        result.indent_unit = tally.most_used();
        result.use_crlf = crlf_count > lf_count;
        return result;
    }

} // namespace Mimic
