#pragma once


/*
    ----------------------------------------------------------
    Mimic::FormatRegistry - Side table of recorded formatting
    ----------------------------------------------------------
    The registry links a decoded `value` to the `Formatting` of the text it
    was decoded from, without storing anything inside the value itself:

    - Keys are value identities (see "Identity" in `value.hpp`). The
      registry observes identities through `std::weak_ptr`; it never keeps
      a value, or its identity, alive
    - When a tracked value is destroyed its entry expires. Expired entries
      are ignored by lookups and swept on later insertions
    - Only arrays and objects can be tracked
    - All member functions are safe to call concurrently

    A single process-wide instance is returned by `Mimic::registry()`.
    `decode(...)` and `read_file(...)` are its normal writers and
    `encode(...)` / `write_file(...)` its normal readers; most code never
    touches it directly.
*/

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "mimic/config.hpp"
#include "mimic/formatting.hpp"
#include "mimic/value.hpp"

namespace Mimic {

    /// @ingroup MimicFormatting
    /// @brief Identity-keyed, non-owning map from values to their formatting
    class FormatRegistry {
    public:
        FormatRegistry() = default;
        FormatRegistry(const FormatRegistry&) = delete;
        FormatRegistry& operator=(const FormatRegistry&) = delete;

        /// @brief Records @p formatting for @p v, replacing any previous record
        /// @throws std::invalid_argument If @p v is not an array or an object
        MIMIC_API void associate(value& v, Formatting formatting);

        /// @brief Returns a copy of the formatting recorded for @p v, if any
        [[nodiscard]] MIMIC_API std::optional<Formatting> lookup(const value& v) const;

        /// @brief Checks whether formatting is recorded for @p v
        [[nodiscard]] MIMIC_API bool is_tracked(const value& v) const;

        /// @brief Sets the source path of the record for @p v
        /// @return false if @p v is not tracked
        MIMIC_API bool set_source_path(const value& v, std::filesystem::path path);

        /// @brief Number of live records
        [[nodiscard]] MIMIC_API std::size_t size() const;

    private:
        using key_type = std::weak_ptr<const detail::identity>;

        void sweep_expired();

        mutable std::mutex m_Mutex;
        std::map<key_type, Formatting, std::owner_less<key_type>> m_Entries;
        std::size_t m_NextSweep = 64;
    };

    /// @ingroup MimicFormatting
    /// @brief Returns the process-wide registry used by decode/encode
    [[nodiscard]] MIMIC_API FormatRegistry& registry() noexcept;

} // namespace Mimic
