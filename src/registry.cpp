#include "mimic/registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>


namespace Mimic {

    void FormatRegistry::associate(value& v, Formatting formatting) {
        if (!v.is_structured()) throw std::invalid_argument{ "Mimic::FormatRegistry::associate: only arrays and objects can be tracked" };
        if (!v.m_Identity) v.m_Identity = std::make_shared<detail::identity>();

        std::lock_guard lock{ m_Mutex };
        if (m_Entries.size() >= m_NextSweep) sweep_expired();
        m_Entries.insert_or_assign(key_type{ v.m_Identity }, std::move(formatting));
    }

    std::optional<Formatting> FormatRegistry::lookup(const value& v) const {
        if (!v.m_Identity) return std::nullopt;

        std::lock_guard lock{ m_Mutex };
        auto it = m_Entries.find(key_type{ v.m_Identity });
        if (it == m_Entries.end()) return std::nullopt;
        return it->second;
    }

    bool FormatRegistry::is_tracked(const value& v) const {
        if (!v.m_Identity) return false;

        std::lock_guard lock{ m_Mutex };
        return m_Entries.contains(key_type{ v.m_Identity });
    }

    bool FormatRegistry::set_source_path(const value& v, std::filesystem::path path) {
        if (!v.m_Identity) return false;

        std::lock_guard lock{ m_Mutex };
        auto it = m_Entries.find(key_type{ v.m_Identity });
        if (it == m_Entries.end()) return false;
        it->second.source_path = std::move(path);
        return true;
    }

    std::size_t FormatRegistry::size() const {
        std::lock_guard lock{ m_Mutex };
        return static_cast<std::size_t>(std::count_if(m_Entries.begin(), m_Entries.end(), [](const auto& entry) { return !entry.first.expired(); }));
    }

    // Caller holds m_Mutex.
    void FormatRegistry::sweep_expired() {
        std::erase_if(m_Entries, [](const auto& entry) { return entry.first.expired(); });
        m_NextSweep = std::max<std::size_t>(64, m_Entries.size() * 2);
    }

    FormatRegistry& registry() noexcept {
        static FormatRegistry instance;
        return instance;
    }

} // namespace Mimic
