#include "mimic/value.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>


namespace Mimic {

    // ------------------------------------------------------------
    // object
    // ------------------------------------------------------------

    value& object::operator[](std::string_view key) {
        if (auto it = find(key); it != end()) return it->second;
        std::pmr::memory_resource* res = m_Items.get_allocator().resource();
        return m_Items.emplace_back(string{ key.begin(), key.end(), res }, value{ res }).second;
    }

    value& object::at(std::string_view key) {
        if (auto it = find(key); it != end()) return it->second;
        throw std::out_of_range{ "Mimic::object::at: key not found" };
    }

    const value& object::at(std::string_view key) const {
        if (auto it = find(key); it != end()) return it->second;
        throw std::out_of_range{ "Mimic::object::at: key not found" };
    }

    object::iterator object::find(std::string_view key) noexcept {
        return std::find_if(m_Items.begin(), m_Items.end(), [key](const value_type& member) { return member.first == key; });
    }

    object::const_iterator object::find(std::string_view key) const noexcept {
        return std::find_if(m_Items.begin(), m_Items.end(), [key](const value_type& member) { return member.first == key; });
    }

    std::pair<object::iterator, bool> object::emplace(string key, value v) {
        if (auto it = find(key); it != end()) return { it, false };
        m_Items.emplace_back(std::move(key), std::move(v));
        return { std::prev(m_Items.end()), true };
    }

    value& object::insert_or_assign(std::string_view key, value v) {
        if (auto it = find(key); it != end()) {
            it->second = std::move(v);
            return it->second;
        }
        std::pmr::memory_resource* res = m_Items.get_allocator().resource();
        return m_Items.emplace_back(string{ key.begin(), key.end(), res }, std::move(v)).second;
    }

    object::size_type object::erase(std::string_view key) {
        auto it = find(key);
        if (it == end()) return 0;
        m_Items.erase(it);
        return 1;
    }

    object::iterator object::erase(const_iterator pos) {
        return m_Items.erase(pos);
    }

    bool operator==(const object& lhs, const object& rhs) {
        if (lhs.size() != rhs.size()) return false;
        for (const auto& [k, v] : lhs) {
            auto it = rhs.find(k);
            if (it == rhs.end() || !(it->second == v)) return false;
        }
        return true;
    }

    // ------------------------------------------------------------
    // value
    // ------------------------------------------------------------

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}


    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ s, res } } {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ string{ sv.begin(), sv.end(), res } } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(s) } {}

    value::value(array a, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(a) } {}

    value::value(object o, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::move(o) } {}

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) }, m_Identity{ std::move(other.m_Identity) } {}

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = clone_storage(other.m_Storage, other.m_MemRes);
        m_Identity.reset();
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        m_Identity = std::move(other.m_Identity);
        return *this;
    }

    kind value::type() const noexcept {
        switch(m_Storage.index()) {
        case 0: return kind::null;
        case 1: return kind::boolean;
        case 2: return kind::number;
        case 3: return kind::string;
        case 4: return kind::array;
        case 5: return kind::object;
        }
        return kind::null;
    }

    bool& value::as_bool() { return std::get<bool>(m_Storage); }
    const bool& value::as_bool() const { return std::get<bool>(m_Storage); }
    double& value::as_number() { return std::get<double>(m_Storage); }
    const double& value::as_number() const { return std::get<double>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }
    array& value::as_array() { if (!is_array()) m_Storage = array{ allocator_type(m_MemRes) }; return std::get<array>(m_Storage); }
    const array& value::as_array() const { return std::get<array>(m_Storage); }
    object& value::as_object() { if (!is_object()) m_Storage = object{ object::allocator_type(m_MemRes) }; return std::get<object>(m_Storage); }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    size_t value::size() const noexcept {
        if (is_array()) return as_array().size();
        if (is_object()) return as_object().size();
        return 0;
    }

    value& value::operator[](std::size_t idx) {
        auto& arr = as_array();
        if (idx >= arr.size()) {
            arr.resize(idx + 1, value{ m_MemRes });
        }
        return arr[idx];
    }

    const value& value::operator[](std::size_t idx) const {
        static const value null_sentinel{};
        if (!is_array()) return null_sentinel;
        const auto& arr = as_array();
        if (idx >= arr.size()) return null_sentinel;
        return arr[idx];
    }

    value& value::operator[](std::string_view key) {
        return as_object()[key];
    }

    value* value::find(std::string_view key) {
        if (!is_object()) return nullptr;
        auto& obj = as_object();
        auto it = obj.find(key);
        if (it == obj.end()) return nullptr;
        return std::addressof(it->second);
    }

    const value* value::find(std::string_view key) const {
        if (!is_object()) return nullptr;
        const auto& obj = as_object();
        auto it = obj.find(key);
        if (it == obj.end()) return nullptr;
        return std::addressof(it->second);
    }

    const value& value::at(std::string_view key) const {
        if (auto* v = find(key)) return *v;
        throw std::out_of_range{ "Mimic::value::at: key not found" };
    }

    bool operator==(const value& lhs, const value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return std::get<bool>(s);
        case 2: return std::get<double>(s);
        case 3: {
            const auto& str = std::get<string>(s);
            return string{ str, res };
        }
        case 4: {
            const auto& arr = std::get<array>(s);
            array copy(allocator_type{ res });
            copy.reserve(arr.size());
            for (const auto& v : arr) copy.emplace_back(v);
            return copy;
        }
        case 5: {
            const auto& obj = std::get<object>(s);
            object copy{ object::allocator_type{ res } };
            copy.reserve(obj.size());
            for (const auto& [k, v] : obj) copy.emplace(string{ k, res }, value{ v });
            return copy;
        }
        }
        return std::monostate{};
    }


} // namespace Mimic
