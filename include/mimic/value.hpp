#pragma once


/*
    ------------------------------------
    Mimic::value - Dynamic JSON DOM node
    ------------------------------------
    The `Mimic::value` type represents any JSON value:
        - null
        - boolean
        - number (as double)
        - string
        - array
        - object
    It is the core DOM building block of Mimic

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, array, objects)
    - Each `value` instance stores a pointer to its `memory_resource`:
        * All nested containers and strings owned by that `value` are allocated
          from this resource
    - Copy construction/assignment:
        * The destination `value` adopts the allocator of the source and performs
          a deep copy of the underlying JSON tree into that allocator
    - Move construction/assignment:
        * The destination `value` steals the allocator and storage of the source

    --------
    Identity
    --------
    - Every `value` has an identity that is independent of its contents.
      `Mimic::decode(...)` records the formatting of the source text against
      that identity (see `registry.hpp`)
    - Identity follows the object, not the data:
        * Moving a value moves its identity; the moved-to value is the same
          tracked document
        * Copying a value creates a new, untracked identity, even though the
          copy compares equal to the original
    - Identity is never compared, serialized or enumerated

    --------------
    Object Members
    --------------
    - `Mimic::object` keeps members in insertion order, so a document that is
      parsed and written back keeps its key order
    - Lookup is linear in the number of members
    - Equality of two objects does not depend on member order

    -----------------
    Kinds and Queries
    -----------------
    - `kind type() const` returns the current kind: null, boolean, number
      string, array, object
    - Convenience predicates:
        * `is_null()`, `is_bool()`, `is_number()`, `is_string()`,
          `is_array()`, `is_object()`

    -----------------------------
    Accessors and Auto-Conversion
    -----------------------------
    - Scalar accessors:
        * `as_bool()`, `as_number()`, `as_string()`
        * These assume the current type matches; calling them on the wrong kind
          throws `std::bad_variant_access`
    - Container accessors:
        * `array& as_array()`
        * `object& as_object()`
        * Non-const versions will **convert** the value in-place if neccessary:
            - If the current kind is not an array, `as_array()` replaces the
              stored value with an empty `array` using the current allocator
            - Similarly for `as_object()`
        * Const versions (`const array&`, `const object&`) assume the type
          is already correct and do not perform conversion

    -------------------
    Indexing Operations
    -------------------
    - `value& operator[](std::string_view)`
        * If the value is not an object, it is converted to an empty object
        * If provided key does not exist, a new entry is appended with a `null` value
        * Returns a reference to the associated `value`
    - `value& operator[](size_t)`
        * If the value is not an array, it is converted to an empty array
        * if `index >= size()`, the array is resized to `index + 1` and all
          new elements are default-constructed (i.e. `null` values)
        * Returns a reference to the element at `index`

    -------------
    Thread-Safety
    -------------
    - `value` is not inherently thread-safe
    - It is safe to use separate `value` instances from multiple threads
    - Concurrent access to the same `value` instance must be externally synchronized
*/

/// @defgroup Mimic Mimic JSON Library
/// @brief Core types and functions for Mimic

/// @defgroup MimicValue DOM Value
/// @ingroup Mimic

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <utility>
#include "mimic/config.hpp"

namespace Mimic {
    /// @brief Enumerates the possible JSON value kinds held by Mimic::value
    enum class kind : uint8_t {
        null, ///< JSON null value
        boolean, ///< JSON boolean value (`true` or `false`)
        number, ///< JSON number value (stored as `double`)
        string, ///< JSON string value
        array, ///< JSON array value
        object, ///< JSON object value
    };


    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup MimicValue
    /// @brief String type used by Mimic::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup MimicValue
    /// @brief Array type used by Mimic::value (JSON arrays)
    using array = pmr_vector<value>;

    namespace detail {
        /// Identity token owned by a tracked `value`. Only its address and
        /// lifetime matter.
        struct identity {};
    } // namespace detail

    /// @ingroup MimicValue
    /// @brief Insertion-ordered JSON object
    ///
    /// @details
    /// Members are stored as a vector of key/value pairs in the order they
    /// were first inserted. Assigning to an existing key keeps its position.
    /// All member functions are defined after `value` is complete.
    class object {
    public:
        using key_type = string;
        using mapped_type = value;
        using value_type = std::pair<string, value>;
        using container_type = pmr_vector<value_type>;
        using allocator_type = std::pmr::polymorphic_allocator<value_type>;
        using iterator = container_type::iterator;
        using const_iterator = container_type::const_iterator;
        using size_type = std::size_t;

        object();
        explicit object(const allocator_type& alloc);

        [[nodiscard]] iterator begin() noexcept;
        [[nodiscard]] iterator end() noexcept;
        [[nodiscard]] const_iterator begin() const noexcept;
        [[nodiscard]] const_iterator end() const noexcept;

        [[nodiscard]] size_type size() const noexcept;
        [[nodiscard]] bool empty() const noexcept;

        /// @brief Returns the member for @p key, appending a `null` member if missing
        MIMIC_API value& operator[](std::string_view key);

        /// @brief Returns the member for @p key
        /// @throws std::out_of_range If the key does not exist
        MIMIC_API value& at(std::string_view key);
        MIMIC_API const value& at(std::string_view key) const;

        /// @brief Returns an iterator to the member for @p key, or `end()`
        [[nodiscard]] MIMIC_API iterator find(std::string_view key) noexcept;
        [[nodiscard]] MIMIC_API const_iterator find(std::string_view key) const noexcept;
        [[nodiscard]] bool contains(std::string_view key) const noexcept;

        /// @brief Appends a member if @p key is not present
        /// @return Iterator to the member for @p key and whether it was inserted
        MIMIC_API std::pair<iterator, bool> emplace(string key, value v);

        /// @brief Replaces the member for @p key in place, or appends it
        MIMIC_API value& insert_or_assign(std::string_view key, value v);

        /// @brief Removes the member for @p key, preserving the order of the others
        /// @return Number of members removed (0 or 1)
        MIMIC_API size_type erase(std::string_view key);
        MIMIC_API iterator erase(const_iterator pos);

        void clear() noexcept;
        void reserve(size_type n);
        [[nodiscard]] allocator_type get_allocator() const noexcept;

        /// @brief Order-insensitive structural equality
        MIMIC_API friend bool operator==(const object& lhs, const object& rhs);

    private:
        container_type m_Items;
    };

    /// @ingroup MimicValue
    /// @brief Variant storage used internally by Mimic::value
    /// @details Exposed only for completness; most users interact via
    ///          Mimic::value member functions instead of using this alias
    using storage_t = std::variant<
        std::monostate,
        bool,
        double,
        string,
        array,
        object
    >;


    /// @ingroup MimicValue
    /// @brief Dynamic JSON DOM types.
    ///
    /// @details
    /// `Mimic::value` can hold any JSON value:
    /// - null
    /// - boolean
    /// - number
    /// - string
    /// - array
    /// - object
    ///
    /// All nested allocations (string, arrays, objects) are performed using
    /// a `std::pmr::memory_resource` associated with each `value` instance.
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup MimicValue
        /// @brief Constructs a null JSON value using the given memory resource
        /// @param res Pointer to the memory resource used for all internal
        ///            allocations in this value, If omitted, the global
        ///            default resource is used
        MIMIC_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup MimicValue
        /// @brief Constructs a null JSON value using the given memory resource
        MIMIC_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup MimicValue
        /// @brief Constructs a boolean JSON value
        MIMIC_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup MimicValue
        /// @brief Constructs a numeric JSON value from a double
        MIMIC_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup MimicValue
        /// @brief Constructs a numeric JSON value from an integral type
        ///
        /// @tparam I Integral type (e.g. int, long, int64_t)
        /// @param i Integer value to convert and store as a double
        /// @param res Memory resource used for nested allocations (if any)
        template<std::integral I>
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<double>(i) } {}

        /// @ingroup MimicValue
        /// @brief Constructs a string JSON value from a C string
        MIMIC_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup MimicValue
        /// @brief Constructs a string JSON value from a string_view
        MIMIC_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup MimicValue
        /// @brief Constructs a string JSON from existing Mimic::string
        MIMIC_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup MimicValue
        /// @brief Constructs an array JSON value from an existing array
        MIMIC_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup MimicValue
        /// @brief Constructs an object JSON value from an existing object
        MIMIC_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup MimicValue
        /// @brief Copy-constructs a JSON value
        ///
        /// @details
        /// The new value adopts the alloctor of @p other. The entire JSON
        /// tree rooted at @p other is deeply copied into the new value using
        /// that allocator. The copy has its own identity and is not tracked,
        /// even if @p other is.
        MIMIC_API value(const value& other);

        /// @ingroup MimicValue
        /// @brief Move-constructs a JSON value
        ///
        /// @details
        /// The new value steals the allocator, storage and identity of @p other.
        /// After the move, @p other is left in a valid but unspecified state
        MIMIC_API value(value&& other) noexcept;

        /// @ingroup MimicValue
        /// @brief Copy-assigns a JSON value
        ///
        /// @details
        /// The left-hand side value adopts the allocator of @p other and its
        /// contents are replaced with a deep copy of @p other. The left-hand
        /// side becomes a new, untracked identity.
        MIMIC_API value& operator=(const value& other);

        /// @ingroup MimicValue
        /// @brief Move-assigns a JSON value
        ///
        /// @details
        /// The left-hand side value's previous contents are destroyed, and
        /// it takes ownership of the allocator, storage and identity of @p other
        MIMIC_API value& operator=(value&& other) noexcept;

        ~value() = default;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @ingroup MimicValue
        /// @brief Returns the kind of JSON value currently stored.
        [[nodiscard]] MIMIC_API kind type() const noexcept;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        /// @ingroup MimicValue
        /// @brief Checks whether the value is an array or an object
        [[nodiscard]] bool is_structured() const noexcept { return is_array() || is_object(); }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        [[nodiscard]] MIMIC_API bool&       as_bool();
        [[nodiscard]] MIMIC_API const bool& as_bool() const;
        [[nodiscard]] MIMIC_API double&       as_number();
        [[nodiscard]] MIMIC_API const double& as_number() const;
        [[nodiscard]] MIMIC_API string&       as_string();
        [[nodiscard]] MIMIC_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @ingroup MimicValue
        /// @brief Returns a reference to the stored array value
        /// @details
        /// If `is_array()` is true, returns the existing array.
        /// Otherwise, the current contents are discarded and replaced with
        /// an empty array allocated from `resource()`, and that array is returned
        [[nodiscard]] MIMIC_API array&       as_array();
        [[nodiscard]] MIMIC_API const array& as_array() const;

        /// @ingroup MimicValue
        /// @brief Returns a reference to the stored object value
        /// @details
        /// If `is_object()` is true, returns the existing object.
        /// Otherwise, the current contents are discarded and replaced with
        /// an empty object allocated from `resource()`, and that object is returned
        [[nodiscard]] MIMIC_API object&       as_object();
        [[nodiscard]] MIMIC_API const object& as_object() const;

        /// @ingroup MimicValue
        /// @brief Returns the number of elements or members, 0 for scalars
        [[nodiscard]] MIMIC_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @ingroup MimicValue
        /// @brief Accesses or creates an array element by index, growing array as needed
        MIMIC_API value& operator[](size_t idx);

        /// @ingroup MimicValue
        /// @brief Accesses an array element by index (const overload)
        /// @details Returns a shared `null` value if this is not an array or
        ///          @p idx is out of bounds
        MIMIC_API const value& operator[](size_t idx) const;

        /// @ingroup MimicValue
        /// @brief Accesses or creates an object member by key
        MIMIC_API value& operator[](std::string_view key);

        /// @ingroup MimicValue
        /// @brief Finds a member with the given key in the object
        /// @return Pointer to the value mapped to @p key or nullptr
        MIMIC_API value* find(std::string_view key);
        MIMIC_API const value* find(std::string_view key) const;

        /// @ingroup MimicValue
        /// @brief Returns a const reference to the value associated with @p key
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        MIMIC_API const value& at(std::string_view key) const;

        /// @ingroup MimicValue
        /// @brief Structural equality. Identity does not take part.
        MIMIC_API friend bool operator==(const value& lhs, const value& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @ingroup MimicValue
        /// @brief Returns a const reference to the underlying variant storage
        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

        /// @ingroup MimicValue
        /// @brief Returns a mutable reference to the underlying variant storage
        ///
        /// **Use with extreme caution.**
        [[nodiscard]] storage_t& storage() noexcept { return m_Storage; }


    private:
        friend class FormatRegistry;

        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};
        std::shared_ptr<const detail::identity> m_Identity{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

    // ------------------------------------------------------------
    // object inline members
    // ------------------------------------------------------------

    inline object::object() : m_Items{} {}
    inline object::object(const allocator_type& alloc) : m_Items{ alloc } {}

    inline object::iterator object::begin() noexcept { return m_Items.begin(); }
    inline object::iterator object::end() noexcept { return m_Items.end(); }
    inline object::const_iterator object::begin() const noexcept { return m_Items.begin(); }
    inline object::const_iterator object::end() const noexcept { return m_Items.end(); }
    inline object::size_type object::size() const noexcept { return m_Items.size(); }
    inline bool object::empty() const noexcept { return m_Items.empty(); }
    inline bool object::contains(std::string_view key) const noexcept { return find(key) != end(); }
    inline void object::clear() noexcept { m_Items.clear(); }
    inline void object::reserve(size_type n) { m_Items.reserve(n); }
    inline object::allocator_type object::get_allocator() const noexcept { return m_Items.get_allocator(); }

} // namespace Mimic
