#pragma once


/*
    ----------------------------------------------
    yamlsort::value - Generic YAML document node
    ----------------------------------------------
    The `yamlsort::value` type represents one node of a parsed YAML document
    in the reduced model the sorter understands:
        - null
        - boolean (loaded from YAML 1.1 boolean words; never emitted)
        - integer (64-bit signed)
        - floating (64-bit)
        - string
        - sequence
        - mapping

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware; every string, sequence and mapping it owns
      is allocated from the `std::pmr::memory_resource` it was built with
    - Copying deep-clones the tree into the source's resource
    - Moving steals the resource and the storage

    ---------------
    Mapping storage
    ---------------
    - `mapping` is keyed by `yamlsort::string`. Its iteration order carries no
      meaning for output: the emitter computes its own key order (see
      `ordered_keys` in `yamlsort.hpp`)
    - Keys are unique; inserting an existing key replaces the value

    -------------
    Thread-Safety
    -------------
    - Distinct `value` trees may be used from different threads
    - A single tree must be externally synchronized if mutated concurrently
*/

/// @defgroup Yamlsort yamlsort
/// @brief Deterministic YAML pretty-printer

/// @defgroup YamlsortValue DOM Value
/// @ingroup Yamlsort

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory_resource>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "yamlsort/config.hpp"

namespace yamlsort {

    /// @brief Enumerates the node kinds a yamlsort::value can hold
    enum class kind : uint8_t {
        null,     ///< `~`, `null` or an empty node
        boolean,  ///< YAML 1.1 boolean; rejected by the emitter
        integer,  ///< 64-bit signed integer
        floating, ///< 64-bit floating point
        string,   ///< Text scalar
        sequence, ///< Ordered list of values
        mapping,  ///< String-keyed collection of values
    };

    /// @brief Returns the lower-case name of @p k ("null", "mapping", ...)
    YAMLSORT_API std::string_view to_string(kind k) noexcept;

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup YamlsortValue
    /// @brief String type used by yamlsort::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup YamlsortValue
    /// @brief YAML sequence
    using sequence = pmr_vector<value>;

    /// @ingroup YamlsortValue
    /// @brief YAML mapping with string keys
    using mapping = pmr_map<string, value>;

    /// @ingroup YamlsortValue
    /// @brief Variant storage used internally by yamlsort::value
    /// @details Alternatives appear in the same order as the `kind` enumerators
    using storage_t = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        double,
        string,
        sequence,
        mapping
    >;


    /// @ingroup YamlsortValue
    /// @brief Dynamic YAML DOM node.
    ///
    /// @details
    /// Nested allocations use the `std::pmr::memory_resource` passed at
    /// construction. `as_sequence()`, `as_mapping()` and the non-const
    /// `operator[]` overloads convert the node in place when it holds a
    /// different kind, which makes building trees by hand concise:
    /// @code
    /// yamlsort::value v;
    /// v["name"] = "web";
    /// v["ports"][0]["containerPort"] = 8080;
    /// @endcode
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment
        // ------------------------------------------------------------

        /// @brief Constructs a null value
        YAMLSORT_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a null value
        YAMLSORT_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a boolean value
        YAMLSORT_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a floating value
        YAMLSORT_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs an integer value from any integral type except bool
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<std::int64_t>(i) } {}

        /// @brief Constructs a string value from a C string
        YAMLSORT_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string value, copying @p sv into `res`
        YAMLSORT_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string value from an existing yamlsort::string
        YAMLSORT_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a sequence value
        YAMLSORT_API value(sequence a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a mapping value
        YAMLSORT_API value(mapping m, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Deep copy into the allocator of @p other
        YAMLSORT_API value(const value& other);
        YAMLSORT_API value(value&& other) noexcept;
        YAMLSORT_API value& operator=(const value& other);
        YAMLSORT_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @brief Returns the kind currently stored
        [[nodiscard]] YAMLSORT_API kind type() const noexcept;

        [[nodiscard]] bool is_null()     const noexcept { return type() == kind::null;     }
        [[nodiscard]] bool is_bool()     const noexcept { return type() == kind::boolean;  }
        [[nodiscard]] bool is_integer()  const noexcept { return type() == kind::integer;  }
        [[nodiscard]] bool is_floating() const noexcept { return type() == kind::floating; }
        [[nodiscard]] bool is_string()   const noexcept { return type() == kind::string;   }
        [[nodiscard]] bool is_sequence() const noexcept { return type() == kind::sequence; }
        [[nodiscard]] bool is_mapping()  const noexcept { return type() == kind::mapping;  }

        /// @brief True for the kinds rendered on a single line (string, integer, floating)
        [[nodiscard]] bool is_scalar() const noexcept { return is_string() || is_integer() || is_floating(); }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------
        // The stored kind must match; otherwise std::bad_variant_access is thrown.

        [[nodiscard]] YAMLSORT_API bool&                as_bool();
        [[nodiscard]] YAMLSORT_API const bool&          as_bool() const;
        [[nodiscard]] YAMLSORT_API std::int64_t&        as_integer();
        [[nodiscard]] YAMLSORT_API const std::int64_t&  as_integer() const;
        [[nodiscard]] YAMLSORT_API double&              as_floating();
        [[nodiscard]] YAMLSORT_API const double&        as_floating() const;
        [[nodiscard]] YAMLSORT_API string&              as_string();
        [[nodiscard]] YAMLSORT_API const string&        as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @brief Returns the stored sequence, replacing any other kind with an empty one
        [[nodiscard]] YAMLSORT_API sequence&       as_sequence();

        /// @brief Returns the stored sequence
        /// @pre `is_sequence()`
        [[nodiscard]] YAMLSORT_API const sequence& as_sequence() const;

        /// @brief Returns the stored mapping, replacing any other kind with an empty one
        [[nodiscard]] YAMLSORT_API mapping&        as_mapping();

        /// @brief Returns the stored mapping
        /// @pre `is_mapping()`
        [[nodiscard]] YAMLSORT_API const mapping&  as_mapping() const;

        /// @brief Element count for sequences, entry count for mappings, 0 otherwise
        [[nodiscard]] YAMLSORT_API std::size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @brief Accesses or creates a sequence element, growing with nulls as needed
        YAMLSORT_API value& operator[](std::size_t idx);

        /// @brief Returns the element at @p idx, or a null sentinel when out of range
        YAMLSORT_API const value& operator[](std::size_t idx) const;

        /// @brief Accesses or creates a mapping entry (inserted as null)
        YAMLSORT_API value& operator[](std::string_view key);

        /// @brief Returns a pointer to the entry for @p key, or nullptr
        YAMLSORT_API const value* find(std::string_view key) const;

        /// @brief Returns the entry for @p key
        /// @throws std::out_of_range If this is not a mapping or the key is missing
        YAMLSORT_API const value& at(std::string_view key) const;

        /// @brief Structural equality; the memory resource does not participate
        YAMLSORT_API friend bool operator==(const value& lhs, const value& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace yamlsort
