#pragma once


/*
    -------------------------------------
    Verse::value - Generic value tree node
    -------------------------------------
    The `Verse::value` type is the format-agnostic input of the conversion
    engine. A decoder (the bundled JSON reader, or any other) produces a tree
    of these and the engine walks it:
        - null      (absent)
        - boolean
        - number    (kept at its native width)
        - string
        - array     (ordered list of values)
        - object    (string-keyed mapping of values)

    -------
    Numbers
    -------
    - A number remembers the width it was constructed from:
        * `int8`, `int16`, `int32`, `int64`
        * `uint8`, `uint16`, `uint32`, `uint64`
        * `float32`, `float64`
    - The JSON reader always produces `float64`. Narrower widths appear when
      a value tree is built by hand, and they select the narrowest matching
      conversion hook (see `convert.hpp`)
    - `as_number()` widens any width to `double`; `get<N>()` returns the
      native payload

    -----------------
    Memory Management
    -----------------
    - `value` is allocator-aware and uses `std::pmr::memory_resource` for all
      internal allocations (strings, arrays, objects)
    - Copy construction/assignment deep copies the tree into the source's
      resource; moves steal storage and resource

    -------------------
    Indexing Operations
    -------------------
    - `value& operator[](std::string_view)` converts to an object and inserts
      a null member when the key is missing
    - `value& operator[](size_t)` converts to an array and grows it with nulls
    - `find(key)` never mutates and returns nullptr when the key is missing

    -------------
    Thread-Safety
    -------------
    - Separate `value` instances may be used from separate threads
    - The engine only ever reads the input tree, so a single tree may be
      converted concurrently into disjoint targets
*/

/// @defgroup Verse Verse conversion library
/// @brief Core types and functions for Verse

/// @defgroup VerseValue Generic Value
/// @ingroup Verse

#include <variant>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory_resource>
#include <cstddef>
#include <cstdint>
#include <concepts>
#include <type_traits>
#include <utility>
#include "verse/config.hpp"

namespace Verse {
    /// @brief Enumerates the possible kinds held by Verse::value
    enum class kind : uint8_t {
        null,    ///< Absent value
        boolean, ///< `true` or `false`
        number,  ///< Number of any width
        string,  ///< UTF-8 string
        array,   ///< Ordered list of values
        object,  ///< String-keyed mapping of values
    };

    /// @brief Native width of a number held by Verse::value
    enum class number_kind : uint8_t {
        int8, int16, int32, int64,
        uint8, uint16, uint32, uint64,
        float32, float64,
    };

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    template<class Key, class T, class Compare = std::less<>>
    using pmr_map = std::pmr::map<Key, T, Compare>;

    /// @ingroup VerseValue
    /// @brief String type used by Verse::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup VerseValue
    /// @brief Array type used by Verse::value
    using array = pmr_vector<value>;

    /// @ingroup VerseValue
    /// @brief Object type used by Verse::value
    using object = pmr_map<string, value>;

    /// @ingroup VerseValue
    /// @brief Variant storage backing Verse::value
    /// @details The alternative order mirrors `kind` and `number_kind`.
    using storage_t = std::variant<
        std::monostate,
        bool,
        std::int8_t, std::int16_t, std::int32_t, std::int64_t,
        std::uint8_t, std::uint16_t, std::uint32_t, std::uint64_t,
        float, double,
        string,
        array,
        object
    >;

    namespace detail {
        // Maps any integral type onto the fixed-width alternative of the same
        // size and signedness.
        template<std::integral I>
        using canonical_int_t = std::conditional_t<std::is_signed_v<I>,
            std::conditional_t<sizeof(I) == 1, std::int8_t,
            std::conditional_t<sizeof(I) == 2, std::int16_t,
            std::conditional_t<sizeof(I) == 4, std::int32_t, std::int64_t>>>,
            std::conditional_t<sizeof(I) == 1, std::uint8_t,
            std::conditional_t<sizeof(I) == 2, std::uint16_t,
            std::conditional_t<sizeof(I) == 4, std::uint32_t, std::uint64_t>>>>;

        template<class T, class Variant>
        struct is_alternative_of : std::false_type {};

        template<class T, class... Ts>
        struct is_alternative_of<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};
    } // namespace detail

    /// @brief True when `T` is one of the payload types a Verse::value stores directly
    template<class T>
    inline constexpr bool is_payload_v = detail::is_alternative_of<T, storage_t>::value && !std::is_same_v<T, std::monostate>;

    /// @ingroup VerseValue
    /// @brief Generic value tree node
    ///
    /// @details
    /// Holds null, a boolean, a number of any native width, a string,
    /// an array or an object. Nested allocations use the
    /// `std::pmr::memory_resource` associated with the instance.
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @brief Constructs a null value using the given memory resource
        VERSE_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a null value; disambiguates explicit `nullptr`
        VERSE_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a boolean value
        VERSE_API value(bool b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a `float64` number
        VERSE_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs a `float32` number
        VERSE_API value(float f, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @brief Constructs an integer number, keeping the width of @p I
        ///
        /// @details
        /// `int`, `long`, `char` and friends are stored as the fixed-width
        /// alternative of the same size and signedness, so `value{ int8_t{3} }`
        /// reports `number_kind::int8` and `value{ 3u }` reports `uint32`.
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        explicit value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ static_cast<detail::canonical_int_t<I>>(i) } {}

        /// @brief Constructs a string value from a C string
        VERSE_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string value from a string_view
        VERSE_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs a string value from an existing Verse::string
        VERSE_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an array value
        VERSE_API value(array a, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @brief Constructs an object value
        VERSE_API value(object o, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        VERSE_API value(const value& other);
        VERSE_API value(value&& other) noexcept;
        VERSE_API value& operator=(const value& other);
        VERSE_API value& operator=(value&& other) noexcept;

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @brief Returns the kind of value currently stored
        [[nodiscard]] VERSE_API kind type() const noexcept;

        /// @brief Returns the native width of the stored number
        /// @pre `is_number()` must be true
        [[nodiscard]] VERSE_API number_kind number_type() const;

        [[nodiscard]] bool is_null()   const noexcept { return type() == kind::null;    }
        [[nodiscard]] bool is_bool()   const noexcept { return type() == kind::boolean; }
        [[nodiscard]] bool is_number() const noexcept { return type() == kind::number;  }
        [[nodiscard]] bool is_string() const noexcept { return type() == kind::string;  }
        [[nodiscard]] bool is_array()  const noexcept { return type() == kind::array;   }
        [[nodiscard]] bool is_object() const noexcept { return type() == kind::object;  }

        // ------------------------------------------------------------
        // Scalar accessors
        // ------------------------------------------------------------

        /// @brief Returns the stored boolean
        /// @throws std::bad_variant_access If the value is not a boolean
        [[nodiscard]] VERSE_API bool as_bool() const;

        /// @brief Returns the stored number widened to `double`
        /// @throws std::bad_variant_access If the value is not a number
        [[nodiscard]] VERSE_API double as_number() const;

        /// @brief Returns the native payload of type @p T
        /// @throws std::bad_variant_access If @p T is not the active alternative
        template<class T>
            requires is_payload_v<T>
        [[nodiscard]] const T& get() const { return std::get<T>(m_Storage); }

        /// @brief Checks whether the active alternative is exactly @p T
        template<class T>
            requires is_payload_v<T>
        [[nodiscard]] bool holds() const noexcept { return std::holds_alternative<T>(m_Storage); }

        [[nodiscard]] VERSE_API string&       as_string();
        [[nodiscard]] VERSE_API const string& as_string() const;

        // ------------------------------------------------------------
        // Container accessors
        // ------------------------------------------------------------

        /// @brief Returns the stored array, replacing any other content with an empty array
        [[nodiscard]] VERSE_API array&       as_array();
        [[nodiscard]] VERSE_API const array& as_array() const;

        /// @brief Returns the stored object, replacing any other content with an empty object
        [[nodiscard]] VERSE_API object&       as_object();
        [[nodiscard]] VERSE_API const object& as_object() const;

        /// @brief Number of elements or members; 0 for scalars
        [[nodiscard]] VERSE_API size_t size() const noexcept;

        // ------------------------------------------------------------
        // Indexing
        // ------------------------------------------------------------

        /// @brief Accesses or creates an array element by index, growing the array with nulls
        VERSE_API value& operator[](size_t idx);

        /// @brief Accesses an array element; returns a null sentinel when out of range
        VERSE_API const value& operator[](size_t idx) const;

        /// @brief Accesses or creates an object member by key
        VERSE_API value& operator[](std::string_view key);

        /// @brief Finds an object member; nullptr if missing or not an object
        [[nodiscard]] VERSE_API const value* find(std::string_view key) const;

        /// @brief Returns the member mapped to @p key
        /// @throws std::out_of_range If the key does not exist or the value is not an object
        [[nodiscard]] VERSE_API const value& at(std::string_view key) const;

        /// @brief Structural equality: same alternative and equal contents
        VERSE_API friend bool operator==(const value& lhs, const value& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }
        [[nodiscard]] storage_t& storage() noexcept { return m_Storage; }

        /// @brief Returns a shared immutable null value
        [[nodiscard]] VERSE_API static const value& null_value() noexcept;

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

    /// @brief Human-readable name of a value kind, e.g. `"object"`
    [[nodiscard]] VERSE_API std::string_view kind_name(kind k) noexcept;

    /// @brief Human-readable name of a number width, e.g. `"int8"`
    [[nodiscard]] VERSE_API std::string_view number_kind_name(number_kind k) noexcept;

    /// @brief Describes the dynamic type of @p v, e.g. `"number (float64)"`
    [[nodiscard]] VERSE_API std::string describe(const value& v);

} // namespace Verse
