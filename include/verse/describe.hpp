#pragma once


/*
    --------------------------------------------
    Verse target descriptors - shapes and fields
    --------------------------------------------
    The engine decides how to fill a target by looking at its static shape.
    `Verse::shape_of<T>` classifies a type at compile time:

        dynamic      Verse::value itself (accepts anything)
        boolean      bool
        integer      any other integral type
        floating     float, double, long double
        enumeration  enum and enum class types
        string       std::string, std::pmr::string
        optional     std::optional<U>, std::unique_ptr<U>, std::shared_ptr<U>
        record       any type with a `Verse::fields<T>` specialization
        map          std::map, std::unordered_map (and pmr variants)
        array        std::array<U, N>
        list         std::vector, std::deque, std::list (and pmr variants)
        opaque       anything else; convertible only through hooks or,
                     for non-aggregates, construction from std::string

    String views are never targets: the converted text must outlive the
    input tree, so targets own their strings.

    -------------
    Field tables
    -------------
    Records are described by specializing `Verse::fields<T>` with a tuple of
    field descriptors, in declaration order:

        struct User {
            Username name;
            Email email;
            const std::uint32_t id = 0;
        };

        template<>
        struct Verse::fields<User> {
            static constexpr auto members = std::tuple{
                Verse::field("Username", &User::name),
                VERSE_FIELD(User, email),   // source key "email"
                VERSE_FIELD(User, id),      // const: never written, skipped
            };
        };

    A descriptor built over a `const` member is not settable and the engine
    skips it without error.
*/

#include <array>
#include <cstdlib>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif
#include <typeinfo>

#include "verse/value.hpp"

/// @defgroup VerseDescribe Target Descriptors
/// @ingroup Verse
/// @brief Compile-time shape information about conversion targets

namespace Verse {

    /// @ingroup VerseDescribe
    /// @brief Static shape of a conversion target
    enum class shape : uint8_t {
        dynamic,
        boolean,
        integer,
        floating,
        enumeration,
        string,
        optional,
        record,
        map,
        array,
        list,
        opaque,
    };

    /// @ingroup VerseDescribe
    /// @brief Field descriptor binding a source key to a record member
    template<class Owner, class Member>
    struct field_descriptor {
        std::string_view name;
        Member Owner::* member;

        /// @brief Whether the engine may write this field
        static constexpr bool settable = !std::is_const_v<Member>;
    };

    /// @ingroup VerseDescribe
    /// @brief Builds a field descriptor reading source key @p name into @p member
    template<class Owner, class Member>
    [[nodiscard]] constexpr field_descriptor<Owner, Member> field(std::string_view name, Member Owner::* member) noexcept {
        return { name, member };
    }

    /// @ingroup VerseDescribe
    /// @brief Field table of a record type; specialize with a `members` tuple
    template<class T>
    struct fields;

    /// @ingroup VerseDescribe
    /// @brief Types with a `Verse::fields<T>` specialization
    template<class T>
    concept described = requires { fields<T>::members; };

    namespace detail {
        template<class T, template<class...> class Template>
        struct is_specialization : std::false_type {};

        template<template<class...> class Template, class... Args>
        struct is_specialization<Template<Args...>, Template> : std::true_type {};

        template<class T>
        struct is_std_array : std::false_type {};

        template<class U, std::size_t N>
        struct is_std_array<std::array<U, N>> : std::true_type {};

        template<class T>
        struct is_unique_ptr : std::false_type {};

        template<class U>
        struct is_unique_ptr<std::unique_ptr<U, std::default_delete<U>>> : std::true_type {};

        // Only owning strings; a view would alias the input tree
        template<class T>
        inline constexpr bool is_string_like_v = is_specialization<T, std::basic_string>::value;

        template<class T>
        inline constexpr bool is_string_view_v = is_specialization<T, std::basic_string_view>::value;

        template<class T>
        inline constexpr bool is_optional_like_v =
            is_specialization<T, std::optional>::value
            || is_specialization<T, std::shared_ptr>::value
            || is_unique_ptr<T>::value;

        template<class T>
        inline constexpr bool is_map_like_v =
            is_specialization<T, std::map>::value || is_specialization<T, std::unordered_map>::value;

        template<class T>
        inline constexpr bool is_list_like_v =
            is_specialization<T, std::vector>::value
            || is_specialization<T, std::deque>::value
            || is_specialization<T, std::list>::value;
    } // namespace detail

    /// @ingroup VerseDescribe
    /// @brief Compile-time shape of @p T
    template<class T>
    inline constexpr shape shape_of = [] {
        if constexpr (std::is_same_v<T, value>) return shape::dynamic;
        else if constexpr (std::is_same_v<T, bool>) return shape::boolean;
        else if constexpr (std::is_integral_v<T>) return shape::integer;
        else if constexpr (std::is_floating_point_v<T>) return shape::floating;
        else if constexpr (std::is_enum_v<T>) return shape::enumeration;
        else if constexpr (detail::is_string_like_v<T>) return shape::string;
        else if constexpr (detail::is_optional_like_v<T>) return shape::optional;
        else if constexpr (described<T>) return shape::record;
        else if constexpr (detail::is_map_like_v<T>) return shape::map;
        else if constexpr (detail::is_std_array<T>::value) return shape::array;
        else if constexpr (detail::is_list_like_v<T>) return shape::list;
        else return shape::opaque;
    }();

    /// @ingroup VerseDescribe
    /// @brief Human-readable name of a shape, e.g. `"record"`
    [[nodiscard]] constexpr std::string_view shape_name(shape s) noexcept {
        switch (s) {
        case shape::dynamic: return "dynamic";
        case shape::boolean: return "boolean";
        case shape::integer: return "integer";
        case shape::floating: return "floating";
        case shape::enumeration: return "enumeration";
        case shape::string: return "string";
        case shape::optional: return "optional";
        case shape::record: return "record";
        case shape::map: return "map";
        case shape::array: return "array";
        case shape::list: return "list";
        case shape::opaque: return "opaque";
        }
        return "unknown";
    }

    /// @ingroup VerseDescribe
    /// @brief Access to the pointee of an optional-shaped target
    template<class T>
    struct optional_traits;

    template<class U>
    struct optional_traits<std::optional<U>> {
        using element_type = U;
        static bool engaged(const std::optional<U>& o) noexcept { return o.has_value(); }
        static U& engage(std::optional<U>& o) { if (!o) o.emplace(); return *o; }
    };

    template<class U>
    struct optional_traits<std::unique_ptr<U>> {
        using element_type = U;
        static bool engaged(const std::unique_ptr<U>& p) noexcept { return p != nullptr; }
        static U& engage(std::unique_ptr<U>& p) { if (!p) p = std::make_unique<U>(); return *p; }
    };

    template<class U>
    struct optional_traits<std::shared_ptr<U>> {
        using element_type = U;
        static bool engaged(const std::shared_ptr<U>& p) noexcept { return p != nullptr; }
        static U& engage(std::shared_ptr<U>& p) { if (!p) p = std::make_shared<U>(); return *p; }
    };

    /// @ingroup VerseDescribe
    /// @brief Readable name of @p T for diagnostics (demangled where supported)
    template<class T>
    [[nodiscard]] std::string type_name() {
        std::string name = typeid(T).name();
#if defined(__GNUC__) || defined(__clang__)
        int status = 0;
        char* demangled = abi::__cxa_demangle(name.c_str(), nullptr, nullptr, &status);
        if (status == 0 && demangled != nullptr) name = demangled;
        std::free(demangled);
#endif
        return name;
    }

} // namespace Verse

/// @ingroup VerseDescribe
/// @brief Field descriptor whose source key is the member's own name
#define VERSE_FIELD(Type, member) ::Verse::field(#member, &Type::member)
