#pragma once


/*
    ----------------------
    Verse conversion hooks
    ----------------------
    A target type takes responsibility for its own invariants by implementing
    one or more member functions, each keyed by the kind of generic value it
    wants to receive. Every hook returns `Verse::status`; `set_default`
    returns nothing.

        parse_any(const Verse::value&)           raw value, bypasses all dispatch
        parse_bool(bool)
        parse_string(std::string_view)
        parse_int8(int8_t)   ...  parse_int64(int64_t),  parse_int(long long)
        parse_uint8(uint8_t) ...  parse_uint64(uint64_t), parse_uint(unsigned long long)
        parse_float32(float), parse_float64(double)
        parse_map(const Verse::object&)
        parse_string_map(const Verse::string_map&)    every member is a string
        parse_list(const Verse::array&)
        parse_string_list(const Verse::string_list&)  every element is a string
        set_default()                           absent input

    Numeric hooks follow a "narrowest wins, else widen" order: an int8 value
    tries parse_int8, parse_int16, parse_int32, parse_int64 then parse_int.
    Unsigned values never fall over to the signed hooks.

    Example:

        class Name {
        public:
            Verse::status parse_string(std::string_view s) {
                if (s.empty() || s.size() > 64) return Verse::reject("name must be 1-64 characters");
                m_Value = s;
                return {};
            }
        private:
            std::string m_Value;
        };
*/

#include <concepts>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "verse/value.hpp"
#include "verse/error.hpp"

/// @defgroup VerseHooks Conversion Hooks
/// @ingroup Verse
/// @brief Capability concepts a conversion target may satisfy

namespace Verse {

    /// @ingroup VerseHooks
    /// @brief Argument of `parse_string_map`
    using string_map = std::map<std::string, std::string, std::less<>>;

    /// @ingroup VerseHooks
    /// @brief Argument of `parse_string_list`
    using string_list = std::vector<std::string>;

    template<class T>
    concept parses_any = requires(T& t, const value& v) { { t.parse_any(v) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_bool = requires(T& t, bool b) { { t.parse_bool(b) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_string = requires(T& t, std::string_view s) { { t.parse_string(s) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_int8 = requires(T& t, std::int8_t n) { { t.parse_int8(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_int16 = requires(T& t, std::int16_t n) { { t.parse_int16(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_int32 = requires(T& t, std::int32_t n) { { t.parse_int32(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_int64 = requires(T& t, std::int64_t n) { { t.parse_int64(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_int = requires(T& t, long long n) { { t.parse_int(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_uint8 = requires(T& t, std::uint8_t n) { { t.parse_uint8(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_uint16 = requires(T& t, std::uint16_t n) { { t.parse_uint16(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_uint32 = requires(T& t, std::uint32_t n) { { t.parse_uint32(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_uint64 = requires(T& t, std::uint64_t n) { { t.parse_uint64(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_uint = requires(T& t, unsigned long long n) { { t.parse_uint(n) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_float32 = requires(T& t, float f) { { t.parse_float32(f) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_float64 = requires(T& t, double d) { { t.parse_float64(d) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_map = requires(T& t, const object& o) { { t.parse_map(o) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_string_map = requires(T& t, const string_map& m) { { t.parse_string_map(m) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_list = requires(T& t, const array& a) { { t.parse_list(a) } -> std::convertible_to<status>; };

    template<class T>
    concept parses_string_list = requires(T& t, const string_list& l) { { t.parse_string_list(l) } -> std::convertible_to<status>; };

    template<class T>
    concept has_default = requires(T& t) { t.set_default(); };

    /// @ingroup VerseHooks
    /// @brief Types implementing at least one conversion hook
    template<class T>
    concept has_hooks =
        parses_any<T> || parses_bool<T> || parses_string<T>
        || parses_int8<T> || parses_int16<T> || parses_int32<T> || parses_int64<T> || parses_int<T>
        || parses_uint8<T> || parses_uint16<T> || parses_uint32<T> || parses_uint64<T> || parses_uint<T>
        || parses_float32<T> || parses_float64<T>
        || parses_map<T> || parses_string_map<T> || parses_list<T> || parses_string_list<T>
        || has_default<T>;

} // namespace Verse
