#pragma once


/*
    -------------------------------------------------
    Verse conversion engine - value -> typed target
    -------------------------------------------------
    `Verse::parse(value, target)` walks a generic value tree in lock-step with
    the static shape of the target and fills it in place. Each target type
    proves its own invariants through conversion hooks (`hooks.hpp`); the
    engine only decides who gets to look at which part of the input.

    ---------
    Algorithm
    ---------
    At every node:
    1. Optional unwrap: `std::optional`, `std::unique_ptr` and
       `std::shared_ptr` targets are engaged on demand and the pointee is
       converted with `required = false`. An empty optional is never
       engaged for an absent input unless its pointee has `set_default()`
    2. Absence: null input calls `set_default()` if the target has it,
       otherwise fails with `missing_value` when required, otherwise leaves
       the target untouched
    3. `parse_any` short-circuits everything below
    4. Identity: a payload whose type is exactly the target type is copied
    5. Kind-directed dispatch:
        * scalars go to the narrowest matching hook (widening through the
          preference order) and fall back to direct conversion
        * objects go to `parse_string_map`/`parse_map`, then record fields,
          then map entries
        * arrays go to `parse_string_list`/`parse_list`, then list elements,
          then fixed array slots

    ------
    Errors
    ------
    - Data problems are returned as `Verse::status` carrying a
      `ConvertError` whose path names the failing field, index or key
    - API misuse is not a data problem: unsupported target types fail to
      compile, and a null target pointer throws `std::invalid_argument`
    - The target is left partially written on failure; containers (lists,
      maps) are only replaced once all of their entries converted
*/

#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "verse/value.hpp"
#include "verse/error.hpp"
#include "verse/options.hpp"
#include "verse/describe.hpp"
#include "verse/hooks.hpp"
#include "verse/log.hpp"

/// @defgroup VerseConvert Conversion Engine
/// @ingroup Verse
/// @brief Converting generic values into user-defined C++ types

namespace Verse {

    /// @ingroup VerseConvert
    /// @brief Types `Verse::parse` accepts as conversion targets
    template<class T>
    concept convertible_target =
        !std::is_const_v<T> && !std::is_pointer_v<T> && !std::is_member_pointer_v<T>
        && !std::is_array_v<T> && !std::is_function_v<T> && !detail::is_string_view_v<T>
        && (shape_of<T> != shape::opaque || has_hooks<T>
            || (!std::is_aggregate_v<T> && std::constructible_from<T, std::string>));

    namespace detail {

        struct Context {
            const ConvertOptions& opts;
            std::size_t depth = 0;
        };

        // Counts nested containers; mirrors the reader's depth accounting.
        struct DepthGuard {
            Context& ctx;

            explicit DepthGuard(Context& c) : ctx(c) { ++ctx.depth; }
            ~DepthGuard() { --ctx.depth; }

            DepthGuard(const DepthGuard&) = delete;
            DepthGuard& operator=(const DepthGuard&) = delete;

            [[nodiscard]] bool ok() const noexcept {
                return ctx.opts.max_depth == 0 || ctx.depth <= ctx.opts.max_depth;
            }
        };

        inline std::unexpected<ConvertError> fail(ConvertError::code c, std::string_view msg) {
            return std::unexpected(ConvertError::make(c, msg));
        }

        template<class T>
        std::unexpected<ConvertError> not_convertible(const value& in) {
            return fail(ConvertError::code::not_convertible, describe(in) + " is not convertible to " + type_name<T>());
        }

        template<class T>
        std::unexpected<ConvertError> unsupported(const value& in) {
            std::string msg = "cannot convert " + describe(in) + " into ";
            msg += shape_name(shape_of<T>);
            msg += " target " + type_name<T>();
            return fail(ConvertError::code::unsupported_kinds, msg);
        }

        inline status finish(std::vector<ConvertError> failures) {
            if (failures.empty()) return {};
            if (failures.size() == 1) return std::unexpected(std::move(failures.front()));
            return std::unexpected(ConvertError::combine(std::move(failures)));
        }

        inline std::int64_t signed_payload(const value& in) {
            return std::visit([](const auto& x) -> std::int64_t {
                using X = std::decay_t<decltype(x)>;
                if constexpr (std::is_integral_v<X> && std::is_signed_v<X>) return x;
                else return 0;
            }, in.storage());
        }

        inline std::uint64_t unsigned_payload(const value& in) {
            return std::visit([](const auto& x) -> std::uint64_t {
                using X = std::decay_t<decltype(x)>;
                if constexpr (std::is_integral_v<X> && std::is_unsigned_v<X> && !std::is_same_v<X, bool>) return x;
                else return 0;
            }, in.storage());
        }

        template<class T, class X>
        bool fits(X x) noexcept {
            if constexpr (std::is_integral_v<T> && std::is_floating_point_v<X>) {
                if (std::isnan(x)) return false;
                // Truncation toward zero keeps anything strictly inside (lowest - 1, max + 1)
                const long double v = x;
                return v > static_cast<long double>(std::numeric_limits<T>::lowest()) - 1.0L
                    && v < static_cast<long double>(std::numeric_limits<T>::max()) + 1.0L;
            } else if constexpr (std::is_floating_point_v<T> && std::is_floating_point_v<X> && sizeof(T) < sizeof(X)) {
                return !std::isfinite(x) || std::fabs(x) <= static_cast<X>(std::numeric_limits<T>::max());
            } else {
                return true;
            }
        }

        template<class T> status parse_value(const value& in, T& out, Context& ctx, bool required);
        template<class T> status parse_absent(T& out, bool required);
        template<class T> status parse_present(const value& in, T& out, Context& ctx);
        template<class T> status assign_number(const value& in, T& out);
        template<class T> status parse_signed(const value& in, T& out);
        template<class T> status parse_unsigned(const value& in, T& out);
        template<class T> status parse_floating(const value& in, T& out);
        template<class T> status parse_text(const value& in, T& out);
        template<class T> status parse_object(const value& in, T& out, Context& ctx);
        template<class T> status parse_record(const object& obj, T& out, Context& ctx);
        template<class T> status parse_entries(const object& obj, T& out, Context& ctx);
        template<class T> status parse_array(const value& in, T& out, Context& ctx);
        template<class T> status parse_elements(const array& arr, T& out, Context& ctx);
        template<class T> status parse_slots(const array& arr, T& out, Context& ctx);

        template<class T>
        status parse_value(const value& in, T& out, Context& ctx, bool required) {
            static_assert(!std::is_const_v<T>, "conversion targets must be mutable");
            static_assert(!std::is_pointer_v<T> && !std::is_member_pointer_v<T>,
                "raw pointers cannot be conversion targets; use std::optional or a smart pointer");
            static_assert(!std::is_array_v<T>, "C arrays cannot be conversion targets; use std::array");
            static_assert(!std::is_function_v<T>, "functions cannot be conversion targets");
            static_assert(!is_string_view_v<T>, "string views would alias the input; use an owning string");
            static_assert(convertible_target<T>,
                "target type has no Verse::fields specialization, no conversion hooks and no std::string constructor");

            if constexpr (shape_of<T> == shape::optional) {
                using traits = optional_traits<T>;
                if (in.is_null() && !traits::engaged(out) && !has_default<typename traits::element_type>) return {};
                return parse_value(in, traits::engage(out), ctx, false);
            } else {
                if (in.is_null()) return parse_absent(out, required);
                return parse_present(in, out, ctx);
            }
        }

        template<class T>
        status parse_absent(T& out, bool required) {
            if constexpr (has_default<T>) {
                out.set_default();
                return {};
            } else {
                (void)out;
                if (required) return fail(ConvertError::code::missing_value, "value is required but missing");
                return {};
            }
        }

        template<class T>
        status parse_present(const value& in, T& out, Context& ctx) {
            if constexpr (parses_any<T>) {
                return out.parse_any(in);
            } else {
                if constexpr (std::is_same_v<T, value>) {
                    out = in;
                    return {};
                } else if constexpr (is_payload_v<T>) {
                    if (in.holds<T>()) {
                        out = in.get<T>();
                        return {};
                    }
                }

                switch (in.type()) {
                case kind::boolean:
                    if constexpr (parses_bool<T>) return out.parse_bool(in.as_bool());
                    else return not_convertible<T>(in);
                case kind::number:
                    switch (in.number_type()) {
                    case number_kind::int8:
                    case number_kind::int16:
                    case number_kind::int32:
                    case number_kind::int64:
                        return parse_signed(in, out);
                    case number_kind::uint8:
                    case number_kind::uint16:
                    case number_kind::uint32:
                    case number_kind::uint64:
                        return parse_unsigned(in, out);
                    case number_kind::float32:
                    case number_kind::float64:
                        return parse_floating(in, out);
                    }
                    break;
                case kind::string:
                    return parse_text(in, out);
                case kind::object:
                    return parse_object(in, out, ctx);
                case kind::array:
                    return parse_array(in, out, ctx);
                case kind::null:
                    break;
                }
                return unsupported<T>(in);
            }
        }

        template<class T>
        status assign_number(const value& in, T& out) {
            if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
                return std::visit([&](const auto& x) -> status {
                    using X = std::decay_t<decltype(x)>;
                    if constexpr (std::is_arithmetic_v<X> && !std::is_same_v<X, bool>) {
                        if (!fits<T>(x)) {
                            return fail(ConvertError::code::not_convertible,
                                describe(in) + " value is out of range for " + type_name<T>());
                        }
                        out = static_cast<T>(x);
                        return {};
                    } else {
                        return not_convertible<T>(in);
                    }
                }, in.storage());
            } else if constexpr (std::is_enum_v<T>) {
                std::underlying_type_t<T> raw{};
                if (auto r = assign_number(in, raw); !r) return r;
                out = static_cast<T>(raw);
                return {};
            } else {
                (void)out;
                return not_convertible<T>(in);
            }
        }

        template<class T>
        status parse_signed(const value& in, T& out) {
            const std::int64_t n = signed_payload(in);
            switch (in.number_type()) {
            case number_kind::int8:
                if constexpr (parses_int8<T>) return out.parse_int8(static_cast<std::int8_t>(n));
                [[fallthrough]];
            case number_kind::int16:
                if constexpr (parses_int16<T>) return out.parse_int16(static_cast<std::int16_t>(n));
                [[fallthrough]];
            case number_kind::int32:
                if constexpr (parses_int32<T>) return out.parse_int32(static_cast<std::int32_t>(n));
                [[fallthrough]];
            case number_kind::int64:
                if constexpr (parses_int64<T>) return out.parse_int64(n);
                [[fallthrough]];
            default:
                if constexpr (parses_int<T>) return out.parse_int(static_cast<long long>(n));
                break;
            }
            return assign_number(in, out);
        }

        template<class T>
        status parse_unsigned(const value& in, T& out) {
            const std::uint64_t n = unsigned_payload(in);
            switch (in.number_type()) {
            case number_kind::uint8:
                if constexpr (parses_uint8<T>) return out.parse_uint8(static_cast<std::uint8_t>(n));
                [[fallthrough]];
            case number_kind::uint16:
                if constexpr (parses_uint16<T>) return out.parse_uint16(static_cast<std::uint16_t>(n));
                [[fallthrough]];
            case number_kind::uint32:
                if constexpr (parses_uint32<T>) return out.parse_uint32(static_cast<std::uint32_t>(n));
                [[fallthrough]];
            case number_kind::uint64:
                if constexpr (parses_uint64<T>) return out.parse_uint64(n);
                [[fallthrough]];
            default:
                if constexpr (parses_uint<T>) return out.parse_uint(static_cast<unsigned long long>(n));
                break;
            }
            return assign_number(in, out);
        }

        template<class T>
        status parse_floating(const value& in, T& out) {
            switch (in.number_type()) {
            case number_kind::float32:
                if constexpr (parses_float32<T>) return out.parse_float32(in.get<float>());
                [[fallthrough]];
            default:
                if constexpr (parses_float64<T>) return out.parse_float64(in.as_number());
                break;
            }
            return assign_number(in, out);
        }

        template<class T>
        status parse_text(const value& in, T& out) {
            const std::string_view s{ in.as_string() };
            if constexpr (parses_string<T>) {
                return out.parse_string(s);
            } else if constexpr (shape_of<T> == shape::string) {
                out = T(s);
                return {};
            } else if constexpr (shape_of<T> == shape::opaque && !std::is_aggregate_v<T>
                                 && std::constructible_from<T, std::string>) {
                out = T(std::string{ s });
                return {};
            } else {
                (void)out;
                return not_convertible<T>(in);
            }
        }

        template<class T>
        status parse_object(const value& in, T& out, Context& ctx) {
            const auto& obj = in.as_object();

            if constexpr (parses_string_map<T>) {
                bool all_strings = true;
                for (const auto& [k, v] : obj) all_strings = all_strings && v.is_string();
                if (all_strings) {
                    string_map m;
                    for (const auto& [k, v] : obj) m.emplace(std::string{ k }, std::string{ v.as_string() });
                    return out.parse_string_map(m);
                }
            }

            if constexpr (parses_map<T>) {
                return out.parse_map(obj);
            } else if constexpr (shape_of<T> == shape::record || shape_of<T> == shape::map) {
                DepthGuard guard{ ctx };
                if (!guard.ok()) return fail(ConvertError::code::depth_limit_exceeded, "maximum nesting depth exceeded");
                if constexpr (shape_of<T> == shape::record) return parse_record(obj, out, ctx);
                else return parse_entries(obj, out, ctx);
            } else {
                (void)ctx;
                return unsupported<T>(in);
            }
        }

        template<class T>
        status parse_record(const object& obj, T& out, Context& ctx) {
            if (logger()->should_log(spdlog::level::trace)) {
                logger()->trace("converting object with {} members into record {}", obj.size(), type_name<T>());
            }

            std::vector<ConvertError> failures;
            bool stop = false;

            auto convert_field = [&](const auto& f) {
                using field_t = std::decay_t<decltype(f)>;
                if constexpr (field_t::settable) {
                    if (stop) return;
                    auto it = obj.find(f.name);
                    const value& field_in = it == obj.end() ? value::null_value() : it->second;
                    if (auto r = parse_value(field_in, out.*(f.member), ctx, true); !r) {
                        failures.push_back(std::move(r.error().at_field(f.name)));
                        stop = !ctx.opts.collect_errors;
                    }
                }
            };
            std::apply([&](const auto&... f) { (convert_field(f), ...); }, fields<T>::members);

            return finish(std::move(failures));
        }

        template<class T>
        status parse_entries(const object& obj, T& out, Context& ctx) {
            using key_type = typename T::key_type;
            using mapped_type = typename T::mapped_type;

            if (logger()->should_log(spdlog::level::trace)) {
                logger()->trace("converting object with {} members into map {}", obj.size(), type_name<T>());
            }

            T fresh{};
            if constexpr (requires { fresh.reserve(obj.size()); }) fresh.reserve(obj.size());

            std::vector<ConvertError> failures;
            for (const auto& [k, v] : obj) {
                const std::string_view name{ k };

                key_type key{};
                const value key_in{ name };
                if (auto r = parse_value(key_in, key, ctx, true); !r) {
                    r.error().msg.insert(0, "invalid key: ");
                    failures.push_back(std::move(r.error().at_key(name)));
                    if (!ctx.opts.collect_errors) break;
                    continue;
                }

                mapped_type item{};
                if (auto r = parse_value(v, item, ctx, true); !r) {
                    failures.push_back(std::move(r.error().at_key(name)));
                    if (!ctx.opts.collect_errors) break;
                    continue;
                }

                fresh.insert_or_assign(std::move(key), std::move(item));
            }

            if (!failures.empty()) return finish(std::move(failures));
            out = std::move(fresh);
            return {};
        }

        template<class T>
        status parse_array(const value& in, T& out, Context& ctx) {
            const auto& arr = in.as_array();

            if constexpr (parses_string_list<T>) {
                bool all_strings = true;
                for (const auto& v : arr) all_strings = all_strings && v.is_string();
                if (all_strings) {
                    string_list l;
                    l.reserve(arr.size());
                    for (const auto& v : arr) l.emplace_back(v.as_string());
                    return out.parse_string_list(l);
                }
            }

            if constexpr (parses_list<T>) {
                return out.parse_list(arr);
            } else if constexpr (shape_of<T> == shape::list || shape_of<T> == shape::array) {
                DepthGuard guard{ ctx };
                if (!guard.ok()) return fail(ConvertError::code::depth_limit_exceeded, "maximum nesting depth exceeded");
                if constexpr (shape_of<T> == shape::list) return parse_elements(arr, out, ctx);
                else return parse_slots(arr, out, ctx);
            } else {
                (void)ctx;
                return unsupported<T>(in);
            }
        }

        template<class T>
        status parse_elements(const array& arr, T& out, Context& ctx) {
            T fresh{};
            if constexpr (requires { fresh.reserve(arr.size()); }) fresh.reserve(arr.size());

            std::vector<ConvertError> failures;
            for (std::size_t i = 0; i < arr.size(); i++) {
                typename T::value_type item{};
                if (auto r = parse_value(arr[i], item, ctx, true); !r) {
                    failures.push_back(std::move(r.error().at_index(i)));
                    if (!ctx.opts.collect_errors) break;
                    continue;
                }
                fresh.push_back(std::move(item));
            }

            if (!failures.empty()) return finish(std::move(failures));
            out = std::move(fresh);
            return {};
        }

        template<class T>
        status parse_slots(const array& arr, T& out, Context& ctx) {
            constexpr std::size_t capacity = std::tuple_size_v<T>;
            if (arr.size() > capacity) {
                return fail(ConvertError::code::capacity_exceeded,
                    "input longer than output capacity (" + std::to_string(arr.size()) + " > " + std::to_string(capacity) + ")");
            }

            std::vector<ConvertError> failures;
            for (std::size_t i = 0; i < capacity; i++) {
                // Slots past the end of the input are treated as absent
                const value& slot = i < arr.size() ? arr[i] : value::null_value();
                if (auto r = parse_value(slot, out[i], ctx, true); !r) {
                    failures.push_back(std::move(r.error().at_index(i)));
                    if (!ctx.opts.collect_errors) break;
                }
            }
            return finish(std::move(failures));
        }

    } // namespace detail

    /// @ingroup VerseConvert
    /// @brief Converts a generic value into @p out in place.
    ///
    /// @details
    /// Walks @p in and @p out together, calling the target's conversion hooks
    /// where it implements them and recursing into records, maps, lists and
    /// fixed arrays otherwise. On failure @p out may be partially written.
    ///
    /// Example:
    /// @code
    /// Person p;
    /// if (auto r = Verse::parse(doc, p); !r) {
    ///     std::cerr << r.error().what() << '\n';   // e.g. "name: name must be 1-64 characters"
    /// }
    /// @endcode
    ///
    /// @param in   The value to convert from. Only read.
    /// @param out  The target to fill.
    /// @param opts Conversion options (error collection, depth limit).
    /// @return Success, or the first failure (all failures in collection mode).
    template<class T>
    [[nodiscard]] status parse(const value& in, T& out, const ConvertOptions& opts = {}) {
        detail::Context ctx{ opts };
        auto result = detail::parse_value(in, out, ctx, true);
        if (!result) {
            if (opts.collect_errors && result.error().errc != ConvertError::code::multiple) {
                std::vector<ConvertError> single;
                single.push_back(std::move(result.error()));
                result = std::unexpected(ConvertError::combine(std::move(single)));
            }
            if (logger()->should_log(spdlog::level::debug)) {
                logger()->debug("conversion into {} failed: {}", type_name<T>(), result.error().what());
            }
        }
        return result;
    }

    /// @ingroup VerseConvert
    /// @brief Converts a generic value into the object @p out points to.
    /// @throws std::invalid_argument If @p out is null.
    template<class T>
    [[nodiscard]] status parse(const value& in, T* out, const ConvertOptions& opts = {}) {
        if (out == nullptr) throw std::invalid_argument{ "Verse::parse: target pointer must not be null" };
        return parse(in, *out, opts);
    }

    /// @ingroup VerseConvert
    /// @brief Converts a generic value into a value-initialized @p T.
    template<class T>
        requires std::default_initializable<T>
    [[nodiscard]] std::expected<T, ConvertError> parse(const value& in, const ConvertOptions& opts = {}) {
        T out{};
        if (auto r = parse(in, out, opts); !r) return std::unexpected(std::move(r.error()));
        return out;
    }

} // namespace Verse
