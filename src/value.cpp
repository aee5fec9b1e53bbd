#include "verse/value.hpp"

#include <stdexcept>


namespace Verse {

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(bool b, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ b } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ d } {}

    value::value(float f, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ f } {}

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
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = clone_storage(other.m_Storage, other.m_MemRes);
        return *this;
    }

    value& value::operator=(value&& other) noexcept {
        if (this == &other) return *this;
        m_MemRes = other.m_MemRes;
        m_Storage = std::move(other.m_Storage);
        return *this;
    }

    kind value::type() const noexcept {
        switch (m_Storage.index()) {
        case 0: return kind::null;
        case 1: return kind::boolean;
        case 12: return kind::string;
        case 13: return kind::array;
        case 14: return kind::object;
        default: return kind::number;
        }
    }

    number_kind value::number_type() const {
        if (!is_number()) throw std::bad_variant_access{};
        // Number alternatives occupy indices 2..11 in number_kind order
        return static_cast<number_kind>(m_Storage.index() - 2);
    }

    bool value::as_bool() const { return std::get<bool>(m_Storage); }

    double value::as_number() const {
        return std::visit([](const auto& x) -> double {
            using X = std::decay_t<decltype(x)>;
            if constexpr (std::is_arithmetic_v<X> && !std::is_same_v<X, bool>) return static_cast<double>(x);
            else throw std::bad_variant_access{};
        }, m_Storage);
    }

    string& value::as_string() { return std::get<string>(m_Storage); }
    const string& value::as_string() const { return std::get<string>(m_Storage); }
    array& value::as_array() { if (!is_array()) m_Storage = array{ allocator_type(m_MemRes) }; return std::get<array>(m_Storage); }
    const array& value::as_array() const { return std::get<array>(m_Storage); }
    object& value::as_object() { if (!is_object()) m_Storage = object{ allocator_type(m_MemRes) }; return std::get<object>(m_Storage); }
    const object& value::as_object() const { return std::get<object>(m_Storage); }

    size_t value::size() const noexcept {
        if (is_array()) return std::get<array>(m_Storage).size();
        if (is_object()) return std::get<object>(m_Storage).size();
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
        if (!is_array()) return null_value();
        const auto& arr = as_array();
        if (idx >= arr.size()) return null_value();
        return arr[idx];
    }

    value& value::operator[](std::string_view key) {
        auto& obj = as_object();
        if (auto it = obj.find(key); it != obj.end()) return it->second;
        auto [it, inserted] = obj.emplace(string{ key.begin(), key.end(), m_MemRes }, value{ m_MemRes });
        return it->second;
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
        throw std::out_of_range{ "Verse::value::at: key not found" };
    }

    const value& value::null_value() noexcept {
        static const value sentinel{};
        return sentinel;
    }

    bool operator==(const value& lhs, const value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        return std::visit([res](const auto& x) -> storage_t {
            using X = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<X, string>) {
                return string{ x, res };
            } else if constexpr (std::is_same_v<X, array>) {
                array copy(allocator_type{ res });
                copy.reserve(x.size());
                for (const auto& v : x) copy.emplace_back(v);
                return copy;
            } else if constexpr (std::is_same_v<X, object>) {
                object copy{ std::less<>{}, res };
                for (const auto& [k, v] : x) copy.emplace(string{ k, res }, value{ v });
                return copy;
            } else {
                return x;
            }
        }, s);
    }

    std::string_view kind_name(kind k) noexcept {
        switch (k) {
        case kind::null: return "null";
        case kind::boolean: return "boolean";
        case kind::number: return "number";
        case kind::string: return "string";
        case kind::array: return "array";
        case kind::object: return "object";
        }
        return "unknown";
    }

    std::string_view number_kind_name(number_kind k) noexcept {
        switch (k) {
        case number_kind::int8: return "int8";
        case number_kind::int16: return "int16";
        case number_kind::int32: return "int32";
        case number_kind::int64: return "int64";
        case number_kind::uint8: return "uint8";
        case number_kind::uint16: return "uint16";
        case number_kind::uint32: return "uint32";
        case number_kind::uint64: return "uint64";
        case number_kind::float32: return "float32";
        case number_kind::float64: return "float64";
        }
        return "unknown";
    }

    std::string describe(const value& v) {
        std::string out{ kind_name(v.type()) };
        if (v.is_number()) {
            out += " (";
            out += number_kind_name(v.number_type());
            out += ')';
        }
        return out;
    }

} // namespace Verse
