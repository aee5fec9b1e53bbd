#include "verse/error.hpp"

#include <utility>

namespace Verse {

    namespace {
        // A segment joins the existing path with a dot unless the path
        // already starts with a bracketed index or key.
        void prefix_path(std::string& path, std::string segment) {
            if (!path.empty() && path.front() != '[') segment.push_back('.');
            path.insert(0, segment);
        }

        template<class F>
        void prefix_all(ConvertError& e, const F& make_segment) {
            prefix_path(e.path, make_segment());
            for (auto& cause : e.causes) prefix_all(cause, make_segment);
        }
    } // namespace

    ConvertError ConvertError::make(code c, std::string_view m) {
        ConvertError e;
        e.errc = c;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    ConvertError ConvertError::combine(std::vector<ConvertError> errors) {
        ConvertError e;
        e.errc = code::multiple;
        for (auto& err : errors) {
            if (err.errc == code::multiple) {
                for (auto& cause : err.causes) e.causes.push_back(std::move(cause));
            } else {
                e.causes.push_back(std::move(err));
            }
        }
        e.msg = std::to_string(e.causes.size()) + " conversion errors";
        return e;
    }

    ConvertError& ConvertError::at_field(std::string_view name) {
        prefix_all(*this, [name] { return std::string{ name }; });
        return *this;
    }

    ConvertError& ConvertError::at_index(std::size_t idx) {
        prefix_all(*this, [idx] { return "[" + std::to_string(idx) + "]"; });
        return *this;
    }

    ConvertError& ConvertError::at_key(std::string_view key) {
        prefix_all(*this, [key] {
            std::string s{ "[\"" };
            s.append(key.begin(), key.end());
            s += "\"]";
            return s;
        });
        return *this;
    }

    std::string ConvertError::what() const {
        if (errc == code::multiple) {
            std::string out;
            for (const auto& cause : causes) {
                if (!out.empty()) out += "; ";
                out += cause.what();
            }
            return out.empty() ? msg : out;
        }
        if (path.empty()) return msg;
        return path + ": " + msg;
    }

    std::unexpected<ConvertError> reject(std::string_view msg) {
        return std::unexpected(ConvertError::make(ConvertError::code::rejected, msg));
    }

    std::string_view code_name(ConvertError::code c) noexcept {
        switch (c) {
        case ConvertError::code::missing_value: return "missing_value";
        case ConvertError::code::not_convertible: return "not_convertible";
        case ConvertError::code::unsupported_kinds: return "unsupported_kinds";
        case ConvertError::code::capacity_exceeded: return "capacity_exceeded";
        case ConvertError::code::rejected: return "rejected";
        case ConvertError::code::depth_limit_exceeded: return "depth_limit_exceeded";
        case ConvertError::code::multiple: return "multiple";
        }
        return "unknown";
    }

    ReadError ReadError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ReadError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

} // namespace Verse
