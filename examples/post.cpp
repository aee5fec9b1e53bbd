#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "verse/verse.hpp"

namespace {

    class Title {
    public:
        Verse::status parse_string(std::string_view s) {
            if (s.size() < 3 || s.size() > 100) return Verse::reject("title must be between 3 and 100 characters long");
            m_Text = s;
            return {};
        }

        const std::string& str() const noexcept { return m_Text; }

    private:
        std::string m_Text;
    };

    class Upvotes {
    public:
        Verse::status parse_float64(double f) {
            if (f < 0) return Verse::reject("upvotes cannot be negative");
            m_Count = static_cast<int>(f);
            return {};
        }

        void set_default() { m_Count = 0; }

        int count() const noexcept { return m_Count; }

    private:
        int m_Count = 0;
    };

    struct Post {
        Title title;
        Upvotes upvotes;
        std::vector<std::string> labels;
        std::optional<std::string> admin_note;
    };

} // namespace

namespace Verse {

    template<>
    struct fields<Post> {
        static constexpr auto members = std::tuple{
            field("Title", &Post::title),
            field("Upvotes", &Post::upvotes),
            field("Labels", &Post::labels),
            field("AdminNote", &Post::admin_note),
        };
    };

} // namespace Verse

int main(int argc, char** argv) {
    Verse::set_log_level(spdlog::level::debug);

    Post post;
    std::optional<Verse::JsonError> failure;
    if (argc > 1) {
        if (auto r = Verse::parse_json(argv[1], post, { .collect_errors = true }); !r) failure = r.error();
    } else {
        if (auto r = Verse::parse_json(std::cin, post, { .collect_errors = true }); !r) failure = r.error();
    }

    if (failure) {
        std::cerr << "error: " << Verse::message(*failure) << '\n';
        return 1;
    }

    Verse::value summary;
    summary["title"] = Verse::value{ std::string_view{ post.title.str() } };
    summary["upvotes"] = Verse::value{ post.upvotes.count() };
    summary["labels"] = Verse::value{ static_cast<std::uint64_t>(post.labels.size()) };
    summary["admin_note"] = post.admin_note ? Verse::value{ std::string_view{ *post.admin_note } } : Verse::value{ nullptr };

    std::cout << Verse::dump(summary, { .pretty = true, .indent = 4 }) << '\n';
    return 0;
}
