#include <catch2/catch_all.hpp>

#include "verse/verse.hpp"

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

using namespace Catch;

namespace blog {

    std::string_view trim(std::string_view s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    std::chrono::sys_seconds utc(int y, unsigned mo, unsigned d, int h, int mi, int s) {
        using namespace std::chrono;
        return sys_days{ year{ y } / month{ mo } / day{ d } } + hours{ h } + minutes{ mi } + seconds{ s };
    }

    class Username {
    public:
        Verse::status parse_string(std::string_view s) {
            static const std::regex pattern{ "^[a-zA-Z0-9_-]{3,16}$" };
            if (!std::regex_match(s.begin(), s.end(), pattern)) {
                return Verse::reject("username must be 3 to 16 letters, digits, dashes or underscores");
            }
            m_Value = s;
            return {};
        }

        const std::string& str() const noexcept { return m_Value; }

    private:
        std::string m_Value;
    };

    class Email {
    public:
        Verse::status parse_string(std::string_view s) {
            if (s.find('@') == std::string_view::npos) return Verse::reject("email must contain an @ symbol");
            m_Value = s;
            return {};
        }

        const std::string& str() const noexcept { return m_Value; }

    private:
        std::string m_Value;
    };

    // Accepts the UTC form of RFC 3339, e.g. 2023-09-11T10:00:00Z
    class CreatedAt {
    public:
        Verse::status parse_string(std::string_view s) {
            const std::string text{ s };
            int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, consumed = 0;
            if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ%n", &y, &mo, &d, &h, &mi, &sec, &consumed) != 6
                || consumed != static_cast<int>(text.size())) {
                return Verse::reject("timestamp must be RFC 3339 in UTC");
            }

            const std::chrono::year_month_day ymd{ std::chrono::year{ y }, std::chrono::month{ static_cast<unsigned>(mo) },
                                                   std::chrono::day{ static_cast<unsigned>(d) } };
            if (!ymd.ok() || h > 23 || mi > 59 || sec > 59) return Verse::reject("timestamp is out of range");

            m_Time = utc(y, static_cast<unsigned>(mo), static_cast<unsigned>(d), h, mi, sec);
            return {};
        }

        std::chrono::sys_seconds time() const noexcept { return m_Time; }

    private:
        std::chrono::sys_seconds m_Time{};
    };

    template<std::size_t Min, std::size_t Max>
    class TrimmedText {
    public:
        Verse::status parse_string(std::string_view s) {
            const auto trimmed = trim(s);
            if (trimmed.size() < Min || trimmed.size() > Max) {
                return Verse::reject("text must be between " + std::to_string(Min) + " and " + std::to_string(Max) + " characters long");
            }
            m_Value = trimmed;
            return {};
        }

        const std::string& str() const noexcept { return m_Value; }

    private:
        std::string m_Value;
    };

    using Title = TrimmedText<3, 100>;
    using Body = TrimmedText<10, 5000>;
    using Label = TrimmedText<1, 20>;

    class Upvotes {
    public:
        Verse::status parse_float64(double f) {
            m_Count = static_cast<int>(f);
            return {};
        }

        int count() const noexcept { return m_Count; }

    private:
        int m_Count = 0;
    };

    using Metadata = std::map<std::string, std::string>;

    struct User {
        Username username;
        Email email;
        CreatedAt created_at;
        bool is_admin = false;
    };

    struct Comment {
        Body body;
        Metadata metadata;
        Upvotes upvotes;
        User commenter;
    };

    struct Post {
        Title title;
        Body body;
        std::optional<Metadata> metadata;
        std::vector<Label> labels;
        Upvotes upvotes;
        User poster;
        std::vector<Comment> comments;
        std::optional<std::string> admin_note;
    };

} // namespace blog

namespace people {

    class Name {
    public:
        Verse::status parse_string(std::string_view s) {
            if (s.empty()) return Verse::reject("name must not be empty");
            m_Value = s;
            return {};
        }

        const std::string& str() const noexcept { return m_Value; }

    private:
        std::string m_Value;
    };

    struct Person {
        Name name;
        int age = 0;
    };

    struct Account {
        std::string owner;
        const int id = 7;
    };

    struct Note {
        std::string text;
        std::optional<std::string> footer;
    };

    // Counts how often the engine asked it to fill in a default.
    struct Nickname {
        int defaults = 0;
        std::string text;

        void set_default() {
            ++defaults;
            text = "anonymous";
        }

        Verse::status parse_string(std::string_view s) {
            text = s;
            return {};
        }
    };

    struct Profile {
        Nickname nickname;
        std::unique_ptr<Nickname> alias;
        std::optional<int> age;
        std::optional<Name> middle_name;
    };

} // namespace people

namespace Verse {

    template<>
    struct fields<blog::User> {
        static constexpr auto members = std::tuple{
            field("Username", &blog::User::username),
            field("Email", &blog::User::email),
            field("CreatedAt", &blog::User::created_at),
            field("IsAdmin", &blog::User::is_admin),
        };
    };

    template<>
    struct fields<blog::Comment> {
        static constexpr auto members = std::tuple{
            field("Body", &blog::Comment::body),
            field("Metadata", &blog::Comment::metadata),
            field("Upvotes", &blog::Comment::upvotes),
            field("Commenter", &blog::Comment::commenter),
        };
    };

    template<>
    struct fields<blog::Post> {
        static constexpr auto members = std::tuple{
            field("Title", &blog::Post::title),
            field("Body", &blog::Post::body),
            field("Metadata", &blog::Post::metadata),
            field("Labels", &blog::Post::labels),
            field("Upvotes", &blog::Post::upvotes),
            field("Poster", &blog::Post::poster),
            field("Comments", &blog::Post::comments),
            field("AdminNote", &blog::Post::admin_note),
        };
    };

    template<>
    struct fields<people::Person> {
        static constexpr auto members = std::tuple{
            VERSE_FIELD(people::Person, name),
            VERSE_FIELD(people::Person, age),
        };
    };

    template<>
    struct fields<people::Account> {
        static constexpr auto members = std::tuple{
            VERSE_FIELD(people::Account, owner),
            VERSE_FIELD(people::Account, id),
        };
    };

    template<>
    struct fields<people::Note> {
        static constexpr auto members = std::tuple{
            VERSE_FIELD(people::Note, text),
            VERSE_FIELD(people::Note, footer),
        };
    };

    template<>
    struct fields<people::Profile> {
        static constexpr auto members = std::tuple{
            VERSE_FIELD(people::Profile, nickname),
            VERSE_FIELD(people::Profile, alias),
            VERSE_FIELD(people::Profile, age),
            VERSE_FIELD(people::Profile, middle_name),
        };
    };

} // namespace Verse

namespace {

    Verse::value doc(std::string_view json) {
        auto r = Verse::read(json);
        REQUIRE(r);
        return std::move(*r);
    }

    struct Widths {
        std::vector<std::string> calls;

        Verse::status parse_int8(std::int8_t) { calls.emplace_back("int8"); return {}; }
        Verse::status parse_int32(std::int32_t) { calls.emplace_back("int32"); return {}; }
        Verse::status parse_uint(unsigned long long) { calls.emplace_back("uint"); return {}; }
        Verse::status parse_float32(float) { calls.emplace_back("float32"); return {}; }
        Verse::status parse_float64(double) { calls.emplace_back("float64"); return {}; }
    };

    struct Raw {
        Verse::value seen;

        Verse::status parse_any(const Verse::value& v) {
            seen = v;
            return {};
        }
    };

    class Headers {
    public:
        Verse::status parse_string_map(const Verse::string_map& m) {
            m_Entries = m;
            return {};
        }

        Verse::status parse_map(const Verse::object& o) {
            m_Mixed = true;
            m_Size = o.size();
            return {};
        }

        const Verse::string_map& entries() const noexcept { return m_Entries; }
        bool mixed() const noexcept { return m_Mixed; }
        std::size_t size() const noexcept { return m_Size; }

    private:
        Verse::string_map m_Entries;
        bool m_Mixed = false;
        std::size_t m_Size = 0;
    };

    class Tags {
    public:
        Verse::status parse_string_list(const Verse::string_list& l) {
            if (l.size() > 4) return Verse::reject("at most 4 tags");
            m_Tags = l;
            return {};
        }

        const Verse::string_list& list() const noexcept { return m_Tags; }

    private:
        Verse::string_list m_Tags;
    };

    class Slug {
    public:
        Slug() = default;
        explicit Slug(std::string s) : m_Text(std::move(s)) {}

        const std::string& str() const noexcept { return m_Text; }

    private:
        std::string m_Text;
    };

    enum class Color : std::uint8_t { red, green, blue };

} // namespace

// ------------------------------------------------------------
// Identity and scalars
// ------------------------------------------------------------

TEST_CASE("Primitive Payloads Convert by Identity") {
    bool b = false;
    REQUIRE(Verse::parse(Verse::value{ true }, b));
    REQUIRE(b);

    double d = 0.0;
    REQUIRE(Verse::parse(Verse::value{ 2.25 }, d));
    REQUIRE(d == 2.25);

    std::int32_t i = 0;
    REQUIRE(Verse::parse(Verse::value{ std::int32_t{ -17 } }, i));
    REQUIRE(i == -17);

    std::string s;
    REQUIRE(Verse::parse(Verse::value{ "hello" }, s));
    REQUIRE(s == "hello");
}

TEST_CASE("Generic Value Target Copies the Input") {
    const auto in = doc(R"({"a": [1, "two", null], "b": {"c": true}})");

    Verse::value out;
    REQUIRE(Verse::parse(in, out));
    REQUIRE(out == in);
}

TEST_CASE("Lists and Maps Convert Element by Element") {
    std::vector<double> numbers;
    REQUIRE(Verse::parse(doc("[1, 2.5, -3]"), numbers));
    REQUIRE(numbers == std::vector<double>{ 1.0, 2.5, -3.0 });

    std::map<std::string, bool> flags;
    REQUIRE(Verse::parse(doc(R"({"on": true, "off": false})"), flags));
    REQUIRE(flags == std::map<std::string, bool>{ { "off", false }, { "on", true } });
}

TEST_CASE("Containers of Generic Values Convert by Identity") {
    const auto list = doc(R"([1, "two", {"three": [3]}, null])");
    Verse::array arr;
    REQUIRE(Verse::parse(list, arr));
    REQUIRE(arr == list.as_array());

    const auto map = doc(R"({"a": null, "b": [true], "c": {"d": "e"}})");
    Verse::object obj;
    REQUIRE(Verse::parse(map, obj));
    REQUIRE(obj == map.as_object());
}

TEST_CASE("Integer Narrowing Wraps Without Error") {
    std::uint8_t byte = 0;
    REQUIRE(Verse::parse(Verse::value{ std::int64_t{ 300 } }, byte));
    REQUIRE(byte == 44);

    std::int16_t small = 0;
    REQUIRE(Verse::parse(Verse::value{ std::uint32_t{ 65535 } }, small));
    REQUIRE(small == -1);
}

TEST_CASE("Float Converts to Integer by Truncation") {
    int age = 0;
    REQUIRE(Verse::parse(Verse::value{ 30.9 }, age));
    REQUIRE(age == 30);

    std::int8_t small = 0;
    auto r = Verse::parse(Verse::value{ 300.0 }, small);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::not_convertible);

    auto nan = Verse::parse(Verse::value{ std::numeric_limits<double>::quiet_NaN() }, age);
    REQUIRE_FALSE(nan);
}

TEST_CASE("Enum Converts Through Its Underlying Type") {
    Color c = Color::red;
    REQUIRE(Verse::parse(Verse::value{ 2.0 }, c));
    REQUIRE(c == Color::blue);
}

TEST_CASE("Mismatched Kinds Are Reported") {
    int n = 0;
    auto from_bool = Verse::parse(Verse::value{ true }, n);
    REQUIRE_FALSE(from_bool);
    REQUIRE(from_bool.error().errc == Verse::ConvertError::code::not_convertible);

    auto from_array = Verse::parse(doc("[1]"), n);
    REQUIRE_FALSE(from_array);
    REQUIRE(from_array.error().errc == Verse::ConvertError::code::unsupported_kinds);

    std::string s;
    auto from_object = Verse::parse(doc("{}"), s);
    REQUIRE_FALSE(from_object);
    REQUIRE(from_object.error().errc == Verse::ConvertError::code::unsupported_kinds);
}

TEST_CASE("Opaque Type Built From String Constructor") {
    std::vector<Slug> slugs;
    REQUIRE(Verse::parse(doc(R"(["intro", "faq"])"), slugs));
    REQUIRE(slugs.size() == 2);
    REQUIRE(slugs[1].str() == "faq");
}

// ------------------------------------------------------------
// Absence
// ------------------------------------------------------------

TEST_CASE("Required Target Fails on Absent Input") {
    int n = 5;
    auto r = Verse::parse(Verse::value{}, n);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::missing_value);
    REQUIRE(r.error().path.empty());
    REQUIRE(n == 5);
}

TEST_CASE("Absent Input Calls set_default Exactly Once") {
    people::Nickname nick;
    REQUIRE(Verse::parse(Verse::value{}, nick));
    REQUIRE(nick.defaults == 1);
    REQUIRE(nick.text == "anonymous");
}

TEST_CASE("Optional Targets Stay Empty When Absent") {
    people::Profile profile;
    REQUIRE(Verse::parse(doc("{}"), profile));

    REQUIRE(profile.nickname.defaults == 1);
    REQUIRE_FALSE(profile.age.has_value());
    REQUIRE_FALSE(profile.middle_name.has_value());

    // A pointee with set_default is allocated so the default can be applied
    REQUIRE(profile.alias != nullptr);
    REQUIRE(profile.alias->defaults == 1);

    std::optional<double> bare;
    REQUIRE(Verse::parse(Verse::value{}, bare));
    REQUIRE_FALSE(bare.has_value());
}

TEST_CASE("Optional Targets Are Engaged When Present") {
    people::Profile profile;
    REQUIRE(Verse::parse(doc(R"({"nickname": "zed", "age": 41, "middle_name": "Q"})"), profile));

    REQUIRE(profile.nickname.text == "zed");
    REQUIRE(profile.nickname.defaults == 0);
    REQUIRE(profile.age == 41);
    REQUIRE(profile.middle_name.has_value());
    REQUIRE(profile.middle_name->str() == "Q");

    auto shared = std::shared_ptr<int>{};
    REQUIRE(Verse::parse(Verse::value{ 3.0 }, shared));
    REQUIRE(shared != nullptr);
    REQUIRE(*shared == 3);
}

// ------------------------------------------------------------
// Hooks
// ------------------------------------------------------------

TEST_CASE("Narrowest Numeric Hook Wins") {
    Widths w;

    REQUIRE(Verse::parse(Verse::value{ std::int8_t{ 5 } }, w));
    REQUIRE(Verse::parse(Verse::value{ std::int16_t{ 5 } }, w));
    REQUIRE(Verse::parse(Verse::value{ std::uint16_t{ 5 } }, w));
    REQUIRE(Verse::parse(Verse::value{ 1.5f }, w));
    REQUIRE(Verse::parse(Verse::value{ 1.5 }, w));

    REQUIRE(w.calls == std::vector<std::string>{ "int8", "int32", "uint", "float32", "float64" });
}

TEST_CASE("No Numeric Hook Wide Enough Fails") {
    Widths w;
    auto r = Verse::parse(Verse::value{ std::int64_t{ 5 } }, w);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::not_convertible);
    REQUIRE(w.calls.empty());
}

TEST_CASE("parse_any Sees the Raw Value") {
    Raw raw;
    const auto in = doc(R"([1, {"x": null}])");
    REQUIRE(Verse::parse(in, raw));
    REQUIRE(raw.seen == in);
}

TEST_CASE("String Map Hook Receives All-String Objects") {
    Headers h;
    REQUIRE(Verse::parse(doc(R"({"Accept": "text/plain", "Host": "example.com"})"), h));
    REQUIRE_FALSE(h.mixed());
    REQUIRE(h.entries().at("Host") == "example.com");

    Headers mixed;
    REQUIRE(Verse::parse(doc(R"({"Accept": "text/plain", "Retries": 3})"), mixed));
    REQUIRE(mixed.mixed());
    REQUIRE(mixed.size() == 2);
}

TEST_CASE("String List Hook Receives All-String Arrays") {
    Tags tags;
    REQUIRE(Verse::parse(doc(R"(["c++", "json"])"), tags));
    REQUIRE(tags.list() == Verse::string_list{ "c++", "json" });

    auto too_many = Verse::parse(doc(R"(["a", "b", "c", "d", "e"])"), tags);
    REQUIRE_FALSE(too_many);
    REQUIRE(too_many.error().errc == Verse::ConvertError::code::rejected);

    auto not_strings = Verse::parse(doc("[1, 2]"), tags);
    REQUIRE_FALSE(not_strings);
    REQUIRE(not_strings.error().errc == Verse::ConvertError::code::unsupported_kinds);
}

// ------------------------------------------------------------
// Records
// ------------------------------------------------------------

TEST_CASE("Record Fields Map From Source Keys") {
    people::Person joe;
    REQUIRE(Verse::parse(doc(R"({"name": "Joe", "age": 30.0, "extra": [1, 2]})"), joe));
    REQUIRE(joe.name.str() == "Joe");
    REQUIRE(joe.age == 30);
}

TEST_CASE("Hook Failure Reports the Field Path") {
    people::Person joe;
    auto r = Verse::parse(doc(R"({"name": "", "age": 30.0})"), joe);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::rejected);
    REQUIRE(r.error().path == "name");
    REQUIRE(r.error().what() == "name: name must not be empty");
}

TEST_CASE("Missing Required Field Reports Its Path") {
    people::Person p;
    auto r = Verse::parse(doc(R"({"age": 3})"), p);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::missing_value);
    REQUIRE(r.error().path == "name");
}

TEST_CASE("Const Fields Are Skipped") {
    people::Account acct;
    REQUIRE(Verse::parse(doc(R"({"owner": "ops", "id": 99})"), acct));
    REQUIRE(acct.owner == "ops");
    REQUIRE(acct.id == 7);
}

TEST_CASE("Shape Classification") {
    STATIC_REQUIRE(Verse::shape_of<Verse::value> == Verse::shape::dynamic);
    STATIC_REQUIRE(Verse::shape_of<bool> == Verse::shape::boolean);
    STATIC_REQUIRE(Verse::shape_of<unsigned> == Verse::shape::integer);
    STATIC_REQUIRE(Verse::shape_of<Color> == Verse::shape::enumeration);
    STATIC_REQUIRE(Verse::shape_of<std::string> == Verse::shape::string);
    STATIC_REQUIRE(Verse::shape_of<std::unique_ptr<int>> == Verse::shape::optional);
    STATIC_REQUIRE(Verse::shape_of<people::Person> == Verse::shape::record);
    STATIC_REQUIRE(Verse::shape_of<std::unordered_map<std::string, int>> == Verse::shape::map);
    STATIC_REQUIRE(Verse::shape_of<std::array<int, 2>> == Verse::shape::array);
    STATIC_REQUIRE(Verse::shape_of<std::vector<int>> == Verse::shape::list);
    STATIC_REQUIRE(Verse::shape_of<Tags> == Verse::shape::opaque);
    STATIC_REQUIRE(Verse::shape_of<std::optional<people::Person>> == Verse::shape::optional);
    STATIC_REQUIRE(Verse::shape_of<std::map<std::string, std::vector<int>>> == Verse::shape::map);
    STATIC_REQUIRE(Verse::shape_of<std::string_view> == Verse::shape::opaque);

    STATIC_REQUIRE(Verse::convertible_target<std::string>);
    STATIC_REQUIRE(Verse::convertible_target<people::Person>);
    STATIC_REQUIRE(Verse::convertible_target<Slug>);
    STATIC_REQUIRE_FALSE(Verse::convertible_target<std::string_view>);
    STATIC_REQUIRE_FALSE(Verse::convertible_target<const int>);
    STATIC_REQUIRE_FALSE(Verse::convertible_target<int*>);

    using account_fields = std::decay_t<decltype(Verse::fields<people::Account>::members)>;
    STATIC_REQUIRE(std::tuple_element_t<0, account_fields>::settable);
    STATIC_REQUIRE_FALSE(std::tuple_element_t<1, account_fields>::settable);
}

// ------------------------------------------------------------
// Lists, fixed arrays and maps
// ------------------------------------------------------------

TEST_CASE("Fixed Array Overflow Leaves Target Untouched") {
    std::array<int, 3> slots{ 7, 8, 9 };
    auto r = Verse::parse(doc("[1, 2, 3, 4, 5]"), slots);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::capacity_exceeded);
    REQUIRE(slots == std::array<int, 3>{ 7, 8, 9 });
}

TEST_CASE("Short Input Treats Trailing Slots as Absent") {
    std::array<std::optional<int>, 3> optional_slots;
    REQUIRE(Verse::parse(doc("[1, 2]"), optional_slots));
    REQUIRE(optional_slots[1] == 2);
    REQUIRE_FALSE(optional_slots[2].has_value());

    std::array<int, 3> slots{};
    auto r = Verse::parse(doc("[1, 2]"), slots);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::missing_value);
    REQUIRE(r.error().path == "[2]");
}

TEST_CASE("Failing Element Leaves List Untouched") {
    std::vector<int> out{ 42 };
    auto r = Verse::parse(doc(R"([1, "x", 3])"), out);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().path == "[1]");
    REQUIRE(out == std::vector<int>{ 42 });
}

TEST_CASE("Map Round-Trip Ignores Iteration Order") {
    const auto in = doc(R"({"zeta": 26, "alpha": 1, "mu": 12})");

    std::unordered_map<std::string, int> hashed;
    REQUIRE(Verse::parse(in, hashed));
    REQUIRE(hashed == std::unordered_map<std::string, int>{ { "alpha", 1 }, { "mu", 12 }, { "zeta", 26 } });

    std::map<std::string, int> ordered;
    REQUIRE(Verse::parse(in, ordered));
    REQUIRE(ordered.size() == 3);
    REQUIRE(ordered.at("zeta") == 26);
}

TEST_CASE("Map Entry Failures Report the Key") {
    std::map<std::string, int> counts{ { "keep", 1 } };
    auto r = Verse::parse(doc(R"({"a": 1, "b": "two"})"), counts);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().path == "[\"b\"]");
    REQUIRE(counts.size() == 1);

    std::map<int, std::string> by_number;
    auto key = Verse::parse(doc(R"({"1": "one"})"), by_number);
    REQUIRE_FALSE(key);
    REQUIRE(key.error().path == "[\"1\"]");
    REQUIRE(key.error().msg.starts_with("invalid key: "));
}

// ------------------------------------------------------------
// Nested records
// ------------------------------------------------------------

namespace {

    constexpr std::string_view post_json = R"({
        "Title": "  My First Post ",
        "Body": "This is the content of my first post. It's pretty exciting!",
        "Metadata": { "category": "tech", "tags": "golang,testing" },
        "Labels": ["new", "featured"],
        "Upvotes": 42.0,
        "Poster": {
            "Username": "johndoe",
            "Email": "john@example.com",
            "CreatedAt": "2023-09-11T10:00:00Z",
            "IsAdmin": true
        },
        "Comments": [
            {
                "Body": "Great post! Looking forward to more.",
                "Metadata": { "likes": "5" },
                "Upvotes": 5.0,
                "Commenter": {
                    "Username": "janedoe",
                    "Email": "jane@example.com",
                    "CreatedAt": "2023-09-10T09:00:00Z",
                    "IsAdmin": false
                }
            }
        ],
        "AdminNote": "Approved for front page"
    })";

} // namespace

TEST_CASE("Post With Comments Converts End to End") {
    auto in = doc(post_json);
    for (std::uint8_t b : { 1, 2, 3, 4 }) in["FewBytes"].as_array().emplace_back(b);

    blog::Post post;
    auto r = Verse::parse(in, post);
    INFO((r ? std::string{} : r.error().what()));
    REQUIRE(r);

    REQUIRE(post.title.str() == "My First Post");
    REQUIRE(post.body.str() == "This is the content of my first post. It's pretty exciting!");
    REQUIRE(post.metadata == blog::Metadata{ { "category", "tech" }, { "tags", "golang,testing" } });
    REQUIRE(post.labels.size() == 2);
    REQUIRE(post.labels[1].str() == "featured");
    REQUIRE(post.upvotes.count() == 42);

    REQUIRE(post.poster.username.str() == "johndoe");
    REQUIRE(post.poster.email.str() == "john@example.com");
    REQUIRE(post.poster.created_at.time() == blog::utc(2023, 9, 11, 10, 0, 0));
    REQUIRE(post.poster.is_admin);

    REQUIRE(post.comments.size() == 1);
    const auto& comment = post.comments.front();
    REQUIRE(comment.body.str() == "Great post! Looking forward to more.");
    REQUIRE(comment.metadata == blog::Metadata{ { "likes", "5" } });
    REQUIRE(comment.upvotes.count() == 5);
    REQUIRE(comment.commenter.username.str() == "janedoe");
    REQUIRE(comment.commenter.created_at.time() == blog::utc(2023, 9, 10, 9, 0, 0));
    REQUIRE_FALSE(comment.commenter.is_admin);

    REQUIRE(post.admin_note == "Approved for front page");
}

TEST_CASE("Post Without Optional Parts Leaves Them Empty") {
    auto in = doc(post_json);
    in.as_object().erase("Metadata");
    in["AdminNote"] = nullptr;

    blog::Post post;
    REQUIRE(Verse::parse(in, post));
    REQUIRE_FALSE(post.metadata.has_value());
    REQUIRE_FALSE(post.admin_note.has_value());
}

TEST_CASE("Nested Failure Path Names Every Level") {
    auto in = doc(post_json);
    in["Comments"][0]["Commenter"]["Username"] = "x";

    blog::Post post;
    auto r = Verse::parse(in, post);
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::rejected);
    REQUIRE(r.error().path == "Comments[0].Commenter.Username");

    auto meta = doc(post_json);
    meta["Metadata"]["tags"] = 3.0;
    auto m = Verse::parse(meta, post);
    REQUIRE_FALSE(m);
    REQUIRE(m.error().path == "Metadata[\"tags\"]");
}

// ------------------------------------------------------------
// Options
// ------------------------------------------------------------

TEST_CASE("Error Collection Reports Every Failure") {
    auto in = doc(post_json);
    in["Title"] = "x";
    in["Poster"]["Email"] = "nobody";
    in["Labels"][1] = "";

    blog::Post post;
    auto first = Verse::parse(in, post);
    REQUIRE_FALSE(first);
    REQUIRE(first.error().path == "Title");

    auto all = Verse::parse(in, post, { .collect_errors = true });
    REQUIRE_FALSE(all);
    REQUIRE(all.error().errc == Verse::ConvertError::code::multiple);
    REQUIRE(all.error().causes.size() == 3);
    REQUIRE(all.error().causes[0].path == "Title");
    REQUIRE(all.error().causes[1].path == "Labels[1]");
    REQUIRE(all.error().causes[2].path == "Poster.Email");
    REQUIRE(all.error().what().find("; ") != std::string::npos);
}

TEST_CASE("Error Collection Wraps a Single Failure") {
    people::Person p;
    auto r = Verse::parse(doc(R"({"name": "", "age": 1})"), p, { .collect_errors = true });
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::multiple);
    REQUIRE(r.error().causes.size() == 1);
    REQUIRE(r.error().causes[0].path == "name");

    auto both = Verse::parse(doc(R"({"name": ""})"), p, { .collect_errors = true });
    REQUIRE_FALSE(both);
    REQUIRE(both.error().causes.size() == 2);
    REQUIRE(both.error().causes[1].errc == Verse::ConvertError::code::missing_value);
    REQUIRE(both.error().causes[1].path == "age");
}

TEST_CASE("Conversion Depth Limit") {
    std::vector<std::vector<std::vector<int>>> nested;
    const auto in = doc("[[[1]]]");

    REQUIRE(Verse::parse(in, nested, { .max_depth = 3 }));
    REQUIRE(nested[0][0][0] == 1);

    auto r = Verse::parse(in, nested, { .max_depth = 2 });
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Verse::ConvertError::code::depth_limit_exceeded);
    REQUIRE(r.error().path == "[0][0]");
}

// ------------------------------------------------------------
// Entry points
// ------------------------------------------------------------

TEST_CASE("Typed Parse Returns the Value") {
    auto p = Verse::parse<people::Person>(doc(R"({"name": "Ann", "age": 7})"));
    REQUIRE(p);
    REQUIRE(p->name.str() == "Ann");

    auto bad = Verse::parse<int>(Verse::value{ "seven" });
    REQUIRE_FALSE(bad);
    REQUIRE(Verse::code_name(bad.error().errc) == "not_convertible");
}

TEST_CASE("Pointer Target Must Not Be Null") {
    people::Person* none = nullptr;
    REQUIRE_THROWS_AS(Verse::parse(Verse::value{}, none), std::invalid_argument);

    people::Person joe;
    REQUIRE(Verse::parse(doc(R"({"name": "Joe", "age": 1})"), &joe));
    REQUIRE(joe.name.str() == "Joe");
}

TEST_CASE("Converted Text Outlives the Input") {
    people::Note note;
    REQUIRE(Verse::parse_json(R"({"text": "a string long enough to defeat small string optimisation",
                                  "footer": "another string that lives on the heap for sure"})", note));
    REQUIRE(note.text == "a string long enough to defeat small string optimisation");
    REQUIRE(note.footer == "another string that lives on the heap for sure");
}

TEST_CASE("parse_json Reads Then Converts") {
    people::Person joe;
    auto ok = Verse::parse_json(R"({"name": "Joe", "age": 30.0})", joe);
    REQUIRE(ok);
    REQUIRE(joe.age == 30);

    std::istringstream stream{ R"({"name": "Bo", "age": 2})" };
    REQUIRE(Verse::parse_json(stream, joe));
    REQUIRE(joe.name.str() == "Bo");

    auto syntax = Verse::parse_json("{\"name\": ", joe);
    REQUIRE_FALSE(syntax);
    REQUIRE(std::holds_alternative<Verse::ReadError>(syntax.error()));
    REQUIRE(Verse::message(syntax.error()).starts_with("line 1, column 10: "));

    auto invalid = Verse::parse_json(R"({"name": "", "age": 1})", joe);
    REQUIRE_FALSE(invalid);
    REQUIRE(std::holds_alternative<Verse::ConvertError>(invalid.error()));
    REQUIRE(Verse::message(invalid.error()) == "name: name must not be empty");
}

TEST_CASE("Library Logger Is Named and Adjustable") {
    REQUIRE(Verse::logger()->name() == "verse");

    Verse::set_log_level(spdlog::level::trace);
    people::Person p;
    REQUIRE_FALSE(Verse::parse(doc(R"({"name": ""})"), p));
    Verse::set_log_level(spdlog::level::warn);
    REQUIRE(Verse::logger()->level() == spdlog::level::warn);
}
