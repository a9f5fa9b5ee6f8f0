#include <catch2/catch.hpp>
#include <sqlid/identifier.hpp>
#include <initializer_list>
#include <set>
#include <sstream>
#include <unordered_set>

using namespace sqlid;

static std::string canonical(const char* raw) {
    auto id = Identifier::create(raw);
    REQUIRE(id.has_value());
    return id->str();
}

// ===== Normalization =====

TEST_CASE("mixed case is folded to lowercase", "[identifier]") {
    REQUIRE(canonical("AbCdEfG") == "abcdefg");
}

TEST_CASE("digits after the first character are kept", "[identifier]") {
    REQUIRE(canonical("a0123456789") == "a0123456789");
}

TEST_CASE("embedded space is allowed", "[identifier]") {
    REQUIRE(canonical("Hello World") == "hello world");
}

TEST_CASE("underscore may lead", "[identifier]") {
    REQUIRE(canonical("_1a") == "_1a");
    REQUIRE(canonical("_") == "_");
}

TEST_CASE("single letter is valid", "[identifier]") {
    REQUIRE(canonical("Q") == "q");
}

TEST_CASE("trailing space is kept", "[identifier]") {
    REQUIRE(canonical("abc ") == "abc ");
}

TEST_CASE("normalize_identifier matches create", "[identifier]") {
    REQUIRE(normalize_identifier("Order_Items").value() == "order_items");
    REQUIRE_FALSE(normalize_identifier("9lives").has_value());
}

// ===== Rejection =====

TEST_CASE("empty input is rejected", "[identifier]") {
    REQUIRE_FALSE(Identifier::create("").has_value());
    REQUIRE_FALSE(Identifier::is_valid(""));
}

TEST_CASE("leading digit is rejected", "[identifier]") {
    REQUIRE_FALSE(Identifier::create("1a").has_value());
    REQUIRE_FALSE(Identifier::create("0").has_value());
}

TEST_CASE("leading space is rejected", "[identifier]") {
    REQUIRE_FALSE(Identifier::create(" abc ").has_value());
    REQUIRE_FALSE(Identifier::create(" ").has_value());
}

TEST_CASE("disallowed characters are rejected anywhere", "[identifier]") {
    for (const char* raw : {"a.b", "a-b", "tab\tname", "line\nbreak",
                            "semi;", "$dollar", "quote\"", "back\\slash",
                            "caf\xc3\xa9"}) {
        INFO(raw);
        REQUIRE_FALSE(Identifier::create(raw).has_value());
        REQUIRE_FALSE(Identifier::is_valid(raw));
    }
}

TEST_CASE("embedded NUL is rejected", "[identifier]") {
    std::string raw("ab");
    raw.push_back('\0');
    raw += "c";
    REQUIRE_FALSE(Identifier::create(raw).has_value());
}

// ===== Properties =====

TEST_CASE("normalization is idempotent", "[identifier]") {
    for (const char* raw : {"AbCdEfG", "Hello World", "_1a", "ZZ_top 9"}) {
        auto once = Identifier::create(raw).value();
        auto twice = Identifier::create(once.view()).value();
        REQUIRE(once == twice);
    }
}

TEST_CASE("recasing does not change the identifier", "[identifier]") {
    auto a = Identifier::create("customer orders").value();
    REQUIRE(a == Identifier::create("CUSTOMER ORDERS").value());
    REQUIRE(a == Identifier::create("Customer Orders").value());
    REQUIRE(a == Identifier::create("cUsToMeR oRdErS").value());
}

TEST_CASE("every string over the allowed alphabet with a valid first char is accepted", "[identifier]") {
    const std::string first = "abcxyzABCXYZ_";
    const std::string rest = "azAZ09_ ";
    for (char f : first) {
        for (char r1 : rest) {
            for (char r2 : rest) {
                std::string raw{f, r1, r2};
                auto id = Identifier::create(raw);
                INFO(raw);
                REQUIRE(id.has_value());
                for (char c : id->str()) {
                    REQUIRE_FALSE((c >= 'A' && c <= 'Z'));
                }
            }
        }
    }
}

TEST_CASE("every single byte outside the alphabet is rejected", "[identifier]") {
    for (int b = 0; b < 256; ++b) {
        char c = static_cast<char>(b);
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '_' || c == ' ';
        std::string raw = "x";
        raw.push_back(c);
        INFO(b);
        REQUIRE(Identifier::create(raw).has_value() == allowed);
    }
}

// ===== Diagnostic parse =====

TEST_CASE("parse agrees with create", "[identifier]") {
    for (const char* raw : {"", "1a", " abc ", "a.b", "AbC", "_1a", "x y"}) {
        INFO(raw);
        REQUIRE(Identifier::parse(raw).is_ok() ==
                Identifier::create(raw).has_value());
    }
    REQUIRE(Identifier::parse("AbC").value() == "abc");
}

TEST_CASE("parse reports empty input", "[identifier]") {
    auto r = Identifier::parse("");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SqlidError::Empty);
}

TEST_CASE("parse reports a leading digit or space", "[identifier]") {
    auto digit = Identifier::parse("1a");
    REQUIRE(digit.is_err());
    REQUIRE(digit.error().code == SqlidError::LeadingChar);
    REQUIRE(digit.error().column == 1);

    auto space = Identifier::parse(" abc");
    REQUIRE(space.is_err());
    REQUIRE(space.error().code == SqlidError::LeadingChar);
}

TEST_CASE("parse reports the column of a bad character", "[identifier]") {
    auto r = Identifier::parse("users.id");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SqlidError::InvalidChar);
    REQUIRE(r.error().column == 6);
    REQUIRE(r.error().message.find("'.'") != std::string::npos);

    auto first = Identifier::parse("-x");
    REQUIRE(first.is_err());
    REQUIRE(first.error().code == SqlidError::InvalidChar);
    REQUIRE(first.error().column == 1);
}

TEST_CASE("parse escapes control characters in messages", "[identifier]") {
    auto r = Identifier::parse("a\tb");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("\\x09") != std::string::npos);
}

TEST_CASE("parse messages stay on one line", "[identifier]") {
    auto r = Identifier::parse("x\ny.z");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find('\n') == std::string::npos);
    REQUIRE(r.error().message.find("'x\\x0ay.z'") != std::string::npos);
    REQUIRE(r.error().format().find("\n  hint:") != std::string::npos);
    REQUIRE(r.error().format().find('\n') == r.error().format().find("\n  hint:"));
}

TEST_CASE("parse messages escape terminal control bytes", "[identifier]") {
    auto r = Identifier::parse("red\x1b[31mtable");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find('\x1b') == std::string::npos);
    REQUIRE(r.error().message.find("\\x1b") != std::string::npos);
}

TEST_CASE("parse messages escape quotes, backslashes and high bytes", "[identifier]") {
    auto dq = Identifier::parse("say \"hi\"");
    REQUIRE(dq.is_err());
    REQUIRE(dq.error().message.find("'say \\\"hi\\\"'") != std::string::npos);

    auto sq = Identifier::parse("o'neil");
    REQUIRE(sq.is_err());
    REQUIRE(sq.error().message.find("invalid character '\\''") != std::string::npos);

    auto bs = Identifier::parse("a\\b");
    REQUIRE(bs.is_err());
    REQUIRE(bs.error().message.find("'a\\\\b'") != std::string::npos);

    auto hi = Identifier::parse("caf\xc3\xa9");
    REQUIRE(hi.is_err());
    REQUIRE(hi.error().column == 4);
    REQUIRE(hi.error().message.find("'caf\\xc3\\xa9'") != std::string::npos);
}

TEST_CASE("create is parse without the error detail", "[identifier]") {
    for (const char* raw : {"", "1a", " abc ", "a.b", "AbC", "_1a", "x y", "x\ny"}) {
        INFO(raw);
        auto parsed = Identifier::parse(raw);
        auto created = Identifier::create(raw);
        REQUIRE(parsed.is_ok() == created.has_value());
        if (created) {
            REQUIRE(*created == parsed.value());
        }
    }
}

// ===== Access, comparison, formatting =====

TEST_CASE("identifier dereferences to its canonical text", "[identifier]") {
    auto id = Identifier::create("Users").value();
    REQUIRE(*id == "users");
    REQUIRE(id->size() == 5u);
    REQUIRE(id.size() == 5u);
    std::string_view sv = id;
    REQUIRE(sv == "users");
}

TEST_CASE("comparison against text is on the canonical form", "[identifier]") {
    auto id = Identifier::create("Users").value();
    REQUIRE(id == "users");
    REQUIRE(id != "Users");
}

TEST_CASE("ordering follows the canonical text", "[identifier]") {
    auto a = Identifier::create("Alpha").value();
    auto b = Identifier::create("beta").value();
    REQUIRE(a < b);
    REQUIRE(a <= b);
    REQUIRE(b > a);
    REQUIRE(b >= a);
    REQUIRE_FALSE(b < a);

    std::set<Identifier> sorted{b, a, Identifier::create("ALPHA").value()};
    REQUIRE(sorted.size() == 2);
    REQUIRE(*sorted.begin() == a);
}

TEST_CASE("hash is consistent with equality", "[identifier]") {
    auto a = Identifier::create("Order Items").value();
    auto b = Identifier::create("ORDER ITEMS").value();
    REQUIRE(std::hash<Identifier>{}(a) == std::hash<Identifier>{}(b));

    std::unordered_set<Identifier> ids{a, b};
    REQUIRE(ids.size() == 1);
}

TEST_CASE("display writes the bare canonical text", "[identifier]") {
    std::ostringstream ss;
    ss << Identifier::create("Hello World").value();
    REQUIRE(ss.str() == "hello world");
}

TEST_CASE("debug_string quotes the canonical text", "[identifier]") {
    REQUIRE(Identifier::create("Hello World").value().debug_string() ==
            "\"hello world\"");
}

TEST_CASE("copies are independent values", "[identifier]") {
    auto a = Identifier::create("t1").value();
    Identifier b = a;
    Identifier c = std::move(a);
    REQUIRE(b == c);
    REQUIRE(b.str() == "t1");
}
