#include <sqlid/identifier.hpp>
#include <cstdio>

namespace sqlid {

namespace {

// ASCII only; the locale is never consulted
bool is_ascii_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_allowed_char(char c) {
    return is_ascii_alpha(c) || is_ascii_digit(c) || c == '_' || c == ' ';
}

bool is_allowed_first_char(char c) {
    return is_allowed_char(c) && !is_ascii_digit(c) && c != ' ';
}

char to_ascii_lower(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

// Quotes and backslashes are backslash-escaped, control and high bytes
// become \xNN, so the result is always a single printable line.
std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto u = static_cast<unsigned char>(c);
        if (c == '\'' || c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (u < 0x20 || u >= 0x7f) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", u);
            out += buf;
        } else {
            out += c;
        }
    }
    return out;
}

// Index of the first offending character, or npos if raw is valid.
// Empty input reports index 0.
std::size_t find_invalid(std::string_view raw) {
    if (raw.empty() || !is_allowed_first_char(raw[0])) {
        return 0;
    }
    for (std::size_t i = 1; i < raw.size(); ++i) {
        if (!is_allowed_char(raw[i])) {
            return i;
        }
    }
    return std::string_view::npos;
}

std::string fold(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        out.push_back(to_ascii_lower(c));
    }
    return out;
}

} // namespace

bool Identifier::is_valid(std::string_view raw) {
    return find_invalid(raw) == std::string_view::npos;
}

std::optional<std::string> normalize_identifier(std::string_view raw) {
    if (!Identifier::is_valid(raw)) {
        return std::nullopt;
    }
    return fold(raw);
}

std::optional<Identifier> Identifier::create(std::string_view raw) {
    return parse(raw).to_optional();
}

Result<Identifier> Identifier::parse(std::string_view raw) {
    if (raw.empty()) {
        return SqlidError{SqlidError::Empty, "empty identifier",
            "identifiers must have at least one character"};
    }

    std::size_t bad = find_invalid(raw);
    if (bad == std::string_view::npos) {
        return Result<Identifier>::ok(Identifier(fold(raw)));
    }

    std::string quoted = "'" + escape(raw) + "'";
    if (bad == 0 && is_allowed_char(raw[0])) {
        SqlidError e{SqlidError::LeadingChar,
            "identifier " + quoted + " starts with '" + escape(raw.substr(0, 1)) + "'",
            "identifiers cannot start with a digit or a space"};
        e.column = 1;
        return e;
    }

    SqlidError e{SqlidError::InvalidChar,
        "invalid character '" + escape(raw.substr(bad, 1)) + "' in identifier " +
        quoted + " at column " + std::to_string(bad + 1),
        "allowed: [a-zA-Z0-9_ ]"};
    e.column = static_cast<int>(bad + 1);
    return e;
}

std::string Identifier::debug_string() const {
    return "\"" + escape(value_) + "\"";
}

std::ostream& operator<<(std::ostream& os, const Identifier& id) {
    return os << id.str();
}

} // namespace sqlid
