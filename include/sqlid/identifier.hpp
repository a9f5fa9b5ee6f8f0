#pragma once

#include <sqlid/result.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace sqlid {

// Name of a database object: table, column, constraint.
//
// Allowed characters: [a-zA-Z0-9_ ] (space is legal in quoted SQL identifiers).
// Must be non-empty and may not start with a digit or a space.
// Identifiers are case insensitive; the stored form is folded to lowercase
// so equality, ordering and hashing work on the canonical text.
class Identifier {
public:
    // Returns nullopt if raw is not a valid identifier
    static std::optional<Identifier> create(std::string_view raw);

    // Same rules as create(), but reports which rule failed and where
    static Result<Identifier> parse(std::string_view raw);

    static bool is_valid(std::string_view raw);

    const std::string& str() const { return value_; }
    std::string_view view() const { return value_; }
    std::size_t size() const { return value_.size(); }

    const std::string& operator*() const { return value_; }
    const std::string* operator->() const { return &value_; }
    operator std::string_view() const { return value_; }

    // Quoted and escaped, for diagnostics
    std::string debug_string() const;

    bool operator==(const Identifier& o) const { return value_ == o.value_; }
    bool operator!=(const Identifier& o) const { return value_ != o.value_; }
    bool operator<(const Identifier& o) const { return value_ < o.value_; }
    bool operator<=(const Identifier& o) const { return value_ <= o.value_; }
    bool operator>(const Identifier& o) const { return value_ > o.value_; }
    bool operator>=(const Identifier& o) const { return value_ >= o.value_; }

    // Compares the canonical text verbatim; "Users" never equals an Identifier
    bool operator==(std::string_view text) const { return view() == text; }
    bool operator!=(std::string_view text) const { return view() != text; }

private:
    explicit Identifier(std::string canonical) : value_(std::move(canonical)) {}

    std::string value_;
};

// Validates raw and folds it to the canonical lowercase form
std::optional<std::string> normalize_identifier(std::string_view raw);

std::ostream& operator<<(std::ostream& os, const Identifier& id);

} // namespace sqlid

namespace std {

template<>
struct hash<sqlid::Identifier> {
    std::size_t operator()(const sqlid::Identifier& id) const noexcept {
        return std::hash<std::string_view>{}(id.view());
    }
};

} // namespace std
