#pragma once

#include <sqlid/identifier.hpp>
#include <sqlid/result.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlid {

// Distinct identifiers in insertion order. Names that differ only in case
// collide, which is how a catalog rejects a second "Users" table.
class IdentifierSet {
public:
    using const_iterator = std::vector<Identifier>::const_iterator;

    Status insert(Identifier id);
    Status insert(std::string_view raw);

    bool contains(const Identifier& id) const;
    bool contains(std::string_view raw) const;

    // nullptr if raw is invalid or not present
    const Identifier* find(std::string_view raw) const;

    bool erase(const Identifier& id);

    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

private:
    std::vector<Identifier> items_;
    std::unordered_map<Identifier, std::size_t> index_;
};

// Inserts every name into out. Returns one error per rejected or duplicate
// name, in input order.
std::vector<SqlidError> check_names(const std::vector<std::string>& raw,
                                    IdentifierSet& out);

} // namespace sqlid
