#include <sqlid/identifier_set.hpp>
#include <sqlid/log.hpp>

namespace sqlid {

Status IdentifierSet::insert(Identifier id) {
    if (index_.count(id)) {
        return SqlidError{SqlidError::Duplicate,
            "duplicate identifier " + id.debug_string(),
            "identifiers are case insensitive"};
    }
    index_.emplace(id, items_.size());
    items_.push_back(std::move(id));
    return ok_status();
}

Status IdentifierSet::insert(std::string_view raw) {
    auto parsed = Identifier::parse(raw);
    SQLID_TRY(parsed);
    return insert(std::move(parsed).value());
}

bool IdentifierSet::contains(const Identifier& id) const {
    return index_.count(id) != 0;
}

bool IdentifierSet::contains(std::string_view raw) const {
    return find(raw) != nullptr;
}

const Identifier* IdentifierSet::find(std::string_view raw) const {
    auto id = Identifier::create(raw);
    if (!id) return nullptr;
    auto it = index_.find(*id);
    if (it == index_.end()) return nullptr;
    return &items_[it->second];
}

bool IdentifierSet::erase(const Identifier& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    std::size_t pos = it->second;
    index_.erase(it);
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(pos));
    for (auto& [key, idx] : index_) {
        if (idx > pos) --idx;
    }
    return true;
}

std::vector<SqlidError> check_names(const std::vector<std::string>& raw,
                                    IdentifierSet& out) {
    std::vector<SqlidError> errors;
    for (const auto& name : raw) {
        auto st = out.insert(name);
        if (st.is_err()) {
            log::debug("rejected '%s': %s", name.c_str(),
                       SqlidError::code_name(st.error().code));
            errors.push_back(std::move(st).error());
            continue;
        }
        log::debug("accepted '%s' as %s", name.c_str(),
                   out.find(name)->debug_string().c_str());
    }
    return errors;
}

} // namespace sqlid
