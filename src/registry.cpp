#include "richenum/registry.hpp"

#include <algorithm>
#include <limits>
#include <new>
#include <utility>

#include "richenum/config.hpp"
#include "richenum/lookup.hpp"
#include "lcr/log/logger.hpp"


namespace richenum {

Registry::Registry(std::string type_name)
    : type_name_(std::move(type_name))
    , max_value_(config::AUTO_NUMBER_FLOOR)
    , max_index_(config::AUTO_NUMBER_FLOOR)
{
    items_.reserve(config::REGISTRY_RESERVE);
    used_values_.reserve(config::REGISTRY_RESERVE);
    used_indices_.reserve(config::REGISTRY_RESERVE);
}

// ============================================================================
// Construction protocol
// ============================================================================

void Registry::add(Member& m, const Definition& def) {
    std::optional<error> failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure = add_locked_(m, def);
    }
    if (failure) {
        RE_ERROR("[REGISTRY] " << type_name_ << ": cannot register '" << def.text << "': "
                 << to_string(failure->code()) << " (" << failure->what() << ")");
        throw *failure;
    }
    // Fields are immutable from here on (reinitialize aside)
    RE_DEBUG("[REGISTRY] " << type_name_ << ": registered '" << m.text_ << "' (value=" << m.value_
             << ", index=" << m.index_ << ", oid=" << oid::to_string(m.oid_)
             << ", visible=" << (m.is_visible_ ? "true" : "false") << ")");
}

std::optional<error> Registry::add_locked_(Member& m, const Definition& def) {
    // 1) explicit value must be free
    if (def.value && used_values_.contains(*def.value)) {
        return error(error_code::duplicate_value,
                     "value " + std::to_string(*def.value) + " is already used in " + type_name_);
    }
    // 2) explicit index must be free
    if (def.index && used_indices_.contains(*def.index)) {
        return error(error_code::duplicate_index,
                     "index " + std::to_string(*def.index) + " is already used in " + type_name_);
    }
    // 3) auto value
    std::int32_t value;
    if (def.value) {
        value = *def.value;
    } else if (!next_free_(used_values_, max_value_, value)) {
        return error(error_code::exhausted_value_space, "no free value left in " + type_name_);
    }
    // 4) auto index
    std::int32_t index;
    if (def.index) {
        index = *def.index;
    } else if (!next_free_(used_indices_, max_index_, index)) {
        return error(error_code::exhausted_index_space, "no free index left in " + type_name_);
    }
    // 5) oid
    const Oid id = def.oid ? *def.oid : oid::generate();

    // 6) commit: everything that can throw happens before the first mutation
    //    of visible state, or is rolled back
    std::string text = def.text;
    items_.reserve(items_.size() + 1);
    used_values_.insert(value);
    try {
        used_indices_.insert(index);
    } catch (const std::bad_alloc&) {
        used_values_.erase(value);
        throw;
    }
    m.text_       = std::move(text);
    m.value_      = value;
    m.index_      = index;
    m.oid_        = id;
    m.is_visible_ = def.is_visible;
    items_.push_back(&m);     // capacity reserved above: cannot throw
    max_value_ = std::max(max_value_, value);
    max_index_ = std::max(max_index_, index);
    return std::nullopt;
}

bool Registry::next_free_(const std::unordered_set<std::int32_t>& used, std::int32_t max, std::int32_t& out) noexcept {
    constexpr std::int64_t limit = std::numeric_limits<std::int32_t>::max();
    std::int64_t candidate = static_cast<std::int64_t>(max) + 1;
    while (candidate <= limit && used.contains(static_cast<std::int32_t>(candidate))) {
        ++candidate;
    }
    if (candidate > limit) {
        return false;
    }
    out = static_cast<std::int32_t>(candidate);
    return true;
}

void Registry::withdraw(const Member& m) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(items_.begin(), items_.end(), &m);
    if (it == items_.end()) {
        return;
    }
    used_values_.erase(m.value_);
    used_indices_.erase(m.index_);
    items_.erase(it);
    if (default_ == &m) {
        default_ = nullptr;
    }
    // maxima track the members still registered
    max_value_ = config::AUTO_NUMBER_FLOOR;
    max_index_ = config::AUTO_NUMBER_FLOOR;
    for (const Member* other : items_) {
        max_value_ = std::max(max_value_, other->value_);
        max_index_ = std::max(max_index_, other->index_);
    }
}

void Registry::reinitialize(const Member& m, std::string_view new_text, std::optional<std::int32_t> new_value) {
    std::optional<error> failure;
    std::string final_text;
    std::int32_t final_value = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(items_.begin(), items_.end(), &m);
        if (it == items_.end()) {
            failure.emplace(error_code::not_found, "member is not registered in " + type_name_);
        } else {
            Member& target = **it;
            if (new_value && *new_value != target.value_ && used_values_.contains(*new_value)) {
                failure.emplace(error_code::duplicate_value,
                                "value " + std::to_string(*new_value) + " is already used in " + type_name_);
            } else {
                std::string text(new_text);
                if (new_value && *new_value != target.value_) {
                    used_values_.insert(*new_value);
                    used_values_.erase(target.value_);
                    target.value_ = *new_value;
                    max_value_ = std::max(max_value_, *new_value);
                }
                if (!text.empty()) {
                    target.text_ = std::move(text);
                }
                final_text  = target.text_;
                final_value = target.value_;
            }
        }
    }
    if (failure) {
        RE_ERROR("[REGISTRY] " << type_name_ << ": reinitialize rejected: " << failure->what());
        throw *failure;
    }
    RE_WARN("[REGISTRY] " << type_name_ << ": member reinitialized to '" << final_text << "' (value=" << final_value << ")");
}

// ============================================================================
// Default member
// ============================================================================

void Registry::set_default(const Member& m) {
    bool already_set = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (default_ != nullptr) {
            already_set = true;
        } else {
            default_ = &m;
        }
    }
    if (already_set) {
        RE_ERROR("[REGISTRY] " << type_name_ << ": default member designated twice");
        throw error(error_code::default_already_set, "default member of " + type_name_ + " is already set");
    }
}

const Member* Registry::default_member() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_;
}

// ============================================================================
// Reads
// ============================================================================

std::vector<const Member*> Registry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<const Member*>(items_.begin(), items_.end());
}

const Member* Registry::find_by_oid(const Oid& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup::by_oid(items_, id);
}

const Member* Registry::find_by_value(std::int32_t value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup::by_value(items_, value);
}

const Member* Registry::find_by_text(std::string_view label, TextComparison mode) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup::by_text(items_, label, mode);
}

const Member* Registry::parse(std::string_view input, TextComparison mode) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup::parse(items_, input, mode);
}

std::vector<EnumEntry> Registry::clones() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EnumEntry> out;
    out.reserve(items_.size());
    for (const Member* m : items_) {
        out.push_back(m->clone());
    }
    return out;
}

std::size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

} // namespace richenum
