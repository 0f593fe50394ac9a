#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "richenum/definition.hpp"
#include "richenum/entry.hpp"
#include "richenum/error.hpp"
#include "richenum/member.hpp"
#include "richenum/oid.hpp"
#include "richenum/text.hpp"


namespace richenum {

/*
===============================================================================
richenum::Registry
===============================================================================

Process-wide state of ONE enumeration type: registered members in
registration order, used value/index sets, running maxima for
auto-numbering, and the default member.

Concurrency model:
  • One mutex guards every mutation and every bulk copy
  • Auto-numbering ("read max, scan for a free number, reserve") runs inside
    the same critical section as the registration itself
  • Lookups and clones read member fields under the lock, so they never
    observe a half-applied reinitialize()
  • snapshot() hands out bare pointers: reading a member's fields through
    them while reinitialize() runs on that member is a data race (undefined
    behaviour)
  • Nothing is logged while the lock is held

Failure model:
  • add() either registers the member completely or throws richenum::error
    and leaves the registry untouched
  • withdraw() is called from a member's destructor (failed type
    initialization or process teardown). The running maxima are recomputed
    from the members left, so a retried initialization numbers its members
    exactly as the first attempt did

Member objects are owned by the enumeration type, never by the registry.
===============================================================================
*/
class Registry {
public:
    explicit Registry(std::string type_name);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ---------------------------------------------------------------------
    // Construction protocol
    // ---------------------------------------------------------------------

    // Validates/assigns value, index and oid of m from def and appends m.
    // Throws duplicate_value, duplicate_index, exhausted_value_space or
    // exhausted_index_space.
    void add(Member& m, const Definition& def);

    // Removes m if it is registered (no-op otherwise)
    void withdraw(const Member& m) noexcept;

    // Overwrites text (when non-empty) and/or value of a registered member.
    // The new value is checked against the used values (duplicate_value).
    // Throws not_found if m is not registered here.
    void reinitialize(const Member& m, std::string_view new_text, std::optional<std::int32_t> new_value);

    // ---------------------------------------------------------------------
    // Default member (settable once)
    // ---------------------------------------------------------------------
    void set_default(const Member& m);
    [[nodiscard]] const Member* default_member() const;

    // ---------------------------------------------------------------------
    // Reads
    // ---------------------------------------------------------------------

    // Registration-order copy of the member pointers
    [[nodiscard]] std::vector<const Member*> snapshot() const;

    // Scans of lookup.hpp, run under the lock. nullptr when nothing matches.
    [[nodiscard]] const Member* find_by_oid(const Oid& id) const;
    [[nodiscard]] const Member* find_by_value(std::int32_t value) const;
    [[nodiscard]] const Member* find_by_text(std::string_view label, TextComparison mode) const;
    [[nodiscard]] const Member* parse(std::string_view input, TextComparison mode) const;

    // Detached copies, registration order
    [[nodiscard]] std::vector<EnumEntry> clones() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    // Smallest free number above max, or false when INT32_MAX is passed
    [[nodiscard]] static bool next_free_(const std::unordered_set<std::int32_t>& used, std::int32_t max, std::int32_t& out) noexcept;

    [[nodiscard]] std::optional<error> add_locked_(Member& m, const Definition& def);

private:
    const std::string type_name_;

    mutable std::mutex mutex_;
    std::vector<Member*> items_;
    std::unordered_set<std::int32_t> used_values_;
    std::unordered_set<std::int32_t> used_indices_;
    std::int32_t max_value_;
    std::int32_t max_index_;
    const Member* default_{nullptr};
};

} // namespace richenum
