#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <typeinfo>
#include <vector>

#include <boost/core/demangle.hpp>

#include "richenum/codec.hpp"
#include "richenum/definition.hpp"
#include "richenum/entry.hpp"
#include "richenum/error.hpp"
#include "richenum/flags.hpp"
#include "richenum/member.hpp"
#include "richenum/oid.hpp"
#include "richenum/registry.hpp"
#include "richenum/text.hpp"


namespace richenum {

/*
===============================================================================
richenum::EnumBase<T>
===============================================================================

CRTP base of a smart enumeration type T. T declares its members as fields
of a nested `Members` structure, defined after T itself:

    class OrderStatus final : public richenum::EnumBase<OrderStatus> {
    public:
        struct Members;
        static const OrderStatus& Pending();
        static const OrderStatus& Shipped();
    private:
        explicit OrderStatus(const richenum::Definition& def) : EnumBase(def) {}
    };

    struct OrderStatus::Members {
        OrderStatus pending{{.text = "Pending"}};
        OrderStatus shipped{{.text = "Shipped", .value = 42}};
        Members() { set_default(pending); }
    };

    inline const OrderStatus& OrderStatus::Pending() { return members().pending; }
    inline const OrderStatus& OrderStatus::Shipped() { return members().shipped; }

Initialization:
  • members() owns the one and only T::Members instance (function-local
    static), so the members are constructed exactly once, in declaration
    order, on first use of the type
  • Every static read below calls members() first; concurrent first users
    block until construction has finished and never see a partial registry
  • A construction failure (duplicate or exhausted number) propagates out of
    the first use and the members built so far withdraw themselves

type_name() is the demangled C++ name of T ("app::OrderStatus").

Lookups come in two flavours:
  • strict  (find, from_value, from_text)  throw richenum::error
  • try_*                                   return false and set out = nullptr
===============================================================================
*/
template <typename T>
class EnumBase : public Member {
public:
    // ---------------------------------------------------------------------
    // Lookup by oid
    // ---------------------------------------------------------------------
    [[nodiscard]] static const T& find(const Oid& id) {
        if (const Member* m = registry().find_by_oid(id)) {
            return downcast_(m);
        }
        throw error(error_code::not_found, oid::to_string(id) + " is not a member of " + type_name());
    }

    // invalid_argument for a malformed literal
    [[nodiscard]] static const T& find(std::string_view oid_literal) {
        return find(oid::parse(oid_literal));
    }

    [[nodiscard]] static bool try_find(const Oid& id, const T*& out) {
        return resolve_(registry().find_by_oid(id), out);
    }

    // ---------------------------------------------------------------------
    // Lookup by value
    // ---------------------------------------------------------------------
    [[nodiscard]] static const T& from_value(std::int32_t value) {
        if (const Member* m = registry().find_by_value(value)) {
            return downcast_(m);
        }
        throw error(error_code::not_found, std::to_string(value) + " is not a value of " + type_name());
    }

    [[nodiscard]] static bool try_from_value(std::int32_t value, const T*& out) {
        return resolve_(registry().find_by_value(value), out);
    }

    // ---------------------------------------------------------------------
    // Lookup by text
    // ---------------------------------------------------------------------

    // Ordinal by default. invalid_argument for blank text.
    [[nodiscard]] static const T& from_text(std::string_view label, TextComparison mode = TextComparison::Ordinal) {
        if (text::is_blank(label)) {
            throw error(error_code::invalid_argument, "text cannot be empty");
        }
        if (const Member* m = registry().find_by_text(label, mode)) {
            return downcast_(m);
        }
        throw error(error_code::not_found, "'" + std::string(label) + "' is not a text of " + type_name());
    }

    // Case-insensitive by default
    [[nodiscard]] static bool try_from_text(std::string_view label, const T*& out, TextComparison mode = TextComparison::IgnoreCase) {
        return resolve_(registry().find_by_text(label, mode), out);
    }

    // oid literal, then integer value, then text (see lookup.hpp)
    [[nodiscard]] static bool try_parse(std::string_view input, const T*& out, TextComparison mode = TextComparison::IgnoreCase) {
        if (text::is_blank(input)) {
            out = nullptr;
            return false;
        }
        return resolve_(registry().parse(input, mode), out);
    }

    // ---------------------------------------------------------------------
    // Snapshots (a fresh copy on every call)
    // ---------------------------------------------------------------------

    // Registration order
    [[nodiscard]] static std::vector<const T*> entries() {
        return downcast_all_(registry().snapshot());
    }

    // Ascending index
    [[nodiscard]] static std::vector<const T*> sorted_entries() {
        auto items = entries();
        sort_by_index_(items);
        return items;
    }

    // Visible members only, ascending index
    [[nodiscard]] static std::vector<const T*> sorted_visible_entries() {
        auto items = entries();
        std::erase_if(items, [](const T* m) { return !m->is_visible(); });
        sort_by_index_(items);
        return items;
    }

    // Detached copies, registration order
    [[nodiscard]] static std::vector<EnumEntry> cloned_entries() {
        return registry().clones();
    }

    [[nodiscard]] static std::size_t size() {
        return registry().size();
    }

    // ---------------------------------------------------------------------
    // Default member
    // ---------------------------------------------------------------------

    // nullptr when the type designates none
    [[nodiscard]] static const T* get_default() {
        const Member* m = registry().default_member();
        return m ? &downcast_(m) : nullptr;
    }

    [[nodiscard]] bool is_default() const {
        return get_default() == static_cast<const T*>(this);
    }

    // ---------------------------------------------------------------------
    // Flags
    // ---------------------------------------------------------------------
    [[nodiscard]] bool has_flag(const T* flag) const noexcept {
        return flags::has_flag(self_(), flag);
    }

    [[nodiscard]] bool has_flag(const T& flag) const noexcept {
        return flags::has_flag(self_(), &flag);
    }

    [[nodiscard]] bool shares_bit(const T& other) const noexcept {
        return flags::shares_bit(self_(), &other);
    }

    // ---------------------------------------------------------------------
    // Initialization-time escape hatch
    // ---------------------------------------------------------------------

    // Overwrites text (if non-empty) and/or value. Rejects a value already
    // used by another member (duplicate_value). The lookups, cloned_entries()
    // and to_json() are synchronized with it. Reading the member's fields
    // directly (text(), value(), operator==) while it runs is a data race
    // and undefined behaviour.
    static void reinitialize(const T& member, std::string_view new_text, std::optional<std::int32_t> new_value) {
        registry().reinitialize(member, new_text, new_value);
    }

    // ---------------------------------------------------------------------
    // JSON
    // ---------------------------------------------------------------------
    static void to_json(std::ostream& os) {
        codec::write(os, cloned_entries());
    }

    static void to_json(const std::filesystem::path& file) {
        codec::write_file(file, cloned_entries());
    }

    [[nodiscard]] static std::vector<EnumEntry> from_json(std::istream& is) {
        return codec::read(is);
    }

    [[nodiscard]] static std::vector<EnumEntry> from_json(const std::filesystem::path& file) {
        return codec::read_file(file);
    }

    // ---------------------------------------------------------------------
    // Identity
    // ---------------------------------------------------------------------
    [[nodiscard]] static const std::string& type_name() {
        return storage_().type_name();
    }

    friend bool operator==(const T& a, const T& b) noexcept {
        return a.value() == b.value();
    }

protected:
    explicit EnumBase(const Definition& def) {
        storage_().add(*this, def);
    }

    ~EnumBase() override {
        storage_().withdraw(*this);
    }

    // The single T::Members instance. Not const: reinitialize() writes
    // through the registry's pointers. Deduced return type: T is still
    // incomplete where EnumBase<T> is instantiated.
    [[nodiscard]] static const auto& members() {
        static typename T::Members instance;
        return instance;
    }

    // Call once, from the T::Members constructor
    static void set_default(const T& member) {
        storage_().set_default(member);
    }

private:
    // Raw registry access, used by the constructor itself
    [[nodiscard]] static Registry& storage_() {
        static Registry instance{boost::core::demangle(typeid(T).name())};
        return instance;
    }

    // Registry access for readers: forces member construction first
    [[nodiscard]] static Registry& registry() {
        (void)members();
        return storage_();
    }

    [[nodiscard]] const T* self_() const noexcept {
        return static_cast<const T*>(this);
    }

    [[nodiscard]] static const T& downcast_(const Member* m) noexcept {
        return *static_cast<const T*>(static_cast<const EnumBase*>(m));
    }

    [[nodiscard]] static bool resolve_(const Member* m, const T*& out) noexcept {
        out = m ? &downcast_(m) : nullptr;
        return out != nullptr;
    }

    [[nodiscard]] static std::vector<const T*> downcast_all_(const std::vector<const Member*>& items) {
        std::vector<const T*> out;
        out.reserve(items.size());
        for (const Member* m : items) {
            out.push_back(&downcast_(m));
        }
        return out;
    }

    static void sort_by_index_(std::vector<const T*>& items) {
        std::sort(items.begin(), items.end(), [](const T* a, const T* b) { return a->index() < b->index(); });
    }
};

} // namespace richenum
