/*
===============================================================================
 richenum::EnumBase::reinitialize — Tests
===============================================================================

Scope:
------
These tests validate the initialization-time override of a member's text
and value.

Covered Requirements:
---------------------
R1. Text and value replaced, lookups follow
R2. Empty text keeps the current text, absent value keeps the value
R3. A value used by another member is rejected, nothing changes
R4. Auto-numbering continues above a raised value
R5. A member unknown to the registry is rejected

===============================================================================
*/

#include <iostream>
#include <optional>

#include "richenum/enum_base.hpp"
#include "common/test_check.hpp"
#include "common/mocks/mock_auto.hpp"

using namespace richenum;
using namespace richenum::test;

namespace {

struct BareMember final : Member {};

} // namespace


// -----------------------------------------------------------------------------
// R1. Replace text and value
// -----------------------------------------------------------------------------
void test_replace_text_and_value() {
    std::cout << "[TEST] Group R1: text and value replaced\n";

    const auto& sut = MockAuto::Entry1();
    const auto old_value = sut.value();

    MockAuto::reinitialize(sut, "Renamed", 987654321);

    TEST_CHECK(sut.text() == "Renamed");
    TEST_CHECK(sut.value() == 987654321);
    TEST_CHECK(&MockAuto::from_value(987654321) == &sut);
    TEST_CHECK(&MockAuto::from_text("Renamed") == &sut);

    // the old value is free again
    const MockAuto* out = nullptr;
    TEST_CHECK(!MockAuto::try_from_value(old_value, out));

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// R2. Partial updates
// -----------------------------------------------------------------------------
void test_partial_update() {
    std::cout << "[TEST] Group R2: partial updates\n";

    const auto& sut = MockAuto::Entry2();
    const auto value = sut.value();

    MockAuto::reinitialize(sut, "", std::nullopt);
    TEST_CHECK(sut.text() == "Entry2");
    TEST_CHECK(sut.value() == value);

    MockAuto::reinitialize(sut, "Second", std::nullopt);
    TEST_CHECK(sut.text() == "Second");
    TEST_CHECK(sut.value() == value);

    // same value again is not a collision with itself
    MockAuto::reinitialize(sut, "", value);
    TEST_CHECK(sut.value() == value);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// R3. Collisions
// -----------------------------------------------------------------------------
void test_collision_rejected() {
    std::cout << "[TEST] Group R3: colliding value rejected\n";

    const auto& sut = MockAuto::Entry3();
    const auto taken = MockAuto::Entry2().value();
    const auto text = sut.text();
    const auto value = sut.value();

    TEST_CHECK_THROWS(MockAuto::reinitialize(sut, "Clash", taken), error_code::duplicate_value);
    TEST_CHECK(sut.text() == text);
    TEST_CHECK(sut.value() == value);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// R4. Auto-numbering after a raised value
// -----------------------------------------------------------------------------
void test_auto_numbering_after_raise() {
    std::cout << "[TEST] Group R4: auto-numbering continues above raised value\n";

    Registry reg{"raise"};
    BareMember a, b;
    reg.add(a, {.text = "a"});
    reg.reinitialize(a, "", 1000);
    reg.add(b, {.text = "b"});
    TEST_CHECK(b.value() == 1001);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// R5. Unknown member
// -----------------------------------------------------------------------------
void test_unknown_member() {
    std::cout << "[TEST] Group R5: unregistered member rejected\n";

    Registry reg{"unknown"};
    BareMember stray;
    TEST_CHECK_THROWS(reg.reinitialize(stray, "x", 1), error_code::not_found);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_replace_text_and_value();
    test_partial_update();
    test_collision_rejected();
    test_auto_numbering_after_raise();
    test_unknown_member();

    std::cout << "\n[GROUP R] All reinitialize tests passed!\n";
    return 0;
}
