/*
===============================================================================
 richenum::EnumBase — Ordering & Snapshot Tests
===============================================================================

Scope:
------
These tests validate the views a type exposes over its members.

Covered Requirements:
---------------------
S1. entries() in registration order
S2. sorted_entries() ascending by index
S3. sorted_visible_entries() filters hidden members
S4. cloned_entries() are detached copies
S5. Every call returns a fresh sequence

===============================================================================
*/

#include <iostream>
#include <sstream>
#include <vector>

#include "richenum/enum_base.hpp"
#include "common/test_check.hpp"
#include "common/mocks/mock_auto.hpp"
#include "common/mocks/mock_indexed.hpp"

using namespace richenum;
using namespace richenum::test;


// -----------------------------------------------------------------------------
// S1. Registration order
// -----------------------------------------------------------------------------
void test_entries_registration_order() {
    std::cout << "[TEST] Group S1: entries() in registration order\n";

    const auto items = MockIndexed::entries();
    TEST_CHECK(items.size() == 4);
    TEST_CHECK(items[0] == &MockIndexed::Entry1());
    TEST_CHECK(items[1] == &MockIndexed::Entry2());
    TEST_CHECK(items[2] == &MockIndexed::Entry3());
    TEST_CHECK(items[3] == &MockIndexed::Entry4());

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S2. Sorted by index
// -----------------------------------------------------------------------------
void test_sorted_entries() {
    std::cout << "[TEST] Group S2: sorted_entries() ascending by index\n";

    const auto sorted = MockIndexed::sorted_entries();
    TEST_CHECK(sorted.size() == 4);
    TEST_CHECK(sorted[0]->text() == "Entry3");
    TEST_CHECK(sorted[1]->text() == "Entry1");
    TEST_CHECK(sorted[2]->text() == "Entry2");
    TEST_CHECK(sorted[3]->text() == "Entry4");

    for (std::size_t i = 1; i < sorted.size(); ++i) {
        TEST_CHECK(sorted[i - 1]->index() < sorted[i]->index());
    }

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S3. Visible only
// -----------------------------------------------------------------------------
void test_sorted_visible_entries() {
    std::cout << "[TEST] Group S3: sorted_visible_entries() drops hidden members\n";

    const auto visible = MockIndexed::sorted_visible_entries();
    TEST_CHECK(visible.size() == 2);
    TEST_CHECK(visible[0] == &MockIndexed::Entry2());
    TEST_CHECK(visible[1] == &MockIndexed::Entry4());

    // nothing hidden: same as the full list
    TEST_CHECK(MockAuto::sorted_visible_entries().size() == MockAuto::cloned_entries().size());

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S4. Clones
// -----------------------------------------------------------------------------
void test_cloned_entries() {
    std::cout << "[TEST] Group S4: cloned_entries() are detached copies\n";

    auto clones = MockIndexed::cloned_entries();
    TEST_CHECK(clones.size() == 4);

    const MockIndexed& e1 = MockIndexed::Entry1();
    TEST_CHECK(clones[0].text == e1.text());
    TEST_CHECK(clones[0].value == e1.value());
    TEST_CHECK(clones[0].index == e1.index());
    TEST_CHECK(clones[0].oid == e1.oid());
    TEST_CHECK(clones[0].is_visible == e1.is_visible());
    TEST_CHECK(clones[0] == e1.clone());
    TEST_CHECK(clones[0].to_string() == "Entry1");

    // mutating a clone leaves the member alone
    clones[0].text = "Changed";
    clones[0].value = 12345;
    TEST_CHECK(e1.text() == "Entry1");
    TEST_CHECK(MockIndexed::cloned_entries()[0].text == "Entry1");

    std::ostringstream os;
    os << MockIndexed::cloned_entries()[1];
    TEST_CHECK(os.str().find("text=Entry2") != std::string::npos);
    TEST_CHECK(os.str().find("index=4") != std::string::npos);
    TEST_CHECK(os.str().find("visible=true") != std::string::npos);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// S5. Fresh snapshots
// -----------------------------------------------------------------------------
void test_snapshot_isolation() {
    std::cout << "[TEST] Group S5: each call returns a fresh sequence\n";

    auto first = MockAuto::entries();
    first.clear();
    TEST_CHECK(MockAuto::entries().size() == 3);

    auto sorted = MockAuto::sorted_entries();
    sorted.pop_back();
    TEST_CHECK(MockAuto::sorted_entries().size() == 3);
    TEST_CHECK(MockAuto::size() == 3);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_entries_registration_order();
    test_sorted_entries();
    test_sorted_visible_entries();
    test_cloned_entries();
    test_snapshot_isolation();

    std::cout << "\n[GROUP S] All snapshot tests passed!\n";
    return 0;
}
