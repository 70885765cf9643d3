/*
===============================================================================
 domain::KitchenBoard - Unit Tests
===============================================================================

Covered:
K1 New orders go to the front; duplicates by id or order number rejected
K2 Status and item status updates
K3 Completion moves the order, completed list bounded to 50
K4 Snapshot replaces the active set
K5 remove_order / clear

===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "tablesync/domain/kitchen_board.hpp"
#include "common/test_check.hpp"

using tablesync::domain::KitchenBoard;
using KitchenOrder = KitchenBoard::KitchenOrder;

static KitchenOrder make_order(const std::string& id, const std::string& number) {
    KitchenOrder ko;
    ko.id = id;
    ko.order_number = number;
    ko.status = "pending";
    ko.items.push_back({"i1", "Momo", 1, "pending"});
    ko.items.push_back({"i2", "Lassi", 2, "pending"});
    return ko;
}


void test_add_and_duplicates() {
    std::cout << "[TEST] K1 New orders prepended, duplicates rejected\n";
    KitchenBoard board;

    TEST_CHECK(board.add_order(make_order("o1", "A-1")));
    TEST_CHECK(board.add_order(make_order("o2", "A-2")));
    TEST_CHECK(board.active().front().id == "o2");

    TEST_CHECK(!board.add_order(make_order("o1", "A-9")));   // same id
    TEST_CHECK(!board.add_order(make_order("o3", "A-2")));   // same order number
    TEST_CHECK(board.active_count() == 2);

    // Empty order numbers never collide
    TEST_CHECK(board.add_order(make_order("o4", "")));
    TEST_CHECK(board.add_order(make_order("o5", "")));
    TEST_CHECK(board.active_count() == 4);

    std::cout << "[TEST] OK\n";
}

void test_status_updates() {
    std::cout << "[TEST] K2 Status and item status updates\n";
    KitchenBoard board;
    TEST_CHECK(board.add_order(make_order("o1", "A-1")));

    TEST_CHECK(board.update_status("o1", "preparing"));
    TEST_CHECK(board.find("o1")->status == "preparing");
    TEST_CHECK(!board.update_status("missing", "preparing"));

    TEST_CHECK(board.update_item_status("o1", "i2", "ready"));
    TEST_CHECK(board.find("o1")->items[1].status == "ready");
    TEST_CHECK(board.find("o1")->items[0].status == "pending");
    TEST_CHECK(!board.update_item_status("o1", "i9", "ready"));
    TEST_CHECK(!board.update_item_status("o9", "i1", "ready"));

    std::cout << "[TEST] OK\n";
}

void test_completion_bounded() {
    std::cout << "[TEST] K3 Completion bounded to 50\n";
    KitchenBoard board;

    for (int i = 0; i < 60; ++i) {
        const std::string id = "o" + std::to_string(i);
        TEST_CHECK(board.add_order(make_order(id, "N-" + std::to_string(i))));
        TEST_CHECK(board.move_to_completed(id));
    }
    TEST_CHECK(board.active_count() == 0);
    TEST_CHECK(board.completed_count() == KitchenBoard::COMPLETED_CAPACITY);
    TEST_CHECK(board.completed().front().id == "o59");
    TEST_CHECK(board.completed().back().id == "o10");
    TEST_CHECK(board.completed().front().status == "completed");

    TEST_CHECK(!board.move_to_completed("o59"));   // no longer active

    std::cout << "[TEST] OK\n";
}

void test_snapshot_replaces() {
    std::cout << "[TEST] K4 Snapshot replaces the active set\n";
    KitchenBoard board;
    TEST_CHECK(board.add_order(make_order("old", "X-1")));

    board.set_active_orders({make_order("s1", "S-1"), make_order("s2", "S-2")});
    TEST_CHECK(board.active_count() == 2);
    TEST_CHECK(board.find("old") == nullptr);
    TEST_CHECK(board.active().front().id == "s1");

    board.set_active_orders({});
    TEST_CHECK(board.active_count() == 0);

    std::cout << "[TEST] OK\n";
}

void test_remove_and_clear() {
    std::cout << "[TEST] K5 remove_order / clear\n";
    KitchenBoard board;
    TEST_CHECK(board.add_order(make_order("o1", "A-1")));
    TEST_CHECK(board.add_order(make_order("o2", "A-2")));
    TEST_CHECK(board.move_to_completed("o2"));

    TEST_CHECK(board.remove_order("o1"));
    TEST_CHECK(!board.remove_order("o1"));
    TEST_CHECK(board.active_count() == 0);
    TEST_CHECK(board.completed_count() == 1);

    board.clear();
    TEST_CHECK(board.completed_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    test_add_and_duplicates();
    test_status_updates();
    test_completion_bounded();
    test_snapshot_replaces();
    test_remove_and_clear();

    std::cout << "\n[KITCHEN BOARD TESTS PASSED]\n";
    return 0;
}
