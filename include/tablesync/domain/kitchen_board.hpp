#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

#include "tablesync/core/protocol/schema/order.hpp"


namespace tablesync::domain {

/*
===============================================================================
 tablesync::domain::KitchenBoard
===============================================================================

In-memory board of kitchen orders as shown on kitchen and bar displays.

  • active orders, newest first
  • completed orders, newest first, bounded to COMPLETED_CAPACITY

Orders are matched by kitchen order id. The stored `raw` JSON is the order
as received; field updates apply to the typed fields only.
===============================================================================
*/
class KitchenBoard {
public:
    using KitchenOrder = core::protocol::schema::order::KitchenOrder;

    static constexpr std::size_t COMPLETED_CAPACITY = 50;

    // Prepends the order. Returns false (no change) if an active order with
    // the same id or order number exists.
    bool add_order(const KitchenOrder& order);

    // Replaces the active set (snapshot from the relay)
    void set_active_orders(std::vector<KitchenOrder> orders);

    // Returns false if the order is not active
    bool update_status(std::string_view order_id, std::string_view status);

    // Moves an active order to the completed list. Returns false if absent.
    bool move_to_completed(std::string_view order_id);

    // Returns false if the order or the item is not found
    bool update_item_status(std::string_view order_id, std::string_view item_id, std::string_view status);

    // Removes an active order without completing it
    bool remove_order(std::string_view order_id);

    void clear() noexcept;

    [[nodiscard]] const KitchenOrder* find(std::string_view order_id) const noexcept;

    [[nodiscard]] inline const std::deque<KitchenOrder>& active() const noexcept { return active_; }
    [[nodiscard]] inline const std::deque<KitchenOrder>& completed() const noexcept { return completed_; }

    [[nodiscard]] inline std::size_t active_count() const noexcept { return active_.size(); }
    [[nodiscard]] inline std::size_t completed_count() const noexcept { return completed_.size(); }

private:
    std::deque<KitchenOrder>::iterator find_(std::string_view order_id) noexcept;

    std::deque<KitchenOrder> active_;
    std::deque<KitchenOrder> completed_;
};

} // namespace tablesync::domain
