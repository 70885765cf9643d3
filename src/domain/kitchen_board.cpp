#include "tablesync/domain/kitchen_board.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "lcr/log/logger.hpp"


namespace tablesync::domain {

bool KitchenBoard::add_order(const KitchenOrder& order) {
    const bool exists = std::any_of(active_.begin(), active_.end(), [&](const KitchenOrder& o) {
        return o.id == order.id || (!order.order_number.empty() && o.order_number == order.order_number);
    });
    if (exists) {
        TS_DEBUG("[BOARD] Skipping duplicate order: " << order.order_number << " (id " << order.id << ")");
        return false;
    }
    active_.push_front(order);
    return true;
}

void KitchenBoard::set_active_orders(std::vector<KitchenOrder> orders) {
    active_.assign(std::make_move_iterator(orders.begin()), std::make_move_iterator(orders.end()));
}

bool KitchenBoard::update_status(std::string_view order_id, std::string_view status) {
    auto it = find_(order_id);
    if (it == active_.end()) {
        return false;
    }
    it->status.assign(status.data(), status.size());
    return true;
}

bool KitchenBoard::move_to_completed(std::string_view order_id) {
    auto it = find_(order_id);
    if (it == active_.end()) {
        return false;
    }
    KitchenOrder order = std::move(*it);
    active_.erase(it);
    order.status = "completed";
    completed_.push_front(std::move(order));
    while (completed_.size() > COMPLETED_CAPACITY) {
        completed_.pop_back();
    }
    return true;
}

bool KitchenBoard::update_item_status(std::string_view order_id, std::string_view item_id, std::string_view status) {
    auto it = find_(order_id);
    if (it == active_.end()) {
        return false;
    }
    for (auto& item : it->items) {
        if (item.id == item_id) {
            item.status.assign(status.data(), status.size());
            return true;
        }
    }
    return false;
}

bool KitchenBoard::remove_order(std::string_view order_id) {
    auto it = find_(order_id);
    if (it == active_.end()) {
        return false;
    }
    active_.erase(it);
    return true;
}

void KitchenBoard::clear() noexcept {
    active_.clear();
    completed_.clear();
}

const KitchenBoard::KitchenOrder* KitchenBoard::find(std::string_view order_id) const noexcept {
    auto it = std::find_if(active_.begin(), active_.end(), [&](const KitchenOrder& o) { return o.id == order_id; });
    return it == active_.end() ? nullptr : &*it;
}

std::deque<KitchenBoard::KitchenOrder>::iterator KitchenBoard::find_(std::string_view order_id) noexcept {
    return std::find_if(active_.begin(), active_.end(), [&](const KitchenOrder& o) { return o.id == order_id; });
}

} // namespace tablesync::domain
