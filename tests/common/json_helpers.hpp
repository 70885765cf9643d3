#pragma once

#include <cstdint>
#include <string>

// ----------------------------------------------------------------------------
// Inbound frames as produced by the relay and by peer terminals
// ----------------------------------------------------------------------------

namespace json::frame {

static std::string kitchen_order(const std::string& id, const std::string& number, std::int64_t table = 5) {
    return R"({"id":")" + id + R"(","orderNumber":")" + number +
           R"(","orderType":"dine_in","status":"pending","tableNumber":)" + std::to_string(table) +
           R"(,"items":[{"id":"i1","name":"Dal Bhat","quantity":2,"status":"pending"}]})";
}

static std::string order_created(const std::string& id, const std::string& number = "A-1") {
    return R"({"type":"order_created","order":{"orderId":")" + id +
           R"(","total":12.5},"kitchenOrder":)" + kitchen_order(id, number) + "}";
}

static std::string qr_order_created(const std::string& id, const std::string& number = "Q-1") {
    return R"({"type":"qr_order_created","order":{"orderId":")" + id +
           R"("},"tableInfo":{"tableId":"t5","tableNumber":5,"sectionName":"Patio"},"kitchenOrder":)" +
           kitchen_order(id, number) + "}";
}

static std::string status_update(const std::string& id, const std::string& status) {
    return R"({"type":"order_status_update","orderId":")" + id + R"(","status":")" + status + R"("})";
}

static std::string sync_state(const std::string& id_a, const std::string& id_b) {
    return R"({"type":"sync_state","activeOrders":[)" + kitchen_order(id_a, "S-1") + "," +
           kitchen_order(id_b, "S-2") + "]}";
}

static std::string pong() {
    return R"({"type":"pong"})";
}

} // namespace json::frame
