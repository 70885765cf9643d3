#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include "lcr/log/logger.hpp"


namespace lcr::event {

/*
===============================================================================
 lcr::event::emitter<Args...>
===============================================================================

Typed multi-subscriber event channel.

- subscribe() returns a token usable with unsubscribe()
- emit() invokes every handler registered at the time of the call, in
  subscription order
- Handlers may subscribe / unsubscribe from inside emit(); changes apply to
  the next emit()
- A handler throwing std::exception is logged and does not stop delivery
  to the remaining handlers

Single-threaded. Owners serialize access.
===============================================================================
*/

using Token = std::uint64_t;

template <typename... Args>
class emitter {
public:
    using Handler = std::function<void(Args...)>;

    [[nodiscard]]
    inline Token subscribe(Handler handler) {
        const Token token = ++next_token_;
        handlers_.push_back(Slot{token, std::move(handler)});
        return token;
    }

    inline bool unsubscribe(Token token) noexcept {
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->token == token) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    inline void emit(Args... args) const {
        if (handlers_.empty()) {
            return;
        }
        const auto snapshot = handlers_;
        for (const auto& slot : snapshot) {
            if (!slot.handler) {
                continue;
            }
            try {
                slot.handler(args...);
            } catch (const std::exception& e) {
                TS_ERROR("[EVENT] Subscriber " << slot.token << " threw: " << e.what());
            }
        }
    }

    inline void clear() noexcept { handlers_.clear(); }

    [[nodiscard]] inline std::size_t size() const noexcept { return handlers_.size(); }
    [[nodiscard]] inline bool empty() const noexcept { return handlers_.empty(); }

private:
    struct Slot {
        Token token;
        Handler handler;
    };

    std::vector<Slot> handlers_;
    Token next_token_{0};
};

} // namespace lcr::event
