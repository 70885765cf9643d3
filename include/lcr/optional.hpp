#pragma once

#include <string>
#include <type_traits>
#include <utility>


namespace lcr {

// Presence flag plus an always-constructed value. Wire fields that may be
// absent or null use it, so T must be default-constructible; value() on an
// empty optional yields T{}.
template <typename T>
class optional {
    static_assert(std::is_default_constructible_v<T>, "lcr::optional requires a default-constructible T");

public:
    optional() = default;
    optional(T v) : value_(std::move(v)), has_(true) {}

    optional& operator=(T v) {
        value_ = std::move(v);
        has_ = true;
        return *this;
    }

    [[nodiscard]] bool has() const noexcept { return has_; }
    [[nodiscard]] const T& value() const noexcept { return value_; }
    [[nodiscard]] T& value() noexcept { return value_; }

    [[nodiscard]] T value_or(T fallback) const {
        return has_ ? value_ : std::move(fallback);
    }

    void reset() {
        value_ = T{};
        has_ = false;
    }

    friend bool operator==(const optional& a, const optional& b) {
        return a.has_ == b.has_ && (!a.has_ || a.value_ == b.value_);
    }

private:
    T value_{};
    bool has_ = false;
};

// Log-friendly rendering: null, true/false, numbers bare, strings quoted.
template <typename T>
std::string to_string(const optional<T>& opt) {
    if (!opt.has()) {
        return "null";
    }
    if constexpr (std::is_same_v<T, bool>) {
        return opt.value() ? "true" : "false";
    }
    else if constexpr (std::is_arithmetic_v<T>) {
        return std::to_string(opt.value());
    }
    else {
        std::string out{"\""};
        out += opt.value();
        out += '"';
        return out;
    }
}

} // namespace lcr
