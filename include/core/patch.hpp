#pragma once

#include <optional>
#include <utility>

namespace paydb {

/**
 * @brief Optional-field wrapper for partial updates
 *
 * Three states:
 * - absent: field was not supplied, column is never written
 * - null:   field was supplied as null, column is written as SQL NULL
 * - value:  field was supplied with a value
 *
 * Usage:
 *   UpdatePayerSetInput set;
 *   set.description = std::string("vip");   // write value
 *   set.deleted_at = Patch<Timestamp>::null(); // write NULL
 *   // set.metadata left default -> untouched
 */
template<typename T>
class Patch {
public:
    Patch() = default;
    Patch(T value) : supplied_(true), value_(std::move(value)) {}

    [[nodiscard]] static Patch null() {
        Patch p;
        p.supplied_ = true;
        return p;
    }

    [[nodiscard]] static Patch absent() { return Patch{}; }

    // From an optional: nullopt means "supplied as null"
    [[nodiscard]] static Patch from_optional(std::optional<T> v) {
        Patch p;
        p.supplied_ = true;
        p.value_ = std::move(v);
        return p;
    }

    [[nodiscard]] bool is_supplied() const noexcept { return supplied_; }
    [[nodiscard]] bool is_null() const noexcept { return supplied_ && !value_.has_value(); }
    [[nodiscard]] bool has_value() const noexcept { return value_.has_value(); }

    [[nodiscard]] const T& value() const { return *value_; }
    [[nodiscard]] const std::optional<T>& as_optional() const noexcept { return value_; }

    bool operator==(const Patch&) const = default;

private:
    bool supplied_ = false;
    std::optional<T> value_;
};

} // namespace paydb
