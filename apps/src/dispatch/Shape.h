#pragma once

#include "ValidationIssue.h"
#include <cstdint>
#include <limits>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Switchboard {

enum class ShapeKind { Any, None, Boolean, Integer, Number, String, Array, Object, Enum, Nullable };

const char* toString(ShapeKind kind);

struct ShapeField;

/**
 * @brief Structural description of a message payload.
 *
 * Shapes are immutable values. Array and Nullable shapes share their inner
 * shape. Object shapes ignore keys they do not declare.
 */
class Shape {
public:
    // Any.
    Shape();

    static Shape any();
    static Shape none();
    static Shape boolean();
    // Accepts any value representable as int64_t or uint64_t.
    static Shape integer();
    // Accepts integers within [minimum, maximum].
    static Shape integer(std::int64_t minimum, std::uint64_t maximum);
    static Shape number();
    static Shape string();
    static Shape array(Shape element);
    static Shape object(std::vector<ShapeField> fields);
    static Shape enumOf(std::vector<std::string> values);
    static Shape nullable(Shape inner);

    ShapeKind kind() const { return kind_; }

    // Element shape of an Array, inner shape of a Nullable.
    const Shape& inner() const;

    const std::vector<ShapeField>& fields() const;
    const std::vector<std::string>& enumValues() const { return enumValues_; }
    std::int64_t integerMinimum() const { return integerMinimum_; }
    std::uint64_t integerMaximum() const { return integerMaximum_; }

    const ShapeField* findField(const std::string& name) const;

    /**
     * @brief Validates a JSON value, appending every mismatch to `issues`.
     * @param loc Path of `value` from the message root.
     * @return true when no issue was appended.
     */
    bool validate(
        const nlohmann::json& value,
        const nlohmann::json& loc,
        std::vector<ValidationIssue>& issues) const;

    bool operator==(const Shape& other) const;
    bool operator!=(const Shape& other) const { return !(*this == other); }

private:
    explicit Shape(ShapeKind kind);

    ShapeKind kind_;
    std::shared_ptr<const Shape> inner_;
    std::shared_ptr<const std::vector<ShapeField>> fields_;
    std::vector<std::string> enumValues_;
    std::int64_t integerMinimum_ = std::numeric_limits<std::int64_t>::min();
    std::uint64_t integerMaximum_ = std::numeric_limits<std::uint64_t>::max();
};

struct ShapeField {
    std::string name;
    Shape shape;
    bool required = true;
};

} // namespace Switchboard
