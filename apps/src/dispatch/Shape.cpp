#include "Shape.h"
#include <cmath>
#include <string>

namespace Switchboard {

namespace {

const std::vector<ShapeField>& emptyFields()
{
    static const std::vector<ShapeField> fields;
    return fields;
}

const Shape& anyShape()
{
    static const Shape shape;
    return shape;
}

nlohmann::json childLoc(const nlohmann::json& loc, const nlohmann::json& segment)
{
    nlohmann::json result = loc;
    result.push_back(segment);
    return result;
}

void addIssue(
    std::vector<ValidationIssue>& issues,
    const char* type,
    const nlohmann::json& loc,
    std::string msg)
{
    issues.push_back(ValidationIssue{ type, loc, std::move(msg) });
}

void validateInteger(
    const nlohmann::json& value,
    std::int64_t minimum,
    std::uint64_t maximum,
    const nlohmann::json& loc,
    std::vector<ValidationIssue>& issues)
{
    bool tooSmall = false;
    bool tooLarge = false;

    if (value.is_number_unsigned()) {
        tooLarge = value.get<std::uint64_t>() > maximum;
    }
    else if (value.is_number_integer()) {
        const std::int64_t v = value.get<std::int64_t>();
        tooSmall = v < minimum;
        tooLarge = v > 0 && static_cast<std::uint64_t>(v) > maximum;
    }
    else if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d) || std::floor(d) != d) {
            addIssue(
                issues,
                IssueType::IntFromFloat,
                loc,
                "Input should be a valid integer, got a number with a fractional part");
            return;
        }
        // Exact for the limits of integral types: minimum is 0 or -2^n, maximum + 1 is 2^n.
        tooSmall = d < static_cast<double>(minimum);
        tooLarge = d >= static_cast<double>(maximum) + 1.0;
    }
    else {
        addIssue(issues, IssueType::IntType, loc, "Input should be a valid integer");
        return;
    }

    if (tooSmall) {
        addIssue(
            issues,
            IssueType::GreaterThanEqual,
            loc,
            "Input should be greater than or equal to " + std::to_string(minimum));
    }
    else if (tooLarge) {
        addIssue(
            issues,
            IssueType::LessThanEqual,
            loc,
            "Input should be less than or equal to " + std::to_string(maximum));
    }
}

} // namespace

const char* toString(ShapeKind kind)
{
    switch (kind) {
        case ShapeKind::Any:
            return "any";
        case ShapeKind::None:
            return "null";
        case ShapeKind::Boolean:
            return "boolean";
        case ShapeKind::Integer:
            return "integer";
        case ShapeKind::Number:
            return "number";
        case ShapeKind::String:
            return "string";
        case ShapeKind::Array:
            return "array";
        case ShapeKind::Object:
            return "object";
        case ShapeKind::Enum:
            return "enum";
        case ShapeKind::Nullable:
            return "nullable";
    }
    return "unknown";
}

Shape::Shape() : kind_(ShapeKind::Any)
{}

Shape::Shape(ShapeKind kind) : kind_(kind)
{}

Shape Shape::any()
{
    return Shape(ShapeKind::Any);
}

Shape Shape::none()
{
    return Shape(ShapeKind::None);
}

Shape Shape::boolean()
{
    return Shape(ShapeKind::Boolean);
}

Shape Shape::integer()
{
    return Shape(ShapeKind::Integer);
}

Shape Shape::integer(std::int64_t minimum, std::uint64_t maximum)
{
    Shape shape(ShapeKind::Integer);
    shape.integerMinimum_ = minimum;
    shape.integerMaximum_ = maximum;
    return shape;
}

Shape Shape::number()
{
    return Shape(ShapeKind::Number);
}

Shape Shape::string()
{
    return Shape(ShapeKind::String);
}

Shape Shape::array(Shape element)
{
    Shape shape(ShapeKind::Array);
    shape.inner_ = std::make_shared<const Shape>(std::move(element));
    return shape;
}

Shape Shape::object(std::vector<ShapeField> fields)
{
    Shape shape(ShapeKind::Object);
    shape.fields_ = std::make_shared<const std::vector<ShapeField>>(std::move(fields));
    return shape;
}

Shape Shape::enumOf(std::vector<std::string> values)
{
    Shape shape(ShapeKind::Enum);
    shape.enumValues_ = std::move(values);
    return shape;
}

Shape Shape::nullable(Shape inner)
{
    if (inner.kind() == ShapeKind::Nullable || inner.kind() == ShapeKind::Any) {
        return inner;
    }
    Shape shape(ShapeKind::Nullable);
    shape.inner_ = std::make_shared<const Shape>(std::move(inner));
    return shape;
}

const Shape& Shape::inner() const
{
    return inner_ ? *inner_ : anyShape();
}

const std::vector<ShapeField>& Shape::fields() const
{
    return fields_ ? *fields_ : emptyFields();
}

const ShapeField* Shape::findField(const std::string& name) const
{
    for (const auto& field : fields()) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

bool Shape::validate(
    const nlohmann::json& value,
    const nlohmann::json& loc,
    std::vector<ValidationIssue>& issues) const
{
    const size_t issuesBefore = issues.size();

    switch (kind_) {
        case ShapeKind::Any:
            break;
        case ShapeKind::None:
            if (!value.is_null()) {
                addIssue(issues, IssueType::NoneRequired, loc, "Input should be None");
            }
            break;
        case ShapeKind::Boolean:
            if (!value.is_boolean()) {
                addIssue(issues, IssueType::BoolType, loc, "Input should be a valid boolean");
            }
            break;
        case ShapeKind::Integer:
            validateInteger(value, integerMinimum_, integerMaximum_, loc, issues);
            break;
        case ShapeKind::Number:
            if (!value.is_number()) {
                addIssue(issues, IssueType::FloatType, loc, "Input should be a valid number");
            }
            break;
        case ShapeKind::String:
            if (!value.is_string()) {
                addIssue(issues, IssueType::StringType, loc, "Input should be a valid string");
            }
            break;
        case ShapeKind::Array:
            if (!value.is_array()) {
                addIssue(issues, IssueType::ListType, loc, "Input should be a valid list");
                break;
            }
            for (size_t i = 0; i < value.size(); ++i) {
                inner().validate(value[i], childLoc(loc, i), issues);
            }
            break;
        case ShapeKind::Object:
            if (!value.is_object()) {
                addIssue(issues, IssueType::ModelType, loc, "Input should be an object");
                break;
            }
            for (const auto& field : fields()) {
                auto it = value.find(field.name);
                if (it == value.end()) {
                    if (field.required) {
                        addIssue(
                            issues, IssueType::Missing, childLoc(loc, field.name), "Field required");
                    }
                    continue;
                }
                field.shape.validate(*it, childLoc(loc, field.name), issues);
            }
            break;
        case ShapeKind::Enum: {
            bool ok = false;
            if (value.is_string()) {
                const auto& str = value.get_ref<const std::string&>();
                for (const auto& allowed : enumValues_) {
                    if (allowed == str) {
                        ok = true;
                        break;
                    }
                }
            }
            if (!ok) {
                std::string expected;
                for (size_t i = 0; i < enumValues_.size(); ++i) {
                    if (i > 0) {
                        expected += i + 1 == enumValues_.size() ? " or " : ", ";
                    }
                    expected += "'" + enumValues_[i] + "'";
                }
                addIssue(issues, IssueType::Enum, loc, "Input should be " + expected);
            }
            break;
        }
        case ShapeKind::Nullable:
            if (!value.is_null()) {
                inner().validate(value, loc, issues);
            }
            break;
    }

    return issues.size() == issuesBefore;
}

bool Shape::operator==(const Shape& other) const
{
    if (kind_ != other.kind_) {
        return false;
    }

    switch (kind_) {
        case ShapeKind::Any:
        case ShapeKind::None:
        case ShapeKind::Boolean:
        case ShapeKind::Number:
        case ShapeKind::String:
            return true;
        case ShapeKind::Integer:
            return integerMinimum_ == other.integerMinimum_
                && integerMaximum_ == other.integerMaximum_;
        case ShapeKind::Array:
        case ShapeKind::Nullable:
            return inner() == other.inner();
        case ShapeKind::Enum:
            return enumValues_ == other.enumValues_;
        case ShapeKind::Object: {
            const auto& mine = fields();
            const auto& theirs = other.fields();
            if (mine.size() != theirs.size()) {
                return false;
            }
            for (size_t i = 0; i < mine.size(); ++i) {
                if (mine[i].name != theirs[i].name || mine[i].required != theirs[i].required
                    || mine[i].shape != theirs[i].shape) {
                    return false;
                }
            }
            return true;
        }
    }
    return false;
}

} // namespace Switchboard
