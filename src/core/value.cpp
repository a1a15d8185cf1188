#include <parcel/core/value.hpp>

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <type_traits>

namespace parcel {

namespace {

auto quote(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char c : text) {
        switch (c) {
            case '"':
                out.append("\\\"");
                break;
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                out.push_back(c);
        }
    }
    out.push_back('"');
    return out;
}

void append_joined(std::string& out, const std::vector<Value>& values) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(debug_format(values[i]));
    }
}

auto format_struct(const StructValue& value) -> std::string {
    std::string out{short_name(value.type_path)};
    if (value.fields.empty()) {
        return out;
    }
    out.append(" { ");
    for (std::size_t i = 0; i < value.fields.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(value.names[i]);
        out.append(": ");
        out.append(debug_format(value.fields[i]));
    }
    out.append(" }");
    return out;
}

auto format_tuple(const TupleValue& value) -> std::string {
    std::string out{short_name(value.type_path)};
    out.push_back('(');
    append_joined(out, value.fields);
    // A one-element anonymous tuple keeps its trailing comma: (1,)
    if (value.type_path.empty() && value.fields.size() == 1) {
        out.push_back(',');
    }
    out.push_back(')');
    return out;
}

auto format_enum(const EnumValue& value) -> std::string {
    std::string out = value.variant;
    if (!value.fields.empty()) {
        out.push_back('(');
        append_joined(out, value.fields);
        out.push_back(')');
    }
    return out;
}

}  // namespace

auto StructValue::field(std::string_view name) const -> const Value* {
    for (std::size_t i = 0; i < names.size() && i < fields.size(); ++i) {
        if (names[i] == name) {
            return &fields[i];
        }
    }
    return nullptr;
}

auto make_struct(std::string type_path,
                 std::initializer_list<std::pair<std::string, Value>> fields) -> Value {
    StructValue out;
    out.type_path = std::move(type_path);
    out.names.reserve(fields.size());
    out.fields.reserve(fields.size());
    for (const auto& [name, value] : fields) {
        out.names.push_back(name);
        out.fields.push_back(value);
    }
    return Value{std::move(out)};
}

auto make_tuple(std::string type_path, std::vector<Value> fields) -> Value {
    return Value{TupleValue{.type_path = std::move(type_path), .fields = std::move(fields)}};
}

auto make_list(std::vector<Value> items) -> Value {
    return Value{ListValue{.items = std::move(items), .fixed_size = false}};
}

auto make_array(std::vector<Value> items) -> Value {
    return Value{ListValue{.items = std::move(items), .fixed_size = true}};
}

auto make_enum(std::string type_path, std::string variant, std::vector<Value> fields) -> Value {
    return Value{EnumValue{.type_path = std::move(type_path),
                           .variant = std::move(variant),
                           .fields = std::move(fields)}};
}

auto make_string(std::string text) -> Value { return Value{std::move(text)}; }

auto format_float(double value, bool single_precision) -> std::string {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::array<char, 64> buffer{};
    std::to_chars_result result{};
    if (single_precision) {
        result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                               static_cast<float>(value));
    } else {
        result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    }
    std::string text = result.ec == std::errc{} ? std::string(buffer.data(), result.ptr)
                                                : fmt::format("{}", value);
    if (auto pos = text.find("e+"); pos != std::string::npos) {
        text.erase(pos + 1, 1);
    }
    if (text.find_first_of(".e") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

auto debug_format(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, float>) {
                return format_float(v, true);
            } else if constexpr (std::is_same_v<T, double>) {
                return format_float(v, false);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quote(v);
            } else if constexpr (std::is_same_v<T, StructValue>) {
                return format_struct(v);
            } else if constexpr (std::is_same_v<T, TupleValue>) {
                return format_tuple(v);
            } else if constexpr (std::is_same_v<T, ListValue>) {
                std::string out = "[";
                append_joined(out, v.items);
                out.push_back(']');
                return out;
            } else if constexpr (std::is_same_v<T, EnumValue>) {
                return format_enum(v);
            } else if constexpr (std::is_same_v<T, OpaqueValue>) {
                return v.repr;
            } else {
                return fmt::format("{}", v);
            }
        },
        value.data);
}

auto short_name(std::string_view type_path) -> std::string_view {
    auto pos = type_path.rfind("::");
    if (pos == std::string_view::npos) {
        return type_path;
    }
    return type_path.substr(pos + 2);
}

}  // namespace parcel
