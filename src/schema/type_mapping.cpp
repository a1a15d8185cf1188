#include <parcel/schema/type_mapping.hpp>

#include <fmt/format.h>

#include <array>
#include <string_view>

namespace parcel::schema {

namespace {

/// Nesting bound for self-referencing output/list types.
constexpr int kMaxPlanDepth = 16;

constexpr std::array<std::string_view, 3> kVec3Fields{"x", "y", "z"};

auto scalar_name(ScalarType type) -> std::string_view {
    switch (type) {
        case ScalarType::Boolean:
            return "bool";
        case ScalarType::Float32:
            return "f32";
        case ScalarType::Float64:
            return "f64";
        case ScalarType::Int32:
            return "i32";
        case ScalarType::Int64:
            return "i64";
        case ScalarType::UInt32:
            return "u32";
        case ScalarType::UInt64:
            return "u64";
    }
    return "?";
}

auto value_kind_name(const Value& value) -> std::string_view {
    switch (value.kind()) {
        case ValueKind::Bool:
            return "bool";
        case ValueKind::Float32:
            return "f32";
        case ValueKind::Float64:
            return "f64";
        case ValueKind::Int32:
            return "i32";
        case ValueKind::Int64:
            return "i64";
        case ValueKind::UInt32:
            return "u32";
        case ValueKind::UInt64:
            return "u64";
        case ValueKind::String:
            return "string";
        case ValueKind::Struct:
            return "struct";
        case ValueKind::Tuple:
            return "tuple";
        case ValueKind::List:
            return "list";
        case ValueKind::Enum:
            return "enum";
        case ValueKind::Opaque:
            return "opaque";
    }
    return "?";
}

auto is_vec3(const TypeDescriptor& descriptor, const TypeRegistry& registry) -> bool {
    if (descriptor.kind != TypeKind::Struct || descriptor.fields.size() != kVec3Fields.size()) {
        return false;
    }
    for (std::size_t i = 0; i < kVec3Fields.size(); ++i) {
        const auto& field = descriptor.fields[i];
        if (field.name != kVec3Fields[i]) {
            return false;
        }
        const auto* field_type = registry.descriptor(field.type);
        if (field_type == nullptr || field_type->type_path != "f32") {
            return false;
        }
    }
    return true;
}

auto plan_for(std::optional<TypeId> type_id, const TypeRegistry& registry, int depth)
    -> ColumnPlan {
    if (!type_id || depth > kMaxPlanDepth) {
        return ColumnPlan::text();
    }
    const auto* descriptor = registry.descriptor(*type_id);
    if (descriptor == nullptr) {
        return ColumnPlan::text();
    }

    switch (descriptor->kind) {
        case TypeKind::Value: {
            if (auto scalar = scalar_for_path(descriptor->type_path)) {
                return ColumnPlan::of_scalar(*scalar);
            }
            return ColumnPlan::text();
        }
        case TypeKind::Struct: {
            if (is_vec3(*descriptor, registry)) {
                return ColumnPlan{.kind = PlanKind::Vec3};
            }
            if (const auto* output = descriptor->field("output")) {
                auto inner = plan_for(output->type, registry, depth + 1);
                // Text over the projected field is what the Text policy does
                // for a struct with `output` anyway.
                if (inner.kind == PlanKind::Text) {
                    return ColumnPlan::text();
                }
                return ColumnPlan{.kind = PlanKind::Output,
                                  .child = std::make_shared<const ColumnPlan>(std::move(inner))};
            }
            return ColumnPlan::text();
        }
        case TypeKind::List: {
            auto item = plan_for(descriptor->item, registry, depth + 1);
            return ColumnPlan{.kind = PlanKind::List,
                              .child = std::make_shared<const ColumnPlan>(std::move(item))};
        }
        case TypeKind::Array: {
            auto item = plan_for(descriptor->item, registry, depth + 1);
            return ColumnPlan{.kind = PlanKind::FixedSizeList,
                              .child = std::make_shared<const ColumnPlan>(std::move(item)),
                              .list_size = static_cast<std::int32_t>(descriptor->length)};
        }
        case TypeKind::Enum:
        case TypeKind::TupleStruct:
        case TypeKind::Tuple:
        case TypeKind::Map:
            return ColumnPlan::text();
    }
    return ColumnPlan::text();
}

template <typename T>
auto expect_scalar(const Value& value, ScalarType type) -> Result<Value> {
    if (value.get_if<T>() == nullptr) {
        return serialization_failure(fmt::format("expected {} value, got {}", scalar_name(type),
                                                 value_kind_name(value)));
    }
    return value;
}

template <typename BuilderT, typename T>
auto append_scalar(arrow::ArrayBuilder& builder, const Value& value) -> arrow::Status {
    const auto* v = value.get_if<T>();
    if (v == nullptr) {
        return arrow::Status::TypeError("value does not match column type ",
                                        builder.type()->ToString());
    }
    return static_cast<BuilderT&>(builder).Append(*v);
}

}  // namespace

auto ColumnPlan::describe() const -> std::string {
    switch (kind) {
        case PlanKind::Scalar:
            return std::string(scalar_name(scalar));
        case PlanKind::Vec3:
            return "vec3";
        case PlanKind::List:
            return fmt::format("list<{}>", child ? child->describe() : "?");
        case PlanKind::FixedSizeList:
            return fmt::format("list<{}; {}>", child ? child->describe() : "?", list_size);
        case PlanKind::Output:
            return fmt::format("output<{}>", child ? child->describe() : "?");
        case PlanKind::Text:
            return "string";
    }
    return "?";
}

auto scalar_for_path(std::string_view type_path) -> std::optional<ScalarType> {
    if (type_path == "f32") return ScalarType::Float32;
    if (type_path == "f64") return ScalarType::Float64;
    if (type_path == "i32") return ScalarType::Int32;
    if (type_path == "i64") return ScalarType::Int64;
    if (type_path == "u32") return ScalarType::UInt32;
    if (type_path == "u64") return ScalarType::UInt64;
    if (type_path == "bool") return ScalarType::Boolean;
    // Entity handles are stored by their 64-bit representation.
    if (type_path == "entity") return ScalarType::UInt64;
    return std::nullopt;
}

auto plan_for_type(std::optional<TypeId> type_id, const TypeRegistry& registry) -> ColumnPlan {
    return plan_for(type_id, registry, 0);
}

auto to_arrow_type(const ColumnPlan& plan) -> std::shared_ptr<arrow::DataType> {
    switch (plan.kind) {
        case PlanKind::Scalar:
            switch (plan.scalar) {
                case ScalarType::Boolean:
                    return arrow::boolean();
                case ScalarType::Float32:
                    return arrow::float32();
                case ScalarType::Float64:
                    return arrow::float64();
                case ScalarType::Int32:
                    return arrow::int32();
                case ScalarType::Int64:
                    return arrow::int64();
                case ScalarType::UInt32:
                    return arrow::uint32();
                case ScalarType::UInt64:
                    return arrow::uint64();
            }
            return arrow::utf8();
        case PlanKind::Vec3:
            return arrow::struct_({arrow::field("x", arrow::float32(), false),
                                   arrow::field("y", arrow::float32(), false),
                                   arrow::field("z", arrow::float32(), false)});
        case PlanKind::List:
            return arrow::list(arrow::field("item", to_arrow_type(*plan.child), true));
        case PlanKind::FixedSizeList:
            return arrow::fixed_size_list(arrow::field("item", to_arrow_type(*plan.child), true),
                                          plan.list_size);
        case PlanKind::Output:
            return to_arrow_type(*plan.child);
        case PlanKind::Text:
            return arrow::utf8();
    }
    return arrow::utf8();
}

auto render_text(const Value& value) -> std::string {
    if (const auto* s = value.get_if<StructValue>()) {
        if (const auto* output = s->field("output")) {
            return debug_format(*output);
        }
        return debug_format(value);
    }
    if (const auto* t = value.get_if<TupleValue>()) {
        if (!t->fields.empty()) {
            return debug_format(t->fields.front());
        }
    }
    return debug_format(value);
}

auto conform(const ColumnPlan& plan, const Value& value) -> Result<Value> {
    switch (plan.kind) {
        case PlanKind::Text:
            return make_string(render_text(value));
        case PlanKind::Scalar:
            switch (plan.scalar) {
                case ScalarType::Boolean:
                    return expect_scalar<bool>(value, plan.scalar);
                case ScalarType::Float32:
                    return expect_scalar<float>(value, plan.scalar);
                case ScalarType::Float64:
                    return expect_scalar<double>(value, plan.scalar);
                case ScalarType::Int32:
                    return expect_scalar<std::int32_t>(value, plan.scalar);
                case ScalarType::Int64:
                    return expect_scalar<std::int64_t>(value, plan.scalar);
                case ScalarType::UInt32:
                    return expect_scalar<std::uint32_t>(value, plan.scalar);
                case ScalarType::UInt64:
                    return expect_scalar<std::uint64_t>(value, plan.scalar);
            }
            break;
        case PlanKind::Vec3: {
            const auto* s = value.get_if<StructValue>();
            if (s == nullptr) {
                return serialization_failure(
                    fmt::format("expected vec3 struct, got {}", value_kind_name(value)));
            }
            for (auto name : kVec3Fields) {
                const auto* component = s->field(name);
                if (component == nullptr || component->get_if<float>() == nullptr) {
                    return serialization_failure(
                        fmt::format("vec3 component '{}' is missing or not f32", name));
                }
            }
            return value;
        }
        case PlanKind::Output: {
            const auto* s = value.get_if<StructValue>();
            const auto* output = s == nullptr ? nullptr : s->field("output");
            if (output == nullptr) {
                return serialization_failure(
                    fmt::format("expected struct with an 'output' field, got {}",
                                value_kind_name(value)));
            }
            return conform(*plan.child, *output);
        }
        case PlanKind::List:
        case PlanKind::FixedSizeList: {
            const auto* list = value.get_if<ListValue>();
            if (list == nullptr) {
                return serialization_failure(
                    fmt::format("expected list, got {}", value_kind_name(value)));
            }
            if (plan.kind == PlanKind::FixedSizeList &&
                list->items.size() != static_cast<std::size_t>(plan.list_size)) {
                return serialization_failure(fmt::format("expected {} items, got {}",
                                                         plan.list_size, list->items.size()));
            }
            ListValue out{.fixed_size = list->fixed_size};
            out.items.reserve(list->items.size());
            for (const auto& item : list->items) {
                auto conformed = conform(*plan.child, item);
                if (!conformed) {
                    return std::unexpected(conformed.error());
                }
                out.items.push_back(std::move(conformed.value()));
            }
            return Value{std::move(out)};
        }
    }
    return serialization_failure("unhandled column plan");
}

auto append_value(arrow::ArrayBuilder& builder, const ColumnPlan& plan, const Value& value)
    -> arrow::Status {
    switch (plan.kind) {
        case PlanKind::Text:
            return append_scalar<arrow::StringBuilder, std::string>(builder, value);
        case PlanKind::Scalar:
            switch (plan.scalar) {
                case ScalarType::Boolean:
                    return append_scalar<arrow::BooleanBuilder, bool>(builder, value);
                case ScalarType::Float32:
                    return append_scalar<arrow::FloatBuilder, float>(builder, value);
                case ScalarType::Float64:
                    return append_scalar<arrow::DoubleBuilder, double>(builder, value);
                case ScalarType::Int32:
                    return append_scalar<arrow::Int32Builder, std::int32_t>(builder, value);
                case ScalarType::Int64:
                    return append_scalar<arrow::Int64Builder, std::int64_t>(builder, value);
                case ScalarType::UInt32:
                    return append_scalar<arrow::UInt32Builder, std::uint32_t>(builder, value);
                case ScalarType::UInt64:
                    return append_scalar<arrow::UInt64Builder, std::uint64_t>(builder, value);
            }
            break;
        case PlanKind::Vec3: {
            const auto* s = value.get_if<StructValue>();
            if (s == nullptr) {
                return arrow::Status::TypeError("vec3 column expects a struct value");
            }
            auto& struct_builder = static_cast<arrow::StructBuilder&>(builder);
            ARROW_RETURN_NOT_OK(struct_builder.Append());
            for (std::size_t i = 0; i < kVec3Fields.size(); ++i) {
                const auto* component = s->field(kVec3Fields[i]);
                if (component == nullptr) {
                    return arrow::Status::TypeError("vec3 value is missing a component");
                }
                ARROW_RETURN_NOT_OK(append_scalar<arrow::FloatBuilder, float>(
                    *struct_builder.field_builder(static_cast<int>(i)), *component));
            }
            return arrow::Status::OK();
        }
        case PlanKind::Output:
            return append_value(builder, *plan.child, value);
        case PlanKind::List: {
            const auto* list = value.get_if<ListValue>();
            if (list == nullptr) {
                return arrow::Status::TypeError("list column expects a list value");
            }
            auto& list_builder = static_cast<arrow::ListBuilder&>(builder);
            ARROW_RETURN_NOT_OK(list_builder.Append());
            for (const auto& item : list->items) {
                ARROW_RETURN_NOT_OK(append_value(*list_builder.value_builder(), *plan.child, item));
            }
            return arrow::Status::OK();
        }
        case PlanKind::FixedSizeList: {
            const auto* list = value.get_if<ListValue>();
            if (list == nullptr) {
                return arrow::Status::TypeError("fixed-size list column expects a list value");
            }
            auto& list_builder = static_cast<arrow::FixedSizeListBuilder&>(builder);
            ARROW_RETURN_NOT_OK(list_builder.Append());
            for (const auto& item : list->items) {
                ARROW_RETURN_NOT_OK(append_value(*list_builder.value_builder(), *plan.child, item));
            }
            return arrow::Status::OK();
        }
    }
    return arrow::Status::NotImplemented("unhandled column plan");
}

}  // namespace parcel::schema
