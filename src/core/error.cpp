#include <parcel/core/error.hpp>

namespace parcel {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::IoFailure:
            return "io failure";
        case ErrorKind::WriteFailure:
            return "write failure";
        case ErrorKind::SerializationFailure:
            return "serialization failure";
    }
    return "unknown failure";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace parcel
