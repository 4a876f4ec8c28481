#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace stockflow::v1 {

// Basic numeric types
using Real = double;
using Index = std::int32_t;

// Entity kinds that can appear in a model scope
enum class EntityKind : std::uint8_t {
    Stock,
    Parameter,
    Auxiliary,
    Flow
};

[[nodiscard]] constexpr std::string_view to_string(EntityKind kind) noexcept {
    switch (kind) {
        case EntityKind::Stock: return "stock";
        case EntityKind::Parameter: return "parameter";
        case EntityKind::Auxiliary: return "auxiliary";
        case EntityKind::Flow: return "flow";
    }
    return "unknown";
}

// Role of a flow with respect to a connected stock
enum class FlowDirection : std::uint8_t {
    Inflow,
    Outflow
};

[[nodiscard]] constexpr std::string_view to_string(FlowDirection direction) noexcept {
    switch (direction) {
        case FlowDirection::Inflow: return "inflow";
        case FlowDirection::Outflow: return "outflow";
    }
    return "unknown";
}

/// Parse a connection direction token. Only the exact tokens are accepted.
[[nodiscard]] constexpr std::optional<FlowDirection> parse_direction(std::string_view token) noexcept {
    if (token == "inflow") return FlowDirection::Inflow;
    if (token == "outflow") return FlowDirection::Outflow;
    return std::nullopt;
}

// Name bound to the current simulated time in every evaluation scope
inline constexpr std::string_view kTimeName = "time";

}  // namespace stockflow::v1
