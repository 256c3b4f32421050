#pragma once

#include <raylib.h>

#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include "../../shared/world/block.hpp"

namespace ecs {

// Raised when a component is asked to read or write a field it does not
// declare. Components have a fixed field set; this is a programming error in
// the caller, not a runtime condition.
class UnknownField : public std::logic_error {
public:
    UnknownField(std::string_view component, std::string_view field);
};

struct ItemSlot {
    int item{-1};   // -1 = empty
    int count{0};

    bool empty() const { return item < 0; }

    friend bool operator==(const ItemSlot&, const ItemSlot&) = default;
};

using InventorySlots = std::array<ItemSlot, shared::world::kInventorySlots>;

// Value accepted by the by-name accessors. Float fields also accept int.
using FieldValue = std::variant<int, float, InventorySlots>;

// ============================================================================
// Kinematics
// ============================================================================

// Pixel-space position of an entity.
struct Position2D {
    float x{0.0f};
    float y{0.0f};

    static constexpr std::string_view kName = "Position2D";

    Vector2 as_vector() const { return Vector2{x, y}; }

    std::span<const std::string_view> field_names() const;
    FieldValue get_field(std::string_view field) const;
    void set_field(std::string_view field, const FieldValue& value);

    Position2D operator+(const Position2D& other) const;
    Position2D operator-(const Position2D& other) const;
    Position2D operator*(float scale) const;
    Position2D operator-() const { return Position2D{-x, -y}; }

    friend bool operator==(const Position2D&, const Position2D&) = default;
};

struct Velocity2D {
    float vx{0.0f};
    float vy{0.0f};

    static constexpr std::string_view kName = "Velocity2D";

    Vector2 as_vector() const { return Vector2{vx, vy}; }

    std::span<const std::string_view> field_names() const;
    FieldValue get_field(std::string_view field) const;
    void set_field(std::string_view field, const FieldValue& value);

    Velocity2D operator+(const Velocity2D& other) const;
    Velocity2D operator-(const Velocity2D& other) const;
    Velocity2D operator*(float scale) const;

    friend bool operator==(const Velocity2D&, const Velocity2D&) = default;
};

// Position advanced by velocity over dt seconds.
Position2D integrate(const Position2D& position, const Velocity2D& velocity, float dt);

struct Acceleration2D {
    float ax{0.0f};
    float ay{0.0f};

    static constexpr std::string_view kName = "Acceleration2D";

    std::span<const std::string_view> field_names() const;
    FieldValue get_field(std::string_view field) const;
    void set_field(std::string_view field, const FieldValue& value);

    friend bool operator==(const Acceleration2D&, const Acceleration2D&) = default;
};

// Degrees, always kept in [0, 360).
struct Rotation2D {
    static constexpr std::string_view kName = "Rotation2D";

    Rotation2D() = default;
    explicit Rotation2D(float degrees) { set_angle(degrees); }

    float angle() const { return angle_; }
    void set_angle(float degrees);

    std::span<const std::string_view> field_names() const;
    FieldValue get_field(std::string_view field) const;
    void set_field(std::string_view field, const FieldValue& value);

    friend bool operator==(const Rotation2D&, const Rotation2D&) = default;

private:
    float angle_{0.0f};
};

// ============================================================================
// Player state
// ============================================================================

struct Health {
    int current{100};
    int maximum{100};

    static constexpr std::string_view kName = "Health";

    std::span<const std::string_view> field_names() const;
    FieldValue get_field(std::string_view field) const;
    void set_field(std::string_view field, const FieldValue& value);

    friend bool operator==(const Health&, const Health&) = default;
};

// Seconds remaining / full duration.
struct Cooldown {
    float current{0.0f};
    float maximum{0.0f};

    static constexpr std::string_view kName = "Cooldown";

    bool ready() const { return current <= 0.0f; }

    std::span<const std::string_view> field_names() const;
    FieldValue get_field(std::string_view field) const;
    void set_field(std::string_view field, const FieldValue& value);

    friend bool operator==(const Cooldown&, const Cooldown&) = default;
};

struct SelectedSlot {
    int slot{0};

    static constexpr std::string_view kName = "SelectedSlot";

    std::span<const std::string_view> field_names() const;
    FieldValue get_field(std::string_view field) const;
    void set_field(std::string_view field, const FieldValue& value);

    friend bool operator==(const SelectedSlot&, const SelectedSlot&) = default;
};

struct Inventory {
    InventorySlots slots{};

    static constexpr std::string_view kName = "Inventory";

    std::span<const std::string_view> field_names() const;
    FieldValue get_field(std::string_view field) const;
    void set_field(std::string_view field, const FieldValue& value);

    friend bool operator==(const Inventory&, const Inventory&) = default;
};

// Every component kind the registry can store. The alternative index is the
// kind id used to bind component names.
using Component = std::variant<
    Position2D,
    Velocity2D,
    Acceleration2D,
    Rotation2D,
    Health,
    Cooldown,
    SelectedSlot,
    Inventory
>;

std::string_view component_kind_name(std::size_t kind);

} // namespace ecs
