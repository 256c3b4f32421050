#include "components.hpp"

#include <raymath.h>

#include <cmath>
#include <string>

namespace ecs {

namespace {

constexpr std::array<std::string_view, 2> kPositionFields{"x", "y"};
constexpr std::array<std::string_view, 2> kVelocityFields{"vx", "vy"};
constexpr std::array<std::string_view, 2> kAccelerationFields{"ax", "ay"};
constexpr std::array<std::string_view, 1> kRotationFields{"angle"};
constexpr std::array<std::string_view, 2> kRangeFields{"current", "maximum"};
constexpr std::array<std::string_view, 1> kSlotFields{"slot"};
constexpr std::array<std::string_view, 1> kInventoryFields{"slots"};

std::string bad_type_message(std::string_view component, std::string_view field, const char* expected) {
    std::string msg(component);
    msg += ".";
    msg += field;
    msg += ": expected ";
    msg += expected;
    return msg;
}

float as_float(std::string_view component, std::string_view field, const FieldValue& value) {
    if (const auto* f = std::get_if<float>(&value)) return *f;
    if (const auto* i = std::get_if<int>(&value)) return static_cast<float>(*i);
    throw std::invalid_argument(bad_type_message(component, field, "float"));
}

int as_int(std::string_view component, std::string_view field, const FieldValue& value) {
    if (const auto* i = std::get_if<int>(&value)) return *i;
    throw std::invalid_argument(bad_type_message(component, field, "int"));
}

const InventorySlots& as_slots(std::string_view component, std::string_view field, const FieldValue& value) {
    if (const auto* s = std::get_if<InventorySlots>(&value)) return *s;
    throw std::invalid_argument(bad_type_message(component, field, "inventory slots"));
}

// Shared accessor for the two-float components.
template <typename T, typename C>
auto& pick_pair(C& c, float T::*first, float T::*second, std::string_view field,
                const std::array<std::string_view, 2>& names) {
    if (field == names[0]) return c.*first;
    if (field == names[1]) return c.*second;
    throw UnknownField(T::kName, field);
}

} // namespace

UnknownField::UnknownField(std::string_view component, std::string_view field)
    : std::logic_error(std::string(component) + " has no field '" + std::string(field) + "'") {}

// ----------------------------------------------------------------------------
// Position2D
// ----------------------------------------------------------------------------

std::span<const std::string_view> Position2D::field_names() const { return kPositionFields; }

FieldValue Position2D::get_field(std::string_view field) const {
    return pick_pair(*this, &Position2D::x, &Position2D::y, field, kPositionFields);
}

void Position2D::set_field(std::string_view field, const FieldValue& value) {
    float& slot = pick_pair(*this, &Position2D::x, &Position2D::y, field, kPositionFields);
    slot = as_float(kName, field, value);
}

Position2D Position2D::operator+(const Position2D& other) const {
    const Vector2 v = Vector2Add(as_vector(), other.as_vector());
    return Position2D{v.x, v.y};
}

Position2D Position2D::operator-(const Position2D& other) const {
    const Vector2 v = Vector2Subtract(as_vector(), other.as_vector());
    return Position2D{v.x, v.y};
}

Position2D Position2D::operator*(float scale) const {
    const Vector2 v = Vector2Scale(as_vector(), scale);
    return Position2D{v.x, v.y};
}

// ----------------------------------------------------------------------------
// Velocity2D
// ----------------------------------------------------------------------------

std::span<const std::string_view> Velocity2D::field_names() const { return kVelocityFields; }

FieldValue Velocity2D::get_field(std::string_view field) const {
    return pick_pair(*this, &Velocity2D::vx, &Velocity2D::vy, field, kVelocityFields);
}

void Velocity2D::set_field(std::string_view field, const FieldValue& value) {
    float& slot = pick_pair(*this, &Velocity2D::vx, &Velocity2D::vy, field, kVelocityFields);
    slot = as_float(kName, field, value);
}

Velocity2D Velocity2D::operator+(const Velocity2D& other) const {
    const Vector2 v = Vector2Add(as_vector(), other.as_vector());
    return Velocity2D{v.x, v.y};
}

Velocity2D Velocity2D::operator-(const Velocity2D& other) const {
    const Vector2 v = Vector2Subtract(as_vector(), other.as_vector());
    return Velocity2D{v.x, v.y};
}

Velocity2D Velocity2D::operator*(float scale) const {
    const Vector2 v = Vector2Scale(as_vector(), scale);
    return Velocity2D{v.x, v.y};
}

Position2D integrate(const Position2D& position, const Velocity2D& velocity, float dt) {
    const Vector2 v = Vector2Add(position.as_vector(), Vector2Scale(velocity.as_vector(), dt));
    return Position2D{v.x, v.y};
}

// ----------------------------------------------------------------------------
// Acceleration2D
// ----------------------------------------------------------------------------

std::span<const std::string_view> Acceleration2D::field_names() const { return kAccelerationFields; }

FieldValue Acceleration2D::get_field(std::string_view field) const {
    return pick_pair(*this, &Acceleration2D::ax, &Acceleration2D::ay, field, kAccelerationFields);
}

void Acceleration2D::set_field(std::string_view field, const FieldValue& value) {
    float& slot = pick_pair(*this, &Acceleration2D::ax, &Acceleration2D::ay, field, kAccelerationFields);
    slot = as_float(kName, field, value);
}

// ----------------------------------------------------------------------------
// Rotation2D
// ----------------------------------------------------------------------------

void Rotation2D::set_angle(float degrees) {
    float a = std::fmod(degrees, 360.0f);
    if (a < 0.0f) a += 360.0f;
    // fmod of a tiny negative value can round up to exactly 360.
    if (a >= 360.0f) a = 0.0f;
    angle_ = a;
}

std::span<const std::string_view> Rotation2D::field_names() const { return kRotationFields; }

FieldValue Rotation2D::get_field(std::string_view field) const {
    if (field == kRotationFields[0]) return angle_;
    throw UnknownField(kName, field);
}

void Rotation2D::set_field(std::string_view field, const FieldValue& value) {
    if (field != kRotationFields[0]) throw UnknownField(kName, field);
    set_angle(as_float(kName, field, value));
}

// ----------------------------------------------------------------------------
// Health / Cooldown
// ----------------------------------------------------------------------------

std::span<const std::string_view> Health::field_names() const { return kRangeFields; }

FieldValue Health::get_field(std::string_view field) const {
    if (field == "current") return current;
    if (field == "maximum") return maximum;
    throw UnknownField(kName, field);
}

void Health::set_field(std::string_view field, const FieldValue& value) {
    if (field == "current") current = as_int(kName, field, value);
    else if (field == "maximum") maximum = as_int(kName, field, value);
    else throw UnknownField(kName, field);
}

std::span<const std::string_view> Cooldown::field_names() const { return kRangeFields; }

FieldValue Cooldown::get_field(std::string_view field) const {
    return pick_pair(*this, &Cooldown::current, &Cooldown::maximum, field, kRangeFields);
}

void Cooldown::set_field(std::string_view field, const FieldValue& value) {
    float& slot = pick_pair(*this, &Cooldown::current, &Cooldown::maximum, field, kRangeFields);
    slot = as_float(kName, field, value);
}

// ----------------------------------------------------------------------------
// SelectedSlot / Inventory
// ----------------------------------------------------------------------------

std::span<const std::string_view> SelectedSlot::field_names() const { return kSlotFields; }

FieldValue SelectedSlot::get_field(std::string_view field) const {
    if (field == kSlotFields[0]) return slot;
    throw UnknownField(kName, field);
}

void SelectedSlot::set_field(std::string_view field, const FieldValue& value) {
    if (field != kSlotFields[0]) throw UnknownField(kName, field);
    const int v = as_int(kName, field, value);
    if (v < 0 || v >= static_cast<int>(shared::world::kInventorySlots)) {
        throw std::invalid_argument("SelectedSlot.slot out of range");
    }
    slot = v;
}

std::span<const std::string_view> Inventory::field_names() const { return kInventoryFields; }

FieldValue Inventory::get_field(std::string_view field) const {
    if (field == kInventoryFields[0]) return slots;
    throw UnknownField(kName, field);
}

void Inventory::set_field(std::string_view field, const FieldValue& value) {
    if (field != kInventoryFields[0]) throw UnknownField(kName, field);
    slots = as_slots(kName, field, value);
}

std::string_view component_kind_name(std::size_t kind) {
    switch (kind) {
        case 0: return Position2D::kName;
        case 1: return Velocity2D::kName;
        case 2: return Acceleration2D::kName;
        case 3: return Rotation2D::kName;
        case 4: return Health::kName;
        case 5: return Cooldown::kName;
        case 6: return SelectedSlot::kName;
        case 7: return Inventory::kName;
        default: return "Unknown";
    }
}

} // namespace ecs
