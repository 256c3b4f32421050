#include "entity_registry.hpp"

namespace ecs {

Entity EntityRegistry::create() {
    ++alive_;
    return registry_.create();
}

void EntityRegistry::destroy(Entity entity) {
    if (!registry_.valid(entity)) return;
    registry_.destroy(entity);
    --alive_;
}

bool EntityRegistry::valid(Entity entity) const {
    return registry_.valid(entity);
}

void EntityRegistry::add(Entity entity, std::string_view name, const Component& component) {
    std::visit([&](const auto& c) { add(entity, name, c); }, component);
}

bool EntityRegistry::try_add(Entity entity, std::string_view name, const Component& component) {
    if (has(entity, name)) return false;
    add(entity, name, component);
    return true;
}

bool EntityRegistry::has(Entity entity, std::string_view name) const {
    if (!registry_.valid(entity)) return false;
    auto it = kinds_.find(std::string(name));
    if (it == kinds_.end()) return false;
    const auto* pool = registry_.storage(storage_id(name));
    return pool != nullptr && pool->contains(entity);
}

void EntityRegistry::set(Entity entity, std::string_view name, const Component& source) {
    visit_stored(entity, name, [&](auto& target) {
        std::visit([&](const auto& src) {
            for (std::string_view field : src.field_names()) {
                target.set_field(field, src.get_field(field));
            }
        }, source);
    });
}

void EntityRegistry::set_field(Entity entity, std::string_view name, std::string_view field, const FieldValue& value) {
    visit_stored(entity, name, [&](auto& target) { target.set_field(field, value); });
}

FieldValue EntityRegistry::get_field(Entity entity, std::string_view name, std::string_view field) const {
    FieldValue out{};
    const_cast<EntityRegistry*>(this)->visit_stored(entity, name, [&](const auto& target) {
        out = target.get_field(field);
    });
    return out;
}

bool EntityRegistry::remove(Entity entity, std::string_view name) {
    if (!has(entity, name)) return false;
    auto* pool = registry_.storage(storage_id(name));
    return pool != nullptr && pool->remove(entity);
}

void EntityRegistry::bind(std::string_view name, std::size_t kind) {
    auto [it, inserted] = kinds_.try_emplace(std::string(name), kind);
    if (!inserted && it->second != kind) {
        throw std::invalid_argument("component '" + std::string(name) + "' is bound to " +
                                    std::string(component_kind_name(it->second)) + ", not " +
                                    std::string(component_kind_name(kind)));
    }
}

void EntityRegistry::check_kind(std::string_view name, std::size_t kind) const {
    auto it = kinds_.find(std::string(name));
    if (it == kinds_.end()) {
        throw std::out_of_range("no component named '" + std::string(name) + "'");
    }
    if (it->second != kind) {
        throw std::invalid_argument("component '" + std::string(name) + "' is a " +
                                    std::string(component_kind_name(it->second)) + ", not a " +
                                    std::string(component_kind_name(kind)));
    }
}

void EntityRegistry::require_valid(Entity entity) const {
    if (!registry_.valid(entity)) {
        throw std::out_of_range("invalid entity " + std::to_string(entt::to_integral(entity)));
    }
}

std::size_t EntityRegistry::bound_kind(std::string_view name, Entity entity) const {
    auto it = kinds_.find(std::string(name));
    if (it == kinds_.end()) {
        throw std::out_of_range(missing_message(entity, name));
    }
    return it->second;
}

std::string EntityRegistry::missing_message(Entity entity, std::string_view name) {
    return "entity " + std::to_string(entt::to_integral(entity)) + " has no component '" + std::string(name) + "'";
}

} // namespace ecs
