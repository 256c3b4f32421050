#pragma once

#include <entt/entt.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

#include "components.hpp"

namespace ecs {

using Entity = entt::entity;

namespace detail {

template <typename T, typename Variant>
struct variant_index;

template <typename T, typename... Ts>
struct variant_index<T, std::variant<Ts...>> {
    static constexpr std::size_t value = [] {
        constexpr bool matches[] = {std::is_same_v<T, Ts>...};
        for (std::size_t i = 0; i < sizeof...(Ts); ++i) {
            if (matches[i]) return i;
        }
        return sizeof...(Ts);
    }();
    static_assert(value < sizeof...(Ts), "type is not a registered component kind");
};

} // namespace detail

template <typename T>
inline constexpr std::size_t component_kind_v = detail::variant_index<T, Component>::value;

// ============================================================================
// EntityRegistry - named components on top of entt::registry
// ============================================================================
//
// Each component is attached under a name ("position", "velocity", ...). Every
// name gets its own entt storage, so one entity may hold two components of the
// same kind under different names. The first add() binds a name to a kind for
// the registry's lifetime; later adds with another kind are rejected.
//
// Not thread-safe. Owned and mutated by the simulation tick only.
class EntityRegistry {
public:
    EntityRegistry() = default;

    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    Entity create();
    void destroy(Entity entity);
    bool valid(Entity entity) const;
    std::size_t alive() const { return alive_; }

    // Attaches (or replaces) the component stored under `name`.
    template <typename T>
    T& add(Entity entity, std::string_view name, T component) {
        require_valid(entity);
        bind(name, component_kind_v<T>);
        auto& store = storage<T>(name);
        if (store.contains(entity)) {
            auto& slot = store.get(entity);
            slot = std::move(component);
            return slot;
        }
        return store.emplace(entity, std::move(component));
    }

    void add(Entity entity, std::string_view name, const Component& component);

    // Like add(), but leaves an existing component untouched. Returns true if
    // the component was attached.
    template <typename T>
    bool try_add(Entity entity, std::string_view name, T component) {
        if (has(entity, name)) return false;
        add<T>(entity, name, std::move(component));
        return true;
    }

    bool try_add(Entity entity, std::string_view name, const Component& component);

    bool has(Entity entity, std::string_view name) const;

    // Throws std::out_of_range if the entity or component is missing and
    // std::invalid_argument if `name` is bound to another kind.
    template <typename T>
    T& get(Entity entity, std::string_view name) {
        check_kind(name, component_kind_v<T>);
        auto& store = storage<T>(name);
        if (!valid(entity) || !store.contains(entity)) {
            throw std::out_of_range(missing_message(entity, name));
        }
        return store.get(entity);
    }

    template <typename T>
    const T& get(Entity entity, std::string_view name) const {
        return const_cast<EntityRegistry*>(this)->get<T>(entity, name);
    }

    template <typename T>
    T* try_get(Entity entity, std::string_view name) {
        auto it = kinds_.find(std::string(name));
        if (it == kinds_.end() || it->second != component_kind_v<T> || !valid(entity)) return nullptr;
        auto& store = storage<T>(name);
        return store.contains(entity) ? &store.get(entity) : nullptr;
    }

    // Copies every field of `source` into the stored component by name. The
    // stored kind is kept; a source field the stored kind lacks raises
    // UnknownField (fields copied before it stay written).
    void set(Entity entity, std::string_view name, const Component& source);

    void set_field(Entity entity, std::string_view name, std::string_view field, const FieldValue& value);
    FieldValue get_field(Entity entity, std::string_view name, std::string_view field) const;

    // Returns true if a component was removed.
    bool remove(Entity entity, std::string_view name);

private:
    entt::registry registry_;
    std::size_t alive_{0};

    // component name -> Component alternative index
    std::unordered_map<std::string, std::size_t> kinds_;

    static entt::id_type storage_id(std::string_view name) {
        return entt::hashed_string{name.data(), name.size()}.value();
    }

    template <typename T>
    auto& storage(std::string_view name) {
        return registry_.storage<T>(storage_id(name));
    }

    void bind(std::string_view name, std::size_t kind);
    void check_kind(std::string_view name, std::size_t kind) const;
    void require_valid(Entity entity) const;
    std::size_t bound_kind(std::string_view name, Entity entity) const;

    static std::string missing_message(Entity entity, std::string_view name);

    // Calls fn(component&) with the component stored under `name`, resolved to
    // its bound kind.
    template <typename Fn>
    void visit_stored(Entity entity, std::string_view name, Fn&& fn);

    template <typename Fn, std::size_t... I>
    void dispatch_kind(std::size_t kind, Fn&& fn, std::index_sequence<I...>) {
        ((kind == I ? (fn.template operator()<std::variant_alternative_t<I, Component>>(), true) : false) || ...);
    }
};

template <typename Fn>
void EntityRegistry::visit_stored(Entity entity, std::string_view name, Fn&& fn) {
    const std::size_t kind = bound_kind(name, entity);
    dispatch_kind(kind, [&]<typename T>() {
        fn(this->template get<T>(entity, name));
    }, std::make_index_sequence<std::variant_size_v<Component>>{});
}

} // namespace ecs
