#pragma once

#include <utility>
#include <variant>

#include "value.hpp"

// Either a view of a value owned elsewhere (a variable, a literal, a list
// element) or a freshly computed value. A borrowed value_ref must not
// outlive the state or expression it points into.
class value_ref final
{
  public:
    [[nodiscard]] static auto borrowed(const value& val) -> value_ref { return value_ref {&val}; }

    [[nodiscard]] static auto owned(value&& val) -> value_ref { return value_ref {std::move(val)}; }

    [[nodiscard]] auto is_owned() const -> bool { return std::holds_alternative<value>(m_storage); }

    [[nodiscard]] auto get() const -> const value&
    {
        if (const auto* const* ptr = std::get_if<const value*>(&m_storage); ptr != nullptr) {
            return **ptr;
        }
        return std::get<value>(m_storage);
    }

    [[nodiscard]] auto into_owned() && -> value
    {
        if (is_owned()) {
            return std::move(std::get<value>(m_storage));
        }
        return *std::get<const value*>(m_storage);
    }

    auto operator*() const -> const value& { return get(); }

    auto operator->() const -> const value* { return &get(); }

  private:
    explicit value_ref(const value* ptr)
        : m_storage {ptr}
    {
    }

    explicit value_ref(value&& val)
        : m_storage {std::move(val)}
    {
    }

    std::variant<const value*, value> m_storage;
};
