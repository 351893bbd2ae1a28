#pragma once

#include <utility>
#include <variant>

namespace Utility
{
    template <typename... Ts>
    struct Overloaded : Ts...
    {
        using Ts::operator()...;
    };
    template <typename... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    template <typename VariantT, typename... Functions>
    decltype(auto) visitOverloaded(VariantT&& variant, Functions&&... functions)
    {
        return std::visit(Overloaded{std::forward<Functions>(functions)...}, std::forward<VariantT>(variant));
    }
}
