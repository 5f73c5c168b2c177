#pragma once
#include <lookup_table.hpp>
#include <string_view>

namespace helm {

    /**
     * Command dialect of the helm binary.
     */
    enum class ToolVariant { Helm3, Legacy };

    inline constexpr std::string_view DEFAULT_HELM{"helm3"};

    inline constexpr util::LookupTable<std::string_view, ToolVariant, 1> TOOL_VARIANTS{
        DEFAULT_HELM, ToolVariant::Helm3};

    [[nodiscard]] inline ToolVariant toolVariant(std::string_view helm) noexcept {
        return TOOL_VARIANTS.lookupOr(helm, ToolVariant::Legacy);
    }
} // namespace helm
