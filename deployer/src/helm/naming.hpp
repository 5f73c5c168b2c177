#pragma once
#include <string>
#include <string_view>

namespace helm {

    inline constexpr std::string_view STABLE_TRACK{"stable"};
    inline constexpr std::string_view CANARY_TRACK{"canary"};
    inline constexpr std::string_view APP_CHART{"app"};
    inline constexpr std::string_view APP_CHART_PATH{"/usr/src/charts/app"};

    /**
     * Release name for a track: the app name on the stable track, app-track otherwise.
     */
    [[nodiscard]] std::string releaseName(std::string_view appName, std::string_view track);

    /**
     * The built-in chart alias "app" resolves to the bundled chart path.
     */
    [[nodiscard]] std::string chartRef(std::string_view chart);

    /**
     * Directory a plugin install leaves behind in the plugin cache, relative to the plugin
     * directory. https://github.com/x/y/ gives https-github.com-x-y
     */
    [[nodiscard]] std::string residualSlug(std::string_view url);
} // namespace helm
