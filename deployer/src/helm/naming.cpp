#include "naming.hpp"
#include <string_util.hpp>

namespace helm {

    std::string releaseName(std::string_view appName, std::string_view track) {
        if(track != STABLE_TRACK) {
            std::string name{appName};
            name += '-';
            name += track;
            return name;
        }
        return std::string{appName};
    }

    std::string chartRef(std::string_view chart) {
        if(chart == APP_CHART) {
            return std::string{APP_CHART_PATH};
        }
        return std::string{chart};
    }

    std::string residualSlug(std::string_view url) {
        auto trimmed = util::trimTrailing(util::trim(url), '/');
        return util::collapseRuns(trimmed, ":/", "-");
    }
} // namespace helm
