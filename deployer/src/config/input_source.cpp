#include "input_source.hpp"
#include <string_util.hpp>

namespace config {

    ParameterSource::ParameterSource(
        std::shared_ptr<data::Map> params,
        std::shared_ptr<data::Map> fileInputs,
        std::shared_ptr<const lifecycle::SysProperties> env)
        : _params(params ? std::move(params) : std::make_shared<data::Map>()),
          _fileInputs(fileInputs ? std::move(fileInputs) : std::make_shared<data::Map>()),
          _env(env ? std::move(env) : std::make_shared<const lifecycle::SysProperties>()) {
    }

    std::string ParameterSource::parameterName(std::string_view name) {
        return util::replaceAll(name, '_', '-');
    }

    std::string ParameterSource::environmentName(std::string_view parameterName) {
        return "INPUT_" + util::upper(util::replaceAll(parameterName, ' ', '_'));
    }

    data::Value ParameterSource::lookup(std::string_view name) const {
        auto key = parameterName(name);
        if(_params->hasKey(key)) {
            return _params->get(key);
        }
        if(auto env = _env->get(environmentName(key)); env.has_value()) {
            return data::Value{util::trim(env.value())};
        }
        return _fileInputs->get(key);
    }
} // namespace config
