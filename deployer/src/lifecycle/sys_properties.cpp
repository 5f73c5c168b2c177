#include "sys_properties.hpp"

namespace lifecycle {
    void SysProperties::parseEnv(std::span<char *const> envs) {
        for(std::string_view env : envs) {
            if(auto pos = env.find('='); pos != std::string_view::npos) {
                put(env.substr(0, pos), env.substr(pos + 1));
            } else {
                put(env, {});
            }
        }
    }

    void SysProperties::parseEnv(char *const *envp) {
        if(envp == nullptr) {
            return;
        }
        size_t count = 0;
        while(envp[count] != nullptr) {
            ++count;
        }
        parseEnv(std::span<char *const>{envp, count});
    }

    std::optional<std::string> SysProperties::get(std::string_view name) const {
        std::shared_lock guard{_mutex};
        if(auto i = _cache.find(name); i == _cache.end()) {
            return {};
        } else {
            return i->second;
        }
    }

    std::string SysProperties::getOr(std::string_view name, std::string_view dflt) const {
        auto value = get(name);
        if(value.has_value() && !value->empty()) {
            return value.value();
        }
        return std::string{dflt};
    }

    bool SysProperties::exists(std::string_view name) const {
        std::shared_lock guard{_mutex};
        return _cache.find(name) != _cache.cend();
    }

    void SysProperties::put(std::string_view name, std::string_view value) {
        std::unique_lock guard{_mutex};
        _cache.insert_or_assign(std::string(name), std::string(value));
    }

    void SysProperties::remove(std::string_view name) {
        std::unique_lock guard{_mutex};
        if(auto it = _cache.find(name); it != _cache.end()) {
            _cache.erase(it);
        }
    }

    std::vector<std::string> SysProperties::toEnvironment() const {
        std::shared_lock guard{_mutex};
        std::vector<std::string> env;
        env.reserve(_cache.size());
        for(const auto &[name, value] : _cache) {
            env.emplace_back(name + "=" + value);
        }
        return env;
    }

} // namespace lifecycle
