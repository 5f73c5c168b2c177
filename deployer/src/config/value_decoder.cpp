#include "value_decoder.hpp"
#include "conv/json_conv.hpp"
#include "errors/errors.hpp"
#include "logging/log_manager.hpp"
#include <cmath>
#include <lookup_table.hpp>
#include <string_util.hpp>

const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("deployer.config.ValueDecoder");

namespace config {

    static constexpr util::LookupTable<std::string_view, bool, 8> FLAG_WORDS{
        "true",
        true,
        "yes",
        true,
        "on",
        true,
        "1",
        true,
        "false",
        false,
        "no",
        false,
        "off",
        false,
        "0",
        false};

    // Largest magnitude below which every integral double is exact as int64
    static constexpr double MAX_EXACT_INTEGRAL = 9007199254740992.0;

    std::string renderValue(const data::Value &value) {
        if(value.isNull()) {
            return {};
        }
        if(value.isString()) {
            return value.getString();
        }
        if(value.isDouble()) {
            double whole = 0.0;
            double d = value.getDouble();
            if(std::isfinite(d) && std::modf(d, &whole) == 0.0
               && std::fabs(d) < MAX_EXACT_INTEGRAL) {
                return std::to_string(static_cast<int64_t>(whole));
            }
        }
        return conv::JsonHelper::toJson(value);
    }

    std::string renderSetValue(const data::Value &value) {
        if(value.isNull()) {
            return "null";
        }
        return renderValue(value);
    }

    /**
     * Decode string form of a structured input. Returns empty if the string is not JSON.
     */
    static std::optional<data::Value> tryDecode(const std::string &text) {
        try {
            return conv::JsonHelper::parse(text);
        } catch(const errors::JsonParseError &err) {
            LOG.atTrace("decode-fallback").cause(err).log();
            return {};
        }
    }

    ValueSet decodeValues(const data::Value &raw) {
        ValueSet result;
        data::Value decoded = raw;
        if(raw.isString()) {
            if(raw.getString().empty()) {
                return result;
            }
            auto parsed = tryDecode(raw.getString());
            if(!parsed.has_value()) {
                result.expression = raw.getString();
                return result;
            }
            decoded = parsed.value();
        }
        if(decoded.isNull()) {
            return result;
        }
        if(!decoded.isMap()) {
            result.expression = renderValue(decoded);
            return result;
        }
        for(const auto &[key, value] : *decoded.getMap()) {
            result.entries.emplace_back(key, value);
        }
        return result;
    }

    static std::optional<std::shared_ptr<data::List>> decodeList(const data::Value &raw) {
        data::Value decoded = raw;
        if(raw.isString()) {
            if(raw.getString().empty()) {
                return {};
            }
            auto parsed = tryDecode(raw.getString());
            if(parsed.has_value()) {
                decoded = parsed.value();
            } else {
                // Assume it's a single item
                decoded = data::List::of({raw});
            }
        }
        if(!decoded.isList()) {
            return {};
        }
        return decoded.getList();
    }

    std::vector<PluginSpec> decodePlugins(const data::Value &raw) {
        std::vector<PluginSpec> plugins;
        auto list = decodeList(raw);
        if(!list.has_value()) {
            return plugins;
        }
        for(const auto &entry : *list.value()) {
            PluginSpec spec;
            if(entry.isString()) {
                spec.url = entry.getString();
            } else if(entry.isMap()) {
                auto map = entry.getMap();
                auto url = map->get("url");
                if(url.isScalar()) {
                    spec.url = renderValue(url);
                }
                auto version = map->get("version");
                if(version.isScalar() && version.truthy()) {
                    spec.version = renderValue(version);
                }
            }
            if(util::trim(spec.url).empty()) {
                LOG.atWarn("plugin-dropped")
                    .kv("entry", renderValue(entry))
                    .log("plugin.url could not be found");
                continue;
            }
            plugins.emplace_back(std::move(spec));
        }
        return plugins;
    }

    std::vector<std::string> decodeValueFiles(const data::Value &raw) {
        std::vector<std::string> files;
        auto list = decodeList(raw);
        if(!list.has_value()) {
            return files;
        }
        for(const auto &entry : *list.value()) {
            if(entry.isString() && !entry.getString().empty()) {
                files.emplace_back(entry.getString());
            }
        }
        return files;
    }

    bool parseFlag(const data::Value &raw, bool dflt) {
        if(raw.isNull()) {
            return dflt;
        }
        if(raw.isString()) {
            auto text = util::lower(util::trim(raw.getString()));
            if(text.empty()) {
                return dflt;
            }
            return FLAG_WORDS.lookupOr(text, true);
        }
        return raw.truthy();
    }
} // namespace config
