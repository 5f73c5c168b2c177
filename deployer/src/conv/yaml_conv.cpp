#include "yaml_conv.hpp"
#include "errors/errors.hpp"
#include <fstream>

namespace conv {

    data::Value YamlReader::read(const std::filesystem::path &path) {
        std::ifstream stream{path};
        if(!stream.is_open()) {
            throw errors::ConfigFileError("Unable to read inputs file " + path.string());
        }
        return read(stream);
    }

    data::Value YamlReader::read(std::istream &stream) {
        //
        // yaml-cpp has a number of flaws, but short of rewriting a YAML parser, is
        // sufficient to get going
        //
        try {
            YAML::Node root = YAML::Load(stream);
            return rawValue(root);
        } catch(const YAML::Exception &err) {
            throw errors::ConfigFileError(std::string("Malformed YAML: ") + err.what());
        }
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::Value YamlReader::rawValue(const YAML::Node &node) {
        switch(node.Type()) {
            case YAML::NodeType::Map:
                return rawMapValue(node);
            case YAML::NodeType::Sequence:
                return rawSequenceValue(node);
            case YAML::NodeType::Scalar:
                return node.as<std::string>();
            default:
                break;
        }
        return {};
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::Value YamlReader::rawSequenceValue(const YAML::Node &node) {
        auto newList{std::make_shared<data::List>()};
        for(const auto &i : node) {
            newList->push(rawValue(i));
        }
        return newList;
    }

    // NOLINTNEXTLINE(*-no-recursion)
    data::Value YamlReader::rawMapValue(const YAML::Node &node) {
        auto newMap{std::make_shared<data::Map>()};
        for(const auto &i : node) {
            auto key = i.first.as<std::string>();
            newMap->put(key, rawValue(i.second));
        }
        return newMap;
    }
} // namespace conv
