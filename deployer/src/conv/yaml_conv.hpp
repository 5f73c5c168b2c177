#pragma once

#include "data/value.hpp"
#include <filesystem>
#include <istream>
#include <yaml-cpp/yaml.h>

namespace conv {

    /**
     * Reads YAML into data::Value. Scalars stay strings; the consumers decide how to interpret
     * them.
     */
    class YamlReader {
    public:
        /**
         * @throws errors::ConfigFileError on unreadable or malformed input
         */
        static data::Value read(const std::filesystem::path &path);
        static data::Value read(std::istream &stream);

        static data::Value rawValue(const YAML::Node &node);
        static data::Value rawMapValue(const YAML::Node &node);
        static data::Value rawSequenceValue(const YAML::Node &node);
    };
} // namespace conv
