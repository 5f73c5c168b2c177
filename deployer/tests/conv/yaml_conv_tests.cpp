#include "conv/yaml_conv.hpp"
#include "errors/errors.hpp"
#include "test_tools.hpp"
#include <catch2/catch_all.hpp>
#include <sstream>

// NOLINTBEGIN
SCENARIO("Reading an inputs file", "[yaml]") {
    GIVEN("The sample inputs file") {
        auto value = conv::YamlReader::read(test::samples() / "inputs.yml");
        THEN("Top level inputs are a mapping") {
            REQUIRE(value.isMap());
            auto inputs = value.getMap();
            REQUIRE(inputs->get("release").getString() == "hello");
            REQUIRE(inputs->get("timeout").getString() == "5m0s");
        }
        THEN("Sequences and mappings are kept structured") {
            auto inputs = value.getMap();
            REQUIRE(inputs->get("value-files").getList()->size() == 2);
            auto plugins = inputs->get("plugins").getList();
            REQUIRE(plugins->size() == 2);
            REQUIRE(plugins->at(0).getMap()->get("version").getString() == "3.1.3");
            REQUIRE(plugins->at(1).getString() == "https://github.com/jkroepke/helm-secrets");
        }
        THEN("Scalars are read as text") {
            auto values = value.getMap()->get("values").getMap();
            REQUIRE(values->get("replicas").getString() == "2");
        }
    }
    GIVEN("Malformed YAML") {
        std::stringstream stream("release: [unterminated");
        THEN("A configuration error is raised") {
            REQUIRE_THROWS_AS(conv::YamlReader::read(stream), errors::ConfigFileError);
        }
    }
    GIVEN("A missing file") {
        test::TempDir tempDir;
        THEN("A configuration error is raised") {
            REQUIRE_THROWS_AS(
                conv::YamlReader::read(tempDir.getDir() / "none.yml"), errors::ConfigFileError);
        }
    }
}
// NOLINTEND
