#include "lifecycle/run_environment.hpp"
#include "test_tools.hpp"
#include "util/commitable_file.hpp"
#include <catch2/catch_all.hpp>
#include <fstream>

// NOLINTBEGIN
static std::string readAll(const std::filesystem::path &path) {
    std::ifstream stream(path);
    return {(std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>()};
}

SCENARIO("Preparing the run environment", "[lifecycle]") {
    test::TempDir tempDir;
    auto env = std::make_shared<lifecycle::SysProperties>();
    lifecycle::RunEnvironment runEnvironment(env, "/root/.helm/", tempDir.getDir());

    GIVEN("No inline kubeconfig") {
        runEnvironment.prepare();
        THEN("XDG directories point at the helm home") {
            REQUIRE(env->get("XDG_DATA_HOME") == "/root/.helm/");
            REQUIRE(env->get("XDG_CACHE_HOME") == "/root/.helm/");
            REQUIRE(env->get("XDG_CONFIG_HOME") == "/root/.helm/");
        }
        THEN("KUBECONFIG is untouched") {
            REQUIRE_FALSE(env->exists("KUBECONFIG"));
            REQUIRE_FALSE(std::filesystem::exists(runEnvironment.kubeconfigPath()));
        }
        THEN("The plugin cache is under the helm home") {
            REQUIRE(runEnvironment.pluginDirectory() == "/root/.helm/helm/plugins");
        }
        THEN("Children receive the variables") {
            auto entries = env->toEnvironment();
            REQUIRE(
                std::find(entries.begin(), entries.end(), "XDG_DATA_HOME=/root/.helm/")
                != entries.end());
        }
    }

    GIVEN("An inline kubeconfig") {
        env->put("KUBECONFIG_FILE", "clusters: []\n");
        runEnvironment.prepare();
        THEN("It is written to the work directory") {
            auto path = tempDir.getDir() / "kubeconfig.yml";
            REQUIRE(env->get("KUBECONFIG") == path.string());
            REQUIRE(readAll(path) == "clusters: []\n");
            REQUIRE_FALSE(std::filesystem::exists(util::CommitableFile::getNewFile(path)));
        }
    }
}

SCENARIO("Commit-on-success files", "[lifecycle]") {
    test::TempDir tempDir;
    auto target = tempDir.writeFile("config.yml", "old");

    GIVEN("A file that is written but not committed") {
        {
            util::CommitableFile file(target);
            file.write("new");
        }
        THEN("The target is unchanged and the new file is removed") {
            REQUIRE(readAll(target) == "old");
            REQUIRE_FALSE(std::filesystem::exists(util::CommitableFile::getNewFile(target)));
        }
    }
    GIVEN("A committed file") {
        util::CommitableFile file(target);
        file.write("new").commit();
        THEN("The target is replaced") {
            REQUIRE(readAll(target) == "new");
            REQUIRE_FALSE(file.is_open());
        }
    }
}
// NOLINTEND
