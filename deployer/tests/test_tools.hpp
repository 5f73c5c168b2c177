#pragma once
#include <array>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

namespace test {

    //
    // Access samples directory
    //
    inline std::filesystem::path samples() {
#ifdef DEPLOYER_SAMPLES_DIR
        if(std::filesystem::exists(DEPLOYER_SAMPLES_DIR)) {
            return std::filesystem::path(DEPLOYER_SAMPLES_DIR);
        }
#endif
        std::array<std::filesystem::path, 2> alts = {"samples", "../samples"};
        for(const auto &alt : alts) {
            if(std::filesystem::exists(alt)) {
                return std::filesystem::absolute(alt);
            }
        }
        throw std::runtime_error("Cannot find samples directory");
    }

    //
    // Generate temporary directory for testing
    //
    class TempDir {
        std::filesystem::path _tempDir;

    private:
        static std::filesystem::path genPath() {
            auto tempdir = std::filesystem::temp_directory_path();
            std::string prefix = "helm-deployer-test-";
            std::random_device rd;
            std::mt19937 gen(rd());

            for(int i = 0; i < 1000; ++i) {
                auto num = gen();
                std::string tail = prefix + std::to_string(num);
                auto path = tempdir / tail;
                if(std::filesystem::create_directory(path)) {
                    return path;
                }
            }
            throw std::runtime_error("Tried too many times creating temporary directory");
        }

    public:
        TempDir() : _tempDir(genPath()) {
        }
        TempDir(const TempDir &) = delete;
        TempDir(TempDir &&) = delete;
        TempDir &operator=(const TempDir &) = delete;
        TempDir &operator=(TempDir &&) = delete;

        std::filesystem::path getDir() {
            return _tempDir;
        }

        std::filesystem::path writeFile(const std::string &name, std::string_view content) {
            auto path = _tempDir / name;
            std::filesystem::create_directories(path.parent_path());
            std::ofstream stream(path, std::ios::out | std::ios::trunc);
            stream << content;
            return path;
        }

        void remove() {
            if(_tempDir.empty()) {
                return;
            }

            std::error_code ec;
            std::filesystem::remove_all(_tempDir, ec);
            if(ec) {
                std::cerr << "Failed to clean up temporary directory" << std::endl;
            }
            _tempDir.clear();
        }

        ~TempDir() {
            remove();
        }
    };

} // namespace test
