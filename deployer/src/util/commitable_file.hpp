#pragma once
#include <filesystem>
#include <fstream>
#include <string_view>

namespace util {
    /**
     * Writes to a sibling "+" file and renames it over the target on commit(). Destroying the
     * object without a commit discards what was written and leaves the target untouched.
     */
    class CommitableFile {
        std::filesystem::path _new;
        std::filesystem::path _target;
        std::ofstream _stream;

        void deleteNew() noexcept;

    public:
        CommitableFile(const CommitableFile &) = delete;
        CommitableFile(CommitableFile &&) = default;
        CommitableFile &operator=(const CommitableFile &) = delete;
        CommitableFile &operator=(CommitableFile &&) = default;
        explicit CommitableFile(std::filesystem::path targetPath);
        ~CommitableFile();

        static std::filesystem::path getNewFile(const std::filesystem::path &path);

        [[nodiscard]] const std::filesystem::path &getTargetFile() const noexcept {
            return _target;
        }

        [[nodiscard]] const std::filesystem::path &getNewFile() const noexcept {
            return _new;
        }

        /**
         * Open the new file, truncating any stale one.
         * @throws std::ios_base::failure if it cannot be opened
         */
        CommitableFile &begin();

        CommitableFile &write(std::string_view content);

        /**
         * @throws std::filesystem::filesystem_error if the rename fails
         */
        CommitableFile &commit();

        CommitableFile &abandon() noexcept;

        [[nodiscard]] bool is_open() const {
            return _stream.is_open();
        }
    };
} // namespace util
