#include "commitable_file.hpp"

namespace util {
    CommitableFile::CommitableFile(std::filesystem::path targetPath)
        : _new(getNewFile(targetPath)), _target(std::move(targetPath)) {
    }

    std::filesystem::path CommitableFile::getNewFile(const std::filesystem::path &path) {
        std::filesystem::path newPath{path};
        return newPath.replace_extension(path.extension().generic_string() + "+");
    }

    void CommitableFile::deleteNew() noexcept {
        std::error_code ec;
        std::filesystem::remove(_new, ec);
    }

    CommitableFile &CommitableFile::begin() {
        if(!_stream.is_open()) {
            deleteNew();
            _stream.exceptions(std::ios::failbit | std::ios::badbit);
            _stream.open(_new, std::ios_base::trunc | std::ios_base::out);
        }
        return *this;
    }

    CommitableFile &CommitableFile::write(std::string_view content) {
        begin();
        _stream.write(content.data(), static_cast<std::streamsize>(content.size()));
        return *this;
    }

    CommitableFile &CommitableFile::commit() {
        if(_stream.is_open()) {
            _stream.flush();
            _stream.close();
            std::filesystem::rename(_new, _target);
        }
        return *this;
    }

    CommitableFile &CommitableFile::abandon() noexcept {
        _stream.exceptions(std::ios::goodbit);
        if(_stream.is_open()) {
            _stream.close();
            deleteNew();
        }
        return *this;
    }

    CommitableFile::~CommitableFile() {
        abandon();
    }
} // namespace util
