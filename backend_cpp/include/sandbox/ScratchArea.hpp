#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <spdlog/spdlog.h>
#include "model/Errors.hpp"

namespace pyguard::sandbox {

namespace fs = std::filesystem;

// Private 0700 directory for one execution, removed when this object dies.
class ScratchArea {
public:
    ScratchArea() {
        std::string pattern = (fs::temp_directory_path() / "pyguard-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');

        if (!mkdtemp(buffer.data())) {
            throw InfrastructureError(std::string("cannot create scratch area: ") + std::strerror(errno));
        }
        path_ = fs::path(buffer.data());
    }

    ~ScratchArea() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) spdlog::warn("⚠️ Scratch area {} not fully removed: {}", path_.string(), ec.message());
    }

    ScratchArea(const ScratchArea&) = delete;
    ScratchArea& operator=(const ScratchArea&) = delete;

    const fs::path& path() const { return path_; }

    void write_file(const std::string& name, const std::string& content) const {
        fs::path target = path_ / name;
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
        out.close();
        if (!out) throw InfrastructureError("cannot write " + target.string());
        std::error_code ec;
        fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        if (ec) throw InfrastructureError("cannot restrict " + target.string() + ": " + ec.message());
    }

private:
    fs::path path_;
};

}
