#ifndef _WIN32
#include "./temp.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

using namespace incpath;

temporary_dir temporary_dir::create_in(const std::filesystem::path& parent) {
    auto file = (parent / "incpath-tmp-XXXXXX").string();

    const char* tempdir_path = ::mkdtemp(file.data());

    if (tempdir_path == nullptr) {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                "Failed to create a temporary directory");
    }
    auto path = std::filesystem::path(tempdir_path);
    return temporary_dir(std::make_shared<impl>(std::move(path)));
}
#endif
