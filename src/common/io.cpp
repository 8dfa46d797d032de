#include <cerrno>
#include <cstdio>
#include <memory>
#include <string>

#include "common/io.hpp"

namespace paradox_data {

namespace {

struct File_Closer {
    void operator()(std::FILE* f) const noexcept
    {
        std::fclose(f);
    }
};

using Unique_File = std::unique_ptr<std::FILE, File_Closer>;

} // namespace

Result<std::vector<char>, IO_Error_Code> file_to_bytes(std::string_view path)
{
    const std::string terminated_path { path };

    errno = 0;
    Unique_File stream { std::fopen(terminated_path.c_str(), "rb") };
    if (!stream) {
        return errno == ENOENT ? IO_Error_Code::file_not_found : IO_Error_Code::cannot_open;
    }

    constexpr Size block_size = 4096;
    char buffer[block_size];

    std::vector<char> out;
    Size read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream.get());
        if (std::ferror(stream.get())) {
            return IO_Error_Code::read_error;
        }
        out.insert(out.end(), buffer, buffer + read_size);
    } while (read_size == block_size);

    return out;
}

} // namespace paradox_data
