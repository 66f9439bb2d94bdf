//===----------------------------------------------------------------------===//
//
// Part of the Rexta project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/file_io.cpp
// Purpose: File helpers shared by rexta-asm and rexta-sim.
// Key invariants: See file_io.hpp.
// Ownership/Lifetime: Stateless.
// Links: src/tools/common/file_io.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements source and binary image file access for the CLI tools.

#include "tools/common/file_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace rexta::tools::common
{
namespace
{
constexpr auto kMaxSourceSize = static_cast<std::streamoff>(64ULL * 1024 * 1024);

support::Diag ioError(std::string message)
{
    return support::makeError({}, std::move(message));
}

/// @brief Open @p path and report its size, rejecting files over @p limit.
support::Expected<std::streamoff> measure(std::ifstream &in,
                                          const std::string &path,
                                          std::streamoff limit,
                                          const char *what)
{
    in.seekg(0, std::ios::end);
    const auto size = static_cast<std::streamoff>(in.tellg());
    in.seekg(0, std::ios::beg);
    if (size < 0)
        return ioError("unable to determine size of " + path);
    if (size > limit)
    {
        return ioError(std::string(what) + " too large: " + path + " (limit: " +
                       std::to_string(limit) + " bytes)");
    }
    return size;
}
} // namespace

support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("unable to open " + path);

    auto size = measure(in, path, kMaxSourceSize, "source file");
    if (!size)
        return size.error();

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return ioError("out of memory reading " + path);
    }

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
        return ioError("source manager exhausted file identifiers");

    LoadedSource source{};
    source.buffer = std::move(contents);
    source.fileId = fileId;
    return source;
}

support::Expected<isa::BinaryImage> loadBinaryImage(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("unable to open " + path);

    auto size = measure(in, path, static_cast<std::streamoff>(isa::kMemorySize), "image");
    if (!size)
        return size.error();

    isa::BinaryImage image(static_cast<size_t>(size.value()));
    if (!image.empty() &&
        !in.read(reinterpret_cast<char *>(image.data()), static_cast<std::streamsize>(image.size())))
    {
        return ioError("error reading " + path);
    }
    return image;
}

support::Expected<void> writeBinaryImage(const std::string &path, const isa::BinaryImage &image)
{
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            return ioError("unable to open " + path + " for writing");
        out.write(reinterpret_cast<const char *>(image.data()),
                  static_cast<std::streamsize>(image.size()));
        out.flush();
        if (out)
            return {};
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    return ioError("error writing " + path);
}

std::string defaultImagePath(const std::string &input)
{
    std::filesystem::path p(input);
    p.replace_extension(".bin");
    return p.string();
}

} // namespace rexta::tools::common
