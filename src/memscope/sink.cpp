#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <lz4frame.h>

#include "exceptions.h"
#include "logging.h"
#include "sink.h"

namespace memscope::io {

using namespace memscope::exception;

FileSink::FileSink(const std::string& file_name, bool overwrite, bool compress)
: d_filename(file_name)
, d_compress(compress)
{
    int flags = O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC;
    if (!overwrite) {
        flags |= O_EXCL;
    }
    do {
        d_fd = ::open(file_name.c_str(), flags, 0644);
    } while (d_fd < 0 && errno == EINTR);
    if (d_fd < 0) {
        throw IoError{"Could not create output file " + file_name + ": " + std::string(strerror(errno))};
    }
    d_buffer.reserve(BUFFER_SIZE);
}

bool
FileSink::writeAll(const char* data, size_t length)
{
    if (d_fd < 0) {
        errno = EBADF;
        return false;
    }
    d_buffer.append(data, length);
    if (d_buffer.size() >= BUFFER_SIZE) {
        return flush();
    }
    return true;
}

bool
FileSink::flush()
{
    if (d_fd < 0) {
        return d_buffer.empty();
    }

    const char* data = d_buffer.data();
    size_t length = d_buffer.size();
    while (length) {
        ssize_t ret = ::write(d_fd, data, length);
        if (ret < 0 && errno != EINTR) {
            return false;
        } else if (ret >= 0) {
            data += ret;
            length -= ret;
        }
    }
    d_buffer.clear();
    return true;
}

bool
FileSink::close()
{
    if (d_fd < 0) {
        return true;
    }

    bool success = flush();
    if (::close(d_fd) != 0) {
        success = false;
    }
    d_fd = -1;

    if (success && d_compress) {
        success = compress();
    }
    return success;
}

bool
FileSink::compress() noexcept
{
    std::ifstream in_file(d_filename, std::ios::binary);
    std::string tmp_filename = d_filename + ".lz4.tmp";
    std::ofstream out_file(tmp_filename, std::ios::binary);
    bool success = static_cast<bool>(in_file) && static_cast<bool>(out_file);

    LZ4F_cctx* ctx = nullptr;
    if (success && LZ4F_isError(LZ4F_createCompressionContext(&ctx, LZ4F_VERSION))) {
        success = false;
    }

    constexpr size_t bufsize = 4 * 1024;
    std::vector<char> buf(bufsize);
    std::vector<char> out(LZ4F_compressBound(bufsize, nullptr) + LZ4F_HEADER_SIZE_MAX);

    if (success) {
        size_t ret = LZ4F_compressBegin(ctx, out.data(), out.size(), nullptr);
        if (LZ4F_isError(ret)) {
            success = false;
        } else {
            out_file.write(out.data(), ret);
        }
    }

    while (success && in_file) {
        in_file.read(buf.data(), buf.size());
        size_t ret = LZ4F_compressUpdate(
                ctx,
                out.data(),
                out.size(),
                buf.data(),
                static_cast<size_t>(in_file.gcount()),
                nullptr);
        if (LZ4F_isError(ret)) {
            success = false;
        } else {
            out_file.write(out.data(), ret);
        }
    }

    if (success) {
        size_t ret = LZ4F_compressEnd(ctx, out.data(), out.size(), nullptr);
        if (LZ4F_isError(ret)) {
            success = false;
        } else {
            out_file.write(out.data(), ret);
        }
    }
    LZ4F_freeCompressionContext(ctx);

    out_file.close();
    if (!in_file.eof() || !out_file) {
        success = false;
    }

    if (!success) {
        LOG(ERROR) << "Failed to compress " << d_filename;
        ::unlink(tmp_filename.c_str());
    } else if (0 != std::rename(tmp_filename.c_str(), d_filename.c_str())) {
        LOG(ERROR) << "Error moving compressed file back to original name: " << strerror(errno);
        ::unlink(tmp_filename.c_str());
        success = false;
    }
    return success;
}

FileSink::~FileSink()
{
    if (d_fd != -1 && !close()) {
        LOG(ERROR) << "Failed to finish writing " << d_filename << ": " << strerror(errno);
    }
}

}  // namespace memscope::io
