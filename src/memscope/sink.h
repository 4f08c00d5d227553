#pragma once

#include <cerrno>
#include <memory>
#include <string>
#include <unistd.h>

namespace memscope::io {

class Sink
{
  public:
    virtual ~Sink(){};
    virtual bool writeAll(const char* data, size_t length) = 0;
    virtual bool flush()
    {
        return true;
    }
    // Flush and release the destination. Returns false if any data was lost.
    virtual bool close()
    {
        return flush();
    }
};

class FileSink : public memscope::io::Sink
{
  public:
    FileSink(const std::string& file_name, bool overwrite, bool compress);
    ~FileSink() override;
    FileSink(FileSink&) = delete;
    FileSink(FileSink&&) = delete;
    void operator=(const FileSink&) = delete;
    void operator=(const FileSink&&) = delete;

    bool writeAll(const char* data, size_t length) override;
    bool flush() override;
    bool close() override;

  private:
    bool compress() noexcept;

    std::string d_filename;
    bool d_compress{false};
    int d_fd{-1};
    const size_t BUFFER_SIZE{64 * 1024};  // 64 KiB
    std::string d_buffer;
};

}  // namespace memscope::io
