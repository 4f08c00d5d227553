#pragma once

#include <memory>
#include <string>

#include "records.h"
#include "sink.h"

namespace memscope::tracking_api {

class RecordWriter
{
  public:
    virtual ~RecordWriter() = default;

    RecordWriter(RecordWriter& other) = delete;
    RecordWriter(RecordWriter&& other) = delete;
    void operator=(const RecordWriter&) = delete;
    void operator=(RecordWriter&&) = delete;

    virtual bool writeSession(const ProfileSession& session) = 0;

    // Flush and close the sink. Must be called to know whether the record
    // was persisted in full.
    bool finish();

  protected:
    explicit RecordWriter(std::unique_ptr<memscope::io::Sink> sink);
    std::unique_ptr<memscope::io::Sink> d_sink;

    bool inline writeRaw(const std::string& data)
    {
        return d_sink->writeAll(data.data(), data.size());
    }
};

/**
 * Canonical JSON rendition of a ProfileSession.
 *
 * Every field of the session is written, including the nested snapshot and
 * leak summary. Active allocations are sorted by address so that equal
 * sessions serialize to identical documents.
 */
class JsonRecordWriter : public RecordWriter
{
  public:
    explicit JsonRecordWriter(std::unique_ptr<memscope::io::Sink> sink, int indent = 2);

    bool writeSession(const ProfileSession& session) override;

  private:
    const int d_indent;
};

std::string
formatTimestamp(wall_clock_t::time_point time_point);

}  // namespace memscope::tracking_api
