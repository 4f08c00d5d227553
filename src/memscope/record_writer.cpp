#include "record_writer.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <vector>

#include <boost/json.hpp>
#include <boost/locale/encoding_utf.hpp>

namespace memscope::tracking_api {

using namespace std::chrono;

namespace {  // unnamed

// Record strings come from the target (argv, /proc, symbol names) and need not
// be valid UTF-8. Invalid sequences are dropped so the document always parses.
boost::json::string
jsonText(const std::string& value)
{
    return boost::json::string(
            boost::locale::conv::utf_to_utf<char>(value, boost::locale::conv::skip));
}

void
prettyPrint(std::string& out, const boost::json::value& value, int indent, int depth)
{
    switch (value.kind()) {
        case boost::json::kind::object: {
            const boost::json::object& object = value.get_object();
            if (object.empty()) {
                out += "{}";
                break;
            }
            out += "{\n";
            bool first = true;
            for (const auto& member : object) {
                if (!first) {
                    out += ",\n";
                }
                first = false;
                out.append(indent * (depth + 1), ' ');
                out += boost::json::serialize(boost::json::string(member.key()));
                out += ": ";
                prettyPrint(out, member.value(), indent, depth + 1);
            }
            out += '\n';
            out.append(indent * depth, ' ');
            out += '}';
        } break;
        case boost::json::kind::array: {
            const boost::json::array& array = value.get_array();
            if (array.empty()) {
                out += "[]";
                break;
            }
            out += "[\n";
            bool first = true;
            for (const auto& element : array) {
                if (!first) {
                    out += ",\n";
                }
                first = false;
                out.append(indent * (depth + 1), ' ');
                prettyPrint(out, element, indent, depth + 1);
            }
            out += '\n';
            out.append(indent * depth, ' ');
            out += ']';
        } break;
        default:
            out += boost::json::serialize(value);
    }
}

std::string
formatAddress(address_t address)
{
    char buf[2 + 2 * sizeof(address_t) + 1];
    snprintf(buf, sizeof(buf), "0x%lx", static_cast<unsigned long>(address));
    return buf;
}

boost::json::object
allocationToJson(address_t address, const AllocationRecord& record)
{
    boost::json::array call_stack;
    for (const auto& frame : record.call_stack) {
        call_stack.emplace_back(jsonText(frame));
    }

    boost::json::object object;
    object["address"] = formatAddress(address);
    object["size"] = record.size;
    object["timestamp"] = formatTimestamp(record.timestamp);
    object["thread_id"] = record.thread_id;
    object["call_stack"] = std::move(call_stack);
    return object;
}

boost::json::object
snapshotToJson(const MemorySnapshot& snapshot)
{
    std::vector<const ledger_t::value_type*> entries;
    entries.reserve(snapshot.active_allocations.size());
    for (const auto& entry : snapshot.active_allocations) {
        entries.push_back(&entry);
    }
    std::sort(entries.begin(), entries.end(), [](const auto* lhs, const auto* rhs) {
        return lhs->first < rhs->first;
    });

    boost::json::array active_allocations;
    active_allocations.reserve(entries.size());
    for (const auto* entry : entries) {
        active_allocations.emplace_back(allocationToJson(entry->first, entry->second));
    }

    boost::json::object object;
    object["total_allocated"] = snapshot.total_allocated;
    object["total_freed"] = snapshot.total_freed;
    object["current_usage"] = snapshot.current_usage;
    object["peak_usage"] = snapshot.peak_usage;
    object["allocation_count"] = snapshot.allocation_count;
    object["free_count"] = snapshot.free_count;
    object["active_allocations"] = std::move(active_allocations);
    return object;
}

boost::json::object
leakSummaryToJson(const LeakSummary& summary)
{
    boost::json::array leaks_by_size;
    for (const auto& [size, count] : summary.leaks_by_size) {
        leaks_by_size.emplace_back(boost::json::object{{"size", size}, {"count", count}});
    }

    boost::json::object object;
    object["total_leaked_bytes"] = summary.total_leaked_bytes;
    object["leak_count"] = summary.leak_count;
    if (summary.largest_leak) {
        object["largest_leak"] = *summary.largest_leak;
    } else {
        object["largest_leak"] = nullptr;
    }
    object["leaks_by_size"] = std::move(leaks_by_size);
    return object;
}

boost::json::object
sessionToJson(const ProfileSession& session)
{
    boost::json::object object;
    object["format"] = MAGIC;
    object["version"] = CURRENT_RECORD_VERSION;
    object["pid"] = session.process_id;
    object["command"] = jsonText(session.command);
    object["start_time"] = formatTimestamp(session.start_time);
    object["end_time"] = formatTimestamp(session.end_time);
    object["duration_ms"] = session.duration.count();
    object["stop_reason"] = stopReasonName(session.stop_reason);
    if (session.exit_status) {
        object["exit_status"] = *session.exit_status;
    } else {
        object["exit_status"] = nullptr;
    }
    object["interval_ms"] = session.interval.count();
    object["max_duration_ms"] = session.max_duration.count();
    object["samples_taken"] = session.samples_taken;
    object["samples_skipped"] = session.samples_skipped;
    object["memory_stats"] = snapshotToJson(session.final_snapshot);
    object["leak_summary"] = leakSummaryToJson(session.leak_summary);
    return object;
}

}  // unnamed namespace

std::string
formatTimestamp(wall_clock_t::time_point time_point)
{
    const auto millis = duration_cast<milliseconds>(time_point.time_since_epoch()).count();
    time_t seconds = static_cast<time_t>(millis / 1000);
    long remainder = static_cast<long>(millis % 1000);
    if (remainder < 0) {
        remainder += 1000;
        seconds -= 1;
    }

    struct tm utc;
    if (gmtime_r(&seconds, &utc) == nullptr) {
        return "invalid-time";
    }
    char date[32];
    strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char result[48];
    snprintf(result, sizeof(result), "%s.%03ldZ", date, remainder);
    return result;
}

RecordWriter::RecordWriter(std::unique_ptr<memscope::io::Sink> sink)
: d_sink(std::move(sink))
{
}

bool
RecordWriter::finish()
{
    return d_sink->close();
}

JsonRecordWriter::JsonRecordWriter(std::unique_ptr<memscope::io::Sink> sink, int indent)
: RecordWriter(std::move(sink))
, d_indent(indent)
{
}

bool
JsonRecordWriter::writeSession(const ProfileSession& session)
{
    const boost::json::value document = sessionToJson(session);

    std::string text;
    if (d_indent > 0) {
        prettyPrint(text, document, d_indent, 0);
    } else {
        text = boost::json::serialize(document);
    }
    text += '\n';
    return writeRaw(text);
}

}  // namespace memscope::tracking_api
