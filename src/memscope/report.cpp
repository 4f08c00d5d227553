#include "report.h"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <vector>

#include "record_writer.h"

namespace memscope::report {

using namespace memscope::tracking_api;

namespace {  // unnamed

class Table
{
  public:
    void addRow(std::vector<std::string> row)
    {
        if (d_widths.size() < row.size()) {
            d_widths.resize(row.size(), 0);
        }
        for (size_t i = 0; i < row.size(); ++i) {
            d_widths[i] = std::max(d_widths[i], row[i].size());
        }
        d_rows.push_back(std::move(row));
    }

    void print(std::ostream& out) const
    {
        printRule(out);
        for (size_t r = 0; r < d_rows.size(); ++r) {
            out << '|';
            for (size_t i = 0; i < d_widths.size(); ++i) {
                const std::string cell = i < d_rows[r].size() ? d_rows[r][i] : "";
                out << ' ' << cell << std::string(d_widths[i] - cell.size(), ' ') << " |";
            }
            out << '\n';
            // Header separator.
            if (r == 0) {
                printRule(out);
            }
        }
        printRule(out);
    }

  private:
    std::vector<size_t> d_widths;
    std::vector<std::vector<std::string>> d_rows;

    void printRule(std::ostream& out) const
    {
        out << '+';
        for (size_t width : d_widths) {
            out << std::string(width + 2, '-') << '+';
        }
        out << '\n';
    }
};

std::string
formatAddress(address_t address)
{
    std::ostringstream out;
    out << "0x" << std::hex << address;
    return out.str();
}

std::vector<std::pair<address_t, const AllocationRecord*>>
largestAllocations(const MemorySnapshot& snapshot)
{
    std::vector<std::pair<address_t, const AllocationRecord*>> allocations;
    allocations.reserve(snapshot.active_allocations.size());
    for (const auto& [address, record] : snapshot.active_allocations) {
        allocations.emplace_back(address, &record);
    }
    std::sort(allocations.begin(), allocations.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.second->size != rhs.second->size) {
            return lhs.second->size > rhs.second->size;
        }
        return lhs.first < rhs.first;
    });
    return allocations;
}

void
printMemoryStatistics(const ProfileSession& session, std::ostream& out)
{
    const MemorySnapshot& stats = session.final_snapshot;

    out << "=== MEMORY STATISTICS ===\n";
    Table table;
    table.addRow({"Metric", "Value", "Human Readable"});
    table.addRow({"Total Allocated",
                  std::to_string(stats.total_allocated),
                  formatBytes(stats.total_allocated)});
    table.addRow({"Total Freed", std::to_string(stats.total_freed), formatBytes(stats.total_freed)});
    table.addRow(
            {"Current Usage", std::to_string(stats.current_usage), formatBytes(stats.current_usage)});
    table.addRow({"Peak Usage", std::to_string(stats.peak_usage), formatBytes(stats.peak_usage)});
    table.addRow({"Allocations", std::to_string(stats.allocation_count), "-"});
    table.addRow({"Frees", std::to_string(stats.free_count), "-"});
    table.addRow({"Active Allocations", std::to_string(stats.active_allocations.size()), "-"});
    table.print(out);
    out << '\n';
}

void
printLeakAnalysis(const ProfileSession& session, std::ostream& out)
{
    const LeakSummary& leaks = session.leak_summary;

    out << "=== ACTIVE AT END OF PROFILING ===\n";
    if (leaks.leak_count == 0) {
        out << "No allocations were active at end of profiling.\n";
        out << "Residual usage: " << formatBytes(leaks.total_leaked_bytes) << "\n\n";
        return;
    }

    out << leaks.leak_count << " allocations were active at end of profiling (possible leaks).\n";
    out << "Residual usage: " << formatBytes(leaks.total_leaked_bytes) << '\n';
    if (leaks.largest_leak) {
        out << "Largest active allocation: " << formatBytes(*leaks.largest_leak) << '\n';
    }

    out << "\nActive allocations by size:\n";
    Table table;
    table.addRow({"Size", "Count", "Total"});
    for (const auto& [size, count] : leaks.leaks_by_size) {
        table.addRow({formatBytes(size), std::to_string(count), formatBytes(size * count)});
    }
    table.print(out);
    out << '\n';
}

void
printAllocationDetails(const ProfileSession& session, std::ostream& out, size_t top_allocations)
{
    const MemorySnapshot& stats = session.final_snapshot;
    if (stats.active_allocations.empty() || top_allocations == 0) {
        return;
    }

    out << "=== LARGEST ACTIVE ALLOCATIONS ===\n";
    auto allocations = largestAllocations(stats);

    Table table;
    table.addRow({"Address", "Size", "Age", "Thread", "Allocated At"});
    const size_t shown = std::min(top_allocations, allocations.size());
    for (size_t i = 0; i < shown; ++i) {
        const auto& [address, record] = allocations[i];
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
                session.end_time - record->timestamp);
        table.addRow(
                {formatAddress(address),
                 formatBytes(record->size),
                 formatDuration(std::max(age, std::chrono::milliseconds(0))),
                 std::to_string(record->thread_id),
                 record->call_stack.empty() ? "?" : record->call_stack.front()});
    }
    table.print(out);

    if (allocations.size() > shown) {
        out << "... and " << allocations.size() - shown << " more allocations\n";
    }
    out << '\n';
}

}  // unnamed namespace

std::string
formatBytes(size_t bytes)
{
    static const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t n_units = sizeof(UNITS) / sizeof(UNITS[0]);

    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < n_units - 1) {
        size /= 1024.0;
        ++unit;
    }

    if (unit == 0) {
        return std::to_string(bytes) + " B";
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2f %s", size, UNITS[unit]);
    return buf;
}

std::string
formatDuration(std::chrono::milliseconds duration)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%.2fs", static_cast<double>(duration.count()) / 1000.0);
    return buf;
}

void
printSummary(const ProfileSession& session, std::ostream& out, size_t top_allocations)
{
    out << "\n=== MEMORY PROFILE REPORT ===\n";
    out << "Process: " << session.command << " (PID: " << session.process_id << ")\n";
    out << "Duration: " << formatDuration(session.duration) << '\n';
    out << "Profiling Period: " << formatTimestamp(session.start_time) << " to "
        << formatTimestamp(session.end_time) << '\n';
    out << "Stopped: " << stopReasonName(session.stop_reason);
    if (session.exit_status) {
        out << " (exit status " << *session.exit_status << ")";
    }
    out << '\n';
    out << "Samples: " << session.samples_taken << " taken, " << session.samples_skipped
        << " skipped\n\n";

    printMemoryStatistics(session, out);
    printLeakAnalysis(session, out);
    printAllocationDetails(session, out, top_allocations);
    out.flush();
}

void
printLiveStats(const MemorySnapshot& snapshot, std::ostream& out)
{
    out << "\r\x1b[2K=== Live Memory Stats ===\n";
    out << "Current Usage: " << snapshot.current_usage / 1024 << " KB\n";
    out << "Peak Usage: " << snapshot.peak_usage / 1024 << " KB\n";
    out << "Total Allocated: " << snapshot.total_allocated / 1024 << " KB\n";
    out << "Allocations: " << snapshot.allocation_count << '\n';
    out << "Active Allocations: " << snapshot.active_allocations.size() << '\n';
    out << "========================" << std::endl;
}

std::string
renderMarkdown(const ProfileSession& session)
{
    std::ostringstream out;
    const MemorySnapshot& stats = session.final_snapshot;
    const LeakSummary& leaks = session.leak_summary;

    out << "# Memory Profile Report\n\n";
    out << "**Process:** " << session.command << " (PID: " << session.process_id << ")\n";
    out << "**Duration:** " << formatDuration(session.duration) << '\n';
    out << "**Start Time:** " << formatTimestamp(session.start_time) << '\n';
    out << "**End Time:** " << formatTimestamp(session.end_time) << '\n';
    out << "**Stopped:** " << stopReasonName(session.stop_reason) << "\n\n";

    out << "## Memory Statistics\n\n";
    out << "- **Total Allocated:** " << formatBytes(stats.total_allocated) << '\n';
    out << "- **Total Freed:** " << formatBytes(stats.total_freed) << '\n';
    out << "- **Current Usage:** " << formatBytes(stats.current_usage) << '\n';
    out << "- **Peak Usage:** " << formatBytes(stats.peak_usage) << '\n';
    out << "- **Allocation Count:** " << stats.allocation_count << '\n';
    out << "- **Free Count:** " << stats.free_count << "\n\n";

    out << "## Active at End of Profiling\n\n";
    if (leaks.leak_count == 0) {
        out << "No allocations were active at end of profiling.\n";
        out << "Residual usage: " << formatBytes(leaks.total_leaked_bytes) << '\n';
        return out.str();
    }

    out << "**" << leaks.leak_count << " allocations active at end of profiling (possible leaks)**\n\n";
    out << "- **Residual Usage:** " << formatBytes(leaks.total_leaked_bytes) << '\n';
    if (leaks.largest_leak) {
        out << "- **Largest Allocation:** " << formatBytes(*leaks.largest_leak) << '\n';
    }
    out << "\n### By Size\n\n";
    out << "| Size | Count | Total |\n";
    out << "|------|-------|-------|\n";
    for (const auto& [size, count] : leaks.leaks_by_size) {
        out << "| " << formatBytes(size) << " | " << count << " | " << formatBytes(size * count)
            << " |\n";
    }
    return out.str();
}

}  // namespace memscope::report
