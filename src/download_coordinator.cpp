#include "splitfetch/download_coordinator.hpp"

#include "splitfetch/capability_probe.hpp"
#include "splitfetch/chunk_fetcher.hpp"
#include "splitfetch/detail/task_gate.hpp"
#include "splitfetch/errors.hpp"
#include "splitfetch/merger.hpp"
#include "splitfetch/range_planner.hpp"
#include "splitfetch/scratch_space.hpp"

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace splitfetch {

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Idle:     return "idle";
        case JobState::Probing:  return "probing";
        case JobState::Planning: return "planning";
        case JobState::Fetching: return "fetching";
        case JobState::Merging:  return "merging";
        case JobState::Done:     return "done";
        case JobState::Failed:   return "failed";
    }
    return "unknown";
}

class DownloadCoordinator::Impl {
public:
    Impl(DownloadOptions options, HttpClientPtr client, EventSink sink)
        : options_(std::move(options)),
        client_(std::move(client)),
        sink_(std::move(sink)) {
        if (!client_) {
            throw std::invalid_argument("DownloadCoordinator requires an HTTP client");
        }
        if (options_.url.empty() || options_.destination.empty()) {
            throw std::invalid_argument("url and output are required");
        }
        if (options_.concurrency <= 0) {
            throw std::invalid_argument(fmt::format("concurrency must be positive, got {}", options_.concurrency));
        }

        job_.url = options_.url;
        job_.destination = options_.destination;
        job_.worker_count = options_.concurrency;
    }

    void download() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != JobState::Idle) {
                throw std::logic_error("DownloadCoordinator runs a single job");
            }
            state_ = JobState::Probing;
        }

        emit(makeEvent(EventKind::ProbeStarted));
        ProbeResult probe;
        try {
            probe = CapabilityProbe(client_).probe(job_.url);
        } catch (const RangeUnsupportedError& ex) {
            fail(ex.what());
            throw;
        }

        setState(JobState::Planning);
        std::vector<ByteRange> ranges = planRanges(probe.total_size, job_.worker_count);
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            job_.total_size = probe.total_size;
            job_.ranges = ranges;
        }
        auto size_event = makeEvent(EventKind::SizeDiscovered);
        emit(size_event);

        std::optional<ScratchSpace> scratch;
        try {
            scratch.emplace(ScratchSpace::create(options_.scratch_root));
        } catch (const std::filesystem::filesystem_error& ex) {
            fail(ex.what());
            throw DownloadError(ex.what());
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            scratch_dir_ = scratch->directory();
        }
        auto ranges_event = makeEvent(EventKind::RangesPlanned);
        ranges_event.ranges = ranges;
        emit(ranges_event);

        setState(JobState::Fetching);
        fetchAll(*scratch, ranges);

        setState(JobState::Merging);
        emit(makeEvent(EventKind::MergeStarted));
        try {
            mergePieces(*scratch, ranges.size(), job_.destination);
        } catch (const MergeError& ex) {
            fail(ex.what());
            throw;
        }

        setState(JobState::Done);
        emit(makeEvent(EventKind::Completed));
    }

    [[nodiscard]] JobState state() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return state_;
    }

    [[nodiscard]] DownloadJob job() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return job_;
    }

    [[nodiscard]] std::vector<ChunkResult> chunkResults() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return results_;
    }

    [[nodiscard]] std::filesystem::path scratchDirectory() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return scratch_dir_;
    }

private:
    // One thread per range, all joined before returning. Task outcomes are
    // recorded, not inspected.
    void fetchAll(const ScratchSpace& scratch, const std::vector<ByteRange>& ranges) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            results_.assign(ranges.size(), ChunkResult{});
        }

        const ChunkFetcher fetcher(client_);
        detail::TaskGate gate(options_.max_parallel);

        std::vector<std::thread> workers;
        workers.reserve(ranges.size());
        try {
            for (const auto& range : ranges) {
                workers.emplace_back([this, &fetcher, &gate, &scratch, range]() {
                    detail::GateSlot slot(gate);
                    runChunk(fetcher, scratch, range);
                });
            }
        } catch (const std::exception& ex) {
            // Tasks already running finish normally; nothing gets merged.
            const std::string message = fmt::format("Cannot start fetch task {} of {}: {}",
                                                    workers.size(), ranges.size(), ex.what());
            joinAll(workers);
            fail(message);
            throw DownloadError(message);
        }
        joinAll(workers);
    }

    void runChunk(const ChunkFetcher& fetcher, const ScratchSpace& scratch, const ByteRange& range) {
        auto started = makeEvent(EventKind::ChunkStarted);
        started.range = range;
        emit(started);

        ChunkResult result;
        result.index = range.index;
        auto finished = makeEvent(EventKind::ChunkFinished);
        finished.range = range;
        try {
            result.bytes_written = fetcher.fetch(job_.url, range, scratch.piecePath(range.index));
            result.ok = true;
        } catch (const std::exception& ex) {
            result.error_message = ex.what();
            finished.kind = EventKind::ChunkFailed;
            finished.message = result.error_message;
        }

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            results_[range.index] = result;
        }
        emit(finished);
    }

    static void joinAll(std::vector<std::thread>& workers) {
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers.clear();
    }

    DownloadEvent makeEvent(EventKind kind) const {
        DownloadEvent event;
        event.kind = kind;
        event.total_size = job_.total_size;
        return event;
    }

    void emit(const DownloadEvent& event) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (sink_) {
            sink_(event);
        }
    }

    void setState(JobState state) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = state;
    }

    void fail(const std::string& message) {
        setState(JobState::Failed);
        auto event = makeEvent(EventKind::Failed);
        event.message = message;
        emit(event);
    }

    DownloadOptions options_;
    HttpClientPtr client_;
    EventSink sink_;

    mutable std::mutex state_mutex_;
    std::mutex sink_mutex_;

    JobState state_{JobState::Idle};
    DownloadJob job_;
    std::vector<ChunkResult> results_;
    std::filesystem::path scratch_dir_;
};

DownloadCoordinator::DownloadCoordinator(DownloadOptions options, HttpClientPtr client, EventSink sink)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(client), std::move(sink))) {}

DownloadCoordinator::~DownloadCoordinator() = default;

void DownloadCoordinator::download() { impl_->download(); }

JobState DownloadCoordinator::state() const { return impl_->state(); }

DownloadJob DownloadCoordinator::job() const { return impl_->job(); }

std::vector<ChunkResult> DownloadCoordinator::chunkResults() const { return impl_->chunkResults(); }

std::filesystem::path DownloadCoordinator::scratchDirectory() const { return impl_->scratchDirectory(); }

} // namespace splitfetch
