// SPDX-License-Identifier: Apache-2.0
#include "Job.hpp"

#include <pipeline/ProgressTracker.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <random>

namespace scribe
{

auto formatTimestamp(Timestamp timestamp) -> std::string
{
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::milliseconds>(timestamp));
}

auto toJson(const JobSnapshot& snapshot) -> nlohmann::json
{
    auto doc = nlohmann::json::object();
    doc["id"] = snapshot.id;
    doc["status"] = jobStatusName(snapshot.status);
    doc["progress"] = snapshot.progress;
    doc["stage"] = snapshot.stage;
    doc["submittedAt"] = formatTimestamp(snapshot.submittedAt);

    if (snapshot.startedAt)
        doc["startedAt"] = formatTimestamp(*snapshot.startedAt);
    if (snapshot.completedAt)
        doc["completedAt"] = formatTimestamp(*snapshot.completedAt);
    if (snapshot.transcription)
        doc["transcription"] = *snapshot.transcription;
    if (snapshot.downloadUrl)
        doc["downloadUrl"] = *snapshot.downloadUrl;
    if (snapshot.error)
    {
        doc["error"] = snapshot.error->message;
        doc["errorCode"] = errorCodeName(snapshot.error->code);
    }

    return doc;
}

auto generateJobId() -> JobId
{
    thread_local auto engine = std::mt19937_64 { std::random_device {}() };

    auto bytes = std::array<std::uint8_t, 16> {};
    auto distribution = std::uniform_int_distribution<unsigned> { 0, 255 };
    for (auto& byte: bytes)
        byte = static_cast<std::uint8_t>(distribution(engine));

    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    auto id = std::string {};
    id.reserve(36);
    for (auto i = std::size_t { 0 }; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            id += '-';
        id += std::format("{:02x}", bytes[i]);
    }
    return id;
}

JobRecord::JobRecord(JobId id)
{
    _state.id = std::move(id);
    _state.status = JobStatus::Queued;
    _state.progress = 0;
    _state.stage = std::string(stage::Queued);
    _state.submittedAt = std::chrono::system_clock::now();
}

auto JobRecord::markProcessing() -> bool
{
    auto lock = std::lock_guard(_mutex);
    if (_state.status != JobStatus::Queued)
        return false;

    _state.status = JobStatus::Processing;
    _state.startedAt = std::chrono::system_clock::now();
    _state.stage = std::string(stage::Starting);
    _state.progress = std::max(_state.progress, checkpoint::Starting);
    return true;
}

auto JobRecord::updateProgress(std::string_view stageName, int percent) -> bool
{
    auto lock = std::lock_guard(_mutex);
    if (_state.status != JobStatus::Processing)
        return false;

    _state.stage = std::string(stageName);
    _state.progress = std::clamp(std::max(_state.progress, percent), 0, checkpoint::ActiveCeiling);
    return true;
}

auto JobRecord::markCompleted(std::string transcription, std::string outputFile, std::string downloadUrl) -> bool
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_state.status != JobStatus::Processing)
            return false;

        _state.status = JobStatus::Completed;
        _state.completedAt = std::chrono::system_clock::now();
        _state.progress = checkpoint::Complete;
        _state.stage = std::string(stage::Completed);
        _state.transcription = std::move(transcription);
        _state.outputFile = std::move(outputFile);
        _state.downloadUrl = std::move(downloadUrl);
    }
    _terminalReached.notify_all();
    return true;
}

auto JobRecord::markFailed(Error error) -> bool
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_state.status != JobStatus::Processing)
            return false;

        _state.status = JobStatus::Failed;
        _state.completedAt = std::chrono::system_clock::now();
        _state.progress = checkpoint::Complete;
        _state.stage = std::string(stage::Failed);
        _state.error = std::move(error);
    }
    _terminalReached.notify_all();
    return true;
}

auto JobRecord::snapshot() const -> JobSnapshot
{
    auto lock = std::lock_guard(_mutex);
    return _state;
}

auto JobRecord::waitUntilTerminal(std::chrono::milliseconds timeout) const -> JobSnapshot
{
    auto lock = std::unique_lock(_mutex);
    _terminalReached.wait_for(lock, timeout, [this] { return isTerminal(_state.status); });
    return _state;
}

} // namespace scribe
