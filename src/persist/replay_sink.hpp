#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "persist/file_sink.hpp"

namespace persist {

struct SinkResult {
    bool ok{true};
    int error_code{0}; // errno where the failure came from the OS
    std::string detail;

    static SinkResult success() { return {}; }
    static SinkResult failure(int code, std::string why) { return {false, code, std::move(why)}; }
};

// Append-only destination for assembled replay bytes. Written by a single
// thread; refuses writes once finalized or aborted.
class IReplaySink {
public:
    virtual ~IReplaySink() = default;

    SinkResult write(std::span<const std::byte> bytes) {
        const std::span<const std::byte> parts[1] = {bytes};
        return write_gather(parts);
    }

    // Appends every part, in order, as one logical write.
    virtual SinkResult write_gather(std::span<const std::span<const std::byte>> parts) = 0;

    // Commits the output; fails unless exactly `total_bytes` were written.
    virtual SinkResult finalize(std::uint64_t total_bytes) = 0;

    // Discards everything written so far. Idempotent.
    virtual void abort() noexcept = 0;

    // True when an incomplete artifact could not be removed.
    virtual bool leaves_partial() const noexcept = 0;

    virtual std::uint64_t bytes_written() const noexcept = 0;
};

class MemoryReplaySink : public IReplaySink {
public:
    SinkResult write_gather(std::span<const std::span<const std::byte>> parts) override;
    SinkResult finalize(std::uint64_t total_bytes) override;
    void abort() noexcept override;
    bool leaves_partial() const noexcept override { return false; }
    std::uint64_t bytes_written() const noexcept override { return buffer_.size(); }

    bool finalized() const noexcept { return state_ == State::Finalized; }
    // Complete replay once finalized; empty after abort.
    const std::vector<std::byte>& bytes() const noexcept { return buffer_; }

private:
    enum class State { Open, Finalized, Aborted };

    std::vector<std::byte> buffer_;
    State state_{State::Open};
};

// Streams to "<path>.partial" and renames it to `path` once finalized, so a
// file at `path` is always a complete replay.
class FileReplaySink : public IReplaySink {
public:
    explicit FileReplaySink(std::filesystem::path path);
    FileReplaySink(std::filesystem::path path, std::unique_ptr<IFileSink> file);
    ~FileReplaySink() override;

    FileReplaySink(const FileReplaySink&) = delete;
    FileReplaySink& operator=(const FileReplaySink&) = delete;

    SinkResult write_gather(std::span<const std::span<const std::byte>> parts) override;
    SinkResult finalize(std::uint64_t total_bytes) override;
    void abort() noexcept override;
    bool leaves_partial() const noexcept override { return leaves_partial_; }
    std::uint64_t bytes_written() const noexcept override { return bytes_written_; }

    const std::filesystem::path& path() const noexcept { return path_; }
    const std::filesystem::path& partial_path() const noexcept { return partial_path_; }
    // writev calls that returned fewer bytes than requested.
    std::uint64_t short_writes() const noexcept { return short_writes_; }

private:
    enum class State { Idle, Writing, Finalized, Aborted };

    SinkResult ensure_open();

    std::filesystem::path path_;
    std::filesystem::path partial_path_;
    std::unique_ptr<IFileSink> file_;
    State state_{State::Idle};
    std::uint64_t bytes_written_{0};
    std::uint64_t short_writes_{0};
    bool leaves_partial_{false};
};

} // namespace persist
