#include "persist/replay_sink.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include "util/log.hpp"

namespace persist {
namespace {

// Retries EINTR and resumes after short writes until every iovec is drained.
IoResult writev_fully(IFileSink& sink,
                      struct iovec* iov,
                      int iovcnt,
                      std::uint64_t& total_written,
                      std::uint64_t& short_writes) {
    total_written = 0;
    int idx = 0;
    while (idx < iovcnt) {
        if (iov[idx].iov_len == 0) {
            ++idx;
            continue;
        }
        std::size_t bytes_written = 0;
        const IoResult r = sink.writev(&iov[idx], iovcnt - idx, bytes_written);
        if (!r.ok) {
            if (r.error_code == EINTR) {
                continue;
            }
            return r;
        }
        if (bytes_written == 0) {
            return {false, EIO};
        }
        total_written += bytes_written;
        std::size_t advance = bytes_written;
        while (advance > 0 && idx < iovcnt) {
            if (advance < iov[idx].iov_len) {
                iov[idx].iov_base = static_cast<char*>(iov[idx].iov_base) + advance;
                iov[idx].iov_len -= advance;
                advance = 0;
            } else {
                advance -= iov[idx].iov_len;
                ++idx;
            }
        }
        if (idx < iovcnt) {
            ++short_writes;
        }
    }
    return {true, 0};
}

std::string errno_text(int code) { return std::strerror(code); }

} // namespace

SinkResult MemoryReplaySink::write_gather(std::span<const std::span<const std::byte>> parts) {
    if (state_ != State::Open) {
        return SinkResult::failure(EBADF, "write after sink was closed");
    }
    for (const auto& part : parts) {
        buffer_.insert(buffer_.end(), part.begin(), part.end());
    }
    return SinkResult::success();
}

SinkResult MemoryReplaySink::finalize(std::uint64_t total_bytes) {
    if (state_ != State::Open) {
        return SinkResult::failure(EBADF, "finalize after sink was closed");
    }
    if (total_bytes != buffer_.size()) {
        return SinkResult::failure(0,
                                   "expected " + std::to_string(total_bytes) + " bytes, buffered " +
                                       std::to_string(buffer_.size()));
    }
    state_ = State::Finalized;
    return SinkResult::success();
}

void MemoryReplaySink::abort() noexcept {
    if (state_ == State::Finalized) {
        return;
    }
    state_ = State::Aborted;
    buffer_.clear();
    buffer_.shrink_to_fit();
}

FileReplaySink::FileReplaySink(std::filesystem::path path)
    : FileReplaySink(std::move(path), std::make_unique<PosixFileSink>()) {}

FileReplaySink::FileReplaySink(std::filesystem::path path, std::unique_ptr<IFileSink> file)
    : path_(std::move(path)), file_(std::move(file)) {
    partial_path_ = path_;
    partial_path_ += ".partial";
}

FileReplaySink::~FileReplaySink() {
    if (state_ == State::Writing) {
        abort();
    }
}

SinkResult FileReplaySink::ensure_open() {
    if (state_ == State::Writing) {
        return SinkResult::success();
    }
    if (state_ != State::Idle) {
        return SinkResult::failure(EBADF, "write after sink was closed");
    }
    const IoResult r = file_->open(partial_path_.string());
    if (!r.ok) {
        state_ = State::Aborted;
        return SinkResult::failure(r.error_code, "open " + partial_path_.string() + ": " + errno_text(r.error_code));
    }
    state_ = State::Writing;
    return SinkResult::success();
}

SinkResult FileReplaySink::write_gather(std::span<const std::span<const std::byte>> parts) {
    if (auto r = ensure_open(); !r.ok) {
        return r;
    }
    std::vector<struct iovec> iov;
    iov.reserve(parts.size());
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        iov.push_back({const_cast<std::byte*>(part.data()), part.size()});
    }
    std::uint64_t written = 0;
    const IoResult r = writev_fully(*file_, iov.data(), static_cast<int>(iov.size()), written, short_writes_);
    bytes_written_ += written;
    if (!r.ok) {
        return SinkResult::failure(r.error_code,
                                   "write " + partial_path_.string() + ": " + errno_text(r.error_code));
    }
    return SinkResult::success();
}

SinkResult FileReplaySink::finalize(std::uint64_t total_bytes) {
    if (auto r = ensure_open(); !r.ok) {
        return r;
    }
    if (total_bytes != bytes_written_) {
        return SinkResult::failure(0,
                                   "expected " + std::to_string(total_bytes) + " bytes, wrote " +
                                       std::to_string(bytes_written_));
    }
    if (const IoResult r = file_->sync(); !r.ok) {
        return SinkResult::failure(r.error_code, "fsync " + partial_path_.string() + ": " + errno_text(r.error_code));
    }
    if (const IoResult r = file_->close(); !r.ok) {
        return SinkResult::failure(r.error_code, "close " + partial_path_.string() + ": " + errno_text(r.error_code));
    }
    std::error_code ec;
    std::filesystem::rename(partial_path_, path_, ec);
    if (ec) {
        return SinkResult::failure(ec.value(),
                                   "rename " + partial_path_.string() + " -> " + path_.string() + ": " + ec.message());
    }
    state_ = State::Finalized;
    RF_LOG_INFO("wrote %s (%llu bytes)", path_.c_str(), static_cast<unsigned long long>(bytes_written_));
    return SinkResult::success();
}

void FileReplaySink::abort() noexcept {
    if (state_ == State::Finalized || state_ == State::Aborted) {
        return;
    }
    const bool opened = state_ == State::Writing;
    state_ = State::Aborted;
    if (!opened) {
        return;
    }
    if (const IoResult r = file_->close(); !r.ok) {
        RF_LOG_WARN("close %s failed: %s", partial_path_.c_str(), std::strerror(r.error_code));
    }
    std::error_code ec;
    std::filesystem::remove(partial_path_, ec);
    if (ec) {
        leaves_partial_ = true;
        RF_LOG_ERROR("could not remove incomplete replay %s: %s", partial_path_.c_str(), ec.message().c_str());
    }
}

} // namespace persist
