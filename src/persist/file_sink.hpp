#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/uio.h>

namespace persist {

struct IoResult {
    bool ok{false};
    int error_code{0};
};

// Raw file seam under FileReplaySink. Tests substitute short-writing or
// failing implementations.
class IFileSink {
public:
    virtual ~IFileSink() = default;
    // Creates or truncates `path`.
    virtual IoResult open(const std::string& path) noexcept = 0;
    virtual IoResult close() noexcept = 0;
    // May write fewer bytes than requested.
    virtual IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept = 0;
    virtual IoResult sync() noexcept = 0;
    virtual std::uint64_t current_size() const noexcept = 0;
    virtual bool is_open() const noexcept = 0;
};

class PosixFileSink : public IFileSink {
public:
    PosixFileSink();
    ~PosixFileSink() override;

    PosixFileSink(const PosixFileSink&) = delete;
    PosixFileSink& operator=(const PosixFileSink&) = delete;

    IoResult open(const std::string& path) noexcept override;
    IoResult close() noexcept override;
    IoResult writev(const struct iovec* iov, int iovcnt, std::size_t& bytes_written) noexcept override;
    IoResult sync() noexcept override;
    std::uint64_t current_size() const noexcept override { return size_bytes_; }
    bool is_open() const noexcept override;

private:
    int fd_{-1};
    std::uint64_t size_bytes_{0};
};

} // namespace persist
