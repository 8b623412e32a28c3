#include "io/AtomicFile.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <new>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ghostledger::io {

namespace {

void SetErrno(std::error_code* out_ec, int err) noexcept
{
    if (out_ec)
        *out_ec = std::error_code(err, std::generic_category());
}

// Closes the descriptor on scope exit unless released.
class FdGuard
{
public:
    explicit FdGuard(int fd) noexcept : m_fd(fd) {}
    ~FdGuard()
    {
        if (m_fd >= 0)
            ::close(m_fd);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return m_fd; }

    // Close explicitly so the caller can observe close() errors.
    [[nodiscard]] int close() noexcept
    {
        const int fd = m_fd;
        m_fd = -1;
        return fd >= 0 ? ::close(fd) : 0;
    }

private:
    int m_fd = -1;
};

[[nodiscard]] bool WriteAll(int fd, const char* p, std::size_t remaining, int& out_err) noexcept
{
    while (remaining > 0)
    {
        const ssize_t n = ::write(fd, p, remaining);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            out_err = errno;
            return false;
        }
        if (n == 0)
        {
            out_err = EIO;
            return false;
        }
        remaining -= static_cast<std::size_t>(n);
        p += n;
    }
    return true;
}

// Best effort: some filesystems refuse fsync on directories.
void SyncDirectory(const fs::path& dir) noexcept
{
    const int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0)
        return;
    (void)::fsync(dfd);
    (void)::close(dfd);
}

} // namespace

std::string TempPrefixFor(const fs::path& target)
{
    return "." + target.filename().string() + ".tmp.";
}

bool AtomicWriteFile(const fs::path& requestedTarget, std::string_view bytes, std::error_code* out_ec) noexcept
{
    try
    {
        if (out_ec)
            out_ec->clear();

        if (requestedTarget.empty() || !requestedTarget.has_filename())
        {
            SetErrno(out_ec, EINVAL);
            return false;
        }

        std::error_code ec;
        fs::path target = requestedTarget;
        if (target.parent_path().empty())
            target = fs::current_path(ec) / target;
        if (ec)
        {
            if (out_ec) *out_ec = ec;
            return false;
        }

        const fs::path dir = target.parent_path();
        fs::create_directories(dir, ec);
        if (ec)
        {
            if (out_ec) *out_ec = ec;
            return false;
        }

        // Unique across rapid successive calls from this process.
        static std::atomic_uint32_t s_tmpCounter{0};

        fs::path tmp;
        int fd = -1;
        int createErr = 0;
        for (int attempt = 0; attempt < 16; ++attempt)
        {
            const std::uint32_t n = s_tmpCounter.fetch_add(1, std::memory_order_relaxed) + 1u;
            const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();

            std::string name = TempPrefixFor(target);
            name += std::to_string(static_cast<long long>(::getpid()));
            name += ".";
            name += std::to_string(static_cast<long long>(tick));
            name += ".";
            name += std::to_string(n);

            tmp = dir / name;
            fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
            if (fd >= 0)
                break;

            createErr = errno;
            if (createErr != EEXIST)
                break;
        }

        if (fd < 0)
        {
            SetErrno(out_ec, createErr ? createErr : EEXIST);
            return false;
        }

        FdGuard guard(fd);
        int err = 0;

        if (!WriteAll(guard.get(), bytes.data(), bytes.size(), err))
        {
            (void)guard.close();
            ::unlink(tmp.c_str());
            SetErrno(out_ec, err);
            return false;
        }

        if (::fsync(guard.get()) != 0)
        {
            err = errno;
            (void)guard.close();
            ::unlink(tmp.c_str());
            SetErrno(out_ec, err);
            return false;
        }

        if (guard.close() != 0)
        {
            err = errno;
            ::unlink(tmp.c_str());
            SetErrno(out_ec, err);
            return false;
        }

        if (::rename(tmp.c_str(), target.c_str()) != 0)
        {
            err = errno;
            ::unlink(tmp.c_str());
            SetErrno(out_ec, err);
            return false;
        }

        SyncDirectory(dir);
        return true;
    }
    catch (const std::bad_alloc&)
    {
        if (out_ec) *out_ec = std::make_error_code(std::errc::not_enough_memory);
        return false;
    }
}

bool ReadFileToString(const fs::path& path, std::string& out, std::error_code* out_ec, std::size_t max_bytes) noexcept
{
    out.clear();
    if (out_ec)
        out_ec->clear();

    if (path.empty())
    {
        SetErrno(out_ec, EINVAL);
        return false;
    }

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        SetErrno(out_ec, errno);
        return false;
    }
    FdGuard guard(fd);

    struct stat st{};
    if (::fstat(guard.get(), &st) != 0)
    {
        SetErrno(out_ec, errno);
        return false;
    }

    if (S_ISDIR(st.st_mode))
    {
        SetErrno(out_ec, EISDIR);
        return false;
    }

    if (st.st_size < 0 || static_cast<std::uint64_t>(st.st_size) > max_bytes)
    {
        SetErrno(out_ec, EFBIG);
        return false;
    }

    try
    {
        out.resize(static_cast<std::size_t>(st.st_size));
    }
    catch (const std::bad_alloc&)
    {
        SetErrno(out_ec, ENOMEM);
        return false;
    }

    std::size_t got = 0;
    while (got < out.size())
    {
        const ssize_t n = ::read(guard.get(), out.data() + got, out.size() - got);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            SetErrno(out_ec, errno);
            out.clear();
            return false;
        }
        if (n == 0)
            break; // file shrank underneath us
        got += static_cast<std::size_t>(n);
    }
    out.resize(got);
    return true;
}

} // namespace ghostledger::io
