#include "core/single_instance_coordinator.hpp"
#include "core/path_utils.hpp"
#include "core/scoped_fd.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace
{
    int newUnixSocket()
    {
        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0)
        {
            throw SingleInstanceError(errno, "Failed to create unix socket");
        }
        return fd;
    }

    socklen_t abstractAddress(const std::string &name, sockaddr_un &addr)
    {
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        if (name.size() + 1 > sizeof(addr.sun_path))
        {
            throw SingleInstanceError(ENAMETOOLONG, "Abstract socket name too long: " + name);
        }
        addr.sun_path[0] = '\0';
        std::memcpy(addr.sun_path + 1, name.data(), name.size());
        return static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + 1 + name.size());
    }

    socklen_t filesystemAddress(const std::string &path, sockaddr_un &addr)
    {
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        if (path.size() + 1 > sizeof(addr.sun_path))
        {
            throw SingleInstanceError(ENAMETOOLONG, "Socket path too long: " + path);
        }
        std::memcpy(addr.sun_path, path.data(), path.size());
        return static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size() + 1);
    }

    void listenOn(int fd, const std::string &what)
    {
        if (::listen(fd, SOMAXCONN) != 0)
        {
            throw SingleInstanceError(errno, "Failed to listen on " + what);
        }
    }

    InstanceHandle connectTo(const sockaddr_un &addr, socklen_t len, const std::string &what)
    {
        ScopedFd fd(newUnixSocket());
        if (::connect(fd.get(), reinterpret_cast<const sockaddr *>(&addr), len) != 0)
        {
            throw SingleInstanceError(errno, "Failed to connect to running instance at " + what);
        }
        return InstanceHandle(InstanceRole::CLIENT, fd.take());
    }

    void writePid(int lock_fd, const std::string &lock_path)
    {
        std::string pid_str = std::to_string(::getpid()) + "\n";
        if (::ftruncate(lock_fd, 0) != 0)
        {
            throw SingleInstanceError(errno, "Failed to truncate lockfile " + lock_path);
        }
        size_t written = 0;
        while (written < pid_str.size())
        {
            ssize_t n = ::pwrite(lock_fd, pid_str.data() + written, pid_str.size() - written,
                                 static_cast<off_t>(written));
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                throw SingleInstanceError(errno, "Failed to write lockfile " + lock_path);
            }
            written += static_cast<size_t>(n);
        }
    }
} // namespace

// InstanceHandle

InstanceHandle::InstanceHandle(InstanceRole role, int socket_fd, int lock_fd, std::string socket_path)
    : role_(role), socket_fd_(socket_fd), lock_fd_(lock_fd), socket_path_(std::move(socket_path))
{
}

InstanceHandle::~InstanceHandle()
{
    release();
}

InstanceHandle::InstanceHandle(InstanceHandle &&other) noexcept
    : role_(other.role_), socket_fd_(other.socket_fd_), lock_fd_(other.lock_fd_),
      socket_path_(std::move(other.socket_path_))
{
    other.socket_fd_ = -1;
    other.lock_fd_ = -1;
    other.socket_path_.clear();
}

InstanceHandle &InstanceHandle::operator=(InstanceHandle &&other) noexcept
{
    if (this == &other)
        return *this;
    release();
    role_ = other.role_;
    socket_fd_ = other.socket_fd_;
    lock_fd_ = other.lock_fd_;
    socket_path_ = std::move(other.socket_path_);
    other.socket_fd_ = -1;
    other.lock_fd_ = -1;
    other.socket_path_.clear();
    return *this;
}

bool InstanceHandle::release()
{
    bool ok = true;

    if (socket_fd_ >= 0)
    {
        if (::close(socket_fd_) != 0)
        {
            Logger::warn("Failed to close instance socket: " + std::string(std::strerror(errno)));
            ok = false;
        }
        socket_fd_ = -1;
    }

    // Unlink before dropping the lock so a new server never sees our file as its own
    if (!socket_path_.empty())
    {
        if (::unlink(socket_path_.c_str()) != 0 && errno != ENOENT)
        {
            Logger::warn("Failed to remove socket file " + socket_path_ + ": " + std::strerror(errno));
            ok = false;
        }
        socket_path_.clear();
    }

    if (lock_fd_ >= 0)
    {
        if (::close(lock_fd_) != 0)
        {
            Logger::warn("Failed to close instance lockfile: " + std::string(std::strerror(errno)));
            ok = false;
        }
        lock_fd_ = -1;
    }

    return ok;
}

std::optional<InstanceMessage> InstanceHandle::acceptMessage(std::chrono::milliseconds timeout)
{
    if (role_ != InstanceRole::SERVER || socket_fd_ < 0)
    {
        Logger::error("acceptMessage() requires a live server handle");
        return std::nullopt;
    }

    struct pollfd pfd = {socket_fd_, POLLIN, 0};
    int ready;
    do
    {
        ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (ready < 0 && errno == EINTR);

    if (ready < 0)
    {
        Logger::error("poll() on instance socket failed: " + std::string(std::strerror(errno)));
        return std::nullopt;
    }
    if (ready == 0)
    {
        return std::nullopt;
    }

    ScopedFd conn(::accept4(socket_fd_, nullptr, nullptr, SOCK_CLOEXEC));
    if (conn.get() < 0)
    {
        Logger::warn("Failed to accept instance connection: " + std::string(std::strerror(errno)));
        return std::nullopt;
    }
    return InstanceMessageCodec::readMessage(conn.get(), timeout);
}

bool InstanceHandle::sendMessage(const InstanceMessage &message)
{
    if (role_ != InstanceRole::CLIENT || socket_fd_ < 0)
    {
        Logger::error("sendMessage() requires a connected client handle");
        return false;
    }
    if (!InstanceMessageCodec::writeMessage(socket_fd_, message))
    {
        return false;
    }
    // Signal end of message to the server
    if (::shutdown(socket_fd_, SHUT_WR) != 0)
    {
        Logger::warn("Failed to shut down instance socket for writing: " + std::string(std::strerror(errno)));
    }
    return true;
}

// SingleInstanceCoordinator

SingleInstanceCoordinator::SingleInstanceCoordinator(SingleInstanceOptions options)
    : options_(std::move(options))
{
}

std::string SingleInstanceCoordinator::canonicalName(const std::string &group_id) const
{
    std::string name = options_.app_name + "-ipc-" + std::to_string(::geteuid());
    if (!group_id.empty())
    {
        name += "-" + group_id;
    }
    return name;
}

std::vector<std::string> SingleInstanceCoordinator::defaultSocketDirectories()
{
#ifdef __APPLE__
    return {PathUtils::joinPath(PathUtils::homeDirectory(), "Library/Caches"), "/Library/Caches",
            PathUtils::tempDirectory(), PathUtils::homeDirectory()};
#else
    return {PathUtils::tempDirectory(), PathUtils::homeDirectory()};
#endif
}

std::vector<std::string> SingleInstanceCoordinator::candidateDirectories() const
{
    if (!options_.socket_directories.empty())
    {
        std::vector<std::string> dirs;
        for (const auto &dir : options_.socket_directories)
        {
            dirs.push_back(PathUtils::expandUser(dir));
        }
        return dirs;
    }
    return defaultSocketDirectories();
}

std::optional<SocketAddressCandidate> SingleInstanceCoordinator::socketCandidate(const std::string &name) const
{
    const std::string home = PathUtils::homeDirectory();
    for (const auto &dir : candidateDirectories())
    {
        if (!PathUtils::isAccessibleDirectory(dir))
        {
            continue;
        }
        std::string base = (dir == home ? "." : "") + name;
        SocketAddressCandidate candidate;
        candidate.directory = dir;
        candidate.lock_path = PathUtils::joinPath(dir, base + ".lock");
        candidate.socket_path = PathUtils::joinPath(dir, base + ".sock");
        return candidate;
    }
    return std::nullopt;
}

InstanceHandle SingleInstanceCoordinator::acquireOrConnect(const std::string &group_id) const
{
    std::string name = canonicalName(group_id);

    if (options_.use_abstract_namespace)
    {
        auto handle = tryAbstractNamespace(name);
        if (handle)
        {
            Logger::debug("Single instance '" + name + "' resolved via abstract socket as " +
                          InstanceRoles::getRoleName(handle->role()));
            return std::move(*handle);
        }
        Logger::debug("Abstract unix sockets unsupported, using lockfile protocol for '" + name + "'");
    }

    InstanceHandle handle = acquireWithLockfile(name);
    Logger::debug("Single instance '" + name + "' resolved via lockfile as " +
                  InstanceRoles::getRoleName(handle.role()));
    return handle;
}

std::optional<InstanceHandle> SingleInstanceCoordinator::tryAbstractNamespace(const std::string &name) const
{
#ifdef __linux__
    sockaddr_un addr;
    socklen_t len = abstractAddress(name, addr);

    ScopedFd fd(newUnixSocket());
    if (::bind(fd.get(), reinterpret_cast<const sockaddr *>(&addr), len) == 0)
    {
        listenOn(fd.get(), "abstract socket " + name);
        return InstanceHandle(InstanceRole::SERVER, fd.take());
    }

    int err = errno;
    if (err == EADDRINUSE)
    {
        return connectTo(addr, len, "abstract socket " + name);
    }
    if (err == ENOENT || err == EAFNOSUPPORT)
    {
        return std::nullopt;
    }
    throw SingleInstanceError(err, "Failed to bind abstract socket " + name);
#else
    (void)name;
    return std::nullopt;
#endif
}

InstanceHandle SingleInstanceCoordinator::acquireWithLockfile(const std::string &name) const
{
    auto candidate = socketCandidate(name);
    if (!candidate)
    {
        throw SingleInstanceError(ENOENT, "No accessible directory for the instance socket of " + name);
    }

    ScopedFd lock_fd(::open(candidate->lock_path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0600));
    if (lock_fd.get() < 0)
    {
        throw SingleInstanceError(errno, "Failed to open lockfile " + candidate->lock_path);
    }

    sockaddr_un addr;
    socklen_t len = filesystemAddress(candidate->socket_path, addr);

    if (::lockf(lock_fd.get(), F_TLOCK, 0) != 0)
    {
        int err = errno;
        if (err == EAGAIN || err == EACCES)
        {
            // Another live process owns the lock
            return connectTo(addr, len, candidate->socket_path);
        }
        throw SingleInstanceError(err, "Failed to lock " + candidate->lock_path);
    }

    writePid(lock_fd.get(), candidate->lock_path);

    ScopedFd fd(newUnixSocket());
    if (::bind(fd.get(), reinterpret_cast<const sockaddr *>(&addr), len) != 0)
    {
        int err = errno;
        if (err != EADDRINUSE && err != EEXIST)
        {
            throw SingleInstanceError(err, "Failed to bind " + candidate->socket_path);
        }

        // Left behind by a server that died without cleaning up; we hold the lock
        Logger::info("Removing stale instance socket " + candidate->socket_path);
        if (::unlink(candidate->socket_path.c_str()) != 0 && errno != ENOENT)
        {
            throw SingleInstanceError(errno, "Failed to remove stale socket " + candidate->socket_path);
        }
        if (::bind(fd.get(), reinterpret_cast<const sockaddr *>(&addr), len) != 0)
        {
            throw SingleInstanceError(errno, "Failed to bind " + candidate->socket_path);
        }
    }

    listenOn(fd.get(), candidate->socket_path);
    int socket_fd = fd.take();
    return InstanceHandle(InstanceRole::SERVER, socket_fd, lock_fd.take(), candidate->socket_path);
}
