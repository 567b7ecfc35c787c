#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "core/instance_message.hpp"

/**
 * @brief Role of this process among instances sharing one logical name
 */
enum class InstanceRole
{
    SERVER, // First instance, owns the listening endpoint
    CLIENT  // Later instance, connected to the server's endpoint
};

class InstanceRoles
{
public:
    static std::string getRoleName(InstanceRole role)
    {
        switch (role)
        {
        case InstanceRole::SERVER:
            return "SERVER";
        case InstanceRole::CLIENT:
            return "CLIENT";
        default:
            return "UNKNOWN";
        }
    }
};

/**
 * @brief Unexpected OS failure while coordinating instances
 *
 * Carries the errno of the failing call; "address in use" and "abstract
 * namespace unsupported" are handled internally and never raised.
 */
class SingleInstanceError : public std::system_error
{
public:
    SingleInstanceError(int error_code, const std::string &what)
        : std::system_error(error_code, std::generic_category(), what) {}
};

/**
 * @brief Filesystem location used when the abstract namespace is unavailable
 */
struct SocketAddressCandidate
{
    std::string directory;
    std::string lock_path;
    std::string socket_path;
};

/**
 * @brief This process's side of the single-instance protocol
 *
 * Owns the socket (listening for a server, connected for a client) and, for a
 * filesystem server, the locked lockfile and the socket file to unlink on
 * teardown. Move-only; teardown runs from release() or the destructor.
 */
class InstanceHandle
{
public:
    InstanceHandle(InstanceRole role, int socket_fd, int lock_fd = -1, std::string socket_path = "");
    ~InstanceHandle();

    InstanceHandle(InstanceHandle &&other) noexcept;
    InstanceHandle &operator=(InstanceHandle &&other) noexcept;
    InstanceHandle(const InstanceHandle &) = delete;
    InstanceHandle &operator=(const InstanceHandle &) = delete;

    InstanceRole role() const { return role_; }
    bool isServer() const { return role_ == InstanceRole::SERVER; }
    int socketFd() const { return socket_fd_; }

    // Socket file owned by this server, empty for abstract sockets and clients
    const std::string &socketPath() const { return socket_path_; }

    /**
     * @brief Best-effort teardown: close the socket, unlink an owned socket
     * file and release the lockfile. Failures are logged, never thrown.
     * @return True when every step succeeded
     */
    bool release();

    // Server only: wait for one client connection and read its message
    std::optional<InstanceMessage> acceptMessage(std::chrono::milliseconds timeout);

    // Client only: forward a message to the server
    bool sendMessage(const InstanceMessage &message);

private:
    InstanceRole role_;
    int socket_fd_ = -1;
    int lock_fd_ = -1;
    std::string socket_path_;
};

struct SingleInstanceOptions
{
    std::string app_name = "term-launcher";
    bool use_abstract_namespace = true;
    std::vector<std::string> socket_directories; // Replaces the platform candidates when non-empty
};

/**
 * @brief Decides whether this process is the server or a client instance
 *
 * Tries an abstract-namespace Unix socket first; where the platform has no
 * abstract namespace it falls back to a socket file guarded by an advisory
 * lock in the first accessible candidate directory.
 */
class SingleInstanceCoordinator
{
public:
    explicit SingleInstanceCoordinator(SingleInstanceOptions options = SingleInstanceOptions());

    /**
     * @brief Become the server or connect to the existing one
     * @param group_id Optional group suffix of the canonical name
     * @return Handle describing the role and owning the socket
     * @throws SingleInstanceError on any unexpected OS failure
     */
    InstanceHandle acquireOrConnect(const std::string &group_id = "") const;

    // "<app>-ipc-<euid>[-<group>]"
    std::string canonicalName(const std::string &group_id = "") const;

    // Candidate directories in priority order, accessible or not
    std::vector<std::string> candidateDirectories() const;

    // Lock and socket paths in the first accessible candidate directory
    std::optional<SocketAddressCandidate> socketCandidate(const std::string &name) const;

    static std::vector<std::string> defaultSocketDirectories();

private:
    // nullopt when the abstract namespace is unsupported
    std::optional<InstanceHandle> tryAbstractNamespace(const std::string &name) const;
    InstanceHandle acquireWithLockfile(const std::string &name) const;

    SingleInstanceOptions options_;
};
