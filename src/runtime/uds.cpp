#include "nvrpc/runtime/uds.hpp"

#include "nvrpc/runtime/error.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace nvrpc::runtime::uds
{
namespace
{

Error make_errno_error(const std::string& prefix, int err)
{
    std::error_code code(err, std::generic_category());
    std::string message = prefix;
    if (!prefix.empty()) {
        message += ": ";
    }
    message += code.message();
    return make_error(ErrorCode::ConnectionError, std::move(message));
}

class UdsConnection : public Connection
{
public:
    explicit UdsConnection(int fd)
        : fd_(fd)
    {
        wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (wake_fd_ < 0) {
            int err = errno;
            ::close(fd);
            throw std::system_error(err, std::generic_category(), "eventfd");
        }
    }

    ~UdsConnection() override
    {
        close();
        if (wake_fd_ >= 0) {
            ::close(wake_fd_);
        }
    }

    Result<void> write(std::span<const std::uint8_t> data) override;
    Result<std::size_t> read_some(std::span<std::uint8_t> buffer) override;
    void close() override;

    bool is_open() const override
    {
        return fd() >= 0;
    }

private:
    int fd() const
    {
        return fd_.load(std::memory_order_relaxed);
    }

    std::atomic<int> fd_{-1};
    int wake_fd_ = -1;
};

int create_socket()
{
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    return fd;
}

sockaddr_un make_address(const std::string& path)
{
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("Unix socket path too long");
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return addr;
}

Result<std::shared_ptr<Connection>> wrap_fd(int fd)
{
    try {
        return std::make_shared<UdsConnection>(fd);
    } catch (const std::system_error& ex) {
        return unexpected_result<std::shared_ptr<Connection>>(make_errno_error("eventfd", ex.code().value()));
    }
}

}  // namespace

Result<void> UdsConnection::write(std::span<const std::uint8_t> data)
{
    std::size_t written = 0;
    while (written < data.size()) {
        int current_fd = fd();
        if (current_fd < 0) {
            return unexpected_result(connection_closed_error());
        }
        ssize_t rc = ::send(current_fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (rc < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            return unexpected_result(make_errno_error("write", err));
        }
        written += static_cast<std::size_t>(rc);
    }
    return {};
}

Result<std::size_t> UdsConnection::read_some(std::span<std::uint8_t> buffer)
{
    while (true) {
        int current_fd = fd();
        if (current_fd < 0) {
            return unexpected_result<std::size_t>(ErrorCode::Cancelled, "connection closed locally");
        }

        struct pollfd fds[2];
        fds[0].fd = current_fd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake_fd_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            return unexpected_result<std::size_t>(make_errno_error("poll", err));
        }

        if (fds[1].revents & POLLIN) {
            return unexpected_result<std::size_t>(ErrorCode::Cancelled, "connection closed locally");
        }

        if (fds[0].revents & POLLNVAL) {
            return unexpected_result<std::size_t>(ErrorCode::Cancelled, "connection closed locally");
        }

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            continue;
        }

        ssize_t read_rc = ::read(current_fd, buffer.data(), buffer.size());
        if (read_rc < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN) {
                continue;
            }
            return unexpected_result<std::size_t>(make_errno_error("read", err));
        }
        return static_cast<std::size_t>(read_rc);
    }
}

void UdsConnection::close()
{
    int old = fd_.exchange(-1, std::memory_order_acq_rel);
    if (old < 0) {
        return;
    }
    ::shutdown(old, SHUT_RDWR);
    ::close(old);
    std::uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) < 0) {
        spdlog::debug("uds: failed to signal reader wake-up: {}", std::strerror(errno));
    }
}

Server::Server(int fd, std::string path)
    : fd_(fd)
    , path_(std::move(path))
{
}

Server::~Server()
{
    close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
    }
}

void Server::close()
{
    int old = fd_;
    fd_ = -1;
    if (old >= 0) {
        ::shutdown(old, SHUT_RDWR);
        ::close(old);
    }
}

Result<std::shared_ptr<Connection>> Server::accept()
{
    if (fd_ < 0) {
        return unexpected_result<std::shared_ptr<Connection>>(ErrorCode::ConnectionError, "server socket closed");
    }

    int client_fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd < 0) {
        int err = errno;
        return unexpected_result<std::shared_ptr<Connection>>(make_errno_error("accept", err));
    }
    return wrap_fd(client_fd);
}

Result<std::shared_ptr<Server>> listen(const std::string& path)
{
    try {
        int fd = create_socket();
        sockaddr_un addr = make_address(path);
        ::unlink(path.c_str());
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            int err = errno;
            ::close(fd);
            return unexpected_result<std::shared_ptr<Server>>(make_errno_error("bind", err));
        }
        if (::listen(fd, SOMAXCONN) < 0) {
            int err = errno;
            ::close(fd);
            return unexpected_result<std::shared_ptr<Server>>(make_errno_error("listen", err));
        }
        return std::shared_ptr<Server>(new Server(fd, path));
    } catch (const std::exception& ex) {
        return unexpected_result<std::shared_ptr<Server>>(ErrorCode::ConnectionError, ex.what());
    }
}

Result<std::shared_ptr<Connection>> connect(const std::string& path)
{
    if (path.empty()) {
        return unexpected_result<std::shared_ptr<Connection>>(ErrorCode::ConnectionError, "empty socket address");
    }
    try {
        int fd = create_socket();
        sockaddr_un addr = make_address(path);
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            int err = errno;
            ::close(fd);
            return unexpected_result<std::shared_ptr<Connection>>(make_errno_error("connect " + path, err));
        }
        spdlog::debug("uds: connected to {}", path);
        return wrap_fd(fd);
    } catch (const std::exception& ex) {
        return unexpected_result<std::shared_ptr<Connection>>(ErrorCode::ConnectionError, ex.what());
    }
}

Result<std::pair<std::shared_ptr<Connection>, std::shared_ptr<Connection>>> socket_pair()
{
    using Pair = std::pair<std::shared_ptr<Connection>, std::shared_ptr<Connection>>;

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        return unexpected_result<Pair>(make_errno_error("socketpair", errno));
    }

    auto first = wrap_fd(fds[0]);
    if (!first) {
        ::close(fds[1]);
        return std::unexpected(first.error());
    }

    auto second = wrap_fd(fds[1]);
    if (!second) {
        return std::unexpected(second.error());
    }

    return std::make_pair(*first, *second);
}

}  // namespace nvrpc::runtime::uds
