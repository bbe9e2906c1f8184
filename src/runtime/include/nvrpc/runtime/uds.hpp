#pragma once

#include "nvrpc/runtime/connection.hpp"
#include "nvrpc/runtime/result.hpp"

#include <memory>
#include <string>
#include <utility>

namespace nvrpc::runtime::uds
{

/// Listening socket, used by tests and tools that play the peer's role.
class Server
{
public:
    ~Server();
    Result<std::shared_ptr<Connection>> accept();
    void close();
    const std::string& path() const { return path_; }

private:
    friend Result<std::shared_ptr<Server>> listen(const std::string& path);
    explicit Server(int fd, std::string path);
    int fd_ = -1;
    std::string path_;
};

Result<std::shared_ptr<Server>> listen(const std::string& path);
Result<std::shared_ptr<Connection>> connect(const std::string& path);
Result<std::pair<std::shared_ptr<Connection>, std::shared_ptr<Connection>>> socket_pair();

}  // namespace nvrpc::runtime::uds
