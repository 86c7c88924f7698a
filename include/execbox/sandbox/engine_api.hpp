#pragma once

#include "execbox/common/result.hpp"

#include <chrono>
#include <string>

namespace execbox::sandbox {

/// Moves tar streams in and out of a container filesystem.
class IArchiveTransport {
public:
  virtual ~IArchiveTransport() = default;

  /// Tar stream of `path` inside `container`; NotFound when the path does not exist.
  [[nodiscard]] virtual common::Result<std::string> get_archive(const std::string &container,
                                                                const std::string &path) = 0;

  /// Extract `tar` into the existing directory `directory` inside `container`.
  [[nodiscard]] virtual common::Status put_archive(const std::string &container,
                                                   const std::string &directory,
                                                   const std::string &tar) = 0;

  /// Whether the container runtime answers at all.
  [[nodiscard]] virtual common::Status ping() = 0;
};

/// Docker Engine HTTP API spoken over the daemon's unix socket.
class DockerEngineClient final : public IArchiveTransport {
public:
  explicit DockerEngineClient(std::string socket_path = "/var/run/docker.sock",
                              std::chrono::milliseconds timeout = std::chrono::seconds(60));

  [[nodiscard]] common::Result<std::string> get_archive(const std::string &container,
                                                        const std::string &path) override;
  [[nodiscard]] common::Status put_archive(const std::string &container,
                                           const std::string &directory,
                                           const std::string &tar) override;
  [[nodiscard]] common::Status ping() override;

private:
  struct Response {
    long status = 0;
    std::string body;
  };

  [[nodiscard]] common::Result<Response> request(const std::string &method,
                                                 const std::string &path_and_query,
                                                 const std::string *body,
                                                 std::chrono::milliseconds timeout);

  std::string socket_path_;
  std::chrono::milliseconds timeout_;
};

} // namespace execbox::sandbox
