#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace filesync {

enum class ErrorKind {
  Connection,
  FileOperation,
  Server,
  WebSocket,
  DiskSpace,
  Permission,
  NotFound,
  Database,
  Protocol,
  Validation
};

std::string toString(ErrorKind kind);

/**
 * SyncError carries one failure across a module boundary. Library specific
 * exceptions are translated into one of these before they leave a module.
 */
struct SyncError {
  ErrorKind kind = ErrorKind::FileOperation;
  std::string message;
  std::string path;
  std::string operation;
  std::string host;
  int port = 0;
  int status_code = 0;
  std::string details;

  // One line, e.g. "SERVER_ERROR: upload failed (path=a.txt op=upload status=500)"
  std::string describe() const;

  static SyncError connection(const std::string &message,
                              const std::string &host, int port,
                              const std::string &details = "");
  static SyncError server(const std::string &message, int statusCode,
                          const std::string &path = "",
                          const std::string &operation = "");
  static SyncError fileOperation(const std::string &message,
                                 const std::string &path,
                                 const std::string &operation,
                                 const std::string &details = "");
  static SyncError notFound(const std::string &path,
                            const std::string &operation);
  static SyncError permission(const std::string &path,
                              const std::string &operation,
                              const std::string &details = "");
  static SyncError diskSpace(const std::string &path,
                             const std::string &details = "");
  static SyncError database(const std::string &operation,
                            const std::string &details);
  static SyncError webSocket(const std::string &message,
                             const std::string &details = "");
  static SyncError protocol(const std::string &message,
                            const std::string &details = "");
};

// Maps an errno value from a failed file operation to the matching kind.
SyncError fromErrno(int err, const std::string &path,
                    const std::string &operation);

template <typename T> class Result {
public:
  static Result Ok(T value) { return Result(std::move(value)); }
  static Result Error(SyncError error) { return Result(std::move(error)); }

  bool ok() const { return std::holds_alternative<T>(m_state); }
  explicit operator bool() const { return ok(); }

  T &value() { return std::get<T>(m_state); }
  const T &value() const { return std::get<T>(m_state); }
  const SyncError &error() const { return std::get<SyncError>(m_state); }

private:
  explicit Result(T value) : m_state(std::move(value)) {}
  explicit Result(SyncError error) : m_state(std::move(error)) {}

  std::variant<T, SyncError> m_state;
};

template <> class Result<void> {
public:
  static Result Ok() { return Result(); }
  static Result Error(SyncError error) { return Result(std::move(error)); }

  bool ok() const { return !m_error.has_value(); }
  explicit operator bool() const { return ok(); }

  const SyncError &error() const { return *m_error; }

private:
  Result() = default;
  explicit Result(SyncError error) : m_error(std::move(error)) {}

  std::optional<SyncError> m_error;
};

/**
 * Thrown by configuration validation at startup. The executables report it
 * and exit with a non-zero status.
 */
class ConfigError : public std::runtime_error {
public:
  ConfigError(const std::string &field, const std::string &message)
      : std::runtime_error(field + ": " + message), m_field(field) {}

  const std::string &field() const { return m_field; }

private:
  std::string m_field;
};

} // namespace filesync
