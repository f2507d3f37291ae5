#include "SyncError.hpp"
#include <cerrno>
#include <cstring>
#include <sstream>

namespace filesync {

std::string toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Connection:
    return "CONNECTION_ERROR";
  case ErrorKind::FileOperation:
    return "FILE_OPERATION_ERROR";
  case ErrorKind::Server:
    return "SERVER_ERROR";
  case ErrorKind::WebSocket:
    return "WEBSOCKET_ERROR";
  case ErrorKind::DiskSpace:
    return "DISK_SPACE_ERROR";
  case ErrorKind::Permission:
    return "PERMISSION_ERROR";
  case ErrorKind::NotFound:
    return "FILE_NOT_FOUND";
  case ErrorKind::Database:
    return "DATABASE_ERROR";
  case ErrorKind::Protocol:
    return "PROTOCOL_ERROR";
  case ErrorKind::Validation:
    return "VALIDATION_ERROR";
  }
  return "SYNC_ERROR";
}

std::string SyncError::describe() const {
  std::ostringstream out;
  out << toString(kind) << ": " << message;

  std::ostringstream context;
  if (!path.empty())
    context << " path=" << path;
  if (!operation.empty())
    context << " op=" << operation;
  if (!host.empty())
    context << " host=" << host << ":" << port;
  if (status_code != 0)
    context << " status=" << status_code;
  if (!details.empty())
    context << " details=" << details;

  auto ctx = context.str();
  if (!ctx.empty())
    out << " (" << ctx.substr(1) << ")";
  return out.str();
}

SyncError SyncError::connection(const std::string &message,
                                const std::string &host, int port,
                                const std::string &details) {
  SyncError e;
  e.kind = ErrorKind::Connection;
  e.message = message;
  e.host = host;
  e.port = port;
  e.details = details;
  return e;
}

SyncError SyncError::server(const std::string &message, int statusCode,
                            const std::string &path,
                            const std::string &operation) {
  SyncError e;
  e.kind = ErrorKind::Server;
  e.message = message;
  e.status_code = statusCode;
  e.path = path;
  e.operation = operation;
  return e;
}

SyncError SyncError::fileOperation(const std::string &message,
                                   const std::string &path,
                                   const std::string &operation,
                                   const std::string &details) {
  SyncError e;
  e.kind = ErrorKind::FileOperation;
  e.message = message;
  e.path = path;
  e.operation = operation;
  e.details = details;
  return e;
}

SyncError SyncError::notFound(const std::string &path,
                              const std::string &operation) {
  SyncError e;
  e.kind = ErrorKind::NotFound;
  e.message = "File not found: " + path;
  e.path = path;
  e.operation = operation;
  return e;
}

SyncError SyncError::permission(const std::string &path,
                                const std::string &operation,
                                const std::string &details) {
  SyncError e;
  e.kind = ErrorKind::Permission;
  e.message = "Permission denied for " + operation + " on " + path;
  e.path = path;
  e.operation = operation;
  e.details = details;
  return e;
}

SyncError SyncError::diskSpace(const std::string &path,
                               const std::string &details) {
  SyncError e;
  e.kind = ErrorKind::DiskSpace;
  e.message = "Insufficient disk space for " + path;
  e.path = path;
  e.operation = "write";
  e.details = details;
  return e;
}

SyncError SyncError::database(const std::string &operation,
                              const std::string &details) {
  SyncError e;
  e.kind = ErrorKind::Database;
  e.message = "Database operation failed";
  e.operation = operation;
  e.details = details;
  return e;
}

SyncError SyncError::webSocket(const std::string &message,
                               const std::string &details) {
  SyncError e;
  e.kind = ErrorKind::WebSocket;
  e.message = message;
  e.details = details;
  return e;
}

SyncError SyncError::protocol(const std::string &message,
                              const std::string &details) {
  SyncError e;
  e.kind = ErrorKind::Protocol;
  e.message = message;
  e.details = details;
  return e;
}

SyncError fromErrno(int err, const std::string &path,
                    const std::string &operation) {
  std::string details = std::strerror(err);
  switch (err) {
  case ENOENT:
    return SyncError::notFound(path, operation);
  case EACCES:
  case EPERM:
  case EROFS:
    return SyncError::permission(path, operation, details);
  case ENOSPC:
  case EDQUOT:
    return SyncError::diskSpace(path, details);
  default:
    return SyncError::fileOperation("OS error during " + operation, path,
                                    operation, details);
  }
}

} // namespace filesync
