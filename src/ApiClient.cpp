#include "ApiClient.hpp"
#include "Protocol.hpp"
#include "httplib.h"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace filesync {

namespace {

bool isUnreserved(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
         c == '.' || c == '~';
}

std::string percentEncode(const std::string &value, bool keepSlash) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (char c : value) {
    if (isUnreserved(c) || (keepSlash && c == '/')) {
      escaped << c;
      continue;
    }
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }
  return escaped.str();
}

// Server error bodies are {"detail": "..."}; fall back to the raw body.
std::string errorDetail(const std::string &body) {
  auto parsed = json::parse(body, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("detail") &&
      parsed["detail"].is_string())
    return parsed["detail"].get<std::string>();
  return body;
}

} // namespace

std::string urlEncode(const std::string &value) {
  return percentEncode(value, false);
}

std::string encodeUrlPath(const std::string &path) {
  return percentEncode(path, true);
}

struct ApiClient::Impl {
  httplib::Client client;
  std::string host;
  int port;

  Impl(const std::string &h, int p, std::chrono::seconds timeout)
      : client(h, p), host(h), port(p) {
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_keep_alive(true);
  }

  SyncError connectionError(const httplib::Result &res,
                            const std::string &operation) const {
    auto e = SyncError::connection(operation + " request failed", host, port,
                                   httplib::to_string(res.error()));
    e.operation = operation;
    return e;
  }

  SyncError statusError(const httplib::Response &res,
                        const std::string &operation,
                        const std::string &path = "") const {
    if (res.status == 404)
      return SyncError::notFound(path, operation);
    return SyncError::server(operation + " failed: " + errorDetail(res.body),
                             res.status, path, operation);
  }

  // GET returning parsed JSON, or the matching error.
  Result<json> getJson(const std::string &target, const std::string &operation,
                       const std::string &path = "") {
    auto res = client.Get(target);
    if (!res)
      return Result<json>::Error(connectionError(res, operation));
    if (res->status != 200)
      return Result<json>::Error(statusError(*res, operation, path));
    try {
      return Result<json>::Ok(json::parse(res->body));
    } catch (const json::exception &e) {
      return Result<json>::Error(
          SyncError::protocol("invalid " + operation + " response", e.what()));
    }
  }
};

ApiClient::ApiClient(const std::string &host, int port,
                     std::chrono::seconds timeout)
    : m_impl(std::make_unique<Impl>(host, port, timeout)), m_host(host),
      m_port(port) {}

ApiClient::~ApiClient() = default;

Result<void> ApiClient::health() {
  auto body = m_impl->getJson("/health", "health");
  if (!body)
    return Result<void>::Error(body.error());
  if (body.value().value("status", std::string()) != "healthy")
    return Result<void>::Error(
        SyncError::server("server reports unhealthy", 200, "", "health"));
  return Result<void>::Ok();
}

Result<void> ApiClient::registerClient(const ClientInfo &client) {
  auto res = m_impl->client.Post("/register", json(client).dump(),
                                 "application/json");
  if (!res)
    return Result<void>::Error(m_impl->connectionError(res, "register"));
  if (res->status != 200)
    return Result<void>::Error(m_impl->statusError(*res, "register"));
  return Result<void>::Ok();
}

Result<SyncResponse> ApiClient::requestSync(const SyncRequest &request) {
  auto res =
      m_impl->client.Post("/sync", json(request).dump(), "application/json");
  if (!res)
    return Result<SyncResponse>::Error(m_impl->connectionError(res, "sync"));
  if (res->status != 200)
    return Result<SyncResponse>::Error(m_impl->statusError(*res, "sync"));
  try {
    return Result<SyncResponse>::Ok(json::parse(res->body).get<SyncResponse>());
  } catch (const json::exception &e) {
    return Result<SyncResponse>::Error(
        SyncError::protocol("invalid sync response", e.what()));
  }
}

static httplib::UploadFormDataItems formFields(const UploadForm &form) {
  return {{"relative_path", form.relative_path, "", ""},
          {"client_id", form.client_id, "", ""},
          {"compression_type", toString(form.compression), "", ""},
          {"original_size", std::to_string(form.original_size), "", ""}};
}

static std::string baseName(const std::string &relativePath) {
  auto pos = relativePath.find_last_of('/');
  return pos == std::string::npos ? relativePath : relativePath.substr(pos + 1);
}

Result<void> ApiClient::uploadBytes(const UploadForm &form,
                                    const std::string &payload) {
  auto items = formFields(form);
  items.push_back({"file", payload, baseName(form.relative_path),
                   "application/octet-stream"});

  auto res = m_impl->client.Post("/upload", items);
  if (!res)
    return Result<void>::Error(m_impl->connectionError(res, "upload"));
  if (res->status != 200)
    return Result<void>::Error(
        m_impl->statusError(*res, "upload", form.relative_path));
  return Result<void>::Ok();
}

Result<void> ApiClient::uploadStream(const UploadForm &form,
                                     UploadSource source, size_t chunkSize) {
  auto items = formFields(form);
  bool readFailed = false;

  httplib::FormDataProviderItems providers = {
      {"file",
       [&, chunkSize](size_t offset, httplib::DataSink &sink) {
         std::vector<char> buf(chunkSize);
         auto got = source(offset, buf.data(), buf.size());
         if (got < 0) {
           readFailed = true;
           return false;
         }
         if (got == 0) {
           sink.done();
           return true;
         }
         return sink.write(buf.data(), static_cast<size_t>(got));
       },
       baseName(form.relative_path), "application/octet-stream"}};

  auto res = m_impl->client.Post("/upload", httplib::Headers{}, items, providers);
  if (readFailed)
    return Result<void>::Error(SyncError::fileOperation(
        "read failed while streaming", form.relative_path, "upload"));
  if (!res)
    return Result<void>::Error(m_impl->connectionError(res, "upload"));
  if (res->status != 200)
    return Result<void>::Error(
        m_impl->statusError(*res, "upload", form.relative_path));
  return Result<void>::Ok();
}

Result<DownloadOutcome> ApiClient::downloadFile(const std::string &relativePath,
                                                const std::string &partPath,
                                                uint64_t offset) {
  httplib::Headers headers;
  if (offset > 0)
    headers.emplace("Range", "bytes=" + std::to_string(offset) + "-");

  DownloadOutcome outcome;
  std::FILE *out = nullptr;
  int writeErrno = 0;
  std::string errorBody;

  auto res = m_impl->client.Get(
      "/download/" + encodeUrlPath(relativePath), headers,
      [&](const httplib::Response &response) {
        outcome.status = response.status;
        if (response.status != 200 && response.status != 206)
          return true; // Body is an error document
        errno = 0;
        out = std::fopen(partPath.c_str(), response.status == 206 ? "ab" : "wb");
        if (!out) {
          writeErrno = errno != 0 ? errno : EIO;
          return false;
        }
        return true;
      },
      [&](const char *data, size_t len) {
        if (!out) {
          errorBody.append(data, len);
          return true;
        }
        if (std::fwrite(data, 1, len, out) != len) {
          writeErrno = errno != 0 ? errno : EIO;
          return false;
        }
        outcome.written += len;
        return true;
      });

  if (out && std::fclose(out) != 0 && writeErrno == 0)
    writeErrno = errno != 0 ? errno : EIO;

  if (writeErrno != 0)
    return Result<DownloadOutcome>::Error(
        fromErrno(writeErrno, relativePath, "download"));
  if (!res)
    return Result<DownloadOutcome>::Error(
        m_impl->connectionError(res, "download"));

  if (outcome.status == 404)
    return Result<DownloadOutcome>::Error(
        SyncError::notFound(relativePath, "download"));
  if (outcome.status != 200 && outcome.status != 206)
    return Result<DownloadOutcome>::Error(
        SyncError::server("download failed: " + errorDetail(errorBody),
                          outcome.status, relativePath, "download"));
  return Result<DownloadOutcome>::Ok(outcome);
}

Result<void> ApiClient::deleteFile(const std::string &relativePath,
                                   const std::string &clientId) {
  auto target = "/files/" + encodeUrlPath(relativePath) +
                "?client_id=" + urlEncode(clientId);
  auto res = m_impl->client.Delete(target);
  if (!res)
    return Result<void>::Error(m_impl->connectionError(res, "delete"));
  if (res->status != 200)
    return Result<void>::Error(
        m_impl->statusError(*res, "delete", relativePath));
  return Result<void>::Ok();
}

Result<std::vector<FileChunk>>
ApiClient::fetchSignature(const std::string &relativePath) {
  using R = Result<std::vector<FileChunk>>;
  auto body = m_impl->getJson("/signature/" + encodeUrlPath(relativePath),
                              "signature", relativePath);
  if (!body)
    return R::Error(body.error());
  try {
    return R::Ok(body.value().at("chunks").get<std::vector<FileChunk>>());
  } catch (const json::exception &e) {
    return R::Error(SyncError::protocol("invalid signature response", e.what()));
  }
}

Result<void> ApiClient::uploadDelta(const std::string &relativePath,
                                    const std::string &clientId,
                                    const std::string &expectedChecksum,
                                    const FileDelta &delta) {
  auto target = "/delta?path=" + urlEncode(relativePath) +
                "&client_id=" + urlEncode(clientId) +
                "&checksum=" + urlEncode(expectedChecksum);
  auto res = m_impl->client.Post(target, encodeDelta(delta), "application/cbor");
  if (!res)
    return Result<void>::Error(m_impl->connectionError(res, "delta"));
  if (res->status != 200)
    return Result<void>::Error(
        m_impl->statusError(*res, "delta", relativePath));
  return Result<void>::Ok();
}

Result<std::vector<HistoryRecord>> ApiClient::history(const std::string &path,
                                                      size_t limit) {
  using R = Result<std::vector<HistoryRecord>>;
  auto body = m_impl->getJson("/history?path=" + urlEncode(path) +
                                  "&limit=" + std::to_string(limit),
                              "history");
  if (!body)
    return R::Error(body.error());

  std::vector<HistoryRecord> records;
  try {
    for (const auto &item : body.value().at("history")) {
      HistoryRecord r;
      r.id = item.value("id", int64_t{0});
      r.file_path = item.at("file_path").get<std::string>();
      r.operation = item.at("operation").get<std::string>();
      r.client_id = item.value("client_id", std::string());
      r.timestamp = item.value("timestamp", int64_t{0});
      r.checksum = item.value("checksum", std::string());
      r.size = item.value("size", int64_t{0});
      records.push_back(std::move(r));
    }
  } catch (const json::exception &e) {
    return R::Error(SyncError::protocol("invalid history response", e.what()));
  }
  return R::Ok(std::move(records));
}

Result<std::vector<ConflictReport>> ApiClient::conflicts() {
  using R = Result<std::vector<ConflictReport>>;
  auto body = m_impl->getJson("/conflicts", "conflicts");
  if (!body)
    return R::Error(body.error());

  std::vector<ConflictReport> reports;
  try {
    for (const auto &item : body.value().at("conflicts")) {
      ConflictReport report;
      report.file_path = item.at("file_path").get<std::string>();
      for (const auto &change : item.at("recent_changes")) {
        HistoryRecord r;
        r.file_path = report.file_path;
        r.operation = change.value("operation", std::string());
        r.client_id = change.value("client_id", std::string());
        r.timestamp = change.value("timestamp", int64_t{0});
        report.recent_changes.push_back(std::move(r));
      }
      reports.push_back(std::move(report));
    }
  } catch (const json::exception &e) {
    return R::Error(SyncError::protocol("invalid conflicts response", e.what()));
  }
  return R::Ok(std::move(reports));
}

Result<std::vector<ClientInfo>> ApiClient::clients() {
  using R = Result<std::vector<ClientInfo>>;
  auto body = m_impl->getJson("/clients", "clients");
  if (!body)
    return R::Error(body.error());
  try {
    return R::Ok(body.value().at("clients").get<std::vector<ClientInfo>>());
  } catch (const json::exception &e) {
    return R::Error(SyncError::protocol("invalid clients response", e.what()));
  }
}

} // namespace filesync
