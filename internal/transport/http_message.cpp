#include "http_message.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace collector::transport {

namespace {

std::string Lower(std::string_view in) {
  std::string out(in);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view TrimSpaces(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

bool DecodeChunked(std::string_view in, std::string* out) {
  out->clear();
  while (true) {
    const auto eol = in.find("\r\n");
    if (eol == std::string_view::npos) return false;

    const std::string size_text(in.substr(0, eol));
    char*             end  = nullptr;
    const auto        size = std::strtoul(size_text.c_str(), &end, 16);
    if (end == size_text.c_str()) return false;

    in.remove_prefix(eol + 2);
    if (size == 0) return true;
    if (in.size() < size + 2) return false;

    out->append(in.substr(0, size));
    in.remove_prefix(size + 2);
  }
}

} // namespace

const char* ToString(TransportStatus status) {
  switch (status) {
    case TransportStatus::OK:
      return "ok";
    case TransportStatus::ConnectFailed:
      return "connect_failed";
    case TransportStatus::Timeout:
      return "timeout";
    case TransportStatus::IOError:
      return "io_error";
    case TransportStatus::ProtocolError:
      return "protocol_error";
  }
  return "unknown";
}

std::string FormatRequest(const HttpRequest& request, std::string_view host_header) {
  std::string out;
  out.reserve(request.body.size() + 256);
  out += request.method + " " + request.target + " HTTP/1.1\r\n";
  out += "Host: " + std::string(host_header) + "\r\n";
  out += "User-Agent: serial-collector\r\n";
  for (const auto& [name, value] : request.headers) {
    out += name + ": " + value + "\r\n";
  }
  out += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
  out += "Connection: close\r\n\r\n";
  out += request.body;
  return out;
}

bool ParseResponse(std::string_view raw, TransportResult* out) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string_view::npos) {
    out->status  = TransportStatus::ProtocolError;
    out->message = "incomplete response headers";
    return false;
  }

  const auto head        = raw.substr(0, header_end);
  const auto status_end  = head.find("\r\n");
  const auto status_line = head.substr(0, status_end);

  // HTTP/1.1 204 No Content
  if (status_line.size() < 12 || status_line.substr(0, 7) != "HTTP/1." || status_line[8] != ' ') {
    out->status  = TransportStatus::ProtocolError;
    out->message = "bad status line '" + std::string(status_line) + "'";
    return false;
  }
  const std::string code(status_line.substr(9, 3));
  if (!std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isdigit(c); })) {
    out->status  = TransportStatus::ProtocolError;
    out->message = "bad status code '" + code + "'";
    return false;
  }
  out->http_status = std::atoi(code.c_str());

  bool   chunked        = false;
  long   content_length = -1;
  size_t pos            = status_end == std::string_view::npos ? head.size() : status_end + 2;
  while (pos < head.size()) {
    auto eol = head.find("\r\n", pos);
    if (eol == std::string_view::npos) eol = head.size();
    const auto header = head.substr(pos, eol - pos);
    pos               = eol + 2;

    const auto colon = header.find(':');
    if (colon == std::string_view::npos) continue;
    const auto name  = Lower(TrimSpaces(header.substr(0, colon)));
    const auto value = TrimSpaces(header.substr(colon + 1));
    if (name == "content-length") {
      content_length = std::atol(std::string(value).c_str());
    } else if (name == "transfer-encoding" && Lower(value).find("chunked") != std::string::npos) {
      chunked = true;
    }
  }

  auto body = raw.substr(header_end + 4);
  if (chunked) {
    if (!DecodeChunked(body, &out->body)) {
      out->status  = TransportStatus::ProtocolError;
      out->message = "truncated chunked body";
      return false;
    }
  } else if (content_length >= 0) {
    out->body = std::string(body.substr(0, static_cast<size_t>(content_length)));
  } else {
    out->body = std::string(body);
  }

  out->status = TransportStatus::OK;
  return true;
}

std::string UrlEncode(std::string_view value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[(c >> 4) & 0x0F]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

} // namespace collector::transport
