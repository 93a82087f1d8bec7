#include "tier_cache/resp.hpp"

#include <charconv>

namespace tier_cache {
namespace {
constexpr long long kMaxBulkLen = 512LL * 1024 * 1024;
constexpr long long kMaxArrayLen = 1024 * 1024;
constexpr int kMaxDepth = 8;

bool parse_ll(const std::string &s, std::size_t begin, std::size_t end,
              long long &out) {
  if (begin >= end)
    return false;
  const char *first = s.data() + begin;
  const char *last = s.data() + end;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}
} // namespace

void RespReplyParser::feed(const char *data, std::size_t len) {
  buffer_.append(data, len);
}

std::optional<RespReply> RespReplyParser::next_reply(std::string *err) {
  if (failed_) {
    if (err) *err = "reply stream is desynchronized";
    return std::nullopt;
  }
  std::size_t pos = pos_;
  RespReply reply;
  switch (parse(pos, reply, 0)) {
  case Step::Incomplete:
    return std::nullopt;
  case Step::Malformed:
    failed_ = true;
    if (err) *err = "malformed reply";
    return std::nullopt;
  case Step::Done:
    break;
  }
  pos_ = pos;
  // Compact once the consumed prefix dominates the buffer.
  if (pos_ > 4096 && pos_ * 2 > buffer_.size()) {
    buffer_.erase(0, pos_);
    pos_ = 0;
  }
  return reply;
}

bool RespReplyParser::read_line(std::size_t &pos, std::string &line) const {
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos) return false;
  line = buffer_.substr(pos, crlf - pos);
  pos = crlf + 2;
  return true;
}

RespReplyParser::Step RespReplyParser::parse(std::size_t &pos, RespReply &out,
                                             int depth) const {
  if (depth > kMaxDepth) return Step::Malformed;
  if (pos >= buffer_.size()) return Step::Incomplete;
  const char marker = buffer_[pos];
  std::size_t cursor = pos + 1;
  std::string line;
  if (!read_line(cursor, line)) return Step::Incomplete;

  switch (marker) {
  case '+':
    out.type = RespReply::Type::Simple;
    out.str = std::move(line);
    break;
  case '-':
    out.type = RespReply::Type::Error;
    out.str = std::move(line);
    break;
  case ':':
    out.type = RespReply::Type::Integer;
    if (!parse_ll(line, 0, line.size(), out.integer)) return Step::Malformed;
    break;
  case '$': {
    long long len = 0;
    if (!parse_ll(line, 0, line.size(), len)) return Step::Malformed;
    if (len == -1) {
      out.type = RespReply::Type::Null;
      break;
    }
    if (len < 0 || len > kMaxBulkLen) return Step::Malformed;
    const auto n = static_cast<std::size_t>(len);
    if (cursor + n + 2 > buffer_.size()) return Step::Incomplete;
    if (buffer_.compare(cursor + n, 2, "\r\n") != 0) return Step::Malformed;
    out.type = RespReply::Type::Bulk;
    out.str = buffer_.substr(cursor, n);
    cursor += n + 2;
    break;
  }
  case '*': {
    long long count = 0;
    if (!parse_ll(line, 0, line.size(), count)) return Step::Malformed;
    if (count == -1) {
      out.type = RespReply::Type::Null;
      break;
    }
    if (count < 0 || count > kMaxArrayLen) return Step::Malformed;
    out.type = RespReply::Type::Array;
    out.elements.clear();
    out.elements.reserve(static_cast<std::size_t>(count));
    for (long long i = 0; i < count; ++i) {
      RespReply child;
      const Step s = parse(cursor, child, depth + 1);
      if (s != Step::Done) return s;
      out.elements.push_back(std::move(child));
    }
    break;
  }
  default:
    return Step::Malformed;
  }
  pos = cursor;
  return Step::Done;
}

std::string resp_command(const std::vector<std::string> &args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto &a : args) {
    out += "$" + std::to_string(a.size()) + "\r\n";
    out += a;
    out += "\r\n";
  }
  return out;
}

} // namespace tier_cache
