#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tier_cache {

struct RespReply {
  enum class Type { Simple, Error, Integer, Bulk, Null, Array };

  Type type{Type::Null};
  std::string str;
  long long integer{0};
  std::vector<RespReply> elements;

  bool is_error() const { return type == Type::Error; }
  bool is_null() const { return type == Type::Null; }
};

// Parses server replies. next_reply() returns nullopt until a complete reply
// is buffered; malformed input is reported through `err` and poisons the
// parser, since the stream can no longer be framed.
class RespReplyParser {
public:
  void feed(const char *data, std::size_t len);
  std::optional<RespReply> next_reply(std::string *err = nullptr);
  bool failed() const { return failed_; }
  std::size_t buffered() const { return buffer_.size() - pos_; }

private:
  enum class Step { Done, Incomplete, Malformed };
  Step parse(std::size_t &pos, RespReply &out, int depth) const;
  bool read_line(std::size_t &pos, std::string &line) const;

  std::string buffer_;
  std::size_t pos_{0};
  bool failed_{false};
};

// Encodes one command as an array of bulk strings.
std::string resp_command(const std::vector<std::string> &args);

} // namespace tier_cache
