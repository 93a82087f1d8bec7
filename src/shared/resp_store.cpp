#include "tier_cache/resp_store.hpp"

#include "tier_cache/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <fcntl.h>
#include <functional>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

namespace tier_cache {
namespace {
constexpr char kTagSeparator = '\x1f';
constexpr std::size_t kDelBatch = 512;
constexpr int kWatchRetries = 16;
constexpr std::size_t kPruneSample = 8;

std::string kind_name(const std::optional<ExpirationSpec> &spec) {
  if (!spec.has_value())
    return "none";
  return spec->kind == ExpirationKind::Sliding ? "sld" : "abs";
}

std::string join_tags(const std::vector<std::string> &tags) {
  std::string out;
  for (const auto &t : tags) {
    if (!out.empty())
      out.push_back(kTagSeparator);
    out += t;
  }
  return out;
}

std::vector<std::string> split_tags(const std::string &s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < s.size()) {
    auto end = s.find(kTagSeparator, start);
    if (end == std::string::npos)
      end = s.size();
    if (end > start)
      out.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

bool parse_i64(const std::string &s, std::int64_t &out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

void timeval_from(Millis ms, timeval &tv) {
  tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
}
} // namespace

class RespStore::Connection {
public:
  Connection() = default;
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;
  ~Connection() {
    if (fd_ >= 0)
      ::close(fd_);
  }

  bool open(const RespStoreConfig &cfg, std::string *err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    const std::string port = std::to_string(cfg.port);
    const int rc = ::getaddrinfo(cfg.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0) {
      if (err)
        *err = std::string("resolve failed: ") + ::gai_strerror(rc);
      return false;
    }
    std::string last_err = "no address";
    for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
      if (connect_one(ai, cfg, &last_err))
        break;
    }
    ::freeaddrinfo(res);
    if (fd_ < 0) {
      if (err)
        *err = "connect to " + cfg.host + ":" + port + " failed: " + last_err;
      return false;
    }
    return true;
  }

  bool roundtrip(const std::string &payload, std::size_t expected,
                 std::vector<RespReply> &out, std::string *err) {
    std::size_t sent = 0;
    while (sent < payload.size()) {
      const auto n = ::send(fd_, payload.data() + sent, payload.size() - sent,
                            MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR)
          continue;
        if (err)
          *err = std::string("send failed: ") + std::strerror(errno);
        return false;
      }
      sent += static_cast<std::size_t>(n);
    }

    out.clear();
    out.reserve(expected);
    char buf[16 * 1024];
    while (out.size() < expected) {
      std::string perr;
      while (out.size() < expected) {
        auto reply = parser_.next_reply(&perr);
        if (!reply.has_value())
          break;
        out.push_back(std::move(*reply));
      }
      if (parser_.failed()) {
        if (err)
          *err = perr;
        return false;
      }
      if (out.size() == expected)
        break;
      const auto n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n == 0) {
        if (err)
          *err = "connection closed by server";
        return false;
      }
      if (n < 0) {
        if (errno == EINTR)
          continue;
        if (err)
          *err = (errno == EAGAIN || errno == EWOULDBLOCK)
                     ? std::string("read timed out")
                     : std::string("recv failed: ") + std::strerror(errno);
        return false;
      }
      parser_.feed(buf, static_cast<std::size_t>(n));
    }
    if (parser_.buffered() != 0) {
      if (err)
        *err = "unexpected trailing reply data";
      return false;
    }
    return true;
  }

private:
  bool connect_one(addrinfo *ai, const RespStoreConfig &cfg, std::string *err) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                      ai->ai_protocol);
    if (fd < 0) {
      *err = std::strerror(errno);
      return false;
    }
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc != 0 && errno == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      rc = ::poll(&pfd, 1, static_cast<int>(cfg.connect_timeout.count()));
      if (rc == 0) {
        *err = "connect timed out";
        ::close(fd);
        return false;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (rc < 0 ||
          ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 ||
          so_error != 0) {
        *err = std::strerror(so_error != 0 ? so_error : errno);
        ::close(fd);
        return false;
      }
    } else if (rc != 0) {
      *err = std::strerror(errno);
      ::close(fd);
      return false;
    }
    ::fcntl(fd, F_SETFL, flags);
    timeval tv{};
    timeval_from(cfg.io_timeout, tv);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    fd_ = fd;
    return true;
  }

  int fd_{-1};
  RespReplyParser parser_;
};

RespStore::RespStore(RespStoreConfig cfg, std::string name)
    : cfg_(std::move(cfg)), name_(std::move(name)) {
  if (cfg_.pool_size == 0)
    cfg_.pool_size = 1;
  spdlog::info("{}: RESP store {}:{} prefix='{}' pool={}", name_, cfg_.host,
               cfg_.port, cfg_.key_prefix, cfg_.pool_size);
}

RespStore::~RespStore() = default;

std::string RespStore::entry_key(const std::string &key) const {
  return cfg_.key_prefix + "k:" + key;
}

std::string RespStore::tag_key(const std::string &tag) const {
  return cfg_.key_prefix + "t:" + tag;
}

std::optional<CacheEntry> RespStore::get(const std::string &key) {
  const std::string k = entry_key(key);
  auto replies = execute({{"HGETALL", k}});
  const RespReply &r = replies.front();
  if (r.type != RespReply::Type::Array || r.elements.empty())
    return std::nullopt;

  CacheEntry entry;
  bool has_data = false;
  std::string kind = "none";
  std::int64_t ttl = 0;
  for (std::size_t i = 0; i + 1 < r.elements.size(); i += 2) {
    const auto &field = r.elements[i].str;
    const auto &value = r.elements[i + 1].str;
    if (field == "data") {
      entry.value.assign(value.begin(), value.end());
      has_data = true;
    } else if (field == "kind") {
      kind = value;
    } else if (field == "ttl") {
      if (!parse_i64(value, ttl))
        throw TierUnavailable(name_, "corrupt ttl field on '" + key + "'");
    } else if (field == "tags") {
      entry.tags = split_tags(value);
    } else if (field == "neg") {
      entry.negative = value == "1";
    }
  }
  if (!has_data)
    return std::nullopt;
  if (kind == "abs")
    entry.expiration = ExpirationSpec::absolute(Millis(ttl));
  else if (kind == "sld")
    entry.expiration = ExpirationSpec::sliding(Millis(ttl));

  if (kind == "sld" && ttl > 0)
    execute({{"PEXPIRE", k, std::to_string(ttl)}});
  return entry;
}

void RespStore::set(const std::string &key, const CacheEntry &entry) {
  write_entry(key, &entry);
}

void RespStore::remove(const std::string &key) { write_entry(key, nullptr); }

// Replaces or deletes one entry under WATCH so the tag sets it leaves and the
// ones it joins change together with the hash. Members of the new tags are
// sampled and dropped from the set when their hash has expired.
void RespStore::write_entry(const std::string &key, const CacheEntry *entry) {
  const std::string k = entry_key(key);
  const std::vector<std::string> new_tags =
      entry != nullptr ? entry->tags : std::vector<std::string>{};

  with_connection([&](Connection &conn) {
    for (int attempt = 0; attempt < kWatchRetries; ++attempt) {
      Commands read{{"WATCH", k}, {"HGET", k, "tags"}};
      for (const auto &tag : new_tags)
        read.push_back(
            {"SRANDMEMBER", tag_key(tag), std::to_string(kPruneSample)});
      const auto current = run(conn, read);

      std::vector<std::string> old_tags;
      if (current[1].type == RespReply::Type::Bulk)
        old_tags = split_tags(current[1].str);

      std::vector<std::pair<std::string, std::string>> sampled;
      for (std::size_t i = 0; i < new_tags.size(); ++i) {
        for (const auto &m : current[2 + i].elements) {
          if (m.str != k)
            sampled.emplace_back(tag_key(new_tags[i]), m.str);
        }
      }
      std::vector<RespReply> alive;
      if (!sampled.empty()) {
        Commands exists;
        for (const auto &[_, member] : sampled)
          exists.push_back({"EXISTS", member});
        alive = run(conn, exists);
      }

      Commands tx{{"MULTI"}, {"DEL", k}};
      if (entry != nullptr) {
        const std::int64_t ttl = entry->expiration.has_value()
                                     ? entry->expiration->duration.count()
                                     : 0;
        tx.push_back({"HSET", k, "data",
                      std::string(entry->value.begin(), entry->value.end()),
                      "kind", kind_name(entry->expiration), "ttl",
                      std::to_string(ttl), "tags", join_tags(entry->tags),
                      "neg", entry->negative ? "1" : "0"});
        if (entry->expiration.has_value())
          tx.push_back(
              {"PEXPIRE", k, std::to_string(std::max<std::int64_t>(1, ttl))});
      }
      for (const auto &tag : old_tags) {
        if (std::find(new_tags.begin(), new_tags.end(), tag) == new_tags.end())
          tx.push_back({"SREM", tag_key(tag), k});
      }
      std::uint64_t dead = 0;
      for (std::size_t i = 0; i < sampled.size(); ++i) {
        if (alive[i].integer == 0) {
          tx.push_back({"SREM", sampled[i].first, sampled[i].second});
          ++dead;
        }
      }
      for (const auto &tag : new_tags)
        tx.push_back({"SADD", tag_key(tag), k});
      tx.push_back({"EXEC"});

      const auto result = run(conn, tx);
      if (result.back().type == RespReply::Type::Array) {
        pruned_ += dead;
        return;
      }
      if (!result.back().is_null())
        throw TierUnavailable(name_, "unexpected EXEC reply for '" + key + "'");
      ++conflicts_;
      spdlog::debug("{}: concurrent change to '{}', retrying", name_, key);
    }
    throw TierUnavailable(name_, "'" + key + "' kept changing during write");
  });
}

void RespStore::remove_by_tag(const std::string &tag) {
  const std::string t = tag_key(tag);
  std::size_t removed = 0;

  with_connection([&](Connection &conn) {
    for (int attempt = 0; attempt < kWatchRetries; ++attempt) {
      const auto listed = run(conn, {{"WATCH", t}, {"SMEMBERS", t}});
      std::vector<std::string> members;
      for (const auto &m : listed[1].elements)
        members.push_back(m.str);

      Commands read;
      for (std::size_t i = 0; i < members.size(); i += kDelBatch) {
        std::vector<std::string> watch{"WATCH"};
        const auto end = std::min(members.size(), i + kDelBatch);
        watch.insert(watch.end(), members.begin() + i, members.begin() + end);
        read.push_back(std::move(watch));
      }
      for (const auto &m : members)
        read.push_back({"HGET", m, "tags"});
      std::vector<RespReply> tags_of;
      if (!read.empty())
        tags_of = run(conn, read);
      const std::size_t first_tags = read.size() - members.size();

      // Each member also leaves every other tag set it was in.
      Commands tx{{"MULTI"}};
      for (std::size_t i = 0; i < members.size(); ++i) {
        const auto &r = tags_of[first_tags + i];
        if (r.type != RespReply::Type::Bulk)
          continue;
        for (const auto &other : split_tags(r.str)) {
          if (other != tag)
            tx.push_back({"SREM", tag_key(other), members[i]});
        }
      }
      std::vector<std::string> del{"DEL"};
      for (const auto &m : members) {
        del.push_back(m);
        if (del.size() > kDelBatch) {
          tx.push_back(std::move(del));
          del = {"DEL"};
        }
      }
      if (del.size() > 1)
        tx.push_back(std::move(del));
      tx.push_back({"DEL", t});
      tx.push_back({"EXEC"});

      const auto result = run(conn, tx);
      if (result.back().type == RespReply::Type::Array) {
        removed = members.size();
        return;
      }
      if (!result.back().is_null())
        throw TierUnavailable(name_, "unexpected EXEC reply for tag '" + tag + "'");
      ++conflicts_;
    }
    throw TierUnavailable(name_, "tag '" + tag + "' kept changing during removal");
  });
  spdlog::debug("{}: removed tag '{}' ({} members)", name_, tag, removed);
}

bool RespStore::ping(std::string *err) {
  try {
    auto replies = execute({{"PING"}});
    return replies.front().type == RespReply::Type::Simple;
  } catch (const TierUnavailable &e) {
    if (err)
      *err = e.what();
    return false;
  }
}

RespStoreStats RespStore::stats() const {
  return {commands_.load(), connects_.load(), failures_.load(),
          conflicts_.load(), pruned_.load()};
}

std::size_t RespStore::open_connections() const {
  std::lock_guard<std::mutex> lock(pool_mu_);
  return open_;
}

std::unique_ptr<RespStore::Connection> RespStore::checkout() {
  {
    std::unique_lock<std::mutex> lock(pool_mu_);
    const bool ready = pool_cv_.wait_for(lock, cfg_.io_timeout, [&] {
      return !idle_.empty() || open_ < cfg_.pool_size;
    });
    if (!ready) {
      ++failures_;
      throw TierUnavailable(name_, "connection pool exhausted");
    }
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      return conn;
    }
    ++open_;
  }

  auto conn = std::make_unique<Connection>();
  std::string err;
  if (!conn->open(cfg_, &err)) {
    discard();
    ++failures_;
    spdlog::warn("{}: {}", name_, err);
    throw TierUnavailable(name_, err);
  }
  ++connects_;
  spdlog::debug("{}: connected to {}:{}", name_, cfg_.host, cfg_.port);
  return conn;
}

void RespStore::checkin(std::unique_ptr<Connection> conn) {
  {
    std::lock_guard<std::mutex> lock(pool_mu_);
    idle_.push_back(std::move(conn));
  }
  pool_cv_.notify_one();
}

void RespStore::discard() {
  {
    std::lock_guard<std::mutex> lock(pool_mu_);
    --open_;
  }
  pool_cv_.notify_one();
}

void RespStore::with_connection(const std::function<void(Connection &)> &fn) {
  auto conn = checkout();
  try {
    fn(*conn);
  } catch (const TierUnavailable &) {
    // The connection may hold half a reply or an open WATCH.
    conn.reset();
    discard();
    throw;
  }
  checkin(std::move(conn));
}

std::vector<RespReply> RespStore::run(Connection &conn,
                                      const Commands &commands) {
  std::string payload;
  for (const auto &c : commands)
    payload += resp_command(c);

  std::vector<RespReply> replies;
  std::string err;
  if (!conn.roundtrip(payload, commands.size(), replies, &err)) {
    ++failures_;
    throw TierUnavailable(name_, err);
  }
  commands_ += commands.size();
  for (const auto &r : replies) {
    if (r.is_error())
      throw TierUnavailable(name_, "server error: " + r.str);
  }
  return replies;
}

std::vector<RespReply> RespStore::execute(const Commands &commands) {
  std::vector<RespReply> replies;
  with_connection([&](Connection &conn) { replies = run(conn, commands); });
  return replies;
}

} // namespace tier_cache
