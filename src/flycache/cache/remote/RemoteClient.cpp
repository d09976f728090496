#include "flycache/cache/remote/RemoteClient.hpp"
#include "flycache/cache/base/CacheError.hpp"
#include "flycache/util/Logging.hpp"

namespace flycache {
namespace cache {
namespace remote {

RemoteClientOptions RemoteClientOptions::fromConfig(const CacheConfig& config) {
    RemoteClientOptions options;
    options.target = RemoteTarget::parse(config.remoteUrl);
    options.poolSize = config.poolSize;
    options.minIdleConns = config.minIdleConns;
    options.maxIdleConns = config.maxIdleConns;
    options.connMaxIdleTime = config.connMaxIdleTime;
    options.connMaxLifetime = config.connMaxLifetime;
    options.connectTimeout = config.connectTimeout;
    options.ioTimeout = config.ioTimeout;
    return options;
}

// Соединение, взятое из пула; возвращается в пул в деструкторе
class RemoteClient::Lease {
public:
    Lease(RemoteClient& client, std::unique_ptr<RemoteConnection> conn)
        : client_(client), conn_(std::move(conn)) {}
    ~Lease() { client_.release(std::move(conn_)); }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    RemoteConnection* operator->() { return conn_.get(); }

private:
    RemoteClient& client_;
    std::unique_ptr<RemoteConnection> conn_;
};

RemoteClient::RemoteClient(RemoteClientOptions options)
    : options_(std::move(options))
    , endpoint_(options_.target.host + ":" + std::to_string(options_.target.port))
    , logger_(util::componentLogger("remotecache")) {
    if (options_.poolSize == 0) {
        options_.poolSize = 1;
    }
    logger_->debug("RemoteClient: создан для {}, poolSize={}, maxIdle={}",
                   endpoint_, options_.poolSize, options_.maxIdleConns);
}

RemoteClient::~RemoteClient() {
    close();
}

RespValue RemoteClient::execute(const std::vector<std::string>& args, const Deadline& deadline) {
    Lease lease(*this, acquire(deadline));
    return lease->execute(args, deadline);
}

RespValue RemoteClient::expectOk(const RespValue& reply, const char* op, const std::string& key) const {
    if (reply.isError()) {
        throw BackendError(op, key, reply.str);
    }
    return reply;
}

std::optional<std::string> RemoteClient::get(const std::string& key, const Deadline& deadline) {
    auto reply = expectOk(execute({"GET", key}, deadline), "get", key);
    if (reply.isNull()) {
        return std::nullopt;
    }
    if (reply.type != RespValue::Type::BulkString && reply.type != RespValue::Type::SimpleString) {
        throw BackendError("get", key, "unexpected reply type");
    }
    return reply.str;
}

void RemoteClient::set(const std::string& key, const std::string& value, Ttl ttl, const Deadline& deadline) {
    std::vector<std::string> args{"SET", key, value};
    if (ttl.count() > 0) {
        args.push_back("PX");
        args.push_back(std::to_string(ttl.count()));
    }
    expectOk(execute(args, deadline), "set", key);
}

long long RemoteClient::del(const std::vector<std::string>& keys, const Deadline& deadline) {
    if (keys.empty()) {
        return 0;
    }
    std::vector<std::string> args;
    args.reserve(keys.size() + 1);
    args.push_back("DEL");
    args.insert(args.end(), keys.begin(), keys.end());
    auto reply = expectOk(execute(args, deadline), "delete", keys.front());
    return reply.type == RespValue::Type::Integer ? reply.integer : 0;
}

bool RemoteClient::exists(const std::string& key, const Deadline& deadline) {
    auto reply = expectOk(execute({"EXISTS", key}, deadline), "exists", key);
    if (reply.type != RespValue::Type::Integer) {
        throw BackendError("exists", key, "unexpected reply type");
    }
    return reply.integer > 0;
}

std::pair<std::string, std::vector<std::string>> RemoteClient::scan(const std::string& cursor,
                                                                    const std::string& match,
                                                                    size_t count,
                                                                    const Deadline& deadline) {
    auto reply = expectOk(execute({"SCAN", cursor, "MATCH", match, "COUNT", std::to_string(count)}, deadline),
                          "scan", match);
    if (reply.type != RespValue::Type::Array || reply.elements.size() != 2
        || reply.elements[1].type != RespValue::Type::Array) {
        throw BackendError("scan", match, "unexpected reply shape");
    }
    std::vector<std::string> keys;
    keys.reserve(reply.elements[1].elements.size());
    for (auto& element : reply.elements[1].elements) {
        keys.push_back(std::move(element.str));
    }
    return {reply.elements[0].str, std::move(keys)};
}

void RemoteClient::ping(const Deadline& deadline) {
    auto reply = expectOk(execute({"PING"}, deadline), "ping", "");
    if (reply.type != RespValue::Type::SimpleString || reply.str != "PONG") {
        throw BackendError("ping", "", "unexpected reply '" + reply.str + "'");
    }
}

void RemoteClient::fillIdle(const Deadline& deadline) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || open_ >= options_.minIdleConns || open_ >= options_.poolSize) {
                return;
            }
            ++open_;
        }
        try {
            auto conn = connect(deadline);
            release(std::move(conn));
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                --open_;
            }
            released_.notify_one();
            logger_->warn("RemoteClient: не удалось открыть резервное соединение: {}", e.what());
            return;
        }
    }
}

void RemoteClient::close() {
    std::deque<std::unique_ptr<RemoteConnection>> toClose;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        open_ -= idle_.size();
        toClose.swap(idle_);
    }
    released_.notify_all();
    logger_->debug("RemoteClient: закрыто {} свободных соединений с {}", toClose.size(), endpoint_);
}

PoolStats RemoteClient::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return PoolStats{open_, idle_.size(), created_};
}

bool RemoteClient::isStale(const RemoteConnection& conn, Clock::time_point now) const {
    if (options_.connMaxLifetime.count() > 0 && now - conn.createdAt() >= options_.connMaxLifetime) {
        return true;
    }
    return options_.connMaxIdleTime.count() > 0 && now - conn.lastUsed() >= options_.connMaxIdleTime;
}

std::unique_ptr<RemoteConnection> RemoteClient::acquire(const Deadline& deadline) {
    std::vector<std::unique_ptr<RemoteConnection>> stale;
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (closed_) {
            throw BackendUnavailableError("acquire", endpoint_, "client is closed");
        }

        auto now = Clock::now();
        while (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            if (!isStale(*conn, now)) {
                lock.unlock();
                return conn;
            }
            --open_;
            stale.push_back(std::move(conn));
        }

        if (open_ < options_.poolSize) {
            ++open_;
            lock.unlock();
            stale.clear();
            try {
                return connect(deadline);
            } catch (...) {
                {
                    std::lock_guard<std::mutex> guard(mutex_);
                    --open_;
                }
                released_.notify_one();
                throw;
            }
        }

        auto tp = deadline.timePoint();
        if (!tp) {
            released_.wait(lock);
        } else if (released_.wait_until(lock, *tp) == std::cv_status::timeout) {
            throw PoolTimeoutError("acquire", endpoint_, "connection pool exhausted");
        }
    }
}

void RemoteClient::release(std::unique_ptr<RemoteConnection> conn) {
    if (!conn) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bool keep = !closed_ && !conn->isBroken()
                    && idle_.size() < options_.maxIdleConns
                    && !isStale(*conn, Clock::now());
        if (keep) {
            idle_.push_back(std::move(conn));
        } else {
            --open_;
        }
    }
    released_.notify_one();
    // conn, если не возвращено в пул, закрывается здесь вне блокировки
}

std::unique_ptr<RemoteConnection> RemoteClient::connect(const Deadline& deadline) {
    auto conn = RemoteConnection::open(options_.target, options_.connectTimeout, options_.ioTimeout, deadline);

    const auto& target = options_.target;
    if (!target.password.empty()) {
        std::vector<std::string> auth{"AUTH"};
        if (!target.username.empty()) {
            auth.push_back(target.username);
        }
        auth.push_back(target.password);
        auto reply = conn->execute(auth, deadline);
        if (reply.isError()) {
            throw BackendUnavailableError("auth", endpoint_, reply.str);
        }
    }
    if (target.db != 0) {
        auto reply = conn->execute({"SELECT", std::to_string(target.db)}, deadline);
        if (reply.isError()) {
            throw BackendUnavailableError("select", endpoint_, reply.str);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++created_;
    }
    logger_->debug("RemoteClient: новое соединение с {}", endpoint_);
    return conn;
}

} // namespace remote
} // namespace cache
} // namespace flycache
