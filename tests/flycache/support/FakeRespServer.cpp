#include "flycache/support/FakeRespServer.hpp"
#include "flycache/cache/remote/RespCodec.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace flycache {
namespace test {

namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string simple(const std::string& s) { return "+" + s + "\r\n"; }
std::string error(const std::string& s) { return "-" + s + "\r\n"; }
std::string integer(long long n) { return ":" + std::to_string(n) + "\r\n"; }
std::string bulk(const std::string& s) { return "$" + std::to_string(s.size()) + "\r\n" + s + "\r\n"; }
const char* kNullBulk = "$-1\r\n";

bool sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

bool globMatch(const std::string& pattern, const std::string& text) {
    size_t p = 0;
    size_t t = 0;
    size_t starP = std::string::npos;
    size_t starT = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starP = p++;
            starT = t;
            continue;
        }
        if (p < pattern.size()) {
            char expected = pattern[p];
            size_t width = 1;
            if (expected == '\\' && p + 1 < pattern.size()) {
                expected = pattern[p + 1];
                width = 2;
            } else if (expected == '?') {
                p += 1;
                t += 1;
                continue;
            }
            if (expected == text[t]) {
                p += width;
                t += 1;
                continue;
            }
        }
        if (starP == std::string::npos) {
            return false;
        }
        p = starP + 1;
        t = ++starT;
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

FakeRespServer::FakeRespServer(std::string password)
    : password_(std::move(password)) {
    listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0) {
        throw std::runtime_error("FakeRespServer: socket() failed");
    }
    int yes = 1;
    ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0
        || ::listen(listenFd_, 64) != 0) {
        ::close(listenFd_);
        throw std::runtime_error("FakeRespServer: bind/listen failed");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    acceptThread_ = std::thread([this] { acceptLoop(); });
}

FakeRespServer::~FakeRespServer() {
    stop();
}

std::string FakeRespServer::url() const {
    if (password_.empty()) {
        return "redis://127.0.0.1:" + std::to_string(port_);
    }
    return "redis://:" + password_ + "@127.0.0.1:" + std::to_string(port_);
}

void FakeRespServer::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    ::close(listenFd_);

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        for (int fd : clientFds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
        threads.swap(clientThreads_);
    }
    for (auto& t : threads) {
        t.join();
    }
}

void FakeRespServer::acceptLoop() {
    while (!stopping_.load()) {
        pollfd pfd{listenFd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 20);
        if (ready <= 0) {
            continue;
        }
        int fd = ::accept(listenFd_, nullptr, nullptr);
        if (fd < 0) {
            continue;
        }
        std::lock_guard<std::mutex> lock(clientsMutex_);
        clientFds_.push_back(fd);
        clientThreads_.emplace_back([this, fd] { serveClient(fd); });
    }
}

void FakeRespServer::serveClient(int fd) {
    cache::remote::RespReader reader;
    bool authenticated = password_.empty();
    char buf[4096];
    bool open = true;
    while (open && !stopping_.load()) {
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 20);
        if (ready <= 0) {
            continue;
        }
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        reader.feed(buf, static_cast<size_t>(n));
        try {
            while (auto command = reader.next()) {
                std::vector<std::string> args;
                for (const auto& element : command->elements) {
                    args.push_back(element.str);
                }
                if (auto delay = replyDelayMs_.load()) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
                }
                if (!sendAll(fd, handle(args, authenticated))) {
                    open = false;
                    break;
                }
            }
        } catch (const std::exception&) {
            sendAll(fd, error("ERR protocol error"));
            open = false;
        }
    }
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        clientFds_.erase(std::remove(clientFds_.begin(), clientFds_.end(), fd), clientFds_.end());
    }
    ::close(fd);
}

bool FakeRespServer::liveLocked(const std::string& key, std::chrono::steady_clock::time_point now) {
    auto it = data_.find(key);
    if (it == data_.end()) return false;
    if (it->second.expiresAt && now >= *it->second.expiresAt) {
        data_.erase(it);
        return false;
    }
    return true;
}

std::string FakeRespServer::handle(const std::vector<std::string>& args, bool& authenticated) {
    if (args.empty()) {
        return error("ERR empty command");
    }
    const std::string name = upper(args[0]);
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(dataMutex_);
    log_.push_back(args);

    if (name == "AUTH") {
        if (args.back() == password_) {
            authenticated = true;
            return simple("OK");
        }
        return error("WRONGPASS invalid password");
    }
    if (!authenticated) {
        return error("NOAUTH Authentication required.");
    }
    if (name == "PING") {
        return simple("PONG");
    }
    if (name == "SELECT") {
        return simple("OK");
    }
    if (name == "GET" && args.size() == 2) {
        if (!liveLocked(args[1], now)) {
            return kNullBulk;
        }
        return bulk(data_[args[1]].value);
    }
    if (name == "SET" && args.size() >= 3) {
        Entry entry{args[2], std::nullopt};
        if (args.size() == 5 && upper(args[3]) == "PX") {
            entry.expiresAt = now + std::chrono::milliseconds(std::stoll(args[4]));
        }
        data_[args[1]] = std::move(entry);
        return simple("OK");
    }
    if (name == "DEL" || name == "EXISTS") {
        long long count = 0;
        for (size_t i = 1; i < args.size(); ++i) {
            if (liveLocked(args[i], now)) {
                ++count;
                if (name == "DEL") {
                    data_.erase(args[i]);
                }
            }
        }
        return integer(count);
    }
    if (name == "SCAN" && args.size() >= 2) {
        size_t cursor = static_cast<size_t>(std::stoull(args[1]));
        std::string match = "*";
        size_t count = 10;
        for (size_t i = 2; i + 1 < args.size(); i += 2) {
            if (upper(args[i]) == "MATCH") match = args[i + 1];
            if (upper(args[i]) == "COUNT") count = static_cast<size_t>(std::stoull(args[i + 1]));
        }
        // Курсор ссылается на последний выданный ключ, поэтому удаление
        // ключей между итерациями не приводит к пропускам
        auto it = data_.begin();
        if (cursor != 0) {
            auto last = scanCursors_.find(cursor);
            if (last == scanCursors_.end()) {
                return error("ERR invalid cursor");
            }
            it = data_.upper_bound(last->second);
            scanCursors_.erase(last);
        }
        std::string page;
        size_t found = 0;
        std::string lastKey;
        for (size_t examined = 0; it != data_.end() && examined < count; ++it, ++examined) {
            lastKey = it->first;
            if (globMatch(match, it->first)) {
                page += bulk(it->first);
                ++found;
            }
        }
        std::string next = "0";
        if (it != data_.end()) {
            size_t id = nextCursor_++;
            scanCursors_[id] = lastKey;
            next = std::to_string(id);
        }
        return "*2\r\n" + bulk(next) + "*" + std::to_string(found) + "\r\n" + page;
    }
    return error("ERR unknown command '" + args[0] + "'");
}

size_t FakeRespServer::commandCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return static_cast<size_t>(std::count_if(log_.begin(), log_.end(), [&](const std::vector<std::string>& c) {
        return !c.empty() && upper(c[0]) == upper(name);
    }));
}

std::vector<std::vector<std::string>> FakeRespServer::commands() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    return log_;
}

std::vector<std::string> FakeRespServer::keys() const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    std::vector<std::string> result;
    auto now = std::chrono::steady_clock::now();
    for (const auto& kv : data_) {
        if (!kv.second.expiresAt || now < *kv.second.expiresAt) {
            result.push_back(kv.first);
        }
    }
    return result;
}

std::optional<std::string> FakeRespServer::rawValue(const std::string& key) const {
    std::lock_guard<std::mutex> lock(dataMutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second.value;
}

} // namespace test
} // namespace flycache
