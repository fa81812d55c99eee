#include "support/test_http_server.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <fmt/format.h>

namespace braid::test {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r");
    return value.substr(begin, end - begin + 1);
}

const char* reasonPhrase(int status) {
    switch (status) {
    case 200: return "OK";
    case 206: return "Partial Content";
    case 404: return "Not Found";
    case 416: return "Range Not Satisfiable";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
    }
}

bool sendAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

bool parseRequest(const std::string& raw, HttpRequest& request) {
    const auto line_end = raw.find("\r\n");
    if (line_end == std::string::npos) {
        return false;
    }

    const std::string request_line = raw.substr(0, line_end);
    const auto first_space = request_line.find(' ');
    const auto second_space = request_line.find(' ', first_space + 1);
    if (first_space == std::string::npos || second_space == std::string::npos) {
        return false;
    }
    request.method = request_line.substr(0, first_space);
    request.target = request_line.substr(first_space + 1, second_space - first_space - 1);

    std::size_t pos = line_end + 2;
    while (pos < raw.size()) {
        const auto next = raw.find("\r\n", pos);
        if (next == std::string::npos || next == pos) {
            break;
        }
        const std::string line = raw.substr(pos, next - pos);
        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            request.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
        pos = next + 2;
    }
    return true;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    const auto it = headers.find(toLower(name));
    return it == headers.end() ? std::string{} : it->second;
}

TestHttpServer::TestHttpServer(Handler handler) : handler_(std::move(handler)) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }

    const int opt = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = 0;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0 ||
        ::listen(listen_fd_, 64) < 0) {
        const int error = errno;
        ::close(listen_fd_);
        throw std::system_error(error, std::generic_category(), "bind/listen");
    }

    socklen_t length = sizeof(address);
    if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&address), &length) < 0) {
        const int error = errno;
        ::close(listen_fd_);
        throw std::system_error(error, std::generic_category(), "getsockname");
    }
    port_ = ntohs(address.sin_port);

    running_ = true;
    accept_thread_ = std::thread([this]() { acceptLoop(); });
}

TestHttpServer::~TestHttpServer() { stop(); }

std::string TestHttpServer::url(const std::string& path) const {
    return fmt::format("http://127.0.0.1:{}{}", port_, path);
}

std::vector<HttpRequest> TestHttpServer::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

void TestHttpServer::stop() {
    if (running_.exchange(false) && accept_thread_.joinable()) {
        accept_thread_.join();
    }

    std::vector<std::thread> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        if (connection.joinable()) {
            connection.join();
        }
    }

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

void TestHttpServer::acceptLoop() {
    while (running_) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, 50);
        if (ready <= 0) {
            continue;
        }

        const int client_fd = ::accept(listen_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        connections_.emplace_back([this, client_fd]() { serveConnection(client_fd); });
    }
}

void TestHttpServer::serveConnection(int client_fd) {
    std::string raw;
    char buffer[4096];
    while (raw.find("\r\n\r\n") == std::string::npos) {
        const ssize_t n = ::recv(client_fd, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            ::close(client_fd);
            return;
        }
        raw.append(buffer, static_cast<std::size_t>(n));
    }

    HttpRequest request;
    if (!parseRequest(raw, request)) {
        ::close(client_fd);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }

    const HttpResponse response = handler_(request);

    std::string head = fmt::format("HTTP/1.1 {} {}\r\nConnection: close\r\n",
                                   response.status, reasonPhrase(response.status));
    bool has_length = false;
    for (const auto& [name, value] : response.headers) {
        if (toLower(name) == "content-length") {
            has_length = true;
        }
        head += fmt::format("{}: {}\r\n", name, value);
    }
    if (response.send_content_length && !has_length) {
        head += fmt::format("Content-Length: {}\r\n", response.body.size());
    }
    head += "\r\n";

    if (sendAll(client_fd, head) && request.method != "HEAD") {
        sendAll(client_fd, response.body);
    }

    ::shutdown(client_fd, SHUT_WR);
    ::close(client_fd);
}

HttpResponse serveContent(const HttpRequest& request, const std::string& content) {
    HttpResponse response;
    response.headers.emplace_back("Accept-Ranges", "bytes");
    response.headers.emplace_back("Content-Type", "application/octet-stream");

    if (request.method == "HEAD") {
        response.headers.emplace_back("Content-Length", std::to_string(content.size()));
        return response;
    }

    const std::string range = request.header("Range");
    const std::string prefix = "bytes=";
    if (range.rfind(prefix, 0) != 0) {
        response.body = content;
        return response;
    }

    const std::string bounds = range.substr(prefix.size());
    const auto dash = bounds.find('-');
    std::size_t first = 0;
    std::size_t last = content.empty() ? 0 : content.size() - 1;
    try {
        first = std::stoull(bounds.substr(0, dash));
        if (dash != std::string::npos && dash + 1 < bounds.size()) {
            last = std::min<std::size_t>(std::stoull(bounds.substr(dash + 1)), last);
        }
    } catch (const std::exception&) {
        response.status = 416;
        return response;
    }

    if (dash == std::string::npos || content.empty() || first > last) {
        response.status = 416;
        response.headers.emplace_back("Content-Range", fmt::format("bytes */{}", content.size()));
        return response;
    }

    response.status = 206;
    response.headers.emplace_back("Content-Range", fmt::format("bytes {}-{}/{}", first, last, content.size()));
    response.body = content.substr(first, last - first + 1);
    return response;
}

std::string makeResource(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + i / 1024) % 251);
    }
    return data;
}

} // namespace braid::test
