#include "common.h"


std::string fsend::sockaddr_to_string(const sockaddr* const addr, const socklen_t len)
{
    char host[NI_MAXHOST];
    char service[NI_MAXSERV];
    const int ret = getnameinfo(addr, len, host, sizeof(host), service, sizeof(service), NI_NUMERICHOST | NI_NUMERICSERV);
    if (ret != 0) {
        LOG_WARN("getnameinfo() failed with {} ({})", ret, gai_strerror(ret));
        return "<unknown>";
    }

    if (addr->sa_family == AF_INET6) {
        return std::string("[") + host + "]:" + service;
    }
    return std::string(host) + ":" + service;
}



//==============================================================================
// struct listen_endpoint
//==============================================================================

bool fsend::listen_endpoint::parse(const std::string& value)
{
    std::string host_part;
    std::string port_part;
    bool has_port = false;

    if (!value.empty() && value.front() == '[') {
        const size_t bracket = value.find(']');
        if (bracket == std::string::npos || bracket == 1) {
            return false;
        }
        host_part = value.substr(1, bracket - 1);
        if (host_part.find(':') == std::string::npos) {
            return false;
        }

        const std::string rest = value.substr(bracket + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') return false;
            port_part = rest.substr(1);
            has_port = true;
        }
    }
    else {
        const size_t colon = value.find(':');
        if (colon != std::string::npos && value.find(':', colon + 1) != std::string::npos) {
            // Bare IPv6 literal: needs brackets
            return false;
        }
        host_part = value.substr(0, colon);
        if (colon != std::string::npos) {
            port_part = value.substr(colon + 1);
            has_port = true;
        }

        if (host_part != "*") {
            const auto is_host_char = [](const char ch) {
                return std::isalnum(static_cast<unsigned char>(ch)) || ch == '.' || ch == '-';
            };
            if (!std::all_of(host_part.begin(), host_part.end(), is_host_char)) {
                return false;
            }
        }
    }

    if (host_part.empty()) {
        return false;
    }

    std::optional<uint16_t> parsed_port;
    if (has_port) {
        if (port_part == "*") {
            parsed_port = static_cast<uint16_t>(0);
        }
        else {
            if (port_part.empty() || port_part.size() > 5 ||
                !std::all_of(port_part.begin(), port_part.end(), [](const char ch) { return ch >= '0' && ch <= '9'; })) {
                return false;
            }
            const unsigned long number = std::stoul(port_part);
            if (number > 65535) {
                return false;
            }
            parsed_port = static_cast<uint16_t>(number);
        }
    }

    host = std::move(host_part);
    port = parsed_port;
    return true;
}

const char* fsend::listen_endpoint::host_for_lookup() const noexcept
{
    if (host == "*") {
        return nullptr;
    }
    return host.c_str();
}

std::string fsend::listen_endpoint::to_string() const
{
    std::string result = (host.find(':') != std::string::npos) ? ("[" + host + "]") : host;
    if (port.has_value()) {
        result += ":" + std::to_string(port.value());
    }
    return result;
}



//==============================================================================
// class listener
//==============================================================================

void fsend::listener::dispose_impl() noexcept
{
    if (_handle != INVALID_HANDLE) {
        (void)close(_handle);
        _handle = INVALID_HANDLE;
    }
}

bool fsend::listener::open(const listen_endpoint& endpoint, const int backlog)
{
    ASSERT(_handle == INVALID_HANDLE, "listener is already open");
    ASSERT(endpoint.port.has_value());

    addrinfo hint { };
    hint.ai_family = AF_UNSPEC;
    hint.ai_socktype = SOCK_STREAM;
    hint.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* results = nullptr;
    const std::string service = std::to_string(endpoint.port.value());
    const int ret = getaddrinfo(endpoint.host_for_lookup(), service.c_str(), &hint, &results);
    if (ret != 0) {
        LOG_ERROR("getaddrinfo() '{}' failed with {} ({})", endpoint.to_string(), ret, gai_strerror(ret));
        return false;
    }

    const infra::sweeper free_results = [&]() {
        freeaddrinfo(results);
    };

    for (const addrinfo* p = results; p != nullptr; p = p->ai_next) {
        if (p->ai_family != AF_INET && p->ai_family != AF_INET6) {
            LOG_DEBUG("Skip address family {}", p->ai_family);
            continue;
        }
        if (this->try_bind(*p, backlog)) {
            LOG_INFO("Listening on {}", _bound_address);
            return true;
        }
    }

    LOG_ERROR("Can't listen on {}", endpoint.to_string());
    return false;
}

bool fsend::listener::try_bind(const addrinfo& candidate, const int backlog)
{
    const std::string address = sockaddr_to_string(candidate.ai_addr, candidate.ai_addrlen);

    const int handle = socket(candidate.ai_family, SOCK_STREAM | SOCK_CLOEXEC, candidate.ai_protocol);
    if (handle == INVALID_HANDLE) {
        LOG_WARN("socket() for {} failed. {}", address, infra::errno_description(errno));
        return false;
    }

    infra::sweeper close_on_error = [&]() {
        (void)close(handle);
    };

    const int value_1 = 1;
    if (setsockopt(handle, SOL_SOCKET, SO_REUSEADDR, &value_1, sizeof(value_1)) != 0) {
        LOG_WARN("setsockopt(SO_REUSEADDR) failed. {}", infra::errno_description(errno));
        return false;
    }

    if (candidate.ai_family == AF_INET6) {
        // Dual stack: the wildcard v6 socket also takes v4 clients
        const int value_0 = 0;
        if (setsockopt(handle, IPPROTO_IPV6, IPV6_V6ONLY, &value_0, sizeof(value_0)) != 0) {
            LOG_DEBUG("setsockopt(IPV6_V6ONLY) to 0 failed. {}", infra::errno_description(errno));
        }
    }

    if (bind(handle, candidate.ai_addr, candidate.ai_addrlen) != 0) {
        LOG_WARN("bind() to {} failed. {}", address, infra::errno_description(errno));
        return false;
    }

    if (listen(handle, backlog) != 0) {
        LOG_WARN("listen(backlog={}) on {} failed. {}", backlog, address, infra::errno_description(errno));
        return false;
    }

    sockaddr_storage local { };
    socklen_t len = sizeof(local);
    if (getsockname(handle, reinterpret_cast<sockaddr*>(&local), &len) != 0) {
        LOG_WARN("getsockname() on {} failed. {}", address, infra::errno_description(errno));
        return false;
    }

    close_on_error.suppress_sweep();
    _handle = handle;
    _bound_address = sockaddr_to_string(reinterpret_cast<const sockaddr*>(&local), len);
    _bound_port = (local.ss_family == AF_INET6)
        ? ntohs(reinterpret_cast<const sockaddr_in6*>(&local)->sin6_port)
        : ntohs(reinterpret_cast<const sockaddr_in*>(&local)->sin_port);
    return true;
}

std::unique_ptr<fsend::fd_sink> fsend::listener::accept(
    /*out,opt*/ std::string* const remote,
    /*out,opt*/ bool* const interrupted)
{
    ASSERT(_handle != INVALID_HANDLE, "listener is not open");
    if (interrupted) *interrupted = false;

    sockaddr_storage addr { };
    socklen_t len = sizeof(addr);
    const int client = accept4(_handle, reinterpret_cast<sockaddr*>(&addr), &len, SOCK_CLOEXEC);
    if (client == INVALID_HANDLE) {
        const int err = errno;
        if (err == EINTR) {
            if (interrupted) *interrupted = true;
            LOG_DEBUG("accept() interrupted");
        }
        else {
            LOG_ERROR("accept() failed. {}", infra::errno_description(err));
        }
        return nullptr;
    }

    const int value_1 = 1;
    if (setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &value_1, sizeof(value_1)) != 0) {
        LOG_DEBUG("setsockopt(TCP_NODELAY) failed. {}", infra::errno_description(errno));
    }

    if (remote) {
        *remote = sockaddr_to_string(reinterpret_cast<const sockaddr*>(&addr), len);
    }
    return std::make_unique<fd_sink>(client, /*owned*/true);
}
