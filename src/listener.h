#if !defined(_FSEND_LISTENER_H_INCLUDED_)
#define _FSEND_LISTENER_H_INCLUDED_

#if !defined(_FSEND_COMMON_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include common.h"
#endif  // !defined(_FSEND_COMMON_H_INCLUDED_)

namespace fsend
{
    //
    // Where the tool listens.
    //   <host>           default port
    //   <host>:<port>
    //   [<ipv6>]:<port>
    //   *:<port>         any address
    // Port 0 (or '*') lets the kernel pick one.
    //
    struct listen_endpoint
    {
    public:
        std::string host { };
        std::optional<uint16_t> port { };

    public:
        bool parse(const std::string& value);

        // nullptr for the wildcard host, brackets stripped from IPv6 literals
        [[nodiscard]]
        const char* host_for_lookup() const noexcept;

        [[nodiscard]]
        std::string to_string() const;
    };


    //
    // A listening TCP socket. Every accepted connection becomes an owned fd_sink.
    //
    class listener final : public infra::disposable
    {
    public:
        FSEND_DISABLE_COPY_CONSTRUCTOR(listener)
        FSEND_DISABLE_MOVE_CONSTRUCTOR(listener)

        listener() noexcept = default;
        ~listener() noexcept override { this->dispose(); }

        // Binds the first resolved address that works. endpoint.port must be set.
        bool open(const listen_endpoint& endpoint, int backlog);

        // nullptr on failure; *interrupted is set if accept() got EINTR
        std::unique_ptr<fd_sink> accept(/*out,opt*/std::string* remote, /*out,opt*/bool* interrupted);

        [[nodiscard]]
        uint16_t bound_port() const noexcept { return _bound_port; }

        [[nodiscard]]
        const std::string& bound_address() const noexcept { return _bound_address; }

    protected:
        void dispose_impl() noexcept override;

    private:
        bool try_bind(const addrinfo& candidate, int backlog);

    private:
        static constexpr const int INVALID_HANDLE = -1;

        int _handle = INVALID_HANDLE;
        uint16_t _bound_port = 0;
        std::string _bound_address { };
    };


    // "host:port" or "[v6]:port" for a socket address
    std::string sockaddr_to_string(const sockaddr* addr, socklen_t len);

}  // namespace fsend

#endif  // !defined(_FSEND_LISTENER_H_INCLUDED_)
