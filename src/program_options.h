#if !defined(_FSEND_PROGRAM_OPTIONS_H_INCLUDED_)
#define _FSEND_PROGRAM_OPTIONS_H_INCLUDED_

#include "common.h"

#include <CLI/CLI.hpp>


//
// For CLI11
//
namespace fsend
{
    inline std::istream& operator >>(std::istream& iss, listen_endpoint& endpoint)
    {
        std::string value;
        iss >> value;
        endpoint = listen_endpoint();
        if (!endpoint.parse(value)) {
            throw CLI::ConversionError(value, "listen_endpoint");
        }
        return iss;
    }
}  // namespace fsend


namespace fsend
{
    struct program_options_defaults
    {
        static constexpr const uint16_t LISTEN_PORT = 62580;
        static constexpr const int LISTEN_BACKLOG = 16;
        static constexpr const size_t CONNECTIONS = 1;

        static constexpr const char OUTPUT_STDOUT[] = "-";
        static constexpr const char DISPATCH_AUTO[] = "auto";
    };

    struct base_program_options
    {
    public:
        int arg_verbosity = 0;

    public:
        virtual ~base_program_options() = default;
        virtual void add_options(CLI::App& app);
        virtual bool post_process();
    };


    struct fsend_program_options : base_program_options
    {
    public:
        std::vector<std::string> arg_files { };
        std::optional<listen_endpoint> arg_listen { };
        size_t arg_connections = program_options_defaults::CONNECTIONS;
        std::string arg_output = program_options_defaults::OUTPUT_STDOUT;
        std::optional<uint64_t> arg_chunk_size { };
        std::optional<uint32_t> arg_timeout_seconds { };
        bool arg_blocking_sendfile = false;
        std::string arg_dispatch = program_options_defaults::DISPATCH_AUTO;

        transfer_options transfer { };
        runtime_capabilities runtime { };
        std::optional<dispatch_mode> dispatch { };

    public:
        void add_options(CLI::App& app) override;
        bool post_process() override;
    };

}  // namespace fsend


#endif  // !defined(_FSEND_PROGRAM_OPTIONS_H_INCLUDED_)
