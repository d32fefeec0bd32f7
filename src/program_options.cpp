#include "program_options.h"


//==============================================================================
// struct base_program_options
//==============================================================================

void fsend::base_program_options::add_options(CLI::App& app)
{
    app.add_flag(
        "-V,--version",
        [&](const size_t /*count*/) {
            printf("Version %d.%d.%d\nGit branch %s commit %s\n",
                FSEND_VERSION_MAJOR, FSEND_VERSION_MINOR, FSEND_VERSION_PATCH,
                TEXTIFY(FSEND_GIT_BRANCH), TEXTIFY(FSEND_GIT_COMMIT_HASH));
            exit(0);
        },
        "Print version and exit");

    app.add_flag(
        "-q,--quiet",
        [&](const size_t count) { this->arg_verbosity -= static_cast<int>(count); },
        "Be more quiet");

    app.add_flag(
        "-v,--verbose",
        [&](const size_t count) { this->arg_verbosity += static_cast<int>(count); },
        "Be more verbose");
}

bool fsend::base_program_options::post_process()
{
    // Set verbosity
    infra::set_logging_verbosity(this->arg_verbosity);

    return true;
}



//==============================================================================
// struct fsend_program_options
//==============================================================================

void fsend::fsend_program_options::add_options(CLI::App& app)
{
    base_program_options::add_options(app);

    CLI::Option* opt_files = app.add_option(
        "files",
        this->arg_files,
        "Send these files, in order");
    opt_files->type_name("<file>");
    opt_files->required();

    CLI::Option* opt_output = app.add_option(
        "-o,--output",
        this->arg_output,
        "Write to this file ('-' for stdout)");
    opt_output->type_name("<path>");

    CLI::Option* opt_listen = app.add_option(
        "-l,--listen",
        this->arg_listen,
        "Listen on this endpoint and send to every client that connects");
    opt_listen->type_name("<endpoint>");
    opt_listen->excludes(opt_output);

    CLI::Option* opt_connections = app.add_option(
        "-n,--connections",
        this->arg_connections,
        "Serve this many clients, one after another, then exit");
    opt_connections->type_name("<count>");
    opt_connections->needs(opt_listen);

    CLI::Option* opt_chunk = app.add_option(
        "-c,--chunk-size",
        this->arg_chunk_size,
        "Bytes per transfer call");
    opt_chunk->type_name("<size>");
    opt_chunk->transform(CLI::AsSizeValue(false));

    CLI::Option* opt_timeout = app.add_option(
        "-t,--timeout",
        this->arg_timeout_seconds,
        "Give up on a peer that accepts nothing for this many seconds");
    opt_timeout->type_name("<seconds>");

    app.add_flag(
        "--blocking-sendfile",
        this->arg_blocking_sendfile,
        "Never use non-blocking sendfile()");

    CLI::Option* opt_dispatch = app.add_option(
        "--dispatch",
        this->arg_dispatch,
        "How the output is driven");
    opt_dispatch->type_name("auto|takeover|each");
    opt_dispatch->check(CLI::IsMember({ "auto", "takeover", "each" }));
}

bool fsend::fsend_program_options::post_process()
{
    if (!base_program_options::post_process()) {
        return false;
    }

    //----------------------------------------------------------------
    // arg_files
    //----------------------------------------------------------------
    for (const std::string& path : arg_files) {
        LOG_DEBUG("Send file: {}", path);
    }


    //----------------------------------------------------------------
    // arg_listen, arg_connections, arg_output
    //----------------------------------------------------------------
    if (arg_listen.has_value()) {
        if (!arg_listen->port.has_value()) {
            arg_listen->port = program_options_defaults::LISTEN_PORT;
            LOG_TRACE("Listen on default port {}", arg_listen->port.value());
        }

        LOG_INFO("Listen endpoint: {}", arg_listen->to_string());

        if (arg_connections == 0) {
            LOG_ERROR("Number of connections must be at least 1");
            return false;
        }
    }
    else {
        LOG_DEBUG("Output: {}", (arg_output == program_options_defaults::OUTPUT_STDOUT) ? "stdout" : arg_output);
    }


    //----------------------------------------------------------------
    // arg_chunk_size, arg_timeout_seconds
    //----------------------------------------------------------------
    transfer = transfer_options();
    if (arg_chunk_size.has_value()) {
        if (arg_chunk_size.value() > transfer_defaults::MAX_CHUNK_SIZE) {
            LOG_WARN("Chunk size is too large: {}. Set to MAX_CHUNK_SIZE: {}",
                     arg_chunk_size.value(), transfer_defaults::MAX_CHUNK_SIZE);
            arg_chunk_size = transfer_defaults::MAX_CHUNK_SIZE;
        }
        transfer.chunk_size = arg_chunk_size.value();
    }
    LOG_TRACE("Chunk size: {}", transfer.chunk_size);

    if (arg_timeout_seconds.has_value()) {
        transfer.dead_peer_timeout = std::chrono::seconds(arg_timeout_seconds.value());
    }
    LOG_TRACE("Dead peer timeout: {} ms", transfer.dead_peer_timeout.count());

    try {
        transfer.validate();
    }
    catch (const configuration_error& ex) {
        LOG_ERROR("Invalid transfer options: {}", ex.what());
        return false;
    }


    //----------------------------------------------------------------
    // arg_blocking_sendfile, arg_dispatch
    //----------------------------------------------------------------
    runtime = runtime_capabilities::detect();
    if (arg_blocking_sendfile) {
        runtime.force_blocking_send_file = true;
        LOG_DEBUG("Non-blocking sendfile() is disabled");
    }

    if (arg_dispatch == program_options_defaults::DISPATCH_AUTO) {
        dispatch.reset();
    }
    else {
        dispatch = parse_dispatch_mode(arg_dispatch);
        if (!dispatch.has_value()) {
            LOG_ERROR("Unknown dispatch mode: {}", arg_dispatch);
            return false;
        }
    }
    LOG_TRACE("Dispatch: {}", dispatch.has_value() ? to_string(dispatch.value()) : "auto");

    return true;
}
