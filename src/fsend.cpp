#include "program_options.h"


namespace
{
    //
    // Send all files to one sink. Returns true if the transfer completed.
    //
    bool send_files(
        fsend::dispatcher& dispatcher,
        const fsend::fsend_program_options& options,
        fsend::sink& out,
        const std::string& remarks)
    {
        fsend::path_file_source source(options.arg_files);
        const bool show_progress = (options.arg_verbosity >= 0);
        fsend::speedometer speed(remarks);
        bool completed = false;

        fsend::lifecycle_callbacks callbacks;
        callbacks.started = [&](const uint64_t /*zero*/) {
            speed.reset();
        };
        callbacks.bytes_sent = [&](const uint64_t chunk_bytes, const uint64_t total_bytes) {
            if (infra::sighandle::is_exit_required()) {
                throw fsend::transfer_error(fsend::failure_kind::application, EINTR, "Interrupted by signal");
            }
            if (show_progress) {
                speed.measure(chunk_bytes);
            }
            LOG_TRACE("Sent {} bytes, {} in total", chunk_bytes, total_bytes);
        };
        callbacks.complete = [&](const uint64_t /*total_bytes*/) {
            completed = true;
        };
        callbacks.aborted = [&](const fsend::transfer_failure& failure) {
            LOG_WARN("{}: transfer aborted ({}): {}", remarks, fsend::to_string(failure.kind), failure.message);
        };
        callbacks.cleanup = [&](const uint64_t total_bytes) {
            if (show_progress) {
                speed.finish();
            }
            LOG_DEBUG("{}: {} bytes sent", remarks, total_bytes);
        };

        dispatcher.serve(source, out, std::move(callbacks), options.dispatch);
        return completed;
    }


    bool send_to_output(fsend::dispatcher& dispatcher, const fsend::fsend_program_options& options)
    {
        if (options.arg_output == fsend::program_options_defaults::OUTPUT_STDOUT) {
            fsend::fd_sink out(STDOUT_FILENO, /*owned*/false);
            return send_files(dispatcher, options, out, "stdout");
        }

        const int fd = open(options.arg_output.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        if (fd == -1) {
            LOG_ERROR("open() {} for write failed. {}", options.arg_output, infra::errno_description(errno));
            return false;
        }

        fsend::fd_sink out(fd, /*owned*/true);
        return send_files(dispatcher, options, out, options.arg_output);
    }


    bool serve_listen(fsend::dispatcher& dispatcher, const fsend::fsend_program_options& options)
    {
        ASSERT(options.arg_listen.has_value());

        fsend::listener server;
        if (!server.open(options.arg_listen.value(), fsend::program_options_defaults::LISTEN_BACKLOG)) {
            return false;
        }

        bool all_succeeded = true;
        for (size_t served = 0; served < options.arg_connections; ) {
            if (infra::sighandle::is_exit_required()) {
                LOG_INFO("Exit required: stop accepting connections");
                break;
            }

            std::string remote;
            bool interrupted = false;
            const std::unique_ptr<fsend::fd_sink> out = server.accept(&remote, &interrupted);
            if (!out) {
                if (interrupted) continue;
                return false;
            }
            ++served;

            LOG_INFO("Accepted connection #{} from {}", served, remote);
            if (!send_files(dispatcher, options, *out, remote)) {
                all_succeeded = false;
            }
        }

        return all_succeeded;
    }

}  // namespace


int main(int argc, char* argv[])
{
    //
    // Parse command line arguments
    //
    std::shared_ptr<fsend::fsend_program_options> options = std::make_shared<fsend::fsend_program_options>();
    CLI::App app("Send files to a connection as fast as the kernel allows", "fsend");
    options->add_options(app);
    try {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    if (!options->post_process()) {
        LOG_ERROR("fsend_program_options post_process() failed");
        return 1;
    }

    bool success = false;
    try {
        // Initialize signal handler
        if (options->arg_listen.has_value()) {
            infra::sighandle::setup_signal_handler();
        }
        else {
            infra::sighandle::ignore_sigpipe();
        }

        fsend::dispatcher dispatcher(options->transfer, options->runtime);
        if (options->arg_listen.has_value()) {
            success = serve_listen(dispatcher, *options);
        }
        else {
            success = send_to_output(dispatcher, *options);
        }
    }
    catch (const fsend::configuration_error& ex) {
        LOG_ERROR("Configuration error: {}", ex.what());
        return 2;
    }
    catch (const std::exception& ex) {
        LOG_ERROR("fsend failed: {}", ex.what());
        return 1;
    }

    LOG_DEBUG("Bye!");
    return (success ? 0 : 1);
}
