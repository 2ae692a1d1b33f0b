// devbridge: synchronous request bridge for builds, test runs, processes and debugging
// Entry point: one-shot operation or stdio request loop.
//
// Responses go to stdout, one JSON object per line. Logs go to stderr.

#include <nlohmann/json.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <list>
#include <memory>
#include <string>
#include <thread>

#include <signal.h>

#include "config/bridge_config.hpp"
#include "core/bridge_service.hpp"
#include "host/local/local_host.hpp"
#include "host/local/project_file.hpp"
#include "request/request_envelope.hpp"
#include "request/request_registry.hpp"
#include "request/request_stdio.hpp"
#include "request/response_builder.hpp"
#include "request_handlers/request_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// No SA_RESTART: a signal interrupts the blocking stdin read, so the loop
// notices it without waiting for the next request.
static void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::signal(SIGPIPE, SIG_IGN);
}

static void print_usage() {
    std::cerr << "usage: devbridge [--config FILE] PROJECT_FILE [OPERATION [ARGUMENTS_JSON]]\n"
              << "\n"
              << "With OPERATION, performs it once and prints the JSON response.\n"
              << "Without, reads {\"operation\", \"arguments\", \"id\"} requests from stdin.\n";
}

struct CommandLine {
    std::string config_path;
    std::string project_file;
    std::string operation;
    std::string arguments_text;
};

static bool parse_command_line(int argc, char **argv, CommandLine &command_line) {
    int position = 0;
    for (int index = 1; index < argc; index++) {
        std::string argument = argv[index];
        if (argument == "--config") {
            if (index + 1 >= argc) {
                std::cerr << "--config requires a file argument\n";
                return false;
            }
            command_line.config_path = argv[++index];
        } else if (argument == "--help" || argument == "-h") {
            return false;
        } else if (position == 0) {
            command_line.project_file = argument;
            position++;
        } else if (position == 1) {
            command_line.operation = argument;
            position++;
        } else if (position == 2) {
            command_line.arguments_text = argument;
            position++;
        } else {
            std::cerr << "Unexpected argument: " << argument << "\n";
            return false;
        }
    }
    return !command_line.project_file.empty();
}

static int run_single_operation(bridge_core::BridgeService &service, const CommandLine &command_line) {
    json response;
    json arguments = json::object();
    if (!command_line.arguments_text.empty()) {
        try {
            arguments = json::parse(command_line.arguments_text);
        } catch (const json::parse_error &error) {
            response = response_builder::build_invalid_request("ARGUMENTS_JSON is not valid JSON: " +
                                                               std::string(error.what()));
        }
    }
    if (response.is_null()) {
        response = request_registry::dispatch_request(service, command_line.operation, arguments);
    }
    request_stdio::write_message(response.dump());
    return response_builder::is_success(response) ? 0 : 1;
}

// A request handled on its own thread; done is set once its response is written.
struct RequestWorker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

static void join_finished(std::list<RequestWorker> &workers) {
    for (auto iterator = workers.begin(); iterator != workers.end();) {
        if (iterator->done->load()) {
            iterator->thread.join();
            iterator = workers.erase(iterator);
        } else {
            ++iterator;
        }
    }
}

static void serve_requests(bridge_core::BridgeService &service, local_host::LocalHost &host) {
    std::list<RequestWorker> workers;

    debug_log::log("Waiting for requests on stdin.");
    while (!shutdown_requested) {
        std::string raw_message = request_stdio::read_message(std::cin);
        if (raw_message.empty()) {
            if (shutdown_requested) {
                debug_log::log("Signal received. Shutting down.");
            } else {
                debug_log::log("EOF on stdin. Shutting down.");
            }
            break;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread worker([&service, raw_message, done]() {
            json response = request_envelope::handle_text(service, raw_message);
            request_stdio::write_message(response.dump());
            done->store(true);
        });
        workers.push_back({std::move(worker), done});
        join_finished(workers);
    }

    // Terminating the processes ends the waits of in-flight requests; they
    // still write their responses.
    service.shutdown();
    host.shutdown();
    for (auto &worker : workers) {
        worker.thread.join();
    }
}

int main(int argc, char **argv) {
    CommandLine command_line;
    if (!parse_command_line(argc, argv, command_line)) {
        print_usage();
        return 1;
    }

    install_signal_handlers();

    bridge_config::LoadResult config = bridge_config::load(command_line.config_path);
    if (!config.success) {
        debug_log::warn("Configuration error: " + config.error_detail);
        return 1;
    }

    local_host::ProjectFileResult projects = local_host::load_project_file(command_line.project_file);
    if (!projects.success) {
        debug_log::warn("Project file error: " + projects.error_detail);
        return 1;
    }

    local_host::LocalHostOptions options;
    options.terminate_grace = config.config.terminate_grace;
    options.gdb_executable = config.config.gdb_executable;

    local_host::LocalHost host(projects.projects, options);
    int exit_status = 0;
    {
        bridge_core::BridgeService service(host, config.config);
        request_handlers::register_all_operations();
        debug_log::log("devbridge started with " + std::to_string(projects.projects.size()) + " project(s).");

        if (!command_line.operation.empty()) {
            exit_status = run_single_operation(service, command_line);
            service.shutdown();
        } else {
            serve_requests(service, host);
        }
    }
    host.shutdown();
    debug_log::log("devbridge shut down.");

    return exit_status;
}
