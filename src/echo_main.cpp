#include <mcp_bridge/core/version.hpp>
#include <mcp_bridge/echo/echo_server.hpp>

#include <argparse/argparse.hpp>

#include <chrono>
#include <iostream>
#include <thread>

int main(int argc, const char* argv[]) {
    argparse::ArgumentParser program("mcp-bridge-echo", mcp_bridge::kVersion);
    program.add_argument("--name")
        .help("serverInfo name reported by initialize")
        .default_value(std::string("mcp-bridge-echo"));
    program.add_argument("--exit-code")
        .help("Exit immediately with this code")
        .scan<'i', int>();
    program.add_argument("--startup-delay-ms")
        .help("Sleep before reading stdin")
        .default_value(0)
        .scan<'i', int>();
    program.add_argument("--banner")
        .help("Line written to stderr at startup");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << program;
        return 2;
    }

    if (auto banner = program.present("--banner")) {
        std::cerr << *banner << std::endl;
    }
    if (auto code = program.present<int>("--exit-code")) {
        std::cerr << "echo: exiting with code " << *code << std::endl;
        return *code;
    }
    if (const int delay = program.get<int>("--startup-delay-ms"); delay > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }

    mcp_bridge::echo::ToolRegistry registry;
    mcp_bridge::echo::RegisterEchoTools(registry);
    mcp_bridge::echo::EchoServer server(std::move(registry),
                                        program.get<std::string>("--name"));
    return server.Run();
}
