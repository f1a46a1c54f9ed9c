#include "SandboxServer.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include <args.hxx>
#include <csignal>
#include <iostream>

using namespace Switchboard;

static Sandbox::SandboxServer* g_server = nullptr;

void signalHandler(int signum)
{
    SLOG_INFO("Interrupt signal ({}) received, shutting down...", signum);
    if (g_server) {
        g_server->requestExit();
    }
}

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Switchboard Sandbox", "Demo chat and job consumers served over WebSocket.");
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<uint16_t> portArg(
        parser, "port", "WebSocket port (default: from sandbox.json, else 8080)", { 'p', "port" });
    args::ValueFlag<std::string> bindArg(
        parser, "address", "Bind address (default: 0.0.0.0)", { "bind" });
    args::ValueFlag<std::string> configDir(
        parser, "config-dir", "Directory searched first for sandbox.json", { "config-dir" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., dispatch:debug,*:off)",
        { 'C', "channels" });
    args::Flag completion(
        parser, "completion", "Send complete / group_complete markers", { "completion" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    LoggingChannels::initializeFromConfig(args::get(logConfig), "sandbox");
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        SLOG_INFO("Applied channel overrides: {}", args::get(logChannels));
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    auto configResult = ConfigLoader::loadOr("sandbox.json", Sandbox::SandboxConfig{});
    if (configResult.isError()) {
        SLOG_ERROR("{}", configResult.errorValue());
        return 1;
    }
    Sandbox::SandboxConfig config = configResult.value();
    if (portArg) {
        config.port = args::get(portArg);
    }
    if (bindArg) {
        config.bindAddress = args::get(bindArg);
    }
    if (completion) {
        config.chat.completionSignalsEnabled = true;
        config.jobs.completionSignalsEnabled = true;
    }

    Sandbox::SandboxServer server(config);
    g_server = &server;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto startResult = server.start();
    if (startResult.isError()) {
        SLOG_ERROR("Failed to start sandbox: {}", startResult.errorValue());
        return 1;
    }

    server.mainLoopRun();
    server.stop();
    g_server = nullptr;
    SLOG_INFO("switchboard-sandbox shut down cleanly");
    return 0;
}
