#include <csignal>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <CLI/CLI.hpp>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

#include "config/relay_config.hpp"
#include "repository/sqlite_database.hpp"
#include "repository/sqlite_event_repository.hpp"
#include "server/websocketpp_server.hpp"
#include "service/relay_service.hpp"
#include "verifier/noscrypt_verifier.hpp"

using namespace nrelay;
using namespace std;

struct CommandLine
{
    string configPath;
    optional<uint16_t> port;
    optional<string> database;
    bool verbose = false;
    string registerPubkey;
};

static void _waitForSignal(
    boost::asio::io_context& context,
    boost::asio::signal_set& signals,
    service::RelayService& relay)
{
    signals.async_wait([&context, &signals, &relay](const boost::system::error_code& error, int signalNumber)
    {
        if (error)
        {
            return;
        }

        switch (signalNumber)
        {
        case SIGUSR1:
            relay.enableMaintenance();
            break;

        case SIGUSR2:
            relay.disableMaintenance();
            break;

        default:
            PLOG_INFO << "Received signal " << signalNumber << ", shutting down.";
            context.stop();
            return;
        }

        _waitForSignal(context, signals, relay);
    });
};

int main(int argc, char** argv)
{
    CommandLine args;
    CLI::App app{ "nrelay - a Nostr relay", "nrelay" };
    app.add_option("-c,--config", args.configPath, "Path to the JSON configuration file")->check(CLI::ExistingFile);
    app.add_option("-p,--port", args.port, "Port to listen on");
    app.add_option("-d,--database", args.database, "Path to the SQLite database");
    app.add_flag("-v,--verbose", args.verbose, "Enable debug logging");
    app.add_option("--register", args.registerPubkey, "Register a hex pubkey as an account and exit");

    CLI11_PARSE(app, argc, argv);

    auto appender = make_shared<plog::ConsoleAppender<plog::TxtFormatter>>();
    plog::init(args.verbose ? plog::debug : plog::info, appender.get());

    try
    {
        config::RelayConfig relayConfig = args.configPath.empty()
            ? config::RelayConfig()
            : config::RelayConfig::fromFile(args.configPath);
        if (args.port)
        {
            relayConfig.port = *args.port;
        }
        if (args.database)
        {
            relayConfig.database = *args.database;
        }

        auto database = make_shared<repository::SqliteDatabase>(relayConfig.database);
        auto accounts = make_shared<repository::SqliteAccountRegistry>(database);

        if (!args.registerPubkey.empty())
        {
            accounts->registerAccount(args.registerPubkey);
            PLOG_INFO << "Registered account " << args.registerPubkey;
            return 0;
        }

        auto events = make_shared<repository::SqliteEventRepository>(
            appender,
            database,
            relayConfig.defaultLimit,
            relayConfig.limitation.maxLimit);
        auto eventVerifier = make_shared<verifier::NoscryptVerifier>(appender);
        auto webSocketServer = make_shared<server::WebsocketppServer>(appender);

        service::RelayService relay(appender, webSocketServer, eventVerifier, events, accounts, relayConfig);

        boost::asio::io_context signalContext;
        boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.add(SIGUSR1);
        signals.add(SIGUSR2);
        _waitForSignal(signalContext, signals, relay);

        relay.start();
        signalContext.run();
        relay.stop();
    }
    catch (const exception& e)
    {
        PLOG_FATAL << "nrelay failed: " << e.what();
        return 1;
    }

    return 0;
};
