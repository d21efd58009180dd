#include <edi/app/command_line.h>
#include <edi/app/config_store.h>
#include <edi/app/setup_prompts.h>
#include <edi/config.h>
#include <edi/core/chat_session.h>
#include <edi/core/session_store.h>
#include <edi/net/completion_client.h>
#include <edi/net/curl_utils.h>
#include <edi/net/http_transport.h>
#include <edi/ui/cli_interface.h>
#include <edi/utils/filesystem_utils.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace edi;

namespace {

// Loads the stored config or, on first use, asks for a key and a model and
// saves them.
app::AppConfig loadOrCreateConfig(const app::ConfigStore& config_store, ui::UserInterface& cli_ui) {
    if (auto stored = config_store.load()) {
        cli_ui.displayStatus("Loaded configuration from " + config_store.path().string());
        return *stored;
    }
    if (!cli_ui.isInteractive()) {
        throw std::runtime_error("No configuration found at " + config_store.path().string() +
                                 ". Run edi once from a terminal to set it up.");
    }

    app::AppConfig config;
    config.api_key = app::promptApiKey(std::cin, std::cout);
    config.model = app::promptModel(std::cin, std::cout);
    config_store.save(config);
    cli_ui.displayStatus("Configuration saved to " + config_store.path().string());
    return config;
}

} // namespace

int main(int argc, char** argv) {
    const std::string program_name = argc > 0 ? argv[0] : "edi";
    app::CommandLineOptions options = app::parseCommandLine(std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc));
    if (!options.error.empty()) {
        std::cerr << app::usageText(program_name) << program_name << ": error: " << options.error << std::endl;
        return 2;
    }
    if (options.show_help) {
        std::cout << app::usageText(program_name);
        return 0;
    }
    if (options.show_version) {
        std::cout << "edi " << EDI_VERSION << std::endl;
        return 0;
    }

    const bool interactive = ui::stdinIsTerminal();
    ui::CliInterface cli_ui(interactive, options.verbose);
    try {
        const auto config_dir = utils::get_config_directory_path();
        app::ConfigStore config_store(config_dir / "config.json");
        app::AppConfig config = app::applyEnvironmentOverrides(loadOrCreateConfig(config_store, cli_ui));

        if (interactive) {
            cli_ui.displayOutput("\nWelcome to EDI! (Edgar's Delightful Interface)\n");
            cli_ui.displayOutput("Type 'Ctrl-D' or leave a blank line to end input and get the response.\n");
        }

        net::CurlGlobalGuard curl_global;
        net::CurlHttpTransport transport;
        net::ChatCompletionClient client(transport, app::resolveApiBaseUrl());
        core::SessionStore session_store(config_dir / "session.json");
        cli_ui.displayStatus("Active model: " + config.model + ", endpoint: " + client.endpointUrl());

        core::ChatOptions chat_options;
        chat_options.resume = options.continue_session;
        chat_options.interactive = interactive;

        core::ChatSession session(cli_ui, client, session_store, config.model, config.api_key, chat_options);
        session.run();
    } catch (const std::exception& e) {
        cli_ui.displayError("Fatal Error: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
