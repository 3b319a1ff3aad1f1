/// Client example: connects to a capwire server and walks its capabilities.
/// Usage: ./capwire_client_example <server_command> [args...]
///        ./capwire_client_example ws://127.0.0.1:8765 [subject]
/// Example: ./capwire_client_example ./capwire_echo_server

#include <capwire/capwire.hpp>
#include <iostream>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <server_command|ws://url> [args...]\n";
        return 1;
    }

    std::string target = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    bool websocket = target.rfind("ws://", 0) == 0;

    capwire::Client::Options opts;
    opts.client_info = {"example-client", "1.0.0"};
    opts.request_timeout = std::chrono::milliseconds(10000);
    if (websocket && !args.empty()) opts.subject_id = args.front();
    capwire::Client client{std::move(opts)};

    try {
        if (websocket) {
            client.connect_websocket(target);
        } else {
            client.connect_stdio(target, args);
        }
        auto init = client.initialize();
        std::cout << "Connected to: " << init.server_info.name
                  << " v" << init.server_info.version
                  << " (protocol " << init.protocol_version << ")\n";

        std::cout << "\n--- Tools ---\n";
        auto tools = client.list_tools();
        for (const auto& tool : tools.items) {
            std::cout << "  " << tool.name;
            if (tool.description) std::cout << " - " << *tool.description;
            std::cout << "\n";
        }

        for (const auto& tool : tools.items) {
            if (tool.name != "echo") continue;
            auto result = client.call_tool("echo", {{"text", "Hello from C++ client!"}});
            for (const auto& content : result.content) {
                if (auto* tc = std::get_if<capwire::TextContent>(&content)) {
                    std::cout << "  Response: " << tc->text << "\n";
                }
            }
        }

        std::cout << "\n--- Resources ---\n";
        for (const auto& res : client.list_resources().items) {
            std::cout << "  " << res.uri << " (" << res.name << ")\n";
            try {
                for (const auto& c : client.read_resource(res.uri)) {
                    std::cout << "    " << c.text.value_or("<binary>") << "\n";
                }
            } catch (const capwire::DispatchError& e) {
                std::cout << "    denied: " << e.kind() << "\n";
            }
        }

        auto stats = client.transport_stats();
        std::cout << "\nsent " << stats.messages_sent << " / received " << stats.messages_received
                  << " frames\n";

        client.disconnect();
    } catch (const capwire::DispatchError& e) {
        std::cerr << "Server error " << e.code() << " (" << e.kind() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
