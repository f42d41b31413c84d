#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <utility>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"

namespace Rotor {
namespace Core {

using Proxy::Pool::ProxyDescriptor;

namespace {

// Descriptor as written in the configuration; unset limits fall back to the
// global --max-failures / --timeout once the command line has been applied.
struct ProxyEntry {
    ProxyDescriptor    descriptor;
    std::optional<int> max_failures;
    std::optional<int> timeout;
    bool               from_cli = false;
};

ProxyEntry entry_from_yaml(const YAML::Node& node) {
    ProxyEntry entry;
    if (node.IsScalar()) {
        entry.descriptor.endpoint = node.as<std::string>();
        return entry;
    }
    if (!node.IsMap() || !node["url"]) {
        throw std::runtime_error("proxy entry needs a 'url' key");
    }
    entry.descriptor.endpoint = node["url"].as<std::string>();
    if (node["username"])
        entry.descriptor.username = node["username"].as<std::string>();
    if (node["password"])
        entry.descriptor.password = node["password"].as<std::string>();
    if (node["max_failures"])
        entry.max_failures = node["max_failures"].as<int>();
    if (node["timeout"])
        entry.timeout = node["timeout"].as<int>();
    return entry;
}

void load_yaml(Config& config, const std::string& path, std::vector<ProxyEntry>& entries) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["attempts"])
            config.attempts = yaml["attempts"].as<int>();
        if (yaml["max_failures"])
            config.max_failures = yaml["max_failures"].as<int>();
        if (yaml["timeout"])
            config.timeout = yaml["timeout"].as<int>();

        if (yaml["proxies"] && yaml["proxies"].IsSequence()) {
            for (const auto& node : yaml["proxies"])
                entries.push_back(entry_from_yaml(node));
        }

        if (yaml["proxy_list"]) {
            for (auto& endpoint : Config::load_proxy_list(yaml["proxy_list"].as<std::string>())) {
                ProxyEntry entry;
                entry.descriptor.endpoint = std::move(endpoint);
                entries.push_back(std::move(entry));
            }
        }

        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

}  // namespace

std::vector<std::string> Config::load_proxy_list(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open proxy list: " + path);
    }

    std::vector<std::string> endpoints;
    std::string              line;
    while (std::getline(file, line)) {
        line = Utils::Text::strip_comment(line);
        if (!line.empty())
            endpoints.push_back(line);
    }
    return endpoints;
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Rotor - fetch URLs through a rotating proxy pool"};

    std::vector<std::string> cli_proxies;
    std::string              proxy_list_path;

    app.add_option("-p,--proxy", cli_proxies, "Proxy endpoint (repeatable)");
    app.add_option("--proxy-list", proxy_list_path, "File containing list of proxies");
    app.add_option("-u,--proxy-username", config.proxy_username, "Username for --proxy entries");
    app.add_option("--proxy-password", config.proxy_password, "Password for --proxy entries");
    app.add_option("--max-failures", config.max_failures, "Failures before a proxy is skipped")
        ->check(CLI::PositiveNumber);
    app.add_option("--timeout", config.timeout, "Per-proxy connection timeout in seconds")
        ->check(CLI::PositiveNumber);
    app.add_option("-t,--threads", config.threads, "Number of fetch threads")
        ->check(CLI::PositiveNumber);
    app.add_option("-a,--attempts", config.attempts, "Attempts per URL")
        ->check(CLI::PositiveNumber);
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_flag("-q,--quiet", config.quiet, "Only log errors");
    app.add_option("urls", config.urls, "URLs to fetch");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    std::vector<ProxyEntry> entries;
    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path, entries);

        // Command line values win over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (!proxy_list_path.empty()) {
        for (auto& endpoint : load_proxy_list(proxy_list_path)) {
            ProxyEntry entry;
            entry.descriptor.endpoint = std::move(endpoint);
            entry.from_cli            = true;
            entries.push_back(std::move(entry));
        }
    }
    for (const auto& endpoint : cli_proxies) {
        ProxyEntry entry;
        entry.descriptor.endpoint = endpoint;
        entry.from_cli            = true;
        entries.push_back(std::move(entry));
    }

    for (auto& entry : entries) {
        ProxyDescriptor& d  = entry.descriptor;
        d.failure_threshold = entry.max_failures.value_or(config.max_failures);
        d.timeout_seconds   = entry.timeout.value_or(config.timeout);
        if (entry.from_cli && !config.proxy_username.empty() && !config.proxy_password.empty()) {
            d.username = config.proxy_username;
            d.password = config.proxy_password;
        }
        config.proxies.push_back(std::move(d));
    }

    return config;
}

}  // namespace Core
}  // namespace Rotor
