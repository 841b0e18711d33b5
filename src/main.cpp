#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "mediapush/core/logger.hpp"
#include "mediapush/core/config.hpp"
#include "mediapush/core/cli.hpp"
#include "mediapush/core/errors.hpp"
#include "mediapush/core/prompt.hpp"
#include "mediapush/core/settings.hpp"
#include "mediapush/core/utils.hpp"
#include "mediapush/crypto/random.hpp"
#include "mediapush/network/gateway_session.hpp"
#include "mediapush/network/parallel_transport.hpp"
#include "mediapush/storage/file_catalog.hpp"
#include "mediapush/transfer/batch_runner.hpp"

namespace {

struct RunOptions {
    std::optional<size_t> limit;
    bool recursive = false;
    bool no_proxy = false;
    std::optional<std::uint32_t> connections;
    std::filesystem::path env_file = ".env";
    bool verbose = false;
};

RunOptions options_from_arguments(const mediapush::core::CommandLineParser& parser) {
    using mediapush::core::ConfigurationError;
    
    RunOptions options;
    if (auto limit = parser.get_int_option("limit")) {
        if (*limit < 0) {
            throw ConfigurationError("--limit must not be negative");
        }
        options.limit = static_cast<size_t>(*limit);
    }
    if (auto connections = parser.get_int_option("connections")) {
        if (*connections < 1 || *connections > mediapush::network::ParallelTransport::MAX_CONNECTIONS) {
            throw ConfigurationError("--connections must be between 1 and " +
                                     std::to_string(mediapush::network::ParallelTransport::MAX_CONNECTIONS));
        }
        options.connections = static_cast<std::uint32_t>(*connections);
    }
    options.recursive = parser.has_option("recursive");
    options.no_proxy = parser.has_option("no-proxy");
    options.env_file = mediapush::core::utils::FileUtils::expand_user(parser.get_option("env", ".env"));
    options.verbose = parser.has_option("verbose");
    return options;
}

RunOptions options_from_prompts() {
    using namespace mediapush::core;
    
    RunOptions options;
    auto limit = prompt_int("How many files to upload? (blank = all)", std::nullopt, 1, std::nullopt);
    if (limit) {
        options.limit = static_cast<size_t>(*limit);
    }
    options.recursive = prompt_yes_no("Scan subdirectories?", false);
    options.no_proxy = prompt_yes_no("Ignore proxy settings?", true);
    
    auto connections = prompt_int("Parallel connections", 16, 1,
                                  mediapush::network::ParallelTransport::MAX_CONNECTIONS);
    options.connections = static_cast<std::uint32_t>(*connections);
    return options;
}

int run(const RunOptions& options) {
    using namespace mediapush;
    
    core::Config config;
    if (std::filesystem::exists(options.env_file) && !config.load_from_file(options.env_file)) {
        throw core::ConfigurationError("Cannot read settings file " + options.env_file.string());
    }
    config.load_from_environment(core::SETTINGS_KEYS);
    
    auto base_dir = std::filesystem::absolute(options.env_file).parent_path();
    auto settings = core::Settings::load(config, base_dir, options.no_proxy);
    
    core::Logger::initialize(settings.log_file.string(),
                             options.verbose ? core::LogLevel::Debug : core::LogLevel::Info);
    LOG_INFO("mediapush starting up");
    if (settings.proxy) {
        LOG_INFO("Using proxy {}", network::describe(*settings.proxy));
    }
    
    storage::FileCatalog catalog(settings.download_dir, options.recursive);
    auto files = catalog.scan(options.limit);
    LOG_DEBUG("Found {} video file(s) in {}", files.size(), settings.download_dir.string());
    
    crypto::SecureRandom random;
    network::GatewaySession session(network::GatewayEndpoint{settings.gateway_host, settings.gateway_port, settings.proxy});
    network::ParallelTransport transport(session.connection_factory());
    transfer::ChunkedUploadPipeline pipeline(transport, random);
    
    transfer::BatchOptions batch_options;
    batch_options.target = settings.target;
    batch_options.directory = settings.download_dir;
    batch_options.credentials = transfer::Credentials{settings.api_id, settings.api_hash,
                                                      settings.phone, settings.session_path};
    batch_options.connections = options.connections;
    
    transfer::BatchRunner runner(session, pipeline, std::move(batch_options));
    auto totals = runner.run(files);
    
    LOG_INFO("Uploaded {} file(s), {} bytes", totals.files, totals.bytes);
    return EXIT_SUCCESS;
}

}

int main(int argc, char* argv[]) {
    using namespace mediapush;
    
    core::CommandLineParser parser("mediapush");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 2;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    int exit_code = EXIT_SUCCESS;
    try {
        RunOptions options = argc > 1 ? options_from_arguments(parser) : options_from_prompts();
        if (!crypto::SecureRandom::initialize()) {
            throw std::runtime_error("Cannot initialize the random number generator");
        }
        exit_code = run(options);
    } catch (const core::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        LOG_ERROR("Configuration error: {}", e.what());
        exit_code = 2;
    } catch (const core::TransferError& e) {
        std::cerr << "Upload failed: " << e.what() << "\n";
        LOG_ERROR("Upload failed: {}", e.what());
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        LOG_CRITICAL("Unexpected error: {}", e.what());
        exit_code = 1;
    }
    
    core::Logger::shutdown();
    return exit_code;
}
