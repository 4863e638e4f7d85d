/// @file main.cpp
/// @brief API server entry point.
///
/// Builds the identity core from configuration with in-memory stores
/// suitable for development, then runs until SIGINT or SIGTERM. Any
/// configuration error is fatal.

#include "cbs/foundation/api_logger.hpp"
#include "cbs/foundation/config_manager.hpp"
#include "cbs/foundation/worker_pool.hpp"
#include "cbs/service/account_service.hpp"
#include "cbs/service/api_routes.hpp"
#include "cbs/service/authn_gate.hpp"
#include "cbs/service/password_hasher.hpp"
#include "cbs/service/post_service.hpp"
#include "cbs/service/post_store.hpp"
#include "cbs/service/resource_id.hpp"
#include "cbs/service/server_options.hpp"
#include "cbs/service/service_runner.hpp"
#include "cbs/service/token_provider.hpp"
#include "cbs/service/user_store.hpp"
#include "cbs/version.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

namespace {

using cbs::foundation::LogCategory;

int fail(std::string_view stage, const cbs::foundation::ApiError& error) {
    std::string msg = std::string(stage) + ": " + std::string(error.message());
    CBS_LOG_ERROR(LogCategory::Config, msg);
    std::cerr << msg << "\n";
    return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
    cbs::service::SignalHandler signals;

    // Resolve config path: --config flag > CBS_CONFIG_PATH env > default.
    auto configPath = cbs::service::resolveConfigPath(cbs::service::parseConfigArg(argc, argv));

    cbs::foundation::ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        return fail("failed to load config", loadResult.error());
    }

    auto options = cbs::service::ServerOptions::fromConfig(config);
    if (!options) {
        return fail("invalid configuration", options.error());
    }
    const auto& opts = options.value();

    auto tokenConfig = opts.tokenConfig();
    if (!tokenConfig) {
        return fail("invalid token configuration", tokenConfig.error());
    }
    auto ids = cbs::service::ResourceIdGenerator::create(opts.identitySalt);
    if (!ids) {
        return fail("invalid identity configuration", ids.error());
    }

    auto tokens = std::make_shared<const cbs::service::TokenProvider>(tokenConfig.value());
    auto idGenerator =
        std::make_shared<const cbs::service::ResourceIdGenerator>(std::move(ids.value()));
    auto hasher = std::make_shared<const cbs::service::PasswordHasher>(opts.passwordIterations);
    auto workers = std::make_shared<cbs::foundation::WorkerPool>(opts.workerThreads);

    // In-memory backends for standalone development mode.
    auto users = std::make_shared<cbs::service::InMemoryUserStore>();
    auto posts = std::make_shared<cbs::service::InMemoryPostStore>();

    auto created = cbs::service::AccountService::create(users, tokens, hasher, idGenerator, workers);
    if (!created) {
        return fail("failed to initialize account service", created.error());
    }
    std::shared_ptr<cbs::service::AccountService> accounts = std::move(created).value();
    auto postService = std::make_shared<cbs::service::PostService>(posts, idGenerator);
    cbs::service::AuthnGate gate(tokens);

    // The HTTP front end dispatches into this table.
    cbs::service::RouteTable routes;
    cbs::service::installRoutes(routes, accounts, postService, gate);

    CBS_LOG_INFO(LogCategory::Core,
                 "cbs_apiserver " + std::string(cbs::Version::string) + " started (config: " +
                     configPath.string() + ", addr: " + opts.addr +
                     ", workers: " + std::to_string(workers->workerCount()) +
                     ", routes: " + std::to_string(routes.size()) + ")");

    signals.waitForShutdown();

    CBS_LOG_INFO(LogCategory::Core, "cbs_apiserver stopped");
    auto flushed = cbs::foundation::ApiLogger::instance().flush();
    if (!flushed) {
        std::cerr << "log flush failed: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
