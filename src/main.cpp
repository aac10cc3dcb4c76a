#include <iostream>
#include <filesystem>
#include <algorithm>
#include <pistache/common.h>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/http_headers.h>
#include <pistache/net.h>
#include <pistache/peer.h>

#include "headers/xforwardfor.hpp"

#include "debug/log.hpp"

#include "core/Handler.hpp"
#include "core/WebhookHandler.hpp"
#include "core/Publisher.hpp"

#include "config/Config.hpp"

#include "logging/TrafficLogger.hpp"

#include "helpers/FsUtils.hpp"

#include "GlobalState.hpp"

#include <signal.h>

int main(int argc, char** argv, char** envp) {

    std::vector<std::string> ARGS{};
    ARGS.resize(argc);
    for (int i = 0; i < argc; ++i) {
        ARGS[i] = std::string{argv[i]};
    }

    g_pGlobalState->cwd = std::filesystem::current_path();

    for (int i = 1; i < argc; ++i) {
        if (ARGS[i] == "--help" || ARGS[i] == "-h") {
            std::cout << "hookrelay " << HOOKRELAY_VERSION << "\n-c [config.jsonc]\n";
            return 0;
        } else if ((ARGS[i] == "--config" || ARGS[i] == "-c") && i + 1 < argc) {
            g_pGlobalState->configPath = ARGS[i + 1];
            i++;
        } else {
            std::cerr << "Unrecognized / invalid use of option " << ARGS[i] << "\nContinuing...\n";
            continue;
        }
    }

    CConfig::SConfig cfg;
    if (!g_pGlobalState->configPath.empty()) {
        auto fileConfig = CConfig::readFile(NFsUtils::absolutePath(g_pGlobalState->configPath));
        if (!fileConfig)
            Debug::die("{}", fileConfig.error());
        cfg = std::move(*fileConfig);
    }

    CConfig::applyEnvironment(cfg);

    g_pConfig = std::make_shared<CConfig>(cfg);

    std::shared_ptr<IPublisher> publisher;
    if (g_pConfig->valid())
        publisher = NPublisher::initialize(*g_pConfig);
    else
        Debug::log(CRIT, "Configuration is invalid, every request will be answered with 500 until fixed");

    const auto& ALLOW_LIST = g_pConfig->m_parsedConfigDatas.allowList;
    if (ALLOW_LIST.configured())
        Debug::log(LOG, "IP allow list: {} valid range(s), {} invalid", ALLOW_LIST.validRanges(), ALLOW_LIST.invalidRanges());
    else
        Debug::log(LOG, "IP allow list: not configured, accepting all origins");

    sigset_t signals;
    if (sigemptyset(&signals) != 0 || sigaddset(&signals, SIGTERM) != 0 || sigaddset(&signals, SIGINT) != 0 || sigaddset(&signals, SIGQUIT) != 0 ||
        sigaddset(&signals, SIGPIPE) != 0 || sigaddset(&signals, SIGALRM) != 0 || sigprocmask(SIG_BLOCK, &signals, nullptr) != 0)
        return 1;

    const auto PORT = g_pConfig->listenPort();
    if (!PORT)
        Debug::die("Can't listen on port {}", g_pConfig->m_config.port);

    Pistache::Address address = {Pistache::Ipv4::any(), *PORT};
    Debug::log(LOG, "Starting hookrelay {} on {}:{}", HOOKRELAY_VERSION, address.host(), address.port().toString());

    Pistache::Http::Header::Registry::instance().registerHeader<XForwardedForHeader>();

    auto trafficLogger  = std::make_shared<CTrafficLogger>(*g_pConfig);
    auto webhookHandler = std::make_shared<const CWebhookHandler>(g_pConfig, publisher, trafficLogger);

    auto endpoint = std::make_unique<Pistache::Http::Endpoint>(address);
    auto opts     = Pistache::Http::Endpoint::options()
                    .threads(std::max(g_pConfig->m_config.threads, 1))
                    .flags(Pistache::Tcp::Options::ReuseAddr | Pistache::Tcp::Options::ReusePort);
    opts.maxRequestSize(g_pConfig->m_config.max_request_size);
    endpoint->init(opts);
    auto handler = Pistache::Http::make_handler<CServerHandler>(webhookHandler);
    endpoint->setHandler(handler);

    endpoint->serveThreaded();

    bool terminate = false;
    while (!terminate) {
        int number = 0;
        int status = sigwait(&signals, &number);
        if (status != 0) {
            Debug::log(CRIT, "sigwait threw {} :(", status);
            break;
        }

        Debug::log(LOG, "Caught signal {}", number);

        switch (number) {
            case SIGINT: terminate = true; break;
            case SIGTERM: terminate = true; break;
            case SIGQUIT: terminate = true; break;
            case SIGPIPE: break;
            case SIGALRM: break;
        }
    }

    sigprocmask(SIG_UNBLOCK, &signals, nullptr);

    Debug::log(LOG, "Shutting down, bye!");

    endpoint->shutdown();
    endpoint = nullptr;

    return 0;
}
