#include "config/config_loader.hpp"
#include "gateway/gateway_server.hpp"
#include "logger/structured_logger.hpp"
#include "scan/scan_engine.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// Helper: 설정 파일 경로 결정
//   argv[1] > TRUSTGATE_CONFIG > config/trustgate.yaml
// ---------------------------------------------------------------------------
namespace {

std::filesystem::path config_path_from(int argc, char* argv[]) {
    if (argc > 1 && argv[1][0] != '\0') {
        return argv[1];
    }
    const char* env = std::getenv("TRUSTGATE_CONFIG");  // NOLINT(concurrency-mt-unsafe)
    if (env != nullptr && env[0] != '\0') {
        return env;
    }
    return "config/trustgate.yaml";
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 (YAML → 환경변수 오버라이드 → 검증) ──────────────────────
    const auto config_path = config_path_from(argc, argv);

    auto loaded = ConfigLoader::load_or_default(config_path);
    if (!loaded) {
        spdlog::critical("config: {}", loaded.error());
        return EXIT_FAILURE;
    }
    GateConfig config = std::move(*loaded);
    ConfigLoader::apply_env(config);

    if (auto valid = ConfigLoader::validate(config); !valid) {
        spdlog::critical("config: {}", valid.error());
        return EXIT_FAILURE;
    }

    spdlog::info("Starting trustgate");
    spdlog::info("Config: {}", config_path.string());
    spdlog::info("Listen: {}:{}", config.server.listen_address, config.server.listen_port);
    spdlog::info("Upstream: {}:{}", config.server.upstream_address, config.server.upstream_port);
    spdlog::info("UDS socket: {}", config.server.uds_socket_path);
    spdlog::info("Log level: {}", config.server.log_level);

    set_diagnostic_level(parse_log_level(config.server.log_level));

    try {
        auto logger = std::make_shared<StructuredLogger>(
            parse_log_level(config.server.log_level), config.server.log_path);

        // ── 스캐너 감지: 모드를 health / posture 에 노출 ──────────────────
        const auto scan_engine = make_scan_engine(config.scan);

        boost::asio::io_context ioc;
        GatewayServer server{std::move(config), config_path, scan_engine->mode(), logger};
        server.run(ioc);
        ioc.run();
    } catch (const std::exception& e) {
        spdlog::critical("trustgate: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("trustgate stopped");
    return EXIT_SUCCESS;
}
