#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include "option_screener/core/logger.hpp"
#include "option_screener/data/alpha_vantage_provider.hpp"
#include "option_screener/data/credential_store.hpp"
#include "option_screener/data/csv_price_provider.hpp"
#include "option_screener/data/csv_universe_provider.hpp"
#include "option_screener/data/fred_rate_provider.hpp"
#include "option_screener/data/http_client.hpp"
#include "option_screener/report/report_formatter.hpp"
#include "option_screener/screening/leaderboard.hpp"
#include "option_screener/screening/screener_config.hpp"

using namespace option_screener;

namespace {

std::atomic<bool> g_cancel_requested{false};

void handle_sigint(int) {
    g_cancel_requested.store(true);
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [config.json] [--symbols N] [--capital AMOUNT] [--offline DIR]"
                 " [--universe SOURCE]"
              << std::endl;
}

struct CommandLine {
    std::string config_path{"config.json"};
    std::optional<int> symbols;
    std::optional<double> capital;
    std::optional<std::string> offline_directory;
    std::optional<std::string> universe_source;
    bool help{false};
};

Result<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool takes_value =
            arg == "--symbols" || arg == "--capital" || arg == "--offline" || arg == "--universe";
        if (takes_value && i + 1 >= argc) {
            return make_error<CommandLine>(ErrorCode::INVALID_CONFIGURATION,
                                           arg + " requires a value", "CommandLine");
        }

        try {
            if (arg == "-h" || arg == "--help") {
                cmd.help = true;
            } else if (arg == "--symbols") {
                cmd.symbols = std::stoi(argv[++i]);
            } else if (arg == "--capital") {
                cmd.capital = std::stod(argv[++i]);
            } else if (arg == "--offline") {
                cmd.offline_directory = argv[++i];
            } else if (arg == "--universe") {
                cmd.universe_source = argv[++i];
            } else if (!arg.empty() && arg[0] != '-') {
                cmd.config_path = arg;
            } else {
                return make_error<CommandLine>(ErrorCode::INVALID_CONFIGURATION,
                                               "Unknown option: " + arg, "CommandLine");
            }
        } catch (const std::exception& e) {
            return make_error<CommandLine>(ErrorCode::INVALID_CONFIGURATION,
                                           "Invalid value for " + arg + ": " + e.what(),
                                           "CommandLine");
        }
    }
    return Result<CommandLine>(std::move(cmd));
}

int run_screener(int argc, char* argv[]) {
    auto cmd_result = parse_command_line(argc, argv);
    if (cmd_result.is_error()) {
        std::cerr << cmd_result.error()->what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }
    const CommandLine& cmd = cmd_result.value();
    if (cmd.help) {
        print_usage(argv[0]);
        return 0;
    }

    // Load configuration; a missing file means defaults
    ScreenerConfig config;
    std::error_code exists_error;
    if (std::filesystem::exists(cmd.config_path, exists_error)) {
        auto load_result = config.load_from_file(cmd.config_path);
        if (load_result.is_error()) {
            std::cerr << "Failed to load " << cmd.config_path << ": "
                      << load_result.error()->what() << std::endl;
            return 2;
        }
    } else if (exists_error) {
        std::cerr << "Cannot access " << cmd.config_path << ": " << exists_error.message()
                  << std::endl;
        return 2;
    }
    if (cmd.symbols) config.symbol_count = *cmd.symbols;
    if (cmd.capital) config.capital = *cmd.capital;
    if (cmd.offline_directory) config.providers.offline_price_directory = *cmd.offline_directory;
    if (cmd.universe_source) config.providers.universe_source = *cmd.universe_source;

    auto validation = config.validate();
    if (validation.is_error()) {
        std::cerr << "Invalid configuration: " << validation.error()->what() << std::endl;
        return 2;
    }

    try {
        Logger::instance().initialize(config.logging);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }
    Logger::register_component("OptionScreener");
    INFO("Starting option screener: " << config.symbol_count << " symbols, capital "
                                      << config.capital);

    CredentialStore credentials(cmd.config_path);
    auto credential_result = credentials.load_config();
    if (credential_result.is_error()) {
        DEBUG("No credentials file: " << credential_result.error()->what());
    }

    auto http = std::make_shared<HttpClient>(config.providers.http_timeout_seconds);

    CsvUniverseProvider universe_provider(config.providers.universe_source,
                                          config.providers.symbol_column, http);
    auto universe_result = universe_provider.fetch_ticker_universe();
    if (universe_result.is_error()) {
        ERROR("Failed to load ticker universe: " << universe_result.error()->what());
        return 1;
    }
    const TickerUniverse& universe = universe_result.value();

    auto fred_key = credentials.get_api_key("fred", "FRED_API_KEY");
    FredRateProvider rate_provider(http, fred_key.is_ok() ? fred_key.value() : std::string(),
                                   config.providers);
    RateContext rate = resolve_rate_context(rate_provider, config.pipeline.default_risk_free_rate);

    std::unique_ptr<IPriceSeriesProvider> price_provider;
    std::unique_ptr<IRateLimiter> rate_limiter;
    if (config.providers.use_offline_prices()) {
        INFO("Reading prices from " << config.providers.offline_price_directory);
        price_provider =
            std::make_unique<CsvPriceProvider>(config.providers.offline_price_directory);
        rate_limiter = std::make_unique<NoopRateLimiter>();
    } else {
        auto av_key = credentials.get_api_key("alpha_vantage", "ALPHA_VANTAGE_KEY");
        if (av_key.is_error()) {
            ERROR(av_key.error()->what());
            return 2;
        }
        price_provider =
            std::make_unique<AlphaVantagePriceProvider>(http, av_key.value(), config.providers);
        rate_limiter = std::make_unique<FixedIntervalRateLimiter>(
            std::chrono::milliseconds(config.providers.pacing_interval_ms));
    }

    std::signal(SIGINT, handle_sigint);

    LoggingProgressObserver observer;
    ScreeningPipeline pipeline(config.pipeline, *price_provider, *rate_limiter, &observer);
    auto report_result =
        pipeline.run(universe.symbols, static_cast<size_t>(config.symbol_count), config.capital,
                     rate, &g_cancel_requested);
    if (report_result.is_error()) {
        ERROR("Screening failed: " << report_result.error()->what());
        return 2;
    }

    const ScreeningReport& report = report_result.value();
    auto top = leaderboard(report.results, config.pipeline.leaderboard_size);

    INFO("Calculation complete");
    ReportFormatter formatter(config.pipeline);
    formatter.write_report(std::cout, report, top);

    return report.cancelled ? 130 : 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        return run_screener(argc, argv);
    } catch (const std::exception& e) {
        ERROR("Unhandled error: " << e.what());
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
