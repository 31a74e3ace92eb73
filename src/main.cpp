/// @file src/main.cpp
/// @brief quantcore CLI entry point.
///
/// Usage:
///   quantcore --backtest SYMBOL [options]        MA-crossover backtest
///   quantcore --walk-forward SYMBOL [options]    Walk-forward optimisation
///   quantcore --max-sharpe SYM SYM... [options]  Max-Sharpe weights
///   quantcore --risk-parity SYM SYM... [options] Inverse-volatility weights
///   quantcore --help                             Print usage

#include "quantcore/engine.hpp"
#include "quantcore/errors.hpp"
#include "quantcore/price_provider.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace quantcore;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  quantcore --backtest SYMBOL           MA-crossover backtest\n"
        "  quantcore --walk-forward SYMBOL       Walk-forward optimisation\n"
        "  quantcore --max-sharpe SYM SYM...     Max-Sharpe portfolio weights\n"
        "  quantcore --risk-parity SYM SYM...    Inverse-volatility weights\n"
        "  quantcore --help                      Show this help\n"
        "\n"
        "Options:\n"
        "  --data DIR          Directory of <SYMBOL>.csv files (default: data)\n"
        "  --start YYYY-MM-DD  First date (default: 2020-01-01)\n"
        "  --end YYYY-MM-DD    Last date (default: 2023-12-31)\n"
        "  --fast N            Fast MA window (default: 10)\n"
        "  --slow N            Slow MA window (default: 50)\n"
        "  --cost RATE         Cost per position change (default: 0.001 backtest,\n"
        "                      0 walk-forward)\n"
        "  --train N           Walk-forward train periods\n"
        "  --test N            Walk-forward test periods\n"
        "  --train-months N    Train window in months (default: 12)\n"
        "  --test-months N     Test window in months (default: 3)\n"
        "  --compound          Compound walk-forward test returns\n"
        "  --verbose           Diagnostics on stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  date,open,high,low,close,volume   or   date,close\n"
    );
}

enum class Mode { None, Backtest, WalkForward, MaxSharpe, RiskParity };

struct CliOptions {
    Mode                       mode = Mode::None;
    std::vector<std::string>   symbols;
    std::string                data_dir = "data";
    std::string                start    = "2020-01-01";
    std::string                end      = "2023-12-31";
    int                        fast     = constants::DEFAULT_FAST_WINDOW;
    int                        slow     = constants::DEFAULT_SLOW_WINDOW;
    std::optional<double>      cost;
    std::optional<std::size_t> train;
    std::optional<std::size_t> test;
    int                        train_months = constants::DEFAULT_TRAIN_MONTHS;
    int                        test_months  = constants::DEFAULT_TEST_MONTHS;
    bool                       compound = false;
    bool                       verbose  = false;
    bool                       help     = false;
};

template <typename T>
T parse_number(std::string_view flag, std::string_view text) {
    T value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        throw InvalidParameterError(fmt::format("{}: invalid number '{}'", flag, text));
    }
    return value;
}

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    const std::vector<std::string_view> args(argv + 1, argv + argc);

    const auto set_mode = [&](Mode mode, std::string_view flag) {
        if (opts.mode != Mode::None) {
            throw InvalidParameterError(fmt::format(
                "{}: only one of --backtest, --walk-forward, --max-sharpe, "
                "--risk-parity may be given", flag));
        }
        opts.mode = mode;
    };

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view flag = args[i];

        const auto value = [&]() -> std::string_view {
            if (i + 1 >= args.size()) {
                throw InvalidParameterError(fmt::format("{} requires a value", flag));
            }
            return args[++i];
        };

        if (flag == "--help" || flag == "-h") {
            opts.help = true;
        } else if (flag == "--backtest" || flag == "--walk-forward") {
            set_mode(flag == "--backtest" ? Mode::Backtest : Mode::WalkForward, flag);
            opts.symbols.emplace_back(value());
        } else if (flag == "--max-sharpe" || flag == "--risk-parity") {
            set_mode(flag == "--max-sharpe" ? Mode::MaxSharpe : Mode::RiskParity, flag);
            while (i + 1 < args.size() && !args[i + 1].starts_with("--")) {
                opts.symbols.emplace_back(args[++i]);
            }
            if (opts.symbols.empty()) {
                throw InvalidParameterError(fmt::format("{} requires symbols", flag));
            }
        } else if (flag == "--data") {
            opts.data_dir = std::string(value());
        } else if (flag == "--start") {
            opts.start = std::string(value());
        } else if (flag == "--end") {
            opts.end = std::string(value());
        } else if (flag == "--fast") {
            opts.fast = parse_number<int>(flag, value());
        } else if (flag == "--slow") {
            opts.slow = parse_number<int>(flag, value());
        } else if (flag == "--cost") {
            opts.cost = parse_number<double>(flag, value());
        } else if (flag == "--train") {
            opts.train = parse_number<std::size_t>(flag, value());
        } else if (flag == "--test") {
            opts.test = parse_number<std::size_t>(flag, value());
        } else if (flag == "--train-months") {
            opts.train_months = parse_number<int>(flag, value());
        } else if (flag == "--test-months") {
            opts.test_months = parse_number<int>(flag, value());
        } else if (flag == "--compound") {
            opts.compound = true;
        } else if (flag == "--verbose") {
            opts.verbose = true;
        } else {
            throw InvalidParameterError(fmt::format("Unknown option: {}", flag));
        }
    }
    return opts;
}

core::EngineConfig make_config(const CliOptions& opts) {
    core::EngineConfig config;
    config.verbose                     = opts.verbose;
    config.backtest.verbose            = opts.verbose;
    config.walk_forward.verbose        = opts.verbose;
    config.portfolio.verbose           = opts.verbose;
    config.portfolio.solver.verbose    = opts.verbose;
    config.walk_forward.aggregation    = opts.compound
        ? walkforward::Aggregation::Compounded
        : walkforward::Aggregation::Additive;
    if (opts.cost) {
        config.backtest.cost_rate     = *opts.cost;
        config.walk_forward.cost_rate = *opts.cost;
    }
    return config;
}

int run(const CliOptions& opts) {
    const auto range = core::DateRange::parse(opts.start, opts.end);
    const core::CsvPriceProvider provider(opts.data_dir, opts.verbose);
    const core::Engine engine(provider, make_config(opts));

    switch (opts.mode) {
        case Mode::Backtest: {
            const auto report = engine.backtest(
                opts.symbols.front(), range,
                strategy::StrategyParams{.fast_window = opts.fast,
                                         .slow_window = opts.slow});
            fmt::print("{}\n", report.to_string());
            return 0;
        }
        case Mode::WalkForward: {
            const auto report = (opts.train || opts.test)
                ? engine.walk_forward(
                      opts.symbols.front(), range,
                      opts.train.value_or(walkforward::months_to_periods(opts.train_months)),
                      opts.test.value_or(walkforward::months_to_periods(opts.test_months)))
                : engine.walk_forward_months(opts.symbols.front(), range,
                                             opts.train_months, opts.test_months);
            fmt::print("{}\n", report.to_string());
            return 0;
        }
        case Mode::MaxSharpe:
            fmt::print("{}\n", engine.max_sharpe(opts.symbols, range).to_string());
            return 0;
        case Mode::RiskParity:
            fmt::print("{}\n", engine.risk_parity(opts.symbols, range).to_string());
            return 0;
        case Mode::None:
            break;
    }
    print_usage();
    return 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    try {
        const CliOptions opts = parse_args(argc, argv);
        if (opts.help) {
            print_usage();
            return 0;
        }
        return run(opts);
    } catch (const quantcore::QuantError& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
