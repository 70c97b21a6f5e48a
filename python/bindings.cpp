/**
 * @file bindings.cpp
 * @brief Python bindings (pybind11)
 *
 * Exposes the engine, the strategy roster and the data helpers as _cryptobt.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "cbt/cryptobt.hpp"

namespace py = pybind11;

namespace {

// keyword dict -> Params; bool is checked before int since Python bools are ints
cbt::Params toParams(const py::dict& kwargs) {
    cbt::Params params;
    for (const auto& item : kwargs) {
        std::string key = py::str(item.first);
        py::handle value = item.second;
        if (py::isinstance<py::bool_>(value)) {
            params.set(key, value.cast<bool>());
        } else if (py::isinstance<py::int_>(value)) {
            params.set(key, value.cast<long>());
        } else if (py::isinstance<py::float_>(value)) {
            params.set(key, value.cast<double>());
        } else if (py::isinstance<py::str>(value)) {
            params.set(key, value.cast<std::string>());
        } else {
            throw cbt::ConfigurationError("unsupported value type for option " + key);
        }
    }
    return params;
}

cbt::SignalSequence toSignals(const std::vector<int>& values) {
    cbt::SignalSequence signals;
    signals.reserve(values.size());
    for (int v : values) {
        signals.push_back(cbt::signal_utils::fromInt(v));
    }
    return signals;
}

} // namespace

PYBIND11_MODULE(_cryptobt, m) {
    m.doc() = "cryptobt C++ backtesting core";

    m.def("version", &cbt::version, "Get library version");

    // ==================== Errors ====================
    // subclasses are registered later so their translators are tried first
    auto& backtestError = py::register_exception<cbt::BacktestError>(m, "BacktestError");
    py::register_exception<cbt::ConfigurationError>(m, "ConfigurationError", backtestError.ptr());
    py::register_exception<cbt::DataIntegrityError>(m, "DataIntegrityError", backtestError.ptr());
    py::register_exception<cbt::ComputationError>(m, "ComputationError", backtestError.ptr());
    py::register_exception<cbt::IoError>(m, "IoError", backtestError.ptr());

    // ==================== Signal ====================
    py::enum_<cbt::Signal>(m, "Signal")
        .value("EXIT", cbt::Signal::Exit)
        .value("HOLD", cbt::Signal::Hold)
        .value("ENTER", cbt::Signal::Enter);

    m.def("render_signals", &cbt::signal_utils::render, py::arg("signals"),
          "One character per bar: E, X or .");

    // ==================== Bar / PriceSeries ====================
    py::class_<cbt::Bar>(m, "Bar")
        .def(py::init<>())
        .def(py::init([](cbt::Timestamp ts, cbt::Value o, cbt::Value h, cbt::Value l,
                         cbt::Value c, cbt::Value v) {
            return cbt::Bar{ts, o, h, l, c, v};
        }), py::arg("timestamp"), py::arg("open"), py::arg("high"), py::arg("low"),
            py::arg("close"), py::arg("volume") = 0.0)
        .def_readwrite("timestamp", &cbt::Bar::timestamp)
        .def_readwrite("open", &cbt::Bar::open)
        .def_readwrite("high", &cbt::Bar::high)
        .def_readwrite("low", &cbt::Bar::low)
        .def_readwrite("close", &cbt::Bar::close)
        .def_readwrite("volume", &cbt::Bar::volume)
        .def(py::self == py::self)
        .def("__repr__", [](const cbt::Bar& b) {
            return "<Bar " + cbt::formatTimestamp(b.timestamp) + " close=" + std::to_string(b.close) + ">";
        });

    py::class_<cbt::PriceSeries>(m, "PriceSeries")
        .def(py::init<>())
        .def(py::init<std::vector<cbt::Bar>, std::string, std::string>(),
             py::arg("bars"), py::arg("symbol") = "", py::arg("timeframe") = "")
        .def_static("from_closes", &cbt::PriceSeries::fromCloses,
                    py::arg("closes"), py::arg("start") = 0, py::arg("step") = 86400000)
        .def("add_bar", &cbt::PriceSeries::addBar)
        .def("__len__", &cbt::PriceSeries::size)
        .def("__getitem__", [](const cbt::PriceSeries& self, cbt::Size idx) {
            return self.at(idx);
        })
        .def("bars", &cbt::PriceSeries::bars)
        .def("closes", &cbt::PriceSeries::closes)
        .def("timestamps", &cbt::PriceSeries::timestamps)
        .def("head", &cbt::PriceSeries::head)
        .def("slice", &cbt::PriceSeries::slice)
        .def("validate", &cbt::PriceSeries::validate)
        .def_property("symbol", &cbt::PriceSeries::symbol, &cbt::PriceSeries::setSymbol)
        .def_property("timeframe", &cbt::PriceSeries::timeframe, &cbt::PriceSeries::setTimeframe);

    // ==================== Strategies ====================
    py::class_<cbt::Strategy>(m, "Strategy")
        .def("generate_signals", &cbt::Strategy::generateSignals)
        .def("name", &cbt::Strategy::name)
        .def("__repr__", [](const cbt::Strategy& s) { return "<Strategy " + s.name() + ">"; });

    py::class_<cbt::SMACrossover, cbt::Strategy>(m, "SMACrossover")
        .def(py::init<cbt::Size, cbt::Size>(), py::arg("fast_window") = 50, py::arg("slow_window") = 200);

    py::class_<cbt::EMACrossover, cbt::Strategy>(m, "EMACrossover")
        .def(py::init<cbt::Size, cbt::Size>(), py::arg("fast_window") = 50, py::arg("slow_window") = 200);

    py::class_<cbt::RSIReversion, cbt::Strategy>(m, "RSIReversion")
        .def(py::init<cbt::Size, cbt::Value, cbt::Value>(),
             py::arg("window") = 14, py::arg("oversold") = 30.0, py::arg("overbought") = 70.0);

    py::class_<cbt::MACDCrossover, cbt::Strategy>(m, "MACDCrossover")
        .def(py::init([](py::kwargs kwargs) {
            return std::make_unique<cbt::MACDCrossover>(toParams(kwargs));
        }));

    py::class_<cbt::BollingerReversion, cbt::Strategy>(m, "BollingerReversion")
        .def(py::init([](py::kwargs kwargs) {
            return std::make_unique<cbt::BollingerReversion>(toParams(kwargs));
        }));

    py::class_<cbt::DonchianBreakout, cbt::Strategy>(m, "DonchianBreakout")
        .def(py::init([](py::kwargs kwargs) {
            return std::make_unique<cbt::DonchianBreakout>(toParams(kwargs));
        }));

    py::class_<cbt::BuyAndHold, cbt::Strategy>(m, "BuyAndHold")
        .def(py::init<>());

    m.def("make_strategy", [](const std::string& kind, py::kwargs kwargs) {
        return cbt::makeStrategy(kind, toParams(kwargs));
    }, py::arg("kind"), "Build a strategy by kind with keyword options");
    m.def("available_strategies", &cbt::availableStrategies);

    // ==================== Engine ====================
    py::enum_<cbt::FillPolicy>(m, "FillPolicy")
        .value("SIGNAL_BAR_CLOSE", cbt::FillPolicy::SignalBarClose)
        .value("NEXT_BAR_OPEN", cbt::FillPolicy::NextBarOpen);

    py::class_<cbt::BacktestConfig>(m, "BacktestConfig")
        .def(py::init<>())
        .def_readwrite("initial_capital", &cbt::BacktestConfig::initialCapital)
        .def_readwrite("commission", &cbt::BacktestConfig::commission)
        .def_readwrite("fill_policy", &cbt::BacktestConfig::fillPolicy)
        .def_readwrite("start_time", &cbt::BacktestConfig::startTime)
        .def_readwrite("end_time", &cbt::BacktestConfig::endTime)
        .def("validate", &cbt::BacktestConfig::validate);

    py::class_<cbt::Trade>(m, "Trade")
        .def_readonly("entry_index", &cbt::Trade::entryIndex)
        .def_readonly("exit_index", &cbt::Trade::exitIndex)
        .def_readonly("entry_time", &cbt::Trade::entryTime)
        .def_readonly("exit_time", &cbt::Trade::exitTime)
        .def_readonly("entry_price", &cbt::Trade::entryPrice)
        .def_readonly("exit_price", &cbt::Trade::exitPrice)
        .def_readonly("return_pct", &cbt::Trade::returnPct)
        .def_readonly("forced_close", &cbt::Trade::forcedClose)
        .def("is_win", &cbt::Trade::isWin);

    py::class_<cbt::PerformanceReport>(m, "PerformanceReport")
        .def_readonly("total_return_pct", &cbt::PerformanceReport::totalReturnPct)
        .def_readonly("num_trades", &cbt::PerformanceReport::numTrades)
        .def_readonly("win_rate", &cbt::PerformanceReport::winRate)
        .def_readonly("average_return_pct", &cbt::PerformanceReport::averageReturnPct)
        .def_readonly("winning_trades", &cbt::PerformanceReport::winningTrades)
        .def_readonly("losing_trades", &cbt::PerformanceReport::losingTrades)
        .def_readonly("best_trade_pct", &cbt::PerformanceReport::bestTradePct)
        .def_readonly("worst_trade_pct", &cbt::PerformanceReport::worstTradePct)
        .def_readonly("profit_factor", &cbt::PerformanceReport::profitFactor)
        .def_readonly("max_win_streak", &cbt::PerformanceReport::maxWinStreak)
        .def_readonly("max_loss_streak", &cbt::PerformanceReport::maxLossStreak)
        .def_readonly("max_drawdown_pct", &cbt::PerformanceReport::maxDrawdownPct)
        .def_readonly("initial_capital", &cbt::PerformanceReport::initialCapital)
        .def_readonly("final_capital", &cbt::PerformanceReport::finalCapital);

    py::class_<cbt::BacktestResult>(m, "BacktestResult")
        .def_readonly("trades", &cbt::BacktestResult::trades)
        .def_readonly("report", &cbt::BacktestResult::report)
        .def_readonly("equity_curve", &cbt::BacktestResult::equityCurve)
        .def_readonly("first_index", &cbt::BacktestResult::firstIndex)
        .def_readonly("last_index", &cbt::BacktestResult::lastIndex)
        .def_readonly("final_capital", &cbt::BacktestResult::finalCapital);

    py::class_<cbt::Backtester>(m, "Backtester")
        .def(py::init<cbt::BacktestConfig>(), py::arg("config") = cbt::BacktestConfig{})
        .def("run", py::overload_cast<const cbt::PriceSeries&, const cbt::Strategy&>(
                 &cbt::Backtester::run, py::const_),
             py::arg("series"), py::arg("strategy"),
             py::call_guard<py::gil_scoped_release>())
        .def("run_signals", [](const cbt::Backtester& self, const cbt::PriceSeries& series,
                               const std::vector<int>& signals) {
            return self.run(series, toSignals(signals));
        }, py::arg("series"), py::arg("signals"))
        .def_property_readonly("config", &cbt::Backtester::config);

    m.def("trade_return", &cbt::tradeReturn,
          py::arg("entry_price"), py::arg("exit_price"), py::arg("commission") = 0.0);

    // ==================== Data ====================
    m.def("load_csv", [](const std::string& path, py::kwargs kwargs) {
        return cbt::CsvPriceFeed(path, toParams(kwargs)).load();
    }, py::arg("path"), "Load OHLCV bars from a CSV file");
    m.def("save_csv", py::overload_cast<const cbt::PriceSeries&, const std::string&>(
              &cbt::CsvPriceFeed::save),
          py::arg("series"), py::arg("path"));

    // ==================== Logging ====================
    py::enum_<cbt::LogLevel>(m, "LogLevel")
        .value("DEBUG", cbt::LogLevel::Debug)
        .value("INFO", cbt::LogLevel::Info)
        .value("WARNING", cbt::LogLevel::Warning)
        .value("ERROR", cbt::LogLevel::Error)
        .value("OFF", cbt::LogLevel::Off);
    m.def("set_log_level", &cbt::Logger::setLevel);
}
