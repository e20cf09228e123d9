#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <beacon/execution/backend.hpp>
#include <beacon/execution/logical_clock.hpp>
#include <beacon/execution/registry.hpp>
#include <beacon/schema/encoding/scale/encoder.hpp>
#include <beacon/storage/rocksdb/storage.hpp>
#include <exception>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

namespace {

std::optional<beacon::schema::account_id_t> parse_account(
    const std::string& name,
    const std::string& value) {
  if (value.empty()) {
    return beacon::schema::account_id_t{};
  }
  auto account = beacon::schema::try_make_hash32(value);
  if (!account) {
    spdlog::error("--{} must be 64 hex characters", name);
  }
  return account;
}

std::optional<beacon::schema::amount_t> parse_amount(const std::string& name,
                                                     const std::string& value) {
  try {
    return beacon::schema::amount_t{value.c_str()};
  } catch (const std::exception& ex) {
    spdlog::error("--{} is not an unsigned integer: {}", name, ex.what());
    return std::nullopt;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("beacon.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "beacon", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto owner = std::string{};
  auto controller = std::string{};
  auto keeper = std::string{};
  auto fee_bps = uint32_t{};
  auto min_amount = std::string{};
  auto max_amount = std::string{};
  auto ops_path = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Beacon"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "beacon.db"),
      "RocksDB directory holding the registry")(
      "owner", boost::program_options::value<std::string>(&owner),
      "Owner account (hex), used on first start")(
      "controller", boost::program_options::value<std::string>(&controller),
      "Controller account (hex), used on first start")(
      "keeper", boost::program_options::value<std::string>(&keeper),
      "Keeper account (hex), used on first start")(
      "fee-bps",
      boost::program_options::value<uint32_t>(&fee_bps)->default_value(0),
      "Fee rate in basis points, used on first start")(
      "min-amount",
      boost::program_options::value<std::string>(&min_amount)
          ->default_value("1"),
      "Minimum intent amount, used on first start")(
      "max-amount",
      boost::program_options::value<std::string>(&max_amount)
          ->default_value(
              std::numeric_limits<beacon::schema::amount_t>::max().str()),
      "Maximum intent amount, used on first start")(
      "ops,o", boost::program_options::value<std::string>(&ops_path),
      "File of hex-encoded operations to apply, one per line")(
      "verbose,v", "Enable verbose output");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    spdlog::error("{}", ex.what());
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto owner_id = parse_account("owner", owner);
  auto controller_id = parse_account("controller", controller);
  auto keeper_id = parse_account("keeper", keeper);
  auto min = parse_amount("min-amount", min_amount);
  auto max = parse_amount("max-amount", max_amount);
  if (!owner_id || !controller_id || !keeper_id || !min || !max) {
    spdlog::shutdown();
    return 1;
  }

  auto options = beacon::execution::registry_options{};
  options.owner = *owner_id;
  options.controller = *controller_id;
  options.keeper = *keeper_id;
  options.fee_bps = fee_bps;
  options.min_amount = *min;
  options.max_amount = *max;

  spdlog::info("Opening registry at '{}'", db_path);
  auto storage =
      beacon::storage::make_storage<beacon::storage::rocksdb_storage_tag>(
          db_path);
  auto encoder = beacon::execution::encoder_t{};
  auto clock = beacon::execution::logical_clock{};

  auto transfer = [](const beacon::schema::account_id_t& to,
                     const beacon::schema::amount_t& amount) {
    spdlog::info("Transfer {} to {}", amount.str(), beacon::schema::to_hex(to));
    return true;
  };
  auto sink = [](const beacon::schema::registry_event_t& event) {
    spdlog::debug("Event {}", beacon::schema::event_name(event));
  };
  auto registry = beacon::execution::registry{encoder, storage, clock, options,
                                              transfer, sink};

  auto failures = uint64_t{};
  if (!ops_path.empty()) {
    auto input = std::ifstream{ops_path};
    if (!input) {
      spdlog::error("Cannot open operations file '{}'", ops_path);
      spdlog::shutdown();
      return 1;
    }
    auto line = std::string{};
    auto line_number = uint64_t{};
    while (std::getline(input, line)) {
      ++line_number;
      if (line.empty() || line.front() == '#') {
        continue;
      }
      auto raw = beacon::schema::try_from_hex(line);
      if (!raw) {
        spdlog::warn("Line {}: not valid hex", line_number);
        ++failures;
        continue;
      }
      clock.advance();
      auto result = registry.apply_encoded(
          beacon::schema::bytes_view_t{raw->data(), raw->size()});
      if (result.code != 0) {
        spdlog::warn("Line {}: {} failed with code {} ({})", line_number,
                     result.codespace, result.code, result.log);
        ++failures;
      } else {
        spdlog::info("Line {}: {} ok, {} event(s)", line_number,
                     result.codespace, result.events.size());
      }
    }
  }

  auto config = registry.config();
  auto stats = registry.stats();
  spdlog::info("Owner {}", beacon::schema::to_hex(config.owner));
  spdlog::info("Controller {}", beacon::schema::to_hex(config.controller));
  spdlog::info("Keeper {}", beacon::schema::to_hex(config.keeper));
  spdlog::info("Fee {} bps, bounds [{}, {}]{}", config.fee_bps,
               config.min_amount.str(), config.max_amount.str(),
               config.paused ? ", paused" : "");
  spdlog::info("Treasury balance {}", stats.treasury_balance.str());
  spdlog::info(
      "Intents {} (pending {}, executed {}, cancelled {}), executions {}",
      stats.total_intents, stats.pending, stats.executed, stats.cancelled,
      stats.total_executions);
  spdlog::info("Fill rate {} bps, cancellation rate {} bps, execution rate {} bps",
               stats.fill_rate_bps, stats.cancellation_rate_bps,
               stats.execution_rate_bps);

  spdlog::shutdown();
  return failures == 0 ? 0 : 1;
}
