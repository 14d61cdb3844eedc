#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <hashlock/crypto/commitment.hpp>
#include <hashlock/execution/engine.hpp>
#include <hashlock/ledger/storage_ledger.hpp>
#include <hashlock/schema/encoding/scale/encoder.hpp>
#include <hashlock/schema/key/engine_keys.hpp>
#include <hashlock/storage/escrow_store.hpp>
#include <hashlock/storage/rocksdb/storage.hpp>

#include <charconv>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace {

namespace po = boost::program_options;
using encoder_t = hashlock::schema::encoding::scale_encoder_t;
using storage_t =
    hashlock::storage::storage<hashlock::storage::rocksdb_storage_tag>;

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

void configure_logging(const spdlog::level::level_enum level,
                       const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "hashlock", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

// spdlog maps unknown names to `off`; only accept names it really knows.
std::optional<spdlog::level::level_enum> try_log_level(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

std::optional<hashlock::schema::hash32_t> get_hash32(const po::variables_map& vm,
                                                     const std::string& name) {
  if (!vm.contains(name)) {
    spdlog::error("missing required argument --{}", name);
    return std::nullopt;
  }
  auto parsed =
      hashlock::schema::try_make_hash32(vm[name].as<std::string>());
  if (!parsed) {
    spdlog::error("--{} must be 32 bytes of hex", name);
  }
  return parsed;
}

std::optional<uint64_t> get_u64(const po::variables_map& vm,
                                const std::string& name) {
  if (!vm.contains(name)) {
    spdlog::error("missing required argument --{}", name);
    return std::nullopt;
  }
  // Taken as text: program_options wraps "-1" to UINT64_MAX for unsigned
  // targets.
  const auto& text = vm[name].as<std::string>();
  auto value = uint64_t{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [end, error] = std::from_chars(first, last, value);
  if (text.empty() || error != std::errc{} || end != last) {
    spdlog::error("--{} must be a non-negative integer, got '{}'", name, text);
    return std::nullopt;
  }
  return value;
}

std::string hex(const hashlock::schema::hash32_t& value) {
  return hashlock::schema::to_hex(
      hashlock::schema::bytes_view_t{value.data(), value.size()});
}

/// Manually driven height oracle persisted beside the escrow records.
class stored_height final {
 public:
  explicit stored_height(storage_t& storage)
      : storage_{storage},
        key_{hashlock::schema::key::make_prefix_key(
            encoder_, hashlock::schema::key::kHeightKey)} {}

  hashlock::schema::height_t current() {
    return storage_
        .get<hashlock::schema::height_t>(encoder_, view())
        .value_or(0);
  }

  bool advance_to(const hashlock::schema::height_t height) {
    if (height < current()) {
      return false;
    }
    storage_.put(encoder_, view(), height);
    return true;
  }

 private:
  hashlock::schema::bytes_view_t view() const {
    return hashlock::schema::bytes_view_t{key_.data(), key_.size()};
  }

  storage_t& storage_;
  encoder_t encoder_;
  hashlock::schema::bytes_t key_;
};

int report(const hashlock::schema::transaction_result_t& result) {
  if (hashlock::schema::succeeded(result)) {
    std::cout << "ok";
    if (result.escrow_id) {
      std::cout << " id=" << *result.escrow_id;
    }
    std::cout << '\n';
    for (const auto& event : result.events) {
      std::cout << event.type;
      for (const auto& attribute : event.attributes) {
        std::cout << ' ' << attribute.key << '=' << attribute.value;
      }
      std::cout << '\n';
    }
    return kExitOk;
  }
  std::cout << "error code=" << result.code << " codespace=" << result.codespace
            << " log=\"" << result.log << '"';
  if (!result.info.empty()) {
    std::cout << " info=\"" << result.info << '"';
  }
  std::cout << '\n';
  return kExitRejected;
}

void print_record(const hashlock::schema::escrow_state_t& record) {
  std::cout << "id=" << record.id << " sender=" << hex(record.sender)
            << " recipient=" << hex(record.recipient)
            << " amount=" << record.amount
            << " unlock_height=" << record.unlock_height
            << " secret_hash=" << hex(record.secret_hash)
            << " status=" << hashlock::schema::to_string(record.status)
            << " created_height=" << record.created_height << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "usage: hashlock <command> [options]\n\n"
            << "commands:\n"
            << "  fund        credit --account with --amount\n"
            << "  balance     print the balance of --account\n"
            << "  set-height  advance the stored height to --height\n"
            << "  hash        print the commitment of --secret\n"
            << "  create      lock --amount for --recipient\n"
            << "  claim       claim --id with --secret\n"
            << "  refund      refund --id after its unlock height\n"
            << "  cancel      privileged cancel of --id before unlock\n"
            << "  get         print the record --id\n"
            << "  status      print the summary of --id\n"
            << "  by-hash     list records locked under --secret-hash\n"
            << "  stats       print aggregate statistics\n\n"
            << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto config_file = std::string{};

  auto generic = po::options_description{"generic options"};
  generic.add_options()("help,h", "show help")(
      "config,c", po::value<std::string>(&config_file),
      "INI style configuration file");

  auto settings = po::options_description{"engine options"};
  settings.add_options()(
      "db", po::value<std::string>()->default_value("hashlock.db"),
      "RocksDB directory")("privileged-owner", po::value<std::string>(),
                           "privileged owner account hex")(
      "holding-account", po::value<std::string>(),
      "escrow holding account hex")(
      "hash-algorithm", po::value<std::string>()->default_value("sha256"),
      "sha256|blake3")("log-level",
                       po::value<std::string>()->default_value("info"),
                       "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value(""),
      "optional log file");

  auto arguments = po::options_description{"command arguments"};
  arguments.add_options()("command", po::value<std::string>(&command),
                          "command to run")(
      "caller", po::value<std::string>(), "calling account hex")(
      "account", po::value<std::string>(), "account hex")(
      "recipient", po::value<std::string>(), "recipient account hex")(
      "amount", po::value<std::string>(), "amount")(
      "blocks-ahead", po::value<std::string>(), "lock duration in heights")(
      "secret-hash", po::value<std::string>(), "32-byte commitment hex")(
      "secret", po::value<std::string>(), "claim preimage hex")(
      "id", po::value<std::string>(), "escrow id")(
      "height", po::value<std::string>(), "new height");

  auto command_line = po::options_description{};
  command_line.add(generic).add(settings).add(arguments);
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(command_line)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto config_stream = std::ifstream{vm["config"].as<std::string>()};
      if (!config_stream) {
        std::cerr << "cannot open config file "
                  << vm["config"].as<std::string>() << '\n';
        return kExitUsage;
      }
      po::store(po::parse_config_file(config_stream, settings), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(command_line);
    return kExitOk;
  }

  auto log_level = try_log_level(vm["log-level"].as<std::string>());
  if (!log_level) {
    std::cerr << "--log-level must be one of trace, debug, info, warn, error, "
                 "critical, off\n";
    return kExitUsage;
  }
  configure_logging(*log_level, vm["log-file"].as<std::string>());

  auto algorithm = hashlock::schema::try_hash_algorithm_from_string(
      vm["hash-algorithm"].as<std::string>());
  if (!algorithm) {
    spdlog::error("--hash-algorithm must be sha256 or blake3");
    spdlog::shutdown();
    return kExitUsage;
  }

  auto options = hashlock::execution::engine_options{};
  options.hash_algorithm = *algorithm;
  if (vm.contains("privileged-owner")) {
    auto owner = get_hash32(vm, "privileged-owner");
    if (!owner) {
      spdlog::shutdown();
      return kExitUsage;
    }
    options.privileged_owner = *owner;
  }
  if (vm.contains("holding-account")) {
    auto holding = get_hash32(vm, "holding-account");
    if (!holding) {
      spdlog::shutdown();
      return kExitUsage;
    }
    options.holding_account = *holding;
  }

  auto storage = hashlock::storage::make_storage<
      hashlock::storage::rocksdb_storage_tag>(vm["db"].as<std::string>());
  auto height = stored_height{storage};
  auto store = hashlock::storage::escrow_store{storage};
  auto ledger = hashlock::ledger::storage_ledger{storage};
  auto engine = hashlock::execution::engine{
      store, ledger, [&height] { return height.current(); }, options};

  auto exit_code = [&]() -> int {
    if (command == "fund") {
      auto account = get_hash32(vm, "account");
      auto amount = get_u64(vm, "amount");
      if (!account || !amount) {
        return kExitUsage;
      }
      if (!ledger.credit(*account, *amount)) {
        spdlog::error("crediting {} would overflow the balance", *amount);
        return kExitRejected;
      }
      std::cout << "balance=" << ledger.balance_of(*account) << '\n';
      return kExitOk;
    }
    if (command == "balance") {
      auto account = get_hash32(vm, "account");
      if (!account) {
        return kExitUsage;
      }
      std::cout << "balance=" << ledger.balance_of(*account) << '\n';
      return kExitOk;
    }
    if (command == "set-height") {
      auto target = get_u64(vm, "height");
      if (!target) {
        return kExitUsage;
      }
      if (!height.advance_to(*target)) {
        spdlog::error("height may not decrease (current {})",
                      height.current());
        return kExitRejected;
      }
      std::cout << "height=" << height.current() << '\n';
      return kExitOk;
    }
    if (command == "hash") {
      if (!vm.contains("secret")) {
        spdlog::error("missing required argument --secret");
        return kExitUsage;
      }
      auto secret =
          hashlock::schema::try_from_hex(vm["secret"].as<std::string>());
      if (!secret) {
        spdlog::error("--secret must be hex");
        return kExitUsage;
      }
      auto digest = hashlock::crypto::commitment(
          options.hash_algorithm,
          hashlock::schema::bytes_view_t{secret->data(), secret->size()});
      std::cout << hex(digest) << '\n';
      return kExitOk;
    }
    if (command == "create") {
      auto caller = get_hash32(vm, "caller");
      auto recipient = get_hash32(vm, "recipient");
      auto amount = get_u64(vm, "amount");
      auto blocks_ahead = get_u64(vm, "blocks-ahead");
      auto secret_hash = get_hash32(vm, "secret-hash");
      if (!caller || !recipient || !amount || !blocks_ahead || !secret_hash) {
        return kExitUsage;
      }
      return report(engine.create_escrow(
          *caller, hashlock::schema::create_escrow_t{
                       .recipient = *recipient,
                       .amount = *amount,
                       .blocks_ahead = *blocks_ahead,
                       .secret_hash = *secret_hash}));
    }
    if (command == "claim") {
      auto caller = get_hash32(vm, "caller");
      auto id = get_u64(vm, "id");
      if (!caller || !id || !vm.contains("secret")) {
        spdlog::error("claim requires --caller, --id and --secret");
        return kExitUsage;
      }
      auto secret =
          hashlock::schema::try_from_hex(vm["secret"].as<std::string>());
      if (!secret) {
        spdlog::error("--secret must be hex");
        return kExitUsage;
      }
      return report(engine.claim_escrow(
          *caller,
          hashlock::schema::claim_escrow_t{.escrow_id = *id,
                                           .secret = std::move(*secret)}));
    }
    if (command == "refund") {
      auto caller = get_hash32(vm, "caller");
      auto id = get_u64(vm, "id");
      if (!caller || !id) {
        return kExitUsage;
      }
      return report(engine.refund_escrow(
          *caller, hashlock::schema::refund_escrow_t{.escrow_id = *id}));
    }
    if (command == "cancel") {
      auto caller = get_hash32(vm, "caller");
      auto id = get_u64(vm, "id");
      if (!caller || !id) {
        return kExitUsage;
      }
      return report(engine.cancel_escrow(
          *caller, hashlock::schema::cancel_escrow_t{.escrow_id = *id}));
    }
    if (command == "get") {
      auto id = get_u64(vm, "id");
      if (!id) {
        return kExitUsage;
      }
      auto record = engine.get(*id);
      if (!record) {
        std::cout << "none\n";
        return kExitOk;
      }
      print_record(*record);
      return kExitOk;
    }
    if (command == "status") {
      auto id = get_u64(vm, "id");
      if (!id) {
        return kExitUsage;
      }
      auto summary = engine.status(*id);
      std::cout << std::boolalpha << "exists=" << summary.exists
                << " claimed=" << summary.claimed
                << " refunded=" << summary.refunded
                << " height_reached=" << summary.height_reached
                << " sender=" << hex(summary.sender)
                << " recipient=" << hex(summary.recipient)
                << " amount=" << summary.amount
                << " can_claim=" << engine.can_claim(*id)
                << " can_refund=" << engine.can_refund(*id) << '\n';
      return kExitOk;
    }
    if (command == "by-hash") {
      auto secret_hash = get_hash32(vm, "secret-hash");
      if (!secret_hash) {
        return kExitUsage;
      }
      for (const auto& record : engine.by_secret_hash(*secret_hash)) {
        print_record(record);
      }
      return kExitOk;
    }
    if (command == "stats") {
      auto stats = engine.stats();
      std::cout << "total_escrows=" << stats.total_escrows
                << " holding_balance=" << stats.holding_balance
                << " current_height=" << stats.current_height
                << " privileged_owner=" << hex(stats.privileged_owner) << '\n';
      return kExitOk;
    }
    spdlog::error("unknown command '{}'", command);
    return kExitUsage;
  }();

  spdlog::shutdown();
  return exit_code;
}
