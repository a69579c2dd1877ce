#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <relay/common/critical.hpp>
#include <relay/crypto/secp256k1.hpp>
#include <relay/digest/builder.hpp>
#include <relay/schema/encoding/scale/encoder.hpp>
#include <relay/schema/execution_record.hpp>
#include <relay/schema/key/engine_keys.hpp>
#include <relay/schema/primitives.hpp>
#include <relay/storage/rocksdb/storage.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

void configure_logging(const std::string& level) {
  // stdout carries command output only.
  auto logger = spdlog::stderr_color_mt("relay_tool");
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_default_logger(logger);
  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::warn("Unknown log level '{}', using 'warn'", level);
    parsed = spdlog::level::warn;
  }
  spdlog::set_level(parsed);
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    relay::common::critical("missing required option --{}", name);
  }
  return vm[name].as<std::string>();
}

relay::schema::address_t get_address(const po::variables_map& vm,
                                     const std::string& name) {
  auto value = require(vm, name);
  auto address = relay::schema::try_make_address(value);
  if (!address) {
    relay::common::critical("--{} must be 20 bytes of hex", name);
  }
  return *address;
}

boost::multiprecision::uint256_t get_uint256(const po::variables_map& vm,
                                             const std::string& name) {
  auto value = require(vm, name);
  auto parsed = relay::schema::try_make_uint256(value);
  if (!parsed) {
    relay::common::critical("--{} must be an unsigned 256-bit integer", name);
  }
  return *parsed;
}

relay::schema::private_key_t get_private_key(const po::variables_map& vm) {
  auto key = relay::schema::try_make_private_key(require(vm, "private-key"));
  if (!key) {
    relay::common::critical("--private-key must be 32 bytes of hex");
  }
  return *key;
}

relay::schema::transfer_intent_t get_intent(const po::variables_map& vm) {
  return relay::digest::make_intent(
      get_address(vm, "sender"), get_uint256(vm, "amount"),
      get_address(vm, "recipient"), get_address(vm, "token"),
      get_uint256(vm, "nonce"));
}

int keygen() {
  auto private_key = relay::crypto::generate_private_key();
  if (!private_key) {
    relay::common::critical("secp256k1 key generation is unavailable");
  }
  auto address = relay::crypto::address_of(*private_key);
  if (!address) {
    relay::common::critical("failed to derive address from generated key");
  }
  std::cout << relay::schema::to_hex(*private_key) << '\n'
            << relay::schema::to_hex(*address) << '\n';
  return 0;
}

int address(const po::variables_map& vm) {
  auto address = relay::crypto::address_of(get_private_key(vm));
  if (!address) {
    spdlog::error("private key is not a valid secp256k1 scalar");
    return 1;
  }
  std::cout << relay::schema::to_hex(*address) << '\n';
  return 0;
}

int digest(const po::variables_map& vm) {
  auto value = relay::digest::compute_digest(get_intent(vm));
  std::cout << relay::schema::to_hex(value) << '\n';
  return 0;
}

int sign(const po::variables_map& vm) {
  auto value = relay::digest::compute_digest(get_intent(vm));
  auto signature = relay::crypto::sign_message(get_private_key(vm), value);
  if (!signature) {
    spdlog::error("signing failed");
    return 1;
  }
  std::cout << relay::schema::to_hex(*signature) << '\n';
  return 0;
}

int recover(const po::variables_map& vm) {
  auto signature = relay::schema::try_make_signature(require(vm, "signature"));
  if (!signature) {
    relay::common::critical("--signature must be 65 bytes of hex");
  }
  auto value = relay::digest::compute_digest(get_intent(vm));
  auto signer = relay::crypto::recover_address(
      relay::digest::personal_message_digest(value), *signature);
  if (!signer) {
    spdlog::error("signature does not recover to any signer");
    return 1;
  }
  std::cout << relay::schema::to_hex(*signer) << '\n';
  return 0;
}

int executed(const po::variables_map& vm) {
  auto value = relay::schema::try_make_hash32(require(vm, "digest"));
  if (!value) {
    relay::common::critical("--digest must be 32 bytes of hex");
  }
  auto storage =
      relay::storage::make_storage<relay::storage::rocksdb_storage_tag>(
          require(vm, "db"));
  auto encoder = relay::schema::encoding::scale_encoder_t{};
  auto key = relay::schema::key::make_executed_key(*value);
  auto record = storage.get<relay::schema::execution_record_t>(
      encoder, relay::schema::bytes_view_t{key});
  if (!record) {
    std::cout << "false\n";
    return 0;
  }
  std::cout << "true\n";
  spdlog::info("digest {} status {} ledger code {}",
               relay::schema::to_hex(*value),
               static_cast<int>(record->status), record->ledger_code);
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  relay_tool keygen\n"
            << "  relay_tool address --private-key HEX\n"
            << "  relay_tool digest --sender --amount --recipient --token "
               "--nonce\n"
            << "  relay_tool sign <digest options> --private-key HEX\n"
            << "  relay_tool recover <digest options> --signature HEX\n"
            << "  relay_tool executed --db PATH --digest HEX\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto log_level = std::string{};
  auto options = po::options_description{"relay_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|address|digest|sign|recover|executed")(
      "log-level", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|error|critical|off")(
      "sender", po::value<std::string>(), "sender address hex")(
      "amount", po::value<std::string>(), "amount, decimal or 0x hex")(
      "recipient", po::value<std::string>(), "recipient address hex")(
      "token", po::value<std::string>(), "token address hex")(
      "nonce", po::value<std::string>(), "nonce, decimal or 0x hex")(
      "private-key", po::value<std::string>(), "32-byte private key hex")(
      "signature", po::value<std::string>(), "65-byte signature hex")(
      "digest", po::value<std::string>(), "32-byte digest hex")(
      "db", po::value<std::string>(), "RocksDB executed-set path");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return 2;
  }

  configure_logging(log_level);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    return keygen();
  }
  if (command == "address") {
    return address(vm);
  }
  if (command == "digest") {
    return digest(vm);
  }
  if (command == "sign") {
    return sign(vm);
  }
  if (command == "recover") {
    return recover(vm);
  }
  if (command == "executed") {
    return executed(vm);
  }

  spdlog::error("unknown command '{}'", command);
  print_help(options);
  return 2;
}
