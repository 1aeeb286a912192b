#include <boost/program_options.hpp>
#include <vestlock/access/identity.hpp>
#include <vestlock/blake3/hash.hpp>
#include <vestlock/common/critical.hpp>
#include <vestlock/execution/engine.hpp>
#include <vestlock/schema/command.hpp>
#include <vestlock/schema/encoding/scale/encoder.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace {

using encoder_t = vestlock::schema::encoding::encoder<
    vestlock::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

vestlock::schema::hash32_t get_hash32(const po::variables_map& vm,
                                      const std::string& name) {
  if (!vm.contains(name)) {
    vestlock::common::critical("missing required argument --" + name);
  }
  auto hash = vestlock::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash.has_value()) {
    vestlock::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

vestlock::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return get_hash32(vm, "chain-id");
  }
  return vestlock::blake3::hash(
      std::string_view{vm["chain-seed"].as<std::string>()});
}

vestlock::schema::signer_id_t get_signer(const po::variables_map& vm) {
  if (!vm.contains("signer")) {
    vestlock::common::critical("missing required argument --signer");
  }
  auto signer = vestlock::access::try_make_signer_id(
      vm["signer-kind"].as<std::string>(), vm["signer"].as<std::string>());
  if (!signer.has_value()) {
    vestlock::common::critical("--signer does not match --signer-kind");
  }
  return *signer;
}

template <typename Signature>
Signature copy_signature(const vestlock::schema::bytes_t& bytes) {
  auto signature = Signature{};
  if (!bytes.empty()) {
    if (bytes.size() != signature.size()) {
      vestlock::common::critical("signature has the wrong length");
    }
    std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
  }
  return signature;
}

vestlock::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  auto bytes = hex.empty() ? vestlock::schema::bytes_t{}
                           : vestlock::schema::from_hex(hex);
  if (kind == "ed25519") {
    return copy_signature<vestlock::schema::ed25519_signature_t>(bytes);
  }
  if (kind == "secp256k1") {
    return copy_signature<vestlock::schema::secp256k1_signature_t>(bytes);
  }
  vestlock::common::critical("signature-kind must be ed25519|secp256k1");
}

vestlock::schema::command_payload_t build_payload(const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    vestlock::common::critical("command mode requires --payload");
  }
  auto payload = vm["payload"].as<std::string>();
  if (payload == "initiate_lock") {
    auto amount =
        vestlock::schema::try_make_amount(vm["amount"].as<std::string>());
    if (!amount.has_value()) {
      vestlock::common::critical("--amount must be a decimal 256-bit integer");
    }
    return vestlock::schema::initiate_lock_t{.asset = get_hash32(vm, "asset"),
                                             .amount = *amount};
  }
  if (payload == "release") {
    return vestlock::schema::release_t{.asset = get_hash32(vm, "asset")};
  }
  if (payload == "sweep_native") {
    return vestlock::schema::sweep_native_t{};
  }
  if (payload == "transfer_control") {
    return vestlock::schema::transfer_control_t{
        .new_controller = get_hash32(vm, "new-controller")};
  }
  if (payload == "renounce_control") {
    return vestlock::schema::renounce_control_t{};
  }
  vestlock::common::critical("unsupported payload type");
}

vestlock::schema::command_t build_command(const po::variables_map& vm) {
  return vestlock::schema::command_t{.version = 1,
                                     .chain_id = get_chain_id(vm),
                                     .nonce = vm["nonce"].as<uint64_t>(),
                                     .signer = get_signer(vm),
                                     .payload = build_payload(vm),
                                     .signature = make_signature(vm)};
}

vestlock::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/lock/list" ||
      path == "/lock/duration" || path == "/access/controller") {
    return {};
  }
  if (path == "/lock/maturity" || path == "/lock/balance") {
    auto asset = get_hash32(vm, "asset");
    return vestlock::schema::bytes_t{std::begin(asset), std::end(asset)};
  }
  if (path == "/nonce") {
    return encoder_t{}.encode(get_signer(vm));
  }
  vestlock::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  command_builder command [options]\n"
            << "  command_builder signing-bytes [options]\n"
            << "  command_builder query-key [options]\n"
            << "  command_builder chain-id [--chain-seed <seed>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto mode = std::string{};
  auto options = po::options_description{"command_builder options"};
  options.add_options()("help,h", "show help")(
      "mode", po::value<std::string>(&mode),
      "command|signing-bytes|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "initiate_lock|release|sweep_native|transfer_control|renounce_control")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-seed", po::value<std::string>()->default_value("vestlock-chain"),
      "seed hashed into the chain id when --chain-id is absent")(
      "nonce", po::value<uint64_t>()->default_value(1), "command nonce")(
      "signer", po::value<std::string>(), "signer key or name hex")(
      "signer-kind", po::value<std::string>()->default_value("named"),
      "named|ed25519|secp256k1")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "asset", po::value<std::string>(), "asset hash32 hex")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal amount")("new-controller", po::value<std::string>(),
                        "new controller hash32 hex");

  auto positional = po::positional_options_description{};
  positional.add("mode", 1);
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
    return 1;
  }

  if (vm.contains("help") || mode.empty()) {
    print_help(options);
    return 0;
  }

  if (mode == "command") {
    auto encoded = encoder_t{}.encode(build_command(vm));
    std::cout << vestlock::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (mode == "signing-bytes") {
    auto message = vestlock::execution::make_signing_bytes(build_command(vm));
    std::cout << vestlock::schema::to_hex(
                     vestlock::schema::make_bytes_view(message))
              << '\n';
    return 0;
  }

  if (mode == "query-key") {
    if (!vm.contains("path")) {
      vestlock::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << vestlock::schema::to_base64(key) << '\n';
    return 0;
  }

  if (mode == "chain-id") {
    std::cout << vestlock::schema::to_hex(get_chain_id(vm)) << '\n';
    return 0;
  }

  vestlock::common::critical(
      "mode must be command|signing-bytes|query-key|chain-id");
}
