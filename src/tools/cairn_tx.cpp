#include <boost/program_options.hpp>
#include <cairn/blake3/hash.hpp>
#include <cairn/common/critical.hpp>
#include <cairn/crypto/sign.hpp>
#include <cairn/schema/accumulator_state.hpp>
#include <cairn/schema/broadcast_mode.hpp>
#include <cairn/schema/encoding/scale/encoder.hpp>
#include <cairn/schema/encoding/signing.hpp>
#include <cairn/schema/push_result.hpp>
#include <cairn/schema/query_height.hpp>
#include <cairn/schema/transaction.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace {

using encoder_t = cairn::schema::encoding::encoder<
    cairn::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

cairn::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    cairn::common::critical("missing required hash argument --" + name);
  }
  auto hash = cairn::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    cairn::common::critical("--" + name + " must be 32 bytes of hex");
  }
  return *hash;
}

cairn::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return get_hash32(vm, "chain-id");
  }
  if (vm.contains("chain-name")) {
    return cairn::blake3::hash(vm["chain-name"].as<std::string>());
  }
  cairn::common::critical("requires --chain-id or --chain-name");
}

/// 32-byte secret from --private-key, read as an ed25519 seed or a
/// secp256k1 scalar depending on --key-type.
std::optional<std::array<uint8_t, 32>> get_private_key(
    const po::variables_map& vm) {
  if (!vm.contains("private-key")) {
    return std::nullopt;
  }
  auto bytes = cairn::schema::try_from_hex(vm["private-key"].as<std::string>());
  auto key = std::array<uint8_t, 32>{};
  if (!bytes || bytes->size() != key.size()) {
    cairn::common::critical("--private-key must be 32 bytes of hex");
  }
  std::ranges::copy(*bytes, std::begin(key));
  return key;
}

bool use_secp256k1(const po::variables_map& vm) {
  auto key_type = vm["key-type"].as<std::string>();
  if (key_type != "ed25519" && key_type != "secp256k1") {
    cairn::common::critical("--key-type must be ed25519|secp256k1");
  }
  return key_type == "secp256k1";
}

cairn::schema::signer_id_t make_signer(const po::variables_map& vm) {
  if (auto private_key = get_private_key(vm)) {
    if (use_secp256k1(vm)) {
      auto public_key = cairn::crypto::secp256k1_public_key(*private_key);
      if (!public_key) {
        cairn::common::critical("--private-key is not a valid secp256k1 key");
      }
      return cairn::schema::signer_id_t{*public_key};
    }
    auto public_key = cairn::crypto::ed25519_public_key(*private_key);
    if (!public_key) {
      cairn::common::critical("failed to derive ed25519 public key");
    }
    return cairn::schema::signer_id_t{*public_key};
  }
  if (vm.contains("signer")) {
    return cairn::schema::signer_id_t{get_hash32(vm, "signer")};
  }
  cairn::common::critical("requires --private-key or --signer");
}

/// Raw bytes of a file, or of standard input for "-".
cairn::schema::bytes_t read_input(const std::string& path) {
  if (path == "-") {
    return cairn::schema::bytes_t(std::istreambuf_iterator<char>{std::cin},
                                  std::istreambuf_iterator<char>{});
  }
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    cairn::common::critical("cannot open --input " + path);
  }
  return cairn::schema::bytes_t(std::istreambuf_iterator<char>{file},
                                std::istreambuf_iterator<char>{});
}

cairn::schema::bytes_t get_payload(const po::variables_map& vm) {
  if (vm.contains("payload-hex")) {
    auto bytes =
        cairn::schema::try_from_hex(vm["payload-hex"].as<std::string>());
    if (!bytes) {
      cairn::common::critical("--payload-hex is not valid hex");
    }
    return *bytes;
  }
  if (vm.contains("payload")) {
    return cairn::schema::make_bytes(vm["payload"].as<std::string>());
  }
  return read_input(vm["input"].as<std::string>());
}

cairn::schema::transaction_payload_t build_payload(
    const std::string& command,
    const po::variables_map& vm) {
  if (command == "create") {
    auto write_access = cairn::schema::try_from_string<
        cairn::schema::write_access_t>(vm["write-access"].as<std::string>());
    if (!write_access) {
      cairn::common::critical("--write-access must be only_owner|public");
    }
    return cairn::schema::create_accumulator_t{.version = 1,
                                               .write_access = *write_access};
  }
  if (!vm.contains("address")) {
    cairn::common::critical("push requires --address");
  }
  return cairn::schema::push_t{.version = 1,
                               .address = vm["address"].as<uint64_t>(),
                               .payload = get_payload(vm)};
}

/// Sign with --private-key when given; named signers get an empty signature
/// and only pass a node running without strict crypto.
cairn::schema::signature_t make_signature(
    encoder_t& encoder,
    const po::variables_map& vm,
    const cairn::schema::transaction_t& transaction) {
  auto private_key = get_private_key(vm);
  if (!private_key) {
    return cairn::schema::signature_t{cairn::schema::ed25519_signature_t{}};
  }
  auto message = cairn::schema::encoding::signing_bytes(encoder, transaction);
  if (use_secp256k1(vm)) {
    auto signature = cairn::crypto::sign_secp256k1(
        cairn::schema::make_bytes_view(message), *private_key);
    if (!signature) {
      cairn::common::critical("failed to sign transaction");
    }
    return cairn::schema::signature_t{*signature};
  }
  auto signature = cairn::crypto::sign_ed25519(
      cairn::schema::make_bytes_view(message), *private_key);
  if (!signature) {
    cairn::common::critical("failed to sign transaction");
  }
  return cairn::schema::signature_t{*signature};
}

cairn::schema::bytes_t build_query_data(encoder_t& encoder,
                                        const std::string& path,
                                        const po::variables_map& vm) {
  if (path == "/engine/info") {
    return {};
  }
  if (path == "/state/nonce") {
    return encoder.encode(make_signer(vm));
  }
  if (!vm.contains("address")) {
    cairn::common::critical("accumulator queries require --address");
  }
  auto address = vm["address"].as<uint64_t>();
  if (path == "/accumulator/leaf") {
    return encoder.encode(std::tuple{address, vm["index"].as<uint64_t>()});
  }
  if (path == "/accumulator/count" || path == "/accumulator/peaks" ||
      path == "/accumulator/root" || path == "/accumulator/info") {
    return encoder.encode(address);
  }
  cairn::common::critical("unsupported query path");
}

nlohmann::json json_rpc(const std::string_view method, nlohmann::json params) {
  return nlohmann::json{{"jsonrpc", "2.0"},
                        {"id", 1},
                        {"method", method},
                        {"params", std::move(params)}};
}

std::string signer_to_string(const cairn::schema::signer_id_t& signer) {
  return std::visit(
      overloaded{[](const cairn::schema::ed25519_signer_id& id) {
                   return "ed25519:" + cairn::schema::to_hex(id.public_key);
                 },
                 [](const cairn::schema::secp256k1_signer_id& id) {
                   return "secp256k1:" + cairn::schema::to_hex(id.public_key);
                 },
                 [](const cairn::schema::named_signer_t& id) {
                   return "named:" + cairn::schema::to_hex(id);
                 }},
      signer);
}

template <typename T>
T decode_value(encoder_t& encoder, const cairn::schema::bytes_t& value) {
  auto decoded = encoder.try_decode<T>(cairn::schema::make_bytes_view(value));
  if (!decoded) {
    cairn::common::critical("value does not decode for this path");
  }
  return *decoded;
}

void print_decoded(encoder_t& encoder,
                   const std::string& path,
                   const cairn::schema::bytes_t& value) {
  if (path == "/accumulator/leaf") {
    auto leaf = decode_value<cairn::schema::bytes_t>(encoder, value);
    std::cout.write(reinterpret_cast<const char*>(leaf.data()),
                    static_cast<std::streamsize>(leaf.size()));
    std::cout.flush();
    return;
  }

  auto out = nlohmann::json::object();
  if (path == "/accumulator/count") {
    out["count"] = decode_value<uint64_t>(encoder, value);
  } else if (path == "/state/nonce") {
    out["nonce"] = decode_value<uint64_t>(encoder, value);
  } else if (path == "/accumulator/root") {
    out["root"] = cairn::schema::to_hex(
        decode_value<cairn::schema::hash32_t>(encoder, value));
  } else if (path == "/accumulator/peaks") {
    auto peaks = nlohmann::json::array();
    for (const auto& peak :
         decode_value<std::vector<cairn::schema::hash32_t>>(encoder, value)) {
      peaks.push_back(cairn::schema::to_hex(peak));
    }
    out["peaks"] = std::move(peaks);
  } else if (path == "/accumulator/info") {
    auto state =
        decode_value<cairn::schema::accumulator_state_t>(encoder, value);
    out["address"] = state.address;
    out["write_access"] = cairn::schema::to_string(state.write_access);
    out["owner"] = signer_to_string(state.owner);
    out["created_height"] = state.created_height;
  } else if (path == "/engine/info") {
    auto [height, state_root, chain_id] =
        decode_value<std::tuple<int64_t, cairn::schema::hash32_t,
                                cairn::schema::hash32_t>>(encoder, value);
    out["height"] = height;
    out["state_root"] = cairn::schema::to_hex(state_root);
    out["chain_id"] = cairn::schema::to_hex(chain_id);
  } else if (path == "create") {
    out["address"] = decode_value<uint64_t>(encoder, value);
  } else if (path == "push") {
    auto receipt = decode_value<cairn::schema::push_result_t>(encoder, value);
    out["address"] = receipt.address;
    out["index"] = receipt.index;
    out["root"] = cairn::schema::to_hex(receipt.root);
  } else {
    cairn::common::critical("unsupported decode path");
  }
  std::cout << out.dump() << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  cairn_tx create --chain-name <id> --nonce <n> "
               "--private-key <hex> [--write-access only_owner|public]\n"
            << "  cairn_tx push --chain-name <id> --nonce <n> --private-key "
               "<hex> --address <a> [--payload <text> | <file|->]\n"
            << "  cairn_tx query --path <route> [--address <a>] [--index <i>] "
               "[--height committed|pending|<h>]\n"
            << "  cairn_tx decode --path <route|create|push> --value <base64>\n"
            << "  cairn_tx chain-id --chain-name <id>\n"
            << "  cairn_tx signer --private-key <hex>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"cairn_tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "create|push|query|decode|chain-id|signer")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name", po::value<std::string>(),
      "CometBFT chain-id string, hashed into the chain id")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "private-key", po::value<std::string>(),
      "32-byte secret hex (ed25519 seed or secp256k1 scalar)")(
      "key-type", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")(
      "signer", po::value<std::string>(), "named signer hash32 hex")(
      "write-access", po::value<std::string>()->default_value("only_owner"),
      "only_owner|public")("address", po::value<uint64_t>(),
                           "accumulator address")(
      "index", po::value<uint64_t>()->default_value(0), "leaf index")(
      "payload", po::value<std::string>(), "push payload text")(
      "payload-hex", po::value<std::string>(), "push payload bytes hex")(
      "input", po::value<std::string>()->default_value("-"),
      "push payload file, '-' for stdin")(
      "broadcast", po::value<std::string>()->default_value("commit"),
      "async|sync|commit")("path", po::value<std::string>(),
                           "abci query path")(
      "height", po::value<std::string>()->default_value("committed"),
      "committed|pending|<height>")("value", po::value<std::string>(),
                                    "base64 query value or tx result data");

  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("input", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    cairn::common::critical(ex.what());
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  auto encoder = encoder_t{};

  if (command == "create" || command == "push") {
    auto broadcast = cairn::schema::try_from_string<
        cairn::schema::broadcast_mode_t>(vm["broadcast"].as<std::string>());
    if (!broadcast) {
      cairn::common::critical("--broadcast must be async|sync|commit");
    }
    auto transaction =
        cairn::schema::transaction_t{.version = 1,
                                     .chain_id = get_chain_id(vm),
                                     .nonce = vm["nonce"].as<uint64_t>(),
                                     .signer = make_signer(vm),
                                     .payload = build_payload(command, vm)};
    transaction.signature = make_signature(encoder, vm, transaction);
    auto encoded = encoder.encode(transaction);
    std::cout << json_rpc(cairn::schema::rpc_method(*broadcast),
                          {{"tx", cairn::schema::to_base64(encoded)}})
                     .dump()
              << '\n';
    return 0;
  }

  if (command == "query") {
    if (!vm.contains("path")) {
      cairn::common::critical("query requires --path");
    }
    auto path = vm["path"].as<std::string>();
    auto height =
        cairn::schema::try_parse_query_height(vm["height"].as<std::string>());
    if (!height) {
      cairn::common::critical("--height must be committed|pending|<height>");
    }
    auto data = build_query_data(encoder, path, vm);
    auto route = height->kind == cairn::schema::query_height_kind_t::pending
                     ? "/pending" + path
                     : path;
    auto request_height =
        height->kind == cairn::schema::query_height_kind_t::explicit_height
            ? height->height
            : uint64_t{0};
    std::cout << json_rpc("abci_query", {{"path", route},
                                         {"data", cairn::schema::to_hex(data)},
                                         {"height", std::to_string(
                                                        request_height)},
                                         {"prove", false}})
                     .dump()
              << '\n';
    return 0;
  }

  if (command == "decode") {
    if (!vm.contains("path") || !vm.contains("value")) {
      cairn::common::critical("decode requires --path and --value");
    }
    auto value = cairn::schema::try_from_base64(vm["value"].as<std::string>());
    if (!value) {
      cairn::common::critical("--value must be base64");
    }
    print_decoded(encoder, vm["path"].as<std::string>(), *value);
    return 0;
  }

  if (command == "chain-id") {
    std::cout << cairn::schema::to_hex(get_chain_id(vm)) << '\n';
    return 0;
  }

  if (command == "signer") {
    auto signer = make_signer(vm);
    std::cout << signer_to_string(signer) << '\n'
              << cairn::schema::to_hex(encoder.encode(signer)) << '\n';
    return 0;
  }

  cairn::common::critical(
      "command must be create|push|query|decode|chain-id|signer");
}
