#include <gtest/gtest.h>
#include <cairn/blake3/hash.hpp>
#include <cairn/crypto/verify.hpp>
#include <cairn/schema/encoding/scale/encoder.hpp>
#include <cairn/schema/encoding/signing.hpp>
#include <cairn/schema/primitives.hpp>
#include <cairn/schema/push_result.hpp>
#include <cairn/schema/transaction.hpp>
#include <cairn/testing/common.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <sys/wait.h>

#ifndef CAIRN_TX_PATH
#define CAIRN_TX_PATH ""
#endif

namespace {

using encoder_t = cairn::schema::encoding::encoder<
    cairn::schema::encoding::scale_encoder_tag>;

constexpr auto kPrivateKey =
    "0707070707070707070707070707070707070707070707070707070707070707";
constexpr auto kSigner =
    "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

/// Exit code and the exact bytes written to stdout.
std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  auto read = size_t{0};
  while ((read = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    output.append(buffer.data(), read);
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_command(const std::string& tool, const std::string_view args) {
  auto command = shell_quote(tool) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

nlohmann::json run_json(const std::string& tool, const std::string_view args) {
  return nlohmann::json::parse(run_command(tool, args));
}

cairn::schema::transaction_t decode_tx(const nlohmann::json& body) {
  auto raw = cairn::schema::from_base64(
      body.at("params").at("tx").get<std::string>());
  auto encoder = encoder_t{};
  return encoder.decode<cairn::schema::transaction_t>(
      cairn::schema::make_bytes_view(raw));
}

cairn::schema::bytes_t binary_payload() {
  return cairn::schema::bytes_t{0x00, 0xFF, 0x0A, 0x41, 0x0D, 0x0A, 0x00};
}

std::string write_file(const cairn::schema::bytes_t& bytes) {
  auto path = cairn::testing::make_db_path("cairn_tx_input");
  auto file = std::ofstream{path, std::ios::binary};
  file.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  return path;
}

const cairn::schema::push_t& push_of(const cairn::schema::transaction_t& tx) {
  EXPECT_TRUE(std::holds_alternative<cairn::schema::push_t>(tx.payload));
  return std::get<cairn::schema::push_t>(tx.payload);
}

std::string tool_path() {
  return std::string{CAIRN_TX_PATH};
}

}  // namespace

TEST(cairn_tx, chain_id_hashes_chain_name) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto output = run_command(tool, "chain-id --chain-name cairn-devnet");
  EXPECT_EQ(output, cairn::schema::to_hex(cairn::blake3::hash(
                        std::string_view{"cairn-devnet"})));
}

TEST(cairn_tx, create_builds_signed_broadcast_body) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto body = run_json(
      tool, std::string{"create --chain-name cairn-devnet --nonce 3 "
                        "--write-access public --broadcast sync "
                        "--private-key "} +
                kPrivateKey);
  EXPECT_EQ(body.at("jsonrpc"), "2.0");
  EXPECT_EQ(body.at("method"), "broadcast_tx_sync");

  auto tx = decode_tx(body);
  EXPECT_EQ(tx.version, 1);
  EXPECT_EQ(tx.nonce, 3u);
  EXPECT_EQ(tx.chain_id,
            cairn::blake3::hash(std::string_view{"cairn-devnet"}));
  ASSERT_TRUE(std::holds_alternative<cairn::schema::ed25519_signer_id>(
      tx.signer));
  ASSERT_TRUE(
      std::holds_alternative<cairn::schema::create_accumulator_t>(tx.payload));
  EXPECT_EQ(std::get<cairn::schema::create_accumulator_t>(tx.payload)
                .write_access,
            cairn::schema::write_access_t::public_write);

  auto encoder = encoder_t{};
  auto message = cairn::schema::encoding::signing_bytes(encoder, tx);
  EXPECT_TRUE(cairn::crypto::verify_signature(
      cairn::schema::make_bytes_view(message), tx.signer, tx.signature));
}

TEST(cairn_tx, create_signs_with_secp256k1_key) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto tx = decode_tx(run_json(
      tool, std::string{"create --chain-name cairn-devnet --key-type "
                        "secp256k1 --private-key "} +
                kPrivateKey));
  ASSERT_TRUE(std::holds_alternative<cairn::schema::secp256k1_signer_id>(
      tx.signer));
  ASSERT_TRUE(std::holds_alternative<cairn::schema::secp256k1_signature_t>(
      tx.signature));

  auto encoder = encoder_t{};
  auto message = cairn::schema::encoding::signing_bytes(encoder, tx);
  EXPECT_TRUE(cairn::crypto::verify_signature(
      cairn::schema::make_bytes_view(message), tx.signer, tx.signature));

  auto [exit_code, output] = run_capture(
      shell_quote(tool) +
      " create --chain-name cairn-devnet --key-type rsa --private-key " +
      kPrivateKey + " 2>&1");
  EXPECT_NE(exit_code, 0) << output;
}

TEST(cairn_tx, push_defaults_to_commit_broadcast) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto body = run_json(
      tool, std::string{"push --chain-name cairn-devnet --address 4 "
                        "--payload hello --signer "} +
                kSigner);
  EXPECT_EQ(body.at("method"), "broadcast_tx_commit");

  auto tx = decode_tx(body);
  const auto& push = push_of(tx);
  EXPECT_EQ(push.address, 4u);
  EXPECT_EQ(push.payload,
            cairn::schema::make_bytes(std::string_view{"hello"}));
  EXPECT_EQ(tx.signer, cairn::schema::signer_id_t{
                           cairn::schema::make_hash32(std::string{kSigner})});
}

TEST(cairn_tx, push_reads_payload_from_input_file) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto path = write_file(binary_payload());
  auto args = std::string{"push --chain-name cairn-devnet --address 2 "
                          "--signer "} +
              kSigner;

  auto positional = decode_tx(run_json(tool, args + " " + shell_quote(path)));
  EXPECT_EQ(push_of(positional).payload, binary_payload());

  auto flagged =
      decode_tx(run_json(tool, args + " --input " + shell_quote(path)));
  EXPECT_EQ(push_of(flagged).payload, binary_payload());

  cairn::testing::remove_path(path);
}

TEST(cairn_tx, push_reads_payload_from_stdin) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto path = write_file(binary_payload());
  auto args = std::string{"push --chain-name cairn-devnet --address 2 "
                          "--signer "} +
              kSigner;

  auto implicit = decode_tx(run_json(tool, args + " < " + shell_quote(path)));
  EXPECT_EQ(push_of(implicit).payload, binary_payload());

  auto dash = decode_tx(run_json(tool, args + " - < " + shell_quote(path)));
  EXPECT_EQ(push_of(dash).payload, binary_payload());

  auto empty = decode_tx(run_json(tool, args + " < /dev/null"));
  EXPECT_TRUE(push_of(empty).payload.empty());

  cairn::testing::remove_path(path);
}

TEST(cairn_tx, push_rejects_unreadable_input) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto missing = cairn::testing::make_db_path("cairn_tx_missing");
  auto [exit_code, output] = run_capture(
      shell_quote(tool) + " push --chain-name cairn-devnet --address 2 " +
      "--signer " + kSigner + " " + shell_quote(missing) + " 2>&1");
  EXPECT_NE(exit_code, 0) << output;
}

TEST(cairn_tx, query_encodes_route_and_height) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto encoder = encoder_t{};

  auto leaf = run_json(
      tool, "query --path /accumulator/leaf --address 2 --index 5 --height 9");
  EXPECT_EQ(leaf.at("method"), "abci_query");
  EXPECT_EQ(leaf.at("params").at("path"), "/accumulator/leaf");
  EXPECT_EQ(leaf.at("params").at("height"), "9");
  EXPECT_EQ(leaf.at("params").at("prove"), false);
  EXPECT_EQ(leaf.at("params").at("data"),
            cairn::schema::to_hex(
                encoder.encode(std::tuple{uint64_t{2}, uint64_t{5}})));

  auto pending = run_json(
      tool, "query --path /accumulator/root --address 2 --height pending");
  EXPECT_EQ(pending.at("params").at("path"), "/pending/accumulator/root");
  EXPECT_EQ(pending.at("params").at("height"), "0");
}

TEST(cairn_tx, decode_prints_query_values_as_json) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto encoder = encoder_t{};

  auto count = cairn::schema::to_base64(encoder.encode(uint64_t{12}));
  EXPECT_EQ(run_json(tool, "decode --path /accumulator/count --value " + count),
            (nlohmann::json{{"count", 12}}));

  auto first = cairn::testing::make_hash(1);
  auto second = cairn::testing::make_hash(2);
  auto peaks = cairn::schema::to_base64(
      encoder.encode(std::vector<cairn::schema::hash32_t>{first, second}));
  EXPECT_EQ(run_json(tool, "decode --path /accumulator/peaks --value " + peaks),
            (nlohmann::json{
                {"peaks", nlohmann::json::array({cairn::testing::hex(first),
                                                 cairn::testing::hex(
                                                     second)})}}));

  auto root = cairn::schema::hash32_t{};
  root.fill(0xAB);
  auto encoded_root = cairn::schema::to_base64(encoder.encode(root));
  EXPECT_EQ(
      run_json(tool, "decode --path /accumulator/root --value " + encoded_root),
      (nlohmann::json{{"root", cairn::testing::hex(root)}}));

  auto receipt = cairn::schema::to_base64(encoder.encode(
      cairn::schema::push_result_t{.address = 3, .index = 7, .root = root}));
  EXPECT_EQ(run_json(tool, "decode --path push --value " + receipt),
            (nlohmann::json{{"address", 3},
                            {"index", 7},
                            {"root", cairn::testing::hex(root)}}));
}

TEST(cairn_tx, decode_writes_leaf_bytes_verbatim) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto encoder = encoder_t{};
  auto leaf = cairn::schema::to_base64(encoder.encode(binary_payload()));
  auto [exit_code, output] = run_capture(
      shell_quote(tool) + " decode --path /accumulator/leaf --value " + leaf);
  ASSERT_EQ(exit_code, 0) << output;
  EXPECT_EQ(cairn::schema::make_bytes(output), binary_payload());
}

TEST(cairn_tx, rejects_unknown_command) {
  auto tool = tool_path();
  if (tool.empty() || !std::filesystem::exists(tool)) {
    GTEST_SKIP() << "cairn_tx binary not available: " << tool;
  }
  auto [exit_code, output] =
      run_capture(shell_quote(tool) + " frobnicate 2>&1");
  EXPECT_NE(exit_code, 0) << output;
}
