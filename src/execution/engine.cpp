#include <spdlog/spdlog.h>
#include <algorithm>
#include <cairn/blake3/hash.hpp>
#include <cairn/common/critical.hpp>
#include <cairn/crypto/verify.hpp>
#include <cairn/execution/engine.hpp>
#include <cairn/mmr/access.hpp>
#include <cairn/mmr/hash.hpp>
#include <cairn/schema/encoding/signing.hpp>
#include <cairn/schema/key/engine_keys.hpp>
#include <iterator>
#include <limits>
#include <mutex>
#include <tuple>
#include <utility>

using namespace cairn::schema;

namespace {

using encoder_t = cairn::schema::encoding::encoder<
    cairn::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckTxCodespace = std::string_view{"cairn.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"cairn.finalize"};
constexpr auto kQueryCodespace = std::string_view{"cairn.query"};

cairn::schema::hash32_t fold_state_root(const cairn::schema::hash32_t& seed,
                                        const cairn::schema::bytes_view_t& tx,
                                        uint64_t height,
                                        uint64_t index) {
  auto material = cairn::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index}, material);
  return cairn::blake3::hash(
      cairn::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<cairn::schema::transaction_t> decode_transaction(
    const cairn::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<cairn::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_error(const transaction_error_code code,
                                std::string log,
                                std::string info,
                                const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

bool signature_matches_signer(const signer_id_t& signer,
                              const signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const ed25519_signer_id&) {
            return std::holds_alternative<ed25519_signature_t>(signature);
          },
          [&](const secp256k1_signer_id&) {
            return std::holds_alternative<secp256k1_signature_t>(signature);
          },
          [](const named_signer_t&) { return true; }},
      signer);
}

bool is_known_write_access(const write_access_t write_access) {
  return write_access == write_access_t::only_owner ||
         write_access == write_access_t::public_write;
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

}  // namespace

namespace cairn::execution {

engine::engine(encoder_t& encoder,
               cairn::storage::storage<cairn::storage::rocksdb_storage_tag>&
                   storage,
               bool require_strict_crypto,
               uint64_t max_payload_bytes)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto},
      max_payload_bytes_{max_payload_bytes},
      signature_verifier_{cairn::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine (strict crypto: {})",
               require_strict_crypto_);
  if (require_strict_crypto_ && !cairn::crypto::available()) {
    spdlog::warn(
        "OpenSSL lacks ed25519 or secp256k1; affected signatures will fail");
  }
  load_persisted_state();
  spdlog::info("Execution engine ready at height {} with {} accumulator(s)",
               last_committed_height_, registry_.size());
}

transaction_result_t engine::check_transaction(
    const cairn::schema::bytes_view_t& raw_tx) {
  auto lock = std::shared_lock{mutex_};
  return check_raw(raw_tx, kCheckTxCodespace);
}

transaction_result_t engine::process_proposal_transaction(
    const cairn::schema::bytes_view_t& raw_tx) {
  auto lock = std::shared_lock{mutex_};
  return check_raw(raw_tx, kCheckTxCodespace);
}

transaction_result_t engine::check_raw(const cairn::schema::bytes_view_t& raw_tx,
                                       std::string_view codespace) const {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error(transaction_error_code::invalid_transaction,
                      "invalid transaction", decode_error, codespace);
  }
  return validate_transaction(*maybe_tx, codespace, std::nullopt);
}

transaction_result_t engine::validate_transaction(
    const cairn::schema::transaction_t& tx,
    std::string_view codespace,
    std::optional<uint64_t> expected_nonce) const {
  if (tx.version != 1) {
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "unsupported transaction version", "expected version 1",
                      codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error(transaction_error_code::invalid_chain_id,
                      "invalid chain id",
                      "transaction chain_id does not match this chain",
                      codespace);
  }

  if (expected_nonce) {
    if (tx.nonce != *expected_nonce) {
      return make_error(transaction_error_code::invalid_nonce,
                        "invalid nonce",
                        fmt::format("expected nonce {}, got {}",
                                    *expected_nonce, tx.nonce),
                        codespace);
    }
  } else {
    auto last = last_nonce(tx.signer, false);
    if (tx.nonce <= last) {
      return make_error(
          transaction_error_code::invalid_nonce, "invalid nonce",
          fmt::format("nonce {} already used, next is {}", tx.nonce, last + 1),
          codespace);
    }
  }

  if (require_strict_crypto_) {
    if (!signature_matches_signer(tx.signer, tx.signature)) {
      return make_error(transaction_error_code::invalid_signature_type,
                        "invalid signature type",
                        "signature type does not match signer type",
                        codespace);
    }
    auto message = cairn::schema::encoding::signing_bytes(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(make_bytes_view(message), tx.signer,
                             tx.signature)) {
      return make_error(transaction_error_code::signature_verification_failed,
                        "signature verification failed",
                        "signature did not verify for signer", codespace);
    }
  }

  return validate_payload(tx, codespace);
}

transaction_result_t engine::validate_payload(
    const cairn::schema::transaction_t& tx,
    std::string_view codespace) const {
  return std::visit(
      overloaded{
          [&](const create_accumulator_t& operation) {
            if (operation.version != 1) {
              return make_error(
                  transaction_error_code::unsupported_transaction_version,
                  "unsupported payload version", "expected version 1",
                  codespace);
            }
            if (!is_known_write_access(operation.write_access)) {
              return make_error(
                  transaction_error_code::unsupported_write_access,
                  "unsupported write access",
                  fmt::format("write access {} is not defined",
                              static_cast<uint32_t>(operation.write_access)),
                  codespace);
            }
            return transaction_result_t{};
          },
          [&](const push_t& operation) {
            if (operation.version != 1) {
              return make_error(
                  transaction_error_code::unsupported_transaction_version,
                  "unsupported payload version", "expected version 1",
                  codespace);
            }
            if (operation.payload.size() > max_payload_bytes_) {
              return make_error(
                  transaction_error_code::payload_too_large,
                  "payload too large",
                  fmt::format("payload is {} bytes, limit is {}",
                              operation.payload.size(), max_payload_bytes_),
                  codespace);
            }
            const auto* accumulator = registry_.attach(operation.address);
            if (accumulator == nullptr) {
              return make_error(
                  transaction_error_code::accumulator_missing,
                  "accumulator not found",
                  fmt::format("no accumulator at address {}",
                              operation.address),
                  codespace);
            }
            const auto& state = accumulator->state();
            if (!cairn::mmr::can_write(tx.signer, state.write_access,
                                       state.owner)) {
              return make_error(
                  transaction_error_code::permission_denied,
                  "permission denied",
                  fmt::format("signer may not write to accumulator {}",
                              operation.address),
                  codespace);
            }
            return transaction_result_t{};
          }},
      tx.payload);
}

transaction_result_t engine::execute_operation(
    const cairn::schema::transaction_t& tx,
    uint64_t height) {
  auto result = transaction_result_t{};
  std::visit(
      overloaded{
          [&](const create_accumulator_t& operation) {
            auto address =
                registry_.create(operation.write_access, tx.signer, height);
            const auto* accumulator = registry_.attach(address);
            stage_row(cairn::schema::key::make_accumulator_key(address),
                      encoder_.encode(accumulator->state()));
            stage_row(make_bytes(cairn::schema::key::kNextAddressKey),
                      encoder_.encode(registry_.next_address()));
            result.data = encoder_.encode(address);
            result.events.push_back(transaction_event_t{
                .type = "accumulator_created",
                .attributes = {
                    make_attribute("address", std::to_string(address)),
                    make_attribute("write_access",
                                   std::string{to_string(
                                       operation.write_access)})}});
            spdlog::debug("Created accumulator {} at height {}", address,
                          height);
          },
          [&](const push_t& operation) {
            auto* accumulator = registry_.attach(operation.address);
            auto record = leaf_record_t{
                .payload = operation.payload,
                .commitment = cairn::mmr::hash_leaf(
                    make_bytes_view(operation.payload))};
            auto appended = accumulator->append(height, record.commitment);
            stage_row(cairn::schema::key::make_leaf_key(operation.address,
                                                        appended.index),
                      encoder_.encode(record));
            stage_row(
                cairn::schema::key::make_checkpoint_key(operation.address,
                                                        height),
                encoder_.encode(accumulator->snapshots().checkpoints().back()));
            result.data = encoder_.encode(push_result_t{
                .address = operation.address,
                .index = appended.index,
                .root = appended.root});
            result.events.push_back(transaction_event_t{
                .type = "accumulator_push",
                .attributes = {
                    make_attribute("address",
                                   std::to_string(operation.address)),
                    make_attribute("index", std::to_string(appended.index)),
                    make_attribute("root", to_hex(appended.root))}});
          }},
      tx.payload);
  return result;
}

block_result_t engine::finalize_block(
    uint64_t height,
    const std::vector<cairn::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (static_cast<int64_t>(height) <= last_committed_height_) {
    cairn::common::critical(
        "finalize_block height must advance past the committed height");
  }
  if (has_pending_block_ && static_cast<int64_t>(height) < pending_height_) {
    cairn::common::critical("finalize_block height moved backwards");
  }

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  auto state_root =
      has_pending_block_ ? pending_state_root_ : last_committed_state_root_;

  for (size_t i = 0; i < txs.size(); ++i) {
    const auto raw_tx = make_bytes_view(txs[i]);
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(raw_tx, decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(
          make_error(transaction_error_code::invalid_transaction,
                     "invalid transaction", decode_error, kFinalizeCodespace));
      continue;
    }

    auto expected_nonce = last_nonce(maybe_tx->signer, true) + 1;
    auto tx_result =
        validate_transaction(*maybe_tx, kFinalizeCodespace, expected_nonce);
    if (tx_result.code != 0) {
      spdlog::debug("Rejected tx {} at height {}: {}", i, height,
                    tx_result.info);
      result.tx_results.push_back(std::move(tx_result));
      continue;
    }

    tx_result = execute_operation(*maybe_tx, height);
    auto nonce_key =
        cairn::schema::key::make_nonce_key(encoder_, maybe_tx->signer);
    pending_nonces_[nonce_key] = maybe_tx->nonce;
    stage_row(std::move(nonce_key), encoder_.encode(maybe_tx->nonce));
    state_root = fold_state_root(state_root, raw_tx, height, i);
    result.tx_results.push_back(std::move(tx_result));
  }

  has_pending_block_ = true;
  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = state_root;
  result.state_root = state_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto result = commit_result_t{};
  if (!has_pending_block_) {
    spdlog::warn("Commit without a finalized block at height {}",
                 last_committed_height_);
    result.committed_height = last_committed_height_;
    result.state_root = last_committed_state_root_;
    return result;
  }

  auto rows = std::vector<cairn::storage::key_value_entry_t>{};
  rows.reserve(pending_rows_.size());
  for (auto& [key, value] : pending_rows_) {
    rows.emplace_back(key, std::move(value));
  }
  storage_.commit_block(
      rows, cairn::storage::committed_state{.height = pending_height_,
                                            .state_root = pending_state_root_});

  last_committed_height_ = pending_height_;
  last_committed_state_root_ = pending_state_root_;
  pending_rows_.clear();
  pending_nonces_.clear();
  has_pending_block_ = false;

  spdlog::info("Committed height {} ({} row(s))", last_committed_height_,
               rows.size());
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::shared_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(std::string_view path,
                             const cairn::schema::bytes_view_t& data,
                             const cairn::schema::query_height_t& height) const {
  auto lock = std::shared_lock{mutex_};
  auto resolved = resolve_height(height);
  if (!resolved) {
    return make_query_error(
        query_error_code::invalid_height,
        fmt::format("height {} is above the committed height {}",
                    height.height, last_committed_height_),
        data, last_committed_height_);
  }
  auto response_height = height.kind == query_height_kind_t::pending
                             ? (has_pending_block_ ? pending_height_
                                                   : last_committed_height_)
                             : static_cast<int64_t>(*resolved);

  if (path == "/engine/info") {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.height = last_committed_height_;
    result.codespace = std::string{kQueryCodespace};
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }

  if (path == "/state/nonce") {
    auto signer = encoder_.try_decode<signer_id_t>(data);
    if (!signer) {
      return make_query_error(query_error_code::invalid_query_data,
                              "invalid signer", data, response_height);
    }
    auto next = last_nonce(*signer, height.kind == query_height_kind_t::pending) + 1;
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.height = response_height;
    result.codespace = std::string{kQueryCodespace};
    result.value = encoder_.encode(next);
    return result;
  }

  auto result = query_accumulator(path, data, *resolved);
  result.height = response_height;
  return result;
}

query_result_t engine::query_accumulator(
    std::string_view path,
    const cairn::schema::bytes_view_t& data,
    uint64_t height) const {
  auto make_value = [&](cairn::schema::bytes_t value) {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = std::move(value);
    result.codespace = std::string{kQueryCodespace};
    return result;
  };

  if (path == "/accumulator/leaf") {
    auto request = encoder_.try_decode<std::tuple<address_t, uint64_t>>(data);
    if (!request) {
      return make_query_error(query_error_code::invalid_query_data,
                              "expected SCALE(address, index)", data, 0);
    }
    auto [address, index] = *request;
    const auto* accumulator = registry_.attach(address);
    if (accumulator == nullptr) {
      return make_query_error(query_error_code::accumulator_missing,
                              "accumulator not found", data, 0);
    }
    auto checkpoint = accumulator->at(height);
    if (index >= checkpoint.leaf_count) {
      return make_query_error(
          query_error_code::leaf_missing,
          fmt::format("leaf {} not present ({} leaves)", index,
                      checkpoint.leaf_count),
          data, 0);
    }
    auto record = load_leaf(address, index);
    if (!record) {
      cairn::common::critical(fmt::format(
          "leaf {} of accumulator {} missing from storage", index, address));
    }
    return make_value(encoder_.encode(record->payload));
  }

  if (path != "/accumulator/count" && path != "/accumulator/peaks" &&
      path != "/accumulator/root" && path != "/accumulator/info") {
    return make_query_error(query_error_code::unknown_path,
                            fmt::format("unknown query path '{}'", path), data,
                            0);
  }

  auto address = encoder_.try_decode<address_t>(data);
  if (!address) {
    return make_query_error(query_error_code::invalid_query_data,
                            "expected SCALE(address)", data, 0);
  }
  const auto* accumulator = registry_.attach(*address);
  if (accumulator == nullptr) {
    return make_query_error(query_error_code::accumulator_missing,
                            "accumulator not found", data, 0);
  }

  if (path == "/accumulator/info") {
    if (accumulator->state().created_height > height) {
      return make_query_error(
          query_error_code::accumulator_missing,
          fmt::format("accumulator {} created after height {}", *address,
                      height),
          data, 0);
    }
    return make_value(encoder_.encode(accumulator->state()));
  }

  // Heights before creation resolve to the empty checkpoint.
  auto checkpoint = accumulator->at(height);
  if (path == "/accumulator/count") {
    return make_value(encoder_.encode(checkpoint.leaf_count));
  }
  if (path == "/accumulator/peaks") {
    auto peaks = std::vector<hash32_t>{};
    peaks.reserve(checkpoint.peaks.size());
    std::ranges::transform(checkpoint.peaks, std::back_inserter(peaks),
                           [](const peak_t& peak) { return peak.hash; });
    return make_value(encoder_.encode(peaks));
  }
  return make_value(encoder_.encode(cairn::mmr::bag_peaks(checkpoint.peaks)));
}

std::optional<uint64_t> engine::resolve_height(
    const cairn::schema::query_height_t& height) const {
  switch (height.kind) {
    case query_height_kind_t::committed:
      return static_cast<uint64_t>(last_committed_height_);
    case query_height_kind_t::pending:
      return std::numeric_limits<uint64_t>::max();
    case query_height_kind_t::explicit_height:
      if (height.height > static_cast<uint64_t>(last_committed_height_)) {
        return std::nullopt;
      }
      return height.height;
  }
  return std::nullopt;
}

std::optional<cairn::schema::leaf_record_t> engine::load_leaf(
    cairn::schema::address_t address,
    uint64_t index) const {
  auto key = cairn::schema::key::make_leaf_key(address, index);
  auto pending = pending_rows_.find(key);
  if (pending != std::end(pending_rows_)) {
    return encoder_.try_decode<leaf_record_t>(make_bytes_view(pending->second));
  }
  return storage_.get<leaf_record_t>(encoder_, make_bytes_view(key));
}

uint64_t engine::last_nonce(const cairn::schema::signer_id_t& signer,
                            bool include_pending) const {
  auto key = cairn::schema::key::make_nonce_key(encoder_, signer);
  if (include_pending) {
    auto it = pending_nonces_.find(key);
    if (it != std::end(pending_nonces_)) {
      return it->second;
    }
  }
  return storage_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
}

void engine::set_chain_id(std::string_view chain_name) {
  auto lock = std::scoped_lock{mutex_};
  chain_id_ = cairn::blake3::hash(chain_name);
  auto key = make_bytes(cairn::schema::key::kChainIdKey);
  storage_.put(encoder_, make_bytes_view(key), chain_id_);
  spdlog::info("Chain id set from '{}': {}", chain_name, to_hex(chain_id_));
}

cairn::schema::hash32_t engine::chain_id() const {
  auto lock = std::shared_lock{mutex_};
  return chain_id_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier; strict crypto disabled");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

void engine::stage_row(cairn::schema::bytes_t key,
                       cairn::schema::bytes_t value) {
  pending_rows_.insert_or_assign(std::move(key), std::move(value));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  auto committed = storage_.load_committed_state();
  if (committed) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }

  auto chain_key = make_bytes(cairn::schema::key::kChainIdKey);
  auto chain_id = storage_.get<hash32_t>(encoder_, make_bytes_view(chain_key));
  if (chain_id) {
    chain_id_ = *chain_id;
  }

  for (const auto& [key, value] : storage_.list_by_prefix(make_bytes_view(
           make_bytes(cairn::schema::key::kAccumulatorKeyPrefix)))) {
    auto address = cairn::schema::key::parse_accumulator_key(key);
    auto state = encoder_.try_decode<accumulator_state_t>(value);
    if (!address || !state || state->address != *address) {
      cairn::common::critical("corrupt accumulator row in storage");
    }
    if (registry_.adopt(*state) == nullptr) {
      cairn::common::critical("accumulator addresses in storage have gaps");
    }
  }

  for (const auto& [key, value] : storage_.list_by_prefix(make_bytes_view(
           make_bytes(cairn::schema::key::kCheckpointKeyPrefix)))) {
    auto id = cairn::schema::key::parse_checkpoint_key(key);
    auto checkpoint = encoder_.try_decode<checkpoint_t>(value);
    if (!id || !checkpoint || checkpoint->height != id->second) {
      cairn::common::critical("corrupt checkpoint row in storage");
    }
    auto* accumulator = registry_.attach(id->first);
    if (accumulator == nullptr ||
        !accumulator->restore_checkpoint(std::move(*checkpoint))) {
      cairn::common::critical("checkpoint row out of order");
    }
  }

  for (auto address = address_t{1}; address < registry_.next_address();
       ++address) {
    auto* accumulator = registry_.attach(address);
    if (!accumulator->finish_restore()) {
      cairn::common::critical(
          fmt::format("accumulator {} checkpoints do not restore", address));
    }
    // The leaf rows must end exactly at the latest checkpoint's count.
    auto count = accumulator->range().count();
    if (count > 0) {
      auto last = load_leaf(address, count - 1);
      if (!last || cairn::mmr::hash_leaf(make_bytes_view(last->payload)) !=
                       last->commitment) {
        cairn::common::critical(fmt::format(
            "accumulator {} last leaf row is missing or corrupt", address));
      }
    }
    if (load_leaf(address, count)) {
      cairn::common::critical(fmt::format(
          "accumulator {} has leaf rows past its checkpoints", address));
    }
  }

  auto next_key = make_bytes(cairn::schema::key::kNextAddressKey);
  auto next_address = storage_.get<uint64_t>(encoder_, make_bytes_view(next_key));
  if (next_address && *next_address != registry_.next_address()) {
    cairn::common::critical("stored next address disagrees with accumulators");
  }

  spdlog::info("Loaded {} accumulator(s) at committed height {}",
               registry_.size(), last_committed_height_);
}

}  // namespace cairn::execution
