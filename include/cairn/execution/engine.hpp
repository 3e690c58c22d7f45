#pragma once

#include <cairn/execution/signature_verifier.hpp>
#include <cairn/mmr/registry.hpp>
#include <cairn/schema/app_info.hpp>
#include <cairn/schema/block_result.hpp>
#include <cairn/schema/commit_result.hpp>
#include <cairn/schema/encoding/scale/encoder.hpp>
#include <cairn/schema/leaf_record.hpp>
#include <cairn/schema/primitives.hpp>
#include <cairn/schema/query_height.hpp>
#include <cairn/schema/query_result.hpp>
#include <cairn/schema/transaction.hpp>
#include <cairn/schema/transaction_error_code.hpp>
#include <cairn/schema/transaction_result.hpp>
#include <cairn/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace cairn::execution {

inline constexpr uint64_t kDefaultMaxPayloadBytes{1024 * 1024};

/// Deterministic accumulator state machine used by the ABCI server.
///
/// The engine validates signed transactions, applies them block by block to
/// the accumulator registry, persists committed rows to RocksDB and answers
/// height-scoped queries. Rows produced by a finalized block stay in memory
/// until `commit` writes them in one batch.
class engine final {
 public:
  /// Construct the engine and reload committed state from `storage`.
  ///
  /// `require_strict_crypto` enables signature verification; when false,
  /// signatures are not checked at all.
  explicit engine(
      cairn::schema::encoding::encoder<
          cairn::schema::encoding::scale_encoder_tag>& encoder,
      cairn::storage::storage<cairn::storage::rocksdb_storage_tag>& storage,
      bool require_strict_crypto = true,
      uint64_t max_payload_bytes = kDefaultMaxPayloadBytes);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Decode and validation only; never mutates state. The nonce only has to
  /// be newer than the committed one.
  cairn::schema::transaction_result_t check_transaction(
      const cairn::schema::bytes_view_t& raw_tx);

  /// Validate a transaction of a proposed block. Same pipeline as CheckTx.
  cairn::schema::transaction_result_t process_proposal_transaction(
      const cairn::schema::bytes_view_t& raw_tx);

  /// Execute a block and compute its resulting state_root.
  ///
  /// Transactions are processed in order; per-tx results are returned even on
  /// failures. Each signer's nonce must advance by exactly one.
  cairn::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<cairn::schema::bytes_t>& txs);

  /// Persist the finalized block (rows, height and state_root) atomically.
  cairn::schema::commit_result_t commit();

  /// Application metadata (latest committed height and state_root).
  cairn::schema::app_info_t info() const;

  /// Execute a read-path query by route at the requested height.
  cairn::schema::query_result_t query(
      std::string_view path,
      const cairn::schema::bytes_view_t& data,
      const cairn::schema::query_height_t& height =
          cairn::schema::query_height_t::committed()) const;

  /// Install the chain id, BLAKE3 of the CometBFT chain-id string, and
  /// persist it.
  void set_chain_id(std::string_view chain_name);

  cairn::schema::hash32_t chain_id() const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  /// Validate envelope, signature, nonce and the payload against current
  /// state. When `expected_nonce` is set the nonce must match it exactly.
  cairn::schema::transaction_result_t validate_transaction(
      const cairn::schema::transaction_t& tx,
      std::string_view codespace,
      std::optional<uint64_t> expected_nonce) const;

  cairn::schema::transaction_result_t validate_payload(
      const cairn::schema::transaction_t& tx,
      std::string_view codespace) const;

  cairn::schema::transaction_result_t check_raw(
      const cairn::schema::bytes_view_t& raw_tx,
      std::string_view codespace) const;

  /// Apply a validated transaction at block `height`.
  cairn::schema::transaction_result_t execute_operation(
      const cairn::schema::transaction_t& tx,
      uint64_t height);

  /// Leaf row from the block being finalized, else from storage.
  std::optional<cairn::schema::leaf_record_t> load_leaf(
      cairn::schema::address_t address,
      uint64_t index) const;

  /// Last nonce used by `signer`, including the block being finalized when
  /// `include_pending` is set.
  uint64_t last_nonce(const cairn::schema::signer_id_t& signer,
                      bool include_pending) const;

  /// Map a query height onto a block height; nothing when out of range.
  std::optional<uint64_t> resolve_height(
      const cairn::schema::query_height_t& height) const;

  cairn::schema::query_result_t query_accumulator(
      std::string_view path,
      const cairn::schema::bytes_view_t& data,
      uint64_t height) const;

  void stage_row(cairn::schema::bytes_t key, cairn::schema::bytes_t value);

  /// Rebuild registry and committed metadata from storage at startup.
  void load_persisted_state();

  mutable std::shared_mutex mutex_;
  cairn::schema::encoding::encoder<cairn::schema::encoding::scale_encoder_tag>&
      encoder_;
  cairn::storage::storage<cairn::storage::rocksdb_storage_tag>& storage_;
  cairn::mmr::registry registry_;
  std::map<cairn::schema::bytes_t, cairn::schema::bytes_t> pending_rows_;
  std::map<cairn::schema::bytes_t, uint64_t> pending_nonces_;
  int64_t last_committed_height_{};
  cairn::schema::hash32_t last_committed_state_root_{};
  bool has_pending_block_{false};
  int64_t pending_height_{};
  cairn::schema::hash32_t pending_state_root_{};
  cairn::schema::hash32_t chain_id_{};
  bool require_strict_crypto_{true};
  uint64_t max_payload_bytes_{kDefaultMaxPayloadBytes};
  signature_verifier_t signature_verifier_;
};

}  // namespace cairn::execution
