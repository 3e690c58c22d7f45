#pragma once

#include <cairn/execution/engine.hpp>
#include <cairn/schema/primitives.hpp>
#include <cairn/storage/rocksdb/storage.hpp>
#include <cairn/testing/common.hpp>
#include <cairn/testing/execution_harness.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace cairn::testing {

inline constexpr auto kTestChainName = std::string_view{"cairn-test-chain"};

class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = false,
                             const bool install_allow_all_verifier = true)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{cairn::storage::make_storage<
            cairn::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, strict_crypto} {
    engine_.set_chain_id(kTestChainName);
    if (install_allow_all_verifier) {
      engine_.set_signature_verifier(allow_all_verifier());
    }
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  cairn::storage::storage<cairn::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  cairn::execution::engine& engine() { return engine_; }
  const cairn::execution::engine& engine() const { return engine_; }

  cairn::schema::hash32_t chain_id() {
    if (!chain_id_.has_value()) {
      chain_id_ = chain_id_from_engine(engine_);
    }
    return *chain_id_;
  }

  static cairn::execution::signature_verifier_t allow_all_verifier() {
    return [](const cairn::schema::bytes_view_t&,
              const cairn::schema::signer_id_t&,
              const cairn::schema::signature_t&) { return true; };
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  cairn::storage::storage<cairn::storage::rocksdb_storage_tag> storage_;
  cairn::execution::engine engine_;
  std::optional<cairn::schema::hash32_t> chain_id_{std::nullopt};
};

}  // namespace cairn::testing
