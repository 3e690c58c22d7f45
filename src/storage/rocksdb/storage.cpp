#include <cairn/common/critical.hpp>
#include <cairn/schema/encoding/scale/encoder.hpp>
#include <cairn/schema/key/engine_keys.hpp>
#include <cairn/storage/rocksdb/storage.hpp>

#include <tuple>

namespace cairn::storage {

namespace {

using encoder_t = cairn::schema::encoding::scale_encoder_t;

cairn::schema::bytes_t encode_committed_state(const committed_state& state) {
  return encoder_t{}.encode(std::tuple{state.height, state.state_root});
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    cairn::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    cairn::common::critical("RocksDB database is not initialized");
  }
  auto raw = std::string{};
  auto status = database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      std::string{cairn::schema::key::kCommittedHeightKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load committed state: {}", status.ToString());
    cairn::common::critical("failed to load committed state");
  }

  auto decoded =
      encoder_t{}.try_decode<std::tuple<int64_t, cairn::schema::hash32_t>>(
          cairn::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded.has_value()) {
    cairn::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const cairn::schema::bytes_view_t& prefix) const {
  if (!database) {
    cairn::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB prefix scan failed: {}",
                  iterator->status().ToString());
    cairn::common::critical("failed to scan RocksDB prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit_block(
    const std::vector<key_value_entry_t>& rows,
    const committed_state& state) const {
  if (!database) {
    cairn::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : rows) {
    auto status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      cairn::common::critical("failed staging row in commit batch");
    }
  }
  auto encoded_state = encode_committed_state(state);
  auto state_status =
      batch.Put(ROCKSDB_NAMESPACE::Slice{
                    cairn::schema::key::kCommittedHeightKey.data(),
                    cairn::schema::key::kCommittedHeightKey.size()},
                detail::to_slice(encoded_state));
  if (!state_status.ok()) {
    cairn::common::critical("failed staging committed height");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit block {}: {}", state.height,
                  status.ToString());
    cairn::common::critical("failed to commit block batch");
  }
}

}  // namespace cairn::storage
