#pragma once

#include <tendermint/abci/types.grpc.pb.h>
#include <cairn/execution/engine.hpp>
#include <cairn/schema/query_height.hpp>
#include <string>
#include <utility>

namespace cairn::abci {

/// Path prefix selecting the pending (finalized, not committed) state.
inline constexpr auto kPendingQueryPrefix = std::string_view{"/pending"};

/// Map an ABCI query onto an engine route and height. `height == 0` selects
/// the committed state, `height > 0` an explicit block height, and a
/// `/pending` prefix on the path the pending state.
std::pair<std::string, cairn::schema::query_height_t> resolve_query_route(
    const std::string& path,
    int64_t height);

/// ABCI callback listener used by CometBFT to drive the accumulator engine.
///
/// Quick reference (ABCI++):
/// - Echo/Flush: liveness and flush barriers.
/// - Info/InitChain: handshake, chain id and initial state root exchange.
/// - CheckTx: mempool admission checks; no state mutation.
/// - PrepareProposal: proposer-side tx selection/filtering.
/// - ProcessProposal: validator-side proposal accept/reject decision.
/// - FinalizeBlock: execute block and return tx results + app_hash(state_root).
/// - Commit: persist finalized state.
/// - Vote extensions: unused; empty extension, always accepted.
struct listener final : public tendermint::abci::ABCI::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(cairn::execution::engine& engine);

  /// Echo request/response passthrough used for connectivity checks.
  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestEcho* request,
      tendermint::abci::ResponseEcho* response) override final;

  /// Flush barrier for request ordering; no app state changes.
  virtual grpc::ServerUnaryReactor* Flush(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestFlush* request,
      tendermint::abci::ResponseFlush* response) override final;

  /// Return app metadata used during node/app handshake.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestInfo* request,
      tendermint::abci::ResponseInfo* response) override final;

  /// Mempool admission check for a single tx (decode/validate only).
  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestCheckTx* request,
      tendermint::abci::ResponseCheckTx* response) override final;

  /// Height-scoped accumulator read.
  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestQuery* request,
      tendermint::abci::ResponseQuery* response) override final;

  /// Persist finalized state after FinalizeBlock.
  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestCommit* request,
      tendermint::abci::ResponseCommit* response) override final;

  /// Install the chain id at genesis handshake.
  virtual grpc::ServerUnaryReactor* InitChain(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestInitChain* request,
      tendermint::abci::ResponseInitChain* response) override final;

  /// Proposer-side tx list preparation under max-bytes and validity checks.
  virtual grpc::ServerUnaryReactor* PrepareProposal(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestPrepareProposal* request,
      tendermint::abci::ResponsePrepareProposal* response) override final;

  /// Validator-side proposal validation; returns ACCEPT or REJECT.
  virtual grpc::ServerUnaryReactor* ProcessProposal(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestProcessProposal* request,
      tendermint::abci::ResponseProcessProposal* response) override final;

  virtual grpc::ServerUnaryReactor* ExtendVote(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestExtendVote* request,
      tendermint::abci::ResponseExtendVote* response) override final;

  virtual grpc::ServerUnaryReactor* VerifyVoteExtension(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestVerifyVoteExtension* request,
      tendermint::abci::ResponseVerifyVoteExtension* response) override final;

  /// Execute ordered block transactions and return tx results + app_hash.
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const tendermint::abci::RequestFinalizeBlock* request,
      tendermint::abci::ResponseFinalizeBlock* response) override final;

  cairn::execution::engine& execution_engine_;
};

}  // namespace cairn::abci
