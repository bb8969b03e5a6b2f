// SolX Trading SDK - Geyser Stream Implementation

#include <solx/trading/streams/geyser.hpp>
#include <solx/trading/errors.hpp>
#include "geyser.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <map>

namespace solx::trading {

namespace storage = solana::storage::ConfirmedBlock;

namespace {

constexpr int MAX_RECEIVE_MESSAGE_BYTES = 64 * 1024 * 1024;

struct Target {
    std::string address;
    bool tls = false;
};

Target parse_target(const std::string& endpoint) {
    Target target;
    std::string rest = endpoint;
    if (rest.rfind("https://", 0) == 0) {
        target.tls = true;
        rest = rest.substr(8);
    } else if (rest.rfind("http://", 0) == 0) {
        rest = rest.substr(7);
    }
    while (!rest.empty() && rest.back() == '/') rest.pop_back();
    if (target.tls && rest.find(':') == std::string::npos) rest += ":443";
    target.address = rest;
    return target;
}

geyser::CommitmentLevel to_proto(Commitment commitment) {
    switch (commitment) {
        case Commitment::Processed: return geyser::PROCESSED;
        case Commitment::Confirmed: return geyser::CONFIRMED;
        case Commitment::Finalized: return geyser::FINALIZED;
    }
    return geyser::CONFIRMED;
}

Pubkey key_from(const std::string& raw) {
    if (raw.size() != Pubkey::SIZE) return Pubkey{};
    return Pubkey::from_bytes(reinterpret_cast<const uint8_t*>(raw.data()));
}

Pubkey key_at(const std::vector<Pubkey>& keys, uint32_t index) {
    return index < keys.size() ? keys[index] : Pubkey{};
}

std::vector<Pubkey> resolve(const std::vector<Pubkey>& keys, const std::string& indexes) {
    std::vector<Pubkey> out;
    out.reserve(indexes.size());
    for (unsigned char idx : indexes) {
        out.push_back(key_at(keys, idx));
    }
    return out;
}

Bytes bytes_of(const std::string& raw) {
    return Bytes(raw.begin(), raw.end());
}

// Static keys, then loaded writable, then loaded readonly
std::optional<TransactionView> to_view(const geyser::SubscribeUpdateTransaction& update) {
    const auto& info = update.transaction();
    if (info.signature().size() != Signature::SIZE || !info.has_transaction()) {
        return std::nullopt;
    }
    const auto& message = info.transaction().message();
    const auto& meta = info.meta();

    TransactionView view;
    view.signature = Signature::from_bytes(reinterpret_cast<const uint8_t*>(info.signature().data()));
    view.slot = update.slot();
    view.confirmed = true;

    std::vector<Pubkey> keys;
    keys.reserve(message.account_keys_size() + meta.loaded_writable_addresses_size() +
                 meta.loaded_readonly_addresses_size());
    for (const auto& k : message.account_keys()) keys.push_back(key_from(k));
    for (const auto& k : meta.loaded_writable_addresses()) keys.push_back(key_from(k));
    for (const auto& k : meta.loaded_readonly_addresses()) keys.push_back(key_from(k));

    std::map<uint32_t, const storage::InnerInstructions*> inner_by_index;
    for (const auto& group : meta.inner_instructions()) {
        inner_by_index[group.index()] = &group;
    }

    for (int i = 0; i < message.instructions_size(); ++i) {
        const auto& ix = message.instructions(i);
        const auto index = static_cast<uint32_t>(i);

        InstructionView outer;
        outer.program_id = key_at(keys, ix.program_id_index());
        outer.accounts = resolve(keys, ix.accounts());
        outer.data = bytes_of(ix.data());
        outer.index = index;
        view.instructions.push_back(std::move(outer));

        auto it = inner_by_index.find(index);
        if (it == inner_by_index.end()) continue;
        for (const auto& inner_ix : it->second->instructions()) {
            InstructionView inner;
            inner.program_id = key_at(keys, inner_ix.program_id_index());
            inner.accounts = resolve(keys, inner_ix.accounts());
            inner.data = bytes_of(inner_ix.data());
            inner.index = index;
            inner.inner = true;
            view.instructions.push_back(std::move(inner));
        }
    }

    view.logs.assign(meta.log_messages().begin(), meta.log_messages().end());
    return view;
}

geyser::SubscribeRequest make_request(const SubscribeOptions& options,
                                      const std::vector<Pubkey>& accounts) {
    geyser::SubscribeRequest request;
    auto& filter = (*request.mutable_transactions())["solx"];
    filter.set_vote(false);
    filter.set_failed(false);
    for (const auto& key : accounts) {
        filter.add_account_include(key.to_base58());
    }
    for (const auto& key : options.account_required) {
        filter.add_account_required(key.to_base58());
    }
    if (options.signature) {
        filter.set_signature(options.signature->to_base58());
    }
    request.set_commitment(to_proto(options.commitment));
    return request;
}

}  // namespace

GeyserClient::GeyserClient(std::string endpoint, std::optional<std::string> x_token, BackoffPolicy backoff)
    : StreamClient("geyser", backoff),
      endpoint_(std::move(endpoint)),
      x_token_(std::move(x_token)) {
    if (endpoint_.empty()) {
        throw ValidationError("geyser endpoint is empty");
    }
}

std::unique_ptr<GeyserClient> GeyserClient::from_config(const StreamConfig& config) {
    return std::make_unique<GeyserClient>(config.geyser_url, config.geyser_token,
                                          BackoffPolicy::from(config));
}

void GeyserClient::run_session(const SubscribeOptions& options, StreamSession& session) {
    const Target target = parse_target(endpoint_);
    auto credentials = target.tls ? grpc::SslCredentials(grpc::SslCredentialsOptions())
                                  : grpc::InsecureChannelCredentials();
    grpc::ChannelArguments args;
    args.SetMaxReceiveMessageSize(MAX_RECEIVE_MESSAGE_BYTES);
    auto channel = grpc::CreateCustomChannel(target.address, credentials, args);
    auto stub = geyser::Geyser::NewStub(channel);

    grpc::ClientContext context;
    if (x_token_) {
        context.AddMetadata("x-token", *x_token_);
    }
    StreamSession::CancelScope cancel_scope(session, [&context]() { context.TryCancel(); });

    const auto accounts = account_filter(options);
    auto stream = stub->Subscribe(&context);
    if (!stream->Write(make_request(options, accounts))) {
        auto status = stream->Finish();
        throw NetworkError("geyser: subscribe request rejected: " + status.error_message(), endpoint_);
    }
    spdlog::info("geyser: subscribed at {} for {} accounts", endpoint_, accounts.size());

    geyser::SubscribeUpdate update;
    try {
        while (stream->Read(&update)) {
            switch (update.update_oneof_case()) {
                case geyser::SubscribeUpdate::kTransaction: {
                    // Pings alone do not make a session live
                    session.mark_live();
                    if (auto view = to_view(update.transaction())) {
                        session.deliver(*view);
                    }
                    break;
                }
                case geyser::SubscribeUpdate::kPing: {
                    geyser::SubscribeRequest pong;
                    pong.mutable_ping()->set_id(1);
                    if (!stream->Write(pong)) {
                        spdlog::warn("geyser: failed to answer server ping");
                    }
                    break;
                }
                default:
                    break;
            }
        }
    } catch (...) {
        context.TryCancel();
        auto status = stream->Finish();
        spdlog::debug("geyser: stream closed after callback failure ({})", status.error_message());
        throw;
    }

    auto status = stream->Finish();
    if (session.cancelled()) return;
    if (!status.ok()) {
        throw NetworkError("geyser: " + status.error_message(), endpoint_);
    }
}

}  // namespace solx::trading
