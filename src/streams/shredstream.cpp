// SolX Trading SDK - ShredStream Implementation

#include <solx/trading/streams/shredstream.hpp>
#include <solx/trading/borsh.hpp>
#include <solx/trading/errors.hpp>
#include <solx/trading/transaction.hpp>
#include "shredstream.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace solx::trading {

namespace {

constexpr int MAX_RECEIVE_MESSAGE_BYTES = 64 * 1024 * 1024;
// An entry header is num_hashes (u64) + hash (32) + transaction count (u64)
constexpr std::size_t ENTRY_HEADER_SIZE = 8 + 32 + 8;

std::string strip_scheme(std::string endpoint) {
    for (const char* scheme : {"http://", "https://"}) {
        std::string prefix(scheme);
        if (endpoint.rfind(prefix, 0) == 0) {
            endpoint = endpoint.substr(prefix.size());
            break;
        }
    }
    while (!endpoint.empty() && endpoint.back() == '/') endpoint.pop_back();
    return endpoint;
}

bool touches(const Message& message, const std::vector<Pubkey>& programs) {
    for (const auto& key : message.account_keys()) {
        if (std::find(programs.begin(), programs.end(), key) != programs.end()) return true;
    }
    return false;
}

TransactionView to_view(const ParsedTransaction& tx, uint64_t slot) {
    const auto& message = tx.message;

    TransactionView view;
    if (!tx.signatures.empty()) view.signature = tx.signatures.front();
    view.slot = slot;
    view.confirmed = false;

    const auto& compiled = message.instructions();
    for (std::size_t i = 0; i < compiled.size(); ++i) {
        InstructionView ix;
        ix.program_id = message.static_key(compiled[i].program_id_index).value_or(Pubkey{});
        ix.accounts.reserve(compiled[i].accounts.size());
        for (uint8_t idx : compiled[i].accounts) {
            ix.accounts.push_back(message.static_key(idx).value_or(Pubkey{}));
        }
        ix.data = compiled[i].data;
        ix.index = static_cast<uint32_t>(i);
        view.instructions.push_back(std::move(ix));
    }
    return view;
}

}  // namespace

ShredStreamClient::ShredStreamClient(std::string endpoint, BackoffPolicy backoff)
    : StreamClient("shredstream", backoff), endpoint_(std::move(endpoint)) {
    if (endpoint_.empty()) {
        throw ValidationError("shredstream endpoint is empty");
    }
}

std::unique_ptr<ShredStreamClient> ShredStreamClient::from_config(const StreamConfig& config) {
    return std::make_unique<ShredStreamClient>(config.shredstream_url, BackoffPolicy::from(config));
}

std::optional<std::vector<TransactionView>> ShredStreamClient::parse_entries(
    const uint8_t* data, std::size_t size, uint64_t slot, const std::vector<Pubkey>& programs) {
    BorshReader reader(data, size);
    std::vector<TransactionView> out;

    const uint64_t entries = reader.u64();
    if (!reader.ok() || entries > reader.remaining() / ENTRY_HEADER_SIZE) return std::nullopt;

    for (uint64_t e = 0; e < entries; ++e) {
        reader.skip(8 + 32);  // num_hashes, hash
        const uint64_t count = reader.u64();
        if (!reader.ok() || count > reader.remaining()) return std::nullopt;

        for (uint64_t t = 0; t < count; ++t) {
            auto tx = ParsedTransaction::parse(reader);
            if (!tx) return std::nullopt;
            if (touches(tx->message, programs)) {
                out.push_back(to_view(*tx, slot));
            }
        }
    }
    return out;
}

void ShredStreamClient::run_session(const SubscribeOptions& options, StreamSession& session) {
    grpc::ChannelArguments args;
    args.SetMaxReceiveMessageSize(MAX_RECEIVE_MESSAGE_BYTES);
    auto channel = grpc::CreateCustomChannel(strip_scheme(endpoint_), grpc::InsecureChannelCredentials(), args);
    auto stub = shredstream::ShredstreamProxy::NewStub(channel);

    grpc::ClientContext context;
    StreamSession::CancelScope cancel_scope(session, [&context]() { context.TryCancel(); });

    const auto programs = account_filter(options);
    shredstream::SubscribeEntriesRequest request;
    auto reader = stub->SubscribeEntries(&context, request);
    spdlog::info("shredstream: subscribed at {}", endpoint_);

    shredstream::Entry entry;
    try {
        while (reader->Read(&entry)) {
            session.mark_live();
            const auto& raw = entry.entries();
            auto views = parse_entries(reinterpret_cast<const uint8_t*>(raw.data()), raw.size(),
                                       entry.slot(), programs);
            if (!views) {
                spdlog::debug("shredstream: malformed entry batch in slot {} ({} bytes)",
                              entry.slot(), raw.size());
                continue;
            }
            for (const auto& view : *views) {
                session.deliver(view);
            }
        }
    } catch (...) {
        context.TryCancel();
        auto status = reader->Finish();
        spdlog::debug("shredstream: stream closed after callback failure ({})", status.error_message());
        throw;
    }

    auto status = reader->Finish();
    if (session.cancelled()) return;
    if (!status.ok()) {
        throw NetworkError("shredstream: " + status.error_message(), endpoint_);
    }
}

}  // namespace solx::trading
