// SolX Trading SDK - Transactions Implementation

#include <solx/trading/transaction.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/errors.hpp>
#include <unordered_map>

namespace solx::trading {

namespace {

constexpr uint8_t VERSION_PREFIX = 0x80;
constexpr std::size_t MAX_ACCOUNT_KEYS = 256;

struct KeyMeta {
    Pubkey key;
    bool signer = false;
    bool writable = false;
    bool invoked = false;
};

// Collects unique keys in first-seen order, payer first
class KeyCollector {
public:
    explicit KeyCollector(const Pubkey& payer) { upsert(payer, true, true, false); }

    void add(const Instruction& ix) {
        upsert(ix.program_id, false, false, true);
        for (const auto& meta : ix.accounts) {
            upsert(meta.pubkey, meta.is_signer, meta.is_writable, false);
        }
    }

    [[nodiscard]] const std::vector<KeyMeta>& keys() const noexcept { return keys_; }

private:
    void upsert(const Pubkey& key, bool signer, bool writable, bool invoked) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            index_.emplace(key, keys_.size());
            keys_.push_back(KeyMeta{key, signer, writable, invoked});
            return;
        }
        auto& meta = keys_[it->second];
        meta.signer = meta.signer || signer;
        meta.writable = meta.writable || writable;
        meta.invoked = meta.invoked || invoked;
    }

    std::vector<KeyMeta> keys_;
    std::unordered_map<Pubkey, std::size_t, PubkeyHasher> index_;
};

void write_bytes(BorshWriter& w, const std::vector<uint8_t>& bytes) {
    w.compact_u16(static_cast<uint16_t>(bytes.size()));
    w.raw(bytes.data(), bytes.size());
}

}  // namespace

// =============================================================================
// Message compilation
// =============================================================================

Message Message::compile_legacy(const Pubkey& payer,
                                const std::vector<Instruction>& instructions,
                                const Hash& recent_blockhash) {
    return compile(payer, instructions, recent_blockhash, {}, false);
}

Message Message::compile_v0(const Pubkey& payer,
                            const std::vector<Instruction>& instructions,
                            const Hash& recent_blockhash,
                            const std::vector<AddressLookupTable>& tables) {
    return compile(payer, instructions, recent_blockhash, tables, true);
}

Message Message::compile(const Pubkey& payer,
                         const std::vector<Instruction>& instructions,
                         const Hash& recent_blockhash,
                         const std::vector<AddressLookupTable>& tables,
                         bool versioned) {
    if (instructions.empty()) {
        throw ValidationError("cannot compile a message without instructions");
    }

    KeyCollector collector(payer);
    for (const auto& ix : instructions) collector.add(ix);
    const auto& keys = collector.keys();

    // Move lookup-eligible keys into the first table that holds them
    Message msg;
    msg.versioned_ = versioned;
    msg.recent_blockhash_ = recent_blockhash;

    std::vector<bool> loaded(keys.size(), false);
    std::vector<Pubkey> loaded_writable;
    std::vector<Pubkey> loaded_readonly;
    for (const auto& table : tables) {
        MessageAddressTableLookup lookup;
        lookup.account_key = table.key;
        std::vector<Pubkey> table_writable;
        std::vector<Pubkey> table_readonly;
        for (std::size_t i = 0; i < keys.size(); ++i) {
            const auto& meta = keys[i];
            if (loaded[i] || meta.signer || meta.invoked) continue;
            for (std::size_t j = 0; j < table.addresses.size() && j < MAX_ACCOUNT_KEYS; ++j) {
                if (table.addresses[j] != meta.key) continue;
                loaded[i] = true;
                if (meta.writable) {
                    lookup.writable_indexes.push_back(static_cast<uint8_t>(j));
                    table_writable.push_back(meta.key);
                } else {
                    lookup.readonly_indexes.push_back(static_cast<uint8_t>(j));
                    table_readonly.push_back(meta.key);
                }
                break;
            }
        }
        if (lookup.writable_indexes.empty() && lookup.readonly_indexes.empty()) continue;
        loaded_writable.insert(loaded_writable.end(), table_writable.begin(), table_writable.end());
        loaded_readonly.insert(loaded_readonly.end(), table_readonly.begin(), table_readonly.end());
        msg.lookups_.push_back(std::move(lookup));
    }

    // Static keys: writable signers, readonly signers, writable, readonly
    auto take_group = [&](bool signer, bool writable) {
        for (std::size_t i = 0; i < keys.size(); ++i) {
            const auto& meta = keys[i];
            if (loaded[i] || meta.signer != signer || meta.writable != writable) continue;
            msg.account_keys_.push_back(meta.key);
        }
    };
    take_group(true, true);
    take_group(true, false);
    take_group(false, true);
    take_group(false, false);

    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (loaded[i]) continue;
        const auto& meta = keys[i];
        if (meta.signer) {
            ++msg.header_.num_required_signatures;
            if (!meta.writable) ++msg.header_.num_readonly_signed;
        } else if (!meta.writable) {
            ++msg.header_.num_readonly_unsigned;
        }
    }

    std::unordered_map<Pubkey, std::size_t, PubkeyHasher> position;
    std::size_t next = 0;
    for (const auto& key : msg.account_keys_) position.emplace(key, next++);
    for (const auto& key : loaded_writable) position.emplace(key, next++);
    for (const auto& key : loaded_readonly) position.emplace(key, next++);
    if (next > MAX_ACCOUNT_KEYS) {
        throw ValidationError("transaction references " + std::to_string(next) +
                              " accounts, limit is 256");
    }

    for (const auto& ix : instructions) {
        CompiledInstruction compiled;
        compiled.program_id_index = static_cast<uint8_t>(position.at(ix.program_id));
        compiled.accounts.reserve(ix.accounts.size());
        for (const auto& meta : ix.accounts) {
            compiled.accounts.push_back(static_cast<uint8_t>(position.at(meta.pubkey)));
        }
        compiled.data = ix.data;
        msg.instructions_.push_back(std::move(compiled));
    }

    return msg;
}

// =============================================================================
// Message wire format
// =============================================================================

Bytes Message::serialize() const {
    BorshWriter w;
    if (versioned_) w.u8(VERSION_PREFIX);
    w.u8(header_.num_required_signatures)
     .u8(header_.num_readonly_signed)
     .u8(header_.num_readonly_unsigned);

    w.compact_u16(static_cast<uint16_t>(account_keys_.size()));
    for (const auto& key : account_keys_) w.pubkey(key);
    w.raw(recent_blockhash_.bytes());

    w.compact_u16(static_cast<uint16_t>(instructions_.size()));
    for (const auto& ix : instructions_) {
        w.u8(ix.program_id_index);
        write_bytes(w, ix.accounts);
        write_bytes(w, ix.data);
    }

    if (versioned_) {
        w.compact_u16(static_cast<uint16_t>(lookups_.size()));
        for (const auto& lookup : lookups_) {
            w.pubkey(lookup.account_key);
            write_bytes(w, lookup.writable_indexes);
            write_bytes(w, lookup.readonly_indexes);
        }
    }
    return w.take();
}

std::optional<Message> Message::parse(BorshReader& reader) {
    Message msg;
    uint8_t first = reader.u8();
    if (first & VERSION_PREFIX) {
        if ((first & 0x7f) != 0) return std::nullopt;
        msg.versioned_ = true;
        msg.header_.num_required_signatures = reader.u8();
    } else {
        msg.header_.num_required_signatures = first;
    }
    msg.header_.num_readonly_signed = reader.u8();
    msg.header_.num_readonly_unsigned = reader.u8();

    uint16_t key_count = reader.compact_u16();
    if (!reader.ok() || reader.remaining() < static_cast<std::size_t>(key_count) * 32) return std::nullopt;
    msg.account_keys_.reserve(key_count);
    for (uint16_t i = 0; i < key_count; ++i) msg.account_keys_.push_back(reader.pubkey());

    auto blockhash = reader.pubkey();
    msg.recent_blockhash_ = Hash(blockhash.bytes());

    uint16_t ix_count = reader.compact_u16();
    for (uint16_t i = 0; i < ix_count && reader.ok(); ++i) {
        CompiledInstruction ix;
        ix.program_id_index = reader.u8();
        ix.accounts = reader.bytes(reader.compact_u16());
        ix.data = reader.bytes(reader.compact_u16());
        msg.instructions_.push_back(std::move(ix));
    }

    if (msg.versioned_) {
        uint16_t lookup_count = reader.compact_u16();
        for (uint16_t i = 0; i < lookup_count && reader.ok(); ++i) {
            MessageAddressTableLookup lookup;
            lookup.account_key = reader.pubkey();
            lookup.writable_indexes = reader.bytes(reader.compact_u16());
            lookup.readonly_indexes = reader.bytes(reader.compact_u16());
            msg.lookups_.push_back(std::move(lookup));
        }
    }

    if (!reader.ok()) return std::nullopt;
    if (msg.header_.num_required_signatures > msg.account_keys_.size()) return std::nullopt;
    return msg;
}

std::vector<Pubkey> Message::signer_keys() const {
    return std::vector<Pubkey>(account_keys_.begin(),
                               account_keys_.begin() + header_.num_required_signatures);
}

std::optional<Pubkey> Message::static_key(std::size_t index) const {
    if (index >= account_keys_.size()) return std::nullopt;
    return account_keys_[index];
}

// =============================================================================
// Signing
// =============================================================================

SignedTransaction::SignedTransaction(Message message, std::vector<Signature> signatures)
    : message_(std::move(message)), signatures_(std::move(signatures)) {
    auto body = message_.serialize();
    BorshWriter w;
    w.compact_u16(static_cast<uint16_t>(signatures_.size()));
    for (const auto& sig : signatures_) w.raw(sig.bytes());
    w.raw(body.data(), body.size());
    wire_ = w.take();
}

SignedTransaction SignedTransaction::sign(Message message, const std::vector<const Keypair*>& signers) {
    auto body = message.serialize();
    std::vector<Signature> signatures;
    for (const auto& key : message.signer_keys()) {
        const Keypair* match = nullptr;
        for (const auto* kp : signers) {
            if (kp && kp->pubkey() == key) {
                match = kp;
                break;
            }
        }
        if (!match) {
            throw ValidationError("missing signer for " + key.to_base58());
        }
        signatures.push_back(match->sign(body));
    }

    SignedTransaction tx(std::move(message), std::move(signatures));
    if (tx.wire_.size() > constants::PACKET_DATA_SIZE) {
        throw ValidationError("transaction is " + std::to_string(tx.wire_.size()) +
                              " bytes, limit is " + std::to_string(constants::PACKET_DATA_SIZE));
    }
    return tx;
}

std::optional<ParsedTransaction> ParsedTransaction::parse(BorshReader& reader) {
    ParsedTransaction tx;
    uint16_t count = reader.compact_u16();
    if (!reader.ok() || reader.remaining() < static_cast<std::size_t>(count) * 64) return std::nullopt;
    tx.signatures.reserve(count);
    for (uint16_t i = 0; i < count; ++i) {
        auto raw = reader.bytes(64);
        if (!reader.ok()) return std::nullopt;
        tx.signatures.push_back(Signature::from_bytes(raw.data()));
    }
    auto message = Message::parse(reader);
    if (!message) return std::nullopt;
    tx.message = std::move(*message);
    return tx;
}

}  // namespace solx::trading
