// SolX Trading SDK - Transactions
// Message compilation (legacy and v0), signing and wire-format (de)serialization

#pragma once

#include <solx/trading/borsh.hpp>
#include <solx/trading/crypto.hpp>
#include <solx/trading/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace solx::trading {

struct MessageHeader {
    uint8_t num_required_signatures = 0;
    uint8_t num_readonly_signed = 0;
    uint8_t num_readonly_unsigned = 0;
};

struct CompiledInstruction {
    uint8_t program_id_index = 0;
    std::vector<uint8_t> accounts;
    Bytes data;
};

// On-chain address lookup table contents
struct AddressLookupTable {
    Pubkey key;
    std::vector<Pubkey> addresses;
};

struct MessageAddressTableLookup {
    Pubkey account_key;
    std::vector<uint8_t> writable_indexes;
    std::vector<uint8_t> readonly_indexes;
};

class Message {
public:
    static Message compile_legacy(const Pubkey& payer,
                                  const std::vector<Instruction>& instructions,
                                  const Hash& recent_blockhash);

    // Non-signer, non-program accounts found in `tables` are loaded through lookups
    static Message compile_v0(const Pubkey& payer,
                              const std::vector<Instruction>& instructions,
                              const Hash& recent_blockhash,
                              const std::vector<AddressLookupTable>& tables = {});

    // Reads one message; nullopt on malformed input
    static std::optional<Message> parse(BorshReader& reader);

    [[nodiscard]] Bytes serialize() const;

    [[nodiscard]] bool versioned() const noexcept { return versioned_; }
    [[nodiscard]] const MessageHeader& header() const noexcept { return header_; }
    [[nodiscard]] const std::vector<Pubkey>& account_keys() const noexcept { return account_keys_; }
    [[nodiscard]] const Hash& recent_blockhash() const noexcept { return recent_blockhash_; }
    [[nodiscard]] const std::vector<CompiledInstruction>& instructions() const noexcept { return instructions_; }
    [[nodiscard]] const std::vector<MessageAddressTableLookup>& lookups() const noexcept { return lookups_; }

    [[nodiscard]] std::vector<Pubkey> signer_keys() const;

    // Static key for an instruction account index; nullopt when it points into a lookup table
    [[nodiscard]] std::optional<Pubkey> static_key(std::size_t index) const;

private:
    static Message compile(const Pubkey& payer,
                           const std::vector<Instruction>& instructions,
                           const Hash& recent_blockhash,
                           const std::vector<AddressLookupTable>& tables,
                           bool versioned);

    bool versioned_ = false;
    MessageHeader header_;
    std::vector<Pubkey> account_keys_;
    Hash recent_blockhash_;
    std::vector<CompiledInstruction> instructions_;
    std::vector<MessageAddressTableLookup> lookups_;
};

// Immutable signed payload, shared unmodified across relay submissions
class SignedTransaction {
public:
    // Every required signer must appear in `signers`
    static SignedTransaction sign(Message message, const std::vector<const Keypair*>& signers);

    [[nodiscard]] const Signature& signature() const noexcept { return signatures_.front(); }
    [[nodiscard]] const std::vector<Signature>& signatures() const noexcept { return signatures_; }
    [[nodiscard]] const Message& message() const noexcept { return message_; }
    [[nodiscard]] const Bytes& wire() const noexcept { return wire_; }
    [[nodiscard]] std::string to_base64() const { return base64_encode(wire_); }
    [[nodiscard]] std::string to_base58() const { return base58_encode(wire_); }

private:
    SignedTransaction(Message message, std::vector<Signature> signatures);

    Message message_;
    std::vector<Signature> signatures_;
    Bytes wire_;
};

// Transaction as read back from the wire (entries, RPC blobs)
struct ParsedTransaction {
    std::vector<Signature> signatures;
    Message message;

    static std::optional<ParsedTransaction> parse(BorshReader& reader);
};

}  // namespace solx::trading
