// SolX Trading SDK - Event Codec
// Discriminator registry mapping raw program payloads to typed trade events

#pragma once

#include <solx/trading/events.hpp>
#include <solx/trading/types.hpp>
#include <array>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace solx::trading {

struct DecodeError {
    enum class Code : uint8_t {
        Filtered = 0,              // program belongs to an unselected protocol
        UnknownProgram = 1,
        TooShort = 2,
        UnknownDiscriminator = 3,
        Malformed = 4
    };

    Code code = Code::Malformed;
    std::string message;
};

const char* to_string(DecodeError::Code code) noexcept;

using DecodeResult = std::variant<TradeEvent, DecodeError>;

// Where a payload came from; instruction payloads also need their resolved accounts
struct DecodeContext {
    Signature signature;
    uint64_t slot = 0;
    EventSource source = EventSource::ProgramLog;
    uint32_t instruction_index = 0;
    const std::vector<Pubkey>* accounts = nullptr;
};

struct InstructionView {
    Pubkey program_id;
    std::vector<Pubkey> accounts;
    Bytes data;
    uint32_t index = 0;  // outer instruction index, shared by its inner instructions
    bool inner = false;
};

// Transport-neutral transaction as delivered by a stream
struct TransactionView {
    Signature signature;
    uint64_t slot = 0;
    bool confirmed = true;  // false for pre-confirmation fragments
    std::vector<InstructionView> instructions;
    std::vector<std::string> logs;
};

class EventCodec {
public:
    // Accepts every supported protocol
    EventCodec();
    explicit EventCodec(std::set<ProtocolTag> protocols);

    // Total: never throws for any input bytes or program id
    [[nodiscard]] DecodeResult classify(const uint8_t* data, std::size_t size,
                                        const Pubkey& program_id,
                                        const DecodeContext& ctx = {}) const;
    [[nodiscard]] DecodeResult classify(const Bytes& payload,
                                        const Pubkey& program_id,
                                        const DecodeContext& ctx = {}) const {
        return classify(payload.data(), payload.size(), program_id, ctx);
    }

    // Events from logs and self-CPI instructions (confirmed) or top-level
    // instructions (fragments). Undecodable payloads are logged and skipped.
    [[nodiscard]] std::vector<TradeEvent> decode_transaction(const TransactionView& tx) const;

    [[nodiscard]] bool accepts(const Pubkey& program_id) const noexcept;
    [[nodiscard]] bool accepts(ProtocolTag protocol) const noexcept;
    [[nodiscard]] const std::set<ProtocolTag>& protocols() const noexcept { return protocols_; }
    [[nodiscard]] std::vector<Pubkey> program_ids() const;

    static std::optional<ProtocolTag> protocol_for_program(const Pubkey& program_id) noexcept;
    static const Pubkey& program_for(ProtocolTag protocol) noexcept;

private:
    void decode_logs(const TransactionView& tx,
                     const std::set<Pubkey>& skip_programs,
                     std::vector<TradeEvent>& out) const;
    void push_result(DecodeResult result, std::vector<TradeEvent>& out) const;

    std::set<ProtocolTag> protocols_;
    std::array<bool, 3> enabled_{};
};

// Flags a creator's own trade in the transaction that created its token or pool
void mark_creator_trades(std::vector<TradeEvent>& events);

}  // namespace solx::trading
