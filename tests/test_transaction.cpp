// SolX Trading SDK - Transaction Tests

#include <catch2/catch_test_macros.hpp>
#include <solx/trading/constants.hpp>
#include <solx/trading/programs.hpp>
#include <solx/trading/transaction.hpp>

using namespace solx::trading;

namespace cst = solx::trading::constants;

namespace {

Hash test_blockhash() {
    std::array<uint8_t, 32> raw{};
    raw.fill(0x42);
    return Hash(raw);
}

}  // namespace

TEST_CASE("Legacy message compilation", "[transaction]") {
    auto payer = Keypair::generate();
    auto dest = Keypair::generate().pubkey();
    auto ix = programs::system::transfer(payer.pubkey(), dest, 5000);
    auto msg = Message::compile_legacy(payer.pubkey(), {ix}, test_blockhash());

    SECTION("Header counts and key order") {
        REQUIRE_FALSE(msg.versioned());
        REQUIRE(msg.header().num_required_signatures == 1);
        REQUIRE(msg.header().num_readonly_signed == 0);
        REQUIRE(msg.header().num_readonly_unsigned == 1);

        REQUIRE(msg.account_keys().size() == 3);
        REQUIRE(msg.account_keys()[0] == payer.pubkey());
        REQUIRE(msg.account_keys()[1] == dest);
        REQUIRE(msg.account_keys()[2] == cst::SYSTEM_PROGRAM);
    }

    SECTION("Instruction indexes") {
        REQUIRE(msg.instructions().size() == 1);
        const auto& compiled = msg.instructions()[0];
        REQUIRE(compiled.program_id_index == 2);
        REQUIRE(compiled.accounts == std::vector<uint8_t>{0, 1});
        REQUIRE(compiled.data == ix.data);
    }

    SECTION("Serialized size") {
        // header 3, keys 1 + 96, blockhash 32, one instruction 1 + 1 + 3 + 13
        REQUIRE(msg.serialize().size() == 150);
    }

    SECTION("Duplicate accounts collapse and merge permissions") {
        auto second = programs::system::transfer(payer.pubkey(), dest, 1);
        auto merged = Message::compile_legacy(payer.pubkey(), {ix, second}, test_blockhash());
        REQUIRE(merged.account_keys().size() == 3);
        REQUIRE(merged.instructions().size() == 2);
    }

    SECTION("Empty instruction list is rejected") {
        REQUIRE_THROWS_AS(Message::compile_legacy(payer.pubkey(), {}, test_blockhash()), ValidationError);
    }
}

TEST_CASE("Versioned message with lookup table", "[transaction]") {
    auto payer = Keypair::generate();
    auto dest = Keypair::generate().pubkey();
    auto ix = programs::system::transfer(payer.pubkey(), dest, 5000);

    AddressLookupTable table;
    table.key = Keypair::generate().pubkey();
    table.addresses = {Keypair::generate().pubkey(), dest};

    auto msg = Message::compile_v0(payer.pubkey(), {ix}, test_blockhash(), {table});

    REQUIRE(msg.versioned());
    REQUIRE(msg.account_keys().size() == 2);
    REQUIRE(msg.account_keys()[0] == payer.pubkey());
    REQUIRE(msg.account_keys()[1] == cst::SYSTEM_PROGRAM);

    REQUIRE(msg.lookups().size() == 1);
    REQUIRE(msg.lookups()[0].account_key == table.key);
    REQUIRE(msg.lookups()[0].writable_indexes == std::vector<uint8_t>{1});
    REQUIRE(msg.lookups()[0].readonly_indexes.empty());

    const auto& compiled = msg.instructions()[0];
    REQUIRE(compiled.program_id_index == 1);
    REQUIRE(compiled.accounts == std::vector<uint8_t>{0, 2});
    REQUIRE_FALSE(msg.static_key(2).has_value());

    SECTION("Signers and programs never move into a table") {
        AddressLookupTable greedy{table.key, {payer.pubkey(), cst::SYSTEM_PROGRAM}};
        auto plain = Message::compile_v0(payer.pubkey(), {ix}, test_blockhash(), {greedy});
        REQUIRE(plain.lookups().empty());
        REQUIRE(plain.account_keys().size() == 3);
    }
}

TEST_CASE("Transaction signing and wire format", "[transaction]") {
    auto payer = Keypair::generate();
    auto dest = Keypair::generate().pubkey();
    auto msg = Message::compile_legacy(payer.pubkey(),
                                       {programs::system::transfer(payer.pubkey(), dest, 5000)},
                                       test_blockhash());

    SECTION("Signature covers the serialized message") {
        auto tx = SignedTransaction::sign(msg, {&payer});
        REQUIRE(tx.signatures().size() == 1);
        auto body = tx.message().serialize();
        REQUIRE(Keypair::verify(payer.pubkey(), body.data(), body.size(), tx.signature()));
        REQUIRE(tx.wire().size() == 1 + 64 + body.size());
    }

    SECTION("Wire bytes parse back") {
        auto tx = SignedTransaction::sign(msg, {&payer});
        BorshReader reader(tx.wire());
        auto parsed = ParsedTransaction::parse(reader);
        REQUIRE(parsed.has_value());
        REQUIRE(reader.remaining() == 0);
        REQUIRE(parsed->signatures.size() == 1);
        REQUIRE(parsed->signatures[0] == tx.signature());
        REQUIRE(parsed->message.account_keys() == msg.account_keys());
        REQUIRE(parsed->message.recent_blockhash() == test_blockhash());
        REQUIRE(parsed->message.instructions()[0].data == msg.instructions()[0].data);
    }

    SECTION("Encodings of the wire bytes") {
        auto tx = SignedTransaction::sign(msg, {&payer});
        REQUIRE(base64_decode(tx.to_base64()) == tx.wire());
        REQUIRE(base58_decode(tx.to_base58()) == tx.wire());
    }

    SECTION("Missing signer is rejected") {
        auto other = Keypair::generate();
        REQUIRE_THROWS_AS(SignedTransaction::sign(msg, {&other}), ValidationError);
    }

    SECTION("Oversized transactions are rejected") {
        Instruction big;
        big.program_id = cst::SYSTEM_PROGRAM;
        big.accounts = {AccountMeta::writable(payer.pubkey(), true)};
        big.data = Bytes(1200, 0);
        auto huge = Message::compile_legacy(payer.pubkey(), {big}, test_blockhash());
        REQUIRE_THROWS_AS(SignedTransaction::sign(huge, {&payer}), ValidationError);
    }

    SECTION("Truncated wire bytes do not parse") {
        auto tx = SignedTransaction::sign(msg, {&payer});
        Bytes cut(tx.wire().begin(), tx.wire().begin() + 100);
        BorshReader reader(cut);
        REQUIRE_FALSE(ParsedTransaction::parse(reader).has_value());
    }
}

TEST_CASE("Compact-u16 lengths", "[transaction][borsh]") {
    for (uint16_t value : {uint16_t{0}, uint16_t{127}, uint16_t{128}, uint16_t{16383}, uint16_t{16384}, uint16_t{65535}}) {
        BorshWriter w;
        w.compact_u16(value);
        BorshReader r(w.data());
        REQUIRE(r.compact_u16() == value);
        REQUIRE(r.ok());
    }

    BorshWriter w;
    w.compact_u16(128);
    REQUIRE(w.data() == Bytes{0x80, 0x01});
}
