#include <core/engine/transfer_engine.h>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <transit/connection.h>
#include <transit/key_confirmation.h>
#include <transit/record_cipher.h>
#include <transit/sha256_hasher.h>

using namespace wormhole::transit;

namespace {

BinaryData bytes(const std::string& text) {
    return BinaryData(text.begin(), text.end());
}

} // namespace

TEST(KeyConfirmationTest, KeyDependsOnlyOnCode) {
    auto key = DeriveKey("7-crossover-clockwork");
    EXPECT_EQ(key.size(), 32u);
    EXPECT_EQ(key, DeriveKey("7-crossover-clockwork"));
    EXPECT_NE(key, DeriveKey("7-crossover-clockworks"));
    EXPECT_NE(DeriveSubkey(key, "sender-records"), DeriveSubkey(key, "receiver-records"));
    EXPECT_EQ(DeriveSubkey(key, "sender-records").size(), 32u);
}

TEST(KeyConfirmationTest, NoncesAreRandomHex) {
    std::set<std::string> seen;
    for (int i = 0; i < 16; ++i) {
        auto nonce = MakeNonce();
        EXPECT_EQ(nonce.size(), 32u);
        EXPECT_EQ(nonce.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(nonce);
    }
    EXPECT_EQ(seen.size(), 16u);
}

TEST(KeyConfirmationTest, ProofsMatchOnlyWithSameCode) {
    auto sender_nonce = MakeNonce();
    auto receiver_nonce = MakeNonce();
    auto key = DeriveKey("7-crossover-clockwork");
    auto proof = ComputeProof(key, kSenderLabel, sender_nonce, receiver_nonce);

    EXPECT_TRUE(VerifyProof(proof,
                            ComputeProof(DeriveKey("7-crossover-clockwork"),
                                         kSenderLabel,
                                         sender_nonce,
                                         receiver_nonce)));
    EXPECT_FALSE(VerifyProof(proof,
                             ComputeProof(DeriveKey("7-crossover-cleanup"),
                                          kSenderLabel,
                                          sender_nonce,
                                          receiver_nonce)));
    // A proof cannot be reflected back as the other side's
    EXPECT_FALSE(
        VerifyProof(proof, ComputeProof(key, kReceiverLabel, sender_nonce, receiver_nonce)));
    EXPECT_FALSE(VerifyProof(proof, ""));
    EXPECT_FALSE(VerifyProof(proof, proof.substr(1)));
}

TEST(RecordCipherTest, OpensRecordsInOrder) {
    auto key = DeriveSubkey(DeriveKey("3-apple"), "sender-records");
    RecordCipher sealer(key);
    RecordCipher opener(key);

    auto first = sealer.Seal(bytes("first record"));
    auto second = sealer.Seal(bytes("second record"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->size(), std::string("first record").size() + RecordCipher::kTagSize);
    EXPECT_NE(*first, bytes("first record"));

    auto opened = opener.Open(*first);
    ASSERT_TRUE(opened.has_value()) << opened.error();
    EXPECT_EQ(*opened, bytes("first record"));
    opened = opener.Open(*second);
    ASSERT_TRUE(opened.has_value()) << opened.error();
    EXPECT_EQ(*opened, bytes("second record"));
    EXPECT_EQ(sealer.records(), 2u);
}

TEST(RecordCipherTest, RejectsTamperedRecord) {
    auto key = DeriveKey("3-apple");
    RecordCipher sealer(key);
    RecordCipher opener(key);

    auto sealed = sealer.Seal(bytes("payload"));
    ASSERT_TRUE(sealed.has_value());
    (*sealed)[0] ^= 0x01;
    EXPECT_FALSE(opener.Open(*sealed).has_value());
}

TEST(RecordCipherTest, RejectsReorderedRecord) {
    auto key = DeriveKey("3-apple");
    RecordCipher sealer(key);
    RecordCipher opener(key);

    auto first = sealer.Seal(bytes("one"));
    auto second = sealer.Seal(bytes("two"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(opener.Open(*second).has_value());
}

TEST(RecordCipherTest, RejectsWrongKeyAndShortRecords) {
    RecordCipher sealer(DeriveKey("3-apple"));
    RecordCipher opener(DeriveKey("3-apples"));

    auto sealed = sealer.Seal(bytes("payload"));
    ASSERT_TRUE(sealed.has_value());
    EXPECT_FALSE(opener.Open(*sealed).has_value());
    EXPECT_FALSE(opener.Open(BinaryData(4, 0)).has_value());
    EXPECT_THROW(RecordCipher{Key(16, 0)}, std::invalid_argument);
}

TEST(Sha256HasherTest, MatchesKnownDigest) {
    Sha256Hasher hasher;
    hasher.Update("ab", 2);
    hasher.Update("c", 1);
    EXPECT_EQ(hasher.FinalHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ConnectionTest, DecodesHeaderAndPayload) {
    auto message = EncodeMessage({{"type", "data"}, {"entry", 2}}, bytes("chunk"));
    auto frame = DecodeMessage(message);

    EXPECT_EQ(frame.type(), "data");
    EXPECT_EQ(frame.header.value("entry", 0), 2);
    EXPECT_EQ(frame.payload, bytes("chunk"));
}

TEST(ConnectionTest, RejectsMalformedMessages) {
    using wormhole::core::TransferError;
    EXPECT_THROW(DecodeMessage(BinaryData{0, 0}), TransferError);
    EXPECT_THROW(DecodeMessage(BinaryData{0, 0, 0, 9, '{', '}'}), TransferError);
    EXPECT_THROW(DecodeMessage(BinaryData{0, 0, 0, 2, 'n', 'o'}), TransferError);
    EXPECT_THROW(DecodeMessage(BinaryData{0, 0, 0, 2, '[', ']'}), TransferError);
}
