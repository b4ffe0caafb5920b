#pragma once
#include "sigil/configuration/binding_config.hpp"
#include "sigil/core/result.hpp"
#include "sigil/core/failures.hpp"
#include "sigil/groups/distribution_id.hpp"
#include "sigil/groups/sender_key_distribution_message.hpp"
#include "sigil/groups/sender_key_name.hpp"
#include "sigil/groups/sender_key_record.hpp"
#include "sigil/session/protocol_address.hpp"
#include "sigil/stores/i_sender_key_store.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace sigil::protocol::groups {
using configuration::BindingConfig;
using session::ProtocolAddress;
using stores::ISenderKeyStore;
/**
 * @brief Sender-key messaging for one group, from one local sender.
 *
 * Each operation loads the relevant record from the store, runs the engine
 * on it, and writes it back only when the engine call succeeded. A failed
 * operation leaves the stored record untouched.
 *
 * Single-owner: the operation counter and the store access are not
 * synchronised. The store must outlive the session.
 *
 * @example
 * ```cpp
 * InMemorySenderKeyStore store;
 * auto alice = GroupSession::Create(alice_address, distribution_id, store).Unwrap();
 * auto skdm = alice.CreateDistributionMessage().Unwrap();
 * bob.ProcessDistributionMessage(alice_address, skdm);
 * auto ciphertext = alice.Encrypt(plaintext).Unwrap();
 * auto decrypted = bob.Decrypt(alice_address, ciphertext).Unwrap();
 * ```
 */
class GroupSession {
public:
    GroupSession(
        ProtocolAddress sender_address,
        const DistributionId& distribution_id,
        ISenderKeyStore& store,
        BindingConfig config = BindingConfig::Default());
    /// As the constructor, for a distribution id given as raw bytes (must be 16).
    [[nodiscard]] static Result<GroupSession, SigilFailure> Create(
        ProtocolAddress sender_address,
        std::span<const uint8_t> distribution_id,
        ISenderKeyStore& store,
        BindingConfig config = BindingConfig::Default());
    /// Starts (or continues) the local sender chain and describes it for other members.
    [[nodiscard]] Result<SenderKeyDistributionMessage, SigilFailure> CreateDistributionMessage();
    [[nodiscard]] Result<Unit, SigilFailure> ProcessDistributionMessage(
        const ProtocolAddress& sender,
        const SenderKeyDistributionMessage& message);
    /// Serialized SenderKeyMessage.
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Encrypt(std::span<const uint8_t> plaintext);
    [[nodiscard]] Result<std::vector<uint8_t>, SigilFailure> Decrypt(
        const ProtocolAddress& sender,
        std::span<const uint8_t> ciphertext);
    [[nodiscard]] const ProtocolAddress& GetSenderAddress() const noexcept { return sender_address_; }
    [[nodiscard]] const DistributionId& GetDistributionId() const noexcept { return distribution_id_; }
    [[nodiscard]] const BindingConfig& GetConfig() const noexcept { return config_; }
    /// Id of the most recent operation; 0 before the first one.
    [[nodiscard]] uint64_t GetOperationCount() const noexcept { return operation_counter_; }
private:
    uint64_t NextOperationId() noexcept;
    [[nodiscard]] Result<SenderKeyRecord, SigilFailure> LoadOrCreate(const SenderKeyName& name);
    [[nodiscard]] Result<Unit, SigilFailure> CheckPayloadSize(std::span<const uint8_t> payload, const char* context) const;
    ProtocolAddress sender_address_;
    DistributionId distribution_id_;
    ISenderKeyStore* store_;
    BindingConfig config_;
    uint64_t operation_counter_ = 0;
};
}
