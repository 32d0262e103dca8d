#ifndef SOLANA_TRANSACTION_HPP
#define SOLANA_TRANSACTION_HPP

#include"Solana/Instruction.hpp"
#include"Solana/Pubkey.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Solana { class Keypair; }

namespace Solana {

/** struct Solana::Message
 *
 * @brief a compiled legacy transaction message.
 *
 * @desc `account_keys` is ordered writable signers,
 * read-only signers, writable non-signers, then
 * read-only non-signers, with the fee payer first.
 */
struct Message {
	std::uint8_t num_required_signatures;
	std::uint8_t num_readonly_signed;
	std::uint8_t num_readonly_unsigned;
	std::vector<Pubkey> account_keys;
	Blockhash recent_blockhash;

	struct CompiledInstruction {
		std::uint8_t program_id_index;
		std::vector<std::uint8_t> accounts;
		std::vector<std::uint8_t> data;
	};
	std::vector<CompiledInstruction> instructions;

	static
	Message compile( Pubkey const& payer
		       , std::vector<Instruction> const& instructions
		       , Blockhash const& recent_blockhash
		       );

	std::vector<std::uint8_t> serialize() const;
};

/** class Solana::Transaction
 *
 * @brief a message together with its signatures,
 * in the order of the signer keys.
 */
class Transaction {
private:
	Message message;
	std::vector<Signature> signatures;

public:
	explicit
	Transaction(Message message_);

	/* Sign with every required signer.  Throws
	 * `std::invalid_argument` if a keypair does not
	 * belong to the signer keys, or a signer is
	 * missing.  */
	void sign(std::vector<Keypair const*> const& keypairs);

	Message const& get_message() const { return message; }
	/* The first signature identifies the transaction.  */
	Signature const& signature() const;

	std::vector<std::uint8_t> serialize() const;
	/* Wire form, as accepted by `sendTransaction`.  */
	std::string to_base64() const;
};

}

#endif /* !defined(SOLANA_TRANSACTION_HPP) */
