#include"Solana/Keypair.hpp"
#include"Solana/Transaction.hpp"
#include"Solana/shortvec.hpp"
#include"Util/Base64.hpp"
#include"Util/BacktraceException.hpp"
#include<algorithm>
#include<sstream>
#include<stdexcept>

namespace {

struct KeyEntry {
	Solana::Pubkey key;
	bool is_signer;
	bool is_writable;
};

void add_key( std::vector<KeyEntry>& keys
	    , Solana::Pubkey const& key
	    , bool is_signer
	    , bool is_writable
	    ) {
	for (auto& k : keys) {
		if (k.key == key) {
			k.is_signer = k.is_signer || is_signer;
			k.is_writable = k.is_writable || is_writable;
			return;
		}
	}
	keys.push_back(KeyEntry{key, is_signer, is_writable});
}

int category(KeyEntry const& k) {
	if (k.is_signer)
		return k.is_writable ? 0 : 1;
	return k.is_writable ? 2 : 3;
}

std::uint8_t index_of( std::vector<Solana::Pubkey> const& keys
		     , Solana::Pubkey const& key
		     ) {
	auto it = std::find(keys.begin(), keys.end(), key);
	return std::uint8_t(it - keys.begin());
}

void write_bytes(std::ostream& os, std::uint8_t const* p, std::size_t len) {
	os.write(reinterpret_cast<char const*>(p), len);
}

}

namespace Solana {

Message Message::compile( Pubkey const& payer
			, std::vector<Instruction> const& instructions
			, Blockhash const& recent_blockhash
			) {
	auto keys = std::vector<KeyEntry>();
	add_key(keys, payer, true, true);
	for (auto const& i : instructions) {
		for (auto const& a : i.accounts)
			add_key(keys, a.pubkey, a.is_signer, a.is_writable);
		add_key(keys, i.program_id, false, false);
	}
	/* Stable, so the payer stays in front.  */
	std::stable_sort( keys.begin(), keys.end()
			, [](KeyEntry const& a, KeyEntry const& b) {
		return category(a) < category(b);
	});
	if (keys.size() > 256)
		throw Util::BacktraceException<std::invalid_argument>(
			"Solana::Message: too many accounts"
		);

	auto rv = Message();
	rv.num_required_signatures = 0;
	rv.num_readonly_signed = 0;
	rv.num_readonly_unsigned = 0;
	for (auto const& k : keys) {
		switch (category(k)) {
		case 0: ++rv.num_required_signatures; break;
		case 1: ++rv.num_required_signatures;
			++rv.num_readonly_signed; break;
		case 3: ++rv.num_readonly_unsigned; break;
		default: break;
		}
		rv.account_keys.push_back(k.key);
	}
	rv.recent_blockhash = recent_blockhash;

	for (auto const& i : instructions) {
		auto ci = CompiledInstruction();
		ci.program_id_index = index_of(rv.account_keys, i.program_id);
		for (auto const& a : i.accounts)
			ci.accounts.push_back(index_of(rv.account_keys, a.pubkey));
		ci.data = i.data;
		rv.instructions.push_back(std::move(ci));
	}
	return rv;
}

std::vector<std::uint8_t> Message::serialize() const {
	auto os = std::ostringstream();
	os.put(char(num_required_signatures));
	os.put(char(num_readonly_signed));
	os.put(char(num_readonly_unsigned));
	os << shortvec(account_keys.size());
	for (auto const& k : account_keys)
		write_bytes(os, k.data(), Pubkey::size);
	write_bytes(os, recent_blockhash.data(), Blockhash::size);
	os << shortvec(instructions.size());
	for (auto const& i : instructions) {
		os.put(char(i.program_id_index));
		os << shortvec(i.accounts.size());
		write_bytes(os, i.accounts.data(), i.accounts.size());
		os << shortvec(i.data.size());
		write_bytes(os, i.data.data(), i.data.size());
	}
	auto s = os.str();
	return std::vector<std::uint8_t>(s.begin(), s.end());
}

Transaction::Transaction(Message message_)
	: message(std::move(message_))
	, signatures(message.num_required_signatures) { }

void Transaction::sign(std::vector<Keypair const*> const& keypairs) {
	auto bytes = message.serialize();
	auto signed_ = std::vector<bool>(signatures.size(), false);
	for (auto kp : keypairs) {
		auto it = std::find( message.account_keys.begin()
				   , message.account_keys.begin()
				   + signatures.size()
				   , kp->pubkey()
				   );
		auto idx = std::size_t(it - message.account_keys.begin());
		if (idx >= signatures.size())
			throw Util::BacktraceException<std::invalid_argument>(
				"Solana::Transaction: keypair "
				+ std::string(kp->pubkey())
				+ " is not a signer"
			);
		signatures[idx] = kp->sign(bytes);
		signed_[idx] = true;
	}
	for (auto i = std::size_t(0); i < signed_.size(); ++i)
		if (!signed_[i])
			throw Util::BacktraceException<std::invalid_argument>(
				"Solana::Transaction: missing signature for "
				+ std::string(message.account_keys[i])
			);
}

Signature const& Transaction::signature() const {
	if (signatures.empty())
		throw Util::BacktraceException<std::logic_error>(
			"Solana::Transaction: no signers"
		);
	return signatures[0];
}

std::vector<std::uint8_t> Transaction::serialize() const {
	auto os = std::ostringstream();
	os << shortvec(signatures.size());
	for (auto const& s : signatures)
		write_bytes(os, s.data(), Signature::size);
	auto msg = message.serialize();
	write_bytes(os, msg.data(), msg.size());
	auto s = os.str();
	return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::string Transaction::to_base64() const {
	return Util::Base64::encode(serialize());
}

}
