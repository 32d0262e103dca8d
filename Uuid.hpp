#ifndef UUID_HPP
#define UUID_HPP

#include<cstdint>
#include<iostream>
#include<memory>
#include<string>

/** class Uuid
 *
 * @brief a unique 128-bit identifier.
 *
 * @desc this is ***not*** an RFC4122-standard UUID!
 * This is just 16 random bytes, used to name
 * containers and temporary directories so that
 * concurrent invocations never collide.
 */
class Uuid {
private:
	struct Impl {
		std::uint8_t data[16];
	};
	std::shared_ptr<Impl> pimpl;

public:
	Uuid() =default;
	Uuid(Uuid&&) =default;
	Uuid(Uuid const&) =default;
	Uuid& operator=(Uuid&&) =default;
	Uuid& operator=(Uuid const&) =default;
	~Uuid() =default;

	/* Construct a fresh random UUID that has never
	 * been used before (with high probability).  */
	static Uuid random();

	bool operator==(Uuid const& o) const;
	bool operator!=(Uuid const& o) const {
		return !(*this == o);
	}

	explicit operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	explicit operator std::string() const;
	explicit Uuid(std::string const&);

	static
	bool valid_string(std::string const&);
};

inline
std::ostream& operator<<(std::ostream& os, Uuid const& i) {
	return os << std::string(i);
}

#endif /* !defined(UUID_HPP) */
