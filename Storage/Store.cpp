#include <PCH.hpp>

#include "Storage/Store.hpp"

#include <random>

namespace Storage
{
	String NewClaimToken()
	{
		thread_local std::mt19937_64 generator(std::random_device{}());

		static const char HexDigits[] = "0123456789abcdef";

		String token(32, '0');

		for (size_t i = 0; i < token.size(); i += 16)
		{
			auto value = generator();

			for (size_t j = 0; j < 16; ++j, value >>= 4)
				token[i + j] = HexDigits[value & 0xF];
		}

		return token;
	}
}
