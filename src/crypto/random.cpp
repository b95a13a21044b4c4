#include "lazymc/crypto/random.hpp"
#include "lazymc/crypto/crypto_error.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <string_view>
#include <vector>

namespace{
constexpr std::string_view alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

int last_reason(){
    unsigned long err = ::ERR_peek_last_error();
    if(err == 0) return 0;
    return static_cast<int>(::ERR_GET_REASON(err));
}

error_code make_crypto_error(crypto::crypto_error kind){
    return error_code::from_crypto(crypto::make_code(kind, last_reason()));
}
}

std::expected <std::string, error_code> crypto::random_alphanumeric(std::size_t length){
    ::ERR_clear_error();
    if(::OPENSSL_init_crypto(0, nullptr) != 1){
        return std::unexpected(make_crypto_error(crypto_error::openssl_init_failed));
    }

    // Rejection sampling keeps the distribution uniform over the alphabet.
    constexpr unsigned limit = 256 - (256 % alphabet.size());
    std::string out;
    out.reserve(length);

    std::vector<unsigned char> buf(length == 0 ? 1 : length * 2);
    while(out.size() < length){
        ::ERR_clear_error();
        if(::RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1){
            return std::unexpected(make_crypto_error(crypto_error::rand_bytes_failed));
        }

        for(unsigned char byte : buf){
            if(byte >= limit) continue;
            out.push_back(alphabet[byte % alphabet.size()]);
            if(out.size() == length) break;
        }
    }
    return out;
}
