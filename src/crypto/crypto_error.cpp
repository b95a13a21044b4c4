#include "lazymc/crypto/crypto_error.hpp"

#include <openssl/err.h>

namespace crypto{
    static std::string kind_to_string(crypto_error kind){
        switch(kind){
            case crypto_error::unknown:
                return "crypto.unknown";
            case crypto_error::openssl_init_failed:
                return "crypto.openssl_init_failed";
            case crypto_error::rand_bytes_failed:
                return "crypto.rand_bytes_failed";
        }
        return "crypto.unknown";
    }

    static std::string reason_to_string(int reason){
        if(reason == 0) return {};

        const char* openssl_reason = ::ERR_reason_error_string(static_cast<unsigned long>(reason));
        if(openssl_reason != nullptr && openssl_reason[0] != '\0'){
            return std::string(openssl_reason);
        }

        return {};
    }

    std::string crypto_strerror(int code){
        crypto_error kind = kind_of(code);
        int reason = reason_of(code);
        std::string out = kind_to_string(kind);

        std::string reason_str = reason_to_string(reason);
        if(!reason_str.empty()){
            out += " (reason: ";
            out += reason_str;
            out += ")";
        }
        return out;
    }
}
