#pragma once

#include <string>

namespace crypto{
    enum class crypto_error : int{
        unknown = 1,
        openssl_init_failed,
        rand_bytes_failed
    };

    constexpr int crypto_kind_shift = 16;
    constexpr int crypto_reason_mask = 0xFFFF;

    inline int make_code(crypto_error kind, int reason = 0){
        return (static_cast<int>(kind) << crypto_kind_shift) | (reason & crypto_reason_mask);
    }

    inline crypto_error kind_of(int code){
        if(code <= 0) return crypto_error::unknown;
        return static_cast<crypto_error>((code >> crypto_kind_shift) & crypto_reason_mask);
    }

    inline int reason_of(int code){
        return code & crypto_reason_mask;
    }

    std::string crypto_strerror(int code);
}
