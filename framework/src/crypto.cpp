#include <streamgate/crypto.h>
#include <streamgate/util/string.h>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <ctime>
#include <memory>
#include <stdexcept>

namespace streamgate::crypto {

    struct BioDeleter { void operator()(BIO* b) { BIO_free_all(b); } };
    using BioPtr = std::unique_ptr<BIO, BioDeleter>;

    namespace {
        BioPtr create_base64_sink() {
            BioPtr b64(BIO_new(BIO_f_base64()));
            if (!b64) return nullptr;
            BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

            BIO* mem = BIO_new(BIO_s_mem());
            if (!mem) return nullptr;

            BIO_push(b64.get(), mem);
            return b64;
        }

        BioPtr create_base64_source(std::string_view input) {
            BioPtr b64(BIO_new(BIO_f_base64()));
            if (!b64) return nullptr;
            BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

            BIO* mem = BIO_new_mem_buf(input.data(), static_cast<int>(input.size()));
            if (!mem) return nullptr;

            BIO_push(b64.get(), mem);
            return b64;
        }

        void fill_random(unsigned char* out, size_t length) {
            if (RAND_bytes(out, static_cast<int>(length)) != 1) {
                throw std::runtime_error("RAND_bytes failed");
            }
        }
    }

    std::string hmac_sha256(std::string_view key, std::string_view data) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash, &len);
        return std::string(reinterpret_cast<char*>(hash), len);
    }

    std::string base64_encode(std::string_view input) {
        BioPtr chain = create_base64_sink();
        if (!chain) return "";

        if (BIO_write(chain.get(), input.data(), static_cast<int>(input.size())) <= 0) return "";
        BIO_flush(chain.get());

        BUF_MEM* buffer_ptr = nullptr;
        BIO_get_mem_ptr(chain.get(), &buffer_ptr);

        return std::string(buffer_ptr->data, buffer_ptr->length);
    }

    std::string base64_decode(std::string_view input) {
        BioPtr chain = create_base64_source(input);
        if (!chain) return "";

        std::string res;
        res.resize(input.size());
        int decoded_size = BIO_read(chain.get(), res.data(), static_cast<int>(input.size()));
        res.resize(decoded_size > 0 ? decoded_size : 0);

        return res;
    }

    std::string base64url_encode(std::string_view input) {
        std::string b64 = base64_encode(input);
        std::string res;
        res.reserve(b64.size());
        for (char c : b64) {
            if (c == '+') res += '-';
            else if (c == '/') res += '_';
            else if (c == '=') continue;
            else res += c;
        }
        return res;
    }

    std::string base64url_decode(std::string_view input) {
        std::string b64 = std::string(input);
        for (char& c : b64) {
            if (c == '-') c = '+';
            else if (c == '_') c = '/';
        }
        while (b64.size() % 4) b64 += '=';
        return base64_decode(b64);
    }

    std::string uuid_v4() {
        unsigned char bytes[16];
        fill_random(bytes, sizeof(bytes));
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

        std::string hex = util::hex_encode(std::string_view(reinterpret_cast<char*>(bytes), sizeof(bytes)));
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
               hex.substr(16, 4) + "-" + hex.substr(20);
    }

    bool secure_compare(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    std::string jwt_sign(boost::json::object payload, std::string_view secret, int expires_in) {
        std::string header = R"({"alg":"HS256","typ":"JWT"})";
        payload["exp"] = static_cast<std::int64_t>(std::time(nullptr)) + expires_in;

        std::string data = base64url_encode(header) + "." + base64url_encode(boost::json::serialize(payload));
        return data + "." + base64url_encode(hmac_sha256(secret, data));
    }

    std::optional<boost::json::object> jwt_verify(std::string_view token, std::string_view secret, JwtError* error) {
        if (error) *error = JwtError::None;

        size_t first_dot = token.find('.');
        size_t last_dot = token.rfind('.');
        if (first_dot == std::string_view::npos || first_dot == last_dot) {
            if (error) *error = JwtError::Malformed;
            return std::nullopt;
        }

        std::string_view data = token.substr(0, last_dot);
        std::string expected_sig = hmac_sha256(secret, data);
        std::string received_sig = base64url_decode(token.substr(last_dot + 1));

        if (!secure_compare(expected_sig, received_sig)) {
            if (error) *error = JwtError::InvalidSignature;
            return std::nullopt;
        }

        std::string payload_json = base64url_decode(token.substr(first_dot + 1, last_dot - first_dot - 1));
        boost::system::error_code ec;
        auto payload = boost::json::parse(payload_json, ec);
        if (ec || !payload.is_object()) {
            if (error) *error = JwtError::Malformed;
            return std::nullopt;
        }

        auto& claims = payload.as_object();
        if (auto* exp = claims.if_contains("exp"); exp && exp->is_number()) {
            if (static_cast<double>(std::time(nullptr)) > exp->to_number<double>()) {
                if (error) *error = JwtError::Expired;
                return std::nullopt;
            }
        }

        return std::move(claims);
    }

} // namespace streamgate::crypto
