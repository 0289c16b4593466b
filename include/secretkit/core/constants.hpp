#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace secretkit::service {
struct Constants {
    static constexpr size_t AES_128_KEY_SIZE = 16;
    static constexpr size_t AES_BLOCK_SIZE = 16;
    static constexpr size_t AES_CBC_IV_SIZE = AES_BLOCK_SIZE;
    static constexpr size_t DH_GROUP_BYTES = 128;
    static constexpr size_t DH_PRIVATE_EXPONENT_BYTES = 128;
    static constexpr uint32_t DH_GENERATOR = 2;
    static constexpr size_t DH_MAX_EXPONENT_ATTEMPTS = 64;
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t HKDF_MAX_OUTPUT_SIZE = 255 * SHA_256_DIGEST_SIZE;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr const char* ALGORITHM_HKDF = "HKDF";
    static constexpr const char* ALGORITHM_SHA256 = "SHA256";
    static constexpr const char* PARAM_DIGEST = "digest";
    static constexpr const char* PARAM_KEY = "key";
    static constexpr const char* PARAM_SALT = "salt";
    static constexpr const char* PARAM_INFO = "info";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
};
struct BusConstants {
    static constexpr std::string_view SERVICE_PATH = "/org/freedesktop/secrets";
    static constexpr std::string_view COLLECTION_PATH_PREFIX = "/org/freedesktop/secrets/collection/";
    static constexpr std::string_view NO_OBJECT_PATH = "/";
    static constexpr std::string_view SERVICE_INTERFACE = "org.freedesktop.Secret.Service";
    static constexpr std::string_view COLLECTION_INTERFACE = "org.freedesktop.Secret.Collection";
    static constexpr std::string_view ITEM_INTERFACE = "org.freedesktop.Secret.Item";
    static constexpr std::string_view PROPERTY_LABEL = "Label";
    static constexpr std::string_view PROPERTY_LOCKED = "Locked";
    static constexpr std::string_view PROPERTY_ATTRIBUTES = "Attributes";
    static constexpr std::string_view PROPERTY_CREATED = "Created";
    static constexpr std::string_view PROPERTY_MODIFIED = "Modified";
    static constexpr std::string_view PROPERTY_ITEMS = "Items";
    static constexpr std::string_view PROPERTY_COLLECTIONS = "Collections";
    static constexpr std::string_view ALGORITHM_PLAIN = "plain";
    static constexpr std::string_view ALGORITHM_DH = "dh-ietf1024-sha256-aes128-cbc-pkcs7";
    static constexpr std::string_view DEFAULT_ALIAS = "default";
    static constexpr std::string_view SESSION_ALIAS = "session";
    static constexpr std::string_view DEFAULT_WINDOW_ID = "";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SESSION_MISMATCH = "Secret was encoded for a different session";
    static constexpr std::string_view PROMPT_DISMISSED = "Prompt was dismissed";
    static constexpr std::string_view PROMPT_TIMED_OUT = "Prompt was not answered in time";
    static constexpr std::string_view NO_SUCH_ALIAS = "No collection is bound to alias";
    static constexpr std::string_view NO_COLLECTIONS = "Secret service has no collections";
    static constexpr std::string_view MISSING_PROMPT_RESULT = "Prompt completed without the expected object path";
};
}
