//
// Runtime configuration, read from the environment, plus compile time constants
//

#ifndef STAGING_GATEWAY_SETTINGS_H
#define STAGING_GATEWAY_SETTINGS_H

#include <cstdint>
#include <cstdlib>
#include <string>

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
inline auto GET_ENV(const std::string &variable, const std::string &_default) -> std::string {
    // NOLINTNEXTLINE(clang-analyzer-cplusplus.StringChecker,concurrency-mt-unsafe)
    return std::getenv(variable.c_str()) != nullptr ? std::string(std::getenv(variable.c_str())) : _default;
}

constexpr const char* CENTRAL_URL_ENV_VARIABLE = "STAGING_GATEWAY_CENTRAL_URL";
constexpr const char* IDENTITY_URL_ENV_VARIABLE = "STAGING_GATEWAY_IDENTITY_URL";
constexpr const char* JWT_PUBLIC_KEY_FILE_ENV_VARIABLE = "STAGING_GATEWAY_JWT_PUBLIC_KEY_FILE";
constexpr const char* JWT_ISSUER_ENV_VARIABLE = "STAGING_GATEWAY_JWT_ISSUER";
constexpr const char* JWT_AUDIENCE_ENV_VARIABLE = "STAGING_GATEWAY_JWT_AUDIENCE";
constexpr const char* STAGING_ROOT_ENV_VARIABLE = "STAGING_GATEWAY_STAGING_ROOT";

#define CENTRAL_URL                 GET_ENV(CENTRAL_URL_ENV_VARIABLE, "https://central.sonatype.com")
#define IDENTITY_URL                GET_ENV(IDENTITY_URL_ENV_VARIABLE, "")
#define JWT_PUBLIC_KEY_FILE         GET_ENV(JWT_PUBLIC_KEY_FILE_ENV_VARIABLE, "")
#define JWT_ISSUER                  GET_ENV(JWT_ISSUER_ENV_VARIABLE, "user-service")
#define JWT_AUDIENCE                GET_ENV(JWT_AUDIENCE_ENV_VARIABLE, "ossrh-proxy")
#define STAGING_ROOT                GET_ENV(STAGING_ROOT_ENV_VARIABLE, "")

constexpr const char* PORTAL_UPLOAD_PATH = "/api/v1/publisher/upload";
constexpr const char* DEPLOYMENT_NAME_SUFFIX = " (via OSSRH API Proxy)";
constexpr const char* NO_PROFILE = "no-profile";

constexpr const char* REPOSITORY_FOLDER = "repository_contents";
constexpr const char* REPOSITORY_STATE_FILE = "repository_state";
constexpr const char* REPOSITORY_ROOT_PREFIX = "local-repository";

const uint64_t UPLOAD_CHUNK_SIZE = (1024ULL*64ULL);

#ifndef BUILD_TESTS
    const uint16_t HTTP_PORT = 2727;
#else
    const uint16_t HTTP_PORT = 8000;
#endif

const uint32_t HTTP_WORKER_POOL_SIZE = 32;
const uint32_t HTTP_CONTENT_TIMEOUT_SECONDS = (60ULL * 60ULL);
const uint32_t CLIENT_TIMEOUT_SECONDS = 300;

#endif //STAGING_GATEWAY_SETTINGS_H
